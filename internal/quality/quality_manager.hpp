#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "coordinator/core/v1/types.pb.h"
#include "quality_factors.hpp"

namespace coordinator::db {
class KvStore;
}
namespace coordinator::resources {
class ResourceManager;
}

namespace coordinator::quality {

struct QualityWeights {
  double input        = 0.25;
  double resources    = 0.3;
  double subscription = 0.3;
  double history      = 0.1;
  double preference   = 0.05;
  double extension    = 0.1;

  double For(const Factor& factor) const;
};

struct QualityAssessment {
  coordinator::v1::QualityLevel level     = coordinator::v1::QUALITY_LEVEL_LOW;
  // what the request asked for (or what the factors computed) before the tier clamp
  coordinator::v1::QualityLevel requested = coordinator::v1::QUALITY_LEVEL_LOW;
  std::vector<Factor>           factors;
  double                        score   = 0.0;
  bool                          clamped = false;

  std::vector<coordinator::v1::QualityFactorScore> FactorScores(const QualityWeights& weights) const;
};

/*
  Resolves the quality level a workflow runs at.

  An explicit target wins over the computed level; either way the result
  never exceeds what the subscription tier permits. Auto targets are
  decided from the weighted mean of the factors that apply.
*/
class QualityManager {
 public:
  QualityManager(const coordinator::runtime::config::QualityConfig& config, std::shared_ptr<resources::ResourceManager> resources,
                 std::shared_ptr<db::KvStore> store);

  QualityAssessment AssessQuality(const coordinator::v1::WorkflowRequest& request, const std::vector<ExtensionFactor>& extensions = {});

  // Best effort: store failures are logged, never thrown.
  void RecordQualitySelection(const std::string& workflow_type, coordinator::v1::QualityLevel level);

  coordinator::v1::QualityLevel LevelForScore(double score) const;

  const QualityWeights& Weights() const {
    return weights_;
  }

  static std::string HistoryKey(const std::string& workflow_type, coordinator::v1::QualityLevel level);

 private:
  double ScoreHistory(const std::string& workflow_type);
  double ScoreResources();

  QualityWeights                              weights_;
  double                                      high_threshold_;
  double                                      medium_threshold_;
  std::chrono::seconds                        history_ttl_;
  std::shared_ptr<resources::ResourceManager> resources_;
  std::shared_ptr<db::KvStore>                store_;
};

} // namespace coordinator::quality
