#include "quality_manager.hpp"

#include <charconv>

#include "internal/db/api/kv_store.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resources/resource_manager.hpp"
#include "internal/resources/tier_policy.hpp"

namespace coordinator::quality {

namespace {

constexpr std::chrono::seconds kDefaultHistoryTtl{30 * 24 * 3600};

constexpr coordinator::v1::QualityLevel kLevels[] = {coordinator::v1::QUALITY_LEVEL_LOW, coordinator::v1::QUALITY_LEVEL_MEDIUM,
                                                     coordinator::v1::QUALITY_LEVEL_HIGH};

double OrDefault(double value, double fallback) {
  return value > 0.0 ? value : fallback;
}

int64_t ParseCounter(const std::optional<std::string>& raw) {
  if (!raw) return 0;
  int64_t    value  = 0;
  const auto parsed = std::from_chars(raw->data(), raw->data() + raw->size(), value);
  return parsed.ec == std::errc() ? value : 0;
}

} // namespace

double QualityWeights::For(const Factor& factor) const {
  if (const auto* ext = std::get_if<ExtensionFactor>(&factor)) {
    return ext->weight > 0.0 ? ext->weight : extension;
  }
  if (std::holds_alternative<InputComplexity>(factor)) return input;
  if (std::holds_alternative<ResourceAvailability>(factor)) return resources;
  if (std::holds_alternative<Subscription>(factor)) return subscription;
  if (std::holds_alternative<History>(factor)) return history;
  return preference;
}

std::vector<coordinator::v1::QualityFactorScore> QualityAssessment::FactorScores(const QualityWeights& weights) const {
  std::vector<coordinator::v1::QualityFactorScore> out;
  out.reserve(factors.size());
  for (const auto& factor : factors) {
    coordinator::v1::QualityFactorScore score;
    score.set_name(std::string(FactorName(factor)));
    score.set_score(FactorScore(factor));
    score.set_weight(weights.For(factor));
    out.push_back(std::move(score));
  }
  return out;
}

QualityManager::QualityManager(const coordinator::runtime::config::QualityConfig& config, std::shared_ptr<resources::ResourceManager> resources,
                               std::shared_ptr<db::KvStore> store)
    : high_threshold_(OrDefault(config.high_threshold(), 0.7)),
      medium_threshold_(OrDefault(config.medium_threshold(), 0.4)),
      history_ttl_(config.history_ttl_seconds() > 0 ? std::chrono::seconds(config.history_ttl_seconds()) : kDefaultHistoryTtl),
      resources_(std::move(resources)),
      store_(std::move(store)) {
  const auto& w        = config.weights();
  weights_.input        = OrDefault(w.input(), weights_.input);
  weights_.resources    = OrDefault(w.resources(), weights_.resources);
  weights_.subscription = OrDefault(w.subscription(), weights_.subscription);
  weights_.history      = OrDefault(w.history(), weights_.history);
  weights_.preference   = OrDefault(w.preference(), weights_.preference);
  weights_.extension    = OrDefault(w.extension(), weights_.extension);
}

std::string QualityManager::HistoryKey(const std::string& workflow_type, coordinator::v1::QualityLevel level) {
  return "history:" + workflow_type + ":quality:" + std::string(model::ToString(level));
}

coordinator::v1::QualityLevel QualityManager::LevelForScore(double score) const {
  if (score >= high_threshold_) return coordinator::v1::QUALITY_LEVEL_HIGH;
  if (score >= medium_threshold_) return coordinator::v1::QUALITY_LEVEL_MEDIUM;
  return coordinator::v1::QUALITY_LEVEL_LOW;
}

QualityAssessment QualityManager::AssessQuality(const coordinator::v1::WorkflowRequest& request, const std::vector<ExtensionFactor>& extensions) {
  QualityAssessment assessment;

  const auto explicit_level = model::ToLevel(request.quality_target());
  if (explicit_level != coordinator::v1::QUALITY_LEVEL_UNSPECIFIED) {
    assessment.requested = explicit_level;
  } else {
    assessment.factors.emplace_back(InputComplexity{ScoreInputComplexity(request)});
    assessment.factors.emplace_back(ResourceAvailability{ScoreResources()});
    assessment.factors.emplace_back(Subscription{ScoreSubscription(request.subscription_tier())});
    assessment.factors.emplace_back(History{ScoreHistory(request.type())});
    if (request.quality_preference() != coordinator::v1::QUALITY_PREFERENCE_UNSPECIFIED) {
      assessment.factors.emplace_back(Preference{ScorePreference(request.quality_preference())});
    }
    for (const auto& ext : extensions) {
      assessment.factors.emplace_back(ext);
    }

    double weighted = 0.0;
    double total    = 0.0;
    for (const auto& factor : assessment.factors) {
      const double weight = weights_.For(factor);
      weighted += FactorScore(factor) * weight;
      total += weight;
    }
    assessment.score     = total > 0.0 ? weighted / total : 0.5;
    assessment.requested = LevelForScore(assessment.score);
  }

  assessment.level   = resources::ClampToTier(assessment.requested, request.subscription_tier());
  assessment.clamped = assessment.level != assessment.requested;

  COORDINATOR_LOG_DEBUG("quality assessed",
                        {observability::StringField("type", request.type()), observability::StringField("target", model::ToString(request.quality_target())),
                         observability::DoubleField("score", assessment.score), observability::StringField("level", model::ToString(assessment.level)),
                         observability::BoolField("clamped", assessment.clamped)});
  return assessment;
}

void QualityManager::RecordQualitySelection(const std::string& workflow_type, coordinator::v1::QualityLevel level) {
  if (!store_) return;

  int64_t    count = 0;
  const auto ttl   = std::chrono::duration_cast<std::chrono::milliseconds>(history_ttl_);
  const auto res   = store_->Increment(HistoryKey(workflow_type, level), 1, count, ttl);
  if (!res) {
    COORDINATOR_LOG_WARN("failed to record quality selection",
                         {observability::StringField("type", workflow_type), observability::StringField("level", model::ToString(level)),
                          observability::StringField("error", res.message)});
  }
}

double QualityManager::ScoreHistory(const std::string& workflow_type) {
  if (!store_) return 0.5;

  int64_t counts[3] = {0, 0, 0};
  int64_t total     = 0;
  for (std::size_t i = 0; i < 3; ++i) {
    counts[i] = ParseCounter(store_->Get(HistoryKey(workflow_type, kLevels[i])));
    total += counts[i];
  }
  if (total <= 0) return 0.5;

  const double n = static_cast<double>(total);
  return (counts[0] * 0.25 + counts[1] * 0.5 + counts[2] * 0.75) / n;
}

double QualityManager::ScoreResources() {
  if (!resources_) return 0.5;

  const auto u = resources_->GetResourceUtilization();
  return (1.0 - u.cpu()) * 0.3 + (1.0 - u.memory()) * 0.3 + (1.0 - u.gpu()) * 0.4;
}

} // namespace coordinator::quality
