#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace coordinator::runtime::config {
class PredictiveScalingConfig;
}

namespace coordinator::scaling {

/*
  Predicts the next load sample from a window of past samples, oldest
  first. An empty window forecasts zero.
*/
class Forecaster {
 public:
  virtual ~Forecaster() = default;

  virtual double           Forecast(const std::vector<double>& history) const = 0;
  virtual std::string_view Name() const                                      = 0;

  // Samples a forecast looks at; callers pass at least this many when available.
  virtual std::size_t MinSamples() const {
    return 1;
  }
};

class MovingAverageForecaster final : public Forecaster {
 public:
  double           Forecast(const std::vector<double>& history) const override;
  std::string_view Name() const override {
    return "moving-average";
  }
};

// Repeats the sample one season back; falls back to the moving average
// until a full season of history exists.
class SeasonalNaiveForecaster final : public Forecaster {
 public:
  explicit SeasonalNaiveForecaster(std::size_t season_length);

  double           Forecast(const std::vector<double>& history) const override;
  std::string_view Name() const override {
    return "seasonal-naive";
  }
  std::size_t MinSamples() const override {
    return season_length_;
  }

 private:
  std::size_t             season_length_;
  MovingAverageForecaster fallback_;
};

std::unique_ptr<Forecaster> MakeForecaster(const coordinator::runtime::config::PredictiveScalingConfig& config);

} // namespace coordinator::scaling
