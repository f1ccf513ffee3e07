#include "forecaster.hpp"

#include "config/config.pb.h"

namespace coordinator::scaling {

double MovingAverageForecaster::Forecast(const std::vector<double>& history) const {
  if (history.empty()) return 0.0;

  double sum = 0.0;
  for (double v : history) sum += v;
  return sum / static_cast<double>(history.size());
}

SeasonalNaiveForecaster::SeasonalNaiveForecaster(std::size_t season_length) : season_length_(season_length == 0 ? 1 : season_length) {
}

double SeasonalNaiveForecaster::Forecast(const std::vector<double>& history) const {
  if (history.size() < season_length_) return fallback_.Forecast(history);
  // the next sample lands one season after history[size - season]
  return history[history.size() - season_length_];
}

std::unique_ptr<Forecaster> MakeForecaster(const coordinator::runtime::config::PredictiveScalingConfig& config) {
  switch (config.forecaster()) {
    case coordinator::runtime::config::FORECASTER_KIND_SEASONAL_NAIVE:
      return std::make_unique<SeasonalNaiveForecaster>(config.season_length() > 0 ? config.season_length() : 24);
    default:
      return std::make_unique<MovingAverageForecaster>();
  }
}

} // namespace coordinator::scaling
