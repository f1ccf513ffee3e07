#include "quantity.hpp"

#include <array>
#include <cmath>
#include <cstdlib>
#include <utility>

#include "internal/util/errors.hpp"

namespace coordinator::resources {

namespace {

constexpr int64_t kMi = 1024LL * 1024LL;
constexpr int64_t kGi = 1024LL * kMi;

// Splits "1.5Gi" into (1.5, "Gi").
std::pair<double, std::string_view> SplitNumber(std::string_view quantity) {
  if (quantity.empty()) {
    throw util::ValidationError("empty resource quantity");
  }

  const std::string text(quantity);
  char*             end   = nullptr;
  const double      value = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || value < 0 || !std::isfinite(value)) {
    throw util::ValidationError("invalid resource quantity: " + text);
  }
  return {value, quantity.substr(static_cast<std::size_t>(end - text.c_str()))};
}

} // namespace

int64_t ParseCpuMillis(std::string_view quantity) {
  auto [value, suffix] = SplitNumber(quantity);

  if (suffix.empty()) return std::llround(value * 1000.0);
  if (suffix == "m") return std::llround(value);
  if (suffix == "u") return std::llround(value / 1000.0);
  if (suffix == "n") return std::llround(value / 1000000.0);

  throw util::ValidationError("invalid cpu quantity: " + std::string(quantity));
}

int64_t ParseMemoryBytes(std::string_view quantity) {
  static const std::array<std::pair<std::string_view, double>, 9> kSuffixes = {{
      {"", 1.0},
      {"Ki", 1024.0},
      {"Mi", 1024.0 * 1024.0},
      {"Gi", 1024.0 * 1024.0 * 1024.0},
      {"Ti", 1024.0 * 1024.0 * 1024.0 * 1024.0},
      {"k", 1e3},
      {"M", 1e6},
      {"G", 1e9},
      {"T", 1e12},
  }};

  auto [value, suffix] = SplitNumber(quantity);
  for (const auto& [name, factor] : kSuffixes) {
    if (suffix == name) return std::llround(value * factor);
  }

  throw util::ValidationError("invalid memory quantity: " + std::string(quantity));
}

double ParseCount(std::string_view quantity) {
  auto [value, suffix] = SplitNumber(quantity);
  if (!suffix.empty()) {
    throw util::ValidationError("invalid count quantity: " + std::string(quantity));
  }
  return value;
}

std::string FormatCpuMillis(int64_t millis) {
  return std::to_string(millis) + "m";
}

std::string FormatMemoryBytes(int64_t bytes) {
  if (bytes > 0 && bytes % kGi == 0) {
    return std::to_string(bytes / kGi) + "Gi";
  }
  return std::to_string(bytes / kMi) + "Mi";
}

} // namespace coordinator::resources
