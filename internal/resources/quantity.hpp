#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace coordinator::resources {

/*
  Kubernetes resource quantities.

  CPU:    "2", "1.5", "500m", "250000u", "123456789n"
  Memory: "8Gi", "512Mi", "1G", "1048576"

  Malformed input throws util::ValidationError.
*/

int64_t ParseCpuMillis(std::string_view quantity);
int64_t ParseMemoryBytes(std::string_view quantity);
double  ParseCount(std::string_view quantity);

std::string FormatCpuMillis(int64_t millis);

// Whole Gi when exact, otherwise Mi rounded down.
std::string FormatMemoryBytes(int64_t bytes);

} // namespace coordinator::resources
