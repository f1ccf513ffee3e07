#pragma once

#include <string>
#include <string_view>

namespace coordinator::util {

// Lowercase hex SHA-256 digest.
std::string Sha256Hex(std::string_view data);

} // namespace coordinator::util
