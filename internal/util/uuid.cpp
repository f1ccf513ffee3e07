#include "uuid.hpp"

#include <random>

namespace coordinator::util {

namespace {
constexpr std::size_t kMaxTypePrefix = 26;
}

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (std::size_t i = 0; i < id.size(); i += 8) {
    const uint64_t bits = rng();
    for (std::size_t j = 0; j < 8; ++j) id[i + j] = static_cast<uint8_t>(bits >> (j * 8));
  }

  id[6] = (id[6] & 0x0F) | 0x40; // version 4
  id[8] = (id[8] & 0x3F) | 0x80; // variant 10xx

  return id;
}

std::string ToString(const UUID& id) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
    out += kHex[id[i] >> 4];
    out += kHex[id[i] & 0x0F];
  }
  return out;
}

std::string GenerateWorkflowId(const std::string& type) {
  return type.substr(0, kMaxTypePrefix) + "-" + ToString(GenerateUUID());
}

} // namespace coordinator::util
