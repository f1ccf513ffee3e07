#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace coordinator::util {

using UUID = std::array<uint8_t, 16>;

// RFC4122 version 4, random.
UUID GenerateUUID();

// Lowercase 8-4-4-4-12 form.
std::string ToString(const UUID& id);

/*
  "<type>-<uuid>", used as both the workflow id and the engine object
  name. The type is cut to 26 characters so the result fits the
  63-character Kubernetes name limit.
*/
std::string GenerateWorkflowId(const std::string& type);

} // namespace coordinator::util
