#pragma once

#include <string>

#include "config/config.pb.h"

namespace coordinator::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Scalars may reference the environment as ${NAME} or
  ${NAME:-fallback}. Feature toggles may then be overridden from the
  environment:

    COORDINATOR_FEATURE_PREDICTIVE_SCALING
    COORDINATOR_FEATURE_SCALING_DEPENDENCIES
    COORDINATOR_FEATURE_HPA_EVENT_LOGGING

  Zero means "use the default" throughout, so Validate only rejects
  values that are set and out of range. Scaling workloads and their
  dependency graph are validated by the services that own them.
*/
class ConfigLoader {
 public:
  static coordinator::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static coordinator::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyEnvironmentOverrides(coordinator::runtime::config::RuntimeConfig& config);

  // Throws util::ValidationError.
  static void Validate(const coordinator::runtime::config::RuntimeConfig& config);
};

} // namespace coordinator::config
