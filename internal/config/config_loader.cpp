#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <optional>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace coordinator::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// Replaces ${NAME} and ${NAME:-fallback}. An unset NAME without a fallback is an error.
static std::string ExpandEnvironment(const std::string& raw) {
  std::string out;
  std::size_t pos = 0;
  while (pos < raw.size()) {
    const auto open = raw.find("${", pos);
    if (open == std::string::npos) {
      out.append(raw, pos, std::string::npos);
      break;
    }
    const auto close = raw.find('}', open + 2);
    if (close == std::string::npos) {
      throw std::runtime_error("Unterminated ${ in config value: " + raw);
    }
    out.append(raw, pos, open - pos);

    std::string                name = raw.substr(open + 2, close - open - 2);
    std::optional<std::string> fallback;
    if (const auto sep = name.find(":-"); sep != std::string::npos) {
      fallback = name.substr(sep + 2);
      name.resize(sep);
    }

    const char* env = std::getenv(name.c_str());
    if (env && *env) {
      out += env;
    } else if (fallback) {
      out += *fallback;
    } else {
      throw std::runtime_error("Config references unset environment variable " + name);
    }
    pos = close + 1;
  }
  return out;
}

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string scalar_value = ExpandEnvironment(node.Scalar());

  // quoted scalars stay strings ("8Gi", "500m", "1")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static coordinator::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  coordinator::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyEnvironmentOverrides(config);
  ConfigLoader::Validate(config);
  return config;
}

static std::optional<bool> EnvFlag(const char* name) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return std::nullopt;
  }

  const std::string value(raw);
  if (value == "1" || value == "true") return true;
  if (value == "0" || value == "false") return false;

  throw std::runtime_error(std::string("Invalid boolean in ") + name + ": " + value);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

coordinator::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

coordinator::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyEnvironmentOverrides(coordinator::runtime::config::RuntimeConfig& config) {
  auto* features = config.mutable_features();

  if (auto flag = EnvFlag("COORDINATOR_FEATURE_PREDICTIVE_SCALING")) {
    features->set_predictive_scaling(*flag);
  }
  if (auto flag = EnvFlag("COORDINATOR_FEATURE_SCALING_DEPENDENCIES")) {
    features->set_scaling_dependencies(*flag);
  }
  if (auto flag = EnvFlag("COORDINATOR_FEATURE_HPA_EVENT_LOGGING")) {
    features->set_hpa_event_logging(*flag);
  }
  if (auto flag = EnvFlag("COORDINATOR_FEATURE_TASK_QUEUE")) {
    features->set_task_queue(*flag);
  }
}

static void RequireUnitInterval(double value, const char* field) {
  if (value < 0.0 || value > 1.0) {
    throw util::ValidationError(std::string(field) + " must be between 0 and 1");
  }
}

void ConfigLoader::Validate(const coordinator::runtime::config::RuntimeConfig& config) {
  const auto& quality = config.quality();
  RequireUnitInterval(quality.high_threshold(), "quality.high_threshold");
  RequireUnitInterval(quality.medium_threshold(), "quality.medium_threshold");
  if (quality.high_threshold() > 0.0 && quality.medium_threshold() > 0.0 && quality.medium_threshold() >= quality.high_threshold()) {
    throw util::ValidationError("quality.medium_threshold must be below quality.high_threshold");
  }

  const auto& w = quality.weights();
  for (const double weight : {w.input(), w.resources(), w.subscription(), w.history(), w.preference(), w.extension()}) {
    if (weight < 0.0) throw util::ValidationError("quality.weights must not be negative");
  }

  RequireUnitInterval(config.resources().high_load_threshold(), "resources.high_load_threshold");

  if (config.observability().trace_sample_ratio() < 0.0) {
    throw util::ValidationError("observability.trace_sample_ratio must not be negative");
  }

  const auto& predictive = config.predictive_scaling();
  if (predictive.forecaster() == coordinator::runtime::config::FORECASTER_KIND_SEASONAL_NAIVE && predictive.max_signal_samples() > 0 &&
      predictive.max_signal_samples() < predictive.season_length()) {
    throw util::ValidationError("predictive_scaling.max_signal_samples must hold at least one season_length of samples");
  }

  const auto& queue = config.task_queue();
  for (const auto* lane : {&queue.high(), &queue.medium(), &queue.low(), &queue.batch()}) {
    if (lane->retry().multiplier() < 0.0) {
      throw util::ValidationError("task_queue lane retry.multiplier must not be negative");
    }
  }

  if (config.store().has_sqlite() && config.store().sqlite().path().empty()) {
    throw util::ValidationError("store.sqlite.path is required");
  }
}

} // namespace coordinator::config
