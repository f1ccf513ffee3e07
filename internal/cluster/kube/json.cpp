#include "json.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include "internal/util/errors.hpp"

namespace coordinator::cluster::kube {

google::protobuf::Struct ParseObject(const std::string& json) {
  google::protobuf::Struct object;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &object, options);
  if (!status.ok()) {
    throw util::TransientInfraError("malformed response from API server: " + std::string(status.message()));
  }
  return object;
}

std::string ToJson(const google::protobuf::Struct& object) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize object: " + std::string(status.message()));
  }
  return json;
}

std::string ToJson(const google::protobuf::Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize value: " + std::string(status.message()));
  }
  return json;
}

const google::protobuf::Value* Find(const google::protobuf::Struct& object, std::initializer_list<std::string_view> path) {
  const google::protobuf::Struct* current = &object;
  const google::protobuf::Value*  found   = nullptr;

  for (auto segment : path) {
    if (!current) return nullptr;

    auto it = current->fields().find(std::string(segment));
    if (it == current->fields().end()) return nullptr;

    found   = &it->second;
    current = found->has_struct_value() ? &found->struct_value() : nullptr;
  }
  return found;
}

std::string GetString(const google::protobuf::Struct& object, std::initializer_list<std::string_view> path, std::string fallback) {
  const auto* value = Find(object, path);
  if (!value) return fallback;
  if (value->has_string_value()) return value->string_value();
  if (value->has_number_value()) return std::to_string(static_cast<int64_t>(value->number_value()));
  return fallback;
}

double GetNumber(const google::protobuf::Struct& object, std::initializer_list<std::string_view> path, double fallback) {
  const auto* value = Find(object, path);
  if (!value) return fallback;
  if (value->has_number_value()) return value->number_value();
  return fallback;
}

int64_t GetTimeMillis(const google::protobuf::Struct& object, std::initializer_list<std::string_view> path) {
  const auto text = GetString(object, path);
  if (text.empty()) return 0;

  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(text, &ts)) return 0;
  return google::protobuf::util::TimeUtil::TimestampToMilliseconds(ts);
}

google::protobuf::Struct* MutableObject(google::protobuf::Struct& object, std::string_view key) {
  return (*object.mutable_fields())[std::string(key)].mutable_struct_value();
}

void SetString(google::protobuf::Struct& object, std::string_view key, std::string_view value) {
  (*object.mutable_fields())[std::string(key)].set_string_value(std::string(value));
}

void SetNumber(google::protobuf::Struct& object, std::string_view key, double value) {
  (*object.mutable_fields())[std::string(key)].set_number_value(value);
}

} // namespace coordinator::cluster::kube
