#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace coordinator::cluster::kube {

/*
  Kubernetes objects are handled as google::protobuf::Struct so the
  coordinator needs no JSON library beyond protobuf's JsonUtil.
*/

google::protobuf::Struct ParseObject(const std::string& json);
std::string              ToJson(const google::protobuf::Struct& object);
std::string              ToJson(const google::protobuf::Value& value);

// nullptr when any segment is missing or not an object
const google::protobuf::Value* Find(const google::protobuf::Struct& object, std::initializer_list<std::string_view> path);

std::string GetString(const google::protobuf::Struct& object, std::initializer_list<std::string_view> path, std::string fallback = {});
double      GetNumber(const google::protobuf::Struct& object, std::initializer_list<std::string_view> path, double fallback = 0.0);

// RFC3339 timestamp field as unix millis, 0 when absent or unparsable
int64_t GetTimeMillis(const google::protobuf::Struct& object, std::initializer_list<std::string_view> path);

google::protobuf::Struct* MutableObject(google::protobuf::Struct& object, std::string_view key);
void                      SetString(google::protobuf::Struct& object, std::string_view key, std::string_view value);
void                      SetNumber(google::protobuf::Struct& object, std::string_view key, double value);

} // namespace coordinator::cluster::kube
