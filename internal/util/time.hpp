#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace coordinator::util {

/*
  Time utilities. All clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t ToUnixMillis(TimePoint tp);
int64_t NowMillis();

bool IsSet(const google::protobuf::Timestamp& ts);

} // namespace coordinator::util
