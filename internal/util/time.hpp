#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace linksync::util {

/*
  Wall-clock helpers for task timestamps and report fields.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

int64_t MillisBetween(TimePoint from, TimePoint to);

} // namespace linksync::util
