#pragma once

#include <chrono>

#include "google/protobuf/timestamp.pb.h"

namespace stpa::util {

/*
  Time utilities. Event timestamps go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

} // namespace stpa::util
