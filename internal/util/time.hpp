#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace ingest::util {

/*
  Wall clock helpers. Sessions, parts and catalog rows store unix
  milliseconds; the wire carries google.protobuf.Timestamp.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t NowUnixMillis();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp UnixMillisToProto(uint64_t ms);

} // namespace ingest::util
