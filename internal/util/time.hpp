#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace coord::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// 20261019T190512.123Z, sortable and filesystem safe.
std::string CompactUtc(TimePoint tp);

// Inverse of CompactUtc.
std::optional<TimePoint> ParseCompactUtc(const std::string& text);

// 2026-10-19T19:05:12Z
std::string IsoUtc(TimePoint tp);

} // namespace coord::util
