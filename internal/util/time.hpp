#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace convintel::util {

/*
  Time utilities. All calendar math is UTC.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline constexpr std::uint64_t kMillisPerDay = 86'400'000ULL;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp MillisToProto(uint64_t ms);

// 0 = Monday ... 6 = Sunday
unsigned DayOfWeekUtc(uint64_t unix_ms);
unsigned HourOfDayUtc(uint64_t unix_ms);

uint64_t DaysToMillis(uint32_t days);

} // namespace convintel::util
