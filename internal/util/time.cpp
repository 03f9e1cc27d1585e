#include "time.hpp"

namespace convintel::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(ms / 1000));
  ts.set_nanos(static_cast<int32_t>((ms % 1000) * 1'000'000));
  return ts;
}

unsigned DayOfWeekUtc(uint64_t unix_ms) {
  // 1970-01-01 was a Thursday
  const uint64_t days = unix_ms / kMillisPerDay;
  return static_cast<unsigned>((days + 3) % 7);
}

unsigned HourOfDayUtc(uint64_t unix_ms) {
  return static_cast<unsigned>((unix_ms % kMillisPerDay) / 3'600'000ULL);
}

uint64_t DaysToMillis(uint32_t days) {
  return static_cast<uint64_t>(days) * kMillisPerDay;
}

} // namespace convintel::util
