#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace coord::util {

namespace {

std::tm UtcTm(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);
  return tm;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

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

std::string CompactUtc(TimePoint tp) {
  const auto         tm     = UtcTm(tp);
  const auto         millis = ToUnixMillis(tp) % 1000;
  std::ostringstream out;
  out << std::put_time(&tm, "%Y%m%dT%H%M%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

std::optional<TimePoint> ParseCompactUtc(const std::string& text) {
  // YYYYmmddTHHMMSS.mmmZ
  if (text.size() != 20 || text[8] != 'T' || text[15] != '.' || text[19] != 'Z') {
    return std::nullopt;
  }

  std::tm            tm{};
  std::istringstream in(text.substr(0, 15));
  in >> std::get_time(&tm, "%Y%m%dT%H%M%S");
  if (in.fail()) {
    return std::nullopt;
  }

  int millis = 0;
  for (size_t i = 16; i < 19; ++i) {
    if (text[i] < '0' || text[i] > '9') return std::nullopt;
    millis = millis * 10 + (text[i] - '0');
  }

  return Clock::from_time_t(timegm(&tm)) + std::chrono::milliseconds(millis);
}

std::string IsoUtc(TimePoint tp) {
  const auto         tm = UtcTm(tp);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace coord::util
