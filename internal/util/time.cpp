#include "time.hpp"

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace sportsledger::util {

TimePoint Now() {
  return TruncateToMicros(Clock::now());
}

TimePoint TruncateToMicros(TimePoint tp) {
  return std::chrono::time_point_cast<std::chrono::microseconds>(tp);
}

std::string FormatTimestamp(TimePoint tp) {
  const auto micros_total = ToUnixMicros(tp);
  auto       seconds      = micros_total / 1000000;
  auto       micros       = micros_total % 1000000;
  if (micros < 0) {
    micros += 1000000;
    seconds -= 1;
  }

  const std::time_t t = static_cast<std::time_t>(seconds);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<long long>(micros));
  return buffer;
}

TimePoint ParseTimestamp(const std::string& text) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(text, &ts)) {
    throw std::invalid_argument("invalid RFC3339 timestamp: " + text);
  }
  const auto since_epoch = std::chrono::seconds(ts.seconds()) + std::chrono::microseconds(ts.nanos() / 1000);
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(since_epoch);
}

int64_t ToUnixMicros(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

double SecondsBetween(TimePoint from, TimePoint to) {
  return std::chrono::duration<double>(to - from).count();
}

} // namespace sportsledger::util
