#include "time.hpp"

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace eventstore::util {

TimePoint Now() {
  return Clock::now();
}

std::string ToIso8601(TimePoint tp) {
  // floor, not truncation: pre-epoch instants keep a non-negative fraction
  const auto ms   = std::chrono::floor<std::chrono::milliseconds>(tp);
  const auto secs = std::chrono::floor<std::chrono::seconds>(ms);
  const auto frac = (ms - secs).count();

  const std::time_t t = Clock::to_time_t(secs);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << frac << 'Z';
  return oss.str();
}

std::string NowIso8601() {
  return ToIso8601(Now());
}

std::optional<TimePoint> ParseIso8601(const std::string& text) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(text, &ts)) {
    return std::nullopt;
  }
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) +
                                                                   std::chrono::nanoseconds(ts.nanos()));
}

std::optional<std::string> Canonicalize(const std::string& text) {
  auto tp = ParseIso8601(text);
  if (!tp) return std::nullopt;
  return ToIso8601(*tp);
}

} // namespace eventstore::util
