#include "time.hpp"

#include <ctime>

namespace devicefarm::util {

namespace {

std::string FormatUtc(TimePoint tp, const char* format) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  char buffer[32];
  const auto written = std::strftime(buffer, sizeof(buffer), format, &utc);
  return std::string(buffer, written);
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

TimePoint FromEpochSeconds(double seconds) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

std::string ToIso8601(TimePoint tp) {
  return FormatUtc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace devicefarm::util
