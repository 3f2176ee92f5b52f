#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace stagegraph::util {

namespace {

std::tm ToUtc(std::time_t seconds) {
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  return utc;
}

std::string Format(TimePoint tp, const char* date_format, const char* fraction_separator) {
  auto sec    = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - sec).count();
  if (micros < 0) {
    sec -= std::chrono::seconds(1);
    micros += 1000000;
  }

  const auto utc = ToUtc(Clock::to_time_t(sec));

  std::ostringstream out;
  out << std::put_time(&utc, date_format) << fraction_separator << std::setw(6) << std::setfill('0') << micros << 'Z';
  return out.str();
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::string ToIso8601(TimePoint tp) {
  return Format(tp, "%Y-%m-%dT%H:%M:%S", ".");
}

std::string ToPathSuffix(TimePoint tp) {
  return Format(tp, "%Y%m%dT%H%M%S", "");
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace stagegraph::util
