#include "resilix/core/time.h"

#include <cstdio>
#include <ctime>
#include <kj/debug.h>

namespace resilix::core {

kj::String to_utc_iso8601(std::chrono::system_clock::time_point time) {
  using namespace std::chrono;
  auto since_epoch = duration_cast<milliseconds>(time.time_since_epoch());
  auto seconds_part = floor<seconds>(since_epoch);
  auto millis = static_cast<int>((since_epoch - seconds_part).count());
  std::time_t whole = static_cast<std::time_t>(seconds_part.count());

  std::tm tm{};
#if defined(_WIN32)
  KJ_REQUIRE(gmtime_s(&tm, &whole) == 0, "timestamp out of range");
#else
  KJ_REQUIRE(gmtime_r(&whole, &tm) != nullptr, "timestamp out of range");
#endif

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
  return kj::str(buf);
}

kj::String now_utc_iso8601() {
  return to_utc_iso8601(std::chrono::system_clock::now());
}

const kj::MonotonicClock& monotonic_clock() {
  return kj::systemPreciseMonotonicClock();
}

} // namespace resilix::core
