#include "aegis/core/time.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace aegis::core {

std::int64_t now_unix_ms() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::int64_t now_steady_ms() {
  const auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

kj::String now_utc_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto now_time_t = std::chrono::system_clock::to_time_t(now);

  std::tm tm{};
  gmtime_r(&now_time_t, &tm);

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
  const auto subsec_ms = static_cast<int>(ms.count() % 1000);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, subsec_ms);
  return kj::str(buf);
}

MillisClock steady_millis_clock() {
  return []() { return now_steady_ms(); };
}

} // namespace aegis::core
