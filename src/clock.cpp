#include "pacer/clock.hpp"

#include <chrono>
#include <ctime>

namespace pacer {

namespace {

std::tm local_tm(int64_t now_ms) {
  const std::time_t secs = static_cast<std::time_t>(now_ms / kMsPerSecond);
  std::tm tm{};
  localtime_r(&secs, &tm);
  return tm;
}

int64_t to_unix_ms(std::tm tm) {
  // mktime normalizes out-of-range fields (day 32, hour 24) and resolves DST.
  tm.tm_isdst = -1;
  return static_cast<int64_t>(std::mktime(&tm)) * kMsPerSecond;
}

}  // namespace

int64_t SystemClock::now_ms() const {
  return static_cast<int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

Clock& system_clock() {
  static SystemClock inst;
  return inst;
}

int64_t next_local_midnight_ms(int64_t now_ms) {
  std::tm tm = local_tm(now_ms);
  tm.tm_mday += 1;
  tm.tm_hour = 0;
  tm.tm_min  = 0;
  tm.tm_sec  = 0;
  return to_unix_ms(tm);
}

int64_t local_day_start_ms(int64_t now_ms) {
  std::tm tm = local_tm(now_ms);
  tm.tm_hour = 0;
  tm.tm_min  = 0;
  tm.tm_sec  = 0;
  return to_unix_ms(tm);
}

int64_t next_local_hour_ms(int64_t now_ms) {
  std::tm tm = local_tm(now_ms);
  tm.tm_hour += 1;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  return to_unix_ms(tm);
}

int64_t local_day_key(int64_t now_ms) {
  const std::tm tm = local_tm(now_ms);
  return static_cast<int64_t>(tm.tm_year + 1900) * 10000 +
         static_cast<int64_t>(tm.tm_mon + 1) * 100 + tm.tm_mday;
}

int64_t local_hour_key(int64_t now_ms) {
  const std::tm tm = local_tm(now_ms);
  return local_day_key(now_ms) * 100 + tm.tm_hour;
}

}  // namespace pacer
