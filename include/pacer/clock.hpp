#pragma once

// pacer/clock.hpp — Injectable wall clock and calendar boundary helpers.
//
// Every time-dependent decision in the core (phase age, score windows, retry
// hints, idle reclamation) reads time through a Clock so tests can pin it.
// Calendar boundaries are LOCAL time: daily counters reset at local midnight,
// hourly counters at the top of the local hour.

#include <atomic>
#include <cstdint>

namespace pacer {

constexpr int64_t kMsPerSecond = 1000;
constexpr int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr int64_t kMsPerHour   = 60 * kMsPerMinute;
constexpr int64_t kMsPerDay    = 24 * kMsPerHour;

class Clock {
 public:
  virtual ~Clock() = default;
  virtual int64_t now_ms() const = 0;
};

class SystemClock : public Clock {
 public:
  int64_t now_ms() const override;
};

// Fixed clock that only moves when told to. Thread-safe.
class ManualClock : public Clock {
 public:
  explicit ManualClock(int64_t start_ms) : now_(start_ms) {}
  int64_t now_ms() const override { return now_.load(std::memory_order_acquire); }
  void set(int64_t ms) { now_.store(ms, std::memory_order_release); }
  void advance(int64_t delta_ms) { now_.fetch_add(delta_ms, std::memory_order_acq_rel); }

 private:
  std::atomic<int64_t> now_;
};

// Process-wide system clock instance.
Clock& system_clock();

// Unix ms of the next local midnight strictly after now_ms.
int64_t next_local_midnight_ms(int64_t now_ms);

// Unix ms of the local midnight that started the day containing now_ms.
int64_t local_day_start_ms(int64_t now_ms);

// Unix ms of the next local top-of-hour strictly after now_ms.
int64_t next_local_hour_ms(int64_t now_ms);

// Local calendar keys: YYYYMMDD and YYYYMMDDHH.
int64_t local_day_key(int64_t now_ms);
int64_t local_hour_key(int64_t now_ms);

}  // namespace pacer
