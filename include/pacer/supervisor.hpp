#pragma once

// pacer/supervisor.hpp — Periodic drivers for the safety core.
//
// The Supervisor owns every background loop and nothing else runs on a timer:
//   health      every health_interval_ms: HealthMonitor::run_cycle()
//   daily reset at each local midnight: ActionGate::reset_daily_counters()
//   hourly reset at each local hour:    ActionGate::reset_hourly_counters()
//   idle sweep  every sweep_interval_ms: SessionPool::reclaim_idle()
//   task upkeep every hour: expire_tasks() + cleanup_old_tasks()
//   history   every hour: prune scoring history older than the longest window
//
// The gate rolls counters lazily on its own, so a missed reset never lets an
// account exceed its caps; the resets only keep stored counters tidy.
//
// LIFECYCLE:
//   start() spawns one thread per PeriodicTask; stop() wakes and joins them.
//   Both are idempotent. The destructor calls stop().

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pacer/clock.hpp"
#include "pacer/config.hpp"
#include "pacer/gate.hpp"
#include "pacer/health.hpp"
#include "pacer/health_store.hpp"
#include "pacer/scheduler.hpp"
#include "pacer/session_pool.hpp"

namespace pacer {

// One background loop: wait next_delay(), run body(), repeat until stopped.
class PeriodicTask {
 public:
  using DelayFn = std::function<std::chrono::milliseconds()>;
  using BodyFn  = std::function<void()>;

  PeriodicTask(std::string name, DelayFn next_delay, BodyFn body);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void start();
  void stop();
  bool running() const;
  uint64_t runs() const { return runs_.load(std::memory_order_relaxed); }
  const std::string& name() const { return name_; }

 private:
  void worker_loop();

  std::string name_;
  DelayFn next_delay_;
  BodyFn body_;
  std::thread worker_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> stopping_{false};
  std::atomic<uint64_t> runs_{0};
};

struct HealthCycleReport {
  bool skipped{false};  // a previous cycle was still running
  std::size_t accounts{0};
  std::size_t advanced{0};
  std::size_t throttled{0};
  std::size_t suspended{0};
  std::size_t escalated{0};
  std::size_t unthrottled{0};
  std::size_t recovered{0};
  std::size_t failed{0};  // accounts whose check threw; the cycle moved on
};

class HealthMonitor {
 public:
  HealthMonitor(HealthEngine& engine, IHealthStore& store, const Clock& clock);

  // For every account: advance phase, re-score and throttle, then lift a
  // throttle whose score has recovered and end a finished cooling period.
  // An exception from one account is logged and counted; the rest still run.
  HealthCycleReport run_cycle();

 private:
  void check_account(AccountId id, int unthrottle_at, HealthCycleReport& report);

  HealthEngine& engine_;
  IHealthStore& store_;
  const Clock& clock_;
  std::atomic<bool> in_cycle_{false};
};

class Supervisor {
 public:
  static constexpr int64_t kTaskMaintenanceIntervalMs = kMsPerHour;
  static constexpr int64_t kHistoryPruneIntervalMs = kMsPerHour;

  // Days of scoring history kept: the longest scoring window, or
  // monitor.history_retention_days if that is longer.
  static int history_retention_days(const PacerConfig& config);

  // scheduler and sessions may be null; their loops are then not created.
  Supervisor(HealthEngine& engine, ActionGate& gate, IHealthStore& store, const PacerConfig& config,
             const Clock& clock, EngagementScheduler* scheduler = nullptr,
             SessionPool* sessions = nullptr);
  ~Supervisor();

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  void start();
  void stop();
  bool running() const;

  HealthMonitor& monitor() { return monitor_; }
  const std::vector<std::unique_ptr<PeriodicTask>>& tasks() const { return tasks_; }

 private:
  HealthMonitor monitor_;
  std::vector<std::unique_ptr<PeriodicTask>> tasks_;
};

}  // namespace pacer
