#include "pacer/supervisor.hpp"

#include <algorithm>

#include "pacer/observability.hpp"

namespace pacer {

namespace {

std::chrono::milliseconds at_least_1ms(int64_t ms) {
  return std::chrono::milliseconds(std::max<int64_t>(1, ms));
}

}  // namespace

// ---------------------------------------------------------------------------
// PeriodicTask
// ---------------------------------------------------------------------------

PeriodicTask::PeriodicTask(std::string name, DelayFn next_delay, BodyFn body)
    : name_(std::move(name)), next_delay_(std::move(next_delay)), body_(std::move(body)) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  worker_ = std::thread([this] { worker_loop(); });
}

void PeriodicTask::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

bool PeriodicTask::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return worker_.joinable() && !stopping_;
}

void PeriodicTask::worker_loop() {
  while (true) {
    const auto delay = next_delay_();
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, delay, [this] { return stopping_.load(); });
      if (stopping_) return;
    }

    try {
      body_();
    } catch (const std::exception& e) {
      log(LogLevel::error, name_, std::string("run failed: ") + e.what());
    } catch (...) {
      log(LogLevel::error, name_, "run failed: non-standard exception");
    }
    runs_.fetch_add(1, std::memory_order_relaxed);
  }
}

// ---------------------------------------------------------------------------
// HealthMonitor
// ---------------------------------------------------------------------------

HealthMonitor::HealthMonitor(HealthEngine& engine, IHealthStore& store, const Clock& clock)
    : engine_(engine), store_(store), clock_(clock) {}

void HealthMonitor::check_account(AccountId id, int unthrottle_at, HealthCycleReport& report) {
  if (engine_.advance_warming_phase(id).advanced) ++report.advanced;

  const ThrottleDecision d = engine_.check_and_throttle(id);
  switch (d.action) {
    case ThrottleAction::throttle: ++report.throttled; break;
    case ThrottleAction::suspend:  ++report.suspended; break;
    case ThrottleAction::escalate: ++report.escalated; break;
    case ThrottleAction::none:     break;
  }

  const auto rec = engine_.get_record(id);
  if (!rec) return;
  if (d.action == ThrottleAction::none && (rec->is_throttled || rec->is_suspended) &&
      d.health_score >= unthrottle_at && engine_.unthrottle(id).success) {
    ++report.unthrottled;
  }
  if (rec->account_phase == AccountPhase::cooling && engine_.recover_from_cooling(id).success) {
    ++report.recovered;
  }
}

HealthCycleReport HealthMonitor::run_cycle() {
  HealthCycleReport report;
  bool expected = false;
  if (!in_cycle_.compare_exchange_strong(expected, true)) {
    log(LogLevel::warn, "monitor", "previous health cycle still running; skipping");
    report.skipped = true;
    return report;
  }
  struct CycleGuard {
    std::atomic<bool>& flag;
    ~CycleGuard() { flag.store(false); }
  } guard{in_cycle_};

  const int unthrottle_at = engine_.policy().unthrottle_at;
  for (AccountId id : store_.account_ids()) {
    ++report.accounts;
    try {
      check_account(id, unthrottle_at, report);
    } catch (const std::exception& e) {
      ++report.failed;
      log(LogLevel::error, "monitor",
          "health check failed for account " + std::to_string(id) + ": " + e.what());
    }
  }

  log(LogLevel::info, "monitor",
      "health cycle: " + std::to_string(report.accounts) + " accounts, " +
          std::to_string(report.throttled) + " throttled, " + std::to_string(report.suspended) +
          " suspended, " + std::to_string(report.escalated) + " escalated, " +
          std::to_string(report.unthrottled) + " unthrottled, " + std::to_string(report.failed) +
          " failed");
  emit_core_event({CoreEventKind::health_cycle, 0, "", static_cast<int64_t>(report.accounts),
                   clock_.now_ms()});
  return report;
}

// ---------------------------------------------------------------------------
// Supervisor
// ---------------------------------------------------------------------------

Supervisor::Supervisor(HealthEngine& engine, ActionGate& gate, IHealthStore& store,
                       const PacerConfig& config, const Clock& clock, EngagementScheduler* scheduler,
                       SessionPool* sessions)
    : monitor_(engine, store, clock) {
  const int64_t health_interval = config.monitor.health_interval_ms;
  tasks_.push_back(std::make_unique<PeriodicTask>(
      "monitor", [health_interval] { return at_least_1ms(health_interval); },
      [this] { monitor_.run_cycle(); }));

  const Clock* c = &clock;
  ActionGate* g = &gate;
  tasks_.push_back(std::make_unique<PeriodicTask>(
      "daily-reset",
      [c] {
        const int64_t now = c->now_ms();
        return at_least_1ms(next_local_midnight_ms(now) - now);
      },
      [g] { g->reset_daily_counters(); }));
  tasks_.push_back(std::make_unique<PeriodicTask>(
      "hourly-reset",
      [c] {
        const int64_t now = c->now_ms();
        return at_least_1ms(next_local_hour_ms(now) - now);
      },
      [g] { g->reset_hourly_counters(); }));

  const int64_t retention_ms = static_cast<int64_t>(history_retention_days(config)) * kMsPerDay;
  IHealthStore* history = &store;
  tasks_.push_back(std::make_unique<PeriodicTask>(
      "history-prune", [] { return at_least_1ms(kHistoryPruneIntervalMs); },
      [c, history, retention_ms] {
        const std::size_t removed = history->prune_history_before(c->now_ms() - retention_ms);
        log(LogLevel::debug, "monitor", "pruned " + std::to_string(removed) + " history entries");
      }));

  if (sessions) {
    const int64_t sweep = config.sessions.sweep_interval_ms;
    tasks_.push_back(std::make_unique<PeriodicTask>(
        "idle-sweep", [sweep] { return at_least_1ms(sweep); },
        [sessions] { sessions->reclaim_idle(); }));
  }

  if (scheduler) {
    tasks_.push_back(std::make_unique<PeriodicTask>(
        "task-upkeep", [] { return at_least_1ms(kTaskMaintenanceIntervalMs); },
        [scheduler] {
          const TaskMaintenanceReport r = scheduler->expire_tasks();
          const std::size_t removed = scheduler->cleanup_old_tasks();
          log(LogLevel::debug, "scheduler",
              "upkeep: " + std::to_string(r.expired) + " expired, " +
                  std::to_string(r.released_claims) + " claims released, " +
                  std::to_string(removed) + " removed");
        }));
  }
}

int Supervisor::history_retention_days(const PacerConfig& config) {
  const HealthPolicy& p = config.policy;
  return std::max({config.monitor.history_retention_days, p.login_window_days, p.post_window_days,
                   p.freeze_window_days, p.naturalness_window_days});
}

Supervisor::~Supervisor() { stop(); }

void Supervisor::start() {
  for (auto& t : tasks_) t->start();
  log(LogLevel::info, "supervisor", "started " + std::to_string(tasks_.size()) + " periodic tasks");
}

void Supervisor::stop() {
  bool any = false;
  for (auto& t : tasks_) {
    any = any || t->running();
    t->stop();
  }
  if (any) log(LogLevel::info, "supervisor", "stopped");
}

bool Supervisor::running() const {
  return std::any_of(tasks_.begin(), tasks_.end(), [](const auto& t) { return t->running(); });
}

}  // namespace pacer
