#pragma once

// pacer/scheduler.hpp — Engagement Task Scheduler.
//
// Picks which queued engagement tasks an account should run next. The
// availability check here is deliberately lighter than the gate: it counts
// today's engagement log per type against fixed per-type daily limits. The
// executor must still consult ActionGate right before running a task.
//
// TASK LIFECYCLE:
//   pending --claim_task--> claimed --mark_task_completed--> completed
//   pending --mark_task_completed--> completed
//   pending (past expires_at) --expire_tasks--> expired
//   claimed (older than claim timeout) --expire_tasks--> pending
//   completed|expired (older than N days) --cleanup_old_tasks--> removed
//
// ORDERING:
//   get_next_tasks() is deterministic for identical inputs: a stable sort by
//   priority over the store's newest-first order.

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "pacer/clock.hpp"
#include "pacer/config.hpp"
#include "pacer/health_store.hpp"
#include "pacer/task_store.hpp"
#include "pacer/types.hpp"

namespace pacer {

struct InteractionSettings {
  bool enabled{false};
  bool like_enabled{true};
  bool comment_enabled{true};
  bool follow_enabled{true};
  bool retweet_enabled{true};
  // Minimum minutes between runs of one task, per type. 0 = scheduler default.
  std::array<int, kActionTypeCount> min_interval_minutes{};
};

struct ScheduledTask {
  EngagementTask task;
  int priority{0};
};

struct QueueStats {
  std::size_t pending{0};
  std::size_t completed_today{0};
  std::size_t failed_today{0};
  int success_rate{0};  // rounded percent, 0 with no data
};

// Successful engagements over a trailing window, with a rough reach estimate
// (follow 100, comment 50, like 10 impressions each).
struct EngagementEffectiveness {
  std::size_t likes{0};
  std::size_t follows{0};
  std::size_t comments{0};
  std::size_t total{0};  // every logged engagement, any type or status
  int success_rate{0};   // rounded percent, 0 with no data
  int64_t estimated_reach{0};
};

struct BulkAddResult {
  std::size_t added{0};
  std::size_t failed{0};
};

struct TaskMaintenanceReport {
  std::size_t expired{0};
  std::size_t released_claims{0};
};

// Base 50; +20 if created < 24h ago, else +10 if < 72h; +15 follow, +10 like,
// +5 comment; capped at 100.
int task_priority(const EngagementTask& task, int64_t now_ms);

// Type-specific target rules. Returns ErrorCode::none when the task is valid.
ErrorCode validate_task(const EngagementTask& task, std::string* message);

class EngagementScheduler {
 public:
  EngagementScheduler(ITaskStore& tasks, IHealthStore& history, const SchedulerConfig& config,
                      const Clock& clock);

  // Projects without settings are treated as disabled.
  void set_interaction_settings(ProjectId project_id, const InteractionSettings& settings);
  std::optional<InteractionSettings> interaction_settings(ProjectId project_id) const;

  std::vector<ScheduledTask> get_next_tasks(ProjectId project_id, AccountId account_id,
                                            std::size_t limit = 5);

  // Types with remaining daily quota that are enabled for the project.
  std::vector<ActionType> available_types(const InteractionSettings& settings,
                                          AccountId account_id) const;

  bool claim_task(TaskId task_id);
  bool mark_task_completed(TaskId task_id);

  // Returns the new id, or 0 with *error set.
  TaskId add_to_queue(const EngagementTask& task, std::string* error = nullptr);
  BulkAddResult bulk_add_to_queue(const std::vector<EngagementTask>& tasks);

  TaskMaintenanceReport expire_tasks();

  void log_engagement(EngagementLogEntry entry);
  QueueStats get_queue_stats(ProjectId project_id, AccountId account_id) const;
  // Looks back `days` (<=0 means 30); bounded by the history the store retains.
  EngagementEffectiveness get_engagement_effectiveness(AccountId account_id, int days = 30) const;

  // Deletes completed/expired tasks not updated for `days`; <=0 uses config.
  std::size_t cleanup_old_tasks(int days = 0);

 private:
  int64_t min_wait_ms(const InteractionSettings& settings, ActionType type) const;

  ITaskStore& tasks_;
  IHealthStore& history_;
  SchedulerConfig config_;
  const Clock& clock_;

  mutable std::mutex settings_mu_;
  std::map<ProjectId, InteractionSettings> settings_;
};

}  // namespace pacer
