#include "pacer/scheduler.hpp"

#include <algorithm>
#include <cmath>

#include "pacer/observability.hpp"

namespace pacer {

namespace {

bool type_enabled(const InteractionSettings& s, ActionType type) {
  switch (type) {
    case ActionType::like:     return s.like_enabled;
    case ActionType::comment:  return s.comment_enabled;
    case ActionType::follow:   return s.follow_enabled;
    case ActionType::retweet:  return s.retweet_enabled;
    case ActionType::unfollow: return true;
    case ActionType::post:     return false;
  }
  return false;
}

}  // namespace

int task_priority(const EngagementTask& task, int64_t now_ms) {
  int priority = 50;
  const int64_t age = now_ms - task.created_at_ms;
  if (age < 24 * kMsPerHour) priority += 20;
  else if (age < 72 * kMsPerHour) priority += 10;

  switch (task.task_type) {
    case ActionType::follow:  priority += 15; break;
    case ActionType::like:    priority += 10; break;
    case ActionType::comment: priority += 5; break;
    default: break;
  }
  return std::min(100, priority);
}

ErrorCode validate_task(const EngagementTask& task, std::string* message) {
  auto fail = [message](const std::string& m) {
    if (message) *message = m;
    return ErrorCode::invalid_task;
  };

  switch (task.task_type) {
    case ActionType::follow:
    case ActionType::unfollow:
      if (task.target_user.empty()) return fail(to_string(task.task_type) + " requires target_user");
      if (!task.target_post.empty()) return fail(to_string(task.task_type) + " takes no target_post");
      break;
    case ActionType::like:
      if (task.target_post.empty()) return fail("like requires target_post");
      if (!task.target_user.empty()) return fail("like takes no target_user");
      break;
    case ActionType::comment:
      if (task.target_post.empty()) return fail("comment requires target_post");
      if (!task.target_user.empty()) return fail("comment takes no target_user");
      if (task.comment_text.empty()) return fail("comment requires comment_text");
      break;
    case ActionType::post:
    case ActionType::retweet:
      return fail("task type " + to_string(task.task_type) + " is not queueable");
  }
  if (task.task_type != ActionType::comment && !task.comment_text.empty()) {
    return fail("comment_text is only valid for comment tasks");
  }
  return ErrorCode::none;
}

EngagementScheduler::EngagementScheduler(ITaskStore& tasks, IHealthStore& history,
                                         const SchedulerConfig& config, const Clock& clock)
    : tasks_(tasks), history_(history), config_(config), clock_(clock) {}

void EngagementScheduler::set_interaction_settings(ProjectId project_id,
                                                   const InteractionSettings& settings) {
  std::lock_guard<std::mutex> lk(settings_mu_);
  settings_[project_id] = settings;
}

std::optional<InteractionSettings> EngagementScheduler::interaction_settings(ProjectId project_id) const {
  std::lock_guard<std::mutex> lk(settings_mu_);
  auto it = settings_.find(project_id);
  if (it == settings_.end()) return std::nullopt;
  return it->second;
}

std::vector<ActionType> EngagementScheduler::available_types(const InteractionSettings& settings,
                                                             AccountId account_id) const {
  const int64_t now = clock_.now_ms();
  std::array<uint32_t, kActionTypeCount> counts{};
  for (const auto& e : history_.engagements_since(account_id, local_day_start_ms(now))) {
    ++counts[index_of(e.task_type)];
  }

  std::vector<ActionType> out;
  for (ActionType t : kAllActionTypes) {
    if (counts[index_of(t)] >= config_.daily_limits[index_of(t)]) continue;
    if (type_enabled(settings, t)) out.push_back(t);
  }
  return out;
}

int64_t EngagementScheduler::min_wait_ms(const InteractionSettings& settings, ActionType type) const {
  const int minutes = settings.min_interval_minutes[index_of(type)];
  return minutes > 0 ? static_cast<int64_t>(minutes) * kMsPerMinute : config_.default_retrigger_ms;
}

std::vector<ScheduledTask> EngagementScheduler::get_next_tasks(ProjectId project_id, AccountId account_id,
                                                               std::size_t limit) {
  const auto settings = interaction_settings(project_id);
  if (!settings || !settings->enabled) {
    log(LogLevel::debug, "scheduler", "interactions disabled for project " + std::to_string(project_id));
    return {};
  }

  const std::vector<ActionType> available = available_types(*settings, account_id);
  if (available.empty()) {
    log(LogLevel::info, "scheduler",
        "all task types at daily limit for account " + std::to_string(account_id));
    return {};
  }
  if (limit == 0) return {};

  const int64_t now = clock_.now_ms();
  std::vector<ScheduledTask> out;
  for (auto& task : tasks_.pending_for(project_id, account_id, limit * 2, now)) {
    if (std::find(available.begin(), available.end(), task.task_type) == available.end()) continue;
    if (task.last_executed_at_ms != 0 &&
        now - task.last_executed_at_ms < min_wait_ms(*settings, task.task_type)) {
      continue;
    }
    const int priority = task_priority(task, now);
    out.push_back(ScheduledTask{std::move(task), priority});
  }

  std::stable_sort(out.begin(), out.end(), [](const ScheduledTask& a, const ScheduledTask& b) {
    return a.priority > b.priority;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

bool EngagementScheduler::claim_task(TaskId task_id) {
  const int64_t now = clock_.now_ms();
  bool claimed = false;
  tasks_.update(task_id, [&](EngagementTask& t) {
    if (t.state != TaskState::pending) return;
    if (t.expires_at_ms != 0 && t.expires_at_ms <= now) return;
    t.state = TaskState::claimed;
    t.claimed_at_ms = now;
    t.updated_at_ms = now;
    claimed = true;
  });
  return claimed;
}

bool EngagementScheduler::mark_task_completed(TaskId task_id) {
  const int64_t now = clock_.now_ms();
  bool done = false;
  const bool found = tasks_.update(task_id, [&](EngagementTask& t) {
    if (t.state != TaskState::pending && t.state != TaskState::claimed) return;
    t.state = TaskState::completed;
    t.last_executed_at_ms = now;
    t.updated_at_ms = now;
    done = true;
  });
  if (!found) log(LogLevel::warn, "scheduler", "mark completed: no task " + std::to_string(task_id));
  return done;
}

TaskId EngagementScheduler::add_to_queue(const EngagementTask& task, std::string* error) {
  std::string why;
  if (validate_task(task, &why) != ErrorCode::none) {
    if (error) *error = why;
    return 0;
  }
  const int64_t now = clock_.now_ms();
  EngagementTask row = task;
  row.state = TaskState::pending;
  row.claimed_at_ms = 0;
  if (row.created_at_ms == 0) row.created_at_ms = now;
  row.updated_at_ms = now;
  return tasks_.insert(std::move(row));
}

BulkAddResult EngagementScheduler::bulk_add_to_queue(const std::vector<EngagementTask>& tasks) {
  BulkAddResult r;
  for (const auto& t : tasks) {
    std::string error;
    if (add_to_queue(t, &error) != 0) {
      ++r.added;
    } else {
      log(LogLevel::warn, "scheduler", "failed to add task: " + error);
      ++r.failed;
    }
  }
  return r;
}

TaskMaintenanceReport EngagementScheduler::expire_tasks() {
  const int64_t now = clock_.now_ms();
  const int64_t claim_deadline = now - config_.claim_timeout_ms;
  TaskMaintenanceReport r;

  const auto candidates = tasks_.find([&](const EngagementTask& t) {
    const bool past_expiry = t.state == TaskState::pending && t.expires_at_ms != 0 && t.expires_at_ms <= now;
    const bool stale_claim = t.state == TaskState::claimed && t.claimed_at_ms <= claim_deadline;
    return past_expiry || stale_claim;
  });

  for (TaskId id : candidates) {
    tasks_.update(id, [&](EngagementTask& t) {
      if (t.state == TaskState::pending && t.expires_at_ms != 0 && t.expires_at_ms <= now) {
        t.state = TaskState::expired;
        t.updated_at_ms = now;
        ++r.expired;
      } else if (t.state == TaskState::claimed && t.claimed_at_ms <= claim_deadline) {
        log(LogLevel::warn, "scheduler",
            "task " + std::to_string(t.id) + " claimed " +
                std::to_string((now - t.claimed_at_ms) / kMsPerMinute) +
                " minutes ago and never completed; returning to queue");
        t.state = TaskState::pending;
        t.claimed_at_ms = 0;
        t.updated_at_ms = now;
        ++r.released_claims;
      }
    });
  }
  return r;
}

void EngagementScheduler::log_engagement(EngagementLogEntry entry) {
  if (entry.created_at_ms == 0) entry.created_at_ms = clock_.now_ms();
  history_.append_engagement(entry);
}

QueueStats EngagementScheduler::get_queue_stats(ProjectId project_id, AccountId account_id) const {
  QueueStats s;
  s.pending = tasks_.count_pending(project_id, account_id);
  const int64_t today = local_day_start_ms(clock_.now_ms());
  for (const auto& e : history_.engagements_since(account_id, today)) {
    if (e.status == EngagementStatus::success) ++s.completed_today;
    else ++s.failed_today;
  }
  const std::size_t total = s.completed_today + s.failed_today;
  if (total > 0) {
    s.success_rate = static_cast<int>(
        std::lround(100.0 * static_cast<double>(s.completed_today) / static_cast<double>(total)));
  }
  return s;
}

EngagementEffectiveness EngagementScheduler::get_engagement_effectiveness(AccountId account_id,
                                                                         int days) const {
  if (days <= 0) days = 30;
  const int64_t since = clock_.now_ms() - static_cast<int64_t>(days) * kMsPerDay;
  EngagementEffectiveness out;
  std::size_t succeeded = 0;
  for (const auto& e : history_.engagements_since(account_id, since)) {
    ++out.total;
    if (e.status != EngagementStatus::success) continue;
    ++succeeded;
    switch (e.task_type) {
      case ActionType::like:    ++out.likes; break;
      case ActionType::follow:  ++out.follows; break;
      case ActionType::comment: ++out.comments; break;
      default: break;
    }
  }
  if (out.total > 0) {
    out.success_rate = static_cast<int>(
        std::lround(100.0 * static_cast<double>(succeeded) / static_cast<double>(out.total)));
  }
  out.estimated_reach = static_cast<int64_t>(out.follows) * 100 +
                        static_cast<int64_t>(out.comments) * 50 + static_cast<int64_t>(out.likes) * 10;
  return out;
}

std::size_t EngagementScheduler::cleanup_old_tasks(int days) {
  if (days <= 0) days = config_.cleanup_after_days;
  const int64_t cutoff = clock_.now_ms() - static_cast<int64_t>(days) * kMsPerDay;
  const std::size_t removed = tasks_.remove_if([cutoff](const EngagementTask& t) {
    const bool terminal = t.state == TaskState::completed || t.state == TaskState::expired;
    return terminal && t.updated_at_ms < cutoff;
  });
  if (removed > 0) {
    log(LogLevel::info, "scheduler", "removed " + std::to_string(removed) + " old tasks");
  }
  return removed;
}

}  // namespace pacer
