#include "pacer/gate.hpp"

#include "pacer/observability.hpp"

namespace pacer {

namespace {

struct Counters {
  uint32_t posts_today{0};
  uint32_t actions_today{0};
  uint32_t posts_this_hour{0};
  uint32_t actions_this_hour{0};
};

Counters effective_counters(const AccountHealthRecord& rec, int64_t now_ms) {
  Counters c;
  if (rec.counter_day != local_day_key(now_ms)) return c;
  c.posts_today = rec.posts_today;
  c.actions_today = rec.actions_today;
  if (rec.counter_hour != local_hour_key(now_ms)) return c;
  c.posts_this_hour = rec.posts_this_hour;
  c.actions_this_hour = rec.actions_this_hour;
  return c;
}

void roll_counters(AccountHealthRecord& rec, int64_t now_ms) {
  const int64_t day = local_day_key(now_ms);
  const int64_t hour = local_hour_key(now_ms);
  if (rec.counter_day != day) {
    rec.posts_today = 0;
    rec.actions_today = 0;
    rec.counter_day = day;
  }
  if (rec.counter_hour != hour) {
    rec.posts_this_hour = 0;
    rec.actions_this_hour = 0;
    rec.counter_hour = hour;
  }
}

void count_attempt(AccountHealthRecord& rec, ActionType type) {
  ++rec.actions_today;
  ++rec.actions_this_hour;
  if (type == ActionType::post) {
    ++rec.posts_today;
    ++rec.posts_this_hour;
  }
}

void settle_streaks(AccountHealthRecord& rec, ActionType type, bool success, int64_t now_ms) {
  if (success) {
    ++rec.consecutive_successes;
    rec.consecutive_failures = 0;
  } else {
    ++rec.consecutive_failures;
    rec.consecutive_successes = 0;
  }
  rec.last_action_at_ms = now_ms;
  if (type == ActionType::post) rec.last_post_at_ms = now_ms;
  rec.updated_at_ms = now_ms;
}

ActionPermission deny(DenyReason why, std::string reason, std::optional<int64_t> retry = std::nullopt) {
  ActionPermission p;
  p.allowed = false;
  p.deny = why;
  p.reason = std::move(reason);
  p.retry_after_ms = retry;
  return p;
}

void note_decision(AccountId account_id, const ActionPermission& p, int64_t now_ms) {
  global_core_stats().gate_checks.fetch_add(1, std::memory_order_relaxed);
  if (!p.allowed) {
    emit_core_event({CoreEventKind::gate_denied, account_id, to_string(p.deny),
                     p.retry_after_ms.value_or(0), now_ms});
  }
}

}  // namespace

ActionPermission evaluate_action(const AccountHealthRecord& rec, ActionType type,
                                 const HourlyLimitTable& hourly, int64_t now_ms) {
  if (rec.is_suspended) return deny(DenyReason::suspended, "Account is suspended");
  if (rec.account_phase == AccountPhase::suspended) {
    return deny(DenyReason::suspended, "Account is in suspended phase");
  }

  if (rec.is_throttled && rec.throttle_until_ms > now_ms) {
    return deny(DenyReason::throttled, "Account is throttled: " + rec.throttle_reason,
                rec.throttle_until_ms - now_ms);
  }

  const Counters c = effective_counters(rec, now_ms);
  const int64_t to_midnight = next_local_midnight_ms(now_ms) - now_ms;

  if (type == ActionType::post && c.posts_today >= rec.max_daily_posts) {
    return deny(DenyReason::daily_post_cap,
                "Daily post limit reached (" + std::to_string(c.posts_today) + "/" +
                    std::to_string(rec.max_daily_posts) + ")",
                to_midnight);
  }
  if (c.actions_today >= rec.max_daily_actions) {
    return deny(DenyReason::daily_action_cap,
                "Daily action limit reached (" + std::to_string(c.actions_today) + "/" +
                    std::to_string(rec.max_daily_actions) + ")",
                to_midnight);
  }

  const uint32_t limit = hourly_limit(hourly, rec.account_phase, type);
  const uint32_t used = type == ActionType::post ? c.posts_this_hour : c.actions_this_hour;
  if (used >= limit) {
    return deny(DenyReason::hourly_cap,
                "Hourly " + to_string(type) + " limit reached (" + std::to_string(used) + "/" +
                    std::to_string(limit) + ")",
                next_local_hour_ms(now_ms) - now_ms);
  }

  ActionPermission ok;
  ok.allowed = true;
  return ok;
}

ActionGate::ActionGate(IHealthStore& store, const PacerConfig& config, const Clock& clock)
    : store_(store), hourly_(config.hourly), clock_(clock) {}

ActionPermission ActionGate::can_perform_action(AccountId account_id, ActionType type) const {
  const int64_t now = clock_.now_ms();
  const auto rec = store_.get(account_id);
  const ActionPermission p = rec ? evaluate_action(*rec, type, hourly_, now)
                                 : deny(DenyReason::no_record, "No health record found for this account");
  note_decision(account_id, p, now);
  return p;
}

bool ActionGate::record_action(AccountId account_id, ActionType type, bool success) {
  const int64_t now = clock_.now_ms();
  AccountHealthRecord after;
  const bool found = store_.update(account_id, [&](AccountHealthRecord& rec) {
    roll_counters(rec, now);
    count_attempt(rec, type);
    settle_streaks(rec, type, success, now);
    after = rec;
  });
  if (!found) {
    log(LogLevel::warn, "gate", "cannot record action: no health record for account " +
                                    std::to_string(account_id));
    return false;
  }
  log(LogLevel::debug, "gate",
      "recorded " + to_string(type) + " (" + (success ? "success" : "failure") + ") for account " +
          std::to_string(account_id) + " [posts: " + std::to_string(after.posts_today) + "/" +
          std::to_string(after.max_daily_posts) + ", actions: " + std::to_string(after.actions_today) +
          "/" + std::to_string(after.max_daily_actions) + "]");
  return true;
}

ActionPermission ActionGate::try_reserve_action(AccountId account_id, ActionType type) {
  const int64_t now = clock_.now_ms();
  ActionPermission p = deny(DenyReason::no_record, "No health record found for this account");
  store_.update(account_id, [&](AccountHealthRecord& rec) {
    p = evaluate_action(rec, type, hourly_, now);
    if (!p.allowed) return;
    roll_counters(rec, now);
    count_attempt(rec, type);
    rec.updated_at_ms = now;
  });
  note_decision(account_id, p, now);
  if (p.allowed) emit_core_event({CoreEventKind::reservation, account_id, to_string(type), 0, now});
  return p;
}

bool ActionGate::settle_action(AccountId account_id, ActionType type, bool success) {
  const int64_t now = clock_.now_ms();
  return store_.update(account_id, [&](AccountHealthRecord& rec) {
    settle_streaks(rec, type, success, now);
  });
}

std::size_t ActionGate::reset_daily_counters() {
  const int64_t now = clock_.now_ms();
  std::size_t n = 0;
  for (AccountId id : store_.account_ids()) {
    const bool touched = store_.update(id, [&](AccountHealthRecord& rec) {
      rec.posts_today = 0;
      rec.actions_today = 0;
      rec.posts_this_hour = 0;
      rec.actions_this_hour = 0;
      rec.counter_day = local_day_key(now);
      rec.counter_hour = local_hour_key(now);
      rec.updated_at_ms = now;
    });
    if (touched) ++n;
  }
  log(LogLevel::info, "gate", "reset daily counters for " + std::to_string(n) + " accounts");
  return n;
}

std::size_t ActionGate::reset_hourly_counters() {
  const int64_t now = clock_.now_ms();
  std::size_t n = 0;
  for (AccountId id : store_.account_ids()) {
    const bool touched = store_.update(id, [&](AccountHealthRecord& rec) {
      // Rolls the daily counters too when the hour boundary is also midnight.
      roll_counters(rec, now);
      rec.posts_this_hour = 0;
      rec.actions_this_hour = 0;
      rec.counter_hour = local_hour_key(now);
    });
    if (touched) ++n;
  }
  log(LogLevel::debug, "gate", "reset hourly counters for " + std::to_string(n) + " accounts");
  return n;
}

bool ActionGate::throttle_for(AccountId account_id, int64_t duration_ms, const std::string& reason) {
  const int64_t now = clock_.now_ms();
  const bool found = store_.update(account_id, [&](AccountHealthRecord& rec) {
    rec.is_throttled = true;
    rec.throttle_until_ms = now + duration_ms;
    rec.throttle_reason = reason;
    rec.updated_at_ms = now;
  });
  if (found) {
    log(LogLevel::info, "gate",
        "account " + std::to_string(account_id) + " throttled for " +
            std::to_string(duration_ms / kMsPerSecond) + "s: " + reason);
    emit_core_event({CoreEventKind::throttle, account_id, reason, duration_ms, now});
  }
  return found;
}

}  // namespace pacer
