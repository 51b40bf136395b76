#include "pacer/health.hpp"

#include <algorithm>

#include "pacer/observability.hpp"
#include "pacer/scoring.hpp"

namespace pacer {

namespace {

std::string caps_text(const DailyCaps& c) {
  return "posts: " + std::to_string(c.max_posts) + "/day, actions: " +
         std::to_string(c.max_actions) + "/day";
}

}  // namespace

HealthEngine::HealthEngine(IHealthStore& store, const PacerConfig& config, const Clock& clock,
                           EscalationLog* escalations)
    : store_(store),
      policy_(config.policy),
      phase_caps_(config.phase_caps),
      clock_(clock),
      escalations_(escalations) {}

DailyCaps HealthEngine::caps_for(const AccountHealthRecord& rec, AccountPhase phase) const {
  if (rec.is_suspended) return DailyCaps{0, 0};
  const DailyCaps base = base_caps(phase_caps_, phase);
  return rec.is_throttled ? throttled_caps(base) : base;
}

int64_t HealthEngine::init_account_health(AccountId account_id) {
  const int64_t now = clock_.now_ms();
  const DailyCaps warming = base_caps(phase_caps_, AccountPhase::warming);

  AccountHealthRecord rec;
  rec.account_id = account_id;
  rec.account_phase = AccountPhase::warming;
  rec.warming_started_at_ms = now;
  rec.max_daily_posts = warming.max_posts;
  rec.max_daily_actions = warming.max_actions;
  rec.counter_day = local_day_key(now);
  rec.counter_hour = local_hour_key(now);
  rec.updated_at_ms = now;

  bool created = false;
  const int64_t id = store_.insert_if_absent(rec, &created);
  if (created) {
    log(LogLevel::info, "health", "created health record for account " + std::to_string(account_id));
  } else {
    log(LogLevel::debug, "health",
        "health record already exists for account " + std::to_string(account_id) + " (id: " +
            std::to_string(id) + ")");
  }
  return id;
}

PhaseAdvance HealthEngine::advance_warming_phase(AccountId account_id) {
  const int64_t now = clock_.now_ms();
  PhaseAdvance out;
  const int64_t growing_ms = static_cast<int64_t>(policy_.growing_after_days) * kMsPerDay;
  const int64_t mature_ms = static_cast<int64_t>(policy_.mature_after_days) * kMsPerDay;

  const bool found = store_.update(account_id, [&](AccountHealthRecord& rec) {
    out.phase = rec.account_phase;
    if (rec.is_suspended || rec.account_phase == AccountPhase::suspended) {
      out.message = "Account is suspended";
      return;
    }
    if (rec.warming_started_at_ms == 0) {
      out.message = "No warming start date";
      return;
    }
    if (rec.account_phase == AccountPhase::mature) {
      out.message = "Already at mature phase";
      return;
    }

    const int64_t elapsed = now - rec.warming_started_at_ms;
    const bool early = rec.account_phase == AccountPhase::warming ||
                       rec.account_phase == AccountPhase::growing;
    AccountPhase next = rec.account_phase;
    if (elapsed >= mature_ms && early) {
      next = AccountPhase::mature;
    } else if (elapsed >= growing_ms && rec.account_phase == AccountPhase::warming) {
      next = AccountPhase::growing;
    }

    if (next == rec.account_phase) {
      out.message = "Still in " + to_string(rec.account_phase) + " phase (" +
                    std::to_string(elapsed / kMsPerDay) + " days)";
      return;
    }

    const DailyCaps caps = caps_for(rec, next);
    rec.account_phase = next;
    rec.max_daily_posts = caps.max_posts;
    rec.max_daily_actions = caps.max_actions;
    if (next == AccountPhase::mature) rec.warming_completed_at_ms = now;
    rec.updated_at_ms = now;

    out.advanced = true;
    out.phase = next;
    out.message = "Advanced to " + to_string(next) + " phase (" + caps_text(caps) + ")";
  });

  if (!found) {
    out.message = "No health record found";
    return out;
  }
  if (out.advanced) {
    log(LogLevel::info, "health",
        "account " + std::to_string(account_id) + " advanced to '" + to_string(out.phase) + "'");
    emit_core_event({CoreEventKind::phase_advance, account_id, to_string(out.phase), 0, now});
  }
  return out;
}

HealthScoreBreakdown HealthEngine::calculate_health_score(AccountId account_id) {
  if (!store_.get(account_id)) return HealthScoreBreakdown{};

  const int64_t now = clock_.now_ms();
  const auto window = [now](int days) { return now - static_cast<int64_t>(days) * kMsPerDay; };

  HealthScoreBreakdown b;
  b.login_success_rate =
      login_success_rate(store_.session_attempts_since(account_id, window(policy_.login_window_days)));
  b.post_success_rate =
      post_success_rate(store_.publish_outcomes_since(account_id, window(policy_.post_window_days)));

  std::vector<int64_t> stamps;
  for (const auto& e : store_.engagements_since(account_id, window(policy_.naturalness_window_days))) {
    stamps.push_back(e.created_at_ms);
  }
  b.engagement_naturalness_score = engagement_naturalness(std::move(stamps), policy_);
  b.freeze_risk_score =
      freeze_risk(store_.freeze_detections_since(account_id, window(policy_.freeze_window_days)), now);
  b.health_score = composite_score(b.login_success_rate, b.post_success_rate,
                                   b.engagement_naturalness_score, b.freeze_risk_score, policy_);

  store_.update(account_id, [&](AccountHealthRecord& rec) {
    rec.health_score = b.health_score;
    rec.login_success_rate = b.login_success_rate;
    rec.post_success_rate = b.post_success_rate;
    rec.engagement_naturalness_score = b.engagement_naturalness_score;
    rec.freeze_risk_score = b.freeze_risk_score;
    rec.updated_at_ms = now;
  });

  log(LogLevel::debug, "health",
      "account " + std::to_string(account_id) + " score " + std::to_string(b.health_score) +
          " (login: " + std::to_string(b.login_success_rate) +
          ", post: " + std::to_string(b.post_success_rate) +
          ", naturalness: " + std::to_string(b.engagement_naturalness_score) +
          ", freezeRisk: " + std::to_string(b.freeze_risk_score) + ")");
  return b;
}

ThrottleDecision HealthEngine::check_and_throttle(AccountId account_id) {
  const HealthScoreBreakdown b = calculate_health_score(account_id);
  const int score = b.health_score;
  const int64_t now = clock_.now_ms();
  ThrottleDecision d;
  d.health_score = score;

  // A missing record scores 0 and falls through to the update, which reports it.
  if (score >= policy_.throttle_below) {
    d.message = "Health score OK (" + std::to_string(score) + ")";
    return d;
  }

  DailyCaps applied{0, 0};
  const bool found = store_.update(account_id, [&](AccountHealthRecord& rec) {
    if (score < policy_.suspend_below) {
      // Escalation fires once per crossing; clearing is_escalated re-arms it.
      const bool escalate = score < policy_.escalate_below && !rec.is_escalated;
      const bool critical = score < policy_.escalate_below;
      const int threshold = critical ? policy_.escalate_below : policy_.suspend_below;
      rec.is_suspended = true;
      rec.suspended_reason = (critical ? "Health score critically low: " : "Health score low: ") +
                             std::to_string(score);
      rec.is_throttled = true;
      rec.throttle_reason = "Auto-suspended: health score " + std::to_string(score) + " < " +
                            std::to_string(threshold);
      if (escalate) rec.is_escalated = true;
      rec.max_daily_posts = 0;
      rec.max_daily_actions = 0;
      d.action = escalate ? ThrottleAction::escalate : ThrottleAction::suspend;
    } else {
      applied = throttled_caps(base_caps(phase_caps_, rec.account_phase));
      rec.is_throttled = true;
      rec.throttle_reason = "Auto-throttled: health score " + std::to_string(score) + " < " +
                            std::to_string(policy_.throttle_below);
      rec.is_suspended = false;
      rec.suspended_reason.clear();
      rec.is_escalated = false;
      rec.max_daily_posts = applied.max_posts;
      rec.max_daily_actions = applied.max_actions;
      d.action = ThrottleAction::throttle;
    }
    rec.updated_at_ms = now;
  });

  if (!found) {
    d.health_score = 0;
    d.message = "No health record found";
    return d;
  }

  const std::string who = "account " + std::to_string(account_id);
  switch (d.action) {
    case ThrottleAction::escalate:
      d.message = "Full suspend + escalation record created (score: " + std::to_string(score) + ")";
      log(LogLevel::warn, "health", "ESCALATION: " + who + " fully suspended (score: " +
                                        std::to_string(score) + ")");
      emit_core_event({CoreEventKind::escalate, account_id, "", score, now});
      raise_escalation(account_id, b);
      break;
    case ThrottleAction::suspend:
      d.message = "Automation suspended (score: " + std::to_string(score) + ")";
      log(LogLevel::warn, "health", who + " suspended (score: " + std::to_string(score) + ")");
      emit_core_event({CoreEventKind::suspend, account_id, "", score, now});
      break;
    case ThrottleAction::throttle:
      d.message = "Throttled 50% (score: " + std::to_string(score) + ", " + caps_text(applied) + ")";
      log(LogLevel::info, "health", who + " throttled 50% (score: " + std::to_string(score) + ")");
      emit_core_event({CoreEventKind::throttle, account_id, "", score, now});
      break;
    case ThrottleAction::none:
      break;
  }
  return d;
}

void HealthEngine::raise_escalation(AccountId account_id, const HealthScoreBreakdown& breakdown) {
  EscalationRecord r;
  r.account_id = account_id;
  r.health_score = breakdown.health_score;
  r.breakdown = breakdown;
  r.reason = "Account " + std::to_string(account_id) + " health critically low (" +
             std::to_string(breakdown.health_score) + "/100). Manual review required.";
  r.timestamp_unix_ms = clock_.now_ms();
  if (escalations_) {
    escalations_->append(r);
  } else {
    log(LogLevel::warn, "health", "escalation not recorded (no log configured): " + r.reason);
  }
}

OperationResult HealthEngine::unthrottle(AccountId account_id) {
  const auto rec = store_.get(account_id);
  if (!rec) return {false, "No health record found"};
  if (!rec->is_throttled && !rec->is_suspended) {
    return {false, "Account is not throttled or suspended"};
  }

  const int score = calculate_health_score(account_id).health_score;
  if (score < policy_.unthrottle_at) {
    return {false, "Health score " + std::to_string(score) + " is below " +
                       std::to_string(policy_.unthrottle_at) + " threshold for unthrottling"};
  }

  const int64_t now = clock_.now_ms();
  DailyCaps restored{};
  store_.update(account_id, [&](AccountHealthRecord& r) {
    restored = base_caps(phase_caps_, r.account_phase);
    r.is_throttled = false;
    r.throttle_reason.clear();
    r.throttle_until_ms = 0;
    r.is_suspended = false;
    r.suspended_reason.clear();
    r.is_escalated = false;
    r.max_daily_posts = restored.max_posts;
    r.max_daily_actions = restored.max_actions;
    r.updated_at_ms = now;
  });

  log(LogLevel::info, "health",
      "account " + std::to_string(account_id) + " unthrottled (score: " + std::to_string(score) + ")");
  emit_core_event({CoreEventKind::unthrottle, account_id, "", score, now});
  return {true, "Unthrottled successfully (score: " + std::to_string(score) + ", " +
                    caps_text(restored) + ")"};
}

OperationResult HealthEngine::begin_cooling(AccountId account_id, const std::string& reason) {
  const int64_t now = clock_.now_ms();
  OperationResult out;
  const bool found = store_.update(account_id, [&](AccountHealthRecord& rec) {
    if (rec.is_suspended || rec.account_phase == AccountPhase::suspended) {
      out.message = "Account is suspended";
      return;
    }
    if (rec.account_phase == AccountPhase::cooling) {
      out.message = "Account is already cooling";
      return;
    }
    rec.phase_before_cooling = rec.account_phase;
    rec.account_phase = AccountPhase::cooling;
    rec.cooling_started_at_ms = now;
    const DailyCaps caps = caps_for(rec, AccountPhase::cooling);
    rec.max_daily_posts = caps.max_posts;
    rec.max_daily_actions = caps.max_actions;
    rec.updated_at_ms = now;
    out.success = true;
    out.message = "Cooling from " + to_string(rec.phase_before_cooling) + ": " + reason;
  });
  if (!found) return {false, "No health record found"};
  if (out.success) {
    log(LogLevel::info, "health", "account " + std::to_string(account_id) + " entered cooling: " + reason);
    emit_core_event({CoreEventKind::cooling_enter, account_id, reason, 0, now});
  }
  return out;
}

OperationResult HealthEngine::recover_from_cooling(AccountId account_id) {
  const auto rec = store_.get(account_id);
  if (!rec) return {false, "No health record found"};
  if (rec->account_phase != AccountPhase::cooling) return {false, "Account is not cooling"};

  const int64_t now = clock_.now_ms();
  const int64_t cooled = now - rec->cooling_started_at_ms;
  if (cooled < policy_.cooling_min_ms) {
    return {false, "Cooling period not finished (" + std::to_string((policy_.cooling_min_ms - cooled) / kMsPerMinute) +
                       " minutes remaining)"};
  }

  const int score = calculate_health_score(account_id).health_score;
  if (score < policy_.unthrottle_at) {
    return {false, "Health score " + std::to_string(score) + " is below " +
                       std::to_string(policy_.unthrottle_at) + " threshold for recovery"};
  }

  OperationResult out;
  store_.update(account_id, [&](AccountHealthRecord& r) {
    if (r.account_phase != AccountPhase::cooling) {
      out.message = "Account is not cooling";
      return;
    }
    r.account_phase = r.phase_before_cooling;
    r.cooling_started_at_ms = 0;
    const DailyCaps caps = caps_for(r, r.account_phase);
    r.max_daily_posts = caps.max_posts;
    r.max_daily_actions = caps.max_actions;
    r.updated_at_ms = now;
    out.success = true;
    out.message = "Recovered to " + to_string(r.account_phase) + " phase (" + caps_text(caps) + ")";
  });
  if (out.success) {
    log(LogLevel::info, "health", "account " + std::to_string(account_id) + " recovered from cooling");
    emit_core_event({CoreEventKind::cooling_exit, account_id, "", score, now});
  }
  return out;
}

void HealthEngine::record_session_attempt(AccountId account_id, bool success) {
  store_.append_session_attempt(account_id, SessionAttempt{clock_.now_ms(), success});
}

void HealthEngine::record_publish_outcome(AccountId account_id, PublishStatus status) {
  store_.append_publish_outcome(account_id, PublishOutcome{clock_.now_ms(), status});
}

void HealthEngine::record_freeze_detection(AccountId account_id, int confidence) {
  const int c = std::max(0, std::min(100, confidence));
  store_.append_freeze_detection(account_id, FreezeDetection{clock_.now_ms(), c});
  store_.update(account_id, [](AccountHealthRecord& rec) { ++rec.total_freeze_count; });
}

std::vector<HealthOverviewEntry> HealthEngine::get_health_overview() const {
  std::vector<HealthOverviewEntry> out;
  for (const auto& rec : store_.all()) {
    HealthOverviewEntry e;
    e.account_id = rec.account_id;
    e.health_score = rec.health_score;
    e.account_phase = rec.account_phase;
    e.is_throttled = rec.is_throttled;
    e.is_suspended = rec.is_suspended;
    e.posts_today = rec.posts_today;
    e.max_daily_posts = rec.max_daily_posts;
    e.actions_today = rec.actions_today;
    e.max_daily_actions = rec.max_daily_actions;
    out.push_back(e);
  }
  std::stable_sort(out.begin(), out.end(), [](const HealthOverviewEntry& a, const HealthOverviewEntry& b) {
    return a.health_score < b.health_score;
  });
  return out;
}

bool HealthEngine::is_account_healthy(AccountId account_id) const {
  const auto rec = store_.get(account_id);
  if (!rec) return false;
  return !rec->is_suspended && rec->health_score >= policy_.suspend_below;
}

std::optional<AccountHealthRecord> HealthEngine::get_record(AccountId account_id) const {
  return store_.get(account_id);
}

}  // namespace pacer
