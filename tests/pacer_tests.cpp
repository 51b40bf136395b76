#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "pacer/checkpoint.hpp"
#include "pacer/clock.hpp"
#include "pacer/config.hpp"
#include "pacer/escalation.hpp"
#include "pacer/gate.hpp"
#include "pacer/hash.hpp"
#include "pacer/health.hpp"
#include "pacer/health_store.hpp"
#include "pacer/jsonlite.hpp"
#include "pacer/limits.hpp"
#include "pacer/observability.hpp"
#include "pacer/scheduler.hpp"
#include "pacer/scoring.hpp"
#include "pacer/session_pool.hpp"
#include "pacer/supervisor.hpp"
#include "pacer/task_store.hpp"
#include "pacer/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

using pacer::AccountPhase;
using pacer::ActionType;
using pacer::kMsPerDay;
using pacer::kMsPerHour;
using pacer::kMsPerMinute;
using pacer::kMsPerSecond;

// Local noon of a fixed winter day, far from DST switches and midnight.
int64_t test_noon() {
  return pacer::local_day_start_ms(1767268800000LL) + 12 * kMsPerHour;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path tmp = fs::temp_directory_path() / name;
  fs::remove_all(tmp);
  fs::create_directories(tmp);
  return tmp;
}

struct Core {
  pacer::ManualClock clock{test_noon()};
  pacer::PacerConfig cfg = pacer::default_config();
  pacer::MemoryHealthStore store;
  pacer::EscalationLog escalations;
  pacer::HealthEngine health{store, cfg, clock, &escalations};
  pacer::ActionGate gate{store, cfg, clock};
};

// One failed login and one failed post: 0*.2 + 0*.3 + 100*.2 + 100*.3 = 50.
void make_score_50(Core& c, pacer::AccountId id) {
  c.health.record_session_attempt(id, false);
  c.health.record_publish_outcome(id, pacer::PublishStatus::failed);
}

// ============================================================================
// Hashing, limits and scoring
// ============================================================================

void test_blake3_known_vectors() {
  expect(pacer::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(pacer::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "same bytes";
  const std::string raw = pacer::blake3_hex(payload);
  const std::string ckpt = pacer::checkpoint_content_hash(payload);
  const std::string esc = pacer::escalation_chain_hash(payload);
  expect(raw != ckpt && ckpt != esc && raw != esc, "domains must not collide");
  expect(ckpt == pacer::hash_domain("ckpt:", payload), "checkpoint domain prefix");
  expect(pacer::is_hex_digest(ckpt), "digest is 64 lowercase hex");
  expect(!pacer::is_hex_digest("ABC"), "short digest rejected");
  expect(!pacer::is_hex_digest(std::string(64, 'G')), "non-hex digest rejected");
}

void test_default_tables() {
  const auto hourly = pacer::default_hourly_limits();
  expect(pacer::hourly_limit(hourly, AccountPhase::warming, ActionType::like) == 3, "warming like/h");
  expect(pacer::hourly_limit(hourly, AccountPhase::mature, ActionType::post) == 5, "mature post/h");
  expect(pacer::hourly_limit(hourly, AccountPhase::growing, ActionType::unfollow) ==
             pacer::hourly_limit(hourly, AccountPhase::growing, ActionType::follow),
         "unfollow mirrors follow");
  for (ActionType t : pacer::kAllActionTypes) {
    expect(pacer::hourly_limit(hourly, AccountPhase::suspended, t) == 0, "suspended row is zero");
  }

  const auto caps = pacer::default_phase_caps();
  expect(pacer::base_caps(caps, AccountPhase::warming).max_posts == 1, "warming posts");
  expect(pacer::base_caps(caps, AccountPhase::growing).max_actions == 30, "growing actions");
  expect(pacer::base_caps(caps, AccountPhase::cooling).max_actions == 5, "cooling actions");

  const pacer::DailyCaps w = pacer::throttled_caps({1, 10});
  expect(w.max_posts == 1 && w.max_actions == 5, "warming throttle floors at 1/5");
  const pacer::DailyCaps m = pacer::throttled_caps({10, 100});
  expect(m.max_posts == 5 && m.max_actions == 50, "mature throttle halves");
  const pacer::DailyCaps z = pacer::throttled_caps({0, 0});
  expect(z.max_posts == 0 && z.max_actions == 0, "zero caps stay zero");

  expect(pacer::validate_limits(hourly, caps, pacer::HealthPolicy{}).empty(), "defaults are consistent");
  auto broken = hourly;
  broken[pacer::index_of(AccountPhase::warming)][pacer::index_of(ActionType::like)] = 50;
  expect(!pacer::validate_limits(broken, caps, pacer::HealthPolicy{}).empty(), "non-monotonic table flagged");
}

void test_sub_scores() {
  const int64_t now = test_noon();
  expect(pacer::login_success_rate({}) == 100, "no logins scores 100");
  expect(pacer::login_success_rate({{now, true}, {now, true}, {now, false}}) == 67, "2 of 3 logins");

  using pacer::PublishStatus;
  expect(pacer::post_success_rate({{now, PublishStatus::pending}}) == 100, "pending ignored");
  expect(pacer::post_success_rate({{now, PublishStatus::published}, {now, PublishStatus::failed},
                                   {now, PublishStatus::pending}}) == 50,
         "half published");

  pacer::HealthPolicy policy;
  expect(pacer::engagement_naturalness({now}, policy) == 100, "single engagement is natural");
  // Gaps: 1s (rapid) and 9s: ratio 0.5 pulls 100 halfway to the floor of 20.
  expect(pacer::engagement_naturalness({now + 10000, now, now + 1000}, policy) == 60, "half rapid");

  expect(pacer::freeze_risk({}, now) == 0, "no freezes");
  expect(pacer::freeze_risk({{now, 0}}, now) == 10, "unknown confidence weighs 50");
  expect(pacer::freeze_risk({{now - 40 * kMsPerDay, 100}}, now) == 1, "old detection floors at 1");
  expect(pacer::composite_score(100, 100, 100, 0, policy) == 100, "perfect composite");
  expect(pacer::composite_score(0, 50, 100, 0, policy) == 65, "weighted composite");
}

// ============================================================================
// Account Health & Phase Engine
// ============================================================================

void test_init_is_idempotent() {
  Core c;
  const int64_t first = c.health.init_account_health(7);
  const int64_t second = c.health.init_account_health(7);
  expect(first == second, "second init returns existing id");

  const auto rec = c.health.get_record(7);
  expect(rec.has_value(), "record created");
  expect(rec->account_phase == AccountPhase::warming, "starts warming");
  expect(rec->max_daily_posts == 1 && rec->max_daily_actions == 10, "warming caps");
  expect(rec->warming_started_at_ms == test_noon(), "warming start stamped");
  expect(c.health.get_health_overview().size() == 1, "one account in overview");
}

void test_score_without_record() {
  Core c;
  const auto b = c.health.calculate_health_score(404);
  expect(b.health_score == 0 && b.freeze_risk_score == 100, "missing record yields 0/100");
  expect(!c.health.get_record(404).has_value(), "nothing written");

  c.health.init_account_health(1);
  expect(c.health.calculate_health_score(1).health_score == 100, "clean history scores 100");
  expect(c.health.get_record(1)->health_score == 100, "score persisted");
}

void test_phase_progression() {
  Core c;
  c.health.init_account_health(1);

  c.clock.advance(6 * kMsPerDay);
  expect(!c.health.advance_warming_phase(1).advanced, "day 6 still warming");

  c.clock.advance(kMsPerDay);
  auto step = c.health.advance_warming_phase(1);
  expect(step.advanced && step.phase == AccountPhase::growing, "day 7 growing");
  auto rec = c.health.get_record(1);
  expect(rec->max_daily_posts == 3 && rec->max_daily_actions == 30, "growing caps");

  c.clock.advance(7 * kMsPerDay);
  step = c.health.advance_warming_phase(1);
  expect(step.advanced && step.phase == AccountPhase::mature, "day 14 mature");
  rec = c.health.get_record(1);
  expect(rec->max_daily_posts == 10 && rec->max_daily_actions == 100, "mature caps");
  expect(rec->warming_completed_at_ms == c.clock.now_ms(), "warming completion stamped");

  step = c.health.advance_warming_phase(1);
  expect(!step.advanced && step.message == "Already at mature phase", "mature is terminal");
  expect(!c.health.advance_warming_phase(99).advanced, "missing record does not advance");
}

void test_skip_to_mature() {
  Core c;
  c.health.init_account_health(1);
  c.clock.advance(15 * kMsPerDay);
  const auto step = c.health.advance_warming_phase(1);
  expect(step.advanced && step.phase == AccountPhase::mature, "warming jumps straight to mature");
}

void test_throttle_halves_caps_once() {
  Core c;
  c.health.init_account_health(1);
  make_score_50(c, 1);

  auto d = c.health.check_and_throttle(1);
  expect(d.action == pacer::ThrottleAction::throttle, "score 50 throttles");
  expect(d.health_score == 50, "score reported");
  expect(d.message.rfind("Throttled 50%", 0) == 0, "throttle message");
  auto rec = c.health.get_record(1);
  expect(rec->is_throttled && !rec->is_suspended, "throttled flag only");
  expect(rec->max_daily_posts == 1 && rec->max_daily_actions == 5, "warming caps halved with floor");
  expect(rec->throttle_reason == "Auto-throttled: health score 50 < 60", "throttle reason");

  d = c.health.check_and_throttle(1);
  rec = c.health.get_record(1);
  expect(rec->max_daily_actions == 5, "repeat throttle does not compound");
}

void test_unthrottle_hysteresis() {
  Core c;
  c.health.init_account_health(1);
  make_score_50(c, 1);
  c.health.check_and_throttle(1);

  // post 1/2 -> 50: 0*.2 + 50*.3 + 20 + 30 = 65, inside the hysteresis band.
  c.health.record_publish_outcome(1, pacer::PublishStatus::published);
  auto d = c.health.check_and_throttle(1);
  expect(d.action == pacer::ThrottleAction::none && d.health_score == 65, "65 takes no action");
  expect(c.health.get_record(1)->is_throttled, "still throttled at 65");
  auto r = c.health.unthrottle(1);
  expect(!r.success, "unthrottle refused below 70");
  expect(r.message == "Health score 65 is below 70 threshold for unthrottling", "refusal message");

  // login 2/3 -> 67: 13.4 + 15 + 20 + 30 = 78.
  c.health.record_session_attempt(1, true);
  c.health.record_session_attempt(1, true);
  r = c.health.unthrottle(1);
  expect(r.success, "unthrottle at 78");
  const auto rec = c.health.get_record(1);
  expect(!rec->is_throttled && !rec->is_suspended, "flags cleared");
  expect(rec->max_daily_posts == 1 && rec->max_daily_actions == 10, "base caps restored");

  r = c.health.unthrottle(1);
  expect(!r.success && r.message == "Account is not throttled or suspended", "nothing to lift");
}

void test_unthrottle_at_exact_threshold() {
  Core c;
  c.health.init_account_health(1);
  make_score_50(c, 1);
  expect(c.health.check_and_throttle(1).action == pacer::ThrottleAction::throttle, "50 throttles");

  // Both failures age out of the 30-day windows; one fresh failed post:
  // 100*.2 + 0*.3 + 20 + 30 = 70.
  c.clock.advance(31 * kMsPerDay);
  c.health.record_publish_outcome(1, pacer::PublishStatus::failed);
  expect(c.health.calculate_health_score(1).health_score == 70, "score exactly 70");
  const auto r = c.health.unthrottle(1);
  expect(r.success, "unthrottle allowed at exactly 70");
  const auto rec = c.health.get_record(1);
  expect(!rec->is_throttled && rec->max_daily_posts == 1 && rec->max_daily_actions == 10,
         "warming caps restored");
}

void test_fresh_account_takes_no_action() {
  Core c;
  c.health.init_account_health(1);
  const auto d = c.health.check_and_throttle(1);
  expect(d.action == pacer::ThrottleAction::none, "no data, no action");
  expect(d.health_score == 100, "fresh account scores 100");
  const auto rec = c.health.get_record(1);
  expect(!rec->is_throttled && !rec->is_suspended, "no flags set");
}

void test_failed_logins_to_suspension() {
  Core c;
  c.health.init_account_health(1);
  for (int i = 0; i < 3; ++i) c.health.record_session_attempt(1, false);

  // login 0/3: 0 + 30 + 20 + 30 = 80.
  const auto score = c.health.calculate_health_score(1);
  expect(score.login_success_rate == 0 && score.health_score == 80, "logins alone give 80");
  expect(c.health.check_and_throttle(1).action == pacer::ThrottleAction::none, "80 takes no action");

  c.health.record_publish_outcome(1, pacer::PublishStatus::failed);
  c.health.record_publish_outcome(1, pacer::PublishStatus::failed);
  c.health.record_freeze_detection(1, 100);
  c.health.record_freeze_detection(1, 100);

  // 0 + 0 + 20 + 60*.3 = 38.
  const auto d = c.health.check_and_throttle(1);
  expect(d.action == pacer::ThrottleAction::suspend && d.health_score == 38, "38 suspends");
  const auto rec = c.health.get_record(1);
  expect(rec->max_daily_posts == 0 && rec->max_daily_actions == 0, "caps zeroed");

  const auto p = c.gate.can_perform_action(1, ActionType::post);
  expect(!p.allowed && p.deny == pacer::DenyReason::suspended, "post denied as suspended");
}

void test_suspend_blocks_gate() {
  Core c;
  c.health.init_account_health(1);
  make_score_50(c, 1);
  c.health.record_freeze_detection(1, 100);
  c.health.record_freeze_detection(1, 100);

  // freeze risk 40: 0 + 0 + 20 + 60*.3 = 38.
  const auto d = c.health.check_and_throttle(1);
  expect(d.action == pacer::ThrottleAction::suspend && d.health_score == 38, "38 suspends");
  const auto rec = c.health.get_record(1);
  expect(rec->is_suspended && rec->is_throttled, "suspend sets both flags");
  expect(rec->max_daily_posts == 0 && rec->max_daily_actions == 0, "caps zeroed");
  expect(rec->total_freeze_count == 2, "freezes counted");
  expect(!c.health.is_account_healthy(1), "suspended account unhealthy");
  expect(c.escalations.recent().empty(), "suspend alone does not escalate");

  const auto p = c.gate.can_perform_action(1, ActionType::like);
  expect(!p.allowed && p.deny == pacer::DenyReason::suspended, "gate denies suspended");
}

void test_escalation_record() {
  Core c;
  c.health.init_account_health(1);
  make_score_50(c, 1);
  for (int i = 0; i < 5; ++i) c.health.record_freeze_detection(1, 100);
  const int64_t now = c.clock.now_ms();
  for (int64_t ago : {3000, 2000, 1000}) {
    c.store.append_engagement({1, ActionType::like, pacer::EngagementStatus::success, "", now - ago});
  }

  // naturalness 20, freeze risk 100: 0 + 0 + 4 + 0 = 4.
  const auto d = c.health.check_and_throttle(1);
  expect(d.action == pacer::ThrottleAction::escalate && d.health_score == 4, "4 escalates");
  const auto rec = c.health.get_record(1);
  expect(rec->is_escalated && rec->is_suspended, "escalated and suspended");

  const auto recent = c.escalations.recent();
  expect(recent.size() == 1, "one escalation recorded");
  expect(recent[0].account_id == 1 && recent[0].health_score == 4, "escalation content");
  expect(recent[0].sequence == 1 && recent[0].previous_digest == std::string(64, '0'), "genesis link");
}

void test_escalation_once_per_crossing() {
  Core c;
  c.health.init_account_health(1);
  make_score_50(c, 1);
  for (int i = 0; i < 5; ++i) c.health.record_freeze_detection(1, 100);
  const int64_t now = c.clock.now_ms();
  for (int64_t ago : {3000, 2000, 1000}) {
    c.store.append_engagement({1, ActionType::like, pacer::EngagementStatus::success, "", now - ago});
  }

  auto d = c.health.check_and_throttle(1);
  expect(d.action == pacer::ThrottleAction::escalate, "first cycle escalates");
  c.clock.advance(15 * kMsPerMinute);
  d = c.health.check_and_throttle(1);
  expect(d.action == pacer::ThrottleAction::suspend && d.health_score == 4, "second cycle only suspends");
  expect(c.escalations.recent().size() == 1, "one record per crossing");
  const auto rec = c.health.get_record(1);
  expect(rec->is_escalated && rec->is_suspended, "flags kept");
}

void test_cooling_cycle() {
  Core c;
  c.health.init_account_health(1);

  auto r = c.health.begin_cooling(1, "rate spike");
  expect(r.success, "cooling starts");
  auto rec = c.health.get_record(1);
  expect(rec->account_phase == AccountPhase::cooling, "phase cooling");
  expect(rec->max_daily_posts == 1 && rec->max_daily_actions == 5, "cooling caps");
  expect(!c.health.begin_cooling(1, "again").success, "cannot cool twice");

  r = c.health.recover_from_cooling(1);
  expect(!r.success, "minimum cooling period enforced");

  c.clock.advance(25 * kMsPerHour);
  r = c.health.recover_from_cooling(1);
  expect(r.success, "recovers after 24h");
  rec = c.health.get_record(1);
  expect(rec->account_phase == AccountPhase::warming, "returns to prior phase");
  expect(rec->max_daily_actions == 10, "prior caps restored");
}

void test_overview_sorted() {
  Core c;
  c.health.init_account_health(1);
  c.health.init_account_health(2);
  make_score_50(c, 2);
  c.health.calculate_health_score(1);
  c.health.check_and_throttle(2);

  const auto overview = c.health.get_health_overview();
  expect(overview.size() == 2, "two accounts");
  expect(overview[0].account_id == 2 && overview[0].health_score == 50, "lowest first");
  expect(overview[0].is_throttled, "throttle visible in overview");
  expect(overview[1].health_score == 100, "healthy last");
}

// ============================================================================
// Action Gate & Rate Limiter
// ============================================================================

void test_gate_no_record() {
  Core c;
  const auto p = c.gate.can_perform_action(5, ActionType::post);
  expect(!p.allowed && p.deny == pacer::DenyReason::no_record, "no record denied");
  expect(!c.gate.record_action(5, ActionType::post, true), "record_action without record fails");
}

void test_daily_post_cap() {
  Core c;
  c.health.init_account_health(1);
  expect(c.gate.can_perform_action(1, ActionType::post).allowed, "first post allowed");
  expect(c.gate.record_action(1, ActionType::post, true), "post recorded");

  const auto p = c.gate.can_perform_action(1, ActionType::post);
  expect(!p.allowed && p.deny == pacer::DenyReason::daily_post_cap, "second post denied");
  expect(p.reason == "Daily post limit reached (1/1)", "cap message");
  const int64_t now = c.clock.now_ms();
  expect(p.retry_after_ms && *p.retry_after_ms == pacer::next_local_midnight_ms(now) - now,
         "retry at local midnight");

  expect(c.gate.can_perform_action(1, ActionType::like).allowed, "likes unaffected by post cap");
}

void test_hourly_cap_and_rollover() {
  Core c;
  c.health.init_account_health(1);
  for (int i = 0; i < 3; ++i) {
    expect(c.gate.can_perform_action(1, ActionType::like).allowed, "like within hourly cap");
    c.gate.record_action(1, ActionType::like, true);
  }

  auto p = c.gate.can_perform_action(1, ActionType::like);
  expect(!p.allowed && p.deny == pacer::DenyReason::hourly_cap, "4th like denied");
  const int64_t now = c.clock.now_ms();
  expect(p.retry_after_ms && *p.retry_after_ms == pacer::next_local_hour_ms(now) - now, "retry next hour");
  p = c.gate.can_perform_action(1, ActionType::comment);
  expect(!p.allowed, "hourly non-post check counts every action");

  c.clock.advance(kMsPerHour);
  expect(c.gate.can_perform_action(1, ActionType::like).allowed, "new hour rolls counters lazily");
  expect(c.health.get_record(1)->actions_today == 3, "daily total kept across the hour");
}

void test_daily_action_cap() {
  Core c;
  c.health.init_account_health(1);
  for (int i = 0; i < 10; ++i) {
    if (i > 0 && i % 3 == 0) c.clock.advance(kMsPerHour);
    c.gate.record_action(1, ActionType::like, true);
  }
  const auto p = c.gate.can_perform_action(1, ActionType::like);
  expect(!p.allowed && p.deny == pacer::DenyReason::daily_action_cap, "10 actions exhaust warming day");

  c.clock.set(pacer::next_local_midnight_ms(c.clock.now_ms()) + kMsPerHour);
  expect(c.gate.can_perform_action(1, ActionType::like).allowed, "new day resets");
}

void test_timed_throttle() {
  Core c;
  c.health.init_account_health(1);
  expect(c.gate.throttle_for(1, kMsPerMinute, "cooldown"), "throttle applied");
  auto p = c.gate.can_perform_action(1, ActionType::like);
  expect(!p.allowed && p.deny == pacer::DenyReason::throttled, "throttled denies");
  expect(p.retry_after_ms && *p.retry_after_ms == kMsPerMinute, "retry at throttle expiry");

  c.clock.advance(kMsPerMinute + kMsPerSecond);
  p = c.gate.can_perform_action(1, ActionType::like);
  expect(p.allowed, "expired throttle allows");
}

void test_reserve_is_atomic() {
  Core c;
  c.health.init_account_health(1);
  std::atomic<int> granted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (c.gate.try_reserve_action(1, ActionType::like).allowed) granted.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();
  expect(granted.load() == 3, "exactly the hourly like cap is granted");
  expect(c.health.get_record(1)->actions_this_hour == 3, "reservations counted");
  expect(c.gate.settle_action(1, ActionType::like, true), "settle succeeds");
  expect(c.health.get_record(1)->consecutive_successes == 1, "settle updates streak");
}

void test_counter_resets() {
  Core c;
  c.health.init_account_health(1);
  c.health.init_account_health(2);
  c.gate.record_action(1, ActionType::post, true);
  c.gate.record_action(2, ActionType::like, false);
  expect(c.health.get_record(2)->consecutive_failures == 1, "failure streak");

  expect(c.gate.reset_hourly_counters() == 2, "hourly reset touches both");
  expect(c.health.get_record(1)->posts_this_hour == 0, "hourly zeroed");
  expect(c.health.get_record(1)->posts_today == 1, "daily kept on hourly reset");

  expect(c.gate.reset_daily_counters() == 2, "daily reset touches both");
  expect(c.health.get_record(1)->posts_today == 0, "daily zeroed");
}

// ============================================================================
// Engagement Task Scheduler
// ============================================================================

struct SchedulerRig {
  pacer::ManualClock clock{test_noon()};
  pacer::PacerConfig cfg = pacer::default_config();
  pacer::MemoryHealthStore store;
  pacer::MemoryTaskStore tasks;
  std::unique_ptr<pacer::EngagementScheduler> scheduler;

  SchedulerRig() { rebuild(); }
  void rebuild() {
    scheduler = std::make_unique<pacer::EngagementScheduler>(tasks, store, cfg.scheduler, clock);
    pacer::InteractionSettings s;
    s.enabled = true;
    scheduler->set_interaction_settings(10, s);
  }
};

pacer::EngagementTask make_task(ActionType type, int64_t created_at_ms) {
  pacer::EngagementTask t;
  t.project_id = 10;
  t.account_id = 1;
  t.task_type = type;
  t.created_at_ms = created_at_ms;
  if (type == ActionType::follow || type == ActionType::unfollow) t.target_user = "someone";
  if (type == ActionType::like || type == ActionType::comment) t.target_post = "post-1";
  if (type == ActionType::comment) t.comment_text = "nice";
  return t;
}

void test_task_validation() {
  SchedulerRig r;
  std::string error;
  auto bad = make_task(ActionType::follow, 0);
  bad.target_user.clear();
  expect(r.scheduler->add_to_queue(bad, &error) == 0, "follow needs target_user");
  expect(error == "follow requires target_user", "follow error");

  bad = make_task(ActionType::like, 0);
  bad.target_user = "x";
  expect(r.scheduler->add_to_queue(bad, &error) == 0, "like rejects target_user");

  bad = make_task(ActionType::comment, 0);
  bad.comment_text.clear();
  expect(r.scheduler->add_to_queue(bad, &error) == 0, "comment needs text");

  bad = make_task(ActionType::unfollow, 0);
  bad.comment_text = "hi";
  expect(r.scheduler->add_to_queue(bad, &error) == 0, "text only for comments");

  expect(r.scheduler->add_to_queue(make_task(ActionType::retweet, 0), &error) == 0, "retweet not queueable");

  const auto bulk = r.scheduler->bulk_add_to_queue(
      {make_task(ActionType::follow, 0), make_task(ActionType::like, 0), bad});
  expect(bulk.added == 2 && bulk.failed == 1, "bulk add counts");
}

void test_disabled_project_gets_nothing() {
  SchedulerRig r;
  r.scheduler->add_to_queue(make_task(ActionType::follow, 0));
  expect(r.scheduler->get_next_tasks(99, 1).empty(), "project without settings is disabled");

  pacer::InteractionSettings off;
  off.enabled = false;
  r.scheduler->set_interaction_settings(10, off);
  expect(r.scheduler->get_next_tasks(10, 1).empty(), "disabled project");
}

void test_priority_order() {
  SchedulerRig r;
  const int64_t now = r.clock.now_ms();
  const auto like_id = r.scheduler->add_to_queue(make_task(ActionType::like, now - 48 * kMsPerHour));
  const auto follow_id = r.scheduler->add_to_queue(make_task(ActionType::follow, now - kMsPerHour));
  const auto comment_id = r.scheduler->add_to_queue(make_task(ActionType::comment, now - kMsPerHour));
  const auto old_id = r.scheduler->add_to_queue(make_task(ActionType::unfollow, now - 5 * kMsPerDay));

  const auto next = r.scheduler->get_next_tasks(10, 1, 3);
  expect(next.size() == 3, "limited to 3");
  expect(next[0].task.id == follow_id && next[0].priority == 85, "fresh follow first");
  expect(next[1].task.id == comment_id && next[1].priority == 75, "fresh comment second");
  expect(next[2].task.id == like_id && next[2].priority == 70, "older like third");
  expect(pacer::task_priority(*r.tasks.get(old_id), now) == 50, "stale unfollow is base priority");
}

void test_daily_type_limit() {
  SchedulerRig r;
  r.cfg.scheduler.daily_limits[pacer::index_of(ActionType::follow)] = 2;
  r.rebuild();
  r.scheduler->add_to_queue(make_task(ActionType::follow, r.clock.now_ms()));
  r.scheduler->add_to_queue(make_task(ActionType::like, r.clock.now_ms()));

  for (int i = 0; i < 2; ++i) {
    r.scheduler->log_engagement({1, ActionType::follow, pacer::EngagementStatus::success, "u", 0});
  }
  const auto next = r.scheduler->get_next_tasks(10, 1);
  expect(next.size() == 1 && next[0].task.task_type == ActionType::like, "follow quota exhausted");

  pacer::InteractionSettings s;
  s.enabled = true;
  s.like_enabled = false;
  r.scheduler->set_interaction_settings(10, s);
  expect(r.scheduler->get_next_tasks(10, 1).empty(), "like disabled and follow exhausted");
  const auto types = r.scheduler->available_types(s, 1);
  expect(std::find(types.begin(), types.end(), ActionType::unfollow) != types.end(), "unfollow always on");
  expect(std::find(types.begin(), types.end(), ActionType::post) == types.end(), "post never scheduled");
}

void test_min_wait_between_runs() {
  SchedulerRig r;
  auto t = make_task(ActionType::like, r.clock.now_ms());
  t.last_executed_at_ms = r.clock.now_ms() - kMsPerMinute;
  r.scheduler->add_to_queue(t);
  expect(r.scheduler->get_next_tasks(10, 1).empty(), "default 5 minute wait");

  pacer::InteractionSettings s;
  s.enabled = true;
  s.min_interval_minutes[pacer::index_of(ActionType::like)] = 1;
  r.scheduler->set_interaction_settings(10, s);
  expect(r.scheduler->get_next_tasks(10, 1).size() == 1, "configured 1 minute wait elapsed");
}

void test_task_lifecycle() {
  SchedulerRig r;
  const auto id = r.scheduler->add_to_queue(make_task(ActionType::follow, r.clock.now_ms()));
  expect(r.scheduler->claim_task(id), "claim pending");
  expect(!r.scheduler->claim_task(id), "claim is exclusive");
  expect(r.scheduler->get_next_tasks(10, 1).empty(), "claimed tasks not offered");

  r.clock.advance(31 * kMsPerMinute);
  auto m = r.scheduler->expire_tasks();
  expect(m.released_claims == 1, "stale claim released");
  expect(r.tasks.get(id)->state == pacer::TaskState::pending, "back to pending");

  expect(r.scheduler->mark_task_completed(id), "complete");
  expect(!r.scheduler->mark_task_completed(id), "completion is fire-once");
  expect(r.tasks.get(id)->last_executed_at_ms == r.clock.now_ms(), "execution stamped");
  expect(!r.scheduler->mark_task_completed(12345), "unknown task");

  auto expiring = make_task(ActionType::like, r.clock.now_ms());
  expiring.expires_at_ms = r.clock.now_ms() + kMsPerSecond;
  const auto exp_id = r.scheduler->add_to_queue(expiring);
  r.clock.advance(2 * kMsPerSecond);
  expect(r.scheduler->get_next_tasks(10, 1).empty(), "expired task not offered");
  m = r.scheduler->expire_tasks();
  expect(m.expired == 1 && r.tasks.get(exp_id)->state == pacer::TaskState::expired, "task expired");

  r.clock.advance(8 * kMsPerDay);
  const auto keep = r.scheduler->add_to_queue(make_task(ActionType::like, r.clock.now_ms()));
  expect(r.scheduler->cleanup_old_tasks() == 2, "old completed and expired removed");
  expect(r.tasks.get(keep).has_value() && !r.tasks.get(id).has_value(), "pending task kept");
}

void test_queue_stats() {
  SchedulerRig r;
  r.scheduler->add_to_queue(make_task(ActionType::follow, r.clock.now_ms()));
  r.scheduler->add_to_queue(make_task(ActionType::like, r.clock.now_ms()));

  auto stats = r.scheduler->get_queue_stats(10, 1);
  expect(stats.pending == 2 && stats.success_rate == 0, "no engagement data");

  const int64_t yesterday = r.clock.now_ms() - kMsPerDay;
  r.scheduler->log_engagement({1, ActionType::like, pacer::EngagementStatus::success, "", yesterday});
  for (int i = 0; i < 3; ++i) {
    r.scheduler->log_engagement({1, ActionType::like, pacer::EngagementStatus::success, "", 0});
  }
  r.scheduler->log_engagement({1, ActionType::follow, pacer::EngagementStatus::failed, "u", 0});

  stats = r.scheduler->get_queue_stats(10, 1);
  expect(stats.completed_today == 3 && stats.failed_today == 1, "today's engagement counts");
  expect(stats.success_rate == 75, "success rate rounded");
}

void test_engagement_effectiveness() {
  SchedulerRig r;
  auto e = r.scheduler->get_engagement_effectiveness(1);
  expect(e.total == 0 && e.success_rate == 0 && e.estimated_reach == 0, "empty history");

  for (int i = 0; i < 3; ++i) {
    r.scheduler->log_engagement({1, ActionType::like, pacer::EngagementStatus::success, "", 0});
  }
  r.scheduler->log_engagement({1, ActionType::follow, pacer::EngagementStatus::success, "u1", 0});
  r.scheduler->log_engagement({1, ActionType::follow, pacer::EngagementStatus::failed, "u2", 0});
  r.scheduler->log_engagement({1, ActionType::comment, pacer::EngagementStatus::success, "u3", 0});
  r.scheduler->log_engagement(
      {1, ActionType::like, pacer::EngagementStatus::success, "", r.clock.now_ms() - 40 * kMsPerDay});
  r.scheduler->log_engagement({2, ActionType::follow, pacer::EngagementStatus::success, "u4", 0});

  e = r.scheduler->get_engagement_effectiveness(1);
  expect(e.likes == 3 && e.follows == 1 && e.comments == 1, "successes by type");
  expect(e.total == 6, "failures count toward the total");
  expect(e.success_rate == 83, "5 of 6 rounds to 83");
  expect(e.estimated_reach == 180, "100 + 50 + 3*10");

  e = r.scheduler->get_engagement_effectiveness(1, 60);
  expect(e.likes == 4 && e.total == 7 && e.success_rate == 86, "wider window");
}

// ============================================================================
// Session checkpoints and pool
// ============================================================================

void test_checkpoint_store_integrity() {
  const fs::path tmp = fresh_dir("pacer_checkpoint_test");
  pacer::FileCheckpointStore store(tmp.string());

  const std::string state(2048, 'c');
  const std::string d1 = store.put(1, state);
  expect(pacer::is_hex_digest(d1), "put returns digest");
  expect(store.put(2, state) == d1, "identical state shares one object");
  const auto got = store.get(1);
  expect(got && *got == state, "round trip");

  const auto info = store.info(d1);
  expect(info && info->encoding == "zstd", "compressed with zstd");
  expect(info->stored_size < info->original_size, "repetitive state shrinks");
  expect(store.list().size() == 2, "two heads listed");

  expect(store.remove(2), "remove head");
  expect(!store.contains(2) && store.contains(1), "other head keeps object");

  // Flip a byte of the stored blob: reads must fail closed.
  const fs::path obj = tmp / "objects" / d1.substr(0, 2) / d1.substr(2, 2) / d1;
  {
    std::fstream file(obj, std::ios::in | std::ios::out | std::ios::binary);
    expect(file.good(), "can open object file");
    char byte;
    file.read(&byte, 1);
    byte ^= 0xFF;
    file.seekp(0);
    file.write(&byte, 1);
  }
  expect(!store.get(1).has_value(), "corrupt checkpoint rejected");

  fs::remove_all(tmp);
}

void test_checkpoint_supersede() {
  const fs::path tmp = fresh_dir("pacer_checkpoint_supersede");
  pacer::FileCheckpointStore store(tmp.string());
  const std::string d1 = store.put(1, "v1");
  const std::string d2 = store.put(1, "v2");
  expect(d1 != d2, "new state new digest");
  expect(*store.head(1) == d2, "head moves");
  expect(!fs::exists(tmp / "objects" / d1.substr(0, 2) / d1.substr(2, 2) / d1), "old object dropped");
  expect(*store.get(1) == "v2", "latest state returned");
  fs::remove_all(tmp);
}

struct FakeContext : pacer::ISessionContext {
  explicit FakeContext(std::string s) : state(std::move(s)) {}
  std::string storage_state() override {
    if (fail_export) throw std::runtime_error("page crashed");
    if (export_delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(export_delay_ms));
    exported = true;
    return state;
  }
  void close() override { closed = true; }
  std::string state;
  bool fail_export{false};
  int export_delay_ms{0};
  std::atomic<bool> exported{false};
  std::atomic<bool> closed{false};
};

struct FakeEngine : pacer::IAutomationEngine {
  bool is_connected() const override { return connected; }
  void launch() override {
    connected = true;
    ++launches;
  }
  std::shared_ptr<pacer::ISessionContext> new_context(const pacer::ContextOptions& options) override {
    if (fail_create) throw std::runtime_error("browser gone");
    last_options = options;
    ++created;
    return std::make_shared<FakeContext>("state-" + std::to_string(created));
  }
  void close() override { connected = false; }

  std::atomic<bool> connected{false};
  std::atomic<int> launches{0};
  std::atomic<int> created{0};
  bool fail_create{false};
  pacer::ContextOptions last_options;
};

struct FailingCheckpoints : pacer::ICheckpointStore {
  std::string put(pacer::AccountId, const std::string&) override { return {}; }
  std::optional<std::string> get(pacer::AccountId) const override { return std::nullopt; }
  bool contains(pacer::AccountId) const override { return false; }
  bool remove(pacer::AccountId) override { return true; }
  std::vector<pacer::CheckpointInfo> list() const override { return {}; }
  std::string backend_id() const override { return "failing"; }
};

pacer::SessionPoolConfig pool_config(std::size_t max_concurrent) {
  pacer::SessionPoolConfig cfg;
  cfg.max_concurrent = max_concurrent;
  return cfg;
}

void test_pool_lru_eviction() {
  const fs::path tmp = fresh_dir("pacer_pool_lru");
  pacer::ManualClock clock(test_noon());
  auto engine = std::make_shared<FakeEngine>();
  auto checkpoints = std::make_shared<pacer::FileCheckpointStore>(tmp.string());
  pacer::SessionPool pool(engine, checkpoints, pool_config(2), clock);

  auto s1 = pool.acquire_context(1);
  clock.advance(kMsPerSecond);
  auto s2 = pool.acquire_context(2);
  clock.advance(kMsPerSecond);
  expect(pool.acquire_context(1) == s1, "live session reused");
  expect(engine->launches == 1 && engine->created == 2, "one engine, two contexts");

  clock.advance(kMsPerSecond);
  pool.return_context(2);
  pool.acquire_context(3);
  expect(pool.active_count() == 2, "capacity respected");
  expect(static_cast<FakeContext&>(*s2).closed, "least recently used closed");
  expect(checkpoints->get(2) == std::optional<std::string>("state-2"), "evicted session persisted");
  expect(!static_cast<FakeContext&>(*s1).closed, "recently used kept");

  pool.return_context(3);
  pool.acquire_context(2);
  expect(engine->last_options.storage_state == std::optional<std::string>("state-2"), "state restored");
  bool restored = false;
  for (const auto& info : pool.snapshot()) {
    if (info.account_id == 2) restored = info.restored;
  }
  expect(restored, "snapshot marks restored session");

  expect(pool.shutdown_all(kMsPerSecond * 5) == 2, "shutdown persists live sessions");
  expect(pool.active_count() == 0 && !engine->connected, "engine torn down");
  fs::remove_all(tmp);
}

void test_pool_idle_reclaim() {
  const fs::path tmp = fresh_dir("pacer_pool_idle");
  pacer::ManualClock clock(test_noon());
  auto engine = std::make_shared<FakeEngine>();
  auto checkpoints = std::make_shared<pacer::FileCheckpointStore>(tmp.string());
  pacer::SessionPool pool(engine, checkpoints, pool_config(3), clock);

  pool.acquire_context(1);
  pool.acquire_context(2);
  clock.advance(5 * kMsPerMinute);
  pool.acquire_context(2);

  clock.advance(6 * kMsPerMinute);
  expect(pool.reclaim_idle() == 1, "only the idle session reclaimed");
  expect(pool.active_count() == 1 && engine->connected, "engine stays while sessions live");
  expect(pool.has_checkpoint(1), "reclaimed session persisted");

  clock.advance(11 * kMsPerMinute);
  expect(pool.reclaim_idle() == 1, "second session reclaimed");
  expect(!engine->connected, "empty pool closes engine");

  expect(pool.delete_session(1), "delete checkpoint");
  expect(!pool.has_checkpoint(1), "forced fresh login");
  fs::remove_all(tmp);
}

void test_pool_failures() {
  pacer::ManualClock clock(test_noon());
  auto engine = std::make_shared<FakeEngine>();
  pacer::SessionPool pool(engine, std::make_shared<FailingCheckpoints>(), pool_config(1), clock);

  engine->fail_create = true;
  bool threw = false;
  try {
    pool.acquire_context(1);
  } catch (const pacer::SessionError& e) {
    threw = e.code() == pacer::ErrorCode::session_create_failed;
  }
  expect(threw, "creation failure surfaces as SessionError");
  expect(pool.active_count() == 0, "no half-created session");

  engine->fail_create = false;
  pool.acquire_context(1);
  expect(pool.active_count() == 1, "slot released after failure");

  threw = false;
  try {
    pool.save_session(1);
  } catch (const pacer::SessionError& e) {
    threw = e.code() == pacer::ErrorCode::checkpoint_write_failed;
  }
  expect(threw, "save failure surfaces as SessionError");
  expect(!pool.save_session(42), "save without session is a no-op");

  expect(pool.release_context(1), "release still closes on persist failure");
  expect(!pool.release_context(1), "second release is a no-op");
}

void test_pool_same_account_serializes() {
  const fs::path tmp = fresh_dir("pacer_pool_same");
  pacer::ManualClock clock(test_noon());
  auto engine = std::make_shared<FakeEngine>();
  auto checkpoints = std::make_shared<pacer::FileCheckpointStore>(tmp.string());
  pacer::SessionPool pool(engine, checkpoints, pool_config(3), clock);

  std::vector<std::shared_ptr<pacer::ISessionContext>> got(6);
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&, i] { got[i] = pool.acquire_context(9); });
  }
  for (auto& t : threads) t.join();
  expect(engine->created == 1, "one context for one account");
  for (const auto& s : got) expect(s == got[0], "all callers share it");
  fs::remove_all(tmp);
}

void test_pool_capacity_under_contention() {
  const fs::path tmp = fresh_dir("pacer_pool_contention");
  pacer::ManualClock clock(test_noon());
  auto engine = std::make_shared<FakeEngine>();
  auto checkpoints = std::make_shared<pacer::FileCheckpointStore>(tmp.string());
  auto cfg = pool_config(2);
  cfg.lease_wait_ms = 0;
  pacer::SessionPool pool(engine, checkpoints, cfg, clock);

  std::vector<std::thread> threads;
  for (int i = 1; i <= 8; ++i) {
    threads.emplace_back([&, i] { pool.acquire_context(i); });
  }
  for (auto& t : threads) t.join();
  expect(pool.active_count() <= 2, "never above capacity");
  expect(engine->created == 8, "every account got a session");
  fs::remove_all(tmp);
}

void test_pool_prefers_returned_sessions() {
  const fs::path tmp = fresh_dir("pacer_pool_leases");
  pacer::ManualClock clock(test_noon());
  auto engine = std::make_shared<FakeEngine>();
  auto checkpoints = std::make_shared<pacer::FileCheckpointStore>(tmp.string());
  pacer::SessionPool pool(engine, checkpoints, pool_config(2), clock);

  auto s1 = pool.acquire_context(1);
  clock.advance(kMsPerSecond);
  auto s2 = pool.acquire_context(2);
  clock.advance(kMsPerSecond);
  expect(pool.return_context(2), "lease returned");
  expect(!pool.return_context(7), "no session to return");

  // Account 1 is older but still leased.
  const auto started = std::chrono::steady_clock::now();
  pool.acquire_context(3);
  expect(std::chrono::steady_clock::now() - started < std::chrono::seconds(2), "no lease wait");
  expect(static_cast<FakeContext&>(*s2).closed, "returned session evicted");
  expect(!static_cast<FakeContext&>(*s1).closed, "leased session kept");
  for (const auto& info : pool.snapshot()) {
    if (info.account_id == 1) expect(info.leases == 1, "lease counted");
  }
  pool.shutdown_all(kMsPerSecond * 5);
  fs::remove_all(tmp);
}

void test_pool_evicts_leased_after_wait() {
  const fs::path tmp = fresh_dir("pacer_pool_lease_wait");
  pacer::ManualClock clock(test_noon());
  auto engine = std::make_shared<FakeEngine>();
  auto checkpoints = std::make_shared<pacer::FileCheckpointStore>(tmp.string());
  auto cfg = pool_config(1);
  cfg.lease_wait_ms = 50;
  pacer::SessionPool pool(engine, checkpoints, cfg, clock);

  auto s1 = pool.acquire_context(1);
  const auto started = std::chrono::steady_clock::now();
  pool.acquire_context(2);
  expect(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(50),
         "waited for a return first");
  expect(static_cast<FakeContext&>(*s1).closed, "leased session evicted after the wait");
  expect(checkpoints->get(1) == std::optional<std::string>("state-1"), "evicted session persisted");
  expect(pool.active_count() == 1, "capacity respected");
  pool.shutdown_all(kMsPerSecond * 5);
  fs::remove_all(tmp);
}

void test_pool_lock_table_pruned() {
  const fs::path tmp = fresh_dir("pacer_pool_locks");
  pacer::ManualClock clock(test_noon());
  auto engine = std::make_shared<FakeEngine>();
  auto checkpoints = std::make_shared<pacer::FileCheckpointStore>(tmp.string());
  auto cfg = pool_config(1);
  cfg.lease_wait_ms = 0;
  pacer::SessionPool pool(engine, checkpoints, cfg, clock);

  pool.acquire_context(1);
  expect(pool.tracked_accounts() == 1, "live account tracked");
  pool.acquire_context(2);
  expect(pool.tracked_accounts() == 1, "evicted account forgotten");
  expect(pool.release_context(2), "released");
  expect(pool.tracked_accounts() == 0, "released account forgotten");
  expect(!pool.release_context(3) && !pool.save_session(4), "no-ops");
  expect(pool.tracked_accounts() == 0, "no-ops leave nothing behind");

  engine->fail_create = true;
  bool threw = false;
  try {
    pool.acquire_context(5);
  } catch (const pacer::SessionError&) {
    threw = true;
  }
  expect(threw && pool.tracked_accounts() == 0, "failed acquire forgotten");

  engine->fail_create = false;
  pool.acquire_context(6);
  clock.advance(11 * kMsPerMinute);
  expect(pool.reclaim_idle() == 1 && pool.tracked_accounts() == 0, "reclaimed account forgotten");
  fs::remove_all(tmp);
}

void test_pool_shutdown_is_bounded() {
  const fs::path tmp = fresh_dir("pacer_pool_shutdown");
  pacer::ManualClock clock(test_noon());
  auto engine = std::make_shared<FakeEngine>();
  auto checkpoints = std::make_shared<pacer::FileCheckpointStore>(tmp.string());
  auto pool = std::make_unique<pacer::SessionPool>(engine, checkpoints, pool_config(2), clock);

  auto slow = pool->acquire_context(1);
  pool->acquire_context(2);
  auto& hung = static_cast<FakeContext&>(*slow);
  hung.export_delay_ms = 1500;

  const auto started = std::chrono::steady_clock::now();
  const std::size_t persisted = pool->shutdown_all(100);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  expect(elapsed < std::chrono::milliseconds(1000), "shutdown returns by its deadline");
  expect(persisted <= 1, "hung export not counted");
  expect(pool->active_count() == 0, "pool emptied");
  pool.reset();

  // The abandoned save still completes in the background.
  const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!hung.closed && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  expect(hung.exported && hung.closed, "abandoned session finished on its worker");
  expect(checkpoints->get(1) == std::optional<std::string>("state-1"), "late checkpoint written");
  fs::remove_all(tmp);
}

// ============================================================================
// Escalation log, config, observability
// ============================================================================

void test_escalation_chain_file() {
  const fs::path tmp = fresh_dir("pacer_escalation_test");
  const std::string path = (tmp / "escalations.ndjson").string();
  {
    pacer::EscalationLog log(path);
    pacer::EscalationRecord a;
    a.account_id = 1;
    a.health_score = 10;
    a.reason = "low";
    expect(log.append(a), "first append");
    pacer::EscalationRecord b;
    b.account_id = 2;
    b.health_score = 5;
    b.reason = "lower \"quoted\"";
    expect(log.append(b), "second append");
    expect(b.sequence == 2 && b.previous_digest != std::string(64, '0'), "chained");
    expect(log.entry_count() == 2, "entries counted");
  }
  {
    pacer::EscalationLog reopened(path);
    pacer::EscalationRecord c;
    c.account_id = 3;
    expect(reopened.append(c) && c.sequence == 3, "sequence resumes after restart");
  }
  auto v = pacer::verify_escalation_log(path);
  expect(v.ok && v.records == 3, "chain verifies");

  {
    std::ifstream in(path);
    std::string all((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    const auto pos = all.find("\"health_score\":10");
    expect(pos != std::string::npos, "record present");
    all.replace(pos, 17, "\"health_score\":90");
    std::ofstream out(path, std::ios::trunc);
    out << all;
  }
  v = pacer::verify_escalation_log(path);
  expect(!v.ok, "tampering detected");
  fs::remove_all(tmp);
}

void test_config_overlay() {
  std::string error;
  const auto cfg = pacer::config_from_json(
      "{\"config_version\":\"1\",\"sessions\":{\"max_concurrent\":5,\"idle_timeout_s\":120,"
      "\"lease_wait_ms\":250},\"hourly_limits\":{\"mature\":{\"like\":30}},\"daily_limits\":{\"follow\":7},"
      "\"health\":{\"unthrottle_at\":75},"
      "\"monitor\":{\"health_interval_s\":60,\"history_retention_days\":45}}",
      &error);
  expect(error.empty(), "config parses");
  expect(cfg.sessions.max_concurrent == 5, "pool size overlay");
  expect(cfg.sessions.idle_timeout_ms == 120 * kMsPerSecond, "idle timeout overlay");
  expect(pacer::hourly_limit(cfg.hourly, AccountPhase::mature, ActionType::like) == 30, "hourly overlay");
  expect(pacer::hourly_limit(cfg.hourly, AccountPhase::mature, ActionType::post) == 5, "untouched default");
  expect(cfg.scheduler.daily_limits[pacer::index_of(ActionType::follow)] == 7, "daily overlay");
  expect(cfg.policy.unthrottle_at == 75, "threshold overlay");
  expect(cfg.monitor.health_interval_ms == kMsPerMinute, "interval overlay");
  expect(cfg.sessions.lease_wait_ms == 250, "lease wait overlay");
  expect(cfg.monitor.history_retention_days == 45, "retention overlay");

  pacer::config_from_json("{\"sessions\":", &error);
  expect(!error.empty(), "syntax error reported");

  std::string again;
  const auto round = pacer::config_from_json(pacer::config_to_json(cfg), &again);
  expect(again.empty() && round.sessions.max_concurrent == 5, "serialized config reloads");
  expect(round.sessions.lease_wait_ms == 250 && round.monitor.history_retention_days == 45,
         "new keys survive a reload");
}

void test_config_validation() {
  auto r = pacer::validate_config("{}");
  expect(r.ok && !r.warnings.empty(), "empty config valid with version warning");

  r = pacer::validate_config("{\"config_version\":\"1\",\"colour\":1}");
  expect(r.ok && r.warnings.size() == 1, "unknown key is a warning");

  r = pacer::validate_config("{\"hourly_limits\":{\"dormant\":{\"like\":1}}}");
  expect(!r.ok, "unknown phase rejected");

  r = pacer::validate_config("{\"daily_limits\":{\"like\":-1}}");
  expect(!r.ok, "negative limit rejected");

  r = pacer::validate_config("{\"sessions\":{\"max_concurrent\":0}}");
  expect(!r.ok, "empty pool rejected");

  r = pacer::validate_config("{\"health\":{\"growing_after_days\":20}}");
  expect(!r.ok, "growing must precede mature");

  r = pacer::validate_config("{\"a\":1,\"a\":2}");
  expect(!r.ok, "duplicate keys rejected");
}

std::atomic<int> g_denials_seen{0};

void count_denials(const pacer::CoreEvent& ev) {
  if (ev.kind == pacer::CoreEventKind::gate_denied) g_denials_seen.fetch_add(1);
}

void test_event_hook() {
  Core c;
  pacer::global_core_stats().reset();
  g_denials_seen = 0;
  pacer::set_core_event_hook(count_denials);

  c.gate.can_perform_action(77, ActionType::like);
  expect(g_denials_seen == 1, "denial delivered to hook");
  expect(pacer::global_core_stats().gate_denials == 1, "denial counted");
  expect(pacer::global_core_stats().gate_checks == 1, "check counted");

  pacer::set_core_event_hook(nullptr);
  const std::string json = pacer::core_event_to_json({pacer::CoreEventKind::throttle, 3, "a\"b", 50, 1});
  const auto obj = pacer::jsonlite::parse(json, nullptr);
  expect(pacer::jsonlite::get_string(obj, "kind") == "throttle", "event kind serialized");
  expect(pacer::jsonlite::get_string(obj, "detail") == "a\"b", "event detail escaped");
}

void test_version_manifest() {
  const auto m = pacer::version::current_manifest();
  expect(m.checkpoint_format == pacer::version::CHECKPOINT_FORMAT_VERSION, "checkpoint version");
  const auto obj = pacer::jsonlite::parse(pacer::version::manifest_to_json(m), nullptr);
  expect(pacer::jsonlite::get_string(obj, "hash_primitive") == "blake3", "manifest names blake3");
}

// ============================================================================
// Health Monitor / Supervisor
// ============================================================================

void test_monitor_cycle() {
  Core c;
  c.health.init_account_health(1);
  c.health.init_account_health(2);
  c.clock.advance(7 * kMsPerDay);
  make_score_50(c, 2);

  pacer::HealthMonitor monitor(c.health, c.store, c.clock);
  auto report = monitor.run_cycle();
  expect(report.accounts == 2 && report.advanced == 2, "both accounts advance to growing");
  expect(report.throttled == 1, "low scorer throttled");
  const auto rec = c.health.get_record(2);
  expect(rec->account_phase == AccountPhase::growing, "throttled account still advanced");
  expect(rec->max_daily_posts == 1 && rec->max_daily_actions == 15, "growing caps halved");

  for (int i = 0; i < 4; ++i) {
    c.health.record_session_attempt(2, true);
    c.health.record_publish_outcome(2, pacer::PublishStatus::published);
  }
  report = monitor.run_cycle();
  expect(report.unthrottled == 1, "recovered score lifts the throttle");
  expect(!c.health.get_record(2)->is_throttled, "throttle cleared");
  expect(c.health.get_record(2)->max_daily_actions == 30, "growing caps restored");
}

void test_monitor_isolates_failures() {
  Core c;
  c.health.init_account_health(1);
  c.health.init_account_health(2);
  make_score_50(c, 1);
  for (int i = 0; i < 5; ++i) c.health.record_freeze_detection(1, 100);
  const int64_t now = c.clock.now_ms();
  for (int64_t ago : {3000, 2000, 1000}) {
    c.store.append_engagement({1, ActionType::like, pacer::EngagementStatus::success, "", now - ago});
  }
  make_score_50(c, 2);
  c.escalations.set_hook([](const pacer::EscalationRecord& r) {
    if (r.account_id == 1) throw std::runtime_error("pager unreachable");
  });

  pacer::HealthMonitor monitor(c.health, c.store, c.clock);
  const auto report = monitor.run_cycle();
  expect(report.accounts == 2 && report.failed == 1, "one account failed");
  expect(report.throttled == 1, "other account still checked");
  expect(c.health.get_record(2)->is_throttled, "account 2 throttled");
}

void test_history_pruning() {
  pacer::MemoryHealthStore store;
  const int64_t now = test_noon();
  const int64_t old = now - 40 * kMsPerDay;
  store.append_session_attempt(1, {old, true});
  store.append_session_attempt(1, {now, true});
  store.append_publish_outcome(1, {old, pacer::PublishStatus::published});
  store.append_freeze_detection(2, {old, 80});
  store.append_engagement({2, ActionType::like, pacer::EngagementStatus::success, "", old});
  store.append_engagement({2, ActionType::like, pacer::EngagementStatus::success, "", now});

  expect(store.prune_history_before(now - 30 * kMsPerDay) == 4, "four old entries dropped");
  expect(store.session_attempts_since(1, 0).size() == 1, "recent attempt kept");
  expect(store.publish_outcomes_since(1, 0).empty() && store.freeze_detections_since(2, 0).empty(),
         "old outcomes and freezes gone");
  expect(store.engagements_since(2, 0).size() == 1, "recent engagement kept");
  expect(store.prune_history_before(now - 30 * kMsPerDay) == 0, "second prune is a no-op");

  pacer::PacerConfig cfg = pacer::default_config();
  expect(pacer::Supervisor::history_retention_days(cfg) == 30, "default retention");
  cfg.monitor.history_retention_days = 7;
  expect(pacer::Supervisor::history_retention_days(cfg) == 30, "never shorter than a scoring window");
  cfg.policy.login_window_days = 45;
  expect(pacer::Supervisor::history_retention_days(cfg) == 45, "follows the longest window");
}

void test_periodic_task() {
  std::atomic<int> hits{0};
  pacer::PeriodicTask task(
      "test", [] { return std::chrono::milliseconds(1); }, [&hits] { hits.fetch_add(1); });
  task.start();
  expect(task.running(), "running after start");
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (hits.load() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  task.stop();
  expect(hits.load() >= 3, "body runs repeatedly");
  expect(!task.running(), "stopped");

  pacer::PeriodicTask thrower(
      "thrower", [] { return std::chrono::milliseconds(1); },
      [] { throw std::runtime_error("boom"); });
  thrower.start();
  const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (thrower.runs() < 2 && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  thrower.stop();
  expect(thrower.runs() >= 2, "loop survives a throwing body");

  pacer::PeriodicTask odd(
      "odd", [] { return std::chrono::milliseconds(1); }, [] { throw 42; });
  odd.start();
  const auto later = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (odd.runs() < 2 && std::chrono::steady_clock::now() < later) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  odd.stop();
  expect(odd.runs() >= 2, "loop survives a non-standard exception");
}

void test_supervisor_start_stop() {
  Core c;
  pacer::MemoryTaskStore tasks;
  pacer::EngagementScheduler scheduler(tasks, c.store, c.cfg.scheduler, c.clock);
  pacer::Supervisor sup(c.health, c.gate, c.store, c.cfg, c.clock, &scheduler);
  expect(sup.tasks().size() == 5, "monitor, daily, hourly, history and upkeep loops");
  expect(!sup.running(), "idle before start");
  sup.start();
  expect(sup.running(), "running");
  sup.stop();
  expect(!sup.running(), "stopped");
  sup.stop();
}

}  // namespace

int main() {
  // Keep expected warnings out of the test output.
  pacer::set_log_level(pacer::LogLevel::error);

  std::cout << "=== Pacer Test Suite ===\n";

  std::cout << "\n[Hashing, limits, scoring]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("default tables", test_default_tables);
  run_test("sub-scores", test_sub_scores);

  std::cout << "\n[Account Health & Phase Engine]\n";
  run_test("init is idempotent", test_init_is_idempotent);
  run_test("score without record", test_score_without_record);
  run_test("phase progression", test_phase_progression);
  run_test("skip to mature", test_skip_to_mature);
  run_test("throttle halves caps once", test_throttle_halves_caps_once);
  run_test("unthrottle hysteresis", test_unthrottle_hysteresis);
  run_test("unthrottle at exactly 70", test_unthrottle_at_exact_threshold);
  run_test("fresh account takes no action", test_fresh_account_takes_no_action);
  run_test("failed logins to suspension", test_failed_logins_to_suspension);
  run_test("suspend blocks gate", test_suspend_blocks_gate);
  run_test("escalation record", test_escalation_record);
  run_test("escalation once per crossing", test_escalation_once_per_crossing);
  run_test("cooling cycle", test_cooling_cycle);
  run_test("overview sorted", test_overview_sorted);

  std::cout << "\n[Action Gate & Rate Limiter]\n";
  run_test("no record", test_gate_no_record);
  run_test("daily post cap", test_daily_post_cap);
  run_test("hourly cap and rollover", test_hourly_cap_and_rollover);
  run_test("daily action cap", test_daily_action_cap);
  run_test("timed throttle", test_timed_throttle);
  run_test("reserve is atomic (8 threads)", test_reserve_is_atomic);
  run_test("counter resets", test_counter_resets);

  std::cout << "\n[Engagement Task Scheduler]\n";
  run_test("task validation", test_task_validation);
  run_test("disabled project", test_disabled_project_gets_nothing);
  run_test("priority order", test_priority_order);
  run_test("daily type limit", test_daily_type_limit);
  run_test("min wait between runs", test_min_wait_between_runs);
  run_test("task lifecycle", test_task_lifecycle);
  run_test("queue stats", test_queue_stats);
  run_test("engagement effectiveness", test_engagement_effectiveness);

  std::cout << "\n[Session Resource Pool]\n";
  run_test("checkpoint store integrity", test_checkpoint_store_integrity);
  run_test("checkpoint supersede", test_checkpoint_supersede);
  run_test("LRU eviction", test_pool_lru_eviction);
  run_test("idle reclaim", test_pool_idle_reclaim);
  run_test("failure handling", test_pool_failures);
  run_test("same account serializes", test_pool_same_account_serializes);
  run_test("capacity under contention", test_pool_capacity_under_contention);
  run_test("prefers returned sessions", test_pool_prefers_returned_sessions);
  run_test("evicts leased after wait", test_pool_evicts_leased_after_wait);
  run_test("lock table pruned", test_pool_lock_table_pruned);
  run_test("shutdown is bounded", test_pool_shutdown_is_bounded);

  std::cout << "\n[Escalation, config, observability]\n";
  run_test("escalation chain file", test_escalation_chain_file);
  run_test("config overlay", test_config_overlay);
  run_test("config validation", test_config_validation);
  run_test("event hook", test_event_hook);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Health Monitor / Supervisor]\n";
  run_test("monitor cycle", test_monitor_cycle);
  run_test("monitor isolates failures", test_monitor_isolates_failures);
  run_test("history pruning", test_history_pruning);
  run_test("periodic task", test_periodic_task);
  run_test("supervisor start/stop", test_supervisor_start_stop);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
