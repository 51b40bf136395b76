#pragma once

// pacer/types.hpp — Core data structures for the account safety core.
//
// ARCHITECTURE NOTES:
//
// TIME:
//   Every timestamp is wall-clock unix milliseconds (int64_t). 0 means "unset".
//   Calendar boundaries (midnight, top of hour) are computed in local time by
//   clock.hpp; nothing else in the core interprets timestamps.
//
// OWNERSHIP:
//   All record types are plain values. Stores hand out copies; mutation goes
//   through IHealthStore::update() / ITaskStore::update(), which run the
//   mutator under the owning row's lock.
//
// ENUMS:
//   ActionType and AccountPhase are dense, zero-based enums so they can index
//   std::array tables directly (see limits.hpp). kActionTypeCount and
//   kPhaseCount MUST track the enumerator lists.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pacer {

using AccountId = std::int64_t;
using ProjectId = std::int64_t;
using TaskId    = std::int64_t;

enum class ActionType : uint8_t {
  post     = 0,
  like     = 1,
  comment  = 2,
  follow   = 3,
  retweet  = 4,
  unfollow = 5,
};
constexpr std::size_t kActionTypeCount = 6;

enum class AccountPhase : uint8_t {
  warming   = 0,
  growing   = 1,
  mature    = 2,
  cooling   = 3,
  suspended = 4,
};
constexpr std::size_t kPhaseCount = 5;

constexpr std::size_t index_of(ActionType t) { return static_cast<std::size_t>(t); }
constexpr std::size_t index_of(AccountPhase p) { return static_cast<std::size_t>(p); }

std::string to_string(ActionType t);
std::string to_string(AccountPhase p);
std::optional<ActionType> action_type_from_string(const std::string& s);
std::optional<AccountPhase> phase_from_string(const std::string& s);

constexpr ActionType kAllActionTypes[kActionTypeCount] = {
    ActionType::post,   ActionType::like,    ActionType::comment,
    ActionType::follow, ActionType::retweet, ActionType::unfollow,
};
constexpr AccountPhase kAllPhases[kPhaseCount] = {
    AccountPhase::warming, AccountPhase::growing, AccountPhase::mature,
    AccountPhase::cooling, AccountPhase::suspended,
};

// Machine-readable error codes for hard failures and invalid input.
// Policy denials are NOT errors; see DenyReason.
enum class ErrorCode {
  none,
  not_found,
  invalid_argument,
  invalid_task,
  session_create_failed,
  checkpoint_write_failed,
  checkpoint_corrupt,
  config_parse_error,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// AccountHealthRecord — one per managed account, owned by the health subsystem.
// ---------------------------------------------------------------------------
struct AccountHealthRecord {
  int64_t   id{0};
  AccountId account_id{0};

  int health_score{100};                   // composite, written only by scoring
  int login_success_rate{100};
  int post_success_rate{100};
  int engagement_naturalness_score{100};
  int freeze_risk_score{0};

  AccountPhase account_phase{AccountPhase::warming};
  int64_t warming_started_at_ms{0};
  int64_t warming_completed_at_ms{0};

  uint32_t max_daily_posts{1};
  uint32_t max_daily_actions{10};

  uint32_t posts_today{0};
  uint32_t actions_today{0};
  uint32_t posts_this_hour{0};
  uint32_t actions_this_hour{0};
  int64_t  counter_day{0};                 // local YYYYMMDD the daily counters belong to
  int64_t  counter_hour{0};                // local YYYYMMDDHH the hourly counters belong to

  bool        is_throttled{false};
  std::string throttle_reason;
  int64_t     throttle_until_ms{0};

  bool        is_suspended{false};
  std::string suspended_reason;
  bool        is_escalated{false};

  int64_t      cooling_started_at_ms{0};
  AccountPhase phase_before_cooling{AccountPhase::warming};

  uint32_t consecutive_successes{0};
  uint32_t consecutive_failures{0};
  uint32_t total_freeze_count{0};

  int64_t last_action_at_ms{0};
  int64_t last_post_at_ms{0};
  int64_t updated_at_ms{0};
};

// ---------------------------------------------------------------------------
// Gate results
// ---------------------------------------------------------------------------
enum class DenyReason {
  none,
  no_record,
  suspended,
  throttled,
  daily_post_cap,
  daily_action_cap,
  hourly_cap,
};

std::string to_string(DenyReason r);

struct ActionPermission {
  bool allowed{false};
  DenyReason deny{DenyReason::none};
  std::string reason;                      // human-readable, empty when allowed
  std::optional<int64_t> retry_after_ms;   // advisory only
};

// ---------------------------------------------------------------------------
// Health engine results
// ---------------------------------------------------------------------------
struct HealthScoreBreakdown {
  int health_score{0};
  int login_success_rate{0};
  int post_success_rate{0};
  int engagement_naturalness_score{0};
  int freeze_risk_score{100};
};

enum class ThrottleAction { none, throttle, suspend, escalate };

std::string to_string(ThrottleAction a);

struct ThrottleDecision {
  ThrottleAction action{ThrottleAction::none};
  int health_score{0};
  std::string message;
};

struct PhaseAdvance {
  bool advanced{false};
  AccountPhase phase{AccountPhase::warming};
  std::string message;
};

struct OperationResult {
  bool success{false};
  std::string message;
};

struct HealthOverviewEntry {
  AccountId account_id{0};
  int health_score{0};
  AccountPhase account_phase{AccountPhase::warming};
  bool is_throttled{false};
  bool is_suspended{false};
  uint32_t posts_today{0};
  uint32_t max_daily_posts{0};
  uint32_t actions_today{0};
  uint32_t max_daily_actions{0};
};

// ---------------------------------------------------------------------------
// Scoring history — appended by external collaborators, never mutated.
// ---------------------------------------------------------------------------
struct SessionAttempt {
  int64_t at_ms{0};
  bool success{false};
};

enum class PublishStatus { pending, published, failed };

struct PublishOutcome {
  int64_t at_ms{0};
  PublishStatus status{PublishStatus::pending};
};

struct FreezeDetection {
  int64_t at_ms{0};
  int confidence{0};  // 0-100; 0 is read as "unknown" and weighted as 50
};

enum class EngagementStatus { success, failed };

struct EngagementLogEntry {
  AccountId account_id{0};
  ActionType task_type{ActionType::like};
  EngagementStatus status{EngagementStatus::success};
  std::string target_user;
  int64_t created_at_ms{0};
};

// ---------------------------------------------------------------------------
// EngagementTask — fire-once queued action request.
// ---------------------------------------------------------------------------
enum class TaskState { pending, claimed, completed, expired };

std::string to_string(TaskState s);

struct EngagementTask {
  TaskId    id{0};
  ProjectId project_id{0};
  AccountId account_id{0};
  ActionType task_type{ActionType::like};
  std::string target_user;   // follow / unfollow
  std::string target_post;   // like / comment
  std::string comment_text;  // comment only
  TaskState state{TaskState::pending};
  int64_t last_executed_at_ms{0};
  int64_t claimed_at_ms{0};
  int64_t expires_at_ms{0};  // 0 = never
  int64_t created_at_ms{0};
  int64_t updated_at_ms{0};

  bool is_active() const { return state == TaskState::pending; }
};

}  // namespace pacer
