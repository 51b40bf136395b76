#pragma once

// pacer/health.hpp — Account Health & Phase Engine.
//
// STATE MACHINE (account_phase):
//   warming --7d--> growing --14d--> mature        (advance_warming_phase)
//   warming|growing --14d--> mature
//   {warming,growing,mature} --begin_cooling--> cooling
//   cooling --recover_from_cooling--> phase_before_cooling
//   Phases never move backward except through recover_from_cooling.
//
// FLAGS (orthogonal to phase):
//   is_throttled / is_suspended / is_escalated are set by check_and_throttle
//   and cleared by unthrottle. Score thresholds (defaults):
//     < 20 escalate, < 40 suspend, < 60 throttle, >= 70 unthrottle allowed.
//   A score back in the throttle band downgrades suspension to a throttle and
//   re-arms escalation; is_throttled itself is only cleared by unthrottle, so
//   the gap between 60 and 70 is the hysteresis band.
//   An escalation record is written once per crossing below 20: while
//   is_escalated is set, further sub-20 checks report suspend.
//
// WRITERS:
//   calculate_health_score() is the only writer of health_score and the four
//   sub-scores. Daily caps are written by phase transitions, throttle
//   decisions and unthrottle. Counters belong to ActionGate.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pacer/clock.hpp"
#include "pacer/config.hpp"
#include "pacer/escalation.hpp"
#include "pacer/health_store.hpp"
#include "pacer/types.hpp"

namespace pacer {

class HealthEngine {
 public:
  // escalations may be null; escalation records are then only logged.
  HealthEngine(IHealthStore& store, const PacerConfig& config, const Clock& clock,
               EscalationLog* escalations = nullptr);

  // Idempotent. Returns the record id, existing or new.
  int64_t init_account_health(AccountId account_id);

  PhaseAdvance advance_warming_phase(AccountId account_id);

  // Recomputes and persists sub-scores and the composite. With no record,
  // returns {0,0,0,0,100} and writes nothing.
  HealthScoreBreakdown calculate_health_score(AccountId account_id);

  ThrottleDecision check_and_throttle(AccountId account_id);
  OperationResult unthrottle(AccountId account_id);

  OperationResult begin_cooling(AccountId account_id, const std::string& reason);
  OperationResult recover_from_cooling(AccountId account_id);

  // Scoring history ingest.
  void record_session_attempt(AccountId account_id, bool success);
  void record_publish_outcome(AccountId account_id, PublishStatus status);
  void record_freeze_detection(AccountId account_id, int confidence);

  // All accounts, lowest score first.
  std::vector<HealthOverviewEntry> get_health_overview() const;

  // Not suspended and score at or above the suspend threshold.
  bool is_account_healthy(AccountId account_id) const;

  std::optional<AccountHealthRecord> get_record(AccountId account_id) const;

  const HealthPolicy& policy() const { return policy_; }

 private:
  DailyCaps caps_for(const AccountHealthRecord& rec, AccountPhase phase) const;
  void raise_escalation(AccountId account_id, const HealthScoreBreakdown& breakdown);

  IHealthStore& store_;
  HealthPolicy policy_;
  PhaseCapsTable phase_caps_;
  const Clock& clock_;
  EscalationLog* escalations_;
};

}  // namespace pacer
