#pragma once

// pacer/gate.hpp — Action Gate & Rate Limiter.
//
// Consulted before every automated action. Evaluation order, first failure
// wins:
//   1. no health record                       -> no_record
//   2. is_suspended or phase == suspended     -> suspended
//   3. throttle_until in the future           -> throttled  (retry = remaining)
//   4. daily post cap (post) / action cap     -> daily_*    (retry = to midnight)
//   5. hourly cap from the phase x action table -> hourly_cap (retry = to next hour)
//
// COUNTER ROLLOVER:
//   Each record remembers the local day/hour its counters belong to. A check
//   in a later day or hour reads the stale counters as zero without writing
//   them; the next write (record/reserve) rolls them over. The periodic
//   resets in Supervisor still zero everything at the boundaries.
//
// TWO WAYS TO USE IT:
//   can_perform_action + record_action   single caller per account
//   try_reserve_action + settle_action   concurrent callers; the check and
//                                        the increment happen under one lock

#include <cstdint>
#include <string>

#include "pacer/clock.hpp"
#include "pacer/config.hpp"
#include "pacer/health_store.hpp"
#include "pacer/types.hpp"

namespace pacer {

// Pure decision over one record snapshot.
ActionPermission evaluate_action(const AccountHealthRecord& rec, ActionType type,
                                 const HourlyLimitTable& hourly, int64_t now_ms);

class ActionGate {
 public:
  ActionGate(IHealthStore& store, const PacerConfig& config, const Clock& clock);

  // No mutation.
  ActionPermission can_perform_action(AccountId account_id, ActionType type) const;

  // Counts one attempt, success or not. Returns false when there is no record.
  bool record_action(AccountId account_id, ActionType type, bool success);

  // Check-and-increment under the account lock. When allowed, the counters
  // already include this attempt; call settle_action once it completes.
  ActionPermission try_reserve_action(AccountId account_id, ActionType type);
  bool settle_action(AccountId account_id, ActionType type, bool success);

  // Bulk maintenance; return the number of records touched.
  std::size_t reset_daily_counters();
  std::size_t reset_hourly_counters();

  // Time-bounded block, e.g. after a platform rate-limit response.
  bool throttle_for(AccountId account_id, int64_t duration_ms, const std::string& reason);

 private:
  IHealthStore& store_;
  HourlyLimitTable hourly_;
  const Clock& clock_;
};

}  // namespace pacer
