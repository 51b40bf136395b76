#pragma once

// pacer/limits.hpp — Quota tables and health thresholds.
//
// DESIGN:
//   All phase x action tables are std::array indexed by the dense enums in
//   types.hpp, so every combination exists at compile time. There is no
//   string-keyed lookup and no "missing entry" path.
//
// ORDERING:
//   Hourly caps widen monotonically warming -> growing -> mature; cooling is
//   tighter than growing; suspended is all zero. validate_limits() enforces
//   this for tables loaded from configuration.
//
// The numeric defaults are product-tuning constants. They are kept here as
// defaults and every one of them can be overridden through PacerConfig.

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "pacer/types.hpp"

namespace pacer {

struct DailyCaps {
  uint32_t max_posts{0};
  uint32_t max_actions{0};
};

using HourlyRow        = std::array<uint32_t, kActionTypeCount>;
using HourlyLimitTable = std::array<HourlyRow, kPhaseCount>;
using PhaseCapsTable   = std::array<DailyCaps, kPhaseCount>;
using TypeDailyLimits  = std::array<uint32_t, kActionTypeCount>;

// Columns: post, like, comment, follow, retweet, unfollow.
HourlyLimitTable default_hourly_limits();

// warming 1/10, growing 3/30, mature 10/100, cooling 1/5, suspended 0/0.
PhaseCapsTable default_phase_caps();

// Per-type daily limits used by the engagement scheduler's availability
// check. post is not a schedulable engagement type and carries 0.
TypeDailyLimits default_engagement_daily_limits();

inline uint32_t hourly_limit(const HourlyLimitTable& t, AccountPhase p, ActionType a) {
  return t[index_of(p)][index_of(a)];
}

inline DailyCaps base_caps(const PhaseCapsTable& t, AccountPhase p) {
  return t[index_of(p)];
}

// Halve the phase base caps (never an already-throttled value), floored at
// 1 post / 5 actions. A zero base (suspended phase) stays zero.
DailyCaps throttled_caps(DailyCaps base);

// ---------------------------------------------------------------------------
// HealthPolicy — score thresholds, weights and windows.
// ---------------------------------------------------------------------------
// Threshold semantics (score s):
//   s <  escalate_below  -> suspend + escalation record
//   s <  suspend_below   -> suspend
//   s <  throttle_below  -> throttle
//   s >= unthrottle_at   -> unthrottle permitted
// throttle_below < unthrottle_at forms the hysteresis band.
struct HealthPolicy {
  int escalate_below{20};
  int suspend_below{40};
  int throttle_below{60};
  int unthrottle_at{70};

  double weight_login{0.20};
  double weight_post{0.30};
  double weight_naturalness{0.20};
  double weight_inverse_freeze{0.30};

  int login_window_days{30};
  int post_window_days{30};
  int freeze_window_days{30};
  int naturalness_window_days{7};

  int64_t rapid_gap_ms{5000};
  int naturalness_floor{20};

  int growing_after_days{7};
  int mature_after_days{14};
  int64_t cooling_min_ms{24 * 60 * 60 * 1000LL};
};

// Returns human-readable problems; empty when the tables are consistent.
std::vector<std::string> validate_limits(const HourlyLimitTable& hourly,
                                         const PhaseCapsTable& caps,
                                         const HealthPolicy& policy);

}  // namespace pacer
