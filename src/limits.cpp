#include "pacer/limits.hpp"

#include <algorithm>
#include <cmath>

namespace pacer {

HourlyLimitTable default_hourly_limits() {
  HourlyLimitTable t{};
  //                                   post like comment follow retweet unfollow
  t[index_of(AccountPhase::warming)]   = {1,   3,   2,      2,     1,      2};
  t[index_of(AccountPhase::growing)]   = {2,   10,  5,      5,     3,      5};
  t[index_of(AccountPhase::mature)]    = {5,   20,  10,     10,    5,      10};
  t[index_of(AccountPhase::cooling)]   = {1,   2,   1,      1,     1,      1};
  t[index_of(AccountPhase::suspended)] = {0,   0,   0,      0,     0,      0};
  return t;
}

PhaseCapsTable default_phase_caps() {
  PhaseCapsTable t{};
  t[index_of(AccountPhase::warming)]   = {1, 10};
  t[index_of(AccountPhase::growing)]   = {3, 30};
  t[index_of(AccountPhase::mature)]    = {10, 100};
  t[index_of(AccountPhase::cooling)]   = {1, 5};
  t[index_of(AccountPhase::suspended)] = {0, 0};
  return t;
}

TypeDailyLimits default_engagement_daily_limits() {
  TypeDailyLimits t{};
  t[index_of(ActionType::post)]     = 0;
  t[index_of(ActionType::like)]     = 50;
  t[index_of(ActionType::comment)]  = 10;
  t[index_of(ActionType::follow)]   = 20;
  t[index_of(ActionType::retweet)]  = 15;
  t[index_of(ActionType::unfollow)] = 30;
  return t;
}

DailyCaps throttled_caps(DailyCaps base) {
  if (base.max_posts == 0 && base.max_actions == 0) return base;
  DailyCaps out;
  out.max_posts   = std::max<uint32_t>(1, base.max_posts / 2);
  out.max_actions = std::max<uint32_t>(5, base.max_actions / 2);
  return out;
}

std::vector<std::string> validate_limits(const HourlyLimitTable& hourly,
                                         const PhaseCapsTable& caps,
                                         const HealthPolicy& policy) {
  std::vector<std::string> problems;

  const auto& warming = hourly[index_of(AccountPhase::warming)];
  const auto& growing = hourly[index_of(AccountPhase::growing)];
  const auto& mature  = hourly[index_of(AccountPhase::mature)];
  const auto& cooling = hourly[index_of(AccountPhase::cooling)];
  const auto& suspended = hourly[index_of(AccountPhase::suspended)];

  for (ActionType a : kAllActionTypes) {
    const std::size_t i = index_of(a);
    const std::string col = to_string(a);
    if (warming[i] > growing[i] || growing[i] > mature[i]) {
      problems.push_back("hourly_limits." + col + " must widen warming <= growing <= mature");
    }
    if (cooling[i] > growing[i]) {
      problems.push_back("hourly_limits.cooling." + col + " must not exceed growing");
    }
    if (suspended[i] != 0) {
      problems.push_back("hourly_limits.suspended." + col + " must be 0");
    }
  }

  const DailyCaps s = caps[index_of(AccountPhase::suspended)];
  if (s.max_posts != 0 || s.max_actions != 0) {
    problems.push_back("phase_caps.suspended must be 0/0");
  }

  if (!(policy.escalate_below <= policy.suspend_below &&
        policy.suspend_below <= policy.throttle_below &&
        policy.throttle_below <= policy.unthrottle_at)) {
    problems.push_back("health thresholds must satisfy escalate <= suspend <= throttle <= unthrottle");
  }
  if (policy.unthrottle_at > 100 || policy.escalate_below < 0) {
    problems.push_back("health thresholds must lie in [0,100]");
  }

  const double wsum = policy.weight_login + policy.weight_post +
                      policy.weight_naturalness + policy.weight_inverse_freeze;
  if (std::fabs(wsum - 1.0) > 1e-6) {
    problems.push_back("health weights must sum to 1.0");
  }
  return problems;
}

}  // namespace pacer
