#include "pacer/types.hpp"

namespace pacer {

std::string to_string(ActionType t) {
  switch (t) {
    case ActionType::post:     return "post";
    case ActionType::like:     return "like";
    case ActionType::comment:  return "comment";
    case ActionType::follow:   return "follow";
    case ActionType::retweet:  return "retweet";
    case ActionType::unfollow: return "unfollow";
  }
  return "unknown";
}

std::string to_string(AccountPhase p) {
  switch (p) {
    case AccountPhase::warming:   return "warming";
    case AccountPhase::growing:   return "growing";
    case AccountPhase::mature:    return "mature";
    case AccountPhase::cooling:   return "cooling";
    case AccountPhase::suspended: return "suspended";
  }
  return "unknown";
}

std::optional<ActionType> action_type_from_string(const std::string& s) {
  for (ActionType t : kAllActionTypes) {
    if (to_string(t) == s) return t;
  }
  return std::nullopt;
}

std::optional<AccountPhase> phase_from_string(const std::string& s) {
  for (AccountPhase p : kAllPhases) {
    if (to_string(p) == s) return p;
  }
  return std::nullopt;
}

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:                    return "";
    case ErrorCode::not_found:               return "not_found";
    case ErrorCode::invalid_argument:        return "invalid_argument";
    case ErrorCode::invalid_task:            return "invalid_task";
    case ErrorCode::session_create_failed:   return "session_create_failed";
    case ErrorCode::checkpoint_write_failed: return "checkpoint_write_failed";
    case ErrorCode::checkpoint_corrupt:      return "checkpoint_corrupt";
    case ErrorCode::config_parse_error:      return "config_parse_error";
  }
  return "unknown";
}

std::string to_string(DenyReason r) {
  switch (r) {
    case DenyReason::none:             return "";
    case DenyReason::no_record:        return "no_record";
    case DenyReason::suspended:        return "suspended";
    case DenyReason::throttled:        return "throttled";
    case DenyReason::daily_post_cap:   return "daily_post_cap";
    case DenyReason::daily_action_cap: return "daily_action_cap";
    case DenyReason::hourly_cap:       return "hourly_cap";
  }
  return "unknown";
}

std::string to_string(ThrottleAction a) {
  switch (a) {
    case ThrottleAction::none:     return "none";
    case ThrottleAction::throttle: return "throttle";
    case ThrottleAction::suspend:  return "suspend";
    case ThrottleAction::escalate: return "escalate";
  }
  return "none";
}

std::string to_string(TaskState s) {
  switch (s) {
    case TaskState::pending:   return "pending";
    case TaskState::claimed:   return "claimed";
    case TaskState::completed: return "completed";
    case TaskState::expired:   return "expired";
  }
  return "unknown";
}

}  // namespace pacer
