#pragma once

// pacer/config.hpp — Runtime configuration.
//
// Load order: defaults -> JSON file -> PACER_* environment variables.
//
// JSON layout (every section and key optional):
//   {
//     "config_version": "1",
//     "health": { "escalate_below": 20, "suspend_below": 40,
//                 "throttle_below": 60, "unthrottle_at": 70,
//                 "weights": { "login": 0.2, "post": 0.3,
//                              "naturalness": 0.2, "inverse_freeze": 0.3 },
//                 "growing_after_days": 7, "mature_after_days": 14,
//                 "cooling_min_s": 86400 },
//     "hourly_limits": { "<phase>": { "<action>": n, ... }, ... },
//     "phase_caps":    { "<phase>": { "posts": n, "actions": n }, ... },
//     "daily_limits":  { "<action>": n, ... },
//     "scheduler":     { "retrigger_s": 300, "claim_timeout_s": 1800,
//                        "cleanup_after_days": 7 },
//     "sessions":      { "max_concurrent": 3, "idle_timeout_s": 600,
//                        "sweep_interval_s": 60, "shutdown_timeout_s": 10,
//                        "lease_wait_ms": 5000,
//                        "checkpoint_dir": ".pacer/sessions" },
//     "monitor":       { "health_interval_s": 900, "history_retention_days": 30 },
//     "escalation_log": "path/to/escalations.ndjson"
//   }
//
// Environment overrides:
//   PACER_MAX_SESSIONS, PACER_IDLE_TIMEOUT_S, PACER_HEALTH_INTERVAL_S,
//   PACER_CHECKPOINT_DIR, PACER_ESCALATION_LOG

#include <cstdint>
#include <string>
#include <vector>

#include "pacer/clock.hpp"
#include "pacer/limits.hpp"

namespace pacer {

struct SchedulerConfig {
  TypeDailyLimits daily_limits{default_engagement_daily_limits()};
  int64_t default_retrigger_ms{5 * kMsPerMinute};
  int64_t claim_timeout_ms{30 * kMsPerMinute};
  int cleanup_after_days{7};
};

struct SessionPoolConfig {
  std::size_t max_concurrent{3};
  int64_t idle_timeout_ms{10 * kMsPerMinute};
  int64_t sweep_interval_ms{60 * kMsPerSecond};
  int64_t shutdown_timeout_ms{10 * kMsPerSecond};
  // How long an acquire at capacity waits for a session to be returned before
  // it evicts the least recently used session that is still leased.
  int64_t lease_wait_ms{5 * kMsPerSecond};
  std::string checkpoint_dir{".pacer/sessions"};
};

struct MonitorConfig {
  int64_t health_interval_ms{15 * kMsPerMinute};
  int history_retention_days{30};
};

struct PacerConfig {
  std::string config_version{"1"};
  HealthPolicy policy;
  HourlyLimitTable hourly{default_hourly_limits()};
  PhaseCapsTable phase_caps{default_phase_caps()};
  SchedulerConfig scheduler;
  SessionPoolConfig sessions;
  MonitorConfig monitor;
  std::string escalation_log_path;  // empty = in-memory only
};

PacerConfig default_config();

// Overlay the keys present in config_json onto defaults. On a parse error
// the defaults are returned and *error is set.
PacerConfig config_from_json(const std::string& config_json, std::string* error);

void apply_env_overrides(PacerConfig& cfg);

// Reads path (empty = defaults only), then applies the environment.
PacerConfig load_config(const std::string& path, std::string* error);

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Strict check of a config document: syntax, known sections, value ranges
// and table consistency. Unknown top-level keys are warnings.
ConfigValidationResult validate_config(const std::string& config_json);

std::string config_to_json(const PacerConfig& cfg);

}  // namespace pacer
