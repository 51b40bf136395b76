#include "pacer/config.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>

#include "pacer/jsonlite.hpp"

namespace pacer {

namespace {

namespace js = jsonlite;

bool holds_uint(const js::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && std::holds_alternative<std::uint64_t>(it->second.v);
}

bool holds_number(const js::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && (std::holds_alternative<std::uint64_t>(it->second.v) ||
                             std::holds_alternative<double>(it->second.v));
}

void overlay_health(const js::Object& h, HealthPolicy& p) {
  p.escalate_below  = static_cast<int>(js::get_i64(h, "escalate_below", p.escalate_below));
  p.suspend_below   = static_cast<int>(js::get_i64(h, "suspend_below", p.suspend_below));
  p.throttle_below  = static_cast<int>(js::get_i64(h, "throttle_below", p.throttle_below));
  p.unthrottle_at   = static_cast<int>(js::get_i64(h, "unthrottle_at", p.unthrottle_at));
  p.growing_after_days = static_cast<int>(js::get_i64(h, "growing_after_days", p.growing_after_days));
  p.mature_after_days  = static_cast<int>(js::get_i64(h, "mature_after_days", p.mature_after_days));
  p.naturalness_floor  = static_cast<int>(js::get_i64(h, "naturalness_floor", p.naturalness_floor));
  if (js::has(h, "rapid_gap_ms")) p.rapid_gap_ms = js::get_i64(h, "rapid_gap_ms", p.rapid_gap_ms);
  if (js::has(h, "cooling_min_s")) {
    p.cooling_min_ms = js::get_i64(h, "cooling_min_s", 0) * kMsPerSecond;
  }

  const js::Object w = js::get_object(h, "weights");
  p.weight_login          = js::get_double(w, "login", p.weight_login);
  p.weight_post           = js::get_double(w, "post", p.weight_post);
  p.weight_naturalness    = js::get_double(w, "naturalness", p.weight_naturalness);
  p.weight_inverse_freeze = js::get_double(w, "inverse_freeze", p.weight_inverse_freeze);
}

void overlay_hourly(const js::Object& table, HourlyLimitTable& hourly) {
  for (AccountPhase phase : kAllPhases) {
    const js::Object row = js::get_object(table, to_string(phase));
    for (ActionType a : kAllActionTypes) {
      const std::string col = to_string(a);
      if (holds_uint(row, col)) {
        hourly[index_of(phase)][index_of(a)] = static_cast<uint32_t>(js::get_u64(row, col));
      }
    }
  }
}

void overlay_caps(const js::Object& table, PhaseCapsTable& caps) {
  for (AccountPhase phase : kAllPhases) {
    const js::Object row = js::get_object(table, to_string(phase));
    DailyCaps& c = caps[index_of(phase)];
    c.max_posts   = static_cast<uint32_t>(js::get_u64(row, "posts", c.max_posts));
    c.max_actions = static_cast<uint32_t>(js::get_u64(row, "actions", c.max_actions));
  }
}

void overlay_daily(const js::Object& table, TypeDailyLimits& limits) {
  for (ActionType a : kAllActionTypes) {
    const std::string key = to_string(a);
    if (holds_uint(table, key)) limits[index_of(a)] = static_cast<uint32_t>(js::get_u64(table, key));
  }
}

std::optional<long long> env_int(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !v[0]) return std::nullopt;
  char* end = nullptr;
  const long long n = std::strtoll(v, &end, 10);
  if (end == v || *end != '\0' || n < 0) return std::nullopt;
  return n;
}

std::string read_file(const std::string& path, bool* ok) {
  std::ifstream ifs(path, std::ios::binary);
  *ok = static_cast<bool>(ifs);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void check_known_keys(const js::Object& obj, const std::set<std::string>& known,
                      const std::string& where, std::vector<std::string>& out) {
  for (const auto& [k, v] : obj) {
    (void)v;
    if (known.count(k) == 0) out.push_back("unknown key " + where + k);
  }
}

}  // namespace

PacerConfig default_config() { return PacerConfig{}; }

PacerConfig config_from_json(const std::string& config_json, std::string* error) {
  PacerConfig cfg;
  std::optional<js::JsonError> err;
  const js::Object root = js::parse(config_json, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return cfg;
  }

  cfg.config_version = js::get_string(root, "config_version", cfg.config_version);
  overlay_health(js::get_object(root, "health"), cfg.policy);
  overlay_hourly(js::get_object(root, "hourly_limits"), cfg.hourly);
  overlay_caps(js::get_object(root, "phase_caps"), cfg.phase_caps);
  overlay_daily(js::get_object(root, "daily_limits"), cfg.scheduler.daily_limits);

  const js::Object sch = js::get_object(root, "scheduler");
  if (holds_uint(sch, "retrigger_s")) {
    cfg.scheduler.default_retrigger_ms = js::get_i64(sch, "retrigger_s") * kMsPerSecond;
  }
  if (holds_uint(sch, "claim_timeout_s")) {
    cfg.scheduler.claim_timeout_ms = js::get_i64(sch, "claim_timeout_s") * kMsPerSecond;
  }
  cfg.scheduler.cleanup_after_days =
      static_cast<int>(js::get_i64(sch, "cleanup_after_days", cfg.scheduler.cleanup_after_days));

  const js::Object ses = js::get_object(root, "sessions");
  cfg.sessions.max_concurrent =
      static_cast<std::size_t>(js::get_u64(ses, "max_concurrent", cfg.sessions.max_concurrent));
  if (holds_uint(ses, "idle_timeout_s")) {
    cfg.sessions.idle_timeout_ms = js::get_i64(ses, "idle_timeout_s") * kMsPerSecond;
  }
  if (holds_uint(ses, "sweep_interval_s")) {
    cfg.sessions.sweep_interval_ms = js::get_i64(ses, "sweep_interval_s") * kMsPerSecond;
  }
  if (holds_uint(ses, "shutdown_timeout_s")) {
    cfg.sessions.shutdown_timeout_ms = js::get_i64(ses, "shutdown_timeout_s") * kMsPerSecond;
  }
  if (holds_uint(ses, "lease_wait_ms")) {
    cfg.sessions.lease_wait_ms = js::get_i64(ses, "lease_wait_ms");
  }
  cfg.sessions.checkpoint_dir = js::get_string(ses, "checkpoint_dir", cfg.sessions.checkpoint_dir);

  const js::Object mon = js::get_object(root, "monitor");
  if (holds_uint(mon, "health_interval_s")) {
    cfg.monitor.health_interval_ms = js::get_i64(mon, "health_interval_s") * kMsPerSecond;
  }
  if (holds_uint(mon, "history_retention_days")) {
    cfg.monitor.history_retention_days = static_cast<int>(js::get_i64(mon, "history_retention_days"));
  }

  cfg.escalation_log_path = js::get_string(root, "escalation_log", cfg.escalation_log_path);
  return cfg;
}

void apply_env_overrides(PacerConfig& cfg) {
  if (auto n = env_int("PACER_MAX_SESSIONS"); n && *n > 0) {
    cfg.sessions.max_concurrent = static_cast<std::size_t>(*n);
  }
  if (auto n = env_int("PACER_IDLE_TIMEOUT_S")) {
    cfg.sessions.idle_timeout_ms = *n * kMsPerSecond;
  }
  if (auto n = env_int("PACER_HEALTH_INTERVAL_S"); n && *n > 0) {
    cfg.monitor.health_interval_ms = *n * kMsPerSecond;
  }
  if (const char* dir = std::getenv("PACER_CHECKPOINT_DIR"); dir && dir[0]) {
    cfg.sessions.checkpoint_dir = dir;
  }
  if (const char* log = std::getenv("PACER_ESCALATION_LOG"); log && log[0]) {
    cfg.escalation_log_path = log;
  }
}

PacerConfig load_config(const std::string& path, std::string* error) {
  PacerConfig cfg;
  if (!path.empty()) {
    bool ok = false;
    const std::string text = read_file(path, &ok);
    if (!ok) {
      if (error) *error = "cannot read config file: " + path;
    } else {
      cfg = config_from_json(text, error);
    }
  }
  apply_env_overrides(cfg);
  return cfg;
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<js::JsonError> err;
  const js::Object root = js::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  r.config_version = js::get_string(root, "config_version", "");
  if (r.config_version.empty()) {
    r.warnings.push_back("config_version missing; assuming 1");
    r.config_version = "1";
  } else if (r.config_version != "1") {
    r.errors.push_back("unsupported config_version: " + r.config_version);
  }

  check_known_keys(root,
                   {"config_version", "health", "hourly_limits", "phase_caps", "daily_limits",
                    "scheduler", "sessions", "monitor", "escalation_log"},
                   "", r.warnings);

  const js::Object hourly = js::get_object(root, "hourly_limits");
  for (const auto& [phase_name, row_val] : hourly) {
    if (!phase_from_string(phase_name)) {
      r.errors.push_back("hourly_limits: unknown phase " + phase_name);
      continue;
    }
    if (!std::holds_alternative<js::Object>(row_val.v)) {
      r.errors.push_back("hourly_limits." + phase_name + " must be an object");
      continue;
    }
    for (const auto& [action_name, v] : std::get<js::Object>(row_val.v)) {
      if (!action_type_from_string(action_name)) {
        r.errors.push_back("hourly_limits." + phase_name + ": unknown action " + action_name);
      } else if (!std::holds_alternative<std::uint64_t>(v.v)) {
        r.errors.push_back("hourly_limits." + phase_name + "." + action_name +
                           " must be a non-negative integer");
      }
    }
  }

  for (const auto& [action_name, v] : js::get_object(root, "daily_limits")) {
    if (!action_type_from_string(action_name)) {
      r.errors.push_back("daily_limits: unknown action " + action_name);
    } else if (!std::holds_alternative<std::uint64_t>(v.v)) {
      r.errors.push_back("daily_limits." + action_name + " must be a non-negative integer");
    }
  }

  for (const auto& [phase_name, v] : js::get_object(root, "phase_caps")) {
    (void)v;
    if (!phase_from_string(phase_name)) r.errors.push_back("phase_caps: unknown phase " + phase_name);
  }

  const js::Object health = js::get_object(root, "health");
  const js::Object weights = js::get_object(health, "weights");
  for (const char* key : {"login", "post", "naturalness", "inverse_freeze"}) {
    if (js::has(weights, key) && !holds_number(weights, key)) {
      r.errors.push_back(std::string("health.weights.") + key + " must be a number");
    }
  }

  const js::Object ses = js::get_object(root, "sessions");
  if (js::has(ses, "max_concurrent") && js::get_u64(ses, "max_concurrent", 0) == 0) {
    r.errors.push_back("sessions.max_concurrent must be a positive integer");
  }
  const js::Object mon = js::get_object(root, "monitor");
  if (js::has(mon, "health_interval_s") && js::get_u64(mon, "health_interval_s", 0) == 0) {
    r.errors.push_back("monitor.health_interval_s must be a positive integer");
  }
  if (js::has(mon, "history_retention_days") && js::get_u64(mon, "history_retention_days", 0) == 0) {
    r.errors.push_back("monitor.history_retention_days must be a positive integer");
  }

  std::string parse_error;
  const PacerConfig cfg = config_from_json(config_json, &parse_error);
  for (auto& p : validate_limits(cfg.hourly, cfg.phase_caps, cfg.policy)) {
    r.errors.push_back(std::move(p));
  }
  if (cfg.policy.growing_after_days >= cfg.policy.mature_after_days) {
    r.errors.push_back("health.growing_after_days must be less than mature_after_days");
  }
  if (cfg.sessions.idle_timeout_ms < cfg.sessions.sweep_interval_ms) {
    r.warnings.push_back("sessions.idle_timeout_s is shorter than sweep_interval_s");
  }

  r.ok = r.errors.empty();
  return r;
}

std::string config_to_json(const PacerConfig& cfg) {
  std::ostringstream oss;
  oss << "{\"config_version\":\"" << js::escape(cfg.config_version) << "\"";

  const HealthPolicy& p = cfg.policy;
  oss << ",\"health\":{\"escalate_below\":" << p.escalate_below
      << ",\"suspend_below\":" << p.suspend_below
      << ",\"throttle_below\":" << p.throttle_below
      << ",\"unthrottle_at\":" << p.unthrottle_at
      << ",\"growing_after_days\":" << p.growing_after_days
      << ",\"mature_after_days\":" << p.mature_after_days
      << ",\"cooling_min_s\":" << (p.cooling_min_ms / kMsPerSecond)
      << ",\"weights\":{\"login\":" << js::format_double(p.weight_login)
      << ",\"post\":" << js::format_double(p.weight_post)
      << ",\"naturalness\":" << js::format_double(p.weight_naturalness)
      << ",\"inverse_freeze\":" << js::format_double(p.weight_inverse_freeze) << "}}";

  oss << ",\"hourly_limits\":{";
  for (std::size_t i = 0; i < kPhaseCount; ++i) {
    if (i) oss << ",";
    oss << "\"" << to_string(kAllPhases[i]) << "\":{";
    for (std::size_t j = 0; j < kActionTypeCount; ++j) {
      if (j) oss << ",";
      oss << "\"" << to_string(kAllActionTypes[j]) << "\":" << cfg.hourly[i][j];
    }
    oss << "}";
  }
  oss << "}";

  oss << ",\"phase_caps\":{";
  for (std::size_t i = 0; i < kPhaseCount; ++i) {
    if (i) oss << ",";
    oss << "\"" << to_string(kAllPhases[i]) << "\":{\"posts\":" << cfg.phase_caps[i].max_posts
        << ",\"actions\":" << cfg.phase_caps[i].max_actions << "}";
  }
  oss << "}";

  oss << ",\"daily_limits\":{";
  for (std::size_t j = 0; j < kActionTypeCount; ++j) {
    if (j) oss << ",";
    oss << "\"" << to_string(kAllActionTypes[j]) << "\":" << cfg.scheduler.daily_limits[j];
  }
  oss << "}";

  oss << ",\"scheduler\":{\"retrigger_s\":" << (cfg.scheduler.default_retrigger_ms / kMsPerSecond)
      << ",\"claim_timeout_s\":" << (cfg.scheduler.claim_timeout_ms / kMsPerSecond)
      << ",\"cleanup_after_days\":" << cfg.scheduler.cleanup_after_days << "}";

  oss << ",\"sessions\":{\"max_concurrent\":" << cfg.sessions.max_concurrent
      << ",\"idle_timeout_s\":" << (cfg.sessions.idle_timeout_ms / kMsPerSecond)
      << ",\"sweep_interval_s\":" << (cfg.sessions.sweep_interval_ms / kMsPerSecond)
      << ",\"shutdown_timeout_s\":" << (cfg.sessions.shutdown_timeout_ms / kMsPerSecond)
      << ",\"lease_wait_ms\":" << cfg.sessions.lease_wait_ms
      << ",\"checkpoint_dir\":\"" << js::escape(cfg.sessions.checkpoint_dir) << "\"}";

  oss << ",\"monitor\":{\"health_interval_s\":" << (cfg.monitor.health_interval_ms / kMsPerSecond)
      << ",\"history_retention_days\":" << cfg.monitor.history_retention_days << "}";
  oss << ",\"escalation_log\":\"" << js::escape(cfg.escalation_log_path) << "\"}";
  return oss.str();
}

}  // namespace pacer
