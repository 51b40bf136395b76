#include "pacer/observability.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

#include "pacer/jsonlite.hpp"
#include "pacer/version.hpp"

namespace pacer {

namespace {

LogLevel level_from_env() {
  const char* v = std::getenv("PACER_LOG_LEVEL");
  if (!v) return LogLevel::info;
  if (std::strcmp(v, "debug") == 0) return LogLevel::debug;
  if (std::strcmp(v, "warn") == 0) return LogLevel::warn;
  if (std::strcmp(v, "error") == 0) return LogLevel::error;
  return LogLevel::info;
}

std::atomic<int>& level_slot() {
  static std::atomic<int> slot{static_cast<int>(level_from_env())};
  return slot;
}

// Serializes whole lines so concurrent workers do not interleave output.
std::mutex& log_mutex() {
  static std::mutex mu;
  return mu;
}

std::atomic<CoreEventHook> g_event_hook{nullptr};

}  // namespace

LogLevel log_level() {
  return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

void set_log_level(LogLevel level) {
  level_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

void log(LogLevel level, const std::string& component, const std::string& message) {
  if (static_cast<int>(level) < static_cast<int>(log_level())) return;
  std::lock_guard<std::mutex> lk(log_mutex());
  std::cerr << "[" << component << "] ";
  if (level == LogLevel::warn) std::cerr << "WARN: ";
  if (level == LogLevel::error) std::cerr << "ERROR: ";
  std::cerr << message << "\n";
}

std::string to_string(CoreEventKind k) {
  switch (k) {
    case CoreEventKind::gate_denied:       return "gate_denied";
    case CoreEventKind::reservation:       return "reservation";
    case CoreEventKind::throttle:          return "throttle";
    case CoreEventKind::suspend:           return "suspend";
    case CoreEventKind::escalate:          return "escalate";
    case CoreEventKind::unthrottle:        return "unthrottle";
    case CoreEventKind::phase_advance:     return "phase_advance";
    case CoreEventKind::cooling_enter:     return "cooling_enter";
    case CoreEventKind::cooling_exit:      return "cooling_exit";
    case CoreEventKind::session_created:   return "session_created";
    case CoreEventKind::session_evicted:   return "session_evicted";
    case CoreEventKind::session_reclaimed: return "session_reclaimed";
    case CoreEventKind::checkpoint_failed: return "checkpoint_failed";
    case CoreEventKind::health_cycle:      return "health_cycle";
  }
  return "unknown";
}

std::string core_event_to_json(const CoreEvent& ev) {
  std::string line;
  line.reserve(160);
  line += "{\"schema\":";
  line += std::to_string(version::EVENT_SCHEMA_VERSION);
  line += ",\"kind\":\"";
  line += to_string(ev.kind);
  line += "\",\"account_id\":";
  line += std::to_string(ev.account_id);
  line += ",\"detail\":\"";
  line += jsonlite::escape(ev.detail);
  line += "\",\"value\":";
  line += std::to_string(ev.value);
  line += ",\"ts\":";
  line += std::to_string(ev.timestamp_unix_ms);
  line += "}";
  return line;
}

// ---------------------------------------------------------------------------
// CoreStats
// ---------------------------------------------------------------------------

void CoreStats::record(const CoreEvent& ev) {
  switch (ev.kind) {
    case CoreEventKind::gate_denied:
      gate_denials.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::reservation:
      reservations.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::throttle:
      throttles.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::suspend:
      suspensions.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::escalate:
      escalations.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::unthrottle:
      unthrottles.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::phase_advance:
      phase_advances.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::cooling_enter:
    case CoreEventKind::cooling_exit:
      cooling_transitions.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::session_created:
      sessions_created.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::session_evicted:
      sessions_evicted.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::session_reclaimed:
      sessions_reclaimed.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::checkpoint_failed:
      checkpoint_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case CoreEventKind::health_cycle:
      health_cycles.fetch_add(1, std::memory_order_relaxed);
      break;
  }
}

void CoreStats::reset() {
  for (auto* c : {&gate_checks, &gate_denials, &reservations, &throttles, &suspensions,
                  &escalations, &unthrottles, &phase_advances, &cooling_transitions,
                  &sessions_created, &sessions_reused, &sessions_evicted, &sessions_reclaimed,
                  &checkpoint_writes, &checkpoint_failures, &health_cycles}) {
    c->store(0, std::memory_order_relaxed);
  }
}

std::string CoreStats::to_json() const {
  std::string out;
  out.reserve(512);
  auto field = [&out](const char* name, const std::atomic<uint64_t>& v, bool first = false) {
    if (!first) out += ",";
    out += "\"";
    out += name;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };

  out += "{\"gate\":{";
  field("checks", gate_checks, true);
  field("denials", gate_denials);
  field("reservations", reservations);
  out += "},\"health\":{";
  field("throttles", throttles, true);
  field("suspensions", suspensions);
  field("escalations", escalations);
  field("unthrottles", unthrottles);
  field("phase_advances", phase_advances);
  field("cooling_transitions", cooling_transitions);
  field("cycles", health_cycles);
  out += "},\"sessions\":{";
  field("created", sessions_created, true);
  field("reused", sessions_reused);
  field("evicted", sessions_evicted);
  field("reclaimed", sessions_reclaimed);
  field("checkpoint_writes", checkpoint_writes);
  field("checkpoint_failures", checkpoint_failures);
  out += "}}";
  return out;
}

CoreStats& global_core_stats() {
  static CoreStats inst;
  return inst;
}

void set_core_event_hook(CoreEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_core_event(const CoreEvent& ev) {
  global_core_stats().record(ev);

  CoreEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("PACER_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = core_event_to_json(ev);
  line += "\n";
  // O_APPEND keeps lines whole for writes below PIPE_BUF.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace pacer
