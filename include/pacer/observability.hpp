#pragma once

// pacer/observability.hpp — Diagnostics, counters and the event stream.
//
// DESIGN:
//   Three sinks, each independent:
//     - log(): human-readable "[component] message" lines on stderr, filtered
//       by PACER_LOG_LEVEL (debug|info|warn|error, default info).
//     - CoreStats: process-wide atomic counters, dumped by to_json().
//     - emit_core_event(): one CoreEvent per safety decision. Counted in
//       CoreStats, then either handed to the registered hook or, when
//       PACER_EVENT_LOG names a file, appended to it as one JSON line.
//
// INVARIANT:
//   Emission never throws and never blocks on anything but a short file
//   append. Callers may hold per-account locks while emitting.

#include <atomic>
#include <cstdint>
#include <string>

#include "pacer/types.hpp"

namespace pacer {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

LogLevel log_level();
void set_log_level(LogLevel level);
void log(LogLevel level, const std::string& component, const std::string& message);

// ---------------------------------------------------------------------------
// CoreEvent — one observable safety decision
// ---------------------------------------------------------------------------
enum class CoreEventKind {
  gate_denied,
  reservation,
  throttle,
  suspend,
  escalate,
  unthrottle,
  phase_advance,
  cooling_enter,
  cooling_exit,
  session_created,
  session_evicted,
  session_reclaimed,
  checkpoint_failed,
  health_cycle,
};

std::string to_string(CoreEventKind k);

struct CoreEvent {
  CoreEventKind kind{CoreEventKind::health_cycle};
  AccountId account_id{0};
  std::string detail;
  int64_t value{0};
  int64_t timestamp_unix_ms{0};
};

std::string core_event_to_json(const CoreEvent& ev);

// ---------------------------------------------------------------------------
// CoreStats — global aggregated counters
// ---------------------------------------------------------------------------
class CoreStats {
 public:
  void record(const CoreEvent& ev);
  std::string to_json() const;
  void reset();

  std::atomic<uint64_t> gate_checks{0};
  std::atomic<uint64_t> gate_denials{0};
  std::atomic<uint64_t> reservations{0};

  std::atomic<uint64_t> throttles{0};
  std::atomic<uint64_t> suspensions{0};
  std::atomic<uint64_t> escalations{0};
  std::atomic<uint64_t> unthrottles{0};
  std::atomic<uint64_t> phase_advances{0};
  std::atomic<uint64_t> cooling_transitions{0};

  std::atomic<uint64_t> sessions_created{0};
  std::atomic<uint64_t> sessions_reused{0};
  std::atomic<uint64_t> sessions_evicted{0};
  std::atomic<uint64_t> sessions_reclaimed{0};
  std::atomic<uint64_t> checkpoint_writes{0};
  std::atomic<uint64_t> checkpoint_failures{0};

  std::atomic<uint64_t> health_cycles{0};
};

CoreStats& global_core_stats();

void emit_core_event(const CoreEvent& ev);

using CoreEventHook = void (*)(const CoreEvent&);
void set_core_event_hook(CoreEventHook hook);

}  // namespace pacer
