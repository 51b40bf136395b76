#pragma once

// pacer/escalation.hpp — Append-only, hash-chained escalation log.
//
// An escalation is the "needs a person" signal raised when an account's score
// falls below the escalate threshold. It is data, not an error: the health
// engine appends a record and carries on.
//
// DESIGN INVARIANTS:
//   1. APPEND-ONLY: records are never modified or deleted.
//   2. SEQUENTIAL: each record carries a monotonically increasing sequence.
//   3. CHAINED: each record stores the BLAKE3 ("esc:" domain) digest of the
//      previous serialized line; the first record links to 64 zeros.
//   4. FAIL-SAFE: a write failure increments failure_count() and is logged;
//      the in-memory record and the hook still see the escalation.
//
// EXTENSION_POINT: notification_fanout
//   set_hook() delivers each record in-process. Alerting and dashboards are
//   external consumers of either the hook or the NDJSON file.

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "pacer/types.hpp"

namespace pacer {

struct EscalationRecord {
  uint64_t    sequence{0};
  std::string previous_digest;
  AccountId   account_id{0};
  int         health_score{0};
  HealthScoreBreakdown breakdown;
  std::string reason;
  int64_t     timestamp_unix_ms{0};
};

std::string escalation_to_json(const EscalationRecord& r);

using EscalationHook = std::function<void(const EscalationRecord&)>;

class EscalationLog {
 public:
  static constexpr std::size_t kMaxRecent = 256;

  // Empty path keeps records in memory only.
  explicit EscalationLog(const std::string& path = "");
  ~EscalationLog();

  EscalationLog(const EscalationLog&) = delete;
  EscalationLog& operator=(const EscalationLog&) = delete;

  // Assigns sequence and previous_digest in place. Returns false when the
  // file write failed. Never throws.
  bool append(EscalationRecord& record);

  void set_hook(EscalationHook hook);

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  std::vector<EscalationRecord> recent() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

struct ChainVerifyResult {
  bool ok{false};
  uint64_t records{0};
  std::string error;  // first broken link, empty when ok
};

// Re-derives the chain of an escalation log file.
ChainVerifyResult verify_escalation_log(const std::string& path);

}  // namespace pacer
