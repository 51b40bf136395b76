#pragma once

// pacer/health_store.hpp — Storage seam for health records and scoring history.
//
// DESIGN:
//   IHealthStore is the only way the core touches persistent account state.
//   It needs exactly three things from a backend: point lookup by account,
//   time-range scans over append-only history, and atomic single-row updates.
//
// CONCURRENCY:
//   update(account, fn) runs fn on the stored record while holding that
//   account's lock. Two updates of the same account are serialized; updates of
//   different accounts proceed in parallel. fn must not call back into the
//   store for the same account.
//
// EXTENSION_POINT: relational_backend
//   A SQL-backed store implements update() as SELECT ... FOR UPDATE + UPDATE
//   inside one transaction. MemoryHealthStore is the reference backend.

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "pacer/types.hpp"

namespace pacer {

using HealthMutator = std::function<void(AccountHealthRecord&)>;

class IHealthStore {
 public:
  virtual ~IHealthStore() = default;

  // Inserts rec unless a record for rec.account_id exists. Returns the id of
  // the stored record; *created tells which case happened.
  virtual int64_t insert_if_absent(const AccountHealthRecord& rec, bool* created) = 0;
  virtual std::optional<AccountHealthRecord> get(AccountId account_id) const = 0;
  virtual bool update(AccountId account_id, const HealthMutator& fn) = 0;
  virtual std::vector<AccountId> account_ids() const = 0;
  virtual std::vector<AccountHealthRecord> all() const = 0;

  virtual void append_session_attempt(AccountId account_id, const SessionAttempt& a) = 0;
  virtual void append_publish_outcome(AccountId account_id, const PublishOutcome& p) = 0;
  virtual void append_freeze_detection(AccountId account_id, const FreezeDetection& f) = 0;
  virtual void append_engagement(const EngagementLogEntry& e) = 0;

  // Entries with at_ms / created_at_ms >= since_ms, in insertion order.
  virtual std::vector<SessionAttempt> session_attempts_since(AccountId account_id, int64_t since_ms) const = 0;
  virtual std::vector<PublishOutcome> publish_outcomes_since(AccountId account_id, int64_t since_ms) const = 0;
  virtual std::vector<FreezeDetection> freeze_detections_since(AccountId account_id, int64_t since_ms) const = 0;
  virtual std::vector<EngagementLogEntry> engagements_since(AccountId account_id, int64_t since_ms) const = 0;

  // Drops history entries older than cutoff_ms across all accounts. Records
  // are never pruned. Returns the number of entries removed.
  virtual std::size_t prune_history_before(int64_t cutoff_ms) = 0;
};

// ---------------------------------------------------------------------------
// MemoryHealthStore — in-process reference backend.
// ---------------------------------------------------------------------------
// The account map is guarded by a shared_mutex (writers only on first insert);
// each account owns a Slot with its own mutex covering the record and its
// history vectors.
class MemoryHealthStore : public IHealthStore {
 public:
  int64_t insert_if_absent(const AccountHealthRecord& rec, bool* created) override;
  std::optional<AccountHealthRecord> get(AccountId account_id) const override;
  bool update(AccountId account_id, const HealthMutator& fn) override;
  std::vector<AccountId> account_ids() const override;
  std::vector<AccountHealthRecord> all() const override;

  void append_session_attempt(AccountId account_id, const SessionAttempt& a) override;
  void append_publish_outcome(AccountId account_id, const PublishOutcome& p) override;
  void append_freeze_detection(AccountId account_id, const FreezeDetection& f) override;
  void append_engagement(const EngagementLogEntry& e) override;

  std::vector<SessionAttempt> session_attempts_since(AccountId account_id, int64_t since_ms) const override;
  std::vector<PublishOutcome> publish_outcomes_since(AccountId account_id, int64_t since_ms) const override;
  std::vector<FreezeDetection> freeze_detections_since(AccountId account_id, int64_t since_ms) const override;
  std::vector<EngagementLogEntry> engagements_since(AccountId account_id, int64_t since_ms) const override;

  std::size_t prune_history_before(int64_t cutoff_ms) override;

 private:
  struct Slot {
    mutable std::mutex mu;
    std::optional<AccountHealthRecord> record;
    std::vector<SessionAttempt> sessions;
    std::vector<PublishOutcome> publishes;
    std::vector<FreezeDetection> freezes;
    std::vector<EngagementLogEntry> engagements;
  };

  // History may arrive before the record exists; the slot is created either way.
  std::shared_ptr<Slot> slot_for(AccountId account_id);
  std::shared_ptr<Slot> find_slot(AccountId account_id) const;

  mutable std::shared_mutex map_mu_;
  std::map<AccountId, std::shared_ptr<Slot>> slots_;
  int64_t next_id_{1};
};

}  // namespace pacer
