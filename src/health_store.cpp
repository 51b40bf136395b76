#include "pacer/health_store.hpp"

#include <algorithm>
#include <iterator>

namespace pacer {

namespace {

template <typename T, typename TimeOf>
std::vector<T> filter_since(const std::vector<T>& in, int64_t since_ms, TimeOf time_of) {
  std::vector<T> out;
  for (const auto& e : in) {
    if (time_of(e) >= since_ms) out.push_back(e);
  }
  return out;
}

template <typename T, typename TimeOf>
std::size_t erase_before(std::vector<T>& v, int64_t cutoff_ms, TimeOf time_of) {
  const auto first = std::remove_if(v.begin(), v.end(),
                                    [&](const T& e) { return time_of(e) < cutoff_ms; });
  const auto n = static_cast<std::size_t>(std::distance(first, v.end()));
  v.erase(first, v.end());
  return n;
}

}  // namespace

std::shared_ptr<MemoryHealthStore::Slot> MemoryHealthStore::find_slot(AccountId account_id) const {
  std::shared_lock<std::shared_mutex> lk(map_mu_);
  auto it = slots_.find(account_id);
  return it == slots_.end() ? nullptr : it->second;
}

std::shared_ptr<MemoryHealthStore::Slot> MemoryHealthStore::slot_for(AccountId account_id) {
  if (auto s = find_slot(account_id)) return s;
  std::unique_lock<std::shared_mutex> lk(map_mu_);
  auto& s = slots_[account_id];
  if (!s) s = std::make_shared<Slot>();
  return s;
}

int64_t MemoryHealthStore::insert_if_absent(const AccountHealthRecord& rec, bool* created) {
  auto slot = slot_for(rec.account_id);
  std::lock_guard<std::mutex> lk(slot->mu);
  if (slot->record) {
    if (created) *created = false;
    return slot->record->id;
  }
  AccountHealthRecord stored = rec;
  {
    std::unique_lock<std::shared_mutex> map_lk(map_mu_);
    stored.id = next_id_++;
  }
  slot->record = stored;
  if (created) *created = true;
  return stored.id;
}

std::optional<AccountHealthRecord> MemoryHealthStore::get(AccountId account_id) const {
  auto slot = find_slot(account_id);
  if (!slot) return std::nullopt;
  std::lock_guard<std::mutex> lk(slot->mu);
  return slot->record;
}

bool MemoryHealthStore::update(AccountId account_id, const HealthMutator& fn) {
  auto slot = find_slot(account_id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lk(slot->mu);
  if (!slot->record) return false;
  fn(*slot->record);
  return true;
}

std::vector<AccountId> MemoryHealthStore::account_ids() const {
  std::vector<std::pair<AccountId, std::shared_ptr<Slot>>> snapshot;
  {
    std::shared_lock<std::shared_mutex> lk(map_mu_);
    snapshot.assign(slots_.begin(), slots_.end());
  }
  std::vector<AccountId> out;
  for (const auto& [id, slot] : snapshot) {
    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->record) out.push_back(id);
  }
  return out;
}

std::vector<AccountHealthRecord> MemoryHealthStore::all() const {
  std::vector<std::shared_ptr<Slot>> snapshot;
  {
    std::shared_lock<std::shared_mutex> lk(map_mu_);
    for (const auto& [id, slot] : slots_) {
      (void)id;
      snapshot.push_back(slot);
    }
  }
  std::vector<AccountHealthRecord> out;
  for (const auto& slot : snapshot) {
    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->record) out.push_back(*slot->record);
  }
  return out;
}

void MemoryHealthStore::append_session_attempt(AccountId account_id, const SessionAttempt& a) {
  auto slot = slot_for(account_id);
  std::lock_guard<std::mutex> lk(slot->mu);
  slot->sessions.push_back(a);
}

void MemoryHealthStore::append_publish_outcome(AccountId account_id, const PublishOutcome& p) {
  auto slot = slot_for(account_id);
  std::lock_guard<std::mutex> lk(slot->mu);
  slot->publishes.push_back(p);
}

void MemoryHealthStore::append_freeze_detection(AccountId account_id, const FreezeDetection& f) {
  auto slot = slot_for(account_id);
  std::lock_guard<std::mutex> lk(slot->mu);
  slot->freezes.push_back(f);
}

void MemoryHealthStore::append_engagement(const EngagementLogEntry& e) {
  auto slot = slot_for(e.account_id);
  std::lock_guard<std::mutex> lk(slot->mu);
  slot->engagements.push_back(e);
}

std::vector<SessionAttempt> MemoryHealthStore::session_attempts_since(AccountId account_id,
                                                                      int64_t since_ms) const {
  auto slot = find_slot(account_id);
  if (!slot) return {};
  std::lock_guard<std::mutex> lk(slot->mu);
  return filter_since(slot->sessions, since_ms, [](const SessionAttempt& a) { return a.at_ms; });
}

std::vector<PublishOutcome> MemoryHealthStore::publish_outcomes_since(AccountId account_id,
                                                                      int64_t since_ms) const {
  auto slot = find_slot(account_id);
  if (!slot) return {};
  std::lock_guard<std::mutex> lk(slot->mu);
  return filter_since(slot->publishes, since_ms, [](const PublishOutcome& p) { return p.at_ms; });
}

std::vector<FreezeDetection> MemoryHealthStore::freeze_detections_since(AccountId account_id,
                                                                        int64_t since_ms) const {
  auto slot = find_slot(account_id);
  if (!slot) return {};
  std::lock_guard<std::mutex> lk(slot->mu);
  return filter_since(slot->freezes, since_ms, [](const FreezeDetection& f) { return f.at_ms; });
}

std::vector<EngagementLogEntry> MemoryHealthStore::engagements_since(AccountId account_id,
                                                                     int64_t since_ms) const {
  auto slot = find_slot(account_id);
  if (!slot) return {};
  std::lock_guard<std::mutex> lk(slot->mu);
  return filter_since(slot->engagements, since_ms,
                      [](const EngagementLogEntry& e) { return e.created_at_ms; });
}

std::size_t MemoryHealthStore::prune_history_before(int64_t cutoff_ms) {
  std::vector<std::shared_ptr<Slot>> slots;
  {
    std::shared_lock<std::shared_mutex> lk(map_mu_);
    slots.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
      (void)id;
      slots.push_back(slot);
    }
  }

  std::size_t removed = 0;
  for (const auto& slot : slots) {
    std::lock_guard<std::mutex> lk(slot->mu);
    removed += erase_before(slot->sessions, cutoff_ms, [](const SessionAttempt& a) { return a.at_ms; });
    removed += erase_before(slot->publishes, cutoff_ms, [](const PublishOutcome& p) { return p.at_ms; });
    removed += erase_before(slot->freezes, cutoff_ms, [](const FreezeDetection& f) { return f.at_ms; });
    removed += erase_before(slot->engagements, cutoff_ms,
                            [](const EngagementLogEntry& e) { return e.created_at_ms; });
  }
  return removed;
}

}  // namespace pacer
