#include "pacer/session_pool.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <system_error>
#include <thread>
#include <tuple>

#include "pacer/observability.hpp"

namespace pacer {

namespace {

constexpr auto kSlotRetry = std::chrono::milliseconds(50);

std::string account_tag(AccountId account_id) {
  return "account " + std::to_string(account_id);
}

// Export and store one session's state. Touches nothing owned by the pool so
// a shutdown worker can outlive it.
bool persist_state(ICheckpointStore& checkpoints, AccountId account_id, ISessionContext& context,
                   int64_t now_ms) {
  std::string state;
  try {
    state = context.storage_state();
  } catch (const std::exception& e) {
    log(LogLevel::error, "sessions", "failed to export state for " + account_tag(account_id) + ": " + e.what());
    emit_core_event({CoreEventKind::checkpoint_failed, account_id, e.what(), 0, now_ms});
    return false;
  }
  if (checkpoints.put(account_id, state).empty()) {
    log(LogLevel::error, "sessions", "failed to save session for " + account_tag(account_id));
    emit_core_event({CoreEventKind::checkpoint_failed, account_id, checkpoints.backend_id(), 0, now_ms});
    return false;
  }
  global_core_stats().checkpoint_writes.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void close_context(AccountId account_id, ISessionContext& context) {
  try {
    context.close();
  } catch (const std::exception& e) {
    log(LogLevel::warn, "sessions", "close failed for " + account_tag(account_id) + ": " + e.what());
  }
}

// Completion count shared between shutdown_all() and its drain workers.
struct DrainState {
  std::mutex mu;
  std::condition_variable cv;
  std::size_t done{0};
  std::size_t persisted{0};
};

void drain_session(std::shared_ptr<ICheckpointStore> checkpoints, AccountId account_id,
                   std::shared_ptr<ISessionContext> context, int64_t now_ms,
                   std::shared_ptr<DrainState> state) {
  const bool ok = persist_state(*checkpoints, account_id, *context, now_ms);
  close_context(account_id, *context);
  {
    std::lock_guard<std::mutex> lk(state->mu);
    ++state->done;
    if (ok) ++state->persisted;
  }
  state->cv.notify_all();
}

}  // namespace

SessionPool::SessionPool(std::shared_ptr<IAutomationEngine> engine,
                         std::shared_ptr<ICheckpointStore> checkpoints,
                         const SessionPoolConfig& config, const Clock& clock)
    : engine_(std::move(engine)), checkpoints_(std::move(checkpoints)), config_(config), clock_(clock) {
  if (config_.max_concurrent == 0) config_.max_concurrent = 1;
}

SessionPool::~SessionPool() {
  shutdown_all(config_.shutdown_timeout_ms);
}

std::shared_ptr<std::mutex> SessionPool::account_mutex(AccountId account_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& slot = account_locks_[account_id];
  if (!slot) slot = std::make_shared<std::mutex>();
  return slot;
}

bool SessionPool::persist(AccountId account_id, ISessionContext& context) {
  return persist_state(*checkpoints_, account_id, context, clock_.now_ms());
}

void SessionPool::close_quietly(AccountId account_id, ISessionContext& context) {
  close_context(account_id, context);
}

void SessionPool::prune_account_lock(AccountId account_id) {
  auto it = account_locks_.find(account_id);
  if (it == account_locks_.end() || live_.count(account_id) > 0) return;
  // Every copy is taken under mu_, so a sole owner here cannot gain a new one.
  if (it->second.use_count() == 1) account_locks_.erase(it);
}

void SessionPool::close_engine_if_idle() {
  std::lock_guard<std::mutex> elk(engine_mu_);
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!live_.empty() || pending_ > 0) return;
  }
  if (!engine_->is_connected()) return;
  log(LogLevel::info, "sessions", "no active sessions, closing automation engine");
  try {
    engine_->close();
  } catch (const std::exception& e) {
    log(LogLevel::warn, "sessions", std::string("engine close failed: ") + e.what());
  }
}

void SessionPool::reserve_slot(AccountId account_id) {
  const auto lease_deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.lease_wait_ms);
  std::unique_lock<std::mutex> lk(mu_);
  while (live_.size() + pending_ >= config_.max_concurrent) {
    // Returned sessions go first; leased ones only once lease_wait_ms is spent.
    const bool take_leased = std::chrono::steady_clock::now() >= lease_deadline;
    std::vector<std::tuple<bool, int64_t, AccountId>> by_age;
    by_age.reserve(live_.size());
    for (const auto& [id, entry] : live_) {
      const bool leased = entry.info.leases > 0;
      if (!leased || take_leased) by_age.emplace_back(leased, entry.info.last_used_ms, id);
    }
    std::sort(by_age.begin(), by_age.end());

    // Skip sessions whose account is mid-acquire or mid-release.
    std::shared_ptr<std::mutex> victim_mu;
    std::unique_lock<std::mutex> victim_lock;
    AccountId victim = 0;
    bool victim_leased = false;
    for (const auto& [leased, last_used, id] : by_age) {
      (void)last_used;
      auto it = account_locks_.find(id);
      if (it == account_locks_.end() || !it->second) continue;
      std::unique_lock<std::mutex> candidate(*it->second, std::try_to_lock);
      if (!candidate.owns_lock()) continue;
      victim_mu = it->second;
      victim_lock = std::move(candidate);
      victim = id;
      victim_leased = leased;
      break;
    }

    if (!victim_lock.owns_lock()) {
      slot_cv_.wait_for(lk, kSlotRetry);
      continue;
    }

    Entry evicted = std::move(live_.at(victim));
    live_.erase(victim);
    lk.unlock();

    if (victim_leased) {
      log(LogLevel::warn, "sessions",
          "pool full and no session returned within " + std::to_string(config_.lease_wait_ms) +
              " ms, evicting leased session for " + account_tag(victim));
    }
    log(LogLevel::info, "sessions",
        "pool full, evicting least recently used session for " + account_tag(victim) +
            " to make room for " + account_tag(account_id));
    persist(victim, *evicted.context);
    close_quietly(victim, *evicted.context);
    emit_core_event({CoreEventKind::session_evicted, victim, victim_leased ? "lru-leased" : "lru", 0,
                     clock_.now_ms()});
    victim_lock.unlock();
    victim_mu.reset();

    lk.lock();
    prune_account_lock(victim);
  }
  ++pending_;
}

std::shared_ptr<ISessionContext> SessionPool::create_session(AccountId account_id,
                                                             const std::optional<ProxyConfig>& proxy,
                                                             bool* restored) {
  ContextOptions options;
  options.proxy = proxy;
  options.storage_state = checkpoints_->get(account_id);
  *restored = options.storage_state.has_value();

  std::lock_guard<std::mutex> elk(engine_mu_);
  if (!engine_->is_connected()) {
    log(LogLevel::info, "sessions", "launching automation engine");
    engine_->launch();
  }
  auto context = engine_->new_context(options);
  if (!context) {
    throw SessionError(ErrorCode::session_create_failed, "engine returned no context");
  }
  return context;
}

std::shared_ptr<ISessionContext> SessionPool::acquire_context(AccountId account_id,
                                                              const std::optional<ProxyConfig>& proxy) {
  try {
    return lease_context(account_id, proxy);
  } catch (const SessionError&) {
    std::lock_guard<std::mutex> lk(mu_);
    prune_account_lock(account_id);
    throw;
  }
}

std::shared_ptr<ISessionContext> SessionPool::lease_context(AccountId account_id,
                                                            const std::optional<ProxyConfig>& proxy) {
  auto am = account_mutex(account_id);
  std::lock_guard<std::mutex> acct(*am);

  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = live_.find(account_id);
    if (it != live_.end()) {
      it->second.info.last_used_ms = clock_.now_ms();
      ++it->second.info.leases;
      global_core_stats().sessions_reused.fetch_add(1, std::memory_order_relaxed);
      return it->second.context;
    }
  }

  reserve_slot(account_id);

  bool restored = false;
  std::shared_ptr<ISessionContext> context;
  try {
    context = create_session(account_id, proxy, &restored);
  } catch (const std::exception& e) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      --pending_;
    }
    slot_cv_.notify_all();
    log(LogLevel::error, "sessions", "session creation failed for " + account_tag(account_id) + ": " + e.what());
    throw SessionError(ErrorCode::session_create_failed,
                       "session creation failed for " + account_tag(account_id) + ": " + e.what());
  }

  const int64_t now = clock_.now_ms();
  {
    std::lock_guard<std::mutex> lk(mu_);
    --pending_;
    Entry entry;
    entry.context = context;
    entry.info.account_id = account_id;
    entry.info.created_at_ms = now;
    entry.info.last_used_ms = now;
    entry.info.restored = restored;
    entry.info.leases = 1;
    live_[account_id] = std::move(entry);
  }
  emit_core_event({CoreEventKind::session_created, account_id, restored ? "restored" : "fresh", 0, now});
  return context;
}

bool SessionPool::return_context(AccountId account_id) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = live_.find(account_id);
    if (it == live_.end()) return false;
    if (it->second.info.leases > 0) --it->second.info.leases;
    it->second.info.last_used_ms = clock_.now_ms();
  }
  slot_cv_.notify_all();
  return true;
}

bool SessionPool::release_context(AccountId account_id) {
  bool released = false;
  {
    auto am = account_mutex(account_id);
    std::lock_guard<std::mutex> acct(*am);

    Entry entry;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = live_.find(account_id);
      if (it != live_.end()) {
        entry = std::move(it->second);
        live_.erase(it);
        released = true;
      }
    }
    if (released) {
      slot_cv_.notify_all();
      persist(account_id, *entry.context);
      close_quietly(account_id, *entry.context);
    }
  }
  std::lock_guard<std::mutex> lk(mu_);
  prune_account_lock(account_id);
  return released;
}

bool SessionPool::save_session(AccountId account_id) {
  std::shared_ptr<ISessionContext> context;
  {
    auto am = account_mutex(account_id);
    std::lock_guard<std::mutex> acct(*am);
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = live_.find(account_id);
      if (it != live_.end()) context = it->second.context;
    }
    if (context) write_checkpoint(account_id, *context);
  }
  if (!context) {
    std::lock_guard<std::mutex> lk(mu_);
    prune_account_lock(account_id);
    return false;
  }
  return true;
}

void SessionPool::write_checkpoint(AccountId account_id, ISessionContext& context) {
  std::string state;
  try {
    state = context.storage_state();
  } catch (const std::exception& e) {
    throw SessionError(ErrorCode::checkpoint_write_failed,
                       "cannot export state for " + account_tag(account_id) + ": " + e.what());
  }
  if (checkpoints_->put(account_id, state).empty()) {
    emit_core_event({CoreEventKind::checkpoint_failed, account_id, checkpoints_->backend_id(), 0,
                     clock_.now_ms()});
    throw SessionError(ErrorCode::checkpoint_write_failed,
                       "checkpoint write failed for " + account_tag(account_id));
  }
  global_core_stats().checkpoint_writes.fetch_add(1, std::memory_order_relaxed);
}

bool SessionPool::reclaim_one(AccountId account_id, int64_t scanned_at_ms) {
  auto am = account_mutex(account_id);
  std::lock_guard<std::mutex> acct(*am);

  Entry entry;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = live_.find(account_id);
    // Touched or released since the scan.
    if (it == live_.end() || clock_.now_ms() - it->second.info.last_used_ms <= config_.idle_timeout_ms) {
      return false;
    }
    entry = std::move(it->second);
    live_.erase(it);
  }
  slot_cv_.notify_all();

  log(LogLevel::info, "sessions", "auto-closing idle session for " + account_tag(account_id));
  persist(account_id, *entry.context);
  close_quietly(account_id, *entry.context);
  emit_core_event({CoreEventKind::session_reclaimed, account_id, "idle",
                   scanned_at_ms - entry.info.last_used_ms, scanned_at_ms});
  return true;
}

std::size_t SessionPool::reclaim_idle() {
  const int64_t now = clock_.now_ms();
  std::vector<AccountId> idle;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, entry] : live_) {
      if (now - entry.info.last_used_ms > config_.idle_timeout_ms) idle.push_back(id);
    }
  }

  std::size_t released = 0;
  for (AccountId id : idle) {
    if (reclaim_one(id, now)) ++released;
    std::lock_guard<std::mutex> lk(mu_);
    prune_account_lock(id);
  }

  close_engine_if_idle();
  return released;
}

std::size_t SessionPool::shutdown_all(int64_t timeout_ms) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

  std::map<AccountId, Entry> draining;
  {
    std::lock_guard<std::mutex> lk(mu_);
    draining.swap(live_);
    for (auto it = account_locks_.begin(); it != account_locks_.end();) {
      it = it->second.use_count() == 1 ? account_locks_.erase(it) : std::next(it);
    }
  }
  slot_cv_.notify_all();
  if (draining.empty()) {
    close_engine_if_idle();
    return 0;
  }

  // Each session drains on its own detached worker that owns the context and
  // the store, so one hung export cannot hold shutdown past the deadline.
  auto state = std::make_shared<DrainState>();
  const int64_t now = clock_.now_ms();
  for (auto& [id, entry] : draining) {
    try {
      std::thread(drain_session, checkpoints_, id, entry.context, now, state).detach();
    } catch (const std::system_error& e) {
      log(LogLevel::warn, "sessions",
          "no drain worker for " + account_tag(id) + " (" + e.what() + "), draining inline");
      drain_session(checkpoints_, id, entry.context, now, state);
    }
  }

  std::size_t persisted = 0;
  std::size_t abandoned = 0;
  {
    std::unique_lock<std::mutex> lk(state->mu);
    state->cv.wait_until(lk, deadline, [&] { return state->done == draining.size(); });
    persisted = state->persisted;
    abandoned = draining.size() - state->done;
  }
  if (abandoned > 0) {
    log(LogLevel::warn, "sessions",
        "shutdown timed out after " + std::to_string(timeout_ms) + " ms; abandoning " +
            std::to_string(abandoned) + " sessions still saving");
  }

  close_engine_if_idle();
  return persisted;
}

bool SessionPool::delete_session(AccountId account_id) {
  if (release_context(account_id)) {
    log(LogLevel::debug, "sessions", "released live session before delete for " + account_tag(account_id));
  }
  if (!checkpoints_->remove(account_id)) {
    log(LogLevel::warn, "sessions", "could not delete stored checkpoint for " + account_tag(account_id));
    return false;
  }
  return true;
}

bool SessionPool::has_checkpoint(AccountId account_id) const {
  return checkpoints_->contains(account_id);
}

std::size_t SessionPool::tracked_accounts() const {
  std::lock_guard<std::mutex> lk(mu_);
  return account_locks_.size();
}

std::size_t SessionPool::active_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.size();
}

std::vector<SessionInfo> SessionPool::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<SessionInfo> out;
  out.reserve(live_.size());
  for (const auto& [id, entry] : live_) {
    (void)id;
    out.push_back(entry.info);
  }
  return out;
}

}  // namespace pacer
