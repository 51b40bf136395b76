#pragma once

// pacer/session_pool.hpp — Bounded pool of stateful automation sessions.
//
// At most max_concurrent live sessions share one lazily launched automation
// engine. A session carries an account's login state; that state is written
// to the checkpoint store on release and restored on the next acquire.
//
// DESIGN INVARIANTS:
//   1. CAPACITY: live + in-flight creations never exceed max_concurrent.
//   2. ONE PER ACCOUNT: concurrent acquisitions for one account serialize on
//      that account's mutex and share a single session.
//   3. LRU: at capacity, the least recently used session that has been handed
//      back with return_context() and whose account is not mid-acquire is
//      persisted, closed and removed before a new one is made. Sessions still
//      leased become candidates only after lease_wait_ms.
//   4. NO SLOW WORK UNDER mu_: engine launch, context creation, persistence
//      and close all run with the pool mutex released.
//   5. FAILURES: creation and save_session() failures throw SessionError;
//      persistence and close failures during release or eviction are logged
//      and counted, never thrown.
//   6. BOUNDED SHUTDOWN: shutdown_all() returns by its deadline. Sessions
//      still saving then are left to their drain workers, which hold their
//      own references and never touch the pool.
//   7. LOCK TABLE: a per-account mutex lives only while the account has a
//      live session or a caller holds it.
//
// EXTENSION_POINT: session_health_check
//   A "still logged in" check belongs to the engine adapter; the pool only
//   exposes has_checkpoint() and delete_session() for forcing a fresh login.

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "pacer/checkpoint.hpp"
#include "pacer/clock.hpp"
#include "pacer/config.hpp"
#include "pacer/types.hpp"

namespace pacer {

struct ProxyConfig {
  std::string server;
  std::string username;
  std::string password;
};

struct ContextOptions {
  std::optional<std::string> storage_state;
  std::optional<ProxyConfig> proxy;
};

class ISessionContext {
 public:
  virtual ~ISessionContext() = default;
  // Exports cookies/local storage. May throw.
  virtual std::string storage_state() = 0;
  virtual void close() = 0;
};

class IAutomationEngine {
 public:
  virtual ~IAutomationEngine() = default;
  virtual bool is_connected() const = 0;
  virtual void launch() = 0;
  virtual std::shared_ptr<ISessionContext> new_context(const ContextOptions& options) = 0;
  virtual void close() = 0;
};

class SessionError : public std::runtime_error {
 public:
  SessionError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

struct SessionInfo {
  AccountId account_id{0};
  int64_t created_at_ms{0};
  int64_t last_used_ms{0};
  bool restored{false};  // created from a stored checkpoint
  uint32_t leases{0};    // acquires not yet matched by return_context()
};

class SessionPool {
 public:
  SessionPool(std::shared_ptr<IAutomationEngine> engine, std::shared_ptr<ICheckpointStore> checkpoints,
              const SessionPoolConfig& config, const Clock& clock);
  ~SessionPool();

  SessionPool(const SessionPool&) = delete;
  SessionPool& operator=(const SessionPool&) = delete;

  // Each call takes a lease on the account's session; hand it back with
  // return_context() once the caller is done with it.
  std::shared_ptr<ISessionContext> acquire_context(AccountId account_id,
                                                   const std::optional<ProxyConfig>& proxy = std::nullopt);

  // Drops one lease and marks the session used now; it stays live. Returns
  // false if the account had no session.
  bool return_context(AccountId account_id);

  // Persist, close and remove. Returns false if the account had no session.
  bool release_context(AccountId account_id);

  // Persist without closing. Returns false if the account had no session;
  // throws SessionError when the checkpoint cannot be written.
  bool save_session(AccountId account_id);

  // Releases sessions idle longer than idle_timeout_ms and tears down the
  // engine when the pool is left empty. Returns the number released.
  std::size_t reclaim_idle();

  // Persists and closes every live session in parallel, waiting at most
  // timeout_ms. Returns the number persisted by then; the rest finish in the
  // background.
  std::size_t shutdown_all(int64_t timeout_ms);

  // Release and drop the stored checkpoint so the next acquire starts fresh.
  bool delete_session(AccountId account_id);

  bool has_checkpoint(AccountId account_id) const;
  std::size_t active_count() const;
  std::size_t tracked_accounts() const;  // size of the per-account lock table
  std::vector<SessionInfo> snapshot() const;

 private:
  struct Entry {
    std::shared_ptr<ISessionContext> context;
    SessionInfo info;
  };

  std::shared_ptr<std::mutex> account_mutex(AccountId account_id);
  std::shared_ptr<ISessionContext> create_session(AccountId account_id,
                                                  const std::optional<ProxyConfig>& proxy,
                                                  bool* restored);
  std::shared_ptr<ISessionContext> lease_context(AccountId account_id,
                                                 const std::optional<ProxyConfig>& proxy);
  void reserve_slot(AccountId account_id);
  bool reclaim_one(AccountId account_id, int64_t scanned_at_ms);
  // Caller holds mu_.
  void prune_account_lock(AccountId account_id);
  bool persist(AccountId account_id, ISessionContext& context);
  void write_checkpoint(AccountId account_id, ISessionContext& context);
  void close_quietly(AccountId account_id, ISessionContext& context);
  void close_engine_if_idle();

  std::shared_ptr<IAutomationEngine> engine_;
  std::shared_ptr<ICheckpointStore> checkpoints_;
  SessionPoolConfig config_;
  const Clock& clock_;

  mutable std::mutex mu_;
  std::condition_variable slot_cv_;
  std::map<AccountId, Entry> live_;
  std::map<AccountId, std::shared_ptr<std::mutex>> account_locks_;
  std::size_t pending_{0};

  std::mutex engine_mu_;
};

}  // namespace pacer
