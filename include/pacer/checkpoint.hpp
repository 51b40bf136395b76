#pragma once

// pacer/checkpoint.hpp — Content-addressed store for session login state.
//
// A session checkpoint is the opaque storage state (cookies, local storage)
// an automation context exports. Restoring it lets an account resume without
// a fresh login.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. Object key = BLAKE3("ckpt:" + original_bytes). Content-addressed.
//   2. Writes are atomic: tmp+rename on the same filesystem.
//   3. Reads verify integrity: the stored blob hash and the content digest are
//      both checked before returning data.
//   4. Fail-closed: a corrupt or truncated checkpoint reads as nullopt, so the
//      session pool falls back to a fresh login rather than loading garbage.
//   5. Deduplication: identical state bytes share one object.
//
// LAYOUT (CHECKPOINT_FORMAT_VERSION 1):
//   <root>/objects/AB/CD/<digest>        zstd frame of the state bytes
//   <root>/objects/AB/CD/<digest>.meta   JSON sidecar
//   <root>/heads/<account_id>.head       digest of the account's latest state
//
// EXTENSION_POINT: remote_checkpoint_backend
//   Implement ICheckpointStore over an object store; the key scheme and the
//   head-pointer indirection must stay as they are.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "pacer/types.hpp"

namespace pacer {

struct CheckpointInfo {
  AccountId account_id{0};
  std::string digest;
  std::string encoding{"zstd"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  int64_t created_at_unix_ms{0};
};

class ICheckpointStore {
 public:
  virtual ~ICheckpointStore() = default;

  // Persist state as the account's latest checkpoint. Returns the content
  // digest, or "" on failure.
  virtual std::string put(AccountId account_id, const std::string& state) = 0;

  // Latest verified state for the account; nullopt if absent or corrupt.
  virtual std::optional<std::string> get(AccountId account_id) const = 0;

  virtual bool contains(AccountId account_id) const = 0;

  // Drops the account's head pointer. Objects still referenced by another
  // head are kept. Returns true if removed or not present.
  virtual bool remove(AccountId account_id) = 0;

  virtual std::vector<CheckpointInfo> list() const = 0;

  virtual std::string backend_id() const = 0;
};

class FileCheckpointStore : public ICheckpointStore {
 public:
  explicit FileCheckpointStore(std::string root = ".pacer/sessions");

  std::string put(AccountId account_id, const std::string& state) override;
  std::optional<std::string> get(AccountId account_id) const override;
  bool contains(AccountId account_id) const override;
  bool remove(AccountId account_id) override;
  std::vector<CheckpointInfo> list() const override;
  std::string backend_id() const override { return "local_fs"; }

  std::optional<CheckpointInfo> info(const std::string& digest) const;
  std::optional<std::string> head(AccountId account_id) const;

  const std::string& root() const { return root_; }

 private:
  std::string object_path(const std::string& digest) const;
  std::string meta_path(const std::string& digest) const;
  std::string head_path(AccountId account_id) const;
  std::optional<std::string> read_object(const std::string& digest) const;
  // Deletes the object unless some head still names it. Caller holds mu_.
  bool drop_if_unreferenced(const std::string& digest);

  std::string root_;
  mutable std::mutex mu_;  // serializes head updates and object GC
};

}  // namespace pacer
