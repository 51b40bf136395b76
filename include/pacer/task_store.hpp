#pragma once

// pacer/task_store.hpp — Storage seam for engagement tasks.
//
// Tasks are produced by external discovery logic and consumed by the
// scheduler. Ids are assigned by the store on insert and are never reused.

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "pacer/types.hpp"

namespace pacer {

using TaskMutator   = std::function<void(EngagementTask&)>;
using TaskPredicate = std::function<bool(const EngagementTask&)>;

class ITaskStore {
 public:
  virtual ~ITaskStore() = default;

  // Assigns and returns a fresh id; task.id is ignored.
  virtual TaskId insert(EngagementTask task) = 0;
  virtual std::optional<EngagementTask> get(TaskId id) const = 0;
  virtual bool update(TaskId id, const TaskMutator& fn) = 0;

  // Pending tasks of (project, account) that have not expired at now_ms,
  // newest created first (ties: higher id first), at most limit.
  virtual std::vector<EngagementTask> pending_for(ProjectId project_id, AccountId account_id,
                                                  std::size_t limit, int64_t now_ms) const = 0;
  virtual std::size_t count_pending(ProjectId project_id, AccountId account_id) const = 0;

  virtual std::vector<TaskId> find(const TaskPredicate& pred) const = 0;
  virtual std::size_t remove_if(const TaskPredicate& pred) = 0;
};

class MemoryTaskStore : public ITaskStore {
 public:
  TaskId insert(EngagementTask task) override;
  std::optional<EngagementTask> get(TaskId id) const override;
  bool update(TaskId id, const TaskMutator& fn) override;
  std::vector<EngagementTask> pending_for(ProjectId project_id, AccountId account_id,
                                          std::size_t limit, int64_t now_ms) const override;
  std::size_t count_pending(ProjectId project_id, AccountId account_id) const override;
  std::vector<TaskId> find(const TaskPredicate& pred) const override;
  std::size_t remove_if(const TaskPredicate& pred) override;

 private:
  mutable std::mutex mu_;
  std::map<TaskId, EngagementTask> tasks_;
  TaskId next_id_{1};
};

}  // namespace pacer
