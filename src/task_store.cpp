#include "pacer/task_store.hpp"

#include <algorithm>

namespace pacer {

TaskId MemoryTaskStore::insert(EngagementTask task) {
  std::lock_guard<std::mutex> lk(mu_);
  task.id = next_id_++;
  const TaskId id = task.id;
  tasks_.emplace(id, std::move(task));
  return id;
}

std::optional<EngagementTask> MemoryTaskStore::get(TaskId id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) return std::nullopt;
  return it->second;
}

bool MemoryTaskStore::update(TaskId id, const TaskMutator& fn) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) return false;
  fn(it->second);
  return true;
}

std::vector<EngagementTask> MemoryTaskStore::pending_for(ProjectId project_id, AccountId account_id,
                                                         std::size_t limit, int64_t now_ms) const {
  std::vector<EngagementTask> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, t] : tasks_) {
      (void)id;
      if (t.project_id != project_id || t.account_id != account_id) continue;
      if (!t.is_active()) continue;
      if (t.expires_at_ms != 0 && t.expires_at_ms <= now_ms) continue;
      out.push_back(t);
    }
  }
  std::sort(out.begin(), out.end(), [](const EngagementTask& a, const EngagementTask& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::size_t MemoryTaskStore::count_pending(ProjectId project_id, AccountId account_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(), [&](const auto& kv) {
    const EngagementTask& t = kv.second;
    return t.project_id == project_id && t.account_id == account_id && t.is_active();
  }));
}

std::vector<TaskId> MemoryTaskStore::find(const TaskPredicate& pred) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<TaskId> out;
  for (const auto& [id, t] : tasks_) {
    if (pred(t)) out.push_back(id);
  }
  return out;
}

std::size_t MemoryTaskStore::remove_if(const TaskPredicate& pred) {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t removed = 0;
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    if (pred(it->second)) {
      it = tasks_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

}  // namespace pacer
