// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/task_tracker.hpp"
#include <algorithm>
#include <vector>

namespace kernelshim {
namespace app {

bool TaskTracker::add(network::TaskPtr task) {
  if (!task) {
    return false;
  }
  auto id = task->task_id();
  bool inserted = tasks_.emplace(id, std::move(task)).second;
  high_water_mark_ = std::max(high_water_mark_, tasks_.size());
  return inserted;
}

bool TaskTracker::remove(network::TaskId id) { return tasks_.erase(id) != 0; }

size_t TaskTracker::cancel_all() {
  std::vector<network::TaskPtr> live;
  live.reserve(tasks_.size());
  for (const auto &[id, task] : tasks_) {
    live.push_back(task);
  }
  for (auto &task : live) {
    task->cancel();
  }
  return live.size();
}

} // namespace app
} // namespace kernelshim
