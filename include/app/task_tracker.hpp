// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_APP_TASK_TRACKER_HPP
#define KERNELSHIM_APP_TASK_TRACKER_HPP

#include "network/session_event.hpp"
#include <cstddef>
#include <map>

namespace kernelshim {
namespace app {

/**
 * TaskTracker - the coordinator's live task set
 *
 * Keyed by TaskId. Remembers the largest size the set ever reached; a run
 * counts as having carried real traffic once that high-water mark reaches
 * TRAFFIC_THRESHOLD. Each relayed connection contributes three tasks
 * (session, c2k, k2c), so the threshold is met by the fourth concurrent
 * connection, or by three plus any in-flight dial.
 */
class TaskTracker {
public:
  static constexpr size_t TRAFFIC_THRESHOLD = 10;

  // Returns false if a task with the same id is already tracked
  bool add(network::TaskPtr task);

  // Returns false for unknown ids
  bool remove(network::TaskId id);

  bool contains(network::TaskId id) const { return tasks_.count(id) != 0; }
  size_t size() const { return tasks_.size(); }
  bool empty() const { return tasks_.empty(); }
  size_t high_water_mark() const { return high_water_mark_; }

  // Empty now, and busy enough at some point to count as real traffic
  bool drained_after_traffic() const {
    return tasks_.empty() && high_water_mark_ >= TRAFFIC_THRESHOLD;
  }

  // Request cancellation of every live task; they stay tracked until their
  // TASK_END arrives. Returns the number of tasks signalled.
  size_t cancel_all();

private:
  std::map<network::TaskId, network::TaskPtr> tasks_;
  size_t high_water_mark_ = 0;
};

} // namespace app
} // namespace kernelshim

#endif // KERNELSHIM_APP_TASK_TRACKER_HPP
