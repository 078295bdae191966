// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/session_event.hpp"
#include <atomic>
#include <boost/asio/post.hpp>

namespace kernelshim {
namespace network {

namespace {
std::atomic<TaskId> s_next_task_id{1};
}

TaskId NextTaskId() { return s_next_task_id++; }

std::string TaskKindName(TaskKind kind) {
  switch (kind) {
  case TaskKind::SESSION:
    return "session";
  case TaskKind::CLIENT_TO_KERNEL:
    return "c2k";
  case TaskKind::KERNEL_TO_CLIENT:
    return "k2c";
  }
  return "unknown";
}

void EventChannel::post(SessionEvent event) {
  boost::asio::post(io_context_,
                    [consumer = consumer_, event = std::move(event)]() {
                      consumer(event);
                    });
}

} // namespace network
} // namespace kernelshim
