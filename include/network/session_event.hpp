// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_NETWORK_SESSION_EVENT_HPP
#define KERNELSHIM_NETWORK_SESSION_EVENT_HPP

#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace kernelshim {
namespace network {

using TaskId = uint64_t;

enum class TaskKind {
  SESSION,          // one per accepted client connection
  CLIENT_TO_KERNEL, // c2k forwarder
  KERNEL_TO_CLIENT, // k2c forwarder
};

std::string TaskKindName(TaskKind kind);

// Issue the next process-wide task id (never 0)
TaskId NextTaskId();

/**
 * Task - a unit of concurrent work tracked by the session coordinator
 *
 * cancel() is cooperative and idempotent: the task stops at its next
 * suspension point and still reports TASK_END through its owner.
 */
class Task {
public:
  virtual ~Task() = default;

  virtual TaskId task_id() const = 0;
  virtual TaskKind kind() const = 0;
  virtual void cancel() = 0;
};

using TaskPtr = std::shared_ptr<Task>;

/**
 * SessionEvent - message carried on the coordinator's event channel
 */
struct SessionEvent {
  enum class Type { TASK_START, TASK_END, EXIT };

  Type type;
  TaskId task_id = 0;
  TaskPtr task;   // set for TASK_START only
  int status = 0; // set for EXIT only

  static SessionEvent TaskStart(TaskPtr task) {
    SessionEvent ev{Type::TASK_START};
    ev.task_id = task->task_id();
    ev.task = std::move(task);
    return ev;
  }

  static SessionEvent TaskEnd(TaskId id) {
    SessionEvent ev{Type::TASK_END};
    ev.task_id = id;
    return ev;
  }

  static SessionEvent Exit(int status) {
    SessionEvent ev{Type::EXIT};
    ev.status = status;
    return ev;
  }
};

/**
 * EventSink - producer side of the event channel
 */
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void post(SessionEvent event) = 0;
};

/**
 * EventChannel - unbounded FIFO channel backed by the io_context queue
 *
 * post() never blocks; the consumer runs later on the loop thread, in
 * posting order.
 */
class EventChannel : public EventSink {
public:
  using Consumer = std::function<void(const SessionEvent &)>;

  EventChannel(boost::asio::io_context &io_context, Consumer consumer)
      : io_context_(io_context), consumer_(std::move(consumer)) {}

  void post(SessionEvent event) override;

private:
  boost::asio::io_context &io_context_;
  Consumer consumer_;
};

} // namespace network
} // namespace kernelshim

#endif // KERNELSHIM_NETWORK_SESSION_EVENT_HPP
