// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_APP_SESSION_COORDINATOR_HPP
#define KERNELSHIM_APP_SESSION_COORDINATOR_HPP

#include "app/config.hpp"
#include "app/task_tracker.hpp"
#include "discovery/port_discovery.hpp"
#include "network/dialer.hpp"
#include "network/relay_port.hpp"
#include "network/session_event.hpp"
#include <boost/asio/io_context.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kernelshim {
namespace app {

/**
 * SessionCoordinator - owns the relay ports and decides when the run ends
 *
 * INIT      port discovery in flight
 * RUNNING   five relay ports listening; task events tracked
 * DRAINING  listeners closed, live tasks cancelled, waiting for TASK_END
 * DONE      exit handler called with the final status
 *
 * A run ends when the task set empties after it once held at least
 * TaskTracker::TRAFFIC_THRESHOLD tasks (status 0), when a task reports
 * EXIT(status), or on request_exit().
 *
 * All methods run on the io_context thread. The coordinator is the only
 * consumer of its event channel and the only owner of the task set.
 */
class SessionCoordinator {
public:
  enum class State { INIT, RUNNING, DRAINING, DONE };

  using ExitHandler = std::function<void(int status)>;

  SessionCoordinator(boost::asio::io_context &io_context,
                     const HassSettings &settings,
                     const ConnectionParams &params, network::Dialer &dialer,
                     ExitHandler on_exit);
  ~SessionCoordinator();

  SessionCoordinator(const SessionCoordinator &) = delete;
  SessionCoordinator &operator=(const SessionCoordinator &) = delete;

  // Run port discovery, then start relaying
  void start();

  // Create and start the five relay ports against the discovered ports
  void start_relaying(const discovery::RemotePorts &remote);

  // Drain (or, during discovery, stop at once) with the given status
  void request_exit(int status);

  // Producer side of the event channel, handed to every relay port
  network::EventSink &events() { return channel_; }

  State state() const { return state_; }
  int exit_status() const { return exit_status_; }

  // Diagnostic for a fatal startup failure; empty otherwise
  const std::string &last_error() const { return last_error_; }

  const TaskTracker &tasks() const { return tracker_; }
  const network::RelayPort *port(const std::string &name) const;
  size_t port_count() const { return ports_.size(); }

private:
  void on_discovered(const discovery::DiscoveryResult &result);
  void handle_event(const network::SessionEvent &event);
  void begin_draining(int status);
  void stop_ports();
  void maybe_finish();
  void finish(int status);

  boost::asio::io_context &io_context_;
  const HassSettings &settings_;
  const ConnectionParams &params_;
  network::Dialer &dialer_;
  ExitHandler on_exit_;

  network::EventChannel channel_;
  TaskTracker tracker_;
  discovery::PortDiscoveryClientPtr discovery_;
  std::vector<std::unique_ptr<network::RelayPort>> ports_;

  State state_ = State::INIT;
  int exit_status_ = 0;
  std::string last_error_;
};

} // namespace app
} // namespace kernelshim

#endif // KERNELSHIM_APP_SESSION_COORDINATOR_HPP
