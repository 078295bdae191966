// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/session_coordinator.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"

namespace kernelshim {
namespace app {

using network::SessionEvent;

SessionCoordinator::SessionCoordinator(boost::asio::io_context &io_context,
                                       const HassSettings &settings,
                                       const ConnectionParams &params,
                                       network::Dialer &dialer,
                                       ExitHandler on_exit)
    : io_context_(io_context), settings_(settings), params_(params),
      dialer_(dialer), on_exit_(std::move(on_exit)),
      channel_(io_context,
               [this](const SessionEvent &event) { handle_event(event); }) {}

SessionCoordinator::~SessionCoordinator() {
  if (discovery_) {
    discovery_->cancel();
  }
  stop_ports();
}

void SessionCoordinator::start() {
  if (state_ != State::INIT || discovery_) {
    return;
  }

  discovery_ = std::make_shared<discovery::PortDiscoveryClient>(
      io_context_, settings_, dialer_);
  LOG_APP_DEBUG("starting port discovery with state variable {}",
                discovery_->state_var());
  discovery_->discover(params_,
                       [this](const discovery::DiscoveryResult &result) {
                         on_discovered(result);
                       });
}

void SessionCoordinator::on_discovered(
    const discovery::DiscoveryResult &result) {
  discovery_.reset();

  if (!result.ok) {
    last_error_ = result.error;
    finish(1);
    return;
  }
  start_relaying(result.ports);
}

void SessionCoordinator::start_relaying(const discovery::RemotePorts &remote) {
  if (state_ != State::INIT) {
    return;
  }
  state_ = State::RUNNING;

  std::string listen_host = params_.at("ip").get<std::string>();

  for (const char *name : protocol::ports::ALL) {
    network::RelayPortConfig config;
    config.name = name;
    config.listen_host = listen_host;
    config.listen_port = ConnectionPort(params_, name);
    config.remote_host = settings_.hass_host;
    config.remote_port = remote.get(name);

    auto port =
        std::make_unique<network::RelayPort>(io_context_, config, dialer_);
    if (!port->start(channel_)) {
      last_error_ = "unable to listen on " + listen_host + ":" +
                    std::to_string(config.listen_port) + " for " + name;
      begin_draining(1);
      return;
    }
    LOG_APP_DEBUG("{} relaying {}:{} -> {}:{}", name, listen_host,
                  port->local_port(), config.remote_host, config.remote_port);
    ports_.push_back(std::move(port));
  }

  LOG_APP_INFO("relaying {} kernel ports to {} ({})", ports_.size(),
               settings_.hass_host, dialer_.describe());
}

const network::RelayPort *
SessionCoordinator::port(const std::string &name) const {
  for (const auto &port : ports_) {
    if (port->config().name == name) {
      return port.get();
    }
  }
  return nullptr;
}

void SessionCoordinator::request_exit(int status) {
  switch (state_) {
  case State::INIT:
    if (discovery_) {
      discovery_->cancel();
      discovery_.reset();
    }
    finish(status);
    break;
  case State::RUNNING:
    begin_draining(status);
    break;
  case State::DRAINING:
  case State::DONE:
    break;
  }
}

void SessionCoordinator::handle_event(const SessionEvent &event) {
  switch (event.type) {
  case SessionEvent::Type::TASK_START:
    if (state_ == State::DONE) {
      // Late starter from a connection accepted before the listeners closed
      event.task->cancel();
      return;
    }
    tracker_.add(event.task);
    LOG_APP_DEBUG("task {} ({}) started; {} live, high water {}",
                  event.task_id, network::TaskKindName(event.task->kind()),
                  tracker_.size(), tracker_.high_water_mark());
    if (state_ == State::DRAINING) {
      event.task->cancel();
    }
    break;

  case SessionEvent::Type::TASK_END:
    tracker_.remove(event.task_id);
    LOG_APP_DEBUG("task {} ended; {} live", event.task_id, tracker_.size());
    if (state_ == State::RUNNING && tracker_.drained_after_traffic()) {
      LOG_APP_INFO("all connections closed after {} concurrent tasks; "
                   "shutting down",
                   tracker_.high_water_mark());
      begin_draining(0);
      return;
    }
    maybe_finish();
    break;

  case SessionEvent::Type::EXIT:
    LOG_APP_DEBUG("exit requested with status {}", event.status);
    if (state_ == State::RUNNING) {
      begin_draining(event.status);
    }
    break;
  }
}

void SessionCoordinator::begin_draining(int status) {
  if (state_ == State::DRAINING || state_ == State::DONE) {
    return;
  }
  state_ = State::DRAINING;
  exit_status_ = status;

  stop_ports();
  size_t cancelled = tracker_.cancel_all();
  LOG_APP_DEBUG("draining with exit_status={}; cancelled {} tasks", status,
                cancelled);
  maybe_finish();
}

void SessionCoordinator::stop_ports() {
  for (auto &port : ports_) {
    port->stop();
  }
}

void SessionCoordinator::maybe_finish() {
  if (state_ == State::DRAINING && tracker_.empty()) {
    finish(exit_status_);
  }
}

void SessionCoordinator::finish(int status) {
  if (state_ == State::DONE) {
    return;
  }
  state_ = State::DONE;
  exit_status_ = status;
  LOG_APP_DEBUG("session finished with exit_status={}", status);

  auto on_exit = std::move(on_exit_);
  if (on_exit) {
    on_exit(status);
  }
}

} // namespace app
} // namespace kernelshim
