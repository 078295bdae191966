// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/relay_port.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/ip/v6_only.hpp>

namespace kernelshim {
namespace network {

using tcp = boost::asio::ip::tcp;

namespace {

std::string EndpointString(const tcp::socket &socket) {
  boost::system::error_code ec;
  auto ep = socket.remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

void CloseSocket(tcp::socket &socket) {
  boost::system::error_code ec;
  if (socket.is_open()) {
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
  }
}

} // namespace

// ============================================================================
// RelaySession
// ============================================================================

RelaySession::RelaySession(const RelayPortConfig &config, Dialer &dialer,
                           EventSink &events, tcp::socket client)
    : id_(NextTaskId()), config_(config), dialer_(dialer), events_(events),
      client_socket_(std::move(client)),
      kernel_socket_(client_socket_.get_executor()),
      client_endpoint_(EndpointString(client_socket_)) {}

void RelaySession::start() {
  if (state_ != State::IDLE) {
    return;
  }
  state_ = State::DIALING;
  events_.post(SessionEvent::TaskStart(shared_from_this()));

  LOG_RELAY_DEBUG("{} connected to jupyter client {}; now trying pyscript "
                  "kernel at {}:{} ({})",
                  config_.name, client_endpoint_, config_.remote_host,
                  config_.remote_port, dialer_.describe());

  dial_ = dialer_.async_dial(
      config_.remote_host, config_.remote_port,
      [self = shared_from_this()](const boost::system::error_code &ec,
                                  tcp::socket kernel) {
        self->on_dialed(ec, std::move(kernel));
      });
}

void RelaySession::cancel() {
  if (cancelled_) {
    return;
  }
  cancelled_ = true;

  switch (state_) {
  case State::DIALING:
    if (dial_) {
      dial_->cancel();
    }
    break;
  case State::RELAYING:
    c2k_->cancel();
    k2c_->cancel();
    break;
  case State::IDLE:
  case State::CLOSED:
    break;
  }
}

void RelaySession::on_dialed(const boost::system::error_code &ec,
                             tcp::socket kernel) {
  dial_.reset();

  if (cancelled_ || ec == boost::asio::error::operation_aborted) {
    boost::system::error_code ignored;
    kernel.close(ignored);
    abandon();
    return;
  }

  if (ec) {
    LOG_RELAY_WARN("{} unable to connect to pyscript kernel at {}:{} ({}): {}",
                   config_.name, config_.remote_host, config_.remote_port,
                   dialer_.describe(), ec.message());
    abandon();
    return;
  }

  kernel_socket_ = std::move(kernel);
  LOG_RELAY_DEBUG("{} pyscript kernel connected at {}:{}", config_.name,
                  config_.remote_host, config_.remote_port);

  try {
    start_forwarders();
  } catch (const std::exception &e) {
    LOG_RELAY_WARN("{} exception starting relay for {}: {}", config_.name,
                   client_endpoint_, e.what());
    CloseSocket(kernel_socket_);
    abandon();
  }
}

void RelaySession::start_forwarders() {
  slot_ = std::make_shared<CompletionSlot>();

  auto on_done = [self = shared_from_this()](Forwarder &forwarder,
                                             Forwarder::Outcome outcome) {
    self->on_forwarder_done(forwarder, outcome);
  };

  c2k_ = std::make_shared<Forwarder>(config_.name, TaskKind::CLIENT_TO_KERNEL,
                                     client_socket_, kernel_socket_, slot_,
                                     protocol::COMPLETION_CLIENT_EOF, on_done);
  k2c_ = std::make_shared<Forwarder>(config_.name, TaskKind::KERNEL_TO_CLIENT,
                                     kernel_socket_, client_socket_, slot_,
                                     protocol::COMPLETION_KERNEL_EOF, on_done);

  state_ = State::RELAYING;
  events_.post(SessionEvent::TaskStart(c2k_));
  events_.post(SessionEvent::TaskStart(k2c_));

  c2k_->start();
  k2c_->start();
}

void RelaySession::on_forwarder_done(Forwarder &forwarder,
                                     Forwarder::Outcome outcome) {
  ++forwarders_done_;

  if (forwarders_done_ == 1) {
    auto code = slot_->value();
    LOG_RELAY_DEBUG("{} shutting down connections (first: {} {}, "
                    "exit_status={})",
                    config_.name, TaskKindName(forwarder.kind()),
                    outcome == Forwarder::Outcome::CANCELLED ? "cancelled"
                                                             : "completed",
                    code ? std::to_string(*code) : "none");
    c2k_->cancel();
    k2c_->cancel();
    return;
  }

  close_pair();
}

void RelaySession::close_pair() {
  if (state_ == State::CLOSED) {
    return;
  }
  state_ = State::CLOSED;

  CloseSocket(client_socket_);
  CloseSocket(kernel_socket_);

  events_.post(SessionEvent::TaskEnd(id_));
  events_.post(SessionEvent::TaskEnd(c2k_->task_id()));
  events_.post(SessionEvent::TaskEnd(k2c_->task_id()));

  auto code = slot_->value();
  if (code && *code != 0) {
    events_.post(SessionEvent::Exit(*code));
  }

  LOG_RELAY_DEBUG("{} connection from {} closed", config_.name,
                  client_endpoint_);
}

void RelaySession::abandon() {
  if (state_ == State::CLOSED) {
    return;
  }
  state_ = State::CLOSED;
  CloseSocket(client_socket_);
  events_.post(SessionEvent::TaskEnd(id_));
}

// ============================================================================
// RelayPort
// ============================================================================

RelayPort::RelayPort(boost::asio::io_context &io_context,
                     RelayPortConfig config, Dialer &dialer)
    : io_context_(io_context), config_(std::move(config)), dialer_(dialer) {}

RelayPort::~RelayPort() { stop(); }

bool RelayPort::start(EventSink &events) {
  if (!acceptors_.empty()) {
    LOG_RELAY_DEBUG("{} already listening", config_.name);
    return false;
  }

  events_ = &events;

  try {
    std::string host = config_.listen_host;
    if (host.empty() || host == "*") {
      host = "0.0.0.0";
    }

    tcp::resolver resolver(io_context_);
    auto results = resolver.resolve(host, std::to_string(config_.listen_port),
                                    tcp::resolver::passive);

    std::vector<tcp::endpoint> endpoints;
    for (const auto &entry : results) {
      if (std::find(endpoints.begin(), endpoints.end(), entry.endpoint()) ==
          endpoints.end()) {
        endpoints.push_back(entry.endpoint());
      }
    }

    for (auto endpoint : endpoints) {
      if (endpoint.port() == 0 && bound_port_ != 0) {
        endpoint.port(bound_port_);
      }

      boost::system::error_code ec;
      auto acceptor = listen_on(endpoint, ec);
      if (ec) {
        // Only the first address is mandatory
        if (acceptors_.empty()) {
          throw boost::system::system_error(ec);
        }
        LOG_RELAY_WARN("{} unable to listen on {}: {}", config_.name,
                       endpoint.address().to_string(), ec.message());
        continue;
      }
      bound_port_ = acceptor->local_endpoint().port();
      acceptors_.push_back(std::move(acceptor));

      LOG_RELAY_DEBUG("{} listening for jupyter client at {}:{}", config_.name,
                      endpoint.address().to_string(), bound_port_);
    }

    for (auto &acceptor : acceptors_) {
      start_accept(*acceptor);
    }
    return true;

  } catch (const std::exception &e) {
    LOG_RELAY_ERROR("{} failed to listen on {}:{}: {}", config_.name,
                    config_.listen_host, config_.listen_port, e.what());
    stop();
    bound_port_ = 0;
    return false;
  }
}

std::unique_ptr<tcp::acceptor>
RelayPort::listen_on(const tcp::endpoint &endpoint,
                     boost::system::error_code &ec) {
  auto acceptor = std::make_unique<tcp::acceptor>(io_context_);
  acceptor->open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec && endpoint.protocol() == tcp::v6()) {
    // Dual-stack sockets would collide with the IPv4 listener
    acceptor->set_option(boost::asio::ip::v6_only(true), ec);
  }
  if (!ec) {
    acceptor->bind(endpoint, ec);
  }
  if (!ec) {
    acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    boost::system::error_code ignored;
    acceptor->close(ignored);
  }
  return acceptor;
}

void RelayPort::stop() {
  if (acceptors_.empty()) {
    return;
  }
  for (auto &acceptor : acceptors_) {
    boost::system::error_code ec;
    acceptor->close(ec);
  }
  acceptors_.clear();
  LOG_RELAY_DEBUG("{} stopped listening", config_.name);
}

void RelayPort::start_accept(tcp::acceptor &acceptor) {
  acceptor.async_accept([this, &acceptor](const boost::system::error_code &ec,
                                          tcp::socket socket) {
    handle_accept(acceptor, ec, std::move(socket));
  });
}

void RelayPort::handle_accept(tcp::acceptor &acceptor,
                              const boost::system::error_code &ec,
                              tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_RELAY_WARN("{} accept error: {}", config_.name, ec.message());
      // Continue accepting despite error
      start_accept(acceptor);
    }
    return;
  }

  // Set useful TCP options on the accepted socket (best-effort)
  {
    boost::system::error_code opt_ec;
    socket.set_option(tcp::no_delay(true), opt_ec);
    socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);
  }

  ++sessions_accepted_;

  // A failing session must not take the listener down
  try {
    auto session = std::make_shared<RelaySession>(config_, dialer_, *events_,
                                                  std::move(socket));
    session->start();
  } catch (const std::exception &e) {
    LOG_RELAY_WARN("{} exception in accept handler: {}", config_.name,
                   e.what());
  }

  start_accept(acceptor);
}

} // namespace network
} // namespace kernelshim
