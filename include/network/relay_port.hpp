// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_NETWORK_RELAY_PORT_HPP
#define KERNELSHIM_NETWORK_RELAY_PORT_HPP

#include "network/completion_slot.hpp"
#include "network/dialer.hpp"
#include "network/forwarder.hpp"
#include "network/session_event.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kernelshim {
namespace network {

struct RelayPortConfig {
  std::string name;        // kernel channel, e.g. "shell_port"
  std::string listen_host; // where the Jupyter client connects
  uint16_t listen_port = 0;
  std::string remote_host; // where the kernel listens
  uint16_t remote_port = 0;
};

/**
 * RelaySession - one accepted client connection and its kernel connection
 *
 * Lifecycle, all reported on the event sink:
 *   TASK_START(session)
 *   dial kernel --fail--> close client, TASK_END(session)
 *        |
 *   TASK_START(c2k), TASK_START(k2c)
 *   first forwarder done -> cancel the other, wait for it
 *   both done -> close both sockets,
 *                TASK_END(session), TASK_END(c2k), TASK_END(k2c),
 *                EXIT(code) if the first completion code was non-zero
 */
class RelaySession : public Task,
                     public std::enable_shared_from_this<RelaySession> {
public:
  RelaySession(const RelayPortConfig &config, Dialer &dialer,
               EventSink &events, boost::asio::ip::tcp::socket client);

  void start();

  // Task interface
  TaskId task_id() const override { return id_; }
  TaskKind kind() const override { return TaskKind::SESSION; }
  void cancel() override;

  bool closed() const { return state_ == State::CLOSED; }

private:
  enum class State { IDLE, DIALING, RELAYING, CLOSED };

  void on_dialed(const boost::system::error_code &ec,
                 boost::asio::ip::tcp::socket kernel);
  void start_forwarders();
  void on_forwarder_done(Forwarder &forwarder, Forwarder::Outcome outcome);
  void close_pair();
  void abandon();

  const TaskId id_;
  RelayPortConfig config_;
  Dialer &dialer_;
  EventSink &events_;

  boost::asio::ip::tcp::socket client_socket_;
  boost::asio::ip::tcp::socket kernel_socket_;
  std::string client_endpoint_;

  DialOperationPtr dial_;
  std::shared_ptr<CompletionSlot> slot_;
  ForwarderPtr c2k_;
  ForwarderPtr k2c_;
  int forwarders_done_ = 0;

  State state_ = State::IDLE;
  bool cancelled_ = false;
};

using RelaySessionPtr = std::shared_ptr<RelaySession>;

/**
 * RelayPort - one local listener bridged to one remote kernel port
 *
 * Every accepted connection becomes an independent RelaySession. stop()
 * only closes the listener; sessions already accepted drain on their own.
 */
class RelayPort {
public:
  RelayPort(boost::asio::io_context &io_context, RelayPortConfig config,
            Dialer &dialer);
  ~RelayPort();

  RelayPort(const RelayPort &) = delete;
  RelayPort &operator=(const RelayPort &) = delete;

  /**
   * Bind every address listen_host resolves to, listen and start accepting
   *
   * With listen_port 0 the first bind picks the port and the remaining
   * addresses reuse it.
   * @return false if any listener could not be created (already logged)
   */
  bool start(EventSink &events);

  // Close the listener. Safe to call repeatedly.
  void stop();

  bool is_listening() const { return !acceptors_.empty(); }
  size_t listener_count() const { return acceptors_.size(); }

  // Bound port; differs from config().listen_port when that was 0
  uint16_t local_port() const { return bound_port_; }

  const RelayPortConfig &config() const { return config_; }
  uint64_t sessions_accepted() const { return sessions_accepted_; }

private:
  std::unique_ptr<boost::asio::ip::tcp::acceptor>
  listen_on(const boost::asio::ip::tcp::endpoint &endpoint,
            boost::system::error_code &ec);
  void start_accept(boost::asio::ip::tcp::acceptor &acceptor);
  void handle_accept(boost::asio::ip::tcp::acceptor &acceptor,
                     const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  boost::asio::io_context &io_context_;
  RelayPortConfig config_;
  Dialer &dialer_;
  EventSink *events_ = nullptr;

  std::vector<std::unique_ptr<boost::asio::ip::tcp::acceptor>> acceptors_;
  uint16_t bound_port_ = 0;
  uint64_t sessions_accepted_ = 0;
};

} // namespace network
} // namespace kernelshim

#endif // KERNELSHIM_NETWORK_RELAY_PORT_HPP
