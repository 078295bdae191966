// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_NETWORK_FORWARDER_HPP
#define KERNELSHIM_NETWORK_FORWARDER_HPP

#include "network/completion_slot.hpp"
#include "network/session_event.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kernelshim {
namespace network {

/**
 * Forwarder - unidirectional byte pump between two connected sockets
 *
 * Reads at most RELAY_CHUNK_SIZE bytes from the source and writes all of them
 * to the sink before reading again, so a stalled sink stops the read side.
 *
 * Termination (exactly once, reported through the done callback):
 * - EOF on the source: offers the forwarder's eof code to the slot, COMPLETED
 * - any other I/O error: logs, offers COMPLETION_ERROR, COMPLETED
 * - cancel() or an aborted operation: CANCELLED, nothing offered
 *
 * The sockets are owned by the RelaySession. Cancelling aborts pending
 * operations on both sockets, so the other direction of the pair is
 * interrupted as well; the pair is always torn down as a whole.
 */
class Forwarder : public Task, public std::enable_shared_from_this<Forwarder> {
public:
  enum class Outcome { COMPLETED, CANCELLED };

  using DoneCallback = std::function<void(Forwarder &, Outcome)>;

  Forwarder(std::string port_name, TaskKind direction,
            boost::asio::ip::tcp::socket &source,
            boost::asio::ip::tcp::socket &sink,
            std::shared_ptr<CompletionSlot> slot, int eof_code,
            DoneCallback on_done);

  void start();

  // Task interface
  TaskId task_id() const override { return id_; }
  TaskKind kind() const override { return direction_; }
  void cancel() override;

  bool finished() const { return finished_; }
  uint64_t bytes_forwarded() const { return bytes_forwarded_; }

private:
  void do_read();
  void on_read(const boost::system::error_code &ec, size_t bytes);
  void on_write(const boost::system::error_code &ec, size_t bytes);
  void fail(const char *operation, const boost::system::error_code &ec);
  void finish(Outcome outcome);

  const TaskId id_;
  std::string port_name_;
  TaskKind direction_;
  std::string direction_name_;
  boost::asio::ip::tcp::socket &source_;
  boost::asio::ip::tcp::socket &sink_;
  std::shared_ptr<CompletionSlot> slot_;
  int eof_code_;
  DoneCallback on_done_;

  std::vector<uint8_t> buffer_;
  uint64_t bytes_forwarded_ = 0;
  bool started_ = false;
  bool cancelled_ = false;
  bool finished_ = false;
};

using ForwarderPtr = std::shared_ptr<Forwarder>;

} // namespace network
} // namespace kernelshim

#endif // KERNELSHIM_NETWORK_FORWARDER_HPP
