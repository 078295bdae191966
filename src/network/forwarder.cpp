// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/forwarder.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/fmt/bin_to_hex.h>

namespace kernelshim {
namespace network {

Forwarder::Forwarder(std::string port_name, TaskKind direction,
                     boost::asio::ip::tcp::socket &source,
                     boost::asio::ip::tcp::socket &sink,
                     std::shared_ptr<CompletionSlot> slot, int eof_code,
                     DoneCallback on_done)
    : id_(NextTaskId()), port_name_(std::move(port_name)),
      direction_(direction), direction_name_(TaskKindName(direction)),
      source_(source), sink_(sink), slot_(std::move(slot)),
      eof_code_(eof_code), on_done_(std::move(on_done)),
      buffer_(protocol::RELAY_CHUNK_SIZE) {}

void Forwarder::start() {
  if (started_) {
    return;
  }
  started_ = true;

  if (cancelled_) {
    boost::asio::post(source_.get_executor(), [self = shared_from_this()]() {
      self->finish(Outcome::CANCELLED);
    });
    return;
  }
  do_read();
}

void Forwarder::cancel() {
  if (cancelled_ || finished_) {
    return;
  }
  cancelled_ = true;

  if (!started_) {
    return;
  }

  boost::system::error_code ec;
  source_.cancel(ec);
  sink_.cancel(ec);
}

void Forwarder::do_read() {
  source_.async_read_some(
      boost::asio::buffer(buffer_),
      [self = shared_from_this()](const boost::system::error_code &ec,
                                  size_t bytes) { self->on_read(ec, bytes); });
}

void Forwarder::on_read(const boost::system::error_code &ec, size_t bytes) {
  if (cancelled_ || ec == boost::asio::error::operation_aborted) {
    finish(Outcome::CANCELLED);
    return;
  }

  if (ec == boost::asio::error::eof || (!ec && bytes == 0)) {
    LOG_RELAY_INFO("{} {}: read EOF; shutdown with exit_status={}", port_name_,
                   direction_name_, eof_code_);
    slot_->offer(eof_code_);
    finish(Outcome::COMPLETED);
    return;
  }

  if (ec) {
    fail("read", ec);
    return;
  }

  auto logger = util::LogManager::GetLogger("relay");
  if (logger->should_log(spdlog::level::trace)) {
    logger->trace("{} {}: {} bytes ## {}", port_name_, direction_name_, bytes,
                  spdlog::to_hex(buffer_.begin(), buffer_.begin() + bytes));
  }

  boost::asio::async_write(
      sink_, boost::asio::buffer(buffer_.data(), bytes),
      [self = shared_from_this()](const boost::system::error_code &ec,
                                  size_t written) {
        self->on_write(ec, written);
      });
}

void Forwarder::on_write(const boost::system::error_code &ec, size_t bytes) {
  if (cancelled_ || ec == boost::asio::error::operation_aborted) {
    finish(Outcome::CANCELLED);
    return;
  }

  if (ec) {
    fail("write", ec);
    return;
  }

  bytes_forwarded_ += bytes;
  do_read();
}

void Forwarder::fail(const char *operation, const boost::system::error_code &ec) {
  LOG_RELAY_WARN("{} {} got {} error: {}", port_name_, direction_name_,
                 operation, ec.message());
  slot_->offer(protocol::COMPLETION_ERROR);
  finish(Outcome::COMPLETED);
}

void Forwarder::finish(Outcome outcome) {
  if (finished_) {
    return;
  }
  finished_ = true;

  LOG_RELAY_DEBUG("{} {} finished ({}, {} bytes forwarded)", port_name_,
                  direction_name_,
                  outcome == Outcome::CANCELLED ? "cancelled" : "completed",
                  bytes_forwarded_);

  // Release the callback before invoking it; it may hold the owning session
  auto on_done = std::move(on_done_);
  on_done_ = nullptr;
  if (on_done) {
    on_done(*this, outcome);
  }
}

} // namespace network
} // namespace kernelshim
