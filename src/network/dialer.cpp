// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/dialer.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/url.hpp"
#include <array>
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <vector>

namespace kernelshim {
namespace network {

using tcp = boost::asio::ip::tcp;

// ============================================================================
// DirectDialOperation
// ============================================================================

namespace {

class DirectDialOperation
    : public DialOperation,
      public std::enable_shared_from_this<DirectDialOperation> {
public:
  DirectDialOperation(boost::asio::io_context &io_context, DialHandler handler)
      : resolver_(io_context), socket_(io_context),
        handler_(std::move(handler)) {}

  void start(const std::string &host, uint16_t port) {
    host_ = host;
    port_ = port;
    resolver_.async_resolve(
        host, std::to_string(port),
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    tcp::resolver::results_type results) {
          self->on_resolve(ec, std::move(results));
        });
  }

  void cancel() override {
    if (cancelled_ || !handler_) {
      return;
    }
    cancelled_ = true;
    resolver_.cancel();
    // Closing (not just cancelling) stops the range connect from moving on
    // to the next endpoint
    boost::system::error_code ec;
    socket_.close(ec);
  }

private:
  void on_resolve(const boost::system::error_code &ec,
                  tcp::resolver::results_type results) {
    if (cancelled_) {
      finish(boost::asio::error::operation_aborted);
      return;
    }
    if (ec) {
      LOG_NET_DEBUG("failed to resolve {}: {}", host_, ec.message());
      finish(ec);
      return;
    }

    boost::asio::async_connect(
        socket_, results,
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    const tcp::endpoint &) {
          self->on_connect(ec);
        });
  }

  void on_connect(const boost::system::error_code &ec) {
    if (cancelled_) {
      finish(boost::asio::error::operation_aborted);
      return;
    }
    if (ec) {
      LOG_NET_DEBUG("failed to connect to {}:{}: {}", host_, port_,
                    ec.message());
      finish(ec);
      return;
    }

    // Set useful TCP options (best-effort)
    boost::system::error_code opt_ec;
    socket_.set_option(tcp::no_delay(true), opt_ec);
    socket_.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

    LOG_NET_DEBUG("connected to {}:{}", host_, port_);
    finish(boost::system::error_code{});
  }

  void finish(const boost::system::error_code &ec) {
    if (!handler_) {
      return;
    }
    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (ec) {
      boost::system::error_code ignored;
      socket_.close(ignored);
      handler(ec, tcp::socket(socket_.get_executor()));
    } else {
      handler(ec, std::move(socket_));
    }
  }

  tcp::resolver resolver_;
  tcp::socket socket_;
  DialHandler handler_;
  std::string host_;
  uint16_t port_ = 0;
  bool cancelled_ = false;
};

// ============================================================================
// Socks5DialOperation
// ============================================================================

namespace wire {
constexpr uint8_t VERSION = 0x05;
constexpr uint8_t AUTH_VERSION = 0x01;
constexpr uint8_t METHOD_NO_AUTH = 0x00;
constexpr uint8_t METHOD_USER_PASS = 0x02;
constexpr uint8_t METHOD_NONE_ACCEPTABLE = 0xFF;
constexpr uint8_t CMD_CONNECT = 0x01;
constexpr uint8_t ATYP_IPV4 = 0x01;
constexpr uint8_t ATYP_DOMAIN = 0x03;
constexpr uint8_t ATYP_IPV6 = 0x04;
} // namespace wire

class Socks5DialOperation
    : public DialOperation,
      public std::enable_shared_from_this<Socks5DialOperation> {
public:
  Socks5DialOperation(boost::asio::io_context &io_context,
                      const ProxyEndpoint &proxy, Dialer &direct,
                      DialHandler handler)
      : proxy_(proxy), direct_(direct), resolver_(io_context),
        socket_(io_context), handler_(std::move(handler)) {}

  void start(const std::string &host, uint16_t port) {
    target_host_ = host;
    target_port_ = port;

    boost::system::error_code addr_ec;
    auto literal = boost::asio::ip::make_address(host, addr_ec);
    if (!addr_ec) {
      target_address_ = literal;
      has_target_address_ = true;
      connect_proxy();
      return;
    }

    if (proxy_.remote_dns) {
      if (host.size() > 255) {
        fail(socks5::errc::hostname_too_long);
        return;
      }
      connect_proxy();
      return;
    }

    // socks5:// resolves the target locally and sends the address
    resolver_.async_resolve(
        host, std::to_string(port),
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    tcp::resolver::results_type results) {
          if (self->cancelled_) {
            self->finish(boost::asio::error::operation_aborted);
            return;
          }
          if (ec || results.empty()) {
            self->finish(ec ? ec
                           : make_error_code(boost::asio::error::host_not_found));
            return;
          }
          self->target_address_ = results.begin()->endpoint().address();
          self->has_target_address_ = true;
          self->connect_proxy();
        });
  }

  void cancel() override {
    if (cancelled_ || !handler_) {
      return;
    }
    cancelled_ = true;
    resolver_.cancel();
    if (proxy_dial_) {
      proxy_dial_->cancel();
    }
    boost::system::error_code ec;
    socket_.close(ec);
  }

private:
  void connect_proxy() {
    proxy_dial_ = direct_.async_dial(
        proxy_.host, proxy_.port,
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    tcp::socket socket) {
          self->proxy_dial_.reset();
          if (self->cancelled_) {
            boost::system::error_code ignored;
            socket.close(ignored);
            self->finish(boost::asio::error::operation_aborted);
            return;
          }
          if (ec) {
            self->finish(ec);
            return;
          }
          self->socket_ = std::move(socket);
          self->send_greeting();
        });
  }

  void send_greeting() {
    buffer_ = {wire::VERSION, 1, wire::METHOD_NO_AUTH};
    if (proxy_.has_credentials()) {
      buffer_ = {wire::VERSION, 2, wire::METHOD_NO_AUTH, wire::METHOD_USER_PASS};
    }
    write_then_read(2, &Socks5DialOperation::on_method_selected);
  }

  void on_method_selected() {
    if (buffer_[0] != wire::VERSION) {
      fail(socks5::errc::bad_version);
      return;
    }
    switch (buffer_[1]) {
    case wire::METHOD_NO_AUTH:
      send_connect();
      return;
    case wire::METHOD_USER_PASS:
      if (!proxy_.has_credentials()) {
        fail(socks5::errc::no_acceptable_methods);
        return;
      }
      send_credentials();
      return;
    case wire::METHOD_NONE_ACCEPTABLE:
    default:
      fail(socks5::errc::no_acceptable_methods);
      return;
    }
  }

  // RFC 1929 username/password sub-negotiation
  void send_credentials() {
    const std::string &user = proxy_.username;
    const std::string &pass = proxy_.password;
    if (user.size() > 255 || pass.size() > 255) {
      fail(socks5::errc::authentication_failed);
      return;
    }
    buffer_.clear();
    buffer_.push_back(wire::AUTH_VERSION);
    buffer_.push_back(static_cast<uint8_t>(user.size()));
    buffer_.insert(buffer_.end(), user.begin(), user.end());
    buffer_.push_back(static_cast<uint8_t>(pass.size()));
    buffer_.insert(buffer_.end(), pass.begin(), pass.end());
    write_then_read(2, &Socks5DialOperation::on_authenticated);
  }

  void on_authenticated() {
    if (buffer_[1] != 0x00) {
      fail(socks5::errc::authentication_failed);
      return;
    }
    send_connect();
  }

  void send_connect() {
    buffer_ = {wire::VERSION, wire::CMD_CONNECT, 0x00};
    if (has_target_address_ && target_address_.is_v4()) {
      buffer_.push_back(wire::ATYP_IPV4);
      auto bytes = target_address_.to_v4().to_bytes();
      buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    } else if (has_target_address_) {
      buffer_.push_back(wire::ATYP_IPV6);
      auto bytes = target_address_.to_v6().to_bytes();
      buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    } else {
      buffer_.push_back(wire::ATYP_DOMAIN);
      buffer_.push_back(static_cast<uint8_t>(target_host_.size()));
      buffer_.insert(buffer_.end(), target_host_.begin(), target_host_.end());
    }
    buffer_.push_back(static_cast<uint8_t>(target_port_ >> 8));
    buffer_.push_back(static_cast<uint8_t>(target_port_ & 0xFF));

    // VER REP RSV ATYP
    write_then_read(4, &Socks5DialOperation::on_connect_reply);
  }

  void on_connect_reply() {
    if (buffer_[0] != wire::VERSION) {
      fail(socks5::errc::bad_version);
      return;
    }
    if (buffer_[1] != 0x00) {
      fail(static_cast<socks5::errc>(buffer_[1]));
      return;
    }

    switch (buffer_[3]) {
    case wire::ATYP_IPV4:
      read_bound_address(4 + 2);
      return;
    case wire::ATYP_IPV6:
      read_bound_address(16 + 2);
      return;
    case wire::ATYP_DOMAIN:
      read_exact(1, [](Socks5DialOperation &self) {
        self.read_bound_address(static_cast<size_t>(self.buffer_[0]) + 2);
      });
      return;
    default:
      fail(socks5::errc::malformed_reply);
      return;
    }
  }

  void read_bound_address(size_t length) {
    read_exact(length, [](Socks5DialOperation &self) {
      LOG_NET_DEBUG("socks5 proxy {} connected to {}:{}",
                    self.proxy_.to_string(), self.target_host_,
                    self.target_port_);
      self.finish(boost::system::error_code{});
    });
  }

  void write_then_read(size_t reply_size, void (Socks5DialOperation::*next)()) {
    boost::asio::async_write(
        socket_, boost::asio::buffer(buffer_),
        [self = shared_from_this(), reply_size,
         next](const boost::system::error_code &ec, size_t) {
          if (self->cancelled_) {
            self->finish(boost::asio::error::operation_aborted);
            return;
          }
          if (ec) {
            self->finish(ec);
            return;
          }
          self->read_exact(reply_size, [next](Socks5DialOperation &op) {
            (op.*next)();
          });
        });
  }

  void read_exact(size_t size,
                  std::function<void(Socks5DialOperation &)> next) {
    buffer_.assign(size, 0);
    boost::asio::async_read(
        socket_, boost::asio::buffer(buffer_),
        [self = shared_from_this(),
         next = std::move(next)](const boost::system::error_code &ec, size_t) {
          if (self->cancelled_) {
            self->finish(boost::asio::error::operation_aborted);
            return;
          }
          if (ec) {
            self->finish(ec == boost::asio::error::eof
                             ? make_error_code(socks5::errc::malformed_reply)
                             : ec);
            return;
          }
          next(*self);
        });
  }

  void finish(const boost::system::error_code &ec) {
    if (!handler_) {
      return;
    }
    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (ec) {
      LOG_NET_DEBUG("socks5 dial of {}:{} via {} failed: {}", target_host_,
                    target_port_, proxy_.to_string(), ec.message());
      boost::system::error_code ignored;
      socket_.close(ignored);
      handler(ec, tcp::socket(socket_.get_executor()));
    } else {
      handler(ec, std::move(socket_));
    }
  }

  void fail(socks5::errc e) { finish(make_error_code(e)); }

  ProxyEndpoint proxy_;
  Dialer &direct_;
  tcp::resolver resolver_;
  tcp::socket socket_;
  DialHandler handler_;
  DialOperationPtr proxy_dial_;
  std::vector<uint8_t> buffer_;

  std::string target_host_;
  uint16_t target_port_ = 0;
  boost::asio::ip::address target_address_;
  bool has_target_address_ = false;
  bool cancelled_ = false;
};

} // namespace

// ============================================================================
// Dialers
// ============================================================================

DialOperationPtr DirectDialer::async_dial(const std::string &host,
                                          uint16_t port, DialHandler handler) {
  auto op = std::make_shared<DirectDialOperation>(io_context_,
                                                  std::move(handler));
  op->start(host, port);
  return op;
}

DialOperationPtr Socks5Dialer::async_dial(const std::string &host,
                                          uint16_t port, DialHandler handler) {
  auto op = std::make_shared<Socks5DialOperation>(io_context_, proxy_, direct_,
                                                  std::move(handler));
  op->start(host, port);
  return op;
}

std::string ProxyEndpoint::to_string() const {
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  return scheme + "://" + h + ":" + std::to_string(port);
}

bool ProxyEndpoint::Parse(const std::string &url, ProxyEndpoint &out,
                          std::string &error) {
  util::Url parsed;
  if (!util::ParseUrl(url, parsed, error)) {
    return false;
  }
  if (parsed.scheme != "socks5" && parsed.scheme != "socks5h") {
    error = "unsupported proxy scheme '" + parsed.scheme +
            "' (expected socks5:// or socks5h://)";
    return false;
  }

  out = ProxyEndpoint{};
  out.scheme = parsed.scheme;
  out.host = parsed.host;
  out.port = parsed.port != 0 ? parsed.port : protocol::DEFAULT_SOCKS_PORT;
  out.username = parsed.username;
  out.password = parsed.password;
  out.remote_dns = parsed.scheme == "socks5h";
  return true;
}

std::shared_ptr<Dialer> MakeDialer(boost::asio::io_context &io_context,
                                   const std::string &proxy_url,
                                   std::string &error) {
  if (proxy_url.empty()) {
    return std::make_shared<DirectDialer>(io_context);
  }

  ProxyEndpoint proxy;
  if (!ProxyEndpoint::Parse(proxy_url, proxy, error)) {
    return nullptr;
  }
  return std::make_shared<Socks5Dialer>(io_context, std::move(proxy));
}

// ============================================================================
// socks5 error category
// ============================================================================

namespace socks5 {

namespace {

class Socks5Category : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "socks5"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::general_failure:
      return "general SOCKS server failure";
    case errc::connection_not_allowed:
      return "connection not allowed by ruleset";
    case errc::network_unreachable:
      return "network unreachable";
    case errc::host_unreachable:
      return "host unreachable";
    case errc::connection_refused:
      return "connection refused";
    case errc::ttl_expired:
      return "TTL expired";
    case errc::command_not_supported:
      return "command not supported";
    case errc::address_type_not_supported:
      return "address type not supported";
    case errc::bad_version:
      return "proxy is not a SOCKS5 server";
    case errc::no_acceptable_methods:
      return "no acceptable authentication method";
    case errc::authentication_failed:
      return "proxy authentication failed";
    case errc::hostname_too_long:
      return "target hostname too long";
    case errc::malformed_reply:
      return "malformed proxy reply";
    }
    return "unknown SOCKS5 error " + std::to_string(ev);
  }
};

} // namespace

const boost::system::error_category &category() {
  static Socks5Category instance;
  return instance;
}

boost::system::error_code make_error_code(errc e) {
  return {static_cast<int>(e), category()};
}

} // namespace socks5

} // namespace network
} // namespace kernelshim
