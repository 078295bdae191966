// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_NETWORK_DIALER_HPP
#define KERNELSHIM_NETWORK_DIALER_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

namespace kernelshim {
namespace network {

/**
 * Dialer - abstract capability for opening outbound TCP connections
 *
 * Selected once at startup and injected into the port discovery client and
 * every relay port:
 * - DirectDialer: plain resolve + connect
 * - Socks5Dialer: connect through one SOCKS5 proxy
 */

using DialHandler = std::function<void(const boost::system::error_code &ec,
                                       boost::asio::ip::tcp::socket socket)>;

/**
 * DialOperation - one in-flight dial attempt
 *
 * cancel() aborts the attempt; the handler then completes exactly once with
 * boost::asio::error::operation_aborted. Cancelling a finished attempt is a
 * no-op.
 */
class DialOperation {
public:
  virtual ~DialOperation() = default;
  virtual void cancel() = 0;
};

using DialOperationPtr = std::shared_ptr<DialOperation>;

class Dialer {
public:
  virtual ~Dialer() = default;

  /**
   * Start connecting to host:port
   *
   * The handler runs on the io_context thread; on success it receives the
   * connected socket.
   */
  virtual DialOperationPtr async_dial(const std::string &host, uint16_t port,
                                      DialHandler handler) = 0;

  // Human-readable route for log lines ("direct", "socks5://proxy:1080")
  virtual std::string describe() const = 0;
};

class DirectDialer : public Dialer {
public:
  explicit DirectDialer(boost::asio::io_context &io_context)
      : io_context_(io_context) {}

  DialOperationPtr async_dial(const std::string &host, uint16_t port,
                              DialHandler handler) override;
  std::string describe() const override { return "direct"; }

private:
  boost::asio::io_context &io_context_;
};

/**
 * ProxyEndpoint - parsed SOCKS proxy URL
 *
 * socks5://[user[:password]@]host[:port]   target names resolved locally
 * socks5h://[user[:password]@]host[:port]  target names resolved by the proxy
 */
struct ProxyEndpoint {
  std::string scheme;
  std::string host;
  uint16_t port = 0;
  std::string username;
  std::string password;
  bool remote_dns = false;

  bool has_credentials() const { return !username.empty(); }
  std::string to_string() const;

  static bool Parse(const std::string &url, ProxyEndpoint &out,
                    std::string &error);
};

class Socks5Dialer : public Dialer {
public:
  Socks5Dialer(boost::asio::io_context &io_context, ProxyEndpoint proxy)
      : io_context_(io_context), proxy_(std::move(proxy)),
        direct_(io_context) {}

  DialOperationPtr async_dial(const std::string &host, uint16_t port,
                              DialHandler handler) override;
  std::string describe() const override { return proxy_.to_string(); }

  const ProxyEndpoint &proxy() const { return proxy_; }

private:
  boost::asio::io_context &io_context_;
  ProxyEndpoint proxy_;
  DirectDialer direct_;
};

/**
 * Build the dialer for a proxy URL; an empty URL selects DirectDialer
 * Returns nullptr and sets error for an unusable proxy URL.
 */
std::shared_ptr<Dialer> MakeDialer(boost::asio::io_context &io_context,
                                   const std::string &proxy_url,
                                   std::string &error);

// SOCKS5 failures reported through the dial handler
namespace socks5 {

enum class errc {
  // RFC 1928 reply codes
  general_failure = 1,
  connection_not_allowed = 2,
  network_unreachable = 3,
  host_unreachable = 4,
  connection_refused = 5,
  ttl_expired = 6,
  command_not_supported = 7,
  address_type_not_supported = 8,
  // Handshake failures
  bad_version = 100,
  no_acceptable_methods,
  authentication_failed,
  hostname_too_long,
  malformed_reply,
};

const boost::system::error_category &category();
boost::system::error_code make_error_code(errc e);

} // namespace socks5

} // namespace network
} // namespace kernelshim

namespace boost {
namespace system {
template <>
struct is_error_code_enum<kernelshim::network::socks5::errc> : std::true_type {};
} // namespace system
} // namespace boost

#endif // KERNELSHIM_NETWORK_DIALER_HPP
