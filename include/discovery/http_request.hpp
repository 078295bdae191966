// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_DISCOVERY_HTTP_REQUEST_HPP
#define KERNELSHIM_DISCOVERY_HTTP_REQUEST_HPP

#include "network/dialer.hpp"
#include "util/url.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace kernelshim {
namespace discovery {

struct HttpResponse {
  bool ok = false;    // a response was received (any status)
  std::string error;  // set when ok is false
  unsigned status = 0;
  std::string reason;
  std::string body;
};

using HttpHandler = std::function<void(HttpResponse)>;

/**
 * HttpRequest - one HTTP/1.1 exchange on a fresh connection
 *
 * The connection is opened through the injected Dialer, so a configured
 * proxy applies. https URLs get TLS with SNI; the peer certificate is
 * verified against the URL host when verify_peer is set. The whole exchange,
 * dial included, is bounded by one deadline.
 */
class HttpRequest : public std::enable_shared_from_this<HttpRequest> {
public:
  HttpRequest(boost::asio::io_context &io_context, network::Dialer &dialer,
              boost::asio::ssl::context &ssl_context, bool verify_peer,
              util::Url url, boost::beast::http::verb method,
              std::string bearer_token, std::string body,
              std::chrono::milliseconds timeout);

  // Handler runs exactly once
  void start(HttpHandler handler);
  void cancel();

  // URL as shown in diagnostics
  const std::string &url_string() const { return url_string_; }

private:
  void build_request(boost::beast::http::verb method,
                     const std::string &bearer_token, std::string body);
  void on_dialed(const boost::system::error_code &ec,
                 boost::asio::ip::tcp::socket socket);
  void on_handshake(const boost::system::error_code &ec);
  void on_write(const boost::system::error_code &ec, std::size_t bytes);
  void on_read(const boost::system::error_code &ec, std::size_t bytes);
  void on_timeout(const boost::system::error_code &ec);

  template <typename Stream> void write_request(Stream &stream);

  void close_streams();
  void fail(std::string message);
  void complete(HttpResponse response);

  network::Dialer &dialer_;
  boost::asio::ssl::context &ssl_context_;
  bool verify_peer_;
  util::Url url_;
  std::string url_string_;
  std::chrono::milliseconds timeout_;

  network::DialOperationPtr dial_;
  std::unique_ptr<boost::beast::tcp_stream> plain_;
  std::unique_ptr<boost::beast::ssl_stream<boost::beast::tcp_stream>> tls_;
  boost::asio::steady_timer deadline_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> request_;
  boost::beast::http::response<boost::beast::http::string_body> response_;

  HttpHandler handler_;
  bool completed_ = false;
};

using HttpRequestPtr = std::shared_ptr<HttpRequest>;

} // namespace discovery
} // namespace kernelshim

#endif // KERNELSHIM_DISCOVERY_HTTP_REQUEST_HPP
