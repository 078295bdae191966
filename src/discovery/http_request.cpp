// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "discovery/http_request.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <boost/asio/ssl/host_name_verification.hpp>
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace kernelshim {
namespace discovery {

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

HttpRequest::HttpRequest(boost::asio::io_context &io_context,
                         network::Dialer &dialer, ssl::context &ssl_context,
                         bool verify_peer, util::Url url, http::verb method,
                         std::string bearer_token, std::string body,
                         std::chrono::milliseconds timeout)
    : dialer_(dialer), ssl_context_(ssl_context), verify_peer_(verify_peer),
      url_(std::move(url)), timeout_(timeout), deadline_(io_context) {
  url_string_ = url_.scheme + "://" + url_.host_header() + url_.path;
  build_request(method, bearer_token, std::move(body));
}

void HttpRequest::build_request(http::verb method,
                                const std::string &bearer_token,
                                std::string body) {
  request_.version(11);
  request_.method(method);
  request_.target(url_.path.empty() ? "/" : url_.path);
  request_.set(http::field::host, url_.host_header());
  request_.set(http::field::user_agent, GetUserAgent());
  request_.set(http::field::accept, "application/json");
  request_.set(http::field::connection, "close");
  if (!bearer_token.empty()) {
    request_.set(http::field::authorization, "Bearer " + bearer_token);
  }
  if (method == http::verb::post) {
    request_.set(http::field::content_type, "application/json");
    request_.body() = std::move(body);
  }
  request_.prepare_payload();
}

template <typename Stream> void HttpRequest::write_request(Stream &stream) {
  http::async_write(
      stream, request_,
      beast::bind_front_handler(&HttpRequest::on_write, shared_from_this()));
}

void HttpRequest::start(HttpHandler handler) {
  handler_ = std::move(handler);
  auto self = shared_from_this();

  deadline_.expires_after(timeout_);
  deadline_.async_wait(beast::bind_front_handler(&HttpRequest::on_timeout, self));

  LOG_DISC_DEBUG("{} {} ({})", std::string(request_.method_string()),
                 url_string_, dialer_.describe());

  dial_ = dialer_.async_dial(
      url_.host, url_.effective_port(),
      [self](const boost::system::error_code &ec, tcp::socket socket) {
        self->on_dialed(ec, std::move(socket));
      });
}

void HttpRequest::cancel() {
  if (completed_) {
    return;
  }
  fail("request cancelled (url=" + url_string_ + ")");
  close_streams();
}

void HttpRequest::on_dialed(const boost::system::error_code &ec,
                            tcp::socket socket) {
  dial_.reset();
  if (completed_) {
    boost::system::error_code ignored;
    socket.close(ignored);
    return;
  }

  if (ec) {
    fail(fmt::format("unable to connect to host {}:{} ({}): {}", url_.host,
                     url_.effective_port(), dialer_.describe(), ec.message()));
    return;
  }

  if (url_.scheme != "https") {
    plain_ = std::make_unique<beast::tcp_stream>(std::move(socket));
    write_request(*plain_);
    return;
  }

  tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(
      beast::tcp_stream(std::move(socket)), ssl_context_);

  // SNI; most TLS front ends refuse the handshake without it
  if (!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
    boost::system::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                        boost::asio::error::get_ssl_category()};
    fail(fmt::format("got SSL error {} (url={})", sni_error.message(),
                     url_string_));
    close_streams();
    return;
  }

  if (verify_peer_) {
    tls_->set_verify_mode(ssl::verify_peer);
    tls_->set_verify_callback(ssl::host_name_verification(url_.host));
  } else {
    tls_->set_verify_mode(ssl::verify_none);
  }

  tls_->async_handshake(
      ssl::stream_base::client,
      beast::bind_front_handler(&HttpRequest::on_handshake, shared_from_this()));
}

void HttpRequest::on_handshake(const boost::system::error_code &ec) {
  if (completed_) {
    return;
  }
  if (ec) {
    fail(fmt::format("got SSL error {} (url={})", ec.message(), url_string_));
    close_streams();
    return;
  }
  write_request(*tls_);
}

void HttpRequest::on_write(const boost::system::error_code &ec, std::size_t) {
  if (completed_) {
    return;
  }
  if (ec) {
    fail(fmt::format("unable to send request to {}: {}", url_string_,
                     ec.message()));
    close_streams();
    return;
  }

  auto on_read =
      beast::bind_front_handler(&HttpRequest::on_read, shared_from_this());
  if (tls_) {
    http::async_read(*tls_, buffer_, response_, std::move(on_read));
  } else {
    http::async_read(*plain_, buffer_, response_, std::move(on_read));
  }
}

void HttpRequest::on_read(const boost::system::error_code &ec, std::size_t) {
  if (completed_) {
    return;
  }
  if (ec) {
    fail(fmt::format("unable to read response from {}: {}", url_string_,
                     ec.message()));
    close_streams();
    return;
  }

  HttpResponse response;
  response.ok = true;
  response.status = response_.result_int();
  response.reason = std::string(response_.reason());
  response.body = std::move(response_.body());
  LOG_DISC_TRACE("{} -> {} {}", url_string_, response.status, response.body);

  close_streams();
  complete(std::move(response));
}

void HttpRequest::on_timeout(const boost::system::error_code &ec) {
  if (ec == boost::asio::error::operation_aborted || completed_) {
    return;
  }
  fail(fmt::format("request timed out after {}s (url={})",
                   std::chrono::duration_cast<std::chrono::seconds>(timeout_)
                       .count(),
                   url_string_));
  close_streams();
}

void HttpRequest::close_streams() {
  boost::system::error_code ignored;
  if (dial_) {
    dial_->cancel();
  }
  if (plain_) {
    plain_->socket().shutdown(tcp::socket::shutdown_both, ignored);
    plain_->socket().close(ignored);
  }
  if (tls_) {
    beast::get_lowest_layer(*tls_).socket().close(ignored);
  }
}

void HttpRequest::fail(std::string message) {
  HttpResponse response;
  response.error = std::move(message);
  complete(std::move(response));
}

void HttpRequest::complete(HttpResponse response) {
  if (completed_) {
    return;
  }
  completed_ = true;
  deadline_.cancel();
  auto handler = std::move(handler_);
  if (handler) {
    handler(std::move(response));
  }
}

} // namespace discovery
} // namespace kernelshim
