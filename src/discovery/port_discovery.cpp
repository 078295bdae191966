// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "discovery/port_discovery.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <array>
#include <fmt/format.h>
#include <openssl/rand.h>

namespace kernelshim {
namespace discovery {

namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;

// ============================================================================
// RemotePorts and request helpers
// ============================================================================

uint16_t RemotePorts::get(const std::string &name) const {
  if (name == protocol::ports::HEARTBEAT)
    return hb_port;
  if (name == protocol::ports::STDIN)
    return stdin_port;
  if (name == protocol::ports::SHELL)
    return shell_port;
  if (name == protocol::ports::IOPUB)
    return iopub_port;
  if (name == protocol::ports::CONTROL)
    return control_port;
  return 0;
}

bool RemotePorts::set(const std::string &name, uint16_t port) {
  if (name == protocol::ports::HEARTBEAT) {
    hb_port = port;
  } else if (name == protocol::ports::STDIN) {
    stdin_port = port;
  } else if (name == protocol::ports::SHELL) {
    shell_port = port;
  } else if (name == protocol::ports::IOPUB) {
    iopub_port = port;
  } else if (name == protocol::ports::CONTROL) {
    control_port = port;
  } else {
    return false;
  }
  return true;
}

bool OpenSslKeySource(unsigned char *data, size_t n) {
  return RAND_bytes(data, static_cast<int>(n)) == 1;
}

std::string MakeStateVar(const KeySource &source) {
  std::array<unsigned char, protocol::hass::DISCOVERY_KEY_BYTES> key{};
  if (!source(key.data(), key.size())) {
    LOG_DISC_ERROR("unable to generate state variable key");
    return std::string();
  }

  std::string name = protocol::hass::STATE_VAR_PREFIX;
  for (auto byte : key) {
    name += fmt::format("{:02x}", byte);
  }
  return name;
}

nlohmann::json BuildKernelStartRequest(const app::ConnectionParams &params,
                                       const std::string &state_var,
                                       const std::string &hass_host) {
  nlohmann::json body = params;
  for (const char *port : protocol::ports::ALL) {
    body.erase(port);
  }
  body["state_var"] = state_var;
  body["ip"] = hass_host;
  return body;
}

bool ParsePortState(const nlohmann::json &state, RemotePorts &out,
                    std::string &error) {
  nlohmann::json ports;
  if (state.is_string()) {
    try {
      ports = nlohmann::json::parse(state.get<std::string>());
    } catch (const nlohmann::json::parse_error &e) {
      error = std::string("state is not valid JSON: ") + e.what();
      return false;
    }
  } else {
    ports = state;
  }

  if (!ports.is_object()) {
    error = "state is not a JSON object";
    return false;
  }

  RemotePorts parsed;
  for (const char *name : protocol::ports::ALL) {
    auto it = ports.find(name);
    if (it == ports.end() || !it->is_number_integer()) {
      error = std::string("state has no integer ") + name;
      return false;
    }
    auto value = it->get<int64_t>();
    if (value < 0 || value > 65535) {
      error = fmt::format("state {} out of range: {}", name, value);
      return false;
    }
    parsed.set(name, static_cast<uint16_t>(value));
  }

  out = parsed;
  return true;
}

// ============================================================================
// PortDiscoveryClient
// ============================================================================

PortDiscoveryClient::PortDiscoveryClient(boost::asio::io_context &io_context,
                                         const app::HassSettings &settings,
                                         network::Dialer &dialer,
                                         const KeySource &keys)
    : io_context_(io_context), settings_(settings), dialer_(dialer),
      ssl_context_(ssl::context::tls_client), poll_timer_(io_context),
      state_var_(MakeStateVar(keys)) {
  ssl_context_.set_default_verify_paths();
}

void PortDiscoveryClient::discover(const app::ConnectionParams &params,
                                   DiscoveryHandler handler) {
  handler_ = std::move(handler);

  if (state_var_.empty()) {
    fail("unable to generate state variable key");
    return;
  }

  std::string error;
  if (!util::ParseUrl(settings_.base_url(), base_url_, error)) {
    fail("invalid hass_url " + settings_.hass_url + ": " + error);
    return;
  }
  if (base_url_.scheme != "http" && base_url_.scheme != "https") {
    fail("invalid hass_url " + settings_.hass_url +
         ": scheme must be http or https");
    return;
  }

  auto body = BuildKernelStartRequest(params, state_var_, settings_.hass_host);
  post_kernel_start(body.dump());
}

void PortDiscoveryClient::cancel() {
  if (done_) {
    return;
  }
  done_ = true;
  handler_ = nullptr;
  poll_timer_.cancel();
  if (current_) {
    current_->cancel();
    current_.reset();
  }
}

HttpRequestPtr PortDiscoveryClient::make_request(const std::string &path,
                                                 http::verb method,
                                                 std::string body) {
  util::Url url = base_url_;
  url.path += path;
  return std::make_shared<HttpRequest>(
      io_context_, dialer_, ssl_context_, settings_.verify_ssl, std::move(url),
      method, settings_.hass_token, std::move(body),
      protocol::DISCOVERY_REQUEST_TIMEOUT);
}

bool PortDiscoveryClient::check_status(const HttpResponse &response,
                                       const std::string &url) {
  if (!response.ok) {
    fail(response.error);
    return false;
  }
  if (response.status < 200 || response.status >= 300) {
    fail(fmt::format("request failed with {}: {} (url={})", response.status,
                     response.reason, url));
    return false;
  }
  return true;
}

void PortDiscoveryClient::post_kernel_start(std::string body) {
  std::string path = std::string(protocol::hass::SERVICES_PATH) +
                     protocol::hass::SERVICE_DOMAIN + "/" +
                     protocol::hass::KERNEL_START_SERVICE;
  current_ = make_request(path, http::verb::post, std::move(body));
  LOG_DISC_DEBUG("about to do service call post {}", current_->url_string());

  current_->start([self = shared_from_this()](HttpResponse response) {
    self->on_kernel_start(std::move(response));
  });
}

void PortDiscoveryClient::on_kernel_start(HttpResponse response) {
  if (done_) {
    return;
  }
  std::string url = current_->url_string();
  current_.reset();

  if (!check_status(response, url)) {
    return;
  }
  LOG_DISC_INFO("service call post {} returned {}", url, response.status);
  poll_state();
}

void PortDiscoveryClient::poll_state() {
  if (done_) {
    return;
  }
  ++poll_count_;
  current_ = make_request(protocol::hass::STATES_PATH + state_var_,
                          http::verb::get, std::string());
  LOG_DISC_DEBUG("about to do state get {}", current_->url_string());

  current_->start([self = shared_from_this()](HttpResponse response) {
    self->on_state(std::move(response));
  });
}

void PortDiscoveryClient::on_state(HttpResponse response) {
  if (done_) {
    return;
  }
  std::string url = current_->url_string();
  current_.reset();

  if (!check_status(response, url)) {
    return;
  }

  if (response.status != 200) {
    LOG_DISC_DEBUG("state get {} got status {}; retrying", url,
                   response.status);
    schedule_poll();
    return;
  }

  nlohmann::json body =
      nlohmann::json::parse(response.body, nullptr, /*allow_exceptions=*/false);
  if (body.is_discarded()) {
    fail(fmt::format("got error invalid JSON body (url={})", url));
    return;
  }
  if (!body.is_object() || !body.contains("state")) {
    LOG_DISC_DEBUG("state get {} got body {}; retrying", url, response.body);
    schedule_poll();
    return;
  }

  DiscoveryResult result;
  std::string error;
  if (!ParsePortState(body["state"], result.ports, error)) {
    fail(fmt::format("malformed state {} ({}) (url={})", body["state"].dump(),
                     error, url));
    return;
  }

  LOG_DISC_INFO("state variable get {} returned hb_port={} stdin_port={} "
                "shell_port={} iopub_port={} control_port={}",
                url, result.ports.hb_port, result.ports.stdin_port,
                result.ports.shell_port, result.ports.iopub_port,
                result.ports.control_port);
  result.ok = true;
  finish(std::move(result));
}

void PortDiscoveryClient::schedule_poll() {
  poll_timer_.expires_after(protocol::DISCOVERY_POLL_INTERVAL);
  poll_timer_.async_wait(
      [self = shared_from_this()](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        self->poll_state();
      });
}

void PortDiscoveryClient::fail(std::string error) {
  LOG_DISC_ERROR("{}", error);
  DiscoveryResult result;
  result.error = std::move(error);
  finish(std::move(result));
}

void PortDiscoveryClient::finish(DiscoveryResult result) {
  if (done_) {
    return;
  }
  done_ = true;
  auto handler = std::move(handler_);
  if (handler) {
    handler(result);
  }
}

} // namespace discovery
} // namespace kernelshim
