// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_DISCOVERY_PORT_DISCOVERY_HPP
#define KERNELSHIM_DISCOVERY_PORT_DISCOVERY_HPP

#include "app/config.hpp"
#include "discovery/http_request.hpp"
#include "network/dialer.hpp"
#include "util/url.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace kernelshim {
namespace discovery {

/**
 * The five kernel ports published by the remote side, keyed by the
 * connection-file field names (hb_port, stdin_port, ...)
 */
struct RemotePorts {
  uint16_t hb_port = 0;
  uint16_t stdin_port = 0;
  uint16_t shell_port = 0;
  uint16_t iopub_port = 0;
  uint16_t control_port = 0;

  // 0 for an unknown name
  uint16_t get(const std::string &name) const;
  bool set(const std::string &name, uint16_t port);
};

struct DiscoveryResult {
  bool ok = false;
  RemotePorts ports;
  std::string error; // one diagnostic line when !ok
};

using DiscoveryHandler = std::function<void(const DiscoveryResult &)>;

// Fills n bytes with key material; false when no randomness is available
using KeySource = std::function<bool(unsigned char *data, size_t n)>;

// RAND_bytes
bool OpenSslKeySource(unsigned char *data, size_t n);

/**
 * "pyscript.jupyter_ports_" followed by 10 random hex digits
 * @return empty string if the key source fails
 */
std::string MakeStateVar(const KeySource &source = OpenSslKeySource);

/**
 * Kernel start request body: params without the five port fields, plus the
 * state variable the remote side should publish its ports under, and the
 * host it should listen on
 */
nlohmann::json BuildKernelStartRequest(const app::ConnectionParams &params,
                                       const std::string &state_var,
                                       const std::string &hass_host);

/**
 * Decode the `state` attribute of the published state variable
 *
 * Accepts a JSON-encoded string or an object. Every port must be present
 * and an integer in 0..65535.
 */
bool ParsePortState(const nlohmann::json &state, RemotePorts &out,
                    std::string &error);

/**
 * PortDiscoveryClient - asks Home Assistant to start a kernel and waits for
 * its ports
 *
 * 1. POST {hass_url}/api/services/pyscript/jupyter_kernel_start
 * 2. GET {hass_url}/api/states/{state_var} every DISCOVERY_POLL_INTERVAL
 *    until it answers 200 with a `state` field
 *
 * Polling is unbounded. Only a non-200 2xx answer, or a 200 JSON answer
 * without a `state` field, is retried. Anything else that is not the ports
 * ends discovery with a failed DiscoveryResult.
 */
class PortDiscoveryClient
    : public std::enable_shared_from_this<PortDiscoveryClient> {
public:
  PortDiscoveryClient(boost::asio::io_context &io_context,
                      const app::HassSettings &settings,
                      network::Dialer &dialer,
                      const KeySource &keys = OpenSslKeySource);

  /**
   * Start discovery; handler runs exactly once on the io_context thread,
   * unless cancel() is called first
   */
  void discover(const app::ConnectionParams &params, DiscoveryHandler handler);

  // Abandon discovery; the handler is not called
  void cancel();

  const std::string &state_var() const { return state_var_; }
  // Number of state GETs issued so far
  unsigned poll_count() const { return poll_count_; }

private:
  void post_kernel_start(std::string body);
  void on_kernel_start(HttpResponse response);
  void poll_state();
  void on_state(HttpResponse response);
  void schedule_poll();

  HttpRequestPtr make_request(const std::string &path,
                              boost::beast::http::verb method,
                              std::string body);
  bool check_status(const HttpResponse &response, const std::string &url);
  void finish(DiscoveryResult result);
  void fail(std::string error);

  boost::asio::io_context &io_context_;
  const app::HassSettings &settings_;
  network::Dialer &dialer_;
  boost::asio::ssl::context ssl_context_;
  boost::asio::steady_timer poll_timer_;

  util::Url base_url_;
  std::string state_var_;
  HttpRequestPtr current_;
  DiscoveryHandler handler_;
  unsigned poll_count_ = 0;
  bool done_ = false;
};

using PortDiscoveryClientPtr = std::shared_ptr<PortDiscoveryClient>;

} // namespace discovery
} // namespace kernelshim

#endif // KERNELSHIM_DISCOVERY_PORT_DISCOVERY_HPP
