// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_PROTOCOL_HPP
#define KERNELSHIM_PROTOCOL_HPP

#include "version.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace kernelshim {
namespace protocol {

// The five Jupyter kernel channels, in the order relays are created
namespace ports {
constexpr const char *HEARTBEAT = "hb_port";
constexpr const char *STDIN = "stdin_port";
constexpr const char *SHELL = "shell_port";
constexpr const char *IOPUB = "iopub_port";
constexpr const char *CONTROL = "control_port";

constexpr std::array<const char *, 5> ALL = {HEARTBEAT, STDIN, SHELL, IOPUB,
                                             CONTROL};
} // namespace ports

// Home Assistant REST endpoints used for port discovery
namespace hass {
// Service domain owning jupyter_kernel_start
constexpr const char *SERVICE_DOMAIN = "pyscript";
constexpr const char *KERNEL_START_SERVICE = "jupyter_kernel_start";
constexpr const char *SERVICES_PATH = "/api/services/";
constexpr const char *STATES_PATH = "/api/states/";

// State variable the kernel publishes its ports under; a random hex
// discovery key is appended
constexpr const char *STATE_VAR_PREFIX = "pyscript.jupyter_ports_";
constexpr size_t DISCOVERY_KEY_BYTES = 5;
} // namespace hass

// Delay between state polls
constexpr std::chrono::milliseconds DISCOVERY_POLL_INTERVAL{500};

// Deadline for one discovery HTTP exchange (connect + request + response)
constexpr std::chrono::seconds DISCOVERY_REQUEST_TIMEOUT{30};

// Largest single read a forwarder performs
constexpr size_t RELAY_CHUNK_SIZE = 8192;

// Completion codes posted by forwarders
constexpr int COMPLETION_CLIENT_EOF = 0; // client closed c2k
constexpr int COMPLETION_KERNEL_EOF = 1; // kernel closed k2c
constexpr int COMPLETION_ERROR = 1;

// Default SOCKS proxy port when the proxy URL omits one
constexpr uint16_t DEFAULT_SOCKS_PORT = 1080;

} // namespace protocol
} // namespace kernelshim

#endif // KERNELSHIM_PROTOCOL_HPP
