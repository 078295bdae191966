// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_APP_CONFIG_HPP
#define KERNELSHIM_APP_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace kernelshim {
namespace app {

// Settings file name inside the installed kernel directory
constexpr const char *CONFIG_NAME = "pyscript.conf";
constexpr const char *CONFIG_SECTION = "homeassistant";
constexpr const char *DEFAULT_KERNEL_NAME = "pyscript";

/**
 * Home Assistant connection settings from pyscript.conf
 *
 * Constructed once at startup and passed by reference to the components
 * that need it.
 */
struct HassSettings {
  std::string hass_host = "localhost";
  std::string hass_url = "http://localhost:8123";
  std::string hass_token;
  std::string hass_proxy; // empty = connect directly
  bool verify_ssl = true;

  // hass_url without trailing slashes
  std::string base_url() const;
};

/**
 * Load [homeassistant] from an INI settings file
 *
 * Values may reference other options as ${name}; "$$" is a literal '$'.
 * Surrounding quote characters are stripped after interpolation.
 */
bool LoadHassSettings(const std::filesystem::path &path, HassSettings &out,
                      std::string &error);
bool ParseHassSettings(std::istream &in, HassSettings &out, std::string &error);

// Strip every leading and trailing ' or " character
std::string UnquoteValue(const std::string &value);

// Strip one pair of matching quotes, or a b'...' wrapper (VSCode adds these)
std::string RemoveQuotes(const std::string &value);

/**
 * Jupyter connection parameters
 *
 * A JSON object with ip, transport, signature_scheme, key and the five
 * *_port fields; unknown fields pass through to the kernel start request.
 */
using ConnectionParams = nlohmann::json;

// Discrete CLI flags that can replace a connection file
struct ConnectionFlags {
  std::optional<std::string> ip;
  std::optional<int> stdin_port;
  std::optional<int> control_port;
  std::optional<int> hb_port;
  std::optional<int> shell_port;
  std::optional<int> iopub_port;
  std::optional<std::string> transport;
  std::optional<std::string> signature_scheme;
  std::optional<std::string> key;

  bool empty() const { return !ip && !stdin_port; }
};

bool LoadConnectionFile(const std::filesystem::path &path,
                        ConnectionParams &out, std::string &error);
bool ConnectionParamsFromFlags(const ConnectionFlags &flags,
                               ConnectionParams &out, std::string &error);
bool ValidateConnectionParams(const ConnectionParams &params,
                              std::string &error);

// Port field of validated params
uint16_t ConnectionPort(const ConnectionParams &params, const char *name);

} // namespace app
} // namespace kernelshim

#endif // KERNELSHIM_APP_CONFIG_HPP
