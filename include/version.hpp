// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_VERSION_HPP
#define KERNELSHIM_VERSION_HPP

#include <string>

namespace kernelshim {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 2;
constexpr int CLIENT_VERSION_PATCH = 0;

// Program name printed in diagnostics
constexpr const char *PKG_NAME = "kernelshim";

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// User agent for discovery HTTP calls
// Format: kernelshim/1.2.0
inline std::string GetUserAgent() {
  return std::string(PKG_NAME) + "/" + GetVersionString();
}

// Full version info for display
inline std::string GetFullVersionString() {
  return std::string(PKG_NAME) + " version " + GetVersionString();
}

} // namespace kernelshim

#endif // KERNELSHIM_VERSION_HPP
