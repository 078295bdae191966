// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_UTIL_URL_HPP
#define KERNELSHIM_UTIL_URL_HPP

#include <cstdint>
#include <string>

namespace kernelshim {
namespace util {

/**
 * Minimal absolute URL: scheme://[user[:password]@]host[:port][/path]
 *
 * IPv6 hosts are written in brackets and stored without them. port is 0
 * when the URL does not name one.
 */
struct Url {
  std::string scheme; // lower-cased
  std::string username;
  std::string password;
  std::string host;
  uint16_t port = 0;
  std::string path; // everything after the authority, may be empty

  // Port to use, falling back to the scheme default (http 80, https 443)
  uint16_t effective_port() const;

  // host[:port] as sent in the HTTP Host header
  std::string host_header() const;
};

bool ParseUrl(const std::string &text, Url &out, std::string &error);

} // namespace util
} // namespace kernelshim

#endif // KERNELSHIM_UTIL_URL_HPP
