// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/url.hpp"
#include <algorithm>
#include <cctype>

namespace kernelshim {
namespace util {

uint16_t Url::effective_port() const {
  if (port != 0) {
    return port;
  }
  if (scheme == "https") {
    return 443;
  }
  if (scheme == "http") {
    return 80;
  }
  return 0;
}

std::string Url::host_header() const {
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (port != 0) {
    h += ":" + std::to_string(port);
  }
  return h;
}

bool ParseUrl(const std::string &text, Url &out, std::string &error) {
  out = Url{};

  auto scheme_end = text.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    error = "missing scheme in url '" + text + "'";
    return false;
  }
  out.scheme = text.substr(0, scheme_end);
  std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  size_t authority_begin = scheme_end + 3;
  size_t authority_end = text.find('/', authority_begin);
  if (authority_end == std::string::npos) {
    authority_end = text.size();
  }
  std::string authority =
      text.substr(authority_begin, authority_end - authority_begin);
  out.path = text.substr(authority_end);

  // userinfo
  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    std::string userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
    auto colon = userinfo.find(':');
    if (colon == std::string::npos) {
      out.username = userinfo;
    } else {
      out.username = userinfo.substr(0, colon);
      out.password = userinfo.substr(colon + 1);
    }
  }

  std::string port_text;
  if (!authority.empty() && authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      error = "unterminated IPv6 address in url '" + text + "'";
      return false;
    }
    out.host = authority.substr(1, close - 1);
    std::string rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest[0] != ':') {
        error = "unexpected characters after host in url '" + text + "'";
        return false;
      }
      port_text = rest.substr(1);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
      out.host = authority;
    } else {
      out.host = authority.substr(0, colon);
      port_text = authority.substr(colon + 1);
    }
  }

  if (out.host.empty()) {
    error = "missing host in url '" + text + "'";
    return false;
  }

  if (!port_text.empty()) {
    if (port_text.size() > 5 ||
        !std::all_of(port_text.begin(), port_text.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      error = "invalid port '" + port_text + "' in url '" + text + "'";
      return false;
    }
    unsigned long value = std::stoul(port_text);
    if (value == 0 || value > 65535) {
      error = "invalid port '" + port_text + "' in url '" + text + "'";
      return false;
    }
    out.port = static_cast<uint16_t>(value);
  }

  return true;
}

} // namespace util
} // namespace kernelshim
