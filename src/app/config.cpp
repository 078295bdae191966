// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/config.hpp"
#include "network/protocol.hpp"
#include <algorithm>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cctype>
#include <fstream>
#include <map>
#include <vector>

namespace kernelshim {
namespace app {

namespace {

// Same limit Python's configparser applies to nested references
constexpr int MAX_INTERPOLATION_DEPTH = 10;

const std::map<std::string, std::string> kSettingDefaults = {
    {"hass_host", "localhost"},
    {"hass_url", "http://${hass_host}:8123"},
    {"hass_token", ""},
    {"hass_proxy", ""},
    {"verify_ssl", "True"},
};

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool Interpolate(const std::map<std::string, std::string> &raw,
                 const std::string &option, int depth, std::string &out,
                 std::string &error) {
  if (depth > MAX_INTERPOLATION_DEPTH) {
    error = "interpolation too deeply recursive in option '" + option + "'";
    return false;
  }

  auto it = raw.find(option);
  if (it == raw.end()) {
    error = "bad interpolation reference to '" + option + "'";
    return false;
  }

  const std::string &value = it->second;
  out.clear();
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '$') {
      out.push_back(value[i]);
      continue;
    }
    if (i + 1 < value.size() && value[i + 1] == '$') {
      out.push_back('$');
      ++i;
      continue;
    }
    if (i + 1 < value.size() && value[i + 1] == '{') {
      auto close = value.find('}', i + 2);
      if (close == std::string::npos) {
        error = "unterminated '${' in option '" + option + "'";
        return false;
      }
      std::string ref = ToLower(value.substr(i + 2, close - i - 2));
      if (raw.find(ref) == raw.end()) {
        error = "bad interpolation reference ${" + ref + "} in option '" +
                option + "'";
        return false;
      }
      std::string expanded;
      if (!Interpolate(raw, ref, depth + 1, expanded, error)) {
        return false;
      }
      out += expanded;
      i = close;
      continue;
    }
    error = "'$' must be followed by '$' or '{' in option '" + option + "'";
    return false;
  }
  return true;
}

} // namespace

std::string HassSettings::base_url() const {
  std::string url = hass_url;
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

std::string UnquoteValue(const std::string &value) {
  auto is_quote = [](char c) { return c == '\'' || c == '"'; };
  size_t begin = 0;
  size_t end = value.size();
  while (begin < end && is_quote(value[begin])) {
    ++begin;
  }
  while (end > begin && is_quote(value[end - 1])) {
    --end;
  }
  return value.substr(begin, end - begin);
}

std::string RemoveQuotes(const std::string &value) {
  auto is_quote = [](char c) { return c == '\'' || c == '"'; };
  if (value.size() >= 2 && value.front() == value.back() &&
      is_quote(value.front())) {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() >= 3 && value[0] == 'b' && value[1] == value.back() &&
      is_quote(value[1])) {
    return value.substr(2, value.size() - 3);
  }
  return value;
}

bool ParseHassSettings(std::istream &in, HassSettings &out,
                       std::string &error) {
  boost::property_tree::ptree tree;
  try {
    boost::property_tree::read_ini(in, tree);
  } catch (const boost::property_tree::ptree_error &e) {
    error = e.what();
    return false;
  }

  // Section names are case-sensitive, option names are not
  auto section = tree.get_child_optional(CONFIG_SECTION);
  if (!section) {
    error = "missing section '" + std::string(CONFIG_SECTION) +
            "' in config file";
    return false;
  }

  std::map<std::string, std::string> raw = kSettingDefaults;
  for (const auto &[key, node] : *section) {
    raw[ToLower(key)] = node.get_value<std::string>();
  }

  std::map<std::string, std::string> resolved;
  for (const auto &[option, unused] : kSettingDefaults) {
    std::string value;
    if (!Interpolate(raw, option, 1, value, error)) {
      return false;
    }
    resolved[option] = UnquoteValue(value);
  }

  out = HassSettings{};
  out.hass_host = resolved["hass_host"];
  out.hass_url = resolved["hass_url"];
  out.hass_token = resolved["hass_token"];
  out.hass_proxy = resolved["hass_proxy"];
  out.verify_ssl = ToLower(resolved["verify_ssl"]) == "true";
  return true;
}

bool LoadHassSettings(const std::filesystem::path &path, HassSettings &out,
                      std::string &error) {
  std::ifstream file(path);
  if (!file) {
    error = "unable to load config file " + path.string() +
            ", err=cannot open file";
    return false;
  }

  std::string parse_error;
  if (!ParseHassSettings(file, out, parse_error)) {
    if (parse_error.rfind("missing section", 0) == 0) {
      error = parse_error;
    } else {
      error = "unable to load config file " + path.string() +
              ", err=" + parse_error;
    }
    return false;
  }
  return true;
}

bool LoadConnectionFile(const std::filesystem::path &path,
                        ConnectionParams &out, std::string &error) {
  std::ifstream file(path);
  if (!file) {
    error = "unable to open connection file " + path.string();
    return false;
  }

  try {
    out = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error &e) {
    error = "unable to parse connection file " + path.string() + ": " +
            e.what();
    return false;
  }

  if (!out.is_object()) {
    error = "connection file " + path.string() + " is not a JSON object";
    return false;
  }
  return ValidateConnectionParams(out, error);
}

bool ConnectionParamsFromFlags(const ConnectionFlags &flags,
                               ConnectionParams &out, std::string &error) {
  std::vector<std::string> missing;
  out = nlohmann::json::object();

  auto set_int = [&](const char *key, const char *flag,
                     const std::optional<int> &value) {
    if (value) {
      out[key] = *value;
    } else {
      missing.push_back(flag);
    }
  };
  auto set_string = [&](const char *key, const char *flag,
                        const std::optional<std::string> &value, bool unquote) {
    if (value) {
      out[key] = unquote ? RemoveQuotes(*value) : *value;
    } else {
      missing.push_back(flag);
    }
  };

  set_int(protocol::ports::CONTROL, "control", flags.control_port);
  set_int(protocol::ports::HEARTBEAT, "hb", flags.hb_port);
  set_int(protocol::ports::IOPUB, "iopub", flags.iopub_port);
  set_string("ip", "ip", flags.ip, false);
  set_string("key", "Session.key", flags.key, true);
  set_int(protocol::ports::SHELL, "shell", flags.shell_port);
  set_string("signature_scheme", "Session.signature_scheme",
             flags.signature_scheme, true);
  set_int(protocol::ports::STDIN, "stdin", flags.stdin_port);
  set_string("transport", "transport", flags.transport, true);

  if (!missing.empty()) {
    error = "missing arguments: ";
    for (size_t i = 0; i < missing.size(); ++i) {
      error += (i ? ", --" : "--") + missing[i];
    }
    error += ", (or specify --f config_file instead)";
    return false;
  }
  return ValidateConnectionParams(out, error);
}

bool ValidateConnectionParams(const ConnectionParams &params,
                              std::string &error) {
  if (!params.is_object()) {
    error = "connection parameters must be a JSON object";
    return false;
  }

  for (const char *key : {"ip", "transport", "signature_scheme", "key"}) {
    if (!params.contains(key) || !params[key].is_string()) {
      error = std::string("missing or invalid connection parameter '") + key +
              "'";
      return false;
    }
  }

  for (const char *port : protocol::ports::ALL) {
    if (!params.contains(port) || !params[port].is_number_integer()) {
      error = std::string("missing or invalid connection parameter '") +
              port + "'";
      return false;
    }
    auto value = params[port].get<int64_t>();
    if (value < 0 || value > 65535) {
      error = std::string("connection parameter '") + port +
              "' out of range: " + std::to_string(value);
      return false;
    }
  }
  return true;
}

uint16_t ConnectionPort(const ConnectionParams &params, const char *name) {
  return static_cast<uint16_t>(params.at(name).get<int64_t>());
}

} // namespace app
} // namespace kernelshim
