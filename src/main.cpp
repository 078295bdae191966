// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] [connection_file]\n"
      << "\n"
      << "Relays a Jupyter client to a pyscript kernel running inside Home "
         "Assistant.\n"
      << "\n"
      << "Options:\n"
      << "  -k, --kernel-name <name>  Kernel spec holding pyscript.conf "
         "(default: pyscript)\n"
      << "  -f, --f <file>            Jupyter connection file\n"
      << "  --config=<path>           Read settings from this file instead "
         "of the kernel spec\n"
      << "\n"
      << "Connection (instead of a connection file):\n"
      << "  --ip <addr>               Address to listen on for the client\n"
      << "  --stdin <port>            stdin channel port\n"
      << "  --control <port>          control channel port\n"
      << "  --hb <port>               heartbeat port\n"
      << "  --shell <port>            shell channel port\n"
      << "  --iopub <port>            iopub channel port\n"
      << "  --transport <name>        transport (tcp)\n"
      << "  --Session.signature_scheme <scheme>\n"
      << "  --Session.key <key>\n"
      << "\n"
      << "Logging:\n"
      << "  -v, --verbose             Increase verbosity (repeat up to 4 "
         "times, e.g. -vvv)\n"
      << "  --logfile=<path>          Log to a file instead of stderr\n"
      << "\n"
      << "Other:\n"
      << "  --version                 Show version information\n"
      << "  --help                    Show this help message\n"
      << std::endl;
}

void print_error(const std::string &message) {
  std::cerr << kernelshim::PKG_NAME << ": " << message << std::endl;
}

// Matches "--name value" and "--name=value"; advances i past a separate value
std::optional<std::string> take_value(int argc, char *argv[], int &i,
                                      const std::string &arg,
                                      const std::string &name) {
  if (arg == name) {
    if (i + 1 >= argc) {
      throw std::invalid_argument("argument " + name + ": expected one argument");
    }
    return std::string(argv[++i]);
  }
  if (arg.rfind(name + "=", 0) == 0) {
    return arg.substr(name.size() + 1);
  }
  return std::nullopt;
}

int parse_int(const std::string &name, const std::string &value) {
  try {
    size_t used = 0;
    int result = std::stoi(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
    return result;
  } catch (const std::logic_error &) {
    throw std::invalid_argument("argument " + name + ": invalid int value: '" +
                                value + "'");
  }
}

} // namespace

int main(int argc, char *argv[]) {
  using kernelshim::util::LogManager;

  try {
    kernelshim::app::AppConfig config;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      std::optional<std::string> value;

      if (arg == "--help" || arg == "-h") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << kernelshim::GetFullVersionString() << std::endl;
        return 0;
      } else if (arg == "--verbose") {
        ++config.verbosity;
      } else if (arg.size() >= 2 && arg[0] == '-' &&
                 arg.find_first_not_of('v', 1) == std::string::npos) {
        // -v, -vv, -vvv ...
        config.verbosity += static_cast<int>(arg.size() - 1);
      } else if ((value = take_value(argc, argv, i, arg, "-k")) ||
                 (value = take_value(argc, argv, i, arg, "--kernel-name"))) {
        config.kernel_name = *value;
      } else if ((value = take_value(argc, argv, i, arg, "-f")) ||
                 (value = take_value(argc, argv, i, arg, "--f"))) {
        config.connection_file = *value;
      } else if ((value = take_value(argc, argv, i, arg, "--config"))) {
        config.config_path = *value;
      } else if ((value = take_value(argc, argv, i, arg, "--logfile"))) {
        config.log_file = *value;
      } else if ((value = take_value(argc, argv, i, arg, "--ip"))) {
        config.flags.ip = *value;
      } else if ((value = take_value(argc, argv, i, arg, "--stdin"))) {
        config.flags.stdin_port = parse_int("--stdin", *value);
      } else if ((value = take_value(argc, argv, i, arg, "--control"))) {
        config.flags.control_port = parse_int("--control", *value);
      } else if ((value = take_value(argc, argv, i, arg, "--hb"))) {
        config.flags.hb_port = parse_int("--hb", *value);
      } else if ((value = take_value(argc, argv, i, arg, "--shell"))) {
        config.flags.shell_port = parse_int("--shell", *value);
      } else if ((value = take_value(argc, argv, i, arg, "--iopub"))) {
        config.flags.iopub_port = parse_int("--iopub", *value);
      } else if ((value = take_value(argc, argv, i, arg, "--transport"))) {
        config.flags.transport = *value;
      } else if ((value = take_value(argc, argv, i, arg,
                                     "--Session.signature_scheme"))) {
        config.flags.signature_scheme = *value;
      } else if ((value = take_value(argc, argv, i, arg, "--Session.key"))) {
        config.flags.key = *value;
      } else if (!arg.empty() && arg[0] != '-') {
        // Positional connection file
        config.connection_file = arg;
      } else {
        print_error("unrecognized argument: " + arg);
        print_usage(argv[0]);
        return 1;
      }
    }

    // Initialize logging system; verbosity picks per-component levels
    LogManager::Initialize("warn", !config.log_file.empty(),
                           config.log_file.empty() ? "kernelshim.log"
                                                   : config.log_file);
    LogManager::ApplyVerbosity(config.verbosity);

    kernelshim::app::Application app(config);

    if (!app.initialize()) {
      print_error(app.error());
      LogManager::Shutdown();
      return 1;
    }

    if (!app.start()) {
      print_error("failed to start");
      LogManager::Shutdown();
      return 1;
    }

    int status = app.run();
    if (status != 0 && !app.error().empty()) {
      print_error(app.error());
    }

    LogManager::Shutdown();
    return status;

  } catch (const std::invalid_argument &e) {
    print_error(e.what());
    return 1;
  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    LogManager::Shutdown();
    return 1;
  }
}
