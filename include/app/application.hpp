// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_APP_APPLICATION_HPP
#define KERNELSHIM_APP_APPLICATION_HPP

#include "app/config.hpp"
#include "app/session_coordinator.hpp"
#include "network/dialer.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace kernelshim {
namespace app {

/**
 * Application configuration, filled in by the command line parser
 */
struct AppConfig {
  int verbosity = 0;
  std::string kernel_name = DEFAULT_KERNEL_NAME;

  // Jupyter connection file; used only when the discrete flags are absent
  std::filesystem::path connection_file;
  ConnectionFlags flags;

  // Explicit pyscript.conf; empty means look it up in the kernel spec dir
  std::filesystem::path config_path;

  // Log to this file instead of stderr
  std::string log_file;
};

/**
 * Application - wires settings, dialer and coordinator onto one io_context
 *
 * initialize() loads everything that can fail before any I/O starts,
 * start() installs SIGINT/SIGTERM handling and kicks off discovery, run()
 * drives the loop until the coordinator finishes and returns the process
 * exit status. Fatal problems leave a one-line diagnostic in error().
 */
class Application {
public:
  explicit Application(const AppConfig &config);
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  bool initialize();
  bool start();
  int run();

  // Drain and exit with status (signal path)
  void request_shutdown(int status = 0);

  const std::string &error() const { return error_; }
  const HassSettings &settings() const { return settings_; }
  const ConnectionParams &params() const { return params_; }

private:
  bool load_settings();
  bool load_connection_params();
  void wait_for_signal();
  void on_session_done(int status);

  AppConfig config_;
  boost::asio::io_context io_context_;
  boost::asio::signal_set signals_;

  HassSettings settings_;
  ConnectionParams params_;
  std::shared_ptr<network::Dialer> dialer_;
  std::unique_ptr<SessionCoordinator> coordinator_;

  std::string error_;
  int exit_status_ = 1;
  bool running_ = false;
};

} // namespace app
} // namespace kernelshim

#endif // KERNELSHIM_APP_APPLICATION_HPP
