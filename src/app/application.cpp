// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/application.hpp"
#include "app/kernel_spec.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <csignal>

namespace kernelshim {
namespace app {

Application::Application(const AppConfig &config)
    : config_(config), io_context_(1), signals_(io_context_, SIGINT, SIGTERM) {}

Application::~Application() {
  // Coordinator first: its ports and tasks refer to the dialer
  coordinator_.reset();
  boost::system::error_code ec;
  signals_.cancel(ec);
}

bool Application::initialize() {
  LOG_APP_DEBUG("Initializing {}...", GetFullVersionString());

  if (!load_settings()) {
    return false;
  }

  if (!load_connection_params()) {
    return false;
  }

  std::string error;
  dialer_ = network::MakeDialer(io_context_, settings_.hass_proxy, error);
  if (!dialer_) {
    error_ = "invalid hass_proxy " + settings_.hass_proxy + ": " + error;
    LOG_APP_ERROR("{}", error_);
    return false;
  }

  coordinator_ = std::make_unique<SessionCoordinator>(
      io_context_, settings_, params_, *dialer_,
      [this](int status) { on_session_done(status); });

  LOG_APP_DEBUG("Initialization complete");
  return true;
}

bool Application::load_settings() {
  std::filesystem::path path = config_.config_path;
  if (path.empty()) {
    if (!LocateKernelConfig(config_.kernel_name, FindKernelSpecs(), path,
                            error_)) {
      LOG_APP_ERROR("{}", error_);
      return false;
    }
  }

  if (!LoadHassSettings(path, settings_, error_)) {
    LOG_APP_ERROR("{}", error_);
    return false;
  }

  LOG_APP_DEBUG("settings from {}: hass_host={} hass_url={} hass_proxy={} "
                "verify_ssl={}",
                path.string(), settings_.hass_host, settings_.hass_url,
                settings_.hass_proxy.empty() ? "none" : settings_.hass_proxy,
                settings_.verify_ssl);
  return true;
}

bool Application::load_connection_params() {
  bool ok;
  if (!config_.connection_file.empty() && config_.flags.empty()) {
    ok = LoadConnectionFile(config_.connection_file, params_, error_);
  } else {
    ok = ConnectionParamsFromFlags(config_.flags, params_, error_);
  }

  if (!ok) {
    LOG_APP_ERROR("{}", error_);
    return false;
  }

  LOG_APP_INFO("got jupyter client config={}", params_.dump());
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }
  if (!coordinator_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  running_ = true;
  wait_for_signal();
  coordinator_->start();
  return true;
}

int Application::run() {
  if (!running_) {
    return 1;
  }
  io_context_.run();
  return exit_status_;
}

void Application::request_shutdown(int status) {
  if (coordinator_) {
    coordinator_->request_exit(status);
  }
}

void Application::wait_for_signal() {
  signals_.async_wait(
      [this](const boost::system::error_code &ec, int signal) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        LOG_APP_INFO("Received signal {}, shutting down", signal);
        request_shutdown(0);
      });
}

void Application::on_session_done(int status) {
  exit_status_ = status;
  if (coordinator_ && !coordinator_->last_error().empty()) {
    error_ = coordinator_->last_error();
  }
  LOG_APP_DEBUG("Shutdown complete (exit_status={})", status);

  running_ = false;
  boost::system::error_code ec;
  signals_.cancel(ec);
  io_context_.stop();
}

} // namespace app
} // namespace kernelshim
