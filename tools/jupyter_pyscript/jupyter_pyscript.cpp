// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

// jupyter-pyscript - install or inspect the hass pyscript Jupyter kernel
//
// Usage: jupyter-pyscript install|info [-k <kernel_name>]

#include "app/config.hpp"
#include "app/kernel_spec.hpp"
#include "util/logging.hpp"
#include <iostream>
#include <string>

using namespace kernelshim;

namespace {

constexpr const char *SCRIPT_NAME = "jupyter-pyscript";

void print_usage() {
  std::cout << "usage: " << SCRIPT_NAME
            << " [-h] [-k KERNEL_NAME] action\n"
            << "\n"
            << "positional arguments:\n"
            << "  action                install|info\n"
            << "\n"
            << "options:\n"
            << "  -h, --help            show this help message and exit\n"
            << "  -k KERNEL_NAME, --kernel-name KERNEL_NAME\n"
            << "                        kernel name\n"
            << "\n"
            << "Actions:\n"
            << "install - install or update a Jupyter pyscript kernel\n"
            << "\n"
            << "info - list information about an installed pyscript kernel\n"
            << std::endl;
}

int do_install(const std::string &kernel_name) {
  auto kernels = app::FindKernelSpecs();
  auto target_dir = app::ChooseInstallDir(kernel_name, kernels);

  app::InstallResult result;
  std::string error;
  if (!app::InstallKernel(target_dir, kernel_name, result, error)) {
    std::cerr << SCRIPT_NAME << ": " << error << std::endl;
    return 1;
  }

  if (result.new_install) {
    std::cout << "installed new " << kernel_name << " kernel in "
              << result.target_dir.string() << std::endl;
    std::cout << "you will need to update the settings in "
              << (result.target_dir / app::CONFIG_NAME).string() << std::endl;
  } else {
    std::cout << "updated " << kernel_name << " kernel in "
              << result.target_dir.string() << std::endl;
  }
  return 0;
}

int do_info(const std::string &kernel_name) {
  auto kernels = app::FindKernelSpecs();
  auto it = kernels.find(kernel_name);
  if (it == kernels.end()) {
    std::cout << "No installed kernel named " << kernel_name << " found"
              << std::endl;
    return 0;
  }

  auto config_path = it->second / app::CONFIG_NAME;
  std::cout << "Kernel " << kernel_name << " installed in "
            << it->second.string() << std::endl;
  std::cout << "Config settings from " << config_path.string() << ":"
            << std::endl;

  app::HassSettings settings;
  std::string error;
  if (!app::LoadHassSettings(config_path, settings, error)) {
    std::cerr << SCRIPT_NAME << ": " << error << std::endl;
    return 1;
  }

  std::cout << "    hass_host = " << settings.hass_host << "\n"
            << "    hass_url = " << settings.hass_url << "\n"
            << "    hass_token = " << settings.hass_token << "\n"
            << "    hass_proxy = " << settings.hass_proxy << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string action;
  std::string kernel_name = app::DEFAULT_KERNEL_NAME;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if ((arg == "-k" || arg == "--kernel-name") && i + 1 < argc) {
      kernel_name = argv[++i];
    } else if (arg.rfind("--kernel-name=", 0) == 0) {
      kernel_name = arg.substr(14);
    } else if (!arg.empty() && arg[0] != '-' && action.empty()) {
      action = arg;
    } else {
      std::cerr << SCRIPT_NAME << ": unrecognized argument: " << arg
                << std::endl;
      print_usage();
      return 1;
    }
  }

  util::LogManager::Initialize("warn");

  int status;
  try {
    if (action == "install") {
      status = do_install(kernel_name);
    } else if (action == "info") {
      status = do_info(kernel_name);
    } else {
      print_usage();
      status = action.empty() ? 1 : 0;
    }
  } catch (const std::exception &e) {
    std::cerr << SCRIPT_NAME << ": " << e.what() << std::endl;
    status = 1;
  }

  util::LogManager::Shutdown();
  return status;
}
