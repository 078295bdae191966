// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    kernelshim::util::LogManager::Initialize(level, false, "");

    // "trace" also opens up every component, including per-chunk relay dumps
    if (level == "trace") {
        kernelshim::util::LogManager::ApplyVerbosity(4);
        kernelshim::util::LogManager::SetLogLevel("trace");
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    kernelshim::util::LogManager::Shutdown();
}
