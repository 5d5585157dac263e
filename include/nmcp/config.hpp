/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace nmcp {

struct Config {
    int workers = 4;

    // HTTP gateway
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;

    // Empty workspace keeps the object store in memory only
    std::filesystem::path workspace;

    std::chrono::seconds resyncInterval{60};
    std::chrono::milliseconds backoffBase{500};
    std::chrono::milliseconds backoffCap{30000};
    int maxAttempts = 5;
    std::chrono::seconds failedRequeue{300};
    std::chrono::milliseconds readinessPoll{1000};

    std::chrono::milliseconds sessionReadyTimeout{10000};
    std::chrono::seconds stoppedRetention{0};
    std::chrono::milliseconds terminationGrace{3000};

    // Built-in defaults overridden by NMCP_* environment variables.
    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] std::string describe() const;
};

}
