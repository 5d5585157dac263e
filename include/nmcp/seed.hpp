/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "nmcp/resources.hpp"

namespace nmcp {

// Pools and servers declared on the nmcpd command line.
struct PoolSeed {
    std::string name;
    PoolSpec spec;
};

struct ServerSeed {
    std::string name;
    std::string pool;
};

// NAME:MAX:IDLE:CMD, the command may itself contain colons
[[nodiscard]] std::optional<PoolSeed> parsePoolSeed(const std::string& value);
// NAME[:POOL], pool defaults to "default"
[[nodiscard]] std::optional<ServerSeed> parseServerSeed(const std::string& value);

[[nodiscard]] std::vector<std::string> splitWords(const std::string& value);

}
