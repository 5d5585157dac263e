/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/seed.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace nmcp {

std::vector<std::string> splitWords(const std::string& value) {
    std::istringstream in(value);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

std::optional<PoolSeed> parsePoolSeed(const std::string& value) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    for (int i = 0; i < 3; ++i) {
        auto colon = value.find(':', start);
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        fields.push_back(value.substr(start, colon - start));
        start = colon + 1;
    }
    fields.push_back(value.substr(start));

    PoolSeed seed;
    seed.name = fields[0];
    try {
        seed.spec.maxServers = std::stoi(fields[1]);
        seed.spec.defaultIdleTimeout = std::stoi(fields[2]);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    seed.spec.maxServersLimit = std::max(seed.spec.maxServersLimit, seed.spec.maxServers);
    seed.spec.serverTemplate.command = splitWords(fields[3]);
    if (seed.name.empty() || seed.spec.serverTemplate.command.empty()) {
        return std::nullopt;
    }
    return seed;
}

std::optional<ServerSeed> parseServerSeed(const std::string& value) {
    ServerSeed seed;
    auto colon = value.find(':');
    seed.name = value.substr(0, colon);
    seed.pool = colon == std::string::npos ? "default" : value.substr(colon + 1);
    if (seed.name.empty() || seed.pool.empty() || seed.pool.find(':') != std::string::npos) {
        return std::nullopt;
    }
    return seed;
}

}
