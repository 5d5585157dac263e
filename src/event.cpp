/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/event.hpp"

namespace nmcp {

const char* eventName(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::Endpoint: return "endpoint";
        case EventKind::Message: return "message";
        case EventKind::Error: return "error";
    }
    return "message";
}

std::string Event::toSse() const {
    std::string out = "event: ";
    out += eventName(kind);
    out += "\n";

    // Each payload line gets its own data field
    std::size_t start = 0;
    while (true) {
        auto end = data.find('\n', start);
        std::string line = data.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out += "data: " + line + "\n";
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    out += "\n";
    return out;
}

}
