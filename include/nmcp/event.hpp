/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace nmcp {

// The three server-push event kinds clients parse. Names are part of the wire contract.
enum class EventKind : std::uint8_t { Endpoint, Message, Error };

struct Event {
    EventKind kind = EventKind::Message;
    std::string data;

    [[nodiscard]] static Event endpoint(std::string path) { return {EventKind::Endpoint, std::move(path)}; }
    [[nodiscard]] static Event message(std::string payload) { return {EventKind::Message, std::move(payload)}; }
    [[nodiscard]] static Event error(std::string reason) { return {EventKind::Error, std::move(reason)}; }

    // "event: <kind>\ndata: <line>\n...\n\n"
    [[nodiscard]] std::string toSse() const;
};

[[nodiscard]] const char* eventName(EventKind kind) noexcept;

}
