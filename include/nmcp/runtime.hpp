/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nmcp/resources.hpp"
#include "nmcp/types.hpp"

namespace nmcp {

// Where a workload can be reached.
struct Endpoint {
    std::string unit;
    TransportType transport = TransportType::Stdio;
    std::string host;
    std::uint16_t port = 0;

    [[nodiscard]] std::string toString() const;
};

enum class UnitState : std::uint8_t { Absent, Starting, Ready, Exited };

struct UnitSpec {
    std::vector<std::string> argv;
    std::vector<EnvVar> env;
    Transport transport;
};

// Byte-line channel to a running unit. Several channels may be open on one unit;
// each sees every line the unit emits.
class Channel {
public:
    using LineHandler = std::function<void(const std::string& line)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual ~Channel() = default;

    // Handlers run on the runtime's reader thread.
    virtual void start(LineHandler onLine, CloseHandler onClose) = 0;
    [[nodiscard]] virtual Error send(const std::string& line) = 0;
    virtual void close() noexcept = 0;
};

// Process-hosting half of the orchestration substrate.
class WorkloadRuntime {
public:
    virtual ~WorkloadRuntime() = default;

    // AlreadyExists when a unit of that name is present.
    [[nodiscard]] virtual Result<Endpoint> createUnit(const std::string& name, const UnitSpec& spec) = 0;
    [[nodiscard]] virtual UnitState unitState(const std::string& name) const = 0;
    [[nodiscard]] virtual std::optional<Endpoint> endpoint(const std::string& name) const = 0;
    // NotFound when no such unit exists.
    [[nodiscard]] virtual Error deleteUnit(const std::string& name) = 0;
    [[nodiscard]] virtual Result<std::shared_ptr<Channel>> openChannel(const std::string& name) = 0;
};

}
