/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <sys/types.h>

#include "nmcp/runtime.hpp"

namespace nmcp {

// Runs each unit as a local child process. stdio units speak newline-delimited
// JSON-RPC on stdin/stdout; sse units get PORT exported and listen themselves.
class ProcessRuntime final : public WorkloadRuntime {
public:
    explicit ProcessRuntime(std::chrono::milliseconds terminationGrace = std::chrono::milliseconds(3000));
    ~ProcessRuntime() override;

    ProcessRuntime(const ProcessRuntime&) = delete;
    ProcessRuntime& operator=(const ProcessRuntime&) = delete;
    ProcessRuntime(ProcessRuntime&&) = delete;
    ProcessRuntime& operator=(ProcessRuntime&&) = delete;

    [[nodiscard]] Result<Endpoint> createUnit(const std::string& name, const UnitSpec& spec) override;
    [[nodiscard]] UnitState unitState(const std::string& name) const override;
    [[nodiscard]] std::optional<Endpoint> endpoint(const std::string& name) const override;
    [[nodiscard]] Error deleteUnit(const std::string& name) override;
    [[nodiscard]] Result<std::shared_ptr<Channel>> openChannel(const std::string& name) override;

    // Terminates every unit. Called on daemon shutdown.
    void shutdown() noexcept;

    struct Unit;

private:
    [[nodiscard]] std::shared_ptr<Unit> findUnit(const std::string& name) const;
    void terminate(Unit& unit) noexcept;

    std::chrono::milliseconds terminationGrace_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Unit>> units_;
};

}
