/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>

#include "nmcp/config.hpp"

namespace nmcp {

class ObjectStore;
class ResourceStore;
class ProcessRuntime;
class WorkloadManager;
class ActivityTracker;
class Controller;
class Bridge;
class HttpGateway;

// Wires the substrate, controller, bridge and gateway together and owns them.
class Operator final {
public:
    explicit Operator(const Config& config);
    ~Operator();

    Operator(const Operator&) = delete;
    Operator& operator=(const Operator&) = delete;
    Operator(Operator&&) = delete;
    Operator& operator=(Operator&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] Controller& controller() noexcept { return *controller_; }
    [[nodiscard]] Bridge& bridge() noexcept { return *bridge_; }
    [[nodiscard]] HttpGateway& gateway() noexcept { return *gateway_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool createWorkspace() noexcept;

    Config config_;
    std::atomic<bool> running_{false};

    std::unique_ptr<ObjectStore> objects_;
    std::unique_ptr<ResourceStore> store_;
    std::unique_ptr<ProcessRuntime> runtime_;
    std::unique_ptr<WorkloadManager> workloads_;
    std::unique_ptr<ActivityTracker> activity_;
    std::unique_ptr<Controller> controller_;
    std::unique_ptr<Bridge> bridge_;
    std::unique_ptr<HttpGateway> gateway_;
};

}
