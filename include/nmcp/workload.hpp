/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <optional>
#include <string>

#include "nmcp/resources.hpp"
#include "nmcp/runtime.hpp"

namespace nmcp {

// Sole writer of substrate units. One unit per Server, named after it.
class WorkloadManager {
public:
    explicit WorkloadManager(WorkloadRuntime& runtime) noexcept;

    WorkloadManager(const WorkloadManager&) = delete;
    WorkloadManager& operator=(const WorkloadManager&) = delete;

    // Creates the unit if absent (or replaces one whose process exited) and
    // returns its endpoint. A present unit is returned unchanged.
    [[nodiscard]] Result<Endpoint> ensure(const std::string& server, const ServerTemplate& tmpl);
    // Idempotent: an absent unit is success.
    [[nodiscard]] Error teardown(const std::string& server);

    [[nodiscard]] UnitState state(const std::string& server) const;
    // Bound means a live unit exists (starting or ready).
    [[nodiscard]] bool isBound(const std::string& server) const;
    [[nodiscard]] bool isReady(const std::string& server) const;
    [[nodiscard]] std::optional<Endpoint> endpoint(const std::string& server) const;
    [[nodiscard]] Result<std::shared_ptr<Channel>> openChannel(const std::string& server);

    // InvalidSpec for templates that can never start.
    [[nodiscard]] static Error validate(const ServerTemplate& tmpl);
    [[nodiscard]] static std::string unitName(const std::string& server);

private:
    WorkloadRuntime& runtime_;
};

}
