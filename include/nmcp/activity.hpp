/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "nmcp/resources.hpp"
#include "nmcp/types.hpp"

namespace nmcp {

struct ActivitySnapshot {
    std::optional<TimePoint> lastRequestAt;
    std::uint64_t totalRequests = 0;
    std::uint32_t currentConnections = 0;
};

// Per-server activity counters shared by every bridge session on that server.
// The bridge writes, the controller reads and copies them into status.
class ActivityTracker {
public:
    using Listener = std::function<void(const std::string& server)>;

    explicit ActivityTracker(NowFn now = systemNow);

    ActivityTracker(const ActivityTracker&) = delete;
    ActivityTracker& operator=(const ActivityTracker&) = delete;

    // Servers not yet seeded, or already forgotten, are ignored.
    void recordRequest(const std::string& server);
    void sessionOpened(const std::string& server);
    void sessionClosed(const std::string& server);

    // Adopt persisted counters the first time a server is seen (daemon restart).
    // A record with a different creation time under the same name starts over.
    void seed(const std::string& server, const ServerStatus& status);
    [[nodiscard]] bool known(const std::string& server) const;
    [[nodiscard]] ActivitySnapshot snapshot(const std::string& server) const;
    void forget(const std::string& server);

    // Called after every change; the controller uses it to schedule a reconcile.
    void setListener(Listener listener);

private:
    struct Counters {
        std::int64_t createdMs = -1;
        std::atomic<std::int64_t> lastRequestMs{-1};
        std::atomic<std::uint64_t> totalRequests{0};
        std::atomic<std::uint32_t> connections{0};
    };

    [[nodiscard]] std::shared_ptr<Counters> find(const std::string& server) const;
    void notify(const std::string& server);

    NowFn now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Counters>> counters_;
    Listener listener_;
};

}
