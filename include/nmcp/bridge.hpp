/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "nmcp/activity.hpp"
#include "nmcp/config.hpp"
#include "nmcp/event.hpp"
#include "nmcp/runtime.hpp"
#include "nmcp/types.hpp"

namespace nmcp {

class Controller;
class ResourceStore;
class WorkloadManager;

// One client's relay to a server's process. Client requests are renumbered
// on the way in so that several sessions can share one process; responses are
// matched back and restored to the client's own id.
class Session {
public:
    using IdSource = std::shared_ptr<std::atomic<std::int64_t>>;

    Session(std::string id, std::string server, ActivityTracker& activity, IdSource upstreamIds);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& server() const noexcept { return server_; }

    // Next event for the client. nullopt on timeout, or once closed and drained.
    [[nodiscard]] std::optional<Event> next(std::chrono::milliseconds timeout);

    // Forward one client JSON-RPC message to the process.
    [[nodiscard]] Error send(const std::string& message);

    void close();
    [[nodiscard]] bool isClosed() const;

private:
    friend class Bridge;

    void attach(std::shared_ptr<Channel> channel, std::function<void(const std::string&)> onClosed);
    void push(Event event);
    void deliver(const std::string& line);
    // Terminal error event, then close.
    void fail(const std::string& reason);

    const std::string id_;
    const std::string server_;
    ActivityTracker& activity_;
    IdSource upstreamIds_;

    mutable std::mutex mutex_;
    std::condition_variable eventReady_;
    std::deque<Event> events_;
    bool closed_ = false;
    std::shared_ptr<Channel> channel_;
    std::function<void(const std::string&)> onClosed_;
    // upstream id -> client id (serialized JSON)
    std::unordered_map<std::int64_t, std::string> pending_;
};

// Accepts client sessions for running servers and relays their messages.
// Never changes a server's phase; activity flows to the controller through
// the shared tracker.
class Bridge {
public:
    Bridge(Controller& controller, ResourceStore& store, WorkloadManager& workloads, ActivityTracker& activity,
           const Config& config);
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;
    Bridge(Bridge&&) = delete;
    Bridge& operator=(Bridge&&) = delete;

    // NotFound for an unknown server, TransportError when it is unavailable,
    // not ready within sessionReadyTimeout, or not relayable.
    [[nodiscard]] Result<std::shared_ptr<Session>> openSession(const std::string& server);

    [[nodiscard]] std::shared_ptr<Session> findSession(const std::string& id) const;
    void closeSession(const std::string& id);
    void closeAll();
    [[nodiscard]] std::size_t sessionCount() const;

    // POST path announced in the endpoint event.
    [[nodiscard]] static std::string messagePath(const std::string& server, const std::string& sessionId);

private:
    [[nodiscard]] Error awaitReady(const std::string& server);
    [[nodiscard]] std::string closeReason(const std::string& server, const std::string& channelReason) const;
    void closeServerSessions(const std::string& server, const std::string& reason);
    void forget(const std::string& id);
    [[nodiscard]] static std::string generateId();

    Controller& controller_;
    ResourceStore& store_;
    WorkloadManager& workloads_;
    ActivityTracker& activity_;
    Config config_;
    Session::IdSource upstreamIds_;
    int watchId_ = 0;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

}
