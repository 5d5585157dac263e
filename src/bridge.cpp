/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/bridge.hpp"
#include "nmcp/controller.hpp"
#include "nmcp/logger.hpp"
#include "nmcp/store.hpp"
#include "nmcp/workload.hpp"
#include <algorithm>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace nmcp {

namespace {

constexpr const char* kUnavailable = "server unavailable";
constexpr const char* kNotReady = "server not ready";

bool isResponse(const nlohmann::json& msg) {
    return msg.contains("id") && !msg.contains("method") && (msg.contains("result") || msg.contains("error"));
}

}

Session::Session(std::string id, std::string server, ActivityTracker& activity, IdSource upstreamIds)
    : id_(std::move(id)), server_(std::move(server)), activity_(activity), upstreamIds_(std::move(upstreamIds)) {
}

Session::~Session() {
    close();
}

void Session::attach(std::shared_ptr<Channel> channel, std::function<void(const std::string&)> onClosed) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_ = std::move(channel);
    onClosed_ = std::move(onClosed);
}

void Session::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        events_.push_back(std::move(event));
    }
    eventReady_.notify_all();
}

std::optional<Event> Session::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    eventReady_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

bool Session::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void Session::deliver(const std::string& line) {
    auto msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        LOG_DEBUG("Session " + id_ + ": skipping non JSON-RPC output from " + server_);
        return;
    }

    if (!isResponse(msg)) {
        // Notifications and server-initiated requests go to every session
        push(Event::message(line));
        return;
    }

    if (!msg["id"].is_number_integer()) {
        return;
    }
    const auto upstream = msg["id"].get<std::int64_t>();
    std::string original;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(upstream);
        if (it == pending_.end()) {
            // Answer to another session's request
            return;
        }
        original = std::move(it->second);
        pending_.erase(it);
    }
    msg["id"] = nlohmann::json::parse(original);
    push(Event::message(msg.dump()));
}

Error Session::send(const std::string& message) {
    auto msg = nlohmann::json::parse(message, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        return {ErrorKind::TransportError, "invalid JSON-RPC message"};
    }

    std::shared_ptr<Channel> channel;
    std::optional<std::int64_t> upstream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !channel_) {
            return {ErrorKind::TransportError, "session closed"};
        }
        channel = channel_;
        if (msg.contains("method") && msg.contains("id") && !msg["id"].is_null()) {
            upstream = upstreamIds_->fetch_add(1);
            pending_[*upstream] = msg["id"].dump();
            msg["id"] = *upstream;
        }
    }

    activity_.recordRequest(server_);

    Error err = channel->send(msg.dump());
    if (err.failed()) {
        if (upstream) {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(*upstream);
        }
        fail("channel closed: " + err.message);
        return {ErrorKind::TransportError, err.message};
    }
    LOG_TRACE("Session " + id_ + " -> " + server_ + ": " + message);
    return {};
}

void Session::fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        events_.push_back(Event::error(reason));
    }
    LOG_INFO("Session " + id_ + " on " + server_ + " closed: " + reason);
    close();
}

void Session::close() {
    std::shared_ptr<Channel> channel;
    std::function<void(const std::string&)> onClosed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        channel = std::move(channel_);
        onClosed = std::move(onClosed_);
        pending_.clear();
    }
    eventReady_.notify_all();

    if (channel) {
        channel->close();
    }
    activity_.sessionClosed(server_);
    if (onClosed) {
        onClosed(id_);
    }
    LOG_DEBUG("Session " + id_ + " released");
}

Bridge::Bridge(Controller& controller, ResourceStore& store, WorkloadManager& workloads,
               ActivityTracker& activity, const Config& config)
    : controller_(controller), store_(store), workloads_(workloads), activity_(activity), config_(config),
      upstreamIds_(std::make_shared<std::atomic<std::int64_t>>(1)) {
    watchId_ = store_.watch([this](ResourceKind kind, WatchEventType type, const std::string& name) {
        if (kind == ResourceKind::Server && type == WatchEventType::Deleted) {
            closeServerSessions(name, kUnavailable);
        }
    });
}

Bridge::~Bridge() {
    store_.unwatch(watchId_);
    closeAll();
}

std::string Bridge::generateId() {
    static std::atomic<std::uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    return std::to_string(now) + "_" + std::to_string(counter.fetch_add(1));
}

std::string Bridge::messagePath(const std::string& server, const std::string& sessionId) {
    return "/api/v1/servers/" + server + "/message?session=" + sessionId;
}

Error Bridge::awaitReady(const std::string& server) {
    const auto deadline = std::chrono::steady_clock::now() + config_.sessionReadyTimeout;
    const auto poll = std::min(config_.readinessPoll, std::chrono::milliseconds(50));

    while (true) {
        auto found = controller_.getServer(server);
        if (!found) {
            if (found.error.kind == ErrorKind::NotFound) {
                return {ErrorKind::NotFound, kUnavailable};
            }
            return {ErrorKind::TransportError, found.error.message};
        }

        switch (found.value.status.phase) {
            case Phase::Running:
            case Phase::Idle:
                if (workloads_.isReady(server)) {
                    return {};
                }
                break;
            case Phase::Pending:
            case Phase::Starting:
                break;
            case Phase::Stopping:
            case Phase::Stopped:
            case Phase::Failed:
                return {ErrorKind::TransportError, kUnavailable};
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return {ErrorKind::TransportError, kNotReady};
        }
        controller_.enqueue(server);
        std::this_thread::sleep_for(poll);
    }
}

Result<std::shared_ptr<Session>> Bridge::openSession(const std::string& server) {
    using SessionResult = Result<std::shared_ptr<Session>>;

    Error err = awaitReady(server);
    if (err.failed()) {
        LOG_DEBUG("Session on " + server + " refused: " + err.message);
        return SessionResult::failure(err);
    }

    auto endpoint = workloads_.endpoint(server);
    if (!endpoint) {
        return SessionResult::failure(ErrorKind::TransportError, kNotReady);
    }
    if (endpoint->transport != TransportType::Stdio) {
        return SessionResult::failure(ErrorKind::TransportError,
                                      "server " + server + " is reachable at " + endpoint->toString() +
                                          " and cannot be relayed");
    }

    auto channel = workloads_.openChannel(server);
    if (!channel) {
        return SessionResult::failure(ErrorKind::TransportError, channel.error.message);
    }

    auto session = std::make_shared<Session>(generateId(), server, activity_, upstreamIds_);
    activity_.sessionOpened(server);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session->id()] = session;
    }
    session->push(Event::endpoint(messagePath(server, session->id())));
    session->attach(channel.value, [this](const std::string& id) { forget(id); });

    std::weak_ptr<Session> weak = session;
    channel.value->start(
        [weak](const std::string& line) {
            if (auto s = weak.lock()) s->deliver(line);
        },
        [this, weak](const std::string& reason) {
            if (auto s = weak.lock()) s->fail(closeReason(s->server(), reason));
        });

    LOG_INFO("Session " + session->id() + " opened on " + server);
    return SessionResult::success(session);
}

std::string Bridge::closeReason(const std::string& server, const std::string& channelReason) const {
    auto found = store_.getServer(server);
    if (!found) {
        return kUnavailable;
    }
    switch (found.value.status.phase) {
        case Phase::Stopping:
        case Phase::Stopped:
        case Phase::Failed:
            return kUnavailable;
        default:
            return "channel closed: " + channelReason;
    }
}

std::shared_ptr<Session> Bridge::findSession(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

void Bridge::forget(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(id);
}

void Bridge::closeSession(const std::string& id) {
    auto session = findSession(id);
    if (session) {
        session->close();
    }
}

void Bridge::closeServerSessions(const std::string& server, const std::string& reason) {
    std::vector<std::shared_ptr<Session>> affected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session->server() == server) {
                affected.push_back(session);
            }
        }
    }
    for (const auto& session : affected) {
        session->fail(reason);
    }
}

void Bridge::closeAll() {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            all.push_back(session);
        }
    }
    for (const auto& session : all) {
        session->fail("bridge shutting down");
    }
}

std::size_t Bridge::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}
