/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/activity.hpp"
#include "nmcp/logger.hpp"

namespace nmcp {

ActivityTracker::ActivityTracker(NowFn now) : now_(std::move(now)) {
}

std::shared_ptr<ActivityTracker::Counters> ActivityTracker::find(const std::string& server) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(server);
    return it == counters_.end() ? nullptr : it->second;
}

void ActivityTracker::recordRequest(const std::string& server) {
    // Counters exist from the first reconcile until deletion; a message still
    // in flight on a closing session must not resurrect them
    auto c = find(server);
    if (!c) {
        LOG_DEBUG("Dropping request activity for unknown server " + server);
        return;
    }
    std::int64_t nowMs = toEpochMillis(now_());
    // lastRequestAt only moves forward
    std::int64_t prev = c->lastRequestMs.load();
    while (prev < nowMs && !c->lastRequestMs.compare_exchange_weak(prev, nowMs)) {
    }
    c->totalRequests.fetch_add(1);
    notify(server);
}

void ActivityTracker::sessionOpened(const std::string& server) {
    auto c = find(server);
    if (!c) {
        LOG_DEBUG("Dropping session open for unknown server " + server);
        return;
    }
    c->connections.fetch_add(1);
    notify(server);
}

void ActivityTracker::sessionClosed(const std::string& server) {
    auto c = find(server);
    if (!c) {
        return;
    }
    std::uint32_t prev = c->connections.load();
    while (prev > 0 && !c->connections.compare_exchange_weak(prev, prev - 1)) {
    }
    notify(server);
}

void ActivityTracker::seed(const std::string& server, const ServerStatus& status) {
    const std::int64_t createdMs = status.createdAt ? toEpochMillis(*status.createdAt) : -1;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(server);
    if (it != counters_.end()) {
        if (it->second->createdMs == createdMs) {
            return;
        }
        // Same name, new record: the old server's counters do not carry over
        LOG_DEBUG("Resetting activity for recreated server " + server);
    }
    auto c = std::make_shared<Counters>();
    c->createdMs = createdMs;
    if (status.lastRequestAt) {
        c->lastRequestMs.store(toEpochMillis(*status.lastRequestAt));
    }
    c->totalRequests.store(status.totalRequests);
    // Connections never survive a restart; start from zero.
    counters_[server] = std::move(c);
}

bool ActivityTracker::known(const std::string& server) const {
    return find(server) != nullptr;
}

ActivitySnapshot ActivityTracker::snapshot(const std::string& server) const {
    ActivitySnapshot snap;
    auto c = find(server);
    if (!c) {
        return snap;
    }
    std::int64_t ms = c->lastRequestMs.load();
    if (ms >= 0) {
        snap.lastRequestAt = fromEpochMillis(ms);
    }
    snap.totalRequests = c->totalRequests.load();
    snap.currentConnections = c->connections.load();
    return snap;
}

void ActivityTracker::forget(const std::string& server) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.erase(server);
}

void ActivityTracker::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void ActivityTracker::notify(const std::string& server) {
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(server);
    }
}

}
