/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "nmcp/activity.hpp"
#include "nmcp/config.hpp"
#include "nmcp/controller.hpp"
#include "nmcp/logger.hpp"
#include "nmcp/object_store.hpp"
#include "nmcp/runtime.hpp"
#include "nmcp/store.hpp"
#include "nmcp/workload.hpp"

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

namespace nmcp::testing {

// Wall clock that only moves when told to. Whole seconds keep persisted
// timestamps exact.
class ManualClock {
public:
    ManualClock() : ms_(toEpochMillis(TimePoint(std::chrono::seconds(1700000000)))) {}

    TimePoint now() const { return fromEpochMillis(ms_.load()); }
    void advance(std::chrono::milliseconds by) { ms_.fetch_add(by.count()); }
    NowFn fn() { return [this] { return now(); }; }

private:
    std::atomic<std::int64_t> ms_;
};

class FakeRuntime;

class FakeChannel final : public Channel {
public:
    FakeChannel(FakeRuntime& runtime, std::string unit) : runtime_(runtime), unit_(std::move(unit)) {}

    void start(LineHandler onLine, CloseHandler onClose) override {
        std::string reason;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!terminated_) {
                onLine_ = std::move(onLine);
                onClose_ = std::move(onClose);
                return;
            }
            reason = reason_;
        }
        if (onClose) onClose(reason);
    }

    Error send(const std::string& line) override;

    void close() noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        onLine_ = nullptr;
        onClose_ = nullptr;
    }

    // Process side: emit one stdout line to this subscriber.
    void emit(const std::string& line) {
        LineHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || terminated_) return;
            handler = onLine_;
        }
        if (handler) handler(line);
    }

    // Process side: the unit went away.
    void terminate(const std::string& reason) {
        CloseHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (terminated_) return;
            terminated_ = true;
            reason_ = reason;
            if (!closed_) handler = onClose_;
            onLine_ = nullptr;
            onClose_ = nullptr;
        }
        if (handler) handler(reason);
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ || terminated_;
    }

private:
    FakeRuntime& runtime_;
    std::string unit_;

    mutable std::mutex mutex_;
    LineHandler onLine_;
    CloseHandler onClose_;
    bool closed_ = false;
    bool terminated_ = false;
    std::string reason_;
};

// In-memory substrate. Units answer JSON-RPC requests with an echo of the
// method and params; a "test/notify" message makes the unit broadcast a
// notification to every channel.
class FakeRuntime final : public WorkloadRuntime {
public:
    Result<Endpoint> createUnit(const std::string& name, const UnitSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++creates;
        if (failCreates > 0) {
            --failCreates;
            return Result<Endpoint>::failure(ErrorKind::SubstrateError, "quota exceeded");
        }
        if (units_.count(name) > 0) {
            return Result<Endpoint>::failure(ErrorKind::AlreadyExists, "unit " + name + " exists");
        }
        Endpoint ep;
        ep.unit = name;
        ep.transport = spec.transport.type;
        ep.host = "127.0.0.1";
        ep.port = spec.transport.port;
        units_[name] = readyOnCreate ? UnitState::Ready : UnitState::Starting;
        endpoints_[name] = ep;
        specs[name] = spec;
        return Result<Endpoint>::success(ep);
    }

    UnitState unitState(const std::string& name) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = units_.find(name);
        return it == units_.end() ? UnitState::Absent : it->second;
    }

    std::optional<Endpoint> endpoint(const std::string& name) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = endpoints_.find(name);
        if (it == endpoints_.end()) return std::nullopt;
        return it->second;
    }

    Error deleteUnit(const std::string& name) override {
        std::vector<std::shared_ptr<FakeChannel>> channels;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++deletes;
            if (units_.erase(name) == 0) {
                return {ErrorKind::NotFound, "unit " + name + " not found"};
            }
            endpoints_.erase(name);
            channels = std::move(channels_[name]);
            channels_.erase(name);
        }
        for (auto& ch : channels) ch->terminate("unit deleted");
        return {};
    }

    Result<std::shared_ptr<Channel>> openChannel(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = units_.find(name);
        if (it == units_.end() || it->second != UnitState::Ready) {
            return Result<std::shared_ptr<Channel>>::failure(ErrorKind::TransportError, "unit not ready");
        }
        auto ch = std::make_shared<FakeChannel>(*this, name);
        channels_[name].push_back(ch);
        return Result<std::shared_ptr<Channel>>::success(ch);
    }

    void markReady(const std::string& unit) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (units_.count(unit) > 0) units_[unit] = UnitState::Ready;
    }

    // The process dies on its own; the unit lingers as Exited.
    void crash(const std::string& unit) {
        std::vector<std::shared_ptr<FakeChannel>> channels;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (units_.count(unit) == 0) return;
            units_[unit] = UnitState::Exited;
            channels = std::move(channels_[unit]);
            channels_.erase(unit);
        }
        for (auto& ch : channels) ch->terminate("process exited");
    }

    // Called by FakeChannel::send: the process reads one stdin line.
    void input(const std::string& unit, const std::string& line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            received.push_back(line);
        }
        auto msg = nlohmann::json::parse(line, nullptr, false);
        if (msg.is_discarded() || !msg.contains("method")) return;

        if (msg.contains("id")) {
            nlohmann::json reply = {{"jsonrpc", "2.0"},
                                    {"id", msg["id"]},
                                    {"result", {{"echo", msg["method"]}, {"params", msg.value("params", nlohmann::json())}}}};
            broadcast(unit, reply.dump());
        } else if (msg["method"] == "test/notify") {
            broadcast(unit, nlohmann::json({{"jsonrpc", "2.0"}, {"method", "notifications/message"}}).dump());
        }
    }

    void broadcast(const std::string& unit, const std::string& line) {
        std::vector<std::shared_ptr<FakeChannel>> channels;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = channels_.find(unit);
            if (it != channels_.end()) channels = it->second;
        }
        for (auto& ch : channels) ch->emit(line);
    }

    std::size_t unitCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return units_.size();
    }

    std::atomic<int> creates{0};
    std::atomic<int> deletes{0};
    std::atomic<int> failCreates{0};
    std::atomic<bool> readyOnCreate{true};
    std::map<std::string, UnitSpec> specs;
    std::vector<std::string> received;

private:
    mutable std::mutex mutex_;
    std::map<std::string, UnitState> units_;
    std::map<std::string, Endpoint> endpoints_;
    std::map<std::string, std::vector<std::shared_ptr<FakeChannel>>> channels_;
};

inline Error FakeChannel::send(const std::string& line) {
    if (isClosed()) {
        return {ErrorKind::TransportError, "channel closed"};
    }
    runtime_.input(unit_, line);
    return {};
}

inline Config testConfig() {
    Config c;
    c.workers = 2;
    c.backoffBase = std::chrono::milliseconds(10);
    c.backoffCap = std::chrono::milliseconds(100);
    c.maxAttempts = 3;
    c.failedRequeue = std::chrono::seconds(60);
    c.readinessPoll = std::chrono::milliseconds(10);
    c.sessionReadyTimeout = std::chrono::milliseconds(200);
    c.resyncInterval = std::chrono::seconds(1);
    return c;
}

inline PoolSpec poolSpec(int maxServers, int idleTimeout = 60) {
    PoolSpec spec;
    spec.maxServers = maxServers;
    spec.maxServersLimit = 100;
    spec.defaultIdleTimeout = idleTimeout;
    spec.serverTemplate.image = "mcp/echo:latest";
    spec.serverTemplate.command = {"/bin/cat"};
    return spec;
}

inline ServerSpec serverIn(const std::string& pool) {
    ServerSpec spec;
    spec.pool = pool;
    return spec;
}

// Controller over an in-memory store and the fake runtime.
struct Harness {
    explicit Harness(const Config& cfg = testConfig())
        : store(objects), workloads(runtime), activity(clock.fn()), config(cfg),
          controller(store, workloads, activity, config, clock.fn()) {
        Logger::setLevel(LogLevel::WARN);
    }

    Phase phaseOf(const std::string& name) const {
        auto s = store.getServer(name);
        return s ? s.value.status.phase : Phase::Pending;
    }

    Server server(const std::string& name) const {
        return store.getServer(name).value;
    }

    bool bound(const std::string& name) const { return workloads.isBound(name); }

    ManualClock clock;
    ObjectStore objects;
    ResourceStore store;
    FakeRuntime runtime;
    WorkloadManager workloads;
    ActivityTracker activity;
    Config config;
    Controller controller;
};

// A workload is bound exactly when the phase says one exists.
inline bool bindingMatchesPhase(const Harness& h) {
    for (const auto& s : h.store.listServers()) {
        bool bound = h.workloads.isBound(s.name);
        if (bound != holdsWorkload(s.status.phase)) {
            fprintf(stderr, "server %s: phase %s but bound=%d\n", s.name.c_str(), phaseToString(s.status.phase),
                    bound ? 1 : 0);
            return false;
        }
    }
    return true;
}

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

}
