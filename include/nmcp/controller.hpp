/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "nmcp/activity.hpp"
#include "nmcp/config.hpp"
#include "nmcp/lifecycle.hpp"
#include "nmcp/store.hpp"
#include "nmcp/work_queue.hpp"
#include "nmcp/workload.hpp"

namespace nmcp {

enum class PlanAction : std::uint8_t {
    Hold,             // nothing to drive, refresh counters only
    FailPoolNotFound,
    FailInvalidSpec,
    Teardown,         // Stopping, delete the unit, Stopped
    Defer,            // wait for pool capacity
    Admit,            // create the unit, Starting
    AwaitReadiness,
    Observe           // Running or Idle
};

// Observed facts for one server, gathered by the controller before planning.
struct PlanInput {
    Phase phase = Phase::Pending;
    bool poolFound = true;
    Error templateError;
    UnitState unit = UnitState::Absent;
    bool stopRequested = false;
    bool startRequested = false;
    bool evictionRequested = false;
    bool overAdmitted = false;
    bool specChanged = false;
    bool failureRecoverable = false;
    std::optional<TimePoint> lastRequestAt;
    std::optional<TimePoint> startedAt;
    std::chrono::seconds idleTimeout{60};
    int activeOthers = 0;
    int maxServers = 0;
    bool withinManagedLimit = true;
    std::optional<std::string> evictionCandidate;
    TimePoint now{};
};

struct ReconcilePlan {
    PlanAction action = PlanAction::Hold;
    Phase target = Phase::Pending;
    bool evicting = false;
    // An eviction was requested but the server is no longer idle
    bool evictionDropped = false;
    std::optional<std::string> evict;
};

[[nodiscard]] ReconcilePlan planReconcile(const PlanInput& in);
[[nodiscard]] const char* planActionToString(PlanAction action) noexcept;

struct ReconcileResult {
    bool ok = false;
    // Empty once the record is gone
    std::optional<Server> server;
    std::optional<std::chrono::milliseconds> requeueAfter;
    Error error;

    explicit operator bool() const noexcept { return ok; }
};

// Drives every Server toward its desired phase and is the only writer of
// Server and Pool status.
class Controller {
public:
    Controller(ResourceStore& store, WorkloadManager& workloads, ActivityTracker& activity,
               const Config& config, NowFn now = systemNow);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;
    Controller(Controller&&) = delete;
    Controller& operator=(Controller&&) = delete;

    [[nodiscard]] bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    ReconcileResult reconcile(const std::string& server);
    // No-op until start().
    void enqueue(const std::string& server);

    [[nodiscard]] Result<Pool> createPool(const std::string& name, const PoolSpec& spec);
    [[nodiscard]] Result<Pool> updatePool(const std::string& name, const PoolSpec& spec);
    [[nodiscard]] std::vector<Pool> listPools() const;
    [[nodiscard]] std::vector<Server> listServers() const;
    [[nodiscard]] Result<Pool> getPoolFor(const std::string& server) const;
    [[nodiscard]] Result<Server> getServer(const std::string& name) const;
    [[nodiscard]] Result<Server> createServer(const std::string& name, const ServerSpec& spec);
    [[nodiscard]] Error deleteServer(const std::string& name);
    [[nodiscard]] Result<Server> startServer(const std::string& name);
    [[nodiscard]] Result<Server> stopServer(const std::string& name);

    [[nodiscard]] static Error validatePool(const PoolSpec& spec);

    [[nodiscard]] std::chrono::milliseconds backoff(int attempt);
    // Per-server reconcile locks currently held in memory.
    [[nodiscard]] std::size_t keyLockCount() const;

private:
    ReconcileResult reconcileOnce(const std::string& name);
    ReconcileResult finalizeDeletion(const std::string& name);

    [[nodiscard]] PlanInput observe(const Server& server, const std::optional<Pool>& pool,
                                    const ServerStatus& status, TimePoint now);
    [[nodiscard]] Error writeStatus(Server& server, ServerStatus status);
    [[nodiscard]] Error removeUnit(const std::string& name);
    void updatePoolStatus(const std::string& pool);
    void wakePending(const std::string& pool, const std::string& except);
    void applyActivity(ServerStatus& status, const std::string& name) const;

    ReconcileResult failServer(Server& server, ServerStatus status, const std::string& conditionReason,
                               const std::string& message, TimePoint now,
                               std::optional<std::chrono::milliseconds> requeue);
    ReconcileResult teardown(Server& server, ServerStatus status, const ReconcilePlan& plan, TimePoint now);
    ReconcileResult hold(Server& server, ServerStatus status, const ReconcilePlan& plan, TimePoint now);
    ReconcileResult defer(Server& server, ServerStatus status, const PlanInput& in, const ReconcilePlan& plan,
                          const Pool& pool, TimePoint now);
    ReconcileResult admit(Server& server, ServerStatus status, const PlanInput& in, const Pool& pool, TimePoint now);
    ReconcileResult awaitReadiness(Server& server, ServerStatus status, TimePoint now);
    ReconcileResult observeRunning(Server& server, ServerStatus status, const PlanInput& in,
                                   const ReconcilePlan& plan, TimePoint now);

    template <typename Mutate>
    Result<Server> mutateStatus(const std::string& name, Mutate mutate);

    [[nodiscard]] std::shared_ptr<std::mutex> keyLock(const std::string& name);
    void releaseKeyLock(const std::string& name);
    ReconcileResult reconcileLocked(const std::string& server);
    void clearRetryState(const std::string& name);
    void process(const std::string& key, int workerId);
    void resyncLoop();

    ResourceStore& store_;
    WorkloadManager& workloads_;
    ActivityTracker& activity_;
    Config config_;
    NowFn now_;

    WorkQueue queue_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread resyncThread_;
    std::mutex resyncMutex_;
    std::condition_variable resyncWake_;
    int watchId_ = 0;

    mutable std::mutex locksMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> keyLocks_;

    // Retry bookkeeping lives in memory; a restart starts the budgets afresh
    std::mutex stateMutex_;
    std::unordered_map<std::string, int> attempts_;
    std::unordered_map<std::string, int> deferrals_;
    std::unordered_set<std::string> evictions_;
    std::mt19937 rng_;
};

}
