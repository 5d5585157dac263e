/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/controller.hpp"
#include "nmcp/logger.hpp"
#include <algorithm>

namespace nmcp {

namespace {

constexpr int kConflictRetries = 3;

// Failed condition reason that allows automatic recovery after failedRequeue
constexpr const char* kRetriesExhausted = "RetriesExhausted";
constexpr const char* kManualStart = "ManualStart";

std::chrono::milliseconds remaining(TimePoint deadline, TimePoint now) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    return std::max(left, std::chrono::milliseconds(1));
}

void clearRuntimeFlags(ServerStatus& status) {
    status.isRunning = false;
    status.isIdle = false;
}

}

const char* planActionToString(PlanAction action) noexcept {
    switch (action) {
        case PlanAction::Hold: return "hold";
        case PlanAction::FailPoolNotFound: return "fail-pool-not-found";
        case PlanAction::FailInvalidSpec: return "fail-invalid-spec";
        case PlanAction::Teardown: return "teardown";
        case PlanAction::Defer: return "defer";
        case PlanAction::Admit: return "admit";
        case PlanAction::AwaitReadiness: return "await-readiness";
        case PlanAction::Observe: return "observe";
    }
    return "unknown";
}

ReconcilePlan planReconcile(const PlanInput& in) {
    ReconcilePlan plan;

    if (!in.poolFound) {
        plan.action = PlanAction::FailPoolNotFound;
        plan.target = Phase::Failed;
        return plan;
    }

    const bool bound = in.unit == UnitState::Starting || in.unit == UnitState::Ready;

    LifecycleInput li;
    li.phase = in.phase;
    li.bound = bound;
    li.ready = in.unit == UnitState::Ready;
    li.stopRequested = in.stopRequested;
    li.startRequested = in.startRequested;
    li.specChanged = in.specChanged;
    li.failureRecoverable = in.failureRecoverable;
    li.lastRequestAt = in.lastRequestAt;
    li.startedAt = in.startedAt;
    li.idleTimeout = in.idleTimeout;
    li.now = in.now;

    Phase desired = desiredPhase(li);

    // Capacity evictions only take idle servers; over-admission takes whoever ranks last
    plan.evicting = in.overAdmitted || (in.evictionRequested && desired == Phase::Idle);
    plan.evictionDropped = in.evictionRequested && !plan.evicting;
    if (plan.evicting && !in.stopRequested) {
        li.evictionRequested = true;
        desired = desiredPhase(li);
    }

    switch (desired) {
        case Phase::Stopping:
        case Phase::Stopped:
            plan.target = Phase::Stopped;
            plan.action = (!bound && in.phase == Phase::Stopped) ? PlanAction::Hold : PlanAction::Teardown;
            return plan;
        case Phase::Failed:
            plan.target = Phase::Failed;
            plan.action = PlanAction::Hold;
            return plan;
        case Phase::Starting:
            if (in.templateError.failed()) {
                plan.action = PlanAction::FailInvalidSpec;
                plan.target = Phase::Failed;
                return plan;
            }
            if (bound) {
                plan.action = PlanAction::AwaitReadiness;
                plan.target = Phase::Starting;
                return plan;
            }
            plan.target = Phase::Pending;
            if (!in.withinManagedLimit) {
                plan.action = PlanAction::Defer;
                return plan;
            }
            if (in.activeOthers >= in.maxServers) {
                plan.action = PlanAction::Defer;
                plan.evict = in.evictionCandidate;
                return plan;
            }
            plan.action = PlanAction::Admit;
            plan.target = Phase::Starting;
            return plan;
        case Phase::Running:
        case Phase::Idle:
            plan.action = PlanAction::Observe;
            plan.target = desired;
            return plan;
        case Phase::Pending:
            break;
    }
    plan.action = PlanAction::Hold;
    plan.target = in.phase;
    return plan;
}

Controller::Controller(ResourceStore& store, WorkloadManager& workloads, ActivityTracker& activity,
                       const Config& config, NowFn now)
    : store_(store), workloads_(workloads), activity_(activity), config_(config),
      now_(now ? std::move(now) : NowFn(systemNow)), queue_(config.workers),
      rng_(std::random_device{}()) {
    LOG_DEBUG("Controller created - workers: " + std::to_string(config_.workers));
}

Controller::~Controller() {
    stop();
}

bool Controller::start() {
    if (running_.load()) {
        LOG_WARN("Controller already running");
        return false;
    }

    shutdown_.store(false);
    if (!queue_.start([this](const std::string& key, int workerId) { process(key, workerId); })) {
        LOG_ERROR("Failed to start reconcile queue");
        return false;
    }
    running_.store(true);

    watchId_ = store_.watch([this](ResourceKind kind, WatchEventType type, const std::string& name) {
        if (kind == ResourceKind::Server) {
            if (type == WatchEventType::Deleted) {
                queue_.forget(name);
            }
            enqueue(name);
            return;
        }
        for (const auto& server : store_.listServersInPool(name)) {
            enqueue(server.name);
        }
    });
    activity_.setListener([this](const std::string& server) { enqueue(server); });

    try {
        resyncThread_ = std::thread(&Controller::resyncLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start resync thread: " + std::string(e.what()));
        stop();
        return false;
    }

    LOG_INFO("Controller started");
    return true;
}

void Controller::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Stopping controller...");
    activity_.setListener(nullptr);
    store_.unwatch(watchId_);

    {
        std::lock_guard<std::mutex> lock(resyncMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    resyncWake_.notify_all();
    if (resyncThread_.joinable()) {
        resyncThread_.join();
    }

    queue_.stop();
    LOG_INFO("Controller stopped");
}

void Controller::enqueue(const std::string& server) {
    if (running_.load()) {
        queue_.add(server);
    }
}

void Controller::process(const std::string& key, int workerId) {
    LOG_TRACE("Worker " + std::to_string(workerId) + " reconciling " + key);
    auto result = reconcile(key);
    if (!result) {
        LOG_WARN("Reconcile of " + key + " failed (" + errorKindToString(result.error.kind) + "): " +
                 result.error.message);
    }
    if (!running_.load()) {
        return;
    }
    if (result.requeueAfter) {
        queue_.addAfter(key, *result.requeueAfter);
    } else if (!result) {
        queue_.addAfter(key, backoff(1));
    }
}

void Controller::resyncLoop() {
    setThreadName("Resync");
    LOG_DEBUG("Resync loop started");

    while (!shutdown_.load()) {
        try {
            for (const auto& server : store_.listServers()) {
                enqueue(server.name);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Resync error: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(resyncMutex_);
        resyncWake_.wait_for(lock, config_.resyncInterval, [this] { return shutdown_.load(); });
    }

    LOG_DEBUG("Resync loop stopped");
    clearThreadName();
}

std::chrono::milliseconds Controller::backoff(int attempt) {
    const auto base = config_.backoffBase.count();
    const auto cap = config_.backoffCap.count();
    long long delay = base;
    for (int i = 1; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    delay = std::min<long long>(delay, cap);

    std::lock_guard<std::mutex> lock(stateMutex_);
    std::uniform_real_distribution<double> jitter(0.8, 1.2);
    auto jittered = static_cast<long long>(static_cast<double>(delay) * jitter(rng_));
    jittered = std::min<long long>(jittered, cap);
    return std::chrono::milliseconds(std::max<long long>(jittered, 1));
}

std::shared_ptr<std::mutex> Controller::keyLock(const std::string& name) {
    std::lock_guard<std::mutex> lock(locksMutex_);
    auto& slot = keyLocks_[name];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void Controller::releaseKeyLock(const std::string& name) {
    std::lock_guard<std::mutex> lock(locksMutex_);
    auto it = keyLocks_.find(name);
    // Another caller holding or waiting on the mutex keeps it alive
    if (it != keyLocks_.end() && it->second.use_count() == 1) {
        keyLocks_.erase(it);
    }
}

std::size_t Controller::keyLockCount() const {
    std::lock_guard<std::mutex> lock(locksMutex_);
    return keyLocks_.size();
}

void Controller::clearRetryState(const std::string& name) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    attempts_.erase(name);
    deferrals_.erase(name);
    evictions_.erase(name);
}

ReconcileResult Controller::reconcile(const std::string& server) {
    ReconcileResult result;
    {
        auto lock = keyLock(server);
        std::lock_guard<std::mutex> guard(*lock);
        result = reconcileLocked(server);
    }
    if (result.ok && !result.server) {
        releaseKeyLock(server);
    }
    return result;
}

ReconcileResult Controller::reconcileLocked(const std::string& server) {
    ReconcileResult result;
    for (int attempt = 0; attempt < kConflictRetries; ++attempt) {
        try {
            result = reconcileOnce(server);
        } catch (const std::exception& e) {
            LOG_ERROR("Reconcile of " + server + " threw: " + e.what());
            result = ReconcileResult{};
            result.error = {ErrorKind::SubstrateError, e.what()};
            result.requeueAfter = backoff(1);
            return result;
        }
        if (result.ok || result.error.kind != ErrorKind::Conflict) {
            return result;
        }
        LOG_DEBUG("Write conflict on " + server + ", re-reading");
    }
    result.requeueAfter = backoff(1);
    return result;
}

void Controller::applyActivity(ServerStatus& status, const std::string& name) const {
    auto snap = activity_.snapshot(name);
    if (snap.lastRequestAt) {
        status.lastRequestAt = snap.lastRequestAt;
    }
    status.totalRequests = snap.totalRequests;
    status.currentConnections = snap.currentConnections;
}

Error Controller::writeStatus(Server& server, ServerStatus status) {
    status.observedGeneration = server.generation;
    if (status == server.status) {
        return {};
    }
    const Phase before = server.status.phase;
    if (before != status.phase && !canTransition(before, status.phase)) {
        LOG_WARN("Server " + server.name + ": unusual transition " + phaseToString(before) + " -> " +
                 phaseToString(status.phase));
    }

    Server updated = server;
    updated.status = std::move(status);
    auto written = store_.updateServerStatus(updated);
    if (!written) {
        return written.error;
    }
    server = std::move(written.value);
    if (before != server.status.phase) {
        LOG_INFO("Server " + server.name + ": " + phaseToString(before) + " -> " +
                 phaseToString(server.status.phase));
    }
    return {};
}

Error Controller::removeUnit(const std::string& name) {
    if (workloads_.state(name) == UnitState::Absent) {
        return {};
    }
    return workloads_.teardown(name);
}

PlanInput Controller::observe(const Server& server, const std::optional<Pool>& pool,
                              const ServerStatus& status, TimePoint now) {
    PlanInput in;
    in.phase = status.phase;
    in.now = now;
    in.unit = workloads_.state(server.name);
    in.stopRequested = status.stopRequested;
    const Condition* requested = findCondition(status, conditions::Requested);
    in.startRequested = !status.stopRequested && requested && requested->status &&
                        requested->reason == kManualStart;
    in.specChanged = server.generation > status.observedGeneration;
    in.lastRequestAt = status.lastRequestAt;
    in.startedAt = status.startedAt;

    if (status.phase == Phase::Failed) {
        const Condition* failed = findCondition(status, conditions::Failed);
        in.failureRecoverable = failed && failed->reason == kRetriesExhausted &&
                                now - failed->lastTransitionTime >= config_.failedRequeue;
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        in.evictionRequested = evictions_.count(server.name) > 0;
    }

    if (!pool) {
        in.poolFound = false;
        return in;
    }

    in.idleTimeout = std::chrono::seconds(effectiveIdleTimeout(*pool, server));
    in.maxServers = pool->spec.maxServers;
    in.templateError = WorkloadManager::validate(resolveTemplate(*pool, server));

    // Live membership, re-read at decision time
    auto members = store_.listServersInPool(pool->name);
    for (auto& member : members) {
        if (member.name == server.name) {
            member.status = status;
        }
    }

    std::vector<const Server*> byAge;
    for (const auto& member : members) {
        byAge.push_back(&member);
    }
    std::sort(byAge.begin(), byAge.end(), [](const Server* a, const Server* b) {
        auto ka = a->status.createdAt ? toEpochMillis(*a->status.createdAt) : std::int64_t{0};
        auto kb = b->status.createdAt ? toEpochMillis(*b->status.createdAt) : std::int64_t{0};
        if (ka != kb) return ka < kb;
        return a->name < b->name;
    });
    for (std::size_t i = 0; i < byAge.size(); ++i) {
        if (byAge[i]->name == server.name) {
            in.withinManagedLimit = static_cast<int>(i) < pool->spec.maxServersLimit;
            break;
        }
    }

    std::vector<Server> active;
    for (const auto& member : members) {
        const bool live = member.name == server.name
                              ? in.unit == UnitState::Starting || in.unit == UnitState::Ready
                              : workloads_.isBound(member.name);
        if (member.name != server.name && (isActive(member.status.phase) || live)) {
            ++in.activeOthers;
        }
        if (isActive(member.status.phase) && live) {
            active.push_back(member);
        }
    }

    if (static_cast<int>(active.size()) > pool->spec.maxServers) {
        auto victim = selectOverAdmissionVictim(active);
        in.overAdmitted = victim && *victim == server.name;
    }
    in.evictionCandidate = selectEvictionCandidate(members, server.name);
    return in;
}

ReconcileResult Controller::reconcileOnce(const std::string& name) {
    const TimePoint now = now_();

    auto fetched = store_.getServer(name);
    if (!fetched) {
        if (fetched.error.kind == ErrorKind::NotFound) {
            return finalizeDeletion(name);
        }
        ReconcileResult result;
        result.error = fetched.error;
        return result;
    }
    Server server = std::move(fetched.value);

    activity_.seed(name, server.status);
    ServerStatus status = server.status;
    applyActivity(status, name);

    std::optional<Pool> pool;
    auto poolRead = store_.getPool(server.spec.pool);
    if (poolRead) {
        pool = std::move(poolRead.value);
    } else if (poolRead.error.kind != ErrorKind::NotFound) {
        ReconcileResult result;
        result.error = poolRead.error;
        result.requeueAfter = backoff(1);
        return result;
    }

    const PlanInput in = observe(server, pool, status, now);
    const ReconcilePlan plan = planReconcile(in);
    LOG_TRACE("Server " + name + " plan: " + planActionToString(plan.action));

    if (plan.evictionDropped) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        evictions_.erase(name);
    }

    ReconcileResult result;
    switch (plan.action) {
        case PlanAction::FailPoolNotFound: {
            const std::string message = "pool " + server.spec.pool + " not found";
            setCondition(status, conditions::PoolNotFound, true, "PoolNotFound", message, now);
            result = failServer(server, std::move(status), "PoolNotFound", message, now, std::nullopt);
            return result;
        }
        case PlanAction::FailInvalidSpec:
            result = failServer(server, std::move(status), "InvalidSpec", in.templateError.message, now,
                                std::nullopt);
            break;
        case PlanAction::Teardown:
            result = teardown(server, std::move(status), plan, now);
            break;
        case PlanAction::Defer:
            result = defer(server, std::move(status), in, plan, *pool, now);
            break;
        case PlanAction::Admit:
            result = admit(server, std::move(status), in, *pool, now);
            break;
        case PlanAction::AwaitReadiness:
            result = awaitReadiness(server, std::move(status), now);
            break;
        case PlanAction::Observe:
            result = observeRunning(server, std::move(status), in, plan, now);
            break;
        case PlanAction::Hold:
            result = hold(server, std::move(status), plan, now);
            break;
    }

    if (result.ok || result.error.kind != ErrorKind::Conflict) {
        updatePoolStatus(server.spec.pool);
    }
    return result;
}

ReconcileResult Controller::finalizeDeletion(const std::string& name) {
    ReconcileResult result;
    Error err = removeUnit(name);
    if (err.failed()) {
        LOG_ERROR("Teardown of deleted server " + name + " failed: " + err.message);
        result.error = err;
        result.requeueAfter = backoff(1);
        return result;
    }

    activity_.forget(name);
    queue_.forget(name);
    clearRetryState(name);
    LOG_DEBUG("Server " + name + " deleted, workload released");

    // A freed slot may admit a waiting server in any pool
    for (const auto& server : store_.listServers()) {
        if (server.status.phase == Phase::Pending) {
            enqueue(server.name);
        }
    }
    result.ok = true;
    return result;
}

ReconcileResult Controller::failServer(Server& server, ServerStatus status, const std::string& conditionReason,
                                       const std::string& message, TimePoint now,
                                       std::optional<std::chrono::milliseconds> requeue) {
    ReconcileResult result;
    Error err = removeUnit(server.name);
    if (err.failed()) {
        result.error = err;
        result.requeueAfter = backoff(1);
        return result;
    }

    const Phase before = status.phase;
    if (holdsWorkload(before)) {
        status.stoppedAt = now;
    }
    if (before != Phase::Failed) {
        // Entering Failed always starts a fresh recovery clock
        removeCondition(status, conditions::Failed);
    }
    status.phase = Phase::Failed;
    clearRuntimeFlags(status);
    status.reason = message;
    setCondition(status, conditions::Failed, true, conditionReason, message, now);

    err = writeStatus(server, std::move(status));
    if (err.failed()) {
        result.error = err;
        return result;
    }
    if (before != Phase::Failed) {
        LOG_WARN("Server " + server.name + " failed: " + message);
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        attempts_.erase(server.name);
        deferrals_.erase(server.name);
    }
    result.ok = true;
    result.server = server;
    result.requeueAfter = requeue;
    return result;
}

ReconcileResult Controller::teardown(Server& server, ServerStatus status, const ReconcilePlan& plan,
                                     TimePoint now) {
    ReconcileResult result;
    const bool hasUnit = workloads_.state(server.name) != UnitState::Absent;

    if (plan.evicting && !status.stopRequested) {
        setCondition(status, conditions::Requested, false, "Eviction",
                     "released to make room in pool " + server.spec.pool, now);
    }

    if (hasUnit || holdsWorkload(status.phase)) {
        if (status.phase != Phase::Stopping) {
            status.phase = Phase::Stopping;
            Error err = writeStatus(server, status);
            if (err.failed()) {
                result.error = err;
                return result;
            }
        }

        Error err = removeUnit(server.name);
        if (err.failed()) {
            int attempt = 0;
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                attempt = ++attempts_[server.name];
            }
            status.reason = "teardown failed: " + err.message;
            Error written = writeStatus(server, std::move(status));
            if (written.failed()) {
                LOG_WARN("Could not record teardown failure for " + server.name + ": " + written.message);
            }
            result.error = err;
            result.server = server;
            result.requeueAfter = backoff(attempt);
            return result;
        }
    }

    if (status.phase != Phase::Stopped || !status.stoppedAt) {
        status.stoppedAt = now;
    }
    status.phase = Phase::Stopped;
    clearRuntimeFlags(status);
    status.reason = status.stopRequested ? "stopped on request"
                    : plan.evicting      ? "evicted to free pool capacity"
                                         : status.reason;

    Error err = writeStatus(server, std::move(status));
    if (err.failed()) {
        result.error = err;
        return result;
    }

    clearRetryState(server.name);
    wakePending(server.spec.pool, server.name);

    result.ok = true;
    result.server = server;
    if (config_.stoppedRetention.count() > 0 && server.status.stoppedAt) {
        result.requeueAfter = remaining(*server.status.stoppedAt + config_.stoppedRetention, now);
    }
    return result;
}

ReconcileResult Controller::hold(Server& server, ServerStatus status, const ReconcilePlan& plan, TimePoint now) {
    ReconcileResult result;

    // Pending, Stopped and Failed never keep a unit
    Error err = removeUnit(server.name);
    if (err.failed()) {
        result.error = err;
        result.requeueAfter = backoff(1);
        return result;
    }

    if (plan.target == Phase::Stopped && config_.stoppedRetention.count() > 0 && status.stoppedAt) {
        const TimePoint deadline = *status.stoppedAt + config_.stoppedRetention;
        if (now >= deadline) {
            LOG_INFO("Server " + server.name + " stopped longer than retention, deleting");
            err = store_.deleteServer(server.name);
            if (err.failed() && err.kind != ErrorKind::NotFound) {
                result.error = err;
                result.requeueAfter = backoff(1);
                return result;
            }
            return finalizeDeletion(server.name);
        }
        result.requeueAfter = remaining(deadline, now);
    }

    if (plan.target == Phase::Failed) {
        const Condition* failed = findCondition(status, conditions::Failed);
        if (failed && failed->reason == kRetriesExhausted) {
            result.requeueAfter = remaining(failed->lastTransitionTime + config_.failedRequeue, now);
        }
    }

    err = writeStatus(server, std::move(status));
    if (err.failed()) {
        result.error = err;
        result.requeueAfter.reset();
        return result;
    }
    result.ok = true;
    result.server = server;
    return result;
}

ReconcileResult Controller::defer(Server& server, ServerStatus status, const PlanInput& in,
                                  const ReconcilePlan& plan, const Pool& pool, TimePoint now) {
    ReconcileResult result;

    std::string reason;
    std::string message;
    if (!in.withinManagedLimit) {
        reason = "ManagedLimitReached";
        message = "pool " + pool.name + " manages at most " + std::to_string(pool.spec.maxServersLimit) +
                  " servers";
    } else {
        reason = "PoolAtCapacity";
        message = "pool " + pool.name + " at capacity (" + std::to_string(in.activeOthers) + "/" +
                  std::to_string(pool.spec.maxServers) + " active)";
    }

    if (plan.evict) {
        bool fresh = false;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            fresh = evictions_.insert(*plan.evict).second;
        }
        if (fresh) {
            LOG_INFO("Evicting idle server " + *plan.evict + " to admit " + server.name);
        }
        enqueue(*plan.evict);
    }

    status.phase = Phase::Pending;
    clearRuntimeFlags(status);
    status.reason = message;
    setCondition(status, conditions::CapacityExceeded, true, reason, message, now);

    Error err = writeStatus(server, std::move(status));
    if (err.failed()) {
        result.error = err;
        return result;
    }

    int deferral = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        deferral = ++deferrals_[server.name];
    }
    result.ok = true;
    result.server = server;
    result.requeueAfter = backoff(deferral);
    return result;
}

ReconcileResult Controller::admit(Server& server, ServerStatus status, const PlanInput& in, const Pool& pool,
                                  TimePoint now) {
    ReconcileResult result;

    auto endpoint = workloads_.ensure(server.name, resolveTemplate(pool, server));
    if (!endpoint) {
        if (endpoint.error.kind == ErrorKind::InvalidSpec) {
            return failServer(server, std::move(status), "InvalidSpec", endpoint.error.message, now, std::nullopt);
        }

        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            attempt = ++attempts_[server.name];
        }
        LOG_WARN("Workload for " + server.name + " not created (attempt " + std::to_string(attempt) + "/" +
                 std::to_string(config_.maxAttempts) + "): " + endpoint.error.message);

        if (attempt >= config_.maxAttempts) {
            return failServer(server, std::move(status), kRetriesExhausted,
                              "workload creation failed after " + std::to_string(attempt) +
                                  " attempts: " + endpoint.error.message,
                              now, std::chrono::duration_cast<std::chrono::milliseconds>(config_.failedRequeue));
        }

        status.phase = Phase::Pending;
        clearRuntimeFlags(status);
        status.reason = endpoint.error.message;
        setCondition(status, conditions::WorkloadScheduled, false, "SubstrateError", endpoint.error.message, now);
        Error err = writeStatus(server, std::move(status));
        if (err.failed()) {
            result.error = err;
            return result;
        }
        result.ok = true;
        result.server = server;
        result.requeueAfter = backoff(attempt);
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        attempts_.erase(server.name);
        deferrals_.erase(server.name);
    }

    removeCondition(status, conditions::CapacityExceeded);
    removeCondition(status, conditions::PoolNotFound);
    if (status.phase == Phase::Failed) {
        removeCondition(status, conditions::Failed);
    }
    setCondition(status, conditions::WorkloadScheduled, true, "Created", endpoint.value.toString(), now);
    status.phase = Phase::Starting;
    status.startedAt = now;
    status.stoppedAt.reset();
    clearRuntimeFlags(status);
    status.reason.clear();

    Error err = writeStatus(server, status);
    if (err.failed()) {
        // The unit exists; the retry pass sees it bound and continues from there
        result.error = err;
        return result;
    }

    if (!workloads_.isReady(server.name)) {
        result.ok = true;
        result.server = server;
        result.requeueAfter = config_.readinessPoll;
        return result;
    }

    status = server.status;
    status.phase = Phase::Running;
    status.isRunning = true;
    err = writeStatus(server, std::move(status));
    if (err.failed()) {
        result.error = err;
        return result;
    }

    LifecycleInput li;
    li.lastRequestAt = server.status.lastRequestAt;
    li.startedAt = server.status.startedAt;
    li.idleTimeout = in.idleTimeout;
    li.now = now;
    result.ok = true;
    result.server = server;
    result.requeueAfter = untilIdle(li);
    return result;
}

ReconcileResult Controller::awaitReadiness(Server& server, ServerStatus status, TimePoint now) {
    ReconcileResult result;
    if (status.phase != Phase::Starting) {
        status.phase = Phase::Starting;
        if (!status.startedAt) {
            status.startedAt = now;
        }
    }
    clearRuntimeFlags(status);

    Error err = writeStatus(server, std::move(status));
    if (err.failed()) {
        result.error = err;
        return result;
    }
    result.ok = true;
    result.server = server;
    result.requeueAfter = config_.readinessPoll;
    return result;
}

ReconcileResult Controller::observeRunning(Server& server, ServerStatus status, const PlanInput& in,
                                           const ReconcilePlan& plan, TimePoint now) {
    ReconcileResult result;
    const Phase before = status.phase;

    if (before != Phase::Starting && before != Phase::Running && before != Phase::Idle) {
        // Adopted a unit that was created before the status write landed
        status.phase = Phase::Starting;
        if (!status.startedAt) {
            status.startedAt = now;
        }
        Error err = writeStatus(server, status);
        if (err.failed()) {
            result.error = err;
            return result;
        }
    }

    if (before == Phase::Idle && plan.target == Phase::Running) {
        setCondition(status, conditions::Requested, true, "Connection", "client activity resumed", now);
    } else if (before == Phase::Running && plan.target == Phase::Idle) {
        setCondition(status, conditions::Requested, false, "IdleTimeout",
                     "no client activity for " + std::to_string(in.idleTimeout.count()) + "s", now);
    }

    status.phase = plan.target;
    status.isRunning = true;
    status.isIdle = plan.target == Phase::Idle;
    status.stoppedAt.reset();
    status.reason.clear();
    removeCondition(status, conditions::CapacityExceeded);

    Error err = writeStatus(server, std::move(status));
    if (err.failed()) {
        result.error = err;
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        attempts_.erase(server.name);
        deferrals_.erase(server.name);
    }

    result.ok = true;
    result.server = server;
    if (plan.target == Phase::Running) {
        LifecycleInput li;
        li.lastRequestAt = server.status.lastRequestAt;
        li.startedAt = server.status.startedAt;
        li.idleTimeout = in.idleTimeout;
        li.now = now;
        result.requeueAfter = untilIdle(li);
    }
    return result;
}

void Controller::wakePending(const std::string& pool, const std::string& except) {
    for (const auto& member : store_.listServersInPool(pool)) {
        if (member.name != except && member.status.phase == Phase::Pending) {
            enqueue(member.name);
        }
    }
}

void Controller::updatePoolStatus(const std::string& name) {
    for (int attempt = 0; attempt < kConflictRetries; ++attempt) {
        auto pool = store_.getPool(name);
        if (!pool) {
            return;
        }

        PoolStatus status = pool.value.status;
        int active = 0;
        int managed = 0;
        for (const auto& member : store_.listServersInPool(name)) {
            ++managed;
            if (isActive(member.status.phase)) {
                ++active;
            }
        }
        if (active == status.activeServers && managed == status.managedServers && status.lastReconciledAt) {
            return;
        }
        status.activeServers = active;
        status.managedServers = managed;
        status.lastReconciledAt = now_();

        Pool updated = pool.value;
        updated.status = status;
        auto written = store_.updatePoolStatus(updated);
        if (written) {
            LOG_DEBUG("Pool " + name + ": " + std::to_string(active) + " active, " + std::to_string(managed) +
                      " managed");
            return;
        }
        if (written.error.kind != ErrorKind::Conflict) {
            LOG_ERROR("Failed to update status of pool " + name + ": " + written.error.message);
            return;
        }
    }
    LOG_WARN("Gave up updating status of pool " + name + " after repeated conflicts");
}

Error Controller::validatePool(const PoolSpec& spec) {
    if (spec.maxServers < 0) {
        return {ErrorKind::InvalidSpec, "maxServers must not be negative"};
    }
    if (spec.maxServersLimit < 0) {
        return {ErrorKind::InvalidSpec, "maxServersLimit must not be negative"};
    }
    if (spec.defaultIdleTimeout < 0) {
        return {ErrorKind::InvalidSpec, "defaultIdleTimeout must not be negative"};
    }
    return {};
}

Result<Pool> Controller::createPool(const std::string& name, const PoolSpec& spec) {
    Error invalid = validatePool(spec);
    if (invalid.failed()) {
        return Result<Pool>::failure(invalid);
    }
    Pool pool;
    pool.name = name;
    pool.spec = spec;
    auto created = store_.createPool(pool);
    if (created) {
        LOG_INFO("Pool " + name + " created (maxServers " + std::to_string(spec.maxServers) + ")");
    }
    return created;
}

Result<Pool> Controller::updatePool(const std::string& name, const PoolSpec& spec) {
    Error invalid = validatePool(spec);
    if (invalid.failed()) {
        return Result<Pool>::failure(invalid);
    }
    for (int attempt = 0; attempt < kConflictRetries; ++attempt) {
        auto current = store_.getPool(name);
        if (!current) {
            return current;
        }
        Pool pool = current.value;
        pool.spec = spec;
        auto updated = store_.updatePoolSpec(pool);
        if (updated || updated.error.kind != ErrorKind::Conflict) {
            return updated;
        }
    }
    return Result<Pool>::failure(ErrorKind::Conflict, "pool " + name + " kept changing");
}

std::vector<Pool> Controller::listPools() const {
    return store_.listPools();
}

std::vector<Server> Controller::listServers() const {
    return store_.listServers();
}

Result<Pool> Controller::getPoolFor(const std::string& server) const {
    auto found = store_.getServer(server);
    if (!found) {
        return Result<Pool>::failure(found.error);
    }
    auto pool = store_.getPool(found.value.spec.pool);
    if (!pool && pool.error.kind == ErrorKind::NotFound) {
        return Result<Pool>::failure(ErrorKind::NotFound, "pool " + found.value.spec.pool + " not found");
    }
    return pool;
}

Result<Server> Controller::getServer(const std::string& name) const {
    return store_.getServer(name);
}

Result<Server> Controller::createServer(const std::string& name, const ServerSpec& spec) {
    if (spec.idleTimeout < 0) {
        return Result<Server>::failure(ErrorKind::InvalidSpec, "idleTimeout must not be negative");
    }
    Server server;
    server.name = name;
    server.spec = spec;
    server.status.phase = Phase::Pending;
    server.status.createdAt = now_();

    auto created = store_.createServer(server);
    if (created) {
        LOG_INFO("Server " + name + " created in pool " + spec.pool);
    }
    return created;
}

Error Controller::deleteServer(const std::string& name) {
    Error err = store_.deleteServer(name);
    if (err.failed()) {
        return err;
    }
    // Drop any pending retry; the next pass sees the record gone and tears down
    queue_.forget(name);
    enqueue(name);
    LOG_INFO("Server " + name + " deleted");
    return {};
}

template <typename Mutate>
Result<Server> Controller::mutateStatus(const std::string& name, Mutate mutate) {
    for (int attempt = 0; attempt < kConflictRetries; ++attempt) {
        auto current = store_.getServer(name);
        if (!current) {
            return current;
        }
        Server server = current.value;
        mutate(server.status);
        if (server.status == current.value.status) {
            return current;
        }
        auto written = store_.updateServerStatus(server);
        if (written || written.error.kind != ErrorKind::Conflict) {
            return written;
        }
    }
    return Result<Server>::failure(ErrorKind::Conflict, "server " + name + " kept changing");
}

Result<Server> Controller::startServer(const std::string& name) {
    const TimePoint now = now_();
    auto result = mutateStatus(name, [&](ServerStatus& status) {
        status.stopRequested = false;
        if (status.phase == Phase::Stopped || status.phase == Phase::Failed) {
            status.phase = Phase::Pending;
            status.reason.clear();
            removeCondition(status, conditions::Failed);
        }
        setCondition(status, conditions::Requested, true, kManualStart, "start requested", now);
    });
    if (result) {
        clearRetryState(name);
        LOG_INFO("Start requested for server " + name);
        enqueue(name);
    }
    return result;
}

Result<Server> Controller::stopServer(const std::string& name) {
    const TimePoint now = now_();
    auto result = mutateStatus(name, [&](ServerStatus& status) {
        status.stopRequested = true;
        setCondition(status, conditions::Requested, false, "ManualStop", "stop requested", now);
    });
    if (result) {
        LOG_INFO("Stop requested for server " + name);
        enqueue(name);
    }
    return result;
}

}
