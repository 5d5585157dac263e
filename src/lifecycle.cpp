/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/lifecycle.hpp"
#include <algorithm>

namespace nmcp {

bool holdsWorkload(Phase phase) noexcept {
    return phase == Phase::Starting || phase == Phase::Running || phase == Phase::Idle ||
           phase == Phase::Stopping;
}

bool isActive(Phase phase) noexcept {
    return phase == Phase::Starting || phase == Phase::Running || phase == Phase::Idle;
}

bool canTransition(Phase from, Phase to) noexcept {
    if (from == to) return true;
    // Record deletion can end any phase
    if (to == Phase::Stopped && from != Phase::Running && from != Phase::Idle) return true;
    switch (from) {
        case Phase::Pending:  return to == Phase::Starting || to == Phase::Failed;
        case Phase::Starting: return to == Phase::Running || to == Phase::Failed || to == Phase::Stopping ||
                                     to == Phase::Pending;
        case Phase::Running:  return to == Phase::Idle || to == Phase::Stopping || to == Phase::Starting ||
                                     to == Phase::Failed;
        case Phase::Idle:     return to == Phase::Running || to == Phase::Stopping || to == Phase::Starting ||
                                     to == Phase::Failed;
        case Phase::Stopping: return to == Phase::Stopped || to == Phase::Failed || to == Phase::Pending ||
                                     to == Phase::Starting;
        case Phase::Stopped:  return to == Phase::Pending;
        case Phase::Failed:   return to == Phase::Pending || to == Phase::Starting;
    }
    return false;
}

std::optional<TimePoint> activityReference(const std::optional<TimePoint>& lastRequestAt,
                                           const std::optional<TimePoint>& startedAt) {
    if (lastRequestAt && startedAt) {
        return std::max(*lastRequestAt, *startedAt);
    }
    return lastRequestAt ? lastRequestAt : startedAt;
}

bool idleExpired(const LifecycleInput& in) {
    auto ref = activityReference(in.lastRequestAt, in.startedAt);
    if (!ref) {
        return false;
    }
    return in.now - *ref >= in.idleTimeout;
}

std::optional<std::chrono::milliseconds> untilIdle(const LifecycleInput& in) {
    auto ref = activityReference(in.lastRequestAt, in.startedAt);
    if (!ref) {
        return std::nullopt;
    }
    auto remaining = (*ref + in.idleTimeout) - in.now;
    if (remaining <= TimePoint::duration::zero()) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(remaining) + std::chrono::milliseconds(1);
}

Phase desiredPhase(const LifecycleInput& in) {
    if (in.stopRequested || in.evictionRequested) {
        if (in.bound) return Phase::Stopping;
        return Phase::Stopped;
    }

    if (in.phase == Phase::Failed) {
        if (in.specChanged || in.failureRecoverable) {
            return in.bound && in.ready ? Phase::Running : Phase::Starting;
        }
        return Phase::Failed;
    }

    if (in.phase == Phase::Stopped) {
        return Phase::Stopped;
    }

    if (in.phase == Phase::Stopping) {
        // A stop that was withdrawn mid-teardown still finishes the teardown,
        // then a pending start re-arms the server
        if (in.bound) return Phase::Stopping;
        return in.startRequested ? Phase::Starting : Phase::Stopped;
    }

    if (!in.bound || !in.ready) {
        return Phase::Starting;
    }

    return idleExpired(in) ? Phase::Idle : Phase::Running;
}

std::optional<std::string> selectEvictionCandidate(const std::vector<Server>& servers,
                                                   const std::string& exclude) {
    const Server* best = nullptr;
    std::optional<TimePoint> bestRef;
    for (const auto& s : servers) {
        if (s.name == exclude || s.status.phase != Phase::Idle) continue;
        auto ref = activityReference(s.status.lastRequestAt, s.status.startedAt);
        bool better = false;
        if (!best) {
            better = true;
        } else if (ref != bestRef) {
            // No reference at all sorts as the longest idle
            better = !ref || (bestRef && *ref < *bestRef);
        } else {
            better = s.name < best->name;
        }
        if (better) {
            best = &s;
            bestRef = ref;
        }
    }
    if (!best) return std::nullopt;
    return best->name;
}

std::optional<std::string> selectOverAdmissionVictim(const std::vector<Server>& servers) {
    std::vector<const Server*> active;
    for (const auto& s : servers) {
        if (isActive(s.status.phase)) active.push_back(&s);
    }
    if (active.empty()) return std::nullopt;

    auto rank = [](const Server* s) { return s->status.phase == Phase::Idle ? 0 : 1; };
    auto key = [](const Server* s) {
        auto ref = activityReference(s->status.lastRequestAt, s->status.startedAt);
        return ref ? toEpochMillis(*ref) : std::int64_t{0};
    };
    auto victim = *std::min_element(active.begin(), active.end(), [&](const Server* a, const Server* b) {
        if (rank(a) != rank(b)) return rank(a) < rank(b);
        if (key(a) != key(b)) return key(a) < key(b);
        return a->name < b->name;
    });
    return victim->name;
}

}
