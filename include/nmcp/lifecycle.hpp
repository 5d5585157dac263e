/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "nmcp/resources.hpp"
#include "nmcp/types.hpp"

namespace nmcp {

// Everything the phase decision depends on. No I/O happens past this point.
struct LifecycleInput {
    Phase phase = Phase::Pending;
    bool bound = false;            // live unit exists
    bool ready = false;            // unit reports readiness
    bool stopRequested = false;
    bool startRequested = false;   // start accepted after the last stop
    bool evictionRequested = false;
    bool specChanged = false;      // generation moved past observedGeneration
    bool failureRecoverable = false;
    std::optional<TimePoint> lastRequestAt;
    std::optional<TimePoint> startedAt;
    std::chrono::seconds idleTimeout{60};
    TimePoint now{};
};

// Phase the server should be driven to. Starting means "needs a workload":
// the controller still has to pass admission before it may write it.
[[nodiscard]] Phase desiredPhase(const LifecycleInput& in);

[[nodiscard]] bool canTransition(Phase from, Phase to) noexcept;

// Phases that hold a workload.
[[nodiscard]] bool holdsWorkload(Phase phase) noexcept;
// Phases that count against pool capacity.
[[nodiscard]] bool isActive(Phase phase) noexcept;

// Last activity reference: the last request, or the start when there was none.
[[nodiscard]] std::optional<TimePoint> activityReference(const std::optional<TimePoint>& lastRequestAt,
                                                         const std::optional<TimePoint>& startedAt);
[[nodiscard]] bool idleExpired(const LifecycleInput& in);
// Time until a Running server would turn Idle; nullopt when it already has.
[[nodiscard]] std::optional<std::chrono::milliseconds> untilIdle(const LifecycleInput& in);

// Longest-idle Idle server among candidates, skipping `exclude`.
[[nodiscard]] std::optional<std::string> selectEvictionCandidate(const std::vector<Server>& servers,
                                                                 const std::string& exclude = {});
// Among active servers, the one to give up first when a pool is over admitted:
// Idle before Running, then oldest activity, then name.
[[nodiscard]] std::optional<std::string> selectOverAdmissionVictim(const std::vector<Server>& servers);

}
