/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/types.hpp"

namespace nmcp {

const char* phaseToString(Phase phase) noexcept {
    switch (phase) {
        case Phase::Pending:  return "Pending";
        case Phase::Starting: return "Starting";
        case Phase::Running:  return "Running";
        case Phase::Idle:     return "Idle";
        case Phase::Stopping: return "Stopping";
        case Phase::Stopped:  return "Stopped";
        case Phase::Failed:   return "Failed";
    }
    return "Unknown";
}

bool phaseFromString(const std::string& value, Phase& out) noexcept {
    static const Phase all[] = {Phase::Pending, Phase::Starting, Phase::Running, Phase::Idle,
                                Phase::Stopping, Phase::Stopped, Phase::Failed};
    for (Phase p : all) {
        if (value == phaseToString(p)) {
            out = p;
            return true;
        }
    }
    return false;
}

const char* errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:             return "None";
        case ErrorKind::NotFound:         return "NotFound";
        case ErrorKind::AlreadyExists:    return "AlreadyExists";
        case ErrorKind::CapacityExceeded: return "CapacityExceeded";
        case ErrorKind::SubstrateError:   return "SubstrateError";
        case ErrorKind::InvalidSpec:      return "InvalidSpec";
        case ErrorKind::TransportError:   return "TransportError";
        case ErrorKind::Conflict:         return "Conflict";
    }
    return "Unknown";
}

bool isRetryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::CapacityExceeded || kind == ErrorKind::SubstrateError;
}

std::int64_t toEpochMillis(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(std::int64_t ms) noexcept {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

}
