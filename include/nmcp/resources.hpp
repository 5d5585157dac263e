/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "nmcp/types.hpp"

namespace nmcp {

enum class TransportType : std::uint8_t { Stdio, Sse };

struct Transport {
    TransportType type = TransportType::Stdio;
    // Only meaningful for Sse
    std::uint16_t port = 0;

    [[nodiscard]] std::string toString() const;
};

struct EnvVar {
    std::string name;
    std::string value;
};

struct ResourceLimits {
    std::string cpu;
    std::string memory;
};

struct ServerTemplate {
    std::string image;
    std::vector<std::string> command;
    std::vector<std::string> args;
    std::vector<EnvVar> env;
    ResourceLimits limits;
    Transport transport;
};

struct PoolSpec {
    int maxServers = 100;       // concurrently active
    int maxServersLimit = 100;  // managed at all
    int defaultIdleTimeout = 60;
    ServerTemplate serverTemplate;
};

struct PoolStatus {
    int activeServers = 0;
    int managedServers = 0;
    std::optional<TimePoint> lastReconciledAt;
};

struct Pool {
    std::string name;
    std::uint64_t resourceVersion = 0;
    std::uint64_t generation = 0;
    PoolSpec spec;
    PoolStatus status;
};

struct Condition {
    std::string type;
    bool status = true;
    std::string reason;
    std::string message;
    TimePoint lastTransitionTime{};
};

namespace conditions {
constexpr const char* Requested = "Requested";
constexpr const char* WorkloadScheduled = "WorkloadScheduled";
constexpr const char* CapacityExceeded = "CapacityExceeded";
constexpr const char* PoolNotFound = "PoolNotFound";
constexpr const char* Failed = "Failed";
}

struct ServerSpec {
    std::string pool = "default";
    // Unset keeps the pool template's transport
    std::optional<Transport> transport;
    std::vector<EnvVar> env;
    int idleTimeout = 0;  // 0 falls back to the pool default
    std::vector<std::string> command;
    std::vector<std::string> args;
};

struct ServerStatus {
    Phase phase = Phase::Pending;
    std::optional<TimePoint> createdAt;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> stoppedAt;
    std::optional<TimePoint> lastRequestAt;
    bool isRunning = false;
    bool isIdle = false;
    std::uint64_t totalRequests = 0;
    std::uint32_t currentConnections = 0;
    bool stopRequested = false;
    std::string reason;
    std::uint64_t observedGeneration = 0;
    std::vector<Condition> conditions;
};

struct Server {
    std::string name;
    std::uint64_t resourceVersion = 0;
    std::uint64_t generation = 0;
    ServerSpec spec;
    ServerStatus status;
};

bool operator==(const Condition& a, const Condition& b);
bool operator==(const ServerStatus& a, const ServerStatus& b);
bool operator==(const PoolStatus& a, const PoolStatus& b);
inline bool operator!=(const ServerStatus& a, const ServerStatus& b) { return !(a == b); }
inline bool operator!=(const PoolStatus& a, const PoolStatus& b) { return !(a == b); }

// Replaces any condition of the same type. Returns false (and leaves the list
// untouched, transition time included) when an identical condition is present.
bool setCondition(ServerStatus& status, const std::string& type, bool value,
                  const std::string& reason, const std::string& message, TimePoint now);
bool removeCondition(ServerStatus& status, const std::string& type);
[[nodiscard]] const Condition* findCondition(const ServerStatus& status, const std::string& type);

// Pool template with the server's overrides applied.
[[nodiscard]] ServerTemplate resolveTemplate(const Pool& pool, const Server& server);
[[nodiscard]] int effectiveIdleTimeout(const Pool& pool, const Server& server) noexcept;

void to_json(nlohmann::json& j, const Transport& t);
void from_json(const nlohmann::json& j, Transport& t);
void to_json(nlohmann::json& j, const EnvVar& e);
void from_json(const nlohmann::json& j, EnvVar& e);
void to_json(nlohmann::json& j, const ServerTemplate& t);
void from_json(const nlohmann::json& j, ServerTemplate& t);
void to_json(nlohmann::json& j, const PoolSpec& s);
void from_json(const nlohmann::json& j, PoolSpec& s);
void to_json(nlohmann::json& j, const PoolStatus& s);
void from_json(const nlohmann::json& j, PoolStatus& s);
void to_json(nlohmann::json& j, const Condition& c);
void from_json(const nlohmann::json& j, Condition& c);
void to_json(nlohmann::json& j, const ServerSpec& s);
void from_json(const nlohmann::json& j, ServerSpec& s);
void to_json(nlohmann::json& j, const ServerStatus& s);
void from_json(const nlohmann::json& j, ServerStatus& s);
void to_json(nlohmann::json& j, const Pool& p);
void to_json(nlohmann::json& j, const Server& s);

}
