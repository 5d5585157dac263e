/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/config.hpp"
#include "nmcp/logger.hpp"
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace nmcp {

namespace {
long long env_ll(const char* name, long long defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        long long parsed = std::stoll(val);
        return parsed < 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid value for ") + name + ": " + val);
        return defv;
    }
}

std::string env_str(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}
}

Config Config::fromEnv() {
    Config c;
    c.workers = static_cast<int>(env_ll("NMCP_WORKERS", c.workers));
    if (c.workers <= 0) c.workers = 1;
    c.host = env_str("NMCP_HOST", c.host);
    long long port = env_ll("NMCP_PORT", c.port);
    if (port > 0 && port <= 65535) c.port = static_cast<std::uint16_t>(port);
    c.workspace = env_str("NMCP_WORKSPACE", c.workspace.string());
    c.resyncInterval = std::chrono::seconds(env_ll("NMCP_RESYNC_SECONDS", c.resyncInterval.count()));
    c.backoffBase = std::chrono::milliseconds(env_ll("NMCP_BACKOFF_BASE_MS", c.backoffBase.count()));
    c.backoffCap = std::chrono::milliseconds(env_ll("NMCP_BACKOFF_CAP_MS", c.backoffCap.count()));
    c.maxAttempts = static_cast<int>(env_ll("NMCP_MAX_ATTEMPTS", c.maxAttempts));
    if (c.maxAttempts <= 0) c.maxAttempts = 1;
    c.failedRequeue = std::chrono::seconds(env_ll("NMCP_FAILED_REQUEUE_SECONDS", c.failedRequeue.count()));
    c.readinessPoll = std::chrono::milliseconds(env_ll("NMCP_READINESS_POLL_MS", c.readinessPoll.count()));
    c.sessionReadyTimeout = std::chrono::milliseconds(env_ll("NMCP_SESSION_READY_TIMEOUT_MS", c.sessionReadyTimeout.count()));
    c.stoppedRetention = std::chrono::seconds(env_ll("NMCP_STOPPED_RETENTION_SECONDS", c.stoppedRetention.count()));
    c.terminationGrace = std::chrono::milliseconds(env_ll("NMCP_TERMINATION_GRACE_MS", c.terminationGrace.count()));
    return c;
}

std::string Config::describe() const {
    std::ostringstream oss;
    oss << "workers=" << workers
        << " listen=" << host << ":" << port
        << " workspace=" << (workspace.empty() ? std::string("(memory)") : workspace.string())
        << " resync=" << resyncInterval.count() << "s"
        << " backoff=" << backoffBase.count() << "-" << backoffCap.count() << "ms"
        << " attempts=" << maxAttempts
        << " retention=" << stoppedRetention.count() << "s";
    return oss.str();
}

}
