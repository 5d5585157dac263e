/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <cstdio>
#include <cstdlib>
#include <string>

#include "nmcp/config.hpp"
#include "nmcp/logger.hpp"
#include "nmcp/seed.hpp"

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

using namespace nmcp;

static int test_defaults() {
    Config c;
    EXPECT(c.workers == 4, "workers");
    EXPECT(c.port == 8080, "port");
    EXPECT(c.workspace.empty(), "in-memory by default");
    EXPECT(c.maxAttempts == 5, "attempts");
    EXPECT(c.stoppedRetention.count() == 0, "retention disabled");
    EXPECT(c.describe().find("(memory)") != std::string::npos, "describe names the store");
    return 0;
}

static int test_environment_overrides() {
    setenv("NMCP_WORKERS", "8", 1);
    setenv("NMCP_PORT", "9191", 1);
    setenv("NMCP_HOST", "0.0.0.0", 1);
    setenv("NMCP_WORKSPACE", "/var/lib/nmcp", 1);
    setenv("NMCP_BACKOFF_BASE_MS", "250", 1);
    setenv("NMCP_MAX_ATTEMPTS", "2", 1);
    setenv("NMCP_READINESS_POLL_MS", "100", 1);
    setenv("NMCP_STOPPED_RETENTION_SECONDS", "600", 1);

    Config c = Config::fromEnv();
    EXPECT(c.workers == 8, "workers");
    EXPECT(c.port == 9191, "port");
    EXPECT(c.host == "0.0.0.0", "host");
    EXPECT(c.workspace == "/var/lib/nmcp", "workspace");
    EXPECT(c.backoffBase.count() == 250, "backoff base");
    EXPECT(c.maxAttempts == 2, "attempts");
    EXPECT(c.readinessPoll.count() == 100, "readiness poll");
    EXPECT(c.stoppedRetention.count() == 600, "retention");

    unsetenv("NMCP_WORKERS");
    unsetenv("NMCP_PORT");
    unsetenv("NMCP_HOST");
    unsetenv("NMCP_WORKSPACE");
    unsetenv("NMCP_BACKOFF_BASE_MS");
    unsetenv("NMCP_MAX_ATTEMPTS");
    unsetenv("NMCP_READINESS_POLL_MS");
    unsetenv("NMCP_STOPPED_RETENTION_SECONDS");
    return 0;
}

static int test_invalid_values_fall_back() {
    setenv("NMCP_WORKERS", "lots", 1);
    setenv("NMCP_PORT", "70000", 1);
    setenv("NMCP_MAX_ATTEMPTS", "0", 1);
    setenv("NMCP_BACKOFF_CAP_MS", "-5", 1);

    Config c = Config::fromEnv();
    EXPECT(c.workers == 4, "unparsable workers ignored");
    EXPECT(c.port == 8080, "out of range port ignored");
    EXPECT(c.maxAttempts == 1, "at least one attempt");
    EXPECT(c.backoffCap.count() == 30000, "negative value ignored");

    unsetenv("NMCP_WORKERS");
    unsetenv("NMCP_PORT");
    unsetenv("NMCP_MAX_ATTEMPTS");
    unsetenv("NMCP_BACKOFF_CAP_MS");
    return 0;
}

static int test_log_level_names() {
    LogLevel level = LogLevel::INFO;
    EXPECT(Logger::parseLevel("debug", level) && level == LogLevel::DEBUG, "lower case");
    EXPECT(Logger::parseLevel("WARN", level) && level == LogLevel::WARN, "upper case");
    EXPECT(Logger::parseLevel("Warning", level) && level == LogLevel::WARN, "warning alias");
    EXPECT(!Logger::parseLevel("loud", level), "unknown name");
    EXPECT(level == LogLevel::WARN, "unknown name leaves level alone");

    Logger::setLevel(LogLevel::TRACE);
    EXPECT(Logger::enabled(LogLevel::TRACE), "trace on");
    Logger::setLevel(LogLevel::ERROR);
    EXPECT(!Logger::enabled(LogLevel::WARN), "warn off at error");
    return 0;
}

static int test_command_line_seeds() {
    auto pool = parsePoolSeed("files:2:30:/usr/bin/mcp-files --root /srv:data");
    EXPECT(pool.has_value(), "pool parsed");
    EXPECT(pool->name == "files" && pool->spec.maxServers == 2, "name and capacity");
    EXPECT(pool->spec.defaultIdleTimeout == 30, "idle timeout");
    EXPECT(pool->spec.serverTemplate.command.size() == 3, "command split on spaces");
    EXPECT(pool->spec.serverTemplate.command[2] == "/srv:data", "colons kept in the command");
    EXPECT(!parsePoolSeed("files:two:30:cmd"), "non-numeric capacity");
    EXPECT(!parsePoolSeed(":2:30:cmd"), "empty pool name");

    auto server = parseServerSeed("s1:files");
    EXPECT(server && server->name == "s1" && server->pool == "files", "server with pool");
    server = parseServerSeed("s2");
    EXPECT(server && server->pool == "default", "default pool");
    EXPECT(!parseServerSeed("s3:"), "empty pool rejected");
    EXPECT(!parseServerSeed(":files"), "empty name rejected");
    EXPECT(!parseServerSeed(""), "empty value rejected");
    return 0;
}

int main(void) {
    Logger::setLevel(LogLevel::ERROR);
    if (test_defaults() != 0) return 1;
    if (test_environment_overrides() != 0) return 1;
    if (test_invalid_values_fall_back() != 0) return 1;
    if (test_log_level_names() != 0) return 1;
    if (test_command_line_seeds() != 0) return 1;
    return 0;
}
