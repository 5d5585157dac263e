/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/workload.hpp"
#include "nmcp/logger.hpp"

namespace nmcp {

WorkloadManager::WorkloadManager(WorkloadRuntime& runtime) noexcept : runtime_(runtime) {
}

std::string WorkloadManager::unitName(const std::string& server) {
    return "mcp-server-" + server;
}

Error WorkloadManager::validate(const ServerTemplate& tmpl) {
    if (tmpl.command.empty() || tmpl.command.front().empty()) {
        return {ErrorKind::InvalidSpec, "template has no command"};
    }
    if (tmpl.transport.type == TransportType::Sse && tmpl.transport.port == 0) {
        return {ErrorKind::InvalidSpec, "sse transport requires a port"};
    }
    for (const auto& var : tmpl.env) {
        if (var.name.empty() || var.name.find('=') != std::string::npos) {
            return {ErrorKind::InvalidSpec, "invalid environment variable name '" + var.name + "'"};
        }
    }
    return {};
}

Result<Endpoint> WorkloadManager::ensure(const std::string& server, const ServerTemplate& tmpl) {
    const std::string unit = unitName(server);

    switch (runtime_.unitState(unit)) {
        case UnitState::Starting:
        case UnitState::Ready:
            if (auto ep = runtime_.endpoint(unit)) {
                return Result<Endpoint>::success(*ep);
            }
            break;
        case UnitState::Exited: {
            LOG_WARN("Unit " + unit + " exited; replacing it");
            Error err = teardown(server);
            if (err.failed()) {
                return Result<Endpoint>::failure(err);
            }
            break;
        }
        case UnitState::Absent:
            break;
    }

    Error invalid = validate(tmpl);
    if (invalid.failed()) {
        return Result<Endpoint>::failure(invalid);
    }

    UnitSpec spec;
    spec.argv = tmpl.command;
    spec.argv.insert(spec.argv.end(), tmpl.args.begin(), tmpl.args.end());
    spec.env = tmpl.env;
    spec.transport = tmpl.transport;

    auto created = runtime_.createUnit(unit, spec);
    if (created) {
        LOG_DEBUG("Workload for " + server + " at " + created.value.toString());
        return created;
    }

    switch (created.error.kind) {
        case ErrorKind::AlreadyExists:
            // Someone else created it between our check and create
            if (auto ep = runtime_.endpoint(unit)) {
                return Result<Endpoint>::success(*ep);
            }
            return Result<Endpoint>::failure(ErrorKind::SubstrateError, created.error.message);
        case ErrorKind::InvalidSpec:
            return created;
        default:
            return Result<Endpoint>::failure(ErrorKind::SubstrateError, created.error.message);
    }
}

Error WorkloadManager::teardown(const std::string& server) {
    const std::string unit = unitName(server);
    Error err = runtime_.deleteUnit(unit);
    if (err.kind == ErrorKind::NotFound) {
        return {};
    }
    if (err.failed()) {
        return {ErrorKind::SubstrateError, err.message};
    }
    return {};
}

UnitState WorkloadManager::state(const std::string& server) const {
    return runtime_.unitState(unitName(server));
}

bool WorkloadManager::isBound(const std::string& server) const {
    auto s = state(server);
    return s == UnitState::Starting || s == UnitState::Ready;
}

bool WorkloadManager::isReady(const std::string& server) const {
    return state(server) == UnitState::Ready;
}

std::optional<Endpoint> WorkloadManager::endpoint(const std::string& server) const {
    return runtime_.endpoint(unitName(server));
}

Result<std::shared_ptr<Channel>> WorkloadManager::openChannel(const std::string& server) {
    return runtime_.openChannel(unitName(server));
}

}
