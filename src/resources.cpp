/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/resources.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace nmcp {

using nlohmann::json;

namespace {
void putTime(json& j, const char* key, const std::optional<TimePoint>& tp) {
    if (tp) {
        j[key] = toEpochMillis(*tp);
    }
}

std::optional<TimePoint> getTime(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return fromEpochMillis(it->get<std::int64_t>());
}

template <typename T>
void getOr(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}
}

std::string Transport::toString() const {
    if (type == TransportType::Sse) {
        return "sse-" + std::to_string(port);
    }
    return "stdio";
}

bool operator==(const Condition& a, const Condition& b) {
    return a.type == b.type && a.status == b.status && a.reason == b.reason &&
           a.message == b.message && a.lastTransitionTime == b.lastTransitionTime;
}

bool operator==(const ServerStatus& a, const ServerStatus& b) {
    return a.phase == b.phase && a.createdAt == b.createdAt && a.startedAt == b.startedAt &&
           a.stoppedAt == b.stoppedAt && a.lastRequestAt == b.lastRequestAt &&
           a.isRunning == b.isRunning && a.isIdle == b.isIdle &&
           a.totalRequests == b.totalRequests && a.currentConnections == b.currentConnections &&
           a.stopRequested == b.stopRequested && a.reason == b.reason &&
           a.observedGeneration == b.observedGeneration && a.conditions == b.conditions;
}

bool operator==(const PoolStatus& a, const PoolStatus& b) {
    return a.activeServers == b.activeServers && a.managedServers == b.managedServers &&
           a.lastReconciledAt == b.lastReconciledAt;
}

bool setCondition(ServerStatus& status, const std::string& type, bool value,
                  const std::string& reason, const std::string& message, TimePoint now) {
    for (auto& c : status.conditions) {
        if (c.type != type) continue;
        if (c.status == value && c.reason == reason && c.message == message) {
            return false;
        }
        c.status = value;
        c.reason = reason;
        c.message = message;
        c.lastTransitionTime = now;
        return true;
    }
    status.conditions.push_back({type, value, reason, message, now});
    return true;
}

bool removeCondition(ServerStatus& status, const std::string& type) {
    auto before = status.conditions.size();
    status.conditions.erase(
        std::remove_if(status.conditions.begin(), status.conditions.end(),
                       [&](const Condition& c) { return c.type == type; }),
        status.conditions.end());
    return status.conditions.size() != before;
}

const Condition* findCondition(const ServerStatus& status, const std::string& type) {
    for (const auto& c : status.conditions) {
        if (c.type == type) return &c;
    }
    return nullptr;
}

ServerTemplate resolveTemplate(const Pool& pool, const Server& server) {
    ServerTemplate t = pool.spec.serverTemplate;
    if (!server.spec.command.empty()) {
        t.command = server.spec.command;
        t.args = server.spec.args;
    } else if (!server.spec.args.empty()) {
        t.args = server.spec.args;
    }
    if (server.spec.transport) {
        t.transport = *server.spec.transport;
    }
    for (const auto& var : server.spec.env) {
        auto it = std::find_if(t.env.begin(), t.env.end(),
                               [&](const EnvVar& e) { return e.name == var.name; });
        if (it != t.env.end()) {
            it->value = var.value;
        } else {
            t.env.push_back(var);
        }
    }
    return t;
}

int effectiveIdleTimeout(const Pool& pool, const Server& server) noexcept {
    return server.spec.idleTimeout > 0 ? server.spec.idleTimeout : pool.spec.defaultIdleTimeout;
}

void to_json(json& j, const Transport& t) {
    if (t.type == TransportType::Sse) {
        j = json{{"type", "sse"}, {"port", t.port}};
    } else {
        j = json{{"type", "stdio"}};
    }
}

void from_json(const json& j, Transport& t) {
    std::string type = j.value("type", std::string("stdio"));
    if (type == "sse") {
        t.type = TransportType::Sse;
        t.port = j.at("port").get<std::uint16_t>();
    } else if (type == "stdio") {
        t.type = TransportType::Stdio;
        t.port = 0;
    } else {
        throw std::invalid_argument("unknown transport type: " + type);
    }
}

void to_json(json& j, const EnvVar& e) {
    j = json{{"name", e.name}, {"value", e.value}};
}

void from_json(const json& j, EnvVar& e) {
    e.name = j.at("name").get<std::string>();
    e.value = j.value("value", std::string());
}

void to_json(json& j, const ServerTemplate& t) {
    j = json{{"image", t.image},
             {"command", t.command},
             {"args", t.args},
             {"env", t.env},
             {"resources", {{"cpu", t.limits.cpu}, {"memory", t.limits.memory}}},
             {"transport", t.transport}};
}

void from_json(const json& j, ServerTemplate& t) {
    getOr(j, "image", t.image);
    getOr(j, "command", t.command);
    getOr(j, "args", t.args);
    getOr(j, "env", t.env);
    getOr(j, "transport", t.transport);
    if (auto it = j.find("resources"); it != j.end() && it->is_object()) {
        getOr(*it, "cpu", t.limits.cpu);
        getOr(*it, "memory", t.limits.memory);
    }
}

void to_json(json& j, const PoolSpec& s) {
    j = json{{"maxServers", s.maxServers},
             {"maxServersLimit", s.maxServersLimit},
             {"defaultIdleTimeout", s.defaultIdleTimeout},
             {"template", s.serverTemplate}};
}

void from_json(const json& j, PoolSpec& s) {
    getOr(j, "maxServers", s.maxServers);
    getOr(j, "maxServersLimit", s.maxServersLimit);
    getOr(j, "defaultIdleTimeout", s.defaultIdleTimeout);
    getOr(j, "template", s.serverTemplate);
}

void to_json(json& j, const PoolStatus& s) {
    j = json{{"activeServers", s.activeServers}, {"managedServers", s.managedServers}};
    putTime(j, "lastReconciledAt", s.lastReconciledAt);
}

void from_json(const json& j, PoolStatus& s) {
    getOr(j, "activeServers", s.activeServers);
    getOr(j, "managedServers", s.managedServers);
    s.lastReconciledAt = getTime(j, "lastReconciledAt");
}

void to_json(json& j, const Condition& c) {
    j = json{{"type", c.type},
             {"status", c.status ? "True" : "False"},
             {"reason", c.reason},
             {"message", c.message},
             {"lastTransitionTime", toEpochMillis(c.lastTransitionTime)}};
}

void from_json(const json& j, Condition& c) {
    c.type = j.at("type").get<std::string>();
    c.status = j.value("status", std::string("True")) == "True";
    getOr(j, "reason", c.reason);
    getOr(j, "message", c.message);
    c.lastTransitionTime = fromEpochMillis(j.value("lastTransitionTime", std::int64_t{0}));
}

void to_json(json& j, const ServerSpec& s) {
    j = json{{"pool", s.pool},
             {"env", s.env},
             {"idleTimeout", s.idleTimeout},
             {"command", s.command},
             {"args", s.args}};
    if (s.transport) {
        j["transport"] = *s.transport;
    }
}

void from_json(const json& j, ServerSpec& s) {
    getOr(j, "pool", s.pool);
    auto transport = j.find("transport");
    if (transport != j.end() && !transport->is_null()) {
        s.transport = transport->get<Transport>();
    } else {
        s.transport.reset();
    }
    getOr(j, "env", s.env);
    getOr(j, "idleTimeout", s.idleTimeout);
    getOr(j, "command", s.command);
    getOr(j, "args", s.args);
}

void to_json(json& j, const ServerStatus& s) {
    j = json{{"phase", phaseToString(s.phase)},
             {"isRunning", s.isRunning},
             {"isIdle", s.isIdle},
             {"totalRequests", s.totalRequests},
             {"currentConnections", s.currentConnections},
             {"stopRequested", s.stopRequested},
             {"reason", s.reason},
             {"observedGeneration", s.observedGeneration},
             {"conditions", s.conditions}};
    putTime(j, "createdAt", s.createdAt);
    putTime(j, "startedAt", s.startedAt);
    putTime(j, "stoppedAt", s.stoppedAt);
    putTime(j, "lastRequestAt", s.lastRequestAt);
}

void from_json(const json& j, ServerStatus& s) {
    std::string phase = j.value("phase", std::string("Pending"));
    if (!phaseFromString(phase, s.phase)) {
        throw std::invalid_argument("unknown server phase: " + phase);
    }
    getOr(j, "isRunning", s.isRunning);
    getOr(j, "isIdle", s.isIdle);
    getOr(j, "totalRequests", s.totalRequests);
    getOr(j, "currentConnections", s.currentConnections);
    getOr(j, "stopRequested", s.stopRequested);
    getOr(j, "reason", s.reason);
    getOr(j, "observedGeneration", s.observedGeneration);
    getOr(j, "conditions", s.conditions);
    s.createdAt = getTime(j, "createdAt");
    s.startedAt = getTime(j, "startedAt");
    s.stoppedAt = getTime(j, "stoppedAt");
    s.lastRequestAt = getTime(j, "lastRequestAt");
}

void to_json(json& j, const Pool& p) {
    j = json{{"name", p.name},
             {"resourceVersion", p.resourceVersion},
             {"generation", p.generation},
             {"spec", p.spec},
             {"status", p.status}};
}

void to_json(json& j, const Server& s) {
    j = json{{"name", s.name},
             {"resourceVersion", s.resourceVersion},
             {"generation", s.generation},
             {"spec", s.spec},
             {"status", s.status}};
}

}
