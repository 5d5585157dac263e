/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nmcp/logger.hpp"
#include "nmcp/object_store.hpp"
#include "nmcp/resources.hpp"
#include "nmcp/store.hpp"

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

using namespace nmcp;
using std::chrono::seconds;

namespace {

Pool makePool(const std::string& name, int maxServers) {
    Pool p;
    p.name = name;
    p.spec.maxServers = maxServers;
    p.spec.defaultIdleTimeout = 60;
    p.spec.serverTemplate.image = "mcp/files:1.0";
    p.spec.serverTemplate.command = {"/usr/bin/mcp-files", "--root", "/srv"};
    p.spec.serverTemplate.env = {{"LOG", "info"}};
    p.spec.serverTemplate.limits = {"500m", "256Mi"};
    return p;
}

Server makeServer(const std::string& name, const std::string& pool) {
    Server s;
    s.name = name;
    s.spec.pool = pool;
    s.status.createdAt = TimePoint(seconds(1700000000));
    return s;
}

std::filesystem::path tempWorkspace() {
    char tmpl[] = "/tmp/nmcp_store_XXXXXX";
    char* dir = mkdtemp(tmpl);
    return dir ? std::filesystem::path(dir) : std::filesystem::path();
}

}

static int test_create_and_get() {
    ObjectStore objects;
    ResourceStore store(objects);

    auto created = store.createPool(makePool("p1", 3));
    EXPECT(created.ok, "pool created");
    EXPECT(created.value.generation == 1, "first generation");
    EXPECT(created.value.resourceVersion > 0, "version assigned");

    auto pool = store.getPool("p1");
    EXPECT(pool.ok && pool.value.spec.maxServers == 3, "pool read back");
    EXPECT(pool.value.spec.serverTemplate.command.size() == 3, "template command kept");
    EXPECT(pool.value.spec.serverTemplate.limits.memory == "256Mi", "limits kept");

    EXPECT(store.createPool(makePool("p1", 1)).error.kind == ErrorKind::AlreadyExists, "duplicate");
    EXPECT(store.getPool("nope").error.kind == ErrorKind::NotFound, "missing pool");
    EXPECT(store.createPool(makePool("bad name", 1)).error.kind == ErrorKind::InvalidSpec, "invalid name");
    EXPECT(store.createServer(makeServer("a/b", "p1")).error.kind == ErrorKind::InvalidSpec, "slash in name");
    return 0;
}

static int test_membership_by_pool_reference() {
    ObjectStore objects;
    ResourceStore store(objects);
    (void)store.createPool(makePool("p1", 3));
    (void)store.createPool(makePool("p2", 3));
    (void)store.createServer(makeServer("a", "p1"));
    (void)store.createServer(makeServer("b", "p2"));
    (void)store.createServer(makeServer("c", "p1"));

    auto members = store.listServersInPool("p1");
    EXPECT(members.size() == 2, "two members");
    EXPECT(members[0].name == "a" && members[1].name == "c", "listed by name");
    EXPECT(store.listServers().size() == 3, "all servers");
    EXPECT(store.listPools().size() == 2, "all pools");
    return 0;
}

static int test_optimistic_concurrency() {
    ObjectStore objects;
    ResourceStore store(objects);
    auto created = store.createServer(makeServer("s1", "p1")).value;

    Server first = created;
    first.status.phase = Phase::Starting;
    auto written = store.updateServerStatus(first);
    EXPECT(written.ok, "first write");
    EXPECT(written.value.resourceVersion > created.resourceVersion, "version moved");
    EXPECT(written.value.generation == created.generation, "status write keeps generation");

    Server stale = created;
    stale.status.phase = Phase::Failed;
    auto rejected = store.updateServerStatus(stale);
    EXPECT(!rejected.ok && rejected.error.kind == ErrorKind::Conflict, "stale write rejected");
    EXPECT(store.getServer("s1").value.status.phase == Phase::Starting, "winner kept");

    Server same = written.value;
    auto noop = store.updateServerStatus(same);
    EXPECT(noop.ok && noop.value.resourceVersion == written.value.resourceVersion, "unchanged status is free");

    Server edited = written.value;
    edited.spec.env.push_back({"TOKEN", "x"});
    auto specWrite = store.updateServerSpec(edited);
    EXPECT(specWrite.ok && specWrite.value.generation == created.generation + 1, "spec write bumps generation");
    EXPECT(specWrite.value.status.phase == Phase::Starting, "spec write keeps status");

    EXPECT(store.updateServerStatus(makeServer("ghost", "p1")).error.kind == ErrorKind::NotFound, "missing");
    return 0;
}

static int test_watch_events() {
    ObjectStore objects;
    ResourceStore store(objects);
    std::vector<std::string> seen;
    int id = store.watch([&](ResourceKind kind, WatchEventType type, const std::string& name) {
        std::string k = kind == ResourceKind::Pool ? "pool" : "server";
        std::string t = type == WatchEventType::Added ? "added"
                        : type == WatchEventType::Modified ? "modified" : "deleted";
        seen.push_back(k + ":" + t + ":" + name);
    });

    (void)store.createPool(makePool("p1", 1));
    auto s = store.createServer(makeServer("s1", "p1")).value;
    s.status.phase = Phase::Starting;
    (void)store.updateServerStatus(s);
    (void)store.updateServerStatus(store.getServer("s1").value);
    EXPECT(!store.deleteServer("s1").failed(), "delete");
    EXPECT(store.deleteServer("s1").kind == ErrorKind::NotFound, "double delete");

    store.unwatch(id);
    (void)store.createPool(makePool("p2", 1));

    std::vector<std::string> expected = {"pool:added:p1", "server:added:s1", "server:modified:s1",
                                         "server:deleted:s1"};
    EXPECT(seen == expected, "events in order, no-op writes silent, nothing after unwatch");
    return 0;
}

static int test_persistence_reload() {
    auto dir = tempWorkspace();
    EXPECT(!dir.empty(), "temp workspace");
    std::uint64_t lastVersion = 0;
    {
        ObjectStore objects(dir);
        EXPECT(objects.load(), "empty load");
        ResourceStore store(objects);
        (void)store.createPool(makePool("p1", 2));
        auto s = store.createServer(makeServer("s1", "p1")).value;
        s.status.phase = Phase::Running;
        s.status.totalRequests = 42;
        s.status.startedAt = TimePoint(seconds(1700000100));
        setCondition(s.status, conditions::WorkloadScheduled, true, "Created", "stdio://mcp-server-s1",
                     TimePoint(seconds(1700000100)));
        auto written = store.updateServerStatus(s);
        EXPECT(written.ok, "status persisted");
        lastVersion = written.value.resourceVersion;
        EXPECT(std::filesystem::exists(dir / "objects" / "Server" / "s1.json"), "file per object");
    }
    {
        ObjectStore objects(dir);
        EXPECT(objects.load(), "reload");
        ResourceStore store(objects);
        auto s = store.getServer("s1");
        EXPECT(s.ok, "server survives restart");
        EXPECT(s.value.status.phase == Phase::Running, "phase survives");
        EXPECT(s.value.status.totalRequests == 42, "counters survive");
        EXPECT(s.value.status.startedAt == TimePoint(seconds(1700000100)), "timestamps survive");
        EXPECT(s.value.resourceVersion == lastVersion, "version survives");
        const Condition* c = findCondition(s.value.status, conditions::WorkloadScheduled);
        EXPECT(c && c->reason == "Created", "conditions survive");
        EXPECT(store.getPool("p1").value.spec.maxServers == 2, "pool survives");

        auto next = store.createServer(makeServer("s2", "p1"));
        EXPECT(next.ok && next.value.resourceVersion > lastVersion, "versions keep increasing");

        EXPECT(!store.deleteServer("s2").failed(), "delete");
        EXPECT(!std::filesystem::exists(dir / "objects" / "Server" / "s2.json"), "file removed");
    }
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return 0;
}

static int test_template_resolution() {
    Pool pool = makePool("p1", 1);
    Server server = makeServer("s1", "p1");
    server.spec.env = {{"LOG", "debug"}, {"TOKEN", "t"}};

    ServerTemplate t = resolveTemplate(pool, server);
    EXPECT(t.command.front() == "/usr/bin/mcp-files", "pool command");
    EXPECT(t.env.size() == 2, "merged env");
    EXPECT(t.env[0].name == "LOG" && t.env[0].value == "debug", "server value overrides");
    EXPECT(t.image == "mcp/files:1.0", "image from pool");

    server.spec.command = {"/bin/other"};
    server.spec.args = {"-v"};
    t = resolveTemplate(pool, server);
    EXPECT(t.command.size() == 1 && t.command.front() == "/bin/other", "server command wins");
    EXPECT(t.args.size() == 1 && t.args.front() == "-v", "server args");

    EXPECT(t.transport.type == TransportType::Stdio, "stdio by default");

    pool.spec.serverTemplate.transport.type = TransportType::Sse;
    pool.spec.serverTemplate.transport.port = 9000;
    t = resolveTemplate(pool, server);
    EXPECT(t.transport.type == TransportType::Sse && t.transport.port == 9000, "pool transport kept when unset");
    Transport stdio;
    server.spec.transport = stdio;
    t = resolveTemplate(pool, server);
    EXPECT(t.transport.type == TransportType::Stdio, "explicit server transport wins");

    nlohmann::json unset = makeServer("s2", "p1").spec;
    EXPECT(!unset.contains("transport"), "unset transport not written");
    EXPECT(!unset.get<ServerSpec>().transport, "unset transport read back unset");
    nlohmann::json set = server.spec;
    EXPECT(set.get<ServerSpec>().transport.has_value(), "explicit transport survives JSON");

    EXPECT(effectiveIdleTimeout(pool, server) == 60, "pool default");
    server.spec.idleTimeout = 15;
    EXPECT(effectiveIdleTimeout(pool, server) == 15, "server override");
    return 0;
}

static int test_status_json_shape() {
    ServerStatus status;
    status.phase = Phase::Idle;
    status.isRunning = true;
    status.isIdle = true;
    status.lastRequestAt = TimePoint(seconds(1700000000));

    nlohmann::json j = status;
    EXPECT(j["phase"] == "Idle", "phase by name");
    ServerStatus back = j.get<ServerStatus>();
    EXPECT(back == status, "status survives JSON");

    Transport sse;
    sse.type = TransportType::Sse;
    sse.port = 8000;
    nlohmann::json tj = sse;
    EXPECT(tj["type"] == "sse" && tj["port"] == 8000, "sse transport");

    nlohmann::json unknown = {{"type", "carrier-pigeon"}};
    bool threw = false;
    try {
        (void)unknown.get<Transport>();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    EXPECT(threw, "unknown transport rejected");
    return 0;
}

int main(void) {
    Logger::setLevel(LogLevel::ERROR);
    if (test_create_and_get() != 0) return 1;
    if (test_membership_by_pool_reference() != 0) return 1;
    if (test_optimistic_concurrency() != 0) return 1;
    if (test_watch_events() != 0) return 1;
    if (test_persistence_reload() != 0) return 1;
    if (test_template_resolution() != 0) return 1;
    if (test_status_json_shape() != 0) return 1;
    return 0;
}
