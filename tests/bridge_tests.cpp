/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "test_support.hpp"
#include "nmcp/bridge.hpp"
#include "nmcp/event.hpp"

using namespace nmcp;
using namespace nmcp::testing;
using std::chrono::milliseconds;

namespace {

struct BridgeHarness : Harness {
    BridgeHarness() : bridge(controller, store, workloads, activity, config) {}

    // Pool of one running server.
    bool runningServer(const std::string& name, int maxServers = 1) {
        (void)controller.createPool("p1", poolSpec(maxServers));
        (void)controller.createServer(name, serverIn("p1"));
        (void)controller.reconcile(name);
        return phaseOf(name) == Phase::Running;
    }

    Bridge bridge;
};

std::optional<nlohmann::json> nextMessage(Session& session) {
    auto ev = session.next(milliseconds(500));
    if (!ev || ev->kind != EventKind::Message) return std::nullopt;
    return nlohmann::json::parse(ev->data);
}

}

static int test_session_round_trip() {
    BridgeHarness h;
    EXPECT(h.runningServer("s1"), "server Running");

    auto opened = h.bridge.openSession("s1");
    EXPECT(opened.ok, "session opened");
    auto session = opened.value;

    auto first = session->next(milliseconds(100));
    EXPECT(first && first->kind == EventKind::Endpoint, "endpoint event first");
    EXPECT(first->data == Bridge::messagePath("s1", session->id()), "endpoint carries the message path");
    EXPECT(first->data.find("/api/v1/servers/s1/message?session=") == 0, "message path layout");

    EXPECT(!session->send(R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})").failed(), "send");
    auto reply = nextMessage(*session);
    EXPECT(reply.has_value(), "response delivered");
    EXPECT((*reply)["id"] == 7, "client id restored");
    EXPECT((*reply)["result"]["echo"] == "tools/list", "response body relayed");

    EXPECT(h.runtime.received.size() == 1, "one line reached the process");
    auto upstream = nlohmann::json::parse(h.runtime.received.front());
    EXPECT(upstream["method"] == "tools/list", "method forwarded");

    (void)h.controller.reconcile("s1");
    auto s = h.server("s1");
    EXPECT(s.status.totalRequests == 1, "request counted");
    EXPECT(s.status.currentConnections == 1, "connection counted");
    EXPECT(s.status.lastRequestAt.has_value(), "lastRequestAt set");
    EXPECT(s.status.phase == Phase::Running, "bridge never changes the phase");

    h.bridge.closeSession(session->id());
    EXPECT(session->isClosed(), "session closed");
    EXPECT(h.bridge.sessionCount() == 0, "session forgotten");
    (void)h.controller.reconcile("s1");
    EXPECT(h.server("s1").status.currentConnections == 0, "connection released");
    return 0;
}

static int test_sessions_do_not_see_each_others_responses() {
    BridgeHarness h;
    EXPECT(h.runningServer("s1"), "server Running");

    auto a = h.bridge.openSession("s1").value;
    auto b = h.bridge.openSession("s1").value;
    EXPECT(a && b && a->id() != b->id(), "distinct sessions");
    (void)a->next(milliseconds(100));
    (void)b->next(milliseconds(100));

    EXPECT(!a->send(R"({"jsonrpc":"2.0","id":1,"method":"a/ping"})").failed(), "send a");
    EXPECT(!b->send(R"({"jsonrpc":"2.0","id":1,"method":"b/ping"})").failed(), "send b");

    auto ra = nextMessage(*a);
    auto rb = nextMessage(*b);
    EXPECT(ra && (*ra)["id"] == 1 && (*ra)["result"]["echo"] == "a/ping", "a gets its own answer");
    EXPECT(rb && (*rb)["id"] == 1 && (*rb)["result"]["echo"] == "b/ping", "b gets its own answer");
    EXPECT(!a->next(milliseconds(50)), "no stray message for a");
    EXPECT(!b->next(milliseconds(50)), "no stray message for b");

    auto up1 = nlohmann::json::parse(h.runtime.received[0]);
    auto up2 = nlohmann::json::parse(h.runtime.received[1]);
    EXPECT(up1["id"] != up2["id"], "upstream ids are unique");
    return 0;
}

static int test_string_ids_and_notifications() {
    BridgeHarness h;
    EXPECT(h.runningServer("s1"), "server Running");
    auto a = h.bridge.openSession("s1").value;
    auto b = h.bridge.openSession("s1").value;
    (void)a->next(milliseconds(100));
    (void)b->next(milliseconds(100));

    EXPECT(!a->send(R"({"jsonrpc":"2.0","id":"req-1","method":"x"})").failed(), "send");
    auto ra = nextMessage(*a);
    EXPECT(ra && (*ra)["id"] == "req-1", "string id restored");

    EXPECT(!a->send(R"({"jsonrpc":"2.0","method":"test/notify"})").failed(), "notification");
    auto na = nextMessage(*a);
    auto nb = nextMessage(*b);
    EXPECT(na && (*na)["method"] == "notifications/message", "a sees the notification");
    EXPECT(nb && (*nb)["method"] == "notifications/message", "b sees the notification");
    return 0;
}

static int test_deleted_server_closes_sessions() {
    BridgeHarness h;
    EXPECT(h.runningServer("s1"), "server Running");
    auto session = h.bridge.openSession("s1").value;
    (void)session->next(milliseconds(100));

    EXPECT(!h.controller.deleteServer("s1").failed(), "delete");
    auto ev = session->next(milliseconds(500));
    EXPECT(ev && ev->kind == EventKind::Error, "error event");
    EXPECT(ev->data == "server unavailable", "unavailable reason");
    EXPECT(session->isClosed(), "session closed");
    EXPECT(!session->next(milliseconds(10)), "stream ends");

    (void)h.controller.reconcile("s1");
    EXPECT(h.runtime.deletes == 1, "workload torn down");
    EXPECT(h.bridge.sessionCount() == 0, "no sessions left");
    return 0;
}

static int test_not_ready_server_refused() {
    BridgeHarness h;
    (void)h.controller.createPool("p1", poolSpec(0));
    (void)h.controller.createServer("s1", serverIn("p1"));
    (void)h.controller.reconcile("s1");

    auto opened = h.bridge.openSession("s1");
    EXPECT(!opened.ok, "refused");
    EXPECT(opened.error.kind == ErrorKind::TransportError, "transport error");
    EXPECT(opened.error.message == "server not ready", "not ready reason");
    EXPECT(h.bridge.sessionCount() == 0, "no session registered");
    return 0;
}

static int test_waits_for_controller_to_start_server() {
    BridgeHarness h;
    EXPECT(h.controller.start(), "controller starts");
    (void)h.controller.createPool("p1", poolSpec(1));
    (void)h.controller.createServer("s1", serverIn("p1"));

    auto opened = h.bridge.openSession("s1");
    EXPECT(opened.ok, "session once the server runs");
    EXPECT(h.phaseOf("s1") == Phase::Running, "server Running");
    h.bridge.closeAll();
    h.controller.stop();
    return 0;
}

static int test_stopped_and_unknown_servers() {
    BridgeHarness h;
    EXPECT(h.runningServer("s1"), "server Running");
    (void)h.controller.stopServer("s1");
    (void)h.controller.reconcile("s1");

    auto stopped = h.bridge.openSession("s1");
    EXPECT(!stopped.ok && stopped.error.kind == ErrorKind::TransportError, "stopped server refused");
    EXPECT(stopped.error.message == "server unavailable", "unavailable reason");

    auto unknown = h.bridge.openSession("ghost");
    EXPECT(!unknown.ok && unknown.error.kind == ErrorKind::NotFound, "unknown server");
    return 0;
}

static int test_stop_closes_open_sessions() {
    BridgeHarness h;
    EXPECT(h.runningServer("s1"), "server Running");
    auto session = h.bridge.openSession("s1").value;
    (void)session->next(milliseconds(100));

    (void)h.controller.stopServer("s1");
    (void)h.controller.reconcile("s1");
    auto ev = session->next(milliseconds(500));
    EXPECT(ev && ev->kind == EventKind::Error && ev->data == "server unavailable", "stop ends the stream");
    return 0;
}

static int test_process_exit_reported() {
    BridgeHarness h;
    EXPECT(h.runningServer("s1"), "server Running");
    auto session = h.bridge.openSession("s1").value;
    (void)session->next(milliseconds(100));

    h.runtime.crash("mcp-server-s1");
    auto ev = session->next(milliseconds(500));
    EXPECT(ev && ev->kind == EventKind::Error, "error event");
    EXPECT(ev->data == "channel closed: process exited", "exit reason");
    EXPECT(h.phaseOf("s1") == Phase::Running, "phase left to the controller");

    Error err = session->send(R"({"jsonrpc":"2.0","id":2,"method":"x"})");
    EXPECT(err.kind == ErrorKind::TransportError && err.message == "session closed", "send after close");
    return 0;
}

static int test_invalid_message_keeps_session() {
    BridgeHarness h;
    EXPECT(h.runningServer("s1"), "server Running");
    auto session = h.bridge.openSession("s1").value;

    Error err = session->send("{not json");
    EXPECT(err.kind == ErrorKind::TransportError, "rejected");
    EXPECT(err.message == "invalid JSON-RPC message", "reason");
    EXPECT(!session->isClosed(), "session stays open");
    EXPECT(h.runtime.received.empty(), "nothing forwarded");
    EXPECT(h.activity.snapshot("s1").totalRequests == 0, "not counted");
    return 0;
}

static int test_close_all() {
    BridgeHarness h;
    EXPECT(h.runningServer("s1", 2), "server Running");
    auto a = h.bridge.openSession("s1").value;
    auto b = h.bridge.openSession("s1").value;
    EXPECT(h.bridge.sessionCount() == 2, "two sessions");
    EXPECT(h.bridge.findSession(a->id()) == a, "lookup by id");

    h.bridge.closeAll();
    EXPECT(a->isClosed() && b->isClosed(), "all closed");
    EXPECT(h.bridge.sessionCount() == 0, "registry empty");
    EXPECT(h.bridge.findSession(a->id()) == nullptr, "lookup fails after close");
    EXPECT(h.activity.snapshot("s1").currentConnections == 0, "connections released");
    return 0;
}

static int test_sse_framing() {
    EXPECT(Event::endpoint("/x").toSse() == "event: endpoint\ndata: /x\n\n", "endpoint frame");
    EXPECT(Event::message("{\"a\":1}").toSse() == "event: message\ndata: {\"a\":1}\n\n", "message frame");
    EXPECT(Event::error("line1\nline2").toSse() == "event: error\ndata: line1\ndata: line2\n\n",
           "multi-line payload");
    EXPECT(std::string(eventName(EventKind::Message)) == "message", "event name");
    return 0;
}

int main(void) {
    if (test_session_round_trip() != 0) return 1;
    if (test_sessions_do_not_see_each_others_responses() != 0) return 1;
    if (test_string_ids_and_notifications() != 0) return 1;
    if (test_deleted_server_closes_sessions() != 0) return 1;
    if (test_not_ready_server_refused() != 0) return 1;
    if (test_waits_for_controller_to_start_server() != 0) return 1;
    if (test_stopped_and_unknown_servers() != 0) return 1;
    if (test_stop_closes_open_sessions() != 0) return 1;
    if (test_process_exit_reported() != 0) return 1;
    if (test_invalid_message_keeps_session() != 0) return 1;
    if (test_close_all() != 0) return 1;
    if (test_sse_framing() != 0) return 1;
    return 0;
}
