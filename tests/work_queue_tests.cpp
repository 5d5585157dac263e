/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "nmcp/logger.hpp"
#include "nmcp/work_queue.hpp"

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

using namespace nmcp;
using std::chrono::milliseconds;

namespace {

template <typename Pred>
bool waitFor(Pred pred, milliseconds timeout = milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(5));
    }
    return pred();
}

struct Counts {
    std::mutex mutex;
    std::map<std::string, int> runs;

    void hit(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex);
        ++runs[key];
    }
    int of(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex);
        return runs[key];
    }
};

}

static int test_duplicate_adds_collapse() {
    WorkQueue queue(2);
    queue.add("a");
    queue.add("a");
    queue.add("b");
    queue.add("a");
    EXPECT(queue.queueSize() == 2, "one entry per key");

    Counts counts;
    EXPECT(queue.start([&](const std::string& key, int) { counts.hit(key); }), "start");
    EXPECT(waitFor([&] { return counts.of("a") == 1 && counts.of("b") == 1; }), "each key processed");
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT(counts.of("a") == 1, "no duplicate run");
    queue.stop();
    return 0;
}

static int test_add_during_processing_reruns() {
    WorkQueue queue(2);
    std::atomic<bool> release{false};
    std::atomic<bool> inside{false};
    Counts counts;

    EXPECT(queue.start([&](const std::string& key, int) {
        counts.hit(key);
        if (counts.of(key) == 1) {
            inside.store(true);
            while (!release.load()) std::this_thread::sleep_for(milliseconds(1));
        }
    }), "start");

    queue.add("k");
    EXPECT(waitFor([&] { return inside.load(); }), "first pass running");
    queue.add("k");
    queue.add("k");
    std::this_thread::sleep_for(milliseconds(30));
    EXPECT(counts.of("k") == 1, "second worker does not pick up the busy key");

    release.store(true);
    EXPECT(waitFor([&] { return counts.of("k") == 2; }), "key runs again after the pass");
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT(counts.of("k") == 2, "adds during the pass fold into one rerun");
    queue.stop();
    return 0;
}

static int test_key_never_runs_concurrently() {
    WorkQueue queue(4);
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    std::atomic<int> total{0};

    EXPECT(queue.start([&](const std::string&, int) {
        int now = ++inFlight;
        int seen = maxInFlight.load();
        while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(milliseconds(2));
        --inFlight;
        ++total;
    }), "start");

    for (int i = 0; i < 200; ++i) {
        queue.add("same");
        std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
    EXPECT(waitFor([&] { return queue.queueSize() == 0 && inFlight.load() == 0; }), "drained");
    queue.stop();
    EXPECT(maxInFlight.load() == 1, "one worker per key");
    EXPECT(total.load() >= 1 && total.load() <= 200, "runs collapsed");
    return 0;
}

static int test_delayed_keys() {
    WorkQueue queue(1);
    Counts counts;
    EXPECT(queue.start([&](const std::string& key, int) { counts.hit(key); }), "start");

    queue.addAfter("later", milliseconds(150));
    queue.addAfter("later", milliseconds(5000));
    EXPECT(queue.scheduledCount() == 1, "one schedule per key");
    std::this_thread::sleep_for(milliseconds(40));
    EXPECT(counts.of("later") == 0, "not before the delay");
    EXPECT(waitFor([&] { return counts.of("later") == 1; }), "earliest deadline kept");

    queue.addAfter("cancelled", milliseconds(100));
    queue.forget("cancelled");
    EXPECT(queue.scheduledCount() == 0, "forget drops the schedule");
    std::this_thread::sleep_for(milliseconds(200));
    EXPECT(counts.of("cancelled") == 0, "forgotten key never runs");

    queue.addAfter("now", milliseconds(10000));
    queue.add("now");
    EXPECT(waitFor([&] { return counts.of("now") == 1; }), "immediate add wins");
    EXPECT(queue.scheduledCount() == 0, "delayed entry superseded");
    queue.stop();
    return 0;
}

static int test_processor_exception_keeps_worker() {
    WorkQueue queue(1);
    Counts counts;
    EXPECT(queue.start([&](const std::string& key, int) {
        counts.hit(key);
        if (key == "bad") throw std::runtime_error("boom");
    }), "start");

    queue.add("bad");
    queue.add("good");
    EXPECT(waitFor([&] { return counts.of("good") == 1; }), "worker survives the throw");
    EXPECT(counts.of("bad") == 1, "failing key ran once");
    queue.stop();
    return 0;
}

static int test_start_stop() {
    WorkQueue queue(0);
    EXPECT(queue.workerCount() == 1, "at least one worker");
    EXPECT(!queue.start(nullptr), "processor required");
    EXPECT(queue.start([](const std::string&, int) {}), "start");
    EXPECT(queue.isRunning(), "running");
    EXPECT(!queue.start([](const std::string&, int) {}), "double start refused");
    queue.stop();
    EXPECT(!queue.isRunning(), "stopped");
    queue.add("ignored");
    EXPECT(queue.queueSize() == 0, "adds after stop are dropped");
    return 0;
}

int main(void) {
    Logger::setLevel(LogLevel::ERROR);
    if (test_duplicate_adds_collapse() != 0) return 1;
    if (test_add_during_processing_reruns() != 0) return 1;
    if (test_key_never_runs_concurrently() != 0) return 1;
    if (test_delayed_keys() != 0) return 1;
    if (test_processor_exception_keeps_worker() != 0) return 1;
    if (test_start_stop() != 0) return 1;
    return 0;
}
