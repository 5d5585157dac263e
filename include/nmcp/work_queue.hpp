/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace nmcp {

using KeyProcessor = std::function<void(const std::string& key, int workerId)>;

// Deduplicating queue of keys drained by a fixed set of workers.
// A key is never processed by two workers at once; a key added while it is
// being processed runs again once the current pass returns.
class WorkQueue {
public:
    explicit WorkQueue(int workers) noexcept;
    ~WorkQueue();

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;
    WorkQueue(WorkQueue&&) = delete;
    WorkQueue& operator=(WorkQueue&&) = delete;

    [[nodiscard]] bool start(KeyProcessor processor);
    void stop() noexcept;

    void add(const std::string& key);
    // Keeps the earliest deadline when the key is already scheduled.
    void addAfter(const std::string& key, std::chrono::milliseconds delay);
    void forget(const std::string& key);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::size_t scheduledCount() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    using SteadyTime = std::chrono::steady_clock::time_point;

    void workerLoop(int workerId);
    void enqueueLocked(const std::string& key);
    void promoteDueLocked(SteadyTime now);
    
    int workers_;
    KeyProcessor processor_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    
    mutable std::mutex queueMutex_;
    std::condition_variable keyAvailable_;
    std::deque<std::string> queue_;
    std::unordered_set<std::string> queued_;
    std::unordered_set<std::string> processing_;
    std::unordered_set<std::string> dirty_;
    std::unordered_map<std::string, SteadyTime> delayed_;
    
    std::vector<std::thread> workerThreads_;
};

}
