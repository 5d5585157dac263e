/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/work_queue.hpp"
#include "nmcp/logger.hpp"

namespace nmcp {

WorkQueue::WorkQueue(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("WorkQueue created with " + std::to_string(workers_) + " workers");
}

WorkQueue::~WorkQueue() {
    stop();
}

bool WorkQueue::start(KeyProcessor processor) {
    if (running_.load()) {
        LOG_WARN("WorkQueue already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid key processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&WorkQueue::workerLoop, this, i);
        }
        
        LOG_INFO("WorkQueue started with " + std::to_string(workers_) + " reconcile workers");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start work queue: " + std::string(e.what()));
        shutdown_.store(true);
        keyAvailable_.notify_all();
        for (auto& thread : workerThreads_) {
            if (thread.joinable()) thread.join();
        }
        workerThreads_.clear();
        running_.store(false);
        return false;
    }
}

void WorkQueue::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping work queue...");
    
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    keyAvailable_.notify_all();
    
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();
    
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.clear();
        queued_.clear();
        dirty_.clear();
        delayed_.clear();
    }
    
    LOG_INFO("WorkQueue stopped");
}

void WorkQueue::enqueueLocked(const std::string& key) {
    if (processing_.count(key) > 0) {
        dirty_.insert(key);
        return;
    }
    if (queued_.insert(key).second) {
        queue_.push_back(key);
    }
}

void WorkQueue::add(const std::string& key) {
    if (shutdown_.load()) {
        LOG_DEBUG("Cannot add key to stopped queue: " + key);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        // An immediate add supersedes a pending delayed one
        delayed_.erase(key);
        enqueueLocked(key);
    }
    keyAvailable_.notify_one();
    LOG_TRACE("Key queued: " + key);
}

void WorkQueue::addAfter(const std::string& key, std::chrono::milliseconds delay) {
    if (delay <= std::chrono::milliseconds::zero()) {
        add(key);
        return;
    }
    if (shutdown_.load()) {
        return;
    }
    auto due = std::chrono::steady_clock::now() + delay;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        auto it = delayed_.find(key);
        if (it == delayed_.end() || due < it->second) {
            delayed_[key] = due;
        }
    }
    // Wake a worker so it can shorten its wait if this is the earliest deadline
    keyAvailable_.notify_one();
    LOG_TRACE("Key " + key + " scheduled in " + std::to_string(delay.count()) + "ms");
}

void WorkQueue::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    delayed_.erase(key);
}

std::size_t WorkQueue::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

std::size_t WorkQueue::scheduledCount() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return delayed_.size();
}

void WorkQueue::promoteDueLocked(SteadyTime now) {
    for (auto it = delayed_.begin(); it != delayed_.end();) {
        if (it->second <= now) {
            enqueueLocked(it->first);
            it = delayed_.erase(it);
        } else {
            ++it;
        }
    }
}

void WorkQueue::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_DEBUG("Reconcile worker " + std::to_string(workerId) + " started");
    
    while (!shutdown_.load()) {
        std::string key;
        
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            
            while (!shutdown_.load()) {
                auto now = std::chrono::steady_clock::now();
                promoteDueLocked(now);
                if (!queue_.empty()) {
                    break;
                }
                if (delayed_.empty()) {
                    keyAvailable_.wait(lock);
                } else {
                    auto next = delayed_.begin()->second;
                    for (const auto& [k, due] : delayed_) {
                        if (due < next) next = due;
                    }
                    keyAvailable_.wait_until(lock, next);
                }
            }
            
            if (shutdown_.load()) {
                break;
            }
            
            key = std::move(queue_.front());
            queue_.pop_front();
            queued_.erase(key);
            processing_.insert(key);
        }
        
        try {
            processor_(key, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " failed on key " + key + ": " + e.what());
        }
        
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            processing_.erase(key);
            if (dirty_.erase(key) > 0) {
                enqueueLocked(key);
                keyAvailable_.notify_one();
            }
        }
    }
    
    LOG_DEBUG("Reconcile worker " + std::to_string(workerId) + " stopped");
    clearThreadName();
}

}
