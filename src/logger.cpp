/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/logger.hpp"
#include <strings.h>
#include <cstdlib>
#include <cstdio>
#include <chrono>
#include <ctime>
#include <atomic>
#include <exception>
#include <sstream>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace nmcp {

namespace {
// Read on every LOG_DEBUG/LOG_TRACE in the relay path, so no lock
std::atomic<std::uint8_t> g_level{static_cast<std::uint8_t>(LogLevel::INFO)};
std::once_flag g_level_from_env;
std::mutex g_log_mutex;
std::unordered_map<std::thread::id, std::string> g_thread_names;

void loadEnvLevel() noexcept {
    std::call_once(g_level_from_env, [] {
        const char* env_val = std::getenv("NMCP_LOG_LEVEL");
        LogLevel parsed = LogLevel::INFO;
        if (env_val && Logger::parseLevel(env_val, parsed)) {
            g_level.store(static_cast<std::uint8_t>(parsed));
        }
    });
}
}

void Logger::setLevel(LogLevel level) noexcept {
    loadEnvLevel();
    g_level.store(static_cast<std::uint8_t>(level));
}

void Logger::initFromEnv() noexcept {
    loadEnvLevel();
}

LogLevel Logger::level() noexcept {
    loadEnvLevel();
    return static_cast<LogLevel>(g_level.load());
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(Logger::level());
}

bool Logger::parseLevel(const std::string& value, LogLevel& out) noexcept {
    const char* v = value.c_str();
    if (strcasecmp(v, "error") == 0) out = LogLevel::ERROR;
    else if (strcasecmp(v, "warn") == 0 || strcasecmp(v, "warning") == 0) out = LogLevel::WARN;
    else if (strcasecmp(v, "info") == 0) out = LogLevel::INFO;
    else if (strcasecmp(v, "debug") == 0) out = LogLevel::DEBUG;
    else if (strcasecmp(v, "trace") == 0) out = LogLevel::TRACE;
    else return false;
    return true;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }

    try {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time_t, &local);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::string thread_info;
        auto it = g_thread_names.find(std::this_thread::get_id());
        if (it != g_thread_names.end()) {
            thread_info = it->second;
        } else {
            std::ostringstream oss;
            oss << "T" << std::this_thread::get_id();
            thread_info = oss.str();
        }

        // stdout belongs to the daemon banner; logs go to stderr
        std::fprintf(stderr, "[%s.%03d] [%s] [%s] %s\n", stamp, static_cast<int>(ms.count()),
                     levelToString(level), thread_info.c_str(), message.c_str());
        std::fflush(stderr);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "nmcp: dropped log line: %s\n", e.what());
    }
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

void clearThreadName() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names.erase(std::this_thread::get_id());
}

std::string getThreadName(int worker_id) {
    return "Reconciler-" + std::to_string(worker_id);
}

}
