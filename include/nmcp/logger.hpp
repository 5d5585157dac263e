/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace nmcp {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    // NMCP_LOG_LEVEL, read once; a later setLevel wins.
    static void initFromEnv() noexcept;
    // Case-insensitive level name.
    [[nodiscard]] static bool parseLevel(const std::string& value, LogLevel& out) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context. Short-lived threads (relays, HTTP connections)
// must clear their name before exiting.
void setThreadName(const std::string& name);
void clearThreadName();
std::string getThreadName(int worker_id);

}

#define LOG_ERROR(msg) ::nmcp::Logger::error(msg)
#define LOG_WARN(msg)  ::nmcp::Logger::warn(msg)  
#define LOG_INFO(msg)  ::nmcp::Logger::info(msg)
#define LOG_DEBUG(msg) do { if (::nmcp::Logger::enabled(::nmcp::LogLevel::DEBUG)) ::nmcp::Logger::debug(msg); } while (0)
#define LOG_TRACE(msg) do { if (::nmcp::Logger::enabled(::nmcp::LogLevel::TRACE)) ::nmcp::Logger::trace(msg); } while (0)
