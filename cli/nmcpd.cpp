/*
 * nmcp - Operator daemon (nmcpd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/controller.hpp"
#include "nmcp/logger.hpp"
#include "nmcp/operator.hpp"
#include "nmcp/seed.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace nmcp;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage() {
    std::cout << "\n";
    std::cout << "  \033[1mnmcpd\033[0m " << VERSION << "                     \033[90mmcp · server · pools\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
    std::cout << "\n";
    std::cout << "  nmcpd [options]\n";
    std::cout << "\n";
    std::cout << "    --workspace DIR            persist pools and servers under DIR\n";
    std::cout << "    --host HOST                gateway listen address (default 127.0.0.1)\n";
    std::cout << "    --port PORT                gateway listen port (default 8080)\n";
    std::cout << "    -w, --workers N            reconcile workers (default 4)\n";
    std::cout << "    --pool NAME:MAX:IDLE:CMD   declare a pool running CMD\n";
    std::cout << "    --server NAME[:POOL]       declare a server (pool defaults to 'default')\n";
    std::cout << "    --log-level LEVEL          ERROR, WARN, INFO, DEBUG or TRACE\n";
    std::cout << "    -h, --help                 show this help\n";
    std::cout << "    -v, --version              print the version\n";
    std::cout << "\n";
    std::cout << "  \033[90mSessions: GET /api/v1/servers/<name>/sse\033[0m\n";
    std::cout << "\n";
}

void seed(Controller& controller, const std::vector<PoolSeed>& pools, const std::vector<ServerSeed>& servers) {
    for (const auto& pool : pools) {
        auto created = controller.createPool(pool.name, pool.spec);
        if (!created && created.error.kind == ErrorKind::AlreadyExists) {
            auto updated = controller.updatePool(pool.name, pool.spec);
            if (!updated) {
                LOG_ERROR("Pool " + pool.name + ": " + updated.error.message);
            }
        } else if (!created) {
            LOG_ERROR("Pool " + pool.name + ": " + created.error.message);
        }
    }
    for (const auto& server : servers) {
        ServerSpec spec;
        spec.pool = server.pool;
        auto created = controller.createServer(server.name, spec);
        if (!created && created.error.kind != ErrorKind::AlreadyExists) {
            LOG_ERROR("Server " + server.name + ": " + created.error.message);
        }
    }
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    Config config = Config::fromEnv();
    std::vector<PoolSeed> pools;
    std::vector<ServerSeed> servers;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " needs a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (arg == "--workspace") {
            auto v = needValue("--workspace");
            if (!v) return 1;
            config.workspace = *v;
        } else if (arg == "--host") {
            auto v = needValue("--host");
            if (!v) return 1;
            config.host = *v;
        } else if (arg == "--port") {
            auto v = needValue("--port");
            if (!v) return 1;
            try {
                int port = std::stoi(*v);
                if (port < 0 || port > 65535) throw std::out_of_range("port");
                config.port = static_cast<std::uint16_t>(port);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid port\n";
                return 1;
            }
        } else if (arg == "-w" || arg == "--workers") {
            auto v = needValue("--workers");
            if (!v) return 1;
            try {
                config.workers = std::stoi(*v);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
            if (config.workers < 1 || config.workers > 64) {
                std::cerr << "Error: Worker count must be between 1 and 64\n";
                return 1;
            }
        } else if (arg == "--pool") {
            auto v = needValue("--pool");
            if (!v) return 1;
            auto pool = parsePoolSeed(*v);
            if (!pool) {
                std::cerr << "Error: Invalid pool '" << *v << "', expected NAME:MAX:IDLE:CMD\n";
                return 1;
            }
            pools.push_back(std::move(*pool));
        } else if (arg == "--server") {
            auto v = needValue("--server");
            if (!v) return 1;
            auto server = parseServerSeed(*v);
            if (!server) {
                std::cerr << "Error: Invalid server '" << *v << "', expected NAME[:POOL]\n";
                return 1;
            }
            servers.push_back(std::move(*server));
        } else if (arg == "--log-level") {
            auto v = needValue("--log-level");
            if (!v) return 1;
            LogLevel level;
            if (!Logger::parseLevel(*v, level)) {
                std::cerr << "Error: Unknown log level '" << *v << "'\n";
                return 1;
            }
            Logger::setLevel(level);
        } else {
            std::cerr << "Error: Unknown argument '" << arg << "'\n";
            printUsage();
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        Operator op(config);
        if (!op.start()) {
            std::cerr << "Failed to start\n";
            return 1;
        }

        std::filesystem::path pidPath;
        if (!config.workspace.empty()) {
            pidPath = config.workspace / ".nmcpd.pid";
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        seed(op.controller(), pools, servers);

        LOG_INFO("nmcpd " + std::string(VERSION) + " running - " + config.describe());

        while (!g_shutdown_requested && op.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, stopping operator...");
        if (!pidPath.empty()) {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        op.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Operator error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("nmcpd stopped");
    return 0;
}
