/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

#include "nmcp/config.hpp"

namespace nmcp {

class Bridge;
class Session;

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string body;
};

struct HttpResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;

    [[nodiscard]] std::string serialize() const;
};

// Minimal HTTP/1.1 front door: health, the per-server event stream, and the
// message POST endpoint announced in that stream.
class HttpGateway {
public:
    HttpGateway(Bridge& bridge, const Config& config);
    ~HttpGateway();

    HttpGateway(const HttpGateway&) = delete;
    HttpGateway& operator=(const HttpGateway&) = delete;
    HttpGateway(HttpGateway&&) = delete;
    HttpGateway& operator=(HttpGateway&&) = delete;

    // Binds synchronously so a port of 0 resolves before this returns.
    [[nodiscard]] bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::uint16_t port() const noexcept { return boundPort_; }

    // Header block up to the blank line; body is attached by the caller.
    [[nodiscard]] static std::optional<HttpRequest> parseRequest(const std::string& head);
    // Non-streaming routes.
    [[nodiscard]] HttpResponse handle(const HttpRequest& request);

private:
    struct Connection {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void acceptLoop();
    void serve(int fd, int connectionId);
    void stream(int fd, const std::string& server);
    [[nodiscard]] HttpResponse postMessage(const std::string& server, const HttpRequest& request);
    void reapConnections(bool all);

    Bridge& bridge_;
    Config config_;

    std::atomic<bool> running_{false};
    std::atomic<int> listenFd_{-1};
    std::uint16_t boundPort_ = 0;
    std::thread acceptThread_;

    std::mutex connMutex_;
    std::list<std::unique_ptr<Connection>> connections_;
    std::set<int> openFds_;
    int nextConnection_ = 1;
};

}
