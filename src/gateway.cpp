/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/gateway.hpp"
#include "nmcp/bridge.hpp"
#include "nmcp/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace nmcp {

namespace {

constexpr std::size_t kMaxHeader = 64 * 1024;
constexpr std::size_t kMaxBody = 4 * 1024 * 1024;
constexpr auto kEventPoll = std::chrono::milliseconds(500);
constexpr auto kKeepAlive = std::chrono::seconds(15);

const char* statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 503: return "Service Unavailable";
        default: return "Internal Server Error";
    }
}

HttpResponse jsonResponse(int status, const nlohmann::json& body) {
    HttpResponse response;
    response.status = status;
    response.body = body.dump();
    return response;
}

HttpResponse errorResponse(int status, const std::string& message) {
    return jsonResponse(status, {{"error", message}});
}

bool sendAll(int fd, const std::string& data) {
    const char* ptr = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::send(fd, ptr, left, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        ptr += n;
        left -= static_cast<std::size_t>(n);
    }
    return true;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size() && std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else if (in[i] == '+') {
            out.push_back(' ');
        } else {
            out.push_back(in[i]);
        }
    }
    return out;
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) parts.push_back(percentDecode(part));
    }
    return parts;
}

// /api/v1/servers/{name}/{action}
bool matchServerRoute(const std::string& path, std::string& server, std::string& action) {
    auto parts = splitPath(path);
    if (parts.size() != 5 || parts[0] != "api" || parts[1] != "v1" || parts[2] != "servers") {
        return false;
    }
    server = parts[3];
    action = parts[4];
    return true;
}

}

std::string HttpResponse::serialize() const {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + statusText(status) + "\r\n";
    out += "Content-Type: " + contentType + "\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

HttpGateway::HttpGateway(Bridge& bridge, const Config& config) : bridge_(bridge), config_(config) {
}

HttpGateway::~HttpGateway() {
    stop();
}

std::optional<HttpRequest> HttpGateway::parseRequest(const std::string& head) {
    std::istringstream in(head);
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    HttpRequest request;
    std::string target;
    std::string version;
    std::istringstream first(line);
    if (!(first >> request.method >> target >> version) || version.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }

    auto q = target.find('?');
    request.path = target.substr(0, q);
    if (q != std::string::npos) {
        std::stringstream qs(target.substr(q + 1));
        std::string pair;
        while (std::getline(qs, pair, '&')) {
            if (pair.empty()) continue;
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                request.query[percentDecode(pair)] = "";
            } else {
                request.query[percentDecode(pair.substr(0, eq))] = percentDecode(pair.substr(eq + 1));
            }
        }
    }

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        std::string value = line.substr(colon + 1);
        auto s = value.find_first_not_of(" \t");
        auto e = value.find_last_not_of(" \t");
        request.headers[toLower(line.substr(0, colon))] = s == std::string::npos ? "" : value.substr(s, e - s + 1);
    }
    return request;
}

bool HttpGateway::start() {
    if (running_.load()) {
        LOG_WARN("Gateway already running");
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        LOG_ERROR("Failed to create socket: " + std::string(std::strerror(errno)));
        return false;
    }

    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (::inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("Invalid listen address: " + config_.host);
        ::close(fd);
        return false;
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("Failed to bind " + config_.host + ":" + std::to_string(config_.port) + ": " +
                  std::strerror(errno));
        ::close(fd);
        return false;
    }
    if (::listen(fd, 128) < 0) {
        LOG_ERROR("Failed to listen: " + std::string(std::strerror(errno)));
        ::close(fd);
        return false;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        boundPort_ = ntohs(addr.sin_port);
    }

    listenFd_.store(fd);
    running_.store(true);
    try {
        acceptThread_ = std::thread(&HttpGateway::acceptLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start accept thread: " + std::string(e.what()));
        running_.store(false);
        listenFd_.store(-1);
        ::close(fd);
        return false;
    }

    LOG_INFO("Gateway listening on " + config_.host + ":" + std::to_string(boundPort_));
    return true;
}

void HttpGateway::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping gateway...");
    int fd = listenFd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(connMutex_);
        for (int client : openFds_) {
            ::shutdown(client, SHUT_RDWR);
        }
    }
    reapConnections(true);
    LOG_INFO("Gateway stopped");
}

void HttpGateway::reapConnections(bool all) {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (all || (*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& conn : finished) {
        if (conn->thread.joinable()) {
            conn->thread.join();
        }
    }
}

void HttpGateway::acceptLoop() {
    setThreadName("Gateway");

    while (running_.load()) {
        int fd = listenFd_.load();
        if (fd < 0) break;

        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int client = ::accept4(fd, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno == EINTR) continue;
            break;  // listen socket closed by stop()
        }
        if (!running_.load()) {
            ::close(client);
            break;
        }

        timeval timeout{5, 0};
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        reapConnections(false);

        std::lock_guard<std::mutex> lock(connMutex_);
        auto conn = std::make_unique<Connection>();
        Connection* raw = conn.get();
        const int id = nextConnection_++;
        openFds_.insert(client);
        try {
            raw->thread = std::thread([this, raw, client, id] {
                serve(client, id);
                {
                    std::lock_guard<std::mutex> guard(connMutex_);
                    openFds_.erase(client);
                }
                ::close(client);
                raw->done.store(true);
            });
            connections_.push_back(std::move(conn));
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to start connection thread: " + std::string(e.what()));
            openFds_.erase(client);
            ::close(client);
        }
    }

    LOG_DEBUG("Accept loop finished");
    clearThreadName();
}

void HttpGateway::serve(int fd, int connectionId) {
    setThreadName("Http-" + std::to_string(connectionId));

    std::string buffer;
    char chunk[4096];
    std::size_t headerEnd = std::string::npos;
    while (headerEnd == std::string::npos) {
        if (buffer.size() > kMaxHeader) {
            (void)sendAll(fd, errorResponse(413, "request header too large").serialize());
            clearThreadName();
            return;
        }
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            clearThreadName();
            return;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));
        headerEnd = buffer.find("\r\n\r\n");
    }

    auto request = parseRequest(buffer.substr(0, headerEnd + 2));
    if (!request) {
        (void)sendAll(fd, errorResponse(400, "malformed request").serialize());
        clearThreadName();
        return;
    }

    std::size_t contentLength = 0;
    auto cl = request->headers.find("content-length");
    if (cl != request->headers.end()) {
        try {
            contentLength = static_cast<std::size_t>(std::stoull(cl->second));
        } catch (const std::exception&) {
            (void)sendAll(fd, errorResponse(400, "invalid Content-Length").serialize());
            clearThreadName();
            return;
        }
    }
    if (contentLength > kMaxBody) {
        (void)sendAll(fd, errorResponse(413, "request body too large").serialize());
        clearThreadName();
        return;
    }

    request->body = buffer.substr(headerEnd + 4);
    while (request->body.size() < contentLength) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            clearThreadName();
            return;
        }
        request->body.append(chunk, static_cast<std::size_t>(n));
    }
    request->body.resize(contentLength);

    LOG_DEBUG(request->method + " " + request->path);

    std::string server;
    std::string action;
    if (request->method == "GET" && matchServerRoute(request->path, server, action) && action == "sse") {
        stream(fd, server);
    } else if (!sendAll(fd, handle(*request).serialize())) {
        LOG_DEBUG("Client went away before the response was written");
    }
    clearThreadName();
}

HttpResponse HttpGateway::handle(const HttpRequest& request) {
    if (request.path == "/health") {
        if (request.method != "GET") {
            return errorResponse(405, "method not allowed");
        }
        return jsonResponse(200, {{"status", "ok"}, {"sessions", bridge_.sessionCount()}});
    }

    std::string server;
    std::string action;
    if (!matchServerRoute(request.path, server, action)) {
        return errorResponse(404, "no route for " + request.path);
    }
    if (action == "message") {
        if (request.method != "POST") {
            return errorResponse(405, "method not allowed");
        }
        return postMessage(server, request);
    }
    if (action == "sse") {
        return errorResponse(405, "event stream requires GET");
    }
    return errorResponse(404, "no route for " + request.path);
}

HttpResponse HttpGateway::postMessage(const std::string& server, const HttpRequest& request) {
    auto sid = request.query.find("session");
    if (sid == request.query.end() || sid->second.empty()) {
        return errorResponse(400, "missing session parameter");
    }

    auto session = bridge_.findSession(sid->second);
    if (!session || session->server() != server || session->isClosed()) {
        return errorResponse(404, "unknown session " + sid->second);
    }
    if (!nlohmann::json::accept(request.body)) {
        return errorResponse(400, "invalid JSON-RPC message");
    }

    Error err = session->send(request.body);
    if (err.failed()) {
        return errorResponse(503, err.message);
    }

    HttpResponse accepted;
    accepted.status = 202;
    accepted.contentType = "text/plain";
    accepted.body = "Accepted";
    return accepted;
}

void HttpGateway::stream(int fd, const std::string& server) {
    auto opened = bridge_.openSession(server);
    if (!opened) {
        const int status = opened.error.kind == ErrorKind::NotFound ? 404 : 503;
        (void)sendAll(fd, errorResponse(status, opened.error.message).serialize());
        return;
    }
    auto session = opened.value;

    const std::string headers =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: keep-alive\r\n\r\n";
    if (!sendAll(fd, headers)) {
        session->close();
        return;
    }

    auto lastWrite = std::chrono::steady_clock::now();
    while (running_.load()) {
        auto event = session->next(kEventPoll);
        if (event) {
            if (!sendAll(fd, event->toSse())) {
                LOG_DEBUG("Client of session " + session->id() + " disconnected");
                break;
            }
            lastWrite = std::chrono::steady_clock::now();
            continue;
        }
        if (session->isClosed()) {
            break;
        }
        if (std::chrono::steady_clock::now() - lastWrite >= kKeepAlive) {
            if (!sendAll(fd, ": keep-alive\n\n")) {
                break;
            }
            lastWrite = std::chrono::steady_clock::now();
        }
    }
    session->close();
}

}
