/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/process_runtime.hpp"
#include "nmcp/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace nmcp {

std::string Endpoint::toString() const {
    if (transport == TransportType::Sse) {
        return "http://" + host + ":" + std::to_string(port) + " (" + unit + ")";
    }
    return "stdio://" + unit;
}

struct ProcessRuntime::Unit {
    std::string name;
    pid_t pid = -1;
    int stdinFd = -1;
    int stdoutFd = -1;
    Endpoint endpoint;

    std::atomic<bool> exited{false};
    std::atomic<bool> stopping{false};
    std::thread reader;

    std::mutex writeMutex;

    std::mutex reapMutex;
    bool reaped = false;

    std::mutex subsMutex;
    std::map<int, std::pair<Channel::LineHandler, Channel::CloseHandler>> subscribers;
    int nextSubscriber = 1;
    bool closed = false;
    std::string closeReason;

    // Non-blocking reap; true once the child is gone.
    bool reap() {
        std::lock_guard<std::mutex> lock(reapMutex);
        if (reaped) return true;
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno == ECHILD)) {
            reaped = true;
            exited.store(true);
            if (r == pid) {
                if (WIFEXITED(status)) {
                    LOG_INFO("Unit " + name + " exited with status " + std::to_string(WEXITSTATUS(status)));
                } else if (WIFSIGNALED(status)) {
                    LOG_INFO("Unit " + name + " terminated by signal " + std::to_string(WTERMSIG(status)));
                }
            }
        }
        return reaped;
    }

    void dispatch(const std::string& line) {
        std::vector<Channel::LineHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(subsMutex);
            for (const auto& [id, sub] : subscribers) {
                handlers.push_back(sub.first);
            }
        }
        for (const auto& h : handlers) {
            if (h) h(line);
        }
    }

    void closeAll(const std::string& reason) {
        std::vector<Channel::CloseHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(subsMutex);
            if (closed) return;
            closed = true;
            closeReason = reason;
            for (const auto& [id, sub] : subscribers) {
                handlers.push_back(sub.second);
            }
            subscribers.clear();
        }
        for (const auto& h : handlers) {
            if (h) h(reason);
        }
    }

    void readLoop() {
        setThreadName("Unit-" + name);
        std::string buffer;
        char chunk[4096];
        std::string reason = "process exited";

        while (!stopping.load()) {
            pollfd pfd{stdoutFd, POLLIN, 0};
            int rc = ::poll(&pfd, 1, 200);
            if (rc < 0) {
                if (errno == EINTR) continue;
                reason = std::string("stdout poll failed: ") + std::strerror(errno);
                break;
            }
            if (rc == 0) continue;

            ssize_t n = ::read(stdoutFd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                reason = std::string("stdout read failed: ") + std::strerror(errno);
                break;
            }
            if (n == 0) {
                break;
            }

            buffer.append(chunk, static_cast<std::size_t>(n));
            std::size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty()) dispatch(line);
            }
        }

        if (stopping.load()) {
            reason = "unit deleted";
        }
        exited.store(true);
        LOG_DEBUG("Reader for unit " + name + " finished: " + reason);
        closeAll(reason);
        clearThreadName();
    }
};

namespace {

class ProcessChannel final : public Channel {
public:
    explicit ProcessChannel(std::shared_ptr<ProcessRuntime::Unit> unit) : unit_(std::move(unit)) {}
    ~ProcessChannel() override { close(); }

    void start(LineHandler onLine, CloseHandler onClose) override {
        std::string closedReason;
        {
            std::lock_guard<std::mutex> lock(unit_->subsMutex);
            if (!unit_->closed) {
                id_ = unit_->nextSubscriber++;
                unit_->subscribers[id_] = {std::move(onLine), onClose};
                return;
            }
            closedReason = unit_->closeReason;
        }
        if (onClose) onClose(closedReason);
    }

    Error send(const std::string& line) override {
        if (unit_->exited.load()) {
            return {ErrorKind::TransportError, "unit " + unit_->name + " is not running"};
        }
        std::string data = line;
        data.push_back('\n');

        std::lock_guard<std::mutex> lock(unit_->writeMutex);
        if (unit_->stdinFd < 0) {
            return {ErrorKind::TransportError, "unit " + unit_->name + " is shutting down"};
        }
        const char* ptr = data.data();
        std::size_t left = data.size();
        while (left > 0) {
            ssize_t n = ::write(unit_->stdinFd, ptr, left);
            if (n < 0) {
                if (errno == EINTR) continue;
                return {ErrorKind::TransportError,
                        "write to unit " + unit_->name + " failed: " + std::strerror(errno)};
            }
            ptr += n;
            left -= static_cast<std::size_t>(n);
        }
        return {};
    }

    void close() noexcept override {
        if (id_ == 0) return;
        std::lock_guard<std::mutex> lock(unit_->subsMutex);
        unit_->subscribers.erase(id_);
        id_ = 0;
    }

private:
    std::shared_ptr<ProcessRuntime::Unit> unit_;
    int id_ = 0;
};

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}

ProcessRuntime::ProcessRuntime(std::chrono::milliseconds terminationGrace)
    : terminationGrace_(terminationGrace) {
    // Writes to a unit whose process died must fail with EPIPE, not kill the daemon
    std::signal(SIGPIPE, SIG_IGN);
}

ProcessRuntime::~ProcessRuntime() {
    shutdown();
}

Result<Endpoint> ProcessRuntime::createUnit(const std::string& name, const UnitSpec& spec) {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return Result<Endpoint>::failure(ErrorKind::InvalidSpec, "unit " + name + " has no command");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (units_.count(name) > 0) {
            return Result<Endpoint>::failure(ErrorKind::AlreadyExists, "unit " + name + " already exists");
        }
    }

    // Everything the child needs is built before fork
    std::vector<std::string> envStrings;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        bool overridden = key == "PORT";
        for (const auto& var : spec.env) {
            if (var.name == key) overridden = true;
        }
        if (!overridden) envStrings.push_back(std::move(entry));
    }
    for (const auto& var : spec.env) {
        envStrings.push_back(var.name + "=" + var.value);
    }
    if (spec.transport.type == TransportType::Sse) {
        envStrings.push_back("PORT=" + std::to_string(spec.transport.port));
    }

    std::vector<char*> argv;
    for (const auto& a : spec.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& e : envStrings) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0) {
        std::string err = std::strerror(errno);
        for (int* p : {inPipe, outPipe, errPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        return Result<Endpoint>::failure(ErrorKind::SubstrateError, "pipe failed: " + err);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string err = std::strerror(errno);
        for (int* p : {inPipe, outPipe, errPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        return Result<Endpoint>::failure(ErrorKind::SubstrateError, "fork failed: " + err);
    }

    if (pid == 0) {
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        ssize_t ignored = ::write(errPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    // errPipe closes on a successful exec; otherwise the child reports errno
    int execErr = 0;
    ssize_t got;
    do {
        got = ::read(errPipe[0], &execErr, sizeof(execErr));
    } while (got < 0 && errno == EINTR);
    closeFd(errPipe[0]);

    if (got > 0) {
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        return Result<Endpoint>::failure(ErrorKind::InvalidSpec,
            "cannot execute '" + spec.argv.front() + "': " + std::strerror(execErr));
    }

    auto unit = std::make_shared<Unit>();
    unit->name = name;
    unit->pid = pid;
    unit->stdinFd = inPipe[1];
    unit->stdoutFd = outPipe[0];
    unit->endpoint.unit = name;
    unit->endpoint.transport = spec.transport.type;
    if (spec.transport.type == TransportType::Sse) {
        unit->endpoint.host = "127.0.0.1";
        unit->endpoint.port = spec.transport.port;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (units_.count(name) > 0) {
            // Lost a create race for the same name
            terminate(*unit);
            return Result<Endpoint>::failure(ErrorKind::AlreadyExists, "unit " + name + " already exists");
        }
        units_[name] = unit;
    }
    Unit* raw = unit.get();
    unit->reader = std::thread([raw] { raw->readLoop(); });

    LOG_INFO("Started unit " + name + " (pid " + std::to_string(pid) + "): " + spec.argv.front());
    return Result<Endpoint>::success(unit->endpoint);
}

std::shared_ptr<ProcessRuntime::Unit> ProcessRuntime::findUnit(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(name);
    return it == units_.end() ? nullptr : it->second;
}

UnitState ProcessRuntime::unitState(const std::string& name) const {
    auto unit = findUnit(name);
    if (!unit) {
        return UnitState::Absent;
    }
    if (unit->exited.load() || unit->reap()) {
        return UnitState::Exited;
    }
    return UnitState::Ready;
}

std::optional<Endpoint> ProcessRuntime::endpoint(const std::string& name) const {
    auto unit = findUnit(name);
    if (!unit) {
        return std::nullopt;
    }
    return unit->endpoint;
}

Error ProcessRuntime::deleteUnit(const std::string& name) {
    std::shared_ptr<Unit> unit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = units_.find(name);
        if (it == units_.end()) {
            return {ErrorKind::NotFound, "unit " + name + " not found"};
        }
        unit = it->second;
        units_.erase(it);
    }
    terminate(*unit);
    LOG_INFO("Deleted unit " + name);
    return {};
}

Result<std::shared_ptr<Channel>> ProcessRuntime::openChannel(const std::string& name) {
    auto unit = findUnit(name);
    if (!unit) {
        return Result<std::shared_ptr<Channel>>::failure(ErrorKind::NotFound, "unit " + name + " not found");
    }
    if (unit->endpoint.transport != TransportType::Stdio) {
        return Result<std::shared_ptr<Channel>>::failure(ErrorKind::TransportError,
            "unit " + name + " does not speak stdio");
    }
    if (unit->exited.load()) {
        return Result<std::shared_ptr<Channel>>::failure(ErrorKind::TransportError,
            "unit " + name + " is not running");
    }
    return Result<std::shared_ptr<Channel>>::success(std::make_shared<ProcessChannel>(unit));
}

void ProcessRuntime::terminate(Unit& unit) noexcept {
    unit.stopping.store(true);
    {
        std::lock_guard<std::mutex> lock(unit.writeMutex);
        closeFd(unit.stdinFd);
    }

    if (!unit.reap()) {
        ::kill(unit.pid, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + terminationGrace_;
        while (!unit.reap() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (!unit.reap()) {
            LOG_WARN("Unit " + unit.name + " ignored SIGTERM; killing");
            ::kill(unit.pid, SIGKILL);
            std::lock_guard<std::mutex> lock(unit.reapMutex);
            int status = 0;
            ::waitpid(unit.pid, &status, 0);
            unit.reaped = true;
            unit.exited.store(true);
        }
    }

    if (unit.reader.joinable()) {
        unit.reader.join();
    }
    closeFd(unit.stdoutFd);
}

void ProcessRuntime::shutdown() noexcept {
    std::unordered_map<std::string, std::shared_ptr<Unit>> units;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        units.swap(units_);
    }
    for (auto& [name, unit] : units) {
        terminate(*unit);
    }
    if (!units.empty()) {
        LOG_INFO("Terminated " + std::to_string(units.size()) + " unit(s)");
    }
}

}
