#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace nmcp {

// Server lifecycle phases.
enum class Phase : std::uint8_t { Pending, Starting, Running, Idle, Stopping, Stopped, Failed };

enum class ErrorKind : std::uint8_t {
    None = 0,
    NotFound,
    AlreadyExists,
    CapacityExceeded,
    SubstrateError,
    InvalidSpec,
    TransportError,
    Conflict
};

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn = std::function<TimePoint()>;

inline TimePoint systemNow() { return Clock::now(); }

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    [[nodiscard]] bool failed() const noexcept { return kind != ErrorKind::None; }
};

template <typename T>
struct Result {
    bool ok = false;
    T value{};
    Error error;

    explicit operator bool() const noexcept { return ok; }

    static Result success(T v) {
        Result r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }

    static Result failure(ErrorKind kind, std::string message) {
        Result r;
        r.error = {kind, std::move(message)};
        return r;
    }

    static Result failure(Error error) {
        Result r;
        r.error = std::move(error);
        return r;
    }
};

[[nodiscard]] const char* phaseToString(Phase phase) noexcept;
[[nodiscard]] bool phaseFromString(const std::string& value, Phase& out) noexcept;
[[nodiscard]] const char* errorKindToString(ErrorKind kind) noexcept;

// CapacityExceeded and SubstrateError are retried with backoff; everything else is
// either terminal or handled by the caller.
[[nodiscard]] bool isRetryable(ErrorKind kind) noexcept;

[[nodiscard]] std::int64_t toEpochMillis(TimePoint tp) noexcept;
[[nodiscard]] TimePoint fromEpochMillis(std::int64_t ms) noexcept;

} // namespace nmcp
