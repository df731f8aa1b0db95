#pragma once

#include <chrono>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>

struct StageError {
    enum class Kind { Timeout, Failure, Cancelled };

    Kind kind = Kind::Failure;
    std::string message;

    static StageError timeout(std::string msg) { return {Kind::Timeout, std::move(msg)}; }
    static StageError failure(std::string msg) { return {Kind::Failure, std::move(msg)}; }
    static StageError cancelled(std::string msg = "cancelled") { return {Kind::Cancelled, std::move(msg)}; }
};

inline std::string_view to_string(StageError::Kind kind) {
    switch (kind) {
        case StageError::Kind::Timeout: return "timeout";
        case StageError::Kind::Failure: return "failure";
        case StageError::Kind::Cancelled: return "cancelled";
    }
    return "failure";
}

template <typename T>
using StageResult = std::expected<T, StageError>;

// Passed to every stage call. Implementations must give up once `stop` is
// requested and must not run longer than `timeout`.
struct StageContext {
    std::stop_token stop;
    std::chrono::milliseconds timeout{0};
};
