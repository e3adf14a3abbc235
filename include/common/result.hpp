#pragma once

#include <string>

enum class ErrorCode {
    NONE,
    VALIDATION,
    NOT_FOUND,
    CONCURRENCY,
    TRANSIENT_ENGINE,
    FATAL_ENGINE,
    VERIFICATION,
    PERSISTENCE
};

// Outcome of a command on the orchestrator surface
class Result {
public:
    Result() = default;

    static Result success(const std::string& message = "") {
        return Result(ErrorCode::NONE, message);
    }
    static Result failure(ErrorCode code, const std::string& message) {
        return Result(code, message);
    }

    bool ok() const { return code_ == ErrorCode::NONE; }
    explicit operator bool() const { return ok(); }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    Result(ErrorCode code, const std::string& message)
        : code_(code), message_(message) {}

    ErrorCode code_{ErrorCode::NONE};
    std::string message_;
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:             return "none";
        case ErrorCode::VALIDATION:       return "validation";
        case ErrorCode::NOT_FOUND:        return "not_found";
        case ErrorCode::CONCURRENCY:      return "concurrency";
        case ErrorCode::TRANSIENT_ENGINE: return "transient_engine";
        case ErrorCode::FATAL_ENGINE:     return "fatal_engine";
        case ErrorCode::VERIFICATION:     return "verification";
        case ErrorCode::PERSISTENCE:      return "persistence";
    }
    return "unknown";
}
