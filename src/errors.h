#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace sniprun {

// Reasons a submission is refused before anything runs
enum class ErrorCode {
    INVALID_LANGUAGE,   // caller error, no retry
    PAYLOAD_TOO_LARGE,  // caller error, no retry
    BAD_REQUEST,        // malformed body
    THROTTLED,          // session quota, retry after backoff
    REJECTED,           // session flagged as abusive
    SERVICE_BUSY,       // queue full, retry later
    NOT_FOUND
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_LANGUAGE: return "InvalidLanguage";
        case ErrorCode::PAYLOAD_TOO_LARGE: return "PayloadTooLarge";
        case ErrorCode::BAD_REQUEST: return "BadRequest";
        case ErrorCode::THROTTLED: return "Throttled";
        case ErrorCode::REJECTED: return "Rejected";
        case ErrorCode::SERVICE_BUSY: return "ServiceBusy";
        case ErrorCode::NOT_FOUND: return "NotFound";
    }
    return "Unknown";
}

class RejectedError : public std::runtime_error {
public:
    RejectedError(ErrorCode code, const std::string& message,
                  std::chrono::seconds retry_after = std::chrono::seconds(0))
        : std::runtime_error(message), code_(code), retry_after_(retry_after) {}

    ErrorCode code() const { return code_; }
    std::chrono::seconds retry_after() const { return retry_after_; }

private:
    ErrorCode code_;
    std::chrono::seconds retry_after_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error("Sandbox error: " + message) {}
};

} // namespace sniprun
