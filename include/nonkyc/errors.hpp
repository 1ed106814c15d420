#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace nonkyc {

enum class ErrorKind {
    Authentication,
    RateLimit,
    Transient,
    Validation,
    Configuration
};

const char* to_string(ErrorKind kind) noexcept;

class ApiError : public std::runtime_error {
public:
    ApiError(ErrorKind kind, const std::string& message, long status_code = 0)
        : std::runtime_error(message), kind_(kind), status_code_(status_code) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] long status_code() const noexcept { return status_code_; }

private:
    ErrorKind kind_;
    long status_code_;
};

// 401: credentials or signing are broken. Never retried.
class AuthenticationError : public ApiError {
public:
    explicit AuthenticationError(const std::string& message, long status_code = 401)
        : ApiError(ErrorKind::Authentication, message, status_code) {}
};

class RateLimitError : public ApiError {
public:
    explicit RateLimitError(const std::string& message,
                            std::optional<std::chrono::milliseconds> retry_after = std::nullopt)
        : ApiError(ErrorKind::RateLimit, message, 429), retry_after_(retry_after) {}

    [[nodiscard]] std::optional<std::chrono::milliseconds> retry_after() const noexcept {
        return retry_after_;
    }

private:
    std::optional<std::chrono::milliseconds> retry_after_;
};

// Timeouts, resets, 5xx. Safe to retry, but the outcome of a write is unknown.
class TransientApiError : public ApiError {
public:
    explicit TransientApiError(const std::string& message, long status_code = 0)
        : ApiError(ErrorKind::Transient, message, status_code) {}
};

class ValidationError : public ApiError {
public:
    explicit ValidationError(const std::string& message, long status_code = 0)
        : ApiError(ErrorKind::Validation, message, status_code) {}
};

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace nonkyc
