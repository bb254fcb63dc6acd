#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

enum class ErrorKind {
    AuthenticationError,
    PermissionDenied,
    InsufficientFunds,
    InvalidOrder,
    OrderNotFound,
    NetworkError,
    RequestTimeout,
    RateLimitExceeded,
    ExchangeNotAvailable,
    DDoSProtection,
    ExchangeError,
    UnknownError,
};

const char* to_cstr(ErrorKind kind);

// Transient kinds: network, timeout, exchange down, ddos, rate limit.
bool is_retryable_kind(ErrorKind kind);

// Pure in its arguments. Once attempt reaches max_retries the answer is
// false whatever the kind.
bool should_retry(ErrorKind kind, int attempt, int max_retries);

// Maps any failure to exactly one kind. A null pointer is UnknownError.
ErrorKind classify(const std::exception_ptr& cause);

// Never throws. Falls back to "Unknown error".
std::string error_message(const std::exception_ptr& cause);

class NormalizedError : public std::runtime_error {
public:
    NormalizedError(const std::string& message, ErrorKind kind,
        std::string exchange, std::string operation, bool retryable,
        std::exception_ptr cause);

    ErrorKind kind() const { return kind_; }
    const std::optional<std::string>& code() const { return code_; }
    const std::string& exchange() const { return exchange_; }
    const std::string& operation() const { return operation_; }
    std::optional<int> http_status() const { return http_status_; }
    bool retryable() const { return retryable_; }
    std::int64_t timestamp() const { return timestamp_; }

    // Original failure, for diagnostics and rethrow.
    const std::exception_ptr& cause() const { return cause_; }

private:
    ErrorKind kind_;
    std::optional<std::string> code_;
    std::string exchange_;
    std::string operation_;
    std::optional<int> http_status_;
    bool retryable_;
    std::int64_t timestamp_;
    std::exception_ptr cause_;
};

// Outside the retry loop (attempt 0 of 1) retryable reduces to the kind.
NormalizedError normalize_error(const std::exception_ptr& cause,
    const std::string& exchange, const std::string& operation,
    int attempt = 0, int max_retries = 1);
