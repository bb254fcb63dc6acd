#include "errors/error_taxonomy.hpp"

#include <chrono>

#include "errors/exchange_errors.hpp"

const char* to_cstr(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AuthenticationError: return "AUTHENTICATION_ERROR";
        case ErrorKind::PermissionDenied: return "PERMISSION_DENIED";
        case ErrorKind::InsufficientFunds: return "INSUFFICIENT_FUNDS";
        case ErrorKind::InvalidOrder: return "INVALID_ORDER";
        case ErrorKind::OrderNotFound: return "ORDER_NOT_FOUND";
        case ErrorKind::NetworkError: return "NETWORK_ERROR";
        case ErrorKind::RequestTimeout: return "REQUEST_TIMEOUT";
        case ErrorKind::RateLimitExceeded: return "RATE_LIMIT_EXCEEDED";
        case ErrorKind::ExchangeNotAvailable: return "EXCHANGE_NOT_AVAILABLE";
        case ErrorKind::DDoSProtection: return "DDOS_PROTECTION";
        case ErrorKind::ExchangeError: return "EXCHANGE_ERROR";
        case ErrorKind::UnknownError: return "UNKNOWN_ERROR";
    }
    return "?";
}

bool is_retryable_kind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NetworkError:
        case ErrorKind::RequestTimeout:
        case ErrorKind::ExchangeNotAvailable:
        case ErrorKind::DDoSProtection:
        case ErrorKind::RateLimitExceeded:
            return true;
        default:
            return false;
    }
}

bool should_retry(ErrorKind kind, int attempt, int max_retries) {
    if (attempt >= max_retries) {
        return false;
    }
    return is_retryable_kind(kind);
}

ErrorKind classify(const std::exception_ptr& cause) {
    if (!cause) {
        return ErrorKind::UnknownError;
    }
    // Order matters: derived classes before their bases.
    try {
        std::rethrow_exception(cause);
    } catch (const NormalizedError& e) {
        return e.kind();
    } catch (const PermissionDenied&) {
        return ErrorKind::PermissionDenied;
    } catch (const AuthenticationError&) {
        return ErrorKind::AuthenticationError;
    } catch (const InsufficientFunds&) {
        return ErrorKind::InsufficientFunds;
    } catch (const OrderNotFound&) {
        return ErrorKind::OrderNotFound;
    } catch (const InvalidOrder&) {
        return ErrorKind::InvalidOrder;
    } catch (const RateLimitExceeded&) {
        return ErrorKind::RateLimitExceeded;
    } catch (const DDoSProtection&) {
        return ErrorKind::DDoSProtection;
    } catch (const RequestTimeout&) {
        return ErrorKind::RequestTimeout;
    } catch (const ExchangeNotAvailable&) {
        return ErrorKind::ExchangeNotAvailable;
    } catch (const NetworkError&) {
        return ErrorKind::NetworkError;
    } catch (const ExchangeError&) {
        return ErrorKind::ExchangeError;
    } catch (...) {
        return ErrorKind::UnknownError;
    }
}

std::string error_message(const std::exception_ptr& cause) {
    if (!cause) {
        return "Unknown error";
    }
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        std::string msg = e.what();
        return msg.empty() ? "Unknown error" : msg;
    } catch (...) {
        return "Unknown error";
    }
}

static std::int64_t wall_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

NormalizedError::NormalizedError(const std::string& message, ErrorKind kind,
    std::string exchange, std::string operation, bool retryable,
    std::exception_ptr cause)
    : std::runtime_error(message)
    , kind_(kind)
    , exchange_(std::move(exchange))
    , operation_(std::move(operation))
    , retryable_(retryable)
    , timestamp_(wall_ms())
    , cause_(std::move(cause))
{
    if (!cause_) {
        return;
    }
    try {
        std::rethrow_exception(cause_);
    } catch (const ExchangeException& e) {
        code_ = e.code();
        http_status_ = e.http_status();
    } catch (const NormalizedError& e) {
        code_ = e.code();
        http_status_ = e.http_status();
    } catch (...) {
        // Foreign failure: no code or status to carry over.
    }
}

NormalizedError normalize_error(const std::exception_ptr& cause,
    const std::string& exchange, const std::string& operation,
    int attempt, int max_retries)
{
    const ErrorKind kind = classify(cause);
    return NormalizedError(error_message(cause), kind, exchange, operation,
        should_retry(kind, attempt, max_retries), cause);
}
