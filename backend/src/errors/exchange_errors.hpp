#pragma once

#include <optional>
#include <stdexcept>
#include <string>

// Exceptions thrown by exchange connectors. The hierarchy is what the
// taxonomy classifier walks, most derived first.
class ExchangeException : public std::runtime_error {
public:
    explicit ExchangeException(const std::string& message,
        std::optional<std::string> code = std::nullopt,
        std::optional<int> http_status = std::nullopt)
        : std::runtime_error(message)
        , code_(std::move(code))
        , http_status_(http_status) {}

    const std::optional<std::string>& code() const { return code_; }
    std::optional<int> http_status() const { return http_status_; }

private:
    std::optional<std::string> code_;
    std::optional<int> http_status_;
};

// Exchange answered, but refused the request.
class ExchangeError : public ExchangeException {
public:
    using ExchangeException::ExchangeException;
};

class AuthenticationError : public ExchangeError {
public:
    using ExchangeError::ExchangeError;
};

// Key is valid but lacks a permission, or the caller IP is not whitelisted.
class PermissionDenied : public AuthenticationError {
public:
    using AuthenticationError::AuthenticationError;
};

class InsufficientFunds : public ExchangeError {
public:
    using ExchangeError::ExchangeError;
};

class InvalidOrder : public ExchangeError {
public:
    using ExchangeError::ExchangeError;
};

class OrderNotFound : public InvalidOrder {
public:
    using InvalidOrder::InvalidOrder;
};

class BadSymbol : public ExchangeError {
public:
    using ExchangeError::ExchangeError;
};

// Transport level failures. Everything below is transient.
class NetworkError : public ExchangeException {
public:
    using ExchangeException::ExchangeException;
};

class RequestTimeout : public NetworkError {
public:
    using NetworkError::NetworkError;
};

class ExchangeNotAvailable : public NetworkError {
public:
    using NetworkError::NetworkError;
};

class DDoSProtection : public NetworkError {
public:
    using NetworkError::NetworkError;
};

class RateLimitExceeded : public DDoSProtection {
public:
    using DDoSProtection::DDoSProtection;
};
