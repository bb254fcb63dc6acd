#pragma once

#include <stdexcept>
#include <string>

// Failures raised by the gateway itself, before any connector call.
enum class GatewayErrorCode {
    NotConnected,
    InvalidSymbol,
    InvalidSide,
    InvalidType,
    InvalidAmount,
    InvalidPrice,
    Unsupported,
    // Follower or lock-losing auto process with nothing usable in the store.
    CacheUnavailable,
    UnknownExchange,
};

inline const char* to_cstr(GatewayErrorCode code) {
    switch (code) {
        case GatewayErrorCode::NotConnected: return "NOT_CONNECTED";
        case GatewayErrorCode::InvalidSymbol: return "INVALID_SYMBOL";
        case GatewayErrorCode::InvalidSide: return "INVALID_SIDE";
        case GatewayErrorCode::InvalidType: return "INVALID_TYPE";
        case GatewayErrorCode::InvalidAmount: return "INVALID_AMOUNT";
        case GatewayErrorCode::InvalidPrice: return "INVALID_PRICE";
        case GatewayErrorCode::Unsupported: return "UNSUPPORTED";
        case GatewayErrorCode::CacheUnavailable: return "CACHE_UNAVAILABLE";
        case GatewayErrorCode::UnknownExchange: return "UNKNOWN_EXCHANGE";
    }
    return "?";
}

class GatewayError : public std::runtime_error {
public:
    GatewayError(GatewayErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    GatewayErrorCode code() const { return code_; }

private:
    GatewayErrorCode code_;
};
