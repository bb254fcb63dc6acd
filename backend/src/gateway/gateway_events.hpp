#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "errors/error_taxonomy.hpp"
#include "gateway/gateway_types.hpp"
#include "retry/retry_engine.hpp"

// Event names as seen by collaborators.
constexpr const char* kEventConnected = "connected";
constexpr const char* kEventDisconnected = "disconnected";
constexpr const char* kEventError = "error";
constexpr const char* kEventRetry = "retry";
constexpr const char* kEventOrderCreated = "orderCreated";
constexpr const char* kEventOrderCanceled = "orderCanceled";
constexpr const char* kEventAllOrdersCanceled = "allOrdersCanceled";

struct ConnectedEvent {
    std::string exchange;
    bool lightweight{false};
};

struct DisconnectedEvent {
    std::string exchange;
};

struct ErrorEvent {
    std::string type;           // "request" or "connect"
    std::string operation;
    std::string exchange;
    ErrorKind kind{ErrorKind::UnknownError};
    std::string error;
    std::optional<std::string> code;
    std::optional<int> http_status;
    bool retryable{false};
    std::int64_t timestamp{0};
    std::exception_ptr cause;   // connector failure as thrown
};

// Observer for one gateway. Unset callbacks are skipped. on_event sees every
// event by name with its JSON payload.
struct GatewayListener {
    std::function<void(const ConnectedEvent&)> on_connected;
    std::function<void(const DisconnectedEvent&)> on_disconnected;
    std::function<void(const ErrorEvent&)> on_error;
    std::function<void(const RetryEvent&)> on_retry;
    std::function<void(const UnifiedOrder&)> on_order_created;
    std::function<void(const UnifiedOrder&)> on_order_canceled;
    std::function<void(const CancelAllResult&)> on_all_orders_canceled;
    std::function<void(const std::string& name, const nlohmann::json& payload)> on_event;
};

void to_json(nlohmann::json& j, const ConnectedEvent& e);
void to_json(nlohmann::json& j, const DisconnectedEvent& e);
void to_json(nlohmann::json& j, const ErrorEvent& e);
void to_json(nlohmann::json& j, const RetryEvent& e);
void to_json(nlohmann::json& j, const UnifiedOrder& o);
void to_json(nlohmann::json& j, const CancelAllResult& r);
