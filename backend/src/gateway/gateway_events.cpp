#include "gateway/gateway_events.hpp"

void to_json(nlohmann::json& j, const ConnectedEvent& e) {
    j = {{"exchange", e.exchange}, {"lightweight", e.lightweight}};
}

void to_json(nlohmann::json& j, const DisconnectedEvent& e) {
    j = {{"exchange", e.exchange}};
}

void to_json(nlohmann::json& j, const ErrorEvent& e) {
    j = {
        {"type", e.type},
        {"operation", e.operation},
        {"exchange", e.exchange},
        {"kind", to_cstr(e.kind)},
        {"error", e.error},
        {"code", e.code ? nlohmann::json(*e.code) : nlohmann::json()},
        {"httpStatus", e.http_status ? nlohmann::json(*e.http_status) : nlohmann::json()},
        {"retryable", e.retryable},
        {"timestamp", e.timestamp},
    };
    if (e.cause) {
        j["originalError"] = error_message(e.cause);
    }
}

void to_json(nlohmann::json& j, const RetryEvent& e) {
    j = {
        {"operation", e.operation},
        {"attempt", e.attempt},
        {"maxRetries", e.max_retries},
        {"delay", e.delay_ms},
        {"error", e.error},
    };
}

void to_json(nlohmann::json& j, const UnifiedOrder& o) {
    j = {
        {"id", o.id},
        {"clientOrderId", o.client_order_id ? nlohmann::json(*o.client_order_id) : nlohmann::json()},
        {"symbol", o.symbol},
        {"side", to_cstr(o.side)},
        {"type", to_cstr(o.type)},
        {"amount", o.amount},
        {"price", o.price ? nlohmann::json(*o.price) : nlohmann::json()},
        {"filled", o.filled},
        {"remaining", o.remaining},
        {"cost", o.cost},
        {"average", o.average},
        {"status", to_cstr(o.status)},
        {"timestamp", o.timestamp},
        {"exchange", o.exchange},
    };
    if (o.fee) {
        j["fee"] = {{"cost", o.fee->cost}, {"currency", o.fee->currency}};
    }
}

void to_json(nlohmann::json& j, const CancelAllResult& r) {
    nlohmann::json orders = nlohmann::json::array();
    for (const auto& o : r.orders) {
        nlohmann::json item = {{"id", o.id}, {"status", o.status}, {"success", o.success}};
        if (!o.error.empty()) {
            item["error"] = o.error;
        }
        orders.push_back(std::move(item));
    }
    j = {
        {"symbol", r.symbol},
        {"exchange", r.exchange},
        {"canceledCount", r.canceled_count},
        {"failedCount", r.failed_count},
        {"orders", std::move(orders)},
        {"timestamp", r.timestamp},
    };
}
