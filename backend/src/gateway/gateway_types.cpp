#include "gateway/gateway_types.hpp"

#include <algorithm>
#include <cctype>

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

std::optional<OrderSide> parse_order_side(const std::string& s) {
    const std::string v = lower(s);
    if (v == "buy") return OrderSide::Buy;
    if (v == "sell") return OrderSide::Sell;
    return std::nullopt;
}

std::optional<OrderType> parse_order_type(const std::string& s) {
    const std::string v = lower(s);
    if (v == "market") return OrderType::Market;
    if (v == "limit") return OrderType::Limit;
    if (v == "stop") return OrderType::Stop;
    if (v == "stop_limit") return OrderType::StopLimit;
    if (v == "stop_market") return OrderType::StopMarket;
    return std::nullopt;
}

std::optional<MarginMode> parse_margin_mode(const std::string& s) {
    const std::string v = lower(s);
    if (v == "cross" || v == "crossed") return MarginMode::Cross;
    if (v == "isolated") return MarginMode::Isolated;
    return std::nullopt;
}

OrderStatus normalize_order_status(const std::string& raw) {
    const std::string v = lower(raw);
    if (v == "new" || v == "open" || v == "partially_filled" || v == "live") {
        return OrderStatus::Open;
    }
    if (v == "filled" || v == "closed") return OrderStatus::Closed;
    if (v == "canceled" || v == "cancelled") return OrderStatus::Canceled;
    if (v == "rejected") return OrderStatus::Rejected;
    if (v == "expired") return OrderStatus::Expired;
    return OrderStatus::Open;
}

void to_json(nlohmann::json& j, const Balance& b) {
    j = nlohmann::json{
        {"total", b.total},
        {"free", b.free},
        {"used", b.used},
        {"exchange", b.exchange},
        {"timestamp", b.timestamp},
    };
    if (!b.raw.is_null()) {
        j["info"] = b.raw;
    }
}

void from_json(const nlohmann::json& j, Balance& b) {
    j.at("total").get_to(b.total);
    b.free = j.value("free", std::map<std::string, double>{});
    b.used = j.value("used", std::map<std::string, double>{});
    b.exchange = j.value("exchange", std::string{});
    b.timestamp = j.value("timestamp", std::int64_t{0});
    b.raw = j.contains("info") ? j.at("info") : nlohmann::json();
}
