#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum class OrderSide { Buy, Sell };

enum class OrderType { Market, Limit, Stop, StopLimit, StopMarket };

enum class OrderStatus { Open, Closed, Canceled, Rejected, Expired };

enum class PositionSide { Long, Short };

enum class MarginMode { Cross, Isolated };

inline const char* to_cstr(OrderSide s) { return s == OrderSide::Buy ? "buy" : "sell"; }

inline const char* to_cstr(OrderType t) {
    switch (t) {
        case OrderType::Market: return "market";
        case OrderType::Limit: return "limit";
        case OrderType::Stop: return "stop";
        case OrderType::StopLimit: return "stop_limit";
        case OrderType::StopMarket: return "stop_market";
    }
    return "?";
}

inline const char* to_cstr(OrderStatus st) {
    switch (st) {
        case OrderStatus::Open: return "open";
        case OrderStatus::Closed: return "closed";
        case OrderStatus::Canceled: return "canceled";
        case OrderStatus::Rejected: return "rejected";
        case OrderStatus::Expired: return "expired";
    }
    return "?";
}

inline const char* to_cstr(PositionSide s) { return s == PositionSide::Long ? "long" : "short"; }
inline const char* to_cstr(MarginMode m) { return m == MarginMode::Cross ? "cross" : "isolated"; }

// Case-insensitive parsers. Unknown text yields nullopt.
std::optional<OrderSide> parse_order_side(const std::string& s);
std::optional<OrderType> parse_order_type(const std::string& s);
std::optional<MarginMode> parse_margin_mode(const std::string& s);

// new/open/partially_filled -> open, filled/closed -> closed, canceled and
// cancelled -> canceled, rejected, expired. Anything else reads as open.
OrderStatus normalize_order_status(const std::string& raw);

struct Fee {
    double cost{0.0};
    std::string currency;
    std::optional<double> rate;
};

struct Trade {
    std::string id;
    double price{0.0};
    double amount{0.0};
    std::int64_t timestamp{0};
    std::optional<Fee> fee;
};

struct Balance {
    std::map<std::string, double> total;
    std::map<std::string, double> free;
    std::map<std::string, double> used;
    std::string exchange;
    std::int64_t timestamp{0};
    nlohmann::json raw;

    bool operator==(const Balance& o) const {
        return total == o.total && free == o.free && used == o.used &&
            exchange == o.exchange && timestamp == o.timestamp;
    }
};

void to_json(nlohmann::json& j, const Balance& b);
void from_json(const nlohmann::json& j, Balance& b);

struct Ticker {
    std::string symbol;
    std::optional<double> bid;
    std::optional<double> ask;
    std::optional<double> last;
    std::optional<double> high;
    std::optional<double> low;
    std::optional<double> base_volume;
    std::optional<double> quote_volume;
    std::optional<double> percentage;
    std::int64_t timestamp{0};
    nlohmann::json raw;
};

// One OHLCV row.
struct Candle {
    std::int64_t timestamp{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

struct FundingRate {
    std::string symbol;
    double funding_rate{0.0};
    std::optional<double> funding_rate_predicted;
    std::int64_t funding_timestamp{0};
    std::optional<double> mark_price;
    std::optional<double> index_price;
    std::string exchange;
    std::int64_t timestamp{0};
    nlohmann::json raw;
};

struct UnifiedOrder {
    std::string id;
    std::optional<std::string> client_order_id;
    std::string symbol;
    OrderSide side{OrderSide::Buy};
    OrderType type{OrderType::Limit};
    double amount{0.0};
    std::optional<double> price;
    double filled{0.0};
    double remaining{0.0};
    double cost{0.0};
    double average{0.0};
    OrderStatus status{OrderStatus::Open};
    std::int64_t timestamp{0};
    std::optional<std::int64_t> last_trade_timestamp;
    std::optional<Fee> fee;
    std::vector<Trade> trades;
    std::string exchange;
    nlohmann::json raw;
};

struct UnifiedPosition {
    std::string symbol;
    PositionSide side{PositionSide::Long};
    double contracts{0.0};
    double notional{0.0};
    double entry_price{0.0};
    double mark_price{0.0};
    double liquidation_price{0.0};
    double leverage{1.0};
    double unrealized_pnl{0.0};
    double percentage{0.0};
    double realized_pnl{0.0};
    MarginMode margin_mode{MarginMode::Cross};
    double collateral{0.0};
    std::int64_t timestamp{0};
    std::string exchange;
    nlohmann::json raw;
};

struct CancelOutcome {
    std::string id;
    bool success{false};
    std::string status;     // "canceled" or "failed"
    std::string error;
};

struct CancelAllResult {
    std::string symbol;
    std::string exchange;
    int canceled_count{0};
    int failed_count{0};
    std::vector<CancelOutcome> orders;
    std::int64_t timestamp{0};
};
