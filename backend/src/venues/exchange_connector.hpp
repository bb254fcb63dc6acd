#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gateway/gateway_types.hpp"
#include "symbols/market_info.hpp"

enum class ConnectorOp {
    FetchTime,
    LoadMarkets,
    FetchBalance,
    FetchPositions,
    FetchTicker,
    FetchOhlcv,
    FetchFundingRate,
    CreateOrder,
    CancelOrder,
    CancelAllOrders,
    FetchOpenOrders,
    FetchOrder,
    SetLeverage,
};

using ConnectorOpSet = std::set<ConnectorOp>;

const char* to_cstr(ConnectorOp op);

// Order as the venue reported it. Fields the venue did not send stay empty
// and are defaulted by the gateway's normalizer.
struct RawOrder {
    std::string id;
    std::optional<std::string> client_order_id;
    std::string symbol;
    std::string side;
    std::string type;
    std::optional<double> amount;
    std::optional<double> price;
    std::optional<double> filled;
    std::optional<double> remaining;
    std::optional<double> cost;
    std::optional<double> average;
    std::string status;
    std::optional<std::int64_t> timestamp;
    std::optional<std::int64_t> last_trade_timestamp;
    std::optional<Fee> fee;
    std::vector<Trade> trades;
    nlohmann::json info;
};

struct RawPosition {
    std::string symbol;
    std::string side;
    std::optional<double> contracts;
    std::optional<double> notional;
    std::optional<double> entry_price;
    std::optional<double> mark_price;
    std::optional<double> liquidation_price;
    std::optional<double> leverage;
    std::optional<double> unrealized_pnl;
    std::optional<double> percentage;
    std::optional<double> realized_pnl;
    std::string margin_mode;
    std::optional<double> collateral;
    std::optional<double> initial_margin;
    std::optional<std::int64_t> timestamp;
    nlohmann::json info;
};

struct OrderRequest {
    std::string symbol;
    OrderSide side{OrderSide::Buy};
    OrderType type{OrderType::Limit};
    double amount{0.0};
    std::optional<double> price;
    nlohmann::json params = nlohmann::json::object();
};

// One exchange's REST surface. Implementations throw the ExchangeException
// hierarchy on failure and never retry on their own.
class IExchangeConnector {
public:
    virtual ~IExchangeConnector() = default;

    virtual std::string name() const = 0;
    virtual const ConnectorOpSet& capabilities() const = 0;

    bool supports(ConnectorOp op) const { return capabilities().count(op) > 0; }

    // Public endpoint, epoch ms.
    virtual std::int64_t fetch_time() = 0;
    virtual std::vector<MarketInfo> load_markets() = 0;

    virtual Balance fetch_balance() = 0;
    virtual std::vector<RawPosition> fetch_positions(const std::vector<std::string>& symbols) = 0;
    virtual Ticker fetch_ticker(const std::string& symbol) = 0;
    virtual std::vector<Candle> fetch_ohlcv(const std::string& symbol,
        const std::string& timeframe, std::optional<std::int64_t> since, int limit) = 0;
    virtual FundingRate fetch_funding_rate(const std::string& symbol) = 0;

    virtual RawOrder create_order(const OrderRequest& req) = 0;
    virtual RawOrder cancel_order(const std::string& id, const std::string& symbol) = 0;
    virtual std::vector<RawOrder> cancel_all_orders(const std::string& symbol) = 0;
    virtual std::vector<RawOrder> fetch_open_orders(const std::optional<std::string>& symbol) = 0;
    virtual RawOrder fetch_order(const std::string& id, const std::string& symbol) = 0;
    virtual nlohmann::json set_leverage(int leverage, const std::string& symbol) = 0;

    virtual void close() {}
};
