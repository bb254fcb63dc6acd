#pragma once

#include <string>
#include <unordered_map>

#include "config/gateway_config.hpp"
#include "venues/exchange_connector.hpp"
#include "venues/rest/http_client.hpp"

// Bybit v5 REST on the unified account. category=spot when the default
// market type is spot, linear USDT perpetuals otherwise.
class BybitConnector final : public IExchangeConnector {
public:
    explicit BybitConnector(const GatewayConfig& cfg);

    static const ConnectorOpSet& spot_ops();
    static const ConnectorOpSet& linear_ops();

    std::string name() const override { return "bybit"; }
    const ConnectorOpSet& capabilities() const override;

    std::int64_t fetch_time() override;
    std::vector<MarketInfo> load_markets() override;

    Balance fetch_balance() override;
    std::vector<RawPosition> fetch_positions(const std::vector<std::string>& symbols) override;
    Ticker fetch_ticker(const std::string& symbol) override;
    std::vector<Candle> fetch_ohlcv(const std::string& symbol, const std::string& timeframe,
        std::optional<std::int64_t> since, int limit) override;
    FundingRate fetch_funding_rate(const std::string& symbol) override;

    RawOrder create_order(const OrderRequest& req) override;
    RawOrder cancel_order(const std::string& id, const std::string& symbol) override;
    std::vector<RawOrder> cancel_all_orders(const std::string& symbol) override;
    std::vector<RawOrder> fetch_open_orders(const std::optional<std::string>& symbol) override;
    RawOrder fetch_order(const std::string& id, const std::string& symbol) override;
    nlohmann::json set_leverage(int leverage, const std::string& symbol) override;

private:
    nlohmann::json public_get(const std::string& path, const QueryParams& params);
    nlohmann::json signed_get(const std::string& path, const QueryParams& params);
    nlohmann::json signed_post(const std::string& path, const nlohmann::json& body);
    nlohmann::json send_signed(HttpRequest req, const std::string& payload);

    const char* category() const { return linear_ ? "linear" : "spot"; }
    std::string symbol_of(const std::string& id) const;

    bool linear_;
    std::string base_url_;
    std::string api_key_;
    std::string secret_;
    HttpClient http_;
    std::unordered_map<std::string, std::string> id_to_symbol_;
};

// hex(HMAC-SHA256(secret, timestamp + api_key + recv_window + payload)), where
// payload is the query string for GET and the JSON body for POST.
std::string bybit_sign(const std::string& secret, const std::string& timestamp,
    const std::string& api_key, const std::string& recv_window, const std::string& payload);
