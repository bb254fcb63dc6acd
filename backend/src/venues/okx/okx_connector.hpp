#pragma once

#include <string>

#include "config/gateway_config.hpp"
#include "venues/exchange_connector.hpp"
#include "venues/rest/http_client.hpp"

// OKX v5 REST. Spot instruments when the default market type is spot,
// perpetual swaps otherwise. Demo trading uses the production host with
// the x-simulated-trading header.
class OkxConnector final : public IExchangeConnector {
public:
    explicit OkxConnector(const GatewayConfig& cfg);

    static const ConnectorOpSet& spot_ops();
    static const ConnectorOpSet& swap_ops();

    std::string name() const override { return "okx"; }
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
    nlohmann::json public_get(const std::string& path, const QueryParams& params = {});
    nlohmann::json signed_request(const std::string& method, const std::string& path,
        const QueryParams& params, const nlohmann::json& body = nullptr);

    const char* inst_type() const { return swap_ ? "SWAP" : "SPOT"; }

    bool swap_;
    bool sandbox_;
    std::string base_url_;
    std::string api_key_;
    std::string secret_;
    std::string passphrase_;
    HttpClient http_;
};

// ISO-8601 UTC with milliseconds, the OK-ACCESS-TIMESTAMP format.
std::string okx_timestamp(std::int64_t epoch_ms);

// base64(HMAC-SHA256(secret, timestamp + method + request_path + body)).
std::string okx_sign(const std::string& secret, const std::string& timestamp,
    const std::string& method, const std::string& request_path, const std::string& body);
