#include "venues/binance/binance_connector.hpp"

#include <algorithm>
#include <chrono>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "errors/exchange_errors.hpp"
#include "venues/binance/parser.hpp"
#include "venues/rest/json_fields.hpp"
#include "venues/rest/signing.hpp"

namespace {
    constexpr const char* kRecvWindow = "5000";

    std::string now_ms_str() {
        using namespace std::chrono;
        return std::to_string(duration_cast<milliseconds>(
            system_clock::now().time_since_epoch()).count());
    }

    std::string format_number(double v) {
        // Shortest form that round-trips, never scientific.
        std::string s = fmt::format("{:.12f}", v);
        s.erase(s.find_last_not_of('0') + 1);
        if (!s.empty() && s.back() == '.') s.pop_back();
        return s;
    }

    std::string param_text(const nlohmann::json& v) {
        if (v.is_string()) return v.get<std::string>();
        if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
        if (v.is_number_integer()) return std::to_string(v.get<std::int64_t>());
        if (v.is_number()) return format_number(v.get<double>());
        return v.dump();
    }
}

const ConnectorOpSet& BinanceConnector::spot_ops() {
    static const ConnectorOpSet ops = {
        ConnectorOp::FetchTime, ConnectorOp::LoadMarkets, ConnectorOp::FetchBalance,
        ConnectorOp::FetchTicker, ConnectorOp::FetchOhlcv, ConnectorOp::CreateOrder,
        ConnectorOp::CancelOrder, ConnectorOp::CancelAllOrders, ConnectorOp::FetchOpenOrders,
        ConnectorOp::FetchOrder,
    };
    return ops;
}

const ConnectorOpSet& BinanceConnector::futures_ops() {
    static const ConnectorOpSet ops = {
        ConnectorOp::FetchTime, ConnectorOp::LoadMarkets, ConnectorOp::FetchBalance,
        ConnectorOp::FetchPositions, ConnectorOp::FetchTicker, ConnectorOp::FetchOhlcv,
        ConnectorOp::FetchFundingRate, ConnectorOp::CreateOrder, ConnectorOp::CancelOrder,
        ConnectorOp::CancelAllOrders, ConnectorOp::FetchOpenOrders, ConnectorOp::FetchOrder,
        ConnectorOp::SetLeverage,
    };
    return ops;
}

BinanceConnector::BinanceConnector(const GatewayConfig& cfg)
    : futures_(cfg.default_type != MarketType::Spot)
    , api_key_(cfg.api_key)
    , secret_(cfg.secret)
    , http_(cfg.timeout_ms)
{
    if (futures_) {
        base_url_ = cfg.sandbox ?
            "https://testnet.binancefuture.com" :
            "https://fapi.binance.com";
    } else {
        base_url_ = cfg.sandbox ?
            "https://testnet.binance.vision" :
            "https://api.binance.com";
    }
}

const ConnectorOpSet& BinanceConnector::capabilities() const {
    return futures_ ? futures_ops() : spot_ops();
}

std::string BinanceConnector::path(const char* endpoint) const {
    return std::string(futures_ ? "/fapi/v1/" : "/api/v3/") + endpoint;
}

std::string BinanceConnector::market_id(const std::string& symbol) const {
    return binance_market_id(symbol);
}

std::string BinanceConnector::symbol_of(const std::string& id) const {
    auto it = id_to_symbol_.find(id);
    if (it != id_to_symbol_.end()) {
        return it->second;
    }
    return binance_guess_symbol(id, futures_);
}

nlohmann::json BinanceConnector::handle(const HttpResponse& res) {
    if (res.status < 200 || res.status >= 300) {
        throw_binance_error(res.status, res.body);
    }
    auto j = parse_body(res.body);
    if (j.is_discarded()) {
        throw ExchangeError("binance: unparseable response: " + res.body.substr(0, 200),
            std::nullopt, static_cast<int>(res.status));
    }
    // Some endpoints answer 200 with an error object.
    if (j.is_object() && j.contains("code") && j["code"].is_number() &&
        j["code"].get<int>() < 0) {
        throw_binance_error(res.status, res.body);
    }
    return j;
}

nlohmann::json BinanceConnector::public_get(const std::string& p, const QueryParams& params) {
    HttpRequest req;
    req.method = "GET";
    req.url = base_url_ + p;
    if (!params.empty()) {
        req.url += "?" + build_query(params);
    }
    return handle(http_.send(req));
}

nlohmann::json BinanceConnector::signed_request(const std::string& method, const std::string& p,
    QueryParams params)
{
    if (api_key_.empty() || secret_.empty()) {
        throw AuthenticationError("binance: API key and secret required for " + p);
    }
    params.emplace_back("recvWindow", kRecvWindow);
    params.emplace_back("timestamp", now_ms_str());
    std::string query = build_query(params);
    query += "&signature=" + hmac_sha256_hex(secret_, query);

    HttpRequest req;
    req.method = method;
    req.url = base_url_ + p + "?" + query;
    req.headers.push_back("X-MBX-APIKEY: " + api_key_);
    req.headers.push_back("Content-Type: application/x-www-form-urlencoded");
    return handle(http_.send(req));
}

std::int64_t BinanceConnector::fetch_time() {
    auto j = public_get(path("time"));
    return json_int(j, "serverTime").value_or(0);
}

std::vector<MarketInfo> BinanceConnector::load_markets() {
    auto info = public_get(path("exchangeInfo"));
    auto markets = parse_binance_markets(info, futures_);
    id_to_symbol_.clear();
    for (const auto& m : markets) {
        id_to_symbol_[m.id] = m.symbol;
    }
    spdlog::debug("[binance] {} markets from exchangeInfo", markets.size());
    return markets;
}

Balance BinanceConnector::fetch_balance() {
    auto account = futures_
        ? signed_request("GET", "/fapi/v2/account", {})
        : signed_request("GET", path("account"), {});
    return parse_binance_balance(account, futures_);
}

std::vector<RawPosition> BinanceConnector::fetch_positions(const std::vector<std::string>& symbols) {
    if (!futures_) {
        throw ExchangeError("binance spot has no positions");
    }
    auto rows = signed_request("GET", "/fapi/v2/positionRisk", {});
    std::vector<RawPosition> out;
    for (const auto& r : rows) {
        const std::string sym = symbol_of(json_string(r, "symbol"));
        if (!symbols.empty() &&
            std::find(symbols.begin(), symbols.end(), sym) == symbols.end()) {
            continue;
        }
        out.push_back(parse_binance_position(r, sym));
    }
    return out;
}

Ticker BinanceConnector::fetch_ticker(const std::string& symbol) {
    auto j = public_get(path("ticker/24hr"), {{"symbol", market_id(symbol)}});
    return parse_binance_ticker(j, symbol);
}

std::vector<Candle> BinanceConnector::fetch_ohlcv(const std::string& symbol,
    const std::string& timeframe, std::optional<std::int64_t> since, int limit)
{
    QueryParams params = {{"symbol", market_id(symbol)}, {"interval", timeframe}};
    if (since) {
        params.emplace_back("startTime", std::to_string(*since));
    }
    if (limit > 0) {
        params.emplace_back("limit", std::to_string(limit));
    }
    return parse_binance_klines(public_get(path("klines"), params));
}

FundingRate BinanceConnector::fetch_funding_rate(const std::string& symbol) {
    if (!futures_) {
        throw ExchangeError("binance spot has no funding rate");
    }
    auto j = public_get(path("premiumIndex"), {{"symbol", market_id(symbol)}});
    return parse_binance_funding_rate(j, symbol);
}

RawOrder BinanceConnector::create_order(const OrderRequest& req) {
    QueryParams params = {
        {"symbol", market_id(req.symbol)},
        {"side", req.side == OrderSide::Buy ? "BUY" : "SELL"},
        {"type", binance_order_type(req.type, futures_)},
        {"quantity", format_number(req.amount)},
    };
    if (req.price && req.type != OrderType::Market &&
        req.type != OrderType::StopMarket && req.type != OrderType::Stop) {
        params.emplace_back("price", format_number(*req.price));
        if (!req.params.contains("timeInForce")) {
            params.emplace_back("timeInForce", "GTC");
        }
    }
    if (req.params.is_object()) {
        for (const auto& [key, value] : req.params.items()) {
            params.emplace_back(key, param_text(value));
        }
    }
    if (!futures_) {
        params.emplace_back("newOrderRespType", "RESULT");
    }

    auto j = signed_request("POST", path("order"), params);
    return parse_binance_order(j, req.symbol);
}

RawOrder BinanceConnector::cancel_order(const std::string& id, const std::string& symbol) {
    auto j = signed_request("DELETE", path("order"),
        {{"symbol", market_id(symbol)}, {"orderId", id}});
    return parse_binance_order(j, symbol);
}

std::vector<RawOrder> BinanceConnector::cancel_all_orders(const std::string& symbol) {
    std::vector<RawOrder> out;
    if (futures_) {
        // allOpenOrders answers with a status object, so list first.
        out = fetch_open_orders(symbol);
        signed_request("DELETE", path("allOpenOrders"), {{"symbol", market_id(symbol)}});
        for (auto& o : out) {
            o.status = "canceled";
        }
        return out;
    }
    auto rows = signed_request("DELETE", path("openOrders"), {{"symbol", market_id(symbol)}});
    for (const auto& r : rows) {
        out.push_back(parse_binance_order(r, symbol));
    }
    return out;
}

std::vector<RawOrder> BinanceConnector::fetch_open_orders(const std::optional<std::string>& symbol) {
    QueryParams params;
    if (symbol) {
        params.emplace_back("symbol", market_id(*symbol));
    }
    auto rows = signed_request("GET", path("openOrders"), params);
    std::vector<RawOrder> out;
    for (const auto& r : rows) {
        out.push_back(parse_binance_order(r, symbol ? *symbol : symbol_of(json_string(r, "symbol"))));
    }
    return out;
}

RawOrder BinanceConnector::fetch_order(const std::string& id, const std::string& symbol) {
    auto j = signed_request("GET", path("order"), {{"symbol", market_id(symbol)}, {"orderId", id}});
    return parse_binance_order(j, symbol);
}

nlohmann::json BinanceConnector::set_leverage(int leverage, const std::string& symbol) {
    if (!futures_) {
        throw ExchangeError("binance spot has no leverage");
    }
    return signed_request("POST", path("leverage"),
        {{"symbol", market_id(symbol)}, {"leverage", std::to_string(leverage)}});
}
