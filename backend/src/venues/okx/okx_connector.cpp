#include "venues/okx/okx_connector.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "errors/exchange_errors.hpp"
#include "venues/okx/parser.hpp"
#include "venues/rest/json_fields.hpp"
#include "venues/rest/signing.hpp"

namespace {
    std::int64_t now_ms() {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    std::string format_number(double v) {
        std::string s = fmt::format("{:.12f}", v);
        s.erase(s.find_last_not_of('0') + 1);
        if (!s.empty() && s.back() == '.') s.pop_back();
        return s;
    }

    std::string okx_order_type(OrderType type) {
        switch (type) {
            case OrderType::Market: return "market";
            case OrderType::Limit: return "limit";
            default: break;
        }
        // Conditional orders live on the algo endpoint.
        throw InvalidOrder(std::string("okx: order type ") + to_cstr(type) + " not supported");
    }
}

std::string okx_timestamp(std::int64_t epoch_ms) {
    const std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(epoch_ms % 1000));
}

std::string okx_sign(const std::string& secret, const std::string& timestamp,
    const std::string& method, const std::string& request_path, const std::string& body)
{
    return hmac_sha256_base64(secret, timestamp + method + request_path + body);
}

const ConnectorOpSet& OkxConnector::spot_ops() {
    static const ConnectorOpSet ops = {
        ConnectorOp::FetchTime, ConnectorOp::LoadMarkets, ConnectorOp::FetchBalance,
        ConnectorOp::FetchTicker, ConnectorOp::FetchOhlcv, ConnectorOp::CreateOrder,
        ConnectorOp::CancelOrder, ConnectorOp::FetchOpenOrders, ConnectorOp::FetchOrder,
    };
    return ops;
}

// No single cancel-all endpoint; the gateway cancels one by one.
const ConnectorOpSet& OkxConnector::swap_ops() {
    static const ConnectorOpSet ops = {
        ConnectorOp::FetchTime, ConnectorOp::LoadMarkets, ConnectorOp::FetchBalance,
        ConnectorOp::FetchPositions, ConnectorOp::FetchTicker, ConnectorOp::FetchOhlcv,
        ConnectorOp::FetchFundingRate, ConnectorOp::CreateOrder, ConnectorOp::CancelOrder,
        ConnectorOp::FetchOpenOrders, ConnectorOp::FetchOrder, ConnectorOp::SetLeverage,
    };
    return ops;
}

OkxConnector::OkxConnector(const GatewayConfig& cfg)
    : swap_(cfg.default_type != MarketType::Spot)
    , sandbox_(cfg.sandbox)
    , base_url_("https://www.okx.com")
    , api_key_(cfg.api_key)
    , secret_(cfg.secret)
    , passphrase_(cfg.passphrase.value_or(""))
    , http_(cfg.timeout_ms)
{
}

const ConnectorOpSet& OkxConnector::capabilities() const {
    return swap_ ? swap_ops() : spot_ops();
}

nlohmann::json OkxConnector::public_get(const std::string& path, const QueryParams& params) {
    HttpRequest req;
    req.method = "GET";
    req.url = base_url_ + path;
    if (!params.empty()) {
        req.url += "?" + build_query(params);
    }
    if (sandbox_) {
        req.headers.push_back("x-simulated-trading: 1");
    }
    auto res = http_.send(req);
    return okx_unwrap(res.status, res.body);
}

nlohmann::json OkxConnector::signed_request(const std::string& method, const std::string& path,
    const QueryParams& params, const nlohmann::json& body)
{
    if (api_key_.empty() || secret_.empty() || passphrase_.empty()) {
        throw AuthenticationError("okx: API key, secret and passphrase required for " + path);
    }
    std::string request_path = path;
    if (!params.empty()) {
        request_path += "?" + build_query(params);
    }
    const std::string payload = body.is_null() ? "" : body.dump();
    const std::string ts = okx_timestamp(now_ms());

    HttpRequest req;
    req.method = method;
    req.url = base_url_ + request_path;
    req.body = payload;
    req.headers.push_back("OK-ACCESS-KEY: " + api_key_);
    req.headers.push_back("OK-ACCESS-SIGN: " + okx_sign(secret_, ts, method, request_path, payload));
    req.headers.push_back("OK-ACCESS-TIMESTAMP: " + ts);
    req.headers.push_back("OK-ACCESS-PASSPHRASE: " + passphrase_);
    req.headers.push_back("Content-Type: application/json");
    if (sandbox_) {
        req.headers.push_back("x-simulated-trading: 1");
    }
    auto res = http_.send(req);
    return okx_unwrap(res.status, res.body);
}

std::int64_t OkxConnector::fetch_time() {
    auto data = public_get("/api/v5/public/time");
    if (data.empty()) {
        throw ExchangeError("okx: empty time response");
    }
    return json_int(data[0], "ts").value_or(0);
}

std::vector<MarketInfo> OkxConnector::load_markets() {
    auto data = public_get("/api/v5/public/instruments", {{"instType", inst_type()}});
    auto markets = parse_okx_instruments(data);
    spdlog::debug("[okx] {} {} instruments", markets.size(), inst_type());
    return markets;
}

Balance OkxConnector::fetch_balance() {
    return parse_okx_balance(signed_request("GET", "/api/v5/account/balance", {}));
}

std::vector<RawPosition> OkxConnector::fetch_positions(const std::vector<std::string>& symbols) {
    if (!swap_) {
        throw ExchangeError("okx spot has no positions");
    }
    QueryParams params = {{"instType", "SWAP"}};
    if (symbols.size() == 1) {
        params.emplace_back("instId", okx_inst_id(symbols.front()));
    }
    auto rows = signed_request("GET", "/api/v5/account/positions", params);
    std::vector<RawPosition> out;
    for (const auto& r : rows) {
        auto p = parse_okx_position(r);
        if (!symbols.empty() &&
            std::find(symbols.begin(), symbols.end(), p.symbol) == symbols.end()) {
            continue;
        }
        out.push_back(std::move(p));
    }
    return out;
}

Ticker OkxConnector::fetch_ticker(const std::string& symbol) {
    auto data = public_get("/api/v5/market/ticker", {{"instId", okx_inst_id(symbol)}});
    if (data.empty()) {
        throw BadSymbol("okx: no ticker for " + symbol);
    }
    return parse_okx_ticker(data[0], symbol);
}

std::vector<Candle> OkxConnector::fetch_ohlcv(const std::string& symbol,
    const std::string& timeframe, std::optional<std::int64_t> since, int limit)
{
    QueryParams params = {{"instId", okx_inst_id(symbol)}, {"bar", okx_bar(timeframe)}};
    if (since) {
        // "before" returns rows newer than the timestamp.
        params.emplace_back("before", std::to_string(*since - 1));
    }
    if (limit > 0) {
        params.emplace_back("limit", std::to_string(std::min(limit, 300)));
    }
    return parse_okx_candles(public_get("/api/v5/market/candles", params));
}

FundingRate OkxConnector::fetch_funding_rate(const std::string& symbol) {
    if (!swap_) {
        throw ExchangeError("okx spot has no funding rate");
    }
    auto data = public_get("/api/v5/public/funding-rate", {{"instId", okx_inst_id(symbol)}});
    if (data.empty()) {
        throw BadSymbol("okx: no funding rate for " + symbol);
    }
    return parse_okx_funding_rate(data[0], symbol);
}

RawOrder OkxConnector::create_order(const OrderRequest& req) {
    nlohmann::json body = {
        {"instId", okx_inst_id(req.symbol)},
        {"tdMode", swap_ ? "cross" : "cash"},
        {"side", to_cstr(req.side)},
        {"ordType", okx_order_type(req.type)},
        {"sz", format_number(req.amount)},
    };
    if (req.price && req.type == OrderType::Limit) {
        body["px"] = format_number(*req.price);
    }
    if (req.params.is_object()) {
        for (const auto& [key, value] : req.params.items()) {
            body[key] = value;
        }
    }

    auto data = signed_request("POST", "/api/v5/trade/order", {}, body);
    if (data.empty()) {
        throw ExchangeError("okx: empty order response");
    }
    RawOrder o;
    o.id = json_string(data[0], "ordId");
    if (auto c = json_string(data[0], "clOrdId"); !c.empty()) {
        o.client_order_id = c;
    }
    o.symbol = req.symbol;
    o.side = to_cstr(req.side);
    o.type = to_cstr(req.type);
    o.amount = req.amount;
    o.price = req.price;
    o.status = "open";
    o.timestamp = json_int(data[0], "ts").value_or(now_ms());
    o.info = data[0];
    return o;
}

RawOrder OkxConnector::cancel_order(const std::string& id, const std::string& symbol) {
    nlohmann::json body = {{"instId", okx_inst_id(symbol)}, {"ordId", id}};
    auto data = signed_request("POST", "/api/v5/trade/cancel-order", {}, body);
    RawOrder o;
    o.id = data.empty() ? id : json_string(data[0], "ordId");
    o.symbol = symbol;
    o.status = "canceled";
    o.info = data.empty() ? nlohmann::json::object() : data[0];
    return o;
}

std::vector<RawOrder> OkxConnector::cancel_all_orders(const std::string& symbol) {
    throw ExchangeError("okx has no cancel-all endpoint for " + symbol);
}

std::vector<RawOrder> OkxConnector::fetch_open_orders(const std::optional<std::string>& symbol) {
    QueryParams params = {{"instType", inst_type()}};
    if (symbol) {
        params.emplace_back("instId", okx_inst_id(*symbol));
    }
    auto rows = signed_request("GET", "/api/v5/trade/orders-pending", params);
    std::vector<RawOrder> out;
    for (const auto& r : rows) {
        out.push_back(parse_okx_order(r));
    }
    return out;
}

RawOrder OkxConnector::fetch_order(const std::string& id, const std::string& symbol) {
    auto data = signed_request("GET", "/api/v5/trade/order",
        {{"instId", okx_inst_id(symbol)}, {"ordId", id}});
    if (data.empty()) {
        throw OrderNotFound("okx: order " + id + " not found");
    }
    return parse_okx_order(data[0]);
}

nlohmann::json OkxConnector::set_leverage(int leverage, const std::string& symbol) {
    if (!swap_) {
        throw ExchangeError("okx spot has no leverage");
    }
    nlohmann::json body = {
        {"instId", okx_inst_id(symbol)},
        {"lever", std::to_string(leverage)},
        {"mgnMode", "cross"},
    };
    auto data = signed_request("POST", "/api/v5/account/set-leverage", {}, body);
    return data.empty() ? nlohmann::json::object() : data[0];
}
