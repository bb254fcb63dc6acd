#include "venues/bybit/bybit_connector.hpp"

#include <algorithm>
#include <chrono>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "errors/exchange_errors.hpp"
#include "venues/bybit/parser.hpp"
#include "venues/rest/json_fields.hpp"
#include "venues/rest/signing.hpp"

namespace {
    constexpr const char* kRecvWindow = "5000";
    constexpr long kLeverageNotModified = 110043;

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

    // Bybit wants decimals as strings in request bodies.
    nlohmann::json body_value(const nlohmann::json& v) {
        if (v.is_number_float()) return format_number(v.get<double>());
        if (v.is_number_integer()) return std::to_string(v.get<std::int64_t>());
        return v;
    }
}

std::string bybit_sign(const std::string& secret, const std::string& timestamp,
    const std::string& api_key, const std::string& recv_window, const std::string& payload)
{
    return hmac_sha256_hex(secret, timestamp + api_key + recv_window + payload);
}

const ConnectorOpSet& BybitConnector::spot_ops() {
    static const ConnectorOpSet ops = {
        ConnectorOp::FetchTime, ConnectorOp::LoadMarkets, ConnectorOp::FetchBalance,
        ConnectorOp::FetchTicker, ConnectorOp::FetchOhlcv, ConnectorOp::CreateOrder,
        ConnectorOp::CancelOrder, ConnectorOp::CancelAllOrders, ConnectorOp::FetchOpenOrders,
        ConnectorOp::FetchOrder,
    };
    return ops;
}

const ConnectorOpSet& BybitConnector::linear_ops() {
    static const ConnectorOpSet ops = {
        ConnectorOp::FetchTime, ConnectorOp::LoadMarkets, ConnectorOp::FetchBalance,
        ConnectorOp::FetchPositions, ConnectorOp::FetchTicker, ConnectorOp::FetchOhlcv,
        ConnectorOp::FetchFundingRate, ConnectorOp::CreateOrder, ConnectorOp::CancelOrder,
        ConnectorOp::CancelAllOrders, ConnectorOp::FetchOpenOrders, ConnectorOp::FetchOrder,
        ConnectorOp::SetLeverage,
    };
    return ops;
}

BybitConnector::BybitConnector(const GatewayConfig& cfg)
    : linear_(cfg.default_type != MarketType::Spot)
    , base_url_(cfg.sandbox ? "https://api-testnet.bybit.com" : "https://api.bybit.com")
    , api_key_(cfg.api_key)
    , secret_(cfg.secret)
    , http_(cfg.timeout_ms)
{
}

const ConnectorOpSet& BybitConnector::capabilities() const {
    return linear_ ? linear_ops() : spot_ops();
}

std::string BybitConnector::symbol_of(const std::string& id) const {
    auto it = id_to_symbol_.find(id);
    if (it != id_to_symbol_.end()) {
        return it->second;
    }
    return bybit_guess_symbol(id, linear_);
}

nlohmann::json BybitConnector::public_get(const std::string& path, const QueryParams& params) {
    HttpRequest req;
    req.method = "GET";
    req.url = base_url_ + path;
    if (!params.empty()) {
        req.url += "?" + build_query(params);
    }
    auto res = http_.send(req);
    return bybit_unwrap(res.status, res.body);
}

nlohmann::json BybitConnector::send_signed(HttpRequest req, const std::string& payload) {
    if (api_key_.empty() || secret_.empty()) {
        throw AuthenticationError("bybit: API key and secret required for " + req.url);
    }
    const std::string ts = std::to_string(now_ms());
    req.headers.push_back("X-BAPI-API-KEY: " + api_key_);
    req.headers.push_back("X-BAPI-SIGN: " + bybit_sign(secret_, ts, api_key_, kRecvWindow, payload));
    req.headers.push_back("X-BAPI-SIGN-TYPE: 2");
    req.headers.push_back("X-BAPI-TIMESTAMP: " + ts);
    req.headers.push_back(std::string("X-BAPI-RECV-WINDOW: ") + kRecvWindow);
    req.headers.push_back("Content-Type: application/json");
    auto res = http_.send(req);
    return bybit_unwrap(res.status, res.body);
}

nlohmann::json BybitConnector::signed_get(const std::string& path, const QueryParams& params) {
    const std::string query = build_query(params);
    HttpRequest req;
    req.method = "GET";
    req.url = base_url_ + path + (query.empty() ? "" : "?" + query);
    return send_signed(std::move(req), query);
}

nlohmann::json BybitConnector::signed_post(const std::string& path, const nlohmann::json& body) {
    HttpRequest req;
    req.method = "POST";
    req.url = base_url_ + path;
    req.body = body.dump();
    const std::string payload = req.body;
    return send_signed(std::move(req), payload);
}

std::int64_t BybitConnector::fetch_time() {
    auto result = public_get("/v5/market/time", {});
    if (auto secs = json_int(result, "timeSecond")) {
        return json_int(result, "time").value_or(*secs * 1000);
    }
    return json_int(result, "time").value_or(0);
}

std::vector<MarketInfo> BybitConnector::load_markets() {
    auto result = public_get("/v5/market/instruments-info", {{"category", category()}, {"limit", "1000"}});
    auto markets = parse_bybit_instruments(result, linear_);
    id_to_symbol_.clear();
    for (const auto& m : markets) {
        id_to_symbol_[m.id] = m.symbol;
    }
    spdlog::debug("[bybit] {} {} instruments", markets.size(), category());
    return markets;
}

Balance BybitConnector::fetch_balance() {
    return parse_bybit_balance(signed_get("/v5/account/wallet-balance", {{"accountType", "UNIFIED"}}));
}

std::vector<RawPosition> BybitConnector::fetch_positions(const std::vector<std::string>& symbols) {
    if (!linear_) {
        throw ExchangeError("bybit spot has no positions");
    }
    QueryParams params = {{"category", "linear"}};
    if (symbols.size() == 1) {
        params.emplace_back("symbol", bybit_market_id(symbols.front()));
    } else {
        params.emplace_back("settleCoin", "USDT");
    }
    auto result = signed_get("/v5/position/list", params);

    std::vector<RawPosition> out;
    for (const auto& r : result.value("list", nlohmann::json::array())) {
        const std::string sym = symbol_of(json_string(r, "symbol"));
        if (!symbols.empty() &&
            std::find(symbols.begin(), symbols.end(), sym) == symbols.end()) {
            continue;
        }
        out.push_back(parse_bybit_position(r, sym));
    }
    return out;
}

Ticker BybitConnector::fetch_ticker(const std::string& symbol) {
    auto result = public_get("/v5/market/tickers",
        {{"category", category()}, {"symbol", bybit_market_id(symbol)}});
    const auto list = result.value("list", nlohmann::json::array());
    if (list.empty()) {
        throw BadSymbol("bybit: no ticker for " + symbol);
    }
    return parse_bybit_ticker(list[0], symbol, json_int(result, "time").value_or(now_ms()));
}

std::vector<Candle> BybitConnector::fetch_ohlcv(const std::string& symbol,
    const std::string& timeframe, std::optional<std::int64_t> since, int limit)
{
    QueryParams params = {
        {"category", category()},
        {"symbol", bybit_market_id(symbol)},
        {"interval", bybit_interval(timeframe)},
    };
    if (since) {
        params.emplace_back("start", std::to_string(*since));
    }
    if (limit > 0) {
        params.emplace_back("limit", std::to_string(std::min(limit, 1000)));
    }
    return parse_bybit_klines(public_get("/v5/market/kline", params));
}

// Linear tickers carry the current funding rate and next settlement time.
FundingRate BybitConnector::fetch_funding_rate(const std::string& symbol) {
    if (!linear_) {
        throw ExchangeError("bybit spot has no funding rate");
    }
    auto result = public_get("/v5/market/tickers",
        {{"category", "linear"}, {"symbol", bybit_market_id(symbol)}});
    const auto list = result.value("list", nlohmann::json::array());
    if (list.empty()) {
        throw BadSymbol("bybit: no funding rate for " + symbol);
    }
    FundingRate f = parse_bybit_funding_rate(list[0], symbol);
    f.timestamp = json_int(result, "time").value_or(now_ms());
    return f;
}

RawOrder BybitConnector::create_order(const OrderRequest& req) {
    const bool limit = req.type == OrderType::Limit || req.type == OrderType::StopLimit;
    nlohmann::json body = {
        {"category", category()},
        {"symbol", bybit_market_id(req.symbol)},
        {"side", req.side == OrderSide::Buy ? "Buy" : "Sell"},
        {"orderType", limit ? "Limit" : "Market"},
        {"qty", format_number(req.amount)},
    };
    if (limit) {
        if (!req.price) {
            throw InvalidOrder("bybit: limit order needs a price");
        }
        body["price"] = format_number(*req.price);
        body["timeInForce"] = "GTC";
    }
    if (req.params.is_object()) {
        for (const auto& [key, value] : req.params.items()) {
            body[key] = body_value(value);
        }
    }
    if (req.type == OrderType::Stop || req.type == OrderType::StopMarket ||
        req.type == OrderType::StopLimit)
    {
        if (!body.contains("triggerPrice")) {
            throw InvalidOrder(std::string("bybit: ") + to_cstr(req.type) + " order needs params.triggerPrice");
        }
        if (!body.contains("triggerDirection")) {
            // 1 fires on a rise, 2 on a fall.
            body["triggerDirection"] = req.side == OrderSide::Buy ? 1 : 2;
        }
    }

    auto result = signed_post("/v5/order/create", body);
    RawOrder o;
    o.id = json_string(result, "orderId");
    if (auto c = json_string(result, "orderLinkId"); !c.empty()) {
        o.client_order_id = c;
    }
    o.symbol = req.symbol;
    o.side = to_cstr(req.side);
    o.type = to_cstr(req.type);
    o.amount = req.amount;
    o.price = req.price;
    o.status = "open";
    o.timestamp = json_int(result, "time").value_or(now_ms());
    o.info = result;
    return o;
}

RawOrder BybitConnector::cancel_order(const std::string& id, const std::string& symbol) {
    nlohmann::json body = {
        {"category", category()},
        {"symbol", bybit_market_id(symbol)},
        {"orderId", id},
    };
    auto result = signed_post("/v5/order/cancel", body);
    RawOrder o;
    o.id = json_string(result, "orderId");
    if (o.id.empty()) o.id = id;
    o.symbol = symbol;
    o.status = "canceled";
    o.info = result;
    return o;
}

std::vector<RawOrder> BybitConnector::cancel_all_orders(const std::string& symbol) {
    nlohmann::json body = {{"category", category()}, {"symbol", bybit_market_id(symbol)}};
    auto result = signed_post("/v5/order/cancel-all", body);
    std::vector<RawOrder> out;
    for (const auto& r : result.value("list", nlohmann::json::array())) {
        RawOrder o;
        o.id = json_string(r, "orderId");
        if (auto c = json_string(r, "orderLinkId"); !c.empty()) {
            o.client_order_id = c;
        }
        o.symbol = symbol;
        o.status = "canceled";
        o.info = r;
        out.push_back(std::move(o));
    }
    return out;
}

std::vector<RawOrder> BybitConnector::fetch_open_orders(const std::optional<std::string>& symbol) {
    QueryParams params = {{"category", category()}};
    if (symbol) {
        params.emplace_back("symbol", bybit_market_id(*symbol));
    } else if (linear_) {
        params.emplace_back("settleCoin", "USDT");
    }
    params.emplace_back("openOnly", "0");
    auto result = signed_get("/v5/order/realtime", params);
    std::vector<RawOrder> out;
    for (const auto& r : result.value("list", nlohmann::json::array())) {
        out.push_back(parse_bybit_order(r, symbol_of(json_string(r, "symbol"))));
    }
    return out;
}

RawOrder BybitConnector::fetch_order(const std::string& id, const std::string& symbol) {
    const QueryParams params = {
        {"category", category()},
        {"symbol", bybit_market_id(symbol)},
        {"orderId", id},
    };
    auto result = signed_get("/v5/order/realtime", params);
    auto list = result.value("list", nlohmann::json::array());
    if (list.empty()) {
        // Closed orders age out of realtime into history.
        result = signed_get("/v5/order/history", params);
        list = result.value("list", nlohmann::json::array());
    }
    if (list.empty()) {
        throw OrderNotFound("bybit: order " + id + " not found");
    }
    return parse_bybit_order(list[0], symbol);
}

nlohmann::json BybitConnector::set_leverage(int leverage, const std::string& symbol) {
    if (!linear_) {
        throw ExchangeError("bybit spot has no leverage");
    }
    const std::string lev = std::to_string(leverage);
    nlohmann::json body = {
        {"category", "linear"},
        {"symbol", bybit_market_id(symbol)},
        {"buyLeverage", lev},
        {"sellLeverage", lev},
    };
    try {
        signed_post("/v5/position/set-leverage", body);
    } catch (const ExchangeException& e) {
        if (e.code() != std::to_string(kLeverageNotModified)) {
            throw;
        }
        spdlog::debug("[bybit] leverage for {} already {}", symbol, leverage);
    }
    return {{"symbol", symbol}, {"leverage", leverage}};
}
