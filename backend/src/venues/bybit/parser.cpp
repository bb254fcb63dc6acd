#include "venues/bybit/parser.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "errors/exchange_errors.hpp"
#include "venues/rest/json_fields.hpp"

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string status_from_bybit(const std::string& s) {
        if (s == "New" || s == "PartiallyFilled" || s == "Untriggered" || s == "Created") return "open";
        if (s == "Filled") return "closed";
        if (s == "Cancelled" || s == "PartiallyFilledCanceled" || s == "Deactivated") return "canceled";
        if (s == "Rejected") return "rejected";
        return lower(s);
    }

    const nlohmann::json& list_of(const nlohmann::json& result) {
        static const nlohmann::json kEmpty = nlohmann::json::array();
        if (!result.is_object()) return kEmpty;
        auto it = result.find("list");
        if (it == result.end() || !it->is_array()) return kEmpty;
        return *it;
    }
}

std::string bybit_market_id(const std::string& symbol) {
    std::string id;
    for (char c : symbol) {
        if (c == ':') break;
        if (c != '/') id.push_back(c);
    }
    return id;
}

std::string bybit_guess_symbol(const std::string& id, bool linear) {
    static const char* const kQuotes[] = {"USDT", "USDC", "BTC", "ETH", "EUR"};
    for (const char* q : kQuotes) {
        const std::string quote = q;
        if (id.size() > quote.size() && id.compare(id.size() - quote.size(), quote.size(), quote) == 0) {
            const std::string base = id.substr(0, id.size() - quote.size());
            return linear ? base + "/" + quote + ":" + quote : base + "/" + quote;
        }
    }
    return id;
}

std::string bybit_interval(const std::string& timeframe) {
    static const std::unordered_map<std::string, std::string> kIntervals = {
        {"1m", "1"}, {"3m", "3"}, {"5m", "5"}, {"15m", "15"}, {"30m", "30"},
        {"1h", "60"}, {"2h", "120"}, {"4h", "240"}, {"6h", "360"}, {"12h", "720"},
        {"1d", "D"}, {"1w", "W"}, {"1M", "M"},
    };
    auto it = kIntervals.find(timeframe);
    if (it == kIntervals.end()) {
        throw ExchangeError("bybit: unsupported timeframe " + timeframe);
    }
    return it->second;
}

std::vector<MarketInfo> parse_bybit_instruments(const nlohmann::json& result, bool linear) {
    std::vector<MarketInfo> out;
    for (const auto& i : list_of(result)) {
        if (linear && json_string(i, "contractType") != "LinearPerpetual") {
            continue;
        }
        MarketInfo m;
        m.id = json_string(i, "symbol");
        m.base = json_string(i, "baseCoin");
        m.quote = json_string(i, "quoteCoin");
        if (m.id.empty() || m.base.empty() || m.quote.empty()) continue;
        if (linear) {
            m.type = MarketType::Swap;
            m.settle = json_string(i, "settleCoin");
            if (m.settle.empty()) m.settle = m.quote;
            m.symbol = m.base + "/" + m.quote + ":" + m.settle;
        } else {
            m.type = MarketType::Spot;
            m.symbol = m.base + "/" + m.quote;
        }
        m.active = json_string(i, "status") == "Trading";

        const auto price_filter = i.value("priceFilter", nlohmann::json::object());
        if (auto tick = json_number(price_filter, "tickSize"); tick && *tick > 0) {
            m.price_precision = PrecisionValue::tick_size(*tick);
        }
        m.min_price = json_number(price_filter, "minPrice");
        m.max_price = json_number(price_filter, "maxPrice");

        const auto lot = i.value("lotSizeFilter", nlohmann::json::object());
        // Spot sizes step by basePrecision, contracts by qtyStep.
        auto step = linear ? json_number(lot, "qtyStep") : json_number(lot, "basePrecision");
        if (step && *step > 0) {
            m.amount_precision = PrecisionValue::tick_size(*step);
        }
        m.min_amount = json_number(lot, "minOrderQty");
        m.max_amount = json_number(lot, "maxOrderQty");
        m.min_cost = linear ? json_number(lot, "minNotionalValue") : json_number(lot, "minOrderAmt");
        out.push_back(std::move(m));
    }
    return out;
}

Balance parse_bybit_balance(const nlohmann::json& result) {
    Balance b;
    b.raw = result;
    const auto& accounts = list_of(result);
    if (accounts.empty() || !accounts[0].contains("coin")) {
        return b;
    }
    for (const auto& c : accounts[0]["coin"]) {
        const std::string coin = json_string(c, "coin");
        if (coin.empty()) continue;
        const double total = json_number(c, "walletBalance").value_or(0.0);
        const double used = json_number(c, "locked").value_or(0.0)
            + json_number(c, "totalOrderIM").value_or(0.0)
            + json_number(c, "totalPositionIM").value_or(0.0);
        b.total[coin] = total;
        b.used[coin] = used;
        b.free[coin] = std::max(total - used, 0.0);
    }
    return b;
}

RawOrder parse_bybit_order(const nlohmann::json& j, const std::string& symbol) {
    RawOrder o;
    o.id = json_string(j, "orderId");
    if (auto c = json_string(j, "orderLinkId"); !c.empty()) {
        o.client_order_id = c;
    }
    o.symbol = symbol;
    o.side = lower(json_string(j, "side"));
    o.type = lower(json_string(j, "orderType"));
    o.amount = json_number(j, "qty");
    if (auto px = json_number(j, "price"); px && *px > 0) {
        o.price = px;
    }
    o.filled = json_number(j, "cumExecQty");
    o.remaining = json_number(j, "leavesQty");
    o.cost = json_number(j, "cumExecValue");
    if (auto avg = json_number(j, "avgPrice"); avg && *avg > 0) {
        o.average = avg;
    }
    o.status = status_from_bybit(json_string(j, "orderStatus"));
    o.timestamp = json_int(j, "createdTime");
    o.last_trade_timestamp = json_int(j, "updatedTime");
    if (auto fee = json_number(j, "cumExecFee"); fee && *fee != 0.0) {
        o.fee = Fee{*fee, json_string(j, "feeCurrency"), std::nullopt};
    }
    o.info = j;
    return o;
}

RawPosition parse_bybit_position(const nlohmann::json& j, const std::string& symbol) {
    RawPosition p;
    p.symbol = symbol;
    p.side = json_string(j, "side") == "Sell" ? "short" : "long";
    p.contracts = json_number(j, "size");
    p.notional = json_number(j, "positionValue");
    p.entry_price = json_number(j, "avgPrice");
    p.mark_price = json_number(j, "markPrice");
    if (auto liq = json_number(j, "liqPrice"); liq && *liq > 0) {
        p.liquidation_price = liq;
    }
    p.leverage = json_number(j, "leverage");
    p.unrealized_pnl = json_number(j, "unrealisedPnl");
    p.realized_pnl = json_number(j, "cumRealisedPnl");
    p.margin_mode = json_int(j, "tradeMode").value_or(0) == 1 ? "isolated" : "cross";
    p.initial_margin = json_number(j, "positionIM");
    p.collateral = json_number(j, "positionBalance");
    if (!p.collateral) p.collateral = p.initial_margin;
    if (p.unrealized_pnl && p.initial_margin && *p.initial_margin > 0) {
        p.percentage = *p.unrealized_pnl / *p.initial_margin * 100.0;
    }
    p.timestamp = json_int(j, "updatedTime");
    p.info = j;
    return p;
}

Ticker parse_bybit_ticker(const nlohmann::json& j, const std::string& symbol, std::int64_t timestamp) {
    Ticker t;
    t.symbol = symbol;
    t.bid = json_number(j, "bid1Price");
    t.ask = json_number(j, "ask1Price");
    t.last = json_number(j, "lastPrice");
    t.high = json_number(j, "highPrice24h");
    t.low = json_number(j, "lowPrice24h");
    t.base_volume = json_number(j, "volume24h");
    t.quote_volume = json_number(j, "turnover24h");
    // Sent as a fraction: 0.0123 is +1.23%.
    if (auto pct = json_number(j, "price24hPcnt")) {
        t.percentage = *pct * 100.0;
    }
    t.timestamp = timestamp;
    t.raw = j;
    return t;
}

std::vector<Candle> parse_bybit_klines(const nlohmann::json& result) {
    std::vector<Candle> out;
    for (const auto& r : list_of(result)) {
        if (!r.is_array() || r.size() < 6) continue;
        Candle c;
        c.timestamp = std::stoll(r[0].get<std::string>());
        c.open = std::stod(r[1].get<std::string>());
        c.high = std::stod(r[2].get<std::string>());
        c.low = std::stod(r[3].get<std::string>());
        c.close = std::stod(r[4].get<std::string>());
        c.volume = std::stod(r[5].get<std::string>());
        out.push_back(c);
    }
    // Newest first on the wire.
    std::reverse(out.begin(), out.end());
    return out;
}

FundingRate parse_bybit_funding_rate(const nlohmann::json& ticker, const std::string& symbol) {
    FundingRate f;
    f.symbol = symbol;
    f.funding_rate = json_number(ticker, "fundingRate").value_or(0.0);
    f.funding_timestamp = json_int(ticker, "nextFundingTime").value_or(0);
    f.mark_price = json_number(ticker, "markPrice");
    f.index_price = json_number(ticker, "indexPrice");
    f.raw = ticker;
    return f;
}

void throw_bybit_error(long code, const std::string& msg, int http_status) {
    const std::string text = "bybit " + std::to_string(code) + " " + msg;
    const std::optional<std::string> c = code == 0
        ? std::nullopt
        : std::optional<std::string>(std::to_string(code));

    switch (code) {
        case 10005:
        case 10010:
            throw PermissionDenied(text, c, http_status);
        case 10003:
        case 10004:
        case 10007:
        case 33004:
            throw AuthenticationError(text, c, http_status);
        case 10006:
        case 10018:
            throw RateLimitExceeded(text, c, http_status);
        case 10000:
            throw RequestTimeout(text, c, http_status);
        case 10016:
            throw ExchangeNotAvailable(text, c, http_status);
        case 110004:
        case 110007:
        case 110012:
        case 110045:
        case 110052:
        case 170131:
            throw InsufficientFunds(text, c, http_status);
        case 110001:
        case 170213:
            throw OrderNotFound(text, c, http_status);
        case 170121:
            throw BadSymbol(text, c, http_status);
        default:
            break;
    }
    if ((code >= 110000 && code < 120000) || (code >= 170000 && code < 180000)) {
        throw InvalidOrder(text, c, http_status);
    }
    if (http_status == 401) throw AuthenticationError(text, c, http_status);
    // Bybit answers 403 when the IP exceeds its request quota.
    if (http_status == 403 || http_status == 429) throw RateLimitExceeded(text, c, http_status);
    if (http_status >= 500) throw ExchangeNotAvailable(text, c, http_status);
    throw ExchangeError(text, c, http_status);
}

nlohmann::json bybit_unwrap(long http_status, const std::string& body) {
    const int status = static_cast<int>(http_status);
    const auto j = parse_body(body);
    if (j.is_discarded() || !j.is_object()) {
        if (status == 403 || status == 429) {
            throw RateLimitExceeded("bybit: HTTP " + std::to_string(status), std::nullopt, status);
        }
        if (status >= 500) {
            throw ExchangeNotAvailable("bybit: HTTP " + std::to_string(status), std::nullopt, status);
        }
        throw ExchangeError("bybit: unparseable response: " + body.substr(0, 200), std::nullopt, status);
    }

    const long code = json_int(j, "retCode").value_or(-1);
    if (code != 0) {
        throw_bybit_error(code, json_string(j, "retMsg"), status);
    }
    if (status < 200 || status >= 300) {
        throw_bybit_error(0, "HTTP " + std::to_string(status), status);
    }

    nlohmann::json result = j.contains("result") && j["result"].is_object()
        ? j["result"]
        : nlohmann::json::object();
    if (auto t = json_int(j, "time")) {
        result["time"] = *t;
    }
    return result;
}
