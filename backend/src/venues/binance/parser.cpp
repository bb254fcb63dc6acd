#include "venues/binance/parser.hpp"

#include <algorithm>
#include <cctype>

#include "errors/exchange_errors.hpp"
#include "venues/rest/json_fields.hpp"

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string order_type_from_binance(const std::string& t) {
        if (t == "STOP_LOSS") return "stop";
        if (t == "STOP_LOSS_LIMIT" || t == "STOP") return "stop_limit";
        if (t == "STOP_MARKET") return "stop_market";
        if (t == "LIMIT_MAKER") return "limit";
        return lower(t);
    }

    std::string status_from_binance(const std::string& s) {
        std::string v = lower(s);
        if (v.rfind("expired", 0) == 0) return "expired";
        return v;
    }
}

std::string binance_market_id(const std::string& symbol) {
    std::string id;
    for (char c : symbol) {
        if (c == ':') break;
        if (c != '/') id.push_back(c);
    }
    return id;
}

std::string binance_guess_symbol(const std::string& id, bool futures) {
    static const char* const kQuotes[] = {"USDT", "USDC", "FDUSD", "BUSD", "BTC", "ETH", "BNB"};
    for (const char* q : kQuotes) {
        const std::string quote = q;
        if (id.size() > quote.size() &&
            id.compare(id.size() - quote.size(), quote.size(), quote) == 0) {
            std::string sym = id.substr(0, id.size() - quote.size()) + "/" + quote;
            return futures ? sym + ":" + quote : sym;
        }
    }
    return id;
}

std::vector<MarketInfo> parse_binance_markets(const nlohmann::json& exchange_info, bool futures) {
    std::vector<MarketInfo> out;
    if (!exchange_info.contains("symbols")) {
        return out;
    }
    for (const auto& s : exchange_info["symbols"]) {
        MarketInfo m;
        m.id = json_string(s, "symbol");
        m.base = json_string(s, "baseAsset");
        m.quote = json_string(s, "quoteAsset");

        if (futures) {
            // Dated delivery contracts are left out; only perpetuals trade here.
            if (json_string(s, "contractType") != "PERPETUAL") continue;
            m.settle = json_string(s, "marginAsset");
            m.type = MarketType::Swap;
            m.symbol = m.base + "/" + m.quote + ":" + m.settle;
            m.active = json_string(s, "status") == "TRADING";
        } else {
            m.type = MarketType::Spot;
            m.symbol = m.base + "/" + m.quote;
            m.active = json_string(s, "status") == "TRADING";
        }

        if (s.contains("filters")) {
            for (const auto& f : s["filters"]) {
                const std::string ft = json_string(f, "filterType");
                if (ft == "PRICE_FILTER") {
                    if (auto tick = json_number(f, "tickSize"); tick && *tick > 0) {
                        m.price_precision = PrecisionValue::tick_size(*tick);
                    }
                    m.min_price = json_number(f, "minPrice");
                    m.max_price = json_number(f, "maxPrice");
                } else if (ft == "LOT_SIZE") {
                    if (auto step = json_number(f, "stepSize"); step && *step > 0) {
                        m.amount_precision = PrecisionValue::tick_size(*step);
                    }
                    m.min_amount = json_number(f, "minQty");
                    m.max_amount = json_number(f, "maxQty");
                } else if (ft == "MIN_NOTIONAL" || ft == "NOTIONAL") {
                    m.min_cost = json_number(f, futures ? "notional" : "minNotional");
                }
            }
        }
        if (!m.price_precision) {
            if (auto p = json_int(s, "pricePrecision")) {
                m.price_precision = PrecisionValue::decimal_places(static_cast<int>(*p));
            }
        }
        if (!m.amount_precision) {
            if (auto p = json_int(s, "quantityPrecision")) {
                m.amount_precision = PrecisionValue::decimal_places(static_cast<int>(*p));
            }
        }
        out.push_back(std::move(m));
    }
    return out;
}

Balance parse_binance_balance(const nlohmann::json& account, bool futures) {
    Balance b;
    b.raw = account;
    const char* list = futures ? "assets" : "balances";
    if (!account.contains(list)) {
        return b;
    }
    for (const auto& a : account[list]) {
        const std::string asset = json_string(a, "asset");
        double free = 0.0;
        double total = 0.0;
        if (futures) {
            total = json_number(a, "walletBalance").value_or(0.0);
            free = json_number(a, "availableBalance").value_or(0.0);
        } else {
            free = json_number(a, "free").value_or(0.0);
            total = free + json_number(a, "locked").value_or(0.0);
        }
        if (total == 0.0 && free == 0.0) {
            continue;
        }
        b.total[asset] = total;
        b.free[asset] = free;
        b.used[asset] = total - free;
    }
    return b;
}

RawOrder parse_binance_order(const nlohmann::json& j, const std::string& symbol) {
    RawOrder o;
    o.id = json_string(j, "orderId");
    if (auto c = json_string(j, "clientOrderId"); !c.empty()) {
        o.client_order_id = c;
    }
    o.symbol = symbol;
    o.side = lower(json_string(j, "side"));
    o.type = order_type_from_binance(json_string(j, "type"));
    o.amount = json_number(j, "origQty");
    if (auto px = json_number(j, "price"); px && *px > 0) {
        o.price = px;
    }
    o.filled = json_number(j, "executedQty");
    if (o.amount && o.filled) {
        o.remaining = *o.amount - *o.filled;
    }
    o.cost = json_number(j, "cummulativeQuoteQty");
    if (!o.cost) {
        o.cost = json_number(j, "cumQuote");
    }
    if (auto avg = json_number(j, "avgPrice"); avg && *avg > 0) {
        o.average = avg;
    } else if (o.cost && o.filled && *o.filled > 0) {
        o.average = *o.cost / *o.filled;
    }
    o.status = status_from_binance(json_string(j, "status"));
    o.timestamp = json_int(j, "transactTime");
    if (!o.timestamp) o.timestamp = json_int(j, "time");
    if (!o.timestamp) o.timestamp = json_int(j, "updateTime");
    o.last_trade_timestamp = json_int(j, "updateTime");
    o.info = j;
    return o;
}

RawPosition parse_binance_position(const nlohmann::json& j, const std::string& symbol) {
    RawPosition p;
    p.symbol = symbol;
    const double amt = json_number(j, "positionAmt").value_or(0.0);
    const std::string pos_side = lower(json_string(j, "positionSide"));
    if (pos_side == "long" || pos_side == "short") {
        p.side = pos_side;
    } else {
        p.side = amt < 0 ? "short" : "long";
    }
    p.contracts = amt < 0 ? -amt : amt;
    if (auto n = json_number(j, "notional")) {
        p.notional = *n < 0 ? -*n : *n;
    }
    p.entry_price = json_number(j, "entryPrice");
    p.mark_price = json_number(j, "markPrice");
    p.liquidation_price = json_number(j, "liquidationPrice");
    p.leverage = json_number(j, "leverage");
    p.unrealized_pnl = json_number(j, "unRealizedProfit");
    p.margin_mode = lower(json_string(j, "marginType"));
    if (p.margin_mode == "isolated") {
        p.collateral = json_number(j, "isolatedMargin");
    }
    p.initial_margin = json_number(j, "initialMargin");
    if (p.unrealized_pnl && p.initial_margin && *p.initial_margin > 0) {
        p.percentage = *p.unrealized_pnl / *p.initial_margin * 100.0;
    }
    p.timestamp = json_int(j, "updateTime");
    p.info = j;
    return p;
}

Ticker parse_binance_ticker(const nlohmann::json& j, const std::string& symbol) {
    Ticker t;
    t.symbol = symbol;
    t.bid = json_number(j, "bidPrice");
    t.ask = json_number(j, "askPrice");
    t.last = json_number(j, "lastPrice");
    t.high = json_number(j, "highPrice");
    t.low = json_number(j, "lowPrice");
    t.base_volume = json_number(j, "volume");
    t.quote_volume = json_number(j, "quoteVolume");
    t.percentage = json_number(j, "priceChangePercent");
    t.timestamp = json_int(j, "closeTime").value_or(0);
    t.raw = j;
    return t;
}

std::vector<Candle> parse_binance_klines(const nlohmann::json& rows) {
    std::vector<Candle> out;
    if (!rows.is_array()) {
        return out;
    }
    out.reserve(rows.size());
    for (const auto& r : rows) {
        if (!r.is_array() || r.size() < 6) continue;
        Candle c;
        c.timestamp = r[0].get<std::int64_t>();
        c.open = std::stod(r[1].get<std::string>());
        c.high = std::stod(r[2].get<std::string>());
        c.low = std::stod(r[3].get<std::string>());
        c.close = std::stod(r[4].get<std::string>());
        c.volume = std::stod(r[5].get<std::string>());
        out.push_back(c);
    }
    return out;
}

FundingRate parse_binance_funding_rate(const nlohmann::json& j, const std::string& symbol) {
    FundingRate f;
    f.symbol = symbol;
    f.funding_rate = json_number(j, "lastFundingRate").value_or(0.0);
    f.funding_timestamp = json_int(j, "nextFundingTime").value_or(0);
    f.mark_price = json_number(j, "markPrice");
    f.index_price = json_number(j, "indexPrice");
    f.raw = j;
    return f;
}

std::string binance_order_type(OrderType type, bool futures) {
    switch (type) {
        case OrderType::Market: return "MARKET";
        case OrderType::Limit: return "LIMIT";
        case OrderType::StopLimit: return futures ? "STOP" : "STOP_LOSS_LIMIT";
        case OrderType::Stop:
        case OrderType::StopMarket: return futures ? "STOP_MARKET" : "STOP_LOSS";
    }
    return "LIMIT";
}

void throw_binance_error(long http_status, const std::string& body) {
    const auto j = parse_body(body);
    const bool has_code = j.is_object() && j.contains("code") && j["code"].is_number();
    const int code = has_code ? j["code"].get<int>() : 0;
    const std::string msg = j.is_object() && j.contains("msg")
        ? json_string(j, "msg")
        : body.substr(0, 200);
    const std::optional<std::string> code_str = has_code
        ? std::optional<std::string>(std::to_string(code))
        : std::nullopt;
    const int status = static_cast<int>(http_status);
    const std::string text = "binance " + (has_code ? std::to_string(code) + " " : "") + msg;

    switch (code) {
        case -1003:
        case -1015:
            throw RateLimitExceeded(text, code_str, status);
        case -1001:
            throw ExchangeNotAvailable(text, code_str, status);
        case -1007:
            throw RequestTimeout(text, code_str, status);
        case -1022:
        case -2014:
            throw AuthenticationError(text, code_str, status);
        case -2015:
            // Wrong key, IP outside the whitelist, or missing permission.
            throw PermissionDenied(text, code_str, status);
        case -2010:
            if (lower(msg).find("insufficient") != std::string::npos) {
                throw InsufficientFunds(text, code_str, status);
            }
            throw InvalidOrder(text, code_str, status);
        case -2019:
            throw InsufficientFunds(text, code_str, status);
        case -2011:
        case -2013:
            throw OrderNotFound(text, code_str, status);
        case -1121:
            throw BadSymbol(text, code_str, status);
        case -1013:
        case -1100:
        case -1101:
        case -1102:
        case -1106:
        case -1111:
        case -1116:
        case -1117:
        case -2021:
        case -2022:
        case -4164:
            throw InvalidOrder(text, code_str, status);
        default:
            break;
    }

    if (status == 418) throw DDoSProtection(text, code_str, status);
    if (status == 429) throw RateLimitExceeded(text, code_str, status);
    if (status == 401) throw AuthenticationError(text, code_str, status);
    if (status == 403) throw DDoSProtection(text, code_str, status);
    if (status >= 500) throw ExchangeNotAvailable(text, code_str, status);
    throw ExchangeError(text, code_str, status);
}
