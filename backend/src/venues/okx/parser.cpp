#include "venues/okx/parser.hpp"

#include <algorithm>
#include <cctype>

#include "errors/exchange_errors.hpp"
#include "venues/rest/json_fields.hpp"

namespace {
    std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out;
        std::string cur;
        for (char c : s) {
            if (c == sep) {
                out.push_back(cur);
                cur.clear();
            } else {
                cur.push_back(c);
            }
        }
        out.push_back(cur);
        return out;
    }

    std::string status_from_okx(const std::string& state) {
        if (state == "live") return "open";
        if (state == "mmp_canceled") return "canceled";
        return state;
    }
}

std::string okx_inst_id(const std::string& symbol) {
    const auto colon = symbol.find(':');
    std::string pair = symbol.substr(0, colon);
    std::replace(pair.begin(), pair.end(), '/', '-');
    if (colon == std::string::npos) {
        return pair;
    }
    return pair + "-SWAP";
}

std::string okx_symbol(const std::string& inst_id) {
    const auto parts = split(inst_id, '-');
    if (parts.size() < 2) {
        return inst_id;
    }
    const std::string pair = parts[0] + "/" + parts[1];
    if (parts.size() >= 3 && parts[2] == "SWAP") {
        const std::string settle = parts[1] == "USD" ? parts[0] : parts[1];
        return pair + ":" + settle;
    }
    return pair;
}

std::string okx_bar(const std::string& timeframe) {
    if (timeframe.empty()) {
        return timeframe;
    }
    std::string bar = timeframe;
    const char unit = bar.back();
    if (unit == 'h' || unit == 'd' || unit == 'w') {
        bar.back() = static_cast<char>(std::toupper(static_cast<unsigned char>(unit)));
    }
    return bar;
}

std::vector<MarketInfo> parse_okx_instruments(const nlohmann::json& data) {
    std::vector<MarketInfo> out;
    for (const auto& i : data) {
        const std::string inst_type = json_string(i, "instType");
        MarketInfo m;
        m.id = json_string(i, "instId");
        const auto parts = split(m.id, '-');
        if (parts.size() < 2) continue;

        if (inst_type == "SPOT") {
            m.type = MarketType::Spot;
            m.base = json_string(i, "baseCcy");
            m.quote = json_string(i, "quoteCcy");
        } else if (inst_type == "SWAP") {
            m.type = MarketType::Swap;
            m.base = parts[0];
            m.quote = parts[1];
            m.settle = json_string(i, "settleCcy");
            m.contract_size = json_number(i, "ctVal").value_or(1.0);
        } else {
            continue;
        }
        if (m.base.empty()) m.base = parts[0];
        if (m.quote.empty()) m.quote = parts[1];
        m.symbol = m.settle.empty()
            ? m.base + "/" + m.quote
            : m.base + "/" + m.quote + ":" + m.settle;
        m.active = json_string(i, "state") == "live";

        if (auto tick = json_number(i, "tickSz"); tick && *tick > 0) {
            m.price_precision = PrecisionValue::tick_size(*tick);
            m.min_price = *tick;
        }
        if (auto lot = json_number(i, "lotSz"); lot && *lot > 0) {
            m.amount_precision = PrecisionValue::tick_size(*lot);
        }
        m.min_amount = json_number(i, "minSz");
        m.max_amount = json_number(i, "maxLmtSz");
        out.push_back(std::move(m));
    }
    return out;
}

Balance parse_okx_balance(const nlohmann::json& data) {
    Balance b;
    b.raw = data;
    if (!data.is_array() || data.empty() || !data[0].contains("details")) {
        return b;
    }
    for (const auto& d : data[0]["details"]) {
        const std::string ccy = json_string(d, "ccy");
        double total = json_number(d, "eq").value_or(json_number(d, "cashBal").value_or(0.0));
        double free = json_number(d, "availBal").value_or(json_number(d, "availEq").value_or(total));
        double used = json_number(d, "frozenBal").value_or(total - free);
        b.total[ccy] = total;
        b.free[ccy] = free;
        b.used[ccy] = used;
    }
    return b;
}

RawOrder parse_okx_order(const nlohmann::json& j) {
    RawOrder o;
    o.id = json_string(j, "ordId");
    if (auto c = json_string(j, "clOrdId"); !c.empty()) {
        o.client_order_id = c;
    }
    o.symbol = okx_symbol(json_string(j, "instId"));
    o.side = json_string(j, "side");
    o.type = json_string(j, "ordType");
    o.amount = json_number(j, "sz");
    if (auto px = json_number(j, "px"); px && *px > 0) {
        o.price = px;
    }
    o.filled = json_number(j, "accFillSz");
    if (!o.filled) o.filled = json_number(j, "fillSz");
    if (auto avg = json_number(j, "avgPx"); avg && *avg > 0) {
        o.average = avg;
        if (o.filled) o.cost = *avg * *o.filled;
    }
    o.status = status_from_okx(json_string(j, "state"));
    o.timestamp = json_int(j, "cTime");
    o.last_trade_timestamp = json_int(j, "fillTime");
    if (auto fee = json_number(j, "fee"); fee && *fee != 0.0) {
        // OKX reports fees as negative balances.
        o.fee = Fee{-*fee, json_string(j, "feeCcy"), std::nullopt};
    }
    o.info = j;
    return o;
}

RawPosition parse_okx_position(const nlohmann::json& j) {
    RawPosition p;
    p.symbol = okx_symbol(json_string(j, "instId"));
    const double pos = json_number(j, "pos").value_or(0.0);
    const std::string pos_side = json_string(j, "posSide");
    p.side = (pos_side == "long" || pos_side == "short") ? pos_side : (pos < 0 ? "short" : "long");
    p.contracts = pos < 0 ? -pos : pos;
    p.notional = json_number(j, "notionalUsd");
    p.entry_price = json_number(j, "avgPx");
    p.mark_price = json_number(j, "markPx");
    p.liquidation_price = json_number(j, "liqPx");
    p.leverage = json_number(j, "lever");
    p.unrealized_pnl = json_number(j, "upl");
    if (auto ratio = json_number(j, "uplRatio")) {
        p.percentage = *ratio * 100.0;
    }
    p.realized_pnl = json_number(j, "realizedPnl");
    p.margin_mode = json_string(j, "mgnMode");
    p.collateral = json_number(j, "margin");
    p.initial_margin = json_number(j, "imr");
    p.timestamp = json_int(j, "uTime");
    p.info = j;
    return p;
}

Ticker parse_okx_ticker(const nlohmann::json& j, const std::string& symbol) {
    Ticker t;
    t.symbol = symbol;
    t.bid = json_number(j, "bidPx");
    t.ask = json_number(j, "askPx");
    t.last = json_number(j, "last");
    t.high = json_number(j, "high24h");
    t.low = json_number(j, "low24h");
    t.base_volume = json_number(j, "vol24h");
    t.quote_volume = json_number(j, "volCcy24h");
    const auto open = json_number(j, "open24h");
    if (open && *open > 0 && t.last) {
        t.percentage = (*t.last - *open) / *open * 100.0;
    }
    t.timestamp = json_int(j, "ts").value_or(0);
    t.raw = j;
    return t;
}

std::vector<Candle> parse_okx_candles(const nlohmann::json& data) {
    std::vector<Candle> out;
    if (!data.is_array()) {
        return out;
    }
    for (const auto& r : data) {
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

FundingRate parse_okx_funding_rate(const nlohmann::json& j, const std::string& symbol) {
    FundingRate f;
    f.symbol = symbol;
    f.funding_rate = json_number(j, "fundingRate").value_or(0.0);
    f.funding_rate_predicted = json_number(j, "nextFundingRate");
    f.funding_timestamp = json_int(j, "fundingTime").value_or(0);
    f.raw = j;
    return f;
}

void throw_okx_error(const std::string& code, const std::string& msg, int http_status) {
    const std::string text = "okx " + code + " " + msg;
    const std::optional<std::string> c = code.empty() ? std::nullopt : std::optional<std::string>(code);
    int n = 0;
    try {
        n = code.empty() ? 0 : std::stoi(code);
    } catch (const std::exception&) {
        n = 0;
    }

    switch (n) {
        case 50110:
        case 50120:
            throw PermissionDenied(text, c, http_status);
        case 50101:
        case 50102:
        case 50105:
        case 50111:
        case 50113:
        case 50114:
        case 50119:
            throw AuthenticationError(text, c, http_status);
        case 50011:
        case 50061:
            throw RateLimitExceeded(text, c, http_status);
        case 50001:
        case 50013:
        case 50026:
            throw ExchangeNotAvailable(text, c, http_status);
        case 50004:
            throw RequestTimeout(text, c, http_status);
        case 51008:
            throw InsufficientFunds(text, c, http_status);
        case 51400:
        case 51603:
            throw OrderNotFound(text, c, http_status);
        case 51001:
            throw BadSymbol(text, c, http_status);
        default:
            break;
    }
    if (n >= 51000 && n < 52000) throw InvalidOrder(text, c, http_status);
    if (http_status == 429) throw RateLimitExceeded(text, c, http_status);
    if (http_status == 401) throw AuthenticationError(text, c, http_status);
    if (http_status >= 500) throw ExchangeNotAvailable(text, c, http_status);
    throw ExchangeError(text, c, http_status);
}

nlohmann::json okx_unwrap(long http_status, const std::string& body) {
    const int status = static_cast<int>(http_status);
    const auto j = parse_body(body);
    if (j.is_discarded() || !j.is_object()) {
        if (status == 429) throw RateLimitExceeded("okx: rate limited", std::nullopt, status);
        if (status >= 500) throw ExchangeNotAvailable("okx: HTTP " + std::to_string(status), std::nullopt, status);
        throw ExchangeError("okx: unparseable response: " + body.substr(0, 200), std::nullopt, status);
    }

    const std::string code = json_string(j, "code");
    if (code != "0") {
        // Operation level failures carry the real reason per item.
        if (j.contains("data") && j["data"].is_array() && !j["data"].empty()) {
            const auto& first = j["data"][0];
            const std::string s_code = json_string(first, "sCode");
            if (!s_code.empty() && s_code != "0") {
                throw_okx_error(s_code, json_string(first, "sMsg"), status);
            }
        }
        throw_okx_error(code, json_string(j, "msg"), status);
    }
    if (status < 200 || status >= 300) {
        throw_okx_error("", "HTTP " + std::to_string(status), status);
    }

    nlohmann::json data = j.contains("data") ? j["data"] : nlohmann::json::array();
    if (data.is_array() && !data.empty() && data[0].is_object()) {
        const std::string s_code = json_string(data[0], "sCode");
        if (!s_code.empty() && s_code != "0") {
            throw_okx_error(s_code, json_string(data[0], "sMsg"), status);
        }
    }
    return data;
}
