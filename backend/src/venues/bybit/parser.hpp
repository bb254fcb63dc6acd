#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gateway/gateway_types.hpp"
#include "symbols/market_info.hpp"
#include "venues/exchange_connector.hpp"

// Bybit v5 payloads. Every response is {"retCode": 0, "retMsg": "OK",
// "result": {...}, "time": ms}; lists sit under result.list.

// "BTC/USDT:USDT" and "BTC/USDT" both map to "BTCUSDT".
std::string bybit_market_id(const std::string& symbol);

// Reverse mapping for ids not seen in instruments-info.
std::string bybit_guess_symbol(const std::string& id, bool linear);

// 1m -> "1", 1h -> "60", 1d -> "D". Throws ExchangeError for anything else.
std::string bybit_interval(const std::string& timeframe);

std::vector<MarketInfo> parse_bybit_instruments(const nlohmann::json& result, bool linear);

// Unified account wallet: result.list[0].coin[].
Balance parse_bybit_balance(const nlohmann::json& result);

RawOrder parse_bybit_order(const nlohmann::json& j, const std::string& symbol);
RawPosition parse_bybit_position(const nlohmann::json& j, const std::string& symbol);
Ticker parse_bybit_ticker(const nlohmann::json& j, const std::string& symbol, std::int64_t timestamp);
std::vector<Candle> parse_bybit_klines(const nlohmann::json& result);
FundingRate parse_bybit_funding_rate(const nlohmann::json& ticker, const std::string& symbol);

// Returns "result" (with "time" copied in when present) or throws the
// mapped exception.
nlohmann::json bybit_unwrap(long http_status, const std::string& body);

[[noreturn]] void throw_bybit_error(long code, const std::string& msg, int http_status);
