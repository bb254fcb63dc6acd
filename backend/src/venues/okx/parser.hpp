#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gateway/gateway_types.hpp"
#include "symbols/market_info.hpp"
#include "venues/exchange_connector.hpp"

// OKX v5 payloads. Every response is {"code": "0", "msg": "", "data": [...]}.

// "BTC/USDT" -> "BTC-USDT", "BTC/USDT:USDT" -> "BTC-USDT-SWAP".
std::string okx_inst_id(const std::string& symbol);
// Inverse of okx_inst_id; inverse swaps settle in the base ("BTC-USD-SWAP" -> "BTC/USD:BTC").
std::string okx_symbol(const std::string& inst_id);

// 1h -> 1H, 1d -> 1D; minutes and months pass through.
std::string okx_bar(const std::string& timeframe);

std::vector<MarketInfo> parse_okx_instruments(const nlohmann::json& data);
Balance parse_okx_balance(const nlohmann::json& data);
RawOrder parse_okx_order(const nlohmann::json& j);
RawPosition parse_okx_position(const nlohmann::json& j);
Ticker parse_okx_ticker(const nlohmann::json& j, const std::string& symbol);
std::vector<Candle> parse_okx_candles(const nlohmann::json& data);
FundingRate parse_okx_funding_rate(const nlohmann::json& j, const std::string& symbol);

// Unwraps "data" or throws the mapped exception. Per-item sCode errors
// inside data are checked too.
nlohmann::json okx_unwrap(long http_status, const std::string& body);

[[noreturn]] void throw_okx_error(const std::string& code, const std::string& msg, int http_status);
