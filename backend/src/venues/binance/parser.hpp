#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gateway/gateway_types.hpp"
#include "symbols/market_info.hpp"
#include "venues/exchange_connector.hpp"

// Binance spot (/api/v3) and USD-M futures (/fapi) payloads.

// "BTC/USDT:USDT" and "BTC/USDT" both map to "BTCUSDT".
std::string binance_market_id(const std::string& symbol);

// Best effort reverse mapping for ids not seen in exchangeInfo.
std::string binance_guess_symbol(const std::string& id, bool futures);

std::vector<MarketInfo> parse_binance_markets(const nlohmann::json& exchange_info, bool futures);

// /api/v3/account balances[] or /fapi/v2/account assets[].
Balance parse_binance_balance(const nlohmann::json& account, bool futures);

RawOrder parse_binance_order(const nlohmann::json& j, const std::string& symbol);
RawPosition parse_binance_position(const nlohmann::json& j, const std::string& symbol);
Ticker parse_binance_ticker(const nlohmann::json& j, const std::string& symbol);
std::vector<Candle> parse_binance_klines(const nlohmann::json& rows);
FundingRate parse_binance_funding_rate(const nlohmann::json& j, const std::string& symbol);

// LIMIT, MARKET, STOP_LOSS... for the order endpoint.
std::string binance_order_type(OrderType type, bool futures);

// Maps an error response onto the connector exception hierarchy.
[[noreturn]] void throw_binance_error(long http_status, const std::string& body);
