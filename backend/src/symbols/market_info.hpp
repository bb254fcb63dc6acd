#pragma once

#include <optional>
#include <string>

#include "symbols/precision.hpp"

enum class MarketType { Spot, Swap, Future };

inline const char* to_cstr(MarketType t) {
    switch (t) {
        case MarketType::Spot: return "spot";
        case MarketType::Swap: return "swap";
        case MarketType::Future: return "future";
    }
    return "?";
}

// Market metadata as reported by a connector. Optional fields fall back to
// PrecisionInfo defaults when the precision table is built.
struct MarketInfo {
    std::string symbol;        // BTC/USDT or BTC/USDT:USDT
    std::string id;            // venue id, BTCUSDT or BTC-USDT-SWAP
    std::string base;
    std::string quote;
    std::string settle;        // empty for spot
    MarketType type{MarketType::Spot};
    bool active{true};
    double contract_size{1.0};

    std::optional<PrecisionValue> price_precision;
    std::optional<PrecisionValue> amount_precision;
    std::optional<double> min_amount;
    std::optional<double> max_amount;
    std::optional<double> min_price;
    std::optional<double> max_price;
    std::optional<double> min_cost;
};
