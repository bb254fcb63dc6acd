#include "symbols/precision.hpp"

#include <algorithm>
#include <cmath>

#include "symbols/market_info.hpp"

namespace {
    constexpr double kSnapEps = 1e-9;

    // Pulls x onto the nearest integer when it is only float noise away,
    // so 0.3 / 0.1 counts as 3 steps rather than 2.999...
    double snap(double x) {
        const double r = std::round(x);
        return std::fabs(x - r) < kSnapEps ? r : x;
    }

    double round_to(double x, int decimals) {
        const double scale = std::pow(10.0, decimals);
        return std::round(x * scale) / scale;
    }
}

PrecisionValue PrecisionValue::infer(double raw) {
    if (std::isfinite(raw) && raw >= 0 && std::floor(raw) == raw) {
        return decimal_places(static_cast<int>(raw));
    }
    return tick_size(raw);
}

int tick_decimals(double tick) {
    int d = 0;
    while (d < 12) {
        const double scaled = tick * std::pow(10.0, d);
        if (std::fabs(scaled - std::round(scaled)) < kSnapEps * std::max(1.0, scaled)) {
            break;
        }
        ++d;
    }
    return d;
}

double adjust_to_precision(double value, const PrecisionValue& precision) {
    if (!std::isfinite(value) || !std::isfinite(precision.value)) {
        return value;
    }

    double result = value;
    if (precision.mode == PrecisionMode::DecimalPlaces) {
        const int places = std::max(0, static_cast<int>(precision.value));
        const double scale = std::pow(10.0, places);
        result = round_to(std::floor(snap(value * scale)) / scale, places);
        if (result > value) {
            result = round_to(std::floor(value * scale) / scale, places);
        }
    } else {
        const double tick = precision.value;
        if (tick <= 0) {
            return value;
        }
        const int decimals = tick_decimals(tick);
        result = round_to(std::floor(snap(value / tick)) * tick, decimals);
        if (result > value) {
            result = round_to(std::floor(value / tick) * tick, decimals);
        }
    }
    return std::min(result, value);
}

PrecisionTable PrecisionTable::from_markets(const std::vector<MarketInfo>& markets) {
    PrecisionTable table;
    table.entries_.reserve(markets.size());
    for (const auto& m : markets) {
        PrecisionInfo info;
        if (m.price_precision) info.price = *m.price_precision;
        if (m.amount_precision) info.amount = *m.amount_precision;
        if (m.min_amount) info.min_amount = *m.min_amount;
        if (m.max_amount) info.max_amount = *m.max_amount;
        if (m.min_price) info.min_price = *m.min_price;
        if (m.max_price) info.max_price = *m.max_price;
        if (m.min_cost) info.min_cost = *m.min_cost;
        table.entries_.emplace(m.symbol, info);
    }
    return table;
}

const PrecisionInfo* PrecisionTable::find(const std::string& symbol) const {
    auto it = entries_.find(symbol);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

double PrecisionTable::adjust_price(const std::string& symbol, double price) const {
    const PrecisionInfo* info = find(symbol);
    return info ? adjust_to_precision(price, info->price) : price;
}

double PrecisionTable::adjust_amount(const std::string& symbol, double amount) const {
    const PrecisionInfo* info = find(symbol);
    return info ? adjust_to_precision(amount, info->amount) : amount;
}
