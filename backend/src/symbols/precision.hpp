#pragma once

#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class PrecisionMode { DecimalPlaces, TickSize };

// One precision entry. The mode is carried explicitly so that a whole
// number tick (e.g. 1.0) is never mistaken for a decimal place count.
struct PrecisionValue {
    PrecisionMode mode{PrecisionMode::DecimalPlaces};
    double value{8};

    static PrecisionValue decimal_places(int n) {
        return PrecisionValue{PrecisionMode::DecimalPlaces, static_cast<double>(n)};
    }
    static PrecisionValue tick_size(double tick) {
        return PrecisionValue{PrecisionMode::TickSize, tick};
    }
    // For sources that only give a bare number: integral means decimal places.
    static PrecisionValue infer(double raw);
};

struct PrecisionInfo {
    PrecisionValue price{PrecisionValue::decimal_places(8)};
    PrecisionValue amount{PrecisionValue::decimal_places(8)};
    double min_amount{0};
    double max_amount{std::numeric_limits<double>::infinity()};
    double min_price{0};
    double max_price{std::numeric_limits<double>::infinity()};
    double min_cost{0};
};

// Truncates value to the precision. The result is never above value.
double adjust_to_precision(double value, const PrecisionValue& precision);

// Number of decimals needed to print a tick exactly (0.005 -> 3).
int tick_decimals(double tick);

struct MarketInfo;

// Per-symbol precision, built once from loaded markets and immutable after.
class PrecisionTable {
public:
    PrecisionTable() = default;

    static PrecisionTable from_markets(const std::vector<MarketInfo>& markets);

    const PrecisionInfo* find(const std::string& symbol) const;
    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

    // Unknown symbols pass through unchanged.
    double adjust_price(const std::string& symbol, double price) const;
    double adjust_amount(const std::string& symbol, double amount) const;

private:
    std::unordered_map<std::string, PrecisionInfo> entries_;
};
