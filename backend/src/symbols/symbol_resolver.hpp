#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "symbols/market_info.hpp"

// Reconciles the spot ("BTC/USDT") and derivative ("BTC/USDT:USDT")
// symbol namespaces. With no markets loaded (lightweight mode) it converts
// purely from the default market type.
class SymbolResolver {
public:
    explicit SymbolResolver(MarketType default_type = MarketType::Swap)
        : default_type_(default_type) {}

    void load(const std::vector<MarketInfo>& markets);
    void clear() { markets_.clear(); }

    bool lightweight() const { return markets_.empty(); }
    bool contains(const std::string& symbol) const { return markets_.count(symbol) > 0; }
    MarketType default_type() const { return default_type_; }

    // Idempotent. Unresolvable input comes back unchanged.
    std::string resolve(const std::string& symbol) const;

    // Throws GatewayError(InvalidSymbol) when markets are loaded and neither
    // the symbol nor its converted form is one of them.
    void validate(const std::string& symbol) const;

    // Opposite-namespace candidate, or nullopt when none applies.
    std::optional<std::string> convert(const std::string& symbol) const;

    static bool is_derivative(const std::string& symbol) {
        return symbol.find(':') != std::string::npos;
    }
    static std::string strip_settle(const std::string& symbol);

private:
    MarketType default_type_;
    std::unordered_set<std::string> markets_;
};
