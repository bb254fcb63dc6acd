#include "symbols/symbol_resolver.hpp"

#include "errors/gateway_error.hpp"

namespace {
    const char* const kSettleSuffixes[] = {":USDT", ":USD", ":BUSD"};
}

std::string SymbolResolver::strip_settle(const std::string& symbol) {
    auto pos = symbol.find(':');
    return pos == std::string::npos ? symbol : symbol.substr(0, pos);
}

void SymbolResolver::load(const std::vector<MarketInfo>& markets) {
    markets_.clear();
    markets_.reserve(markets.size());
    for (const auto& m : markets) {
        markets_.insert(m.symbol);
    }
}

std::optional<std::string> SymbolResolver::convert(const std::string& symbol) const {
    if (symbol.empty()) {
        return std::nullopt;
    }

    if (is_derivative(symbol)) {
        std::string spot = strip_settle(symbol);
        if (lightweight()) {
            if (default_type_ == MarketType::Spot) return spot;
            return std::nullopt;
        }
        if (contains(spot)) return spot;
        return std::nullopt;
    }

    if (lightweight()) {
        if (default_type_ != MarketType::Spot) return symbol + ":USDT";
        return std::nullopt;
    }
    for (const char* suffix : kSettleSuffixes) {
        std::string perp = symbol + suffix;
        if (contains(perp)) return perp;
    }
    return std::nullopt;
}

std::string SymbolResolver::resolve(const std::string& symbol) const {
    if (symbol.empty()) {
        return symbol;
    }
    if (lightweight()) {
        if (default_type_ == MarketType::Spot) {
            return is_derivative(symbol) ? strip_settle(symbol) : symbol;
        }
        return is_derivative(symbol) ? symbol : symbol + ":USDT";
    }

    if (contains(symbol)) {
        return symbol;
    }
    auto converted = convert(symbol);
    if (converted && contains(*converted)) {
        return *converted;
    }
    return symbol;
}

void SymbolResolver::validate(const std::string& symbol) const {
    if (lightweight() || contains(symbol)) {
        return;
    }
    auto converted = convert(symbol);
    if (converted && contains(*converted)) {
        return;
    }
    throw GatewayError(GatewayErrorCode::InvalidSymbol, "Invalid symbol: " + symbol);
}
