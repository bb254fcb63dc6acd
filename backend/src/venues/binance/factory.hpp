#pragma once

#include "config/gateway_config.hpp"
#include "venues/binance/binance_connector.hpp"
#include "venues/venue_factory.hpp"

inline ExchangeCapability make_binance_capability() {
    ExchangeCapability capability;
    capability.name = "binance";
    capability.make_connector = [](const GatewayConfig& cfg) -> std::unique_ptr<IExchangeConnector> {
        return std::make_unique<BinanceConnector>(cfg);
    };
    capability.supported_ops = BinanceConnector::futures_ops();
    return capability;
}
