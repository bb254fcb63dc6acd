#pragma once

#include "config/gateway_config.hpp"
#include "venues/bybit/bybit_connector.hpp"
#include "venues/venue_factory.hpp"

inline ExchangeCapability make_bybit_capability() {
    ExchangeCapability capability;
    capability.name = "bybit";
    capability.make_connector = [](const GatewayConfig& cfg) -> std::unique_ptr<IExchangeConnector> {
        return std::make_unique<BybitConnector>(cfg);
    };
    capability.supported_ops = BybitConnector::linear_ops();
    return capability;
}
