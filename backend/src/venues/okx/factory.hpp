#pragma once

#include "config/gateway_config.hpp"
#include "venues/okx/okx_connector.hpp"
#include "venues/venue_factory.hpp"

inline ExchangeCapability make_okx_capability() {
    ExchangeCapability capability;
    capability.name = "okx";
    capability.make_connector = [](const GatewayConfig& cfg) -> std::unique_ptr<IExchangeConnector> {
        return std::make_unique<OkxConnector>(cfg);
    };
    capability.supported_ops = OkxConnector::swap_ops();
    return capability;
}
