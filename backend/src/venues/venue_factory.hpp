#pragma once

#include <functional>
#include <memory>
#include <string>

#include "venues/exchange_connector.hpp"

struct GatewayConfig;

// Everything the gateway needs to know about one exchange: how to build its
// connector and which operations that connector implements.
struct ExchangeCapability {
    std::string name;
    std::function<std::unique_ptr<IExchangeConnector>(const GatewayConfig& cfg)> make_connector;
    ConnectorOpSet supported_ops;
};
