#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/gateway_config.hpp"
#include "gateway/exchange_gateway.hpp"

// Builds a gateway for cfg.exchange from the venue registry. Throws
// GatewayError(UnknownExchange) naming the supported exchanges.
std::unique_ptr<ExchangeGateway> create_gateway(const GatewayConfig& cfg);

// Same, with the configuration read from the environment.
std::unique_ptr<ExchangeGateway> create_gateway(const std::string& exchange,
    const EnvLookup& env = process_env);

struct GatewayInstanceInfo {
    std::string key;
    std::string exchange;
    MarketType type{MarketType::Swap};
    bool connected{false};
};

// Gateways shared within one process, one per exchange, market type and
// instance id. Repeated get() calls hand back the same gateway.
class GatewayInstances {
public:
    using Creator = std::function<std::unique_ptr<ExchangeGateway>(const GatewayConfig&)>;

    static GatewayInstances& instance();

    // Defaults to create_gateway.
    explicit GatewayInstances(Creator creator = {});
    ~GatewayInstances();

    GatewayInstances(const GatewayInstances&) = delete;
    GatewayInstances& operator=(const GatewayInstances&) = delete;

    // "<exchange>_<type>_<instance_id>", exchange lowercased.
    static std::string key_of(const std::string& exchange, MarketType type,
        const std::string& instance_id);

    std::shared_ptr<ExchangeGateway> get(const GatewayConfig& cfg,
        const std::string& instance_id = "default");

    // Closes and forgets one gateway. False when nothing was cached.
    bool destroy(const std::string& exchange, MarketType type,
        const std::string& instance_id = "default");
    void destroy_all();

    std::size_t active_count() const;
    std::vector<GatewayInstanceInfo> active_info() const;

private:
    Creator creator_;
    mutable std::mutex mtx_;
    std::map<std::string, std::shared_ptr<ExchangeGateway>> gateways_;
};
