#include "gateway/gateway_factory.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "errors/gateway_error.hpp"
#include "venues/venue_registry.hpp"

std::unique_ptr<ExchangeGateway> create_gateway(const GatewayConfig& cfg) {
    const auto& registry = VenueRegistry::instance();
    const ExchangeCapability* capability = registry.find(cfg.exchange);
    if (capability == nullptr) {
        std::string supported;
        for (const auto& n : registry.list_names()) {
            if (!supported.empty()) supported += ", ";
            supported += n;
        }
        throw GatewayError(GatewayErrorCode::UnknownExchange,
            "Unsupported exchange: " + cfg.exchange + ". Supported: " + supported);
    }

    auto connector = capability->make_connector(cfg);
    spdlog::info("[factory] {} gateway ({}{})", capability->name,
        to_cstr(cfg.default_type), cfg.sandbox ? ", sandbox" : "");
    return std::make_unique<ExchangeGateway>(cfg, std::move(connector));
}

std::unique_ptr<ExchangeGateway> create_gateway(const std::string& exchange, const EnvLookup& env) {
    return create_gateway(load_gateway_config(exchange, env));
}

namespace {
    // Close failures are logged and the gateway is dropped regardless.
    void close_quietly(const std::string& key, ExchangeGateway& gateway) {
        try {
            gateway.close();
        } catch (const std::exception& e) {
            spdlog::error("[factory] closing {} failed: {}", key, e.what());
        }
    }
}

GatewayInstances& GatewayInstances::instance() {
    static GatewayInstances instances;
    return instances;
}

GatewayInstances::GatewayInstances(Creator creator)
    : creator_(std::move(creator))
{
    if (!creator_) {
        creator_ = [](const GatewayConfig& cfg) { return create_gateway(cfg); };
    }
}

GatewayInstances::~GatewayInstances() = default;

std::string GatewayInstances::key_of(const std::string& exchange, MarketType type,
    const std::string& instance_id)
{
    std::string name = exchange;
    std::transform(name.begin(), name.end(), name.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name + "_" + to_cstr(type) + "_" + instance_id;
}

std::shared_ptr<ExchangeGateway> GatewayInstances::get(const GatewayConfig& cfg,
    const std::string& instance_id)
{
    const std::string key = key_of(cfg.exchange, cfg.default_type, instance_id);
    std::scoped_lock lk(mtx_);
    auto it = gateways_.find(key);
    if (it != gateways_.end()) {
        return it->second;
    }
    std::shared_ptr<ExchangeGateway> gateway = creator_(cfg);
    gateways_.emplace(key, gateway);
    spdlog::info("[factory] cached gateway {}", key);
    return gateway;
}

bool GatewayInstances::destroy(const std::string& exchange, MarketType type,
    const std::string& instance_id)
{
    const std::string key = key_of(exchange, type, instance_id);
    std::shared_ptr<ExchangeGateway> gateway;
    {
        std::scoped_lock lk(mtx_);
        auto it = gateways_.find(key);
        if (it == gateways_.end()) {
            return false;
        }
        gateway = std::move(it->second);
        gateways_.erase(it);
    }
    close_quietly(key, *gateway);
    return true;
}

void GatewayInstances::destroy_all() {
    std::map<std::string, std::shared_ptr<ExchangeGateway>> gateways;
    {
        std::scoped_lock lk(mtx_);
        gateways.swap(gateways_);
    }
    for (auto& [key, gateway] : gateways) {
        close_quietly(key, *gateway);
        spdlog::info("[factory] closed gateway {}", key);
    }
}

std::size_t GatewayInstances::active_count() const {
    std::scoped_lock lk(mtx_);
    return gateways_.size();
}

std::vector<GatewayInstanceInfo> GatewayInstances::active_info() const {
    std::scoped_lock lk(mtx_);
    std::vector<GatewayInstanceInfo> out;
    out.reserve(gateways_.size());
    for (const auto& [key, gateway] : gateways_) {
        out.push_back(GatewayInstanceInfo{key, gateway->name(),
            gateway->config().default_type, gateway->is_connected()});
    }
    return out;
}
