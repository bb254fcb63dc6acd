#include "venues/venue_registry.hpp"

#include <algorithm>
#include <cctype>

#include "venues/binance/factory.hpp"
#include "venues/bybit/factory.hpp"
#include "venues/okx/factory.hpp"

namespace {
    std::string lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }
}

const VenueRegistry& VenueRegistry::instance() {
    static VenueRegistry registry;
    return registry;
}

VenueRegistry::VenueRegistry() {
    register_capability(make_binance_capability());
    register_capability(make_bybit_capability());
    register_capability(make_okx_capability());
}

const ExchangeCapability* VenueRegistry::find(std::string_view name) const {
    auto it = capabilities_.find(lower(name));
    if (it == capabilities_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> VenueRegistry::list_names() const {
    std::vector<std::string> names;
    names.reserve(capabilities_.size());
    for (const auto& kv : capabilities_) {
        names.push_back(kv.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void VenueRegistry::register_capability(ExchangeCapability capability) {
    if (capability.name.empty() || !capability.make_connector) {
        return;
    }
    std::string key = lower(capability.name);
    capabilities_.emplace(std::move(key), std::move(capability));
}
