#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "venue_factory.hpp"

class VenueRegistry {
public:
    static const VenueRegistry& instance();

    // Case-insensitive.
    const ExchangeCapability* find(std::string_view name) const;
    bool is_supported(std::string_view name) const { return find(name) != nullptr; }

    // Sorted.
    std::vector<std::string> list_names() const;

private:
    VenueRegistry();

    void register_capability(ExchangeCapability capability);

    std::unordered_map<std::string, ExchangeCapability> capabilities_;
};
