#pragma once

#include <string>

#include "gateway/gateway_types.hpp"
#include "venues/exchange_connector.hpp"

// Fills the unified records from whatever the venue sent. Defaults:
// filled 0, remaining amount - filled, average falls back to price,
// leverage 1, margin mode cross, collateral falls back to initial margin.
UnifiedOrder normalize_order(const RawOrder& raw, const std::string& exchange);
UnifiedPosition normalize_position(const RawPosition& raw, const std::string& exchange);

// No contracts and no notional.
bool is_flat(const RawPosition& raw);
