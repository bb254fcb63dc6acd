#include "gateway/order_normalizer.hpp"

#include <cmath>

UnifiedOrder normalize_order(const RawOrder& raw, const std::string& exchange) {
    UnifiedOrder o;
    o.id = raw.id;
    o.client_order_id = raw.client_order_id;
    o.symbol = raw.symbol;
    o.side = parse_order_side(raw.side).value_or(OrderSide::Buy);
    o.type = parse_order_type(raw.type).value_or(raw.price ? OrderType::Limit : OrderType::Market);
    o.amount = raw.amount.value_or(0.0);
    o.price = raw.price;
    o.filled = raw.filled.value_or(0.0);
    o.remaining = raw.remaining.value_or(o.amount - o.filled);
    o.cost = raw.cost.value_or(0.0);
    if (raw.average && *raw.average != 0.0) {
        o.average = *raw.average;
    } else {
        o.average = raw.price.value_or(0.0);
    }
    o.status = normalize_order_status(raw.status);
    o.timestamp = raw.timestamp.value_or(0);
    o.last_trade_timestamp = raw.last_trade_timestamp;
    o.fee = raw.fee;
    o.trades = raw.trades;
    o.exchange = exchange;
    o.raw = raw.info;
    return o;
}

bool is_flat(const RawPosition& raw) {
    return std::fabs(raw.contracts.value_or(0.0)) == 0.0 &&
        std::fabs(raw.notional.value_or(0.0)) == 0.0;
}

UnifiedPosition normalize_position(const RawPosition& raw, const std::string& exchange) {
    UnifiedPosition p;
    p.symbol = raw.symbol;
    p.contracts = raw.contracts.value_or(0.0);
    if (raw.side == "long") {
        p.side = PositionSide::Long;
    } else if (raw.side == "short") {
        p.side = PositionSide::Short;
    } else {
        p.side = p.contracts < 0 ? PositionSide::Short : PositionSide::Long;
    }
    p.notional = raw.notional.value_or(0.0);
    p.entry_price = raw.entry_price.value_or(0.0);
    p.mark_price = raw.mark_price.value_or(0.0);
    p.liquidation_price = raw.liquidation_price.value_or(0.0);
    p.leverage = raw.leverage && *raw.leverage > 0 ? *raw.leverage : 1.0;
    p.unrealized_pnl = raw.unrealized_pnl.value_or(0.0);
    p.percentage = raw.percentage.value_or(0.0);
    p.realized_pnl = raw.realized_pnl.value_or(0.0);
    p.margin_mode = parse_margin_mode(raw.margin_mode).value_or(MarginMode::Cross);
    p.collateral = raw.collateral.value_or(raw.initial_margin.value_or(0.0));
    p.timestamp = raw.timestamp.value_or(0);
    p.exchange = exchange;
    p.raw = raw.info;
    return p;
}
