#include "venues/exchange_connector.hpp"

const char* to_cstr(ConnectorOp op) {
    switch (op) {
        case ConnectorOp::FetchTime: return "fetchTime";
        case ConnectorOp::LoadMarkets: return "loadMarkets";
        case ConnectorOp::FetchBalance: return "fetchBalance";
        case ConnectorOp::FetchPositions: return "fetchPositions";
        case ConnectorOp::FetchTicker: return "fetchTicker";
        case ConnectorOp::FetchOhlcv: return "fetchOHLCV";
        case ConnectorOp::FetchFundingRate: return "fetchFundingRate";
        case ConnectorOp::CreateOrder: return "createOrder";
        case ConnectorOp::CancelOrder: return "cancelOrder";
        case ConnectorOp::CancelAllOrders: return "cancelAllOrders";
        case ConnectorOp::FetchOpenOrders: return "fetchOpenOrders";
        case ConnectorOp::FetchOrder: return "fetchOrder";
        case ConnectorOp::SetLeverage: return "setLeverage";
    }
    return "?";
}
