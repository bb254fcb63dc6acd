#include "../src/errors/error_taxonomy.hpp"
#include "../src/errors/exchange_errors.hpp"
#include "../src/venues/bybit/bybit_connector.hpp"
#include "../src/venues/bybit/parser.hpp"
#include <gtest/gtest.h>

using nlohmann::json;

namespace {
    ErrorKind kind_of(long status, const std::string& body)
    {
        try {
            bybit_unwrap(status, body);
        } catch (...) {
            return classify(std::current_exception());
        }
        ADD_FAILURE() << "expected a throw for " << body;
        return ErrorKind::UnknownError;
    }

    std::string reply(long code, const std::string& msg)
    {
        return json{{"retCode", code}, {"retMsg", msg}, {"result", json::object()}}.dump();
    }
}

TEST(BybitParserTest, MarketIdsAndIntervals)
{
    EXPECT_EQ("BTCUSDT", bybit_market_id("BTC/USDT:USDT"));
    EXPECT_EQ("ETHUSDT", bybit_market_id("ETH/USDT"));
    EXPECT_EQ("SOL/USDT:USDT", bybit_guess_symbol("SOLUSDT", true));
    EXPECT_EQ("SOL/USDC", bybit_guess_symbol("SOLUSDC", false));
    EXPECT_EQ("XYZ", bybit_guess_symbol("XYZ", true));

    EXPECT_EQ("1", bybit_interval("1m"));
    EXPECT_EQ("60", bybit_interval("1h"));
    EXPECT_EQ("240", bybit_interval("4h"));
    EXPECT_EQ("D", bybit_interval("1d"));
    EXPECT_EQ("M", bybit_interval("1M"));
    EXPECT_THROW(bybit_interval("7m"), ExchangeError);
}

TEST(BybitParserTest, LinearInstrumentsKeepPerpetualsOnly)
{
    auto result = json::parse(R"({"category": "linear", "list": [
        {"symbol": "BTCUSDT", "contractType": "LinearPerpetual", "status": "Trading",
         "baseCoin": "BTC", "quoteCoin": "USDT", "settleCoin": "USDT",
         "priceFilter": {"minPrice": "0.10", "maxPrice": "199999.80", "tickSize": "0.10"},
         "lotSizeFilter": {"maxOrderQty": "100.000", "minOrderQty": "0.001", "qtyStep": "0.001",
                           "minNotionalValue": "5"}},
        {"symbol": "BTCUSDT-27DEC24", "contractType": "LinearFutures", "status": "Trading",
         "baseCoin": "BTC", "quoteCoin": "USDT", "settleCoin": "USDT"},
        {"symbol": "LUNAUSDT", "contractType": "LinearPerpetual", "status": "Closed",
         "baseCoin": "LUNA", "quoteCoin": "USDT", "settleCoin": "USDT"}
    ]})");

    auto markets = parse_bybit_instruments(result, true);
    ASSERT_EQ(2u, markets.size());
    const auto& btc = markets[0];
    EXPECT_EQ("BTC/USDT:USDT", btc.symbol);
    EXPECT_EQ("BTCUSDT", btc.id);
    EXPECT_EQ(MarketType::Swap, btc.type);
    EXPECT_TRUE(btc.active);
    ASSERT_TRUE(btc.price_precision.has_value());
    EXPECT_EQ(PrecisionMode::TickSize, btc.price_precision->mode);
    EXPECT_DOUBLE_EQ(0.1, btc.price_precision->value);
    EXPECT_DOUBLE_EQ(0.001, btc.amount_precision->value);
    EXPECT_DOUBLE_EQ(0.001, btc.min_amount.value_or(0));
    EXPECT_DOUBLE_EQ(100.0, btc.max_amount.value_or(0));
    EXPECT_DOUBLE_EQ(5.0, btc.min_cost.value_or(0));
    EXPECT_FALSE(markets[1].active);
}

TEST(BybitParserTest, SpotInstrumentsStepByBasePrecision)
{
    auto result = json::parse(R"({"category": "spot", "list": [
        {"symbol": "ETHUSDT", "status": "Trading", "baseCoin": "ETH", "quoteCoin": "USDT",
         "priceFilter": {"tickSize": "0.01"},
         "lotSizeFilter": {"basePrecision": "0.00001", "minOrderQty": "0.00062", "minOrderAmt": "1"}}
    ]})");
    auto markets = parse_bybit_instruments(result, false);
    ASSERT_EQ(1u, markets.size());
    EXPECT_EQ("ETH/USDT", markets[0].symbol);
    EXPECT_EQ(MarketType::Spot, markets[0].type);
    EXPECT_DOUBLE_EQ(0.00001, markets[0].amount_precision->value);
    EXPECT_DOUBLE_EQ(1.0, markets[0].min_cost.value_or(0));
}

TEST(BybitParserTest, UnifiedWalletBalance)
{
    auto result = json::parse(R"({"list": [{"accountType": "UNIFIED", "coin": [
        {"coin": "USDT", "walletBalance": "1000", "locked": "0",
         "totalOrderIM": "50", "totalPositionIM": "150"},
        {"coin": "BTC", "walletBalance": "0.5", "locked": "0.1",
         "totalOrderIM": "", "totalPositionIM": ""}
    ]}]})");
    Balance b = parse_bybit_balance(result);
    EXPECT_DOUBLE_EQ(1000.0, b.total.at("USDT"));
    EXPECT_DOUBLE_EQ(200.0, b.used.at("USDT"));
    EXPECT_DOUBLE_EQ(800.0, b.free.at("USDT"));
    EXPECT_DOUBLE_EQ(0.1, b.used.at("BTC"));
    EXPECT_DOUBLE_EQ(0.4, b.free.at("BTC"));

    EXPECT_TRUE(parse_bybit_balance(json::object()).total.empty());
}

TEST(BybitParserTest, OrderStatusesAndFills)
{
    auto j = json::parse(R"({"orderId": "abc", "orderLinkId": "mine-1", "symbol": "BTCUSDT",
        "side": "Buy", "orderType": "Limit", "price": "65000", "qty": "0.010",
        "cumExecQty": "0.004", "leavesQty": "0.006", "cumExecValue": "260",
        "avgPrice": "65000", "orderStatus": "PartiallyFilled", "cumExecFee": "0.156",
        "createdTime": "1700000000000", "updatedTime": "1700000001000"})");
    RawOrder o = parse_bybit_order(j, "BTC/USDT:USDT");
    EXPECT_EQ("abc", o.id);
    EXPECT_EQ("mine-1", o.client_order_id.value_or(""));
    EXPECT_EQ("buy", o.side);
    EXPECT_EQ("limit", o.type);
    EXPECT_EQ("open", o.status);
    EXPECT_DOUBLE_EQ(0.004, o.filled.value_or(0));
    EXPECT_DOUBLE_EQ(0.006, o.remaining.value_or(0));
    EXPECT_DOUBLE_EQ(260.0, o.cost.value_or(0));
    ASSERT_TRUE(o.fee.has_value());
    EXPECT_DOUBLE_EQ(0.156, o.fee->cost);
    EXPECT_EQ(1700000000000, o.timestamp.value_or(0));

    j["orderStatus"] = "Filled";
    EXPECT_EQ("closed", parse_bybit_order(j, "BTC/USDT:USDT").status);
    j["orderStatus"] = "PartiallyFilledCanceled";
    EXPECT_EQ("canceled", parse_bybit_order(j, "BTC/USDT:USDT").status);
    j["orderStatus"] = "Rejected";
    EXPECT_EQ("rejected", parse_bybit_order(j, "BTC/USDT:USDT").status);

    j["orderType"] = "Market";
    j["price"] = "0";
    EXPECT_FALSE(parse_bybit_order(j, "BTC/USDT:USDT").price.has_value());
}

TEST(BybitParserTest, ShortIsolatedPosition)
{
    auto j = json::parse(R"({"symbol": "ETHUSDT", "side": "Sell", "size": "2",
        "avgPrice": "3000", "markPrice": "2950", "positionValue": "6000", "leverage": "5",
        "liqPrice": "3500", "unrealisedPnl": "100", "cumRealisedPnl": "-3",
        "positionIM": "1200", "tradeMode": 1, "updatedTime": "1700000000000"})");
    RawPosition p = parse_bybit_position(j, "ETH/USDT:USDT");
    EXPECT_EQ("short", p.side);
    EXPECT_DOUBLE_EQ(2.0, p.contracts.value_or(0));
    EXPECT_DOUBLE_EQ(6000.0, p.notional.value_or(0));
    EXPECT_EQ("isolated", p.margin_mode);
    EXPECT_DOUBLE_EQ(1200.0, p.collateral.value_or(0));
    EXPECT_NEAR(8.3333, p.percentage.value_or(0), 1e-3);
    EXPECT_DOUBLE_EQ(3500.0, p.liquidation_price.value_or(0));
}

TEST(BybitParserTest, TickerFundingAndKlines)
{
    auto t = json::parse(R"({"symbol": "BTCUSDT", "lastPrice": "65100", "bid1Price": "65099.9",
        "ask1Price": "65100", "highPrice24h": "66000", "lowPrice24h": "64000",
        "volume24h": "1200", "turnover24h": "78000000", "price24hPcnt": "0.0125",
        "fundingRate": "0.0001", "nextFundingTime": "1700006400000",
        "markPrice": "65101", "indexPrice": "65090"})");
    Ticker ticker = parse_bybit_ticker(t, "BTC/USDT:USDT", 1700000000000);
    EXPECT_DOUBLE_EQ(65100.0, ticker.last.value_or(0));
    EXPECT_DOUBLE_EQ(1.25, ticker.percentage.value_or(0));
    EXPECT_EQ(1700000000000, ticker.timestamp);

    FundingRate f = parse_bybit_funding_rate(t, "BTC/USDT:USDT");
    EXPECT_DOUBLE_EQ(0.0001, f.funding_rate);
    EXPECT_EQ(1700006400000, f.funding_timestamp);
    EXPECT_DOUBLE_EQ(65090.0, f.index_price.value_or(0));

    auto klines = json::parse(R"({"list": [
        ["1700000120000", "3", "4", "2", "3.5", "10", "35"],
        ["1700000060000", "2", "3", "1", "3", "20", "60"]
    ]})");
    auto candles = parse_bybit_klines(klines);
    ASSERT_EQ(2u, candles.size());
    EXPECT_EQ(1700000060000, candles[0].timestamp);
    EXPECT_DOUBLE_EQ(3.5, candles[1].close);
}

TEST(BybitParserTest, UnwrapReturnsResultWithServerTime)
{
    auto result = bybit_unwrap(200,
        R"({"retCode": 0, "retMsg": "OK", "result": {"orderId": "1"}, "time": 1700000000123})");
    EXPECT_EQ("1", result.at("orderId"));
    EXPECT_EQ(1700000000123, result.at("time").get<std::int64_t>());
}

TEST(BybitParserTest, ErrorCodesMapToKinds)
{
    EXPECT_EQ(ErrorKind::AuthenticationError, kind_of(200, reply(10003, "API key is invalid.")));
    EXPECT_EQ(ErrorKind::PermissionDenied, kind_of(200, reply(10010, "Unmatched IP, please check your API key's bound IP addresses.")));
    EXPECT_EQ(ErrorKind::RateLimitExceeded, kind_of(200, reply(10006, "Too many visits!")));
    EXPECT_EQ(ErrorKind::ExchangeNotAvailable, kind_of(200, reply(10016, "Server error.")));
    EXPECT_EQ(ErrorKind::RequestTimeout, kind_of(200, reply(10000, "Server Timeout")));
    EXPECT_EQ(ErrorKind::InsufficientFunds, kind_of(200, reply(110007, "ab not enough for new order")));
    EXPECT_EQ(ErrorKind::OrderNotFound, kind_of(200, reply(110001, "order not exists or too late to cancel")));
    EXPECT_EQ(ErrorKind::InvalidOrder, kind_of(200, reply(110017, "reduce-only rule not satisfied")));
    EXPECT_EQ(ErrorKind::ExchangeError, kind_of(200, reply(10001, "params error")));
    EXPECT_EQ(ErrorKind::RateLimitExceeded, kind_of(403, "<html>403 Forbidden</html>"));
    EXPECT_EQ(ErrorKind::ExchangeNotAvailable, kind_of(502, "Bad Gateway"));
}

TEST(BybitParserTest, ErrorCarriesCodeAndStatus)
{
    try {
        bybit_unwrap(200, reply(110007, "ab not enough for new order"));
        FAIL() << "expected InsufficientFunds";
    } catch (const InsufficientFunds& e) {
        EXPECT_EQ("110007", e.code().value_or(""));
        EXPECT_EQ(200, e.http_status().value_or(0));
        EXPECT_NE(std::string(e.what()).find("bybit 110007"), std::string::npos);
    }
}

TEST(BybitSigningTest, SignsTimestampKeyWindowAndPayload)
{
    EXPECT_EQ("02e9182e346177050f199ce1e0703d738589e3763805ed71590ced65539a73a7",
        bybit_sign("secret", "1658384314791", "XXXXXXXXXX", "5000",
            "category=option&symbol=BTC-29JUL22-25000-C"));
    EXPECT_EQ("0e79a34108fdd9c35f7a469ad6476023fbb4b910896d6b4ea13b66e78623de0c",
        bybit_sign("secret", "1658384314791", "XXXXXXXXXX", "5000", R"({"category":"linear"})"));
}

TEST(BybitConnectorTest, CapabilitiesFollowMarketType)
{
    GatewayConfig cfg;
    cfg.exchange = "bybit";
    BybitConnector linear(cfg);
    EXPECT_TRUE(linear.supports(ConnectorOp::CancelAllOrders));
    EXPECT_TRUE(linear.supports(ConnectorOp::SetLeverage));

    cfg.default_type = MarketType::Spot;
    BybitConnector spot(cfg);
    EXPECT_FALSE(spot.supports(ConnectorOp::FetchPositions));
    EXPECT_FALSE(spot.supports(ConnectorOp::FetchFundingRate));
    EXPECT_THROW(spot.fetch_positions({}), ExchangeError);
}
