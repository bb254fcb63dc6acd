#include "../src/errors/error_taxonomy.hpp"
#include "../src/errors/exchange_errors.hpp"
#include "../src/venues/binance/parser.hpp"
#include "../src/venues/rest/http_client.hpp"
#include "../src/venues/rest/signing.hpp"
#include <gtest/gtest.h>

using nlohmann::json;

namespace {
    ErrorKind kind_of(long status, const std::string& body)
    {
        try {
            throw_binance_error(status, body);
        } catch (...) {
            return classify(std::current_exception());
        }
    }
}

TEST(BinanceParserTest, MarketIds)
{
    EXPECT_EQ("BTCUSDT", binance_market_id("BTC/USDT:USDT"));
    EXPECT_EQ("BTCUSDT", binance_market_id("BTC/USDT"));
    EXPECT_EQ("ETH/USDT:USDT", binance_guess_symbol("ETHUSDT", true));
    EXPECT_EQ("ETH/BTC", binance_guess_symbol("ETHBTC", false));
    EXPECT_EQ("XYZ", binance_guess_symbol("XYZ", false));
}

TEST(BinanceParserTest, FuturesMarketsKeepPerpetualsOnly)
{
    auto info = json::parse(R"({
        "symbols": [
            {"symbol": "BTCUSDT", "baseAsset": "BTC", "quoteAsset": "USDT", "marginAsset": "USDT",
             "contractType": "PERPETUAL", "status": "TRADING",
             "pricePrecision": 2, "quantityPrecision": 3,
             "filters": [
                {"filterType": "PRICE_FILTER", "tickSize": "0.10", "minPrice": "556.80", "maxPrice": "4529764"},
                {"filterType": "LOT_SIZE", "stepSize": "0.001", "minQty": "0.001", "maxQty": "1000"},
                {"filterType": "MIN_NOTIONAL", "notional": "100"}
             ]},
            {"symbol": "BTCUSDT_250328", "baseAsset": "BTC", "quoteAsset": "USDT", "marginAsset": "USDT",
             "contractType": "CURRENT_QUARTER", "status": "TRADING"},
            {"symbol": "ETHUSDT", "baseAsset": "ETH", "quoteAsset": "USDT", "marginAsset": "USDT",
             "contractType": "PERPETUAL", "status": "SETTLING",
             "pricePrecision": 2, "quantityPrecision": 3}
        ]
    })");

    auto markets = parse_binance_markets(info, true);
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
    EXPECT_DOUBLE_EQ(100.0, btc.min_cost.value_or(0));

    // No filters: falls back to decimal places.
    const auto& eth = markets[1];
    EXPECT_FALSE(eth.active);
    EXPECT_EQ(PrecisionMode::DecimalPlaces, eth.amount_precision->mode);
    EXPECT_DOUBLE_EQ(3.0, eth.amount_precision->value);
}

TEST(BinanceParserTest, SpotBalanceSkipsEmptyAssets)
{
    auto account = json::parse(R"({"balances": [
        {"asset": "BTC", "free": "0.5", "locked": "0.25"},
        {"asset": "DOGE", "free": "0.00000000", "locked": "0.00000000"}
    ]})");
    Balance b = parse_binance_balance(account, false);
    ASSERT_EQ(1u, b.total.size());
    EXPECT_DOUBLE_EQ(0.75, b.total["BTC"]);
    EXPECT_DOUBLE_EQ(0.5, b.free["BTC"]);
    EXPECT_DOUBLE_EQ(0.25, b.used["BTC"]);
}

TEST(BinanceParserTest, FuturesBalance)
{
    auto account = json::parse(R"({"assets": [
        {"asset": "USDT", "walletBalance": "1000.5", "availableBalance": "800.5"}
    ]})");
    Balance b = parse_binance_balance(account, true);
    EXPECT_DOUBLE_EQ(1000.5, b.total["USDT"]);
    EXPECT_DOUBLE_EQ(200.0, b.used["USDT"]);
}

TEST(BinanceParserTest, Order)
{
    auto j = json::parse(R"({"orderId": 28, "clientOrderId": "abc", "symbol": "BTCUSDT",
        "side": "SELL", "type": "STOP_MARKET", "origQty": "1.5", "price": "0",
        "executedQty": "0.5", "cumQuote": "30000", "avgPrice": "0.0",
        "status": "PARTIALLY_FILLED", "updateTime": 1700000000000})");
    RawOrder o = parse_binance_order(j, "BTC/USDT:USDT");
    EXPECT_EQ("28", o.id);
    EXPECT_EQ("abc", o.client_order_id.value_or(""));
    EXPECT_EQ("sell", o.side);
    EXPECT_EQ("stop_market", o.type);
    EXPECT_FALSE(o.price.has_value());
    EXPECT_DOUBLE_EQ(1.0, o.remaining.value_or(0));
    EXPECT_DOUBLE_EQ(60000.0, o.average.value_or(0));
    EXPECT_EQ("partially_filled", o.status);
    EXPECT_EQ(1700000000000, o.timestamp.value_or(0));
}

TEST(BinanceParserTest, PositionSideFromSign)
{
    auto j = json::parse(R"({"symbol": "BTCUSDT", "positionAmt": "-0.010", "positionSide": "BOTH",
        "entryPrice": "60000", "markPrice": "59000", "unRealizedProfit": "10",
        "initialMargin": "50", "notional": "-590", "leverage": "10", "marginType": "cross"})");
    RawPosition p = parse_binance_position(j, "BTC/USDT:USDT");
    EXPECT_EQ("short", p.side);
    EXPECT_DOUBLE_EQ(0.01, p.contracts.value_or(0));
    EXPECT_DOUBLE_EQ(590.0, p.notional.value_or(0));
    EXPECT_DOUBLE_EQ(20.0, p.percentage.value_or(0));
}

TEST(BinanceParserTest, OrderTypes)
{
    EXPECT_EQ("STOP_LOSS_LIMIT", binance_order_type(OrderType::StopLimit, false));
    EXPECT_EQ("STOP", binance_order_type(OrderType::StopLimit, true));
    EXPECT_EQ("STOP_MARKET", binance_order_type(OrderType::StopMarket, true));
    EXPECT_EQ("MARKET", binance_order_type(OrderType::Market, true));
}

TEST(BinanceParserTest, ErrorCodesMapOntoTaxonomy)
{
    EXPECT_EQ(ErrorKind::RateLimitExceeded, kind_of(429, R"({"code":-1003,"msg":"Too many requests"})"));
    EXPECT_EQ(ErrorKind::PermissionDenied, kind_of(401, R"({"code":-2015,"msg":"Invalid API-key, IP, or permissions for action, request ip: 1.2.3.4"})"));
    EXPECT_EQ(ErrorKind::AuthenticationError, kind_of(400, R"({"code":-1022,"msg":"Signature for this request is not valid."})"));
    EXPECT_EQ(ErrorKind::InsufficientFunds, kind_of(400, R"({"code":-2010,"msg":"Account has insufficient balance for requested action."})"));
    EXPECT_EQ(ErrorKind::InvalidOrder, kind_of(400, R"({"code":-2010,"msg":"Order would trigger immediately."})"));
    EXPECT_EQ(ErrorKind::OrderNotFound, kind_of(400, R"({"code":-2011,"msg":"Unknown order sent."})"));
    EXPECT_EQ(ErrorKind::RequestTimeout, kind_of(408, R"({"code":-1007,"msg":"Timeout"})"));
    EXPECT_EQ(ErrorKind::DDoSProtection, kind_of(418, "banned"));
    EXPECT_EQ(ErrorKind::ExchangeNotAvailable, kind_of(503, "<html>Service Unavailable</html>"));
    EXPECT_EQ(ErrorKind::ExchangeError, kind_of(400, R"({"code":-9999,"msg":"?"})"));
}

TEST(BinanceParserTest, ErrorCarriesCode)
{
    try {
        throw_binance_error(400, R"({"code":-2019,"msg":"Margin is insufficient."})");
        FAIL() << "expected InsufficientFunds";
    } catch (const InsufficientFunds& e) {
        EXPECT_EQ("-2019", e.code().value_or(""));
        EXPECT_EQ(400, e.http_status().value_or(0));
        EXPECT_STREQ("binance -2019 Margin is insufficient.", e.what());
    }
}

TEST(SigningTest, KnownVectors)
{
    EXPECT_EQ("f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8",
        hmac_sha256_hex("key", "The quick brown fox jumps over the lazy dog"));
    EXPECT_EQ("97yD9DBThCSxMpjmqm+xQ+9NWaFJRhdZl0edvC0aPNg=",
        hmac_sha256_base64("key", "The quick brown fox jumps over the lazy dog"));
    const std::string hello = "hello world";
    EXPECT_EQ("aGVsbG8gd29ybGQ=",
        base64_encode(reinterpret_cast<const unsigned char*>(hello.data()), hello.size()));
}

TEST(QueryTest, EncodesInOrder)
{
    EXPECT_EQ("symbol=BTCUSDT&side=BUY&note=a%20b%2Fc",
        build_query({{"symbol", "BTCUSDT"}, {"side", "BUY"}, {"note", "a b/c"}}));
    EXPECT_EQ("", build_query({}));
}
