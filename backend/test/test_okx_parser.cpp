#include "../src/errors/error_taxonomy.hpp"
#include "../src/errors/exchange_errors.hpp"
#include "../src/venues/okx/okx_connector.hpp"
#include "../src/venues/okx/parser.hpp"
#include <gtest/gtest.h>

using nlohmann::json;

namespace {
    ErrorKind kind_of(long status, const std::string& body)
    {
        try {
            okx_unwrap(status, body);
        } catch (...) {
            return classify(std::current_exception());
        }
        ADD_FAILURE() << "expected a throw for " << body;
        return ErrorKind::UnknownError;
    }
}

TEST(OkxParserTest, InstrumentIds)
{
    EXPECT_EQ("BTC-USDT-SWAP", okx_inst_id("BTC/USDT:USDT"));
    EXPECT_EQ("BTC-USDT", okx_inst_id("BTC/USDT"));
    EXPECT_EQ("BTC/USDT:USDT", okx_symbol("BTC-USDT-SWAP"));
    EXPECT_EQ("BTC/USD:BTC", okx_symbol("BTC-USD-SWAP"));
    EXPECT_EQ("ETH/USDT", okx_symbol("ETH-USDT"));
    EXPECT_EQ("BTC-USD-SWAP", okx_inst_id(okx_symbol("BTC-USD-SWAP")));
}

TEST(OkxParserTest, Bars)
{
    EXPECT_EQ("1H", okx_bar("1h"));
    EXPECT_EQ("4H", okx_bar("4h"));
    EXPECT_EQ("1D", okx_bar("1d"));
    EXPECT_EQ("1m", okx_bar("1m"));
    EXPECT_EQ("1M", okx_bar("1M"));
}

TEST(OkxParserTest, SwapInstruments)
{
    auto data = json::parse(R"([
        {"instType": "SWAP", "instId": "BTC-USDT-SWAP", "settleCcy": "USDT", "ctVal": "0.01",
         "tickSz": "0.1", "lotSz": "1", "minSz": "1", "maxLmtSz": "100000000", "state": "live"},
        {"instType": "SWAP", "instId": "ETH-USD-SWAP", "settleCcy": "ETH", "ctVal": "10",
         "tickSz": "0.01", "lotSz": "1", "minSz": "1", "state": "suspend"},
        {"instType": "FUTURES", "instId": "BTC-USD-250328"}
    ])");
    auto markets = parse_okx_instruments(data);
    ASSERT_EQ(2u, markets.size());

    const auto& btc = markets[0];
    EXPECT_EQ("BTC/USDT:USDT", btc.symbol);
    EXPECT_EQ("BTC-USDT-SWAP", btc.id);
    EXPECT_EQ(MarketType::Swap, btc.type);
    EXPECT_DOUBLE_EQ(0.01, btc.contract_size);
    EXPECT_TRUE(btc.active);
    // A lot size of 1 is a tick, not zero decimals.
    EXPECT_EQ(PrecisionMode::TickSize, btc.amount_precision->mode);
    EXPECT_DOUBLE_EQ(1.0, btc.amount_precision->value);
    EXPECT_DOUBLE_EQ(0.1, btc.price_precision->value);

    EXPECT_EQ("ETH/USD:ETH", markets[1].symbol);
    EXPECT_FALSE(markets[1].active);
}

TEST(OkxParserTest, SpotInstruments)
{
    auto data = json::parse(R"([{"instType": "SPOT", "instId": "ETH-USDT", "baseCcy": "ETH",
        "quoteCcy": "USDT", "tickSz": "0.01", "lotSz": "0.000001", "minSz": "0.0001", "state": "live"}])");
    auto markets = parse_okx_instruments(data);
    ASSERT_EQ(1u, markets.size());
    EXPECT_EQ("ETH/USDT", markets[0].symbol);
    EXPECT_EQ(MarketType::Spot, markets[0].type);
    EXPECT_TRUE(markets[0].settle.empty());
}

TEST(OkxParserTest, Balance)
{
    auto data = json::parse(R"([{"totalEq": "1200", "details": [
        {"ccy": "USDT", "eq": "1000", "availBal": "750", "frozenBal": "250"},
        {"ccy": "BTC", "cashBal": "0.1"}
    ]}])");
    Balance b = parse_okx_balance(data);
    EXPECT_DOUBLE_EQ(1000.0, b.total["USDT"]);
    EXPECT_DOUBLE_EQ(750.0, b.free["USDT"]);
    EXPECT_DOUBLE_EQ(250.0, b.used["USDT"]);
    EXPECT_DOUBLE_EQ(0.1, b.total["BTC"]);
    EXPECT_DOUBLE_EQ(0.1, b.free["BTC"]);
    EXPECT_DOUBLE_EQ(0.0, b.used["BTC"]);
}

TEST(OkxParserTest, Order)
{
    auto j = json::parse(R"({"instId": "BTC-USDT-SWAP", "ordId": "312269865356374016",
        "clOrdId": "", "side": "buy", "ordType": "limit", "sz": "2", "px": "60000",
        "accFillSz": "0.5", "avgPx": "59990", "state": "live", "cTime": "1700000000000",
        "fee": "-0.01", "feeCcy": "USDT"})");
    RawOrder o = parse_okx_order(j);
    EXPECT_EQ("312269865356374016", o.id);
    EXPECT_FALSE(o.client_order_id.has_value());
    EXPECT_EQ("BTC/USDT:USDT", o.symbol);
    EXPECT_EQ("open", o.status);
    EXPECT_DOUBLE_EQ(60000.0, o.price.value_or(0));
    EXPECT_DOUBLE_EQ(0.5, o.filled.value_or(0));
    EXPECT_DOUBLE_EQ(29995.0, o.cost.value_or(0));
    ASSERT_TRUE(o.fee.has_value());
    EXPECT_DOUBLE_EQ(0.01, o.fee->cost);
    EXPECT_EQ(1700000000000, o.timestamp.value_or(0));
}

TEST(OkxParserTest, NetModePosition)
{
    auto j = json::parse(R"({"instId": "ETH-USDT-SWAP", "pos": "-3", "posSide": "net",
        "avgPx": "2000", "lever": "5", "upl": "12", "uplRatio": "0.05", "mgnMode": "isolated",
        "margin": "120", "imr": "", "notionalUsd": "6000"})");
    RawPosition p = parse_okx_position(j);
    EXPECT_EQ("ETH/USDT:USDT", p.symbol);
    EXPECT_EQ("short", p.side);
    EXPECT_DOUBLE_EQ(3.0, p.contracts.value_or(0));
    EXPECT_DOUBLE_EQ(5.0, p.percentage.value_or(0));
    EXPECT_EQ("isolated", p.margin_mode);
    EXPECT_DOUBLE_EQ(120.0, p.collateral.value_or(0));
    EXPECT_FALSE(p.initial_margin.has_value());
}

TEST(OkxParserTest, CandlesComeOutOldestFirst)
{
    auto data = json::parse(R"([
        ["1700003600000", "2", "3", "1", "2.5", "10"],
        ["1700000000000", "1", "2", "0.5", "2", "20"]
    ])");
    auto candles = parse_okx_candles(data);
    ASSERT_EQ(2u, candles.size());
    EXPECT_EQ(1700000000000, candles[0].timestamp);
    EXPECT_DOUBLE_EQ(20.0, candles[0].volume);
    EXPECT_DOUBLE_EQ(2.5, candles[1].close);
}

TEST(OkxParserTest, TickerPercentage)
{
    auto j = json::parse(R"({"last": "110", "open24h": "100", "bidPx": "109.9", "askPx": "110.1", "ts": "1"})");
    Ticker t = parse_okx_ticker(j, "BTC/USDT:USDT");
    EXPECT_DOUBLE_EQ(10.0, t.percentage.value_or(0));
    EXPECT_DOUBLE_EQ(109.9, t.bid.value_or(0));
}

TEST(OkxParserTest, UnwrapReturnsData)
{
    auto data = okx_unwrap(200, R"({"code": "0", "msg": "", "data": [{"ts": "1700000000000"}]})");
    ASSERT_TRUE(data.is_array());
    EXPECT_EQ("1700000000000", data[0]["ts"].get<std::string>());
}

TEST(OkxParserTest, ErrorCodesMapOntoTaxonomy)
{
    EXPECT_EQ(ErrorKind::PermissionDenied,
        kind_of(401, R"({"code": "50110", "msg": "Invalid IP 203.0.113.9", "data": []})"));
    EXPECT_EQ(ErrorKind::AuthenticationError,
        kind_of(401, R"({"code": "50113", "msg": "Invalid Sign", "data": []})"));
    EXPECT_EQ(ErrorKind::RateLimitExceeded,
        kind_of(429, R"({"code": "50011", "msg": "Too Many Requests", "data": []})"));
    EXPECT_EQ(ErrorKind::ExchangeNotAvailable,
        kind_of(503, R"({"code": "50001", "msg": "Service temporarily unavailable", "data": []})"));
    EXPECT_EQ(ErrorKind::RequestTimeout,
        kind_of(200, R"({"code": "50004", "msg": "Endpoint request timeout", "data": []})"));
    EXPECT_EQ(ErrorKind::ExchangeNotAvailable, kind_of(502, "Bad Gateway"));
}

TEST(OkxParserTest, OperationFailuresUseItemCode)
{
    EXPECT_EQ(ErrorKind::InsufficientFunds, kind_of(200, R"({"code": "1", "msg": "Operation failed.",
        "data": [{"ordId": "", "sCode": "51008", "sMsg": "Order failed. Insufficient balance"}]})"));
    EXPECT_EQ(ErrorKind::OrderNotFound, kind_of(200, R"({"code": "1", "msg": "",
        "data": [{"ordId": "1", "sCode": "51400", "sMsg": "Cancellation failed"}]})"));
    EXPECT_EQ(ErrorKind::InvalidOrder, kind_of(200, R"({"code": "1", "msg": "",
        "data": [{"sCode": "51121", "sMsg": "Order quantity must be a multiple of the lot size"}]})"));
}

TEST(OkxSigningTest, TimestampAndSignature)
{
    EXPECT_EQ("2020-12-08T09:08:57.715Z", okx_timestamp(1607418537715));
    EXPECT_EQ("HiZhvSfMtWJA3uUIVXV3a/bSXNPCWvYFXoGCVS8V4zY=",
        okx_sign("22582BD0CFF14C41EDBF1AB98506286D", "2020-12-08T09:08:57.715Z",
            "GET", "/api/v5/account/balance?ccy=BTC", ""));
}
