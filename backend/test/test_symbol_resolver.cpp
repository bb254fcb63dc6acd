#include "../src/errors/gateway_error.hpp"
#include "../src/symbols/symbol_resolver.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

class SymbolResolverTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        resolver.load({
            make_market("BTC/USDT:USDT", MarketType::Swap),
            make_market("ETH/USDT:USDT", MarketType::Swap),
            make_market("ETH/USDT", MarketType::Spot),
            make_market("BTC/USD:BTC", MarketType::Swap),
        });
    }

    SymbolResolver resolver{MarketType::Swap};
};

TEST_F(SymbolResolverTest, SpotRequestResolvesToPerpetual)
{
    EXPECT_EQ("BTC/USDT:USDT", resolver.resolve("BTC/USDT"));
}

TEST_F(SymbolResolverTest, ExactMatchWins)
{
    EXPECT_EQ("ETH/USDT", resolver.resolve("ETH/USDT"));
    EXPECT_EQ("ETH/USDT:USDT", resolver.resolve("ETH/USDT:USDT"));
}

TEST_F(SymbolResolverTest, DerivativeFallsBackToSpot)
{
    SymbolResolver spot{MarketType::Spot};
    spot.load({make_market("SOL/USDT", MarketType::Spot)});
    EXPECT_EQ("SOL/USDT", spot.resolve("SOL/USDT:USDT"));
}

TEST_F(SymbolResolverTest, UnknownPassesThrough)
{
    EXPECT_EQ("DOGE/USDT", resolver.resolve("DOGE/USDT"));
    EXPECT_EQ("", resolver.resolve(""));
}

TEST_F(SymbolResolverTest, Idempotent)
{
    for (const char* s : {"BTC/USDT", "ETH/USDT", "DOGE/USDT", "BTC/USD:BTC"}) {
        const auto once = resolver.resolve(s);
        EXPECT_EQ(once, resolver.resolve(once)) << s;
    }
}

TEST_F(SymbolResolverTest, ValidateThrowsForUnknown)
{
    EXPECT_NO_THROW(resolver.validate("BTC/USDT"));
    EXPECT_NO_THROW(resolver.validate("BTC/USDT:USDT"));
    try {
        resolver.validate("DOGE/USDT");
        FAIL() << "expected GatewayError";
    } catch (const GatewayError& e) {
        EXPECT_EQ(GatewayErrorCode::InvalidSymbol, e.code());
        EXPECT_STREQ("Invalid symbol: DOGE/USDT", e.what());
    }
}

TEST(SymbolResolverLightweightTest, SwapDefaultAppendsSettle)
{
    SymbolResolver r{MarketType::Swap};
    ASSERT_TRUE(r.lightweight());
    EXPECT_EQ("BTC/USDT:USDT", r.resolve("BTC/USDT"));
    EXPECT_EQ("BTC/USDT:USDT", r.resolve("BTC/USDT:USDT"));
    EXPECT_NO_THROW(r.validate("ANY/THING"));
}

TEST(SymbolResolverLightweightTest, SpotDefaultStripsSettle)
{
    SymbolResolver r{MarketType::Spot};
    EXPECT_EQ("BTC/USDT", r.resolve("BTC/USDT:USDT"));
    EXPECT_EQ("BTC/USDT", r.resolve("BTC/USDT"));
}

TEST(SymbolResolverLightweightTest, ClearReturnsToLightweight)
{
    SymbolResolver r{MarketType::Swap};
    r.load({make_market("BTC/USDT:USDT", MarketType::Swap)});
    EXPECT_FALSE(r.lightweight());
    r.clear();
    EXPECT_TRUE(r.lightweight());
}
