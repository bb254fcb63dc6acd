#include "../src/errors/error_taxonomy.hpp"
#include "../src/errors/exchange_errors.hpp"
#include <gtest/gtest.h>

namespace {
    template <typename E>
    std::exception_ptr make(const std::string& msg = "boom") {
        return std::make_exception_ptr(E(msg));
    }
}

TEST(ErrorTaxonomyTest, ClassifiesMostDerivedFirst)
{
    EXPECT_EQ(ErrorKind::PermissionDenied, classify(make<PermissionDenied>()));
    EXPECT_EQ(ErrorKind::AuthenticationError, classify(make<AuthenticationError>()));
    EXPECT_EQ(ErrorKind::OrderNotFound, classify(make<OrderNotFound>()));
    EXPECT_EQ(ErrorKind::InvalidOrder, classify(make<InvalidOrder>()));
    EXPECT_EQ(ErrorKind::InsufficientFunds, classify(make<InsufficientFunds>()));
    EXPECT_EQ(ErrorKind::RateLimitExceeded, classify(make<RateLimitExceeded>()));
    EXPECT_EQ(ErrorKind::DDoSProtection, classify(make<DDoSProtection>()));
    EXPECT_EQ(ErrorKind::RequestTimeout, classify(make<RequestTimeout>()));
    EXPECT_EQ(ErrorKind::ExchangeNotAvailable, classify(make<ExchangeNotAvailable>()));
    EXPECT_EQ(ErrorKind::NetworkError, classify(make<NetworkError>()));
    EXPECT_EQ(ErrorKind::ExchangeError, classify(make<ExchangeError>()));
    // No kind of its own.
    EXPECT_EQ(ErrorKind::ExchangeError, classify(make<BadSymbol>()));
}

TEST(ErrorTaxonomyTest, ForeignFailuresAreUnknown)
{
    EXPECT_EQ(ErrorKind::UnknownError, classify(std::make_exception_ptr(std::runtime_error("x"))));
    EXPECT_EQ(ErrorKind::UnknownError, classify(std::make_exception_ptr(42)));
    EXPECT_EQ(ErrorKind::UnknownError, classify(nullptr));
}

TEST(ErrorTaxonomyTest, RetryableKinds)
{
    EXPECT_TRUE(is_retryable_kind(ErrorKind::NetworkError));
    EXPECT_TRUE(is_retryable_kind(ErrorKind::RequestTimeout));
    EXPECT_TRUE(is_retryable_kind(ErrorKind::ExchangeNotAvailable));
    EXPECT_TRUE(is_retryable_kind(ErrorKind::DDoSProtection));
    EXPECT_TRUE(is_retryable_kind(ErrorKind::RateLimitExceeded));

    EXPECT_FALSE(is_retryable_kind(ErrorKind::AuthenticationError));
    EXPECT_FALSE(is_retryable_kind(ErrorKind::PermissionDenied));
    EXPECT_FALSE(is_retryable_kind(ErrorKind::InsufficientFunds));
    EXPECT_FALSE(is_retryable_kind(ErrorKind::InvalidOrder));
    EXPECT_FALSE(is_retryable_kind(ErrorKind::OrderNotFound));
    EXPECT_FALSE(is_retryable_kind(ErrorKind::ExchangeError));
    EXPECT_FALSE(is_retryable_kind(ErrorKind::UnknownError));
}

TEST(ErrorTaxonomyTest, ShouldRetryStopsAtBudget)
{
    EXPECT_TRUE(should_retry(ErrorKind::NetworkError, 1, 3));
    EXPECT_TRUE(should_retry(ErrorKind::NetworkError, 2, 3));
    EXPECT_FALSE(should_retry(ErrorKind::NetworkError, 3, 3));
    EXPECT_FALSE(should_retry(ErrorKind::NetworkError, 7, 3));
    EXPECT_FALSE(should_retry(ErrorKind::AuthenticationError, 1, 3));
}

TEST(ErrorTaxonomyTest, NormalizeCarriesCodeAndStatus)
{
    auto cause = std::make_exception_ptr(
        RateLimitExceeded("slow down", std::string("-1003"), 429));
    NormalizedError err = normalize_error(cause, "binance", "fetch balance", 1, 3);

    EXPECT_EQ(ErrorKind::RateLimitExceeded, err.kind());
    EXPECT_STREQ("slow down", err.what());
    EXPECT_EQ("binance", err.exchange());
    EXPECT_EQ("fetch balance", err.operation());
    ASSERT_TRUE(err.code().has_value());
    EXPECT_EQ("-1003", *err.code());
    EXPECT_EQ(429, err.http_status().value_or(0));
    EXPECT_TRUE(err.retryable());
    EXPECT_GT(err.timestamp(), 0);
    EXPECT_TRUE(err.cause() != nullptr);
}

TEST(ErrorTaxonomyTest, NormalizeOutsideRetryLoopReducesToKind)
{
    auto net = normalize_error(std::make_exception_ptr(NetworkError("down")), "okx", "connect");
    EXPECT_FALSE(net.retryable());

    auto unknown = normalize_error(std::make_exception_ptr(std::runtime_error("")), "okx", "connect");
    EXPECT_EQ(ErrorKind::UnknownError, unknown.kind());
    EXPECT_STREQ("Unknown error", unknown.what());
    EXPECT_FALSE(unknown.code().has_value());
}

TEST(ErrorTaxonomyTest, NormalizedErrorKeepsItsKindWhenWrappedAgain)
{
    auto inner = normalize_error(std::make_exception_ptr(InsufficientFunds("no money")), "okx", "order");
    auto outer = normalize_error(std::make_exception_ptr(inner), "okx", "connect");
    EXPECT_EQ(ErrorKind::InsufficientFunds, outer.kind());
}

TEST(ErrorTaxonomyTest, KindNames)
{
    EXPECT_STREQ("NETWORK_ERROR", to_cstr(ErrorKind::NetworkError));
    EXPECT_STREQ("AUTHENTICATION_ERROR", to_cstr(ErrorKind::AuthenticationError));
    EXPECT_STREQ("UNKNOWN_ERROR", to_cstr(ErrorKind::UnknownError));
}
