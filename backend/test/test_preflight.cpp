#include "../src/errors/exchange_errors.hpp"
#include "../src/errors/error_taxonomy.hpp"
#include "../src/preflight/preflight_verifier.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

class PreflightTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        cfg.exchange = "binance";
        cfg.api_key = "key";
        cfg.secret = "secret";
    }

    GatewayConfig cfg;
    ManualClock clock;
    FakeConnector connector;
};

TEST(PreflightIpTest, ExtractsOffendingIp)
{
    EXPECT_EQ("203.0.113.7", extract_offending_ip("Invalid API-key, IP: 203.0.113.7, or permissions").value_or(""));
    EXPECT_EQ("10.1.2.3", extract_offending_ip("request ip 10.1.2.3 not whitelisted").value_or(""));
    EXPECT_FALSE(extract_offending_ip("Invalid API-key").has_value());
}

TEST(PreflightIpTest, Diagnosis)
{
    EXPECT_EQ(PreflightDiagnosis::IpNotWhitelisted,
        diagnose(std::make_exception_ptr(PermissionDenied("ip"))));
    EXPECT_EQ(PreflightDiagnosis::Authentication,
        diagnose(std::make_exception_ptr(AuthenticationError("key"))));
    EXPECT_EQ(PreflightDiagnosis::Network,
        diagnose(std::make_exception_ptr(RequestTimeout("slow"))));
    EXPECT_EQ(PreflightDiagnosis::Unknown,
        diagnose(std::make_exception_ptr(std::runtime_error("?"))));
}

TEST_F(PreflightTest, PassesWithCredentials)
{
    connector.on_balance = [] { return make_balance(1.0); };
    PreflightVerifier v(connector, cfg, clock);
    auto r = v.run();

    EXPECT_TRUE(r.passed());
    EXPECT_TRUE(r.network_ok);
    EXPECT_TRUE(r.api_key_ok);
    EXPECT_TRUE(r.ip_allowed);
    EXPECT_FALSE(r.auth_skipped);
    EXPECT_EQ(1'700'000'000'000, r.server_time.value_or(0));
    EXPECT_EQ(PreflightState::Passed, v.state());
    EXPECT_EQ(1, connector.balance_calls.load());
}

TEST_F(PreflightTest, SkipsAuthWithoutCredentials)
{
    cfg.api_key.clear();
    PreflightVerifier v(connector, cfg, clock);
    auto r = v.run();

    EXPECT_TRUE(r.passed());
    EXPECT_TRUE(r.auth_skipped);
    EXPECT_FALSE(r.api_key_ok);
    EXPECT_EQ(0, connector.balance_calls.load());
}

TEST_F(PreflightTest, UsesLocalClockWithoutTimeEndpoint)
{
    FakeConnector no_time({ConnectorOp::FetchBalance});
    no_time.on_balance = [] { return make_balance(1.0); };
    PreflightVerifier v(no_time, cfg, clock);
    auto r = v.run();

    EXPECT_EQ(clock.now_ms(), r.server_time.value_or(0));
    EXPECT_EQ(0, no_time.time_calls.load());
}

TEST_F(PreflightTest, ProductionIpFailureThrows)
{
    connector.on_balance = []() -> Balance {
        throw PermissionDenied("Unauthorized request, IP: 198.51.100.4", std::string("-2015"), 401);
    };
    PreflightVerifier v(connector, cfg, clock);

    try {
        v.run();
        FAIL() << "expected NormalizedError";
    } catch (const NormalizedError& e) {
        EXPECT_EQ(ErrorKind::PermissionDenied, e.kind());
        EXPECT_EQ("preflight", e.operation());
        EXPECT_EQ("-2015", e.code().value_or(""));
    }
    EXPECT_EQ(PreflightState::Failed, v.state());
}

TEST_F(PreflightTest, SandboxFailureIsReturned)
{
    cfg.sandbox = true;
    connector.on_balance = []() -> Balance {
        throw PermissionDenied("Unauthorized request, IP: 198.51.100.4");
    };
    PreflightVerifier v(connector, cfg, clock);
    auto r = v.run();

    EXPECT_FALSE(r.passed());
    EXPECT_EQ(PreflightState::Failed, r.state);
    EXPECT_EQ(PreflightDiagnosis::IpNotWhitelisted, r.diagnosis);
    EXPECT_EQ("198.51.100.4", r.offending_ip.value_or(""));
    EXPECT_TRUE(r.network_ok);
    EXPECT_FALSE(r.api_key_ok);
    EXPECT_TRUE(r.cause != nullptr);
}

TEST_F(PreflightTest, NetworkFailureOnTimeEndpoint)
{
    cfg.sandbox = true;
    connector.on_time = []() -> std::int64_t { throw ExchangeNotAvailable("502"); };
    PreflightVerifier v(connector, cfg, clock);
    auto r = v.run();

    EXPECT_EQ(PreflightDiagnosis::Network, r.diagnosis);
    EXPECT_FALSE(r.network_ok);
    EXPECT_EQ(0, connector.balance_calls.load());
}

TEST_F(PreflightTest, ForeignThrowIsRecordedAsFailure)
{
    cfg.sandbox = true;
    connector.on_balance = []() -> Balance { throw 42; };
    PreflightVerifier v(connector, cfg, clock);
    auto r = v.run();

    EXPECT_EQ(PreflightState::Failed, r.state);
    EXPECT_EQ(PreflightState::Failed, v.state());
    EXPECT_EQ(PreflightDiagnosis::Unknown, r.diagnosis);
    EXPECT_EQ("Unknown error", r.error);
    EXPECT_TRUE(r.network_ok);

    cfg.sandbox = false;
    PreflightVerifier strict(connector, cfg, clock);
    try {
        strict.run();
        FAIL() << "expected NormalizedError";
    } catch (const NormalizedError& e) {
        EXPECT_EQ(ErrorKind::UnknownError, e.kind());
        EXPECT_EQ(PreflightState::Failed, strict.state());
    }
}
