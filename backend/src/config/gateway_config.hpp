#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "retry/retry_engine.hpp"
#include "symbols/market_info.hpp"

enum class BalanceRole { Leader, Follower, Auto };

// What an auto process does when it lost the lock and nothing fresh or
// stale-but-usable showed up: lenient serves any cached value, strict fails.
enum class StaleFallback { Lenient, Strict };

inline const char* to_cstr(BalanceRole r) {
    switch (r) {
        case BalanceRole::Leader: return "leader";
        case BalanceRole::Follower: return "follower";
        case BalanceRole::Auto: return "auto";
    }
    return "?";
}

struct RedisOptions {
    std::string url;            // redis://[:password@]host[:port][/db], wins when set
    std::string host{"localhost"};
    int port{6379};
    std::string password;
    int db{0};
    std::int64_t connect_timeout_ms{2000};
    std::int64_t command_timeout_ms{5000};
};

struct SharedBalanceConfig {
    bool enabled{false};
    BalanceRole role{BalanceRole::Auto};
    std::int64_t ttl_ms{5000};
    std::optional<std::int64_t> stale_max_ms;   // default max(ttl*3, 15000)
    std::optional<std::int64_t> lock_ttl_ms;    // default max(ttl*2, 8000)
    std::int64_t wait_timeout_ms{2000};
    std::int64_t poll_interval_ms{200};
    std::string key_prefix{"quant:"};
    std::string data_key_prefix{"balance:shared"};
    std::string lock_key_prefix{"lock:balance"};
    StaleFallback fallback{StaleFallback::Lenient};
    RedisOptions redis;

    std::int64_t stale_max() const;
    std::int64_t lock_ttl() const;
};

struct GatewayConfig {
    std::string exchange;
    std::string api_key;
    std::string secret;
    std::optional<std::string> passphrase;
    bool sandbox{false};
    MarketType default_type{MarketType::Swap};
    std::int64_t timeout_ms{30000};
    RetryPolicy retry{3, 1000};
    SharedBalanceConfig shared_balance;

    bool has_credentials() const { return !api_key.empty() && !secret.empty(); }
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
std::optional<std::string> process_env(const std::string& name);

// JSON first, raw string otherwise: "5000" -> 5000, "true" -> true, abc -> "abc".
std::optional<nlohmann::json> env_value(const EnvLookup& env, const std::string& name);

std::optional<MarketType> parse_market_type(const std::string& s);

// leader and follower are explicit; anything else is auto.
BalanceRole parse_balance_role(const std::string& s);

// Defaults overridden by <EXCHANGE>_*, EXCHANGE_*, SHARED_BALANCE_* and
// REDIS_* variables.
GatewayConfig load_gateway_config(const std::string& exchange,
    const EnvLookup& env = process_env);

// Seeds the environment from a dotenv file without overriding variables
// that are already set. Returns the number of variables applied.
int load_env_file(const std::string& filepath = ".env");
