#include "config/gateway_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {
    std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r");
        if (first == std::string::npos) return "";
        const auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    // Non-string JSON keeps its raw text so numeric keys survive intact.
    std::optional<std::string> env_string(const EnvLookup& env, const std::string& name) {
        auto v = env_value(env, name);
        if (!v || v->is_null()) return std::nullopt;
        if (v->is_string()) return v->get<std::string>();
        return env(name);
    }

    constexpr std::int64_t kMaxDurationMs = 86'400'000;

    // Values outside [lo, hi] are ignored so the default stays in force.
    std::optional<std::int64_t> env_int(const EnvLookup& env, const std::string& name,
        std::int64_t lo, std::int64_t hi)
    {
        auto v = env_value(env, name);
        if (!v || !v->is_number()) {
            if (v) {
                spdlog::warn("[config] {} is not a number, ignoring", name);
            }
            return std::nullopt;
        }
        const double d = v->get<double>();
        if (!std::isfinite(d) || d < static_cast<double>(lo) || d > static_cast<double>(hi)) {
            spdlog::warn("[config] {}={} outside [{}, {}], ignoring", name, v->dump(), lo, hi);
            return std::nullopt;
        }
        return static_cast<std::int64_t>(d);
    }

    std::optional<bool> env_bool(const EnvLookup& env, const std::string& name) {
        auto v = env_value(env, name);
        if (!v) return std::nullopt;
        if (v->is_boolean()) return v->get<bool>();
        if (v->is_number()) return v->get<double>() != 0.0;
        if (v->is_string()) {
            const std::string s = lower(v->get<std::string>());
            if (s == "yes" || s == "on") return true;
            if (s == "no" || s == "off") return false;
        }
        spdlog::warn("[config] {} is not a boolean, ignoring", name);
        return std::nullopt;
    }

    // First variable that is set wins.
    std::optional<bool> env_bool_any(const EnvLookup& env, std::initializer_list<std::string> names) {
        for (const auto& n : names) {
            if (auto v = env_bool(env, n)) return v;
        }
        return std::nullopt;
    }
}

std::int64_t SharedBalanceConfig::stale_max() const {
    return stale_max_ms.value_or(std::max<std::int64_t>(ttl_ms * 3, 15000));
}

std::int64_t SharedBalanceConfig::lock_ttl() const {
    return lock_ttl_ms.value_or(std::max<std::int64_t>(ttl_ms * 2, 8000));
}

std::optional<std::string> process_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (v == nullptr) {
        return std::nullopt;
    }
    return std::string(v);
}

std::optional<nlohmann::json> env_value(const EnvLookup& env, const std::string& name) {
    auto raw = env(name);
    if (!raw) {
        return std::nullopt;
    }
    auto parsed = nlohmann::json::parse(*raw, nullptr, false);
    if (parsed.is_discarded()) {
        return nlohmann::json(*raw);
    }
    return parsed;
}

std::optional<MarketType> parse_market_type(const std::string& s) {
    const std::string v = lower(s);
    if (v == "spot") return MarketType::Spot;
    if (v == "swap" || v == "perpetual") return MarketType::Swap;
    if (v == "future" || v == "futures") return MarketType::Future;
    return std::nullopt;
}

BalanceRole parse_balance_role(const std::string& s) {
    const std::string v = lower(s);
    if (v == "leader") return BalanceRole::Leader;
    if (v == "follower") return BalanceRole::Follower;
    return BalanceRole::Auto;
}

GatewayConfig load_gateway_config(const std::string& exchange, const EnvLookup& env) {
    GatewayConfig cfg;
    cfg.exchange = lower(exchange);
    const std::string ex = upper(exchange);

    if (auto v = env_string(env, ex + "_API_KEY")) cfg.api_key = *v;
    if (auto v = env_string(env, ex + "_SECRET")) cfg.secret = *v;
    else if (auto v2 = env_string(env, ex + "_API_SECRET")) cfg.secret = *v2;
    if (auto v = env_string(env, ex + "_PASSPHRASE")) cfg.passphrase = *v;
    if (auto v = env_bool_any(env, {ex + "_SANDBOX", ex + "_TESTNET"})) cfg.sandbox = *v;
    if (auto v = env_string(env, ex + "_DEFAULT_TYPE")) {
        if (auto t = parse_market_type(*v)) {
            cfg.default_type = *t;
        } else {
            spdlog::warn("[config] unknown market type '{}' for {}, keeping {}",
                *v, exchange, to_cstr(cfg.default_type));
        }
    }

    if (auto v = env_int(env, "EXCHANGE_TIMEOUT_MS", 1, kMaxDurationMs)) cfg.timeout_ms = *v;
    if (auto v = env_int(env, "EXCHANGE_MAX_RETRIES", 0, 100)) cfg.retry.max_retries = static_cast<int>(*v);
    if (auto v = env_int(env, "EXCHANGE_RETRY_DELAY_MS", 1, kMaxDurationMs)) cfg.retry.base_delay_ms = *v;

    auto& sb = cfg.shared_balance;
    if (auto v = env_bool(env, "SHARED_BALANCE_ENABLED")) sb.enabled = *v;
    if (auto v = env_string(env, "SHARED_BALANCE_ROLE")) sb.role = parse_balance_role(*v);
    if (auto v = env_int(env, "SHARED_BALANCE_TTL_MS", 1, kMaxDurationMs)) sb.ttl_ms = *v;
    if (auto v = env_int(env, "SHARED_BALANCE_STALE_MS", 1, kMaxDurationMs)) sb.stale_max_ms = *v;
    if (auto v = env_int(env, "SHARED_BALANCE_LOCK_TTL_MS", 1, kMaxDurationMs)) sb.lock_ttl_ms = *v;
    if (auto v = env_int(env, "SHARED_BALANCE_WAIT_MS", 1, kMaxDurationMs)) sb.wait_timeout_ms = *v;
    if (auto v = env_bool(env, "SHARED_BALANCE_STRICT")) {
        sb.fallback = *v ? StaleFallback::Strict : StaleFallback::Lenient;
    }

    if (auto v = env_string(env, "SHARED_BALANCE_KEY_PREFIX")) sb.key_prefix = *v;
    else if (auto v2 = env_string(env, "REDIS_PREFIX")) sb.key_prefix = *v2;
    if (auto v = env_string(env, "SHARED_BALANCE_LOCK_PREFIX")) sb.lock_key_prefix = *v;

    if (auto v = env_string(env, "REDIS_URL")) sb.redis.url = *v;
    if (auto v = env_string(env, "REDIS_HOST")) sb.redis.host = *v;
    if (auto v = env_int(env, "REDIS_PORT", 1, 65535)) sb.redis.port = static_cast<int>(*v);
    if (auto v = env_string(env, "REDIS_PASSWORD")) sb.redis.password = *v;
    if (auto v = env_int(env, "REDIS_DB", 0, 65535)) sb.redis.db = static_cast<int>(*v);

    return cfg;
}

int load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        file.open("backend/" + filepath);
        if (!file.is_open()) {
            return 0;
        }
    }

    int applied = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
            ++applied;
        }
    }
    return applied;
}
