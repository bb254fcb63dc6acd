#include "balance/shared_balance_cache.hpp"

#include <algorithm>
#include <cctype>
#include <random>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {
    std::string exchange_key(const std::string& exchange) {
        std::string key = exchange.empty() ? "unknown" : exchange;
        std::transform(key.begin(), key.end(), key.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return key;
    }

    std::string to_base36(std::uint64_t v) {
        static const char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        std::string out;
        do {
            out.push_back(kDigits[v % 36]);
            v /= 36;
        } while (v != 0);
        std::reverse(out.begin(), out.end());
        return out;
    }
}

std::string normalize_key_prefix(const std::string& prefix) {
    if (prefix.empty()) return prefix;
    return prefix.back() == ':' ? prefix : prefix + ":";
}

SharedBalanceCache::SharedBalanceCache(std::shared_ptr<ISharedStore> store,
    const SharedBalanceConfig& cfg, IClock& clock)
    : store_(std::move(store))
    , clock_(clock)
    , key_prefix_(normalize_key_prefix(cfg.key_prefix))
    , data_key_prefix_(cfg.data_key_prefix)
    , lock_key_prefix_(cfg.lock_key_prefix)
    , ttl_ms_(cfg.ttl_ms)
    , stale_max_ms_(cfg.stale_max())
    , lock_ttl_ms_(cfg.lock_ttl())
    , wait_timeout_ms_(cfg.wait_timeout_ms)
    , poll_interval_ms_(cfg.poll_interval_ms > 0 ? cfg.poll_interval_ms : 200) {}

std::string SharedBalanceCache::balance_key(const std::string& exchange) const {
    return key_prefix_ + data_key_prefix_ + ":" + exchange_key(exchange);
}

std::string SharedBalanceCache::lock_key(const std::string& exchange) const {
    return key_prefix_ + lock_key_prefix_ + ":" + exchange_key(exchange);
}

std::optional<CachedBalance> SharedBalanceCache::get(const std::string& exchange) {
    const std::string ex = exchange_key(exchange);
    const std::int64_t now = clock_.now_ms();
    {
        std::scoped_lock lk(local_mtx_);
        auto it = local_.find(ex);
        if (it != local_.end() && now - it->second.cached_at <= ttl_ms_) {
            return CachedBalance{it->second.balance, it->second.cached_at, now - it->second.cached_at};
        }
    }

    auto raw = store_->get(balance_key(ex));
    if (!raw) {
        return std::nullopt;
    }

    auto parsed = nlohmann::json::parse(*raw, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() ||
        !parsed.contains("cachedAt") || !parsed["cachedAt"].is_number() ||
        !parsed.contains("balance") || !parsed["balance"].is_object()) {
        spdlog::warn("[shared-balance] ignoring malformed record at {}", balance_key(ex));
        return std::nullopt;
    }

    LocalRecord rec;
    try {
        rec.balance = parsed["balance"].get<Balance>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("[shared-balance] ignoring malformed balance at {}: {}", balance_key(ex), e.what());
        return std::nullopt;
    }
    rec.cached_at = parsed["cachedAt"].get<std::int64_t>();
    {
        std::scoped_lock lk(local_mtx_);
        local_[ex] = rec;
    }
    return CachedBalance{rec.balance, rec.cached_at, clock_.now_ms() - rec.cached_at};
}

void SharedBalanceCache::set(const std::string& exchange, const Balance& balance) {
    const std::string ex = exchange_key(exchange);
    const std::int64_t now = clock_.now_ms();
    nlohmann::json payload = {
        {"balance", balance},
        {"cachedAt", now},
    };
    {
        std::scoped_lock lk(local_mtx_);
        local_[ex] = LocalRecord{balance, now};
    }
    store_->set(balance_key(ex), payload.dump(), stale_max_ms_);
}

std::string SharedBalanceCache::make_token() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    return std::to_string(clock_.now_ms()) + "-" + to_base36(gen());
}

std::optional<std::string> SharedBalanceCache::acquire_lock(const std::string& exchange) {
    std::string token = make_token();
    if (store_->set_if_absent(lock_key(exchange), token, lock_ttl_ms_)) {
        return token;
    }
    return std::nullopt;
}

bool SharedBalanceCache::release_lock(const std::string& exchange, const std::string& token) {
    return store_->compare_and_delete(lock_key(exchange), token);
}

std::optional<CachedBalance> SharedBalanceCache::wait_for_fresh(const std::string& exchange,
    std::optional<std::int64_t> wait_ms, std::optional<std::int64_t> fresh_ms)
{
    const std::int64_t wait = std::max<std::int64_t>(0, wait_ms.value_or(wait_timeout_ms_));
    const std::int64_t fresh = fresh_ms.value_or(ttl_ms_);
    const std::int64_t deadline = clock_.now_ms() + wait;

    while (clock_.now_ms() < deadline) {
        auto record = get(exchange);
        if (record && record->age_ms <= fresh) {
            return record;
        }
        clock_.sleep_ms(poll_interval_ms_);
    }
    return std::nullopt;
}
