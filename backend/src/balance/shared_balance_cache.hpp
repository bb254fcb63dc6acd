#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "config/gateway_config.hpp"
#include "gateway/gateway_types.hpp"
#include "store/shared_store.hpp"
#include "util/clock.hpp"

struct CachedBalance {
    Balance balance;
    std::int64_t cached_at{0};
    std::int64_t age_ms{0};     // derived on read, never stored
};

// Balance snapshots shared across processes through an ISharedStore, with
// an in-process front cache that only answers while its copy is fresh.
//
// Keys: {prefix}{data_prefix}:{exchange} holds {"balance", "cachedAt"} for
// stale_max ms; {prefix}{lock_prefix}:{exchange} holds the lock token for
// lock_ttl ms. Exchange names are lower-cased.
class SharedBalanceCache {
public:
    SharedBalanceCache(std::shared_ptr<ISharedStore> store, const SharedBalanceConfig& cfg,
        IClock& clock = SystemClock::instance());

    // Fresh local copy first, then the store. Corrupt payloads read as a miss.
    std::optional<CachedBalance> get(const std::string& exchange);
    void set(const std::string& exchange, const Balance& balance);

    // Token on success, nullopt when another holder has the lock.
    std::optional<std::string> acquire_lock(const std::string& exchange);
    // True when our token was still in place and got deleted.
    bool release_lock(const std::string& exchange, const std::string& token);

    // Polls every poll_interval until a record no older than fresh_ms shows
    // up or wait_ms elapses. Defaults: wait_timeout and ttl.
    std::optional<CachedBalance> wait_for_fresh(const std::string& exchange,
        std::optional<std::int64_t> wait_ms = std::nullopt,
        std::optional<std::int64_t> fresh_ms = std::nullopt);

    std::string balance_key(const std::string& exchange) const;
    std::string lock_key(const std::string& exchange) const;

    std::int64_t ttl_ms() const { return ttl_ms_; }
    std::int64_t stale_max_ms() const { return stale_max_ms_; }
    std::int64_t lock_ttl_ms() const { return lock_ttl_ms_; }
    std::int64_t wait_timeout_ms() const { return wait_timeout_ms_; }

    ISharedStore& store() { return *store_; }

private:
    struct LocalRecord {
        Balance balance;
        std::int64_t cached_at{0};
    };

    std::string make_token();

    std::shared_ptr<ISharedStore> store_;
    IClock& clock_;
    std::string key_prefix_;
    std::string data_key_prefix_;
    std::string lock_key_prefix_;
    std::int64_t ttl_ms_;
    std::int64_t stale_max_ms_;
    std::int64_t lock_ttl_ms_;
    std::int64_t wait_timeout_ms_;
    std::int64_t poll_interval_ms_;

    std::mutex local_mtx_;
    std::unordered_map<std::string, LocalRecord> local_;
};

// "quant" -> "quant:", "" stays empty.
std::string normalize_key_prefix(const std::string& prefix);
