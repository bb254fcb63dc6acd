#pragma once

#include <functional>
#include <optional>
#include <string>

#include "balance/shared_balance_cache.hpp"
#include "config/gateway_config.hpp"

// Decides, per role, whether this process may hit the exchange for a
// balance or has to make do with what the shared cache holds.
//
//   leader    fetch on every call and publish
//   follower  never fetch: fresh, stale-but-usable, wait, else fail
//   auto      fetch only while holding the lock; otherwise read the cache,
//             wait, try the lock once more, then fall back per StaleFallback
class BalanceCoordinator {
public:
    using FetchFn = std::function<Balance()>;

    BalanceCoordinator(SharedBalanceCache& cache, std::string exchange,
        BalanceRole role, StaleFallback fallback = StaleFallback::Lenient);

    // Throws GatewayError(CacheUnavailable) when the role forbids fetching
    // and nothing usable is cached. Errors from direct propagate unchanged.
    Balance fetch(const FetchFn& direct);

    BalanceRole role() const { return role_; }

private:
    Balance publish(const FetchFn& direct);
    Balance fetch_locked(const std::string& token, const FetchFn& direct);
    [[noreturn]] void unavailable(const char* why) const;

    SharedBalanceCache& cache_;
    std::string exchange_;
    BalanceRole role_;
    StaleFallback fallback_;
};
