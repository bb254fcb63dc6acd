#include "balance/balance_coordinator.hpp"

#include <spdlog/spdlog.h>

#include "errors/gateway_error.hpp"

namespace {
    // Releases the balance lock when the fetch leaves scope, success or not.
    // Release is best effort: the lock TTL bounds what a failed release costs.
    class LockGuard {
    public:
        LockGuard(SharedBalanceCache& cache, std::string exchange, std::string token)
            : cache_(cache), exchange_(std::move(exchange)), token_(std::move(token)) {}

        ~LockGuard() {
            try {
                if (!cache_.release_lock(exchange_, token_)) {
                    spdlog::warn("[shared-balance] lock for {} expired before release", exchange_);
                }
            } catch (const std::exception& e) {
                spdlog::warn("[shared-balance] lock release for {} failed: {}", exchange_, e.what());
            }
        }

        LockGuard(const LockGuard&) = delete;
        LockGuard& operator=(const LockGuard&) = delete;

    private:
        SharedBalanceCache& cache_;
        std::string exchange_;
        std::string token_;
    };
}

BalanceCoordinator::BalanceCoordinator(SharedBalanceCache& cache, std::string exchange,
    BalanceRole role, StaleFallback fallback)
    : cache_(cache)
    , exchange_(std::move(exchange))
    , role_(role)
    , fallback_(fallback) {}

void BalanceCoordinator::unavailable(const char* why) const {
    spdlog::error("[{}] shared balance cache unavailable ({}, role {})",
        exchange_, why, to_cstr(role_));
    throw GatewayError(GatewayErrorCode::CacheUnavailable,
        "[" + exchange_ + "] Shared balance cache unavailable");
}

Balance BalanceCoordinator::publish(const FetchFn& direct) {
    Balance balance = direct();
    try {
        cache_.set(exchange_, balance);
    } catch (const StoreError& e) {
        // Other processes miss this write and fetch on their own.
        spdlog::warn("[{}] fetched balance not shared: {}", exchange_, e.what());
    }
    return balance;
}

Balance BalanceCoordinator::fetch_locked(const std::string& token, const FetchFn& direct) {
    LockGuard guard(cache_, exchange_, token);
    return publish(direct);
}

Balance BalanceCoordinator::fetch(const FetchFn& direct) {
    if (role_ == BalanceRole::Leader) {
        return publish(direct);
    }

    const auto cached = cache_.get(exchange_);
    if (cached && cached->age_ms <= cache_.ttl_ms()) {
        return cached->balance;
    }
    const bool usable = cached && cached->age_ms <= cache_.stale_max_ms();

    if (role_ == BalanceRole::Follower) {
        if (usable) {
            return cached->balance;
        }
        if (auto waited = cache_.wait_for_fresh(exchange_)) {
            return waited->balance;
        }
        unavailable("no fresh write within wait timeout");
    }

    if (auto token = cache_.acquire_lock(exchange_)) {
        return fetch_locked(*token, direct);
    }
    if (usable) {
        return cached->balance;
    }
    if (auto waited = cache_.wait_for_fresh(exchange_)) {
        return waited->balance;
    }
    if (auto token = cache_.acquire_lock(exchange_)) {
        return fetch_locked(*token, direct);
    }
    if (cached && fallback_ == StaleFallback::Lenient) {
        spdlog::warn("[{}] serving balance cached {}ms ago, lock still held elsewhere",
            exchange_, cached->age_ms);
        return cached->balance;
    }
    unavailable("lock held elsewhere and nothing cached");
}
