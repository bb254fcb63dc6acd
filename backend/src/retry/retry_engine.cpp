#include "retry/retry_engine.hpp"

#include <algorithm>
#include <cmath>
#include <random>

#include <spdlog/spdlog.h>

namespace {
    double default_random() {
        thread_local std::mt19937_64 gen{std::random_device{}()};
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(gen);
    }

    double raw_backoff(std::int64_t base_delay_ms, int attempt) {
        const int exp = std::max(0, attempt - 1);
        return static_cast<double>(base_delay_ms) * std::pow(2.0, exp);
    }
}

RetryEngine::RetryEngine(std::string exchange, RetryPolicy policy, IClock& clock,
    RandomSource random)
    : exchange_(std::move(exchange))
    , policy_(policy)
    , clock_(clock)
    , random_(random ? std::move(random) : RandomSource(default_random)) {}

std::int64_t RetryEngine::base_backoff(const RetryPolicy& policy, int attempt) {
    const double delay = raw_backoff(policy.base_delay_ms, attempt);
    return static_cast<std::int64_t>(std::min(delay, static_cast<double>(kMaxBackoffMs)));
}

std::int64_t RetryEngine::jittered_backoff(int attempt) const {
    const double base = raw_backoff(policy_.base_delay_ms, attempt);
    double u = random_();
    u = std::clamp(u, 0.0, 1.0);
    const double delay = base + base * u * 0.25;
    return static_cast<std::int64_t>(std::min(delay, static_cast<double>(kMaxBackoffMs)));
}

void RetryEngine::give_up(const std::exception_ptr& cause, const std::string& label, int attempt) {
    NormalizedError err = normalize_error(cause, exchange_, label, attempt, policy_.max_retries);
    last_outcome_ = is_retryable_kind(err.kind())
        ? RetryOutcome::Exhausted
        : RetryOutcome::NonRetryable;

    spdlog::error("[{}] {} failed after {} attempt(s) ({}, {}): {}",
        exchange_, label, attempt, to_cstr(err.kind()), to_cstr(last_outcome_), err.what());

    if (on_failure_) {
        on_failure_(err);
    }
    throw err;
}

void RetryEngine::backoff(const std::exception_ptr& cause, const std::string& label, int attempt) {
    RetryEvent ev;
    ev.operation = label;
    ev.attempt = attempt;
    ev.max_retries = policy_.max_retries;
    ev.delay_ms = jittered_backoff(attempt);
    ev.error = error_message(cause);

    spdlog::warn("[{}] {} failed (attempt {}/{}), retrying in {}ms: {}",
        exchange_, label, attempt, policy_.max_retries, ev.delay_ms, ev.error);

    if (on_retry_) {
        on_retry_(ev);
    }
    clock_.sleep_ms(ev.delay_ms);
}
