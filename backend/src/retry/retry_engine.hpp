#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include "errors/error_taxonomy.hpp"
#include "util/clock.hpp"

constexpr std::int64_t kMaxBackoffMs = 30000;

struct RetryPolicy {
    int max_retries{3};
    std::int64_t base_delay_ms{1000};
};

enum class RetryOutcome { Pending, Success, Exhausted, NonRetryable };

inline const char* to_cstr(RetryOutcome o) {
    switch (o) {
        case RetryOutcome::Pending: return "pending";
        case RetryOutcome::Success: return "success";
        case RetryOutcome::Exhausted: return "exhausted";
        case RetryOutcome::NonRetryable: return "non_retryable";
    }
    return "?";
}

// Payload of the gateway "retry" event.
struct RetryEvent {
    std::string operation;
    int attempt{0};
    int max_retries{0};
    std::int64_t delay_ms{0};
    std::string error;
};

class RetryEngine {
public:
    using RandomSource = std::function<double()>;   // uniform in [0, 1)
    using RetryHook = std::function<void(const RetryEvent&)>;
    using FailureHook = std::function<void(const NormalizedError&)>;

    RetryEngine(std::string exchange, RetryPolicy policy, IClock& clock,
        RandomSource random = {});

    void set_retry_hook(RetryHook hook) { on_retry_ = std::move(hook); }
    void set_failure_hook(FailureHook hook) { on_failure_ = std::move(hook); }

    // Runs fn until it succeeds, the taxonomy says stop, or the attempt
    // budget max(1, max_retries) is spent. Failures leave as NormalizedError.
    template <typename Fn>
    auto execute(Fn&& fn, const std::string& label) -> std::invoke_result_t<Fn&> {
        last_outcome_ = RetryOutcome::Pending;
        const int budget = policy_.max_retries < 1 ? 1 : policy_.max_retries;
        for (int attempt = 1; attempt <= budget; ++attempt) {
            std::exception_ptr cause;
            try {
                if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
                    fn();
                    last_outcome_ = RetryOutcome::Success;
                    return;
                } else {
                    auto result = fn();
                    last_outcome_ = RetryOutcome::Success;
                    return result;
                }
            } catch (...) {
                cause = std::current_exception();
            }
            const ErrorKind kind = classify(cause);
            if (!should_retry(kind, attempt, policy_.max_retries)) {
                give_up(cause, label, attempt);
            }
            backoff(cause, label, attempt);
        }
        throw std::logic_error("retry loop left without outcome: " + label);
    }

    // Pre-jitter delay for an attempt (1-based), capped at kMaxBackoffMs.
    static std::int64_t base_backoff(const RetryPolicy& policy, int attempt);

    // base·2^(attempt-1) plus up to 25% jitter, capped at kMaxBackoffMs.
    std::int64_t jittered_backoff(int attempt) const;

    RetryOutcome last_outcome() const { return last_outcome_; }
    const RetryPolicy& policy() const { return policy_; }
    const std::string& exchange() const { return exchange_; }

private:
    [[noreturn]] void give_up(const std::exception_ptr& cause,
        const std::string& label, int attempt);
    void backoff(const std::exception_ptr& cause, const std::string& label, int attempt);

    std::string exchange_;
    RetryPolicy policy_;
    IClock& clock_;
    RandomSource random_;
    RetryHook on_retry_;
    FailureHook on_failure_;
    RetryOutcome last_outcome_{RetryOutcome::Pending};
};
