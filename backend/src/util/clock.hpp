#pragma once

#include <chrono>
#include <cstdint>
#include <thread>

// Wall clock in epoch milliseconds plus a blocking sleep. Injected so that
// retry backoff and cache ageing can be driven by tests.
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::int64_t now_ms() const = 0;
    virtual void sleep_ms(std::int64_t ms) = 0;
};

class SystemClock final : public IClock {
public:
    static SystemClock& instance() {
        static SystemClock clock;
        return clock;
    }

    std::int64_t now_ms() const override {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    void sleep_ms(std::int64_t ms) override {
        if (ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
    }
};
