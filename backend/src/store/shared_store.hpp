#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "util/clock.hpp"

// Store unreachable or answered with a protocol error.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Key-value store shared by every process that coordinates on a balance.
// All writes carry a millisecond expiry.
class ISharedStore {
public:
    virtual ~ISharedStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value, std::int64_t px_ms) = 0;

    // SET NX PX. True when this call created the key.
    virtual bool set_if_absent(const std::string& key, const std::string& value,
        std::int64_t px_ms) = 0;

    // Atomically deletes key only if it still holds expected.
    virtual bool compare_and_delete(const std::string& key, const std::string& expected) = 0;

    // Throws StoreError when the store cannot be reached.
    virtual void ping() = 0;
};

// In-process store with clock-driven expiry. Thread safe.
std::shared_ptr<ISharedStore> make_memory_shared_store(IClock& clock = SystemClock::instance());
