#include "store/shared_store.hpp"

#include <mutex>
#include <unordered_map>

namespace
{
    struct Entry
    {
        std::string value;
        std::int64_t expires_at_ms{0};
    };
}

class MemorySharedStore final : public ISharedStore
{
    mutable std::mutex mtx_;
    std::unordered_map<std::string, Entry> entries_;
    IClock &clock_;

    // Caller holds mtx_.
    Entry *live(const std::string &key)
    {
        auto it = entries_.find(key);
        if (it == entries_.end())
            return nullptr;
        if (it->second.expires_at_ms <= clock_.now_ms())
        {
            entries_.erase(it);
            return nullptr;
        }
        return &it->second;
    }

public:
    explicit MemorySharedStore(IClock &clock) : clock_(clock) {}

    std::optional<std::string> get(const std::string &key) override
    {
        std::scoped_lock lk(mtx_);
        Entry *e = live(key);
        if (!e)
            return std::nullopt;
        return e->value;
    }

    void set(const std::string &key, const std::string &value, std::int64_t px_ms) override
    {
        std::scoped_lock lk(mtx_);
        entries_[key] = Entry{value, clock_.now_ms() + px_ms};
    }

    bool set_if_absent(const std::string &key, const std::string &value, std::int64_t px_ms) override
    {
        std::scoped_lock lk(mtx_);
        if (live(key))
            return false;
        entries_[key] = Entry{value, clock_.now_ms() + px_ms};
        return true;
    }

    bool compare_and_delete(const std::string &key, const std::string &expected) override
    {
        std::scoped_lock lk(mtx_);
        Entry *e = live(key);
        if (!e || e->value != expected)
            return false;
        entries_.erase(key);
        return true;
    }

    void ping() override {}
};

std::shared_ptr<ISharedStore> make_memory_shared_store(IClock &clock)
{
    return std::make_shared<MemorySharedStore>(clock);
}
