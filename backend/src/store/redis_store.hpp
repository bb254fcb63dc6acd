#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "config/gateway_config.hpp"
#include "store/resp.hpp"
#include "store/shared_store.hpp"

// redis://[user][:password@]host[:port][/db]. Fields missing from the URL
// keep their value from base. Throws std::invalid_argument on a bad URL.
RedisOptions parse_redis_url(const std::string& url, RedisOptions base = {});

// Shared store on a Redis server, spoken over RESP2 on one blocking TCP
// connection. Connects on first use and reconnects after an I/O failure.
class RedisSharedStore final : public ISharedStore {
public:
    // Process-wide client, created on first call. Later calls return the
    // same client whatever options they pass.
    static std::shared_ptr<RedisSharedStore> acquire(const RedisOptions& options);

    // Drops the process-wide client. Call once at process exit.
    static void shutdown();

    explicit RedisSharedStore(RedisOptions options);
    ~RedisSharedStore() override;

    RedisSharedStore(const RedisSharedStore&) = delete;
    RedisSharedStore& operator=(const RedisSharedStore&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::int64_t px_ms) override;
    bool set_if_absent(const std::string& key, const std::string& value,
        std::int64_t px_ms) override;
    bool compare_and_delete(const std::string& key, const std::string& expected) override;
    void ping() override;

    void disconnect();
    const RedisOptions& options() const { return options_; }

private:
    // Caller holds mtx_.
    void ensure_connected();
    RespValue roundtrip(const std::vector<std::string>& args);
    void run_io(std::int64_t timeout_ms, const char* what);
    void close_socket();

    RespValue command(const std::vector<std::string>& args);

    RedisOptions options_;
    std::mutex mtx_;
    boost::asio::io_context io_;
    std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
    std::string rbuf_;
};
