#include "store/redis_store.hpp"

#include <array>
#include <chrono>
#include <stdexcept>

#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>

using tcp = boost::asio::ip::tcp;

namespace {
    // Deletes the lock only while it still holds our token.
    const char* const kReleaseScript =
        "if redis.call(\"get\",KEYS[1]) == ARGV[1] then "
        "return redis.call(\"del\",KEYS[1]) "
        "else return 0 end";

    std::mutex g_instance_mtx;
    std::shared_ptr<RedisSharedStore> g_instance;
}

RedisOptions parse_redis_url(const std::string& url, RedisOptions base) {
    static const std::string kScheme = "redis://";
    if (url.rfind(kScheme, 0) != 0) {
        throw std::invalid_argument("unsupported redis url: " + url);
    }
    RedisOptions out = base;
    out.url = url;
    std::string rest = url.substr(kScheme.size());

    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        const std::string db = rest.substr(slash + 1);
        if (!db.empty()) {
            try {
                out.db = std::stoi(db);
            } catch (const std::exception&) {
                throw std::invalid_argument("bad redis db in url: " + url);
            }
        }
        rest = rest.substr(0, slash);
    }

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        const std::string userinfo = rest.substr(0, at);
        auto colon = userinfo.find(':');
        if (colon != std::string::npos) {
            out.password = userinfo.substr(colon + 1);
        }
        rest = rest.substr(at + 1);
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        try {
            out.port = std::stoi(rest.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("bad redis port in url: " + url);
        }
        rest = rest.substr(0, colon);
    }
    if (!rest.empty()) {
        out.host = rest;
    }
    return out;
}

std::shared_ptr<RedisSharedStore> RedisSharedStore::acquire(const RedisOptions& options) {
    std::scoped_lock lk(g_instance_mtx);
    if (!g_instance) {
        RedisOptions effective = options.url.empty() ? options : parse_redis_url(options.url, options);
        g_instance = std::make_shared<RedisSharedStore>(std::move(effective));
    }
    return g_instance;
}

void RedisSharedStore::shutdown() {
    std::shared_ptr<RedisSharedStore> inst;
    {
        std::scoped_lock lk(g_instance_mtx);
        inst.swap(g_instance);
    }
    if (inst) {
        inst->disconnect();
        spdlog::info("[redis] shared client shut down");
    }
}

RedisSharedStore::RedisSharedStore(RedisOptions options)
    : options_(std::move(options)) {}

RedisSharedStore::~RedisSharedStore() {
    close_socket();
}

void RedisSharedStore::disconnect() {
    std::scoped_lock lk(mtx_);
    close_socket();
}

void RedisSharedStore::close_socket() {
    if (socket_) {
        boost::system::error_code ignored;
        socket_->close(ignored);
        socket_.reset();
    }
    rbuf_.clear();
}

void RedisSharedStore::run_io(std::int64_t timeout_ms, const char* what) {
    io_.restart();
    io_.run_for(std::chrono::milliseconds(timeout_ms));
    if (!io_.stopped()) {
        // Pending operation overran: cancel it and let its handler run.
        if (socket_) {
            boost::system::error_code ignored;
            socket_->close(ignored);
        }
        io_.restart();
        io_.run();
        close_socket();
        throw StoreError(std::string("redis ") + what + " timed out");
    }
}

void RedisSharedStore::ensure_connected() {
    if (socket_) {
        return;
    }

    boost::system::error_code ec;
    tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port), ec);
    if (ec) {
        throw StoreError("redis resolve " + options_.host + ": " + ec.message());
    }

    socket_ = std::make_unique<tcp::socket>(io_);
    ec = boost::asio::error::would_block;
    boost::asio::async_connect(*socket_, endpoints,
        [&ec](const boost::system::error_code& e, const tcp::endpoint&) { ec = e; });
    run_io(options_.connect_timeout_ms, "connect");
    if (ec) {
        close_socket();
        throw StoreError("redis connect " + options_.host + ":" +
            std::to_string(options_.port) + ": " + ec.message());
    }
    spdlog::info("[redis] connected to {}:{} db {}", options_.host, options_.port, options_.db);

    if (!options_.password.empty()) {
        RespValue r = roundtrip({"AUTH", options_.password});
        if (r.is_error()) {
            close_socket();
            throw StoreError("redis AUTH failed: " + r.str);
        }
    }
    if (options_.db != 0) {
        RespValue r = roundtrip({"SELECT", std::to_string(options_.db)});
        if (r.is_error()) {
            close_socket();
            throw StoreError("redis SELECT failed: " + r.str);
        }
    }
}

RespValue RedisSharedStore::roundtrip(const std::vector<std::string>& args) {
    const std::string payload = encode_command(args);

    boost::system::error_code ec = boost::asio::error::would_block;
    boost::asio::async_write(*socket_, boost::asio::buffer(payload),
        [&ec](const boost::system::error_code& e, std::size_t) { ec = e; });
    run_io(options_.command_timeout_ms, "write");
    if (ec) {
        close_socket();
        throw StoreError("redis write: " + ec.message());
    }

    std::array<char, 4096> chunk{};
    while (true) {
        std::size_t pos = 0;
        std::optional<RespValue> value;
        try {
            value = parse_resp(rbuf_, pos);
        } catch (const StoreError&) {
            // Stream is out of sync; only a fresh connection recovers.
            close_socket();
            throw;
        }
        if (value) {
            rbuf_.erase(0, pos);
            return *value;
        }

        std::size_t n = 0;
        ec = boost::asio::error::would_block;
        socket_->async_read_some(boost::asio::buffer(chunk),
            [&ec, &n](const boost::system::error_code& e, std::size_t bytes) {
                ec = e;
                n = bytes;
            });
        run_io(options_.command_timeout_ms, "read");
        if (ec) {
            close_socket();
            throw StoreError("redis read: " + ec.message());
        }
        rbuf_.append(chunk.data(), n);
    }
}

RespValue RedisSharedStore::command(const std::vector<std::string>& args) {
    std::scoped_lock lk(mtx_);
    ensure_connected();
    RespValue r = roundtrip(args);
    if (r.is_error()) {
        throw StoreError("redis " + args.front() + ": " + r.str);
    }
    return r;
}

std::optional<std::string> RedisSharedStore::get(const std::string& key) {
    RespValue r = command({"GET", key});
    if (r.is_null()) {
        return std::nullopt;
    }
    return r.str;
}

void RedisSharedStore::set(const std::string& key, const std::string& value, std::int64_t px_ms) {
    command({"SET", key, value, "PX", std::to_string(px_ms)});
}

bool RedisSharedStore::set_if_absent(const std::string& key, const std::string& value,
    std::int64_t px_ms)
{
    RespValue r = command({"SET", key, value, "PX", std::to_string(px_ms), "NX"});
    return r.type == RespValue::Type::SimpleString && r.str == "OK";
}

bool RedisSharedStore::compare_and_delete(const std::string& key, const std::string& expected) {
    RespValue r = command({"EVAL", kReleaseScript, "1", key, expected});
    return r.type == RespValue::Type::Integer && r.integer == 1;
}

void RedisSharedStore::ping() {
    RespValue r = command({"PING"});
    if (r.str != "PONG") {
        throw StoreError("redis PING answered '" + r.str + "'");
    }
}
