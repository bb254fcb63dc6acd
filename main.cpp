#include <cstdio>
#include <exception>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "config/gateway_config.hpp"
#include "errors/error_taxonomy.hpp"
#include "gateway/gateway_factory.hpp"
#include "store/redis_store.hpp"
#include "venues/venue_registry.hpp"

namespace {
    void usage() {
        fmt::print(stderr,
            "usage: gateway_probe <exchange> [--lightweight] [--skip-preflight] [--symbol S]\n"
            "       gateway_probe --list\n");
    }

    void print_balance(const Balance& b) {
        fmt::print("balance @ {} ({})\n", b.timestamp, b.exchange);
        for (const auto& [ccy, total] : b.total) {
            if (total == 0.0) continue;
            auto free = b.free.count(ccy) ? b.free.at(ccy) : 0.0;
            auto used = b.used.count(ccy) ? b.used.at(ccy) : 0.0;
            fmt::print("  {:<8} total={:<16g} free={:<16g} used={:g}\n", ccy, total, free, used);
        }
    }

    void print_ticker(const Ticker& t) {
        fmt::print("{} last={} bid={} ask={}\n", t.symbol,
            t.last.value_or(0.0), t.bid.value_or(0.0), t.ask.value_or(0.0));
    }
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        usage();
        return 2;
    }
    if (args[0] == "--list") {
        for (const auto& n : VenueRegistry::instance().list_names()) {
            fmt::print("{}\n", n);
        }
        return 0;
    }

    const std::string exchange = args[0];
    ConnectOptions options;
    std::optional<std::string> symbol;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--lightweight") {
            options.load_markets = false;
        } else if (args[i] == "--skip-preflight") {
            options.skip_preflight = true;
        } else if (args[i] == "--symbol" && i + 1 < args.size()) {
            symbol = args[++i];
        } else {
            usage();
            return 2;
        }
    }

    if (const int n = load_env_file(); n > 0) {
        spdlog::info("[setup] loaded {} variables from .env", n);
    }

    int rc = 0;
    try {
        auto gateway = GatewayInstances::instance().get(load_gateway_config(exchange));
        gateway->add_listener(GatewayListener{
            .on_retry = [](const RetryEvent& ev) {
                spdlog::info("[probe] retry {} {}/{} in {}ms", ev.operation,
                    ev.attempt, ev.max_retries, ev.delay_ms);
            },
        });

        gateway->connect(options);
        if (const auto& pf = gateway->last_preflight()) {
            spdlog::info("[probe] preflight {} ({})", to_cstr(pf->state), to_cstr(pf->diagnosis));
        }
        spdlog::info("[probe] {} markets, shared balance {}", gateway->markets().size(),
            gateway->config().shared_balance.enabled ? "on" : "off");

        if (gateway->config().has_credentials()) {
            print_balance(gateway->fetch_balance());
        }
        if (symbol) {
            print_ticker(gateway->fetch_ticker(*symbol));
            if (const auto* p = gateway->get_precision(gateway->resolver().resolve(*symbol))) {
                fmt::print("  precision price={} amount={} min_amount={}\n",
                    p->price.value, p->amount.value, p->min_amount);
            }
        }
    } catch (const NormalizedError& e) {
        spdlog::error("[probe] {} {}: {}", to_cstr(e.kind()), e.operation(), e.what());
        rc = 1;
    } catch (const std::exception& e) {
        spdlog::error("[probe] {}", e.what());
        rc = 1;
    }

    GatewayInstances::instance().destroy_all();
    RedisSharedStore::shutdown();
    return rc;
}
