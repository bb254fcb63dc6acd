#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "balance/balance_coordinator.hpp"
#include "balance/shared_balance_cache.hpp"
#include "config/gateway_config.hpp"
#include "gateway/gateway_events.hpp"
#include "gateway/gateway_types.hpp"
#include "preflight/preflight_verifier.hpp"
#include "retry/retry_engine.hpp"
#include "store/shared_store.hpp"
#include "symbols/precision.hpp"
#include "symbols/symbol_resolver.hpp"
#include "util/clock.hpp"
#include "venues/exchange_connector.hpp"

struct ConnectOptions {
    bool load_markets{true};
    bool skip_preflight{false};
};

// Uniform trading surface over one exchange connector. Every connector call
// goes through the retry engine; symbols are resolved and order sizes are
// truncated to the venue's precision before they leave.
//
// Driven from one thread at a time.
class ExchangeGateway {
public:
    ExchangeGateway(GatewayConfig cfg, std::unique_ptr<IExchangeConnector> connector,
        IClock& clock = SystemClock::instance(), RetryEngine::RandomSource random = {});
    ~ExchangeGateway();

    ExchangeGateway(const ExchangeGateway&) = delete;
    ExchangeGateway& operator=(const ExchangeGateway&) = delete;

    // Store for shared balance mode. When unset, the process-wide Redis
    // client is acquired on the first balance fetch.
    void set_shared_store(std::shared_ptr<ISharedStore> store) { shared_store_ = std::move(store); }

    void add_listener(GatewayListener listener);

    void connect(ConnectOptions options = {});
    void close();
    void disconnect() { close(); }

    Balance fetch_balance();
    std::vector<UnifiedPosition> fetch_positions(const std::vector<std::string>& symbols = {});
    FundingRate fetch_funding_rate(const std::string& symbol);

    UnifiedOrder create_order(const std::string& symbol, OrderSide side, OrderType type,
        double amount, std::optional<double> price = std::nullopt,
        const nlohmann::json& params = nlohmann::json::object());
    // Text side/type as collaborators send them; throws InvalidSide/InvalidType.
    UnifiedOrder create_order(const std::string& symbol, const std::string& side,
        const std::string& type, double amount, std::optional<double> price = std::nullopt,
        const nlohmann::json& params = nlohmann::json::object());

    UnifiedOrder cancel_order(const std::string& id, const std::string& symbol);
    CancelAllResult cancel_all_orders(const std::string& symbol);
    UnifiedOrder fetch_order(const std::string& id, const std::string& symbol);
    std::vector<UnifiedOrder> fetch_open_orders(const std::optional<std::string>& symbol = std::nullopt);

    std::vector<Candle> fetch_ohlcv(const std::string& symbol, const std::string& timeframe = "1h",
        std::optional<std::int64_t> since = std::nullopt, int limit = 100);
    Ticker fetch_ticker(const std::string& symbol);
    nlohmann::json set_leverage(int leverage, const std::string& symbol);

    // nullptr for unknown symbols and in lightweight mode.
    const PrecisionInfo* get_precision(const std::string& symbol) const;

    const std::string& name() const { return name_; }
    bool is_connected() const { return connected_; }
    bool shared_balance_active() const { return coordinator_ != nullptr; }
    const std::vector<MarketInfo>& markets() const { return markets_; }
    const std::optional<PreflightResult>& last_preflight() const { return preflight_; }
    const GatewayConfig& config() const { return cfg_; }
    const SymbolResolver& resolver() const { return resolver_; }

private:
    void ensure_connected() const;
    std::string valid_symbol(const std::string& symbol) const;
    void require(ConnectorOp op, const char* what) const;

    Balance fetch_balance_direct();
    BalanceCoordinator* coordinator();

    template <typename Event, typename Callback>
    void emit(const char* name, const Event& ev, Callback GatewayListener::*callback);

    GatewayConfig cfg_;
    std::unique_ptr<IExchangeConnector> connector_;
    IClock& clock_;
    std::string name_;
    RetryEngine retry_;
    SymbolResolver resolver_;
    PrecisionTable precisions_;
    std::vector<MarketInfo> markets_;
    std::vector<GatewayListener> listeners_;
    std::optional<PreflightResult> preflight_;
    bool connected_{false};

    std::shared_ptr<ISharedStore> shared_store_;
    std::unique_ptr<SharedBalanceCache> shared_cache_;
    std::unique_ptr<BalanceCoordinator> coordinator_;
    bool shared_disabled_{false};
};
