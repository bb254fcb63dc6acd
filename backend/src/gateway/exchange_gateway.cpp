#include "gateway/exchange_gateway.hpp"

#include <cmath>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "errors/gateway_error.hpp"
#include "gateway/order_normalizer.hpp"
#include "store/redis_store.hpp"

namespace {
    bool positive_finite(double v) {
        return std::isfinite(v) && v > 0;
    }

    ErrorEvent make_error_event(const char* type, const NormalizedError& err) {
        ErrorEvent ev;
        ev.type = type;
        ev.operation = err.operation();
        ev.exchange = err.exchange();
        ev.kind = err.kind();
        ev.error = err.what();
        ev.code = err.code();
        ev.http_status = err.http_status();
        ev.retryable = err.retryable();
        ev.timestamp = err.timestamp();
        ev.cause = err.cause();
        return ev;
    }
}

ExchangeGateway::ExchangeGateway(GatewayConfig cfg, std::unique_ptr<IExchangeConnector> connector,
    IClock& clock, RetryEngine::RandomSource random)
    : cfg_(std::move(cfg))
    , connector_(std::move(connector))
    , clock_(clock)
    , name_(cfg_.exchange.empty() ? connector_->name() : cfg_.exchange)
    , retry_(name_, cfg_.retry, clock_, std::move(random))
    , resolver_(cfg_.default_type)
{
    retry_.set_retry_hook([this](const RetryEvent& ev) {
        emit(kEventRetry, ev, &GatewayListener::on_retry);
    });
    retry_.set_failure_hook([this](const NormalizedError& err) {
        emit(kEventError, make_error_event("request", err), &GatewayListener::on_error);
    });
}

ExchangeGateway::~ExchangeGateway() = default;

template <typename Event, typename Callback>
void ExchangeGateway::emit(const char* name, const Event& ev, Callback GatewayListener::*callback) {
    for (const auto& listener : listeners_) {
        const auto& cb = listener.*callback;
        if (cb) {
            cb(ev);
        }
        if (listener.on_event) {
            listener.on_event(name, nlohmann::json(ev));
        }
    }
}

void ExchangeGateway::add_listener(GatewayListener listener) {
    listeners_.push_back(std::move(listener));
}

void ExchangeGateway::ensure_connected() const {
    if (!connected_) {
        throw GatewayError(GatewayErrorCode::NotConnected,
            "[" + name_ + "] not connected, call connect() first");
    }
}

std::string ExchangeGateway::valid_symbol(const std::string& symbol) const {
    std::string resolved = resolver_.resolve(symbol);
    resolver_.validate(resolved);
    return resolved;
}

void ExchangeGateway::require(ConnectorOp op, const char* what) const {
    if (!connector_->supports(op)) {
        throw GatewayError(GatewayErrorCode::Unsupported,
            fmt::format("[{}] exchange does not support {}", name_, what));
    }
}

void ExchangeGateway::connect(ConnectOptions options) {
    if (connected_) {
        spdlog::info("[{}] already connected", name_);
        return;
    }
    spdlog::info("[{}] connecting ({}, {})", name_, cfg_.sandbox ? "sandbox" : "production",
        to_cstr(cfg_.default_type));

    try {
        if (!options.skip_preflight) {
            PreflightVerifier verifier(*connector_, cfg_, clock_);
            preflight_ = verifier.run();
        }

        if (options.load_markets) {
            markets_ = retry_.execute([this] { return connector_->load_markets(); }, "load markets");
            resolver_.load(markets_);
            precisions_ = PrecisionTable::from_markets(markets_);
            spdlog::info("[{}] connected, {} markets loaded", name_, markets_.size());
        } else {
            markets_.clear();
            resolver_.clear();
            precisions_ = PrecisionTable();
            spdlog::info("[{}] lightweight mode connected, markets not loaded", name_);
        }
    } catch (const std::exception&) {
        NormalizedError err = normalize_error(std::current_exception(), name_, "connect");
        spdlog::error("[{}] connect failed: {}", name_, err.what());
        emit(kEventError, make_error_event("connect", err), &GatewayListener::on_error);
        throw err;
    }

    connected_ = true;
    emit(kEventConnected, ConnectedEvent{name_, !options.load_markets},
        &GatewayListener::on_connected);
}

void ExchangeGateway::close() {
    spdlog::info("[{}] closing connection", name_);
    connected_ = false;
    connector_->close();
    emit(kEventDisconnected, DisconnectedEvent{name_}, &GatewayListener::on_disconnected);
}

BalanceCoordinator* ExchangeGateway::coordinator() {
    if (!cfg_.shared_balance.enabled || shared_disabled_) {
        return nullptr;
    }
    if (coordinator_) {
        return coordinator_.get();
    }

    try {
        if (!shared_store_) {
            shared_store_ = RedisSharedStore::acquire(cfg_.shared_balance.redis);
        }
        shared_store_->ping();
    } catch (const std::exception& e) {
        // A follower has no direct path; it fails until the store is back.
        if (cfg_.shared_balance.role == BalanceRole::Follower) {
            spdlog::error("[{}] shared balance store unreachable, follower cannot fetch: {}",
                name_, e.what());
            throw GatewayError(GatewayErrorCode::CacheUnavailable,
                "[" + name_ + "] Shared balance cache unavailable");
        }
        shared_disabled_ = true;
        spdlog::warn("[{}] shared balance disabled: {}", name_, e.what());
        return nullptr;
    }

    shared_cache_ = std::make_unique<SharedBalanceCache>(shared_store_, cfg_.shared_balance, clock_);
    coordinator_ = std::make_unique<BalanceCoordinator>(*shared_cache_, name_,
        cfg_.shared_balance.role, cfg_.shared_balance.fallback);
    spdlog::info("[{}] shared balance enabled, role {}", name_, to_cstr(cfg_.shared_balance.role));
    return coordinator_.get();
}

Balance ExchangeGateway::fetch_balance_direct() {
    return retry_.execute([this] {
        Balance balance = connector_->fetch_balance();
        balance.exchange = name_;
        balance.timestamp = clock_.now_ms();
        return balance;
    }, "fetch balance");
}

Balance ExchangeGateway::fetch_balance() {
    ensure_connected();
    if (BalanceCoordinator* coord = coordinator()) {
        return coord->fetch([this] { return fetch_balance_direct(); });
    }
    return fetch_balance_direct();
}

std::vector<UnifiedPosition> ExchangeGateway::fetch_positions(const std::vector<std::string>& symbols) {
    ensure_connected();
    if (!connector_->supports(ConnectorOp::FetchPositions)) {
        spdlog::warn("[{}] exchange does not support fetchPositions", name_);
        return {};
    }

    std::vector<std::string> resolved;
    resolved.reserve(symbols.size());
    for (const auto& s : symbols) {
        resolved.push_back(resolver_.resolve(s));
    }

    return retry_.execute([&] {
        std::vector<UnifiedPosition> out;
        for (const auto& raw : connector_->fetch_positions(resolved)) {
            if (!is_flat(raw)) {
                out.push_back(normalize_position(raw, name_));
            }
        }
        return out;
    }, "fetch positions");
}

FundingRate ExchangeGateway::fetch_funding_rate(const std::string& symbol) {
    ensure_connected();
    const std::string valid = valid_symbol(symbol);
    require(ConnectorOp::FetchFundingRate, "fetchFundingRate");

    return retry_.execute([&] {
        FundingRate rate = connector_->fetch_funding_rate(valid);
        rate.exchange = name_;
        rate.timestamp = clock_.now_ms();
        return rate;
    }, "fetch funding rate: " + symbol);
}

UnifiedOrder ExchangeGateway::create_order(const std::string& symbol, const std::string& side,
    const std::string& type, double amount, std::optional<double> price,
    const nlohmann::json& params)
{
    auto parsed_side = parse_order_side(side);
    if (!parsed_side) {
        throw GatewayError(GatewayErrorCode::InvalidSide,
            fmt::format("[{}] invalid side '{}', expected buy or sell", name_, side));
    }
    auto parsed_type = parse_order_type(type);
    if (!parsed_type) {
        throw GatewayError(GatewayErrorCode::InvalidType,
            fmt::format("[{}] invalid order type '{}'", name_, type));
    }
    return create_order(symbol, *parsed_side, *parsed_type, amount, price, params);
}

UnifiedOrder ExchangeGateway::create_order(const std::string& symbol, OrderSide side, OrderType type,
    double amount, std::optional<double> price, const nlohmann::json& params)
{
    ensure_connected();
    const std::string valid = valid_symbol(symbol);

    if (!positive_finite(amount)) {
        throw GatewayError(GatewayErrorCode::InvalidAmount,
            fmt::format("[{}] amount must be a positive number, got {}", name_, amount));
    }
    const bool needs_price = type == OrderType::Limit || type == OrderType::StopLimit;
    if ((needs_price && !price) || (price && !positive_finite(*price))) {
        throw GatewayError(GatewayErrorCode::InvalidPrice,
            fmt::format("[{}] {} order needs a positive price", name_, to_cstr(type)));
    }

    OrderRequest req;
    req.symbol = valid;
    req.side = side;
    req.type = type;
    req.amount = precisions_.adjust_amount(valid, amount);
    if (price) {
        req.price = precisions_.adjust_price(valid, *price);
    }
    req.params = params;

    if (req.amount <= 0) {
        throw GatewayError(GatewayErrorCode::InvalidAmount,
            fmt::format("[{}] amount {} truncates to zero at {} precision", name_, amount, valid));
    }

    spdlog::info("[{}] creating order: {} {} {} amount={} price={}", name_, valid, to_cstr(side),
        to_cstr(type), req.amount, req.price ? fmt::format("{}", *req.price) : "market");

    const std::string label = fmt::format("create order: {} {} {}", valid, to_cstr(side), to_cstr(type));
    UnifiedOrder order = retry_.execute([&] {
        return normalize_order(connector_->create_order(req), name_);
    }, label);
    if (order.symbol.empty()) {
        order.symbol = valid;
    }

    spdlog::info("[{}] order created: {}", name_, order.id);
    emit(kEventOrderCreated, order, &GatewayListener::on_order_created);
    return order;
}

UnifiedOrder ExchangeGateway::cancel_order(const std::string& id, const std::string& symbol) {
    ensure_connected();
    const std::string resolved = resolver_.resolve(symbol);
    spdlog::info("[{}] canceling order: {}", name_, id);

    UnifiedOrder order = retry_.execute([&] {
        return normalize_order(connector_->cancel_order(id, resolved), name_);
    }, "cancel order: " + id);

    spdlog::info("[{}] order canceled: {}", name_, id);
    emit(kEventOrderCanceled, order, &GatewayListener::on_order_canceled);
    return order;
}

CancelAllResult ExchangeGateway::cancel_all_orders(const std::string& symbol) {
    ensure_connected();
    const std::string valid = valid_symbol(symbol);
    spdlog::info("[{}] canceling all orders: {}", name_, valid);

    CancelAllResult result = retry_.execute([&] {
        CancelAllResult r;
        r.symbol = valid;
        r.exchange = name_;
        r.timestamp = clock_.now_ms();

        if (connector_->supports(ConnectorOp::CancelAllOrders)) {
            for (const auto& raw : connector_->cancel_all_orders(valid)) {
                r.orders.push_back(CancelOutcome{raw.id, true, "canceled", ""});
            }
            r.canceled_count = static_cast<int>(r.orders.size());
            return r;
        }

        // No batch endpoint: cancel one by one and record each outcome.
        for (const auto& open : connector_->fetch_open_orders(valid)) {
            try {
                connector_->cancel_order(open.id, valid);
                ++r.canceled_count;
                r.orders.push_back(CancelOutcome{open.id, true, "canceled", ""});
            } catch (const std::exception& e) {
                ++r.failed_count;
                r.orders.push_back(CancelOutcome{open.id, false, "failed", e.what()});
                spdlog::warn("[{}] cancel of {} failed: {}", name_, open.id, e.what());
            }
        }
        return r;
    }, "cancel all orders: " + symbol);

    spdlog::info("[{}] canceled {} orders", name_, result.canceled_count);
    if (result.failed_count > 0) {
        spdlog::warn("[{}] {} orders failed to cancel", name_, result.failed_count);
    }
    emit(kEventAllOrdersCanceled, result, &GatewayListener::on_all_orders_canceled);
    return result;
}

UnifiedOrder ExchangeGateway::fetch_order(const std::string& id, const std::string& symbol) {
    ensure_connected();
    const std::string resolved = resolver_.resolve(symbol);
    return retry_.execute([&] {
        return normalize_order(connector_->fetch_order(id, resolved), name_);
    }, "fetch order: " + id);
}

std::vector<UnifiedOrder> ExchangeGateway::fetch_open_orders(const std::optional<std::string>& symbol) {
    ensure_connected();
    std::optional<std::string> resolved;
    if (symbol) {
        resolved = resolver_.resolve(*symbol);
    }
    return retry_.execute([&] {
        std::vector<UnifiedOrder> out;
        for (const auto& raw : connector_->fetch_open_orders(resolved)) {
            out.push_back(normalize_order(raw, name_));
        }
        return out;
    }, "fetch open orders: " + symbol.value_or("all"));
}

std::vector<Candle> ExchangeGateway::fetch_ohlcv(const std::string& symbol, const std::string& timeframe,
    std::optional<std::int64_t> since, int limit)
{
    ensure_connected();
    const std::string valid = valid_symbol(symbol);
    return retry_.execute([&] {
        return connector_->fetch_ohlcv(valid, timeframe, since, limit);
    }, fmt::format("fetch ohlcv: {} {}", valid, timeframe));
}

Ticker ExchangeGateway::fetch_ticker(const std::string& symbol) {
    ensure_connected();
    const std::string valid = valid_symbol(symbol);
    return retry_.execute([&] { return connector_->fetch_ticker(valid); },
        "fetch ticker: " + valid);
}

nlohmann::json ExchangeGateway::set_leverage(int leverage, const std::string& symbol) {
    ensure_connected();
    const std::string valid = valid_symbol(symbol);
    require(ConnectorOp::SetLeverage, "setLeverage");

    nlohmann::json result = retry_.execute([&] {
        return connector_->set_leverage(leverage, valid);
    }, fmt::format("set leverage: {} {}x", symbol, leverage));
    spdlog::info("[{}] leverage set: {} {}x", name_, valid, leverage);
    return result;
}

const PrecisionInfo* ExchangeGateway::get_precision(const std::string& symbol) const {
    return precisions_.find(symbol);
}
