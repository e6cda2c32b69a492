// =============================================================================
// engine.cpp - Engine Implementation
// =============================================================================

#include "peerlend/engine.hpp"
#include "peerlend/deltas.hpp"
#include "peerlend/logger.hpp"
#include "peerlend/risk_oracle.hpp"

#include <mutex>
#include <utility>

namespace peerlend {

Engine::Engine(PoolAdapter& pool, RiskOracle& risk, EngineConfig config)
    : config_(std::move(config))
    , pool_(pool)
    , risk_(&risk)
    , guard_(ledger_, pool_, *risk_, config_.general.risk_category)
    , events_(&null_sink_) {}

Engine::Engine(PoolAdapter& pool, const PriceOracle& prices, EngineConfig config)
    : config_(std::move(config))
    , pool_(pool)
    , owned_risk_(std::make_unique<LedgerRiskOracle>(ledger_, pool_, prices))
    , risk_(owned_risk_.get())
    , guard_(ledger_, pool_, *risk_, config_.general.risk_category)
    , events_(&null_sink_) {}

Engine::~Engine() = default;

// =============================================================================
// Market Management
// =============================================================================

int32_t Engine::create_market(const MarketConfig& config) {
    std::unique_lock lock(mutex_);

    if (addresses::is_zero(config.underlying)) return errors::ADDRESS_IS_ZERO;
    if (config.reserve_factor_bps > constants::MAX_BPS ||
        config.p2p_index_cursor_bps > constants::MAX_BPS) {
        return errors::INVALID_CONFIG;
    }
    if (ledger_.market_exists(config.underlying)) return errors::MARKET_ALREADY_CREATED;
    if (!pool_.reserve_config(config.underlying)) return errors::MARKET_NOT_CREATED;

    PoolIndexes pool = pool_.pool_indexes(config.underlying);
    if (pool.supply == 0 || pool.borrow == 0) return errors::INVALID_INDEX;

    MarketState* state = ledger_.create_market(config.underlying);
    Market& market = state->market;
    market.indexes.supply = MarketSideIndexes{pool.supply, X18_ONE};
    market.indexes.borrow = MarketSideIndexes{pool.borrow, X18_ONE};
    market.reserve_factor = config.reserve_factor_bps;
    market.p2p_index_cursor = config.p2p_index_cursor_bps;
    market.is_collateral = config.is_collateral;
    market.pause_statuses.is_p2p_disabled = config.p2p_disabled;
    market.last_update = ++clock_;

    events_->on_market_created(MarketCreated{config.underlying});
    events_->on_indexes_updated(IndexesUpdated{config.underlying, market.indexes});

    PEERLEND_LOG_INFO("market created underlying=" << addresses::to_hex(config.underlying)
                      << " reserve_factor=" << config.reserve_factor_bps
                      << " p2p_index_cursor=" << config.p2p_index_cursor_bps);
    return errors::OK;
}

int32_t Engine::set_pause(const Address& underlying, ActionType action, bool paused) {
    std::unique_lock lock(mutex_);

    MarketState* state = ledger_.find(underlying);
    if (!state) return errors::MARKET_NOT_CREATED;

    state->market.pause_statuses.set_paused(action, paused);
    PEERLEND_LOG_INFO(action_name(action) << (paused ? " paused" : " unpaused")
                      << " underlying=" << addresses::to_hex(underlying));
    return errors::OK;
}

int32_t Engine::set_all_paused(const Address& underlying, bool paused) {
    std::unique_lock lock(mutex_);

    MarketState* state = ledger_.find(underlying);
    if (!state) return errors::MARKET_NOT_CREATED;

    for (uint8_t a = 0; a <= static_cast<uint8_t>(ActionType::LIQUIDATE_BORROW); ++a) {
        state->market.pause_statuses.set_paused(static_cast<ActionType>(a), paused);
    }
    PEERLEND_LOG_INFO((paused ? "all actions paused" : "all actions unpaused")
                      << " underlying=" << addresses::to_hex(underlying));
    return errors::OK;
}

int32_t Engine::set_p2p_disabled(const Address& underlying, bool disabled) {
    std::unique_lock lock(mutex_);

    MarketState* state = ledger_.find(underlying);
    if (!state) return errors::MARKET_NOT_CREATED;

    state->market.pause_statuses.is_p2p_disabled = disabled;
    PEERLEND_LOG_INFO("p2p " << (disabled ? "disabled" : "enabled")
                      << " underlying=" << addresses::to_hex(underlying));
    return errors::OK;
}

int32_t Engine::set_deprecated(const Address& underlying, bool deprecated) {
    std::unique_lock lock(mutex_);

    MarketState* state = ledger_.find(underlying);
    if (!state) return errors::MARKET_NOT_CREATED;

    state->market.pause_statuses.is_deprecated = deprecated;
    PEERLEND_LOG_INFO("market " << (deprecated ? "deprecated" : "undeprecated")
                      << " underlying=" << addresses::to_hex(underlying));
    return errors::OK;
}

int32_t Engine::set_reserve_factor(const Address& underlying, uint32_t reserve_factor_bps) {
    std::unique_lock lock(mutex_);

    MarketState* state = ledger_.find(underlying);
    if (!state) return errors::MARKET_NOT_CREATED;
    if (reserve_factor_bps > constants::MAX_BPS) return errors::INVALID_CONFIG;

    // Accrue at the former factor first
    Indexes indexes;
    int32_t code = fetch_indexes(*state, indexes);
    if (code != errors::OK) return code;
    store_indexes(*state, indexes);

    state->market.reserve_factor = reserve_factor_bps;
    PEERLEND_LOG_INFO("reserve factor set underlying=" << addresses::to_hex(underlying)
                      << " bps=" << reserve_factor_bps);
    return errors::OK;
}

int32_t Engine::set_p2p_index_cursor(const Address& underlying, uint32_t p2p_index_cursor_bps) {
    std::unique_lock lock(mutex_);

    MarketState* state = ledger_.find(underlying);
    if (!state) return errors::MARKET_NOT_CREATED;
    if (p2p_index_cursor_bps > constants::MAX_BPS) return errors::INVALID_CONFIG;

    Indexes indexes;
    int32_t code = fetch_indexes(*state, indexes);
    if (code != errors::OK) return code;
    store_indexes(*state, indexes);

    state->market.p2p_index_cursor = p2p_index_cursor_bps;
    PEERLEND_LOG_INFO("p2p index cursor set underlying=" << addresses::to_hex(underlying)
                      << " bps=" << p2p_index_cursor_bps);
    return errors::OK;
}

void Engine::set_sentinel(const PriceOracleSentinel* sentinel) {
    std::unique_lock lock(mutex_);
    guard_.set_sentinel(sentinel);
}

void Engine::set_event_sink(EventSink* sink) {
    std::unique_lock lock(mutex_);
    events_ = sink ? sink : &null_sink_;
}

int32_t Engine::approve_manager(const Address& delegator, const Address& manager, bool approved) {
    std::unique_lock lock(mutex_);

    if (addresses::is_zero(delegator) || addresses::is_zero(manager)) return errors::ADDRESS_IS_ZERO;

    ledger_.set_manager(delegator, manager, approved);
    events_->on_manager_approval(ManagerApproval{delegator, manager, approved});
    PEERLEND_LOG_INFO("manager " << (approved ? "approved" : "revoked")
                      << " delegator=" << addresses::to_hex(delegator)
                      << " manager=" << addresses::to_hex(manager));
    return errors::OK;
}

// =============================================================================
// Accounting
// =============================================================================

ActionResult Engine::supply(const Address& caller, const Address& underlying, U128 amount,
                            const Address& on_behalf, std::optional<uint32_t> max_iterations) {
    std::unique_lock lock(mutex_);
    ++total_actions_;

    int32_t code = guard_.validate_supply(caller, underlying, on_behalf, amount);
    if (code != errors::OK) return reject(ActionType::SUPPLY, underlying, on_behalf, code);

    MarketState& state = *ledger_.find(underlying);
    Indexes indexes;
    code = fetch_indexes(state, indexes);
    if (code != errors::OK) return reject(ActionType::SUPPLY, underlying, on_behalf, code);

    code = guard_.authorize_supply(underlying, amount, indexes);
    if (code != errors::OK) return reject(ActionType::SUPPLY, underlying, on_behalf, code);

    store_indexes(state, indexes);
    MarketContext ctx = context(state);
    ActionResult result = ActionAccountant(ctx).account_supply(
        caller, on_behalf, amount, max_iterations.value_or(config_.iterations.supply));

    log_outcome(ActionType::SUPPLY, underlying, on_behalf, result);
    return result;
}

ActionResult Engine::supply_collateral(const Address& caller, const Address& underlying, U128 amount,
                                       const Address& on_behalf) {
    std::unique_lock lock(mutex_);
    ++total_actions_;

    int32_t code = guard_.validate_supply_collateral(caller, underlying, on_behalf, amount);
    if (code != errors::OK) return reject(ActionType::SUPPLY_COLLATERAL, underlying, on_behalf, code);

    MarketState& state = *ledger_.find(underlying);
    Indexes indexes;
    code = fetch_indexes(state, indexes);
    if (code != errors::OK) return reject(ActionType::SUPPLY_COLLATERAL, underlying, on_behalf, code);

    code = guard_.authorize_supply_collateral(underlying, amount, indexes);
    if (code != errors::OK) return reject(ActionType::SUPPLY_COLLATERAL, underlying, on_behalf, code);

    store_indexes(state, indexes);
    MarketContext ctx = context(state);
    ActionResult result = ActionAccountant(ctx).account_supply_collateral(caller, on_behalf, amount);

    log_outcome(ActionType::SUPPLY_COLLATERAL, underlying, on_behalf, result);
    return result;
}

ActionResult Engine::borrow(const Address& caller, const Address& underlying, U128 amount,
                            const Address& on_behalf, const Address& receiver,
                            std::optional<uint32_t> max_iterations) {
    std::unique_lock lock(mutex_);
    ++total_actions_;

    int32_t code = guard_.validate_borrow(caller, underlying, on_behalf, receiver, amount);
    if (code != errors::OK) return reject(ActionType::BORROW, underlying, on_behalf, code);

    MarketState& state = *ledger_.find(underlying);
    Indexes indexes;
    code = fetch_indexes(state, indexes);
    if (code != errors::OK) return reject(ActionType::BORROW, underlying, on_behalf, code);

    code = guard_.authorize_borrow(underlying, on_behalf, amount, indexes);
    if (code != errors::OK) return reject(ActionType::BORROW, underlying, on_behalf, code);

    store_indexes(state, indexes);
    MarketContext ctx = context(state);
    ActionResult result = ActionAccountant(ctx).account_borrow(
        caller, on_behalf, amount, max_iterations.value_or(config_.iterations.borrow));

    log_outcome(ActionType::BORROW, underlying, on_behalf, result);
    return result;
}

ActionResult Engine::repay(const Address& caller, const Address& underlying, U128 amount,
                           const Address& on_behalf, std::optional<uint32_t> max_iterations) {
    std::unique_lock lock(mutex_);
    ++total_actions_;

    int32_t code = guard_.validate_repay(caller, underlying, on_behalf, amount);
    if (code != errors::OK) return reject(ActionType::REPAY, underlying, on_behalf, code);

    MarketState& state = *ledger_.find(underlying);
    Indexes indexes;
    code = fetch_indexes(state, indexes);
    if (code != errors::OK) return reject(ActionType::REPAY, underlying, on_behalf, code);

    U128 debt = to_underlying(Side::BORROW, state.balances.scaled_pool_balance(Side::BORROW, on_behalf),
                              indexes.borrow.pool_index) +
                to_underlying(Side::BORROW, state.balances.scaled_p2p_balance(Side::BORROW, on_behalf),
                              indexes.borrow.p2p_index);
    amount = min(amount, debt);
    if (amount == 0) return reject(ActionType::REPAY, underlying, on_behalf, errors::DEBT_IS_ZERO);

    std::optional<U128> headroom;
    if (auto reserve = pool_.reserve_config(underlying)) {
        if (auto cap = cap_amount(reserve->supply_cap, reserve->decimals)) {
            headroom = zero_floor_sub(*cap, pool_.total_supplied(underlying));
        }
    }

    store_indexes(state, indexes);
    MarketContext ctx = context(state);
    ActionResult result = ActionAccountant(ctx).account_repay(
        caller, on_behalf, amount, max_iterations.value_or(config_.iterations.repay), headroom);

    log_outcome(ActionType::REPAY, underlying, on_behalf, result);
    return result;
}

ActionResult Engine::withdraw(const Address& caller, const Address& underlying, U128 amount,
                              const Address& on_behalf, const Address& receiver,
                              std::optional<uint32_t> max_iterations) {
    std::unique_lock lock(mutex_);
    ++total_actions_;

    int32_t code = guard_.validate_withdraw(caller, underlying, on_behalf, receiver, amount);
    if (code != errors::OK) return reject(ActionType::WITHDRAW, underlying, on_behalf, code);

    MarketState& state = *ledger_.find(underlying);
    Indexes indexes;
    code = fetch_indexes(state, indexes);
    if (code != errors::OK) return reject(ActionType::WITHDRAW, underlying, on_behalf, code);

    U128 supplied = to_underlying(Side::SUPPLY, state.balances.scaled_pool_balance(Side::SUPPLY, on_behalf),
                                  indexes.supply.pool_index) +
                    to_underlying(Side::SUPPLY, state.balances.scaled_p2p_balance(Side::SUPPLY, on_behalf),
                                  indexes.supply.p2p_index);
    amount = min(amount, supplied);
    if (amount == 0) return reject(ActionType::WITHDRAW, underlying, on_behalf, errors::SUPPLY_IS_ZERO);

    store_indexes(state, indexes);
    MarketContext ctx = context(state);
    ActionResult result = ActionAccountant(ctx).account_withdraw(
        caller, on_behalf, amount, max_iterations.value_or(config_.iterations.withdraw));

    log_outcome(ActionType::WITHDRAW, underlying, on_behalf, result);
    return result;
}

ActionResult Engine::withdraw_collateral(const Address& caller, const Address& underlying, U128 amount,
                                         const Address& on_behalf, const Address& receiver) {
    std::unique_lock lock(mutex_);
    ++total_actions_;

    int32_t code = guard_.validate_withdraw_collateral(caller, underlying, on_behalf, receiver, amount);
    if (code != errors::OK) return reject(ActionType::WITHDRAW_COLLATERAL, underlying, on_behalf, code);

    MarketState& state = *ledger_.find(underlying);
    Indexes indexes;
    code = fetch_indexes(state, indexes);
    if (code != errors::OK) return reject(ActionType::WITHDRAW_COLLATERAL, underlying, on_behalf, code);

    U128 collateral = x18::mul_down(state.balances.scaled_collateral(on_behalf), indexes.supply.pool_index);
    amount = min(amount, collateral);
    if (amount == 0) return reject(ActionType::WITHDRAW_COLLATERAL, underlying, on_behalf, errors::COLLATERAL_IS_ZERO);

    code = guard_.authorize_withdraw_collateral(underlying, on_behalf, amount);
    if (code != errors::OK) return reject(ActionType::WITHDRAW_COLLATERAL, underlying, on_behalf, code);

    store_indexes(state, indexes);
    MarketContext ctx = context(state);
    ActionResult result = ActionAccountant(ctx).account_withdraw_collateral(caller, on_behalf, amount);

    log_outcome(ActionType::WITHDRAW_COLLATERAL, underlying, on_behalf, result);
    return result;
}

LiquidationAuthorization Engine::authorize_liquidation(const Address& underlying_borrowed,
                                                       const Address& underlying_collateral,
                                                       const Address& borrower) const {
    std::shared_lock lock(mutex_);

    LiquidationAuthorization auth = guard_.authorize_liquidate(underlying_borrowed, underlying_collateral, borrower);
    if (!auth.ok()) {
        PEERLEND_LOG_WARNING("liquidation rejected: " << error_string(auth.error_code)
                             << " borrower=" << addresses::to_hex(borrower));
    } else {
        PEERLEND_LOG_DEBUG("liquidation authorized borrower=" << addresses::to_hex(borrower)
                           << " close_factor=" << to_string(auth.close_factor));
    }
    return auth;
}

// =============================================================================
// Queries
// =============================================================================

bool Engine::market_exists(const Address& underlying) const {
    std::shared_lock lock(mutex_);
    return ledger_.market_exists(underlying);
}

std::optional<Market> Engine::get_market(const Address& underlying) const {
    std::shared_lock lock(mutex_);
    const MarketState* state = ledger_.find(underlying);
    if (!state) return std::nullopt;
    return state->market;
}

std::vector<Address> Engine::markets() const {
    std::shared_lock lock(mutex_);
    std::vector<Address> out;
    out.reserve(ledger_.markets().size());
    for (const auto& [underlying, state] : ledger_.markets()) {
        out.push_back(underlying);
    }
    return out;
}

UserBalance Engine::balance_of(const Address& underlying, const Address& user) const {
    std::shared_lock lock(mutex_);
    const MarketState* state = ledger_.find(underlying);
    if (!state) return UserBalance{};
    return state->balances.balance_of(user);
}

U128 Engine::supply_balance(const Address& underlying, const Address& user) const {
    std::shared_lock lock(mutex_);
    const MarketState* state = ledger_.find(underlying);
    if (!state) return 0;

    const MarketSideIndexes& idx = state->market.indexes.supply;
    return to_underlying(Side::SUPPLY, state->balances.scaled_pool_balance(Side::SUPPLY, user), idx.pool_index) +
           to_underlying(Side::SUPPLY, state->balances.scaled_p2p_balance(Side::SUPPLY, user), idx.p2p_index);
}

U128 Engine::borrow_balance(const Address& underlying, const Address& user) const {
    std::shared_lock lock(mutex_);
    const MarketState* state = ledger_.find(underlying);
    if (!state) return 0;

    const MarketSideIndexes& idx = state->market.indexes.borrow;
    return to_underlying(Side::BORROW, state->balances.scaled_pool_balance(Side::BORROW, user), idx.pool_index) +
           to_underlying(Side::BORROW, state->balances.scaled_p2p_balance(Side::BORROW, user), idx.p2p_index);
}

U128 Engine::collateral_balance(const Address& underlying, const Address& user) const {
    std::shared_lock lock(mutex_);
    const MarketState* state = ledger_.find(underlying);
    if (!state) return 0;
    return x18::mul_down(state->balances.scaled_collateral(user), state->market.indexes.supply.pool_index);
}

UserMarkets Engine::user_markets(const Address& user) const {
    std::shared_lock lock(mutex_);
    return ledger_.user_markets(user);
}

bool Engine::is_managed_by(const Address& delegator, const Address& manager) const {
    std::shared_lock lock(mutex_);
    return ledger_.is_managed_by(delegator, manager);
}

Engine::Stats Engine::get_stats() const {
    return Stats{total_actions_.load(), rejected_actions_.load()};
}

// =============================================================================
// Internals
// =============================================================================

MarketContext Engine::context(MarketState& state) {
    return MarketContext{ledger_, state, *events_};
}

int32_t Engine::fetch_indexes(const MarketState& state, Indexes& out) const {
    Indexes fetched = risk_->updated_indexes(state.market.underlying);
    const Indexes& last = state.market.indexes;

    for (Side side : {Side::SUPPLY, Side::BORROW}) {
        const MarketSideIndexes& next = fetched.side(side);
        const MarketSideIndexes& prev = last.side(side);
        if (next.pool_index == 0 || next.p2p_index == 0) return errors::INVALID_INDEX;
        if (next.pool_index < prev.pool_index || next.p2p_index < prev.p2p_index) return errors::INVALID_INDEX;
    }

    out = fetched;
    return errors::OK;
}

void Engine::store_indexes(MarketState& state, const Indexes& indexes) {
    Market& market = state.market;
    market.last_update = ++clock_;
    if (market.indexes == indexes) return;

    market.indexes = indexes;
    events_->on_indexes_updated(IndexesUpdated{market.underlying, indexes});

    // Accrual can leave a delta above its P2P notional
    MarketContext ctx = context(state);
    DeltaTracker(ctx).bound_deltas();
}

ActionResult Engine::reject(ActionType action, const Address& underlying, const Address& on_behalf, int32_t code) {
    ++rejected_actions_;
    PEERLEND_LOG_WARNING(action_name(action) << " rejected: " << error_string(code)
                         << " underlying=" << addresses::to_hex(underlying)
                         << " on_behalf=" << addresses::to_hex(on_behalf));
    return ActionResult::error(code);
}

void Engine::log_outcome(ActionType action, const Address& underlying, const Address& on_behalf,
                         const ActionResult& result) const {
    PEERLEND_LOG_DEBUG(action_name(action)
                       << " underlying=" << addresses::to_hex(underlying)
                       << " on_behalf=" << addresses::to_hex(on_behalf)
                       << " amount=" << to_string(result.amount)
                       << " to_pool=" << to_string(result.to_pool)
                       << " to_peer=" << to_string(result.to_peer)
                       << " on_pool=" << to_string(result.on_pool)
                       << " in_p2p=" << to_string(result.in_p2p));
}

} // namespace peerlend
