// =============================================================================
// guard.cpp - AuthorizationGuard Implementation
// =============================================================================

#include "peerlend/guard.hpp"

namespace peerlend {

namespace {

int32_t pause_error(ActionType action) {
    switch (action) {
        case ActionType::SUPPLY: return errors::SUPPLY_PAUSED;
        case ActionType::SUPPLY_COLLATERAL: return errors::SUPPLY_COLLATERAL_PAUSED;
        case ActionType::BORROW: return errors::BORROW_PAUSED;
        case ActionType::REPAY: return errors::REPAY_PAUSED;
        case ActionType::WITHDRAW: return errors::WITHDRAW_PAUSED;
        case ActionType::WITHDRAW_COLLATERAL: return errors::WITHDRAW_COLLATERAL_PAUSED;
        case ActionType::LIQUIDATE_COLLATERAL: return errors::LIQUIDATE_COLLATERAL_PAUSED;
        case ActionType::LIQUIDATE_BORROW: return errors::LIQUIDATE_BORROW_PAUSED;
    }
    return errors::OK;
}

// amount + used_p2p + used_pool > cap, without wrapping
bool exceeds_cap(U128 cap, U128 amount, U128 used_p2p, U128 used_pool) {
    if (amount > cap) return true;
    U128 room = cap - amount;
    if (used_p2p > room) return true;
    return used_pool > room - used_p2p;
}

// held + amount above constants::MAX_SIDE_TOTAL
bool exceeds_capacity(U128 amount, U128 held) {
    return amount > constants::MAX_SIDE_TOTAL - min(held, constants::MAX_SIDE_TOTAL);
}

// Underlying value of a side, pool and P2P parts together
U128 side_value(const MarketState& state, Side side, const Indexes& indexes) {
    const MarketSideIndexes& idx = indexes.side(side);
    return checked_add(
        x18::mul_up(state.balances.scaled_pool_total(side), idx.pool_index),
        x18::mul_up(state.market.deltas.side(side).scaled_p2p_total, idx.p2p_index));
}

} // namespace

std::optional<U128> cap_amount(U128 cap_tokens, uint8_t decimals) {
    if (cap_tokens == 0) return std::nullopt;
    U128 unit = pow10(decimals);
    if (cap_tokens > U128_MAX / unit) return U128_MAX;
    return cap_tokens * unit;
}

AuthorizationGuard::AuthorizationGuard(const Ledger& ledger, const PoolAdapter& pool,
                                       const RiskOracle& risk, uint8_t risk_category)
    : ledger_(ledger)
    , pool_(pool)
    , risk_(risk)
    , risk_category_(risk_category) {}

// =============================================================================
// Building Blocks
// =============================================================================

int32_t AuthorizationGuard::validate_input(const Address& underlying, const Address& user, U128 amount) const {
    if (addresses::is_zero(user)) return errors::ADDRESS_IS_ZERO;
    if (amount == 0) return errors::AMOUNT_IS_ZERO;
    if (!ledger_.market_exists(underlying)) return errors::MARKET_NOT_CREATED;
    return errors::OK;
}

int32_t AuthorizationGuard::validate_permission(const Address& caller, const Address& on_behalf) const {
    if (caller == on_behalf) return errors::OK;
    if (ledger_.is_managed_by(on_behalf, caller)) return errors::OK;
    return errors::PERMISSION_DENIED;
}

int32_t AuthorizationGuard::validate_pause(const Address& underlying, ActionType action) const {
    const MarketState* state = ledger_.find(underlying);
    if (!state) return errors::MARKET_NOT_CREATED;
    if (state->market.pause_statuses.is_paused(action)) return pause_error(action);
    return errors::OK;
}

// =============================================================================
// Per Action
// =============================================================================

int32_t AuthorizationGuard::validate_supply(const Address& caller, const Address& underlying,
                                            const Address& on_behalf, U128 amount) const {
    int32_t code = validate_input(underlying, on_behalf, amount);
    if (code != errors::OK) return code;
    code = validate_permission(caller, on_behalf);
    if (code != errors::OK) return code;
    return validate_pause(underlying, ActionType::SUPPLY);
}

int32_t AuthorizationGuard::validate_supply_collateral(const Address& caller, const Address& underlying,
                                                       const Address& on_behalf, U128 amount) const {
    int32_t code = validate_input(underlying, on_behalf, amount);
    if (code != errors::OK) return code;
    code = validate_permission(caller, on_behalf);
    if (code != errors::OK) return code;
    return validate_pause(underlying, ActionType::SUPPLY_COLLATERAL);
}

int32_t AuthorizationGuard::validate_borrow(const Address& caller, const Address& underlying,
                                            const Address& on_behalf, const Address& receiver,
                                            U128 amount) const {
    if (addresses::is_zero(receiver)) return errors::ADDRESS_IS_ZERO;
    int32_t code = validate_input(underlying, on_behalf, amount);
    if (code != errors::OK) return code;
    code = validate_permission(caller, on_behalf);
    if (code != errors::OK) return code;
    return validate_pause(underlying, ActionType::BORROW);
}

int32_t AuthorizationGuard::validate_repay(const Address& caller, const Address& underlying,
                                           const Address& on_behalf, U128 amount) const {
    int32_t code = validate_input(underlying, on_behalf, amount);
    if (code != errors::OK) return code;
    code = validate_permission(caller, on_behalf);
    if (code != errors::OK) return code;
    return validate_pause(underlying, ActionType::REPAY);
}

int32_t AuthorizationGuard::validate_withdraw(const Address& caller, const Address& underlying,
                                              const Address& on_behalf, const Address& receiver,
                                              U128 amount) const {
    if (addresses::is_zero(receiver)) return errors::ADDRESS_IS_ZERO;
    int32_t code = validate_input(underlying, on_behalf, amount);
    if (code != errors::OK) return code;
    code = validate_permission(caller, on_behalf);
    if (code != errors::OK) return code;
    return validate_pause(underlying, ActionType::WITHDRAW);
}

int32_t AuthorizationGuard::validate_withdraw_collateral(const Address& caller, const Address& underlying,
                                                         const Address& on_behalf, const Address& receiver,
                                                         U128 amount) const {
    if (addresses::is_zero(receiver)) return errors::ADDRESS_IS_ZERO;
    int32_t code = validate_input(underlying, on_behalf, amount);
    if (code != errors::OK) return code;
    code = validate_permission(caller, on_behalf);
    if (code != errors::OK) return code;
    return validate_pause(underlying, ActionType::WITHDRAW_COLLATERAL);
}

int32_t AuthorizationGuard::authorize_supply(const Address& underlying, U128 amount,
                                             const Indexes& indexes) const {
    const MarketState* state = ledger_.find(underlying);
    if (!state) return errors::MARKET_NOT_CREATED;

    int32_t code = check_supply_cap(*state, amount, indexes);
    if (code != errors::OK) return code;

    if (exceeds_capacity(amount, side_value(*state, Side::SUPPLY, indexes))) return errors::AMOUNT_TOO_LARGE;
    return errors::OK;
}

int32_t AuthorizationGuard::authorize_supply_collateral(const Address& underlying, U128 amount,
                                                        const Indexes& indexes) const {
    const MarketState* state = ledger_.find(underlying);
    if (!state) return errors::MARKET_NOT_CREATED;

    int32_t code = check_supply_cap(*state, amount, indexes);
    if (code != errors::OK) return code;

    U128 collateral = x18::mul_up(state->balances.scaled_collateral_total(), indexes.supply.pool_index);
    if (exceeds_capacity(amount, collateral)) return errors::AMOUNT_TOO_LARGE;
    return errors::OK;
}

int32_t AuthorizationGuard::check_supply_cap(const MarketState& state, U128 amount,
                                             const Indexes& indexes) const {
    auto config = pool_.reserve_config(state.market.underlying);
    if (!config) return errors::MARKET_NOT_CREATED;

    auto cap = cap_amount(config->supply_cap, config->decimals);
    if (cap) {
        Market market = state.market;
        market.indexes = indexes;
        if (exceeds_cap(*cap, amount, market.true_p2p(Side::SUPPLY), pool_.total_supplied(market.underlying))) {
            return errors::SUPPLY_CAP_EXCEEDED;
        }
    }
    return errors::OK;
}

int32_t AuthorizationGuard::authorize_borrow(const Address& underlying, const Address& on_behalf,
                                             U128 amount, const Indexes& indexes) const {
    const MarketState* state = ledger_.find(underlying);
    if (!state) return errors::MARKET_NOT_CREATED;

    auto config = pool_.reserve_config(underlying);
    if (!config) return errors::MARKET_NOT_CREATED;

    auto cap = cap_amount(config->borrow_cap, config->decimals);
    if (cap) {
        Market market = state->market;
        market.indexes = indexes;
        if (exceeds_cap(*cap, amount, market.true_p2p(Side::BORROW), pool_.total_borrowed(underlying))) {
            return errors::BORROW_CAP_EXCEEDED;
        }
    }
    if (exceeds_capacity(amount, side_value(*state, Side::BORROW, indexes))) return errors::AMOUNT_TOO_LARGE;

    if (!config->borrowing_enabled) return errors::BORROW_NOT_ENABLED;
    if (risk_category_ != 0 && risk_category_ != config->risk_category) {
        return errors::INCONSISTENT_RISK_CATEGORY;
    }

    LiquidityData data = risk_.liquidity_data(on_behalf, underlying, 0, amount);
    if (data.debt > data.borrowable) return errors::UNAUTHORIZED_BORROW;

    return errors::OK;
}

int32_t AuthorizationGuard::authorize_withdraw_collateral(const Address& underlying, const Address& on_behalf,
                                                          U128 amount) const {
    if (risk_.health_factor(on_behalf, underlying, amount) < constants::DEFAULT_LIQUIDATION_THRESHOLD) {
        return errors::UNAUTHORIZED_WITHDRAW;
    }
    return errors::OK;
}

LiquidationAuthorization AuthorizationGuard::authorize_liquidate(const Address& underlying_borrowed,
                                                                 const Address& underlying_collateral,
                                                                 const Address& borrower) const {
    LiquidationAuthorization auth;

    if (addresses::is_zero(borrower)) {
        auth.error_code = errors::ADDRESS_IS_ZERO;
        return auth;
    }

    const MarketState* borrowed = ledger_.find(underlying_borrowed);
    const MarketState* collateral = ledger_.find(underlying_collateral);
    if (!borrowed || !collateral) {
        auth.error_code = errors::MARKET_NOT_CREATED;
        return auth;
    }

    if (collateral->market.pause_statuses.is_liquidate_collateral_paused) {
        auth.error_code = errors::LIQUIDATE_COLLATERAL_PAUSED;
        return auth;
    }
    if (borrowed->market.pause_statuses.is_liquidate_borrow_paused) {
        auth.error_code = errors::LIQUIDATE_BORROW_PAUSED;
        return auth;
    }

    if (collateral->balances.scaled_collateral(borrower) == 0) {
        auth.error_code = errors::COLLATERAL_NOT_HELD;
        return auth;
    }
    if (borrowed->balances.scaled_pool_balance(Side::BORROW, borrower) == 0 &&
        borrowed->balances.scaled_p2p_balance(Side::BORROW, borrower) == 0) {
        auth.error_code = errors::DEBT_NOT_HELD;
        return auth;
    }

    if (borrowed->market.pause_statuses.is_deprecated) {
        auth.close_factor = constants::MAX_CLOSE_FACTOR;
        return auth;
    }

    auth.health_factor = risk_.health_factor(borrower, ZERO_ADDRESS, 0);

    if (auth.health_factor >= constants::DEFAULT_LIQUIDATION_THRESHOLD) {
        auth.error_code = errors::UNAUTHORIZED_LIQUIDATE;
        return auth;
    }

    if (auth.health_factor >= constants::MIN_LIQUIDATION_THRESHOLD) {
        if (sentinel_ && !sentinel_->is_liquidation_allowed()) {
            auth.error_code = errors::SENTINEL_LIQUIDATE_NOT_ENABLED;
            return auth;
        }
        auth.close_factor = constants::DEFAULT_CLOSE_FACTOR;
        return auth;
    }

    auth.close_factor = constants::MAX_CLOSE_FACTOR;
    return auth;
}

} // namespace peerlend
