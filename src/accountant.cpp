// =============================================================================
// accountant.cpp - Action Accountant Implementation
// =============================================================================

#include "peerlend/accountant.hpp"
#include "peerlend/deltas.hpp"
#include "peerlend/matching.hpp"

namespace peerlend {

namespace {

void set_balances(ActionResult& result, Side side, U128 on_pool, U128 in_p2p, const Indexes& indexes) {
    result.scaled_on_pool = on_pool;
    result.scaled_in_p2p = in_p2p;
    result.on_pool = to_underlying(side, on_pool, indexes.side(side).pool_index);
    result.in_p2p = to_underlying(side, in_p2p, indexes.side(side).p2p_index);
}

} // namespace

// =============================================================================
// Adding Liquidity
// =============================================================================

ActionResult ActionAccountant::account_supply(const Address& from, const Address& on_behalf,
                                              U128 amount, uint32_t max_iterations) {
    const Indexes indexes = ctx_.market().indexes;
    MarketBalances& balances = ctx_.balances();
    DeltaTracker deltas(ctx_);
    MatchingEngine matching(ctx_);

    ActionResult result;
    result.amount = amount;
    U128 on_pool = balances.scaled_pool_balance(Side::SUPPLY, on_behalf);
    U128 in_p2p = balances.scaled_p2p_balance(Side::SUPPLY, on_behalf);

    // Peer-to-peer: borrow delta first, then pool borrowers
    DeltaStep delta = deltas.decrease_delta(Side::BORROW, amount, indexes.borrow.pool_index);
    PromoteResult promo = matching.promote_routine(MatchingStrategy::BORROWERS, delta.remaining, max_iterations);

    U128 matched = delta.absorbed + promo.promoted;
    in_p2p = checked_add(in_p2p, deltas.increase_p2p(Side::SUPPLY, promo.promoted, matched, indexes));

    // Pool
    U128 to_pool = promo.remaining;
    on_pool = checked_add(on_pool, to_scaled_credit(Side::SUPPLY, to_pool, indexes.supply.pool_index));

    ctx_.update_user(Side::SUPPLY, on_behalf, on_pool, in_p2p, false);
    deltas.bound_deltas();

    result.to_peer = matched;
    result.to_pool = to_pool;
    set_balances(result, Side::SUPPLY, on_pool, in_p2p, indexes);
    result.pool_ops.repay = matched;
    result.pool_ops.supply = to_pool;

    emit_balance_action(ActionType::SUPPLY, from, on_behalf, result);
    return result;
}

ActionResult ActionAccountant::account_borrow(const Address& from, const Address& on_behalf,
                                              U128 amount, uint32_t max_iterations) {
    const Indexes indexes = ctx_.market().indexes;
    MarketBalances& balances = ctx_.balances();
    DeltaTracker deltas(ctx_);
    MatchingEngine matching(ctx_);

    ActionResult result;
    result.amount = amount;
    U128 on_pool = balances.scaled_pool_balance(Side::BORROW, on_behalf);
    U128 in_p2p = balances.scaled_p2p_balance(Side::BORROW, on_behalf);

    // Peer-to-peer: idle supply, supply delta, then pool suppliers
    DeltaStep idle = deltas.decrease_idle(amount);
    DeltaStep delta = deltas.decrease_delta(Side::SUPPLY, idle.remaining, indexes.supply.pool_index);
    PromoteResult promo = matching.promote_routine(MatchingStrategy::SUPPLIERS, delta.remaining, max_iterations);

    U128 to_withdraw = delta.absorbed + promo.promoted;
    U128 matched = to_withdraw + idle.absorbed;
    in_p2p = checked_add(in_p2p, deltas.increase_p2p(Side::BORROW, promo.promoted, matched, indexes));

    // Pool
    U128 to_pool = promo.remaining;
    on_pool = checked_add(on_pool, to_scaled_credit(Side::BORROW, to_pool, indexes.borrow.pool_index));

    ctx_.update_user(Side::BORROW, on_behalf, on_pool, in_p2p, false);
    deltas.bound_deltas();

    result.to_peer = matched;
    result.to_pool = to_pool;
    set_balances(result, Side::BORROW, on_pool, in_p2p, indexes);
    result.idle_matched = idle.absorbed;
    result.pool_ops.withdraw = to_withdraw;
    result.pool_ops.borrow = to_pool;

    emit_balance_action(ActionType::BORROW, from, on_behalf, result);
    return result;
}

// =============================================================================
// Removing Liquidity
// =============================================================================

ActionResult ActionAccountant::account_repay(const Address& from, const Address& on_behalf,
                                             U128 amount, uint32_t max_iterations,
                                             std::optional<U128> supply_headroom) {
    const Indexes indexes = ctx_.market().indexes;
    MarketBalances& balances = ctx_.balances();
    DeltaTracker deltas(ctx_);
    MatchingEngine matching(ctx_);

    ActionResult result;
    U128 on_pool = balances.scaled_pool_balance(Side::BORROW, on_behalf);
    U128 in_p2p = balances.scaled_p2p_balance(Side::BORROW, on_behalf);

    // Own pool debt first
    U128 from_pool = min(to_underlying(Side::BORROW, on_pool, indexes.borrow.pool_index), amount);
    on_pool -= min(on_pool, to_scaled_debit(from_pool, indexes.borrow.pool_index));

    // Then own P2P debt
    U128 from_p2p = min(amount - from_pool, to_underlying(Side::BORROW, in_p2p, indexes.borrow.p2p_index));
    in_p2p -= min(in_p2p, to_scaled_debit(from_p2p, indexes.borrow.p2p_index));

    ctx_.update_user(Side::BORROW, on_behalf, on_pool, in_p2p, false);

    result.amount = from_pool + from_p2p;
    result.to_pool = from_pool;
    result.to_peer = from_p2p;
    set_balances(result, Side::BORROW, on_pool, in_p2p, indexes);
    result.pool_ops.repay = from_pool;

    if (from_p2p == 0) {
        emit_balance_action(ActionType::REPAY, from, on_behalf, result);
        return result;
    }

    // Borrow delta: P2P debt already sitting on the pool
    DeltaStep delta = deltas.decrease_delta(Side::BORROW, from_p2p, indexes.borrow.pool_index);
    deltas.decrease_p2p(Side::BORROW, 0, delta.absorbed, indexes);
    result.pool_ops.repay += delta.absorbed;

    U128 remaining = deltas.repay_fee(delta.remaining, indexes);
    result.fee_repaid = delta.remaining - remaining;

    // Replace the departing borrower with pool borrowers
    PromoteResult promo = matching.promote_routine(MatchingStrategy::BORROWERS, remaining, max_iterations);
    result.pool_ops.repay += promo.promoted;

    // Breaking repay: matched suppliers go back to the pool
    IdleIncrease idle = deltas.increase_idle(promo.remaining, supply_headroom);
    result.idle_increase = idle.idle_increase;
    result.pool_ops.supply = idle.to_supply;

    U128 demoted = matching.demote(MatchingStrategy::SUPPLIERS, idle.to_supply, max_iterations);
    deltas.increase_delta(Side::SUPPLY, idle.to_supply - demoted, indexes.supply);
    deltas.decrease_p2p(Side::BORROW, demoted, idle.to_supply + idle.idle_increase, indexes);
    deltas.bound_deltas();

    emit_balance_action(ActionType::REPAY, from, on_behalf, result);
    return result;
}

ActionResult ActionAccountant::account_withdraw(const Address& from, const Address& on_behalf,
                                                U128 amount, uint32_t max_iterations) {
    const Indexes indexes = ctx_.market().indexes;
    MarketBalances& balances = ctx_.balances();
    DeltaTracker deltas(ctx_);
    MatchingEngine matching(ctx_);

    ActionResult result;
    U128 on_pool = balances.scaled_pool_balance(Side::SUPPLY, on_behalf);
    U128 in_p2p = balances.scaled_p2p_balance(Side::SUPPLY, on_behalf);

    // Own pool supply first
    U128 from_pool = min(to_underlying(Side::SUPPLY, on_pool, indexes.supply.pool_index), amount);
    on_pool -= min(on_pool, to_scaled_debit(from_pool, indexes.supply.pool_index));

    // Then own P2P supply
    U128 from_p2p = min(amount - from_pool, to_underlying(Side::SUPPLY, in_p2p, indexes.supply.p2p_index));
    in_p2p -= min(in_p2p, to_scaled_debit(from_p2p, indexes.supply.p2p_index));

    ctx_.update_user(Side::SUPPLY, on_behalf, on_pool, in_p2p, false);

    result.amount = from_pool + from_p2p;
    result.to_pool = from_pool;
    result.to_peer = from_p2p;
    set_balances(result, Side::SUPPLY, on_pool, in_p2p, indexes);
    result.pool_ops.withdraw = from_pool;

    if (from_p2p == 0) {
        emit_balance_action(ActionType::WITHDRAW, from, on_behalf, result);
        return result;
    }

    // Idle supply and supply delta have no borrower behind them
    DeltaStep idle = deltas.decrease_idle(from_p2p);
    DeltaStep delta = deltas.decrease_delta(Side::SUPPLY, idle.remaining, indexes.supply.pool_index);
    U128 p2p_supply_decrease = idle.absorbed + delta.absorbed;
    result.idle_matched = idle.absorbed;
    result.pool_ops.withdraw += delta.absorbed;

    // Replace the departing supplier with pool suppliers
    PromoteResult promo = matching.promote_routine(MatchingStrategy::SUPPLIERS, delta.remaining, max_iterations);
    result.pool_ops.withdraw += promo.promoted;

    // Breaking withdraw: matched borrowers go back to the pool
    U128 demoted = matching.demote(MatchingStrategy::BORROWERS, promo.remaining, max_iterations);
    deltas.increase_delta(Side::BORROW, promo.remaining - demoted, indexes.borrow);
    deltas.decrease_p2p(Side::SUPPLY, demoted, p2p_supply_decrease + promo.remaining, indexes);
    deltas.bound_deltas();
    result.pool_ops.borrow = promo.remaining;

    emit_balance_action(ActionType::WITHDRAW, from, on_behalf, result);
    return result;
}

// =============================================================================
// Collateral
// =============================================================================

ActionResult ActionAccountant::account_supply_collateral(const Address& from, const Address& on_behalf,
                                                         U128 amount) {
    MarketBalances& balances = ctx_.balances();
    U128 pool_index = ctx_.market().indexes.supply.pool_index;

    U128 scaled = checked_add(balances.scaled_collateral(on_behalf), x18::div_down(amount, pool_index));
    balances.set_collateral(on_behalf, scaled);
    ctx_.ledger.set_collateral_member(on_behalf, ctx_.underlying(), scaled != 0);

    ActionResult result;
    result.amount = amount;
    result.to_pool = amount;
    result.scaled_on_pool = scaled;
    result.on_pool = x18::mul_down(scaled, pool_index);
    result.pool_ops.supply = amount;

    ctx_.events.on_collateral_action(CollateralAction{
        ActionType::SUPPLY_COLLATERAL, from, on_behalf, ctx_.underlying(), amount, scaled
    });
    return result;
}

ActionResult ActionAccountant::account_withdraw_collateral(const Address& from, const Address& on_behalf,
                                                           U128 amount) {
    MarketBalances& balances = ctx_.balances();
    U128 pool_index = ctx_.market().indexes.supply.pool_index;

    U128 scaled = balances.scaled_collateral(on_behalf);
    U128 withdrawn = min(amount, x18::mul_down(scaled, pool_index));
    scaled -= min(scaled, x18::div_up(withdrawn, pool_index));
    balances.set_collateral(on_behalf, scaled);
    ctx_.ledger.set_collateral_member(on_behalf, ctx_.underlying(), scaled != 0);

    ActionResult result;
    result.amount = withdrawn;
    result.to_pool = withdrawn;
    result.scaled_on_pool = scaled;
    result.on_pool = x18::mul_down(scaled, pool_index);
    result.pool_ops.withdraw = withdrawn;

    ctx_.events.on_collateral_action(CollateralAction{
        ActionType::WITHDRAW_COLLATERAL, from, on_behalf, ctx_.underlying(), withdrawn, scaled
    });
    return result;
}

void ActionAccountant::emit_balance_action(ActionType action, const Address& from, const Address& on_behalf,
                                           const ActionResult& result) {
    ctx_.events.on_balance_action(BalanceAction{
        action, from, on_behalf, ctx_.underlying(), result.amount,
        result.scaled_on_pool, result.scaled_in_p2p
    });
}

} // namespace peerlend
