// =============================================================================
// deltas.cpp - DeltaTracker Implementation
// =============================================================================

#include "peerlend/deltas.hpp"

namespace peerlend {

void DeltaTracker::increase_delta(Side side, U128 amount, const MarketSideIndexes& indexes) {
    if (amount == 0) return;

    MarketSideDelta& delta = ctx_.market().deltas.side(side);
    delta.scaled_delta += x18::div_down(amount, indexes.pool_index);
    ctx_.emit_delta(side);
}

DeltaStep DeltaTracker::decrease_delta(Side side, U128 amount, U128 pool_index) {
    MarketSideDelta& delta = ctx_.market().deltas.side(side);
    if (delta.scaled_delta == 0 || amount == 0) return DeltaStep{amount, 0};

    U128 absorbed = min(x18::mul_up(delta.scaled_delta, pool_index), amount);
    delta.scaled_delta = zero_floor_sub(delta.scaled_delta, x18::div_down(absorbed, pool_index));
    ctx_.emit_delta(side);

    return DeltaStep{amount - absorbed, absorbed};
}

U128 DeltaTracker::increase_p2p(Side demanded, U128 promoted, U128 amount, const Indexes& indexes) {
    if (amount == 0) return 0;

    Side counter = opposite(demanded);
    Deltas& deltas = ctx_.market().deltas;

    U128 credit = to_scaled_credit(demanded, amount, indexes.side(demanded).p2p_index);
    deltas.side(demanded).scaled_p2p_total = checked_add(deltas.side(demanded).scaled_p2p_total, credit);
    deltas.side(counter).scaled_p2p_total = checked_add(
        deltas.side(counter).scaled_p2p_total,
        to_scaled_credit(counter, promoted, indexes.side(counter).p2p_index));
    ctx_.emit_p2p_totals();

    return credit;
}

void DeltaTracker::decrease_p2p(Side demanded, U128 demoted, U128 amount, const Indexes& indexes) {
    if (amount == 0 && demoted == 0) return;

    Side counter = opposite(demanded);
    MarketSideDelta& demanded_delta = ctx_.market().deltas.side(demanded);
    MarketSideDelta& counter_delta = ctx_.market().deltas.side(counter);

    demanded_delta.scaled_p2p_total = zero_floor_sub(
        demanded_delta.scaled_p2p_total, x18::div_down(amount, indexes.side(demanded).p2p_index));
    counter_delta.scaled_p2p_total = zero_floor_sub(
        counter_delta.scaled_p2p_total, x18::div_down(demoted, indexes.side(counter).p2p_index));
    ctx_.emit_p2p_totals();
}

U128 DeltaTracker::repay_fee(U128 amount, const Indexes& indexes) {
    if (amount == 0) return 0;

    Deltas& deltas = ctx_.market().deltas;

    // The borrow delta is fully absorbed whenever an amount is left to pay
    U128 borrow_p2p = x18::mul_up(deltas.borrow.scaled_p2p_total, indexes.borrow.p2p_index);
    U128 net_supply_p2p = zero_floor_sub(
        x18::mul_down(deltas.supply.scaled_p2p_total, indexes.supply.p2p_index),
        x18::mul_up(deltas.supply.scaled_delta, indexes.supply.pool_index));

    U128 fee = zero_floor_sub(borrow_p2p, net_supply_p2p);
    if (fee == 0) return amount;

    fee = min(fee, amount);
    deltas.borrow.scaled_p2p_total = zero_floor_sub(
        deltas.borrow.scaled_p2p_total, x18::div_down(fee, indexes.borrow.p2p_index));
    ctx_.emit_p2p_totals();

    return amount - fee;
}

IdleIncrease DeltaTracker::increase_idle(U128 amount, std::optional<U128> headroom) {
    if (!headroom || amount <= *headroom) return IdleIncrease{amount, 0};

    U128 idle_increase = amount - *headroom;
    ctx_.market().idle_supply += idle_increase;
    ctx_.emit_idle_supply();

    return IdleIncrease{*headroom, idle_increase};
}

DeltaStep DeltaTracker::decrease_idle(U128 amount) {
    if (amount == 0) return DeltaStep{0, 0};

    U128& idle = ctx_.market().idle_supply;
    if (idle == 0) return DeltaStep{amount, 0};

    U128 matched = min(idle, amount);
    idle = zero_floor_sub(idle, matched);
    ctx_.emit_idle_supply();

    return DeltaStep{amount - matched, matched};
}

void DeltaTracker::bound_deltas() {
    Market& market = ctx_.market();
    bool totals_changed = false;

    for (Side side : {Side::SUPPLY, Side::BORROW}) {
        MarketSideDelta& delta = market.deltas.side(side);
        const MarketSideIndexes& idx = market.indexes.side(side);

        if (ctx_.balances().p2p(side).empty() && delta.scaled_p2p_total != 0) {
            delta.scaled_p2p_total = 0;
            totals_changed = true;
        }

        U128 max_delta = x18::div_down(x18::mul_down(delta.scaled_p2p_total, idx.p2p_index), idx.pool_index);
        if (delta.scaled_delta > max_delta) {
            delta.scaled_delta = max_delta;
            ctx_.emit_delta(side);
        }
    }

    if (totals_changed) ctx_.emit_p2p_totals();
}

} // namespace peerlend
