// =============================================================================
// interest.cpp - P2P Index Model
// =============================================================================

#include "peerlend/interest.hpp"

namespace peerlend {

namespace interest {

GrowthFactors compute_growth_factors(U128 new_pool_supply_index, U128 new_pool_borrow_index,
                                     U128 last_pool_supply_index, U128 last_pool_borrow_index,
                                     uint32_t p2p_index_cursor_bps, uint32_t reserve_factor_bps) {
    GrowthFactors g{};
    g.pool_supply = x18::div_down(new_pool_supply_index, last_pool_supply_index);
    g.pool_borrow = x18::div_down(new_pool_borrow_index, last_pool_borrow_index);

    if (g.pool_supply <= g.pool_borrow) {
        U128 p2p = bps::weighted_avg(g.pool_supply, g.pool_borrow, p2p_index_cursor_bps);
        g.p2p_supply = p2p - bps::mul_down(zero_floor_sub(p2p, g.pool_supply), reserve_factor_bps);
        g.p2p_borrow = p2p + bps::mul_down(zero_floor_sub(g.pool_borrow, p2p), reserve_factor_bps);
    } else {
        g.p2p_supply = g.pool_borrow;
        g.p2p_borrow = g.pool_borrow;
    }
    return g;
}

U128 compute_p2p_index(U128 pool_growth, U128 p2p_growth, const MarketSideIndexes& last,
                       U128 scaled_delta, U128 scaled_p2p_total, U128 proportion_idle) {
    if (scaled_p2p_total == 0 || (scaled_delta == 0 && proportion_idle == 0)) {
        return x18::mul_down(last.p2p_index, p2p_growth);
    }

    U128 proportion_delta = min(
        x18::div_up(x18::mul_down(scaled_delta, last.pool_index),
                    x18::mul_down(scaled_p2p_total, last.p2p_index)),
        X18_ONE - proportion_idle);

    // Idle supply accrues nothing
    U128 growth = x18::mul_down(p2p_growth, X18_ONE - proportion_delta - proportion_idle) +
                  x18::mul_down(pool_growth, proportion_delta) +
                  proportion_idle;
    return x18::mul_down(last.p2p_index, growth);
}

U128 proportion_idle(const Market& market) {
    if (market.idle_supply == 0) return 0;

    U128 total_p2p_supply = x18::mul_down(market.deltas.supply.scaled_p2p_total,
                                          market.indexes.supply.p2p_index);
    if (total_p2p_supply == 0) return X18_ONE;
    return min(x18::div_up(market.idle_supply, total_p2p_supply), X18_ONE);
}

Indexes compute_indexes(const Market& market, U128 new_pool_supply_index, U128 new_pool_borrow_index) {
    const Indexes& last = market.indexes;

    GrowthFactors g = compute_growth_factors(
        new_pool_supply_index, new_pool_borrow_index,
        last.supply.pool_index, last.borrow.pool_index,
        market.p2p_index_cursor, market.reserve_factor);

    Indexes next;
    next.supply.pool_index = new_pool_supply_index;
    next.borrow.pool_index = new_pool_borrow_index;
    next.supply.p2p_index = compute_p2p_index(
        g.pool_supply, g.p2p_supply, last.supply,
        market.deltas.supply.scaled_delta, market.deltas.supply.scaled_p2p_total,
        proportion_idle(market));
    next.borrow.p2p_index = compute_p2p_index(
        g.pool_borrow, g.p2p_borrow, last.borrow,
        market.deltas.borrow.scaled_delta, market.deltas.borrow.scaled_p2p_total, 0);
    return next;
}

} // namespace interest

} // namespace peerlend
