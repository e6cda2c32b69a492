#ifndef PEERLEND_INTEREST_HPP
#define PEERLEND_INTEREST_HPP

#include <cstdint>

#include "types.hpp"
#include "market.hpp"

namespace peerlend {

namespace interest {

// X18 ratios of new to last index
struct GrowthFactors {
    U128 pool_supply;
    U128 pool_borrow;
    U128 p2p_supply;
    U128 p2p_borrow;
};

// The P2P rate sits between the pool rates at `p2p_index_cursor_bps`; the
// reserve factor moves both P2P rates back toward their pool rate. When the
// pool supply grows faster than the pool borrow, both P2P rates follow the
// pool borrow growth.
GrowthFactors compute_growth_factors(U128 new_pool_supply_index, U128 new_pool_borrow_index,
                                     U128 last_pool_supply_index, U128 last_pool_borrow_index,
                                     uint32_t p2p_index_cursor_bps, uint32_t reserve_factor_bps);

// New P2P index of one side. The share of the P2P notional covered by the
// delta grows at the pool rate, the idle share does not grow.
U128 compute_p2p_index(U128 pool_growth, U128 p2p_growth, const MarketSideIndexes& last,
                       U128 scaled_delta, U128 scaled_p2p_total, U128 proportion_idle);

// X18 share of the supply P2P notional held as idle supply, at most 1
U128 proportion_idle(const Market& market);

// Market indexes moved to the given pool indexes
Indexes compute_indexes(const Market& market, U128 new_pool_supply_index, U128 new_pool_borrow_index);

} // namespace interest

} // namespace peerlend

#endif // PEERLEND_INTEREST_HPP
