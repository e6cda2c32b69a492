// =============================================================================
// market.cpp - Market State Helpers
// =============================================================================

#include "peerlend/market.hpp"

namespace peerlend {

bool PauseStatuses::is_paused(ActionType action) const {
    switch (action) {
        case ActionType::SUPPLY: return is_supply_paused;
        case ActionType::SUPPLY_COLLATERAL: return is_supply_collateral_paused;
        case ActionType::BORROW: return is_borrow_paused;
        case ActionType::REPAY: return is_repay_paused;
        case ActionType::WITHDRAW: return is_withdraw_paused;
        case ActionType::WITHDRAW_COLLATERAL: return is_withdraw_collateral_paused;
        case ActionType::LIQUIDATE_COLLATERAL: return is_liquidate_collateral_paused;
        case ActionType::LIQUIDATE_BORROW: return is_liquidate_borrow_paused;
    }
    return false;
}

void PauseStatuses::set_paused(ActionType action, bool paused) {
    switch (action) {
        case ActionType::SUPPLY: is_supply_paused = paused; break;
        case ActionType::SUPPLY_COLLATERAL: is_supply_collateral_paused = paused; break;
        case ActionType::BORROW: is_borrow_paused = paused; break;
        case ActionType::REPAY: is_repay_paused = paused; break;
        case ActionType::WITHDRAW: is_withdraw_paused = paused; break;
        case ActionType::WITHDRAW_COLLATERAL: is_withdraw_collateral_paused = paused; break;
        case ActionType::LIQUIDATE_COLLATERAL: is_liquidate_collateral_paused = paused; break;
        case ActionType::LIQUIDATE_BORROW: is_liquidate_borrow_paused = paused; break;
    }
}

U128 Market::true_p2p(Side side) const {
    const MarketSideDelta& delta = deltas.side(side);
    const MarketSideIndexes& idx = indexes.side(side);
    return zero_floor_sub(x18::mul_down(delta.scaled_p2p_total, idx.p2p_index),
                          x18::mul_up(delta.scaled_delta, idx.pool_index));
}

U128 Market::total_p2p(Side side) const {
    const MarketSideDelta& delta = deltas.side(side);
    return x18::mul_down(delta.scaled_p2p_total, indexes.side(side).p2p_index);
}

} // namespace peerlend
