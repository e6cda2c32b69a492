#ifndef PEERLEND_MARKET_HPP
#define PEERLEND_MARKET_HPP

#include <cstdint>

#include "types.hpp"
#include "math.hpp"

namespace peerlend {

// =============================================================================
// Indexes (X18 accrual factors, non-decreasing)
// =============================================================================

struct MarketSideIndexes {
    U128 pool_index = X18_ONE;
    U128 p2p_index = X18_ONE;
};

struct Indexes {
    MarketSideIndexes supply;
    MarketSideIndexes borrow;

    const MarketSideIndexes& side(Side s) const { return s == Side::SUPPLY ? supply : borrow; }
    MarketSideIndexes& side(Side s) { return s == Side::SUPPLY ? supply : borrow; }

    bool operator==(const Indexes& other) const {
        return supply.pool_index == other.supply.pool_index &&
               supply.p2p_index == other.supply.p2p_index &&
               borrow.pool_index == other.borrow.pool_index &&
               borrow.p2p_index == other.borrow.p2p_index;
    }
    bool operator!=(const Indexes& other) const { return !(*this == other); }
};

// =============================================================================
// Deltas
// =============================================================================

struct MarketSideDelta {
    U128 scaled_delta = 0;      // P2P notional without a matched counterpart (pool units)
    U128 scaled_p2p_total = 0;  // Total P2P notional (P2P units)
};

struct Deltas {
    MarketSideDelta supply;
    MarketSideDelta borrow;

    const MarketSideDelta& side(Side s) const { return s == Side::SUPPLY ? supply : borrow; }
    MarketSideDelta& side(Side s) { return s == Side::SUPPLY ? supply : borrow; }
};

// =============================================================================
// Pause Statuses
// =============================================================================

struct PauseStatuses {
    bool is_supply_paused = false;
    bool is_supply_collateral_paused = false;
    bool is_borrow_paused = false;
    bool is_repay_paused = false;
    bool is_withdraw_paused = false;
    bool is_withdraw_collateral_paused = false;
    bool is_liquidate_collateral_paused = false;
    bool is_liquidate_borrow_paused = false;
    bool is_p2p_disabled = false;
    bool is_deprecated = false;

    bool is_paused(ActionType action) const;
    void set_paused(ActionType action, bool paused);
};

// =============================================================================
// Market Configuration (creation parameters)
// =============================================================================

struct MarketConfig {
    Address underlying{};
    uint32_t reserve_factor_bps = 0;     // Share of the P2P spread kept by the protocol
    uint32_t p2p_index_cursor_bps = 0;   // Position of the P2P rate between pool rates
    bool is_collateral = false;
    bool p2p_disabled = false;
};

// =============================================================================
// Market State
// =============================================================================

struct Market {
    Address underlying{};
    Indexes indexes;
    Deltas deltas;
    PauseStatuses pause_statuses;
    U128 idle_supply = 0;            // Underlying units withheld from a capped pool
    uint32_t reserve_factor = 0;     // bps
    uint32_t p2p_index_cursor = 0;   // bps
    bool is_collateral = false;
    uint64_t last_update = 0;

    // P2P notional of a side net of its delta, in underlying units
    U128 true_p2p(Side side) const;

    // P2P notional of a side including its delta, in underlying units
    U128 total_p2p(Side side) const;
};

// =============================================================================
// Scaled <-> Underlying Conversions
//
// Values of supply balances round down, values of debt round up. Credits to a
// supply balance round down, credits to a debt round up. Debits round up on
// both sides so a full repay or withdraw always clears the balance.
// =============================================================================

inline U128 to_underlying(Side side, U128 scaled, U128 index) {
    return side == Side::SUPPLY ? x18::mul_down(scaled, index) : x18::mul_up(scaled, index);
}

inline U128 to_scaled_credit(Side side, U128 amount, U128 index) {
    return side == Side::SUPPLY ? x18::div_down(amount, index) : x18::div_up(amount, index);
}

inline U128 to_scaled_debit(U128 amount, U128 index) {
    return x18::div_up(amount, index);
}

} // namespace peerlend

#endif // PEERLEND_MARKET_HPP
