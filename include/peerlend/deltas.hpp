#ifndef PEERLEND_DELTAS_HPP
#define PEERLEND_DELTAS_HPP

#include <optional>

#include "types.hpp"
#include "market.hpp"
#include "ledger.hpp"

namespace peerlend {

// Result of absorbing an amount into a delta or into idle supply
struct DeltaStep {
    U128 remaining;  // part of the amount left over
    U128 absorbed;   // part of the amount matched, in underlying units
};

struct IdleIncrease {
    U128 to_supply;      // part that fits under the pool supply cap
    U128 idle_increase;  // part withheld as idle supply
};

// =============================================================================
// DeltaTracker - deltas, P2P totals, P2P fee and idle supply of one market
// =============================================================================

class DeltaTracker {
public:
    explicit DeltaTracker(MarketContext& ctx) : ctx_(ctx) {}

    // Adds amount / pool_index (rounded down) to the side's delta
    void increase_delta(Side side, U128 amount, const MarketSideIndexes& indexes);

    // Matches up to the delta's underlying value against amount. The scaled
    // delta saturates at zero.
    DeltaStep decrease_delta(Side side, U128 amount, U128 pool_index);

    // Credits `amount` to the demanded side's P2P total and `promoted` to the
    // other side's. Returns the scaled credit of the demanded side.
    U128 increase_p2p(Side demanded, U128 promoted, U128 amount, const Indexes& indexes);

    // Debits `amount` from the demanded side's P2P total and `demoted` from
    // the other side's, both saturating.
    void decrease_p2p(Side demanded, U128 demoted, U128 amount, const Indexes& indexes);

    // Pays down the borrow P2P notional exceeding the net supply P2P notional.
    // Returns the unspent part of amount.
    U128 repay_fee(U128 amount, const Indexes& indexes);

    // Splits amount into what the pool can take and what becomes idle.
    // `headroom` is the room left under the supply cap, nullopt when uncapped.
    IdleIncrease increase_idle(U128 amount, std::optional<U128> headroom);

    // Matches amount against idle supply first
    DeltaStep decrease_idle(U128 amount);

    // Caps each side's delta at the side's P2P notional, at the market's
    // indexes. A side with no P2P user left has its P2P total and delta
    // cleared. Runs after every P2P change and every index update.
    void bound_deltas();

private:
    MarketContext& ctx_;
};

} // namespace peerlend

#endif // PEERLEND_DELTAS_HPP
