#ifndef PEERLEND_LEDGER_HPP
#define PEERLEND_LEDGER_HPP

#include <map>
#include <set>
#include <optional>
#include <utility>

#include "types.hpp"
#include "market.hpp"
#include "balances.hpp"
#include "events.hpp"

namespace peerlend {

// =============================================================================
// Market State (market parameters plus its user balances)
// =============================================================================

struct MarketState {
    Market market;
    MarketBalances balances;
};

// =============================================================================
// User Market Sets
// =============================================================================

struct UserMarkets {
    std::set<Address> collaterals;  // assets with non-zero collateral
    std::set<Address> borrows;      // assets with non-zero pool or P2P debt
};

// =============================================================================
// Ledger - every market, user market sets and manager approvals
// =============================================================================

class Ledger {
public:
    Ledger() = default;

    // Non-copyable
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    bool market_exists(const Address& underlying) const { return markets_.count(underlying) != 0; }

    // Creates the market state; nullptr when it already exists
    MarketState* create_market(const Address& underlying);

    MarketState* find(const Address& underlying);
    const MarketState* find(const Address& underlying) const;

    const std::map<Address, MarketState>& markets() const { return markets_; }

    const UserMarkets& user_markets(const Address& user) const;

    void set_collateral_member(const Address& user, const Address& underlying, bool member);
    void set_borrow_member(const Address& user, const Address& underlying, bool member);

    bool is_managed_by(const Address& delegator, const Address& manager) const;
    void set_manager(const Address& delegator, const Address& manager, bool approved);

private:
    std::map<Address, MarketState> markets_;
    std::map<Address, UserMarkets> user_markets_;
    std::set<std::pair<Address, Address>> managers_;  // (delegator, manager)
};

// =============================================================================
// MarketContext - explicit handle threaded through every accounting step
// =============================================================================

struct MarketContext {
    Ledger& ledger;
    MarketState& state;
    EventSink& events;

    Market& market() { return state.market; }
    const Market& market() const { return state.market; }
    MarketBalances& balances() { return state.balances; }
    const Address& underlying() const { return state.market.underlying; }

    // Persist a user's balances on a side and keep the borrow set in sync
    void update_user(Side side, const Address& user, U128 on_pool, U128 in_p2p, bool demoting);

    void emit_p2p_totals();
    void emit_delta(Side side);
    void emit_idle_supply();
};

} // namespace peerlend

#endif // PEERLEND_LEDGER_HPP
