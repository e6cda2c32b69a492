// =============================================================================
// ledger.cpp - Ledger and MarketContext Implementation
// =============================================================================

#include "peerlend/ledger.hpp"

namespace peerlend {

MarketState* Ledger::create_market(const Address& underlying) {
    auto [it, inserted] = markets_.try_emplace(underlying);
    if (!inserted) return nullptr;
    it->second.market.underlying = underlying;
    return &it->second;
}

MarketState* Ledger::find(const Address& underlying) {
    auto it = markets_.find(underlying);
    return it != markets_.end() ? &it->second : nullptr;
}

const MarketState* Ledger::find(const Address& underlying) const {
    auto it = markets_.find(underlying);
    return it != markets_.end() ? &it->second : nullptr;
}

const UserMarkets& Ledger::user_markets(const Address& user) const {
    static const UserMarkets empty;
    auto it = user_markets_.find(user);
    return it != user_markets_.end() ? it->second : empty;
}

void Ledger::set_collateral_member(const Address& user, const Address& underlying, bool member) {
    if (member) {
        user_markets_[user].collaterals.insert(underlying);
        return;
    }
    auto it = user_markets_.find(user);
    if (it != user_markets_.end()) it->second.collaterals.erase(underlying);
}

void Ledger::set_borrow_member(const Address& user, const Address& underlying, bool member) {
    if (member) {
        user_markets_[user].borrows.insert(underlying);
        return;
    }
    auto it = user_markets_.find(user);
    if (it != user_markets_.end()) it->second.borrows.erase(underlying);
}

bool Ledger::is_managed_by(const Address& delegator, const Address& manager) const {
    return managers_.count({delegator, manager}) != 0;
}

void Ledger::set_manager(const Address& delegator, const Address& manager, bool approved) {
    if (approved) {
        managers_.insert({delegator, manager});
    } else {
        managers_.erase({delegator, manager});
    }
}

// =============================================================================
// MarketContext
// =============================================================================

void MarketContext::update_user(Side side, const Address& user, U128 on_pool, U128 in_p2p, bool demoting) {
    state.balances.update(side, user, on_pool, in_p2p, demoting);

    if (side == Side::BORROW) {
        ledger.set_borrow_member(user, underlying(), on_pool != 0 || in_p2p != 0);
    }
}

void MarketContext::emit_p2p_totals() {
    events.on_p2p_totals_updated(P2PTotalsUpdated{
        underlying(),
        state.market.deltas.supply.scaled_p2p_total,
        state.market.deltas.borrow.scaled_p2p_total
    });
}

void MarketContext::emit_delta(Side side) {
    events.on_delta_updated(DeltaUpdated{
        underlying(), side, state.market.deltas.side(side).scaled_delta
    });
}

void MarketContext::emit_idle_supply() {
    events.on_idle_supply_updated(IdleSupplyUpdated{underlying(), state.market.idle_supply});
}

} // namespace peerlend
