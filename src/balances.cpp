// =============================================================================
// balances.cpp - MarketBalances Implementation
// =============================================================================

#include "peerlend/balances.hpp"

#include <algorithm>

namespace peerlend {

U128 MarketBalances::scaled_collateral(const Address& user) const {
    auto it = collateral_.find(user);
    return it != collateral_.end() ? it->second : 0;
}

void MarketBalances::update(Side side, const Address& user, U128 on_pool, U128 in_p2p, bool demoting) {
    MatchingQueue& pool_queue = pool(side);
    MatchingQueue& p2p_queue = p2p(side);

    if (pool_queue.value_of(user) != on_pool) {
        pool_queue.update(user, on_pool, demoting);
    }
    if (p2p_queue.value_of(user) != in_p2p) {
        p2p_queue.update(user, in_p2p, true);
    }
}

void MarketBalances::set_collateral(const Address& user, U128 scaled) {
    auto it = collateral_.find(user);
    U128 former = it != collateral_.end() ? it->second : 0;
    collateral_total_ = collateral_total_ - former + scaled;

    if (scaled == 0) {
        if (it != collateral_.end()) collateral_.erase(it);
        return;
    }
    collateral_[user] = scaled;
}

UserBalance MarketBalances::balance_of(const Address& user) const {
    return UserBalance{
        pool_suppliers_.value_of(user),
        p2p_suppliers_.value_of(user),
        pool_borrowers_.value_of(user),
        p2p_borrowers_.value_of(user),
        scaled_collateral(user)
    };
}

std::vector<Address> MarketBalances::users(Side side) const {
    std::vector<Address> out = pool(side).users();
    for (const auto& user : p2p(side).users()) {
        if (!pool(side).contains(user)) out.push_back(user);
    }
    return out;
}

std::vector<Address> MarketBalances::collateral_holders() const {
    std::vector<Address> out;
    out.reserve(collateral_.size());
    for (const auto& [user, scaled] : collateral_) {
        out.push_back(user);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace peerlend
