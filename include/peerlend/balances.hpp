#ifndef PEERLEND_BALANCES_HPP
#define PEERLEND_BALANCES_HPP

#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "buckets.hpp"

namespace peerlend {

// =============================================================================
// UserBalance - one user's scaled position in one market
// =============================================================================

struct UserBalance {
    U128 scaled_pool_supply;
    U128 scaled_p2p_supply;
    U128 scaled_pool_borrow;
    U128 scaled_p2p_borrow;
    U128 scaled_collateral;
};

// =============================================================================
// MarketBalances - per-market user balances and matching queues
//
// The queues are the balance store: a user's scaled pool balance on a side is
// its value in that side's pool queue, likewise for P2P. A queue total is the
// market's mirrored scaled pool (or P2P) balance for that side.
// =============================================================================

class MarketBalances {
public:
    MarketBalances() = default;

    MatchingQueue& pool(Side side) { return side == Side::SUPPLY ? pool_suppliers_ : pool_borrowers_; }
    const MatchingQueue& pool(Side side) const { return side == Side::SUPPLY ? pool_suppliers_ : pool_borrowers_; }

    MatchingQueue& p2p(Side side) { return side == Side::SUPPLY ? p2p_suppliers_ : p2p_borrowers_; }
    const MatchingQueue& p2p(Side side) const { return side == Side::SUPPLY ? p2p_suppliers_ : p2p_borrowers_; }

    U128 scaled_pool_balance(Side side, const Address& user) const { return pool(side).value_of(user); }
    U128 scaled_p2p_balance(Side side, const Address& user) const { return p2p(side).value_of(user); }
    U128 scaled_collateral(const Address& user) const;

    // Persist a user's side balances. Pool entries join the tail of their
    // bucket unless demoting; P2P entries join the head.
    void update(Side side, const Address& user, U128 on_pool, U128 in_p2p, bool demoting);

    void set_collateral(const Address& user, U128 scaled);

    U128 scaled_pool_total(Side side) const { return pool(side).total(); }
    U128 scaled_collateral_total() const { return collateral_total_; }

    UserBalance balance_of(const Address& user) const;

    // Users with a non-zero pool or P2P balance on a side
    std::vector<Address> users(Side side) const;

    // Users with non-zero collateral
    std::vector<Address> collateral_holders() const;

private:
    MatchingQueue pool_suppliers_;
    MatchingQueue p2p_suppliers_;
    MatchingQueue pool_borrowers_;
    MatchingQueue p2p_borrowers_;

    std::unordered_map<Address, U128, AddressHash> collateral_;
    U128 collateral_total_ = 0;
};

} // namespace peerlend

#endif // PEERLEND_BALANCES_HPP
