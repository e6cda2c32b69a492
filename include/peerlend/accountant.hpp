#ifndef PEERLEND_ACCOUNTANT_HPP
#define PEERLEND_ACCOUNTANT_HPP

#include <cstdint>
#include <optional>

#include "types.hpp"
#include "market.hpp"
#include "ledger.hpp"

namespace peerlend {

// =============================================================================
// Pool Operations (what the host must execute against the external pool)
// =============================================================================

struct PoolOperations {
    U128 supply = 0;
    U128 repay = 0;
    U128 borrow = 0;
    U128 withdraw = 0;
};

// =============================================================================
// Action Result
// =============================================================================

struct ActionResult {
    int32_t error_code = errors::OK;
    U128 amount = 0;    // amount actually processed, underlying units
    U128 to_pool = 0;   // part settled against the user's pool balance
    U128 to_peer = 0;   // part settled against the user's P2P balance
    U128 on_pool = 0;   // resulting pool balance (or collateral), underlying units
    U128 in_p2p = 0;    // resulting P2P balance, underlying units
    U128 scaled_on_pool = 0;
    U128 scaled_in_p2p = 0;
    U128 fee_repaid = 0;
    U128 idle_matched = 0;
    U128 idle_increase = 0;
    PoolOperations pool_ops;

    bool ok() const { return error_code == errors::OK; }

    static ActionResult error(int32_t code) {
        ActionResult result;
        result.error_code = code;
        return result;
    }
};

// =============================================================================
// ActionAccountant - one state transition per action
//
// No validation happens here: callers run the AuthorizationGuard first and
// store the market's current indexes before calling in.
// =============================================================================

class ActionAccountant {
public:
    explicit ActionAccountant(MarketContext& ctx) : ctx_(ctx) {}

    ActionResult account_supply(const Address& from, const Address& on_behalf,
                                U128 amount, uint32_t max_iterations);

    ActionResult account_borrow(const Address& from, const Address& on_behalf,
                                U128 amount, uint32_t max_iterations);

    // `supply_headroom` is the room left under the pool supply cap, nullopt
    // when the pool has none
    ActionResult account_repay(const Address& from, const Address& on_behalf,
                               U128 amount, uint32_t max_iterations,
                               std::optional<U128> supply_headroom);

    ActionResult account_withdraw(const Address& from, const Address& on_behalf,
                                  U128 amount, uint32_t max_iterations);

    ActionResult account_supply_collateral(const Address& from, const Address& on_behalf, U128 amount);
    ActionResult account_withdraw_collateral(const Address& from, const Address& on_behalf, U128 amount);

private:
    void emit_balance_action(ActionType action, const Address& from, const Address& on_behalf,
                             const ActionResult& result);

    MarketContext& ctx_;
};

} // namespace peerlend

#endif // PEERLEND_ACCOUNTANT_HPP
