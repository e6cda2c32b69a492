#ifndef PEERLEND_GUARD_HPP
#define PEERLEND_GUARD_HPP

#include <cstdint>
#include <optional>

#include "types.hpp"
#include "market.hpp"
#include "ledger.hpp"
#include "collaborators.hpp"

namespace peerlend {

// Cap in underlying units; nullopt when uncapped
std::optional<U128> cap_amount(U128 cap_tokens, uint8_t decimals);

struct LiquidationAuthorization {
    int32_t error_code = errors::OK;
    U128 close_factor = 0;   // X18 share of the debt a liquidator may repay
    U128 health_factor = 0;

    bool ok() const { return error_code == errors::OK; }
};

// =============================================================================
// AuthorizationGuard - every check an action passes before it mutates state
//
// validate_* covers input, permission and pause flags. authorize_* covers caps
// and the risk checks, and runs on the final amount. Each returns errors::OK
// or the first failing code.
// =============================================================================

class AuthorizationGuard {
public:
    AuthorizationGuard(const Ledger& ledger, const PoolAdapter& pool, const RiskOracle& risk,
                       uint8_t risk_category);

    void set_sentinel(const PriceOracleSentinel* sentinel) { sentinel_ = sentinel; }
    void set_risk_category(uint8_t category) { risk_category_ = category; }

    // =========================================================================
    // Building Blocks
    // =========================================================================

    int32_t validate_input(const Address& underlying, const Address& user, U128 amount) const;
    int32_t validate_permission(const Address& caller, const Address& on_behalf) const;
    int32_t validate_pause(const Address& underlying, ActionType action) const;

    // =========================================================================
    // Per Action
    // =========================================================================

    int32_t validate_supply(const Address& caller, const Address& underlying,
                            const Address& on_behalf, U128 amount) const;
    int32_t validate_supply_collateral(const Address& caller, const Address& underlying,
                                       const Address& on_behalf, U128 amount) const;
    int32_t validate_borrow(const Address& caller, const Address& underlying,
                            const Address& on_behalf, const Address& receiver, U128 amount) const;
    int32_t validate_repay(const Address& caller, const Address& underlying,
                           const Address& on_behalf, U128 amount) const;
    int32_t validate_withdraw(const Address& caller, const Address& underlying,
                              const Address& on_behalf, const Address& receiver, U128 amount) const;
    int32_t validate_withdraw_collateral(const Address& caller, const Address& underlying,
                                         const Address& on_behalf, const Address& receiver,
                                         U128 amount) const;

    // amount + true P2P supply + pool supply within the pool supply cap, the
    // P2P value taken at `indexes`; the side's value stays under
    // constants::MAX_SIDE_TOTAL
    int32_t authorize_supply(const Address& underlying, U128 amount, const Indexes& indexes) const;

    // Supply cap, then the market's collateral under constants::MAX_SIDE_TOTAL
    int32_t authorize_supply_collateral(const Address& underlying, U128 amount, const Indexes& indexes) const;

    // Borrow cap, side capacity, borrowing enabled, risk category, then
    // debt <= borrowable
    int32_t authorize_borrow(const Address& underlying, const Address& on_behalf, U128 amount,
                             const Indexes& indexes) const;

    // Health factor after the withdrawal stays >= 1
    int32_t authorize_withdraw_collateral(const Address& underlying, const Address& on_behalf,
                                          U128 amount) const;

    // Close factor bands, in order: deprecated borrow market, healthy position,
    // sentinel-gated soft band, hard band
    LiquidationAuthorization authorize_liquidate(const Address& underlying_borrowed,
                                                 const Address& underlying_collateral,
                                                 const Address& borrower) const;

private:
    int32_t check_supply_cap(const MarketState& state, U128 amount, const Indexes& indexes) const;

    const Ledger& ledger_;
    const PoolAdapter& pool_;
    const RiskOracle& risk_;
    const PriceOracleSentinel* sentinel_ = nullptr;
    uint8_t risk_category_;
};

} // namespace peerlend

#endif // PEERLEND_GUARD_HPP
