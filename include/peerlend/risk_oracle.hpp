#ifndef PEERLEND_RISK_ORACLE_HPP
#define PEERLEND_RISK_ORACLE_HPP

#include "types.hpp"
#include "market.hpp"
#include "ledger.hpp"
#include "collaborators.hpp"

namespace peerlend {

// =============================================================================
// LedgerRiskOracle - RiskOracle computed from the ledger and a price feed
//
// Collateral counts at the pool's LTV and liquidation threshold of its asset,
// and only in markets created as collateral markets. Collateral values round
// down, debt values round up.
// =============================================================================

class LedgerRiskOracle : public RiskOracle {
public:
    LedgerRiskOracle(const Ledger& ledger, const PoolAdapter& pool, const PriceOracle& prices);

    // Throws std::invalid_argument for an unknown market
    Indexes updated_indexes(const Address& asset) const override;

    LiquidityData liquidity_data(const Address& user, const Address& asset,
                                 U128 withdraw_amount, U128 borrow_amount) const override;

    U128 health_factor(const Address& user, const Address& withdraw_asset,
                       U128 withdraw_amount) const override;

private:
    const Ledger& ledger_;
    const PoolAdapter& pool_;
    const PriceOracle& prices_;
};

} // namespace peerlend

#endif // PEERLEND_RISK_ORACLE_HPP
