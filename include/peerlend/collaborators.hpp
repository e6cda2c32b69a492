#ifndef PEERLEND_COLLABORATORS_HPP
#define PEERLEND_COLLABORATORS_HPP

#include <cstdint>
#include <optional>

#include "types.hpp"
#include "market.hpp"

namespace peerlend {

// =============================================================================
// External Pool
// =============================================================================

struct ReserveConfig {
    U128 supply_cap = 0;             // whole tokens, 0 = uncapped
    U128 borrow_cap = 0;             // whole tokens, 0 = uncapped
    uint8_t decimals = 18;
    bool borrowing_enabled = true;
    uint8_t risk_category = 0;
    uint32_t ltv_bps = 0;
    uint32_t liquidation_threshold_bps = 0;
};

struct PoolIndexes {
    U128 supply = X18_ONE;
    U128 borrow = X18_ONE;
};

class PoolAdapter {
public:
    virtual ~PoolAdapter() = default;

    // nullopt when the pool does not list the asset
    virtual std::optional<ReserveConfig> reserve_config(const Address& asset) const = 0;

    // Pool-wide totals in underlying units
    virtual U128 total_supplied(const Address& asset) const = 0;
    virtual U128 total_borrowed(const Address& asset) const = 0;

    virtual PoolIndexes pool_indexes(const Address& asset) const = 0;
};

// =============================================================================
// Risk / Health
// =============================================================================

// Base-currency values of a user's position
struct LiquidityData {
    U128 borrowable = 0;  // sum of collateral * LTV
    U128 max_debt = 0;    // sum of collateral * liquidation threshold
    U128 debt = 0;        // sum of debt
};

class RiskOracle {
public:
    virtual ~RiskOracle() = default;

    // Indexes of a created market for the current moment
    virtual Indexes updated_indexes(const Address& asset) const = 0;

    // Position as if `withdraw_amount` of `asset` collateral were removed and
    // `borrow_amount` of `asset` were borrowed
    virtual LiquidityData liquidity_data(const Address& user, const Address& asset,
                                         U128 withdraw_amount, U128 borrow_amount) const = 0;

    // X18 max_debt / debt after withdrawing collateral; U128 max without debt
    virtual U128 health_factor(const Address& user, const Address& withdraw_asset,
                               U128 withdraw_amount) const = 0;
};

// =============================================================================
// Prices
// =============================================================================

class PriceOracleSentinel {
public:
    virtual ~PriceOracleSentinel() = default;
    virtual bool is_liquidation_allowed() const = 0;
};

class PriceOracle {
public:
    virtual ~PriceOracle() = default;

    // Base-currency price of one whole token
    virtual U128 asset_price(const Address& asset) const = 0;
};

} // namespace peerlend

#endif // PEERLEND_COLLABORATORS_HPP
