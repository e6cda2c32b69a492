// =============================================================================
// risk_oracle.cpp - LedgerRiskOracle Implementation
// =============================================================================

#include "peerlend/risk_oracle.hpp"
#include "peerlend/interest.hpp"

#include <set>
#include <stdexcept>

namespace peerlend {

LedgerRiskOracle::LedgerRiskOracle(const Ledger& ledger, const PoolAdapter& pool, const PriceOracle& prices)
    : ledger_(ledger)
    , pool_(pool)
    , prices_(prices) {}

Indexes LedgerRiskOracle::updated_indexes(const Address& asset) const {
    const MarketState* state = ledger_.find(asset);
    if (!state) {
        throw std::invalid_argument("market not created: " + addresses::to_hex(asset));
    }

    const Market& market = state->market;
    PoolIndexes pool = pool_.pool_indexes(asset);

    // A pool index that went backwards is handed through untouched for the
    // caller to reject
    if (pool.supply < market.indexes.supply.pool_index || pool.borrow < market.indexes.borrow.pool_index) {
        Indexes raw = market.indexes;
        raw.supply.pool_index = pool.supply;
        raw.borrow.pool_index = pool.borrow;
        return raw;
    }

    return interest::compute_indexes(market, pool.supply, pool.borrow);
}

LiquidityData LedgerRiskOracle::liquidity_data(const Address& user, const Address& asset,
                                               U128 withdraw_amount, U128 borrow_amount) const {
    LiquidityData data;
    const UserMarkets& user_markets = ledger_.user_markets(user);

    for (const auto& collateral : user_markets.collaterals) {
        const MarketState* state = ledger_.find(collateral);
        auto config = pool_.reserve_config(collateral);
        if (!state || !config || !state->market.is_collateral) continue;

        U128 pool_index = pool_.pool_indexes(collateral).supply;
        U128 balance = x18::mul_down(state->balances.scaled_collateral(user), pool_index);
        if (collateral == asset) balance = zero_floor_sub(balance, withdraw_amount);

        U128 value = mul_div(balance, prices_.asset_price(collateral), pow10(config->decimals), false);
        data.borrowable += bps::mul_down(value, config->ltv_bps);
        data.max_debt += bps::mul_down(value, config->liquidation_threshold_bps);
    }

    std::set<Address> borrows = user_markets.borrows;
    if (borrow_amount != 0) borrows.insert(asset);

    for (const auto& borrowed : borrows) {
        const MarketState* state = ledger_.find(borrowed);
        auto config = pool_.reserve_config(borrowed);
        if (!state || !config) continue;

        Indexes indexes = updated_indexes(borrowed);
        U128 debt = x18::mul_up(state->balances.scaled_pool_balance(Side::BORROW, user), indexes.borrow.pool_index) +
                    x18::mul_up(state->balances.scaled_p2p_balance(Side::BORROW, user), indexes.borrow.p2p_index);
        if (borrowed == asset) debt += borrow_amount;

        data.debt += mul_div(debt, prices_.asset_price(borrowed), pow10(config->decimals), true);
    }

    return data;
}

U128 LedgerRiskOracle::health_factor(const Address& user, const Address& withdraw_asset,
                                     U128 withdraw_amount) const {
    LiquidityData data = liquidity_data(user, withdraw_asset, withdraw_amount, 0);
    if (data.debt == 0) return U128_MAX;
    return x18::div_down(data.max_debt, data.debt);
}

} // namespace peerlend
