// PeerLend - Shared Test Fixtures

#ifndef PEERLEND_TEST_SUPPORT_HPP
#define PEERLEND_TEST_SUPPORT_HPP

#include <catch2/catch.hpp>
#include <peerlend/peerlend.hpp>

#include <map>
#include <utility>

namespace Catch {
template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 value) { return peerlend::to_string(value); }
};
}  // namespace Catch

namespace peerlend::test {

inline Address addr(uint64_t id) { return addresses::from_id(id); }

// Whole tokens of an 18-decimal asset
inline U128 tokens(uint64_t n) { return x18::from_int(n); }

// X18 value of pct / 100
inline U128 percent(uint64_t pct) { return X18_ONE / 100 * pct; }

// =============================================================================
// Collaborators
// =============================================================================

class MockPool : public PoolAdapter {
public:
    std::map<Address, ReserveConfig> reserves;
    std::map<Address, U128> supplied;
    std::map<Address, U128> borrowed;
    std::map<Address, PoolIndexes> indexes;

    std::optional<ReserveConfig> reserve_config(const Address& asset) const override {
        auto it = reserves.find(asset);
        if (it == reserves.end()) return std::nullopt;
        return it->second;
    }

    U128 total_supplied(const Address& asset) const override { return lookup(supplied, asset); }
    U128 total_borrowed(const Address& asset) const override { return lookup(borrowed, asset); }

    PoolIndexes pool_indexes(const Address& asset) const override {
        auto it = indexes.find(asset);
        return it != indexes.end() ? it->second : PoolIndexes{};
    }

private:
    static U128 lookup(const std::map<Address, U128>& m, const Address& asset) {
        auto it = m.find(asset);
        return it != m.end() ? it->second : 0;
    }
};

// Fixed answers, for guard tests
class MockRisk : public RiskOracle {
public:
    std::map<Address, Indexes> indexes;
    LiquidityData data;
    U128 hf = U128_MAX;

    Indexes updated_indexes(const Address& asset) const override {
        auto it = indexes.find(asset);
        return it != indexes.end() ? it->second : Indexes{};
    }

    LiquidityData liquidity_data(const Address&, const Address&, U128, U128) const override {
        return data;
    }

    U128 health_factor(const Address&, const Address&, U128) const override { return hf; }
};

class MockSentinel : public PriceOracleSentinel {
public:
    bool allowed = true;
    bool is_liquidation_allowed() const override { return allowed; }
};

class MockPrices : public PriceOracle {
public:
    std::map<Address, U128> prices;

    U128 asset_price(const Address& asset) const override {
        auto it = prices.find(asset);
        return it != prices.end() ? it->second : 0;
    }
};

// =============================================================================
// One market with a recording sink, indexes at 1.0
// =============================================================================

struct MarketFixture {
    Ledger ledger;
    RecordingEventSink events;
    MarketState* state;
    MarketContext ctx;

    MarketFixture()
        : state(ledger.create_market(addr(100)))
        , ctx{ledger, *state, events} {}

    Market& market() { return state->market; }
    MarketBalances& balances() { return state->balances; }

    // Places a user without going through the accountant
    void place(Side side, uint64_t user, U128 on_pool, U128 in_p2p) {
        ctx.update_user(side, addr(user), on_pool, in_p2p, false);
    }

    U128 on_pool(Side side, uint64_t user) const { return state->balances.scaled_pool_balance(side, addr(user)); }
    U128 in_p2p(Side side, uint64_t user) const { return state->balances.scaled_p2p_balance(side, addr(user)); }
};

// =============================================================================
// Engine over a DAI borrow market and a WETH collateral market
//
// Both assets have 80% LTV and 85% liquidation threshold, DAI at 1 and WETH
// at 2000. Pool indexes start at 1.0.
// =============================================================================

struct EngineFixture {
    const Address dai = addr(0xDA1);
    const Address weth = addr(0xE7);
    const Address alice = addr(1);
    const Address bob = addr(2);
    const Address carol = addr(3);

    MockPool pool;
    MockPrices prices;
    RecordingEventSink events;
    Engine engine;

    explicit EngineFixture(EngineConfig config = {})
        : engine(pool, prices, std::move(config)) {
        ReserveConfig reserve;
        reserve.ltv_bps = 8000;
        reserve.liquidation_threshold_bps = 8500;
        pool.reserves[dai] = reserve;
        pool.reserves[weth] = reserve;
        prices.prices[dai] = X18_ONE;
        prices.prices[weth] = x18::from_int(2000);

        engine.set_event_sink(&events);
        engine.create_market(MarketConfig{dai, 0, 5000, false, false});
        engine.create_market(MarketConfig{weth, 0, 5000, true, false});
        events.clear();
    }

    // Posts WETH collateral and borrows DAI from the pool
    ActionResult open_debt(const Address& user, uint64_t weth_tokens, uint64_t dai_tokens) {
        engine.supply_collateral(user, weth, x18::from_int(weth_tokens), user);
        return engine.borrow(user, dai, x18::from_int(dai_tokens), user, user);
    }
};

// total * p2p_index >= delta * pool_index for both sides
inline bool delta_within_p2p(const Market& market) {
    for (Side side : {Side::SUPPLY, Side::BORROW}) {
        const MarketSideDelta& d = market.deltas.side(side);
        const MarketSideIndexes& idx = market.indexes.side(side);
        if (x18::mul_up(d.scaled_p2p_total, idx.p2p_index) < x18::mul_down(d.scaled_delta, idx.pool_index)) {
            return false;
        }
    }
    return true;
}

// Sum of users' pool balances equals the queue total for both sides
inline bool pool_totals_consistent(const MarketBalances& balances) {
    for (Side side : {Side::SUPPLY, Side::BORROW}) {
        U128 sum = 0;
        for (const auto& user : balances.pool(side).users()) {
            sum += balances.scaled_pool_balance(side, user);
        }
        if (sum != balances.scaled_pool_total(side)) return false;
    }
    return true;
}

}  // namespace peerlend::test

#endif  // PEERLEND_TEST_SUPPORT_HPP
