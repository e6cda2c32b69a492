// PeerLend - Simulation Example
// Runs a short supply / borrow / withdraw / repay script against an in-memory
// pool and prints every observation as a JSON line.
//
// Usage: peerlend_simulate [config.toml]

#include <peerlend/peerlend.hpp>

#include <iostream>
#include <map>

using namespace peerlend;

namespace {

// Pool with fixed indexes, caps and prices, tracking totals from the
// operations the engine reports
class SimulatedPool : public PoolAdapter, public PriceOracle {
public:
    void list(const Address& asset, ReserveConfig config, U128 price) {
        reserves_[asset] = config;
        prices_[asset] = price;
    }

    void apply(const Address& asset, const PoolOperations& ops) {
        supplied_[asset] = zero_floor_sub(supplied_[asset] + ops.supply, ops.withdraw);
        borrowed_[asset] = zero_floor_sub(borrowed_[asset] + ops.borrow, ops.repay);
    }

    std::optional<ReserveConfig> reserve_config(const Address& asset) const override {
        auto it = reserves_.find(asset);
        if (it == reserves_.end()) return std::nullopt;
        return it->second;
    }

    U128 total_supplied(const Address& asset) const override { return lookup(supplied_, asset); }
    U128 total_borrowed(const Address& asset) const override { return lookup(borrowed_, asset); }
    PoolIndexes pool_indexes(const Address&) const override { return PoolIndexes{}; }
    U128 asset_price(const Address& asset) const override { return lookup(prices_, asset); }

private:
    static U128 lookup(const std::map<Address, U128>& m, const Address& asset) {
        auto it = m.find(asset);
        return it != m.end() ? it->second : 0;
    }

    std::map<Address, ReserveConfig> reserves_;
    std::map<Address, U128> supplied_;
    std::map<Address, U128> borrowed_;
    std::map<Address, U128> prices_;
};

void report(const char* step, const ActionResult& result) {
    std::cerr << step << ": " << error_string(result.error_code)
              << " amount=" << to_string(result.amount)
              << " to_pool=" << to_string(result.to_pool)
              << " to_peer=" << to_string(result.to_peer) << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    EngineConfig config;
    try {
        if (argc > 1) config = EngineConfig::from_file(argv[1]);
        config.init_logging();
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    const Address dai = addresses::from_id(0xDA1);
    const Address weth = addresses::from_id(0xE7);
    const Address alice = addresses::from_id(1);
    const Address bob = addresses::from_id(2);

    SimulatedPool pool;
    ReserveConfig reserve;
    reserve.ltv_bps = 8000;
    reserve.liquidation_threshold_bps = 8500;
    pool.list(dai, reserve, X18_ONE);
    pool.list(weth, reserve, x18::from_int(2000));

    Engine engine(pool, pool, config);
    JsonEventSink sink(std::cout);
    engine.set_event_sink(&sink);

    for (const auto& market : {MarketConfig{dai, 1000, 3333, false, false},
                               MarketConfig{weth, 1000, 3333, true, false}}) {
        int32_t code = engine.create_market(market);
        if (code != errors::OK) {
            std::cerr << "create_market failed: " << error_string(code) << "\n";
            return 1;
        }
    }

    auto run = [&](const char* step, const Address& asset, ActionResult result) {
        report(step, result);
        if (result.ok()) pool.apply(asset, result.pool_ops);
    };

    // Bob posts collateral and borrows from the pool
    run("bob supply_collateral", weth, engine.supply_collateral(bob, weth, x18::from_int(1), bob));
    run("bob borrow", dai, engine.borrow(bob, dai, x18::from_int(500), bob, bob));

    // Alice's supply is matched with Bob's pool debt
    run("alice supply", dai, engine.supply(alice, dai, x18::from_int(800), alice));

    // Alice leaves; Bob is demoted back to the pool
    run("alice withdraw", dai, engine.withdraw(alice, dai, x18::from_int(800), alice, alice));

    // Bob repays everything
    run("bob repay", dai, engine.repay(bob, dai, x18::from_int(500), bob));

    auto stats = engine.get_stats();
    std::cerr << "actions=" << stats.total_actions << " rejected=" << stats.rejected_actions << "\n";

    Logger::shutdown();
    return 0;
}
