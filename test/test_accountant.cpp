// PeerLend - Action Accountant Tests
//
// Most cases keep indexes at 1.0 so scaled balances equal underlying
// amounts. The last ones run on grown indexes.

#include <catch2/catch.hpp>

#include "test_support.hpp"

using namespace peerlend;
using namespace peerlend::test;

namespace {

void set_p2p_totals(MarketFixture& f, U128 supply, U128 borrow) {
    f.market().deltas.supply.scaled_p2p_total = supply;
    f.market().deltas.borrow.scaled_p2p_total = borrow;
}

}  // namespace

TEST_CASE("Supply", "[accountant]") {
    MarketFixture f;
    ActionAccountant accountant(f.ctx);
    const Address alice = addr(1);

    SECTION("Empty market goes to the pool") {
        ActionResult r = accountant.account_supply(alice, alice, tokens(100), 4);
        REQUIRE(r.ok());
        REQUIRE(r.to_pool == tokens(100));
        REQUIRE(r.to_peer == U128(0));
        REQUIRE(r.on_pool == tokens(100));
        REQUIRE(r.in_p2p == U128(0));
        REQUIRE(r.pool_ops.supply == tokens(100));
        REQUIRE(f.market().deltas.borrow.scaled_delta == U128(0));
        REQUIRE(f.events.balance_actions.size() == 1);
        REQUIRE(f.events.balance_actions[0].action == ActionType::SUPPLY);
        REQUIRE(f.events.balance_actions[0].amount == tokens(100));
    }

    SECTION("Matched with a pool borrower") {
        f.place(Side::BORROW, 2, tokens(100), 0);

        ActionResult r = accountant.account_supply(alice, alice, tokens(100), 4);
        REQUIRE(r.to_peer == tokens(100));
        REQUIRE(r.to_pool == U128(0));
        REQUIRE(r.in_p2p == tokens(100));
        REQUIRE(r.pool_ops.repay == tokens(100));
        REQUIRE(f.in_p2p(Side::BORROW, 2) == tokens(100));
        REQUIRE(f.on_pool(Side::BORROW, 2) == U128(0));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == tokens(100));
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == tokens(100));
    }

    SECTION("No budget skips matching") {
        f.place(Side::BORROW, 2, tokens(100), 0);

        ActionResult r = accountant.account_supply(alice, alice, tokens(100), 0);
        REQUIRE(r.to_pool == tokens(100));
        REQUIRE(r.to_peer == U128(0));
        REQUIRE(f.on_pool(Side::BORROW, 2) == tokens(100));
    }

    SECTION("Borrow delta is matched before pool borrowers") {
        f.place(Side::BORROW, 3, 0, tokens(30));
        f.market().deltas.borrow.scaled_delta = tokens(30);
        set_p2p_totals(f, 0, tokens(30));
        f.place(Side::BORROW, 2, tokens(100), 0);

        ActionResult r = accountant.account_supply(alice, alice, tokens(100), 4);
        REQUIRE(r.to_peer == tokens(100));
        REQUIRE(f.market().deltas.borrow.scaled_delta == U128(0));
        REQUIRE(f.in_p2p(Side::BORROW, 2) == tokens(70));
        REQUIRE(f.on_pool(Side::BORROW, 2) == tokens(30));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == tokens(100));
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == tokens(100));
        REQUIRE(delta_within_p2p(f.market()));
    }
}

TEST_CASE("Borrow", "[accountant]") {
    MarketFixture f;
    ActionAccountant accountant(f.ctx);
    const Address bob = addr(2);

    SECTION("Empty market borrows from the pool") {
        ActionResult r = accountant.account_borrow(bob, bob, tokens(50), 4);
        REQUIRE(r.to_pool == tokens(50));
        REQUIRE(r.pool_ops.borrow == tokens(50));
        REQUIRE(f.ledger.user_markets(bob).borrows.count(addr(100)) == 1);
    }

    SECTION("Idle supply, then supply delta, then pool suppliers") {
        f.market().idle_supply = tokens(20);
        f.market().deltas.supply.scaled_delta = tokens(10);
        f.place(Side::SUPPLY, 4, 0, tokens(30));
        set_p2p_totals(f, tokens(30), 0);
        f.place(Side::SUPPLY, 1, tokens(100), 0);

        ActionResult r = accountant.account_borrow(bob, bob, tokens(50), 4);
        REQUIRE(r.to_peer == tokens(50));
        REQUIRE(r.to_pool == U128(0));
        REQUIRE(r.idle_matched == tokens(20));
        REQUIRE(r.pool_ops.withdraw == tokens(30));
        REQUIRE(f.market().idle_supply == U128(0));
        REQUIRE(f.market().deltas.supply.scaled_delta == U128(0));
        REQUIRE(f.on_pool(Side::SUPPLY, 1) == tokens(80));
        REQUIRE(f.in_p2p(Side::SUPPLY, 1) == tokens(20));
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == tokens(50));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == tokens(50));
    }
}

TEST_CASE("Repay", "[accountant]") {
    MarketFixture f;
    ActionAccountant accountant(f.ctx);
    const Address bob = addr(2);

    SECTION("Pool debt first, then a breaking repay") {
        f.place(Side::BORROW, 2, tokens(60), tokens(40));
        f.place(Side::SUPPLY, 5, 0, tokens(40));
        set_p2p_totals(f, tokens(40), tokens(40));

        ActionResult r = accountant.account_repay(bob, bob, tokens(70), 4, std::nullopt);
        REQUIRE(r.amount == tokens(70));
        REQUIRE(r.to_pool == tokens(60));
        REQUIRE(r.to_peer == tokens(10));
        REQUIRE(r.on_pool == U128(0));
        REQUIRE(r.in_p2p == tokens(30));
        REQUIRE(r.pool_ops.repay == tokens(60));
        REQUIRE(r.pool_ops.supply == tokens(10));
        REQUIRE(f.on_pool(Side::SUPPLY, 5) == tokens(10));
        REQUIRE(f.in_p2p(Side::SUPPLY, 5) == tokens(30));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == tokens(30));
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == tokens(30));
    }

    SECTION("Capped pool turns the excess into idle supply") {
        f.place(Side::BORROW, 2, tokens(60), tokens(40));
        f.place(Side::SUPPLY, 5, 0, tokens(40));
        set_p2p_totals(f, tokens(40), tokens(40));

        ActionResult r = accountant.account_repay(bob, bob, tokens(70), 4, tokens(4));
        REQUIRE(r.idle_increase == tokens(6));
        REQUIRE(r.pool_ops.supply == tokens(4));
        REQUIRE(f.market().idle_supply == tokens(6));
        REQUIRE(f.on_pool(Side::SUPPLY, 5) == tokens(4));
        REQUIRE(f.in_p2p(Side::SUPPLY, 5) == tokens(36));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == tokens(36));
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == tokens(30));
    }

    SECTION("P2P fee is paid before suppliers are demoted") {
        f.place(Side::BORROW, 2, 0, tokens(50));
        f.place(Side::SUPPLY, 5, 0, tokens(45));
        set_p2p_totals(f, tokens(45), tokens(50));

        ActionResult r = accountant.account_repay(bob, bob, tokens(20), 4, std::nullopt);
        REQUIRE(r.fee_repaid == tokens(5));
        REQUIRE(r.pool_ops.supply == tokens(15));
        REQUIRE(f.in_p2p(Side::SUPPLY, 5) == tokens(30));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == tokens(30));
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == tokens(30));
    }

    SECTION("Pool borrowers replace the departing borrower") {
        f.place(Side::BORROW, 2, 0, tokens(50));
        f.place(Side::BORROW, 3, tokens(80), 0);
        f.place(Side::SUPPLY, 5, 0, tokens(50));
        set_p2p_totals(f, tokens(50), tokens(50));

        ActionResult r = accountant.account_repay(bob, bob, tokens(50), 4, std::nullopt);
        REQUIRE(r.pool_ops.repay == tokens(50));
        REQUIRE(r.pool_ops.supply == U128(0));
        REQUIRE(f.in_p2p(Side::BORROW, 3) == tokens(50));
        REQUIRE(f.in_p2p(Side::SUPPLY, 5) == tokens(50));
        REQUIRE(f.ledger.user_markets(bob).borrows.empty());
    }

    SECTION("No demotion budget leaves a supply delta") {
        f.place(Side::BORROW, 2, 0, tokens(50));
        f.place(Side::SUPPLY, 5, 0, tokens(50));
        set_p2p_totals(f, tokens(50), tokens(50));

        accountant.account_repay(bob, bob, tokens(50), 0, std::nullopt);
        REQUIRE(f.market().deltas.supply.scaled_delta == tokens(50));
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == U128(0));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == tokens(50));
        REQUIRE(f.in_p2p(Side::SUPPLY, 5) == tokens(50));
        REQUIRE(delta_within_p2p(f.market()));
    }
}

TEST_CASE("Withdraw", "[accountant]") {
    MarketFixture f;
    ActionAccountant accountant(f.ctx);
    const Address alice = addr(1);

    f.place(Side::SUPPLY, 1, 0, tokens(100));
    f.place(Side::BORROW, 2, 0, tokens(100));
    set_p2p_totals(f, tokens(100), tokens(100));

    SECTION("Pool suppliers replace the departing supplier") {
        f.place(Side::SUPPLY, 3, tokens(100), 0);

        ActionResult r = accountant.account_withdraw(alice, alice, tokens(100), 4);
        REQUIRE(r.to_peer == tokens(100));
        REQUIRE(r.pool_ops.withdraw == tokens(100));
        REQUIRE(r.pool_ops.borrow == U128(0));
        REQUIRE(f.in_p2p(Side::SUPPLY, 3) == tokens(100));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == tokens(100));
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == tokens(100));
    }

    SECTION("Breaking withdraw demotes borrowers") {
        ActionResult r = accountant.account_withdraw(alice, alice, tokens(60), 4);
        REQUIRE(r.in_p2p == tokens(40));
        REQUIRE(r.pool_ops.borrow == tokens(60));
        REQUIRE(f.on_pool(Side::BORROW, 2) == tokens(60));
        REQUIRE(f.in_p2p(Side::BORROW, 2) == tokens(40));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == tokens(40));
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == tokens(40));
        REQUIRE(f.market().deltas.borrow.scaled_delta == U128(0));
    }

    SECTION("No budget raises the borrow delta") {
        ActionResult r = accountant.account_withdraw(alice, alice, tokens(100), 0);
        REQUIRE(r.pool_ops.borrow == tokens(100));
        REQUIRE(f.market().deltas.borrow.scaled_delta == tokens(100));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == U128(0));
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == tokens(100));
        REQUIRE(f.in_p2p(Side::BORROW, 2) == tokens(100));
        REQUIRE(delta_within_p2p(f.market()));
    }

    SECTION("Idle supply is consumed before matching") {
        f.market().idle_supply = tokens(30);

        ActionResult r = accountant.account_withdraw(alice, alice, tokens(30), 4);
        REQUIRE(r.idle_matched == tokens(30));
        REQUIRE(r.pool_ops.withdraw == U128(0));
        REQUIRE(r.pool_ops.borrow == U128(0));
        REQUIRE(f.market().idle_supply == U128(0));
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == tokens(70));
        REQUIRE(f.in_p2p(Side::BORROW, 2) == tokens(100));
    }
}

TEST_CASE("Supply then withdraw leaves nothing behind", "[accountant]") {
    MarketFixture f;
    ActionAccountant accountant(f.ctx);
    const Address alice = addr(1);

    accountant.account_supply(alice, alice, tokens(100), 4);
    ActionResult r = accountant.account_withdraw(alice, alice, tokens(100), 4);
    REQUIRE(r.amount == tokens(100));
    REQUIRE(r.on_pool == U128(0));
    REQUIRE(r.in_p2p == U128(0));
    REQUIRE_FALSE(f.balances().pool(Side::SUPPLY).contains(alice));
    REQUIRE(f.balances().scaled_pool_total(Side::SUPPLY) == U128(0));
}

TEST_CASE("Collateral", "[accountant]") {
    MarketFixture f;
    ActionAccountant accountant(f.ctx);
    const Address bob = addr(2);

    ActionResult r = accountant.account_supply_collateral(bob, bob, tokens(50));
    REQUIRE(r.on_pool == tokens(50));
    REQUIRE(r.pool_ops.supply == tokens(50));
    REQUIRE(f.ledger.user_markets(bob).collaterals.count(addr(100)) == 1);
    REQUIRE(f.balances().scaled_collateral_total() == tokens(50));

    SECTION("Partial withdrawal keeps the membership") {
        r = accountant.account_withdraw_collateral(bob, bob, tokens(20));
        REQUIRE(r.amount == tokens(20));
        REQUIRE(r.on_pool == tokens(30));
        REQUIRE(f.ledger.user_markets(bob).collaterals.count(addr(100)) == 1);
    }

    SECTION("Full withdrawal drops the membership") {
        r = accountant.account_withdraw_collateral(bob, bob, tokens(80));
        REQUIRE(r.amount == tokens(50));
        REQUIRE(r.on_pool == U128(0));
        REQUIRE(f.ledger.user_markets(bob).collaterals.empty());
        REQUIRE(f.balances().scaled_collateral_total() == U128(0));
        REQUIRE(f.events.collateral_actions.size() == 2);
    }
}

// =============================================================================
// Grown indexes
// =============================================================================

namespace {

// Supply pool 1.3, supply P2P 1.1 plus dust, borrow pool 1.5, borrow P2P 1.2
void grow_indexes(MarketFixture& f) {
    f.market().indexes.supply = MarketSideIndexes{percent(130), percent(110) + 7};
    f.market().indexes.borrow = MarketSideIndexes{percent(150), percent(120)};
}

// One supplier and one borrower matched with each other
void match_pair(MarketFixture& f) {
    const Indexes& idx = f.market().indexes;
    U128 supply = tokens(100);
    U128 borrow = x18::div_down(x18::mul_down(supply, idx.supply.p2p_index), idx.borrow.p2p_index);
    f.place(Side::SUPPLY, 1, 0, supply);
    f.place(Side::BORROW, 2, 0, borrow);
    set_p2p_totals(f, supply, borrow);
}

}  // namespace

TEST_CASE("Results are reported in underlying units", "[accountant]") {
    MarketFixture f;
    ActionAccountant accountant(f.ctx);
    const Address alice = addr(1);
    f.market().indexes.supply = MarketSideIndexes{percent(130), percent(125)};
    f.market().indexes.borrow = MarketSideIndexes{percent(150), percent(140)};

    SECTION("Pool supply") {
        ActionResult r = accountant.account_supply(alice, alice, tokens(130), 4);
        REQUIRE(r.on_pool == tokens(130));
        REQUIRE(r.scaled_on_pool == tokens(100));
        REQUIRE(f.on_pool(Side::SUPPLY, 1) == tokens(100));
        REQUIRE(f.events.balance_actions.back().scaled_on_pool == tokens(100));
    }

    SECTION("Matched supply") {
        f.place(Side::BORROW, 2, tokens(100), 0);

        ActionResult r = accountant.account_supply(alice, alice, tokens(125), 4);
        REQUIRE(r.to_peer == tokens(125));
        REQUIRE(r.in_p2p == tokens(125));
        REQUIRE(r.scaled_in_p2p == tokens(100));
        REQUIRE(f.in_p2p(Side::SUPPLY, 1) == tokens(100));
    }

    SECTION("Partial withdrawal") {
        accountant.account_supply(alice, alice, tokens(130), 4);
        ActionResult r = accountant.account_withdraw(alice, alice, tokens(65), 4);
        REQUIRE(r.amount == tokens(65));
        REQUIRE(r.on_pool == tokens(65));
        REQUIRE(r.scaled_on_pool == tokens(50));
    }

    SECTION("Collateral") {
        ActionResult r = accountant.account_supply_collateral(alice, alice, tokens(130));
        REQUIRE(r.on_pool == tokens(130));
        REQUIRE(r.scaled_on_pool == tokens(100));
        REQUIRE(f.balances().scaled_collateral(alice) == tokens(100));
    }
}

TEST_CASE("Last P2P supplier leaving on grown indexes", "[accountant]") {
    MarketFixture f;
    ActionAccountant accountant(f.ctx);
    const Address alice = addr(1);
    grow_indexes(f);
    match_pair(f);

    U128 held = x18::mul_down(tokens(100), f.market().indexes.supply.p2p_index);
    uint32_t budget = GENERATE(0u, 1u, 4u);

    ActionResult r = accountant.account_withdraw(alice, alice, held, budget);
    REQUIRE(r.amount == held);
    REQUIRE(r.in_p2p == U128(0));
    REQUIRE(f.in_p2p(Side::SUPPLY, 1) == U128(0));
    REQUIRE(f.balances().p2p(Side::SUPPLY).empty());
    REQUIRE(f.market().deltas.supply.scaled_p2p_total == U128(0));
    REQUIRE(f.market().deltas.supply.scaled_delta == U128(0));
    REQUIRE(delta_within_p2p(f.market()));
    REQUIRE(pool_totals_consistent(f.balances()));

    if (f.balances().p2p(Side::BORROW).empty()) {
        REQUIRE(f.market().deltas.borrow.scaled_p2p_total == U128(0));
        REQUIRE(f.market().deltas.borrow.scaled_delta == U128(0));
    }
}

TEST_CASE("Last P2P borrower repaying on grown indexes", "[accountant]") {
    MarketFixture f;
    ActionAccountant accountant(f.ctx);
    const Address bob = addr(2);
    grow_indexes(f);
    match_pair(f);

    U128 owed = to_underlying(Side::BORROW, f.in_p2p(Side::BORROW, 2), f.market().indexes.borrow.p2p_index);
    uint32_t budget = GENERATE(0u, 1u, 4u);

    ActionResult r = accountant.account_repay(bob, bob, owed, budget, std::nullopt);
    REQUIRE(r.amount == owed);
    REQUIRE(r.in_p2p == U128(0));
    REQUIRE(f.balances().p2p(Side::BORROW).empty());
    REQUIRE(f.market().deltas.borrow.scaled_p2p_total == U128(0));
    REQUIRE(f.market().deltas.borrow.scaled_delta == U128(0));
    REQUIRE(f.ledger.user_markets(bob).borrows.empty());
    REQUIRE(delta_within_p2p(f.market()));
    REQUIRE(pool_totals_consistent(f.balances()));

    if (f.balances().p2p(Side::SUPPLY).empty()) {
        REQUIRE(f.market().deltas.supply.scaled_p2p_total == U128(0));
        REQUIRE(f.market().deltas.supply.scaled_delta == U128(0));
    }
}
