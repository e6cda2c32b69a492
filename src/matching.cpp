// =============================================================================
// matching.cpp - Promotion / Demotion Routine
// =============================================================================

#include "peerlend/matching.hpp"

namespace peerlend {

namespace {

struct StepResult {
    U128 on_pool;
    U128 in_p2p;
    U128 remaining;
};

// Pool -> P2P for one user
StepResult promote_step(Side side, U128 on_pool, U128 in_p2p,
                        const MarketSideIndexes& idx, U128 remaining) {
    U128 to_process = min(to_underlying(side, on_pool, idx.pool_index), remaining);
    return StepResult{
        on_pool - min(on_pool, to_scaled_debit(to_process, idx.pool_index)),
        in_p2p + to_scaled_credit(side, to_process, idx.p2p_index),
        remaining - to_process
    };
}

// P2P -> pool for one user
StepResult demote_step(Side side, U128 on_pool, U128 in_p2p,
                       const MarketSideIndexes& idx, U128 remaining) {
    U128 to_process = min(to_underlying(side, in_p2p, idx.p2p_index), remaining);
    return StepResult{
        on_pool + to_scaled_credit(side, to_process, idx.pool_index),
        in_p2p - min(in_p2p, to_scaled_debit(to_process, idx.p2p_index)),
        remaining - to_process
    };
}

} // namespace

PromoteResult MatchingEngine::promote_routine(MatchingStrategy strategy, U128 amount, uint32_t max_iterations) {
    if (amount == 0 || ctx_.market().pause_statuses.is_p2p_disabled) {
        return PromoteResult{0, amount, max_iterations};
    }

    Outcome outcome = promote_or_demote(strategy_side(strategy), true, amount, max_iterations);
    return PromoteResult{outcome.processed, amount - outcome.processed, max_iterations - outcome.iterations};
}

U128 MatchingEngine::demote(MatchingStrategy strategy, U128 amount, uint32_t max_iterations) {
    if (amount == 0) return 0;
    return promote_or_demote(strategy_side(strategy), false, amount, max_iterations).processed;
}

MatchingEngine::Outcome MatchingEngine::promote_or_demote(Side side, bool promoting,
                                                          U128 amount, uint32_t max_iterations) {
    if (max_iterations == 0) return Outcome{0, 0};

    MarketBalances& balances = ctx_.balances();
    const MarketSideIndexes& idx = ctx_.market().indexes.side(side);
    const MatchingQueue& working = promoting ? balances.pool(side) : balances.p2p(side);

    U128 remaining = amount;
    uint32_t iterations = 0;

    for (; iterations < max_iterations && remaining != 0; ++iterations) {
        auto user = working.get_match(remaining);
        if (!user) break;

        U128 on_pool = balances.scaled_pool_balance(side, *user);
        U128 in_p2p = balances.scaled_p2p_balance(side, *user);

        StepResult step = promoting
            ? promote_step(side, on_pool, in_p2p, idx, remaining)
            : demote_step(side, on_pool, in_p2p, idx, remaining);
        remaining = step.remaining;

        ctx_.update_user(side, *user, step.on_pool, step.in_p2p, !promoting);
        ctx_.events.on_position_updated(PositionUpdated{
            side, *user, ctx_.underlying(), step.on_pool, step.in_p2p
        });
    }

    return Outcome{amount - remaining, iterations};
}

} // namespace peerlend
