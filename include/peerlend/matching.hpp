#ifndef PEERLEND_MATCHING_HPP
#define PEERLEND_MATCHING_HPP

#include <cstdint>

#include "types.hpp"
#include "market.hpp"
#include "ledger.hpp"

namespace peerlend {

// Which users a routine moves
enum class MatchingStrategy : uint8_t {
    SUPPLIERS = 0,
    BORROWERS = 1
};

constexpr Side strategy_side(MatchingStrategy strategy) {
    return strategy == MatchingStrategy::SUPPLIERS ? Side::SUPPLY : Side::BORROW;
}

struct PromoteResult {
    U128 promoted;             // underlying units moved from pool to P2P
    U128 remaining;            // amount - promoted
    uint32_t iterations_left;
};

// =============================================================================
// MatchingEngine - bounded promotion and demotion between pool and P2P
//
// Each iteration takes one user from the matching queue (pool queue when
// promoting, P2P queue when demoting) and moves as much of its balance as the
// remaining amount needs. The loop ends when the amount is exhausted, the
// queue is empty or the iteration budget is spent. Indexes are the market's
// current ones.
// =============================================================================

class MatchingEngine {
public:
    explicit MatchingEngine(MarketContext& ctx) : ctx_(ctx) {}

    // Pure pool fallback when P2P is disabled or amount is zero
    PromoteResult promote_routine(MatchingStrategy strategy, U128 amount, uint32_t max_iterations);

    // Returns the demoted amount in underlying units
    U128 demote(MatchingStrategy strategy, U128 amount, uint32_t max_iterations);

private:
    struct Outcome {
        U128 processed;
        uint32_t iterations;
    };

    Outcome promote_or_demote(Side side, bool promoting, U128 amount, uint32_t max_iterations);

    MarketContext& ctx_;
};

} // namespace peerlend

#endif // PEERLEND_MATCHING_HPP
