#ifndef PEERLEND_PEERLEND_HPP
#define PEERLEND_PEERLEND_HPP

// =============================================================================
// PeerLend - P2P Matching Overlay for a Pooled Lending Market
//
//   MatchingQueue      bucketed users per market side
//   DeltaTracker       deltas, P2P totals, P2P fee, idle supply
//   MatchingEngine     bounded promotion / demotion
//   ActionAccountant   supply, borrow, repay, withdraw, collateral
//   AuthorizationGuard permissions, pauses, caps, health, liquidation
//   Engine             serialized entry points over all of the above
//
// =============================================================================

#include "types.hpp"
#include "math.hpp"
#include "market.hpp"
#include "events.hpp"
#include "buckets.hpp"
#include "balances.hpp"
#include "ledger.hpp"
#include "deltas.hpp"
#include "matching.hpp"
#include "accountant.hpp"
#include "collaborators.hpp"
#include "guard.hpp"
#include "interest.hpp"
#include "risk_oracle.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "engine.hpp"

#endif // PEERLEND_PEERLEND_HPP
