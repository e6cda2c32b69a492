#ifndef PEERLEND_ENGINE_HPP
#define PEERLEND_ENGINE_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "types.hpp"
#include "market.hpp"
#include "ledger.hpp"
#include "events.hpp"
#include "collaborators.hpp"
#include "guard.hpp"
#include "accountant.hpp"
#include "config.hpp"

namespace peerlend {

// =============================================================================
// Engine - markets, guard and accountant behind one lock
//
// Each action validates, fetches and checks the market indexes, runs the
// remaining authorization checks, and only then stores the indexes and
// mutates balances. A rejected action changes nothing.
//
// An absent iteration budget means the configured default for the action.
// =============================================================================

class Engine {
public:
    Engine(PoolAdapter& pool, RiskOracle& risk, EngineConfig config = {});

    // Uses a LedgerRiskOracle over this engine's ledger
    Engine(PoolAdapter& pool, const PriceOracle& prices, EngineConfig config = {});

    ~Engine();

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // =========================================================================
    // Market Management
    // =========================================================================

    int32_t create_market(const MarketConfig& config);
    int32_t set_pause(const Address& underlying, ActionType action, bool paused);
    int32_t set_all_paused(const Address& underlying, bool paused);
    int32_t set_p2p_disabled(const Address& underlying, bool disabled);
    int32_t set_deprecated(const Address& underlying, bool deprecated);
    int32_t set_reserve_factor(const Address& underlying, uint32_t reserve_factor_bps);
    int32_t set_p2p_index_cursor(const Address& underlying, uint32_t p2p_index_cursor_bps);

    // nullptr removes the sentinel
    void set_sentinel(const PriceOracleSentinel* sentinel);

    // nullptr drops observations
    void set_event_sink(EventSink* sink);

    int32_t approve_manager(const Address& delegator, const Address& manager, bool approved);

    // =========================================================================
    // Accounting
    // =========================================================================

    ActionResult supply(const Address& caller, const Address& underlying, U128 amount,
                        const Address& on_behalf,
                        std::optional<uint32_t> max_iterations = std::nullopt);

    ActionResult supply_collateral(const Address& caller, const Address& underlying, U128 amount,
                                   const Address& on_behalf);

    ActionResult borrow(const Address& caller, const Address& underlying, U128 amount,
                        const Address& on_behalf, const Address& receiver,
                        std::optional<uint32_t> max_iterations = std::nullopt);

    // Amounts above the debt are capped at the debt
    ActionResult repay(const Address& caller, const Address& underlying, U128 amount,
                       const Address& on_behalf,
                       std::optional<uint32_t> max_iterations = std::nullopt);

    // Amounts above the supply are capped at the supply
    ActionResult withdraw(const Address& caller, const Address& underlying, U128 amount,
                          const Address& on_behalf, const Address& receiver,
                          std::optional<uint32_t> max_iterations = std::nullopt);

    // Amounts above the collateral are capped at the collateral
    ActionResult withdraw_collateral(const Address& caller, const Address& underlying, U128 amount,
                                     const Address& on_behalf, const Address& receiver);

    LiquidationAuthorization authorize_liquidation(const Address& underlying_borrowed,
                                                   const Address& underlying_collateral,
                                                   const Address& borrower) const;

    // =========================================================================
    // Queries
    // =========================================================================

    bool market_exists(const Address& underlying) const;
    std::optional<Market> get_market(const Address& underlying) const;
    std::vector<Address> markets() const;

    // Scaled balances; all zero for an unknown market or user
    UserBalance balance_of(const Address& underlying, const Address& user) const;

    // Underlying values at the market's stored indexes
    U128 supply_balance(const Address& underlying, const Address& user) const;
    U128 borrow_balance(const Address& underlying, const Address& user) const;
    U128 collateral_balance(const Address& underlying, const Address& user) const;

    UserMarkets user_markets(const Address& user) const;
    bool is_managed_by(const Address& delegator, const Address& manager) const;

    // Unsynchronized view, for inspection between actions
    const Ledger& ledger() const { return ledger_; }
    const EngineConfig& config() const { return config_; }

    struct Stats {
        uint64_t total_actions;
        uint64_t rejected_actions;
    };
    Stats get_stats() const;

private:
    MarketContext context(MarketState& state);

    // Fetches and validates the indexes of a created market
    int32_t fetch_indexes(const MarketState& state, Indexes& out) const;
    void store_indexes(MarketState& state, const Indexes& indexes);

    ActionResult reject(ActionType action, const Address& underlying, const Address& on_behalf, int32_t code);
    void log_outcome(ActionType action, const Address& underlying, const Address& on_behalf,
                     const ActionResult& result) const;

    EngineConfig config_;
    PoolAdapter& pool_;
    Ledger ledger_;
    std::unique_ptr<RiskOracle> owned_risk_;
    RiskOracle* risk_;
    AuthorizationGuard guard_;

    EventSink null_sink_;
    EventSink* events_;

    uint64_t clock_ = 0;

    mutable std::shared_mutex mutex_;

    std::atomic<uint64_t> total_actions_{0};
    std::atomic<uint64_t> rejected_actions_{0};
};

} // namespace peerlend

#endif // PEERLEND_ENGINE_HPP
