#ifndef PEERLEND_EVENTS_HPP
#define PEERLEND_EVENTS_HPP

#include <ostream>
#include <string>
#include <vector>

#include "types.hpp"
#include "market.hpp"

namespace peerlend {

// =============================================================================
// Observations
// =============================================================================

struct MarketCreated {
    Address underlying;
};

struct IndexesUpdated {
    Address underlying;
    Indexes indexes;
};

struct DeltaUpdated {
    Address underlying;
    Side side;
    U128 scaled_delta;
};

struct P2PTotalsUpdated {
    Address underlying;
    U128 scaled_total_supply_p2p;
    U128 scaled_total_borrow_p2p;
};

struct IdleSupplyUpdated {
    Address underlying;
    U128 idle_supply;
};

// A user moved between pool and P2P by the matching engine
struct PositionUpdated {
    Side side;
    Address user;
    Address underlying;
    U128 scaled_on_pool;
    U128 scaled_in_p2p;
};

// Supplied, borrowed, repaid or withdrawn
struct BalanceAction {
    ActionType action;
    Address from;
    Address on_behalf;
    Address underlying;
    U128 amount;
    U128 scaled_on_pool;
    U128 scaled_in_p2p;
};

// Collateral supplied or withdrawn
struct CollateralAction {
    ActionType action;
    Address from;
    Address on_behalf;
    Address underlying;
    U128 amount;
    U128 scaled_balance;
};

struct ManagerApproval {
    Address delegator;
    Address manager;
    bool approved;
};

// =============================================================================
// EventSink - receives every observation; defaults ignore them
// =============================================================================

class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_market_created(const MarketCreated&) {}
    virtual void on_indexes_updated(const IndexesUpdated&) {}
    virtual void on_delta_updated(const DeltaUpdated&) {}
    virtual void on_p2p_totals_updated(const P2PTotalsUpdated&) {}
    virtual void on_idle_supply_updated(const IdleSupplyUpdated&) {}
    virtual void on_position_updated(const PositionUpdated&) {}
    virtual void on_balance_action(const BalanceAction&) {}
    virtual void on_collateral_action(const CollateralAction&) {}
    virtual void on_manager_approval(const ManagerApproval&) {}
};

// Keeps every observation in memory
class RecordingEventSink : public EventSink {
public:
    std::vector<MarketCreated> markets_created;
    std::vector<IndexesUpdated> indexes_updates;
    std::vector<DeltaUpdated> delta_updates;
    std::vector<P2PTotalsUpdated> p2p_totals_updates;
    std::vector<IdleSupplyUpdated> idle_supply_updates;
    std::vector<PositionUpdated> position_updates;
    std::vector<BalanceAction> balance_actions;
    std::vector<CollateralAction> collateral_actions;
    std::vector<ManagerApproval> manager_approvals;

    void on_market_created(const MarketCreated& e) override { markets_created.push_back(e); }
    void on_indexes_updated(const IndexesUpdated& e) override { indexes_updates.push_back(e); }
    void on_delta_updated(const DeltaUpdated& e) override { delta_updates.push_back(e); }
    void on_p2p_totals_updated(const P2PTotalsUpdated& e) override { p2p_totals_updates.push_back(e); }
    void on_idle_supply_updated(const IdleSupplyUpdated& e) override { idle_supply_updates.push_back(e); }
    void on_position_updated(const PositionUpdated& e) override { position_updates.push_back(e); }
    void on_balance_action(const BalanceAction& e) override { balance_actions.push_back(e); }
    void on_collateral_action(const CollateralAction& e) override { collateral_actions.push_back(e); }
    void on_manager_approval(const ManagerApproval& e) override { manager_approvals.push_back(e); }

    size_t size() const;
    void clear();
};

// Writes one JSON object per observation and line
class JsonEventSink : public EventSink {
public:
    explicit JsonEventSink(std::ostream& out);

    void on_market_created(const MarketCreated& e) override;
    void on_indexes_updated(const IndexesUpdated& e) override;
    void on_delta_updated(const DeltaUpdated& e) override;
    void on_p2p_totals_updated(const P2PTotalsUpdated& e) override;
    void on_idle_supply_updated(const IdleSupplyUpdated& e) override;
    void on_position_updated(const PositionUpdated& e) override;
    void on_balance_action(const BalanceAction& e) override;
    void on_collateral_action(const CollateralAction& e) override;
    void on_manager_approval(const ManagerApproval& e) override;

private:
    void write(const std::string& line);

    std::ostream& out_;
};

} // namespace peerlend

#endif // PEERLEND_EVENTS_HPP
