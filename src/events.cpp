// =============================================================================
// events.cpp - Observation Sinks
// =============================================================================

#include "peerlend/events.hpp"

#include <nlohmann/json.hpp>

namespace peerlend {

using json = nlohmann::json;

namespace {

const char* balance_event_name(ActionType action) {
    switch (action) {
        case ActionType::SUPPLY: return "supplied";
        case ActionType::BORROW: return "borrowed";
        case ActionType::REPAY: return "repaid";
        case ActionType::WITHDRAW: return "withdrawn";
        default: return action_name(action);
    }
}

const char* collateral_event_name(ActionType action) {
    return action == ActionType::SUPPLY_COLLATERAL ? "collateral_supplied" : "collateral_withdrawn";
}

json side_indexes(const MarketSideIndexes& idx) {
    return json{
        {"pool_index", to_string(idx.pool_index)},
        {"p2p_index", to_string(idx.p2p_index)}
    };
}

} // namespace

// =============================================================================
// RecordingEventSink
// =============================================================================

size_t RecordingEventSink::size() const {
    return markets_created.size() + indexes_updates.size() + delta_updates.size() +
           p2p_totals_updates.size() + idle_supply_updates.size() + position_updates.size() +
           balance_actions.size() + collateral_actions.size() + manager_approvals.size();
}

void RecordingEventSink::clear() {
    markets_created.clear();
    indexes_updates.clear();
    delta_updates.clear();
    p2p_totals_updates.clear();
    idle_supply_updates.clear();
    position_updates.clear();
    balance_actions.clear();
    collateral_actions.clear();
    manager_approvals.clear();
}

// =============================================================================
// JsonEventSink
// =============================================================================

JsonEventSink::JsonEventSink(std::ostream& out) : out_(out) {}

void JsonEventSink::write(const std::string& line) {
    out_ << line << '\n';
}

void JsonEventSink::on_market_created(const MarketCreated& e) {
    json j = {
        {"event", "market_created"},
        {"underlying", addresses::to_hex(e.underlying)}
    };
    write(j.dump());
}

void JsonEventSink::on_indexes_updated(const IndexesUpdated& e) {
    json j = {
        {"event", "indexes_updated"},
        {"underlying", addresses::to_hex(e.underlying)},
        {"supply", side_indexes(e.indexes.supply)},
        {"borrow", side_indexes(e.indexes.borrow)}
    };
    write(j.dump());
}

void JsonEventSink::on_delta_updated(const DeltaUpdated& e) {
    json j = {
        {"event", "delta_updated"},
        {"underlying", addresses::to_hex(e.underlying)},
        {"side", side_name(e.side)},
        {"scaled_delta", to_string(e.scaled_delta)}
    };
    write(j.dump());
}

void JsonEventSink::on_p2p_totals_updated(const P2PTotalsUpdated& e) {
    json j = {
        {"event", "p2p_totals_updated"},
        {"underlying", addresses::to_hex(e.underlying)},
        {"scaled_total_supply_p2p", to_string(e.scaled_total_supply_p2p)},
        {"scaled_total_borrow_p2p", to_string(e.scaled_total_borrow_p2p)}
    };
    write(j.dump());
}

void JsonEventSink::on_idle_supply_updated(const IdleSupplyUpdated& e) {
    json j = {
        {"event", "idle_supply_updated"},
        {"underlying", addresses::to_hex(e.underlying)},
        {"idle_supply", to_string(e.idle_supply)}
    };
    write(j.dump());
}

void JsonEventSink::on_position_updated(const PositionUpdated& e) {
    json j = {
        {"event", "position_updated"},
        {"side", side_name(e.side)},
        {"user", addresses::to_hex(e.user)},
        {"underlying", addresses::to_hex(e.underlying)},
        {"scaled_on_pool", to_string(e.scaled_on_pool)},
        {"scaled_in_p2p", to_string(e.scaled_in_p2p)}
    };
    write(j.dump());
}

void JsonEventSink::on_balance_action(const BalanceAction& e) {
    json j = {
        {"event", balance_event_name(e.action)},
        {"from", addresses::to_hex(e.from)},
        {"on_behalf", addresses::to_hex(e.on_behalf)},
        {"underlying", addresses::to_hex(e.underlying)},
        {"amount", to_string(e.amount)},
        {"scaled_on_pool", to_string(e.scaled_on_pool)},
        {"scaled_in_p2p", to_string(e.scaled_in_p2p)}
    };
    write(j.dump());
}

void JsonEventSink::on_collateral_action(const CollateralAction& e) {
    json j = {
        {"event", collateral_event_name(e.action)},
        {"from", addresses::to_hex(e.from)},
        {"on_behalf", addresses::to_hex(e.on_behalf)},
        {"underlying", addresses::to_hex(e.underlying)},
        {"amount", to_string(e.amount)},
        {"scaled_balance", to_string(e.scaled_balance)}
    };
    write(j.dump());
}

void JsonEventSink::on_manager_approval(const ManagerApproval& e) {
    json j = {
        {"event", "manager_approval"},
        {"delegator", addresses::to_hex(e.delegator)},
        {"manager", addresses::to_hex(e.manager)},
        {"approved", e.approved}
    };
    write(j.dump());
}

} // namespace peerlend
