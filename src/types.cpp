// =============================================================================
// types.cpp - Address, Side and Error Code Helpers
// =============================================================================

#include "peerlend/types.hpp"

#include <algorithm>

namespace peerlend {

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (auto b : addr) {
        out.push_back(digits[(b >> 4) & 0x0F]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace addresses

std::string to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

const char* side_name(Side side) {
    return side == Side::SUPPLY ? "supply" : "borrow";
}

const char* action_name(ActionType action) {
    switch (action) {
        case ActionType::SUPPLY: return "supply";
        case ActionType::SUPPLY_COLLATERAL: return "supply_collateral";
        case ActionType::BORROW: return "borrow";
        case ActionType::REPAY: return "repay";
        case ActionType::WITHDRAW: return "withdraw";
        case ActionType::WITHDRAW_COLLATERAL: return "withdraw_collateral";
        case ActionType::LIQUIDATE_COLLATERAL: return "liquidate_collateral";
        case ActionType::LIQUIDATE_BORROW: return "liquidate_borrow";
    }
    return "unknown";
}

// =============================================================================
// Error Codes
// =============================================================================

ErrorKind error_kind(int32_t code) {
    if (code == errors::OK) return ErrorKind::NONE;
    if (code <= -1 && code >= -9) return ErrorKind::INPUT;
    if (code <= -10 && code >= -19) return ErrorKind::PERMISSION;
    if (code <= -20 && code >= -29) return ErrorKind::PAUSED;
    if (code <= -30 && code >= -39) return ErrorKind::CAP;
    if (code <= -40 && code >= -49) return ErrorKind::AUTHORIZATION;
    return ErrorKind::UNKNOWN;
}

const char* error_string(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::ADDRESS_IS_ZERO: return "ADDRESS_IS_ZERO";
        case errors::AMOUNT_IS_ZERO: return "AMOUNT_IS_ZERO";
        case errors::MARKET_NOT_CREATED: return "MARKET_NOT_CREATED";
        case errors::MARKET_ALREADY_CREATED: return "MARKET_ALREADY_CREATED";
        case errors::INVALID_INDEX: return "INVALID_INDEX";
        case errors::INVALID_CONFIG: return "INVALID_CONFIG";
        case errors::DEBT_IS_ZERO: return "DEBT_IS_ZERO";
        case errors::SUPPLY_IS_ZERO: return "SUPPLY_IS_ZERO";
        case errors::COLLATERAL_IS_ZERO: return "COLLATERAL_IS_ZERO";
        case errors::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case errors::SUPPLY_PAUSED: return "SUPPLY_PAUSED";
        case errors::SUPPLY_COLLATERAL_PAUSED: return "SUPPLY_COLLATERAL_PAUSED";
        case errors::BORROW_PAUSED: return "BORROW_PAUSED";
        case errors::REPAY_PAUSED: return "REPAY_PAUSED";
        case errors::WITHDRAW_PAUSED: return "WITHDRAW_PAUSED";
        case errors::WITHDRAW_COLLATERAL_PAUSED: return "WITHDRAW_COLLATERAL_PAUSED";
        case errors::LIQUIDATE_COLLATERAL_PAUSED: return "LIQUIDATE_COLLATERAL_PAUSED";
        case errors::LIQUIDATE_BORROW_PAUSED: return "LIQUIDATE_BORROW_PAUSED";
        case errors::SUPPLY_CAP_EXCEEDED: return "SUPPLY_CAP_EXCEEDED";
        case errors::BORROW_CAP_EXCEEDED: return "BORROW_CAP_EXCEEDED";
        case errors::AMOUNT_TOO_LARGE: return "AMOUNT_TOO_LARGE";
        case errors::BORROW_NOT_ENABLED: return "BORROW_NOT_ENABLED";
        case errors::INCONSISTENT_RISK_CATEGORY: return "INCONSISTENT_RISK_CATEGORY";
        case errors::UNAUTHORIZED_BORROW: return "UNAUTHORIZED_BORROW";
        case errors::UNAUTHORIZED_WITHDRAW: return "UNAUTHORIZED_WITHDRAW";
        case errors::UNAUTHORIZED_LIQUIDATE: return "UNAUTHORIZED_LIQUIDATE";
        case errors::SENTINEL_LIQUIDATE_NOT_ENABLED: return "SENTINEL_LIQUIDATE_NOT_ENABLED";
        case errors::COLLATERAL_NOT_HELD: return "COLLATERAL_NOT_HELD";
        case errors::DEBT_NOT_HELD: return "DEBT_NOT_HELD";
    }
    return "UNKNOWN_ERROR";
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::INPUT: return "input";
        case ErrorKind::PERMISSION: return "permission";
        case ErrorKind::PAUSED: return "paused";
        case ErrorKind::CAP: return "cap";
        case ErrorKind::AUTHORIZATION: return "authorization";
        case ErrorKind::UNKNOWN: return "unknown";
    }
    return "unknown";
}

} // namespace peerlend
