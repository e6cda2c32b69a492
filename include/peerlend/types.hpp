#ifndef PEERLEND_TYPES_HPP
#define PEERLEND_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>

namespace peerlend {

// =============================================================================
// Addresses (EVM 20-byte addresses for users and underlying assets)
// =============================================================================

using Address = std::array<uint8_t, 20>;

constexpr Address ZERO_ADDRESS = {};

namespace addresses {

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Short address whose low 8 bytes hold `id` (big-endian)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

// "0x" followed by 40 lowercase hex digits
std::string to_hex(const Address& addr);

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& addr) const {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Fixed-Point Types (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr U128 X18_ONE = 1000000000000000000ULL;  // 1e18
constexpr U128 U128_MAX = ~static_cast<U128>(0);

// Decimal rendering, 128-bit values have no stream operator
std::string to_string(U128 value);

// =============================================================================
// Market Sides
// =============================================================================

enum class Side : uint8_t {
    SUPPLY = 0,
    BORROW = 1
};

constexpr Side opposite(Side side) {
    return side == Side::SUPPLY ? Side::BORROW : Side::SUPPLY;
}

const char* side_name(Side side);

// =============================================================================
// Action Types (each one carries its own pause flag)
// =============================================================================

enum class ActionType : uint8_t {
    SUPPLY = 0,
    SUPPLY_COLLATERAL = 1,
    BORROW = 2,
    REPAY = 3,
    WITHDRAW = 4,
    WITHDRAW_COLLATERAL = 5,
    LIQUIDATE_COLLATERAL = 6,
    LIQUIDATE_BORROW = 7
};

const char* action_name(ActionType action);

// =============================================================================
// Protocol Constants
// =============================================================================

namespace constants {

constexpr uint32_t MAX_BPS = 10000;  // 100.00%

// Health factors are X18: 1e18 = 1.0
constexpr U128 DEFAULT_LIQUIDATION_THRESHOLD = X18_ONE;
constexpr U128 MIN_LIQUIDATION_THRESHOLD = 950000000000000000ULL;  // 0.95

// Close factors are X18 fractions of the debt
constexpr U128 DEFAULT_CLOSE_FACTOR = X18_ONE / 2;
constexpr U128 MAX_CLOSE_FACTOR = X18_ONE;

constexpr uint32_t DEFAULT_MAX_ITERATIONS = 4;

// Largest underlying value one side of a market may hold, with room for
// 2^16-fold index growth
constexpr U128 MAX_SIDE_TOTAL = U128_MAX >> 16;

} // namespace constants

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Input (-1 .. -9)
constexpr int32_t ADDRESS_IS_ZERO = -1;
constexpr int32_t AMOUNT_IS_ZERO = -2;
constexpr int32_t MARKET_NOT_CREATED = -3;
constexpr int32_t MARKET_ALREADY_CREATED = -4;
constexpr int32_t INVALID_INDEX = -5;
constexpr int32_t INVALID_CONFIG = -6;
constexpr int32_t DEBT_IS_ZERO = -7;
constexpr int32_t SUPPLY_IS_ZERO = -8;
constexpr int32_t COLLATERAL_IS_ZERO = -9;

// Permission (-10 .. -19)
constexpr int32_t PERMISSION_DENIED = -10;

// Pause (-20 .. -29)
constexpr int32_t SUPPLY_PAUSED = -20;
constexpr int32_t SUPPLY_COLLATERAL_PAUSED = -21;
constexpr int32_t BORROW_PAUSED = -22;
constexpr int32_t REPAY_PAUSED = -23;
constexpr int32_t WITHDRAW_PAUSED = -24;
constexpr int32_t WITHDRAW_COLLATERAL_PAUSED = -25;
constexpr int32_t LIQUIDATE_COLLATERAL_PAUSED = -26;
constexpr int32_t LIQUIDATE_BORROW_PAUSED = -27;

// Cap (-30 .. -39)
constexpr int32_t SUPPLY_CAP_EXCEEDED = -30;
constexpr int32_t BORROW_CAP_EXCEEDED = -31;
constexpr int32_t AMOUNT_TOO_LARGE = -32;

// Authorization (-40 .. -49)
constexpr int32_t BORROW_NOT_ENABLED = -40;
constexpr int32_t INCONSISTENT_RISK_CATEGORY = -41;
constexpr int32_t UNAUTHORIZED_BORROW = -42;
constexpr int32_t UNAUTHORIZED_WITHDRAW = -43;
constexpr int32_t UNAUTHORIZED_LIQUIDATE = -44;
constexpr int32_t SENTINEL_LIQUIDATE_NOT_ENABLED = -45;
constexpr int32_t COLLATERAL_NOT_HELD = -46;
constexpr int32_t DEBT_NOT_HELD = -47;
}

enum class ErrorKind : uint8_t {
    NONE = 0,
    INPUT = 1,
    PERMISSION = 2,
    PAUSED = 3,
    CAP = 4,
    AUTHORIZATION = 5,
    UNKNOWN = 6
};

ErrorKind error_kind(int32_t code);
const char* error_string(int32_t code);
const char* error_kind_name(ErrorKind kind);

} // namespace peerlend

#endif // PEERLEND_TYPES_HPP
