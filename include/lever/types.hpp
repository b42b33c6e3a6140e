#ifndef LEVER_TYPES_HPP
#define LEVER_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lever {

// =============================================================================
// Account Identifiers (EVM-style 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

struct AddressHash {
    size_t operator()(const Address& addr) const noexcept {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

namespace addresses {

constexpr Address ZERO = {};

// Address whose low 8 bytes carry `id` (big-endian); handy for fixtures and scripts
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// "0x" + 40 hex digits
std::string to_hex(const Address& addr);

// Accepts 40 hex digits with or without "0x" prefix
std::optional<Address> from_hex(std::string_view hex);

} // namespace addresses

// Opaque price attestation as submitted by callers
using Proof = std::vector<uint8_t>;

// =============================================================================
// Fixed-Point Arithmetic (E6 = 6 decimal places)
//
// Prices are int64_t scaled by 1e6. Collateral amounts use the same scale
// (6-decimal stablecoin units). Intermediate products use I128 with explicit
// overflow checks.
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

namespace e6 {

constexpr int64_t ONE = 1000000;       // 1.000000
constexpr int64_t BPS = 10000;         // basis points per unit
constexpr int64_t PPM = 1000000;       // parts per million per unit

constexpr I128 I64_MAX = std::numeric_limits<int64_t>::max();
constexpr I128 I64_MIN = std::numeric_limits<int64_t>::min();

inline bool fits_i64(I128 v) {
    return v <= I64_MAX && v >= I64_MIN;
}

// false on overflow
inline bool checked_mul(I128 a, I128 b, I128& out) {
    return !__builtin_mul_overflow(a, b, &out);
}

inline bool checked_add(I128 a, I128 b, I128& out) {
    return !__builtin_add_overflow(a, b, &out);
}

// Ceiling division for a >= 0, b > 0
inline I128 ceil_div(I128 a, I128 b) {
    return (a + b - 1) / b;
}

inline I128 abs(I128 v) {
    return v < 0 ? -v : v;
}

// Parse a decimal integer string ("-123", "4500000000") into I128
std::optional<I128> parse_i128(std::string_view text);

std::string to_string(I128 v);

// 12345678 -> "12.345678"
std::string format(I128 v);

} // namespace e6

// =============================================================================
// Position Side
// =============================================================================

enum class Side : uint8_t {
    LONG = 0,
    SHORT = 1
};

inline int64_t side_sign(Side side) {
    return side == Side::LONG ? 1 : -1;
}

const char* to_string(Side side);

// =============================================================================
// Roles
// =============================================================================

enum class Role : uint8_t {
    OWNER = 0,               // deployment administration, pool funding, fee claims
    LEDGER_CONTROLLER = 1,   // lock / unlock / settle on the custody ledger
    RELAYER = 2,             // delegated (signed) calls on behalf of traders
    KEEPER = 3               // limit execution and trigger closes, single and batch
};

const char* to_string(Role role);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {

constexpr int32_t OK = 0;

// Authorization
constexpr int32_t UNAUTHORIZED = -1;
constexpr int32_t NOT_OWNER = -2;
constexpr int32_t EXPIRED = -3;
constexpr int32_t BAD_NONCE = -4;
constexpr int32_t BAD_SIGNATURE = -5;

// State
constexpr int32_t INVALID_STATE = -10;

// Funds
constexpr int32_t INSUFFICIENT_AVAILABLE = -20;
constexpr int32_t INSUFFICIENT_FUNDS = -21;
constexpr int32_t OVER_UNLOCK = -22;
constexpr int32_t FUNDS_LOW = -23;
constexpr int32_t LIQUIDITY_LOW = -24;
constexpr int32_t INSUFFICIENT_SHARES = -25;
constexpr int32_t POOL_INSOLVENT = -26;

// Parameter
constexpr int32_t INVALID_AMOUNT = -30;
constexpr int32_t INVALID_PRICE = -31;
constexpr int32_t INVALID_LEVERAGE = -32;
constexpr int32_t QTY_ZERO = -33;
constexpr int32_t INVALID_STOP_RANGE = -34;
constexpr int32_t NO_TRIGGER = -35;
constexpr int32_t MARKET_CLOSED = -36;
constexpr int32_t WRONG_ASSET = -37;
constexpr int32_t INVALID_MODE = -38;
constexpr int32_t INVALID_REASON = -39;
constexpr int32_t ASSET_EXISTS = -40;

// Price
constexpr int32_t PRICE_NOT_FOUND = -50;
constexpr int32_t PROOF_BAD_TIMESTAMP = -51;
constexpr int32_t PROOF_TOO_OLD = -52;
constexpr int32_t PROOF_PRICE_ZERO = -53;
constexpr int32_t PRICE_NOT_NEAR = -54;
constexpr int32_t PROOF_INVALID = -55;

// Arithmetic range
constexpr int32_t RANGE = -60;
constexpr int32_t PROOF_RANGE = -61;

// Not found
constexpr int32_t UNKNOWN_ASSET = -70;
constexpr int32_t TRADE_NOT_FOUND = -71;

enum class Category : uint8_t {
    NONE = 0,
    AUTHORIZATION,
    STATE,
    FUNDS,
    PARAMETER,
    PRICE,
    RANGE,
    NOT_FOUND
};

constexpr Category category(int32_t code) {
    if (code >= 0) return Category::NONE;
    if (code > -10) return Category::AUTHORIZATION;
    if (code > -20) return Category::STATE;
    if (code > -30) return Category::FUNDS;
    if (code > -50) return Category::PARAMETER;
    if (code > -60) return Category::PRICE;
    if (code > -70) return Category::RANGE;
    return Category::NOT_FOUND;
}

// Batch items failing with these are skipped; everything else aborts the batch
constexpr bool is_skippable(int32_t code) {
    Category c = category(code);
    return c == Category::STATE || c == Category::PRICE ||
           c == Category::PARAMETER || c == Category::NOT_FOUND;
}

const char* to_string(int32_t code);
const char* to_string(Category category);

} // namespace errors

} // namespace lever

#endif // LEVER_TYPES_HPP
