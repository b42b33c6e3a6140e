// =============================================================================
// types.cpp - Address, Fixed-Point and Error Code Helpers
// =============================================================================

#include "lever/types.hpp"

#include <algorithm>

namespace lever {

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Fixed-Point
// =============================================================================

namespace e6 {

std::optional<I128> parse_i128(std::string_view text) {
    bool neg = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        neg = text[0] == '-';
        text.remove_prefix(1);
    }
    if (text.empty()) return std::nullopt;

    I128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        if (!checked_mul(value, 10, value)) return std::nullopt;
        if (!checked_add(value, c - '0', value)) return std::nullopt;
    }
    return neg ? -value : value;
}

std::string to_string(I128 v) {
    if (v == 0) return "0";
    bool neg = v < 0;
    U128 u = neg ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);

    std::string out;
    while (u > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (neg) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::string format(I128 v) {
    bool neg = v < 0;
    I128 a = neg ? -v : v;
    std::string frac = to_string(a % ONE);
    frac.insert(0, 6 - frac.size(), '0');
    return (neg ? "-" : "") + to_string(a / ONE) + "." + frac;
}

} // namespace e6

// =============================================================================
// Enums
// =============================================================================

const char* to_string(Side side) {
    return side == Side::LONG ? "long" : "short";
}

const char* to_string(Role role) {
    switch (role) {
        case Role::OWNER: return "owner";
        case Role::LEDGER_CONTROLLER: return "ledger_controller";
        case Role::RELAYER: return "relayer";
        case Role::KEEPER: return "keeper";
    }
    return "unknown";
}

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case UNAUTHORIZED: return "UNAUTHORIZED";
        case NOT_OWNER: return "NOT_OWNER";
        case EXPIRED: return "EXPIRED";
        case BAD_NONCE: return "BAD_NONCE";
        case BAD_SIGNATURE: return "BAD_SIGNATURE";
        case INVALID_STATE: return "INVALID_STATE";
        case INSUFFICIENT_AVAILABLE: return "INSUFFICIENT_AVAILABLE";
        case INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case OVER_UNLOCK: return "OVER_UNLOCK";
        case FUNDS_LOW: return "FUNDS_LOW";
        case LIQUIDITY_LOW: return "LIQUIDITY_LOW";
        case INSUFFICIENT_SHARES: return "INSUFFICIENT_SHARES";
        case POOL_INSOLVENT: return "POOL_INSOLVENT";
        case INVALID_AMOUNT: return "INVALID_AMOUNT";
        case INVALID_PRICE: return "INVALID_PRICE";
        case INVALID_LEVERAGE: return "INVALID_LEVERAGE";
        case QTY_ZERO: return "QTY_ZERO";
        case INVALID_STOP_RANGE: return "INVALID_STOP_RANGE";
        case NO_TRIGGER: return "NO_TRIGGER";
        case MARKET_CLOSED: return "MARKET_CLOSED";
        case WRONG_ASSET: return "WRONG_ASSET";
        case INVALID_MODE: return "INVALID_MODE";
        case INVALID_REASON: return "INVALID_REASON";
        case ASSET_EXISTS: return "ASSET_EXISTS";
        case PRICE_NOT_FOUND: return "PRICE_NOT_FOUND";
        case PROOF_BAD_TIMESTAMP: return "PROOF_BAD_TIMESTAMP";
        case PROOF_TOO_OLD: return "PROOF_TOO_OLD";
        case PROOF_PRICE_ZERO: return "PROOF_PRICE_ZERO";
        case PRICE_NOT_NEAR: return "PRICE_NOT_NEAR";
        case PROOF_INVALID: return "PROOF_INVALID";
        case RANGE: return "RANGE";
        case PROOF_RANGE: return "PROOF_RANGE";
        case UNKNOWN_ASSET: return "UNKNOWN_ASSET";
        case TRADE_NOT_FOUND: return "TRADE_NOT_FOUND";
        default: return "UNKNOWN_ERROR";
    }
}

const char* to_string(Category category) {
    switch (category) {
        case Category::NONE: return "none";
        case Category::AUTHORIZATION: return "authorization";
        case Category::STATE: return "state";
        case Category::FUNDS: return "funds";
        case Category::PARAMETER: return "parameter";
        case Category::PRICE: return "price";
        case Category::RANGE: return "range";
        case Category::NOT_FOUND: return "not_found";
    }
    return "unknown";
}

} // namespace errors

} // namespace lever
