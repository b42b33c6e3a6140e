#ifndef LEVER_ORACLE_HPP
#define LEVER_ORACLE_HPP

#include <vector>

#include "types.hpp"

namespace lever {

// =============================================================================
// Decoded Price Entry
// =============================================================================

struct PriceEntry {
    uint32_t pair;
    I128 price;          // raw price at `decimals` precision
    uint8_t decimals;
    uint64_t timestamp;  // seconds or milliseconds
    uint64_t round;
};

// =============================================================================
// Price Oracle Interface
// =============================================================================
//
// Verifies and parses an attestation blob. A decoder rejects malformed or
// unverifiable proofs with PROOF_INVALID (or its own error code).

class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    virtual int32_t decode(const Proof& proof, std::vector<PriceEntry>& out) const = 0;
};

// =============================================================================
// JsonPriceOracle - Unsigned JSON Proofs (development and replay)
// =============================================================================
//
// {"prices":[{"pair":1,"price":"6512345000000","decimals":8,
//             "timestamp":1700000000,"round":42}]}
//
// "price" is a JSON integer or a decimal string. No attestation is checked.

class JsonPriceOracle : public IPriceOracle {
public:
    int32_t decode(const Proof& proof, std::vector<PriceEntry>& out) const override;

    static Proof encode(const std::vector<PriceEntry>& entries);
};

// =============================================================================
// Price-Proof Ingestion
// =============================================================================

namespace proof_limits {
constexpr uint64_t MAX_FUTURE_SKEW_SEC = 180;
constexpr uint64_t MILLISECOND_THRESHOLD = 1000000000000ULL;  // 1e12
constexpr uint8_t CANONICAL_DECIMALS = 6;
}

struct PriceResult {
    int32_t status;
    int64_t price_e6;
    uint64_t timestamp;  // normalized to seconds
    uint64_t round;
};

// Decode `proof`, select `pair`, check freshness against `now` and rescale the
// price to 6 decimals.
PriceResult read_price(const IPriceOracle& oracle, const Proof& proof,
                       uint32_t pair, uint64_t max_age_sec, uint64_t now);

// Freshness + rescale of an already located entry
PriceResult normalize_price(const PriceEntry& entry, uint64_t max_age_sec, uint64_t now);

} // namespace lever

#endif // LEVER_ORACLE_HPP
