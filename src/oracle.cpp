// =============================================================================
// oracle.cpp - Price Proof Decoding and Ingestion
// =============================================================================

#include "lever/oracle.hpp"

#include <limits>
#include <string>

#include <nlohmann/json.hpp>

namespace lever {

using json = nlohmann::json;

// =============================================================================
// JsonPriceOracle
// =============================================================================

int32_t JsonPriceOracle::decode(const Proof& proof, std::vector<PriceEntry>& out) const {
    out.clear();

    json doc = json::parse(proof.begin(), proof.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return errors::PROOF_INVALID;
    }

    auto prices = doc.find("prices");
    if (prices == doc.end() || !prices->is_array()) {
        return errors::PROOF_INVALID;
    }

    for (const auto& item : *prices) {
        if (!item.is_object()) return errors::PROOF_INVALID;

        auto pair = item.find("pair");
        auto price = item.find("price");
        auto decimals = item.find("decimals");
        auto timestamp = item.find("timestamp");
        if (pair == item.end() || !pair->is_number_unsigned() ||
            price == item.end() ||
            decimals == item.end() || !decimals->is_number_unsigned() ||
            timestamp == item.end() || !timestamp->is_number_unsigned()) {
            return errors::PROOF_INVALID;
        }

        if (decimals->get<uint64_t>() > 255) return errors::PROOF_INVALID;
        if (pair->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) return errors::PROOF_INVALID;

        PriceEntry entry{};
        entry.pair = pair->get<uint32_t>();
        entry.decimals = static_cast<uint8_t>(decimals->get<uint32_t>());
        entry.timestamp = timestamp->get<uint64_t>();
        auto round = item.find("round");
        if (round != item.end()) {
            if (!round->is_number_unsigned()) return errors::PROOF_INVALID;
            entry.round = round->get<uint64_t>();
        }

        if (price->is_number_integer()) {
            entry.price = price->is_number_unsigned()
                ? static_cast<I128>(price->get<uint64_t>())
                : static_cast<I128>(price->get<int64_t>());
        } else if (price->is_string()) {
            auto parsed = e6::parse_i128(price->get<std::string>());
            if (!parsed) return errors::PROOF_INVALID;
            entry.price = *parsed;
        } else {
            return errors::PROOF_INVALID;
        }

        out.push_back(entry);
    }

    return errors::OK;
}

Proof JsonPriceOracle::encode(const std::vector<PriceEntry>& entries) {
    json prices = json::array();
    for (const auto& entry : entries) {
        prices.push_back({
            {"pair", entry.pair},
            {"price", e6::to_string(entry.price)},
            {"decimals", entry.decimals},
            {"timestamp", entry.timestamp},
            {"round", entry.round}
        });
    }
    std::string text = json{{"prices", prices}}.dump();
    return Proof(text.begin(), text.end());
}

// =============================================================================
// Ingestion
// =============================================================================

PriceResult normalize_price(const PriceEntry& entry, uint64_t max_age_sec, uint64_t now) {
    PriceResult result{errors::OK, 0, 0, entry.round};

    uint64_t ts = entry.timestamp;
    if (ts > proof_limits::MILLISECOND_THRESHOLD) {
        ts /= 1000;
    }
    result.timestamp = ts;

    if (ts > now + proof_limits::MAX_FUTURE_SKEW_SEC) {
        result.status = errors::PROOF_BAD_TIMESTAMP;
        return result;
    }
    if (ts < now && now - ts > max_age_sec) {
        result.status = errors::PROOF_TOO_OLD;
        return result;
    }

    if (entry.price <= 0) {
        result.status = errors::PROOF_PRICE_ZERO;
        return result;
    }

    I128 price = entry.price;
    if (entry.decimals > proof_limits::CANONICAL_DECIMALS) {
        for (uint8_t i = proof_limits::CANONICAL_DECIMALS; i < entry.decimals && price > 0; ++i) {
            price /= 10;
        }
    } else {
        for (uint8_t i = entry.decimals; i < proof_limits::CANONICAL_DECIMALS; ++i) {
            if (!e6::checked_mul(price, 10, price)) {
                result.status = errors::PROOF_RANGE;
                return result;
            }
        }
    }

    if (price > e6::I64_MAX) {
        result.status = errors::PROOF_RANGE;
        return result;
    }
    if (price == 0) {
        result.status = errors::PROOF_PRICE_ZERO;
        return result;
    }

    result.price_e6 = static_cast<int64_t>(price);
    return result;
}

PriceResult read_price(const IPriceOracle& oracle, const Proof& proof,
                       uint32_t pair, uint64_t max_age_sec, uint64_t now) {
    std::vector<PriceEntry> entries;
    int32_t status = oracle.decode(proof, entries);
    if (status != errors::OK) {
        return PriceResult{status, 0, 0, 0};
    }

    for (const auto& entry : entries) {
        if (entry.pair == pair) {
            return normalize_price(entry, max_age_sec, now);
        }
    }
    return PriceResult{errors::PRICE_NOT_FOUND, 0, 0, 0};
}

} // namespace lever
