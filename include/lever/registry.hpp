#ifndef LEVER_REGISTRY_HPP
#define LEVER_REGISTRY_HPP

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "types.hpp"

namespace lever {

// =============================================================================
// Asset Configuration
// =============================================================================

struct AssetInfo {
    uint32_t id;
    std::string symbol;
    uint64_t lot_numerator;      // base quantity per lot = numerator / denominator
    uint64_t lot_denominator;
    int64_t half_spread_ppm;     // paid by the trader on open and on close
    int64_t funding_rate_ppm;    // signed, per funding interval; positive = longs pay
    bool market_open;
};

// =============================================================================
// Asset Registry Interface
// =============================================================================

class IAssetRegistry {
public:
    virtual ~IAssetRegistry() = default;

    virtual std::optional<AssetInfo> asset(uint32_t asset_id) const = 0;
    virtual bool is_market_open(uint32_t asset_id) const = 0;
};

// =============================================================================
// AssetRegistry - In-Memory Registry
// =============================================================================

class AssetRegistry : public IAssetRegistry {
public:
    AssetRegistry() = default;
    ~AssetRegistry() override = default;

    // Non-copyable
    AssetRegistry(const AssetRegistry&) = delete;
    AssetRegistry& operator=(const AssetRegistry&) = delete;

    int32_t list_asset(const AssetInfo& info);
    int32_t delist_asset(uint32_t asset_id);

    int32_t set_market_open(uint32_t asset_id, bool open);
    int32_t set_half_spread(uint32_t asset_id, int64_t half_spread_ppm);
    int32_t set_funding_rate(uint32_t asset_id, int64_t funding_rate_ppm);

    std::optional<AssetInfo> asset(uint32_t asset_id) const override;
    bool is_market_open(uint32_t asset_id) const override;

    std::vector<uint32_t> asset_ids() const;

private:
    std::map<uint32_t, AssetInfo> assets_;
    mutable std::shared_mutex mutex_;
};

} // namespace lever

#endif // LEVER_REGISTRY_HPP
