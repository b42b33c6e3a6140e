// =============================================================================
// registry.cpp - In-Memory Asset Registry
// =============================================================================

#include "lever/registry.hpp"

#include <mutex>

namespace lever {

int32_t AssetRegistry::list_asset(const AssetInfo& info) {
    if (info.lot_denominator == 0) {
        return errors::QTY_ZERO;
    }
    if (info.half_spread_ppm < 0 || info.half_spread_ppm >= e6::PPM) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    if (assets_.find(info.id) != assets_.end()) {
        return errors::ASSET_EXISTS;
    }
    assets_[info.id] = info;
    return errors::OK;
}

int32_t AssetRegistry::delist_asset(uint32_t asset_id) {
    std::unique_lock lock(mutex_);
    return assets_.erase(asset_id) > 0 ? errors::OK : errors::UNKNOWN_ASSET;
}

int32_t AssetRegistry::set_market_open(uint32_t asset_id, bool open) {
    std::unique_lock lock(mutex_);
    auto it = assets_.find(asset_id);
    if (it == assets_.end()) return errors::UNKNOWN_ASSET;
    it->second.market_open = open;
    return errors::OK;
}

int32_t AssetRegistry::set_half_spread(uint32_t asset_id, int64_t half_spread_ppm) {
    if (half_spread_ppm < 0 || half_spread_ppm >= e6::PPM) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    auto it = assets_.find(asset_id);
    if (it == assets_.end()) return errors::UNKNOWN_ASSET;
    it->second.half_spread_ppm = half_spread_ppm;
    return errors::OK;
}

int32_t AssetRegistry::set_funding_rate(uint32_t asset_id, int64_t funding_rate_ppm) {
    std::unique_lock lock(mutex_);
    auto it = assets_.find(asset_id);
    if (it == assets_.end()) return errors::UNKNOWN_ASSET;
    it->second.funding_rate_ppm = funding_rate_ppm;
    return errors::OK;
}

std::optional<AssetInfo> AssetRegistry::asset(uint32_t asset_id) const {
    std::shared_lock lock(mutex_);
    auto it = assets_.find(asset_id);
    if (it == assets_.end()) return std::nullopt;
    return it->second;
}

bool AssetRegistry::is_market_open(uint32_t asset_id) const {
    std::shared_lock lock(mutex_);
    auto it = assets_.find(asset_id);
    return it != assets_.end() && it->second.market_open;
}

std::vector<uint32_t> AssetRegistry::asset_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<uint32_t> ids;
    ids.reserve(assets_.size());
    for (const auto& [id, info] : assets_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace lever
