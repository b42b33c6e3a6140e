#ifndef LEVER_CONFIG_HPP
#define LEVER_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "engine.hpp"
#include "pool.hpp"
#include "registry.hpp"

namespace lever {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// =============================================================================
// DeploymentConfig - Parameters, Roles and Assets of One Deployment
// =============================================================================
//
// {
//   "engine":  {"tolerance_bps": 5, "liquidation_fraction_bps": 8000,
//               "max_leverage": 100, "max_price_age_sec": 60,
//               "funding_interval_sec": 2700, "cap_pnl_to_margin": true},
//   "pool":    {"mode": "owner_cash", "fee_skim": false, "fee_skim_bps": 0},
//   "roles":   {"owner": "0x..", "engine": "0x..", "relayer": "0x..",
//               "keepers": ["0x.."]},
//   "assets":  [{"id": 1, "symbol": "BTC-USD", "lot_numerator": 1,
//                "lot_denominator": 1000, "half_spread_ppm": 0,
//                "funding_rate_ppm": 0, "market_open": true}]
// }
//
// Addresses are 0x-prefixed hex strings or plain integers (addresses::from_id).
// Missing engine / pool keys keep their defaults; "roles.owner" is required.

struct DeploymentConfig {
    EngineParams engine;
    PoolMode pool_mode = PoolMode::OWNER_CASH;
    uint32_t fee_skim_bps = 0;

    Address owner = addresses::ZERO;
    Address engine_address = addresses::from_id(0xE0);
    Address relayer = addresses::from_id(0xE1);
    std::vector<Address> keepers;

    std::vector<AssetInfo> assets;

    // Throw ConfigError on malformed input
    static DeploymentConfig from_json(const nlohmann::json& doc);
    static DeploymentConfig from_string(const std::string& text);
    static DeploymentConfig from_file(const std::string& path);
};

// Hex string or integer id; throws ConfigError
Address address_from_json(const nlohmann::json& value);

} // namespace lever

#endif // LEVER_CONFIG_HPP
