// =============================================================================
// config.cpp - Deployment Configuration Loading
// =============================================================================

#include "lever/config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace lever {

using json = nlohmann::json;

namespace {

template <typename T>
void read_unsigned(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_number_unsigned()) {
        throw ConfigError(std::string("'") + key + "' must be an unsigned integer");
    }
    uint64_t value = it->get<uint64_t>();
    if (value > std::numeric_limits<T>::max()) {
        throw ConfigError(std::string("'") + key + "' out of range");
    }
    out = static_cast<T>(value);
}

void read_signed(const json& obj, const char* key, int64_t& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_number_integer()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    out = it->get<int64_t>();
}

void read_bool(const json& obj, const char* key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_boolean()) {
        throw ConfigError(std::string("'") + key + "' must be a boolean");
    }
    out = it->get<bool>();
}

const json* section(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end()) return nullptr;
    if (!it->is_object()) {
        throw ConfigError(std::string("'") + key + "' must be an object");
    }
    return &*it;
}

PoolMode parse_pool_mode(const json& value) {
    if (!value.is_string()) {
        throw ConfigError("'pool.mode' must be a string");
    }
    const auto& mode = value.get_ref<const std::string&>();
    if (mode == "owner_cash") return PoolMode::OWNER_CASH;
    if (mode == "share_pool") return PoolMode::SHARE_POOL;
    throw ConfigError("unknown pool mode '" + mode + "'");
}

AssetInfo parse_asset(const json& item) {
    if (!item.is_object()) {
        throw ConfigError("asset entries must be objects");
    }

    AssetInfo info{};
    info.lot_numerator = 1;
    info.lot_denominator = 1;
    info.market_open = true;

    if (item.find("id") == item.end()) {
        throw ConfigError("asset entry missing 'id'");
    }
    read_unsigned(item, "id", info.id);

    auto symbol = item.find("symbol");
    if (symbol != item.end()) {
        if (!symbol->is_string()) throw ConfigError("'symbol' must be a string");
        info.symbol = symbol->get<std::string>();
    }

    read_unsigned(item, "lot_numerator", info.lot_numerator);
    read_unsigned(item, "lot_denominator", info.lot_denominator);
    read_signed(item, "half_spread_ppm", info.half_spread_ppm);
    read_signed(item, "funding_rate_ppm", info.funding_rate_ppm);
    read_bool(item, "market_open", info.market_open);

    if (info.lot_denominator == 0) {
        throw ConfigError("asset " + std::to_string(info.id) + ": lot_denominator is zero");
    }
    return info;
}

} // anonymous namespace

Address address_from_json(const json& value) {
    if (value.is_number_unsigned()) {
        return addresses::from_id(value.get<uint64_t>());
    }
    if (value.is_string()) {
        auto addr = addresses::from_hex(value.get_ref<const std::string&>());
        if (addr) return *addr;
        throw ConfigError("malformed address '" + value.get<std::string>() + "'");
    }
    throw ConfigError("address must be a hex string or an unsigned integer");
}

// =============================================================================
// DeploymentConfig
// =============================================================================

DeploymentConfig DeploymentConfig::from_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    DeploymentConfig cfg;

    if (const json* engine = section(doc, "engine")) {
        read_unsigned(*engine, "tolerance_bps", cfg.engine.tolerance_bps);
        read_unsigned(*engine, "liquidation_fraction_bps", cfg.engine.liquidation_fraction_bps);
        read_unsigned(*engine, "max_leverage", cfg.engine.max_leverage);
        read_unsigned(*engine, "max_price_age_sec", cfg.engine.max_price_age_sec);
        read_unsigned(*engine, "funding_interval_sec", cfg.engine.funding_interval_sec);
        read_bool(*engine, "cap_pnl_to_margin", cfg.engine.cap_pnl_to_margin);

        if (cfg.engine.liquidation_fraction_bps == 0 ||
            cfg.engine.liquidation_fraction_bps > e6::BPS) {
            throw ConfigError("'liquidation_fraction_bps' must be in (0, 10000]");
        }
        if (cfg.engine.max_leverage == 0 || cfg.engine.max_leverage > MAX_LEVERAGE) {
            throw ConfigError("'max_leverage' must be in [1, 100]");
        }
    }

    if (const json* pool = section(doc, "pool")) {
        auto mode = pool->find("mode");
        if (mode != pool->end()) cfg.pool_mode = parse_pool_mode(*mode);
        bool skim = false;
        read_bool(*pool, "fee_skim", skim);
        if (skim) cfg.fee_skim_bps = DEFAULT_FEE_SKIM_BPS;
        read_unsigned(*pool, "fee_skim_bps", cfg.fee_skim_bps);
        if (cfg.fee_skim_bps > e6::BPS) {
            throw ConfigError("'fee_skim_bps' must not exceed 10000");
        }
    }

    const json* roles = section(doc, "roles");
    if (!roles || roles->find("owner") == roles->end()) {
        throw ConfigError("'roles.owner' is required");
    }
    cfg.owner = address_from_json(roles->at("owner"));
    if (addresses::is_zero(cfg.owner)) {
        throw ConfigError("'roles.owner' must not be the zero address");
    }
    if (roles->contains("engine")) cfg.engine_address = address_from_json(roles->at("engine"));
    if (roles->contains("relayer")) cfg.relayer = address_from_json(roles->at("relayer"));

    auto keepers = roles->find("keepers");
    if (keepers != roles->end()) {
        if (!keepers->is_array()) throw ConfigError("'roles.keepers' must be an array");
        for (const auto& k : *keepers) {
            cfg.keepers.push_back(address_from_json(k));
        }
    }

    auto assets = doc.find("assets");
    if (assets != doc.end()) {
        if (!assets->is_array()) throw ConfigError("'assets' must be an array");
        for (const auto& item : *assets) {
            cfg.assets.push_back(parse_asset(item));
        }
    }

    return cfg;
}

DeploymentConfig DeploymentConfig::from_string(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        throw ConfigError("configuration is not valid JSON");
    }
    return from_json(doc);
}

DeploymentConfig DeploymentConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open configuration file '" + path + "'");
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return from_string(buf.str());
}

} // namespace lever
