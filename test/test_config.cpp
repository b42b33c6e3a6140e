#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "lever/lever.hpp"
#include "fixtures.hpp"

using namespace lever;
using namespace lever::testing;

namespace {

const char* FULL_CONFIG = R"({
    "engine": {"tolerance_bps": 10, "liquidation_fraction_bps": 9000,
               "max_leverage": 50, "max_price_age_sec": 30,
               "funding_interval_sec": 3600, "cap_pnl_to_margin": false},
    "pool":   {"mode": "share_pool", "fee_skim_bps": 250},
    "roles":  {"owner": 1, "engine": "0x00000000000000000000000000000000000000e0",
               "relayer": 225, "keepers": [192, 193]},
    "assets": [{"id": 1, "symbol": "BTC-USD", "lot_numerator": 1, "lot_denominator": 1000,
                "half_spread_ppm": 100, "funding_rate_ppm": -5, "market_open": true},
               {"id": 2, "symbol": "ETH-USD", "market_open": false}]
})";

class AcceptAll : public ISignatureVerifier {
public:
    bool verify(const Address&, const std::vector<uint8_t>&,
                const std::vector<uint8_t>&) const override {
        return true;
    }
};

} // namespace

TEST_CASE("Deployment configuration parses every section", "[config]") {
    DeploymentConfig cfg = DeploymentConfig::from_string(FULL_CONFIG);

    CHECK(cfg.engine.tolerance_bps == 10);
    CHECK(cfg.engine.liquidation_fraction_bps == 9000);
    CHECK(cfg.engine.max_leverage == 50);
    CHECK(cfg.engine.max_price_age_sec == 30);
    CHECK(cfg.engine.funding_interval_sec == 3600);
    CHECK_FALSE(cfg.engine.cap_pnl_to_margin);

    CHECK(cfg.pool_mode == PoolMode::SHARE_POOL);
    CHECK(cfg.fee_skim_bps == 250);

    CHECK(cfg.owner == OWNER);
    CHECK(cfg.engine_address == ENGINE);
    CHECK(cfg.relayer == RELAYER);
    REQUIRE(cfg.keepers.size() == 2);
    CHECK(cfg.keepers[0] == KEEPER);

    REQUIRE(cfg.assets.size() == 2);
    CHECK(cfg.assets[0].symbol == "BTC-USD");
    CHECK(cfg.assets[0].lot_denominator == 1000);
    CHECK(cfg.assets[0].funding_rate_ppm == -5);
    CHECK(cfg.assets[1].lot_numerator == 1);
    CHECK_FALSE(cfg.assets[1].market_open);
}

TEST_CASE("Deployment configuration defaults", "[config]") {
    DeploymentConfig cfg = DeploymentConfig::from_string(R"({"roles": {"owner": 1}})");

    CHECK(cfg.engine.tolerance_bps == 5);
    CHECK(cfg.engine.liquidation_fraction_bps == 8000);
    CHECK(cfg.engine.max_price_age_sec == 60);
    CHECK(cfg.engine.funding_interval_sec == 2700);
    CHECK(cfg.engine.cap_pnl_to_margin);
    CHECK(cfg.pool_mode == PoolMode::OWNER_CASH);
    CHECK(cfg.keepers.empty());
    CHECK(cfg.assets.empty());
}

TEST_CASE("Fee skim switch selects the default rate", "[config]") {
    DeploymentConfig on = DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "pool": {"fee_skim": true}})");
    CHECK(on.fee_skim_bps == DEFAULT_FEE_SKIM_BPS);

    DeploymentConfig explicit_rate = DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "pool": {"fee_skim": true, "fee_skim_bps": 1000}})");
    CHECK(explicit_rate.fee_skim_bps == 1000);

    DeploymentConfig off = DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "pool": {"fee_skim": false}})");
    CHECK(off.fee_skim_bps == 0);
}

TEST_CASE("Leverage ceiling accepts the full range", "[config]") {
    DeploymentConfig cfg = DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "engine": {"max_leverage": 100}})");
    CHECK(cfg.engine.max_leverage == MAX_LEVERAGE);
}

TEST_CASE("Malformed configuration throws ConfigError", "[config]") {
    CHECK_THROWS_AS(DeploymentConfig::from_string("{"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string("[]"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string("{}"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string(R"({"roles": {"owner": 0}})"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string(R"({"roles": {"owner": "0x12"}})"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "pool": {"mode": "vault"}})"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "engine": {"tolerance_bps": -1}})"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "engine": {"liquidation_fraction_bps": 12000}})"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "engine": {"max_leverage": 0}})"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "engine": {"max_leverage": 101}})"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "assets": [{"id": 1, "lot_denominator": 0}]})"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_string(
        R"({"roles": {"owner": 1}, "assets": [{"symbol": "X"}]})"), ConfigError);
    CHECK_THROWS_AS(DeploymentConfig::from_file("/nonexistent/lever.json"), ConfigError);
}

TEST_CASE("Configuration loads from a file", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "lever_test_config.json";
    {
        std::ofstream out(path);
        out << FULL_CONFIG;
    }

    DeploymentConfig cfg = DeploymentConfig::from_file(path.string());
    CHECK(cfg.assets.size() == 2);
    std::filesystem::remove(path);
}

TEST_CASE("Lever wires a deployment from configuration", "[config]") {
    DeploymentConfig cfg = DeploymentConfig::from_string(R"({
        "roles":  {"owner": 1, "engine": 224, "relayer": 225, "keepers": [192]},
        "assets": [{"id": 1, "symbol": "BTC-USD"}]
    })");

    SECTION("without a verifier") {
        Lever lever(cfg);
        CHECK(lever.access().has_role(Role::LEDGER_CONTROLLER, ENGINE));
        CHECK(lever.access().has_role(Role::KEEPER, KEEPER));
        CHECK_FALSE(lever.access().has_role(Role::RELAYER, RELAYER));
        CHECK(lever.relayer() == nullptr);
        CHECK(lever.registry().asset(BTC).has_value());
        CHECK(lever.engine().address() == ENGINE);
    }

    SECTION("end to end") {
        Lever lever(cfg, nullptr, std::make_unique<AcceptAll>());
        REQUIRE(lever.relayer() != nullptr);
        CHECK(lever.access().has_role(Role::RELAYER, RELAYER));

        uint64_t now = NOW;
        lever.set_clock([&] { return now; });

        lever.ledger().deposit(OWNER, units(500));
        REQUIRE(lever.ledger().fund_pool(OWNER, units(500)) == errors::OK);
        lever.ledger().deposit(ALICE, units(100));

        OpenResult opened = lever.engine().open_market(ALICE, long_at(0, 10, 5), proof(BTC, units(100)));
        REQUIRE(opened.status == errors::OK);
        lever.engine().open_limit(ALICE, long_at(units(90), 10, 1));

        Lever::Stats s = lever.stats();
        CHECK(s.trades == 2);
        CHECK(s.open_positions == 1);
        CHECK(s.orders == 1);
        CHECK(s.pool.liquidity == units(500));
        CHECK(s.total_value == units(600));

        now += 10;
        REQUIRE(lever.engine().close_market(ALICE, opened.trade_id, proof(BTC, units(104), now)).status
                == errors::OK);
        s = lever.stats();
        CHECK(s.closed == 1);
        CHECK(s.pool.liquidity == units(480));
        CHECK(lever.ledger().balance(ALICE) == units(120));
    }

    SECTION("duplicate assets fail") {
        cfg.assets.push_back(cfg.assets.front());
        CHECK_THROWS_AS(Lever(cfg), ConfigError);
    }
}
