#include <catch2/catch.hpp>

#include <algorithm>
#include <string>

#include "lever/access.hpp"
#include "lever/registry.hpp"
#include "fixtures.hpp"

using namespace lever;
using namespace lever::testing;

TEST_CASE("Role grants are owner administered", "[access]") {
    AccessControl access(OWNER);

    CHECK(access.has_role(Role::OWNER, OWNER));
    CHECK_FALSE(access.has_role(Role::KEEPER, KEEPER));

    CHECK(access.grant(ALICE, Role::KEEPER, KEEPER) == errors::UNAUTHORIZED);
    CHECK(access.grant(OWNER, Role::KEEPER, addresses::ZERO) == errors::INVALID_AMOUNT);
    REQUIRE(access.grant(OWNER, Role::KEEPER, KEEPER) == errors::OK);
    CHECK(access.has_role(Role::KEEPER, KEEPER));
    CHECK_FALSE(access.has_role(Role::RELAYER, KEEPER));

    auto keepers = access.members(Role::KEEPER);
    CHECK(std::find(keepers.begin(), keepers.end(), KEEPER) != keepers.end());

    REQUIRE(access.revoke(OWNER, Role::KEEPER, KEEPER) == errors::OK);
    CHECK_FALSE(access.has_role(Role::KEEPER, KEEPER));

    SECTION("the last owner stays") {
        CHECK(access.revoke(OWNER, Role::OWNER, OWNER) == errors::INVALID_STATE);
        REQUIRE(access.grant(OWNER, Role::OWNER, ALICE) == errors::OK);
        CHECK(access.revoke(ALICE, Role::OWNER, OWNER) == errors::OK);
        CHECK_FALSE(access.has_role(Role::OWNER, OWNER));
    }
}

TEST_CASE("Asset registry listing", "[registry]") {
    AssetRegistry registry;

    REQUIRE(registry.list_asset(AssetInfo{BTC, "BTC-USD", 1, 1000, 250, 10, true}) == errors::OK);
    CHECK(registry.list_asset(AssetInfo{BTC, "BTC-USD", 1, 1000, 250, 10, true}) == errors::ASSET_EXISTS);
    CHECK(registry.list_asset(AssetInfo{ETH, "ETH-USD", 1, 0, 0, 0, true}) == errors::QTY_ZERO);
    CHECK(registry.list_asset(AssetInfo{ETH, "ETH-USD", 1, 1, e6::PPM, 0, true}) == errors::INVALID_AMOUNT);

    auto info = registry.asset(BTC);
    REQUIRE(info.has_value());
    CHECK(info->symbol == "BTC-USD");
    CHECK(info->lot_denominator == 1000);
    CHECK(registry.is_market_open(BTC));
    CHECK_FALSE(registry.asset(ETH).has_value());

    SECTION("updates") {
        CHECK(registry.set_market_open(BTC, false) == errors::OK);
        CHECK_FALSE(registry.is_market_open(BTC));
        CHECK(registry.set_half_spread(BTC, 500) == errors::OK);
        CHECK(registry.set_half_spread(BTC, -1) == errors::INVALID_AMOUNT);
        CHECK(registry.set_funding_rate(BTC, -20) == errors::OK);
        CHECK(registry.asset(BTC)->half_spread_ppm == 500);
        CHECK(registry.asset(BTC)->funding_rate_ppm == -20);
        CHECK(registry.set_funding_rate(ETH, 1) == errors::UNKNOWN_ASSET);
    }

    SECTION("delisting") {
        CHECK(registry.delist_asset(BTC) == errors::OK);
        CHECK(registry.delist_asset(BTC) == errors::UNKNOWN_ASSET);
        CHECK(registry.asset_ids().empty());
        CHECK_FALSE(registry.is_market_open(BTC));
    }
}

TEST_CASE("Error categories", "[errors]") {
    CHECK(errors::category(errors::OK) == errors::Category::NONE);
    CHECK(errors::category(errors::BAD_NONCE) == errors::Category::AUTHORIZATION);
    CHECK(errors::category(errors::FUNDS_LOW) == errors::Category::FUNDS);
    CHECK(errors::category(errors::NO_TRIGGER) == errors::Category::PARAMETER);
    CHECK(errors::category(errors::PROOF_TOO_OLD) == errors::Category::PRICE);
    CHECK(errors::category(errors::PROOF_RANGE) == errors::Category::RANGE);
    CHECK(errors::category(errors::TRADE_NOT_FOUND) == errors::Category::NOT_FOUND);

    CHECK(errors::is_skippable(errors::INVALID_STATE));
    CHECK(errors::is_skippable(errors::PRICE_NOT_NEAR));
    CHECK(errors::is_skippable(errors::NO_TRIGGER));
    CHECK_FALSE(errors::is_skippable(errors::LIQUIDITY_LOW));
    CHECK_FALSE(errors::is_skippable(errors::RANGE));
    CHECK_FALSE(errors::is_skippable(errors::UNAUTHORIZED));

    CHECK(std::string(errors::to_string(errors::PRICE_NOT_NEAR)) == "PRICE_NOT_NEAR");
    CHECK(std::string(errors::to_string(-999)) == "UNKNOWN_ERROR");
}
