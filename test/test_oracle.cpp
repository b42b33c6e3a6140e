#include <catch2/catch.hpp>

#include <string>

#include "lever/oracle.hpp"
#include "fixtures.hpp"

using namespace lever;
using namespace lever::testing;

namespace {

Proof raw(const std::string& text) {
    return Proof(text.begin(), text.end());
}

PriceResult read(const std::string& text, uint32_t pair = BTC, uint64_t max_age = 60) {
    JsonPriceOracle oracle;
    return read_price(oracle, raw(text), pair, max_age, NOW);
}

} // namespace

TEST_CASE("JsonPriceOracle decodes price entries", "[oracle]") {
    JsonPriceOracle oracle;
    std::vector<PriceEntry> entries;

    SECTION("string and integer prices") {
        Proof p = raw(R"({"prices":[
            {"pair":1,"price":"6512345000000","decimals":8,"timestamp":1700000000,"round":7},
            {"pair":2,"price":3400,"decimals":0,"timestamp":1700000000}]})");
        REQUIRE(oracle.decode(p, entries) == errors::OK);
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].pair == 1);
        CHECK(entries[0].price == I128(6512345000000LL));
        CHECK(entries[0].decimals == 8);
        CHECK(entries[0].round == 7);
        CHECK(entries[1].price == 3400);
        CHECK(entries[1].round == 0);
    }

    SECTION("encode output decodes") {
        Proof p = JsonPriceOracle::encode({PriceEntry{3, 42, 2, NOW, 9}});
        REQUIRE(oracle.decode(p, entries) == errors::OK);
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].pair == 3);
        CHECK(entries[0].price == 42);
        CHECK(entries[0].round == 9);
    }

    SECTION("malformed proofs") {
        CHECK(oracle.decode(raw("not json"), entries) == errors::PROOF_INVALID);
        CHECK(oracle.decode(raw(R"({"prices":{}})"), entries) == errors::PROOF_INVALID);
        CHECK(oracle.decode(raw(R"({"prices":[{"pair":1}]})"), entries) == errors::PROOF_INVALID);
        CHECK(oracle.decode(raw(R"({"prices":[{"pair":1,"price":"1x","decimals":6,"timestamp":1}]})"),
                            entries) == errors::PROOF_INVALID);
        CHECK(oracle.decode(raw(R"({"prices":[{"pair":1,"price":1,"decimals":300,"timestamp":1}]})"),
                            entries) == errors::PROOF_INVALID);
        CHECK(oracle.decode(raw(R"({"prices":[{"pair":1,"price":1,"decimals":6,"timestamp":1,"round":-1}]})"),
                            entries) == errors::PROOF_INVALID);
        CHECK(oracle.decode(raw(R"({"prices":[{"pair":4294967297,"price":"100000000","decimals":6,"timestamp":1}]})"),
                            entries) == errors::PROOF_INVALID);
    }
}

TEST_CASE("read_price rescales to six decimals", "[oracle]") {
    SECTION("more decimals truncate") {
        PriceResult r = read(R"({"prices":[{"pair":1,"price":"6512345678901","decimals":8,"timestamp":1700000000}]})");
        REQUIRE(r.status == errors::OK);
        CHECK(r.price_e6 == 65123456789);
    }

    SECTION("fewer decimals scale up") {
        PriceResult r = read(R"({"prices":[{"pair":1,"price":12345,"decimals":4,"timestamp":1700000000}]})");
        REQUIRE(r.status == errors::OK);
        CHECK(r.price_e6 == 1234500);
    }

    SECTION("selects the requested pair") {
        PriceResult r = read(R"({"prices":[
            {"pair":1,"price":100,"decimals":0,"timestamp":1700000000},
            {"pair":2,"price":200,"decimals":0,"timestamp":1700000000}]})", ETH);
        REQUIRE(r.status == errors::OK);
        CHECK(r.price_e6 == units(200));
    }

    SECTION("missing pair") {
        PriceResult r = read(R"({"prices":[{"pair":5,"price":1,"decimals":0,"timestamp":1700000000}]})");
        CHECK(r.status == errors::PRICE_NOT_FOUND);
    }
}

TEST_CASE("read_price rejects pair ids beyond 32 bits", "[oracle]") {
    PriceResult r = read(R"({"prices":[{"pair":4294967297,"price":"100000000","decimals":6,"timestamp":1700000000}]})");
    CHECK(r.status == errors::PROOF_INVALID);
}

TEST_CASE("read_price rejects bad values", "[oracle]") {
    SECTION("zero and negative prices") {
        CHECK(read(R"({"prices":[{"pair":1,"price":0,"decimals":6,"timestamp":1700000000}]})").status
              == errors::PROOF_PRICE_ZERO);
        CHECK(read(R"({"prices":[{"pair":1,"price":"-5","decimals":6,"timestamp":1700000000}]})").status
              == errors::PROOF_PRICE_ZERO);
    }

    SECTION("price truncated to zero") {
        CHECK(read(R"({"prices":[{"pair":1,"price":1,"decimals":8,"timestamp":1700000000}]})").status
              == errors::PROOF_PRICE_ZERO);
    }

    SECTION("rescaled price beyond int64") {
        CHECK(read(R"({"prices":[{"pair":1,"price":"9223372036854775807","decimals":0,"timestamp":1700000000}]})").status
              == errors::PROOF_RANGE);
    }
}

TEST_CASE("read_price freshness", "[oracle]") {
    JsonPriceOracle oracle;

    SECTION("120 second old proof against max age") {
        Proof p = proof(BTC, units(100), NOW - 120);
        CHECK(read_price(oracle, p, BTC, 60, NOW).status == errors::PROOF_TOO_OLD);
        CHECK(read_price(oracle, p, BTC, 180, NOW).status == errors::OK);
    }

    SECTION("age equal to max age is accepted") {
        Proof p = proof(BTC, units(100), NOW - 60);
        CHECK(read_price(oracle, p, BTC, 60, NOW).status == errors::OK);
    }

    SECTION("future skew up to 180 seconds") {
        CHECK(read_price(oracle, proof(BTC, units(100), NOW + 180), BTC, 60, NOW).status == errors::OK);
        CHECK(read_price(oracle, proof(BTC, units(100), NOW + 181), BTC, 60, NOW).status
              == errors::PROOF_BAD_TIMESTAMP);
    }

    SECTION("millisecond timestamps") {
        PriceResult r = read_price(oracle, proof(BTC, units(100), NOW * 1000 + 500), BTC, 60, NOW);
        REQUIRE(r.status == errors::OK);
        CHECK(r.timestamp == NOW);
    }
}
