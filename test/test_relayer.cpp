#include <catch2/catch.hpp>

#include <vector>

#include "lever/relayer.hpp"
#include "fixtures.hpp"

using namespace lever;
using namespace lever::testing;

namespace {

// Accepts a signature equal to the payload with the signer's last byte appended
class EchoVerifier : public ISignatureVerifier {
public:
    bool verify(const Address& signer, const std::vector<uint8_t>& payload,
                const std::vector<uint8_t>& signature) const override {
        std::vector<uint8_t> expected = payload;
        expected.push_back(signer[19]);
        return signature == expected;
    }
};

SignedCall signed_call(SignedCall call) {
    call.signature = Relayer::signing_payload(call);
    call.signature.push_back(call.trader[19]);
    return call;
}

SignedCall open_limit_call(uint64_t nonce, OpenRequest req = long_at(units(100))) {
    SignedCall call{};
    call.trader = ALICE;
    call.kind = CallKind::OPEN_LIMIT;
    call.open = req;
    call.nonce = nonce;
    call.expiry = NOW + 60;
    return signed_call(call);
}

struct RelayFixture : Deployment {
    EchoVerifier verifier;
    Relayer relayer{RELAYER, engine, verifier};

    RelayFixture() {
        access.grant(OWNER, Role::RELAYER, RELAYER);
        relayer.set_clock([this] { return now; });
    }
};

} // namespace

TEST_CASE("Relayed calls act for the trader", "[relayer]") {
    RelayFixture f;

    RelayResult r = f.relayer.dispatch(open_limit_call(1));
    REQUIRE(r.status == errors::OK);
    CHECK(f.engine.trade(r.trade_id)->owner == ALICE);
    CHECK(f.ledger.locked(ALICE) == units(100));
    CHECK(f.relayer.last_nonce(ALICE) == 1);

    SECTION("stops, cancel") {
        SignedCall stops{};
        stops.trader = ALICE;
        stops.kind = CallKind::UPDATE_STOPS;
        stops.trade_id = r.trade_id;
        stops.stop_loss = units(95);
        stops.nonce = 2;
        stops.expiry = NOW;
        REQUIRE(f.relayer.dispatch(signed_call(stops)).status == errors::OK);
        CHECK(f.engine.trade(r.trade_id)->stop_loss == units(95));

        SignedCall cancel{};
        cancel.trader = ALICE;
        cancel.kind = CallKind::CANCEL;
        cancel.trade_id = r.trade_id;
        cancel.nonce = 10;
        cancel.expiry = NOW + 1;
        REQUIRE(f.relayer.dispatch(signed_call(cancel)).status == errors::OK);
        CHECK(f.engine.trade(r.trade_id)->state == TradeState::CANCELLED);
        CHECK(f.relayer.last_nonce(ALICE) == 10);
    }

    SECTION("market open and close") {
        SignedCall open{};
        open.trader = ALICE;
        open.kind = CallKind::OPEN_MARKET;
        open.open = long_at(0);
        open.proof = proof(BTC, units(100));
        open.nonce = 2;
        open.expiry = NOW + 60;
        RelayResult opened = f.relayer.dispatch(signed_call(open));
        REQUIRE(opened.status == errors::OK);

        SignedCall close{};
        close.trader = ALICE;
        close.kind = CallKind::CLOSE_MARKET;
        close.trade_id = opened.trade_id;
        close.proof = proof(BTC, units(102));
        close.nonce = 3;
        close.expiry = NOW + 60;
        REQUIRE(f.relayer.dispatch(signed_call(close)).status == errors::OK);
        CHECK(f.engine.trade(opened.trade_id)->realized_pnl == units(20));
    }
}

TEST_CASE("Relayer rejects stale, replayed and forged calls", "[relayer]") {
    RelayFixture f;
    REQUIRE(f.relayer.dispatch(open_limit_call(5)).status == errors::OK);

    SECTION("nonce must increase") {
        CHECK(f.relayer.dispatch(open_limit_call(5)).status == errors::BAD_NONCE);
        CHECK(f.relayer.dispatch(open_limit_call(4)).status == errors::BAD_NONCE);
        CHECK(f.relayer.dispatch(open_limit_call(6)).status == errors::OK);
    }

    SECTION("expiry is inclusive") {
        SignedCall call = open_limit_call(6);
        f.now = call.expiry;
        CHECK(f.relayer.dispatch(call).status == errors::OK);
        SignedCall late = open_limit_call(7);
        f.now = late.expiry + 1;
        CHECK(f.relayer.dispatch(late).status == errors::EXPIRED);
        CHECK(f.relayer.last_nonce(ALICE) == 6);
    }

    SECTION("tampered fields break the signature") {
        SignedCall call = open_limit_call(6);
        call.open.lots = 20;
        CHECK(f.relayer.dispatch(call).status == errors::BAD_SIGNATURE);

        SignedCall other = open_limit_call(6);
        other.trader = BOB;
        CHECK(f.relayer.dispatch(other).status == errors::BAD_SIGNATURE);
        CHECK(f.relayer.last_nonce(ALICE) == 5);
    }

    SECTION("failed calls keep the nonce") {
        CHECK(f.relayer.dispatch(open_limit_call(6, long_at(units(100), 0))).status
              == errors::INVALID_LEVERAGE);
        CHECK(f.relayer.last_nonce(ALICE) == 5);
        CHECK(f.relayer.dispatch(open_limit_call(6)).status == errors::OK);
        CHECK(f.relayer.last_nonce(ALICE) == 6);
    }

    SECTION("nonces are per trader") {
        SignedCall bob = open_limit_call(1);
        bob.trader = BOB;
        CHECK(f.relayer.dispatch(signed_call(bob)).status == errors::OK);
        CHECK(f.relayer.last_nonce(BOB) == 1);
    }
}

TEST_CASE("Trade callbacks may read relayer state mid-dispatch", "[relayer]") {
    RelayFixture f;
    std::vector<uint64_t> seen;
    f.engine.set_trade_callback([&](const TradeEvent&) {
        seen.push_back(f.relayer.last_nonce(ALICE));
    });

    REQUIRE(f.relayer.dispatch(open_limit_call(1)).status == errors::OK);
    REQUIRE(f.relayer.dispatch(open_limit_call(2)).status == errors::OK);

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == 0);
    CHECK(seen[1] == 1);
    CHECK(f.relayer.last_nonce(ALICE) == 2);
}

TEST_CASE("Delegated entry points require the relayer role", "[relayer]") {
    RelayFixture f;

    CHECK(f.engine.open_limit_for(MALLORY, ALICE, long_at(units(100))).status == errors::UNAUTHORIZED);
    CHECK(f.engine.cancel_for(MALLORY, ALICE, 1) == errors::UNAUTHORIZED);

    f.access.revoke(OWNER, Role::RELAYER, RELAYER);
    CHECK(f.relayer.dispatch(open_limit_call(1)).status == errors::UNAUTHORIZED);
    CHECK(f.relayer.last_nonce(ALICE) == 0);
}

TEST_CASE("Signing payload covers the call but not the proof", "[relayer]") {
    SignedCall call{};
    call.trader = ALICE;
    call.kind = CallKind::CLOSE_MARKET;
    call.trade_id = 7;
    call.nonce = 1;
    call.expiry = NOW;

    auto base = Relayer::signing_payload(call);

    SignedCall with_proof = call;
    with_proof.proof = proof(BTC, units(100));
    CHECK(Relayer::signing_payload(with_proof) == base);

    SignedCall other_trade = call;
    other_trade.trade_id = 8;
    CHECK(Relayer::signing_payload(other_trade) != base);

    SignedCall other_kind = call;
    other_kind.kind = CallKind::CANCEL;
    CHECK(Relayer::signing_payload(other_kind) != base);
}
