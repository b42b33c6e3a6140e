#ifndef LEVER_TEST_FIXTURES_HPP
#define LEVER_TEST_FIXTURES_HPP

#include "lever/access.hpp"
#include "lever/engine.hpp"
#include "lever/ledger.hpp"
#include "lever/oracle.hpp"
#include "lever/registry.hpp"

namespace lever::testing {

constexpr uint64_t NOW = 1700000000;

constexpr uint32_t BTC = 1;
constexpr uint32_t ETH = 2;

constexpr Address OWNER = addresses::from_id(1);
constexpr Address ENGINE = addresses::from_id(0xE0);
constexpr Address RELAYER = addresses::from_id(0xE1);
constexpr Address KEEPER = addresses::from_id(0xC0);
constexpr Address ALICE = addresses::from_id(100);
constexpr Address BOB = addresses::from_id(101);
constexpr Address MALLORY = addresses::from_id(666);

// Whole units -> 1e6 fixed point
constexpr int64_t units(int64_t v) { return v * e6::ONE; }

inline Proof proof(uint32_t pair, int64_t price_e6, uint64_t timestamp = NOW) {
    return JsonPriceOracle::encode({PriceEntry{pair, price_e6, 6, timestamp, 1}});
}

inline OpenRequest long_at(int64_t target, uint32_t leverage = 10, uint64_t lots = 10,
                           int64_t stop_loss = 0, int64_t take_profit = 0) {
    return OpenRequest{BTC, Side::LONG, leverage, lots, target, stop_loss, take_profit};
}

inline OpenRequest short_at(int64_t target, uint32_t leverage = 10, uint64_t lots = 10,
                            int64_t stop_loss = 0, int64_t take_profit = 0) {
    return OpenRequest{BTC, Side::SHORT, leverage, lots, target, stop_loss, take_profit};
}

// One lot of BTC or ETH = one unit of base, so notional = lots * price
struct Deployment {
    AccessControl access{OWNER};
    AssetRegistry registry;
    JsonPriceOracle oracle;
    CustodyLedger ledger;
    PositionEngine engine;
    uint64_t now = NOW;

    explicit Deployment(EngineParams params = {},
                        int64_t pool_funding = units(1000000),
                        PoolMode mode = PoolMode::OWNER_CASH,
                        uint32_t fee_skim_bps = 0)
        : ledger(access, mode, fee_skim_bps),
          engine(ENGINE, access, ledger, registry, oracle, params) {
        access.grant(OWNER, Role::LEDGER_CONTROLLER, ENGINE);
        access.grant(OWNER, Role::KEEPER, KEEPER);
        registry.list_asset(AssetInfo{BTC, "BTC-USD", 1, 1, 0, 0, true});
        registry.list_asset(AssetInfo{ETH, "ETH-USD", 1, 1, 0, 0, true});
        engine.set_clock([this] { return now; });

        if (mode == PoolMode::OWNER_CASH && pool_funding > 0) {
            ledger.deposit(OWNER, pool_funding);
            ledger.fund_pool(OWNER, pool_funding);
        }
        ledger.deposit(ALICE, units(1000));
        ledger.deposit(BOB, units(1000));
    }

    uint64_t open_market(const Address& trader, const OpenRequest& req, int64_t price) {
        return engine.open_market(trader, req, proof(req.asset, price, now)).trade_id;
    }

    bool locked_within_balance(const Address& who) const {
        return ledger.locked(who) >= 0 && ledger.locked(who) <= ledger.balance(who);
    }
};

} // namespace lever::testing

#endif // LEVER_TEST_FIXTURES_HPP
