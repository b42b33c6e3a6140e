#ifndef LEVER_LEVER_HPP
#define LEVER_LEVER_HPP

// =============================================================================
// Lever - Leveraged Trading Ledger
//
// Components:
//   AccessControl   role table
//   AssetRegistry   lot sizes, spreads, funding rates, market hours
//   IPriceOracle    price-proof decoder
//   CustodyLedger   balances, margin locks, counterparty pool
//   PositionEngine  order / position lifecycle
//   Relayer         signed delegated calls
// =============================================================================

#include <memory>

#include "types.hpp"
#include "access.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "registry.hpp"
#include "relayer.hpp"
#include "trade.hpp"

namespace lever {

// =============================================================================
// Lever - Unified Controller
// =============================================================================
//
// Builds every component from a DeploymentConfig and assigns the configured
// roles. Without a signature verifier no relayer is created. Throws
// ConfigError if the configuration cannot be applied.

class Lever {
public:
    explicit Lever(const DeploymentConfig& config,
                   std::unique_ptr<IPriceOracle> oracle = nullptr,
                   std::unique_ptr<ISignatureVerifier> verifier = nullptr);
    ~Lever();

    // Non-copyable
    Lever(const Lever&) = delete;
    Lever& operator=(const Lever&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    AccessControl& access() { return *access_; }
    const AccessControl& access() const { return *access_; }

    AssetRegistry& registry() { return *registry_; }
    const AssetRegistry& registry() const { return *registry_; }

    CustodyLedger& ledger() { return *ledger_; }
    const CustodyLedger& ledger() const { return *ledger_; }

    PositionEngine& engine() { return *engine_; }
    const PositionEngine& engine() const { return *engine_; }

    Relayer* relayer() { return relayer_.get(); }

    const Address& owner() const { return owner_; }

    // Engine and relayer share one clock
    void set_clock(std::function<uint64_t()> clock);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t trades;
        uint64_t orders;
        uint64_t open_positions;
        uint64_t closed;
        uint64_t cancelled;
        PoolView pool;
        I128 total_value;
    };
    Stats stats() const;

    static constexpr const char* version() { return "1.0.0"; }

private:
    Address owner_;

    std::unique_ptr<AccessControl> access_;
    std::unique_ptr<AssetRegistry> registry_;
    std::unique_ptr<IPriceOracle> oracle_;
    std::unique_ptr<CustodyLedger> ledger_;
    std::unique_ptr<PositionEngine> engine_;
    std::unique_ptr<ISignatureVerifier> verifier_;
    std::unique_ptr<Relayer> relayer_;
};

} // namespace lever

#endif // LEVER_LEVER_HPP
