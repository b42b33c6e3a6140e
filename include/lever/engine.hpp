#ifndef LEVER_ENGINE_HPP
#define LEVER_ENGINE_HPP

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "access.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "registry.hpp"
#include "trade.hpp"

namespace lever {

// =============================================================================
// Engine Parameters
// =============================================================================

constexpr uint32_t MAX_LEVERAGE = 100;

struct EngineParams {
    uint32_t tolerance_bps = 5;                // execute / SL / TP / liquidation match band
    uint32_t liquidation_fraction_bps = 8000;  // margin fraction lost at the liquidation price
    uint32_t max_leverage = MAX_LEVERAGE;     // at most MAX_LEVERAGE
    uint64_t max_price_age_sec = 60;
    uint64_t funding_interval_sec = 2700;
    bool cap_pnl_to_margin = true;             // clamp realized PnL to +/- margin
};

// =============================================================================
// Requests & Results
// =============================================================================

struct OpenRequest {
    uint32_t asset;
    Side side;
    uint32_t leverage;
    uint64_t lots;
    int64_t target_price;   // limit orders only
    int64_t stop_loss;      // 0 = not set
    int64_t take_profit;    // 0 = not set
};

struct OpenResult {
    int32_t status;
    uint64_t trade_id;
};

struct CloseResult {
    int32_t status;
    int64_t exit_price;
    int64_t pnl;
};

struct BatchOutcome {
    uint64_t trade_id;
    int32_t status;     // OK = executed / closed, otherwise the skip reason
};

struct BatchResult {
    int32_t status;     // non-OK: whole batch rejected or rolled back
    uint32_t processed;
    uint32_t skipped;
    std::vector<BatchOutcome> outcomes;
};

struct Exposure {
    uint64_t long_lots;
    uint64_t short_lots;
};

// =============================================================================
// PositionEngine - Order / Position Lifecycle
// =============================================================================
//
// ORDER -> OPEN -> CLOSED, ORDER -> CANCELLED. Every mutating call runs under
// the engine lock inside one ledger transaction: a failing call leaves no
// trace on the ledger or the trade store. The engine's own address must hold
// LEDGER_CONTROLLER.
//
// Batches read the price proof once and evaluate each id independently.
// Items failing with a state, price, parameter or lookup error are skipped;
// a ledger funds or range failure rolls back the whole batch. Exposure deltas
// are applied once when the batch commits.

class PositionEngine {
public:
    using ClockFn = std::function<uint64_t()>;

    PositionEngine(const Address& self,
                   AccessControl& access,
                   CustodyLedger& ledger,
                   const IAssetRegistry& registry,
                   const IPriceOracle& oracle,
                   EngineParams params = {});
    ~PositionEngine() = default;

    // Non-copyable
    PositionEngine(const PositionEngine&) = delete;
    PositionEngine& operator=(const PositionEngine&) = delete;

    // =========================================================================
    // Trader Entry Points (caller is the trader)
    // =========================================================================

    OpenResult open_limit(const Address& trader, const OpenRequest& request);
    OpenResult open_market(const Address& trader, const OpenRequest& request, const Proof& proof);

    int32_t update_stops(const Address& trader, uint64_t trade_id,
                         int64_t stop_loss, int64_t take_profit);
    int32_t cancel(const Address& trader, uint64_t trade_id);
    CloseResult close_market(const Address& trader, uint64_t trade_id, const Proof& proof);

    // =========================================================================
    // Delegated Entry Points (sender must hold RELAYER)
    // =========================================================================

    OpenResult open_limit_for(const Address& sender, const Address& trader,
                              const OpenRequest& request);
    OpenResult open_market_for(const Address& sender, const Address& trader,
                               const OpenRequest& request, const Proof& proof);
    int32_t update_stops_for(const Address& sender, const Address& trader, uint64_t trade_id,
                             int64_t stop_loss, int64_t take_profit);
    int32_t cancel_for(const Address& sender, const Address& trader, uint64_t trade_id);
    CloseResult close_market_for(const Address& sender, const Address& trader,
                                 uint64_t trade_id, const Proof& proof);

    // =========================================================================
    // Triggers (trade owner or KEEPER)
    // =========================================================================

    // ORDER -> OPEN when the price is within tolerance of the target
    int32_t execute(const Address& caller, uint64_t trade_id, const Proof& proof);

    // MARKET requires the owner; STOP_LOSS / TAKE_PROFIT / LIQUIDATION need a
    // set trigger the price satisfies
    CloseResult close(const Address& caller, uint64_t trade_id, CloseReason reason,
                      const Proof& proof);

    // =========================================================================
    // Batches (KEEPER)
    // =========================================================================

    BatchResult exec_limits(const Address& caller, uint32_t asset,
                            const std::vector<uint64_t>& trade_ids, const Proof& proof);
    BatchResult close_batch(const Address& caller, uint32_t asset, CloseReason reason,
                            const std::vector<uint64_t>& trade_ids, const Proof& proof);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Trade> trade(uint64_t trade_id) const;
    std::optional<TradeState> state_of(uint64_t trade_id) const;
    std::optional<Side> side_of(uint64_t trade_id) const;
    std::vector<Trade> trades_of(const Address& owner) const;
    Exposure exposure(uint32_t asset) const;
    uint64_t next_trade_id() const;

    const EngineParams& params() const { return params_; }
    const Address& address() const { return self_; }

    // =========================================================================
    // Hooks
    // =========================================================================

    void set_clock(ClockFn clock);
    void set_trade_callback(TradeCallback callback);

private:
    Address self_;
    AccessControl& access_;
    CustodyLedger& ledger_;
    const IAssetRegistry& registry_;
    const IPriceOracle& oracle_;
    EngineParams params_;

    // Trade arena: sequential ids, exclusively owned here
    std::map<uint64_t, Trade> trades_;
    uint64_t next_id_{1};

    std::unordered_map<uint32_t, Exposure> exposure_;

    ClockFn clock_;
    TradeCallback callback_;
    std::vector<TradeEvent> pending_;   // queued by the call in progress

    mutable std::shared_mutex mutex_;

    // Internal operations; mutex_ held by the caller
    OpenResult open_locked(const Address& trader, const OpenRequest& request,
                           const Proof* proof);
    int32_t update_stops_locked(const Address& trader, uint64_t trade_id,
                                int64_t stop_loss, int64_t take_profit);
    int32_t cancel_locked(const Address& trader, uint64_t trade_id);
    CloseResult close_locked(const Address& principal, uint64_t trade_id, CloseReason reason,
                             const Proof& proof);
    int32_t execute_locked(const Address& caller, uint64_t trade_id, const Proof& proof);
    BatchResult exec_limits_locked(const Address& caller, uint32_t asset,
                                   const std::vector<uint64_t>& trade_ids, const Proof& proof);
    BatchResult close_batch_locked(const Address& caller, uint32_t asset, CloseReason reason,
                                   const std::vector<uint64_t>& trade_ids, const Proof& proof);

    template <typename Fn>
    auto with_events(Fn&& fn);

    // Applies ORDER -> OPEN to `trade` (no ledger effects)
    int32_t apply_execute(Trade& trade, const AssetInfo& info, int64_t reference, uint64_t now) const;

    // Checks the trigger, unlocks and settles through `tx`, applies OPEN -> CLOSED
    int32_t apply_close(Trade& trade, CloseReason reason, const AssetInfo& info,
                        int64_t reference, uint64_t now, CustodyLedger::Transaction& tx) const;

    bool may_trigger(const Address& principal, const Trade& trade) const;
    PriceResult fetch_price(uint32_t asset, const Proof& proof, uint64_t now) const;
    void add_exposure(uint32_t asset, Side side, uint64_t lots);
    void remove_exposure(uint32_t asset, Side side, uint64_t lots);
    void emit(TradeEventKind kind, const Trade& trade);
    uint64_t now() const;
};

} // namespace lever

#endif // LEVER_ENGINE_HPP
