#ifndef LEVER_TRADE_HPP
#define LEVER_TRADE_HPP

#include <cstdint>
#include <functional>

#include "types.hpp"

namespace lever {

enum class TradeState : uint8_t {
    ORDER = 0,       // pending limit order, margin locked
    OPEN = 1,        // live position
    CLOSED = 2,      // terminal
    CANCELLED = 3    // terminal
};

enum class CloseReason : uint8_t {
    NONE = 0,
    MARKET = 1,
    STOP_LOSS = 2,
    TAKE_PROFIT = 3,
    LIQUIDATION = 4
};

const char* to_string(TradeState state);
const char* to_string(CloseReason reason);

inline bool is_terminal(TradeState state) {
    return state == TradeState::CLOSED || state == TradeState::CANCELLED;
}

// =============================================================================
// Trade - One Order or Position
// =============================================================================
//
// All prices are int64_t scaled by 1e6; zero stop levels mean "not set".
// liquidation_price is fixed at creation and never recomputed.

struct Trade {
    uint64_t id;
    Address owner;
    uint32_t asset;
    Side side;
    uint64_t lots;
    uint32_t leverage;
    TradeState state;

    int64_t entry_price;        // 0 while ORDER
    int64_t target_price;       // limit price while ORDER, 0 once OPEN
    int64_t stop_loss;
    int64_t take_profit;
    int64_t liquidation_price;

    int64_t margin;             // collateral locked on the ledger for this trade

    uint64_t created_at;
    uint64_t opened_at;         // funding accrual base

    // Recorded once on the terminal transition
    uint64_t closed_at;
    int64_t close_price;
    int64_t realized_pnl;
    CloseReason close_reason;
};

// =============================================================================
// Trade Events
// =============================================================================

enum class TradeEventKind : uint8_t {
    OPENED = 0,      // new ORDER or OPEN trade
    EXECUTED = 1,    // ORDER -> OPEN
    UPDATED = 2,     // stop levels changed
    CANCELLED = 3,
    CLOSED = 4
};

const char* to_string(TradeEventKind kind);

struct TradeEvent {
    TradeEventKind kind;
    Trade trade;     // state after the transition
};

// Invoked after the operation commits and the engine lock is released
using TradeCallback = std::function<void(const TradeEvent&)>;

} // namespace lever

#endif // LEVER_TRADE_HPP
