// =============================================================================
// engine.cpp - PositionEngine Implementation
// =============================================================================

#include "lever/engine.hpp"
#include "lever/log.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

namespace lever {

// =============================================================================
// Enum Names
// =============================================================================

const char* to_string(TradeState state) {
    switch (state) {
        case TradeState::ORDER: return "order";
        case TradeState::OPEN: return "open";
        case TradeState::CLOSED: return "closed";
        case TradeState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* to_string(CloseReason reason) {
    switch (reason) {
        case CloseReason::NONE: return "none";
        case CloseReason::MARKET: return "market";
        case CloseReason::STOP_LOSS: return "stop_loss";
        case CloseReason::TAKE_PROFIT: return "take_profit";
        case CloseReason::LIQUIDATION: return "liquidation";
    }
    return "unknown";
}

const char* to_string(TradeEventKind kind) {
    switch (kind) {
        case TradeEventKind::OPENED: return "opened";
        case TradeEventKind::EXECUTED: return "executed";
        case TradeEventKind::UPDATED: return "updated";
        case TradeEventKind::CANCELLED: return "cancelled";
        case TradeEventKind::CLOSED: return "closed";
    }
    return "unknown";
}

// =============================================================================
// Position Math
// =============================================================================

namespace {

// lots * numerator * price / denominator, in 6-decimal collateral units
int32_t notional_e6(const AssetInfo& info, uint64_t lots, int64_t price, I128& out) {
    if (lots == 0 || info.lot_numerator == 0 || info.lot_denominator == 0) {
        return errors::QTY_ZERO;
    }

    I128 value = 0;
    if (!e6::checked_mul(static_cast<I128>(lots), static_cast<I128>(info.lot_numerator), value) ||
        !e6::checked_mul(value, static_cast<I128>(price), value)) {
        return errors::RANGE;
    }
    out = value / static_cast<I128>(info.lot_denominator);
    return errors::OK;
}

// P * (1 - F/L) for longs, P * (1 + F/L) for shorts
int32_t liquidation_price_for(Side side, int64_t reference, uint32_t leverage,
                              uint32_t fraction_bps, int64_t& out) {
    I128 denom = static_cast<I128>(leverage) * e6::BPS;
    I128 numer = side == Side::LONG ? denom - fraction_bps : denom + fraction_bps;
    if (numer <= 0) {
        return errors::INVALID_LEVERAGE;
    }

    I128 liq = static_cast<I128>(reference) * numer / denom;
    if (!e6::fits_i64(liq)) {
        return errors::RANGE;
    }
    out = static_cast<int64_t>(liq);
    return errors::OK;
}

// TP on the profitable side of the reference; SL between reference
// (exclusive) and liquidation (inclusive)
int32_t check_stops(Side side, int64_t reference, int64_t liquidation,
                    int64_t stop_loss, int64_t take_profit) {
    if (stop_loss < 0 || take_profit < 0) {
        return errors::INVALID_STOP_RANGE;
    }

    if (side == Side::LONG) {
        if (take_profit != 0 && take_profit < reference) return errors::INVALID_STOP_RANGE;
        if (stop_loss != 0 && (stop_loss >= reference || stop_loss < liquidation)) {
            return errors::INVALID_STOP_RANGE;
        }
    } else {
        if (take_profit != 0 && take_profit > reference) return errors::INVALID_STOP_RANGE;
        if (stop_loss != 0 && (stop_loss <= reference || stop_loss > liquidation)) {
            return errors::INVALID_STOP_RANGE;
        }
    }
    return errors::OK;
}

// |price - trigger| <= trigger * tolerance
bool within_tolerance(int64_t price, int64_t trigger, uint32_t tolerance_bps) {
    I128 diff = e6::abs(static_cast<I128>(price) - trigger);
    return diff * e6::BPS <= static_cast<I128>(trigger) * tolerance_bps;
}

// Longs buy high on open and sell low on close; shorts the reverse
int32_t spread_adjusted(Side side, int64_t reference, int64_t half_spread_ppm,
                        bool opening, int64_t& out) {
    I128 adj = static_cast<I128>(reference) * half_spread_ppm / e6::PPM;
    bool pay_up = (side == Side::LONG) == opening;
    I128 price = pay_up ? reference + adj : reference - adj;
    if (price <= 0) {
        return errors::INVALID_PRICE;
    }
    if (!e6::fits_i64(price)) {
        return errors::RANGE;
    }
    out = static_cast<int64_t>(price);
    return errors::OK;
}

// Close-side spread, then accrued funding folded into the price
int32_t exit_price_for(const Trade& trade, const AssetInfo& info, int64_t reference,
                       uint64_t now, uint64_t interval_sec, int64_t& out) {
    int64_t adjusted = 0;
    int32_t status = spread_adjusted(trade.side, reference, info.half_spread_ppm, false, adjusted);
    if (status != errors::OK) return status;

    I128 exit = adjusted;
    if (info.funding_rate_ppm != 0 && interval_sec > 0 && now > trade.opened_at) {
        I128 intervals = static_cast<I128>((now - trade.opened_at) / interval_sec);
        I128 funding = 0;
        if (!e6::checked_mul(static_cast<I128>(reference), info.funding_rate_ppm, funding) ||
            !e6::checked_mul(funding, intervals, funding)) {
            return errors::RANGE;
        }
        funding /= e6::PPM;
        exit = trade.side == Side::LONG ? exit + funding : exit - funding;
    }

    if (!e6::fits_i64(exit)) {
        return errors::RANGE;
    }
    out = static_cast<int64_t>(exit);
    return errors::OK;
}

int32_t realized_pnl_for(const Trade& trade, const AssetInfo& info, int64_t exit,
                         bool cap_to_margin, int64_t& out) {
    I128 diff = static_cast<I128>(exit) - trade.entry_price;
    I128 value = 0;
    if (!e6::checked_mul(static_cast<I128>(trade.lots), static_cast<I128>(info.lot_numerator), value) ||
        !e6::checked_mul(value, diff, value)) {
        return errors::RANGE;
    }

    I128 pnl = side_sign(trade.side) * (value / static_cast<I128>(info.lot_denominator));
    if (cap_to_margin) {
        pnl = std::clamp<I128>(pnl, -static_cast<I128>(trade.margin), trade.margin);
    }

    if (!e6::fits_i64(pnl)) {
        return errors::RANGE;
    }
    out = static_cast<int64_t>(pnl);
    return errors::OK;
}

int32_t reject(const char* op, int32_t status) {
    log::logger()->debug("{} rejected: {}", op, errors::to_string(status));
    return status;
}

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PositionEngine::PositionEngine(const Address& self,
                               AccessControl& access,
                               CustodyLedger& ledger,
                               const IAssetRegistry& registry,
                               const IPriceOracle& oracle,
                               EngineParams params)
    : self_(self),
      access_(access),
      ledger_(ledger),
      registry_(registry),
      oracle_(oracle),
      params_(params) {}

// =============================================================================
// Event Delivery
// =============================================================================

// Runs `fn` under the engine lock, then hands the events it queued to the
// callback once the lock is released
template <typename Fn>
auto PositionEngine::with_events(Fn&& fn) {
    std::vector<TradeEvent> events;
    TradeCallback callback;

    auto result = [&] {
        std::unique_lock lock(mutex_);
        auto r = fn();
        events.swap(pending_);
        callback = callback_;
        return r;
    }();

    if (callback) {
        for (const auto& event : events) {
            callback(event);
        }
    }
    return result;
}

// =============================================================================
// Trader Entry Points
// =============================================================================

OpenResult PositionEngine::open_limit(const Address& trader, const OpenRequest& request) {
    return with_events([&] { return open_locked(trader, request, nullptr); });
}

OpenResult PositionEngine::open_market(const Address& trader, const OpenRequest& request,
                                       const Proof& proof) {
    return with_events([&] { return open_locked(trader, request, &proof); });
}

int32_t PositionEngine::update_stops(const Address& trader, uint64_t trade_id,
                                     int64_t stop_loss, int64_t take_profit) {
    return with_events([&] { return update_stops_locked(trader, trade_id, stop_loss, take_profit); });
}

int32_t PositionEngine::cancel(const Address& trader, uint64_t trade_id) {
    return with_events([&] { return cancel_locked(trader, trade_id); });
}

CloseResult PositionEngine::close_market(const Address& trader, uint64_t trade_id,
                                         const Proof& proof) {
    return with_events([&] { return close_locked(trader, trade_id, CloseReason::MARKET, proof); });
}

// =============================================================================
// Delegated Entry Points
// =============================================================================

OpenResult PositionEngine::open_limit_for(const Address& sender, const Address& trader,
                                          const OpenRequest& request) {
    if (!access_.has_role(Role::RELAYER, sender)) {
        return OpenResult{reject("open_limit_for", errors::UNAUTHORIZED), 0};
    }
    return with_events([&] { return open_locked(trader, request, nullptr); });
}

OpenResult PositionEngine::open_market_for(const Address& sender, const Address& trader,
                                           const OpenRequest& request, const Proof& proof) {
    if (!access_.has_role(Role::RELAYER, sender)) {
        return OpenResult{reject("open_market_for", errors::UNAUTHORIZED), 0};
    }
    return with_events([&] { return open_locked(trader, request, &proof); });
}

int32_t PositionEngine::update_stops_for(const Address& sender, const Address& trader,
                                         uint64_t trade_id, int64_t stop_loss,
                                         int64_t take_profit) {
    if (!access_.has_role(Role::RELAYER, sender)) {
        return reject("update_stops_for", errors::UNAUTHORIZED);
    }
    return with_events([&] { return update_stops_locked(trader, trade_id, stop_loss, take_profit); });
}

int32_t PositionEngine::cancel_for(const Address& sender, const Address& trader,
                                   uint64_t trade_id) {
    if (!access_.has_role(Role::RELAYER, sender)) {
        return reject("cancel_for", errors::UNAUTHORIZED);
    }
    return with_events([&] { return cancel_locked(trader, trade_id); });
}

CloseResult PositionEngine::close_market_for(const Address& sender, const Address& trader,
                                             uint64_t trade_id, const Proof& proof) {
    if (!access_.has_role(Role::RELAYER, sender)) {
        return CloseResult{reject("close_market_for", errors::UNAUTHORIZED), 0, 0};
    }
    return with_events([&] { return close_locked(trader, trade_id, CloseReason::MARKET, proof); });
}

// =============================================================================
// Triggers
// =============================================================================

int32_t PositionEngine::execute(const Address& caller, uint64_t trade_id, const Proof& proof) {
    return with_events([&] { return execute_locked(caller, trade_id, proof); });
}

int32_t PositionEngine::execute_locked(const Address& caller, uint64_t trade_id, const Proof& proof) {
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        return reject("execute", errors::TRADE_NOT_FOUND);
    }
    if (!may_trigger(caller, it->second)) {
        return reject("execute", errors::UNAUTHORIZED);
    }
    if (it->second.state != TradeState::ORDER) {
        return reject("execute", errors::INVALID_STATE);
    }

    auto info = registry_.asset(it->second.asset);
    if (!info) {
        return reject("execute", errors::UNKNOWN_ASSET);
    }

    uint64_t ts = now();
    PriceResult price = fetch_price(it->second.asset, proof, ts);
    if (price.status != errors::OK) {
        return reject("execute", price.status);
    }

    Trade next = it->second;
    int32_t status = apply_execute(next, *info, price.price_e6, ts);
    if (status != errors::OK) {
        return reject("execute", status);
    }

    it->second = next;
    add_exposure(next.asset, next.side, next.lots);

    log::logger()->info("trade {} executed at {} (target hit by {})", next.id,
                        e6::format(next.entry_price), e6::format(price.price_e6));
    emit(TradeEventKind::EXECUTED, next);
    return errors::OK;
}

CloseResult PositionEngine::close(const Address& caller, uint64_t trade_id, CloseReason reason,
                                  const Proof& proof) {
    return with_events([&] { return close_locked(caller, trade_id, reason, proof); });
}

// =============================================================================
// Batches
// =============================================================================

BatchResult PositionEngine::exec_limits(const Address& caller, uint32_t asset,
                                        const std::vector<uint64_t>& trade_ids,
                                        const Proof& proof) {
    return with_events([&] { return exec_limits_locked(caller, asset, trade_ids, proof); });
}

BatchResult PositionEngine::close_batch(const Address& caller, uint32_t asset, CloseReason reason,
                                        const std::vector<uint64_t>& trade_ids,
                                        const Proof& proof) {
    return with_events([&] { return close_batch_locked(caller, asset, reason, trade_ids, proof); });
}

BatchResult PositionEngine::exec_limits_locked(const Address& caller, uint32_t asset,
                                               const std::vector<uint64_t>& trade_ids,
                                               const Proof& proof) {
    BatchResult result{errors::OK, 0, 0, {}};

    if (!access_.has_role(Role::KEEPER, caller)) {
        result.status = reject("exec_limits", errors::UNAUTHORIZED);
        return result;
    }

    auto info = registry_.asset(asset);
    if (!info) {
        result.status = reject("exec_limits", errors::UNKNOWN_ASSET);
        return result;
    }

    uint64_t ts = now();
    PriceResult price = fetch_price(asset, proof, ts);
    if (price.status != errors::OK) {
        result.status = reject("exec_limits", price.status);
        return result;
    }

    // Evaluate every id against the staged view, then fold once
    std::map<uint64_t, Trade> staged;
    Exposure delta{0, 0};

    for (uint64_t id : trade_ids) {
        const Trade* current = nullptr;
        auto staged_it = staged.find(id);
        if (staged_it != staged.end()) {
            current = &staged_it->second;
        } else {
            auto it = trades_.find(id);
            if (it != trades_.end()) current = &it->second;
        }

        int32_t status = errors::OK;
        Trade next{};
        if (!current) {
            status = errors::TRADE_NOT_FOUND;
        } else if (current->asset != asset) {
            status = errors::WRONG_ASSET;
        } else {
            next = *current;
            status = apply_execute(next, *info, price.price_e6, ts);
        }

        if (status != errors::OK) {
            if (!errors::is_skippable(status)) {
                log::logger()->warn("exec_limits aborted at trade {}: {}", id, errors::to_string(status));
                return BatchResult{status, 0, 0, {}};
            }
            result.outcomes.push_back(BatchOutcome{id, status});
            ++result.skipped;
            continue;
        }

        (next.side == Side::LONG ? delta.long_lots : delta.short_lots) += next.lots;
        staged[id] = next;
        result.outcomes.push_back(BatchOutcome{id, errors::OK});
        ++result.processed;
    }

    for (const auto& [id, trade] : staged) {
        trades_[id] = trade;
    }
    add_exposure(asset, Side::LONG, delta.long_lots);
    add_exposure(asset, Side::SHORT, delta.short_lots);

    for (const auto& [id, trade] : staged) {
        emit(TradeEventKind::EXECUTED, trade);
    }

    log::logger()->info("exec_limits asset {} at {}: executed {}, skipped {}", asset,
                        e6::format(price.price_e6), result.processed, result.skipped);
    return result;
}

BatchResult PositionEngine::close_batch_locked(const Address& caller, uint32_t asset,
                                               CloseReason reason,
                                               const std::vector<uint64_t>& trade_ids,
                                               const Proof& proof) {
    BatchResult result{errors::OK, 0, 0, {}};

    if (!access_.has_role(Role::KEEPER, caller)) {
        result.status = reject("close_batch", errors::UNAUTHORIZED);
        return result;
    }
    if (reason != CloseReason::STOP_LOSS && reason != CloseReason::TAKE_PROFIT &&
        reason != CloseReason::LIQUIDATION) {
        result.status = reject("close_batch", errors::INVALID_REASON);
        return result;
    }

    auto info = registry_.asset(asset);
    if (!info) {
        result.status = reject("close_batch", errors::UNKNOWN_ASSET);
        return result;
    }

    uint64_t ts = now();
    PriceResult price = fetch_price(asset, proof, ts);
    if (price.status != errors::OK) {
        result.status = reject("close_batch", price.status);
        return result;
    }

    CustodyLedger::Transaction tx = ledger_.begin();
    std::map<uint64_t, Trade> staged;
    Exposure delta{0, 0};

    for (uint64_t id : trade_ids) {
        const Trade* current = nullptr;
        auto staged_it = staged.find(id);
        if (staged_it != staged.end()) {
            current = &staged_it->second;
        } else {
            auto it = trades_.find(id);
            if (it != trades_.end()) current = &it->second;
        }

        int32_t status = errors::OK;
        Trade next{};
        if (!current) {
            status = errors::TRADE_NOT_FOUND;
        } else if (current->asset != asset) {
            status = errors::WRONG_ASSET;
        } else {
            next = *current;
            status = apply_close(next, reason, *info, price.price_e6, ts, tx);
        }

        if (status != errors::OK) {
            if (!errors::is_skippable(status)) {
                // tx rolls back every settled item on return
                log::logger()->warn("close_batch aborted at trade {}: {}", id, errors::to_string(status));
                return BatchResult{status, 0, 0, {}};
            }
            result.outcomes.push_back(BatchOutcome{id, status});
            ++result.skipped;
            continue;
        }

        (next.side == Side::LONG ? delta.long_lots : delta.short_lots) += next.lots;
        staged[id] = next;
        result.outcomes.push_back(BatchOutcome{id, errors::OK});
        ++result.processed;
    }

    tx.commit();
    for (const auto& [id, trade] : staged) {
        trades_[id] = trade;
    }
    remove_exposure(asset, Side::LONG, delta.long_lots);
    remove_exposure(asset, Side::SHORT, delta.short_lots);

    for (const auto& [id, trade] : staged) {
        emit(TradeEventKind::CLOSED, trade);
    }

    log::logger()->info("close_batch asset {} {} at {}: closed {}, skipped {}", asset,
                        to_string(reason), e6::format(price.price_e6),
                        result.processed, result.skipped);
    return result;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Trade> PositionEngine::trade(uint64_t trade_id) const {
    std::shared_lock lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) return std::nullopt;
    return it->second;
}

std::optional<TradeState> PositionEngine::state_of(uint64_t trade_id) const {
    std::shared_lock lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) return std::nullopt;
    return it->second.state;
}

std::optional<Side> PositionEngine::side_of(uint64_t trade_id) const {
    std::shared_lock lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) return std::nullopt;
    return it->second.side;
}

std::vector<Trade> PositionEngine::trades_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    std::vector<Trade> out;
    for (const auto& [id, trade] : trades_) {
        if (trade.owner == owner) out.push_back(trade);
    }
    return out;
}

Exposure PositionEngine::exposure(uint32_t asset) const {
    std::shared_lock lock(mutex_);
    auto it = exposure_.find(asset);
    return it != exposure_.end() ? it->second : Exposure{0, 0};
}

uint64_t PositionEngine::next_trade_id() const {
    std::shared_lock lock(mutex_);
    return next_id_;
}

// =============================================================================
// Hooks
// =============================================================================

void PositionEngine::set_clock(ClockFn clock) {
    std::unique_lock lock(mutex_);
    clock_ = std::move(clock);
}

void PositionEngine::set_trade_callback(TradeCallback callback) {
    std::unique_lock lock(mutex_);
    callback_ = std::move(callback);
}

// =============================================================================
// Internal Operations
// =============================================================================

OpenResult PositionEngine::open_locked(const Address& trader, const OpenRequest& request,
                                       const Proof* proof) {
    const char* op = proof ? "open_market" : "open_limit";

    if (request.leverage == 0 || request.leverage > params_.max_leverage ||
        request.leverage > MAX_LEVERAGE) {
        return OpenResult{reject(op, errors::INVALID_LEVERAGE), 0};
    }

    auto info = registry_.asset(request.asset);
    if (!info) {
        return OpenResult{reject(op, errors::UNKNOWN_ASSET), 0};
    }

    uint64_t ts = now();
    int64_t reference = 0;
    int32_t status = errors::OK;

    if (proof) {
        if (!registry_.is_market_open(request.asset)) {
            return OpenResult{reject(op, errors::MARKET_CLOSED), 0};
        }
        PriceResult price = fetch_price(request.asset, *proof, ts);
        if (price.status != errors::OK) {
            return OpenResult{reject(op, price.status), 0};
        }
        status = spread_adjusted(request.side, price.price_e6, info->half_spread_ppm, true, reference);
        if (status != errors::OK) {
            return OpenResult{reject(op, status), 0};
        }
    } else {
        if (request.target_price <= 0) {
            return OpenResult{reject(op, errors::INVALID_PRICE), 0};
        }
        reference = request.target_price;
    }

    I128 notional = 0;
    status = notional_e6(*info, request.lots, reference, notional);
    if (status != errors::OK) {
        return OpenResult{reject(op, status), 0};
    }

    I128 margin = e6::ceil_div(notional, request.leverage);
    if (margin <= 0) {
        return OpenResult{reject(op, errors::QTY_ZERO), 0};
    }
    if (!e6::fits_i64(margin)) {
        return OpenResult{reject(op, errors::RANGE), 0};
    }

    int64_t liquidation = 0;
    status = liquidation_price_for(request.side, reference, request.leverage,
                                   params_.liquidation_fraction_bps, liquidation);
    if (status != errors::OK) {
        return OpenResult{reject(op, status), 0};
    }

    status = check_stops(request.side, reference, liquidation,
                         request.stop_loss, request.take_profit);
    if (status != errors::OK) {
        return OpenResult{reject(op, status), 0};
    }

    CustodyLedger::Transaction tx = ledger_.begin();
    if (tx.available(trader) < margin) {
        return OpenResult{reject(op, errors::INSUFFICIENT_FUNDS), 0};
    }
    status = tx.lock(self_, trader, margin);
    if (status != errors::OK) {
        return OpenResult{reject(op, status), 0};
    }

    Trade trade{};
    trade.id = next_id_;
    trade.owner = trader;
    trade.asset = request.asset;
    trade.side = request.side;
    trade.lots = request.lots;
    trade.leverage = request.leverage;
    trade.stop_loss = request.stop_loss;
    trade.take_profit = request.take_profit;
    trade.liquidation_price = liquidation;
    trade.margin = static_cast<int64_t>(margin);
    trade.created_at = ts;
    trade.close_reason = CloseReason::NONE;

    if (proof) {
        trade.state = TradeState::OPEN;
        trade.entry_price = reference;
        trade.opened_at = ts;
    } else {
        trade.state = TradeState::ORDER;
        trade.target_price = reference;
    }

    tx.commit();
    trades_[trade.id] = trade;
    ++next_id_;
    if (trade.state == TradeState::OPEN) {
        add_exposure(trade.asset, trade.side, trade.lots);
    }

    log::logger()->info("trade {} {} by {}: {} {} lots on asset {} x{} at {}, margin {}, liq {}",
                        trade.id, to_string(trade.state), addresses::to_hex(trader),
                        to_string(trade.side), trade.lots, trade.asset, trade.leverage,
                        e6::format(reference), e6::format(trade.margin),
                        e6::format(trade.liquidation_price));
    emit(TradeEventKind::OPENED, trade);
    return OpenResult{errors::OK, trade.id};
}

int32_t PositionEngine::update_stops_locked(const Address& trader, uint64_t trade_id,
                                            int64_t stop_loss, int64_t take_profit) {
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        return reject("update_stops", errors::TRADE_NOT_FOUND);
    }

    Trade& trade = it->second;
    if (trade.owner != trader) {
        return reject("update_stops", errors::NOT_OWNER);
    }
    if (trade.state != TradeState::ORDER && trade.state != TradeState::OPEN) {
        return reject("update_stops", errors::INVALID_STATE);
    }

    int64_t reference = trade.state == TradeState::ORDER ? trade.target_price : trade.entry_price;
    int32_t status = check_stops(trade.side, reference, trade.liquidation_price,
                                 stop_loss, take_profit);
    if (status != errors::OK) {
        return reject("update_stops", status);
    }

    trade.stop_loss = stop_loss;
    trade.take_profit = take_profit;

    log::logger()->debug("trade {} stops set: sl {} tp {}", trade.id,
                         e6::format(stop_loss), e6::format(take_profit));
    emit(TradeEventKind::UPDATED, trade);
    return errors::OK;
}

int32_t PositionEngine::cancel_locked(const Address& trader, uint64_t trade_id) {
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        return reject("cancel", errors::TRADE_NOT_FOUND);
    }

    Trade next = it->second;
    if (next.owner != trader) {
        return reject("cancel", errors::NOT_OWNER);
    }
    if (next.state != TradeState::ORDER) {
        return reject("cancel", errors::INVALID_STATE);
    }

    CustodyLedger::Transaction tx = ledger_.begin();
    int32_t status = tx.unlock(self_, next.owner, next.margin);
    if (status != errors::OK) {
        return reject("cancel", status);
    }

    next.state = TradeState::CANCELLED;
    next.closed_at = now();

    tx.commit();
    it->second = next;

    log::logger()->info("trade {} cancelled, {} released", next.id, e6::format(next.margin));
    emit(TradeEventKind::CANCELLED, next);
    return errors::OK;
}

CloseResult PositionEngine::close_locked(const Address& principal, uint64_t trade_id,
                                         CloseReason reason, const Proof& proof) {
    if (reason == CloseReason::NONE) {
        return CloseResult{reject("close", errors::INVALID_REASON), 0, 0};
    }

    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        return CloseResult{reject("close", errors::TRADE_NOT_FOUND), 0, 0};
    }

    if (reason == CloseReason::MARKET) {
        if (it->second.owner != principal) {
            return CloseResult{reject("close", errors::NOT_OWNER), 0, 0};
        }
    } else if (!may_trigger(principal, it->second)) {
        return CloseResult{reject("close", errors::UNAUTHORIZED), 0, 0};
    }

    if (it->second.state != TradeState::OPEN) {
        return CloseResult{reject("close", errors::INVALID_STATE), 0, 0};
    }

    auto info = registry_.asset(it->second.asset);
    if (!info) {
        return CloseResult{reject("close", errors::UNKNOWN_ASSET), 0, 0};
    }

    uint64_t ts = now();
    PriceResult price = fetch_price(it->second.asset, proof, ts);
    if (price.status != errors::OK) {
        return CloseResult{reject("close", price.status), 0, 0};
    }

    CustodyLedger::Transaction tx = ledger_.begin();
    Trade next = it->second;
    int32_t status = apply_close(next, reason, *info, price.price_e6, ts, tx);
    if (status != errors::OK) {
        return CloseResult{reject("close", status), 0, 0};
    }

    tx.commit();
    it->second = next;
    remove_exposure(next.asset, next.side, next.lots);

    log::logger()->info("trade {} closed ({}) at {}, pnl {}", next.id, to_string(reason),
                        e6::format(next.close_price), e6::format(next.realized_pnl));
    emit(TradeEventKind::CLOSED, next);
    return CloseResult{errors::OK, next.close_price, next.realized_pnl};
}

int32_t PositionEngine::apply_execute(Trade& trade, const AssetInfo& info, int64_t reference,
                                      uint64_t now) const {
    if (trade.state != TradeState::ORDER) {
        return errors::INVALID_STATE;
    }
    if (!within_tolerance(reference, trade.target_price, params_.tolerance_bps)) {
        return errors::PRICE_NOT_NEAR;
    }

    int64_t entry = 0;
    int32_t status = spread_adjusted(trade.side, reference, info.half_spread_ppm, true, entry);
    if (status != errors::OK) return status;

    trade.state = TradeState::OPEN;
    trade.entry_price = entry;
    trade.target_price = 0;
    trade.opened_at = now;
    return errors::OK;
}

int32_t PositionEngine::apply_close(Trade& trade, CloseReason reason, const AssetInfo& info,
                                    int64_t reference, uint64_t now,
                                    CustodyLedger::Transaction& tx) const {
    if (trade.state != TradeState::OPEN) {
        return errors::INVALID_STATE;
    }

    switch (reason) {
        case CloseReason::MARKET:
            break;
        case CloseReason::STOP_LOSS:
            if (trade.stop_loss == 0) return errors::NO_TRIGGER;
            if (!within_tolerance(reference, trade.stop_loss, params_.tolerance_bps)) {
                return errors::PRICE_NOT_NEAR;
            }
            break;
        case CloseReason::TAKE_PROFIT:
            if (trade.take_profit == 0) return errors::NO_TRIGGER;
            if (!within_tolerance(reference, trade.take_profit, params_.tolerance_bps)) {
                return errors::PRICE_NOT_NEAR;
            }
            break;
        case CloseReason::LIQUIDATION: {
            if (trade.liquidation_price == 0) return errors::NO_TRIGGER;
            // A price that gapped through the level still liquidates
            bool beyond = trade.side == Side::LONG
                ? reference <= trade.liquidation_price
                : reference >= trade.liquidation_price;
            if (!beyond && !within_tolerance(reference, trade.liquidation_price, params_.tolerance_bps)) {
                return errors::PRICE_NOT_NEAR;
            }
            break;
        }
        default:
            return errors::INVALID_REASON;
    }

    int64_t exit = 0;
    int32_t status = exit_price_for(trade, info, reference, now, params_.funding_interval_sec, exit);
    if (status != errors::OK) return status;

    int64_t pnl = 0;
    status = realized_pnl_for(trade, info, exit, params_.cap_pnl_to_margin, pnl);
    if (status != errors::OK) return status;

    status = tx.unlock(self_, trade.owner, trade.margin);
    if (status != errors::OK) return status;

    status = tx.settle(self_, trade.owner, pnl);
    if (status != errors::OK) return status;

    trade.state = TradeState::CLOSED;
    trade.closed_at = now;
    trade.close_price = exit;
    trade.realized_pnl = pnl;
    trade.close_reason = reason;
    return errors::OK;
}

bool PositionEngine::may_trigger(const Address& principal, const Trade& trade) const {
    return trade.owner == principal || access_.has_role(Role::KEEPER, principal);
}

PriceResult PositionEngine::fetch_price(uint32_t asset, const Proof& proof, uint64_t now) const {
    return read_price(oracle_, proof, asset, params_.max_price_age_sec, now);
}

void PositionEngine::add_exposure(uint32_t asset, Side side, uint64_t lots) {
    if (lots == 0) return;
    Exposure& exp = exposure_[asset];
    (side == Side::LONG ? exp.long_lots : exp.short_lots) += lots;
}

void PositionEngine::remove_exposure(uint32_t asset, Side side, uint64_t lots) {
    if (lots == 0) return;
    Exposure& exp = exposure_[asset];
    uint64_t& counter = side == Side::LONG ? exp.long_lots : exp.short_lots;
    counter -= std::min(counter, lots);
}

void PositionEngine::emit(TradeEventKind kind, const Trade& trade) {
    pending_.push_back(TradeEvent{kind, trade});
}

uint64_t PositionEngine::now() const {
    if (clock_) return clock_();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace lever
