// =============================================================================
// relayer.cpp - Delegated Call Boundary
// =============================================================================

#include "lever/relayer.hpp"
#include "lever/log.hpp"

#include <chrono>
#include <mutex>

namespace lever {

const char* to_string(CallKind kind) {
    switch (kind) {
        case CallKind::OPEN_LIMIT: return "open_limit";
        case CallKind::OPEN_MARKET: return "open_market";
        case CallKind::CANCEL: return "cancel";
        case CallKind::UPDATE_STOPS: return "update_stops";
        case CallKind::CLOSE_MARKET: return "close_market";
    }
    return "unknown";
}

// =============================================================================
// Payload Encoding
// =============================================================================

namespace {

void put_u8(std::vector<uint8_t>& out, uint8_t value) {
    out.push_back(value);
}

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void put_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void put_i64(std::vector<uint8_t>& out, int64_t value) {
    put_u64(out, static_cast<uint64_t>(value));
}

} // anonymous namespace

std::vector<uint8_t> Relayer::signing_payload(const SignedCall& call) {
    std::vector<uint8_t> out;
    out.reserve(128);

    out.insert(out.end(), call.trader.begin(), call.trader.end());
    put_u8(out, static_cast<uint8_t>(call.kind));

    switch (call.kind) {
        case CallKind::OPEN_LIMIT:
        case CallKind::OPEN_MARKET:
            put_u32(out, call.open.asset);
            put_u8(out, static_cast<uint8_t>(call.open.side));
            put_u32(out, call.open.leverage);
            put_u64(out, call.open.lots);
            put_i64(out, call.open.target_price);
            put_i64(out, call.open.stop_loss);
            put_i64(out, call.open.take_profit);
            break;
        case CallKind::UPDATE_STOPS:
            put_u64(out, call.trade_id);
            put_i64(out, call.stop_loss);
            put_i64(out, call.take_profit);
            break;
        case CallKind::CANCEL:
        case CallKind::CLOSE_MARKET:
            put_u64(out, call.trade_id);
            break;
    }

    put_u64(out, call.nonce);
    put_u64(out, call.expiry);
    return out;
}

// =============================================================================
// Relayer
// =============================================================================

Relayer::Relayer(const Address& self, PositionEngine& engine, const ISignatureVerifier& verifier)
    : self_(self), engine_(engine), verifier_(verifier) {}

RelayResult Relayer::dispatch(const SignedCall& call) {
    std::lock_guard serial(dispatch_mutex_);

    uint64_t last = 0;
    {
        std::shared_lock lock(mutex_);
        if (now() > call.expiry) {
            log::logger()->debug("relay {} for {} expired", to_string(call.kind),
                                 addresses::to_hex(call.trader));
            return RelayResult{errors::EXPIRED, 0};
        }

        auto it = nonces_.find(call.trader);
        last = it != nonces_.end() ? it->second : 0;
    }

    if (call.nonce <= last) {
        log::logger()->debug("relay {} for {}: nonce {} not above {}", to_string(call.kind),
                             addresses::to_hex(call.trader), call.nonce, last);
        return RelayResult{errors::BAD_NONCE, 0};
    }

    if (!verifier_.verify(call.trader, signing_payload(call), call.signature)) {
        log::logger()->debug("relay {} for {}: bad signature", to_string(call.kind),
                             addresses::to_hex(call.trader));
        return RelayResult{errors::BAD_SIGNATURE, 0};
    }

    // The nonce table is unlocked while the engine runs its trade callbacks
    RelayResult result = forward(call);
    if (result.status == errors::OK) {
        std::unique_lock lock(mutex_);
        nonces_[call.trader] = call.nonce;
    }
    return result;
}

RelayResult Relayer::forward(const SignedCall& call) {
    switch (call.kind) {
        case CallKind::OPEN_LIMIT: {
            OpenResult r = engine_.open_limit_for(self_, call.trader, call.open);
            return RelayResult{r.status, r.trade_id};
        }
        case CallKind::OPEN_MARKET: {
            OpenResult r = engine_.open_market_for(self_, call.trader, call.open, call.proof);
            return RelayResult{r.status, r.trade_id};
        }
        case CallKind::CANCEL:
            return RelayResult{engine_.cancel_for(self_, call.trader, call.trade_id), call.trade_id};
        case CallKind::UPDATE_STOPS:
            return RelayResult{
                engine_.update_stops_for(self_, call.trader, call.trade_id,
                                         call.stop_loss, call.take_profit),
                call.trade_id
            };
        case CallKind::CLOSE_MARKET: {
            CloseResult r = engine_.close_market_for(self_, call.trader, call.trade_id, call.proof);
            return RelayResult{r.status, call.trade_id};
        }
    }
    return RelayResult{errors::INVALID_STATE, 0};
}

uint64_t Relayer::last_nonce(const Address& trader) const {
    std::shared_lock lock(mutex_);
    auto it = nonces_.find(trader);
    return it != nonces_.end() ? it->second : 0;
}

void Relayer::set_clock(ClockFn clock) {
    std::unique_lock lock(mutex_);
    clock_ = std::move(clock);
}

uint64_t Relayer::now() const {
    if (clock_) return clock_();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace lever
