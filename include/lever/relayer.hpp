#ifndef LEVER_RELAYER_HPP
#define LEVER_RELAYER_HPP

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "engine.hpp"

namespace lever {

// =============================================================================
// Signed Calls
// =============================================================================

enum class CallKind : uint8_t {
    OPEN_LIMIT = 0,
    OPEN_MARKET = 1,
    CANCEL = 2,
    UPDATE_STOPS = 3,
    CLOSE_MARKET = 4
};

const char* to_string(CallKind kind);

struct SignedCall {
    Address trader;
    CallKind kind;

    OpenRequest open;       // OPEN_LIMIT / OPEN_MARKET
    uint64_t trade_id;      // CANCEL / UPDATE_STOPS / CLOSE_MARKET
    int64_t stop_loss;      // UPDATE_STOPS
    int64_t take_profit;    // UPDATE_STOPS
    Proof proof;            // OPEN_MARKET / CLOSE_MARKET, not signed

    uint64_t nonce;
    uint64_t expiry;        // unix seconds, inclusive
    std::vector<uint8_t> signature;
};

struct RelayResult {
    int32_t status;
    uint64_t trade_id;      // opened or targeted trade
};

// =============================================================================
// Signature Verifier Interface
// =============================================================================

class ISignatureVerifier {
public:
    virtual ~ISignatureVerifier() = default;

    virtual bool verify(const Address& signer, const std::vector<uint8_t>& payload,
                        const std::vector<uint8_t>& signature) const = 0;
};

// =============================================================================
// Relayer - Delegated Call Boundary
// =============================================================================
//
// Checks expiry, nonce and signature, then forwards to the engine's *_for
// entry points with its own address as sender (which must hold RELAYER).
// A trader's nonce must be strictly greater than the last one used and is
// only consumed when the forwarded call succeeds.
//
// Dispatches are serialized. Trade callbacks fired by a forwarded call may
// read last_nonce() but must not call dispatch() again.

class Relayer {
public:
    using ClockFn = std::function<uint64_t()>;

    Relayer(const Address& self, PositionEngine& engine, const ISignatureVerifier& verifier);
    ~Relayer() = default;

    // Non-copyable
    Relayer(const Relayer&) = delete;
    Relayer& operator=(const Relayer&) = delete;

    RelayResult dispatch(const SignedCall& call);

    uint64_t last_nonce(const Address& trader) const;

    // Canonical big-endian encoding of every signed field (proof excluded)
    static std::vector<uint8_t> signing_payload(const SignedCall& call);

    void set_clock(ClockFn clock);
    const Address& address() const { return self_; }

private:
    Address self_;
    PositionEngine& engine_;
    const ISignatureVerifier& verifier_;

    std::unordered_map<Address, uint64_t, AddressHash> nonces_;
    ClockFn clock_;

    mutable std::shared_mutex mutex_;   // nonces_ and clock_
    std::mutex dispatch_mutex_;

    RelayResult forward(const SignedCall& call);
    uint64_t now() const;
};

} // namespace lever

#endif // LEVER_RELAYER_HPP
