#ifndef LEVER_POOL_HPP
#define LEVER_POOL_HPP

#include <unordered_map>

#include "types.hpp"

namespace lever {

// =============================================================================
// Counterparty Pool Mode
// =============================================================================

enum class PoolMode : uint8_t {
    OWNER_CASH = 0,   // single owner-funded cash balance
    SHARE_POOL = 1    // liquidity providers hold shares priced at NAV / total_shares
};

const char* to_string(PoolMode mode);

// Skim applied when fee skimming is switched on without an explicit rate
constexpr uint32_t DEFAULT_FEE_SKIM_BPS = 3000;

// Settlement-visible part of the pool state (journaled by the ledger)
struct PoolTotals {
    I128 liquidity;    // pool NAV
    I128 owner_fees;   // skimmed from trader losses, outside NAV
};

// Read-only snapshot handed out by the ledger
struct PoolView {
    PoolMode mode;
    uint32_t fee_skim_bps;
    I128 liquidity;
    I128 owner_fees;
    I128 total_shares;
    I128 share_price_e6;
};

// =============================================================================
// CounterpartyPool - Counterparty to Every Trader Settlement
// =============================================================================
//
// Not synchronized; owned and guarded by CustodyLedger. Trader profit is paid
// out of liquidity. Trader loss flows in, less the owner fee skim. Minting and
// redeeming round down in favor of the pool, so share operations never move
// the share price against remaining holders.

class CounterpartyPool {
public:
    explicit CounterpartyPool(PoolMode mode = PoolMode::OWNER_CASH, uint32_t fee_skim_bps = 0);

    PoolMode mode() const { return mode_; }
    uint32_t fee_skim_bps() const { return fee_skim_bps_; }

    I128 liquidity() const { return liquidity_; }
    I128 owner_fees() const { return owner_fees_; }
    I128 total_shares() const { return total_shares_; }
    I128 shares_of(const Address& investor) const;

    // NAV per share, 1.000000 while no shares exist
    I128 share_price_e6() const;

    PoolView view() const;

    // =========================================================================
    // Settlement
    // =========================================================================

    bool can_pay(I128 amount) const { return amount <= liquidity_; }
    void pay(I128 amount);
    void absorb(I128 amount);

    // Owner cash movements (OWNER_CASH mode)
    void add_cash(I128 amount);
    void remove_cash(I128 amount);

    I128 take_owner_fees();

    // =========================================================================
    // Shares (SHARE_POOL mode)
    // =========================================================================

    // Shares minted for `amount`; 0 when the pool is insolvent or amount too small
    I128 preview_mint(I128 amount) const;
    // Collateral returned for burning `shares`
    I128 preview_redeem(I128 shares) const;

    // Sweeps unowned liquidity to owner fees before the first shares are minted
    void mint(const Address& investor, I128 amount, I128 shares);
    void burn(const Address& investor, I128 shares, I128 amount);

    // =========================================================================
    // Journal Support
    // =========================================================================

    PoolTotals totals() const { return PoolTotals{liquidity_, owner_fees_}; }
    void restore(const PoolTotals& totals);

private:
    PoolMode mode_;
    uint32_t fee_skim_bps_;
    I128 liquidity_{0};
    I128 owner_fees_{0};
    I128 total_shares_{0};
    std::unordered_map<Address, I128, AddressHash> shares_;
};

} // namespace lever

#endif // LEVER_POOL_HPP
