// =============================================================================
// pool.cpp - Counterparty Pool (cash or share-priced liquidity)
// =============================================================================

#include "lever/pool.hpp"

namespace lever {

const char* to_string(PoolMode mode) {
    return mode == PoolMode::SHARE_POOL ? "share_pool" : "owner_cash";
}

CounterpartyPool::CounterpartyPool(PoolMode mode, uint32_t fee_skim_bps)
    : mode_(mode), fee_skim_bps_(fee_skim_bps) {}

I128 CounterpartyPool::shares_of(const Address& investor) const {
    auto it = shares_.find(investor);
    return it != shares_.end() ? it->second : 0;
}

I128 CounterpartyPool::share_price_e6() const {
    if (total_shares_ == 0) return e6::ONE;
    return liquidity_ * e6::ONE / total_shares_;
}

PoolView CounterpartyPool::view() const {
    return PoolView{mode_, fee_skim_bps_, liquidity_, owner_fees_,
                    total_shares_, share_price_e6()};
}

// =============================================================================
// Settlement
// =============================================================================

void CounterpartyPool::pay(I128 amount) {
    liquidity_ -= amount;
}

void CounterpartyPool::absorb(I128 amount) {
    I128 fee = amount * fee_skim_bps_ / e6::BPS;
    owner_fees_ += fee;
    liquidity_ += amount - fee;
}

void CounterpartyPool::add_cash(I128 amount) {
    liquidity_ += amount;
}

void CounterpartyPool::remove_cash(I128 amount) {
    liquidity_ -= amount;
}

I128 CounterpartyPool::take_owner_fees() {
    I128 fees = owner_fees_;
    owner_fees_ = 0;
    return fees;
}

// =============================================================================
// Shares
// =============================================================================

I128 CounterpartyPool::preview_mint(I128 amount) const {
    if (amount <= 0) return 0;
    if (total_shares_ == 0) return amount;
    if (liquidity_ <= 0) return 0;
    return amount * total_shares_ / liquidity_;
}

I128 CounterpartyPool::preview_redeem(I128 shares) const {
    if (shares <= 0 || total_shares_ == 0 || liquidity_ <= 0) return 0;
    return shares * liquidity_ / total_shares_;
}

void CounterpartyPool::mint(const Address& investor, I128 amount, I128 shares) {
    // NAV with no shareholders goes to owner fees
    if (total_shares_ == 0 && liquidity_ > 0) {
        owner_fees_ += liquidity_;
        liquidity_ = 0;
    }
    liquidity_ += amount;
    total_shares_ += shares;
    shares_[investor] += shares;
}

void CounterpartyPool::burn(const Address& investor, I128 shares, I128 amount) {
    liquidity_ -= amount;
    total_shares_ -= shares;

    auto it = shares_.find(investor);
    if (it == shares_.end()) return;
    it->second -= shares;
    if (it->second == 0) {
        shares_.erase(it);
    }
}

void CounterpartyPool::restore(const PoolTotals& totals) {
    liquidity_ = totals.liquidity;
    owner_fees_ = totals.owner_fees;
}

} // namespace lever
