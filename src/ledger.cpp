// =============================================================================
// ledger.cpp - CustodyLedger Implementation
// =============================================================================

#include "lever/ledger.hpp"
#include "lever/log.hpp"

namespace lever {

// =============================================================================
// Constructor
// =============================================================================

CustodyLedger::CustodyLedger(AccessControl& access, PoolMode mode, uint32_t fee_skim_bps)
    : access_(access), pool_(mode, fee_skim_bps) {}

// =============================================================================
// Custody
// =============================================================================

int32_t CustodyLedger::deposit(const Address& account, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    accounts_[account].balance += amount;
    log::logger()->debug("deposit {} {}", addresses::to_hex(account), e6::format(amount));
    return errors::OK;
}

int32_t CustodyLedger::withdraw(const Address& account, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    auto it = accounts_.find(account);
    if (it == accounts_.end() || amount > it->second.available()) {
        return errors::INSUFFICIENT_AVAILABLE;
    }

    it->second.balance -= amount;
    log::logger()->debug("withdraw {} {}", addresses::to_hex(account), e6::format(amount));
    return errors::OK;
}

// =============================================================================
// Privileged
// =============================================================================

int32_t CustodyLedger::lock(const Address& caller, const Address& account, I128 amount) {
    Transaction tx = begin();
    int32_t status = tx.lock(caller, account, amount);
    if (status == errors::OK) tx.commit();
    return status;
}

int32_t CustodyLedger::unlock(const Address& caller, const Address& account, I128 amount) {
    Transaction tx = begin();
    int32_t status = tx.unlock(caller, account, amount);
    if (status == errors::OK) tx.commit();
    return status;
}

int32_t CustodyLedger::settle(const Address& caller, const Address& account, I128 pnl) {
    Transaction tx = begin();
    int32_t status = tx.settle(caller, account, pnl);
    if (status == errors::OK) tx.commit();
    return status;
}

// =============================================================================
// Counterparty Pool
// =============================================================================

int32_t CustodyLedger::fund_pool(const Address& caller, I128 amount) {
    if (!access_.has_role(Role::OWNER, caller)) {
        return errors::UNAUTHORIZED;
    }
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    if (pool_.mode() != PoolMode::OWNER_CASH) {
        return errors::INVALID_MODE;
    }

    auto it = accounts_.find(caller);
    if (it == accounts_.end() || amount > it->second.available()) {
        return errors::INSUFFICIENT_AVAILABLE;
    }

    it->second.balance -= amount;
    pool_.add_cash(amount);
    log::logger()->info("pool funded {} (liquidity {})", e6::format(amount),
                        e6::format(pool_.liquidity()));
    return errors::OK;
}

int32_t CustodyLedger::defund_pool(const Address& caller, I128 amount) {
    if (!access_.has_role(Role::OWNER, caller)) {
        return errors::UNAUTHORIZED;
    }
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    if (pool_.mode() != PoolMode::OWNER_CASH) {
        return errors::INVALID_MODE;
    }
    if (!pool_.can_pay(amount)) {
        return errors::LIQUIDITY_LOW;
    }

    pool_.remove_cash(amount);
    accounts_[caller].balance += amount;
    log::logger()->info("pool defunded {} (liquidity {})", e6::format(amount),
                        e6::format(pool_.liquidity()));
    return errors::OK;
}

int32_t CustodyLedger::add_liquidity(const Address& investor, I128 amount, I128* shares_out) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    if (pool_.mode() != PoolMode::SHARE_POOL) {
        return errors::INVALID_MODE;
    }

    auto it = accounts_.find(investor);
    if (it == accounts_.end() || amount > it->second.available()) {
        return errors::INSUFFICIENT_AVAILABLE;
    }

    if (pool_.total_shares() > 0 && pool_.liquidity() <= 0) {
        return errors::POOL_INSOLVENT;
    }
    I128 shares = pool_.preview_mint(amount);
    if (shares <= 0) {
        return errors::INVALID_AMOUNT;
    }

    it->second.balance -= amount;
    pool_.mint(investor, amount, shares);
    if (shares_out) *shares_out = shares;

    log::logger()->info("liquidity added by {}: {} for {} shares", addresses::to_hex(investor),
                        e6::format(amount), e6::format(shares));
    return errors::OK;
}

int32_t CustodyLedger::remove_liquidity(const Address& investor, I128 shares, I128* amount_out) {
    if (shares <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    if (pool_.mode() != PoolMode::SHARE_POOL) {
        return errors::INVALID_MODE;
    }
    if (shares > pool_.shares_of(investor)) {
        return errors::INSUFFICIENT_SHARES;
    }

    I128 amount = pool_.preview_redeem(shares);
    pool_.burn(investor, shares, amount);
    accounts_[investor].balance += amount;
    if (amount_out) *amount_out = amount;

    log::logger()->info("liquidity removed by {}: {} shares for {}", addresses::to_hex(investor),
                        e6::format(shares), e6::format(amount));
    return errors::OK;
}

int32_t CustodyLedger::claim_owner_fees(const Address& caller, I128* amount_out) {
    if (!access_.has_role(Role::OWNER, caller)) {
        return errors::UNAUTHORIZED;
    }

    std::unique_lock lock(mutex_);
    I128 fees = pool_.take_owner_fees();
    if (fees > 0) {
        accounts_[caller].balance += fees;
    }
    if (amount_out) *amount_out = fees;
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

I128 CustodyLedger::balance(const Address& account) const {
    std::shared_lock lock(mutex_);
    const Account* acct = find(account);
    return acct ? acct->balance : 0;
}

I128 CustodyLedger::locked(const Address& account) const {
    std::shared_lock lock(mutex_);
    const Account* acct = find(account);
    return acct ? acct->locked : 0;
}

I128 CustodyLedger::available(const Address& account) const {
    std::shared_lock lock(mutex_);
    const Account* acct = find(account);
    return acct ? acct->available() : 0;
}

std::optional<Account> CustodyLedger::account(const Address& account) const {
    std::shared_lock lock(mutex_);
    const Account* acct = find(account);
    if (!acct) return std::nullopt;
    return *acct;
}

PoolView CustodyLedger::pool() const {
    std::shared_lock lock(mutex_);
    return pool_.view();
}

I128 CustodyLedger::shares_of(const Address& investor) const {
    std::shared_lock lock(mutex_);
    return pool_.shares_of(investor);
}

I128 CustodyLedger::total_value() const {
    std::shared_lock lock(mutex_);
    I128 total = pool_.liquidity() + pool_.owner_fees();
    for (const auto& [addr, acct] : accounts_) {
        total += acct.balance;
    }
    return total;
}

const Account* CustodyLedger::find(const Address& account) const {
    auto it = accounts_.find(account);
    return it != accounts_.end() ? &it->second : nullptr;
}

// =============================================================================
// Transactions
// =============================================================================

CustodyLedger::Transaction CustodyLedger::begin() {
    return Transaction(*this);
}

CustodyLedger::Transaction::Transaction(CustodyLedger& ledger)
    : ledger_(&ledger), guard_(ledger.mutex_) {}

CustodyLedger::Transaction::Transaction(Transaction&& other) noexcept
    : ledger_(other.ledger_),
      guard_(std::move(other.guard_)),
      saved_accounts_(std::move(other.saved_accounts_)),
      saved_pool_(std::move(other.saved_pool_)) {
    other.ledger_ = nullptr;
}

CustodyLedger::Transaction::~Transaction() {
    if (ledger_) {
        rollback();
    }
}

Account& CustodyLedger::Transaction::touch(const Address& account) {
    auto& accounts = ledger_->accounts_;
    if (saved_accounts_.find(account) == saved_accounts_.end()) {
        auto it = accounts.find(account);
        saved_accounts_[account] = (it != accounts.end())
            ? std::optional<Account>(it->second)
            : std::nullopt;
    }
    return accounts[account];
}

void CustodyLedger::Transaction::touch_pool() {
    if (!saved_pool_) {
        saved_pool_ = ledger_->pool_.totals();
    }
}

int32_t CustodyLedger::Transaction::lock(const Address& caller, const Address& account, I128 amount) {
    if (!ledger_->access_.has_role(Role::LEDGER_CONTROLLER, caller)) {
        return errors::UNAUTHORIZED;
    }
    if (amount < 0) {
        return errors::INVALID_AMOUNT;
    }

    const Account* acct = ledger_->find(account);
    if (amount > (acct ? acct->available() : 0)) {
        return errors::INSUFFICIENT_AVAILABLE;
    }

    touch(account).locked += amount;
    return errors::OK;
}

int32_t CustodyLedger::Transaction::unlock(const Address& caller, const Address& account, I128 amount) {
    if (!ledger_->access_.has_role(Role::LEDGER_CONTROLLER, caller)) {
        return errors::UNAUTHORIZED;
    }
    if (amount < 0) {
        return errors::INVALID_AMOUNT;
    }

    const Account* acct = ledger_->find(account);
    if (amount > (acct ? acct->locked : 0)) {
        return errors::OVER_UNLOCK;
    }

    touch(account).locked -= amount;
    return errors::OK;
}

int32_t CustodyLedger::Transaction::settle(const Address& caller, const Address& account, I128 pnl) {
    if (!ledger_->access_.has_role(Role::LEDGER_CONTROLLER, caller)) {
        return errors::UNAUTHORIZED;
    }
    if (pnl == 0) {
        return errors::OK;
    }

    CounterpartyPool& pool = ledger_->pool_;

    if (pnl > 0) {
        if (!pool.can_pay(pnl)) {
            return errors::LIQUIDITY_LOW;
        }
        touch_pool();
        pool.pay(pnl);
        touch(account).balance += pnl;
        return errors::OK;
    }

    I128 loss = -pnl;
    const Account* acct = ledger_->find(account);
    if (!acct || loss > acct->balance || acct->balance - loss < acct->locked) {
        return errors::FUNDS_LOW;
    }

    touch(account).balance -= loss;
    touch_pool();
    pool.absorb(loss);
    return errors::OK;
}

I128 CustodyLedger::Transaction::available(const Address& account) const {
    const Account* acct = ledger_->find(account);
    return acct ? acct->available() : 0;
}

void CustodyLedger::Transaction::commit() {
    saved_accounts_.clear();
    saved_pool_.reset();
    ledger_ = nullptr;
    if (guard_.owns_lock()) guard_.unlock();
}

void CustodyLedger::Transaction::rollback() {
    if (!ledger_) return;

    auto& accounts = ledger_->accounts_;
    for (auto& [addr, saved] : saved_accounts_) {
        if (saved) {
            accounts[addr] = *saved;
        } else {
            accounts.erase(addr);
        }
    }
    if (saved_pool_) {
        ledger_->pool_.restore(*saved_pool_);
    }

    saved_accounts_.clear();
    saved_pool_.reset();
    ledger_ = nullptr;
    if (guard_.owns_lock()) guard_.unlock();
}

} // namespace lever
