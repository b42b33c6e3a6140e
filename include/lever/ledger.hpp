#ifndef LEVER_LEDGER_HPP
#define LEVER_LEDGER_HPP

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include "types.hpp"
#include "access.hpp"
#include "pool.hpp"

namespace lever {

// =============================================================================
// Ledger Account
// =============================================================================

struct Account {
    I128 balance;   // total custodied collateral
    I128 locked;    // reserved against open trades and pending orders

    I128 available() const { return balance - locked; }
};

// =============================================================================
// CustodyLedger - Collateral Custody, Margin Locks and PnL Settlement
// =============================================================================
//
// Invariant: locked <= balance for every account after every operation.
// lock / unlock / settle require the LEDGER_CONTROLLER role.

class CustodyLedger {
public:
    class Transaction;

    explicit CustodyLedger(AccessControl& access,
                           PoolMode mode = PoolMode::OWNER_CASH,
                           uint32_t fee_skim_bps = 0);
    ~CustodyLedger() = default;

    // Non-copyable
    CustodyLedger(const CustodyLedger&) = delete;
    CustodyLedger& operator=(const CustodyLedger&) = delete;

    // =========================================================================
    // Custody
    // =========================================================================

    int32_t deposit(const Address& account, I128 amount);
    int32_t withdraw(const Address& account, I128 amount);

    // =========================================================================
    // Privileged (each call is its own transaction)
    // =========================================================================

    int32_t lock(const Address& caller, const Address& account, I128 amount);
    int32_t unlock(const Address& caller, const Address& account, I128 amount);
    int32_t settle(const Address& caller, const Address& account, I128 pnl);

    // =========================================================================
    // Counterparty Pool
    // =========================================================================

    // OWNER_CASH mode, OWNER role: move owner balance into / out of the pool
    int32_t fund_pool(const Address& caller, I128 amount);
    int32_t defund_pool(const Address& caller, I128 amount);

    // SHARE_POOL mode: investor available balance <-> pool shares at NAV
    int32_t add_liquidity(const Address& investor, I128 amount, I128* shares_out = nullptr);
    int32_t remove_liquidity(const Address& investor, I128 shares, I128* amount_out = nullptr);

    // OWNER role: credit accrued owner fees to the caller's balance
    int32_t claim_owner_fees(const Address& caller, I128* amount_out = nullptr);

    // =========================================================================
    // Queries
    // =========================================================================

    I128 balance(const Address& account) const;
    I128 locked(const Address& account) const;
    I128 available(const Address& account) const;
    std::optional<Account> account(const Address& account) const;

    PoolView pool() const;
    I128 shares_of(const Address& investor) const;

    // Sum of all account balances plus pool liquidity and owner fees
    I128 total_value() const;

    // =========================================================================
    // Transactions
    // =========================================================================
    //
    // Holds the ledger exclusively until destroyed. Every account and the pool
    // totals are journaled on first touch; destruction without commit() rolls
    // all of them back.

    class Transaction {
    public:
        Transaction(Transaction&& other) noexcept;
        Transaction& operator=(Transaction&&) = delete;
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
        ~Transaction();

        int32_t lock(const Address& caller, const Address& account, I128 amount);
        int32_t unlock(const Address& caller, const Address& account, I128 amount);
        int32_t settle(const Address& caller, const Address& account, I128 pnl);

        I128 available(const Address& account) const;

        void commit();
        void rollback();
        bool active() const { return ledger_ != nullptr; }

    private:
        friend class CustodyLedger;
        explicit Transaction(CustodyLedger& ledger);

        Account& touch(const Address& account);
        void touch_pool();

        CustodyLedger* ledger_;
        std::unique_lock<std::shared_mutex> guard_;
        std::unordered_map<Address, std::optional<Account>, AddressHash> saved_accounts_;
        std::optional<PoolTotals> saved_pool_;
    };

    Transaction begin();

private:
    AccessControl& access_;

    std::unordered_map<Address, Account, AddressHash> accounts_;
    CounterpartyPool pool_;
    mutable std::shared_mutex mutex_;

    const Account* find(const Address& account) const;
};

} // namespace lever

#endif // LEVER_LEDGER_HPP
