#ifndef CLAMM_CUSTODY_HPP
#define CLAMM_CUSTODY_HPP

#include <map>
#include <shared_mutex>
#include <functional>
#include <utility>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Custody Interface (token transfers between callers and the pool)
// =============================================================================

class ICustody {
public:
    virtual ~ICustody() = default;

    // Move `amount` of `token` from account to the pool.
    // Throws InsufficientFunds on balance or allowance shortfall.
    virtual void debit(const Address& account, const Currency& token, const U256& amount) = 0;

    // Move `amount` of `token` from the pool to account
    virtual void credit(const Address& account, const Currency& token, const U256& amount) = 0;

    // Undo a completed debit or credit during settlement rollback. Neither
    // checks allowances nor notifies transfer hooks.
    virtual void refund(const Address& account, const Currency& token, const U256& amount) = 0;
    virtual void reclaim(const Address& account, const Currency& token, const U256& amount) = 0;
};

// =============================================================================
// Share Ledger Interface (one share per unit of liquidity)
// =============================================================================

class IShareLedger {
public:
    virtual ~IShareLedger() = default;

    virtual void mint(const Address& owner, U128 amount) = 0;

    // Throws InsufficientLiquidity when owner holds fewer than amount shares
    virtual void burn(const Address& owner, U128 amount) = 0;

    virtual U128 balance_of(const Address& owner) const = 0;
};

// =============================================================================
// InMemoryCustody - balances and allowances held in process
// =============================================================================

class InMemoryCustody : public ICustody {
public:
    // Invoked after every successful transfer (is_debit = true for
    // account -> pool). Runs without the custody lock held; if it throws,
    // the transfer is reverted and the exception propagates.
    using TransferHook = std::function<void(const Address& account, const Currency& token,
                                            const U256& amount, bool is_debit)>;

    explicit InMemoryCustody(const Address& pool_account);

    // Non-copyable
    InMemoryCustody(const InMemoryCustody&) = delete;
    InMemoryCustody& operator=(const InMemoryCustody&) = delete;

    void debit(const Address& account, const Currency& token, const U256& amount) override;
    void credit(const Address& account, const Currency& token, const U256& amount) override;
    void refund(const Address& account, const Currency& token, const U256& amount) override;
    void reclaim(const Address& account, const Currency& token, const U256& amount) override;

    // Create tokens in an account
    void deposit(const Address& account, const Currency& token, const U256& amount);

    // Allow the pool to debit up to `amount` (max U256 = unlimited)
    void approve(const Address& account, const Currency& token, const U256& amount);

    U256 balance_of(const Address& account, const Currency& token) const;
    U256 allowance(const Address& account, const Currency& token) const;

    // Pool reserves of token
    U256 reserve(const Currency& token) const { return balance_of(pool_account_, token); }

    void set_transfer_hook(TransferHook hook);

private:
    // Balance move with no allowance or hook; throws InsufficientFunds if `from` is short
    void move_balance(const Address& from, const Address& to, const Currency& token, const U256& amount);

    using BalanceKey = std::pair<Address, Address>;  // (account, token)

    Address pool_account_;
    std::map<BalanceKey, U256> balances_;
    std::map<BalanceKey, U256> allowances_;
    mutable std::shared_mutex mutex_;

    TransferHook hook_;
};

// =============================================================================
// InMemoryShareLedger
// =============================================================================

class InMemoryShareLedger : public IShareLedger {
public:
    void mint(const Address& owner, U128 amount) override;
    void burn(const Address& owner, U128 amount) override;
    U128 balance_of(const Address& owner) const override;

    U128 total_supply() const;

private:
    std::map<Address, U128> balances_;
    U128 total_supply_ = 0;
    mutable std::shared_mutex mutex_;
};

} // namespace clamm

#endif // CLAMM_CUSTODY_HPP
