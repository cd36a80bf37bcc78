// =============================================================================
// custody.cpp - In-memory custody and share ledger
// =============================================================================

#include "clamm/custody.hpp"
#include "clamm/errors.hpp"

#include <limits>
#include <mutex>

namespace clamm {

// =============================================================================
// InMemoryCustody
// =============================================================================

InMemoryCustody::InMemoryCustody(const Address& pool_account)
    : pool_account_(pool_account) {}

void InMemoryCustody::debit(const Address& account, const Currency& token, const U256& amount) {
    TransferHook hook;
    bool spent_allowance = false;
    {
        std::unique_lock lock(mutex_);

        BalanceKey key{account, token.addr};
        auto bal = balances_.find(key);
        if (bal == balances_.end() || bal->second < amount) {
            throw InsufficientFunds("insufficient balance for debit of " + amount.str());
        }

        auto allowed = allowances_.find(key);
        if (allowed == allowances_.end() || allowed->second < amount) {
            throw InsufficientFunds("insufficient allowance for debit of " + amount.str(),
                                    errors::INSUFFICIENT_ALLOWANCE);
        }

        bal->second -= amount;
        spent_allowance = allowed->second != (std::numeric_limits<U256>::max)();
        if (spent_allowance) {
            allowed->second -= amount;
        }
        balances_[{pool_account_, token.addr}] += amount;
        hook = hook_;
    }

    if (hook) {
        try {
            hook(account, token, amount, true);
        } catch (...) {
            // A failing hook reverts the transfer
            move_balance(pool_account_, account, token, amount);
            if (spent_allowance) {
                std::unique_lock lock(mutex_);
                allowances_[{account, token.addr}] += amount;
            }
            throw;
        }
    }
}

void InMemoryCustody::credit(const Address& account, const Currency& token, const U256& amount) {
    TransferHook hook;
    {
        std::unique_lock lock(mutex_);

        U256& pool_balance = balances_[{pool_account_, token.addr}];
        if (pool_balance < amount) {
            throw InsufficientFunds("pool reserve short for credit of " + amount.str());
        }
        pool_balance -= amount;
        balances_[{account, token.addr}] += amount;
        hook = hook_;
    }

    if (hook) {
        try {
            hook(account, token, amount, false);
        } catch (...) {
            move_balance(account, pool_account_, token, amount);
            throw;
        }
    }
}

void InMemoryCustody::refund(const Address& account, const Currency& token, const U256& amount) {
    move_balance(pool_account_, account, token, amount);
}

void InMemoryCustody::reclaim(const Address& account, const Currency& token, const U256& amount) {
    move_balance(account, pool_account_, token, amount);
}

void InMemoryCustody::move_balance(const Address& from, const Address& to,
                                   const Currency& token, const U256& amount) {
    std::unique_lock lock(mutex_);
    U256& from_balance = balances_[{from, token.addr}];
    if (from_balance < amount) {
        throw InsufficientFunds("balance short for reversal of " + amount.str());
    }
    from_balance -= amount;
    balances_[{to, token.addr}] += amount;
}

void InMemoryCustody::deposit(const Address& account, const Currency& token, const U256& amount) {
    std::unique_lock lock(mutex_);
    balances_[{account, token.addr}] += amount;
}

void InMemoryCustody::approve(const Address& account, const Currency& token, const U256& amount) {
    std::unique_lock lock(mutex_);
    allowances_[{account, token.addr}] = amount;
}

U256 InMemoryCustody::balance_of(const Address& account, const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find({account, token.addr});
    return it != balances_.end() ? it->second : U256(0);
}

U256 InMemoryCustody::allowance(const Address& account, const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto it = allowances_.find({account, token.addr});
    return it != allowances_.end() ? it->second : U256(0);
}

void InMemoryCustody::set_transfer_hook(TransferHook hook) {
    std::unique_lock lock(mutex_);
    hook_ = std::move(hook);
}

// =============================================================================
// InMemoryShareLedger
// =============================================================================

void InMemoryShareLedger::mint(const Address& owner, U128 amount) {
    std::unique_lock lock(mutex_);
    if (amount > U128_MAX - total_supply_) {
        throw ArithmeticOverflow("share supply exceeds 2^128 - 1");
    }
    balances_[owner] += amount;
    total_supply_ += amount;
}

void InMemoryShareLedger::burn(const Address& owner, U128 amount) {
    std::unique_lock lock(mutex_);
    auto it = balances_.find(owner);
    if (it == balances_.end() || it->second < amount) {
        throw InsufficientLiquidity("share balance lower than burn amount");
    }
    it->second -= amount;
    total_supply_ -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
}

U128 InMemoryShareLedger::balance_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(owner);
    return it != balances_.end() ? it->second : 0;
}

U128 InMemoryShareLedger::total_supply() const {
    std::shared_lock lock(mutex_);
    return total_supply_;
}

} // namespace clamm
