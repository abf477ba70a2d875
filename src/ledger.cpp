// =============================================================================
// ledger.cpp - FungibleLedger Implementation
// =============================================================================

#include "depth/ledger.hpp"
#include "depth/errors.hpp"

#include <stdexcept>
#include <utility>

namespace depth {

FungibleLedger::FungibleLedger(std::string name, std::string symbol)
    : name_(std::move(name))
    , symbol_(std::move(symbol)) {}

// =============================================================================
// Internal Helpers
// =============================================================================

void FungibleLedger::require_non_negative(I128 amount) const {
    if (amount < 0) {
        throw InvalidAmountError(symbol_ + ": amount must not be negative");
    }
}

void FungibleLedger::record(UndoEntry::Kind kind, const Address& account,
                            const Address& spender, I128 previous) {
    if (open_checkpoints_ == 0) return;
    journal_.push_back(UndoEntry{kind, account, spender, previous});
}

void FungibleLedger::debit(const Address& from, I128 amount) {
    auto it = balances_.find(from);
    I128 available = it == balances_.end() ? 0 : it->second;
    if (available < amount) {
        throw InsufficientBalanceError(symbol_, amount, available);
    }
    if (amount == 0) return;

    record(UndoEntry::Kind::Balance, from, Address{}, available);
    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
}

void FungibleLedger::credit(const Address& to, I128 amount) {
    if (amount == 0) return;
    record(UndoEntry::Kind::Balance, to, Address{}, balance_of(to));
    balances_[to] += amount;
}

void FungibleLedger::set_allowance(const Address& owner, const Address& spender, I128 amount) {
    record(UndoEntry::Kind::Allowance, owner, spender, allowance(owner, spender));
    if (amount == 0) {
        auto it = allowances_.find(owner);
        if (it != allowances_.end()) {
            it->second.erase(spender);
            if (it->second.empty()) allowances_.erase(it);
        }
        return;
    }
    allowances_[owner][spender] = amount;
}

// =============================================================================
// Supply
// =============================================================================

void FungibleLedger::mint(const Address& to, I128 amount) {
    require_non_negative(amount);
    credit(to, amount);
    record(UndoEntry::Kind::Supply, Address{}, Address{}, total_supply_);
    total_supply_ += amount;
}

void FungibleLedger::burn(const Address& from, I128 amount) {
    require_non_negative(amount);
    debit(from, amount);
    record(UndoEntry::Kind::Supply, Address{}, Address{}, total_supply_);
    total_supply_ -= amount;
}

I128 FungibleLedger::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

size_t FungibleLedger::holders() const {
    return balances_.size();
}

// =============================================================================
// Transfers
// =============================================================================

void FungibleLedger::transfer(const Address& from, const Address& to, I128 amount) {
    require_non_negative(amount);
    debit(from, amount);
    credit(to, amount);
}

void FungibleLedger::approve(const Address& owner, const Address& spender, I128 amount) {
    require_non_negative(amount);
    set_allowance(owner, spender, amount);
}

I128 FungibleLedger::allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find(owner);
    if (it == allowances_.end()) return 0;
    auto sit = it->second.find(spender);
    return sit == it->second.end() ? 0 : sit->second;
}

void FungibleLedger::transfer_from(const Address& spender, const Address& owner,
                                   const Address& to, I128 amount) {
    require_non_negative(amount);

    I128 allowed = allowance(owner, spender);
    if (allowed < amount) {
        throw InsufficientBalanceError(symbol_ + " allowance", amount, allowed);
    }

    debit(owner, amount);
    credit(to, amount);
    set_allowance(owner, spender, allowed - amount);
}

// =============================================================================
// Checkpoints
// =============================================================================

FungibleLedger::Checkpoint FungibleLedger::checkpoint() {
    ++open_checkpoints_;
    return journal_.size();
}

void FungibleLedger::rollback(Checkpoint checkpoint) {
    while (journal_.size() > checkpoint) {
        const UndoEntry& entry = journal_.back();
        switch (entry.kind) {
            case UndoEntry::Kind::Balance:
                if (entry.previous == 0) {
                    balances_.erase(entry.account);
                } else {
                    balances_[entry.account] = entry.previous;
                }
                break;
            case UndoEntry::Kind::Allowance:
                if (entry.previous == 0) {
                    auto it = allowances_.find(entry.account);
                    if (it != allowances_.end()) {
                        it->second.erase(entry.spender);
                        if (it->second.empty()) allowances_.erase(it);
                    }
                } else {
                    allowances_[entry.account][entry.spender] = entry.previous;
                }
                break;
            case UndoEntry::Kind::Supply:
                total_supply_ = entry.previous;
                break;
        }
        journal_.pop_back();
    }
    close_checkpoint();
}

void FungibleLedger::commit(Checkpoint) {
    // Entries stay until the outermost checkpoint closes so that an
    // enclosing rollback can still undo them
    close_checkpoint();
}

void FungibleLedger::close_checkpoint() {
    if (open_checkpoints_ == 0) {
        throw std::logic_error(symbol_ + ": no open checkpoint");
    }
    if (--open_checkpoints_ == 0) {
        journal_.clear();
    }
}

} // namespace depth
