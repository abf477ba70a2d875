#ifndef DEPTH_LEDGER_HPP
#define DEPTH_LEDGER_HPP

#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace depth {

// =============================================================================
// FungibleLedger - Balance Book for One Token
// =============================================================================
//
// Balances are never negative and total_supply always equals their sum.
// Failed calls leave the ledger untouched.

class FungibleLedger {
public:
    using BalanceMap = std::unordered_map<Address, I128, AddressHash>;
    using AllowanceMap = std::unordered_map<Address, BalanceMap, AddressHash>;

    // Position in the undo journal
    using Checkpoint = size_t;

    FungibleLedger(std::string name, std::string symbol);

    const std::string& name() const { return name_; }
    const std::string& symbol() const { return symbol_; }
    uint8_t decimals() const { return DECIMALS; }

    // =========================================================================
    // Supply
    // =========================================================================

    void mint(const Address& to, I128 amount);
    void burn(const Address& from, I128 amount);

    I128 total_supply() const { return total_supply_; }
    I128 balance_of(const Address& account) const;

    // Number of accounts with a non-zero balance
    size_t holders() const;

    // =========================================================================
    // Transfers
    // =========================================================================

    void transfer(const Address& from, const Address& to, I128 amount);

    void approve(const Address& owner, const Address& spender, I128 amount);
    I128 allowance(const Address& owner, const Address& spender) const;

    // Moves `amount` from `owner` to `to`, consuming the spender's allowance
    void transfer_from(const Address& spender, const Address& owner,
                       const Address& to, I128 amount);

    // =========================================================================
    // Checkpoints
    // =========================================================================
    //
    // While a checkpoint is open every change records the previous value of
    // the entry it touches, so rollback costs the number of changes made
    // since, not the number of accounts. Checkpoints nest and are closed in
    // reverse order by exactly one of rollback or commit.

    Checkpoint checkpoint();
    void rollback(Checkpoint checkpoint);
    void commit(Checkpoint checkpoint);

    size_t open_checkpoints() const { return open_checkpoints_; }

private:
    struct UndoEntry {
        enum class Kind : uint8_t { Balance, Allowance, Supply };

        Kind kind;
        Address account;
        Address spender;
        // Zero means the entry did not exist
        I128 previous;
    };

    std::string name_;
    std::string symbol_;
    BalanceMap balances_;
    AllowanceMap allowances_;
    I128 total_supply_ = 0;

    std::vector<UndoEntry> journal_;
    size_t open_checkpoints_ = 0;

    void require_non_negative(I128 amount) const;
    void debit(const Address& from, I128 amount);
    void credit(const Address& to, I128 amount);
    void set_allowance(const Address& owner, const Address& spender, I128 amount);
    void record(UndoEntry::Kind kind, const Address& account, const Address& spender, I128 previous);
    void close_checkpoint();
};

} // namespace depth

#endif // DEPTH_LEDGER_HPP
