#ifndef DEPTH_NATIVE_HPP
#define DEPTH_NATIVE_HPP

#include <unordered_map>
#include <shared_mutex>

#include "types.hpp"
#include "ledger.hpp"

namespace depth {

// =============================================================================
// Receiver Interface
// =============================================================================

// Code attached to an account that runs when native value is sent to it.
// It may call back into other components (including the engine) before
// deciding whether to accept.
class IReceiver {
public:
    virtual ~IReceiver() = default;

    // Called after `amount` has been credited. Return false to reject.
    virtual bool on_receive(const Address& from, I128 amount) = 0;
};

// =============================================================================
// NativeBank - Custody of the Native Asset
// =============================================================================
//
// Holds native balances for every account, including the engine's
// collateral. `transfer` is a plain balance move used for escrowing value
// attached to a call; `send` is an outbound delivery that consults the
// recipient's receiver and is undone entirely when rejected.
//
// Operations that span several calls (a send and the surrounding engine
// operation) must be serialized by the caller.

class NativeBank {
public:
    using Checkpoint = FungibleLedger::Checkpoint;

    NativeBank();
    ~NativeBank() = default;

    // Non-copyable
    NativeBank(const NativeBank&) = delete;
    NativeBank& operator=(const NativeBank&) = delete;

    // Create new native value (genesis allocation, faucet)
    void fund(const Address& account, I128 amount);

    I128 balance_of(const Address& account) const;
    I128 total_issued() const;

    // Throws InsufficientBalanceError when `from` cannot cover `amount`
    void transfer(const Address& from, const Address& to, I128 amount);

    // Deliver `amount` and run the recipient's receiver. Returns false, with
    // every balance change made during the delivery rolled back, if the
    // receiver rejects or throws.
    bool send(const Address& from, const Address& to, I128 amount);

    // nullptr removes the receiver
    void set_receiver(const Address& account, IReceiver* receiver);

    // Undo journal over the balances; see FungibleLedger
    Checkpoint checkpoint();
    void rollback(Checkpoint checkpoint);
    void commit(Checkpoint checkpoint);

private:
    FungibleLedger balances_;
    std::unordered_map<Address, IReceiver*, AddressHash> receivers_;
    mutable std::shared_mutex mutex_;

    IReceiver* receiver_for(const Address& account) const;
};

} // namespace depth

#endif // DEPTH_NATIVE_HPP
