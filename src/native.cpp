// =============================================================================
// native.cpp - NativeBank Implementation
// =============================================================================

#include "depth/native.hpp"
#include "depth/errors.hpp"

#include <exception>
#include <mutex>

namespace depth {

NativeBank::NativeBank()
    : balances_("Native", "NATIVE") {}

void NativeBank::fund(const Address& account, I128 amount) {
    if (amount <= 0) {
        throw InvalidAmountError("NATIVE: funding amount must be positive");
    }
    std::unique_lock lock(mutex_);
    balances_.mint(account, amount);
}

I128 NativeBank::balance_of(const Address& account) const {
    std::shared_lock lock(mutex_);
    return balances_.balance_of(account);
}

I128 NativeBank::total_issued() const {
    std::shared_lock lock(mutex_);
    return balances_.total_supply();
}

void NativeBank::transfer(const Address& from, const Address& to, I128 amount) {
    std::unique_lock lock(mutex_);
    balances_.transfer(from, to, amount);
}

bool NativeBank::send(const Address& from, const Address& to, I128 amount) {
    Checkpoint checkpoint = 0;
    IReceiver* receiver = nullptr;
    {
        std::unique_lock lock(mutex_);
        checkpoint = balances_.checkpoint();
        try {
            balances_.transfer(from, to, amount);
        } catch (const StabilityError&) {
            balances_.rollback(checkpoint);
            throw;
        }
        receiver = receiver_for(to);
    }

    // The receiver runs without the lock held so that it can call back in
    bool accepted = true;
    if (receiver) {
        try {
            accepted = receiver->on_receive(from, amount);
        } catch (const std::exception&) {
            accepted = false;
        }
    }

    std::unique_lock lock(mutex_);
    if (accepted) {
        balances_.commit(checkpoint);
    } else {
        balances_.rollback(checkpoint);
    }
    return accepted;
}

void NativeBank::set_receiver(const Address& account, IReceiver* receiver) {
    std::unique_lock lock(mutex_);
    if (receiver) {
        receivers_[account] = receiver;
    } else {
        receivers_.erase(account);
    }
}

NativeBank::Checkpoint NativeBank::checkpoint() {
    std::unique_lock lock(mutex_);
    return balances_.checkpoint();
}

void NativeBank::rollback(Checkpoint checkpoint) {
    std::unique_lock lock(mutex_);
    balances_.rollback(checkpoint);
}

void NativeBank::commit(Checkpoint checkpoint) {
    std::unique_lock lock(mutex_);
    balances_.commit(checkpoint);
}

IReceiver* NativeBank::receiver_for(const Address& account) const {
    auto it = receivers_.find(account);
    return it == receivers_.end() ? nullptr : it->second;
}

} // namespace depth
