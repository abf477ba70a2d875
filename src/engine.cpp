// =============================================================================
// engine.cpp - StabilityEngine Implementation
// =============================================================================

#include "depth/engine.hpp"
#include "depth/collateral.hpp"
#include "depth/errors.hpp"
#include "depth/wad.hpp"

#include <exception>
#include <utility>

namespace depth {

StabilityEngine::StabilityEngine(const EngineConfig& config, const IPriceFeed& price_feed,
                                 NativeBank& bank, IEngineHooks* hooks)
    : address_(config.engine_address)
    , price_feed_(price_feed)
    , bank_(bank)
    , fee_policy_(config.fee_rate_percentage)
    , stable_(STABLE_NAME, STABLE_SYMBOL)
    , hooks_(hooks ? hooks : &null_hooks_) {
    if (addresses::is_zero(address_)) {
        throw ConfigError("StabilityEngine: engine address must not be zero");
    }
}

void StabilityEngine::set_hooks(IEngineHooks* hooks) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    hooks_ = hooks ? hooks : &null_hooks_;
}

// =============================================================================
// Operation Frame
// =============================================================================

I128 StabilityEngine::execute(const std::string& operation, const std::function<I128()>& body) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (entered_) {
        throw ReentrancyError();
    }

    entered_ = true;
    pending_events_.clear();
    Checkpoint saved = checkpoint();

    I128 result = 0;
    try {
        result = body();
    } catch (const StabilityError& e) {
        rollback(saved);
        entered_ = false;
        pending_events_.clear();
        deliver([&](IEngineHooks& h) { h.on_operation_rejected(operation, e.code(), e.what()); });
        throw;
    } catch (...) {
        rollback(saved);
        entered_ = false;
        pending_events_.clear();
        throw;
    }

    commit(saved);
    entered_ = false;
    std::vector<Event> events;
    events.swap(pending_events_);
    for (const auto& event : events) {
        deliver(event);
    }
    return result;
}

void StabilityEngine::deliver(const Event& event) {
    // The operation has already been decided; a failing hook only gets counted
    try {
        event(*hooks_);
    } catch (const std::exception& e) {
        ++hook_failures_;
        last_hook_error_ = e.what();
    }
}

StabilityEngine::Checkpoint StabilityEngine::checkpoint() {
    Checkpoint cp;
    cp.stable = stable_.checkpoint();
    if (buffer_) {
        cp.buffer = buffer_->checkpoint();
    }
    cp.native = bank_.checkpoint();
    return cp;
}

void StabilityEngine::rollback(const Checkpoint& cp) {
    bank_.rollback(cp.native);
    if (cp.buffer) {
        buffer_->rollback(*cp.buffer);
    } else {
        // Pool created by the failed operation
        buffer_.reset();
    }
    stable_.rollback(cp.stable);
}

void StabilityEngine::commit(const Checkpoint& cp) {
    bank_.commit(cp.native);
    if (cp.buffer) {
        buffer_->commit(*cp.buffer);
    }
    stable_.commit(cp.stable);
}

I128 StabilityEngine::read_price() const {
    I128 price = price_feed_.current_price();
    if (price <= 0) {
        throw PriceFeedError("StabilityEngine: price feed returned a non-positive price");
    }
    return price;
}

I128 StabilityEngine::fee_for(I128 native_amount) const {
    bool pool_exists = buffer_.has_value();
    I128 supply = pool_exists ? buffer_->total_supply() : 0;
    return fee_policy_.fee(native_amount, pool_exists, supply);
}

void StabilityEngine::send_refund(const Address& to, I128 amount) {
    if (!bank_.send(address_, to, amount)) {
        throw RefundTransferError(to, amount);
    }
}

void StabilityEngine::emit(Event event) {
    pending_events_.push_back(std::move(event));
}

// =============================================================================
// Stable Unit
// =============================================================================

I128 StabilityEngine::mint_stable(const Address& caller, I128 native_value) {
    return execute("mint_stable", [&]() -> I128 {
        if (native_value <= 0) {
            throw InvalidAmountError("mint_stable: native value must be positive");
        }

        I128 price = read_price();
        I128 fee = fee_for(native_value);
        I128 minted = collateral::value_in_stable(native_value - fee, price);
        if (minted <= 0) {
            throw InvalidAmountError("mint_stable: native value too small to mint any " +
                                     std::string(STABLE_SYMBOL));
        }

        bank_.transfer(caller, address_, native_value);
        stable_.mint(caller, minted);

        emit([caller, native_value, fee, minted](IEngineHooks& h) {
            h.on_stable_minted(caller, native_value, fee, minted);
        });
        return minted;
    });
}

I128 StabilityEngine::burn_stable(const Address& caller, I128 amount) {
    return execute("burn_stable", [&]() -> I128 {
        if (amount <= 0) {
            throw InvalidAmountError("burn_stable: amount must be positive");
        }

        I128 price = read_price();
        I128 position = collateral::deficit_or_surplus(
            bank_.balance_of(address_), stable_.total_supply(), price);
        if (position < 0) {
            throw DeficitError(-position);
        }

        stable_.burn(caller, amount);

        I128 refund = collateral::value_in_native(amount, price);
        I128 fee = fee_for(refund);
        I128 net_refund = refund - fee;
        if (net_refund <= 0) {
            throw InvalidAmountError("burn_stable: amount too small to refund any native value");
        }

        send_refund(caller, net_refund);

        emit([caller, amount, fee, net_refund](IEngineHooks& h) {
            h.on_stable_burned(caller, amount, fee, net_refund);
        });
        return net_refund;
    });
}

void StabilityEngine::transfer_stable(const Address& from, const Address& to, I128 amount) {
    execute("transfer_stable", [&]() -> I128 {
        stable_.transfer(from, to, amount);
        emit([from, to, amount](IEngineHooks& h) {
            h.on_transfer(STABLE_SYMBOL, from, to, amount);
        });
        return amount;
    });
}

// =============================================================================
// Buffer Unit
// =============================================================================

I128 StabilityEngine::deposit_buffer(const Address& caller, I128 native_value) {
    return execute("deposit_buffer", [&]() -> I128 {
        if (native_value <= 0) {
            throw InvalidAmountError("deposit_buffer: native value must be positive");
        }

        I128 price = read_price();
        I128 stable_supply = stable_.total_supply();
        // Collateral before the attached value is escrowed
        I128 position = collateral::deficit_or_surplus(
            bank_.balance_of(address_), stable_supply, price);

        I128 minted = 0;
        I128 price_wad = WAD;

        if (position <= 0) {
            // Bootstrap or recovery: clear the deficit, then seed 1:1 with the
            // stable value of what is left over
            I128 deficit = -position;
            I128 minimum = collateral::minimum_bootstrap_deposit(deficit, stable_supply, price);
            if (native_value < minimum) {
                throw InsufficientBootstrapCollateral(native_value, minimum);
            }

            I128 deficit_in_native = collateral::value_in_native(deficit, price);
            minted = collateral::value_in_stable(native_value - deficit_in_native, price);
            if (minted <= 0) {
                throw InvalidAmountError("deposit_buffer: deposit leaves no surplus to issue " +
                                         std::string(BUFFER_SYMBOL) + " against");
            }

            bank_.transfer(caller, address_, native_value);
            if (!buffer_) {
                buffer_.emplace(BUFFER_NAME, BUFFER_SYMBOL);
                emit([caller](IEngineHooks& h) { h.on_buffer_pool_created(caller); });
            }
        } else {
            if (!buffer_) {
                throw BufferPoolMissingError();
            }

            I128 buffer_supply = buffer_->total_supply();
            if (buffer_supply > 0) {
                price_wad = collateral::buffer_unit_price(buffer_supply, position);
            }

            I128 deposit_in_stable = collateral::value_in_stable(native_value, price);
            minted = wad::mul_frac(deposit_in_stable, price_wad);
            if (minted <= 0) {
                throw InvalidAmountError("deposit_buffer: native value too small to mint any " +
                                         std::string(BUFFER_SYMBOL));
            }

            bank_.transfer(caller, address_, native_value);
        }

        buffer_->mint(caller, minted);

        emit([caller, native_value, minted, price_wad](IEngineHooks& h) {
            h.on_buffer_minted(caller, native_value, minted, price_wad);
        });
        return minted;
    });
}

I128 StabilityEngine::withdraw_buffer(const Address& caller, I128 amount) {
    return execute("withdraw_buffer", [&]() -> I128 {
        if (amount <= 0) {
            throw InvalidAmountError("withdraw_buffer: amount must be positive");
        }
        if (!buffer_) {
            throw BufferPoolMissingError();
        }

        I128 available = buffer_->balance_of(caller);
        if (available < amount) {
            throw InsufficientBufferBalance(amount, available);
        }

        I128 price = read_price();
        I128 position = collateral::deficit_or_surplus(
            bank_.balance_of(address_), stable_.total_supply(), price);
        if (position <= 0) {
            throw NoSurplusToWithdraw(position);
        }

        // Pro-rata share of the surplus, priced on the supply before this
        // burn and rounded toward the pool
        I128 buffer_supply = buffer_->total_supply();
        I128 price_wad = collateral::buffer_unit_price(buffer_supply, position);
        I128 refund_in_stable = wad::mul_div(amount, position, buffer_supply);
        I128 refund_in_native = collateral::value_in_native(refund_in_stable, price);
        if (refund_in_native <= 0) {
            throw InvalidAmountError("withdraw_buffer: amount too small to refund any native value");
        }

        buffer_->burn(caller, amount);
        send_refund(caller, refund_in_native);

        emit([caller, amount, refund_in_native, price_wad](IEngineHooks& h) {
            h.on_buffer_burned(caller, amount, refund_in_native, price_wad);
        });
        return refund_in_native;
    });
}

void StabilityEngine::transfer_buffer(const Address& from, const Address& to, I128 amount) {
    execute("transfer_buffer", [&]() -> I128 {
        if (!buffer_) {
            throw BufferPoolMissingError();
        }
        buffer_->transfer(from, to, amount);
        emit([from, to, amount](IEngineHooks& h) {
            h.on_transfer(BUFFER_SYMBOL, from, to, amount);
        });
        return amount;
    });
}

// =============================================================================
// Queries
// =============================================================================

bool StabilityEngine::has_buffer_pool() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return buffer_.has_value();
}

const FungibleLedger* StabilityEngine::buffer_ledger() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return buffer_ ? &*buffer_ : nullptr;
}

I128 StabilityEngine::stable_total_supply() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return stable_.total_supply();
}

I128 StabilityEngine::stable_balance_of(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return stable_.balance_of(account);
}

I128 StabilityEngine::buffer_total_supply() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return buffer_ ? buffer_->total_supply() : 0;
}

I128 StabilityEngine::buffer_balance_of(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return buffer_ ? buffer_->balance_of(account) : 0;
}

I128 StabilityEngine::collateral() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return bank_.balance_of(address_);
}

I128 StabilityEngine::deficit_or_surplus() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return collateral::deficit_or_surplus(bank_.balance_of(address_), stable_.total_supply(),
                                          read_price());
}

std::optional<I128> StabilityEngine::buffer_unit_price() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!buffer_ || buffer_->total_supply() <= 0) return std::nullopt;

    I128 position = collateral::deficit_or_surplus(bank_.balance_of(address_),
                                                   stable_.total_supply(), read_price());
    if (position <= 0) return std::nullopt;
    return collateral::buffer_unit_price(buffer_->total_supply(), position);
}

uint64_t StabilityEngine::hook_failures() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return hook_failures_;
}

std::string StabilityEngine::last_hook_error() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return last_hook_error_;
}

I128 StabilityEngine::current_fee(I128 native_amount) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return fee_for(native_amount);
}

} // namespace depth
