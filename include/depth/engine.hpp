#ifndef DEPTH_ENGINE_HPP
#define DEPTH_ENGINE_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "fee.hpp"
#include "hooks.hpp"
#include "ledger.hpp"
#include "native.hpp"
#include "price_feed.hpp"

namespace depth {

// =============================================================================
// StabilityEngine - Stable Unit / Buffer Unit Issuance
// =============================================================================
//
// Holds native collateral at its own address in the NativeBank and issues:
//   - stable units (DUSD) at the feed price, redeemable while collateral
//     value covers the stable supply
//   - buffer units (DPC), claims on the surplus of collateral value over
//     stable supply
//
// Every mutating call is atomic: on any exception the ledgers and native
// balances are restored to their state at entry. Mutating calls made from
// inside another (e.g. from a receiver during a refund) throw
// ReentrancyError; queries stay available and see the in-progress state.

class StabilityEngine {
public:
    static constexpr const char* STABLE_NAME = "Depth Stable";
    static constexpr const char* STABLE_SYMBOL = "DUSD";
    static constexpr const char* BUFFER_NAME = "Depth Depositor Coin";
    static constexpr const char* BUFFER_SYMBOL = "DPC";

    StabilityEngine(const EngineConfig& config, const IPriceFeed& price_feed,
                    NativeBank& bank, IEngineHooks* hooks = nullptr);
    ~StabilityEngine() = default;

    // Non-copyable
    StabilityEngine(const StabilityEngine&) = delete;
    StabilityEngine& operator=(const StabilityEngine&) = delete;

    void set_hooks(IEngineHooks* hooks);

    // =========================================================================
    // Operations
    // =========================================================================

    // Escrows `native_value` from the caller and mints its stable value less
    // the fee. Returns stable units minted.
    I128 mint_stable(const Address& caller, I128 native_value);

    // Burns `amount` stable units and refunds their native value less the
    // fee. Returns native refunded.
    I128 burn_stable(const Address& caller, I128 amount);

    // Escrows `native_value` into the surplus pool. Returns buffer units minted.
    I128 deposit_buffer(const Address& caller, I128 native_value);

    // Burns `amount` buffer units for their share of the surplus. Returns
    // native refunded.
    I128 withdraw_buffer(const Address& caller, I128 amount);

    void transfer_stable(const Address& from, const Address& to, I128 amount);
    void transfer_buffer(const Address& from, const Address& to, I128 amount);

    // =========================================================================
    // Queries
    // =========================================================================

    const Address& address() const { return address_; }
    uint32_t fee_rate_percentage() const { return fee_policy_.rate_percentage(); }
    const IPriceFeed& price_feed() const { return price_feed_; }

    bool has_buffer_pool() const;

    // nullptr until the first successful bootstrap deposit
    const FungibleLedger* buffer_ledger() const;
    const FungibleLedger& stable_ledger() const { return stable_; }

    I128 stable_total_supply() const;
    I128 stable_balance_of(const Address& account) const;
    I128 buffer_total_supply() const;
    I128 buffer_balance_of(const Address& account) const;

    // Native held by the engine
    I128 collateral() const;

    // Collateral value at the current price minus stable supply
    I128 deficit_or_surplus() const;

    // Buffer units per stable unit of surplus; empty without a funded pool
    // and a positive surplus
    std::optional<I128> buffer_unit_price() const;

    // Fee that mint/burn would charge on `native_amount` right now
    I128 current_fee(I128 native_amount) const;

    // Exceptions thrown by hooks are caught after the operation has been
    // decided and counted here; they never change an operation's outcome
    uint64_t hook_failures() const;
    std::string last_hook_error() const;

private:
    using Event = std::function<void(IEngineHooks&)>;

    // Journal positions a failed operation rolls back to. No buffer
    // checkpoint means the pool did not exist at entry.
    struct Checkpoint {
        FungibleLedger::Checkpoint stable = 0;
        std::optional<FungibleLedger::Checkpoint> buffer;
        NativeBank::Checkpoint native = 0;
    };

    Address address_;
    const IPriceFeed& price_feed_;
    NativeBank& bank_;
    FeePolicy fee_policy_;

    FungibleLedger stable_;
    std::optional<FungibleLedger> buffer_;

    NullHooks null_hooks_;
    IEngineHooks* hooks_;

    mutable std::recursive_mutex mutex_;
    bool entered_{false};
    std::vector<Event> pending_events_;
    uint64_t hook_failures_{0};
    std::string last_hook_error_;

    // Runs `body` under the lock and reentrancy guard; rolls back on throw
    I128 execute(const std::string& operation, const std::function<I128()>& body);

    Checkpoint checkpoint();
    void rollback(const Checkpoint& checkpoint);
    void commit(const Checkpoint& checkpoint);

    I128 read_price() const;
    I128 fee_for(I128 native_amount) const;
    void send_refund(const Address& to, I128 amount);
    void emit(Event event);
    void deliver(const Event& event);
};

} // namespace depth

#endif // DEPTH_ENGINE_HPP
