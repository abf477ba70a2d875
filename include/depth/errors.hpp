#ifndef DEPTH_ERRORS_HPP
#define DEPTH_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace depth {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    OK                          = 0,
    DEFICIT                     = -1,
    INSUFFICIENT_BOOTSTRAP      = -2,
    NO_SURPLUS_TO_WITHDRAW      = -3,
    INSUFFICIENT_BUFFER_BALANCE = -4,
    REFUND_TRANSFER_FAILED      = -5,
    INVALID_AMOUNT              = -10,
    INSUFFICIENT_BALANCE        = -11,
    BUFFER_POOL_MISSING         = -12,
    INVALID_PRICE               = -20,
    REENTRANCY                  = -30,
    UNAUTHORIZED                = -40,
    MATH                        = -50,
    CONFIG                      = -60
};

const char* to_string(ErrorCode code);

// =============================================================================
// Exceptions
// =============================================================================

// Base for every failure raised by the engine and its collaborators
class StabilityError : public std::runtime_error {
public:
    StabilityError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Redemption attempted while collateral value is below stable supply
class DeficitError : public StabilityError {
public:
    explicit DeficitError(I128 deficit);

    I128 deficit() const noexcept { return deficit_; }

private:
    I128 deficit_;
};

// Deposit too small to clear the deficit plus the initial collateral ratio.
// minimum_deposit() is the smallest attached value that would succeed.
class InsufficientBootstrapCollateral : public StabilityError {
public:
    InsufficientBootstrapCollateral(I128 deposited, I128 minimum_deposit);

    I128 deposited() const noexcept { return deposited_; }
    I128 minimum_deposit() const noexcept { return minimum_deposit_; }

private:
    I128 deposited_;
    I128 minimum_deposit_;
};

class NoSurplusToWithdraw : public StabilityError {
public:
    explicit NoSurplusToWithdraw(I128 deficit_or_surplus);
};

class InsufficientBufferBalance : public StabilityError {
public:
    InsufficientBufferBalance(I128 requested, I128 available);
};

class RefundTransferError : public StabilityError {
public:
    RefundTransferError(const Address& recipient, I128 amount);
};

class InvalidAmountError : public StabilityError {
public:
    explicit InvalidAmountError(const std::string& msg)
        : StabilityError(ErrorCode::INVALID_AMOUNT, msg) {}
};

// Ledger or native overdraft
class InsufficientBalanceError : public StabilityError {
public:
    InsufficientBalanceError(const std::string& asset, I128 requested, I128 available);
};

// Surplus-branch operation on an engine whose buffer pool was never bootstrapped
class BufferPoolMissingError : public StabilityError {
public:
    BufferPoolMissingError()
        : StabilityError(ErrorCode::BUFFER_POOL_MISSING,
                         "buffer pool has not been bootstrapped") {}
};

class ReentrancyError : public StabilityError {
public:
    ReentrancyError()
        : StabilityError(ErrorCode::REENTRANCY,
                         "StabilityEngine: already entered (reentrancy)") {}
};

class PriceFeedError : public StabilityError {
public:
    explicit PriceFeedError(const std::string& msg)
        : StabilityError(ErrorCode::INVALID_PRICE, msg) {}
};

class UnauthorizedError : public StabilityError {
public:
    explicit UnauthorizedError(const std::string& msg)
        : StabilityError(ErrorCode::UNAUTHORIZED, msg) {}
};

// Overflow or division by zero in fixed-point arithmetic
class MathError : public StabilityError {
public:
    explicit MathError(const std::string& msg)
        : StabilityError(ErrorCode::MATH, msg) {}
};

class ConfigError : public StabilityError {
public:
    explicit ConfigError(const std::string& msg)
        : StabilityError(ErrorCode::CONFIG, msg) {}
};

} // namespace depth

#endif // DEPTH_ERRORS_HPP
