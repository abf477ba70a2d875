// =============================================================================
// types.cpp - Address Formatting and Error Descriptions
// =============================================================================

#include "depth/types.hpp"
#include "depth/errors.hpp"
#include "depth/wad.hpp"

namespace depth {

namespace addresses {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Errors
// =============================================================================

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                          return "ok";
        case ErrorCode::DEFICIT:                     return "deficit";
        case ErrorCode::INSUFFICIENT_BOOTSTRAP:      return "insufficient_bootstrap_collateral";
        case ErrorCode::NO_SURPLUS_TO_WITHDRAW:      return "no_surplus_to_withdraw";
        case ErrorCode::INSUFFICIENT_BUFFER_BALANCE: return "insufficient_buffer_balance";
        case ErrorCode::REFUND_TRANSFER_FAILED:      return "refund_transfer_failed";
        case ErrorCode::INVALID_AMOUNT:              return "invalid_amount";
        case ErrorCode::INSUFFICIENT_BALANCE:        return "insufficient_balance";
        case ErrorCode::BUFFER_POOL_MISSING:         return "buffer_pool_missing";
        case ErrorCode::INVALID_PRICE:               return "invalid_price";
        case ErrorCode::REENTRANCY:                  return "reentrancy";
        case ErrorCode::UNAUTHORIZED:                return "unauthorized";
        case ErrorCode::MATH:                        return "math";
        case ErrorCode::CONFIG:                      return "config";
    }
    return "unknown";
}

DeficitError::DeficitError(I128 deficit)
    : StabilityError(ErrorCode::DEFICIT,
                     "cannot burn while in deficit (deficit " + wad::to_string(deficit) + ")")
    , deficit_(deficit) {}

InsufficientBootstrapCollateral::InsufficientBootstrapCollateral(I128 deposited, I128 minimum_deposit)
    : StabilityError(ErrorCode::INSUFFICIENT_BOOTSTRAP,
                     "initial collateral ratio not met: deposited " + wad::to_string(deposited) +
                     ", minimum " + wad::to_string(minimum_deposit))
    , deposited_(deposited)
    , minimum_deposit_(minimum_deposit) {}

NoSurplusToWithdraw::NoSurplusToWithdraw(I128 deficit_or_surplus)
    : StabilityError(ErrorCode::NO_SURPLUS_TO_WITHDRAW,
                     "no depositor funds to withdraw (surplus " + wad::to_string(deficit_or_surplus) + ")") {}

InsufficientBufferBalance::InsufficientBufferBalance(I128 requested, I128 available)
    : StabilityError(ErrorCode::INSUFFICIENT_BUFFER_BALANCE,
                     "insufficient buffer balance: requested " + wad::to_string(requested) +
                     ", available " + wad::to_string(available)) {}

RefundTransferError::RefundTransferError(const Address& recipient, I128 amount)
    : StabilityError(ErrorCode::REFUND_TRANSFER_FAILED,
                     "refund of " + wad::to_string(amount) + " to " +
                     addresses::to_hex(recipient) + " was rejected") {}

InsufficientBalanceError::InsufficientBalanceError(const std::string& asset, I128 requested, I128 available)
    : StabilityError(ErrorCode::INSUFFICIENT_BALANCE,
                     "insufficient " + asset + " balance: requested " + wad::to_string(requested) +
                     ", available " + wad::to_string(available)) {}

} // namespace depth
