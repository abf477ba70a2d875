#ifndef DEPTH_TYPES_HPP
#define DEPTH_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>
#include <optional>

namespace depth {

// =============================================================================
// Addresses (EVM-style 20-byte account identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Reserved system addresses (0x...DE0x series)
constexpr Address ZERO             = {};
constexpr Address STABILITY_ENGINE = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xDE,0x01};
constexpr Address PRICE_FEED       = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xDE,0x02};

// Address whose low 8 bytes hold `id` (big-endian). Used for test and
// simulator accounts.
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// "0x" followed by 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts 40 hex digits with or without the 0x prefix
std::optional<Address> from_hex(std::string_view hex);

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (auto b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Fixed-Point Amounts (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// All three assets (native, stable, buffer) use 18 decimals
constexpr uint8_t DECIMALS = 18;

constexpr I128 WAD = 1000000000000000000LL;  // 1e18

// Whole units to base units
constexpr I128 units(int64_t whole) {
    return static_cast<I128>(whole) * WAD;
}

// =============================================================================
// Protocol Constants
// =============================================================================

// Minimum surplus, as % of stable supply, required to bootstrap the buffer pool
constexpr uint32_t INITIAL_COLLATERAL_RATIO_PERCENTAGE = 10;

constexpr uint32_t MAX_FEE_RATE_PERCENTAGE = 100;

} // namespace depth

#endif // DEPTH_TYPES_HPP
