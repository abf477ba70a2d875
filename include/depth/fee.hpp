#ifndef DEPTH_FEE_HPP
#define DEPTH_FEE_HPP

#include <cstdint>

#include "types.hpp"

namespace depth {

// =============================================================================
// FeePolicy - Mint/Burn Fee
// =============================================================================
//
// Zero until the buffer pool exists and has supply, so early minters are not
// charged for a pool nobody funds. Otherwise rate% of the native amount,
// rounded down.

class FeePolicy {
public:
    // Throws ConfigError if the rate exceeds MAX_FEE_RATE_PERCENTAGE
    explicit FeePolicy(uint32_t fee_rate_percentage);

    uint32_t rate_percentage() const { return fee_rate_percentage_; }

    I128 fee(I128 native_amount, bool buffer_pool_exists, I128 buffer_supply) const;

private:
    uint32_t fee_rate_percentage_;
};

} // namespace depth

#endif // DEPTH_FEE_HPP
