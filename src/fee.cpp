// =============================================================================
// fee.cpp - FeePolicy Implementation
// =============================================================================

#include "depth/fee.hpp"
#include "depth/errors.hpp"

#include <string>

namespace depth {

FeePolicy::FeePolicy(uint32_t fee_rate_percentage)
    : fee_rate_percentage_(fee_rate_percentage) {
    if (fee_rate_percentage > MAX_FEE_RATE_PERCENTAGE) {
        throw ConfigError("fee rate percentage must be within 0-100, got " +
                          std::to_string(fee_rate_percentage));
    }
}

I128 FeePolicy::fee(I128 native_amount, bool buffer_pool_exists, I128 buffer_supply) const {
    if (!buffer_pool_exists || buffer_supply <= 0) return 0;
    if (native_amount <= 0) return 0;
    return static_cast<I128>(fee_rate_percentage_) * native_amount / 100;
}

} // namespace depth
