#ifndef DEPTH_COLLATERAL_HPP
#define DEPTH_COLLATERAL_HPP

#include "types.hpp"

namespace depth {

// =============================================================================
// Collateral Accounting
// =============================================================================
//
// Pure functions of observable state. `collateral_native` must exclude any
// native value attached to the operation asking for the figure.

namespace collateral {

// Stable-unit value of a native amount (truncating)
I128 value_in_stable(I128 native_amount, I128 price_x18);

// Native amount worth `stable_amount` (truncating)
I128 value_in_native(I128 stable_amount, I128 price_x18);

// collateral value - stable supply. Positive = surplus, <= 0 = deficit.
I128 deficit_or_surplus(I128 collateral_native, I128 stable_total_supply, I128 price_x18);

// Buffer units per stable unit of surplus. Requires surplus_in_stable > 0.
I128 buffer_unit_price(I128 buffer_total_supply, I128 surplus_in_stable);

// Smallest bootstrap deposit (native) that clears `deficit_in_stable` and
// leaves INITIAL_COLLATERAL_RATIO_PERCENTAGE of the stable supply as surplus.
// Rounded up: depositing exactly this amount meets the ratio.
I128 minimum_bootstrap_deposit(I128 deficit_in_stable, I128 stable_total_supply, I128 price_x18);

} // namespace collateral

} // namespace depth

#endif // DEPTH_COLLATERAL_HPP
