// =============================================================================
// collateral.cpp - Surplus/Deficit Accounting
// =============================================================================

#include "depth/collateral.hpp"
#include "depth/errors.hpp"
#include "depth/wad.hpp"

namespace depth {
namespace collateral {

I128 value_in_stable(I128 native_amount, I128 price_x18) {
    return wad::mul_frac(native_amount, price_x18);
}

I128 value_in_native(I128 stable_amount, I128 price_x18) {
    return wad::div_frac(stable_amount, price_x18);
}

I128 deficit_or_surplus(I128 collateral_native, I128 stable_total_supply, I128 price_x18) {
    return value_in_stable(collateral_native, price_x18) - stable_total_supply;
}

I128 buffer_unit_price(I128 buffer_total_supply, I128 surplus_in_stable) {
    if (surplus_in_stable <= 0) {
        throw MathError("buffer unit price requires a positive surplus");
    }
    return wad::from_ratio(buffer_total_supply, surplus_in_stable);
}

I128 minimum_bootstrap_deposit(I128 deficit_in_stable, I128 stable_total_supply, I128 price_x18) {
    // Both terms round up so that depositing exactly the result always
    // reaches the ratio
    I128 deficit_in_native = wad::mul_div_up(deficit_in_stable, WAD, price_x18);

    I128 required_surplus_in_stable =
        wad::mul_div_up(stable_total_supply, INITIAL_COLLATERAL_RATIO_PERCENTAGE, 100);
    I128 required_surplus_in_native = wad::mul_div_up(required_surplus_in_stable, WAD, price_x18);

    return deficit_in_native + required_surplus_in_native;
}

} // namespace collateral
} // namespace depth
