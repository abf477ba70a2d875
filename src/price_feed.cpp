// =============================================================================
// price_feed.cpp - ManualPriceFeed Implementation
// =============================================================================

#include "depth/price_feed.hpp"
#include "depth/errors.hpp"
#include "depth/wad.hpp"

namespace depth {

ManualPriceFeed::ManualPriceFeed(const Address& owner, I128 initial_price_x18)
    : owner_(owner)
    , price_x18_(initial_price_x18) {
    if (initial_price_x18 <= 0) {
        throw PriceFeedError("price feed: initial price must be positive");
    }
}

I128 ManualPriceFeed::current_price() const {
    return price_x18_.load();
}

void ManualPriceFeed::set_price(const Address& sender, I128 price_x18) {
    if (sender != owner_) {
        throw UnauthorizedError("price feed: only " + addresses::to_hex(owner_) + " may set the price");
    }
    if (price_x18 <= 0) {
        throw PriceFeedError("price feed: price must be positive, got " + wad::to_string(price_x18));
    }
    price_x18_.store(price_x18);
    updates_.fetch_add(1);
}

} // namespace depth
