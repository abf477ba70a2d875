#ifndef DEPTH_PRICE_FEED_HPP
#define DEPTH_PRICE_FEED_HPP

#include <atomic>
#include <cstdint>

#include "types.hpp"

namespace depth {

// =============================================================================
// Price Feed Interface
// =============================================================================

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    // Stable units per whole native unit, as a Wad
    virtual I128 current_price() const = 0;
};

// =============================================================================
// ManualPriceFeed - Owner-Updated Price
// =============================================================================

class ManualPriceFeed : public IPriceFeed {
public:
    ManualPriceFeed(const Address& owner, I128 initial_price_x18);

    I128 current_price() const override;

    // Only the owner may update. Throws UnauthorizedError or PriceFeedError.
    void set_price(const Address& sender, I128 price_x18);

    const Address& owner() const { return owner_; }
    uint64_t updates() const { return updates_.load(); }

private:
    Address owner_;
    std::atomic<I128> price_x18_;
    std::atomic<uint64_t> updates_{0};
};

} // namespace depth

#endif // DEPTH_PRICE_FEED_HPP
