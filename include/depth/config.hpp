#ifndef DEPTH_CONFIG_HPP
#define DEPTH_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace depth {

// =============================================================================
// Configuration
// =============================================================================

// General settings
struct GeneralConfig {
    std::string log_level = "info";  // debug, info, warn, error
};

// Native value credited to an account when the simulator starts
struct GenesisAllocation {
    Address account{};
    I128 amount = 0;
};

// Engine settings
struct EngineConfig {
    uint32_t fee_rate_percentage = 0;
    Address engine_address = addresses::STABILITY_ENGINE;
    Address price_feed_owner = addresses::PRICE_FEED;
    I128 initial_price_x18 = WAD;
    std::vector<GenesisAllocation> genesis;
};

class Config {
public:
    GeneralConfig general;
    EngineConfig engine;

    Config() = default;

    // Load from JSON file
    static Config from_file(std::string_view path);

    // Load from JSON string. Amounts and prices are decimal strings
    // ("4000", "0.5") or JSON numbers; addresses are 0x-prefixed hex.
    static Config from_json(std::string_view content);

    // Serialize back to the from_json format
    std::string to_json() const;

    // Throws ConfigError on an unknown log level, a fee rate above 100,
    // a non-positive price, a zero engine address or a negative allocation
    void validate() const;

    // Builder methods
    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& set_fee_rate(uint32_t percentage) {
        engine.fee_rate_percentage = percentage;
        return *this;
    }

    Config& set_engine_address(const Address& addr) {
        engine.engine_address = addr;
        return *this;
    }

    Config& set_price_feed_owner(const Address& owner) {
        engine.price_feed_owner = owner;
        return *this;
    }

    Config& set_initial_price(I128 price_x18) {
        engine.initial_price_x18 = price_x18;
        return *this;
    }

    Config& with_genesis(const Address& account, I128 amount) {
        engine.genesis.push_back({account, amount});
        return *this;
    }
};

} // namespace depth

#endif // DEPTH_CONFIG_HPP
