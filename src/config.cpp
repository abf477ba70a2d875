// =============================================================================
// config.cpp - Configuration Loading
// =============================================================================

#include "depth/config.hpp"
#include "depth/errors.hpp"
#include "depth/wad.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace depth {

using json = nlohmann::json;

namespace {

I128 parse_amount(const json& value, const std::string& field) {
    try {
        if (value.is_string()) return wad::parse(value.get<std::string>());
        if (value.is_number()) return wad::parse(value.dump());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(field + ": " + e.what());
    } catch (const std::out_of_range& e) {
        throw ConfigError(field + ": " + e.what());
    }
    throw ConfigError(field + ": expected a decimal string or number");
}

Address parse_address(const json& value, const std::string& field) {
    if (!value.is_string()) {
        throw ConfigError(field + ": expected a hex address string");
    }
    auto addr = addresses::from_hex(value.get<std::string>());
    if (!addr) {
        throw ConfigError(field + ": invalid address '" + value.get<std::string>() + "'");
    }
    return *addr;
}

bool is_known_log_level(const std::string& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(std::string(content));
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config root must be an object");
    }

    Config config;

    try {
        if (root.contains("general")) {
            const auto& general = root.at("general");
            if (general.contains("log_level")) {
                config.general.log_level = general.at("log_level").get<std::string>();
            }
        }

        if (root.contains("engine")) {
            const auto& engine = root.at("engine");
            if (engine.contains("fee_rate_percentage")) {
                auto rate = engine.at("fee_rate_percentage").get<int64_t>();
                if (rate < 0 || rate > MAX_FEE_RATE_PERCENTAGE) {
                    throw ConfigError("engine.fee_rate_percentage must be within 0-100");
                }
                config.engine.fee_rate_percentage = static_cast<uint32_t>(rate);
            }
            if (engine.contains("engine_address")) {
                config.engine.engine_address =
                    parse_address(engine.at("engine_address"), "engine.engine_address");
            }
            if (engine.contains("price_feed_owner")) {
                config.engine.price_feed_owner =
                    parse_address(engine.at("price_feed_owner"), "engine.price_feed_owner");
            }
            if (engine.contains("initial_price")) {
                config.engine.initial_price_x18 =
                    parse_amount(engine.at("initial_price"), "engine.initial_price");
            }
            if (engine.contains("genesis")) {
                for (const auto& entry : engine.at("genesis")) {
                    GenesisAllocation alloc;
                    alloc.account = parse_address(entry.at("account"), "engine.genesis.account");
                    alloc.amount = parse_amount(entry.at("amount"), "engine.genesis.amount");
                    config.engine.genesis.push_back(alloc);
                }
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config: ") + e.what());
    }

    config.validate();
    return config;
}

std::string Config::to_json() const {
    json genesis = json::array();
    for (const auto& alloc : engine.genesis) {
        genesis.push_back(json{
            {"account", addresses::to_hex(alloc.account)},
            {"amount", wad::to_string(alloc.amount)}
        });
    }

    json root = {
        {"general", {{"log_level", general.log_level}}},
        {"engine", {
            {"fee_rate_percentage", engine.fee_rate_percentage},
            {"engine_address", addresses::to_hex(engine.engine_address)},
            {"price_feed_owner", addresses::to_hex(engine.price_feed_owner)},
            {"initial_price", wad::to_string(engine.initial_price_x18)},
            {"genesis", genesis}
        }}
    };
    return root.dump(2);
}

void Config::validate() const {
    if (!is_known_log_level(general.log_level)) {
        throw ConfigError("general.log_level must be one of debug, info, warn, error; got '" +
                          general.log_level + "'");
    }
    if (engine.fee_rate_percentage > MAX_FEE_RATE_PERCENTAGE) {
        throw ConfigError("engine.fee_rate_percentage must be within 0-100");
    }
    if (addresses::is_zero(engine.engine_address)) {
        throw ConfigError("engine.engine_address must not be the zero address");
    }
    if (engine.initial_price_x18 <= 0) {
        throw ConfigError("engine.initial_price must be positive");
    }
    for (const auto& alloc : engine.genesis) {
        if (alloc.amount < 0) {
            throw ConfigError("engine.genesis amount for " + addresses::to_hex(alloc.account) +
                              " must not be negative");
        }
    }
}

} // namespace depth
