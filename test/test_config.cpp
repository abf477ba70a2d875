// Depth Stable - Configuration Tests

#include <catch2/catch_test_macros.hpp>

#include "depth/config.hpp"
#include "depth/errors.hpp"
#include "test_support.hpp"

using namespace depth;
using namespace depth::test;

TEST_CASE("Config defaults", "[config]") {
    Config config;
    REQUIRE(config.general.log_level == "info");
    REQUIRE(config.engine.fee_rate_percentage == 0);
    REQUIRE(config.engine.engine_address == addresses::STABILITY_ENGINE);
    REQUIRE(config.engine.price_feed_owner == addresses::PRICE_FEED);
    REQUIRE(config.engine.initial_price_x18 == WAD);
    REQUIRE(config.engine.genesis.empty());
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config builder", "[config]") {
    Config config;
    config.set_log_level("debug")
          .set_fee_rate(3)
          .set_initial_price(units(4000))
          .with_genesis(ALICE, units(10));

    REQUIRE(config.general.log_level == "debug");
    REQUIRE(config.engine.fee_rate_percentage == 3);
    REQUIRE(config.engine.initial_price_x18 == units(4000));
    REQUIRE(config.engine.genesis.size() == 1);
    REQUIRE(config.engine.genesis[0].account == ALICE);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config from JSON", "[config]") {
    const char* content = R"({
        "general": {"log_level": "warn"},
        "engine": {
            "fee_rate_percentage": 3,
            "engine_address": "0x00000000000000000000000000000000000000aa",
            "initial_price": "4000",
            "genesis": [
                {"account": "0x0000000000000000000000000000000000000001", "amount": "10"},
                {"account": "0x0000000000000000000000000000000000000002", "amount": 0.5}
            ]
        }
    })";

    Config config = Config::from_json(content);
    REQUIRE(config.general.log_level == "warn");
    REQUIRE(config.engine.fee_rate_percentage == 3);
    REQUIRE(config.engine.engine_address == addresses::from_id(0xaa));
    REQUIRE(config.engine.initial_price_x18 == units(4000));
    REQUIRE(config.engine.genesis.size() == 2);
    REQUIRE(config.engine.genesis[0].account == ALICE);
    REQUIRE(config.engine.genesis[0].amount == units(10));
    REQUIRE(config.engine.genesis[1].account == BOB);
    REQUIRE(config.engine.genesis[1].amount == amt("0.5"));

    SECTION("Serialized form loads back") {
        Config reloaded = Config::from_json(config.to_json());
        REQUIRE(reloaded.engine.fee_rate_percentage == 3);
        REQUIRE(reloaded.engine.initial_price_x18 == units(4000));
        REQUIRE(reloaded.engine.genesis.size() == 2);
        REQUIRE(reloaded.engine.genesis[1].amount == amt("0.5"));
    }
}

TEST_CASE("Config sections are optional", "[config]") {
    Config config = Config::from_json("{}");
    REQUIRE(config.general.log_level == "info");
    REQUIRE(config.engine.fee_rate_percentage == 0);
}

TEST_CASE("Config rejects invalid input", "[config]") {
    REQUIRE_THROWS_AS(Config::from_json("not json"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json("[]"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"general": {"log_level": "loud"}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"engine": {"fee_rate_percentage": 101}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"engine": {"fee_rate_percentage": -1}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"engine": {"fee_rate_percentage": "three"}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"engine": {"engine_address": "0x1234"}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(
        R"({"engine": {"engine_address": "0x0000000000000000000000000000000000000000"}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"engine": {"initial_price": "0"}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"engine": {"initial_price": "abc"}})"), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(
        R"({"engine": {"genesis": [{"account": "0x0000000000000000000000000000000000000001", "amount": "-1"}]}})"),
        ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(R"({"engine": {"genesis": [{"amount": "1"}]}})"), ConfigError);
}

TEST_CASE("Config from a missing file", "[config]") {
    REQUIRE_THROWS_AS(Config::from_file("/nonexistent/depthstable.json"), ConfigError);
}
