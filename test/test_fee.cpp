// Depth Stable - Fee Policy Tests

#include <catch2/catch_test_macros.hpp>

#include "depth/errors.hpp"
#include "depth/fee.hpp"
#include "test_support.hpp"

using namespace depth;
using namespace depth::test;

TEST_CASE("FeePolicy charges nothing without a funded pool", "[fee]") {
    FeePolicy policy(3);
    REQUIRE(policy.rate_percentage() == 3);

    REQUIRE(policy.fee(units(1), false, 0) == 0);
    REQUIRE(policy.fee(units(1), true, 0) == 0);
    REQUIRE(policy.fee(units(1), true, units(2000)) == amt("0.03"));
}

TEST_CASE("FeePolicy rounds down", "[fee]") {
    FeePolicy policy(3);
    REQUIRE(policy.fee(99, true, 1) == 2);
    REQUIRE(policy.fee(33, true, 1) == 0);
}

TEST_CASE("FeePolicy never exceeds the amount", "[fee]") {
    for (uint32_t rate : {0u, 1u, 3u, 50u, 99u, 100u}) {
        FeePolicy policy(rate);
        for (I128 x : {I128(0), I128(1), I128(7), I128(101), units(1), amt("12345.678")}) {
            I128 fee = policy.fee(x, true, units(1));
            REQUIRE(fee >= 0);
            REQUIRE(fee <= x);
        }
    }

    FeePolicy full(100);
    REQUIRE(full.fee(units(5), true, units(1)) == units(5));
}

TEST_CASE("FeePolicy rejects rates above 100", "[fee]") {
    REQUIRE_NOTHROW(FeePolicy(100));
    REQUIRE_THROWS_AS(FeePolicy(101), ConfigError);
}
