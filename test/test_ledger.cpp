// Depth Stable - Fungible Ledger Tests

#include <catch2/catch_test_macros.hpp>

#include "depth/errors.hpp"
#include "depth/ledger.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace depth;
using namespace depth::test;

TEST_CASE("FungibleLedger mint and burn", "[ledger]") {
    FungibleLedger ledger("Depth Stable", "DUSD");
    REQUIRE(ledger.symbol() == "DUSD");
    REQUIRE(ledger.decimals() == 18);

    ledger.mint(ALICE, units(100));
    ledger.mint(BOB, units(50));
    REQUIRE(ledger.total_supply() == units(150));
    REQUIRE(ledger.balance_of(ALICE) == units(100));
    REQUIRE(ledger.holders() == 2);

    SECTION("Burn reduces balance and supply") {
        ledger.burn(ALICE, units(40));
        REQUIRE(ledger.balance_of(ALICE) == units(60));
        REQUIRE(ledger.total_supply() == units(110));
    }

    SECTION("Burning a whole balance drops the holder") {
        ledger.burn(BOB, units(50));
        REQUIRE(ledger.balance_of(BOB) == 0);
        REQUIRE(ledger.holders() == 1);
    }

    SECTION("Overdraft leaves the ledger untouched") {
        REQUIRE_THROWS_AS(ledger.burn(BOB, units(51)), InsufficientBalanceError);
        REQUIRE(ledger.balance_of(BOB) == units(50));
        REQUIRE(ledger.total_supply() == units(150));
    }

    SECTION("Negative amounts are rejected") {
        REQUIRE_THROWS_AS(ledger.mint(ALICE, -1), InvalidAmountError);
        REQUIRE_THROWS_AS(ledger.burn(ALICE, -1), InvalidAmountError);
        REQUIRE_THROWS_AS(ledger.transfer(ALICE, BOB, -1), InvalidAmountError);
    }
}

TEST_CASE("FungibleLedger transfers", "[ledger]") {
    FungibleLedger ledger("Depth Depositor Coin", "DPC");
    ledger.mint(ALICE, units(10));

    SECTION("Transfer moves balance without changing supply") {
        ledger.transfer(ALICE, BOB, units(3));
        REQUIRE(ledger.balance_of(ALICE) == units(7));
        REQUIRE(ledger.balance_of(BOB) == units(3));
        REQUIRE(ledger.total_supply() == units(10));
    }

    SECTION("Transfer beyond balance fails") {
        REQUIRE_THROWS_AS(ledger.transfer(ALICE, BOB, units(11)), InsufficientBalanceError);
        REQUIRE(ledger.balance_of(BOB) == 0);
    }

    SECTION("Allowance gates transfer_from") {
        ledger.approve(ALICE, BOB, units(4));
        REQUIRE(ledger.allowance(ALICE, BOB) == units(4));

        ledger.transfer_from(BOB, ALICE, CAROL, units(3));
        REQUIRE(ledger.balance_of(CAROL) == units(3));
        REQUIRE(ledger.allowance(ALICE, BOB) == units(1));

        REQUIRE_THROWS_AS(ledger.transfer_from(BOB, ALICE, CAROL, units(2)),
                          InsufficientBalanceError);
        REQUIRE(ledger.balance_of(CAROL) == units(3));
        REQUIRE(ledger.allowance(ALICE, BOB) == units(1));
    }

    SECTION("Approving zero clears the allowance") {
        ledger.approve(ALICE, BOB, units(4));
        ledger.approve(ALICE, BOB, 0);
        REQUIRE(ledger.allowance(ALICE, BOB) == 0);
    }
}

TEST_CASE("FungibleLedger checkpoints", "[ledger]") {
    FungibleLedger ledger("Depth Stable", "DUSD");
    ledger.mint(ALICE, units(5));
    ledger.approve(ALICE, BOB, units(1));

    auto saved = ledger.checkpoint();
    REQUIRE(ledger.open_checkpoints() == 1);

    ledger.mint(BOB, units(7));
    ledger.burn(ALICE, units(5));
    ledger.approve(ALICE, BOB, 0);
    ledger.approve(BOB, CAROL, units(2));

    SECTION("Rollback undoes every change since the checkpoint") {
        ledger.rollback(saved);
        REQUIRE(ledger.open_checkpoints() == 0);
        REQUIRE(ledger.total_supply() == units(5));
        REQUIRE(ledger.balance_of(ALICE) == units(5));
        REQUIRE(ledger.balance_of(BOB) == 0);
        REQUIRE(ledger.holders() == 1);
        REQUIRE(ledger.allowance(ALICE, BOB) == units(1));
        REQUIRE(ledger.allowance(BOB, CAROL) == 0);
    }

    SECTION("Commit keeps the changes") {
        ledger.commit(saved);
        REQUIRE(ledger.open_checkpoints() == 0);
        REQUIRE(ledger.total_supply() == units(7));
        REQUIRE(ledger.balance_of(BOB) == units(7));
        REQUIRE(ledger.allowance(ALICE, BOB) == 0);
    }

    SECTION("A committed inner checkpoint is undone by the outer rollback") {
        auto inner = ledger.checkpoint();
        ledger.transfer(BOB, CAROL, units(3));
        ledger.commit(inner);
        REQUIRE(ledger.balance_of(CAROL) == units(3));

        ledger.rollback(saved);
        REQUIRE(ledger.balance_of(CAROL) == 0);
        REQUIRE(ledger.balance_of(BOB) == 0);
        REQUIRE(ledger.total_supply() == units(5));
    }

    SECTION("An inner rollback leaves earlier changes in place") {
        auto inner = ledger.checkpoint();
        ledger.transfer(BOB, CAROL, units(3));
        ledger.rollback(inner);
        REQUIRE(ledger.balance_of(BOB) == units(7));
        REQUIRE(ledger.balance_of(CAROL) == 0);
        REQUIRE(ledger.open_checkpoints() == 1);
        ledger.commit(saved);
    }
}

TEST_CASE("FungibleLedger rejects closing an unopened checkpoint", "[ledger]") {
    FungibleLedger ledger("Depth Stable", "DUSD");
    REQUIRE_THROWS_AS(ledger.commit(0), std::logic_error);
}

TEST_CASE("FungibleLedger supply equals the sum of balances", "[ledger]") {
    FungibleLedger ledger("Depth Stable", "DUSD");
    const Address accounts[] = {ALICE, BOB, CAROL};

    for (int round = 1; round <= 20; ++round) {
        const Address& from = accounts[round % 3];
        const Address& to = accounts[(round + 1) % 3];
        ledger.mint(from, units(round));
        ledger.transfer(from, to, units(round) / 2);
        if (round % 4 == 0) {
            ledger.burn(to, ledger.balance_of(to) / 3);
        }

        I128 sum = 0;
        for (const auto& account : accounts) {
            REQUIRE(ledger.balance_of(account) >= 0);
            sum += ledger.balance_of(account);
        }
        REQUIRE(sum == ledger.total_supply());
    }
}
