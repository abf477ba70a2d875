// Depth Stable - Native Bank Tests

#include <catch2/catch_test_macros.hpp>

#include "depth/errors.hpp"
#include "depth/native.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace depth;
using namespace depth::test;

namespace {

class RecordingReceiver : public IReceiver {
public:
    explicit RecordingReceiver(bool accept) : accept_(accept) {}

    bool on_receive(const Address& from, I128 amount) override {
        ++calls;
        last_from = from;
        last_amount = amount;
        return accept_;
    }

    int calls = 0;
    Address last_from{};
    I128 last_amount = 0;

private:
    bool accept_;
};

class ThrowingReceiver : public IReceiver {
public:
    bool on_receive(const Address&, I128) override {
        throw std::runtime_error("receiver failure");
    }
};

// Spends what it receives before rejecting
class SpendingReceiver : public IReceiver {
public:
    SpendingReceiver(NativeBank& bank, const Address& self) : bank_(bank), self_(self) {}

    bool on_receive(const Address&, I128 amount) override {
        observed_balance = bank_.balance_of(self_);
        bank_.transfer(self_, CAROL, amount);
        return false;
    }

    I128 observed_balance = 0;

private:
    NativeBank& bank_;
    Address self_;
};

}  // namespace

TEST_CASE("NativeBank funding and transfers", "[native]") {
    NativeBank bank;
    bank.fund(ALICE, units(10));
    REQUIRE(bank.balance_of(ALICE) == units(10));
    REQUIRE(bank.total_issued() == units(10));

    SECTION("Funding must be positive") {
        REQUIRE_THROWS_AS(bank.fund(ALICE, 0), InvalidAmountError);
    }

    SECTION("Transfer moves value") {
        bank.transfer(ALICE, BOB, units(4));
        REQUIRE(bank.balance_of(ALICE) == units(6));
        REQUIRE(bank.balance_of(BOB) == units(4));
        REQUIRE(bank.total_issued() == units(10));
    }

    SECTION("Overdraft fails") {
        REQUIRE_THROWS_AS(bank.transfer(ALICE, BOB, units(11)), InsufficientBalanceError);
        REQUIRE(bank.balance_of(ALICE) == units(10));
    }
}

TEST_CASE("NativeBank send consults the receiver", "[native]") {
    NativeBank bank;
    bank.fund(ALICE, units(10));

    SECTION("No receiver always accepts") {
        REQUIRE(bank.send(ALICE, BOB, units(1)));
        REQUIRE(bank.balance_of(BOB) == units(1));
    }

    SECTION("Accepting receiver sees the delivery") {
        RecordingReceiver receiver(true);
        bank.set_receiver(BOB, &receiver);

        REQUIRE(bank.send(ALICE, BOB, units(2)));
        REQUIRE(receiver.calls == 1);
        REQUIRE(receiver.last_from == ALICE);
        REQUIRE(receiver.last_amount == units(2));
        REQUIRE(bank.balance_of(BOB) == units(2));
    }

    SECTION("Rejecting receiver undoes the delivery") {
        RecordingReceiver receiver(false);
        bank.set_receiver(BOB, &receiver);

        REQUIRE_FALSE(bank.send(ALICE, BOB, units(2)));
        REQUIRE(receiver.calls == 1);
        REQUIRE(bank.balance_of(ALICE) == units(10));
        REQUIRE(bank.balance_of(BOB) == 0);
    }

    SECTION("Throwing receiver counts as a rejection") {
        ThrowingReceiver receiver;
        bank.set_receiver(BOB, &receiver);

        REQUIRE_FALSE(bank.send(ALICE, BOB, units(2)));
        REQUIRE(bank.balance_of(ALICE) == units(10));
    }

    SECTION("Changes made by a rejecting receiver are rolled back") {
        SpendingReceiver receiver(bank, BOB);
        bank.set_receiver(BOB, &receiver);

        REQUIRE_FALSE(bank.send(ALICE, BOB, units(3)));
        REQUIRE(receiver.observed_balance == units(3));
        REQUIRE(bank.balance_of(CAROL) == 0);
        REQUIRE(bank.balance_of(BOB) == 0);
        REQUIRE(bank.balance_of(ALICE) == units(10));
    }

    SECTION("Removing the receiver") {
        RecordingReceiver receiver(false);
        bank.set_receiver(BOB, &receiver);
        bank.set_receiver(BOB, nullptr);

        REQUIRE(bank.send(ALICE, BOB, units(1)));
        REQUIRE(receiver.calls == 0);
    }

    SECTION("Send without funds throws before any receiver runs") {
        RecordingReceiver receiver(true);
        bank.set_receiver(CAROL, &receiver);

        REQUIRE_THROWS_AS(bank.send(BOB, CAROL, units(1)), InsufficientBalanceError);
        REQUIRE(receiver.calls == 0);
    }
}

TEST_CASE("NativeBank checkpoints", "[native]") {
    NativeBank bank;
    bank.fund(ALICE, units(3));
    auto saved = bank.checkpoint();

    bank.fund(BOB, units(1));
    bank.transfer(ALICE, BOB, units(2));

    bank.rollback(saved);
    REQUIRE(bank.balance_of(ALICE) == units(3));
    REQUIRE(bank.balance_of(BOB) == 0);
    REQUIRE(bank.total_issued() == units(3));

    SECTION("A rejected send inside an open checkpoint only undoes itself") {
        class Rejecting : public IReceiver {
        public:
            bool on_receive(const Address&, I128) override { return false; }
        } rejecting;
        bank.set_receiver(CAROL, &rejecting);

        auto outer = bank.checkpoint();
        bank.transfer(ALICE, BOB, units(1));
        REQUIRE_FALSE(bank.send(ALICE, CAROL, units(1)));
        REQUIRE(bank.balance_of(BOB) == units(1));
        REQUIRE(bank.balance_of(ALICE) == units(2));
        bank.commit(outer);
        REQUIRE(bank.balance_of(BOB) == units(1));
    }
}
