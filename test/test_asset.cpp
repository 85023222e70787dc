// SharePool - AssetToken / TokenMover tests

#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

using namespace sharepool;
using namespace sharepool::testing;

TEST_CASE("AssetToken balances and transfers", "[asset]") {
    AssetToken token("USDX");
    REQUIRE(token.symbol() == "USDX");
    REQUIRE(token.mint(ALICE, 1000) == errors::OK);
    REQUIRE(token.total_supply() == 1000_u);

    SECTION("Plain transfer") {
        REQUIRE(token.transfer(ALICE, BOB, 400) == errors::OK);
        REQUIRE(token.balance_of(ALICE) == 600_u);
        REQUIRE(token.balance_of(BOB) == 400_u);
    }

    SECTION("Insufficient balance leaves balances unchanged") {
        REQUIRE(token.transfer(ALICE, BOB, 1001) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(token.balance_of(ALICE) == 1000_u);
        REQUIRE(token.balance_of(BOB) == 0_u);
    }

    SECTION("Zero address is rejected") {
        REQUIRE(token.transfer(ALICE, ZERO_ADDRESS, 1) == errors::ZERO_ADDRESS);
        REQUIRE(token.mint(ZERO_ADDRESS, 1) == errors::ZERO_ADDRESS);
    }

    SECTION("Frozen accounts cannot send or receive") {
        token.set_frozen(BOB, true);
        REQUIRE(token.is_frozen(BOB));
        REQUIRE(token.transfer(ALICE, BOB, 1) == errors::TRANSFER_FAILED);
        token.set_frozen(BOB, false);
        REQUIRE(token.transfer(ALICE, BOB, 1) == errors::OK);
    }

    SECTION("Supply overflow") {
        REQUIRE(token.mint(BOB, U128_MAX) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(token.total_supply() == 1000_u);
    }
}

TEST_CASE("AssetToken allowances", "[asset]") {
    AssetToken token;
    token.mint(ALICE, 1000);

    SECTION("transfer_from spends allowance") {
        REQUIRE(token.approve(ALICE, BOB, 300) == errors::OK);
        REQUIRE(token.transfer_from(BOB, ALICE, CAROL, 200) == errors::OK);
        REQUIRE(token.allowance(ALICE, BOB) == 100_u);
        REQUIRE(token.balance_of(CAROL) == 200_u);

        REQUIRE(token.transfer_from(BOB, ALICE, CAROL, 101) == errors::INSUFFICIENT_ALLOWANCE);
        REQUIRE(token.allowance(ALICE, BOB) == 100_u);
    }

    SECTION("Unlimited allowance is never decremented") {
        token.approve(ALICE, BOB, U128_MAX);
        REQUIRE(token.transfer_from(BOB, ALICE, CAROL, 500) == errors::OK);
        REQUIRE(token.allowance(ALICE, BOB) == U128_MAX);
    }

    SECTION("Failed transfer keeps allowance") {
        token.approve(ALICE, BOB, 5000);
        REQUIRE(token.transfer_from(BOB, ALICE, CAROL, 2000) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(token.allowance(ALICE, BOB) == 5000_u);
    }
}

TEST_CASE("TokenMover moves through custody", "[asset]") {
    AssetToken token;
    TokenMover mover(token, DEFAULT_CUSTODY);
    token.mint(ALICE, 1000);

    SECTION("Pull requires an allowance for the custody account") {
        REQUIRE(mover.pull(ALICE, 100) == errors::TRANSFER_FAILED);

        token.approve(ALICE, DEFAULT_CUSTODY, 100);
        REQUIRE(mover.pull(ALICE, 100) == errors::OK);
        REQUIRE(mover.custody_balance() == 100_u);
        REQUIRE(token.balance_of(ALICE) == 900_u);
    }

    SECTION("Push pays out of custody") {
        token.approve(ALICE, DEFAULT_CUSTODY, U128_MAX);
        REQUIRE(mover.pull(ALICE, 500) == errors::OK);
        REQUIRE(mover.push(BOB, 200) == errors::OK);
        REQUIRE(token.balance_of(BOB) == 200_u);
        REQUIRE(mover.custody_balance() == 300_u);

        // More than custody holds
        REQUIRE(mover.push(BOB, 301) == errors::TRANSFER_FAILED);
        REQUIRE(mover.custody_balance() == 300_u);
    }
}
