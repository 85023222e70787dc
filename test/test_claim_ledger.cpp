// SharePool - ClaimLedger tests

#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

#include <vector>

using namespace sharepool;
using namespace sharepool::testing;

namespace {

struct HookTrace {
    std::vector<BalanceChange> before;
    std::vector<BalanceChange> after;
    // balance of `to` as seen from inside the after hook
    std::vector<U128> to_balance_after;
};

void attach(ClaimLedger& ledger, HookTrace& trace, int32_t verdict = errors::OK) {
    ledger.set_balance_hooks(
        [&trace, verdict](const BalanceChange& c) {
            trace.before.push_back(c);
            return verdict;
        },
        [&trace, &ledger](const BalanceChange& c) {
            trace.after.push_back(c);
            trace.to_balance_after.push_back(ledger.balance_of(c.to));
        });
}

}  // namespace

TEST_CASE("ClaimLedger mint and burn", "[ledger]") {
    ClaimLedger ledger;
    HookTrace trace;
    attach(ledger, trace);

    REQUIRE(ledger.mint(ALICE, 1000) == errors::OK);
    REQUIRE(ledger.balance_of(ALICE) == 1000_u);
    REQUIRE(ledger.total_supply() == 1000_u);

    SECTION("Mint passes old balances to both hook phases") {
        REQUIRE(ledger.mint(ALICE, 500) == errors::OK);
        REQUIRE(trace.before.size() == 2);
        const BalanceChange& c = trace.before.back();
        REQUIRE(c.kind == BalanceChangeKind::MINT);
        REQUIRE(is_zero_address(c.from));
        REQUIRE(c.to == ALICE);
        REQUIRE(c.amount == 500_u);
        REQUIRE(c.old_to_balance == 1000_u);
        REQUIRE(trace.to_balance_after.back() == 1500_u);
    }

    SECTION("Burn") {
        REQUIRE(ledger.burn(ALICE, 400) == errors::OK);
        REQUIRE(ledger.balance_of(ALICE) == 600_u);
        REQUIRE(ledger.total_supply() == 600_u);
        REQUIRE(trace.before.back().kind == BalanceChangeKind::BURN);
        REQUIRE(trace.before.back().old_from_balance == 1000_u);
    }

    SECTION("Validation happens before hooks") {
        size_t calls = trace.before.size();
        REQUIRE(ledger.burn(ALICE, 1001) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(ledger.mint(ALICE, 0) == errors::ZERO_AMOUNT);
        REQUIRE(ledger.mint(ZERO_ADDRESS, 5) == errors::ZERO_ADDRESS);
        REQUIRE(ledger.mint(ALICE, U128_MAX) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(trace.before.size() == calls);
    }
}

TEST_CASE("ClaimLedger transfers", "[ledger]") {
    ClaimLedger ledger;
    HookTrace trace;
    attach(ledger, trace);
    ledger.mint(ALICE, 1000);
    ledger.mint(BOB, 200);

    SECTION("Transfer reports pre-transfer balances") {
        REQUIRE(ledger.transfer(ALICE, BOB, 300) == errors::OK);
        const BalanceChange& c = trace.before.back();
        REQUIRE(c.kind == BalanceChangeKind::TRANSFER);
        REQUIRE(c.old_from_balance == 1000_u);
        REQUIRE(c.old_to_balance == 200_u);
        REQUIRE(ledger.balance_of(ALICE) == 700_u);
        REQUIRE(ledger.balance_of(BOB) == 500_u);
        REQUIRE(ledger.total_supply() == 1200_u);
    }

    SECTION("Self-transfer is a no-op without hooks") {
        size_t calls = trace.before.size();
        REQUIRE(ledger.transfer(ALICE, ALICE, 10) == errors::OK);
        REQUIRE(ledger.balance_of(ALICE) == 1000_u);
        REQUIRE(trace.before.size() == calls);
    }

    SECTION("transfer_from spends allowance") {
        REQUIRE(ledger.approve(ALICE, CAROL, 250) == errors::OK);
        REQUIRE(ledger.transfer_from(CAROL, ALICE, DAVE, 300) == errors::INSUFFICIENT_ALLOWANCE);
        REQUIRE(ledger.transfer_from(CAROL, ALICE, DAVE, 200) == errors::OK);
        REQUIRE(ledger.allowance(ALICE, CAROL) == 50_u);
        REQUIRE(ledger.balance_of(DAVE) == 200_u);
        REQUIRE(ledger.holder_count() == 3);
    }
}

TEST_CASE("ClaimLedger hook veto leaves balances untouched", "[ledger]") {
    ClaimLedger ledger;
    ledger.mint(ALICE, 1000);

    HookTrace trace;
    attach(ledger, trace, errors::TRANSFER_FAILED);

    REQUIRE(ledger.transfer(ALICE, BOB, 100) == errors::TRANSFER_FAILED);
    REQUIRE(ledger.mint(BOB, 100) == errors::TRANSFER_FAILED);
    REQUIRE(ledger.balance_of(ALICE) == 1000_u);
    REQUIRE(ledger.balance_of(BOB) == 0_u);
    REQUIRE(ledger.total_supply() == 1000_u);
    REQUIRE(trace.after.empty());
}

TEST_CASE("ClaimLedger undo journal", "[ledger]") {
    ClaimLedger ledger;
    ledger.mint(ALICE, 1000);
    ledger.approve(ALICE, CAROL, 500);

    ledger.begin_journal();
    REQUIRE(ledger.journaling());
    ledger.mint(BOB, 70);
    ledger.transfer_from(CAROL, ALICE, BOB, 300);
    ledger.burn(ALICE, 100);

    SECTION("Rollback restores every write") {
        ledger.rollback_journal();
        REQUIRE_FALSE(ledger.journaling());
        REQUIRE(ledger.balance_of(ALICE) == 1000_u);
        REQUIRE(ledger.balance_of(BOB) == 0_u);
        REQUIRE(ledger.allowance(ALICE, CAROL) == 500_u);
        REQUIRE(ledger.total_supply() == 1000_u);
    }

    SECTION("Commit keeps them") {
        ledger.commit_journal();
        REQUIRE(ledger.balance_of(ALICE) == 600_u);
        REQUIRE(ledger.balance_of(BOB) == 370_u);
        REQUIRE(ledger.allowance(ALICE, CAROL) == 200_u);
        REQUIRE(ledger.total_supply() == 970_u);

        // A later rollback has nothing to undo
        ledger.rollback_journal();
        REQUIRE(ledger.balance_of(BOB) == 370_u);
    }
}
