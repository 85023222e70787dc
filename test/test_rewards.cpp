// SharePool - RewardAccumulator / RewardBook tests

#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

using namespace sharepool;
using namespace sharepool::testing;

TEST_CASE("RewardAccumulator distributes per share", "[rewards]") {
    RewardAccumulator acc;

    SECTION("Injection over outstanding shares") {
        InjectionResult r{};
        REQUIRE(acc.inject(300, 3000, &r) == errors::OK);
        REQUIRE_FALSE(r.escrowed);
        REQUIRE(r.reward_per_share_delta == PRECISION / 10);
        REQUIRE(acc.cumulative() == PRECISION / 10);
        REQUIRE(acc.ledger().total_proceeds_deposited == 300_u);
        REQUIRE(acc.escrow() == 0_u);
    }

    SECTION("Floor division forfeits the remainder") {
        REQUIRE(acc.inject(1, 3, nullptr) == errors::OK);
        REQUIRE(acc.cumulative() == PRECISION / 3);
        REQUIRE(acc.cumulative() * 3 < PRECISION);
    }

    SECTION("No shares: escrow instead of accumulator") {
        InjectionResult r{};
        REQUIRE(acc.inject(500, 0, &r) == errors::OK);
        REQUIRE(r.escrowed);
        REQUIRE(acc.cumulative() == 0_u);
        REQUIRE(acc.escrow() == 500_u);
        REQUIRE(acc.inject(250, 0) == errors::OK);
        REQUIRE(acc.escrow() == 750_u);
        REQUIRE(acc.ledger().total_proceeds_deposited == 750_u);

        REQUIRE(acc.take_escrow() == 750_u);
        REQUIRE(acc.escrow() == 0_u);
        REQUIRE(acc.ledger().total_proceeds_deposited == 750_u);
    }

    SECTION("Zero amount") {
        REQUIRE(acc.inject(0, 100) == errors::ZERO_AMOUNT);
    }

    SECTION("Accumulator overflow leaves the ledger untouched") {
        REQUIRE(acc.inject(10, 1) == errors::OK);
        PoolLedger before = acc.ledger();
        REQUIRE(acc.inject(U128(1) << 120, 1) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(acc.cumulative() == before.cumulative_reward_per_share);
        REQUIRE(acc.ledger().total_proceeds_deposited == before.total_proceeds_deposited);
    }

    SECTION("Restore from snapshot") {
        acc.inject(100, 10);
        PoolLedger snapshot = acc.ledger();
        acc.inject(100, 10);
        acc.record_paid(42);
        acc.restore(snapshot);
        REQUIRE(acc.cumulative() == snapshot.cumulative_reward_per_share);
        REQUIRE(acc.ledger().total_proceeds_paid == 0_u);
    }
}

TEST_CASE("RewardBook pending and settlement", "[rewards]") {
    RewardBook book;
    const U128 cum = 2 * PRECISION / 10;   // 0.2 per share

    SECTION("Absent accounts read as zero") {
        AccountRewardState s = book.state_of(ALICE);
        REQUIRE(s.checkpoint == 0_u);
        REQUIRE(s.locked_proceeds == 0_u);
    }

    SECTION("Pending accrues from the checkpoint") {
        book.reset_checkpoint(ALICE, PRECISION / 10);
        REQUIRE(book.pending(ALICE, 1000, cum) == 100_u);
        REQUIRE(book.pending(ALICE, 0, cum) == 0_u);
    }

    SECTION("Settle pays and resets") {
        REQUIRE(book.settle(ALICE, 1000, cum) == 200_u);
        AccountRewardState s = book.state_of(ALICE);
        REQUIRE(s.checkpoint == cum);
        REQUIRE(s.locked_proceeds == 0_u);
        REQUIRE(book.pending(ALICE, 1000, cum) == 0_u);
    }

    SECTION("Settle with nothing pending writes nothing") {
        REQUIRE(book.settle(ALICE, 0, cum) == 0_u);
        REQUIRE(book.state_of(ALICE).checkpoint == 0_u);
    }

    SECTION("Locking keeps the claimable total") {
        U128 before = book.pending(ALICE, 1000, cum);
        book.lock_accrued(ALICE, 1000, cum);
        REQUIRE(book.state_of(ALICE).locked_proceeds == 200_u);
        REQUIRE(book.state_of(ALICE).checkpoint == cum);
        // Any remaining balance now accrues from cum
        REQUIRE(book.pending(ALICE, 400, cum) == before);

        // Locked proceeds accumulate across locks
        book.lock_accrued(ALICE, 400, cum + PRECISION);
        REQUIRE(book.state_of(ALICE).locked_proceeds == 600_u);
    }
}

TEST_CASE("RewardBook undo journal", "[rewards]") {
    RewardBook book;
    book.reset_checkpoint(ALICE, 5);

    book.begin_journal();
    book.reset_checkpoint(ALICE, 9);
    book.lock_accrued(BOB, 100, PRECISION);
    book.rollback_journal();

    REQUIRE(book.state_of(ALICE).checkpoint == 5_u);
    REQUIRE(book.state_of(BOB).locked_proceeds == 0_u);
    REQUIRE(book.state_of(BOB).checkpoint == 0_u);
}
