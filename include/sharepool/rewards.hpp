#ifndef SHAREPOOL_REWARDS_HPP
#define SHAREPOOL_REWARDS_HPP

#include <unordered_map>
#include <optional>
#include <vector>

#include "types.hpp"

namespace sharepool {

// =============================================================================
// Pool Ledger (global reward state)
// =============================================================================

struct PoolLedger {
    U128 cumulative_reward_per_share;    // scaled by PRECISION, never decreases
    U128 total_proceeds_deposited;       // lifetime proceeds injected
    U128 pending_zero_supply_proceeds;   // escrow for the next first depositor
    U128 total_proceeds_paid;            // lifetime settlements + bonuses paid
};

// =============================================================================
// Account Reward State
// =============================================================================

struct AccountRewardState {
    U128 checkpoint;        // accumulator value at last settlement
    U128 locked_proceeds;   // owed from balances no longer held
};

// =============================================================================
// RewardAccumulator
// =============================================================================

struct InjectionResult {
    U128 reward_per_share_delta;   // 0 when escrowed
    bool escrowed;                 // no shares existed; amount went to escrow
};

class RewardAccumulator {
public:
    RewardAccumulator() = default;

    const PoolLedger& ledger() const { return ledger_; }
    U128 cumulative() const { return ledger_.cumulative_reward_per_share; }
    U128 escrow() const { return ledger_.pending_zero_supply_proceeds; }

    // Distribute `amount` over `total_shares`, or escrow it when there are
    // none. Floor division: up to total_shares-1 units of PRECISION-scaled
    // dust are forfeited per call. Leaves the ledger untouched on failure.
    int32_t inject(U128 amount, U128 total_shares, InjectionResult* result = nullptr);

    // Drain the zero-supply escrow, returning what it held
    U128 take_escrow();

    void record_paid(U128 amount);

    void restore(const PoolLedger& snapshot) { ledger_ = snapshot; }

private:
    PoolLedger ledger_{};
};

// =============================================================================
// RewardBook - Per-account checkpoints and locked proceeds
// =============================================================================

// Absent accounts read as a zero record. Not internally synchronized.
class RewardBook {
public:
    RewardBook() = default;

    // Non-copyable
    RewardBook(const RewardBook&) = delete;
    RewardBook& operator=(const RewardBook&) = delete;

    AccountRewardState state_of(const Address& account) const;

    // (cumulative - checkpoint) * balance / PRECISION
    static U128 accrued(const AccountRewardState& state, U128 balance, U128 cumulative);

    // locked + accrued
    U128 pending(const Address& account, U128 balance, U128 cumulative) const;

    // Zero pending is a no-op returning 0. Otherwise raises the checkpoint to
    // `cumulative`, clears locked proceeds and returns the amount owed.
    U128 settle(const Address& account, U128 balance, U128 cumulative);

    // Detach what `old_balance` has accrued into locked proceeds and restart
    // accrual at `cumulative`. Claimable total is unchanged.
    void lock_accrued(const Address& account, U128 old_balance, U128 cumulative);

    // Fresh start: units held from now on earn nothing retroactively
    void reset_checkpoint(const Address& account, U128 cumulative);

    // =========================================================================
    // Undo Journal
    // =========================================================================

    void begin_journal();
    void commit_journal();
    void rollback_journal();

private:
    struct JournalEntry {
        Address account;
        std::optional<AccountRewardState> old_state;   // nullopt = absent
    };

    std::unordered_map<Address, AccountRewardState, AddressHash> states_;

    bool journaling_{false};
    std::vector<JournalEntry> journal_;

    AccountRewardState& mutable_state(const Address& account);
};

} // namespace sharepool

#endif // SHAREPOOL_REWARDS_HPP
