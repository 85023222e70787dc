// =============================================================================
// rewards.cpp - Reward-per-share accumulator and per-account settlement
// =============================================================================

#include "sharepool/rewards.hpp"
#include "sharepool/math.hpp"

namespace sharepool {

// =============================================================================
// RewardAccumulator
// =============================================================================

int32_t RewardAccumulator::inject(U128 amount, U128 total_shares, InjectionResult* result) {
    if (amount == 0) {
        return errors::ZERO_AMOUNT;
    }

    auto total = checked_add(ledger_.total_proceeds_deposited, amount);
    if (!total) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    if (total_shares == 0) {
        // Escrow is bounded by total_proceeds_deposited
        ledger_.pending_zero_supply_proceeds += amount;
        ledger_.total_proceeds_deposited = *total;
        if (result) *result = InjectionResult{0, true};
        return errors::OK;
    }

    auto delta = checked_mul_div(amount, PRECISION, total_shares);
    if (!delta) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    auto cumulative = checked_add(ledger_.cumulative_reward_per_share, *delta);
    if (!cumulative) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    ledger_.cumulative_reward_per_share = *cumulative;
    ledger_.total_proceeds_deposited = *total;
    if (result) *result = InjectionResult{*delta, false};
    return errors::OK;
}

U128 RewardAccumulator::take_escrow() {
    U128 amount = ledger_.pending_zero_supply_proceeds;
    ledger_.pending_zero_supply_proceeds = 0;
    return amount;
}

void RewardAccumulator::record_paid(U128 amount) {
    ledger_.total_proceeds_paid += amount;
}

// =============================================================================
// RewardBook
// =============================================================================

AccountRewardState RewardBook::state_of(const Address& account) const {
    auto it = states_.find(account);
    return it != states_.end() ? it->second : AccountRewardState{};
}

U128 RewardBook::accrued(const AccountRewardState& state, U128 balance, U128 cumulative) {
    if (balance == 0 || cumulative <= state.checkpoint) return 0;
    // Bounded by proceeds deposited, so the quotient fits
    return mul_div(cumulative - state.checkpoint, balance, PRECISION);
}

U128 RewardBook::pending(const Address& account, U128 balance, U128 cumulative) const {
    AccountRewardState state = state_of(account);
    return state.locked_proceeds + accrued(state, balance, cumulative);
}

U128 RewardBook::settle(const Address& account, U128 balance, U128 cumulative) {
    U128 owed = pending(account, balance, cumulative);
    if (owed == 0) {
        return 0;
    }

    AccountRewardState& state = mutable_state(account);
    state.checkpoint = cumulative;
    state.locked_proceeds = 0;
    return owed;
}

void RewardBook::lock_accrued(const Address& account, U128 old_balance, U128 cumulative) {
    AccountRewardState& state = mutable_state(account);
    state.locked_proceeds += accrued(state, old_balance, cumulative);
    state.checkpoint = cumulative;
}

void RewardBook::reset_checkpoint(const Address& account, U128 cumulative) {
    mutable_state(account).checkpoint = cumulative;
}

AccountRewardState& RewardBook::mutable_state(const Address& account) {
    auto it = states_.find(account);
    if (journaling_) {
        journal_.push_back({account, it != states_.end()
                                         ? std::optional<AccountRewardState>(it->second)
                                         : std::nullopt});
    }
    if (it != states_.end()) return it->second;
    return states_[account];
}

// =============================================================================
// Undo Journal
// =============================================================================

void RewardBook::begin_journal() {
    journal_.clear();
    journaling_ = true;
}

void RewardBook::commit_journal() {
    journal_.clear();
    journaling_ = false;
}

void RewardBook::rollback_journal() {
    for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
        if (it->old_state) {
            states_[it->account] = *it->old_state;
        } else {
            states_.erase(it->account);
        }
    }
    journal_.clear();
    journaling_ = false;
}

} // namespace sharepool
