// =============================================================================
// claim_ledger.cpp - Claim unit balances with settlement hooks
// =============================================================================

#include "sharepool/claim_ledger.hpp"
#include "sharepool/math.hpp"

#include <utility>

namespace sharepool {

void ClaimLedger::set_balance_hooks(BeforeBalanceChange before, AfterBalanceChange after) {
    before_hook_ = std::move(before);
    after_hook_ = std::move(after);
}

int32_t ClaimLedger::run_before(const BalanceChange& change) {
    return before_hook_ ? before_hook_(change) : errors::OK;
}

void ClaimLedger::run_after(const BalanceChange& change) {
    if (after_hook_) after_hook_(change);
}

// =============================================================================
// Mint / Burn
// =============================================================================

int32_t ClaimLedger::mint(const Address& to, U128 amount) {
    if (is_zero_address(to)) {
        return errors::ZERO_ADDRESS;
    }
    if (amount == 0) {
        return errors::ZERO_AMOUNT;
    }

    U128 old_to = balance_of(to);
    auto supply = checked_add(total_supply_, amount);
    if (!supply) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    BalanceChange change{BalanceChangeKind::MINT, ZERO_ADDRESS, to, amount, 0, old_to};
    int32_t rc = run_before(change);
    if (rc != errors::OK) {
        return rc;
    }

    set_total_supply(*supply);
    set_balance(to, old_to + amount);  // old_to <= total supply

    run_after(change);
    return errors::OK;
}

int32_t ClaimLedger::burn(const Address& from, U128 amount) {
    if (is_zero_address(from)) {
        return errors::ZERO_ADDRESS;
    }
    if (amount == 0) {
        return errors::ZERO_AMOUNT;
    }

    U128 old_from = balance_of(from);
    if (old_from < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    BalanceChange change{BalanceChangeKind::BURN, from, ZERO_ADDRESS, amount, old_from, 0};
    int32_t rc = run_before(change);
    if (rc != errors::OK) {
        return rc;
    }

    set_balance(from, old_from - amount);
    set_total_supply(total_supply_ - amount);

    run_after(change);
    return errors::OK;
}

// =============================================================================
// Transfers
// =============================================================================

int32_t ClaimLedger::transfer(const Address& from, const Address& to, U128 amount) {
    if (is_zero_address(from) || is_zero_address(to)) {
        return errors::ZERO_ADDRESS;
    }
    if (amount == 0) {
        return errors::ZERO_AMOUNT;
    }

    U128 old_from = balance_of(from);
    if (old_from < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    // Self-transfer moves nothing
    if (from == to) {
        return errors::OK;
    }

    U128 old_to = balance_of(to);
    BalanceChange change{BalanceChangeKind::TRANSFER, from, to, amount, old_from, old_to};
    int32_t rc = run_before(change);
    if (rc != errors::OK) {
        return rc;
    }

    set_balance(from, old_from - amount);
    set_balance(to, old_to + amount);

    run_after(change);
    return errors::OK;
}

int32_t ClaimLedger::approve(const Address& owner, const Address& spender, U128 amount) {
    if (is_zero_address(owner) || is_zero_address(spender)) {
        return errors::ZERO_ADDRESS;
    }
    set_allowance(owner, spender, amount);
    return errors::OK;
}

int32_t ClaimLedger::transfer_from(const Address& spender, const Address& from,
                                   const Address& to, U128 amount) {
    if (is_zero_address(spender)) {
        return errors::ZERO_ADDRESS;
    }

    U128 allowed = allowance(from, spender);
    if (allowed < amount) {
        return errors::INSUFFICIENT_ALLOWANCE;
    }

    int32_t rc = transfer(from, to, amount);
    if (rc != errors::OK) {
        return rc;
    }

    // Self-transfer spends nothing
    if (allowed != U128_MAX && from != to) {
        set_allowance(from, spender, allowed - amount);
    }
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

U128 ClaimLedger::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : 0;
}

U128 ClaimLedger::allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find(AllowanceKey{owner, spender});
    return it != allowances_.end() ? it->second : 0;
}

size_t ClaimLedger::holder_count() const {
    size_t n = 0;
    for (const auto& [account, balance] : balances_) {
        if (balance > 0) ++n;
    }
    return n;
}

// =============================================================================
// Journaled Writes
// =============================================================================

void ClaimLedger::set_balance(const Address& account, U128 value) {
    U128& slot = balances_[account];
    if (journaling_) {
        journal_.push_back({EntryKind::BALANCE, account, ZERO_ADDRESS, slot});
    }
    slot = value;
}

void ClaimLedger::set_allowance(const Address& owner, const Address& spender, U128 value) {
    U128& slot = allowances_[AllowanceKey{owner, spender}];
    if (journaling_) {
        journal_.push_back({EntryKind::ALLOWANCE, owner, spender, slot});
    }
    slot = value;
}

void ClaimLedger::set_total_supply(U128 value) {
    if (journaling_) {
        journal_.push_back({EntryKind::SUPPLY, ZERO_ADDRESS, ZERO_ADDRESS, total_supply_});
    }
    total_supply_ = value;
}

void ClaimLedger::begin_journal() {
    journal_.clear();
    journaling_ = true;
}

void ClaimLedger::commit_journal() {
    journal_.clear();
    journaling_ = false;
}

void ClaimLedger::rollback_journal() {
    for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
        switch (it->kind) {
            case EntryKind::BALANCE:
                balances_[it->a] = it->old_value;
                break;
            case EntryKind::ALLOWANCE:
                allowances_[AllowanceKey{it->a, it->b}] = it->old_value;
                break;
            case EntryKind::SUPPLY:
                total_supply_ = it->old_value;
                break;
        }
    }
    journal_.clear();
    journaling_ = false;
}

} // namespace sharepool
