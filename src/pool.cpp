// =============================================================================
// pool.cpp - ProceedsPool: deposits, withdrawals, proceeds distribution
// =============================================================================

#include "sharepool/pool.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace sharepool {

// =============================================================================
// OperationContext
// =============================================================================

void OperationContext::pull(const Address& from, U128 amount) {
    if (amount == 0) return;
    pulls.push_back({from, amount});
}

void OperationContext::pay(const Address& to, U128 amount) {
    if (amount == 0) return;
    for (auto& move : payouts) {
        if (move.account == to) {
            move.amount += amount;
            return;
        }
    }
    payouts.push_back({to, amount});
}

void OperationContext::emit(PoolEventKind kind, const Address& account, U128 amount,
                            const Address& counterparty, U128 cumulative, bool escrowed) {
    events.push_back({kind, account, counterparty, amount, cumulative, escrowed});
}

// =============================================================================
// OperationScope - exclusive lock + same-thread reentrancy guard
// =============================================================================

class OperationScope {
public:
    explicit OperationScope(ProceedsPool& pool) : pool_(pool) {
        if (pool_.op_thread_.load() == std::this_thread::get_id()) {
            reentrant_ = true;
            return;
        }
        lock_ = std::unique_lock<std::shared_mutex>(pool_.mutex_);
        pool_.op_thread_.store(std::this_thread::get_id());
    }

    ~OperationScope() { release(); }

    OperationScope(const OperationScope&) = delete;
    OperationScope& operator=(const OperationScope&) = delete;

    bool reentrant() const { return reentrant_; }

    void release() {
        if (lock_.owns_lock()) {
            pool_.op_thread_.store(std::thread::id{});
            lock_.unlock();
        }
    }

private:
    ProceedsPool& pool_;
    std::unique_lock<std::shared_mutex> lock_;
    bool reentrant_{false};
};

// =============================================================================
// Constructor
// =============================================================================

ProceedsPool::ProceedsPool(IAssetMover& mover, PoolConfig config)
    : mover_(mover), config_(std::move(config)) {
    claims_.set_balance_hooks(
        [this](const BalanceChange& change) { return before_balance_change(change); },
        [this](const BalanceChange& change) { after_balance_change(change); });
}

// =============================================================================
// Settlement Hook
// =============================================================================

int32_t ProceedsPool::before_balance_change(const BalanceChange& change) {
    if (!active_) {
        return errors::HOOK_FAILED;
    }

    switch (change.kind) {
        case BalanceChangeKind::MINT:
            // Freeze-then-mint: pay out what the old balance earned so the
            // new units cannot inflate past proceeds
            if (change.old_to_balance > 0) {
                settle(change.to, change.old_to_balance);
            }
            break;

        case BalanceChangeKind::BURN:
            // Withdraw settles before burning
            break;

        case BalanceChangeKind::TRANSFER:
            // Sender keeps everything accrued on the balance it is losing
            rewards_.lock_accrued(change.from, change.old_from_balance,
                                  accumulator_.cumulative());
            // Receiver is paid on its pre-transfer balance
            settle(change.to, change.old_to_balance);
            break;
    }
    return errors::OK;
}

void ProceedsPool::after_balance_change(const BalanceChange& change) {
    if (change.kind == BalanceChangeKind::MINT ||
        change.kind == BalanceChangeKind::TRANSFER) {
        rewards_.reset_checkpoint(change.to, accumulator_.cumulative());
    }
}

void ProceedsPool::settle(const Address& account, U128 balance) {
    U128 owed = rewards_.settle(account, balance, accumulator_.cumulative());
    if (owed == 0) {
        return;
    }
    accumulator_.record_paid(owed);
    active_->pay(account, owed);
    active_->emit(PoolEventKind::PROCEEDS_CLAIMED, account, owed);
}

// =============================================================================
// Asset Moves
// =============================================================================

namespace {

// A mover that throws is treated as having rejected the move
int32_t try_pull(IAssetMover& mover, const Address& from, U128 amount) {
    try {
        return mover.pull(from, amount);
    } catch (const std::exception&) {
        return errors::TRANSFER_FAILED;
    }
}

int32_t try_push(IAssetMover& mover, const Address& to, U128 amount) {
    try {
        return mover.push(to, amount);
    } catch (const std::exception&) {
        return errors::TRANSFER_FAILED;
    }
}

} // anonymous namespace

// =============================================================================
// Operation Lifecycle
// =============================================================================

void ProceedsPool::begin(OperationContext& ctx) {
    ctx.ledger_snapshot = accumulator_.ledger();
    claims_.begin_journal();
    rewards_.begin_journal();
    active_ = &ctx;
}

void ProceedsPool::rollback(OperationContext& ctx) {
    claims_.rollback_journal();
    rewards_.rollback_journal();
    accumulator_.restore(ctx.ledger_snapshot);
    ctx.events.clear();
    active_ = nullptr;
    total_failed_.fetch_add(1, std::memory_order_relaxed);
}

int32_t ProceedsPool::finish(OperationContext& ctx, int32_t rc) {
    if (rc == errors::OK) {
        rc = execute_moves(ctx);
    }
    if (rc != errors::OK) {
        rollback(ctx);
        return rc;
    }

    claims_.commit_journal();
    rewards_.commit_journal();
    active_ = nullptr;

    for (const auto& event : ctx.events) {
        if (event.kind == PoolEventKind::PROCEEDS_CLAIMED) {
            total_settlements_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    return errors::OK;
}

int32_t ProceedsPool::execute_moves(const OperationContext& ctx) {
    size_t pulled = 0;
    size_t paid = 0;
    int32_t rc = errors::OK;

    for (; pulled < ctx.pulls.size(); ++pulled) {
        const auto& move = ctx.pulls[pulled];
        if (try_pull(mover_, move.account, move.amount) != errors::OK) {
            rc = errors::TRANSFER_FAILED;
            break;
        }
    }
    if (rc == errors::OK) {
        for (; paid < ctx.payouts.size(); ++paid) {
            const auto& move = ctx.payouts[paid];
            if (try_push(mover_, move.account, move.amount) != errors::OK) {
                rc = errors::TRANSFER_FAILED;
                break;
            }
        }
    }
    if (rc == errors::OK) {
        return rc;
    }

    // Compensate completed moves in reverse order
    while (paid > 0) {
        const auto& move = ctx.payouts[--paid];
        if (try_pull(mover_, move.account, move.amount) != errors::OK) {
            rc = errors::ROLLBACK_FAILED;
        }
    }
    while (pulled > 0) {
        const auto& move = ctx.pulls[--pulled];
        if (try_push(mover_, move.account, move.amount) != errors::OK) {
            rc = errors::ROLLBACK_FAILED;
        }
    }
    return rc;
}

void ProceedsPool::notify(const std::vector<PoolEvent>& events) {
    PoolListener* listener = nullptr;
    {
        std::shared_lock lock(mutex_);
        listener = listener_;
    }
    if (!listener) return;
    for (const auto& event : events) {
        dispatch(*listener, event);
    }
}

// =============================================================================
// Deposit / Withdraw
// =============================================================================

int32_t ProceedsPool::deposit(const Address& caller, U128 amount) {
    if (is_zero_address(caller)) {
        return errors::ZERO_ADDRESS;
    }
    if (amount == 0) {
        return errors::ZERO_AMOUNT;
    }

    OperationScope scope(*this);
    if (scope.reentrant()) {
        return errors::REENTRANCY;
    }

    OperationContext ctx;
    begin(ctx);

    bool first_depositor_bonus = claims_.total_supply() == 0 && accumulator_.escrow() > 0;
    U128 bonus = 0;

    ctx.pull(caller, amount);
    int32_t rc = claims_.mint(caller, amount);
    if (rc == errors::OK) {
        ctx.emit(PoolEventKind::DEPOSIT, caller, amount);
        if (first_depositor_bonus) {
            bonus = accumulator_.take_escrow();
            accumulator_.record_paid(bonus);
            ctx.pay(caller, bonus);
            ctx.emit(PoolEventKind::FIRST_DEPOSITOR_BONUS, caller, bonus);
        }
    }

    rc = finish(ctx, rc);
    if (rc == errors::OK) {
        total_deposits_.fetch_add(1, std::memory_order_relaxed);
        total_bonus_paid_ += bonus;
    }
    scope.release();

    notify(ctx.events);
    return rc;
}

int32_t ProceedsPool::withdraw(const Address& caller, U128 amount) {
    if (is_zero_address(caller)) {
        return errors::ZERO_ADDRESS;
    }
    if (amount == 0) {
        return errors::ZERO_AMOUNT;
    }

    OperationScope scope(*this);
    if (scope.reentrant()) {
        return errors::REENTRANCY;
    }

    U128 balance = claims_.balance_of(caller);
    if (amount > balance) {
        return errors::INSUFFICIENT_BALANCE;
    }

    OperationContext ctx;
    begin(ctx);

    // Leaves zero pending behind, whatever remains of the balance
    settle(caller, balance);

    int32_t rc = claims_.burn(caller, amount);
    if (rc == errors::OK) {
        ctx.pay(caller, amount);
        ctx.emit(PoolEventKind::WITHDRAW, caller, amount);
    }

    rc = finish(ctx, rc);
    if (rc == errors::OK) {
        total_withdrawals_.fetch_add(1, std::memory_order_relaxed);
    }
    scope.release();

    notify(ctx.events);
    return rc;
}

// =============================================================================
// Proceeds
// =============================================================================

int32_t ProceedsPool::deposit_proceeds(const Address& caller, U128 amount) {
    if (is_zero_address(caller)) {
        return errors::ZERO_ADDRESS;
    }
    if (amount == 0) {
        return errors::ZERO_AMOUNT;
    }
    if (caller != config_.admin) {
        return errors::UNAUTHORIZED;
    }

    OperationScope scope(*this);
    if (scope.reentrant()) {
        return errors::REENTRANCY;
    }

    OperationContext ctx;
    begin(ctx);

    ctx.pull(caller, amount);
    InjectionResult injection{};
    int32_t rc = accumulator_.inject(amount, claims_.total_supply(), &injection);
    if (rc == errors::OK) {
        ctx.emit(PoolEventKind::PROCEEDS_DEPOSITED, caller, amount, ZERO_ADDRESS,
                 accumulator_.cumulative(), injection.escrowed);
    }

    rc = finish(ctx, rc);
    if (rc == errors::OK) {
        total_injections_.fetch_add(1, std::memory_order_relaxed);
    }
    scope.release();

    notify(ctx.events);
    return rc;
}

int32_t ProceedsPool::claim_proceeds(const Address& caller) {
    if (is_zero_address(caller)) {
        return errors::ZERO_ADDRESS;
    }

    OperationScope scope(*this);
    if (scope.reentrant()) {
        return errors::REENTRANCY;
    }

    OperationContext ctx;
    begin(ctx);
    settle(caller, claims_.balance_of(caller));
    int32_t rc = finish(ctx, errors::OK);
    scope.release();

    notify(ctx.events);
    return rc;
}

// =============================================================================
// Claim Unit Transfers
// =============================================================================

int32_t ProceedsPool::transfer(const Address& from, const Address& to, U128 amount) {
    if (is_zero_address(from) || is_zero_address(to)) {
        return errors::ZERO_ADDRESS;
    }
    if (amount == 0) {
        return errors::ZERO_AMOUNT;
    }

    OperationScope scope(*this);
    if (scope.reentrant()) {
        return errors::REENTRANCY;
    }
    if (amount > claims_.balance_of(from)) {
        return errors::INSUFFICIENT_BALANCE;
    }

    OperationContext ctx;
    begin(ctx);

    // Self-transfer moves nothing and is not reported
    int32_t rc = claims_.transfer(from, to, amount);
    if (rc == errors::OK && from != to) {
        ctx.emit(PoolEventKind::TRANSFER, from, amount, to);
    }

    rc = finish(ctx, rc);
    if (rc == errors::OK && from != to) {
        total_transfers_.fetch_add(1, std::memory_order_relaxed);
    }
    scope.release();

    notify(ctx.events);
    return rc;
}

int32_t ProceedsPool::approve(const Address& owner, const Address& spender, U128 amount) {
    OperationScope scope(*this);
    if (scope.reentrant()) {
        return errors::REENTRANCY;
    }
    return claims_.approve(owner, spender, amount);
}

int32_t ProceedsPool::transfer_from(const Address& spender, const Address& from,
                                    const Address& to, U128 amount) {
    if (is_zero_address(spender) || is_zero_address(from) || is_zero_address(to)) {
        return errors::ZERO_ADDRESS;
    }
    if (amount == 0) {
        return errors::ZERO_AMOUNT;
    }

    OperationScope scope(*this);
    if (scope.reentrant()) {
        return errors::REENTRANCY;
    }
    if (amount > claims_.allowance(from, spender)) {
        return errors::INSUFFICIENT_ALLOWANCE;
    }
    if (amount > claims_.balance_of(from)) {
        return errors::INSUFFICIENT_BALANCE;
    }

    OperationContext ctx;
    begin(ctx);

    int32_t rc = claims_.transfer_from(spender, from, to, amount);
    if (rc == errors::OK && from != to) {
        ctx.emit(PoolEventKind::TRANSFER, from, amount, to);
    }

    rc = finish(ctx, rc);
    if (rc == errors::OK && from != to) {
        total_transfers_.fetch_add(1, std::memory_order_relaxed);
    }
    scope.release();

    notify(ctx.events);
    return rc;
}

// =============================================================================
// Queries
// =============================================================================

U128 ProceedsPool::pending_proceeds(const Address& account) const {
    std::shared_lock lock(mutex_);
    return rewards_.pending(account, claims_.balance_of(account), accumulator_.cumulative());
}

ContractInfo ProceedsPool::contract_info() const {
    std::shared_lock lock(mutex_);
    const PoolLedger& ledger = accumulator_.ledger();
    return ContractInfo{
        claims_.total_supply(),
        mover_.custody_balance(),
        ledger.total_proceeds_deposited,
        ledger.pending_zero_supply_proceeds,
        ledger.cumulative_reward_per_share,
        ledger.total_proceeds_paid
    };
}

UserInfo ProceedsPool::user_info(const Address& account) const {
    std::shared_lock lock(mutex_);
    U128 balance = claims_.balance_of(account);
    AccountRewardState state = rewards_.state_of(account);
    return UserInfo{
        balance,
        rewards_.pending(account, balance, accumulator_.cumulative()),
        state.checkpoint,
        state.locked_proceeds
    };
}

U128 ProceedsPool::balance_of(const Address& account) const {
    std::shared_lock lock(mutex_);
    return claims_.balance_of(account);
}

U128 ProceedsPool::allowance(const Address& owner, const Address& spender) const {
    std::shared_lock lock(mutex_);
    return claims_.allowance(owner, spender);
}

U128 ProceedsPool::total_shares() const {
    std::shared_lock lock(mutex_);
    return claims_.total_supply();
}

// =============================================================================
// Events / Statistics
// =============================================================================

void ProceedsPool::set_listener(PoolListener* listener) {
    std::unique_lock lock(mutex_);
    listener_ = listener;
}

ProceedsPool::Stats ProceedsPool::get_stats() const {
    std::shared_lock lock(mutex_);
    return Stats{
        total_deposits_.load(std::memory_order_relaxed),
        total_withdrawals_.load(std::memory_order_relaxed),
        total_injections_.load(std::memory_order_relaxed),
        total_settlements_.load(std::memory_order_relaxed),
        total_transfers_.load(std::memory_order_relaxed),
        total_failed_.load(std::memory_order_relaxed),
        static_cast<uint64_t>(claims_.holder_count()),
        total_bonus_paid_
    };
}

} // namespace sharepool
