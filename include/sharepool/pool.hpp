#ifndef SHAREPOOL_POOL_HPP
#define SHAREPOOL_POOL_HPP

#include <atomic>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "types.hpp"
#include "asset.hpp"
#include "claim_ledger.hpp"
#include "rewards.hpp"
#include "events.hpp"
#include "config.hpp"

namespace sharepool {

// =============================================================================
// Query Results
// =============================================================================

struct ContractInfo {
    U128 total_shares;
    U128 total_underlying;               // custody balance reported by the mover
    U128 total_proceeds_deposited;
    U128 pending_zero_supply_proceeds;
    U128 cumulative_reward_per_share;
    U128 total_proceeds_paid;
};

struct UserInfo {
    U128 balance;
    U128 pending_proceeds;
    U128 checkpoint;
    U128 locked_proceeds;
};

// =============================================================================
// Operation Context (explicit accounting state for one mutating call)
// =============================================================================

// Asset moves are queued here and executed when the operation commits:
// pulls first, then payouts coalesced per recipient. Events are buffered so
// listeners only ever see committed operations.
struct OperationContext {
    struct Move {
        Address account;
        U128 amount;
    };

    std::vector<Move> pulls;
    std::vector<Move> payouts;
    std::vector<PoolEvent> events;
    PoolLedger ledger_snapshot{};

    void pull(const Address& from, U128 amount);
    void pay(const Address& to, U128 amount);
    void emit(PoolEventKind kind, const Address& account, U128 amount,
              const Address& counterparty = ZERO_ADDRESS,
              U128 cumulative = 0, bool escrowed = false);
};

// =============================================================================
// ProceedsPool - Share pool with proportional proceeds distribution
// =============================================================================

// Every mutating call is all-or-nothing and serialized per pool. Calls made
// back into the same pool from inside an IAssetMover callback fail with
// errors::REENTRANCY; queries must not be made from such callbacks.
class ProceedsPool {
public:
    ProceedsPool(IAssetMover& mover, PoolConfig config = {});
    ~ProceedsPool() = default;

    // Non-copyable
    ProceedsPool(const ProceedsPool&) = delete;
    ProceedsPool& operator=(const ProceedsPool&) = delete;

    // =========================================================================
    // Pool Operations
    // =========================================================================

    // Pull `amount` underlying, mint `amount` claim units 1:1. The first
    // depositor after an escrowed injection also receives the escrow.
    int32_t deposit(const Address& caller, U128 amount);

    // Settle pending proceeds, burn `amount` units, pay `amount` underlying
    int32_t withdraw(const Address& caller, U128 amount);

    // Privileged: distribute `amount` over current shares
    int32_t deposit_proceeds(const Address& caller, U128 amount);

    // Pay pending proceeds; nothing pending is a silent no-op
    int32_t claim_proceeds(const Address& caller);

    // =========================================================================
    // Claim Unit Transfers
    // =========================================================================

    int32_t transfer(const Address& from, const Address& to, U128 amount);
    int32_t approve(const Address& owner, const Address& spender, U128 amount);
    int32_t transfer_from(const Address& spender, const Address& from,
                          const Address& to, U128 amount);

    // =========================================================================
    // Queries
    // =========================================================================

    U128 pending_proceeds(const Address& account) const;
    ContractInfo contract_info() const;
    UserInfo user_info(const Address& account) const;

    U128 balance_of(const Address& account) const;
    U128 allowance(const Address& owner, const Address& spender) const;
    U128 total_shares() const;

    const PoolConfig& config() const { return config_; }

    // =========================================================================
    // Events
    // =========================================================================

    // Listener is not owned; pass nullptr to detach
    void set_listener(PoolListener* listener);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_deposits;
        uint64_t total_withdrawals;
        uint64_t total_injections;
        uint64_t total_settlements;      // non-zero proceeds payouts
        uint64_t total_transfers;
        uint64_t total_failed;           // operations rolled back
        uint64_t holders;
        U128 total_bonus_paid;
    };
    Stats get_stats() const;

private:
    IAssetMover& mover_;
    PoolConfig config_;

    ClaimLedger claims_;
    RewardAccumulator accumulator_;
    RewardBook rewards_;

    mutable std::shared_mutex mutex_;
    std::atomic<std::thread::id> op_thread_{};
    OperationContext* active_{nullptr};   // set while an operation runs

    PoolListener* listener_{nullptr};

    // Statistics
    std::atomic<uint64_t> total_deposits_{0};
    std::atomic<uint64_t> total_withdrawals_{0};
    std::atomic<uint64_t> total_injections_{0};
    std::atomic<uint64_t> total_settlements_{0};
    std::atomic<uint64_t> total_transfers_{0};
    std::atomic<uint64_t> total_failed_{0};
    U128 total_bonus_paid_{0};

    // Settlement hook (registered with claims_)
    int32_t before_balance_change(const BalanceChange& change);
    void after_balance_change(const BalanceChange& change);

    // Pay everything `account` has pending into the active operation
    void settle(const Address& account, U128 balance);

    // Operation lifecycle
    void begin(OperationContext& ctx);
    int32_t finish(OperationContext& ctx, int32_t rc);
    void rollback(OperationContext& ctx);
    int32_t execute_moves(const OperationContext& ctx);
    void notify(const std::vector<PoolEvent>& events);

    friend class OperationScope;
};

} // namespace sharepool

#endif // SHAREPOOL_POOL_HPP
