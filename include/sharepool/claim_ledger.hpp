#ifndef SHAREPOOL_CLAIM_LEDGER_HPP
#define SHAREPOOL_CLAIM_LEDGER_HPP

#include <unordered_map>
#include <functional>
#include <vector>

#include "types.hpp"

namespace sharepool {

// =============================================================================
// Balance Change (passed to settlement hooks)
// =============================================================================

enum class BalanceChangeKind : uint8_t {
    MINT = 0,
    BURN = 1,
    TRANSFER = 2
};

struct BalanceChange {
    BalanceChangeKind kind;
    Address from;             // ZERO_ADDRESS for mint
    Address to;               // ZERO_ADDRESS for burn
    U128 amount;
    U128 old_from_balance;    // balances before the ledger mutates them
    U128 old_to_balance;
};

// Runs before balances change; a non-OK return vetoes the change.
using BeforeBalanceChange = std::function<int32_t(const BalanceChange&)>;
// Runs after balances are committed.
using AfterBalanceChange = std::function<void(const BalanceChange&)>;

// =============================================================================
// ClaimLedger - Fungible balances of pool claim units
// =============================================================================

// Not internally synchronized: the owning pool serializes every call.
// Hooks must not call back into the ledger's mutators.
class ClaimLedger {
public:
    ClaimLedger() = default;
    ~ClaimLedger() = default;

    // Non-copyable
    ClaimLedger(const ClaimLedger&) = delete;
    ClaimLedger& operator=(const ClaimLedger&) = delete;

    void set_balance_hooks(BeforeBalanceChange before, AfterBalanceChange after);

    // =========================================================================
    // Mutators
    // =========================================================================

    int32_t mint(const Address& to, U128 amount);
    int32_t burn(const Address& from, U128 amount);
    int32_t transfer(const Address& from, const Address& to, U128 amount);

    int32_t approve(const Address& owner, const Address& spender, U128 amount);
    int32_t transfer_from(const Address& spender, const Address& from,
                          const Address& to, U128 amount);

    // =========================================================================
    // Queries
    // =========================================================================

    U128 balance_of(const Address& account) const;
    U128 allowance(const Address& owner, const Address& spender) const;
    U128 total_supply() const { return total_supply_; }

    // Accounts with a non-zero balance
    size_t holder_count() const;

    // =========================================================================
    // Undo Journal
    // =========================================================================

    // While a journal is open every write records the value it replaced, so
    // the whole batch can be reverted. Journals do not nest.
    void begin_journal();
    void commit_journal();
    void rollback_journal();
    bool journaling() const { return journaling_; }

private:
    struct AllowanceKey {
        Address owner;
        Address spender;
        bool operator==(const AllowanceKey& other) const {
            return owner == other.owner && spender == other.spender;
        }
    };
    struct AllowanceKeyHash {
        size_t operator()(const AllowanceKey& k) const noexcept {
            AddressHash h;
            return h(k.owner) * 31 + h(k.spender);
        }
    };

    enum class EntryKind : uint8_t { BALANCE, ALLOWANCE, SUPPLY };
    struct JournalEntry {
        EntryKind kind;
        Address a;
        Address b;
        U128 old_value;
    };

    std::unordered_map<Address, U128, AddressHash> balances_;
    std::unordered_map<AllowanceKey, U128, AllowanceKeyHash> allowances_;
    U128 total_supply_{0};

    BeforeBalanceChange before_hook_;
    AfterBalanceChange after_hook_;

    bool journaling_{false};
    std::vector<JournalEntry> journal_;

    int32_t run_before(const BalanceChange& change);
    void run_after(const BalanceChange& change);

    void set_balance(const Address& account, U128 value);
    void set_allowance(const Address& owner, const Address& spender, U128 value);
    void set_total_supply(U128 value);
};

} // namespace sharepool

#endif // SHAREPOOL_CLAIM_LEDGER_HPP
