#ifndef SHAREPOOL_EVENTS_HPP
#define SHAREPOOL_EVENTS_HPP

#include <ostream>
#include <mutex>

#include "types.hpp"

namespace sharepool {

// =============================================================================
// Pool Events
// =============================================================================

enum class PoolEventKind : uint8_t {
    DEPOSIT = 0,
    WITHDRAW = 1,
    PROCEEDS_DEPOSITED = 2,
    FIRST_DEPOSITOR_BONUS = 3,
    PROCEEDS_CLAIMED = 4,
    TRANSFER = 5
};

const char* event_name(PoolEventKind kind);

struct PoolEvent {
    PoolEventKind kind;
    Address account;        // actor / recipient
    Address counterparty;   // transfer receiver, else ZERO_ADDRESS
    U128 amount;
    U128 cumulative;        // accumulator after the event (PROCEEDS_DEPOSITED)
    bool escrowed;          // PROCEEDS_DEPOSITED with no shares outstanding
};

// Callback interface for committed pool events. Events of a failed
// operation are never delivered.
class PoolListener {
public:
    virtual ~PoolListener() = default;
    virtual void on_deposit(const Address& account, U128 amount) = 0;
    virtual void on_withdraw(const Address& account, U128 amount) = 0;
    virtual void on_proceeds_deposited(const Address& caller, U128 amount,
                                       U128 cumulative, bool escrowed) = 0;
    virtual void on_first_depositor_bonus(const Address& account, U128 amount) = 0;
    virtual void on_proceeds_claimed(const Address& account, U128 amount) = 0;
    virtual void on_transfer(const Address& from, const Address& to, U128 amount) = 0;
};

// No-op listener for when notifications aren't needed
class NullPoolListener : public PoolListener {
public:
    void on_deposit(const Address&, U128) override {}
    void on_withdraw(const Address&, U128) override {}
    void on_proceeds_deposited(const Address&, U128, U128, bool) override {}
    void on_first_depositor_bonus(const Address&, U128) override {}
    void on_proceeds_claimed(const Address&, U128) override {}
    void on_transfer(const Address&, const Address&, U128) override {}
};

// Route a buffered event to the matching listener method
void dispatch(PoolListener& listener, const PoolEvent& event);

// =============================================================================
// JsonEventLog - one JSON object per line
// =============================================================================

class JsonEventLog : public PoolListener {
public:
    explicit JsonEventLog(std::ostream& out, std::string pool_name = "");

    void on_deposit(const Address& account, U128 amount) override;
    void on_withdraw(const Address& account, U128 amount) override;
    void on_proceeds_deposited(const Address& caller, U128 amount,
                               U128 cumulative, bool escrowed) override;
    void on_first_depositor_bonus(const Address& account, U128 amount) override;
    void on_proceeds_claimed(const Address& account, U128 amount) override;
    void on_transfer(const Address& from, const Address& to, U128 amount) override;

    uint64_t lines_written() const { return lines_; }

private:
    std::ostream& out_;
    std::string pool_name_;
    std::mutex mutex_;
    uint64_t lines_{0};

    void write(const PoolEvent& event);
};

} // namespace sharepool

#endif // SHAREPOOL_EVENTS_HPP
