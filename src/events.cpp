// =============================================================================
// events.cpp - Event dispatch and the JSON-lines event log
// =============================================================================

#include "sharepool/events.hpp"
#include <nlohmann/json.hpp>

#include <utility>

namespace sharepool {

using json = nlohmann::json;

const char* event_name(PoolEventKind kind) {
    switch (kind) {
        case PoolEventKind::DEPOSIT:               return "deposit";
        case PoolEventKind::WITHDRAW:              return "withdraw";
        case PoolEventKind::PROCEEDS_DEPOSITED:    return "proceeds_deposited";
        case PoolEventKind::FIRST_DEPOSITOR_BONUS: return "first_depositor_bonus";
        case PoolEventKind::PROCEEDS_CLAIMED:      return "proceeds_claimed";
        case PoolEventKind::TRANSFER:              return "transfer";
    }
    return "unknown";
}

void dispatch(PoolListener& listener, const PoolEvent& event) {
    switch (event.kind) {
        case PoolEventKind::DEPOSIT:
            listener.on_deposit(event.account, event.amount);
            break;
        case PoolEventKind::WITHDRAW:
            listener.on_withdraw(event.account, event.amount);
            break;
        case PoolEventKind::PROCEEDS_DEPOSITED:
            listener.on_proceeds_deposited(event.account, event.amount,
                                           event.cumulative, event.escrowed);
            break;
        case PoolEventKind::FIRST_DEPOSITOR_BONUS:
            listener.on_first_depositor_bonus(event.account, event.amount);
            break;
        case PoolEventKind::PROCEEDS_CLAIMED:
            listener.on_proceeds_claimed(event.account, event.amount);
            break;
        case PoolEventKind::TRANSFER:
            listener.on_transfer(event.account, event.counterparty, event.amount);
            break;
    }
}

// =============================================================================
// JsonEventLog
// =============================================================================

JsonEventLog::JsonEventLog(std::ostream& out, std::string pool_name)
    : out_(out), pool_name_(std::move(pool_name)) {}

void JsonEventLog::on_deposit(const Address& account, U128 amount) {
    write({PoolEventKind::DEPOSIT, account, ZERO_ADDRESS, amount, 0, false});
}

void JsonEventLog::on_withdraw(const Address& account, U128 amount) {
    write({PoolEventKind::WITHDRAW, account, ZERO_ADDRESS, amount, 0, false});
}

void JsonEventLog::on_proceeds_deposited(const Address& caller, U128 amount,
                                         U128 cumulative, bool escrowed) {
    write({PoolEventKind::PROCEEDS_DEPOSITED, caller, ZERO_ADDRESS, amount, cumulative, escrowed});
}

void JsonEventLog::on_first_depositor_bonus(const Address& account, U128 amount) {
    write({PoolEventKind::FIRST_DEPOSITOR_BONUS, account, ZERO_ADDRESS, amount, 0, false});
}

void JsonEventLog::on_proceeds_claimed(const Address& account, U128 amount) {
    write({PoolEventKind::PROCEEDS_CLAIMED, account, ZERO_ADDRESS, amount, 0, false});
}

void JsonEventLog::on_transfer(const Address& from, const Address& to, U128 amount) {
    write({PoolEventKind::TRANSFER, from, to, amount, 0, false});
}

void JsonEventLog::write(const PoolEvent& event) {
    json j = {
        {"event", event_name(event.kind)},
        {"amount", to_string(event.amount)}
    };
    if (!pool_name_.empty()) {
        j["pool"] = pool_name_;
    }

    switch (event.kind) {
        case PoolEventKind::TRANSFER:
            j["from"] = addresses::to_hex(event.account);
            j["to"] = addresses::to_hex(event.counterparty);
            break;
        case PoolEventKind::PROCEEDS_DEPOSITED:
            j["caller"] = addresses::to_hex(event.account);
            j["cumulative_reward_per_share"] = to_string(event.cumulative);
            j["escrowed"] = event.escrowed;
            break;
        default:
            j["account"] = addresses::to_hex(event.account);
            break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << j.dump() << "\n";
    ++lines_;
}

} // namespace sharepool
