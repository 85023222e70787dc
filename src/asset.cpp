// =============================================================================
// asset.cpp - In-memory asset token and the custody mover built on it
// =============================================================================

#include "sharepool/asset.hpp"
#include "sharepool/math.hpp"

#include <mutex>
#include <utility>

namespace sharepool {

// =============================================================================
// AssetToken
// =============================================================================

AssetToken::AssetToken(std::string symbol) : symbol_(std::move(symbol)) {}

int32_t AssetToken::mint(const Address& to, U128 amount) {
    if (is_zero_address(to)) {
        return errors::ZERO_ADDRESS;
    }

    std::unique_lock lock(mutex_);
    auto supply = checked_add(total_supply_, amount);
    if (!supply) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    total_supply_ = *supply;
    balances_[to] += amount;
    return errors::OK;
}

int32_t AssetToken::transfer(const Address& from, const Address& to, U128 amount) {
    std::unique_lock lock(mutex_);
    return transfer_locked(from, to, amount);
}

int32_t AssetToken::approve(const Address& owner, const Address& spender, U128 amount) {
    if (is_zero_address(owner) || is_zero_address(spender)) {
        return errors::ZERO_ADDRESS;
    }

    std::unique_lock lock(mutex_);
    allowances_[AllowanceKey{owner, spender}] = amount;
    return errors::OK;
}

int32_t AssetToken::transfer_from(const Address& spender, const Address& from,
                                  const Address& to, U128 amount) {
    std::unique_lock lock(mutex_);

    auto it = allowances_.find(AllowanceKey{from, spender});
    U128 allowed = it != allowances_.end() ? it->second : 0;
    if (allowed < amount) {
        return errors::INSUFFICIENT_ALLOWANCE;
    }

    int32_t rc = transfer_locked(from, to, amount);
    if (rc != errors::OK) {
        return rc;
    }

    if (allowed != U128_MAX && amount > 0) {
        it->second -= amount;
    }
    return errors::OK;
}

int32_t AssetToken::transfer_locked(const Address& from, const Address& to, U128 amount) {
    if (is_zero_address(from) || is_zero_address(to)) {
        return errors::ZERO_ADDRESS;
    }
    if (frozen_.count(from) || frozen_.count(to)) {
        return errors::TRANSFER_FAILED;
    }

    auto from_it = balances_.find(from);
    U128 from_balance = from_it != balances_.end() ? from_it->second : 0;
    if (from_balance < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    if (amount == 0 || from == to) {
        return errors::OK;
    }

    from_it->second -= amount;
    balances_[to] += amount;  // bounded by total supply
    return errors::OK;
}

U128 AssetToken::balance_of(const Address& account) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : 0;
}

U128 AssetToken::allowance(const Address& owner, const Address& spender) const {
    std::shared_lock lock(mutex_);
    auto it = allowances_.find(AllowanceKey{owner, spender});
    return it != allowances_.end() ? it->second : 0;
}

U128 AssetToken::total_supply() const {
    std::shared_lock lock(mutex_);
    return total_supply_;
}

void AssetToken::set_frozen(const Address& account, bool frozen) {
    std::unique_lock lock(mutex_);
    if (frozen) {
        frozen_.insert(account);
    } else {
        frozen_.erase(account);
    }
}

bool AssetToken::is_frozen(const Address& account) const {
    std::shared_lock lock(mutex_);
    return frozen_.count(account) != 0;
}

// =============================================================================
// TokenMover
// =============================================================================

TokenMover::TokenMover(AssetToken& token, const Address& custody)
    : token_(token), custody_(custody) {}

int32_t TokenMover::pull(const Address& from, U128 amount) {
    if (token_.transfer_from(custody_, from, custody_, amount) != errors::OK) {
        return errors::TRANSFER_FAILED;
    }
    return errors::OK;
}

int32_t TokenMover::push(const Address& to, U128 amount) {
    if (token_.transfer(custody_, to, amount) != errors::OK) {
        return errors::TRANSFER_FAILED;
    }
    return errors::OK;
}

U128 TokenMover::custody_balance() const {
    return token_.balance_of(custody_);
}

} // namespace sharepool
