#ifndef SHAREPOOL_ASSET_HPP
#define SHAREPOOL_ASSET_HPP

#include <unordered_map>
#include <unordered_set>
#include <shared_mutex>
#include <string>

#include "types.hpp"

namespace sharepool {

// =============================================================================
// Asset Mover Interface
// =============================================================================

// Moves units of the underlying asset between an account and pool custody.
// Calls are synchronous: they either complete or return a non-OK code and
// leave balances untouched.
class IAssetMover {
public:
    virtual ~IAssetMover() = default;

    // account -> pool custody
    virtual int32_t pull(const Address& from, U128 amount) = 0;

    // pool custody -> account
    virtual int32_t push(const Address& to, U128 amount) = 0;

    // Underlying units currently held in custody
    virtual U128 custody_balance() const = 0;
};

// =============================================================================
// AssetToken - In-memory fungible token (balances + allowances)
// =============================================================================

class AssetToken {
public:
    explicit AssetToken(std::string symbol = "ASSET");
    ~AssetToken() = default;

    // Non-copyable
    AssetToken(const AssetToken&) = delete;
    AssetToken& operator=(const AssetToken&) = delete;

    const std::string& symbol() const { return symbol_; }

    // Issue new units (test faucet / genesis)
    int32_t mint(const Address& to, U128 amount);

    int32_t transfer(const Address& from, const Address& to, U128 amount);
    int32_t approve(const Address& owner, const Address& spender, U128 amount);

    // Spends `spender`'s allowance over `from`. An allowance of U128_MAX is
    // treated as unlimited and never decremented.
    int32_t transfer_from(const Address& spender, const Address& from,
                          const Address& to, U128 amount);

    U128 balance_of(const Address& account) const;
    U128 allowance(const Address& owner, const Address& spender) const;
    U128 total_supply() const;

    // Reject every transfer touching `account` (simulates a token that
    // blocks an address, for failure-path testing)
    void set_frozen(const Address& account, bool frozen);
    bool is_frozen(const Address& account) const;

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

    std::string symbol_;
    std::unordered_map<Address, U128, AddressHash> balances_;
    std::unordered_map<AllowanceKey, U128, AllowanceKeyHash> allowances_;
    std::unordered_set<Address, AddressHash> frozen_;
    U128 total_supply_{0};
    mutable std::shared_mutex mutex_;

    int32_t transfer_locked(const Address& from, const Address& to, U128 amount);
};

// =============================================================================
// TokenMover - IAssetMover over an AssetToken
// =============================================================================

// Pulls with transfer_from (the custody account spends the depositor's
// allowance), pushes with a plain transfer out of custody.
class TokenMover : public IAssetMover {
public:
    TokenMover(AssetToken& token, const Address& custody);

    int32_t pull(const Address& from, U128 amount) override;
    int32_t push(const Address& to, U128 amount) override;
    U128 custody_balance() const override;

    const Address& custody() const { return custody_; }

private:
    AssetToken& token_;
    Address custody_;
};

} // namespace sharepool

#endif // SHAREPOOL_ASSET_HPP
