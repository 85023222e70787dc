#ifndef SHAREPOOL_TYPES_HPP
#define SHAREPOOL_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>

namespace sharepool {

// =============================================================================
// Account Identity (EVM-style 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

// The null identity
constexpr Address ZERO_ADDRESS{};

inline bool is_zero_address(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 1469598103934665603ULL;  // FNV-1a
        for (uint8_t b : a) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

namespace addresses {

// Build an address whose low 8 bytes hold `n` (big-endian).
// Handy for tests and fixtures.
constexpr Address from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts 40 hex digits with or without a 0x prefix.
// Throws std::invalid_argument on malformed input.
Address from_hex(std::string_view hex);

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic
// =============================================================================

using U128 = unsigned __int128;

constexpr U128 U128_MAX = ~U128(0);

// Scale of the cumulative reward-per-share accumulator
constexpr U128 PRECISION = 1000000000000000000ULL;  // 1e18

// Decimal rendering of 128-bit amounts (iostreams and JSON cannot print them)
std::string to_string(U128 v);

// Parses an unsigned decimal string.
// Throws std::invalid_argument on bad digits, std::out_of_range on overflow.
U128 parse_u128(std::string_view s);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t ZERO_AMOUNT = -1;
constexpr int32_t ZERO_ADDRESS = -2;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -11;
constexpr int32_t TRANSFER_FAILED = -20;
constexpr int32_t ROLLBACK_FAILED = -21;
constexpr int32_t ARITHMETIC_OVERFLOW = -22;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t HOOK_FAILED = -31;
constexpr int32_t UNAUTHORIZED = -40;

const char* message(int32_t code);
}

} // namespace sharepool

#endif // SHAREPOOL_TYPES_HPP
