// =============================================================================
// types.cpp - Address and 128-bit amount formatting, error names
// =============================================================================

#include "sharepool/types.hpp"
#include <algorithm>
#include <stdexcept>

namespace sharepool {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw std::invalid_argument("address must be 40 hex digits: " + std::string(hex));
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// U128 <-> decimal
// =============================================================================

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

U128 parse_u128(std::string_view s) {
    if (s.empty()) {
        throw std::invalid_argument("empty amount");
    }
    U128 v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid amount: " + std::string(s));
        }
        U128 digit = static_cast<U128>(c - '0');
        if (v > (U128_MAX - digit) / 10) {
            throw std::out_of_range("amount exceeds 128 bits: " + std::string(s));
        }
        v = v * 10 + digit;
    }
    return v;
}

// =============================================================================
// Error Names
// =============================================================================

namespace errors {

const char* message(int32_t code) {
    switch (code) {
        case OK:                     return "OK";
        case ZERO_AMOUNT:            return "ZeroAmount";
        case ZERO_ADDRESS:           return "ZeroAddress";
        case INSUFFICIENT_BALANCE:   return "InsufficientBalance";
        case INSUFFICIENT_ALLOWANCE: return "InsufficientAllowance";
        case TRANSFER_FAILED:        return "TransferFailed";
        case ROLLBACK_FAILED:        return "RollbackFailed";
        case ARITHMETIC_OVERFLOW:    return "Overflow";
        case REENTRANCY:             return "Reentrancy";
        case HOOK_FAILED:            return "HookFailed";
        case UNAUTHORIZED:           return "Unauthorized";
        default:                     return "Unknown";
    }
}

} // namespace errors

} // namespace sharepool
