#ifndef SHAREPOOL_CONFIG_HPP
#define SHAREPOOL_CONFIG_HPP

#include <string>
#include <string_view>
#include <unordered_map>

#include "types.hpp"

namespace sharepool {

// Custody account used when the config does not name one
constexpr Address DEFAULT_CUSTODY = addresses::from_u64(0x9070);

// =============================================================================
// Pool Configuration
// =============================================================================

struct PoolConfig {
    std::string name = "sharepool";
    Address admin{};                  // privileged proceeds depositor
    Address custody = DEFAULT_CUSTODY;
    bool log_events = false;
    std::unordered_map<std::string, Address> aliases;   // label -> address

    // Throws std::runtime_error if the file cannot be read or parsed
    static PoolConfig from_file(std::string_view path);

    // Missing keys keep their defaults. Throws std::runtime_error on
    // malformed JSON, std::invalid_argument on a malformed address.
    static PoolConfig from_json(std::string_view content);

    // Alias lookup first, then hex. Throws std::invalid_argument.
    Address resolve(std::string_view name_or_hex) const;

    // Reverse alias lookup; falls back to hex
    std::string label(const Address& addr) const;
};

} // namespace sharepool

#endif // SHAREPOOL_CONFIG_HPP
