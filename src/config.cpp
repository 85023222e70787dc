// =============================================================================
// config.cpp - JSON pool configuration
// =============================================================================

#include "sharepool/config.hpp"
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sharepool {

using json = nlohmann::json;

PoolConfig PoolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

PoolConfig PoolConfig::from_json(std::string_view content) {
    json j;
    try {
        j = json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    PoolConfig config;
    try {
        config.name = j.value("name", config.name);
        config.log_events = j.value("log_events", config.log_events);

        if (j.contains("aliases")) {
            for (const auto& [label, hex] : j["aliases"].items()) {
                config.aliases[label] = addresses::from_hex(hex.get<std::string>());
            }
        }
        if (j.contains("admin")) {
            config.admin = config.resolve(j["admin"].get<std::string>());
        }
        if (j.contains("custody")) {
            config.custody = config.resolve(j["custody"].get<std::string>());
        }
    } catch (const json::type_error& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    return config;
}

Address PoolConfig::resolve(std::string_view name_or_hex) const {
    auto it = aliases.find(std::string(name_or_hex));
    if (it != aliases.end()) {
        return it->second;
    }
    return addresses::from_hex(name_or_hex);
}

std::string PoolConfig::label(const Address& addr) const {
    for (const auto& [name, a] : aliases) {
        if (a == addr) return name;
    }
    return addresses::to_hex(addr);
}

} // namespace sharepool
