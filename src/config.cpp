// =============================================================================
// config.cpp - PoolConfig loading
// =============================================================================

#include "cpamm/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cpamm {

namespace {

const char* const LOG_LEVELS[] = {"trace", "debug", "info", "warn", "error", "off"};

Balance parse_fee(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return static_cast<Balance>(value.get<uint64_t>());
    }
    if (value.is_string()) {
        auto parsed = parse_u128(value.get<std::string>());
        if (!parsed) {
            throw std::runtime_error("fee_basis_points: not an unsigned integer: " +
                                     value.get<std::string>());
        }
        return *parsed;
    }
    throw std::runtime_error("fee_basis_points: expected unsigned integer or decimal string");
}

std::string parse_level(const nlohmann::json& value) {
    if (!value.is_string()) {
        throw std::runtime_error("log_level: expected string");
    }
    std::string level = value.get<std::string>();
    for (const char* known : LOG_LEVELS) {
        if (level == known) return level;
    }
    throw std::runtime_error("log_level: unknown level: " + level);
}

} // namespace

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
    nlohmann::json root = nlohmann::json::parse(content.begin(), content.end(), nullptr, false);
    if (root.is_discarded()) {
        throw std::runtime_error("Invalid config: malformed JSON");
    }
    if (!root.is_object()) {
        throw std::runtime_error("Invalid config: top level must be an object");
    }

    PoolConfig config;
    if (auto it = root.find("fee_basis_points"); it != root.end()) {
        config.fee_basis_points = parse_fee(*it);
    }
    if (auto it = root.find("log_level"); it != root.end()) {
        config.log_level = parse_level(*it);
    }
    return config;
}

} // namespace cpamm
