#pragma once

#include "core/error.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string>
#include <string_view>

namespace querygate {

namespace keys {
    inline constexpr std::string_view DUCKDB = "duckdb";
    inline constexpr std::string_view SQLITE = "sqlite";
}

/**
 * @brief Embedded engines a DataSource can promote an in-memory frame into
 */
enum class EngineType {
    DUCKDB,
    SQLITE,
};

// Allow-list, in built-in preference order.
inline constexpr std::array<EngineType, 2> kAllEngines = {EngineType::DUCKDB, EngineType::SQLITE};

[[nodiscard]] inline std::string_view engine_type_to_string(EngineType type) {
    switch (type) {
        case EngineType::DUCKDB: return keys::DUCKDB;
        case EngineType::SQLITE: return keys::SQLITE;
        default: return "unknown";
    }
}

/**
 * @brief Parse an engine name against the allow-list (case-insensitive)
 * @throws ConfigurationError for names outside the allow-list
 */
[[nodiscard]] inline EngineType parse_engine_type(std::string_view name) {
    for (const auto type : kAllEngines) {
        const auto key = engine_type_to_string(type);
        if (key.size() == name.size() &&
            std::equal(key.begin(), key.end(), name.begin(),
                [](char a, char b) { return a == std::tolower(static_cast<unsigned char>(b)); })) {
            return type;
        }
    }

    throw ConfigurationError(
        std::format("Unknown embedded engine '{}'. Allowed engines: {}, {}",
            name, keys::DUCKDB, keys::SQLITE),
        std::string(name));
}

} // namespace querygate
