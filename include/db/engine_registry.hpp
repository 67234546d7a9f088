#pragma once

#include "db/iembedded_engine.hpp"
#include "core/engine_type.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace querygate {

/**
 * @brief Registry of embedded engines plus the process-wide default
 *
 * Built-in engines register in the constructor: SQLite always, DuckDB when
 * built with ENABLE_DUCKDB.
 *
 * Engine resolution precedence:
 *   explicit argument > process default (set_default_engine) > built-in
 * The built-in default is the first registered engine in kAllEngines order.
 *
 * Usage:
 *   EngineRegistry::instance().set_default_engine("SQLite");
 *   const auto type = EngineRegistry::instance().resolve(std::nullopt);
 *   auto engine = EngineRegistry::instance().create(type);
 */
class EngineRegistry {
public:
    using Factory = std::function<std::unique_ptr<IEmbeddedEngine>()>;

    static EngineRegistry& instance() {
        static EngineRegistry registry;
        return registry;
    }

    void register_engine(EngineType type, Factory factory);

    /**
     * @throws ConfigurationError when the engine is not compiled in, or
     *         BackendExecutionError when it fails to open
     */
    [[nodiscard]] std::unique_ptr<IEmbeddedEngine> create(EngineType type) const;

    [[nodiscard]] bool has_engine(EngineType type) const;

    /**
     * @brief Set (or clear with std::nullopt) the process-wide default
     * @throws ConfigurationError for names outside the allow-list
     */
    void set_default_engine(std::optional<std::string_view> name);

    [[nodiscard]] std::optional<EngineType> default_engine() const;

    [[nodiscard]] EngineType builtin_default() const;

    /**
     * @brief Apply the precedence rule to an optional explicit choice
     * @throws ConfigurationError for names outside the allow-list
     */
    [[nodiscard]] EngineType resolve(std::optional<std::string_view> requested) const;

private:
    EngineRegistry();

    struct EngineTypeHash {
        size_t operator()(EngineType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<EngineType, Factory, EngineTypeHash> factories_;
    std::optional<EngineType> default_engine_;
};

} // namespace querygate
