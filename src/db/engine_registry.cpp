#include "db/engine_registry.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"

#ifdef ENABLE_DUCKDB
#include "db/duckdb/duckdb_connection.hpp"
#endif

#include <format>

namespace querygate {

EngineRegistry::EngineRegistry() {
#ifdef ENABLE_DUCKDB
    factories_[EngineType::DUCKDB] = []() -> std::unique_ptr<IEmbeddedEngine> {
        return DuckdbConnection::open_in_memory();
    };
#endif
    factories_[EngineType::SQLITE] = []() -> std::unique_ptr<IEmbeddedEngine> {
        return SqliteConnection::open(":memory:");
    };
}

void EngineRegistry::register_engine(EngineType type, Factory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[type] = std::move(factory);
}

std::unique_ptr<IEmbeddedEngine> EngineRegistry::create(EngineType type) const {
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            throw ConfigurationError(
                std::format("Embedded engine '{}' is not available in this build",
                            engine_type_to_string(type)),
                std::string(engine_type_to_string(type)));
        }
        factory = it->second;
    }

    auto engine = factory();
    if (!engine) {
        throw BackendExecutionError(
            std::format("Failed to open embedded {} engine", engine_type_to_string(type)), "");
    }
    return engine;
}

bool EngineRegistry::has_engine(EngineType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(type) > 0;
}

void EngineRegistry::set_default_engine(std::optional<std::string_view> name) {
    // Parse outside the lock; an unknown name must not clear the current default.
    std::optional<EngineType> parsed;
    if (name) {
        parsed = parse_engine_type(*name);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    default_engine_ = parsed;
    if (parsed) {
        utils::log::info(std::format("Default embedded engine set to {}",
                                     engine_type_to_string(*parsed)));
    }
}

std::optional<EngineType> EngineRegistry::default_engine() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_engine_;
}

EngineType EngineRegistry::builtin_default() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto type : kAllEngines) {
        if (factories_.count(type) > 0) return type;
    }
    throw ConfigurationError("No embedded engine is available in this build");
}

EngineType EngineRegistry::resolve(std::optional<std::string_view> requested) const {
    if (requested) {
        return parse_engine_type(*requested);
    }
    if (const auto process_default = default_engine()) {
        return *process_default;
    }
    return builtin_default();
}

} // namespace querygate
