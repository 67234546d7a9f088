#pragma once

#include "core/utils.hpp"
#include "schema/schema_inspector.hpp"

#include <optional>
#include <string>

namespace querygate {

// ============================================================================
// Gateway Config (mirrors TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    utils::log::Level level = utils::log::Level::INFO;
};

struct QueryConfig {
    bool enforce_select = false;
    bool enable_update_queries = false;    // QUERYGATE_ENABLE_UPDATE_QUERIES also enables
};

struct SchemaConfig {
    int categorical_threshold = SchemaInspector::kDefaultCategoricalThreshold;
};

struct EngineConfig {
    std::optional<std::string> default_engine;    // "duckdb" | "sqlite"; unset = built-in
};

struct GatewayConfig {
    LoggingConfig logging;
    QueryConfig query;
    SchemaConfig schema;
    EngineConfig engine;
};

} // namespace querygate
