#include "config/config_loader.hpp"
#include "core/engine_type.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace querygate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    const std::string level = (*logging)["level"].value_or("info"s);
    const auto parsed = utils::log::parse_level(level);
    if (!parsed) {
        throw std::runtime_error(
            std::format("logging.level must be one of info, warn, error; got '{}'", level));
    }
    cfg.level = *parsed;
    return cfg;
}

QueryConfig extract_query(const toml::table& root) {
    QueryConfig cfg;
    const auto* query = root["query"].as_table();
    if (!query) return cfg;
    const auto& q = *query;

    cfg.enforce_select = q["enforce_select"].value_or(false);
    cfg.enable_update_queries = q["enable_update_queries"].value_or(false);
    return cfg;
}

SchemaConfig extract_schema(const toml::table& root) {
    SchemaConfig cfg;
    const auto* schema = root["schema"].as_table();
    if (!schema) return cfg;

    const int64_t threshold = (*schema)["categorical_threshold"].value_or(
        static_cast<int64_t>(SchemaInspector::kDefaultCategoricalThreshold));
    if (threshold > std::numeric_limits<int>::max()) {
        throw std::runtime_error(
            std::format("schema.categorical_threshold is too large: {}", threshold));
    }
    cfg.categorical_threshold = static_cast<int>(std::max<int64_t>(
        threshold, std::numeric_limits<int>::min()));
    return cfg;
}

EngineConfig extract_engine(const toml::table& root) {
    EngineConfig cfg;
    const auto* engine = root["engine"].as_table();
    if (!engine) return cfg;

    // An empty string (e.g. an unset ${VAR}) means "no preference".
    if (const auto* v = (*engine)["default"].as_string()) {
        if (!v->get().empty()) {
            cfg.default_engine = std::string(v->get());
        }
    }
    return cfg;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

GatewayConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    GatewayConfig config;
    config.logging = extract_logging(root);
    config.query = extract_query(root);
    config.schema = extract_schema(root);
    config.engine = extract_engine(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.schema.categorical_threshold < 1) {
        errors.push_back(std::format("schema.categorical_threshold must be >= 1, got {}",
                                     config.schema.categorical_threshold));
    }

    if (config.engine.default_engine) {
        try {
            (void)parse_engine_type(*config.engine.default_engine);
        } catch (const ConfigurationError& e) {
            errors.push_back(std::format("engine.default: {}", e.message()));
        }
    }

    return errors;
}

} // namespace querygate
