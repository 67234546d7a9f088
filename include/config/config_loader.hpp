#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace querygate {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads querygate.toml
 *
 * Every string value goes through ${VAR} environment expansion before it is
 * read. Never throws: parse, expansion and validation failures all come back
 * as LoadResult::error().
 *
 *   [logging]
 *   level = "warn"
 *
 *   [query]
 *   enforce_select = true
 *   enable_update_queries = false
 *
 *   [schema]
 *   categorical_threshold = 20
 *
 *   [engine]
 *   default = "${QUERYGATE_ENGINE}"
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to querygate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All validation errors for a config (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

private:
    static GatewayConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(GatewayConfig config);
};

} // namespace querygate
