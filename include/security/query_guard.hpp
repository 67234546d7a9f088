#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace querygate {

/**
 * @brief Leading-keyword mutation policy
 *
 * Only the first keyword of the statement is inspected, so identifiers,
 * literals and later clauses never trigger a block
 * ("SELECT * FROM delete_logs" passes).
 *
 * Two keyword classes:
 * - ALWAYS_BLOCKED: DDL, DELETE/TRUNCATE, GRANT/REVOKE, procedure
 *   execution and session/engine control. Never re-enabled.
 * - UPDATE_BLOCKED: INSERT, UPDATE, MERGE, REPLACE, UPSERT. Allowed when
 *   Config::allow_update_queries is set.
 *
 * Violations throw PolicyViolation; the guard never warns.
 */
class QueryGuard {
public:
    static constexpr std::string_view kEnableUpdatesEnvVar = "QUERYGATE_ENABLE_UPDATE_QUERIES";

    struct Config {
        bool allow_update_queries = false;

        /**
         * @brief Fold the environment toggle into a base config
         *
         * Either the flag or a truthy QUERYGATE_ENABLE_UPDATE_QUERIES enables
         * update queries. Read once, here, and not on every check.
         */
        [[nodiscard]] static Config resolve(Config base);
    };

    QueryGuard() = default;
    explicit QueryGuard(const Config& config) : config_(config) {}

    /**
     * @brief Validate a cleaned query
     * @return The query, unchanged
     * @throws PolicyViolation when the leading keyword is blocked
     */
    std::string_view check(std::string_view query) const;

    /**
     * @brief Policy class of a keyword regardless of configuration
     * @param keyword Upper-case keyword
     */
    [[nodiscard]] static std::optional<PolicyClass> classify(std::string_view keyword);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace querygate
