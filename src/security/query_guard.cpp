#include "security/query_guard.hpp"
#include "query/query_cleaner.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <format>

namespace querygate {

namespace {

// Schema/permission mutation, row deletion, procedure execution and
// session/engine control.
constexpr std::array<std::string_view, 18> kAlwaysBlocked = {
    "DELETE", "TRUNCATE", "CREATE", "DROP", "ALTER",
    "GRANT", "REVOKE",
    "EXEC", "EXECUTE", "CALL",
    "SET", "RESET", "ATTACH", "DETACH", "PRAGMA", "INSTALL", "LOAD", "COPY",
};

constexpr std::array<std::string_view, 5> kUpdateBlocked = {
    "INSERT", "UPDATE", "MERGE", "REPLACE", "UPSERT",
};

template<size_t N>
bool contains(const std::array<std::string_view, N>& set, std::string_view keyword) {
    return std::find(set.begin(), set.end(), keyword) != set.end();
}

} // anonymous namespace

QueryGuard::Config QueryGuard::Config::resolve(Config base) {
    const std::string env_name(kEnableUpdatesEnvVar);
    if (const char* env = std::getenv(env_name.c_str())) {
        if (utils::is_truthy(env)) {
            base.allow_update_queries = true;
        }
    }
    return base;
}

std::optional<PolicyClass> QueryGuard::classify(std::string_view keyword) {
    if (contains(kAlwaysBlocked, keyword)) return PolicyClass::ALWAYS_BLOCKED;
    if (contains(kUpdateBlocked, keyword)) return PolicyClass::UPDATE_BLOCKED;
    return std::nullopt;
}

std::string_view QueryGuard::check(std::string_view query) const {
    const std::string keyword = QueryCleaner::leading_keyword(query);
    const auto cls = classify(keyword);
    if (!cls) {
        return query;
    }

    if (*cls == PolicyClass::ALWAYS_BLOCKED) {
        utils::log::warn(std::format("Blocked query with disallowed operation: {}", keyword));
        throw PolicyViolation(*cls, keyword,
            std::format("Query uses a disallowed operation: {}. "
                        "Only read-only queries are permitted.", keyword));
    }

    if (!config_.allow_update_queries) {
        utils::log::warn(std::format("Blocked query with update operation: {}", keyword));
        throw PolicyViolation(*cls, keyword,
            std::format("Query uses an update operation: {}. Update queries are disabled; "
                        "set {}=true to allow them.", keyword, kEnableUpdatesEnvVar));
    }

    return query;
}

} // namespace querygate
