#include <catch2/catch_test_macros.hpp>
#include "security/query_guard.hpp"
#include "core/error.hpp"

#include <cstdlib>
#include <string>

using namespace querygate;

namespace {

// Sets QUERYGATE_ENABLE_UPDATE_QUERIES for the lifetime of the object.
class ScopedUpdateToggle {
public:
    explicit ScopedUpdateToggle(const char* value) {
        ::setenv(std::string(QueryGuard::kEnableUpdatesEnvVar).c_str(), value, 1);
    }
    ~ScopedUpdateToggle() {
        ::unsetenv(std::string(QueryGuard::kEnableUpdatesEnvVar).c_str());
    }
};

PolicyClass violation_class(const QueryGuard& guard, const std::string& sql) {
    try {
        (void)guard.check(sql);
    } catch (const PolicyViolation& e) {
        return e.policy_class();
    }
    FAIL("expected PolicyViolation for: " << sql);
    return PolicyClass::ALWAYS_BLOCKED;
}

} // anonymous namespace

TEST_CASE("QueryGuard: read-only queries pass", "[guard]") {
    const QueryGuard guard;

    REQUIRE(guard.check("SELECT * FROM t") == "SELECT * FROM t");
    REQUIRE_NOTHROW(guard.check("WITH x AS (SELECT 1) SELECT * FROM x"));
    REQUIRE_NOTHROW(guard.check("(SELECT 1)"));
    REQUIRE_NOTHROW(guard.check("EXPLAIN SELECT 1"));
}

TEST_CASE("QueryGuard: only the leading keyword is inspected", "[guard]") {
    const QueryGuard guard;

    REQUIRE_NOTHROW(guard.check("SELECT * FROM delete_logs"));
    REQUIRE_NOTHROW(guard.check("SELECT 'DROP TABLE t' AS text"));
    REQUIRE_NOTHROW(guard.check("SELECT updated_at, created_by FROM t"));
    REQUIRE_NOTHROW(guard.check("SELECT update_count FROM t"));
}

TEST_CASE("QueryGuard: always-blocked keywords", "[guard]") {
    const QueryGuard guard;
    const char* blocked[] = {
        "DELETE FROM t", "TRUNCATE t", "CREATE TABLE x (a INT)", "DROP TABLE t",
        "ALTER TABLE t ADD b INT", "GRANT ALL ON t TO bob", "REVOKE ALL ON t FROM bob",
        "EXEC sp_who", "EXECUTE p", "CALL p()", "SET x = 1", "RESET ALL",
        "ATTACH 'other.db' AS o", "DETACH o", "PRAGMA table_info(t)",
        "INSTALL httpfs", "LOAD httpfs", "COPY t TO 'out.csv'",
    };

    for (const char* sql : blocked) {
        REQUIRE(violation_class(guard, sql) == PolicyClass::ALWAYS_BLOCKED);
    }
}

TEST_CASE("QueryGuard: keyword match is case-insensitive and skips noise", "[guard]") {
    const QueryGuard guard;

    REQUIRE(violation_class(guard, "drop table t") == PolicyClass::ALWAYS_BLOCKED);
    REQUIRE(violation_class(guard, "  (Delete from t") == PolicyClass::ALWAYS_BLOCKED);
    REQUIRE(violation_class(guard, "/* hi */ -- there\nTRUNCATE t") == PolicyClass::ALWAYS_BLOCKED);
}

TEST_CASE("QueryGuard: violation carries keyword and kind", "[guard]") {
    const QueryGuard guard;
    try {
        (void)guard.check("DROP TABLE users");
        FAIL("expected PolicyViolation");
    } catch (const PolicyViolation& e) {
        REQUIRE(e.kind() == ErrorKind::POLICY_VIOLATION);
        REQUIRE(e.keyword() == "DROP");
        REQUIRE(e.offending_fragment() == "DROP");
        REQUIRE(e.message().find("DROP") != std::string::npos);
    }
}

TEST_CASE("QueryGuard: update keywords blocked by default", "[guard]") {
    const QueryGuard guard;

    REQUIRE(violation_class(guard, "INSERT INTO t VALUES (1)") == PolicyClass::UPDATE_BLOCKED);
    REQUIRE(violation_class(guard, "UPDATE t SET a = 1") == PolicyClass::UPDATE_BLOCKED);
    REQUIRE(violation_class(guard, "MERGE INTO t USING s ON 1=1") == PolicyClass::UPDATE_BLOCKED);
    REQUIRE(violation_class(guard, "REPLACE INTO t VALUES (1)") == PolicyClass::UPDATE_BLOCKED);
    REQUIRE(violation_class(guard, "UPSERT INTO t VALUES (1)") == PolicyClass::UPDATE_BLOCKED);
}

TEST_CASE("QueryGuard: update queries enabled by config", "[guard]") {
    QueryGuard::Config config;
    config.allow_update_queries = true;
    const QueryGuard guard(config);

    REQUIRE_NOTHROW(guard.check("INSERT INTO t VALUES (1)"));
    REQUIRE_NOTHROW(guard.check("UPDATE t SET a = 1"));

    // Enabling updates never unlocks the always-blocked set
    REQUIRE(violation_class(guard, "DELETE FROM t") == PolicyClass::ALWAYS_BLOCKED);
    REQUIRE(violation_class(guard, "DROP TABLE t") == PolicyClass::ALWAYS_BLOCKED);
}

TEST_CASE("QueryGuard: environment toggle", "[guard]") {
    SECTION("Truthy values enable updates") {
        for (const char* value : {"1", "true", "TRUE", "yes", " Yes "}) {
            ScopedUpdateToggle toggle(value);
            REQUIRE(QueryGuard::Config::resolve({}).allow_update_queries);
        }
    }

    SECTION("Other values leave updates disabled") {
        for (const char* value : {"0", "false", "no", "", "on"}) {
            ScopedUpdateToggle toggle(value);
            REQUIRE_FALSE(QueryGuard::Config::resolve({}).allow_update_queries);
        }
    }

    SECTION("Unset leaves the base config alone") {
        ::unsetenv(std::string(QueryGuard::kEnableUpdatesEnvVar).c_str());
        QueryGuard::Config base;
        base.allow_update_queries = true;
        REQUIRE(QueryGuard::Config::resolve(base).allow_update_queries);
        REQUIRE_FALSE(QueryGuard::Config::resolve({}).allow_update_queries);
    }

    SECTION("Toggle does not unlock always-blocked keywords") {
        ScopedUpdateToggle toggle("1");
        const QueryGuard guard(QueryGuard::Config::resolve({}));
        REQUIRE_NOTHROW(guard.check("INSERT INTO t VALUES (1)"));
        REQUIRE(violation_class(guard, "TRUNCATE t") == PolicyClass::ALWAYS_BLOCKED);
    }
}

TEST_CASE("QueryGuard: classify", "[guard]") {
    REQUIRE(QueryGuard::classify("DROP") == PolicyClass::ALWAYS_BLOCKED);
    REQUIRE(QueryGuard::classify("INSERT") == PolicyClass::UPDATE_BLOCKED);
    REQUIRE_FALSE(QueryGuard::classify("SELECT").has_value());
    REQUIRE_FALSE(QueryGuard::classify("WITH").has_value());
}
