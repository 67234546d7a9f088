#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace querygate {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute(). Owns the result data, copied out of
 * native result handles as typed Values (row-major).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<Value>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;

    static DbResultSet failure(std::string message) {
        DbResultSet r;
        r.error_message = std::move(message);
        return r;
    }

    static DbResultSet ok() {
        DbResultSet r;
        r.success = true;
        return r;
    }
};

/**
 * @brief Outcome of a table lookup
 *
 * success=false means the lookup itself failed; success=true with no table
 * means the table does not exist.
 */
struct TableLookup {
    bool success = false;
    std::string error_message;
    std::optional<TableMetadata> table;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (sqlite3*, PGconn*, MYSQL*,
 * duckdb::Connection). Implementations are not thread-safe.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute exactly one SQL statement
     *
     * Implementations refuse multi-statement text rather than running more
     * than the first statement.
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Look up a table's columns in native order
     */
    [[nodiscard]] virtual TableLookup describe_table(const TableRef& table) = 0;

    /**
     * @brief Quote one identifier part in this dialect
     */
    [[nodiscard]] virtual std::string quote_identifier(std::string_view name) const = 0;

    /**
     * @brief "SQLite", "DuckDB", "PostgreSQL", "MySQL"
     */
    [[nodiscard]] virtual std::string_view dialect_name() const = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources (idempotent)
     */
    virtual void close() = 0;

    /**
     * @brief Quote every non-empty part of a table reference and join with '.'
     */
    [[nodiscard]] std::string quote_table(const TableRef& table) const {
        std::string out;
        for (const std::string* part : {&table.catalog, &table.schema}) {
            if (!part->empty()) {
                out += quote_identifier(*part);
                out += '.';
            }
        }
        out += quote_identifier(table.table);
        return out;
    }
};

/**
 * @brief Wrap name in quote characters, doubling embedded quotes
 */
[[nodiscard]] inline std::string quote_with(std::string_view name, char quote) {
    std::string out;
    out.reserve(name.size() + 2);
    out += quote;
    for (const char c : name) {
        out += c;
        if (c == quote) out += quote;
    }
    out += quote;
    return out;
}

} // namespace querygate
