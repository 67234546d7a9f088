#pragma once

#include "core/engine_type.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include "db/iembedded_engine.hpp"
#include "query/query_cleaner.hpp"
#include "security/query_guard.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace querygate {

enum class BackendKind { EMBEDDED, EXTERNAL };

[[nodiscard]] inline constexpr std::string_view backend_kind_to_string(BackendKind kind) {
    return kind == BackendKind::EMBEDDED ? "embedded" : "external";
}

enum class DataSourceState { CONSTRUCTED, VALIDATED, ACTIVE, RELEASED };

[[nodiscard]] std::string_view data_source_state_to_string(DataSourceState state);

struct DataSourceOptions {
    QueryCleaner::Config cleaner;
    QueryGuard::Config guard;
    std::optional<std::string> engine;  // Embedded only; nullopt = process default
    bool owns_connection = false;       // External only; close on release()
};

/**
 * @brief One queryable table behind the cleaner and the guard
 *
 * Every query, whatever its origin, goes clean -> guard -> execute. The
 * backend is a closed set of two alternatives:
 * - EmbeddedBackend: a private in-memory engine holding a loaded DataFrame
 * - ExternalBackend: a caller-supplied IDbConnection plus a table reference
 *
 * Not thread-safe; a DataSource has a single owner and runs calls
 * synchronously.
 *
 * Usage:
 *   auto source = DataSource::from_frame(frame, "sales");
 *   auto result = source->execute("SELECT region, SUM(amount) FROM sales GROUP BY 1");
 *   source->release();
 */
class DataSource {
public:
    /**
     * @brief Host an in-memory frame in a fresh embedded engine
     * @throws ConfigurationError for a bad table name, frame or engine name
     * @throws BackendExecutionError when loading the frame fails
     */
    [[nodiscard]] static std::unique_ptr<DataSource> from_frame(
        const DataFrame& frame, const std::string& table_name,
        DataSourceOptions options = {});

    /**
     * @brief Wrap an open external connection
     * @throws TableNotFoundError when the table does not exist
     * @throws BackendExecutionError when the table lookup itself fails
     */
    [[nodiscard]] static std::unique_ptr<DataSource> from_connection(
        std::shared_ptr<IDbConnection> connection, TableRef table,
        DataSourceOptions options = {});

    ~DataSource();

    DataSource(const DataSource&) = delete;
    DataSource& operator=(const DataSource&) = delete;

    [[nodiscard]] const std::string& identifier() const;
    [[nodiscard]] const TableRef& table() const;
    [[nodiscard]] BackendKind backend_kind() const;

    /**
     * @brief "DuckDB", "SQLite", "PostgreSQL" or "MySQL"
     */
    [[nodiscard]] std::string db_type() const;

    /**
     * @brief Columns of the underlying table in native order
     */
    [[nodiscard]] const std::vector<ColumnMetadata>& column_schema() const;

    /**
     * @brief Quote a column or table name in the backend's dialect
     */
    [[nodiscard]] std::string quote_identifier(std::string_view name) const;

    /**
     * @brief Fully qualified, quoted table name for use in FROM clauses
     */
    [[nodiscard]] std::string quoted_table() const;

    /**
     * @brief Clean, guard and run a query
     *
     * A null, empty or comment-only query runs the identity query
     * (every row and column of the table).
     *
     * @throws CleaningError, NotASelectError, PolicyViolation,
     *         BackendExecutionError, SourceReleasedError
     */
    [[nodiscard]] QueryResult execute(std::optional<std::string_view> query);

    /**
     * @brief Like execute(), capped to one row by the backend's planner
     * @throws ColumnMismatchError when require_all_columns is set and the
     *         result drops a table column
     */
    [[nodiscard]] QueryResult fetch_one_row(std::string_view query,
                                            bool require_all_columns = false);

    [[nodiscard]] QueryResult fetch_all();

    /**
     * @brief Free the engine, or close an owned connection. Idempotent.
     */
    void release();

    /**
     * @brief Lifecycle state; the one accessor that still answers after release()
     */
    [[nodiscard]] DataSourceState state() const { return state_; }

private:
    friend class SchemaInspector;

    struct EmbeddedBackend {
        std::unique_ptr<IEmbeddedEngine> engine;
        EngineType type;
    };

    struct ExternalBackend {
        std::shared_ptr<IDbConnection> connection;
        bool owns_connection = false;
    };

    using Backend = std::variant<EmbeddedBackend, ExternalBackend>;

    DataSource(TableRef table, Backend backend, std::vector<ColumnMetadata> columns,
               const DataSourceOptions& options);

    void ensure_open() const;
    [[nodiscard]] IDbConnection& connection() const;

    /**
     * @brief Cleaned, guarded SQL; std::nullopt for no executable content
     */
    [[nodiscard]] std::optional<std::string> prepare(std::optional<std::string_view> query) const;

    [[nodiscard]] QueryResult run(const std::string& sql);

    /**
     * @brief Guard and run SQL assembled here from quoted identifiers
     *
     * Skips the cleaner: its byte filter would rewrite punctuation inside
     * quoted column names and silently change what the query refers to.
     */
    [[nodiscard]] QueryResult execute_generated(const std::string& sql);

    TableRef table_;
    std::string identifier_;
    Backend backend_;
    std::vector<ColumnMetadata> columns_;
    QueryCleaner cleaner_;
    QueryGuard guard_;
    DataSourceState state_ = DataSourceState::CONSTRUCTED;
};

} // namespace querygate
