#pragma once

#include "db/iembedded_engine.hpp"
#include "db/iconnection_factory.hpp"

#include <sqlite3.h>
#include <memory>
#include <string>

namespace querygate {

/**
 * @brief SQLite connection implementing IEmbeddedEngine
 *
 * Serves both roles: a private ":memory:" engine for frames, and an
 * external connection over a database file opened by the caller.
 * All sqlite3 calls are encapsulated here.
 */
class SqliteConnection : public IEmbeddedEngine {
public:
    /**
     * @brief Construct from an open handle (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    /**
     * @brief Open a database file or ":memory:"
     * @return Connection, or nullptr on failure (logged)
     */
    [[nodiscard]] static std::unique_ptr<SqliteConnection> open(
        const std::string& path, bool read_only = false);

    DbResultSet execute(const std::string& sql) override;
    TableLookup describe_table(const TableRef& table) override;
    std::string quote_identifier(std::string_view name) const override;
    std::string_view dialect_name() const override { return "SQLite"; }
    bool is_connected() const override;
    void close() override;

    DbResultSet load_frame(const std::string& table_name, const DataFrame& frame) override;
    DbResultSet lock_down() override;

private:
    DbResultSet failure_from_db(std::string_view context) const;

    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * Connection string is a file path, optionally prefixed with "sqlite://".
 * Files are opened read-write but never created.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace querygate
