#pragma once

#include "db/iembedded_engine.hpp"

#include "duckdb.hpp"

#include <memory>
#include <string>

namespace querygate {

/**
 * @brief In-memory DuckDB instance implementing IEmbeddedEngine
 *
 * Owns both the database and its single connection. Statements run through
 * Prepare(), which rejects multi-statement text.
 */
class DuckdbConnection : public IEmbeddedEngine {
public:
    DuckdbConnection(std::unique_ptr<duckdb::DuckDB> db,
                     std::unique_ptr<duckdb::Connection> conn);

    ~DuckdbConnection() override;

    DuckdbConnection(const DuckdbConnection&) = delete;
    DuckdbConnection& operator=(const DuckdbConnection&) = delete;

    /**
     * @return New private in-memory instance, or nullptr on failure (logged)
     */
    [[nodiscard]] static std::unique_ptr<DuckdbConnection> open_in_memory();

    DbResultSet execute(const std::string& sql) override;
    TableLookup describe_table(const TableRef& table) override;
    std::string quote_identifier(std::string_view name) const override;
    std::string_view dialect_name() const override { return "DuckDB"; }
    bool is_connected() const override;
    void close() override;

    DbResultSet load_frame(const std::string& table_name, const DataFrame& frame) override;
    DbResultSet lock_down() override;

private:
    std::unique_ptr<duckdb::DuckDB> db_;
    std::unique_ptr<duckdb::Connection> conn_;
};

} // namespace querygate
