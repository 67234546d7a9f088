#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/text_value.hpp"
#include "core/utils.hpp"
#include <array>
#include <cstring>
#include <format>
#include <memory>

namespace querygate {

namespace {

// RAII wrapper for libpq results
struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    // Zero-parameter PQexecParams still uses the extended protocol, so a
    // second statement is a server-side error instead of being executed.
    PGResultPtr res(PQexecParams(conn_, sql.c_str(), 0, nullptr, nullptr, nullptr, nullptr, 0));
    if (!res) {
        return DbResultSet::failure(PQerrorMessage(conn_));
    }

    const ExecStatusType status = PQresultStatus(res.get());
    if (status == PGRES_TUPLES_OK) {
        return process_tuples_result(res.get());
    }
    if (status == PGRES_COMMAND_OK) {
        return process_command_result(res.get());
    }

    const char* msg = PQresultErrorMessage(res.get());
    return DbResultSet::failure(utils::trim(msg && *msg ? msg : PQerrorMessage(conn_)));
}

TableLookup PgConnection::describe_table(const TableRef& table) {
    TableLookup lookup;
    if (!conn_) {
        lookup.error_message = "Connection is closed";
        return lookup;
    }

    // An empty schema means "whatever current_schema() resolves to".
    static constexpr const char* kColumnsQuery =
        "SELECT column_name, data_type "
        "FROM information_schema.columns "
        "WHERE table_name::text = $1::text "
        "  AND table_schema::text = COALESCE(NULLIF($2::text, ''), current_schema()) "
        "  AND ($3::text = '' OR table_catalog::text = $3::text) "
        "ORDER BY ordinal_position";

    const std::array<const char*, 3> params = {
        table.table.c_str(), table.schema.c_str(), table.catalog.c_str()};

    PGResultPtr res(PQexecParams(conn_, kColumnsQuery, 3, nullptr, params.data(),
                                 nullptr, nullptr, 0));
    if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        lookup.error_message = utils::trim(res ? PQresultErrorMessage(res.get())
                                               : PQerrorMessage(conn_));
        return lookup;
    }

    lookup.success = true;
    const int nrows = PQntuples(res.get());
    if (nrows == 0) {
        return lookup;
    }

    static constexpr int COL_NAME = 0;
    static constexpr int COL_DATA_TYPE = 1;

    TableMetadata meta;
    meta.ref = table;
    for (int row = 0; row < nrows; ++row) {
        meta.add_column(ColumnMetadata(
            PQgetvalue(res.get(), row, COL_NAME),
            PgTypeMap::build_type_info(std::string_view(PQgetvalue(res.get(), row, COL_DATA_TYPE)))));
    }
    lookup.table = std::move(meta);
    return lookup;
}

std::string PgConnection::quote_identifier(std::string_view name) const {
    return quote_with(name, '"');
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));
        result.column_types.push_back(
            PgTypeMap::build_type_info(static_cast<uint32_t>(PQftype(res, i))));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<Value> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::monostate{});
                continue;
            }
            const std::string_view text(PQgetvalue(res, i, j),
                                        static_cast<size_t>(PQgetlength(res, i, j)));
            row.push_back(parse_text_value(text, result.column_types[j].generic_type));
        }
        result.rows.push_back(std::move(row));
    }

    result.affected_rows = result.rows.size();
    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::try_parse_int<uint64_t>(affected).value_or(0);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace querygate
