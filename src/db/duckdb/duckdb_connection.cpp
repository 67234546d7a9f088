#include "db/duckdb/duckdb_connection.hpp"
#include "db/duckdb/duckdb_type_map.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>

namespace querygate {

namespace {

// Extension supply chain, external I/O, then freeze the configuration so
// user SQL cannot relax any of it.
constexpr std::array<const char*, 7> kLockDownStatements = {
    "SET allow_community_extensions = false",
    "SET allow_unsigned_extensions = false",
    "SET autoinstall_known_extensions = false",
    "SET autoload_known_extensions = false",
    "SET enable_external_access = false",
    "SET disabled_filesystems = 'LocalFileSystem'",
    "SET lock_configuration = true",
};

Value from_duckdb(const duckdb::Value& v, GenericColumnType type) {
    if (v.IsNull()) return std::monostate{};
    if (type == GenericColumnType::BOOLEAN) return v.GetValue<bool>();
    if (is_integer_type(type)) return v.GetValue<int64_t>();
    if (is_floating_type(type)) return v.GetValue<double>();
    return v.ToString();
}

duckdb::Value to_duckdb(const Value& v) {
    struct Converter {
        duckdb::Value operator()(std::monostate) const { return duckdb::Value(); }
        duckdb::Value operator()(bool b) const { return duckdb::Value::BOOLEAN(b); }
        duckdb::Value operator()(int64_t i) const { return duckdb::Value::BIGINT(i); }
        duckdb::Value operator()(double d) const { return duckdb::Value::DOUBLE(d); }
        duckdb::Value operator()(const std::string& s) const { return duckdb::Value(s); }
    };
    return std::visit(Converter{}, v);
}

DbResultSet collect(duckdb::QueryResult& result) {
    if (result.HasError()) {
        return DbResultSet::failure(result.GetError());
    }

    DbResultSet out;
    const auto ncols = result.ColumnCount();
    for (duckdb::idx_t i = 0; i < ncols; ++i) {
        out.column_names.push_back(result.ColumnName(i));
        out.column_types.push_back(DuckdbTypeMap::build_type_info(result.types[i]));
    }

    while (auto chunk = result.Fetch()) {
        if (chunk->size() == 0) break;
        for (duckdb::idx_t r = 0; r < chunk->size(); ++r) {
            std::vector<Value> row;
            row.reserve(ncols);
            for (duckdb::idx_t c = 0; c < ncols; ++c) {
                row.push_back(from_duckdb(chunk->GetValue(c, r), out.column_types[c].generic_type));
            }
            out.rows.push_back(std::move(row));
        }
    }
    if (result.HasError()) {
        return DbResultSet::failure(result.GetError());
    }

    out.success = true;
    out.has_rows = ncols > 0;
    out.affected_rows = out.rows.size();
    return out;
}

} // anonymous namespace

// ============================================================================
// DuckdbConnection
// ============================================================================

DuckdbConnection::DuckdbConnection(std::unique_ptr<duckdb::DuckDB> db,
                                   std::unique_ptr<duckdb::Connection> conn)
    : db_(std::move(db)), conn_(std::move(conn)) {}

DuckdbConnection::~DuckdbConnection() {
    close();
}

std::unique_ptr<DuckdbConnection> DuckdbConnection::open_in_memory() {
    try {
        auto db = std::make_unique<duckdb::DuckDB>(nullptr);
        auto conn = std::make_unique<duckdb::Connection>(*db);
        return std::make_unique<DuckdbConnection>(std::move(db), std::move(conn));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Failed to open DuckDB: {}", e.what()));
        return nullptr;
    }
}

DbResultSet DuckdbConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    try {
        auto prepared = conn_->Prepare(sql);
        if (prepared->HasError()) {
            return DbResultSet::failure(prepared->GetError());
        }
        duckdb::vector<duckdb::Value> params;
        auto result = prepared->Execute(params, false);
        return collect(*result);
    } catch (const std::exception& e) {
        return DbResultSet::failure(e.what());
    }
}

TableLookup DuckdbConnection::describe_table(const TableRef& table) {
    TableLookup lookup;
    if (!conn_) {
        lookup.error_message = "Connection is closed";
        return lookup;
    }

    std::string sql =
        "SELECT column_name, data_type FROM information_schema.columns "
        "WHERE table_name = $1 AND table_schema = $2";
    duckdb::vector<duckdb::Value> params = {
        duckdb::Value(table.table),
        duckdb::Value(table.schema.empty() ? std::string("main") : table.schema),
    };
    if (!table.catalog.empty()) {
        sql += " AND table_catalog = $3";
        params.push_back(duckdb::Value(table.catalog));
    }
    sql += " ORDER BY ordinal_position";

    try {
        auto prepared = conn_->Prepare(sql);
        if (prepared->HasError()) {
            lookup.error_message = prepared->GetError();
            return lookup;
        }
        auto result = prepared->Execute(params, false);
        auto rows = collect(*result);
        if (!rows.success) {
            lookup.error_message = rows.error_message;
            return lookup;
        }

        lookup.success = true;
        if (rows.rows.empty()) {
            return lookup;
        }

        TableMetadata meta;
        meta.ref = table;
        for (const auto& row : rows.rows) {
            const std::string name = format_value(row[0]);
            const std::string type = format_value(row[1]);
            meta.add_column(ColumnMetadata(name,
                ColumnTypeInfo(DuckdbTypeMap::type_name_to_generic(type), 0, type)));
        }
        lookup.table = std::move(meta);
    } catch (const std::exception& e) {
        lookup.success = false;
        lookup.error_message = e.what();
    }
    return lookup;
}

std::string DuckdbConnection::quote_identifier(std::string_view name) const {
    return quote_with(name, '"');
}

bool DuckdbConnection::is_connected() const {
    return conn_ != nullptr;
}

void DuckdbConnection::close() {
    // Connection must go before the database it belongs to.
    conn_.reset();
    db_.reset();
}

DbResultSet DuckdbConnection::load_frame(const std::string& table_name, const DataFrame& frame) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }
    if (frame.columns.empty()) {
        return DbResultSet::failure("Cannot load a frame with no columns");
    }
    if (!frame.is_rectangular()) {
        return DbResultSet::failure("Frame columns have different lengths");
    }

    std::string create = std::format("CREATE TABLE {} (", quote_identifier(table_name));
    for (size_t i = 0; i < frame.columns.size(); ++i) {
        if (i > 0) create += ", ";
        create += std::format("{} {}", quote_identifier(frame.columns[i].name),
                              DuckdbTypeMap::declared_type_for(frame.columns[i].type));
    }
    create += ')';

    try {
        auto created = conn_->Query(create);
        if (created->HasError()) {
            return DbResultSet::failure(created->GetError());
        }

        duckdb::Appender appender(*conn_, table_name);
        const size_t nrows = frame.row_count();
        for (size_t row = 0; row < nrows; ++row) {
            appender.BeginRow();
            for (const auto& col : frame.columns) {
                appender.Append<duckdb::Value>(to_duckdb(col.values[row]));
            }
            appender.EndRow();
        }
        appender.Close();

        auto result = DbResultSet::ok();
        result.affected_rows = nrows;
        return result;
    } catch (const std::exception& e) {
        return DbResultSet::failure(std::format("Failed to load frame into DuckDB: {}", e.what()));
    }
}

DbResultSet DuckdbConnection::lock_down() {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }
    for (const char* stmt : kLockDownStatements) {
        auto result = conn_->Query(stmt);
        if (result->HasError()) {
            return DbResultSet::failure(
                std::format("DuckDB lock-down failed at '{}': {}", stmt, result->GetError()));
        }
    }
    return DbResultSet::ok();
}

} // namespace querygate
