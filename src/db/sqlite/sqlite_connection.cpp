#include "db/sqlite/sqlite_connection.hpp"
#include "db/sqlite/sqlite_type_map.hpp"
#include "core/utils.hpp"

#include <format>
#include <optional>

namespace querygate {

namespace {

// RAII wrapper for prepared statements
struct SqliteStmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

// Only ATTACH/DETACH reach outside the private database file.
int deny_attach(void* /*user*/, int action, const char*, const char*, const char*, const char*) {
    return (action == SQLITE_ATTACH || action == SQLITE_DETACH) ? SQLITE_DENY : SQLITE_OK;
}

Value read_column(sqlite3_stmt* stmt, int col, GenericColumnType declared) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_NULL:
            return std::monostate{};
        case SQLITE_INTEGER: {
            const int64_t v = sqlite3_column_int64(stmt, col);
            if (declared == GenericColumnType::BOOLEAN) return v != 0;
            return v;
        }
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            const int bytes = sqlite3_column_bytes(stmt, col);
            return std::string(data ? data : "", static_cast<size_t>(bytes));
        }
        default: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            const int bytes = sqlite3_column_bytes(stmt, col);
            return std::string(text ? text : "", static_cast<size_t>(bytes));
        }
    }
}

int bind_value(sqlite3_stmt* stmt, int index, const Value& value) {
    struct Binder {
        sqlite3_stmt* stmt;
        int index;
        int operator()(std::monostate) const { return sqlite3_bind_null(stmt, index); }
        int operator()(bool b) const { return sqlite3_bind_int(stmt, index, b ? 1 : 0); }
        int operator()(int64_t i) const { return sqlite3_bind_int64(stmt, index, i); }
        int operator()(double d) const { return sqlite3_bind_double(stmt, index, d); }
        int operator()(const std::string& s) const {
            return sqlite3_bind_text(stmt, index, s.data(), static_cast<int>(s.size()),
                                     SQLITE_TRANSIENT);
        }
    };
    return std::visit(Binder{stmt, index}, value);
}

bool only_whitespace(const char* p) {
    if (!p) return true;
    for (; *p; ++p) {
        if (*p != ' ' && *p != '\t' && *p != '\n' && *p != '\r') return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

std::unique_ptr<SqliteConnection> SqliteConnection::open(const std::string& path, bool read_only) {
    int flags = read_only ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
    if (path == ":memory:") {
        flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        utils::log::error(std::format("Failed to open SQLite database '{}': {}",
            path, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
        sqlite3_close(db);
        return nullptr;
    }

    sqlite3_extended_result_codes(db, 1);
    return std::make_unique<SqliteConnection>(db);
}

DbResultSet SqliteConnection::failure_from_db(std::string_view context) const {
    if (context.empty()) {
        return DbResultSet::failure(sqlite3_errmsg(db_));
    }
    return DbResultSet::failure(std::format("{}: {}", context, sqlite3_errmsg(db_)));
}

DbResultSet SqliteConnection::execute(const std::string& sql) {
    if (!db_) {
        return DbResultSet::failure("Connection is closed");
    }

    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, &tail);
    SqliteStmtPtr stmt(raw);
    if (rc != SQLITE_OK) {
        return failure_from_db("");
    }
    if (!only_whitespace(tail)) {
        return DbResultSet::failure("Multiple statements are not allowed in one execution");
    }
    if (!stmt) {
        // Empty statement (whitespace only)
        return DbResultSet::ok();
    }

    DbResultSet result;
    const int ncols = sqlite3_column_count(stmt.get());
    result.column_names.reserve(ncols);
    result.column_types.reserve(ncols);
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        const char* decl = sqlite3_column_decltype(stmt.get(), i);
        result.column_names.emplace_back(name ? name : "");
        result.column_types.push_back(SqliteTypeMap::build_type_info(decl ? decl : ""));
    }

    while (true) {
        const int step = sqlite3_step(stmt.get());
        if (step == SQLITE_DONE) break;
        if (step != SQLITE_ROW) {
            return failure_from_db("");
        }

        std::vector<Value> row;
        row.reserve(ncols);
        for (int i = 0; i < ncols; ++i) {
            row.push_back(read_column(stmt.get(), i, result.column_types[i].generic_type));
        }
        result.rows.push_back(std::move(row));
    }

    // Expression columns have no declared type; classify from the first non-null value.
    for (int i = 0; i < ncols; ++i) {
        auto& type = result.column_types[i];
        if (!type.vendor_type_name.empty()) continue;
        for (const auto& row : result.rows) {
            if (is_null(row[i])) continue;
            if (std::holds_alternative<int64_t>(row[i])) {
                type.generic_type = SqliteTypeMap::storage_class_to_generic(SQLITE_INTEGER);
            } else if (std::holds_alternative<double>(row[i])) {
                type.generic_type = SqliteTypeMap::storage_class_to_generic(SQLITE_FLOAT);
            } else {
                type.generic_type = SqliteTypeMap::storage_class_to_generic(SQLITE_TEXT);
            }
            break;
        }
    }

    result.success = true;
    result.has_rows = ncols > 0;
    result.affected_rows = ncols > 0
        ? result.rows.size()
        : static_cast<uint64_t>(sqlite3_changes(db_));
    return result;
}

TableLookup SqliteConnection::describe_table(const TableRef& table) {
    TableLookup lookup;
    if (!db_) {
        lookup.error_message = "Connection is closed";
        return lookup;
    }

    static constexpr const char* kColumnsQuery =
        "SELECT name, type FROM pragma_table_info(?1, ?2) ORDER BY cid";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, kColumnsQuery, -1, &raw, nullptr) != SQLITE_OK) {
        SqliteStmtPtr guard(raw);
        lookup.error_message = sqlite3_errmsg(db_);
        return lookup;
    }
    SqliteStmtPtr stmt(raw);

    // SQLite has no catalogs; a qualifier names an attached schema.
    const std::string& schema = !table.schema.empty() ? table.schema
                              : !table.catalog.empty() ? table.catalog
                              : std::string("main");
    sqlite3_bind_text(stmt.get(), 1, table.table.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, schema.c_str(), -1, SQLITE_TRANSIENT);

    TableMetadata meta;
    meta.ref = table;
    int step = SQLITE_OK;
    while ((step = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const auto* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
        const auto* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
        meta.add_column(ColumnMetadata(name ? name : "",
                                       SqliteTypeMap::build_type_info(type ? type : "")));
    }
    if (step != SQLITE_DONE) {
        lookup.error_message = sqlite3_errmsg(db_);
        return lookup;
    }

    lookup.success = true;
    if (!meta.columns.empty()) {
        lookup.table = std::move(meta);
    }
    return lookup;
}

std::string SqliteConnection::quote_identifier(std::string_view name) const {
    return quote_with(name, '"');
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

DbResultSet SqliteConnection::load_frame(const std::string& table_name, const DataFrame& frame) {
    if (!db_) {
        return DbResultSet::failure("Connection is closed");
    }
    if (frame.columns.empty()) {
        return DbResultSet::failure("Cannot load a frame with no columns");
    }
    if (!frame.is_rectangular()) {
        return DbResultSet::failure("Frame columns have different lengths");
    }

    std::string create = std::format("CREATE TABLE {} (", quote_identifier(table_name));
    std::string insert = std::format("INSERT INTO {} VALUES (", quote_identifier(table_name));
    for (size_t i = 0; i < frame.columns.size(); ++i) {
        if (i > 0) {
            create += ", ";
            insert += ", ";
        }
        create += std::format("{} {}", quote_identifier(frame.columns[i].name),
                              SqliteTypeMap::declared_type_for(frame.columns[i].type));
        insert += std::format("?{}", i + 1);
    }
    create += ')';
    insert += ')';

    if (auto r = execute(create); !r.success) {
        return r;
    }
    if (sqlite3_exec(db_, "BEGIN", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return failure_from_db("BEGIN failed");
    }

    const auto rollback = [this](DbResultSet failure) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        return failure;
    };

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, insert.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        SqliteStmtPtr guard(raw);
        return rollback(failure_from_db("Failed to prepare insert"));
    }
    SqliteStmtPtr stmt(raw);

    const size_t nrows = frame.row_count();
    for (size_t row = 0; row < nrows; ++row) {
        for (size_t col = 0; col < frame.columns.size(); ++col) {
            if (bind_value(stmt.get(), static_cast<int>(col + 1),
                           frame.columns[col].values[row]) != SQLITE_OK) {
                return rollback(failure_from_db("Failed to bind value"));
            }
        }
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return rollback(failure_from_db(std::format("Failed to insert row {}", row)));
        }
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());
    }

    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return rollback(failure_from_db("COMMIT failed"));
    }

    auto result = DbResultSet::ok();
    result.affected_rows = nrows;
    return result;
}

DbResultSet SqliteConnection::lock_down() {
    if (!db_) {
        return DbResultSet::failure("Connection is closed");
    }
    if (sqlite3_db_config(db_, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 0, nullptr) != SQLITE_OK ||
        sqlite3_db_config(db_, SQLITE_DBCONFIG_DEFENSIVE, 1, nullptr) != SQLITE_OK) {
        return failure_from_db("Failed to restrict SQLite configuration");
    }
    if (sqlite3_set_authorizer(db_, deny_attach, nullptr) != SQLITE_OK) {
        return failure_from_db("Failed to install SQLite authorizer");
    }
    return DbResultSet::ok();
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> SqliteConnectionFactory::create(
    const std::string& connection_string) {

    std::string_view path(connection_string);
    if (path.starts_with("sqlite://")) {
        path.remove_prefix(9);
    }
    return SqliteConnection::open(std::string(path));
}

} // namespace querygate
