#include "datasource/data_source.hpp"
#include "db/engine_registry.hpp"
#include "schema/column_contract.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <type_traits>
#include <variant>

namespace querygate {

namespace {

// Letter first, then letters, digits or underscores.
bool is_valid_table_name(std::string_view name) {
    if (name.empty()) return false;
    const auto is_alpha = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    };
    if (!is_alpha(name.front())) return false;
    for (const char c : name.substr(1)) {
        if (!is_alpha(c) && !(c >= '0' && c <= '9') && c != '_') return false;
    }
    return true;
}

QueryResult materialize(DbResultSet&& rs) {
    QueryResult result;
    if (!rs.has_rows) {
        return result;
    }

    const size_t ncols = rs.column_names.size();
    result.columns.resize(ncols);
    for (size_t c = 0; c < ncols; ++c) {
        result.columns[c].name = std::move(rs.column_names[c]);
        if (c < rs.column_types.size()) {
            result.columns[c].type = rs.column_types[c];
        }
        result.columns[c].values.reserve(rs.rows.size());
    }

    for (auto& row : rs.rows) {
        for (size_t c = 0; c < ncols; ++c) {
            result.columns[c].values.push_back(
                c < row.size() ? std::move(row[c]) : Value{});
        }
    }
    result.row_count = rs.rows.size();
    return result;
}

} // anonymous namespace

std::string_view data_source_state_to_string(DataSourceState state) {
    switch (state) {
        case DataSourceState::CONSTRUCTED: return "constructed";
        case DataSourceState::VALIDATED:   return "validated";
        case DataSourceState::ACTIVE:      return "active";
        case DataSourceState::RELEASED:    return "released";
    }
    return "unknown";
}

// ============================================================================
// Construction
// ============================================================================

DataSource::DataSource(TableRef table, Backend backend, std::vector<ColumnMetadata> columns,
                       const DataSourceOptions& options)
    : table_(std::move(table)),
      identifier_(table_.full_name()),
      backend_(std::move(backend)),
      columns_(std::move(columns)),
      cleaner_(options.cleaner),
      guard_(QueryGuard::Config::resolve(options.guard)) {}

std::unique_ptr<DataSource> DataSource::from_frame(
    const DataFrame& frame, const std::string& table_name, DataSourceOptions options) {

    if (!is_valid_table_name(table_name)) {
        throw ConfigurationError(
            std::format("Invalid table name '{}': expected a letter followed by "
                        "letters, digits or underscores", table_name),
            table_name);
    }
    if (frame.columns.empty()) {
        throw ConfigurationError(std::format("Frame for table '{}' has no columns", table_name));
    }
    if (!frame.is_rectangular()) {
        throw ConfigurationError(
            std::format("Frame for table '{}' has columns of different lengths", table_name));
    }

    auto& registry = EngineRegistry::instance();
    const EngineType type = registry.resolve(options.engine);
    auto engine = registry.create(type);

    auto loaded = engine->load_frame(table_name, frame);
    if (!loaded.success) {
        throw BackendExecutionError(
            std::format("Failed to load table '{}' into {}: {}",
                        table_name, engine->dialect_name(), loaded.error_message),
            table_name);
    }

    auto locked = engine->lock_down();
    if (!locked.success) {
        throw BackendExecutionError(
            std::format("Failed to lock down {} engine: {}",
                        engine->dialect_name(), locked.error_message),
            table_name);
    }

    TableRef ref(table_name);
    auto lookup = engine->describe_table(ref);
    if (!lookup.success || !lookup.table) {
        throw BackendExecutionError(
            std::format("Failed to read back columns of '{}': {}", table_name,
                        lookup.success ? "table missing after load" : lookup.error_message),
            table_name);
    }

    auto columns = std::move(lookup.table->columns);
    utils::log::info(std::format("Data source '{}' ready: embedded {}, {} columns, {} rows",
        table_name, engine_type_to_string(type), columns.size(), frame.row_count()));

    std::unique_ptr<DataSource> source(new DataSource(
        std::move(ref), EmbeddedBackend{std::move(engine), type}, std::move(columns), options));
    source->state_ = DataSourceState::VALIDATED;
    return source;
}

std::unique_ptr<DataSource> DataSource::from_connection(
    std::shared_ptr<IDbConnection> connection, TableRef table, DataSourceOptions options) {

    if (!connection || !connection->is_connected()) {
        throw ConfigurationError("External data source requires an open connection");
    }
    if (table.table.empty()) {
        throw ConfigurationError("External data source requires a table name");
    }

    auto lookup = connection->describe_table(table);
    if (!lookup.success) {
        throw BackendExecutionError(
            std::format("Failed to look up table '{}': {}", table.full_name(), lookup.error_message),
            table.full_name());
    }
    if (!lookup.table) {
        throw TableNotFoundError(
            std::format("Table '{}' does not exist in the {} database",
                        table.full_name(), connection->dialect_name()),
            table.full_name());
    }

    // MySQL's default sql_mode treats a backslash inside a string as an escape.
    if (connection->dialect_name() == "MySQL") {
        options.cleaner.backslash_escapes = true;
    }

    auto columns = std::move(lookup.table->columns);
    utils::log::info(std::format("Data source '{}' ready: external {}, {} columns",
        table.full_name(), connection->dialect_name(), columns.size()));

    std::unique_ptr<DataSource> source(new DataSource(
        std::move(table),
        ExternalBackend{std::move(connection), options.owns_connection},
        std::move(columns), options));
    source->state_ = DataSourceState::VALIDATED;
    return source;
}

DataSource::~DataSource() {
    release();
}

// ============================================================================
// Accessors
// ============================================================================

const std::string& DataSource::identifier() const {
    ensure_open();
    return identifier_;
}

const TableRef& DataSource::table() const {
    ensure_open();
    return table_;
}

BackendKind DataSource::backend_kind() const {
    ensure_open();
    return std::holds_alternative<EmbeddedBackend>(backend_)
        ? BackendKind::EMBEDDED : BackendKind::EXTERNAL;
}

std::string DataSource::db_type() const {
    ensure_open();
    return std::string(connection().dialect_name());
}

const std::vector<ColumnMetadata>& DataSource::column_schema() const {
    ensure_open();
    return columns_;
}

std::string DataSource::quote_identifier(std::string_view name) const {
    ensure_open();
    return connection().quote_identifier(name);
}

std::string DataSource::quoted_table() const {
    ensure_open();
    return connection().quote_table(table_);
}

void DataSource::ensure_open() const {
    if (state_ == DataSourceState::RELEASED) {
        throw SourceReleasedError(identifier_);
    }
}

IDbConnection& DataSource::connection() const {
    return std::visit([](const auto& backend) -> IDbConnection& {
        using T = std::decay_t<decltype(backend)>;
        if constexpr (std::is_same_v<T, EmbeddedBackend>) {
            return *backend.engine;
        } else {
            return *backend.connection;
        }
    }, backend_);
}

// ============================================================================
// Query Path
// ============================================================================

std::optional<std::string> DataSource::prepare(std::optional<std::string_view> query) const {
    if (!query || query->empty()) {
        return std::nullopt;
    }

    auto cleaned = cleaner_.clean(*query);
    if (!cleaned.has_content()) {
        return std::nullopt;
    }

    // Keyword scan runs before ')' repair so appended text cannot shift it.
    guard_.check(cleaned.pre_repair_query);
    return std::move(cleaned.query);
}


QueryResult DataSource::run(const std::string& sql) {
    utils::Timer timer;
    auto rs = connection().execute(sql);
    if (!rs.success) {
        utils::log::error(std::format("Query against '{}' failed: {}", identifier_, rs.error_message));
        throw BackendExecutionError(
            std::format("{} query against '{}' failed: {}",
                        connection().dialect_name(), identifier_, rs.error_message),
            sql);
    }

    auto result = materialize(std::move(rs));
    result.execution_time = timer.elapsed_us();
    state_ = DataSourceState::ACTIVE;
    return result;
}

QueryResult DataSource::execute(std::optional<std::string_view> query) {
    ensure_open();
    const auto sql = prepare(query);
    return run(sql ? *sql : "SELECT * FROM " + quoted_table());
}

QueryResult DataSource::fetch_one_row(std::string_view query, bool require_all_columns) {
    ensure_open();
    const auto sql = prepare(query);
    const std::string limited = sql
        ? std::format("SELECT * FROM ({}) AS querygate_probe LIMIT 1", *sql)
        : "SELECT * FROM " + quoted_table() + " LIMIT 1";

    auto result = run(limited);
    if (require_all_columns) {
        std::vector<std::string> required;
        required.reserve(columns_.size());
        for (const auto& col : columns_) {
            required.push_back(col.name);
        }
        ColumnContractValidator::validate(required, result.column_names());
    }
    return result;
}

QueryResult DataSource::execute_generated(const std::string& sql) {
    ensure_open();
    guard_.check(sql);
    return run(sql);
}

QueryResult DataSource::fetch_all() {
    ensure_open();
    return run("SELECT * FROM " + quoted_table());
}

void DataSource::release() {
    if (state_ == DataSourceState::RELEASED) {
        return;
    }
    state_ = DataSourceState::RELEASED;

    std::visit([](auto& backend) {
        using T = std::decay_t<decltype(backend)>;
        if constexpr (std::is_same_v<T, EmbeddedBackend>) {
            if (backend.engine) {
                backend.engine->close();
                backend.engine.reset();
            }
        } else {
            if (backend.owns_connection && backend.connection) {
                backend.connection->close();
            }
            backend.connection.reset();
        }
    }, backend_);

    utils::log::info(std::format("Data source '{}' released", identifier_));
}

} // namespace querygate
