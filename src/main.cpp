#include "core/utils.hpp"
#include "core/error.hpp"
#include "config/config_loader.hpp"
#include "datasource/data_source.hpp"
#include "db/engine_registry.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "schema/schema_inspector.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_connection.hpp"
#endif
#ifdef ENABLE_MYSQL
#include "db/mysql/mysql_connection.hpp"
#endif

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace querygate;

namespace {

struct CliOptions {
    std::optional<std::string> config_file;
    std::string backend;            // "sqlite" | "postgresql" | "mysql"
    std::string connection_string;
    std::string table;
    bool schema = false;
    bool one_row = false;
    bool require_all_columns = false;
    bool owned = false;
    std::optional<std::string> query;
};

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} [--config FILE] (--sqlite DB | --postgres CONNINFO | --mysql URI)\n"
        "       --table NAME [--schema] [--one-row] [--require-all-columns] [--owned] [QUERY]\n"
        "\n"
        "Runs QUERY (or the whole table) through the cleaner and the read-only\n"
        "guard and prints the result as JSON. --schema prints the table description.\n",
        prog);
}

// Returns std::nullopt after printing a diagnostic.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    const std::vector<std::string_view> args(argv + 1, argv + argc);

    for (size_t i = 0; i < args.size(); ++i) {
        const auto arg = args[i];
        const auto take_value = [&](std::string_view flag) -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                utils::log::error(std::format("{} requires a value", flag));
                return std::nullopt;
            }
            return std::string(args[++i]);
        };

        if (arg == "--config") {
            opts.config_file = take_value(arg);
            if (!opts.config_file) return std::nullopt;
        } else if (arg == "--sqlite" || arg == "--postgres" || arg == "--mysql") {
            if (!opts.backend.empty()) {
                utils::log::error("Only one of --sqlite, --postgres, --mysql may be given");
                return std::nullopt;
            }
            auto value = take_value(arg);
            if (!value) return std::nullopt;
            opts.backend = arg == "--sqlite" ? "sqlite" : arg == "--postgres" ? "postgresql" : "mysql";
            opts.connection_string = std::move(*value);
        } else if (arg == "--table") {
            auto value = take_value(arg);
            if (!value) return std::nullopt;
            opts.table = std::move(*value);
        } else if (arg == "--schema") {
            opts.schema = true;
        } else if (arg == "--one-row") {
            opts.one_row = true;
        } else if (arg == "--require-all-columns") {
            opts.require_all_columns = true;
        } else if (arg == "--owned") {
            opts.owned = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg.starts_with("--")) {
            utils::log::error(std::format("Unknown option {}", arg));
            return std::nullopt;
        } else if (!opts.query) {
            opts.query = std::string(arg);
        } else {
            utils::log::error("Only one QUERY argument is accepted");
            return std::nullopt;
        }
    }

    if (opts.backend.empty() || opts.table.empty()) {
        utils::log::error("A backend (--sqlite, --postgres or --mysql) and --table are required");
        return std::nullopt;
    }
    return opts;
}

// "table", "schema.table" or "catalog.schema.table"
TableRef parse_table_ref(const std::string& name) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t dot = name.find('.', start);
        parts.push_back(name.substr(start, dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }

    switch (parts.size()) {
        case 1: return TableRef(parts[0]);
        case 2: return TableRef(parts[0], parts[1]);
        case 3: return TableRef(parts[0], parts[1], parts[2]);
        default:
            throw ConfigurationError(
                std::format("Table name '{}' has too many parts", name), name);
    }
}

std::unique_ptr<IDbConnection> open_connection(const CliOptions& opts) {
    std::unique_ptr<IConnectionFactory> factory;
    if (opts.backend == "sqlite") {
        factory = std::make_unique<SqliteConnectionFactory>();
    }
#ifdef ENABLE_POSTGRESQL
    if (opts.backend == "postgresql") {
        factory = std::make_unique<PgConnectionFactory>();
    }
#endif
#ifdef ENABLE_MYSQL
    if (opts.backend == "mysql") {
        factory = std::make_unique<MysqlConnectionFactory>();
    }
#endif

    if (!factory) {
        throw ConfigurationError(
            std::format("Backend '{}' is not available in this build", opts.backend),
            opts.backend);
    }

    auto conn = factory->create(opts.connection_string);
    if (!conn) {
        throw BackendExecutionError(
            std::format("Failed to connect to {} database", opts.backend), "");
    }
    return conn;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 2;
    }

    GatewayConfig config;
    if (opts->config_file) {
        auto loaded = ConfigLoader::load_from_file(*opts->config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            std::cout << ConfigurationError(loaded.error_message, *opts->config_file).to_json()
                      << '\n';
            return 1;
        }
        config = std::move(loaded.config);
    }
    utils::log::set_level(config.logging.level);

    try {
        if (config.engine.default_engine) {
            EngineRegistry::instance().set_default_engine(*config.engine.default_engine);
        }

        DataSourceOptions options;
        options.cleaner.enforce_select = config.query.enforce_select;
        options.guard.allow_update_queries = config.query.enable_update_queries;
        options.owns_connection = opts->owned;

        std::shared_ptr<IDbConnection> conn = open_connection(*opts);
        auto source = DataSource::from_connection(conn, parse_table_ref(opts->table), options);

        if (opts->schema) {
            const SchemaInspector inspector(config.schema.categorical_threshold);
            std::cout << inspector.describe(*source) << '\n';
        } else if (opts->one_row) {
            const auto result = source->fetch_one_row(opts->query.value_or(""),
                                                      opts->require_all_columns);
            std::cout << result.to_json() << '\n';
        } else {
            std::optional<std::string_view> query;
            if (opts->query) query = *opts->query;
            const auto result = source->execute(query);
            utils::log::info(std::format("{} rows in {}us", result.row_count,
                                         result.execution_time.count()));
            std::cout << result.to_json() << '\n';
        }

        source->release();
        if (!opts->owned) {
            conn->close();
        }
        return 0;
    } catch (const GatewayError& e) {
        utils::log::error(std::format("{}: {}", error_kind_to_string(e.kind()), e.message()));
        std::cout << e.to_json() << '\n';
        return 1;
    }
}
