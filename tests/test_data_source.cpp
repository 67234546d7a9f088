#include <catch2/catch_test_macros.hpp>
#include "datasource/data_source.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "core/error.hpp"
#include "mocks/mock_connection.hpp"

using namespace querygate;
using querygate::testing::MockConnection;

namespace {

DataFrame make_sales_frame() {
    DataFrame frame;
    frame.columns.push_back({"id", GenericColumnType::BIGINT,
        {Value{int64_t{1}}, Value{int64_t{2}}, Value{int64_t{3}}}});
    frame.columns.push_back({"region", GenericColumnType::TEXT,
        {Value{std::string("east")}, Value{std::string("west")}, Value{std::string("east")}}});
    frame.columns.push_back({"amount", GenericColumnType::DOUBLE_PRECISION,
        {Value{10.5}, Value{20.0}, Value{}}});
    return frame;
}

DataSourceOptions sqlite_options() {
    DataSourceOptions options;
    options.engine = "sqlite";
    return options;
}

// An external SQLite database with a populated "orders" table.
std::shared_ptr<SqliteConnection> make_orders_db() {
    std::shared_ptr<SqliteConnection> conn = SqliteConnection::open(":memory:");
    REQUIRE(conn);
    REQUIRE(conn->execute("CREATE TABLE orders (id INTEGER, customer TEXT, total REAL)").success);
    REQUIRE(conn->execute("INSERT INTO orders VALUES (1, 'ann', 9.5), (2, 'bob', 12.25)").success);
    return conn;
}

} // anonymous namespace

// ============================================================================
// Embedded backend
// ============================================================================

TEST_CASE("DataSource: embedded construction", "[datasource]") {
    auto source = DataSource::from_frame(make_sales_frame(), "sales", sqlite_options());

    REQUIRE(source->identifier() == "sales");
    REQUIRE(source->backend_kind() == BackendKind::EMBEDDED);
    REQUIRE(source->db_type() == "SQLite");
    REQUIRE(source->state() == DataSourceState::VALIDATED);

    const auto& columns = source->column_schema();
    REQUIRE(columns.size() == 3);
    REQUIRE(columns[0].name == "id");
    REQUIRE(columns[1].name == "region");
    REQUIRE(columns[2].name == "amount");
    REQUIRE(columns[0].type.generic_type == GenericColumnType::BIGINT);
}

TEST_CASE("DataSource: table name validation", "[datasource]") {
    const auto frame = make_sales_frame();

    REQUIRE_NOTHROW(DataSource::from_frame(frame, "Sales_2024", sqlite_options()));
    REQUIRE_THROWS_AS(DataSource::from_frame(frame, "", sqlite_options()), ConfigurationError);
    REQUIRE_THROWS_AS(DataSource::from_frame(frame, "2024sales", sqlite_options()), ConfigurationError);
    REQUIRE_THROWS_AS(DataSource::from_frame(frame, "_sales", sqlite_options()), ConfigurationError);
    REQUIRE_THROWS_AS(DataSource::from_frame(frame, "sales; DROP", sqlite_options()), ConfigurationError);
    REQUIRE_THROWS_AS(DataSource::from_frame(frame, "sales-data", sqlite_options()), ConfigurationError);
}

TEST_CASE("DataSource: frame validation", "[datasource]") {
    SECTION("No columns") {
        REQUIRE_THROWS_AS(DataSource::from_frame(DataFrame{}, "t", sqlite_options()),
                          ConfigurationError);
    }

    SECTION("Ragged columns") {
        auto frame = make_sales_frame();
        frame.columns[1].values.pop_back();
        REQUIRE_THROWS_AS(DataSource::from_frame(frame, "t", sqlite_options()), ConfigurationError);
    }

    SECTION("Unknown engine") {
        DataSourceOptions options;
        options.engine = "oracle";
        REQUIRE_THROWS_AS(DataSource::from_frame(make_sales_frame(), "t", options),
                          ConfigurationError);
    }
}

TEST_CASE("DataSource: identity query", "[datasource]") {
    auto source = DataSource::from_frame(make_sales_frame(), "sales", sqlite_options());

    for (const std::optional<std::string_view> query :
         {std::optional<std::string_view>{}, std::optional<std::string_view>{""},
          std::optional<std::string_view>{"  -- just a comment"}}) {
        const auto result = source->execute(query);
        REQUIRE(result.row_count == 3);
        REQUIRE(result.column_names() == std::vector<std::string>{"id", "region", "amount"});
        for (const auto& col : result.columns) {
            REQUIRE(col.values.size() == result.row_count);
        }
    }

    const auto all = source->fetch_all();
    REQUIRE(all.row_count == 3);
    REQUIRE(std::get<int64_t>(all.at(0, 0)) == 1);
    REQUIRE(std::get<std::string>(all.at(1, 1)) == "west");
    REQUIRE(std::get<double>(all.at(0, 2)) == 10.5);
    REQUIRE(is_null(all.at(2, 2)));
    REQUIRE(source->state() == DataSourceState::ACTIVE);
}

TEST_CASE("DataSource: query execution goes through the cleaner", "[datasource]") {
    auto source = DataSource::from_frame(make_sales_frame(), "sales", sqlite_options());

    SECTION("Aggregation") {
        const auto result = source->execute(
            "SELECT region, COUNT(*) AS n FROM sales GROUP BY region ORDER BY region");
        REQUIRE(result.row_count == 2);
        REQUIRE(std::get<std::string>(result.at(0, 0)) == "east");
        REQUIRE(std::get<int64_t>(result.at(0, 1)) == 2);
    }

    SECTION("Comments, trailing statements and a missing paren are repaired") {
        const auto result = source->execute(
            "/* count */ SELECT COUNT(*) AS n FROM sales WHERE id IN (1, 2; DROP TABLE sales");
        REQUIRE(result.row_count == 1);
        REQUIRE(std::get<int64_t>(result.at(0, 0)) == 2);

        // The table survived
        REQUIRE(source->fetch_all().row_count == 3);
    }
}

TEST_CASE("DataSource: policy enforcement", "[datasource]") {
    auto source = DataSource::from_frame(make_sales_frame(), "sales", sqlite_options());

    REQUIRE_THROWS_AS(source->execute("DROP TABLE sales"), PolicyViolation);
    REQUIRE_THROWS_AS(source->execute("DELETE FROM sales"), PolicyViolation);
    REQUIRE_THROWS_AS(source->execute("INSERT INTO sales VALUES (4, 'north', 1.0)"), PolicyViolation);
    REQUIRE_THROWS_AS(source->fetch_one_row("UPDATE sales SET amount = 0"), PolicyViolation);
    REQUIRE(source->fetch_all().row_count == 3);
}

TEST_CASE("DataSource: update queries when enabled", "[datasource]") {
    auto options = sqlite_options();
    options.guard.allow_update_queries = true;
    auto source = DataSource::from_frame(make_sales_frame(), "sales", options);

    const auto inserted = source->execute("INSERT INTO sales VALUES (4, 'north', 1.0)");
    REQUIRE(inserted.row_count == 0);
    REQUIRE(source->fetch_all().row_count == 4);
    REQUIRE_THROWS_AS(source->execute("DELETE FROM sales"), PolicyViolation);
}

TEST_CASE("DataSource: enforce_select", "[datasource]") {
    auto options = sqlite_options();
    options.cleaner.enforce_select = true;
    auto source = DataSource::from_frame(make_sales_frame(), "sales", options);

    REQUIRE_THROWS_AS(source->execute("WITH x AS (SELECT 1) SELECT * FROM x"), NotASelectError);
    REQUIRE(source->execute("SELECT id FROM sales").row_count == 3);
}

TEST_CASE("DataSource: backend errors", "[datasource]") {
    auto source = DataSource::from_frame(make_sales_frame(), "sales", sqlite_options());

    try {
        (void)source->execute("SELECT nope FROM sales");
        FAIL("expected BackendExecutionError");
    } catch (const BackendExecutionError& e) {
        REQUIRE(e.kind() == ErrorKind::BACKEND_EXECUTION);
        REQUIRE(e.message().find("sales") != std::string::npos);
        REQUIRE(e.message().find("nope") != std::string::npos);
        REQUIRE(e.offending_fragment() == "SELECT nope FROM sales");
    }
}

TEST_CASE("DataSource: embedded engine is locked down", "[datasource]") {
    auto source = DataSource::from_frame(make_sales_frame(), "sales", sqlite_options());

    // ATTACH never reaches the engine. Extension loading inside a SELECT
    // passes the guard and is refused by the engine itself.
    REQUIRE_THROWS_AS(source->execute("ATTACH ':memory:' AS other"), PolicyViolation);
    REQUIRE_THROWS_AS(source->execute("SELECT load_extension('x')"), BackendExecutionError);
}

TEST_CASE("DataSource: independent embedded instances", "[datasource]") {
    auto first = DataSource::from_frame(make_sales_frame(), "sales", sqlite_options());

    DataFrame other;
    other.columns.push_back({"x", GenericColumnType::BIGINT, {Value{int64_t{7}}}});
    auto second = DataSource::from_frame(other, "sales", sqlite_options());

    REQUIRE(first->fetch_all().row_count == 3);
    REQUIRE(second->fetch_all().row_count == 1);
    REQUIRE(second->column_schema().size() == 1);
}

TEST_CASE("DataSource: fetch_one_row", "[datasource]") {
    auto source = DataSource::from_frame(make_sales_frame(), "sales", sqlite_options());

    SECTION("Capped to one row") {
        const auto result = source->fetch_one_row("SELECT * FROM sales ORDER BY id DESC");
        REQUIRE(result.row_count == 1);
        REQUIRE(std::get<int64_t>(result.at(0, 0)) == 3);
    }

    SECTION("Empty query fetches the first table row") {
        const auto result = source->fetch_one_row("");
        REQUIRE(result.row_count == 1);
        REQUIRE(result.columns.size() == 3);
    }

    SECTION("Column contract satisfied") {
        REQUIRE_NOTHROW(source->fetch_one_row("SELECT *, amount * 2 AS doubled FROM sales", true));
    }

    SECTION("Column contract violated") {
        try {
            (void)source->fetch_one_row("SELECT id FROM sales", true);
            FAIL("expected ColumnMismatchError");
        } catch (const ColumnMismatchError& e) {
            REQUIRE(e.missing_columns() == std::vector<std::string>{"amount", "region"});
        }
    }

    SECTION("Contract not checked unless requested") {
        REQUIRE_NOTHROW(source->fetch_one_row("SELECT id FROM sales"));
    }

    SECTION("No matching rows keeps the columns") {
        const auto result = source->fetch_one_row("SELECT * FROM sales WHERE id > 99", true);
        REQUIRE(result.row_count == 0);
        REQUIRE(result.column_names() == std::vector<std::string>{"id", "region", "amount"});
    }
}

TEST_CASE("DataSource: release lifecycle", "[datasource]") {
    auto source = DataSource::from_frame(make_sales_frame(), "sales", sqlite_options());
    source->release();

    REQUIRE(source->state() == DataSourceState::RELEASED);
    REQUIRE_NOTHROW(source->release());

    REQUIRE_THROWS_AS(source->execute("SELECT 1"), SourceReleasedError);
    REQUIRE_THROWS_AS(source->fetch_one_row("SELECT 1"), SourceReleasedError);
    REQUIRE_THROWS_AS(source->fetch_all(), SourceReleasedError);
    REQUIRE_THROWS_AS(source->column_schema(), SourceReleasedError);
    REQUIRE_THROWS_AS(source->db_type(), SourceReleasedError);
    REQUIRE_THROWS_AS(source->identifier(), SourceReleasedError);
    REQUIRE_THROWS_AS(source->table(), SourceReleasedError);
    REQUIRE_THROWS_AS(source->backend_kind(), SourceReleasedError);
    REQUIRE_THROWS_AS(source->quoted_table(), SourceReleasedError);
}

#ifdef ENABLE_DUCKDB
TEST_CASE("DataSource: embedded DuckDB", "[datasource][duckdb]") {
    DataSourceOptions options;
    options.engine = "duckdb";
    auto source = DataSource::from_frame(make_sales_frame(), "sales", options);

    REQUIRE(source->db_type() == "DuckDB");
    REQUIRE(source->fetch_all().row_count == 3);

    const auto result = source->execute("SELECT SUM(amount) AS total FROM sales");
    REQUIRE(std::get<double>(result.at(0, 0)) == 30.5);

    // Configuration is locked after load
    REQUIRE_THROWS_AS(source->execute("SELECT * FROM read_csv('/etc/passwd')"),
                      BackendExecutionError);
}
#endif

// ============================================================================
// External backend
// ============================================================================

TEST_CASE("DataSource: external SQLite connection", "[datasource][external]") {
    auto conn = make_orders_db();
    auto source = DataSource::from_connection(conn, TableRef("orders"));

    REQUIRE(source->backend_kind() == BackendKind::EXTERNAL);
    REQUIRE(source->db_type() == "SQLite");
    REQUIRE(source->column_schema().size() == 3);

    const auto result = source->execute("SELECT customer FROM orders WHERE total > 10");
    REQUIRE(result.row_count == 1);
    REQUIRE(std::get<std::string>(result.at(0, 0)) == "bob");

    REQUIRE_THROWS_AS(source->execute("DROP TABLE orders"), PolicyViolation);
}

TEST_CASE("DataSource: external table must exist", "[datasource][external]") {
    auto conn = make_orders_db();
    try {
        (void)DataSource::from_connection(conn, TableRef("missing"));
        FAIL("expected TableNotFoundError");
    } catch (const TableNotFoundError& e) {
        REQUIRE(e.kind() == ErrorKind::TABLE_NOT_FOUND);
        REQUIRE(e.offending_fragment() == "missing");
    }
}

TEST_CASE("DataSource: external ownership on release", "[datasource][external]") {
    SECTION("Borrowed connection stays open") {
        auto conn = make_orders_db();
        auto source = DataSource::from_connection(conn, TableRef("orders"));
        source->release();
        REQUIRE(conn->is_connected());
        REQUIRE(conn->execute("SELECT COUNT(*) FROM orders").success);
    }

    SECTION("Owned connection is closed exactly once") {
        auto mock = std::make_shared<MockConnection>("orders", std::vector<std::string>{"id"});
        DataSourceOptions options;
        options.owns_connection = true;
        auto source = DataSource::from_connection(mock, TableRef("orders"), options);

        source->release();
        source->release();
        REQUIRE(mock->close_count() == 1);
        REQUIRE_FALSE(mock->is_connected());
    }

    SECTION("Destructor releases") {
        auto mock = std::make_shared<MockConnection>("orders", std::vector<std::string>{"id"});
        DataSourceOptions options;
        options.owns_connection = true;
        {
            auto source = DataSource::from_connection(mock, TableRef("orders"), options);
        }
        REQUIRE(mock->close_count() == 1);
    }
}

TEST_CASE("DataSource: generated SQL", "[datasource][external]") {
    auto mock = std::make_shared<MockConnection>(
        "orders", std::vector<std::string>{"id", "total"});
    auto source = DataSource::from_connection(mock, TableRef("shop", "orders"));

    REQUIRE(source->identifier() == "shop.orders");

    (void)source->execute(std::nullopt);
    (void)source->fetch_one_row("SELECT id FROM orders;");
    (void)source->fetch_one_row("");

    REQUIRE(mock->executed() == std::vector<std::string>{
        R"(SELECT * FROM "shop"."orders")",
        "SELECT * FROM (SELECT id FROM orders) AS querygate_probe LIMIT 1",
        R"(SELECT * FROM "shop"."orders" LIMIT 1)",
    });
}

TEST_CASE("DataSource: external failures", "[datasource][external]") {
    SECTION("Lookup failure is a backend error") {
        auto mock = std::make_shared<MockConnection>("orders", std::vector<std::string>{"id"});
        mock->fail_lookup_with("permission denied for schema public");
        REQUIRE_THROWS_AS(DataSource::from_connection(mock, TableRef("orders")),
                          BackendExecutionError);
    }

    SECTION("Execution failure carries backend message verbatim") {
        auto mock = std::make_shared<MockConnection>("orders", std::vector<std::string>{"id"});
        auto source = DataSource::from_connection(mock, TableRef("orders"));
        mock->fail_with("relation \"orders\" is locked");
        try {
            (void)source->execute("SELECT * FROM orders");
            FAIL("expected BackendExecutionError");
        } catch (const BackendExecutionError& e) {
            REQUIRE(e.message().find("relation \"orders\" is locked") != std::string::npos);
            REQUIRE(e.message().find("orders") != std::string::npos);
        }
    }

    SECTION("Closed connection is rejected") {
        auto mock = std::make_shared<MockConnection>("orders", std::vector<std::string>{"id"});
        mock->close();
        REQUIRE_THROWS_AS(DataSource::from_connection(mock, TableRef("orders")),
                          ConfigurationError);
    }

    SECTION("Column contract on external results") {
        auto mock = std::make_shared<MockConnection>(
            "orders", std::vector<std::string>{"id", "total"});
        auto source = DataSource::from_connection(mock, TableRef("orders"));
        mock->return_columns({"id"});
        REQUIRE_THROWS_AS(source->fetch_one_row("SELECT id FROM orders", true),
                          ColumnMismatchError);
    }
}

TEST_CASE("DataSource: MySQL backslash escapes", "[datasource][external]") {
    auto mock = std::make_shared<MockConnection>("people", std::vector<std::string>{"name"});
    mock->set_dialect("MySQL");
    auto source = DataSource::from_connection(mock, TableRef("people"));

    (void)source->execute(R"(SELECT * FROM people WHERE name = 'O\'Brien')");
    (void)source->execute(R"(SELECT * FROM people WHERE name = 'a\';b')");

    REQUIRE(mock->executed() == std::vector<std::string>{
        R"(SELECT * FROM people WHERE name = 'O\'Brien')",
        R"(SELECT * FROM people WHERE name = 'a\';b')",
    });
}

TEST_CASE("DataSource: other dialects keep standard quoting", "[datasource][external]") {
    auto mock = std::make_shared<MockConnection>("people", std::vector<std::string>{"name"});
    mock->set_dialect("PostgreSQL");
    auto source = DataSource::from_connection(mock, TableRef("people"));

    // A standard SQL string ends at the first lone quote, backslash or not.
    (void)source->execute(R"(SELECT * FROM people WHERE name = 'C:\'; DROP TABLE people)");
    REQUIRE(mock->executed() == std::vector<std::string>{
        R"(SELECT * FROM people WHERE name = 'C:\')",
    });
}
