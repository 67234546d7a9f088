#pragma once

#include "core/column_type.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace querygate {

// ============================================================================
// Scalar Values
// ============================================================================

/**
 * @brief Typed scalar cell
 *
 * std::monostate is SQL NULL. Dates and timestamps are carried as ISO-8601
 * text; the column's ColumnTypeInfo says how to read them.
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

[[nodiscard]] inline bool is_null(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

/**
 * @brief Human-readable rendering ("NULL", "true", "42", "1.1", text verbatim)
 */
[[nodiscard]] std::string format_value(const Value& v);

/**
 * @brief JSON literal rendering (null, true, 42, 1.1, "text")
 */
[[nodiscard]] std::string value_to_json(const Value& v);

// ============================================================================
// Table Identity and Schema
// ============================================================================

struct TableRef {
    std::string catalog;        // Catalog / database (optional)
    std::string schema;         // Schema name (empty = current schema)
    std::string table;          // Table name

    TableRef() = default;
    TableRef(std::string t) : table(std::move(t)) {}
    TableRef(std::string s, std::string t) : schema(std::move(s)), table(std::move(t)) {}
    TableRef(std::string c, std::string s, std::string t)
        : catalog(std::move(c)), schema(std::move(s)), table(std::move(t)) {}

    std::string full_name() const {
        std::string out;
        if (!catalog.empty()) out += catalog + ".";
        if (!schema.empty()) out += schema + ".";
        out += table;
        return out;
    }
};

struct ColumnMetadata {
    std::string name;
    ColumnTypeInfo type;

    ColumnMetadata() = default;
    ColumnMetadata(std::string n, ColumnTypeInfo t) : name(std::move(n)), type(std::move(t)) {}
};

struct TableMetadata {
    TableRef ref;
    std::vector<ColumnMetadata> columns;
    std::unordered_map<std::string, size_t> column_index; // name -> index

    void add_column(ColumnMetadata col) {
        column_index[col.name] = columns.size();
        columns.push_back(std::move(col));
    }

    const ColumnMetadata* find_column(const std::string& col_name) const {
        auto it = column_index.find(col_name);
        if (it != column_index.end() && it->second < columns.size()) {
            return &columns[it->second];
        }
        return nullptr;
    }
};

// ============================================================================
// In-memory Input Frame (embedded backend)
// ============================================================================

struct FrameColumn {
    std::string name;
    GenericColumnType type = GenericColumnType::TEXT;
    std::vector<Value> values;
};

/**
 * @brief Rectangular in-memory table handed to the embedded backend
 */
struct DataFrame {
    std::vector<FrameColumn> columns;

    [[nodiscard]] size_t row_count() const {
        return columns.empty() ? 0 : columns.front().values.size();
    }

    // All columns must have the same length.
    [[nodiscard]] bool is_rectangular() const {
        for (const auto& col : columns) {
            if (col.values.size() != row_count()) return false;
        }
        return true;
    }
};

// ============================================================================
// Query Execution Result
// ============================================================================

struct ResultColumn {
    std::string name;
    ColumnTypeInfo type;
    std::vector<Value> values;
};

/**
 * @brief Materialized, column-major query result
 *
 * Every column holds exactly row_count values.
 */
struct QueryResult {
    std::vector<ResultColumn> columns;
    size_t row_count = 0;
    std::chrono::microseconds execution_time{0};

    [[nodiscard]] std::vector<std::string> column_names() const;

    [[nodiscard]] const ResultColumn* find_column(const std::string& name) const;

    [[nodiscard]] const Value& at(size_t row, size_t col) const {
        return columns[col].values[row];
    }

    /**
     * @brief {"columns":["a","b"],"rows":[[1,"x"]],"row_count":1}
     */
    [[nodiscard]] std::string to_json() const;
};

} // namespace querygate
