#include "schema/schema_inspector.hpp"
#include "datasource/data_source.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace querygate {

namespace {

enum class StatKind { NONE, RANGE, CATEGORICAL };

// Text kinds whose values are comparable and short enough to enumerate.
bool is_categorical_candidate(GenericColumnType t) {
    switch (t) {
        case GenericColumnType::TEXT:
        case GenericColumnType::VARCHAR:
        case GenericColumnType::CHAR:
        case GenericColumnType::UUID:
        case GenericColumnType::UNKNOWN:
        case GenericColumnType::VENDOR_SPECIFIC:
            return true;
        default:
            return false;
    }
}

StatKind stat_kind_for(const ColumnTypeInfo& type) {
    switch (to_semantic_type(type)) {
        case SemanticType::INTEGER:
        case SemanticType::FLOAT:
        case SemanticType::DATETIME:
            return StatKind::RANGE;
        case SemanticType::TEXT:
            return is_categorical_candidate(type.generic_type)
                ? StatKind::CATEGORICAL : StatKind::NONE;
        case SemanticType::BOOLEAN:
            return StatKind::NONE;
    }
    return StatKind::NONE;
}

// COUNT(DISTINCT) comes back as BIGINT, NUMERIC or text depending on the backend.
int64_t count_value(const Value& v) {
    if (const auto* i = std::get_if<int64_t>(&v)) return *i;
    if (const auto* d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    if (const auto* s = std::get_if<std::string>(&v)) {
        return utils::try_parse_int<int64_t>(*s).value_or(0);
    }
    return 0;
}

} // anonymous namespace

std::string_view semantic_type_to_string(SemanticType type) {
    switch (type) {
        case SemanticType::INTEGER:  return "INTEGER";
        case SemanticType::FLOAT:    return "FLOAT";
        case SemanticType::BOOLEAN:  return "BOOLEAN";
        case SemanticType::DATETIME: return "DATETIME";
        case SemanticType::TEXT:     return "TEXT";
    }
    return "TEXT";
}

SemanticType to_semantic_type(const ColumnTypeInfo& type) {
    const auto t = type.generic_type;
    if (is_integer_type(t)) return SemanticType::INTEGER;
    if (is_floating_type(t)) return SemanticType::FLOAT;
    if (is_temporal_type(t)) return SemanticType::DATETIME;
    return t == GenericColumnType::BOOLEAN ? SemanticType::BOOLEAN : SemanticType::TEXT;
}

std::string format_schema(const Schema& schema) {
    std::string out = std::format("Table: {}\nColumns:", schema.table);

    for (const auto& col : schema.columns) {
        out += std::format("\n- {} ({})", col.name, semantic_type_to_string(col.semantic_type));

        if (const auto* range = std::get_if<ValueRange>(&col.facet)) {
            out += std::format("\n  Range: {} to {}",
                               format_value(range->min), format_value(range->max));
        } else if (std::holds_alternative<NoRange>(col.facet)) {
            out += "\n  Range: no non-null values";
        } else if (const auto* cats = std::get_if<CategoricalValues>(&col.facet)) {
            if (!cats->values.empty()) {
                out += "\n  Categorical values: " + utils::join_quoted(cats->values);
            }
        }
    }
    return out;
}

// ============================================================================
// SchemaInspector
// ============================================================================

SchemaInspector::SchemaInspector(int categorical_threshold)
    : categorical_threshold_(categorical_threshold) {
    if (categorical_threshold_ < 1) {
        throw ConfigurationError(
            std::format("categorical_threshold must be at least 1, got {}", categorical_threshold_),
            std::to_string(categorical_threshold_));
    }
}

Schema SchemaInspector::inspect(DataSource& source) const {
    Schema schema;
    schema.table = source.identifier();

    const auto& columns = source.column_schema();
    std::vector<StatKind> kinds;
    kinds.reserve(columns.size());

    // Build one aggregate query; remember where each column's stats land.
    std::vector<std::string> select_parts;
    std::vector<size_t> stat_offset(columns.size(), 0);
    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& col = columns[i];
        const StatKind kind = stat_kind_for(col.type);
        kinds.push_back(kind);

        ColumnDescriptor desc;
        desc.name = col.name;
        desc.semantic_type = to_semantic_type(col.type);
        schema.columns.push_back(std::move(desc));

        const auto quoted = source.quote_identifier(col.name);
        stat_offset[i] = select_parts.size();
        if (kind == StatKind::RANGE) {
            select_parts.push_back(std::format("MIN({}) AS min_{}", quoted, i));
            select_parts.push_back(std::format("MAX({}) AS max_{}", quoted, i));
        } else if (kind == StatKind::CATEGORICAL) {
            select_parts.push_back(std::format("COUNT(DISTINCT {}) AS distinct_{}", quoted, i));
        }
    }

    if (select_parts.empty()) {
        return schema;
    }

    std::string stats_sql = "SELECT ";
    for (size_t i = 0; i < select_parts.size(); ++i) {
        if (i > 0) stats_sql += ", ";
        stats_sql += select_parts[i];
    }
    stats_sql += " FROM " + source.quoted_table();

    const auto stats = source.execute_generated(stats_sql);
    if (stats.row_count != 1 || stats.columns.size() != select_parts.size()) {
        throw BackendExecutionError(
            std::format("Statistics query for '{}' returned {} rows and {} columns",
                        source.identifier(), stats.row_count, stats.columns.size()),
            stats_sql);
    }

    for (size_t i = 0; i < columns.size(); ++i) {
        auto& desc = schema.columns[i];
        const size_t at = stat_offset[i];

        if (kinds[i] == StatKind::RANGE) {
            const Value& lo = stats.at(0, at);
            const Value& hi = stats.at(0, at + 1);
            if (is_null(lo) || is_null(hi)) {
                desc.facet = NoRange{};
            } else {
                desc.facet = ValueRange{lo, hi};
            }
        } else if (kinds[i] == StatKind::CATEGORICAL) {
            const int64_t distinct = count_value(stats.at(0, at));
            if (distinct < 1 || distinct > categorical_threshold_) {
                continue;
            }

            const auto quoted = source.quote_identifier(columns[i].name);
            const auto values = source.execute_generated(std::format(
                "SELECT DISTINCT {0} FROM {1} WHERE {0} IS NOT NULL ORDER BY {0}",
                quoted, source.quoted_table()));

            CategoricalValues cats;
            if (!values.columns.empty()) {
                for (const auto& v : values.columns.front().values) {
                    cats.values.push_back(format_value(v));
                }
            }
            desc.facet = std::move(cats);
        }
    }

    return schema;
}

} // namespace querygate
