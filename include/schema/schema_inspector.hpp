#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace querygate {

class DataSource;

/**
 * @brief Coarse type shown to the LLM
 */
enum class SemanticType { INTEGER, FLOAT, BOOLEAN, DATETIME, TEXT };

[[nodiscard]] std::string_view semantic_type_to_string(SemanticType type);

[[nodiscard]] SemanticType to_semantic_type(const ColumnTypeInfo& type);

// ============================================================================
// Facets
// ============================================================================

struct ValueRange {
    Value min;
    Value max;
};

// A range column with no non-null values
struct NoRange {};

struct CategoricalValues {
    std::vector<std::string> values;
};

using Facet = std::variant<std::monostate, CategoricalValues, ValueRange, NoRange>;

struct ColumnDescriptor {
    std::string name;
    SemanticType semantic_type = SemanticType::TEXT;
    Facet facet;
};

/**
 * @brief Point-in-time description of one table
 */
struct Schema {
    std::string table;
    std::vector<ColumnDescriptor> columns;
};

/**
 * @brief Render the prompt-facing text form
 *
 *   Table: sales
 *   Columns:
 *   - amount (FLOAT)
 *     Range: 1.5 to 99
 *   - region (TEXT)
 *     Categorical values: 'east', 'west'
 */
[[nodiscard]] std::string format_schema(const Schema& schema);

/**
 * @brief Derives a Schema from a live DataSource
 *
 * Issues one aggregate query (MIN/MAX for range columns, COUNT(DISTINCT)
 * for text columns) plus one DISTINCT query per categorical column. The
 * queries are built from quoted identifiers, so they pass the guard but not
 * the cleaner. Nothing is cached.
 */
class SchemaInspector {
public:
    static constexpr int kDefaultCategoricalThreshold = 20;

    /**
     * @throws ConfigurationError when categorical_threshold < 1
     */
    explicit SchemaInspector(int categorical_threshold = kDefaultCategoricalThreshold);

    [[nodiscard]] Schema inspect(DataSource& source) const;

    [[nodiscard]] std::string describe(DataSource& source) const {
        return format_schema(inspect(source));
    }

    [[nodiscard]] int categorical_threshold() const { return categorical_threshold_; }

private:
    int categorical_threshold_;
};

} // namespace querygate
