#pragma once

#include "core/column_type.hpp"

#include "duckdb.hpp"

#include <string>
#include <string_view>

namespace querygate {

/**
 * @brief DuckDB type mapping utilities
 *
 * Maps LogicalTypeId (query results) and information_schema data_type
 * names (table lookup) to GenericColumnType.
 */
class DuckdbTypeMap {
public:
    [[nodiscard]] static GenericColumnType logical_type_to_generic(const duckdb::LogicalType& type);

    /**
     * @brief Map a data_type name ("BIGINT", "DECIMAL(18,3)", "INTEGER[]") to GenericColumnType
     */
    [[nodiscard]] static GenericColumnType type_name_to_generic(std::string_view type_name);

    [[nodiscard]] static ColumnTypeInfo build_type_info(const duckdb::LogicalType& type);

    /**
     * @brief Column type used when creating a table for a frame column
     */
    [[nodiscard]] static const char* declared_type_for(GenericColumnType type);
};

} // namespace querygate
