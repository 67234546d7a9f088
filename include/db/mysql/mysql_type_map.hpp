#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace querygate {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL field types (result metadata) and information_schema
 * DATA_TYPE names (table lookup) to GenericColumnType.
 */
class MysqlTypeMap {
public:
    [[nodiscard]] static GenericColumnType field_type_to_generic(enum_field_types field_type);

    /**
     * @brief Full ColumnTypeInfo from a result field type
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(enum_field_types field_type);

    /**
     * @brief Map MySQL type name ("int", "VARCHAR", ...) to GenericColumnType
     */
    [[nodiscard]] static GenericColumnType type_name_to_generic(std::string_view type_name);
};

} // namespace querygate
