#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace querygate {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps between PG type names (information_schema data_type), OIDs
 * (PQftype) and GenericColumnType.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL type name to its OID
     * @param type_name PostgreSQL type name, any case
     * @return Type OID, or 0 if unknown
     */
    [[nodiscard]] static uint32_t type_name_to_oid(std::string_view type_name);

    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);

    /**
     * @brief Full ColumnTypeInfo from an OID, as reported for result columns
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(uint32_t oid);

    /**
     * @brief Full ColumnTypeInfo from an information_schema data_type name
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(std::string_view type_name);
};

} // namespace querygate
