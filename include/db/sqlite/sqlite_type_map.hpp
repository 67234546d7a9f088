#pragma once

#include "core/column_type.hpp"
#include <string>
#include <string_view>

namespace querygate {

/**
 * @brief SQLite type mapping utilities
 *
 * SQLite columns carry a free-form declared type; classification follows
 * SQLite's own affinity rules (substring matching), refined for the
 * date/boolean names SQLite itself treats as NUMERIC.
 */
class SqliteTypeMap {
public:
    /**
     * @brief Map a declared column type ("VARCHAR(20)", "BIGINT", ...) to GenericColumnType
     */
    [[nodiscard]] static GenericColumnType declared_type_to_generic(std::string_view declared);

    /**
     * @brief Map a storage class (SQLITE_INTEGER, ...) to GenericColumnType
     *
     * Used for expression columns, which have no declared type.
     */
    [[nodiscard]] static GenericColumnType storage_class_to_generic(int storage_class);

    /**
     * @brief Declared type used when creating a table for a frame column
     */
    [[nodiscard]] static const char* declared_type_for(GenericColumnType type);

    [[nodiscard]] static ColumnTypeInfo build_type_info(std::string_view declared);
};

} // namespace querygate
