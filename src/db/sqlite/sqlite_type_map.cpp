#include "db/sqlite/sqlite_type_map.hpp"
#include "core/utils.hpp"

#include <sqlite3.h>

namespace querygate {

GenericColumnType SqliteTypeMap::declared_type_to_generic(std::string_view declared) {
    const std::string upper = utils::to_upper(declared);
    const auto has = [&upper](std::string_view token) {
        return upper.find(token) != std::string::npos;
    };

    if (upper.empty()) return GenericColumnType::UNKNOWN;
    if (has("BOOL")) return GenericColumnType::BOOLEAN;
    if (has("TIMESTAMP") || has("DATETIME")) return GenericColumnType::TIMESTAMP;
    if (has("DATE")) return GenericColumnType::DATE;
    if (has("TIME")) return GenericColumnType::TIME;
    if (has("INT")) {
        if (has("BIGINT")) return GenericColumnType::BIGINT;
        if (has("SMALLINT") || has("TINYINT")) return GenericColumnType::SMALLINT;
        return GenericColumnType::INTEGER;
    }
    if (has("VARCHAR")) return GenericColumnType::VARCHAR;
    if (has("CHAR")) return GenericColumnType::CHAR;
    if (has("CLOB") || has("TEXT")) return GenericColumnType::TEXT;
    if (has("REAL") || has("FLOA")) return GenericColumnType::REAL;
    if (has("DOUB")) return GenericColumnType::DOUBLE_PRECISION;
    if (has("NUMERIC") || has("DECIMAL")) return GenericColumnType::NUMERIC;
    if (has("JSON")) return GenericColumnType::JSON;
    if (has("BLOB")) return GenericColumnType::BLOB;
    return GenericColumnType::VENDOR_SPECIFIC;
}

GenericColumnType SqliteTypeMap::storage_class_to_generic(int storage_class) {
    switch (storage_class) {
        case SQLITE_INTEGER: return GenericColumnType::BIGINT;
        case SQLITE_FLOAT:   return GenericColumnType::DOUBLE_PRECISION;
        case SQLITE_TEXT:    return GenericColumnType::TEXT;
        case SQLITE_BLOB:    return GenericColumnType::BLOB;
        default:             return GenericColumnType::UNKNOWN;
    }
}

const char* SqliteTypeMap::declared_type_for(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
            return "BIGINT";
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::MONEY:
            return "DOUBLE";
        case GenericColumnType::NUMERIC:
            return "NUMERIC";
        case GenericColumnType::BOOLEAN:
            return "BOOLEAN";
        case GenericColumnType::DATE:
            return "DATE";
        case GenericColumnType::TIME:
            return "TIME";
        case GenericColumnType::TIMESTAMP:
        case GenericColumnType::TIMESTAMP_TZ:
            return "TIMESTAMP";
        case GenericColumnType::BLOB:
            return "BLOB";
        default:
            return "TEXT";
    }
}

ColumnTypeInfo SqliteTypeMap::build_type_info(std::string_view declared) {
    return ColumnTypeInfo(declared_type_to_generic(declared), 0, std::string(declared));
}

} // namespace querygate
