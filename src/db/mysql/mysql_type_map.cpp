#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"
#include <array>

namespace querygate {

namespace {

struct MysqlTypeEntry {
    std::string_view name;
    GenericColumnType type;
};

// information_schema DATA_TYPE names. The first entry per class names
// result columns, which only carry a field type.
constexpr std::array<MysqlTypeEntry, 32> kMysqlTypes = {{
    {"smallint", GenericColumnType::SMALLINT},
    {"tinyint", GenericColumnType::SMALLINT},
    {"int", GenericColumnType::INTEGER},
    {"integer", GenericColumnType::INTEGER},
    {"mediumint", GenericColumnType::INTEGER},
    {"year", GenericColumnType::INTEGER},
    {"bigint", GenericColumnType::BIGINT},
    {"float", GenericColumnType::REAL},
    {"double", GenericColumnType::DOUBLE_PRECISION},
    {"decimal", GenericColumnType::NUMERIC},
    {"numeric", GenericColumnType::NUMERIC},
    {"char", GenericColumnType::CHAR},
    {"varchar", GenericColumnType::VARCHAR},
    {"enum", GenericColumnType::VARCHAR},
    {"set", GenericColumnType::VARCHAR},
    {"text", GenericColumnType::TEXT},
    {"tinytext", GenericColumnType::TEXT},
    {"mediumtext", GenericColumnType::TEXT},
    {"longtext", GenericColumnType::TEXT},
    {"blob", GenericColumnType::BLOB},
    {"tinyblob", GenericColumnType::BLOB},
    {"mediumblob", GenericColumnType::BLOB},
    {"longblob", GenericColumnType::BLOB},
    {"binary", GenericColumnType::BLOB},
    {"varbinary", GenericColumnType::BLOB},
    {"date", GenericColumnType::DATE},
    {"time", GenericColumnType::TIME},
    {"datetime", GenericColumnType::TIMESTAMP},
    {"timestamp", GenericColumnType::TIMESTAMP},
    {"boolean", GenericColumnType::BOOLEAN},
    {"bool", GenericColumnType::BOOLEAN},
    {"json", GenericColumnType::JSON},
}};

} // anonymous namespace

GenericColumnType MysqlTypeMap::field_type_to_generic(enum_field_types field_type) {
    switch (field_type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
            return GenericColumnType::SMALLINT;
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_YEAR:
            return GenericColumnType::INTEGER;
        case MYSQL_TYPE_LONGLONG:
            return GenericColumnType::BIGINT;
        case MYSQL_TYPE_FLOAT:
            return GenericColumnType::REAL;
        case MYSQL_TYPE_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return GenericColumnType::NUMERIC;
        case MYSQL_TYPE_STRING:
            return GenericColumnType::CHAR;
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
            // TEXT columns also report as BLOB; the charset decides, and
            // result values are text either way.
            return GenericColumnType::TEXT;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return GenericColumnType::DATE;
        case MYSQL_TYPE_TIME:
        case MYSQL_TYPE_TIME2:
            return GenericColumnType::TIME;
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_DATETIME2:
        case MYSQL_TYPE_TIMESTAMP:
        case MYSQL_TYPE_TIMESTAMP2:
            return GenericColumnType::TIMESTAMP;
        case MYSQL_TYPE_JSON:
            return GenericColumnType::JSON;
        case MYSQL_TYPE_BIT:
        case MYSQL_TYPE_GEOMETRY:
            return GenericColumnType::VENDOR_SPECIFIC;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

ColumnTypeInfo MysqlTypeMap::build_type_info(enum_field_types field_type) {
    const GenericColumnType generic = field_type_to_generic(field_type);
    std::string_view name = "unknown";
    for (const auto& entry : kMysqlTypes) {
        if (entry.type == generic) {
            name = entry.name;
            break;
        }
    }
    return ColumnTypeInfo(generic, static_cast<uint32_t>(field_type), std::string(name));
}

GenericColumnType MysqlTypeMap::type_name_to_generic(std::string_view type_name) {
    const std::string lower = utils::to_lower(type_name);
    for (const auto& entry : kMysqlTypes) {
        if (entry.name == lower) return entry.type;
    }
    return GenericColumnType::VENDOR_SPECIFIC;
}

} // namespace querygate
