#include "db/duckdb/duckdb_type_map.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace querygate {

GenericColumnType DuckdbTypeMap::logical_type_to_generic(const duckdb::LogicalType& type) {
    using duckdb::LogicalTypeId;
    switch (type.id()) {
        case LogicalTypeId::BOOLEAN:
            return GenericColumnType::BOOLEAN;
        case LogicalTypeId::TINYINT:
        case LogicalTypeId::SMALLINT:
        case LogicalTypeId::UTINYINT:
            return GenericColumnType::SMALLINT;
        case LogicalTypeId::INTEGER:
        case LogicalTypeId::USMALLINT:
            return GenericColumnType::INTEGER;
        case LogicalTypeId::BIGINT:
        case LogicalTypeId::UINTEGER:
            return GenericColumnType::BIGINT;
        case LogicalTypeId::UBIGINT:
        case LogicalTypeId::HUGEINT:
        case LogicalTypeId::DECIMAL:
            return GenericColumnType::NUMERIC;
        case LogicalTypeId::FLOAT:
            return GenericColumnType::REAL;
        case LogicalTypeId::DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case LogicalTypeId::VARCHAR:
            return GenericColumnType::VARCHAR;
        case LogicalTypeId::DATE:
            return GenericColumnType::DATE;
        case LogicalTypeId::TIME:
            return GenericColumnType::TIME;
        case LogicalTypeId::TIMESTAMP:
        case LogicalTypeId::TIMESTAMP_SEC:
        case LogicalTypeId::TIMESTAMP_MS:
        case LogicalTypeId::TIMESTAMP_NS:
            return GenericColumnType::TIMESTAMP;
        case LogicalTypeId::TIMESTAMP_TZ:
            return GenericColumnType::TIMESTAMP_TZ;
        case LogicalTypeId::INTERVAL:
            return GenericColumnType::INTERVAL;
        case LogicalTypeId::BLOB:
            return GenericColumnType::BLOB;
        case LogicalTypeId::UUID:
            return GenericColumnType::UUID;
        case LogicalTypeId::LIST:
        case LogicalTypeId::ARRAY:
            return GenericColumnType::ARRAY;
        case LogicalTypeId::SQLNULL:
            return GenericColumnType::UNKNOWN;
        default:
            return GenericColumnType::VENDOR_SPECIFIC;
    }
}

GenericColumnType DuckdbTypeMap::type_name_to_generic(std::string_view type_name) {
    const std::string upper = utils::to_upper(type_name);

    if (upper.ends_with("]")) return GenericColumnType::ARRAY;
    if (upper.starts_with("DECIMAL") || upper.starts_with("NUMERIC")) return GenericColumnType::NUMERIC;

    static const std::unordered_map<std::string, GenericColumnType> TYPE_MAP = {
        {"BOOLEAN", GenericColumnType::BOOLEAN},
        {"TINYINT", GenericColumnType::SMALLINT},
        {"SMALLINT", GenericColumnType::SMALLINT},
        {"UTINYINT", GenericColumnType::SMALLINT},
        {"INTEGER", GenericColumnType::INTEGER},
        {"USMALLINT", GenericColumnType::INTEGER},
        {"BIGINT", GenericColumnType::BIGINT},
        {"UINTEGER", GenericColumnType::BIGINT},
        {"UBIGINT", GenericColumnType::NUMERIC},
        {"HUGEINT", GenericColumnType::NUMERIC},
        {"FLOAT", GenericColumnType::REAL},
        {"DOUBLE", GenericColumnType::DOUBLE_PRECISION},
        {"VARCHAR", GenericColumnType::VARCHAR},
        {"DATE", GenericColumnType::DATE},
        {"TIME", GenericColumnType::TIME},
        {"TIMESTAMP", GenericColumnType::TIMESTAMP},
        {"TIMESTAMP_S", GenericColumnType::TIMESTAMP},
        {"TIMESTAMP_MS", GenericColumnType::TIMESTAMP},
        {"TIMESTAMP_NS", GenericColumnType::TIMESTAMP},
        {"TIMESTAMP WITH TIME ZONE", GenericColumnType::TIMESTAMP_TZ},
        {"INTERVAL", GenericColumnType::INTERVAL},
        {"BLOB", GenericColumnType::BLOB},
        {"UUID", GenericColumnType::UUID},
        {"JSON", GenericColumnType::JSON},
    };

    auto it = TYPE_MAP.find(upper);
    return it != TYPE_MAP.end() ? it->second : GenericColumnType::VENDOR_SPECIFIC;
}

ColumnTypeInfo DuckdbTypeMap::build_type_info(const duckdb::LogicalType& type) {
    ColumnTypeInfo info;
    info.vendor_type_id = static_cast<uint32_t>(type.id());
    info.vendor_type_name = type.ToString();
    info.generic_type = logical_type_to_generic(type);
    return info;
}

const char* DuckdbTypeMap::declared_type_for(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
            return "BIGINT";
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
        case GenericColumnType::MONEY:
            return "DOUBLE";
        case GenericColumnType::BOOLEAN:
            return "BOOLEAN";
        case GenericColumnType::DATE:
            return "DATE";
        case GenericColumnType::TIME:
            return "TIME";
        case GenericColumnType::TIMESTAMP:
            return "TIMESTAMP";
        case GenericColumnType::TIMESTAMP_TZ:
            return "TIMESTAMPTZ";
        case GenericColumnType::BLOB:
            return "BLOB";
        default:
            return "VARCHAR";
    }
}

} // namespace querygate
