#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"

#include <array>

namespace querygate {

namespace {

struct PgTypeEntry {
    std::string_view name;
    uint32_t oid;
    GenericColumnType type;
};

// First entry per OID is the canonical name used for result columns.
constexpr std::array<PgTypeEntry, 39> kPgTypes = {{
    {"smallint", 21, GenericColumnType::SMALLINT},
    {"int2", 21, GenericColumnType::SMALLINT},
    {"integer", 23, GenericColumnType::INTEGER},
    {"int4", 23, GenericColumnType::INTEGER},
    {"serial", 23, GenericColumnType::INTEGER},
    {"bigint", 20, GenericColumnType::BIGINT},
    {"int8", 20, GenericColumnType::BIGINT},
    {"bigserial", 20, GenericColumnType::BIGINT},
    {"oid", 26, GenericColumnType::INTEGER},
    {"real", 700, GenericColumnType::REAL},
    {"float4", 700, GenericColumnType::REAL},
    {"double precision", 701, GenericColumnType::DOUBLE_PRECISION},
    {"float8", 701, GenericColumnType::DOUBLE_PRECISION},
    {"numeric", 1700, GenericColumnType::NUMERIC},
    {"decimal", 1700, GenericColumnType::NUMERIC},
    {"money", 790, GenericColumnType::MONEY},
    {"text", 25, GenericColumnType::TEXT},
    {"character varying", 1043, GenericColumnType::VARCHAR},
    {"varchar", 1043, GenericColumnType::VARCHAR},
    {"character", 1042, GenericColumnType::CHAR},
    {"char", 1042, GenericColumnType::CHAR},
    {"name", 19, GenericColumnType::VARCHAR},
    {"boolean", 16, GenericColumnType::BOOLEAN},
    {"bool", 16, GenericColumnType::BOOLEAN},
    {"date", 1082, GenericColumnType::DATE},
    {"time without time zone", 1083, GenericColumnType::TIME},
    {"time with time zone", 1266, GenericColumnType::TIME},
    {"timestamp without time zone", 1114, GenericColumnType::TIMESTAMP},
    {"timestamp", 1114, GenericColumnType::TIMESTAMP},
    {"timestamp with time zone", 1184, GenericColumnType::TIMESTAMP_TZ},
    {"timestamptz", 1184, GenericColumnType::TIMESTAMP_TZ},
    {"interval", 1186, GenericColumnType::INTERVAL},
    {"bytea", 17, GenericColumnType::BLOB},
    {"json", 114, GenericColumnType::JSON},
    {"jsonb", 3802, GenericColumnType::JSON},
    {"uuid", 2950, GenericColumnType::UUID},
    {"inet", 869, GenericColumnType::VENDOR_SPECIFIC},
    {"xml", 142, GenericColumnType::VENDOR_SPECIFIC},
    {"array", 2277, GenericColumnType::ARRAY},
}};

} // anonymous namespace

uint32_t PgTypeMap::type_name_to_oid(std::string_view type_name) {
    const std::string lower = utils::to_lower(type_name);
    for (const auto& entry : kPgTypes) {
        if (entry.name == lower) return entry.oid;
    }
    return 0;
}

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    for (const auto& entry : kPgTypes) {
        if (entry.oid == oid) return entry.type;
    }
    return oid == 0 ? GenericColumnType::UNKNOWN : GenericColumnType::VENDOR_SPECIFIC;
}

ColumnTypeInfo PgTypeMap::build_type_info(uint32_t oid) {
    for (const auto& entry : kPgTypes) {
        if (entry.oid == oid) {
            return ColumnTypeInfo(entry.type, oid, std::string(entry.name));
        }
    }
    return ColumnTypeInfo(oid_to_generic_type(oid), oid, "");
}

ColumnTypeInfo PgTypeMap::build_type_info(std::string_view type_name) {
    const uint32_t oid = type_name_to_oid(type_name);
    // USER-DEFINED, geometric and other unlisted types stay vendor specific.
    const GenericColumnType generic = (oid == 0)
        ? GenericColumnType::VENDOR_SPECIFIC
        : oid_to_generic_type(oid);
    return ColumnTypeInfo(generic, oid, std::string(type_name));
}

} // namespace querygate
