#pragma once

#include <cstdint>
#include <string>

namespace querygate {

/**
 * @brief Backend-neutral column classes
 *
 * Only the distinctions the gateway acts on are kept: which cells become
 * int64_t, double or bool, which columns get a range or a categorical
 * listing, and which ones a data frame can declare when it is loaded into an
 * embedded engine. Anything a backend reports outside these classes is
 * VENDOR_SPECIFIC and travels as text.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Cells become int64_t
    SMALLINT,
    INTEGER,
    BIGINT,

    // Cells become double
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,
    MONEY,

    // Categorical candidates
    TEXT,
    VARCHAR,
    CHAR,
    UUID,

    BOOLEAN,

    // Range candidates, compared as ISO text
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,

    // Passed through as text, never summarized
    INTERVAL,
    BLOB,
    JSON,
    ARRAY,

    VENDOR_SPECIFIC,
};

/**
 * @brief Column type as a backend reported it
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    uint32_t vendor_type_id = 0;       // PG OID, MySQL field type, DuckDB LogicalTypeId
    std::string vendor_type_name;      // "integer", "VARCHAR", "DOUBLE", ...

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, uint32_t vid, std::string vname)
        : generic_type(gt), vendor_type_id(vid), vendor_type_name(std::move(vname)) {}
};

[[nodiscard]] inline bool is_integer_type(GenericColumnType t) {
    return t == GenericColumnType::SMALLINT || t == GenericColumnType::INTEGER ||
           t == GenericColumnType::BIGINT;
}

[[nodiscard]] inline bool is_floating_type(GenericColumnType t) {
    return t == GenericColumnType::REAL || t == GenericColumnType::DOUBLE_PRECISION ||
           t == GenericColumnType::NUMERIC || t == GenericColumnType::MONEY;
}

[[nodiscard]] inline bool is_temporal_type(GenericColumnType t) {
    return t == GenericColumnType::DATE || t == GenericColumnType::TIME ||
           t == GenericColumnType::TIMESTAMP || t == GenericColumnType::TIMESTAMP_TZ;
}

} // namespace querygate
