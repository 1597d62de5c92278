#pragma once

#include "core/column_type.hpp"
#include "core/sql_value.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace sqlbridge {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps PG type OIDs to GenericColumnType and converts between SqlValue and
 * the text wire format libpq uses for parameters and results.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL OID to GenericColumnType
     * @param oid PostgreSQL type OID
     * @return Generic column type
     */
    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);

    /**
     * @brief Decode one text-format result field
     *
     * Integers -> int64, float4/float8 -> double, bool -> bool,
     * date -> Date, timestamp -> Timestamp. Everything else (numeric,
     * timestamptz, time, json, ...) stays text as PostgreSQL rendered it.
     * A value that does not parse as its column type is kept as text.
     */
    [[nodiscard]] static SqlValue decode(uint32_t oid, std::string_view text);

    /**
     * @brief Encode a parameter for PQexecParams (text format)
     *
     * Callers pass nullptr to libpq for null values; this is not called
     * for them.
     */
    [[nodiscard]] static std::string encode(const SqlValue& value);
};

} // namespace sqlbridge
