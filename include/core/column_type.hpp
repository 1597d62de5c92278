#pragma once

#include <cstdint>

namespace sqlbridge {

/**
 * @brief Database-agnostic column type classification
 *
 * Maps from vendor-specific types (PG OIDs, SQLite storage classes).
 * Drives the decoding of result fields into SqlValue.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,

    // Binary
    BLOB,

    // Vendor-specific fallback
    VENDOR_SPECIFIC,
};

} // namespace sqlbridge
