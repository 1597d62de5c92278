#pragma once

#include "core/sql_value.hpp"
#include <string>

namespace sqlbridge {

/**
 * @brief Best-effort rewrite of PostgreSQL-flavoured SQL into SQLite SQL
 *
 * Pattern based, not a parser. All rules are case-insensitive on keywords
 * and independent of surrounding whitespace:
 *
 * - "%s" markers become "?", "%%" becomes "%"
 * - TIMESTAMP / TIMESTAMPTZ / TIMESTAMP WITH[OUT] TIME ZONE /
 *   TIME WITH[OUT] TIME ZONE / TIMETZ become TEXT
 * - SERIAL / BIGSERIAL / SMALLSERIAL become INTEGER
 * - BOOLEAN / BOOL become INTEGER
 * - dotted names after FROM, JOIN, INTO, UPDATE, REFERENCES, TABLE and
 *   TABLE IF NOT EXISTS are double-quoted: public.run -> "public.run"
 *
 * Stateless; every member is a pure function and safe to call concurrently.
 */
class SqliteDialect {
public:
    [[nodiscard]] static std::string translate(const std::string& query);

    /**
     * @brief Map parameters onto SQLite storage classes
     *
     * Timestamp -> "YYYY-MM-DD HH:MM:SS.ffffff", Date -> "YYYY-MM-DD",
     * bool -> 0 / 1.
     * Other values pass through; order and count are preserved.
     */
    [[nodiscard]] static SqlParams convert_params(const SqlParams& params);

    /**
     * @brief True if the statement carries a RETURNING clause
     */
    [[nodiscard]] static bool has_returning_clause(const std::string& query);

    /**
     * @brief Remove the RETURNING clause and any trailing terminator
     *
     * "INSERT INTO t (a) VALUES (?) RETURNING id;" -> "INSERT INTO t (a) VALUES (?)"
     */
    [[nodiscard]] static std::string strip_returning_clause(const std::string& query);
};

} // namespace sqlbridge
