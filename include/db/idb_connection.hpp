#pragma once

#include "core/column_type.hpp"
#include "core/sql_value.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sqlbridge {

/**
 * @brief Classification of a failed statement
 *
 * OPERATIONAL covers the engine rejecting the statement itself (syntax
 * errors, unknown tables, unsupported clauses). The SQLite client only
 * retries a RETURNING statement without the clause for this kind.
 */
enum class DbErrorKind {
    NONE,
    OPERATIONAL,
    CONSTRAINT,
    BUSY_OR_LOCKED,
    CONNECTION,
    GENERIC
};

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied out of native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    DbErrorKind error_kind = DbErrorKind::NONE;

    // For SELECT / RETURNING
    std::vector<std::string> column_names;
    std::vector<GenericColumnType> column_types;
    std::vector<std::vector<SqlValue>> rows;

    // For DML
    uint64_t affected_rows = 0;
    bool has_affected_rows = false;
    int64_t last_insert_id = 0;

    [[nodiscard]] static DbResultSet failure(std::string message, DbErrorKind kind) {
        DbResultSet r;
        r.success = false;
        r.error_message = std::move(message);
        r.error_kind = kind;
        return r;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, sqlite3*).
 * Implementations are not thread-safe; a connection is only ever used by
 * the one caller that borrowed it from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute one statement with positional parameters
     * @param sql Statement text, already in this engine's marker style
     * @param params Parameter values, positionally aligned with the markers
     * @return Result set with rows, affected count or error
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql, const SqlParams& params) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlbridge
