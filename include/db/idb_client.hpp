#pragma once

#include "core/sql_value.hpp"
#include "db/connection_identity.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlbridge {

/**
 * @brief Per-client settings that are not part of the identity
 */
struct ClientConfig {
    std::string password;
    size_t min_connections = 1;
    size_t max_connections = 10;
    bool debug = false;
};

/**
 * @brief Engine-independent query API
 *
 * Queries use "%s" positional markers ("%%" for a literal percent).
 *
 * Auto mode (auto_connection = true, nothing held): every call borrows a
 * connection, runs, commits or rolls back, and returns the connection.
 * Manual mode: connect() pins one connection to the client until close();
 * every call runs on it and each write is committed individually.
 *
 * Failures are thrown as DbError subclasses (see core/error.hpp).
 */
class IDbClient {
public:
    virtual ~IDbClient() = default;

    /**
     * @brief Borrow a connection and keep it until close()
     * @throws PoolExhaustedError, PoolCreationError
     */
    virtual void connect() = 0;

    /**
     * @brief Run a statement and return every row
     */
    [[nodiscard]] virtual std::vector<Row> execute_query(
        const std::string& query,
        const SqlParams& params = {},
        bool auto_connection = true) = 0;

    /**
     * @brief Run a write statement
     * @return Affected row count if the engine reports one
     */
    virtual std::optional<uint64_t> execute_non_query(
        const std::string& query,
        const SqlParams& params = {},
        bool auto_connection = true) = 0;

    /**
     * @brief Run a write statement that produces a generated identifier
     * @return Generated id, or null if the engine produced none
     */
    virtual SqlValue execute_non_query_returning(
        const std::string& query,
        const SqlParams& params = {},
        bool auto_connection = true) = 0;

    /**
     * @brief Return the held connection to its pool (no-op when none is held)
     */
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    [[nodiscard]] virtual const ConnectionIdentity& identity() const = 0;
};

} // namespace sqlbridge
