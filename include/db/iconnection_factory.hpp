#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlbridge {

/**
 * @brief Abstract factory for creating database connections
 *
 * Each backend provides its own factory that wraps the native
 * connection function (PQconnectdb, sqlite3_open_v2).
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string Backend-specific connection string
     * @return New, connected connection
     * @throws PoolCreationError with the engine's message on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace sqlbridge
