#pragma once

#include "core/database_type.hpp"
#include "db/connection_identity.hpp"
#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_client.hpp"
#include <memory>
#include <string>

namespace sqlbridge {

class PoolRegistry;

/**
 * @brief Abstract database backend - creates all engine-specific components
 *
 * Each database type (PostgreSQL, SQLite) provides a concrete implementation
 * that creates the right connection factory, pool and client variant.
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::SQLITE);
 *   auto pool = backend->create_pool(identity.key(), config);
 *   auto client = backend->create_client(identity, client_config, pools);
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Database type this backend supports */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Create the native connection factory */
    [[nodiscard]] virtual std::shared_ptr<IConnectionFactory> create_connection_factory() = 0;

    /**
     * @brief Create a connection pool
     * @throws PoolCreationError if pre-warming fails
     */
    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> create_pool(
        const std::string& name,
        const PoolConfig& config) = 0;

    /** @brief Create the client variant for this engine */
    [[nodiscard]] virtual std::shared_ptr<IDbClient> create_client(
        const ConnectionIdentity& identity,
        const ClientConfig& config,
        std::shared_ptr<PoolRegistry> pools) = 0;
};

} // namespace sqlbridge
