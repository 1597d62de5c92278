#pragma once

#include "db/idb_backend.hpp"

namespace sqlbridge {

/**
 * @brief PostgreSQL backend - creates all PG-specific components
 *
 * Creates:
 * - PgConnectionFactory -> GenericConnectionPool
 * - PgClient
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionFactory> create_connection_factory() override;

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<IDbClient> create_client(
        const ConnectionIdentity& identity,
        const ClientConfig& config,
        std::shared_ptr<PoolRegistry> pools) override;
};

} // namespace sqlbridge
