#pragma once

#include "db/idb_backend.hpp"

namespace sqlbridge {

/**
 * @brief SQLite backend - creates all SQLite-specific components
 *
 * Creates:
 * - SqliteConnectionFactory -> GenericConnectionPool
 * - SqliteClient
 */
class SqliteBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::SQLITE;
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
