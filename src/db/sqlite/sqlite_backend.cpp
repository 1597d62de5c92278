#include "db/sqlite/sqlite_backend.hpp"
#include "db/sqlite/sqlite_client.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "db/generic_connection_pool.hpp"

namespace sqlbridge {

std::shared_ptr<IConnectionFactory> SqliteBackend::create_connection_factory() {
    return std::make_shared<SqliteConnectionFactory>();
}

std::shared_ptr<IConnectionPool> SqliteBackend::create_pool(
    const std::string& name,
    const PoolConfig& config) {

    return std::make_shared<GenericConnectionPool>(
        name, config, create_connection_factory());
}

std::shared_ptr<IDbClient> SqliteBackend::create_client(
    const ConnectionIdentity& identity,
    const ClientConfig& config,
    std::shared_ptr<PoolRegistry> pools) {

    return std::make_shared<SqliteClient>(identity, config, std::move(pools));
}

} // namespace sqlbridge
