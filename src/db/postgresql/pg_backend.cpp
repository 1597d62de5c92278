#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_client.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/generic_connection_pool.hpp"

namespace sqlbridge {

std::shared_ptr<IConnectionFactory> PgBackend::create_connection_factory() {
    return std::make_shared<PgConnectionFactory>();
}

std::shared_ptr<IConnectionPool> PgBackend::create_pool(
    const std::string& name,
    const PoolConfig& config) {

    return std::make_shared<GenericConnectionPool>(
        name, config, create_connection_factory());
}

std::shared_ptr<IDbClient> PgBackend::create_client(
    const ConnectionIdentity& identity,
    const ClientConfig& config,
    std::shared_ptr<PoolRegistry> pools) {

    return std::make_shared<PgClient>(identity, config, std::move(pools));
}

} // namespace sqlbridge
