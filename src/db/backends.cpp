#include "db/backend_registry.hpp"
#include "db/postgresql/pg_backend.hpp"
#include "db/sqlite/sqlite_backend.hpp"

namespace sqlbridge {

void register_builtin_backends() {
    BackendRegistry::instance().register_backend(
        DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });

    BackendRegistry::instance().register_backend(
        DatabaseType::SQLITE,
        [] { return std::make_unique<SqliteBackend>(); });
}

} // namespace sqlbridge
