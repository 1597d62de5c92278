#pragma once

#include "db/pooled_db_client.hpp"
#include <string>

namespace sqlbridge {

/**
 * @brief PostgreSQL client: "%s" markers become $1..$n, RETURNING is native
 */
class PgClient : public PooledDbClient {
public:
    using PooledDbClient::PooledDbClient;

    /**
     * @brief libpq keyword/value conninfo for an identity
     *
     * Values are single-quoted with backslash escaping; an empty password
     * is omitted so libpq can fall back to PGPASSWORD or ~/.pgpass.
     */
    [[nodiscard]] static std::string build_conninfo(
        const ConnectionIdentity& identity, const std::string& password);

protected:
    [[nodiscard]] PreparedStatement prepare(
        const std::string& query, const SqlParams& params) const override;

    [[nodiscard]] SqlValue generated_id_without_row(const DbResultSet& result) const override;

    [[nodiscard]] std::string connection_string() const override;
};

} // namespace sqlbridge
