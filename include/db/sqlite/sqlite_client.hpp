#pragma once

#include "db/pooled_db_client.hpp"
#include <string>

namespace sqlbridge {

/**
 * @brief SQLite client: full dialect translation plus RETURNING fallback
 *
 * A returning statement that SQLite rejects as an operational error is
 * retried once without its RETURNING clause, in the same transaction,
 * and the generated id becomes sqlite3_last_insert_rowid().
 */
class SqliteClient : public PooledDbClient {
public:
    using PooledDbClient::PooledDbClient;

protected:
    [[nodiscard]] PreparedStatement prepare(
        const std::string& query, const SqlParams& params) const override;

    [[nodiscard]] DbResultSet run_statement(
        IDbConnection& conn, const PreparedStatement& stmt, StatementKind kind) override;

    [[nodiscard]] SqlValue generated_id_without_row(const DbResultSet& result) const override;

    [[nodiscard]] std::string connection_string() const override;
};

} // namespace sqlbridge
