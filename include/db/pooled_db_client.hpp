#pragma once

#include "db/connection_identity.hpp"
#include "db/idb_client.hpp"
#include "db/idb_connection.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace sqlbridge {

class PoolRegistry;

enum class StatementKind {
    SELECT,
    NON_QUERY,
    NON_QUERY_RETURNING,
};

[[nodiscard]] const char* statement_kind_to_string(StatementKind kind);

/**
 * @brief Statement text and parameters in an engine's native form
 */
struct PreparedStatement {
    std::string sql;
    SqlParams params;
};

/**
 * @brief Execution engine shared by the PostgreSQL and SQLite clients
 *
 * Flow per call: prepare (dialect hook) -> borrow or reuse a connection ->
 * BEGIN for writes -> run (engine hook) -> COMMIT, or ROLLBACK and throw
 * QueryExecutionError -> return the connection if it was borrowed for
 * this call.
 *
 * The pool is looked up in the PoolRegistry on every borrow, so a client
 * outlives close_all_connections() and transparently gets a fresh pool.
 *
 * Auto-mode calls are safe from many threads. A held (manual-mode)
 * connection is guarded by a mutex, so concurrent manual-mode calls
 * serialise on it.
 */
class PooledDbClient : public IDbClient {
public:
    PooledDbClient(ConnectionIdentity identity,
                   ClientConfig config,
                   std::shared_ptr<PoolRegistry> pools);

    ~PooledDbClient() override;

    PooledDbClient(const PooledDbClient&) = delete;
    PooledDbClient& operator=(const PooledDbClient&) = delete;

    void connect() override;

    [[nodiscard]] std::vector<Row> execute_query(
        const std::string& query,
        const SqlParams& params = {},
        bool auto_connection = true) override;

    std::optional<uint64_t> execute_non_query(
        const std::string& query,
        const SqlParams& params = {},
        bool auto_connection = true) override;

    SqlValue execute_non_query_returning(
        const std::string& query,
        const SqlParams& params = {},
        bool auto_connection = true) override;

    void close() override;

    [[nodiscard]] bool is_connected() const override;

    [[nodiscard]] const ConnectionIdentity& identity() const override { return identity_; }

    [[nodiscard]] bool debug() const noexcept { return config_.debug; }

protected:
    /**
     * @brief Rewrite query and parameters into the engine's dialect
     */
    [[nodiscard]] virtual PreparedStatement prepare(
        const std::string& query, const SqlParams& params) const = 0;

    /**
     * @brief Run one prepared statement; failures come back in the result set
     *
     * Called inside the statement's transaction. The default runs the
     * statement as-is.
     */
    [[nodiscard]] virtual DbResultSet run_statement(
        IDbConnection& conn, const PreparedStatement& stmt, StatementKind kind);

    /**
     * @brief Generated id when a returning statement produced no row
     */
    [[nodiscard]] virtual SqlValue generated_id_without_row(const DbResultSet& result) const = 0;

    /**
     * @brief Backend connection string (conninfo, database path)
     */
    [[nodiscard]] virtual std::string connection_string() const = 0;

    /**
     * @brief Log through utils::log::info when the client's debug flag is set
     */
    void log_debug(const std::string& msg) const;

    ClientConfig config_;

private:
    [[nodiscard]] std::shared_ptr<IConnectionPool> pool();

    [[nodiscard]] DbResultSet execute(
        const std::string& query,
        const SqlParams& params,
        bool auto_connection,
        StatementKind kind);

    [[nodiscard]] DbResultSet run_in_transaction(
        IDbConnection& conn, const PreparedStatement& stmt, StatementKind kind);

    ConnectionIdentity identity_;
    std::shared_ptr<PoolRegistry> pools_;

    // Manual mode
    std::unique_ptr<PooledConnection> held_;
    mutable std::mutex held_mutex_;
};

} // namespace sqlbridge
