#include "db/pooled_db_client.hpp"
#include "db/pool_registry.hpp"
#include "db/transaction_scope.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlbridge {

namespace {

constexpr const char* kNotConnected =
    "Not connected to database. Call connect() first or use auto_connection=true.";

std::string render_params(const SqlParams& params) {
    std::string out = "(";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        if (const auto* s = std::get_if<std::string>(&params[i])) {
            out += std::format("'{}'", *s);
        } else {
            out += to_display_string(params[i]);
        }
    }
    out += ")";
    return out;
}

std::vector<Row> to_rows(DbResultSet&& result) {
    std::vector<Row> rows;
    rows.reserve(result.rows.size());
    for (auto& values : result.rows) {
        Row row;
        row.reserve(result.column_names.size());
        for (size_t i = 0; i < result.column_names.size() && i < values.size(); ++i) {
            row.insert_or_assign(result.column_names[i], std::move(values[i]));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // anonymous namespace

const char* statement_kind_to_string(StatementKind kind) {
    switch (kind) {
        case StatementKind::SELECT:              return "Query";
        case StatementKind::NON_QUERY:           return "Non-Query";
        case StatementKind::NON_QUERY_RETURNING: return "Non-Query (Returning)";
        default:                                 return "Statement";
    }
}

PooledDbClient::PooledDbClient(ConnectionIdentity identity,
                               ClientConfig config,
                               std::shared_ptr<PoolRegistry> pools)
    : config_(std::move(config)),
      identity_(std::move(identity)),
      pools_(std::move(pools)) {}

PooledDbClient::~PooledDbClient() {
    std::lock_guard lock(held_mutex_);
    if (held_) {
        held_->release();
        held_.reset();
    }
}

std::shared_ptr<IConnectionPool> PooledDbClient::pool() {
    PoolConfig pool_config;
    pool_config.connection_string = connection_string();
    pool_config.min_connections = config_.min_connections;
    pool_config.max_connections = config_.max_connections;
    return pools_->get_or_create_pool(identity_, pool_config);
}

void PooledDbClient::connect() {
    std::lock_guard lock(held_mutex_);
    if (held_) {
        return;
    }

    held_ = pool()->acquire();
    log_debug(std::format("Connection acquired from pool for '{}'", identity_.key()));
}

void PooledDbClient::close() {
    std::lock_guard lock(held_mutex_);
    if (!held_) {
        return;
    }

    held_->release();
    held_.reset();
    log_debug(std::format("Connection returned to pool for '{}'", identity_.key()));
}

bool PooledDbClient::is_connected() const {
    std::lock_guard lock(held_mutex_);
    return held_ != nullptr && held_->is_valid();
}

std::vector<Row> PooledDbClient::execute_query(
    const std::string& query, const SqlParams& params, bool auto_connection) {

    auto result = execute(query, params, auto_connection, StatementKind::SELECT);
    auto rows = to_rows(std::move(result));
    log_debug(std::format("Query Success -> {} rows fetched", rows.size()));
    return rows;
}

std::optional<uint64_t> PooledDbClient::execute_non_query(
    const std::string& query, const SqlParams& params, bool auto_connection) {

    const auto result = execute(query, params, auto_connection, StatementKind::NON_QUERY);
    log_debug("Non-Query executed successfully");
    if (!result.has_affected_rows) {
        return std::nullopt;
    }
    return result.affected_rows;
}

SqlValue PooledDbClient::execute_non_query_returning(
    const std::string& query, const SqlParams& params, bool auto_connection) {

    auto result = execute(query, params, auto_connection, StatementKind::NON_QUERY_RETURNING);

    SqlValue id;
    if (!result.rows.empty() && !result.column_names.empty()) {
        size_t column = 0;
        for (size_t i = 0; i < result.column_names.size(); ++i) {
            if (result.column_names[i] == "id") {
                column = i;
                break;
            }
        }
        if (column < result.rows.front().size()) {
            id = std::move(result.rows.front()[column]);
        }
    } else {
        id = generated_id_without_row(result);
    }

    log_debug(std::format("Non-Query (Returning) executed successfully -> Returning ID: {}",
        to_display_string(id)));
    return id;
}

DbResultSet PooledDbClient::execute(
    const std::string& query,
    const SqlParams& params,
    bool auto_connection,
    StatementKind kind) {

    const auto stmt = prepare(query, params);

    // A held connection serves every call until close()
    {
        std::lock_guard lock(held_mutex_);
        if (held_) {
            log_debug(std::format("Executing {}:\n   SQL: {}\n   Params: {}",
                statement_kind_to_string(kind), stmt.sql, render_params(stmt.params)));
            return run_in_transaction(**held_, stmt, kind);
        }
    }

    if (!auto_connection) {
        throw NotConnectedError(kNotConnected);
    }

    log_debug(std::format("Executing {} (auto):\n   SQL: {}\n   Params: {}",
        statement_kind_to_string(kind), stmt.sql, render_params(stmt.params)));

    auto conn_pool = pool();
    return with_pooled_connection(*conn_pool, [&](IDbConnection& conn) {
        return run_in_transaction(conn, stmt, kind);
    });
}

DbResultSet PooledDbClient::run_in_transaction(
    IDbConnection& conn, const PreparedStatement& stmt, StatementKind kind) {

    // Reads run in autocommit; writes get their own BEGIN/COMMIT
    TransactionScope tx(conn, kind != StatementKind::SELECT);

    auto result = run_statement(conn, stmt, kind);
    if (!result.success) {
        log_debug(std::format("{} failed: {}", statement_kind_to_string(kind), result.error_message));
        throw QueryExecutionError(std::format("Error executing query: {}", result.error_message));
    }

    tx.commit();
    return result;
}

DbResultSet PooledDbClient::run_statement(
    IDbConnection& conn, const PreparedStatement& stmt, StatementKind /*kind*/) {
    return conn.execute(stmt.sql, stmt.params);
}

void PooledDbClient::log_debug(const std::string& msg) const {
    if (config_.debug) {
        utils::log::info(msg);
    }
}

} // namespace sqlbridge
