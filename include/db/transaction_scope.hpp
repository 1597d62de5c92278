#pragma once

#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"
#include "db/pooled_connection.hpp"
#include <type_traits>
#include <utility>

namespace sqlbridge {

/**
 * @brief Statement-level transaction on one borrowed connection
 *
 * With transactional = true the constructor issues BEGIN; commit() issues
 * COMMIT; leaving the scope without a commit issues ROLLBACK. With
 * transactional = false every member is a no-op and statements run in the
 * engine's autocommit mode.
 *
 * Usage:
 *   TransactionScope tx(conn, true);
 *   auto result = conn.execute(sql, params);
 *   if (!result.success) throw QueryExecutionError(result.error_message);  // rolls back
 *   tx.commit();
 */
class TransactionScope {
public:
    /**
     * @throws QueryExecutionError if BEGIN is rejected
     */
    TransactionScope(IDbConnection& conn, bool transactional);

    /**
     * @brief Rolls back if neither commit() nor rollback() ran; never throws
     */
    ~TransactionScope();

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    /**
     * @throws QueryExecutionError if COMMIT is rejected (the scope is closed either way)
     */
    void commit();

    /**
     * @brief Roll back now; failures are logged, not thrown
     */
    void rollback() noexcept;

    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    IDbConnection& conn_;
    bool active_ = false;
};

/**
 * @brief Borrow a connection, run fn on it, and return the connection
 *
 * The connection is released explicitly on the success path and on the
 * error path before the exception propagates, so a failed call never keeps
 * a pool slot busy.
 *
 * @param pool Pool to borrow from
 * @param fn Callable taking IDbConnection&
 * @return Whatever fn returns
 * @throws PoolExhaustedError, PoolCreationError from acquire(); anything fn throws
 */
template<typename Fn>
decltype(auto) with_pooled_connection(IConnectionPool& pool, Fn&& fn) {
    auto conn = pool.acquire();
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn, IDbConnection&>>) {
            std::forward<Fn>(fn)(**conn);
            conn->release();
        } else {
            auto result = std::forward<Fn>(fn)(**conn);
            conn->release();
            return result;
        }
    } catch (...) {
        conn->release();
        throw;
    }
}

} // namespace sqlbridge
