#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace sqlbridge {

/**
 * @brief Borrowed database connection
 *
 * Returns the connection to its pool exactly once: either through an
 * explicit release() or, as a backstop, on destruction.
 * Move-only to prevent accidental copying.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    /**
     * @brief Construct pooled connection with return callback
     * @param conn Database connection
     * @param return_fn Function that hands the connection back to the pool
     */
    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    /**
     * @brief Destructor - returns the connection if release() was not called
     */
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    /**
     * @brief Return the connection to the pool now; later calls are no-ops
     */
    void release();

    /**
     * @brief Access the underlying connection
     */
    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }
    IDbConnection& operator*() const { return *conn_; }

    /**
     * @brief Check if connection is still held and usable
     */
    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

private:
    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
};

} // namespace sqlbridge
