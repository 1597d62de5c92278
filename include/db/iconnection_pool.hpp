#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace sqlbridge {

// Forward declarations
class PooledConnection;

/**
 * @brief Pool configuration (database-agnostic)
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 10;
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t max_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t connections_replaced = 0;
};

/**
 * @brief Abstract connection pool interface
 *
 * Acquisition never waits: a pool with every connection borrowed and no
 * room to open another fails the call immediately.
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Borrow a connection
     * @return RAII connection handle, never nullptr
     * @throws PoolExhaustedError when borrowed == max_connections
     * @throws PoolCreationError when a new connection cannot be opened
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire() = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Drain pool - close idle connections now, borrowed ones on return
     */
    virtual void drain() = 0;

    /**
     * @brief Identity key this pool serves
     */
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace sqlbridge
