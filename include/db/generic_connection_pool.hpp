#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace sqlbridge {

/**
 * @brief Database-agnostic bounded connection pool
 *
 * Design:
 * - Bounded pool: idle + borrowed never exceeds max_connections
 * - Fail-fast: acquire() throws PoolExhaustedError instead of waiting
 * - Lazy growth: connections created on demand up to max, min pre-warmed
 * - Liveness: idle connections that lost their server are replaced on acquire
 * - Thread-safe: one mutex guards the idle deque and the borrowed count
 * - RAII: PooledConnection hands the connection back exactly once
 *
 * Connection creation happens outside the lock; the slot is reserved
 * (borrowed_ incremented) first so concurrent acquires cannot overshoot max.
 *
 * Must be owned by a std::shared_ptr. Borrowed connections hold a weak
 * reference back to the pool; one returned after the pool is gone is closed.
 */
class GenericConnectionPool : public IConnectionPool,
                              public std::enable_shared_from_this<GenericConnectionPool> {
public:
    /**
     * @brief Construct pool with connection factory
     * @param name Identity key (for logging and diagnostics)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     * @throws PoolCreationError if a pre-warm connection cannot be opened
     */
    GenericConnectionPool(
        std::string name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    std::unique_ptr<PooledConnection> acquire() override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return name_; }

private:
    /**
     * @brief Create new connection via factory
     */
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Return connection to pool (called by PooledConnection)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<IDbConnection> conn);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    size_t borrowed_ = 0;
    bool shutdown_ = false;
    mutable std::mutex mutex_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> connections_replaced_{0};
};

} // namespace sqlbridge
