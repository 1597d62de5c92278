#include "db/generic_connection_pool.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <vector>

namespace sqlbridge {

GenericConnectionPool::GenericConnectionPool(
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)) {

    if (config_.max_connections == 0) {
        throw PoolCreationError(std::format(
            "Error creating connection pool '{}': max_connections must be > 0", name_));
    }
    config_.min_connections = std::min(config_.min_connections, config_.max_connections);

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        try {
            auto conn = create_connection();
            std::lock_guard lock(mutex_);
            idle_connections_.emplace_back(std::move(conn));
        } catch (const PoolCreationError& e) {
            utils::log::error(std::format(
                "Failed to create connection {} during pool initialization for '{}': {}",
                i + 1, name_, e.what()));
            drain();
            throw;
        }
    }

    utils::log::info(std::format("ConnectionPool created for '{}' (min={}, max={})",
        name_, config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire() {
    std::unique_ptr<IDbConnection> conn;
    {
        std::lock_guard lock(mutex_);

        if (shutdown_) {
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            throw DbError(ErrorCategory::INTERNAL_ERROR,
                std::format("Connection pool '{}' has been closed", name_));
        }

        // Reuse an idle connection, discarding any that lost their server
        while (!idle_connections_.empty() && !conn) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (!conn->is_connected()) {
                conn->close();
                conn.reset();
                connections_replaced_.fetch_add(1, std::memory_order_relaxed);
            }
        }

        // No idle connection: reserve a slot for a new one, or fail fast
        if (!conn && borrowed_ >= config_.max_connections) {
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            throw PoolExhaustedError(std::format(
                "Connection pool exhausted for '{}' (max: {})", name_, config_.max_connections));
        }

        ++borrowed_;
    }

    if (!conn) {
        try {
            conn = create_connection();
        } catch (const DbError&) {
            std::lock_guard lock(mutex_);
            --borrowed_;
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            throw;
        }
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);
    return wrap(std::move(conn));
}

std::unique_ptr<PooledConnection> GenericConnectionPool::wrap(std::unique_ptr<IDbConnection> conn) {
    auto return_fn = [weak = weak_from_this()](std::unique_ptr<IDbConnection> c) {
        if (auto pool = weak.lock()) {
            pool->return_connection(std::move(c));
        } else if (c) {
            c->close();
        }
    };
    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = borrowed_;
    stats.total_connections = stats.idle_connections + stats.active_connections;
    stats.max_connections = config_.max_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.connections_replaced = connections_replaced_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    std::vector<std::unique_ptr<IDbConnection>> to_close;
    size_t still_borrowed = 0;
    {
        std::lock_guard lock(mutex_);
        if (shutdown_ && idle_connections_.empty()) {
            return;
        }
        shutdown_ = true;
        still_borrowed = borrowed_;
        for (auto& conn : idle_connections_) {
            to_close.emplace_back(std::move(conn));
        }
        idle_connections_.clear();
    }

    for (auto& conn : to_close) {
        if (conn) {
            conn->close();
        }
    }

    utils::log::info(std::format("ConnectionPool drained for '{}' ({} closed, {} still borrowed)",
        name_, to_close.size(), still_borrowed));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        throw PoolCreationError(std::format(
            "Error creating connection for '{}': factory returned no connection", name_));
    }
    return conn;
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    bool discard = false;
    {
        std::lock_guard lock(mutex_);
        if (borrowed_ > 0) {
            --borrowed_;
        }
        // Closed pools and dead connections do not go back to the idle set
        discard = shutdown_ || !conn->is_connected();
        if (!discard) {
            idle_connections_.emplace_back(std::move(conn));
        }
    }

    if (discard) {
        conn->close();
    }
}

} // namespace sqlbridge
