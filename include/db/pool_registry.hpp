#pragma once

#include "db/connection_identity.hpp"
#include "db/iconnection_pool.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlbridge {

/**
 * @brief One connection pool per connection identity
 *
 * Pools are created lazily on first access. Lookups take a shared lock;
 * creation re-checks under the unique lock so two threads asking for the
 * same identity at once still produce a single pool.
 *
 * The default factory builds pools through the backend registered for the
 * identity's DatabaseType.
 */
class PoolRegistry {
public:
    using PoolFactory = std::function<std::shared_ptr<IConnectionPool>(
        const ConnectionIdentity& identity, const PoolConfig& config)>;

    PoolRegistry();
    explicit PoolRegistry(PoolFactory factory);

    ~PoolRegistry();

    PoolRegistry(const PoolRegistry&) = delete;
    PoolRegistry& operator=(const PoolRegistry&) = delete;

    /**
     * @brief Return the identity's pool, creating it with config if absent
     *
     * config is only used by the call that creates the pool.
     *
     * @throws PoolCreationError if the pool cannot be created; nothing is registered then
     */
    [[nodiscard]] std::shared_ptr<IConnectionPool> get_or_create_pool(
        const ConnectionIdentity& identity, const PoolConfig& config);

    /**
     * @brief Existing pool for key, or nullptr
     */
    [[nodiscard]] std::shared_ptr<IConnectionPool> find_pool(const std::string& key) const;

    /**
     * @brief Drain and unregister one pool
     * @return false if no pool is registered under key
     */
    bool close(const std::string& key);

    /**
     * @brief Drain and unregister every pool
     */
    void close_all();

    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] size_t size() const;

private:
    PoolFactory factory_;
    std::unordered_map<std::string, std::shared_ptr<IConnectionPool>> pools_;
    mutable std::shared_mutex mutex_;
};

} // namespace sqlbridge
