#pragma once

#include "db/connection_identity.hpp"
#include "db/idb_client.hpp"
#include "db/pool_registry.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlbridge {

/**
 * @brief Snapshot of the registries for diagnostics
 */
struct InstanceInfo {
    std::vector<std::string> instances;
    std::vector<std::string> pools;
    size_t instance_count = 0;
    size_t pool_count = 0;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Shares one client per connection identity
 *
 * Asking twice for the same identity returns the same client object unless
 * force_new is set. Forced clients are not cached but still borrow from the
 * identity's shared pool.
 */
class ClientRegistry {
public:
    using ClientFactory = std::function<std::shared_ptr<IDbClient>(
        const ConnectionIdentity& identity,
        const ClientConfig& config,
        std::shared_ptr<PoolRegistry> pools)>;

    explicit ClientRegistry(std::shared_ptr<PoolRegistry> pools);
    ClientRegistry(std::shared_ptr<PoolRegistry> pools, ClientFactory factory);

    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;

    /**
     * @brief Cached client for identity, or a new one
     *
     * config only applies to the call that creates the client (and, through
     * it, the identity's pool).
     */
    [[nodiscard]] std::shared_ptr<IDbClient> get_or_create_client(
        const ConnectionIdentity& identity,
        const ClientConfig& config = {},
        bool force_new = false);

    /**
     * @brief Evict the cached client for key, optionally closing its pool
     * @return true if a client was cached under key
     */
    bool remove(const std::string& key, bool close_pool = false);

    /**
     * @brief Close one pool (key given) or every pool, evicting cached clients
     */
    void close_all_connections(const std::optional<std::string>& key = std::nullopt);

    [[nodiscard]] InstanceInfo get_instance_info() const;

    [[nodiscard]] const std::shared_ptr<PoolRegistry>& pools() const { return pools_; }

private:
    std::shared_ptr<PoolRegistry> pools_;
    ClientFactory factory_;
    std::unordered_map<std::string, std::shared_ptr<IDbClient>> clients_;
    mutable std::shared_mutex mutex_;
};

} // namespace sqlbridge
