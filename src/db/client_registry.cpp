#include "db/client_registry.hpp"
#include "db/backend_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace sqlbridge {

namespace {

std::shared_ptr<IDbClient> create_backend_client(
    const ConnectionIdentity& identity,
    const ClientConfig& config,
    std::shared_ptr<PoolRegistry> pools) {
    auto backend = BackendRegistry::instance().create(identity.type);
    return backend->create_client(identity, config, std::move(pools));
}

} // anonymous namespace

nlohmann::json InstanceInfo::to_json() const {
    return nlohmann::json{
        {"instances", instances},
        {"pools", pools},
        {"instance_count", instance_count},
        {"pool_count", pool_count},
    };
}

ClientRegistry::ClientRegistry(std::shared_ptr<PoolRegistry> pools)
    : ClientRegistry(std::move(pools), create_backend_client) {}

ClientRegistry::ClientRegistry(std::shared_ptr<PoolRegistry> pools, ClientFactory factory)
    : pools_(std::move(pools)),
      factory_(std::move(factory)) {}

std::shared_ptr<IDbClient> ClientRegistry::get_or_create_client(
    const ConnectionIdentity& identity,
    const ClientConfig& config,
    bool force_new) {

    if (force_new) {
        return factory_(identity, config, pools_);
    }

    const std::string key = identity.key();

    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(mutex_);
        if (const auto it = clients_.find(key); it != clients_.end()) {
            return it->second;
        }
    }

    // Slow path: unique lock with double-checked locking
    std::unique_lock lock(mutex_);
    if (const auto it = clients_.find(key); it != clients_.end()) {
        return it->second;
    }

    auto client = factory_(identity, config, pools_);
    clients_.emplace(key, client);
    utils::log::info(std::format("Client registered for '{}'", key));
    return client;
}

bool ClientRegistry::remove(const std::string& key, bool close_pool) {
    bool removed = false;
    {
        std::unique_lock lock(mutex_);
        removed = clients_.erase(key) > 0;
    }

    if (close_pool) {
        pools_->close(key);
    }
    return removed;
}

void ClientRegistry::close_all_connections(const std::optional<std::string>& key) {
    if (key) {
        pools_->close(*key);
        std::unique_lock lock(mutex_);
        clients_.erase(*key);
        return;
    }

    pools_->close_all();
    {
        std::unique_lock lock(mutex_);
        clients_.clear();
    }
    utils::log::info("All pools closed and client instances cleared");
}

InstanceInfo ClientRegistry::get_instance_info() const {
    InstanceInfo info;
    {
        std::shared_lock lock(mutex_);
        info.instances.reserve(clients_.size());
        for (const auto& [key, _] : clients_) {
            info.instances.push_back(key);
        }
    }
    std::sort(info.instances.begin(), info.instances.end());

    info.pools = pools_->keys();
    info.instance_count = info.instances.size();
    info.pool_count = info.pools.size();
    return info;
}

} // namespace sqlbridge
