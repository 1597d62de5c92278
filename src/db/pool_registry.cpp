#include "db/pool_registry.hpp"
#include "db/backend_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace sqlbridge {

namespace {

std::shared_ptr<IConnectionPool> create_backend_pool(
    const ConnectionIdentity& identity, const PoolConfig& config) {
    auto backend = BackendRegistry::instance().create(identity.type);
    return backend->create_pool(identity.key(), config);
}

} // anonymous namespace

PoolRegistry::PoolRegistry() : PoolRegistry(create_backend_pool) {}

PoolRegistry::PoolRegistry(PoolFactory factory)
    : factory_(std::move(factory)) {}

PoolRegistry::~PoolRegistry() {
    close_all();
}

std::shared_ptr<IConnectionPool> PoolRegistry::get_or_create_pool(
    const ConnectionIdentity& identity, const PoolConfig& config) {

    const std::string key = identity.key();

    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(mutex_);
        if (const auto it = pools_.find(key); it != pools_.end()) {
            return it->second;
        }
    }

    // Slow path: unique lock with double-checked locking
    std::unique_lock lock(mutex_);

    // Double-check: another thread may have created it
    if (const auto it = pools_.find(key); it != pools_.end()) {
        return it->second;
    }

    if (!factory_) {
        throw PoolCreationError(std::format(
            "Error creating connection pool for '{}': no pool factory configured", key));
    }

    std::shared_ptr<IConnectionPool> pool;
    try {
        pool = factory_(identity, config);
    } catch (const DbError&) {
        throw;
    } catch (const std::exception& e) {
        throw PoolCreationError(std::format("Error creating connection pool: {}", e.what()));
    }
    if (!pool) {
        throw PoolCreationError(std::format(
            "Error creating connection pool for '{}': factory returned no pool", key));
    }

    pools_.emplace(key, pool);
    utils::log::info(std::format("Connection pool registered for '{}' (min={}, max={})",
        key, config.min_connections, config.max_connections));
    return pool;
}

std::shared_ptr<IConnectionPool> PoolRegistry::find_pool(const std::string& key) const {
    std::shared_lock lock(mutex_);
    const auto it = pools_.find(key);
    return it != pools_.end() ? it->second : nullptr;
}

bool PoolRegistry::close(const std::string& key) {
    std::shared_ptr<IConnectionPool> pool;
    {
        std::unique_lock lock(mutex_);
        const auto it = pools_.find(key);
        if (it == pools_.end()) {
            return false;
        }
        pool = std::move(it->second);
        pools_.erase(it);
    }

    pool->drain();
    utils::log::info(std::format("Connection pool for '{}' closed", key));
    return true;
}

void PoolRegistry::close_all() {
    std::unordered_map<std::string, std::shared_ptr<IConnectionPool>> closing;
    {
        std::unique_lock lock(mutex_);
        closing.swap(pools_);
    }

    if (closing.empty()) {
        return;
    }

    for (const auto& [key, pool] : closing) {
        pool->drain();
        utils::log::info(std::format("Connection pool for '{}' closed", key));
    }
    utils::log::info(std::format("All connection pools closed ({})", closing.size()));
}

std::vector<std::string> PoolRegistry::keys() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(pools_.size());
        for (const auto& [key, _] : pools_) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t PoolRegistry::size() const {
    std::shared_lock lock(mutex_);
    return pools_.size();
}

} // namespace sqlbridge
