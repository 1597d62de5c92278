#pragma once

#include "db/idb_backend.hpp"
#include "core/database_type.hpp"
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace sqlbridge {

/**
 * @brief Registry for database backends
 *
 * Populated once at startup by register_builtin_backends(), then queried
 * by DatabaseType to instantiate the right backend.
 *
 * Usage:
 *   // Registration (in backends.cpp):
 *   BackendRegistry::instance().register_backend(
 *       DatabaseType::SQLITE, []{ return std::make_unique<SqliteBackend>(); });
 *
 *   // Creation (in pool_registry.cpp):
 *   auto backend = BackendRegistry::instance().create(DatabaseType::SQLITE);
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(DatabaseType type, Factory factory) {
        std::lock_guard lock(mutex_);
        factories_[type] = std::move(factory);
    }

    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const {
        Factory factory;
        {
            std::lock_guard lock(mutex_);
            const auto it = factories_.find(type);
            if (it == factories_.end()) {
                throw std::runtime_error(std::format(
                    "No backend registered for database type: {}", database_type_to_string(type)));
            }
            factory = it->second;
        }
        return factory();
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        std::lock_guard lock(mutex_);
        return factories_.count(type) > 0;
    }

private:
    BackendRegistry() = default;

    // Use a simple struct hash for DatabaseType
    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

/**
 * @brief Register the PostgreSQL and SQLite backends (idempotent)
 */
void register_builtin_backends();

} // namespace sqlbridge
