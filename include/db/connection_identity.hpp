#pragma once

#include "core/database_type.hpp"
#include <cstdint>
#include <format>
#include <functional>
#include <string>
#include <utility>

namespace sqlbridge {

/**
 * @brief Logical database target
 *
 * Two identities with equal fields share one pool and one cached client.
 * The password is deliberately not part of the identity.
 *
 * Keys:
 *   PostgreSQL: "host:port/database@user"
 *   SQLite:     "sqlite:<database file path>"
 */
struct ConnectionIdentity {
    DatabaseType type = DatabaseType::POSTGRESQL;
    std::string host;
    uint16_t port = 5432;
    std::string database;
    std::string user;

    [[nodiscard]] static ConnectionIdentity postgres(
        std::string host, uint16_t port, std::string database, std::string user) {
        return ConnectionIdentity{DatabaseType::POSTGRESQL, std::move(host), port,
                                  std::move(database), std::move(user)};
    }

    [[nodiscard]] static ConnectionIdentity sqlite(std::string database_path) {
        return ConnectionIdentity{DatabaseType::SQLITE, "", 0, std::move(database_path), ""};
    }

    [[nodiscard]] std::string key() const {
        if (type == DatabaseType::SQLITE) {
            return std::format("sqlite:{}", database);
        }
        return std::format("{}:{}/{}@{}", host, port, database, user);
    }

    bool operator==(const ConnectionIdentity&) const = default;
};

} // namespace sqlbridge

template<>
struct std::hash<sqlbridge::ConnectionIdentity> {
    size_t operator()(const sqlbridge::ConnectionIdentity& id) const noexcept {
        return std::hash<std::string>{}(id.key());
    }
};
