#pragma once

#include "core/database_type.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace sqlbridge {

// ============================================================================
// PostgreSQL Config ([database])
// ============================================================================

struct DatabaseConfig {
    DatabaseType type = DatabaseType::POSTGRESQL;
    std::string host = "localhost";
    uint32_t port = 5432;
    std::string name = "cipdb";
    std::string user = "cipuser";
    std::string password;
    size_t pool_min = 1;
    size_t pool_max = 10;
};

// ============================================================================
// SQLite Config ([sqlite])
// ============================================================================

struct SqliteConfig {
    std::string db_path = "./data/cip_debug.db";
    size_t pool_max = 5;
};

// ============================================================================
// Logging Config ([logging])
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
    bool debug_sql = false;
};

// ============================================================================
// Top-level Config
// ============================================================================

struct BridgeConfig {
    DatabaseConfig database;
    SqliteConfig sqlite;
    LoggingConfig logging;
};

} // namespace sqlbridge
