#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlbridge {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

/**
 * @brief Read an integer key, rejecting values the target type cannot hold
 */
template<typename T>
T integer_field(const toml::table& section, const char* section_name,
                const char* key, int64_t fallback) {
    const int64_t raw = section[key].value_or(fallback);
    if (raw < 0 || static_cast<uint64_t>(raw) > std::numeric_limits<T>::max()) {
        throw std::out_of_range(std::format("{}.{} is out of range, got {}", section_name, key, raw));
    }
    return static_cast<T>(raw);
}

DatabaseConfig extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* db = root["database"].as_table();
    if (!db) return cfg;

    cfg.type = parse_database_type((*db)["type"].value_or("postgresql"s));
    cfg.host = (*db)["host"].value_or(cfg.host);
    cfg.port = integer_field<uint32_t>(*db, "database", "port", 5432);
    cfg.name = (*db)["name"].value_or(cfg.name);
    cfg.user = (*db)["user"].value_or(cfg.user);
    cfg.password = (*db)["password"].value_or(""s);
    cfg.pool_min = integer_field<size_t>(*db, "database", "pool_min", 1);
    cfg.pool_max = integer_field<size_t>(*db, "database", "pool_max", 10);
    return cfg;
}

SqliteConfig extract_sqlite(const toml::table& root) {
    SqliteConfig cfg;
    const auto* sq = root["sqlite"].as_table();
    if (!sq) return cfg;

    cfg.db_path = (*sq)["db_path"].value_or(cfg.db_path);
    cfg.pool_max = integer_field<size_t>(*sq, "sqlite", "pool_max", 5);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* lg = root["logging"].as_table();
    if (!lg) return cfg;

    cfg.level = (*lg)["level"].value_or(cfg.level);
    cfg.debug_sql = (*lg)["debug_sql"].value_or(false);
    return cfg;
}

BridgeConfig extract_all_sections(const toml::table& tbl) {
    BridgeConfig config;
    config.database = extract_database(tbl);
    config.sqlite = extract_sqlite(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

template<typename T>
void override_int(const char* name, T& target, std::vector<std::string>& errors) {
    const char* env_val = std::getenv(name);
    if (!env_val) return;

    if (const auto parsed = utils::try_parse_int<T>(env_val)) {
        target = *parsed;
    } else {
        errors.push_back(std::format("{} must be an integer, got '{}'", name, env_val));
    }
}

void override_string(const char* name, std::string& target) {
    if (const char* env_val = std::getenv(name)) {
        target = env_val;
    }
}

} // anonymous namespace

// ---- Environment -----------------------------------------------------------

std::vector<std::string> ConfigLoader::apply_env_overrides(BridgeConfig& config) {
    std::vector<std::string> errors;

    override_string("DB_HOST", config.database.host);
    override_int("DB_PORT", config.database.port, errors);
    override_string("DB_NAME", config.database.name);
    override_string("DB_USER", config.database.user);
    override_string("DB_PASSWORD", config.database.password);
    override_int("DB_POOL_MIN", config.database.pool_min, errors);
    override_int("DB_POOL_MAX", config.database.pool_max, errors);

    override_string("SQLITE_DB_PATH", config.sqlite.db_path);
    override_int("SQLITE_POOL_MAX", config.sqlite.pool_max, errors);

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(BridgeConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::finish_load(BridgeConfig config, bool use_env) {
    if (use_env) {
        const auto env_errors = apply_env_overrides(config);
        if (!env_errors.empty()) {
            std::string combined = "Config validation failed:";
            for (const auto& err : env_errors) { combined += "\n  - "; combined += err; }
            return LoadResult::error(std::move(combined));
        }
    }
    return validate_and_return(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path, bool use_env) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return finish_load(extract_all_sections(tbl), use_env);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content, bool use_env) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return finish_load(extract_all_sections(tbl), use_env);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_env() {
    return finish_load(BridgeConfig{}, true);
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const BridgeConfig& config) {
    std::vector<std::string> errors;
    const auto& db = config.database;

    if (db.type == DatabaseType::POSTGRESQL) {
        if (!utils::in_range<1, 65535>(db.port)) {
            errors.push_back(std::format("database.port must be 1-65535, got {}", db.port));
        }
        if (db.host.empty()) {
            errors.push_back("database.host must not be empty");
        }
        if (db.name.empty()) {
            errors.push_back("database.name must not be empty");
        }
        if (db.user.empty()) {
            errors.push_back("database.user must not be empty");
        }
    }

    if (db.pool_min < 1) {
        errors.push_back("database.pool_min must be >= 1");
    }
    if (!utils::in_range<1, 100>(db.pool_max)) {
        errors.push_back(std::format("database.pool_max must be 1-100, got {}", db.pool_max));
    }
    if (db.pool_min > db.pool_max) {
        errors.push_back(std::format(
            "database.pool_min ({}) > pool_max ({})", db.pool_min, db.pool_max));
    }

    if (db.type == DatabaseType::SQLITE && config.sqlite.db_path.empty()) {
        errors.push_back("sqlite.db_path must not be empty");
    }
    if (!utils::in_range<1, 100>(config.sqlite.pool_max)) {
        errors.push_back(std::format("sqlite.pool_max must be 1-100, got {}", config.sqlite.pool_max));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'", config.logging.level));
    }

    return errors;
}

} // namespace sqlbridge
