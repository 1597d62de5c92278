#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace sqlbridge {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads BridgeConfig from TOML (toml++)
 *
 * "${VAR}" references inside string values are expanded from the
 * environment before extraction. Missing keys keep their defaults.
 *
 * Environment overrides (applied by apply_env_overrides, after the file):
 *   DB_HOST DB_PORT DB_NAME DB_USER DB_PASSWORD DB_POOL_MIN DB_POOL_MAX
 *   SQLITE_DB_PATH SQLITE_POOL_MAX
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        BridgeConfig config;

        static LoadResult ok(BridgeConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sqlbridge.toml
     * @param use_env Apply DB_* / SQLITE_* environment overrides
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path, bool use_env = true);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @param use_env Apply DB_* / SQLITE_* environment overrides
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content, bool use_env = false);

    /**
     * @brief Defaults plus environment overrides, for running without a file
     */
    [[nodiscard]] static LoadResult load_from_env();

    /**
     * @brief Overwrite config fields from DB_* / SQLITE_* variables that are set
     * @return Errors for variables that are set but not valid numbers
     */
    static std::vector<std::string> apply_env_overrides(BridgeConfig& config);

    /**
     * @brief Check ranges and required fields
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const BridgeConfig& config);

private:
    static LoadResult validate_and_return(BridgeConfig config);
    static LoadResult finish_load(BridgeConfig config, bool use_env);
};

} // namespace sqlbridge
