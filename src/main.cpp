#include "core/utils.hpp"
#include "core/database_type.hpp"
#include "core/error.hpp"
#include "core/sql_value.hpp"
#include "config/config_loader.hpp"
#include "db/backend_registry.hpp"
#include "db/client_registry.hpp"
#include "db/connection_identity.hpp"
#include "db/pool_registry.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace sqlbridge;

namespace {

constexpr const char* kUsage =
    "Usage: sqlbridge <config.toml> <query|exec|insert> <sql> [param...]\n"
    "\n"
    "  query   run a statement and print its rows as a JSON array\n"
    "  exec    run a write statement and print {\"affected_rows\": n}\n"
    "  insert  run a write statement and print {\"id\": generated id}\n"
    "\n"
    "  Markers in <sql> are written %s (literal percent: %%).\n"
    "  Params: null, true, false, integers, decimals, YYYY-MM-DD,\n"
    "  YYYY-MM-DD HH:MM:SS[.ffffff]; anything else is text.\n"
    "  Use '-' as config path to configure from the environment only.\n";

SqlValue parse_cli_param(const std::string& arg) {
    if (arg == "null") return std::monostate{};
    if (arg == "true") return true;
    if (arg == "false") return false;

    if (const auto i = utils::try_parse_int<int64_t>(arg)) {
        return *i;
    }

    double d = 0.0;
    const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), d);
    if (ec == std::errc{} && ptr == arg.data() + arg.size()) {
        return d;
    }

    if (const auto date = parse_date(arg)) return *date;
    if (const auto ts = parse_timestamp(arg)) return *ts;
    return arg;
}

nlohmann::json to_json(const SqlValue& v) {
    if (is_null(v)) return nullptr;
    if (const auto* b = std::get_if<bool>(&v)) return *b;
    if (const auto* i = std::get_if<int64_t>(&v)) return *i;
    if (const auto* d = std::get_if<double>(&v)) return *d;
    return to_display_string(v);
}

nlohmann::json rows_to_json(const std::vector<Row>& rows) {
    auto out = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& [column, value] : row) {
            obj[column] = to_json(value);
        }
        out.push_back(std::move(obj));
    }
    return out;
}

struct Target {
    ConnectionIdentity identity;
    ClientConfig client;
};

Target target_from_config(const BridgeConfig& config) {
    Target target;
    target.client.debug = config.logging.debug_sql;

    if (config.database.type == DatabaseType::SQLITE) {
        target.identity = ConnectionIdentity::sqlite(config.sqlite.db_path);
        target.client.min_connections = 1;
        target.client.max_connections = config.sqlite.pool_max;
        return target;
    }

    const auto& db = config.database;
    target.identity = ConnectionIdentity::postgres(
        db.host, static_cast<uint16_t>(db.port), db.name, db.user);
    target.client.password = db.password;
    target.client.min_connections = db.pool_min;
    target.client.max_connections = db.pool_max;
    return target;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << kUsage;
        return 1;
    }

    const std::string config_file = argv[1];
    const std::string command = argv[2];
    const std::string sql = argv[3];

    if (command != "query" && command != "exec" && command != "insert") {
        std::cerr << std::format("Unknown command '{}'\n\n", command) << kUsage;
        return 1;
    }

    SqlParams params;
    for (int i = 4; i < argc; ++i) {
        params.push_back(parse_cli_param(argv[i]));
    }

    auto config_result = config_file == "-"
        ? ConfigLoader::load_from_env()
        : ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return 1;
    }
    const auto& config = config_result.config;

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    register_builtin_backends();

    auto pools = std::make_shared<PoolRegistry>();
    ClientRegistry clients(pools);

    int exit_code = 0;
    try {
        const auto target = target_from_config(config);
        utils::log::info(std::format("Using {} database '{}'",
            database_type_to_string(target.identity.type), target.identity.key()));

        auto client = clients.get_or_create_client(target.identity, target.client);

        nlohmann::json output;
        if (command == "query") {
            output = rows_to_json(client->execute_query(sql, params));
        } else if (command == "exec") {
            const auto affected = client->execute_non_query(sql, params);
            output = {{"affected_rows", affected ? nlohmann::json(*affected) : nlohmann::json(nullptr)}};
        } else {
            output = {{"id", to_json(client->execute_non_query_returning(sql, params))}};
        }

        std::cout << output.dump(2) << std::endl;

    } catch (const DbError& e) {
        utils::log::error(std::format("{}: {}", error_category_to_string(e.category()), e.what()));
        exit_code = 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        exit_code = 1;
    }

    clients.close_all_connections();
    return exit_code;
}
