#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "db/postgresql/pg_client.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/backend_registry.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/pool_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "mocks/mock_connection.hpp"

#include <cstdlib>
#include <format>
#include <unistd.h>

using namespace sqlbridge;
using sqlbridge::testing::MockConnectionFactory;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

// ---------------------------------------------------------------------------
// Conninfo
// ---------------------------------------------------------------------------

TEST_CASE("PgClient: conninfo from identity", "[pg]") {
    const auto identity = ConnectionIdentity::postgres("db.internal", 5433, "cipdb", "cipuser");

    SECTION("with password") {
        CHECK(PgClient::build_conninfo(identity, "s3cret") ==
              "host='db.internal' port=5433 dbname='cipdb' user='cipuser' password='s3cret'");
    }

    SECTION("empty password is omitted") {
        CHECK(PgClient::build_conninfo(identity, "") ==
              "host='db.internal' port=5433 dbname='cipdb' user='cipuser'");
    }

    SECTION("quotes and backslashes are escaped") {
        CHECK(PgClient::build_conninfo(identity, R"(it's\x)") ==
              R"(host='db.internal' port=5433 dbname='cipdb' user='cipuser' password='it\'s\\x')");
    }
}

// ---------------------------------------------------------------------------
// Type mapping
// ---------------------------------------------------------------------------

TEST_CASE("PgTypeMap: OID classification", "[pg]") {
    CHECK(PgTypeMap::oid_to_generic_type(23) == GenericColumnType::INTEGER);
    CHECK(PgTypeMap::oid_to_generic_type(20) == GenericColumnType::BIGINT);
    CHECK(PgTypeMap::oid_to_generic_type(16) == GenericColumnType::BOOLEAN);
    CHECK(PgTypeMap::oid_to_generic_type(1114) == GenericColumnType::TIMESTAMP);
    CHECK(PgTypeMap::oid_to_generic_type(1184) == GenericColumnType::TIMESTAMP_TZ);
    CHECK(PgTypeMap::oid_to_generic_type(999999) == GenericColumnType::UNKNOWN);
}

TEST_CASE("PgTypeMap: decode text results", "[pg]") {
    CHECK(std::get<int64_t>(PgTypeMap::decode(20, "9007199254740993")) == 9007199254740993LL);
    CHECK(std::get<int64_t>(PgTypeMap::decode(21, "-12")) == -12);
    CHECK(std::get<double>(PgTypeMap::decode(701, "2.5")) == 2.5);
    CHECK(std::get<bool>(PgTypeMap::decode(16, "t")));
    CHECK_FALSE(std::get<bool>(PgTypeMap::decode(16, "f")));
    CHECK(std::get<Date>(PgTypeMap::decode(1082, "2024-02-29")) == Date{2024, 2, 29});

    const auto ts = std::get<Timestamp>(PgTypeMap::decode(1114, "2024-03-01 08:30:00.25"));
    CHECK(ts == Timestamp{Date{2024, 3, 1}, 8, 30, 0, 250000});

    SECTION("types without a native mapping stay text") {
        CHECK(std::get<std::string>(PgTypeMap::decode(1700, "12.50")) == "12.50");
        CHECK(std::get<std::string>(PgTypeMap::decode(1184, "2024-03-01 08:30:00+00")) ==
              "2024-03-01 08:30:00+00");
        CHECK(std::get<std::string>(PgTypeMap::decode(114, R"({"a":1})")) == R"({"a":1})");
    }

    SECTION("unparseable values stay text") {
        CHECK(std::get<std::string>(PgTypeMap::decode(1082, "infinity")) == "infinity");
        CHECK(std::get<std::string>(PgTypeMap::decode(23, "")) == "");
    }
}

TEST_CASE("PgTypeMap: encode parameters", "[pg]") {
    CHECK(PgTypeMap::encode(true) == "true");
    CHECK(PgTypeMap::encode(false) == "false");
    CHECK(PgTypeMap::encode(int64_t{-7}) == "-7");
    CHECK(PgTypeMap::encode(0.5) == "0.5");
    CHECK(PgTypeMap::encode(std::string("plain")) == "plain");
    CHECK(PgTypeMap::encode(Date{2024, 1, 2}) == "2024-01-02");
    CHECK(PgTypeMap::encode(Timestamp{Date{2024, 1, 2}, 3, 4, 5, 6}) == "2024-01-02 03:04:05.000006");
}

// ---------------------------------------------------------------------------
// Connection failures
// ---------------------------------------------------------------------------

TEST_CASE("PgConnectionFactory: unreachable server raises PoolCreationError", "[pg]") {
    PgConnectionFactory factory;
    const auto conninfo = PgClient::build_conninfo(
        ConnectionIdentity::postgres("127.0.0.1", 1, "cipdb", "cipuser"), "") +
        " connect_timeout=2";

    try {
        (void)factory.create(conninfo);
        FAIL("expected PoolCreationError");
    } catch (const PoolCreationError& e) {
        CHECK_THAT(std::string(e.what()), StartsWith("Error creating connection pool:"));
        CHECK(e.category() == ErrorCategory::POOL_CREATION);
    }
}

TEST_CASE("PgClient: first call against an unreachable server fails", "[pg]") {
    register_builtin_backends();
    auto pools = std::make_shared<PoolRegistry>();
    PgClient client(ConnectionIdentity::postgres("127.0.0.1", 1, "cipdb", "cipuser"), {}, pools);

    CHECK_THROWS_AS(client.execute_query("SELECT 1"), PoolCreationError);
    CHECK(pools->size() == 0);
}

// ---------------------------------------------------------------------------
// Execution against scripted connections
// ---------------------------------------------------------------------------

namespace {

std::shared_ptr<PoolRegistry> mock_pools(const std::shared_ptr<MockConnectionFactory>& factory) {
    return std::make_shared<PoolRegistry>(
        [factory](const ConnectionIdentity& identity, const PoolConfig& config) {
            return std::make_shared<GenericConnectionPool>(identity.key(), config, factory);
        });
}

PgClient make_mock_client(std::shared_ptr<PoolRegistry> pools) {
    return PgClient(ConnectionIdentity::postgres("db.internal", 5432, "cipdb", "cipuser"), {},
                    std::move(pools));
}

DbResultSet ok_result() {
    DbResultSet r;
    r.success = true;
    return r;
}

} // namespace

TEST_CASE("PgClient: writes run between BEGIN and COMMIT with $n markers", "[pg]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    SqlParams seen;
    factory->handler = [&seen](const std::string& sql, const SqlParams& params) {
        auto r = ok_result();
        if (sql.starts_with("INSERT")) {
            seen = params;
            r.has_affected_rows = true;
            r.affected_rows = 1;
            r.column_names = {"recipe_name", "id"};
            r.rows.push_back({std::string("anneal"), int64_t{11}});
        }
        return r;
    };
    auto client = make_mock_client(mock_pools(factory));

    const auto id = client.execute_non_query_returning(
        "INSERT INTO run (recipe_name, note) VALUES (%s, %s) RETURNING recipe_name, id",
        {std::string("anneal"), std::string("100%")});

    REQUIRE(std::holds_alternative<int64_t>(id));
    CHECK(std::get<int64_t>(id) == 11);

    const auto log = factory->log->statements();
    REQUIRE(log.size() == 3);
    CHECK(log[0] == "BEGIN");
    CHECK(log[1] == "INSERT INTO run (recipe_name, note) VALUES ($1, $2) RETURNING recipe_name, id");
    CHECK(log[2] == "COMMIT");

    // Values travel as parameters, untouched by the marker rewrite
    REQUIRE(seen.size() == 2);
    CHECK(std::get<std::string>(seen[1]) == "100%");
}

TEST_CASE("PgClient: a failed write is rolled back", "[pg]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->handler = [](const std::string& sql, const SqlParams&) {
        if (sql.starts_with("UPDATE")) {
            return DbResultSet::failure(
                "duplicate key value violates unique constraint \"run_pkey\"", DbErrorKind::CONSTRAINT);
        }
        return ok_result();
    };
    auto pools = mock_pools(factory);
    auto client = make_mock_client(pools);

    try {
        (void)client.execute_non_query("UPDATE run SET id = %s", {int64_t{1}});
        FAIL("expected QueryExecutionError");
    } catch (const QueryExecutionError& e) {
        CHECK_THAT(std::string(e.what()), StartsWith("Error executing query: duplicate key"));
    }

    const auto log = factory->log->statements();
    REQUIRE(log.size() == 3);
    CHECK(log[0] == "BEGIN");
    CHECK(log[1] == "UPDATE run SET id = $1");
    CHECK(log[2] == "ROLLBACK");
    CHECK(pools->find_pool(client.identity().key())->get_stats().active_connections == 0);
}

TEST_CASE("PgClient: no returned row means no id", "[pg]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->handler = [](const std::string& sql, const SqlParams&) {
        auto r = ok_result();
        if (sql.starts_with("INSERT")) {
            r.has_affected_rows = true;
            r.affected_rows = 1;
            r.last_insert_id = 99;
        }
        return r;
    };
    auto client = make_mock_client(mock_pools(factory));

    const auto id = client.execute_non_query_returning(
        "INSERT INTO run (recipe_name) VALUES (%s)", {std::string("etch")});
    CHECK(is_null(id));
}

TEST_CASE("PgClient: query text without parameters is sent verbatim", "[pg]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto client = make_mock_client(mock_pools(factory));

    (void)client.execute_query("SELECT * FROM t WHERE name LIKE '%son'");
    (void)client.execute_query("SELECT * FROM t WHERE name LIKE %s AND tag LIKE 'a%%'",
                               {std::string("%son")});

    // SELECT runs in autocommit, so no BEGIN/COMMIT around it
    const auto log = factory->log->statements();
    REQUIRE(log.size() == 2);
    CHECK(log[0] == "SELECT * FROM t WHERE name LIKE '%son'");
    CHECK(log[1] == "SELECT * FROM t WHERE name LIKE $1 AND tag LIKE 'a%'");
}

// ---------------------------------------------------------------------------
// Live server. Hidden from the default run; select it with
// "[integration]" and point SQLBRIDGE_TEST_PG_HOST (plus optional
// SQLBRIDGE_TEST_PG_PORT / _DB / _USER / _PASSWORD) at a server.
// ---------------------------------------------------------------------------

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

} // namespace

TEST_CASE("PgClient: live round trip", "[.][pg][integration]") {
    const char* host = std::getenv("SQLBRIDGE_TEST_PG_HOST");
    REQUIRE(host != nullptr);

    register_builtin_backends();
    const auto port = utils::try_parse_int<uint16_t>(env_or("SQLBRIDGE_TEST_PG_PORT", "5432"));
    REQUIRE(port.has_value());

    const auto identity = ConnectionIdentity::postgres(
        host, *port,
        env_or("SQLBRIDGE_TEST_PG_DB", "cipdb"),
        env_or("SQLBRIDGE_TEST_PG_USER", "cipuser"));
    ClientConfig config;
    config.password = env_or("SQLBRIDGE_TEST_PG_PASSWORD", "");

    auto pools = std::make_shared<PoolRegistry>();
    PgClient client(identity, config, pools);

    const std::string table = std::format("sqlbridge_test_{}", ::getpid());

    // Temp tables are per session, so pin one connection
    client.connect();

    (void)client.execute_non_query(std::format(
        "CREATE TEMP TABLE {} (id SERIAL PRIMARY KEY, name TEXT, "
        "ts TIMESTAMP, d DATE, ok BOOLEAN, score DOUBLE PRECISION)", table), {}, false);

    const Timestamp ts{Date{2024, 3, 1}, 8, 30, 0, 250000};
    const auto id = client.execute_non_query_returning(std::format(
        "INSERT INTO {} (name, ts, d, ok, score) VALUES (%s, %s, %s, %s, %s) RETURNING id", table),
        {std::string("100% sure"), ts, Date{2024, 3, 1}, true, 1.5}, false);
    REQUIRE(std::holds_alternative<int64_t>(id));
    CHECK(std::get<int64_t>(id) == 1);

    const auto rows = client.execute_query(std::format(
        "SELECT name, ts, d, ok, score FROM {} WHERE name LIKE '100%%'", table), {}, false);
    REQUIRE(rows.size() == 1);
    CHECK(std::get<std::string>(rows[0].at("name")) == "100% sure");
    CHECK(std::get<Timestamp>(rows[0].at("ts")) == ts);
    CHECK(std::get<Date>(rows[0].at("d")) == Date{2024, 3, 1});
    CHECK(std::get<bool>(rows[0].at("ok")));
    CHECK(std::get<double>(rows[0].at("score")) == 1.5);

    const auto affected = client.execute_non_query(
        std::format("UPDATE {} SET ok = %s", table), {false}, false);
    REQUIRE(affected.has_value());
    CHECK(*affected == 1);

    try {
        (void)client.execute_non_query(
            std::format("INSERT INTO {} (id) VALUES (%s)", table), {int64_t{1}}, false);
        FAIL("expected QueryExecutionError");
    } catch (const QueryExecutionError& e) {
        CHECK_THAT(std::string(e.what()), ContainsSubstring("duplicate key"));
    }

    client.close();
}
