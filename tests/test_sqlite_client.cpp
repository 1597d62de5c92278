#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "db/sqlite/sqlite_client.hpp"
#include "db/backend_registry.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/pool_registry.hpp"
#include "core/error.hpp"
#include "mocks/mock_connection.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace sqlbridge;
using sqlbridge::testing::MockConnectionFactory;
using sqlbridge::testing::TempDbPath;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

constexpr const char* kCreateRun =
    "CREATE TABLE IF NOT EXISTS public.run ("
    "id SERIAL PRIMARY KEY, recipe_name TEXT NOT NULL, "
    "start_ts TIMESTAMP WITHOUT TIME ZONE, run_date DATE, passed BOOLEAN)";

std::shared_ptr<SqliteClient> make_client(
    const std::string& path, std::shared_ptr<PoolRegistry> pools, size_t max_conn = 5) {
    ClientConfig config;
    config.max_connections = max_conn;
    return std::make_shared<SqliteClient>(ConnectionIdentity::sqlite(path), config, std::move(pools));
}

// Registry whose pools hand out scripted connections
std::shared_ptr<PoolRegistry> mock_pools(const std::shared_ptr<MockConnectionFactory>& factory) {
    return std::make_shared<PoolRegistry>(
        [factory](const ConnectionIdentity& identity, const PoolConfig& config) {
            return std::make_shared<GenericConnectionPool>(identity.key(), config, factory);
        });
}

DbResultSet ok_result() {
    DbResultSet r;
    r.success = true;
    return r;
}

DbResultSet insert_result(int64_t rowid) {
    DbResultSet r;
    r.success = true;
    r.has_affected_rows = true;
    r.affected_rows = 1;
    r.last_insert_id = rowid;
    return r;
}

} // namespace

TEST_CASE("SqliteClient: round trip through the dialect", "[sqlite_client]") {
    register_builtin_backends();
    TempDbPath path("roundtrip");
    auto pools = std::make_shared<PoolRegistry>();
    auto client = make_client(path.str(), pools);

    (void)client->execute_non_query(kCreateRun);

    const Timestamp start{Date{2024, 3, 1}, 8, 30, 0, 250000};
    const auto id = client->execute_non_query_returning(
        "INSERT INTO public.run (recipe_name, start_ts, run_date, passed) "
        "VALUES (%s, %s, %s, %s) RETURNING id",
        {std::string("anneal"), start, Date{2024, 3, 1}, true});
    REQUIRE(std::holds_alternative<int64_t>(id));
    CHECK(std::get<int64_t>(id) == 1);

    const auto rows = client->execute_query(
        "SELECT id, recipe_name, start_ts, run_date, passed FROM public.run WHERE recipe_name = %s",
        {std::string("anneal")});
    REQUIRE(rows.size() == 1);
    const auto& row = rows.front();
    CHECK(std::get<int64_t>(row.at("id")) == 1);
    CHECK(std::get<std::string>(row.at("recipe_name")) == "anneal");
    CHECK(std::get<std::string>(row.at("start_ts")) == "2024-03-01 08:30:00.250000");
    CHECK(std::get<std::string>(row.at("run_date")) == "2024-03-01");
    CHECK(std::get<int64_t>(row.at("passed")) == 1);

    SECTION("affected row counts") {
        (void)client->execute_non_query_returning(
            "INSERT INTO public.run (recipe_name) VALUES (%s)", {std::string("etch")});
        const auto affected = client->execute_non_query(
            "UPDATE public.run SET passed = %s", {false});
        REQUIRE(affected.has_value());
        CHECK(*affected == 2);
    }

    SECTION("literal percent survives the marker rewrite") {
        const auto like = client->execute_query(
            "SELECT recipe_name FROM public.run WHERE recipe_name LIKE 'ann%%'");
        CHECK(like.size() == 1);
    }

    SECTION("a failed statement is rolled back and reported") {
        CHECK_THROWS_AS(client->execute_non_query(
            "INSERT INTO public.run (recipe_name) VALUES (%s)", {std::monostate{}}),
            QueryExecutionError);
        const auto count = client->execute_query("SELECT COUNT(*) AS n FROM public.run");
        CHECK(std::get<int64_t>(count.front().at("n")) == 1);
    }
}

TEST_CASE("SqliteClient: returned id selects the inserted row", "[sqlite_client]") {
    register_builtin_backends();
    TempDbPath path("widgets");
    auto pools = std::make_shared<PoolRegistry>();
    auto client = make_client(path.str(), pools);

    (void)client->execute_non_query("CREATE TABLE widgets (id SERIAL PRIMARY KEY, name TEXT)");
    (void)client->execute_non_query_returning(
        "INSERT INTO widgets (name) VALUES (%s) RETURNING id", {std::string("bar")});

    const auto id = client->execute_non_query_returning(
        "INSERT INTO widgets (name) VALUES (%s) RETURNING id", {std::string("foo")});
    REQUIRE_FALSE(is_null(id));

    const auto rows = client->execute_query("SELECT * FROM widgets WHERE id=%s", {id});
    REQUIRE(rows.size() == 1);
    CHECK(std::get<std::string>(rows.front().at("name")) == "foo");
}

TEST_CASE("SqliteClient: RETURNING falls back to last_insert_rowid", "[sqlite_client]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->handler = [](const std::string& sql, const SqlParams&) {
        if (sql.find("RETURNING") != std::string::npos) {
            return DbResultSet::failure("near \"RETURNING\": syntax error", DbErrorKind::OPERATIONAL);
        }
        if (sql.starts_with("INSERT")) {
            return insert_result(42);
        }
        return ok_result();
    };
    auto pools = mock_pools(factory);
    auto client = make_client("mock.db", pools);

    const auto id = client->execute_non_query_returning(
        "INSERT INTO public.run (recipe_name) VALUES (%s) RETURNING id;", {std::string("x")});

    REQUIRE(std::holds_alternative<int64_t>(id));
    CHECK(std::get<int64_t>(id) == 42);

    const auto log = factory->log->statements();
    REQUIRE(log.size() == 4);
    CHECK(log[0] == "BEGIN");
    CHECK_THAT(log[1], ContainsSubstring("RETURNING id"));
    CHECK(log[2] == R"(INSERT INTO "public.run" (recipe_name) VALUES (?))");
    CHECK(log[3] == "COMMIT");
}

TEST_CASE("SqliteClient: only operational errors trigger the fallback", "[sqlite_client]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->handler = [](const std::string& sql, const SqlParams&) {
        if (sql.starts_with("INSERT")) {
            return DbResultSet::failure("UNIQUE constraint failed: run.id", DbErrorKind::CONSTRAINT);
        }
        return ok_result();
    };
    auto pools = mock_pools(factory);
    auto client = make_client("mock.db", pools);

    try {
        (void)client->execute_non_query_returning(
            "INSERT INTO public.run (id) VALUES (%s) RETURNING id", {int64_t{1}});
        FAIL("expected QueryExecutionError");
    } catch (const QueryExecutionError& e) {
        CHECK_THAT(std::string(e.what()), StartsWith("Error executing query: UNIQUE constraint failed"));
    }

    const auto log = factory->log->statements();
    REQUIRE(log.size() == 3);
    CHECK(log[0] == "BEGIN");
    CHECK(log[2] == "ROLLBACK");
}

TEST_CASE("SqliteClient: generated id column selection", "[sqlite_client]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pools = mock_pools(factory);
    auto client = make_client("mock.db", pools);

    SECTION("the id column wins over column order") {
        factory->handler = [](const std::string& sql, const SqlParams&) {
            auto r = ok_result();
            if (sql.starts_with("INSERT")) {
                r.column_names = {"recipe_name", "id"};
                r.rows.push_back({std::string("x"), int64_t{7}});
            }
            return r;
        };
        const auto id = client->execute_non_query_returning(
            "INSERT INTO run (recipe_name) VALUES (%s) RETURNING recipe_name, id", {std::string("x")});
        CHECK(std::get<int64_t>(id) == 7);
    }

    SECTION("otherwise the first column") {
        factory->handler = [](const std::string& sql, const SqlParams&) {
            auto r = ok_result();
            if (sql.starts_with("INSERT")) {
                r.column_names = {"run_id"};
                r.rows.push_back({int64_t{9}});
            }
            return r;
        };
        const auto id = client->execute_non_query_returning(
            "INSERT INTO run (recipe_name) VALUES (%s) RETURNING run_id", {std::string("x")});
        CHECK(std::get<int64_t>(id) == 9);
    }

    SECTION("no row and no change count gives null") {
        const auto id = client->execute_non_query_returning("CREATE TABLE run (id INTEGER)");
        CHECK(is_null(id));
    }

    SECTION("a statement that inserted nothing does not report an older rowid") {
        factory->handler = [](const std::string& sql, const SqlParams&) {
            auto r = ok_result();
            if (sql.starts_with("INSERT")) {
                r.has_affected_rows = true;
                r.affected_rows = 0;
                r.last_insert_id = 5;
            }
            return r;
        };
        const auto id = client->execute_non_query_returning(
            "INSERT INTO run (id) VALUES (%s) ON CONFLICT DO NOTHING RETURNING id", {int64_t{1}});
        CHECK(is_null(id));
    }
}

TEST_CASE("SqliteClient: manual mode", "[sqlite_client]") {
    register_builtin_backends();
    TempDbPath path("manual");
    auto pools = std::make_shared<PoolRegistry>();
    auto writer = make_client(path.str(), pools);
    auto reader = make_client(path.str(), pools);

    SECTION("calls without connect() are refused") {
        CHECK_FALSE(writer->is_connected());
        try {
            (void)writer->execute_query("SELECT 1", {}, false);
            FAIL("expected NotConnectedError");
        } catch (const NotConnectedError& e) {
            CHECK(std::string(e.what()) ==
                  "Not connected to database. Call connect() first or use auto_connection=true.");
            CHECK(e.category() == ErrorCategory::NOT_CONNECTED);
        }
    }

    SECTION("each write commits and is visible to other clients") {
        writer->connect();
        CHECK(writer->is_connected());

        (void)writer->execute_non_query(kCreateRun, {}, false);
        (void)writer->execute_non_query(
            "INSERT INTO public.run (recipe_name) VALUES (%s)", {std::string("first")}, false);
        (void)writer->execute_non_query(
            "INSERT INTO public.run (recipe_name) VALUES (%s)", {std::string("second")}, false);

        const auto rows = reader->execute_query("SELECT recipe_name FROM public.run ORDER BY id");
        REQUIRE(rows.size() == 2);
        CHECK(std::get<std::string>(rows[0].at("recipe_name")) == "first");
        CHECK(std::get<std::string>(rows[1].at("recipe_name")) == "second");

        // Auto calls also use the held connection
        CHECK(writer->execute_query("SELECT recipe_name FROM public.run").size() == 2);
        CHECK(pools->find_pool(writer->identity().key())->get_stats().active_connections == 1);

        writer->close();
        CHECK_FALSE(writer->is_connected());
        CHECK(pools->find_pool(writer->identity().key())->get_stats().active_connections == 0);

        // close() twice is harmless
        writer->close();
    }
}

TEST_CASE("SqliteClient: failed calls give their connection back", "[sqlite_client]") {
    register_builtin_backends();
    TempDbPath path("release");
    auto pools = std::make_shared<PoolRegistry>();
    auto client = make_client(path.str(), pools, 1);

    for (int i = 0; i < 3; ++i) {
        CHECK_THROWS_AS(client->execute_query("SELECT * FROM missing_table"), QueryExecutionError);
    }

    const auto pool = pools->find_pool(client->identity().key());
    REQUIRE(pool != nullptr);
    CHECK(pool->get_stats().active_connections == 0);
    CHECK(client->execute_query("SELECT 1 AS one").size() == 1);
}

TEST_CASE("SqliteClient: a held connection can exhaust the pool", "[sqlite_client]") {
    register_builtin_backends();
    TempDbPath path("exhaust");
    auto pools = std::make_shared<PoolRegistry>();
    auto holder = make_client(path.str(), pools, 1);
    auto other = make_client(path.str(), pools, 1);

    holder->connect();
    CHECK_THROWS_AS(other->execute_query("SELECT 1"), PoolExhaustedError);
    CHECK_THROWS_AS(other->connect(), PoolExhaustedError);

    holder->close();
    CHECK(other->execute_query("SELECT 1 AS one").size() == 1);
}

TEST_CASE("SqliteClient: one client shared by many threads", "[sqlite_client][concurrency]") {
    register_builtin_backends();
    TempDbPath path("shared");
    auto pools = std::make_shared<PoolRegistry>();

    constexpr int kThreads = 8;
    constexpr int kInsertsPerThread = 50;
    auto client = make_client(path.str(), pools, kThreads);

    (void)client->execute_non_query("CREATE TABLE hits (id SERIAL PRIMARY KEY, worker INTEGER)");

    std::mutex ids_mutex;
    std::vector<int64_t> ids;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kInsertsPerThread; ++i) {
                try {
                    const auto id = client->execute_non_query_returning(
                        "INSERT INTO hits (worker) VALUES (%s) RETURNING id", {int64_t{t}});
                    std::lock_guard lock(ids_mutex);
                    ids.push_back(std::get<int64_t>(id));
                } catch (const std::exception&) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(failures.load() == 0);
    REQUIRE(ids.size() == static_cast<size_t>(kThreads * kInsertsPerThread));
    std::sort(ids.begin(), ids.end());
    CHECK(std::adjacent_find(ids.begin(), ids.end()) == ids.end());

    const auto count = client->execute_query("SELECT COUNT(*) AS n FROM hits");
    CHECK(std::get<int64_t>(count.front().at("n")) == kThreads * kInsertsPerThread);
    CHECK(pools->find_pool(client->identity().key())->get_stats().active_connections == 0);
}
