#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <string>

namespace sqlbridge {

/**
 * @brief Map a primary SQLite result code onto DbErrorKind
 *
 * SQLITE_ERROR and SQLITE_SCHEMA (the statement itself was rejected) are
 * OPERATIONAL; BUSY/LOCKED, CONSTRAINT and the file-level codes get their
 * own kinds.
 */
[[nodiscard]] DbErrorKind classify_sqlite_code(int primary_code);

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* and provides database-agnostic interface.
 * All sqlite3 calls are encapsulated here.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    /**
     * @brief Prepare, bind, and step one statement to completion
     *
     * sql must use "?" markers and hold exactly one statement.
     * For INSERT/UPDATE/DELETE/REPLACE the result carries the change count
     * and sqlite3_last_insert_rowid().
     */
    DbResultSet execute(const std::string& sql, const SqlParams& params) override;
    bool is_connected() const override;
    void close() override;

private:
    DbResultSet error_result() const;

    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * The connection string is the database path. Opens with
 * SQLITE_OPEN_FULLMUTEX, creates missing parent directories, enables
 * foreign keys and sets a busy timeout.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    static constexpr int kBusyTimeoutMs = 5000;

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace sqlbridge
