#include "db/sqlite/sqlite_client.hpp"
#include "db/sqlite/sqlite_dialect.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlbridge {

PreparedStatement SqliteClient::prepare(const std::string& query, const SqlParams& params) const {
    return PreparedStatement{
        SqliteDialect::translate(query),
        SqliteDialect::convert_params(params)};
}

DbResultSet SqliteClient::run_statement(
    IDbConnection& conn, const PreparedStatement& stmt, StatementKind kind) {

    auto result = conn.execute(stmt.sql, stmt.params);
    if (result.success ||
        kind != StatementKind::NON_QUERY_RETURNING ||
        result.error_kind != DbErrorKind::OPERATIONAL ||
        !SqliteDialect::has_returning_clause(stmt.sql)) {
        return result;
    }

    const auto stripped = SqliteDialect::strip_returning_clause(stmt.sql);
    utils::log::warn(std::format(
        "Retrying without RETURNING clause ({}):\n   SQL: {}", result.error_message, stripped));

    auto retry = conn.execute(stripped, stmt.params);
    // The id comes from last_insert_rowid, never from rows of the retry
    retry.rows.clear();
    return retry;
}

SqlValue SqliteClient::generated_id_without_row(const DbResultSet& result) const {
    // last_insert_rowid is only meaningful when this statement inserted a row
    if (!result.has_affected_rows || result.affected_rows == 0) {
        return std::monostate{};
    }
    return result.last_insert_id;
}

std::string SqliteClient::connection_string() const {
    return identity().database;
}

} // namespace sqlbridge
