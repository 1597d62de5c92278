#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>
#include <string_view>

namespace sqlbridge {

namespace {

// SQLSTATE class (first two characters) -> error kind
DbErrorKind classify_sqlstate(const char* sqlstate) {
    if (!sqlstate || std::strlen(sqlstate) < 2) {
        return DbErrorKind::GENERIC;
    }
    const std::string_view state(sqlstate);
    const auto cls = state.substr(0, 2);

    if (cls == "23") return DbErrorKind::CONSTRAINT;        // integrity_constraint_violation
    if (cls == "08") return DbErrorKind::CONNECTION;        // connection_exception
    if (cls == "40" || state == "55P03") {                  // serialization / lock_not_available
        return DbErrorKind::BUSY_OR_LOCKED;
    }
    if (cls == "42" || cls == "0A") {                       // syntax_or_access / feature_not_supported
        return DbErrorKind::OPERATIONAL;
    }
    return DbErrorKind::GENERIC;
}

std::string trimmed_error(const char* msg) {
    return msg ? utils::rtrim(msg) : std::string("unknown error");
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const SqlParams& params) {
    if (!conn_) {
        return DbResultSet::failure("Connection is null", DbErrorKind::CONNECTION);
    }

    // Text-format parameters; storage must outlive PQexecParams
    std::vector<std::string> storage;
    std::vector<const char*> values;
    storage.reserve(params.size());
    values.reserve(params.size());
    for (const auto& param : params) {
        if (is_null(param)) {
            values.push_back(nullptr);
            continue;
        }
        storage.push_back(PgTypeMap::encode(param));
        values.push_back(storage.back().c_str());
    }

    PGresult* res = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(values.size()),
        nullptr,            // let the server infer parameter types
        values.empty() ? nullptr : values.data(),
        nullptr,            // text parameters need no lengths
        nullptr,            // all text format
        0);                 // text results

    if (!res) {
        const auto kind = PQstatus(conn_) == CONNECTION_OK
            ? DbErrorKind::GENERIC : DbErrorKind::CONNECTION;
        return DbResultSet::failure(trimmed_error(PQerrorMessage(conn_)), kind);
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    auto result = process_error_result(res);
    PQclear(res);
    return result;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const int ncols = PQnfields(res);
    std::vector<uint32_t> oids;
    oids.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));
        const auto oid = static_cast<uint32_t>(PQftype(res, i));
        oids.push_back(oid);
        result.column_types.push_back(PgTypeMap::oid_to_generic_type(oid));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<SqlValue> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::monostate{});
                continue;
            }
            const std::string_view text(PQgetvalue(res, i, j),
                                        static_cast<size_t>(PQgetlength(res, i, j)));
            row.push_back(PgTypeMap::decode(oids[j], text));
        }
        result.rows.push_back(std::move(row));
    }

    // INSERT/UPDATE/DELETE ... RETURNING still report a row count
    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        if (const auto n = utils::try_parse_int<uint64_t>(affected)) {
            result.affected_rows = *n;
            result.has_affected_rows = true;
        }
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        if (const auto n = utils::try_parse_int<uint64_t>(affected)) {
            result.affected_rows = *n;
            result.has_affected_rows = true;
        }
    }

    return result;
}

DbResultSet PgConnection::process_error_result(PGresult* res) {
    const char* sqlstate = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    DbErrorKind kind = classify_sqlstate(sqlstate);
    if (PQstatus(conn_) != CONNECTION_OK) {
        kind = DbErrorKind::CONNECTION;
    }

    const char* msg = PQresultErrorMessage(res);
    if (!msg || *msg == '\0') {
        msg = PQerrorMessage(conn_);
    }
    return DbResultSet::failure(trimmed_error(msg), kind);
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        throw PoolCreationError("Error creating connection pool: out of memory allocating PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        const std::string error = trimmed_error(PQerrorMessage(conn));
        utils::log::error(std::format("Failed to connect: {}", error));
        PQfinish(conn);
        throw PoolCreationError(std::format("Error creating connection pool: {}", error));
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace sqlbridge
