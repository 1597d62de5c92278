#include "db/sqlite/sqlite_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <memory>
#include <system_error>
#include <type_traits>

namespace sqlbridge {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

bool only_terminators(const char* tail) {
    if (!tail) {
        return true;
    }
    for (; *tail != '\0'; ++tail) {
        const char c = *tail;
        if (c != ';' && c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            return false;
        }
    }
    return true;
}

// INSERT / UPDATE / DELETE / REPLACE report a change count
bool is_dml(const std::string& sql) {
    const auto start = sql.find_first_not_of(" \t\n\r(");
    if (start == std::string::npos) {
        return false;
    }
    const auto end = sql.find_first_of(" \t\n\r(", start);
    const auto keyword = utils::to_upper(sql.substr(start, end == std::string::npos ? end : end - start));
    return keyword == "INSERT" || keyword == "UPDATE" || keyword == "DELETE" || keyword == "REPLACE";
}

int bind_param(sqlite3_stmt* stmt, int index, const SqlValue& value) {
    return std::visit([&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, bool>) {
            return sqlite3_bind_int(stmt, index, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, Date>) {
            const auto text = format_date(v);
            return sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        } else {
            const auto text = format_timestamp(v);
            return sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
    }, value);
}

// Declared column type -> generic type, following SQLite's affinity rules
GenericColumnType decltype_to_generic(const char* decl) {
    if (!decl) {
        return GenericColumnType::UNKNOWN;
    }
    const std::string upper = utils::to_upper(decl);
    if (upper.find("INT") != std::string::npos) return GenericColumnType::INTEGER;
    if (upper.find("CHAR") != std::string::npos ||
        upper.find("CLOB") != std::string::npos ||
        upper.find("TEXT") != std::string::npos) return GenericColumnType::TEXT;
    if (upper.find("BLOB") != std::string::npos) return GenericColumnType::BLOB;
    if (upper.find("REAL") != std::string::npos ||
        upper.find("FLOA") != std::string::npos ||
        upper.find("DOUB") != std::string::npos) return GenericColumnType::DOUBLE_PRECISION;
    return GenericColumnType::NUMERIC;
}

SqlValue read_column(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            return std::string(text ? text : "", static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            return std::string(data ? data : "", static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
        }
        case SQLITE_NULL:
        default:
            return std::monostate{};
    }
}

} // anonymous namespace

DbErrorKind classify_sqlite_code(int primary_code) {
    switch (primary_code) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return DbErrorKind::BUSY_OR_LOCKED;
        case SQLITE_CONSTRAINT:
            return DbErrorKind::CONSTRAINT;
        case SQLITE_ERROR:
        case SQLITE_SCHEMA:
            return DbErrorKind::OPERATIONAL;
        case SQLITE_CANTOPEN:
        case SQLITE_IOERR:
        case SQLITE_NOTADB:
        case SQLITE_CORRUPT:
            return DbErrorKind::CONNECTION;
        default:
            return DbErrorKind::GENERIC;
    }
}

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql, const SqlParams& params) {
    if (!db_) {
        return DbResultSet::failure("Connection is null", DbErrorKind::CONNECTION);
    }

    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, &tail) != SQLITE_OK) {
        return error_result();
    }
    StatementPtr stmt(raw);

    if (!only_terminators(tail)) {
        return DbResultSet::failure("You can only execute one statement at a time.",
                                    DbErrorKind::GENERIC);
    }

    // Whitespace or comment only
    if (!stmt) {
        DbResultSet result;
        result.success = true;
        return result;
    }

    const int expected = sqlite3_bind_parameter_count(stmt.get());
    if (expected != static_cast<int>(params.size())) {
        return DbResultSet::failure(std::format(
            "Incorrect number of bindings supplied. The current statement uses {}, and there are {} supplied.",
            expected, params.size()), DbErrorKind::GENERIC);
    }

    for (size_t i = 0; i < params.size(); ++i) {
        if (bind_param(stmt.get(), static_cast<int>(i + 1), params[i]) != SQLITE_OK) {
            return error_result();
        }
    }

    DbResultSet result;
    result.success = true;

    const int ncols = sqlite3_column_count(stmt.get());
    for (int i = 0; i < ncols; i++) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        result.column_names.emplace_back(name ? name : "");
        result.column_types.push_back(decltype_to_generic(sqlite3_column_decltype(stmt.get(), i)));
    }

    while (true) {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return error_result();
        }

        std::vector<SqlValue> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            row.push_back(read_column(stmt.get(), j));
        }
        result.rows.push_back(std::move(row));
    }

    if (is_dml(sql)) {
        result.affected_rows = static_cast<uint64_t>(sqlite3_changes(db_));
        result.has_affected_rows = true;
        result.last_insert_id = static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
    }

    return result;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

DbResultSet SqliteConnection::error_result() const {
    const int code = sqlite3_errcode(db_) & 0xff;
    return DbResultSet::failure(sqlite3_errmsg(db_), classify_sqlite_code(code));
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> SqliteConnectionFactory::create(
    const std::string& connection_string) {

    const bool in_memory = connection_string.empty() || connection_string == ":memory:" ||
                           connection_string.starts_with("file:");
    if (!in_memory) {
        const auto parent = std::filesystem::path(connection_string).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                utils::log::warn(std::format("Failed to create directory '{}': {}",
                    parent.string(), ec.message()));
            }
        }
    }

    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                      SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
    const int rc = sqlite3_open_v2(connection_string.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        const std::string error = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close_v2(db);
        utils::log::error(std::format("Failed to open '{}': {}", connection_string, error));
        throw PoolCreationError(std::format("Error getting connection from pool: {}", error));
    }

    sqlite3_busy_timeout(db, kBusyTimeoutMs);

    char* errmsg = nullptr;
    if (sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
        const std::string error = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        sqlite3_close_v2(db);
        throw PoolCreationError(std::format("Error getting connection from pool: {}", error));
    }

    return std::make_unique<SqliteConnection>(db);
}

} // namespace sqlbridge
