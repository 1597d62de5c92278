#include "db/postgresql/pg_client.hpp"
#include "db/placeholder_rewriter.hpp"

#include <format>

namespace sqlbridge {

namespace {

std::string quote_conninfo_value(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted += '\'';
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

} // anonymous namespace

std::string PgClient::build_conninfo(const ConnectionIdentity& identity, const std::string& password) {
    std::string conninfo = std::format("host={} port={} dbname={} user={}",
        quote_conninfo_value(identity.host),
        identity.port,
        quote_conninfo_value(identity.database),
        quote_conninfo_value(identity.user));

    if (!password.empty()) {
        conninfo += " password=";
        conninfo += quote_conninfo_value(password);
    }
    return conninfo;
}

PreparedStatement PgClient::prepare(const std::string& query, const SqlParams& params) const {
    // Without parameters the text is sent verbatim, '%' literals included
    if (params.empty()) {
        return PreparedStatement{query, params};
    }
    return PreparedStatement{
        PlaceholderRewriter::rewrite(query, PlaceholderStyle::DOLLAR_NUMBERED),
        params};
}

SqlValue PgClient::generated_id_without_row(const DbResultSet& /*result*/) const {
    return std::monostate{};
}

std::string PgClient::connection_string() const {
    return build_conninfo(identity(), config_.password);
}

} // namespace sqlbridge
