#include "db/sqlite/sqlite_dialect.hpp"
#include "db/placeholder_rewriter.hpp"

#include <regex>
#include <vector>

namespace sqlbridge {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

// schema.table (two or more dotted parts, each a plain identifier)
constexpr const char* kDottedIdentifier =
    R"(([A-Za-z_][A-Za-z0-9_$]*(?:\.[A-Za-z_][A-Za-z0-9_$]*)+)\b)";

struct TypeRule {
    std::regex pattern;
    std::string replacement;
};

const std::vector<TypeRule>& type_rules() {
    // Longest forms first so "TIMESTAMP WITH TIME ZONE" is not split by the
    // plain TIMESTAMP rule.
    static const std::vector<TypeRule> rules = {
        {std::regex(R"(\bTIMESTAMP(?:\s*\(\s*\d+\s*\))?\s+WITH(?:OUT)?\s+TIME\s+ZONE\b)", kFlags), "TEXT"},
        {std::regex(R"(\bTIME(?:\s*\(\s*\d+\s*\))?\s+WITH(?:OUT)?\s+TIME\s+ZONE\b)", kFlags), "TEXT"},
        {std::regex(R"(\bTIMESTAMPTZ\b)", kFlags), "TEXT"},
        {std::regex(R"(\bTIMETZ\b)", kFlags), "TEXT"},
        {std::regex(R"(\bTIMESTAMP\b)", kFlags), "TEXT"},
        {std::regex(R"(\b(?:BIG|SMALL)?SERIAL\b)", kFlags), "INTEGER"},
        {std::regex(R"(\bBOOL(?:EAN)?\b)", kFlags), "INTEGER"},
    };
    return rules;
}

// Each pattern captures: 1 = keyword(s), 2 = whitespace, 3 = dotted identifier
const std::vector<std::regex>& identifier_rules() {
    // TABLE IF NOT EXISTS runs before the bare TABLE rule, and the bare rule
    // refuses to start at "IF NOT EXISTS", so clause keywords never get quoted.
    static const std::vector<std::regex> rules = {
        std::regex(std::string(R"(\b(FROM|JOIN|INTO|UPDATE|REFERENCES)(\s+))") + kDottedIdentifier, kFlags),
        std::regex(std::string(R"(\b(TABLE\s+IF\s+NOT\s+EXISTS)(\s+))") + kDottedIdentifier, kFlags),
        std::regex(std::string(R"(\b(TABLE)(\s+)(?!IF\s+NOT\s+EXISTS\b))") + kDottedIdentifier, kFlags),
    };
    return rules;
}

std::string quote_identifiers(const std::string& input, const std::regex& pattern) {
    std::string result;
    result.reserve(input.size() + 8);

    auto last = input.cbegin();
    for (std::sregex_iterator it(input.begin(), input.end(), pattern), end; it != end; ++it) {
        const auto& m = *it;
        result.append(last, m[0].first);
        result += m[1].str();
        result += m[2].str();
        result += '"';
        result += m[3].str();
        result += '"';
        last = m[0].second;
    }
    result.append(last, input.cend());
    return result;
}

const std::regex& returning_pattern() {
    static const std::regex pattern(R"(\bRETURNING\b)", kFlags);
    return pattern;
}

} // anonymous namespace

std::string SqliteDialect::translate(const std::string& query) {
    std::string result = PlaceholderRewriter::rewrite(query, PlaceholderStyle::QUESTION_MARK);

    for (const auto& rule : type_rules()) {
        result = std::regex_replace(result, rule.pattern, rule.replacement);
    }

    for (const auto& pattern : identifier_rules()) {
        result = quote_identifiers(result, pattern);
    }

    return result;
}

SqlParams SqliteDialect::convert_params(const SqlParams& params) {
    SqlParams converted;
    converted.reserve(params.size());
    for (const auto& param : params) {
        if (const auto* ts = std::get_if<Timestamp>(&param)) {
            converted.emplace_back(format_timestamp(*ts));
        } else if (const auto* d = std::get_if<Date>(&param)) {
            converted.emplace_back(format_date(*d));
        } else if (const auto* b = std::get_if<bool>(&param)) {
            converted.emplace_back(int64_t{*b ? 1 : 0});
        } else {
            converted.push_back(param);
        }
    }
    return converted;
}

bool SqliteDialect::has_returning_clause(const std::string& query) {
    return std::regex_search(query, returning_pattern());
}

std::string SqliteDialect::strip_returning_clause(const std::string& query) {
    std::string stripped = query;

    std::smatch m;
    if (std::regex_search(query, m, returning_pattern())) {
        stripped = query.substr(0, static_cast<size_t>(m.position(0)));
    }

    const auto end = stripped.find_last_not_of(" \t\n\r;");
    if (end == std::string::npos) {
        return "";
    }
    stripped.erase(end + 1);
    return stripped;
}

} // namespace sqlbridge
