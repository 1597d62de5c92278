#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sqlbridge {

/**
 * @brief Calendar date without time of day
 */
struct Date {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    auto operator<=>(const Date&) const = default;
};

/**
 * @brief Date and time of day with microsecond precision, no zone
 */
struct Timestamp {
    Date date;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    uint32_t microsecond = 0;

    auto operator<=>(const Timestamp&) const = default;
};

/**
 * @brief Tagged SQL value used for both bound parameters and result fields
 *
 * Alternatives: null, boolean, 64-bit integer, double, text, date, timestamp.
 * Conversions for each backend switch over every alternative, so adding a new
 * one fails to compile until every backend handles it.
 */
using SqlValue = std::variant<std::monostate, bool, int64_t, double, std::string, Date, Timestamp>;

/**
 * @brief One result row: column name -> value
 */
using Row = std::unordered_map<std::string, SqlValue>;

using SqlParams = std::vector<SqlValue>;

[[nodiscard]] inline bool is_null(const SqlValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

/** @brief YYYY-MM-DD */
[[nodiscard]] std::string format_date(const Date& d);

/** @brief YYYY-MM-DD HH:MM:SS.ffffff */
[[nodiscard]] std::string format_timestamp(const Timestamp& ts);

/**
 * @brief Parse "YYYY-MM-DD"; nullopt on any other shape or an invalid day
 */
[[nodiscard]] std::optional<Date> parse_date(std::string_view text);

/**
 * @brief Parse "YYYY-MM-DD HH:MM:SS[.ffffff]" (a 'T' separator is accepted)
 *
 * A trailing zone offset ("+02", "-05:30", "Z") is ignored; the wall-clock
 * fields are kept as written.
 */
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

/**
 * @brief Human-readable rendering (null -> "NULL", bool -> "true"/"false")
 */
[[nodiscard]] std::string to_display_string(const SqlValue& v);

} // namespace sqlbridge
