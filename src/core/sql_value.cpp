#include "core/sql_value.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlbridge {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

template<typename T>
std::optional<T> parse_fixed(std::string_view text, size_t pos, size_t len) {
    if (pos + len > text.size()) {
        return std::nullopt;
    }
    const auto field = text.substr(pos, len);
    for (char c : field) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    return utils::try_parse_int<T>(field);
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// Parses the date prefix of text; does not require text to end after it
std::optional<Date> parse_date_prefix(std::string_view text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    const auto year = parse_fixed<int>(text, 0, 4);
    const auto month = parse_fixed<unsigned>(text, 5, 2);
    const auto day = parse_fixed<unsigned>(text, 8, 2);
    if (!year || !month || !day) {
        return std::nullopt;
    }
    if (*month < 1 || *month > 12 || *day < 1 || *day > days_in_month(*year, *month)) {
        return std::nullopt;
    }
    return Date{*year, *month, *day};
}

} // anonymous namespace

std::optional<Date> parse_date(std::string_view text) {
    if (text.size() != 10) {
        return std::nullopt;
    }
    return parse_date_prefix(text);
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    const auto date = parse_date_prefix(text);
    if (!date || text.size() < 19) {
        return std::nullopt;
    }
    if ((text[10] != ' ' && text[10] != 'T') || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    const auto hour = parse_fixed<unsigned>(text, 11, 2);
    const auto minute = parse_fixed<unsigned>(text, 14, 2);
    const auto second = parse_fixed<unsigned>(text, 17, 2);
    if (!hour || !minute || !second || *hour > 23 || *minute > 59 || *second > 59) {
        return std::nullopt;
    }

    Timestamp ts{*date, *hour, *minute, *second, 0};

    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        uint32_t fraction = 0;
        size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                fraction = fraction * 10 + static_cast<uint32_t>(text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 6; ++digits) {
            fraction *= 10;
        }
        ts.microsecond = fraction;
    }

    // Zone suffix
    if (pos < text.size()) {
        const char c = text[pos];
        if (c != '+' && c != '-' && c != 'Z') {
            return std::nullopt;
        }
    }
    return ts;
}

std::string format_date(const Date& d) {
    return std::format("{:04d}-{:02d}-{:02d}", d.year, d.month, d.day);
}

std::string format_timestamp(const Timestamp& ts) {
    return std::format("{} {:02d}:{:02d}:{:02d}.{:06d}",
        format_date(ts.date), ts.hour, ts.minute, ts.second, ts.microsecond);
}

std::string to_display_string(const SqlValue& v) {
    return std::visit(overloaded{
        [](std::monostate) -> std::string { return "NULL"; },
        [](bool b) -> std::string { return b ? "true" : "false"; },
        [](int64_t i) -> std::string { return std::to_string(i); },
        [](double d) -> std::string { return std::format("{}", d); },
        [](const std::string& s) -> std::string { return s; },
        [](const Date& d) -> std::string { return format_date(d); },
        [](const Timestamp& ts) -> std::string { return format_timestamp(ts); },
    }, v);
}

} // namespace sqlbridge
