#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <format>
#include <unordered_map>

namespace sqlbridge {

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    static const std::unordered_map<uint32_t, GenericColumnType> OID_TO_GENERIC = {
        {21, GenericColumnType::SMALLINT},
        {23, GenericColumnType::INTEGER},
        {20, GenericColumnType::BIGINT},
        {26, GenericColumnType::INTEGER},  // oid
        {700, GenericColumnType::REAL},
        {701, GenericColumnType::DOUBLE_PRECISION},
        {1700, GenericColumnType::NUMERIC},
        {25, GenericColumnType::TEXT},
        {1043, GenericColumnType::VARCHAR},
        {1042, GenericColumnType::CHAR},
        {16, GenericColumnType::BOOLEAN},
        {1082, GenericColumnType::DATE},
        {1083, GenericColumnType::TIME},
        {1266, GenericColumnType::TIME},
        {1114, GenericColumnType::TIMESTAMP},
        {1184, GenericColumnType::TIMESTAMP_TZ},
        {17, GenericColumnType::BLOB},
        {114, GenericColumnType::VENDOR_SPECIFIC},   // json
        {3802, GenericColumnType::VENDOR_SPECIFIC},  // jsonb
        {2950, GenericColumnType::VENDOR_SPECIFIC},  // uuid
        {1186, GenericColumnType::VENDOR_SPECIFIC},  // interval
    };

    auto it = OID_TO_GENERIC.find(oid);
    return it != OID_TO_GENERIC.end() ? it->second : GenericColumnType::UNKNOWN;
}

SqlValue PgTypeMap::decode(uint32_t oid, std::string_view text) {
    switch (oid_to_generic_type(oid)) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
            if (const auto v = utils::try_parse_int<int64_t>(text)) {
                return *v;
            }
            break;

        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION: {
            double d = 0.0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
            if (ec == std::errc{} && ptr == text.data() + text.size()) {
                return d;
            }
            break;
        }

        case GenericColumnType::BOOLEAN:
            if (text == "t") return true;
            if (text == "f") return false;
            break;

        case GenericColumnType::DATE:
            if (const auto d = parse_date(text)) {
                return *d;
            }
            break;

        case GenericColumnType::TIMESTAMP:
            if (const auto ts = parse_timestamp(text)) {
                return *ts;
            }
            break;

        default:
            break;
    }
    return std::string(text);
}

std::string PgTypeMap::encode(const SqlValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return std::format("{}", *d);
    }
    return to_display_string(value);
}

} // namespace sqlbridge
