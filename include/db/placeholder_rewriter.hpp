#pragma once

#include <string>

namespace sqlbridge {

/**
 * @brief Marker styles accepted by the native drivers
 */
enum class PlaceholderStyle {
    QUESTION_MARK,      // SQLite: ?
    DOLLAR_NUMBERED,    // libpq: $1, $2, ...
};

/**
 * @brief Rewrites portable "%s" parameter markers into a driver's native style
 *
 * Portable queries use "%s" for each positional parameter and "%%" for a
 * literal percent sign.
 * The rewrite is a single left-to-right pass; any other "%x" sequence is
 * copied unchanged.
 */
class PlaceholderRewriter {
public:
    [[nodiscard]] static std::string rewrite(const std::string& query, PlaceholderStyle style);
};

} // namespace sqlbridge
