#include "db/placeholder_rewriter.hpp"

namespace sqlbridge {

std::string PlaceholderRewriter::rewrite(const std::string& query, PlaceholderStyle style) {
    std::string result;
    result.reserve(query.size() + 8);

    size_t index = 0;
    for (size_t i = 0; i < query.size(); ++i) {
        const char c = query[i];
        if (c != '%' || i + 1 >= query.size()) {
            result += c;
            continue;
        }

        const char next = query[i + 1];
        if (next == 's') {
            ++index;
            if (style == PlaceholderStyle::QUESTION_MARK) {
                result += '?';
            } else {
                result += '$';
                result += std::to_string(index);
            }
            ++i;
        } else if (next == '%') {
            result += '%';
            ++i;
        } else {
            result += c;
        }
    }
    return result;
}

} // namespace sqlbridge
