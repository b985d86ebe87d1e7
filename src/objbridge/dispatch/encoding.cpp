#include <objbridge/dispatch/encoding.hpp>

namespace objbridge {

namespace {

constexpr bool is_qualifier(char c) {
    switch (c) {
        case 'r': case 'n': case 'N': case 'o': case 'O': case 'R': case 'V':
            return true;
        default:
            return false;
    }
}

constexpr bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

std::string normalize_encoding(std::string_view encoding) {
    std::string result;
    result.reserve(encoding.size());
    bool in_name = false;   // struct or union tag, between '{'/'(' and '='
    bool in_quote = false;  // class or field name in double quotes
    for (std::size_t i = 0; i < encoding.size(); ++i) {
        const char c = encoding[i];
        if (in_quote) {
            if (c == '"') {
                in_quote = false;
            }
            continue;
        }
        if (in_name) {
            result += c;
            if (c == '=') {
                in_name = false;
            }
            continue;
        }
        if (c == '"') {
            in_quote = true;
            continue;
        }
        if (is_digit(c) || is_qualifier(c)) {
            continue;
        }
        if (c == '{' || c == '(') {
            in_name = true;
        }
        result += (c == 'B') ? 'c' : c;
    }
    return result;
}

bool encodings_compatible(std::string_view expected, std::string_view actual) {
    if (expected.empty() || actual.empty()) {
        return true;
    }
    return normalize_encoding(expected) == normalize_encoding(actual);
}

} // namespace objbridge
