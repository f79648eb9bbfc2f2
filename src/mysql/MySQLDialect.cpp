#include "MySQLDialect.hpp"

namespace sqlquote {

namespace {

// Characters the backslash form renders itself
constexpr std::string_view RENDERED_CONTROLS("\0\t\n\r\x1a", 5);

char backslashEscape(char c) {
    switch (c) {
        case '\0':   return '0';
        case '\t':   return 't';
        case '\n':   return 'n';
        case '\r':   return 'r';
        case '\\':   return '\\';
        case '\'':   return '\'';
        case '"':    return '"';
        case '\x1a': return 'Z';  // Ctrl+Z
        default:     return '\0';  // No escape
    }
}

}  // namespace

MySQLDialect::MySQLDialect(DialectOptions options)
    : Dialect(options) {
}

std::string MySQLDialect::escapeIdentifier(std::string_view id) const {
    encoding::checkIdentifier(id, options().encoding);
    return doubleDelimiter(id, '`');
}

std::string MySQLDialect::escapeString(std::string_view value) const {
    if (!options().backslashEscapes) {
        encoding::checkText(value, options().encoding);
        return doubleDelimiter(value, '\'');
    }

    encoding::checkText(value, options().encoding, RENDERED_CONTROLS);

    std::string result;
    result.reserve(value.size() * 2 + 2);
    result += '\'';
    for (char c : value) {
        char escape = backslashEscape(c);
        if (escape == '\0') {
            result += c;
        } else {
            result += '\\';
            result += escape;
        }
    }
    result += '\'';
    return result;
}

}  // namespace sqlquote
