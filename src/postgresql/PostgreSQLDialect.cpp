#include "PostgreSQLDialect.hpp"

namespace sqlquote {

namespace {

// TAB, LF and CR are written as \t, \n and \r in escape string syntax
constexpr std::string_view RENDERED_CONTROLS("\t\n\r");

// C1 controls are only recognised in text checked as UTF-8
bool isRenderedC1(std::string_view value, size_t pos, const EncodingPolicy& policy) {
    return policy.strictUtf8 && encoding::isC1Control(value, pos);
}

bool needsEscapeSyntax(std::string_view value, const EncodingPolicy& policy) {
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' || RENDERED_CONTROLS.find(value[i]) != std::string_view::npos ||
            isRenderedC1(value, i, policy)) {
            return true;
        }
    }
    return false;
}

}  // namespace

PostgreSQLDialect::PostgreSQLDialect(DialectOptions options)
    : AnsiDialect(options) {
}

std::string PostgreSQLDialect::escapeString(std::string_view value) const {
    encoding::checkText(value, options().encoding, RENDERED_CONTROLS, true);

    if (!needsEscapeSyntax(value, options().encoding)) {
        return doubleDelimiter(value, '\'');
    }

    std::string result;
    result.reserve(value.size() * 2 + 3);
    result += "E'";
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        switch (c) {
            case '\'':
            case '\\':
                result += c;
                result += c;
                break;
            case '\t':
                result += "\\t";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            default:
                if (isRenderedC1(value, i, options().encoding)) {
                    // U+0080..U+009F as a Unicode escape
                    const auto cp = static_cast<unsigned char>(value[++i]);
                    result += "\\u00";
                    result += encoding::describeByte(cp).substr(2);
                } else {
                    result += c;
                }
                break;
        }
    }
    result += '\'';
    return result;
}

}  // namespace sqlquote
