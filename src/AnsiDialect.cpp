#include "AnsiDialect.hpp"

namespace sqlquote {

AnsiDialect::AnsiDialect(DialectOptions options)
    : Dialect(options) {
}

std::string AnsiDialect::escapeIdentifier(std::string_view id) const {
    encoding::checkIdentifier(id, options().encoding);
    return doubleDelimiter(id, '"');
}

std::string AnsiDialect::escapeString(std::string_view value) const {
    encoding::checkText(value, options().encoding);
    return doubleDelimiter(value, '\'');
}

}  // namespace sqlquote
