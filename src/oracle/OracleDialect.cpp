#include "OracleDialect.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlquote {

OracleDialect::OracleDialect(DialectOptions options)
    : AnsiDialect(options) {
}

std::string OracleDialect::escapeIdentifier(std::string_view id) const {
    encoding::checkIdentifier(id, options().encoding);

    auto quote_pos = id.find('"');
    if (quote_pos != std::string_view::npos) {
        spdlog::debug("Rejected Oracle identifier with a double quote at byte {}", quote_pos);
        throw EncodingError("Oracle identifiers cannot contain '\"' (byte " +
                            std::to_string(quote_pos) + ")", quote_pos);
    }

    std::string result;
    result.reserve(id.size() + 2);
    result += '"';
    result += id;
    result += '"';
    return result;
}

}  // namespace sqlquote
