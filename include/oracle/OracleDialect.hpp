#pragma once

#include "AnsiDialect.hpp"

namespace sqlquote {

// Oracle quoting. String literals follow SQL-92. Quoted identifiers may
// contain any character except the double quote and NUL, so an identifier
// containing '"' has no quoted form and raises EncodingError.
class OracleDialect : public AnsiDialect {
public:
    explicit OracleDialect(DialectOptions options = DialectOptions{});

    std::string name() const override { return "oracle"; }

protected:
    std::string escapeIdentifier(std::string_view id) const override;
};

}  // namespace sqlquote
