#pragma once

#include "AnsiDialect.hpp"

namespace sqlquote {

// PostgreSQL quoting.
//
// Identifiers follow SQL-92. A string literal containing a backslash, TAB,
// LF, CR or a C1 control is written in escape string syntax (E'...'):
// backslashes and quotes are doubled, line breaks become \t, \n and \r and
// C1 controls become Unicode escapes. This reads the same whether
// standard_conforming_strings is on or off. Other literals are plain SQL-92
// literals.
class PostgreSQLDialect : public AnsiDialect {
public:
    explicit PostgreSQLDialect(DialectOptions options = DialectOptions{});

    std::string name() const override { return "postgresql"; }

protected:
    std::string escapeString(std::string_view value) const override;
};

}  // namespace sqlquote
