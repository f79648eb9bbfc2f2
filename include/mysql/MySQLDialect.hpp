#pragma once

/**
 * @file MySQLDialect.hpp
 * @brief MySQL / MariaDB quoting convention.
 */

#include "Dialect.hpp"

namespace sqlquote {

/**
 * @class MySQLDialect
 * @brief Backtick identifiers and backslash-escaped string literals.
 *
 * Key MySQL-specific behaviors:
 * - Identifiers are escaped with backticks (`identifier`), backticks
 *   within identifiers are doubled
 * - String literals use backslash escaping for special characters
 *   (\0, \t, \n, \r, \Z, \\, \', \"), so NUL, TAB, LF, CR and Ctrl-Z are
 *   rendered rather than rejected
 * - With DialectOptions::backslashEscapes off the server is assumed to run
 *   with NO_BACKSLASH_ESCAPES and string literals are quoted as in SQL-92
 *
 * Assumes a utf8mb4 connection character set.
 */
class MySQLDialect : public Dialect {
public:
    explicit MySQLDialect(DialectOptions options = DialectOptions{});

    std::string name() const override { return "mysql"; }

protected:
    std::string escapeIdentifier(std::string_view id) const override;
    std::string escapeString(std::string_view value) const override;
};

}  // namespace sqlquote
