#pragma once

/**
 * @file AnsiDialect.hpp
 * @brief SQL-92 quoting, the default convention.
 */

#include "Dialect.hpp"

namespace sqlquote {

/**
 * @class AnsiDialect
 * @brief SQL-92 delimited identifiers and character string literals.
 *
 * ANSI Escaping Rules:
 * - Identifiers: double quotes with internal quotes doubled ("table""name")
 * - Strings: single quotes with internal quotes doubled ('O''Brien')
 *
 * Backends that agree with SQL-92 on one of the two forms derive from this
 * class and override only the other hook.
 */
class AnsiDialect : public Dialect {
public:
    explicit AnsiDialect(DialectOptions options = DialectOptions{});

    std::string name() const override { return "ansi"; }

protected:
    std::string escapeIdentifier(std::string_view id) const override;
    std::string escapeString(std::string_view value) const override;
};

}  // namespace sqlquote
