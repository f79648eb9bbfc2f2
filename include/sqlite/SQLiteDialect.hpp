#pragma once

/**
 * @file SQLiteDialect.hpp
 * @brief SQLite quoting through sqlite3_mprintf().
 */

#include "Dialect.hpp"

namespace sqlquote {

/**
 * @class SQLiteDialect
 * @brief SQLite escaping, delegated to the SQLite library's own formatter.
 *
 * SQLite Escaping Rules:
 * - Identifiers: Double quotes with internal quotes doubled ("table""name"),
 *   produced with the %w conversion
 * - Strings: Single quotes with internal quotes doubled ('value''s'),
 *   produced with the %q conversion
 *
 * The formatter works on NUL-terminated strings, so values are checked
 * against the encoding policy (which never admits NUL) before formatting.
 */
class SQLiteDialect : public Dialect {
public:
    explicit SQLiteDialect(DialectOptions options = DialectOptions{});

    std::string name() const override { return "sqlite"; }

protected:
    std::string escapeIdentifier(std::string_view id) const override;
    std::string escapeString(std::string_view value) const override;
};

}  // namespace sqlquote
