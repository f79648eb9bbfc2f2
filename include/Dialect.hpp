#pragma once

#include "Encoding.hpp"
#include "SafeSql.hpp"
#include "SqlInput.hpp"
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sqlquote {

// Built-in quoting conventions
enum class DatabaseType {
    ANSI,
    MySQL,
    PostgreSQL,
    SQLite,
    Oracle
};

// Convert string to DatabaseType, throws InvalidArgument for unknown names
DatabaseType parseDatabaseType(const std::string& type);

// Convert DatabaseType to string
std::string databaseTypeToString(DatabaseType type);

struct DialectOptions {
    EncodingPolicy encoding;
    // MySQL only: false selects NO_BACKSLASH_ESCAPES quoting
    bool backslashEscapes = true;
};

/**
 * @class Dialect
 * @brief Backend-specific quoting convention.
 *
 * The public quoting members are non-virtual and fix the parts every
 * backend must agree on:
 * - SafeSql input, and Safe elements of a mixed input, are copied through
 *   unchanged;
 * - a missing value becomes the unquoted keyword NULL in a string literal
 *   and is rejected with InvalidArgument in an identifier;
 * - the result has one element per input element, in input order.
 *
 * Only plain, present values reach the protected hooks, which return the
 * complete delimited fragment for one value. A backend overrides the hooks
 * and nothing else.
 *
 * Dialects are immutable and may be shared between threads.
 */
class Dialect {
public:
    virtual ~Dialect() = default;

    Dialect(const Dialect&) = delete;
    Dialect& operator=(const Dialect&) = delete;

    virtual std::string name() const = 0;

    const DialectOptions& options() const { return m_options; }

    SafeSql quoteIdentifier(const SafeSql& x) const { return x; }
    SafeSql quoteIdentifier(const std::string& x) const;
    SafeSql quoteIdentifier(const std::vector<std::string>& x) const;
    SafeSql quoteIdentifier(const std::vector<SqlValue>& x) const;
    SafeSql quoteIdentifier(const std::vector<SqlInput>& x) const;
    SafeSql quoteIdentifier(std::initializer_list<SqlInput> x) const;

    SafeSql quoteStringLiteral(const SafeSql& x) const { return x; }
    SafeSql quoteStringLiteral(const std::string& x) const;
    SafeSql quoteStringLiteral(const std::vector<std::string>& x) const;
    SafeSql quoteStringLiteral(const std::vector<SqlValue>& x) const;
    SafeSql quoteStringLiteral(const std::vector<SqlInput>& x) const;
    SafeSql quoteStringLiteral(std::initializer_list<SqlInput> x) const;

protected:
    explicit Dialect(DialectOptions options = DialectOptions{});

    virtual std::string escapeIdentifier(std::string_view id) const = 0;
    virtual std::string escapeString(std::string_view value) const = 0;

    // Wrap value in delim, doubling every delim inside it
    static std::string doubleDelimiter(std::string_view value, char delim);

private:
    std::string identifierFor(const SqlInput& input, size_t position) const;
    std::string literalFor(const SqlInput& input) const;

    DialectOptions m_options;
};

// Factory for the built-in conventions
std::shared_ptr<const Dialect> makeDialect(DatabaseType type,
                                           const DialectOptions& options = DialectOptions{});

}  // namespace sqlquote
