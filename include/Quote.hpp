#pragma once

/**
 * @file Quote.hpp
 * @brief Entry points for quoting identifiers and string literals.
 *
 * Each function dispatches on the connection's dialect and on whether the
 * input is already safe:
 *
 * @code
 * auto name = "Robert'); DROP TABLE Students;--";
 * quoteStringLiteral(ansi(), std::string(name));  // 'Robert''); DROP TABLE Students;--'
 * quoteIdentifier(ansi(), std::string(name));     // "Robert'); DROP TABLE Students;--"
 * quoteIdentifier(ansi(), SafeSql("select"));     // select, passed through
 * quoteStringLiteral(ansi(), {"x", std::nullopt}); // 'x', NULL
 * @endcode
 *
 * All functions return one SafeSql element per input element, in order.
 */

#include "Connection.hpp"
#include "SafeSql.hpp"
#include "SqlInput.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace sqlquote {

// Identifiers. A missing value throws InvalidArgument.
SafeSql quoteIdentifier(const Connection& conn, const SafeSql& x);
SafeSql quoteIdentifier(const Connection& conn, const std::string& x);
SafeSql quoteIdentifier(const Connection& conn, const std::vector<std::string>& x);
SafeSql quoteIdentifier(const Connection& conn, const std::vector<SqlValue>& x);
SafeSql quoteIdentifier(const Connection& conn, const std::vector<SqlInput>& x);
SafeSql quoteIdentifier(const Connection& conn, std::initializer_list<SqlInput> x);

// String literals. A missing value becomes the unquoted keyword NULL.
SafeSql quoteStringLiteral(const Connection& conn, const SafeSql& x);
SafeSql quoteStringLiteral(const Connection& conn, const std::string& x);
SafeSql quoteStringLiteral(const Connection& conn, const std::vector<std::string>& x);
SafeSql quoteStringLiteral(const Connection& conn, const std::vector<SqlValue>& x);
SafeSql quoteStringLiteral(const Connection& conn, const std::vector<SqlInput>& x);
SafeSql quoteStringLiteral(const Connection& conn, std::initializer_list<SqlInput> x);

}  // namespace sqlquote
