#include "Dialect.hpp"
#include "AnsiDialect.hpp"
#include "ErrorHandler.hpp"
#include "MySQLDialect.hpp"
#include "OracleDialect.hpp"
#include "PostgreSQLDialect.hpp"
#include "SQLiteDialect.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace sqlquote {

DatabaseType parseDatabaseType(const std::string& type) {
    std::string lower = type;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "ansi" || lower == "sql92" || lower == "default") {
        return DatabaseType::ANSI;
    } else if (lower == "mysql" || lower == "mariadb") {
        return DatabaseType::MySQL;
    } else if (lower == "postgresql" || lower == "postgres" || lower == "pgsql") {
        return DatabaseType::PostgreSQL;
    } else if (lower == "sqlite" || lower == "sqlite3") {
        return DatabaseType::SQLite;
    } else if (lower == "oracle") {
        return DatabaseType::Oracle;
    }

    throw InvalidArgument("Unknown database type: " + type);
}

std::string databaseTypeToString(DatabaseType type) {
    switch (type) {
        case DatabaseType::ANSI:
            return "ansi";
        case DatabaseType::MySQL:
            return "mysql";
        case DatabaseType::PostgreSQL:
            return "postgresql";
        case DatabaseType::SQLite:
            return "sqlite";
        case DatabaseType::Oracle:
            return "oracle";
        default:
            return "unknown";
    }
}

std::shared_ptr<const Dialect> makeDialect(DatabaseType type, const DialectOptions& options) {
    spdlog::debug("Creating {} dialect", databaseTypeToString(type));

    switch (type) {
        case DatabaseType::ANSI:
            return std::make_shared<AnsiDialect>(options);
        case DatabaseType::MySQL:
            return std::make_shared<MySQLDialect>(options);
        case DatabaseType::PostgreSQL:
            return std::make_shared<PostgreSQLDialect>(options);
        case DatabaseType::SQLite:
            return std::make_shared<SQLiteDialect>(options);
        case DatabaseType::Oracle:
            return std::make_shared<OracleDialect>(options);
    }

    throw InvalidArgument("Unsupported database type: " +
                          std::to_string(static_cast<int>(type)));
}

Dialect::Dialect(DialectOptions options)
    : m_options(options) {
}

std::string Dialect::doubleDelimiter(std::string_view value, char delim) {
    std::string result;
    result.reserve(value.size() + 2);
    result += delim;
    for (char c : value) {
        if (c == delim) {
            result += delim;  // Double the delimiter
        }
        result += c;
    }
    result += delim;
    return result;
}

std::string Dialect::identifierFor(const SqlInput& input, size_t position) const {
    switch (input.kind()) {
        case SqlInput::Kind::Safe:
            return input.text();
        case SqlInput::Kind::Missing:
            spdlog::debug("Rejected missing identifier at position {}", position);
            throw InvalidArgument("identifier at position " + std::to_string(position) +
                                  " is missing; identifiers have no NULL form");
        case SqlInput::Kind::Text:
        default:
            return escapeIdentifier(input.text());
    }
}

std::string Dialect::literalFor(const SqlInput& input) const {
    switch (input.kind()) {
        case SqlInput::Kind::Safe:
            return input.text();
        case SqlInput::Kind::Missing:
            return SafeSql::NULL_KEYWORD;
        case SqlInput::Kind::Text:
        default:
            return escapeString(input.text());
    }
}

// ============================================================================
// Identifiers
// ============================================================================

SafeSql Dialect::quoteIdentifier(const std::string& x) const {
    return SafeSql(escapeIdentifier(x));
}

SafeSql Dialect::quoteIdentifier(const std::vector<std::string>& x) const {
    SafeSql result;
    result.reserve(x.size());
    for (const auto& id : x) {
        result.append(escapeIdentifier(id));
    }
    return result;
}

SafeSql Dialect::quoteIdentifier(const std::vector<SqlValue>& x) const {
    SafeSql result;
    result.reserve(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        result.append(identifierFor(SqlInput(x[i]), i));
    }
    return result;
}

SafeSql Dialect::quoteIdentifier(const std::vector<SqlInput>& x) const {
    SafeSql result;
    result.reserve(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        result.append(identifierFor(x[i], i));
    }
    return result;
}

SafeSql Dialect::quoteIdentifier(std::initializer_list<SqlInput> x) const {
    return quoteIdentifier(std::vector<SqlInput>(x));
}

// ============================================================================
// String literals
// ============================================================================

SafeSql Dialect::quoteStringLiteral(const std::string& x) const {
    return SafeSql(escapeString(x));
}

SafeSql Dialect::quoteStringLiteral(const std::vector<std::string>& x) const {
    SafeSql result;
    result.reserve(x.size());
    for (const auto& value : x) {
        result.append(escapeString(value));
    }
    return result;
}

SafeSql Dialect::quoteStringLiteral(const std::vector<SqlValue>& x) const {
    SafeSql result;
    result.reserve(x.size());
    for (const auto& value : x) {
        result.append(literalFor(SqlInput(value)));
    }
    return result;
}

SafeSql Dialect::quoteStringLiteral(const std::vector<SqlInput>& x) const {
    SafeSql result;
    result.reserve(x.size());
    for (const auto& value : x) {
        result.append(literalFor(value));
    }
    return result;
}

SafeSql Dialect::quoteStringLiteral(std::initializer_list<SqlInput> x) const {
    return quoteStringLiteral(std::vector<SqlInput>(x));
}

}  // namespace sqlquote
