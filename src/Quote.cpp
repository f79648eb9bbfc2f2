#include "Quote.hpp"

namespace sqlquote {

SafeSql quoteIdentifier(const Connection& conn, const SafeSql& x) {
    return conn.dialect().quoteIdentifier(x);
}

SafeSql quoteIdentifier(const Connection& conn, const std::string& x) {
    return conn.dialect().quoteIdentifier(x);
}

SafeSql quoteIdentifier(const Connection& conn, const std::vector<std::string>& x) {
    return conn.dialect().quoteIdentifier(x);
}

SafeSql quoteIdentifier(const Connection& conn, const std::vector<SqlValue>& x) {
    return conn.dialect().quoteIdentifier(x);
}

SafeSql quoteIdentifier(const Connection& conn, const std::vector<SqlInput>& x) {
    return conn.dialect().quoteIdentifier(x);
}

SafeSql quoteIdentifier(const Connection& conn, std::initializer_list<SqlInput> x) {
    return conn.dialect().quoteIdentifier(x);
}

SafeSql quoteStringLiteral(const Connection& conn, const SafeSql& x) {
    return conn.dialect().quoteStringLiteral(x);
}

SafeSql quoteStringLiteral(const Connection& conn, const std::string& x) {
    return conn.dialect().quoteStringLiteral(x);
}

SafeSql quoteStringLiteral(const Connection& conn, const std::vector<std::string>& x) {
    return conn.dialect().quoteStringLiteral(x);
}

SafeSql quoteStringLiteral(const Connection& conn, const std::vector<SqlValue>& x) {
    return conn.dialect().quoteStringLiteral(x);
}

SafeSql quoteStringLiteral(const Connection& conn, const std::vector<SqlInput>& x) {
    return conn.dialect().quoteStringLiteral(x);
}

SafeSql quoteStringLiteral(const Connection& conn, std::initializer_list<SqlInput> x) {
    return conn.dialect().quoteStringLiteral(x);
}

}  // namespace sqlquote
