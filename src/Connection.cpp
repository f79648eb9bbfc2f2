#include "Connection.hpp"
#include "ErrorHandler.hpp"

namespace sqlquote {

DialectConnection::DialectConnection(std::shared_ptr<const Dialect> dialect)
    : m_dialect(std::move(dialect)) {
    if (!m_dialect) {
        throw InvalidArgument("DialectConnection requires a dialect");
    }
}

const Connection& ansi() {
    static const DialectConnection connection(makeDialect(DatabaseType::ANSI));
    return connection;
}

std::unique_ptr<Connection> makeConnection(DatabaseType type, const DialectOptions& options) {
    return std::make_unique<DialectConnection>(makeDialect(type, options));
}

}  // namespace sqlquote
