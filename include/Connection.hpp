#pragma once

#include "Dialect.hpp"
#include <memory>

namespace sqlquote {

// The capability quoting needs from a database connection: which dialect it
// speaks. Drivers implement this on their connection class; the quoting
// layer only ever reads it.
class Connection {
public:
    virtual ~Connection() = default;

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    virtual const Dialect& dialect() const = 0;

protected:
    Connection() = default;
};

// A connection capability that carries a dialect and nothing else
class DialectConnection : public Connection {
public:
    explicit DialectConnection(std::shared_ptr<const Dialect> dialect);

    const Dialect& dialect() const override { return *m_dialect; }

private:
    std::shared_ptr<const Dialect> m_dialect;
};

// Shared SQL-92 capability with the default encoding policy
const Connection& ansi();

std::unique_ptr<Connection> makeConnection(DatabaseType type,
                                           const DialectOptions& options = DialectOptions{});

}  // namespace sqlquote
