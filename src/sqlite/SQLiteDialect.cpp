#include "SQLiteDialect.hpp"
#include <sqlite3.h>
#include <memory>
#include <new>

namespace sqlquote {

namespace {

struct SQLiteFree {
    void operator()(char* p) const { sqlite3_free(p); }
};

std::string format(const char* pattern, std::string_view value) {
    const std::string text(value);
    std::unique_ptr<char, SQLiteFree> formatted(sqlite3_mprintf(pattern, text.c_str()));
    if (!formatted) {
        throw std::bad_alloc();
    }
    return std::string(formatted.get());
}

}  // namespace

SQLiteDialect::SQLiteDialect(DialectOptions options)
    : Dialect(options) {
}

std::string SQLiteDialect::escapeIdentifier(std::string_view id) const {
    encoding::checkIdentifier(id, options().encoding);
    return format("\"%w\"", id);
}

std::string SQLiteDialect::escapeString(std::string_view value) const {
    encoding::checkText(value, options().encoding);
    return format("'%q'", value);
}

}  // namespace sqlquote
