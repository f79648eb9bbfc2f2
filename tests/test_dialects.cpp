#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Dialect.hpp"
#include "AnsiDialect.hpp"
#include "MySQLDialect.hpp"
#include "OracleDialect.hpp"
#include "PostgreSQLDialect.hpp"
#include "SQLiteDialect.hpp"
#include "ErrorHandler.hpp"

using namespace sqlquote;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

// SQL Server style brackets, as a backend outside the built-in set would
// implement it
class BracketDialect : public Dialect {
public:
    std::string name() const override { return "brackets"; }

protected:
    std::string escapeIdentifier(std::string_view id) const override {
        std::string result = "[";
        for (char c : id) {
            if (c == ']') result += "]]";
            else result += c;
        }
        result += "]";
        return result;
    }

    std::string escapeString(std::string_view value) const override {
        return "N" + doubleDelimiter(value, '\'');
    }
};

// Database type parsing
TEST(DatabaseTypeTest, ParsesCanonicalNames) {
    EXPECT_EQ(parseDatabaseType("ansi"), DatabaseType::ANSI);
    EXPECT_EQ(parseDatabaseType("mysql"), DatabaseType::MySQL);
    EXPECT_EQ(parseDatabaseType("postgresql"), DatabaseType::PostgreSQL);
    EXPECT_EQ(parseDatabaseType("sqlite"), DatabaseType::SQLite);
    EXPECT_EQ(parseDatabaseType("oracle"), DatabaseType::Oracle);
}

TEST(DatabaseTypeTest, ParsesAliasesCaseInsensitively) {
    EXPECT_EQ(parseDatabaseType("SQL92"), DatabaseType::ANSI);
    EXPECT_EQ(parseDatabaseType("default"), DatabaseType::ANSI);
    EXPECT_EQ(parseDatabaseType("MariaDB"), DatabaseType::MySQL);
    EXPECT_EQ(parseDatabaseType("Postgres"), DatabaseType::PostgreSQL);
    EXPECT_EQ(parseDatabaseType("pgsql"), DatabaseType::PostgreSQL);
    EXPECT_EQ(parseDatabaseType("SQLite3"), DatabaseType::SQLite);
    EXPECT_EQ(parseDatabaseType("ORACLE"), DatabaseType::Oracle);
}

TEST(DatabaseTypeTest, UnknownNameThrows) {
    EXPECT_THROW(parseDatabaseType("db2"), InvalidArgument);
    EXPECT_THROW(parseDatabaseType(""), InvalidArgument);
}

TEST(DatabaseTypeTest, RoundTripsThroughString) {
    for (auto type : {DatabaseType::ANSI, DatabaseType::MySQL, DatabaseType::PostgreSQL,
                      DatabaseType::SQLite, DatabaseType::Oracle}) {
        EXPECT_EQ(parseDatabaseType(databaseTypeToString(type)), type);
        EXPECT_EQ(makeDialect(type)->name(), databaseTypeToString(type));
    }
}

// MySQL
class MySQLDialectTest : public ::testing::Test {
protected:
    MySQLDialect dialect_;
};

TEST_F(MySQLDialectTest, IdentifierUsesBackticks) {
    EXPECT_EQ(dialect_.quoteIdentifier(std::string("users"))[0], "`users`");
    EXPECT_EQ(dialect_.quoteIdentifier(std::string("a`b"))[0], "`a``b`");
    EXPECT_EQ(dialect_.quoteIdentifier(std::string("a\"b"))[0], "`a\"b`");
}

TEST_F(MySQLDialectTest, StringUsesBackslashEscapes) {
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("O'Brien"))[0], "'O\\'Brien'");
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("a\\b"))[0], "'a\\\\b'");
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("say \"hi\""))[0], "'say \\\"hi\\\"'");
}

TEST_F(MySQLDialectTest, RendersSpecialControlCharacters) {
    std::string value("a\0b\nc\rd\x1a", 8);

    EXPECT_EQ(dialect_.quoteStringLiteral(value)[0], "'a\\0b\\nc\\rd\\Z'");
}

TEST_F(MySQLDialectTest, RendersTab) {
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("a\tb"))[0], "'a\\tb'");
}

TEST_F(MySQLDialectTest, RenderedControlsIgnoreLineBreakPolicy) {
    DialectOptions options;
    options.encoding.allowLineBreaks = false;
    MySQLDialect dialect(options);

    EXPECT_EQ(dialect.quoteStringLiteral(std::string("a\nb"))[0], "'a\\nb'");
}

TEST_F(MySQLDialectTest, OtherControlCharactersAreRejected) {
    EXPECT_THROW(dialect_.quoteStringLiteral(std::string("a\x07")), EncodingError);
}

TEST_F(MySQLDialectTest, NulInIdentifierIsRejected) {
    EXPECT_THROW(dialect_.quoteIdentifier(std::string("a\0b", 3)), EncodingError);
}

TEST_F(MySQLDialectTest, InjectionAttemptIsEscaped) {
    auto quoted = dialect_.quoteStringLiteral(std::string("x' OR '1'='1"))[0];

    EXPECT_EQ(quoted, "'x\\' OR \\'1\\'=\\'1'");
}

TEST_F(MySQLDialectTest, NoBackslashEscapesModeDoublesQuotes) {
    DialectOptions options;
    options.backslashEscapes = false;
    MySQLDialect dialect(options);

    EXPECT_EQ(dialect.quoteStringLiteral(std::string("O'Brien"))[0], "'O''Brien'");
    EXPECT_EQ(dialect.quoteStringLiteral(std::string("a\\b"))[0], "'a\\b'");
    EXPECT_THROW(dialect.quoteStringLiteral(std::string("a\0b", 3)), EncodingError);
}

TEST_F(MySQLDialectTest, MissingStillBecomesNull) {
    std::vector<SqlInput> inputs = {"x", std::nullopt};

    EXPECT_THAT(dialect_.quoteStringLiteral(inputs).toText(), ElementsAre("'x'", "NULL"));
}

// PostgreSQL
class PostgreSQLDialectTest : public ::testing::Test {
protected:
    PostgreSQLDialect dialect_;
};

TEST_F(PostgreSQLDialectTest, IdentifierFollowsAnsi) {
    EXPECT_EQ(dialect_.quoteIdentifier(std::string("a\"b"))[0], "\"a\"\"b\"");
}

TEST_F(PostgreSQLDialectTest, PlainStringFollowsAnsi) {
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("O'Brien"))[0], "'O''Brien'");
}

TEST_F(PostgreSQLDialectTest, BackslashSelectsEscapeStringSyntax) {
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("a\\b"))[0], "E'a\\\\b'");
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("it's a\\b"))[0], "E'it''s a\\\\b'");
}

TEST_F(PostgreSQLDialectTest, EscapeStringCannotBeBrokenOut) {
    // A trailing backslash must not escape the closing quote
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("x\\"))[0], "E'x\\\\'");
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("\\'; DROP TABLE t;--"))[0],
              "E'\\\\''; DROP TABLE t;--'");
}

TEST_F(PostgreSQLDialectTest, LineBreaksSelectEscapeStringSyntax) {
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("a\nb\tc\rd"))[0], "E'a\\nb\\tc\\rd'");
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("it's\n"))[0], "E'it''s\\n'");
}

TEST_F(PostgreSQLDialectTest, C1ControlsBecomeUnicodeEscapes) {
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("a\xC2\x85" "b"))[0], "E'a\\u0085b'");
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("\xC2\x9B"))[0], "E'\\u009B'");
}

TEST_F(PostgreSQLDialectTest, NoRawControlBytesInOutput) {
    auto quoted = dialect_.quoteStringLiteral(std::string("x\n\xC2\x85\ty\r"))[0];

    for (size_t i = 0; i < quoted.size(); ++i) {
        EXPECT_FALSE(encoding::isControl(static_cast<unsigned char>(quoted[i]))) << "byte " << i;
        EXPECT_FALSE(encoding::isC1Control(quoted, i)) << "byte " << i;
    }
}

TEST_F(PostgreSQLDialectTest, RenderedControlsIgnoreLineBreakPolicy) {
    DialectOptions options;
    options.encoding.allowLineBreaks = false;
    PostgreSQLDialect dialect(options);

    EXPECT_EQ(dialect.quoteStringLiteral(std::string("a\nb"))[0], "E'a\\nb'");
    EXPECT_THROW(dialect.quoteStringLiteral(std::string("a\x07")), EncodingError);
}

TEST_F(PostgreSQLDialectTest, NonControlUtf8StaysPlain) {
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("caf\xC3\xA9"))[0], "'caf\xC3\xA9'");
}

TEST_F(PostgreSQLDialectTest, IdentifierRejectsControls) {
    EXPECT_THROW(dialect_.quoteIdentifier(std::string("a\nb")), EncodingError);
    EXPECT_THROW(dialect_.quoteIdentifier(std::string("a\xC2\x85")), EncodingError);
}

// SQLite
class SQLiteDialectTest : public ::testing::Test {
protected:
    SQLiteDialect dialect_;
};

TEST_F(SQLiteDialectTest, IdentifierDoublesDoubleQuotes) {
    EXPECT_EQ(dialect_.quoteIdentifier(std::string("table\"name"))[0], "\"table\"\"name\"");
}

TEST_F(SQLiteDialectTest, StringDoublesSingleQuotes) {
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("value's"))[0], "'value''s'");
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string())[0], "''");
}

TEST_F(SQLiteDialectTest, MatchesAnsiForOrdinaryText) {
    AnsiDialect ansi_dialect;
    std::vector<std::string> values = {"plain", "it's", "a\"b", "50%", "\xC3\xA9t\xC3\xA9"};

    EXPECT_EQ(dialect_.quoteStringLiteral(values), ansi_dialect.quoteStringLiteral(values));
    EXPECT_EQ(dialect_.quoteIdentifier(values), ansi_dialect.quoteIdentifier(values));
}

TEST_F(SQLiteDialectTest, NulIsRejectedBeforeFormatting) {
    EXPECT_THROW(dialect_.quoteStringLiteral(std::string("ab\0cd", 5)), EncodingError);
}

// Oracle
class OracleDialectTest : public ::testing::Test {
protected:
    OracleDialect dialect_;
};

TEST_F(OracleDialectTest, IdentifierWrapsInDoubleQuotes) {
    EXPECT_EQ(dialect_.quoteIdentifier(std::string("EMP"))[0], "\"EMP\"");
    EXPECT_EQ(dialect_.quoteIdentifier(std::string("my table"))[0], "\"my table\"");
}

TEST_F(OracleDialectTest, DoubleQuoteInIdentifierIsRejected) {
    try {
        dialect_.quoteIdentifier(std::string("a\"b"));
        FAIL() << "Expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_EQ(e.offset(), 1u);
        EXPECT_THAT(e.what(), HasSubstr("Oracle"));
    }
}

TEST_F(OracleDialectTest, StringFollowsAnsi) {
    EXPECT_EQ(dialect_.quoteStringLiteral(std::string("O'Brien"))[0], "'O''Brien'");
}

// Invariants shared by every dialect
class AllDialectsTest : public ::testing::TestWithParam<DatabaseType> {
protected:
    std::shared_ptr<const Dialect> dialect_ = makeDialect(GetParam());
};

TEST_P(AllDialectsTest, SafeSqlPassesThrough) {
    SafeSql safe{"select", "weird \" ' ` \\ text"};

    EXPECT_EQ(dialect_->quoteIdentifier(safe), safe);
    EXPECT_EQ(dialect_->quoteStringLiteral(safe), safe);
}

TEST_P(AllDialectsTest, QuotingTwiceIsQuotingOnce) {
    std::vector<std::string> values = {"x", "it's", "back\\slash"};

    auto literals = dialect_->quoteStringLiteral(values);
    EXPECT_EQ(dialect_->quoteStringLiteral(literals), literals);

    auto identifiers = dialect_->quoteIdentifier(values);
    EXPECT_EQ(dialect_->quoteIdentifier(identifiers), identifiers);
}

TEST_P(AllDialectsTest, MissingLiteralIsNull) {
    std::vector<SqlValue> values = {std::string("x"), std::nullopt};

    auto quoted = dialect_->quoteStringLiteral(values);

    ASSERT_EQ(quoted.size(), 2u);
    EXPECT_TRUE(quoted.isNull(1));
}

TEST_P(AllDialectsTest, MissingIdentifierThrows) {
    std::vector<SqlValue> values = {std::nullopt};

    EXPECT_THROW(dialect_->quoteIdentifier(values), InvalidArgument);
}

TEST_P(AllDialectsTest, InvalidUtf8IsRejected) {
    EXPECT_THROW(dialect_->quoteStringLiteral(std::string("a\xC3(")), EncodingError);
    EXPECT_THROW(dialect_->quoteIdentifier(std::string("\xFF")), EncodingError);
}

TEST_P(AllDialectsTest, IdentifierRejectsLineBreaks) {
    EXPECT_THROW(dialect_->quoteIdentifier(std::string("a\nb")), EncodingError);
    EXPECT_THROW(dialect_->quoteIdentifier(std::string("a\tb")), EncodingError);
}

TEST_P(AllDialectsTest, LiteralNeverHasRawC1Control) {
    std::string value("a\xC2\x85" "b");

    try {
        auto quoted = dialect_->quoteStringLiteral(value)[0];
        EXPECT_EQ(quoted.find("\xC2\x85"), std::string::npos);
    } catch (const EncodingError& e) {
        EXPECT_EQ(e.offset(), 1u);
    }
}

INSTANTIATE_TEST_SUITE_P(BuiltIn, AllDialectsTest,
                         ::testing::Values(DatabaseType::ANSI, DatabaseType::MySQL,
                                           DatabaseType::PostgreSQL, DatabaseType::SQLite,
                                           DatabaseType::Oracle));

// User-defined dialect
TEST(CustomDialectTest, UsesOverriddenHooks) {
    BracketDialect dialect;

    EXPECT_EQ(dialect.quoteIdentifier(std::string("a]b"))[0], "[a]]b]");
    EXPECT_EQ(dialect.quoteStringLiteral(std::string("it's"))[0], "N'it''s'");
}

TEST(CustomDialectTest, InheritsPassThroughAndNull) {
    BracketDialect dialect;
    std::vector<SqlInput> inputs = {"x", std::nullopt, SqlInput::safe("[done]")};

    EXPECT_THAT(dialect.quoteStringLiteral(inputs).toText(),
                ElementsAre("N'x'", "NULL", "[done]"));
    EXPECT_EQ(dialect.quoteIdentifier(SafeSql("[t]")), SafeSql("[t]"));
    EXPECT_THROW(dialect.quoteIdentifier(inputs), InvalidArgument);
}
