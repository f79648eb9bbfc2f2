#pragma once

#include "SafeSql.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sqlquote {

// Represents a single value that can be missing
using SqlValue = std::optional<std::string>;

// One element handed to a quoting function: plain text that still needs
// escaping, a fragment that is already safe, or a missing value.
class SqlInput {
public:
    enum class Kind {
        Text,
        Safe,
        Missing
    };

    SqlInput(std::string text) : m_kind(Kind::Text), m_text(std::move(text)) {}
    SqlInput(const char* text) : m_kind(Kind::Text), m_text(text) {}
    SqlInput(std::nullopt_t) : m_kind(Kind::Missing) {}
    SqlInput(const SqlValue& value)
        : m_kind(value ? Kind::Text : Kind::Missing), m_text(value.value_or(std::string())) {}

    static SqlInput safe(std::string fragment) {
        SqlInput input(std::move(fragment));
        input.m_kind = Kind::Safe;
        return input;
    }

    static SqlInput missing() { return SqlInput(std::nullopt); }

    // One Safe input per element of sql
    static std::vector<SqlInput> fromSafeSql(const SafeSql& sql);

    Kind kind() const { return m_kind; }
    bool isText() const { return m_kind == Kind::Text; }
    bool isSafe() const { return m_kind == Kind::Safe; }
    bool isMissing() const { return m_kind == Kind::Missing; }

    // Empty for missing values
    const std::string& text() const { return m_text; }

    bool operator==(const SqlInput& other) const {
        return m_kind == other.m_kind && m_text == other.m_text;
    }
    bool operator!=(const SqlInput& other) const { return !(*this == other); }

private:
    Kind m_kind;
    std::string m_text;
};

}  // namespace sqlquote
