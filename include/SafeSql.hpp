#pragma once

#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace sqlquote {

/**
 * @class SafeSql
 * @brief A sequence of SQL fragments that need no further escaping.
 *
 * Every element is either text already known to be safe for direct
 * inclusion in a statement (a quoted identifier, a quoted literal, or text
 * the caller vouches for) or the unquoted keyword NULL.
 *
 * Construction performs no validation: building a SafeSql by hand is an
 * explicit statement of trust. The quoting functions return SafeSql and pass
 * SafeSql input through untouched, which is what prevents double escaping.
 *
 * There is deliberately no implicit conversion to or from plain strings.
 * Use toText() to get the fragments back as ordinary text.
 */
class SafeSql {
public:
    using value_type = std::string;
    using size_type = std::vector<std::string>::size_type;
    using const_iterator = std::vector<std::string>::const_iterator;

    static constexpr const char* NULL_KEYWORD = "NULL";

    SafeSql() = default;
    explicit SafeSql(std::string fragment);
    explicit SafeSql(std::vector<std::string> fragments);
    explicit SafeSql(std::initializer_list<std::string> fragments);

    size_type size() const { return m_fragments.size(); }
    bool empty() const { return m_fragments.empty(); }

    const std::string& operator[](size_type i) const { return m_fragments[i]; }
    const std::string& at(size_type i) const { return m_fragments.at(i); }
    const std::string& front() const { return m_fragments.front(); }
    const std::string& back() const { return m_fragments.back(); }

    const_iterator begin() const { return m_fragments.begin(); }
    const_iterator end() const { return m_fragments.end(); }

    // True if element i is the unquoted NULL keyword
    bool isNull(size_type i) const;

    // Plain-text view of the fragments
    const std::vector<std::string>& toText() const { return m_fragments; }

    // "<SQL> fragment" per element, newline separated
    std::string show() const;

    SafeSql& operator+=(const SafeSql& other);

    bool operator==(const SafeSql& other) const { return m_fragments == other.m_fragments; }
    bool operator!=(const SafeSql& other) const { return m_fragments != other.m_fragments; }

private:
    friend class Dialect;

    void append(std::string fragment) { m_fragments.push_back(std::move(fragment)); }
    void reserve(size_type n) { m_fragments.reserve(n); }

    std::vector<std::string> m_fragments;
};

SafeSql operator+(SafeSql lhs, const SafeSql& rhs);

std::ostream& operator<<(std::ostream& out, const SafeSql& sql);

}  // namespace sqlquote
