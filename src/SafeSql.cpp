#include "SafeSql.hpp"
#include <utility>

namespace sqlquote {

SafeSql::SafeSql(std::string fragment) {
    m_fragments.push_back(std::move(fragment));
}

SafeSql::SafeSql(std::vector<std::string> fragments)
    : m_fragments(std::move(fragments)) {
}

SafeSql::SafeSql(std::initializer_list<std::string> fragments)
    : m_fragments(fragments) {
}

bool SafeSql::isNull(size_type i) const {
    return m_fragments.at(i) == NULL_KEYWORD;
}

std::string SafeSql::show() const {
    std::string out;
    for (size_type i = 0; i < m_fragments.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += "<SQL> ";
        out += m_fragments[i];
    }
    return out;
}

SafeSql& SafeSql::operator+=(const SafeSql& other) {
    m_fragments.insert(m_fragments.end(), other.m_fragments.begin(), other.m_fragments.end());
    return *this;
}

SafeSql operator+(SafeSql lhs, const SafeSql& rhs) {
    lhs += rhs;
    return lhs;
}

std::ostream& operator<<(std::ostream& out, const SafeSql& sql) {
    return out << sql.show();
}

}  // namespace sqlquote
