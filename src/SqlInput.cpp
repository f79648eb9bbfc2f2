#include "SqlInput.hpp"

namespace sqlquote {

std::vector<SqlInput> SqlInput::fromSafeSql(const SafeSql& sql) {
    std::vector<SqlInput> inputs;
    inputs.reserve(sql.size());
    for (const auto& fragment : sql) {
        inputs.push_back(safe(fragment));
    }
    return inputs;
}

}  // namespace sqlquote
