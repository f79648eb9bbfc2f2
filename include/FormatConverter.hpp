#pragma once

#include "SafeSql.hpp"
#include "SqlInput.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqlquote {

using json = nlohmann::json;

// Options structs declared outside the class to avoid default argument issues
struct JSONOptions {
    bool pretty = false;
    int indent = 2;
};

enum class OutputFormat {
    Plain,  // one fragment per line
    Show,   // "<SQL> fragment" per line
    JSON    // array of strings
};

// Convert string to OutputFormat, throws InvalidArgument for unknown names
OutputFormat parseOutputFormat(const std::string& format);

// Reads quoting input and renders quoted output for the command-line tool
class FormatConverter {
public:
    // One value per line. A line equal to nullToken is a missing value.
    // A trailing '\r' is stripped from every line and a single trailing
    // newline does not start another value.
    static std::vector<SqlInput> parseLines(const std::string& data,
                                            const std::string& nullToken);

    // A JSON array whose elements are strings, numbers, booleans or null.
    // Numbers and booleans are taken as their JSON text.
    static std::vector<SqlInput> parseJSON(const std::string& data);

    static std::string toPlain(const SafeSql& sql);
    static std::string toJSON(const SafeSql& sql, const JSONOptions& options = JSONOptions{});

    static std::string render(const SafeSql& sql, OutputFormat format,
                              const JSONOptions& options = JSONOptions{});
};

}  // namespace sqlquote
