#include "FormatConverter.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>
#include <cctype>

namespace sqlquote {

OutputFormat parseOutputFormat(const std::string& format) {
    std::string lower = format;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "plain" || lower == "text") {
        return OutputFormat::Plain;
    } else if (lower == "show") {
        return OutputFormat::Show;
    } else if (lower == "json") {
        return OutputFormat::JSON;
    }

    throw InvalidArgument("Unknown output format: " + format);
}

std::vector<SqlInput> FormatConverter::parseLines(const std::string& data,
                                                  const std::string& nullToken) {
    std::vector<SqlInput> result;

    if (data.empty()) {
        return result;
    }

    size_t start = 0;
    while (start < data.size()) {
        size_t end = data.find('\n', start);
        if (end == std::string::npos) {
            end = data.size();
        }

        std::string line = data.substr(start, end - start);

        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line == nullToken) {
            result.push_back(SqlInput::missing());
        } else {
            result.emplace_back(std::move(line));
        }

        start = end + 1;
    }

    return result;
}

std::vector<SqlInput> FormatConverter::parseJSON(const std::string& data) {
    std::vector<SqlInput> result;

    json parsed;
    try {
        parsed = json::parse(data);
    } catch (const json::parse_error& e) {
        throw InvalidArgument("JSON parse error: " + std::string(e.what()));
    }

    if (!parsed.is_array()) {
        throw InvalidArgument("JSON input must be an array of values");
    }

    result.reserve(parsed.size());
    for (size_t i = 0; i < parsed.size(); ++i) {
        const json& value = parsed[i];

        if (value.is_null()) {
            result.push_back(SqlInput::missing());
        } else if (value.is_string()) {
            result.emplace_back(value.get<std::string>());
        } else if (value.is_number() || value.is_boolean()) {
            result.emplace_back(value.dump());
        } else {
            throw InvalidArgument("JSON element " + std::to_string(i) +
                                  " must be a string, number, boolean or null");
        }
    }

    return result;
}

std::string FormatConverter::toPlain(const SafeSql& sql) {
    std::string out;
    for (const auto& fragment : sql) {
        out += fragment;
        out += '\n';
    }
    return out;
}

std::string FormatConverter::toJSON(const SafeSql& sql, const JSONOptions& options) {
    json arr = json::array();
    for (const auto& fragment : sql) {
        arr.push_back(fragment);
    }

    try {
        return options.pretty ? arr.dump(options.indent) : arr.dump();
    } catch (const json::type_error& e) {
        // Only reachable with strict UTF-8 checking switched off
        throw EncodingError("cannot render output as JSON: " + std::string(e.what()), 0);
    }
}

std::string FormatConverter::render(const SafeSql& sql, OutputFormat format,
                                    const JSONOptions& options) {
    switch (format) {
        case OutputFormat::Show:
            return sql.empty() ? std::string() : sql.show() + "\n";
        case OutputFormat::JSON:
            return toJSON(sql, options) + "\n";
        case OutputFormat::Plain:
        default:
            return toPlain(sql);
    }
}

}  // namespace sqlquote
