#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>

namespace sqlquote {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Apply to appropriate section
        if (current_section == "quote") {
            if (key == "dialect") config.quote.dialect = value;
            else if (key == "mode") config.quote.mode = value;
            else if (key == "null_token") config.quote.null_token = value;
            else if (key == "strict_utf8") config.quote.strict_utf8 = parseBool(value);
            else if (key == "allow_line_breaks") config.quote.allow_line_breaks = parseBool(value);
            else if (key == "backslash_escapes") config.quote.backslash_escapes = parseBool(value);
        }
        else if (current_section == "io") {
            if (key == "input_format") config.io.input_format = value;
            else if (key == "output_format") config.io.output_format = value;
            else if (key == "pretty_json") config.io.pretty_json = parseBool(value);
        }
        else if (current_section == "log") {
            if (key == "debug") config.log.debug = parseBool(value);
            else if (key == "file") config.log.file = value;
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    CLI::App app{"sql-quote - Quote SQL identifiers and string literals"};

    // Values from the config file are overridden by command line options
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file")
        ->check(CLI::ExistingFile);

    std::string dialect;
    app.add_option("-t,--dialect", dialect,
                   "Quoting dialect (ansi, mysql, postgresql, sqlite, oracle)");

    bool identifier = false;
    bool string_literal = false;
    auto* id_flag = app.add_flag("-i,--identifier", identifier, "Quote values as identifiers");
    auto* str_flag = app.add_flag("-s,--string", string_literal,
                                  "Quote values as string literals (default)");
    id_flag->excludes(str_flag);

    std::string null_token;
    auto* null_opt = app.add_option("-n,--null", null_token,
                                    "Input token that stands for a missing value");

    bool json_input = false;
    app.add_flag("-j,--json", json_input, "Read input as a JSON array");

    std::string output_format;
    app.add_option("-o,--output", output_format, "Output format (plain, show, json)");

    bool pretty = false;
    app.add_flag("--pretty", pretty, "Pretty-print JSON output");

    bool no_strict_utf8 = false;
    app.add_flag("--no-strict-utf8", no_strict_utf8, "Pass bytes >= 0x80 through unchecked");
    bool no_line_breaks = false;
    app.add_flag("--no-line-breaks", no_line_breaks, "Reject TAB, LF and CR");
    bool no_backslash_escapes = false;
    app.add_flag("--no-backslash-escapes", no_backslash_escapes,
                 "MySQL: server runs with NO_BACKSLASH_ESCAPES");

    bool debug = false;
    app.add_flag("-d,--debug", debug, "Enable debug output");
    std::string log_file;
    app.add_option("--log-file", log_file, "Also write the log to this file");

    std::vector<std::string> values;
    app.add_option("values", values, "Values to quote (default: read stdin)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    Config config;
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Command line args override file config
    if (!dialect.empty()) config.quote.dialect = dialect;
    if (identifier) config.quote.mode = "identifier";
    if (string_literal) config.quote.mode = "string";
    if (null_opt->count() > 0) config.quote.null_token = null_token;
    if (json_input) config.io.input_format = "json";
    if (!output_format.empty()) config.io.output_format = output_format;
    if (pretty) config.io.pretty_json = true;
    if (no_strict_utf8) config.quote.strict_utf8 = false;
    if (no_line_breaks) config.quote.allow_line_breaks = false;
    if (no_backslash_escapes) config.quote.backslash_escapes = false;
    if (debug) config.log.debug = true;
    if (!log_file.empty()) config.log.file = log_file;

    config.values = std::move(values);

    // SQLQUOTE_DIALECT applies when no dialect was given on the command line
    if (dialect.empty()) {
        config.resolveDialect();
    }

    return config;
}

bool Config::hasFlag(int argc, char* argv[], const std::string& shortName,
                     const std::string& longName) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") {
            break;  // Everything after is a value
        }
        if (arg == shortName || arg == longName) {
            return true;
        }
    }
    return false;
}

bool Config::validate() const {
    try {
        parseDatabaseType(quote.dialect);
    } catch (const QuoteError& e) {
        spdlog::error("{}", e.what());
        return false;
    }

    if (quote.mode != "string" && quote.mode != "identifier") {
        spdlog::error("Unknown quoting mode: {} (expected string or identifier)", quote.mode);
        return false;
    }

    if (io.input_format != "lines" && io.input_format != "json") {
        spdlog::error("Unknown input format: {} (expected lines or json)", io.input_format);
        return false;
    }

    try {
        parseOutputFormat(io.output_format);
    } catch (const QuoteError& e) {
        spdlog::error("{}", e.what());
        return false;
    }

    return true;
}

void Config::resolveDialect() {
    const char* env_dialect = std::getenv("SQLQUOTE_DIALECT");
    if (env_dialect && *env_dialect) {
        quote.dialect = env_dialect;
    }
}

DialectOptions Config::dialectOptions() const {
    DialectOptions options;
    options.encoding.strictUtf8 = quote.strict_utf8;
    options.encoding.allowLineBreaks = quote.allow_line_breaks;
    options.backslashEscapes = quote.backslash_escapes;
    return options;
}

}  // namespace sqlquote
