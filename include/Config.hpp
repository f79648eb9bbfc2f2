#pragma once

#include "Dialect.hpp"
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace sqlquote {

struct QuoteConfig {
    std::string dialect = "ansi";  // ansi, mysql, postgresql, sqlite, oracle
    std::string mode = "string";   // string, identifier
    std::string null_token = "\\N";
    bool strict_utf8 = true;
    bool allow_line_breaks = true;
    bool backslash_escapes = true;  // MySQL only
};

struct IOConfig {
    std::string input_format = "lines";   // lines, json
    std::string output_format = "plain";  // plain, show, json
    bool pretty_json = false;
};

struct LogConfig {
    bool debug = false;
    std::string file;
};

struct Config {
    QuoteConfig quote;
    IOConfig io;
    LogConfig log;

    // Positional values; empty means read stdin
    std::vector<std::string> values;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Whether a flag is given before any "--" separator. Used for -h and -V,
    // which are answered before the full parse.
    static bool hasFlag(int argc, char* argv[], const std::string& shortName,
                        const std::string& longName);

    // Validate configuration
    bool validate() const;

    // Get dialect from environment if not set
    void resolveDialect();

    bool quoteIdentifiers() const { return quote.mode == "identifier"; }

    DialectOptions dialectOptions() const;
};

}  // namespace sqlquote
