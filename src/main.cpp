#include "Config.hpp"
#include "Connection.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include "Quote.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace sqlquote;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // stdout carries the quoted output only
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sql-quote", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [values...]\n\n";
    std::cout << "Quoting:\n";
    std::cout << "  -t, --dialect <name>   ansi, mysql, postgresql, sqlite, oracle (default: ansi)\n";
    std::cout << "  -i, --identifier       Quote values as identifiers\n";
    std::cout << "  -s, --string           Quote values as string literals (default)\n";
    std::cout << "  -n, --null <token>     Input token for a missing value (default: \\N)\n";
    std::cout << "  --no-strict-utf8       Pass bytes >= 0x80 through unchecked\n";
    std::cout << "  --no-line-breaks       Reject TAB, LF and CR\n";
    std::cout << "  --no-backslash-escapes MySQL server runs with NO_BACKSLASH_ESCAPES\n";
    std::cout << "\nInput / Output:\n";
    std::cout << "  -j, --json             Read stdin as a JSON array of strings and nulls\n";
    std::cout << "  -o, --output <fmt>     plain, show, json (default: plain)\n";
    std::cout << "  --pretty               Pretty-print JSON output\n";
    std::cout << "\nConfiguration:\n";
    std::cout << "  -c, --config <file>    Path to configuration file\n";
    std::cout << "  -d, --debug            Enable debug output\n";
    std::cout << "  --log-file <path>      Also write the log to this file\n";
    std::cout << "\nOther Options:\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -V, --version          Show version information\n";
    std::cout << "\nWithout values, one value per line is read from stdin.\n";
    std::cout << "Values after -- are taken as they are, even if they start with '-'.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program << " \"Robert'); DROP TABLE Students;--\"\n";
    std::cout << "  " << program << " -t mysql -i order\n";
    std::cout << "  " << program << " -- -h\n";
    std::cout << "  printf 'x\\n\\\\N\\n' | " << program << " -o show\n";
    std::cout << "  echo '[\"x\", null]' | " << program << " -j -o json\n";
    std::cout << std::endl;
}

std::vector<SqlInput> readInput(const Config& config) {
    if (!config.values.empty()) {
        ErrorContext ctx("command line");
        std::vector<SqlInput> inputs;
        inputs.reserve(config.values.size());
        for (const auto& value : config.values) {
            if (value == config.quote.null_token) {
                inputs.push_back(SqlInput::missing());
            } else {
                inputs.emplace_back(value);
            }
        }
        return inputs;
    }

    ErrorContext ctx("stdin");
    std::string data((std::istreambuf_iterator<char>(std::cin)),
                     std::istreambuf_iterator<char>());

    if (config.io.input_format == "json") {
        return FormatConverter::parseJSON(data);
    }
    return FormatConverter::parseLines(data, config.quote.null_token);
}

}  // namespace

int main(int argc, char* argv[]) {
    if (Config::hasFlag(argc, argv, "-h", "--help")) {
        printUsage(argv[0]);
        return ErrorHandler::EXIT_OK;
    }
    if (Config::hasFlag(argc, argv, "-V", "--version")) {
        std::cout << "sql-quote version 1.0.0" << std::endl;
        return ErrorHandler::EXIT_OK;
    }

    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return ErrorHandler::EXIT_USAGE;
    }

    // Setup logging
    setupLogging(config.log.debug, config.log.file);

    if (!config.validate()) {
        return ErrorHandler::EXIT_USAGE;
    }

    spdlog::debug("Quoting {} with the {} dialect",
                  config.quoteIdentifiers() ? "identifiers" : "string literals",
                  config.quote.dialect);

    try {
        auto conn = makeConnection(parseDatabaseType(config.quote.dialect),
                                   config.dialectOptions());

        auto inputs = readInput(config);
        spdlog::debug("Read {} values", inputs.size());

        SafeSql quoted;
        {
            ErrorContext ctx(config.quoteIdentifiers() ? "quoting identifiers"
                                                       : "quoting string literals");
            quoted = config.quoteIdentifiers() ? quoteIdentifier(*conn, inputs)
                                               : quoteStringLiteral(*conn, inputs);
        }

        JSONOptions json_options;
        json_options.pretty = config.io.pretty_json;
        std::cout << FormatConverter::render(quoted, parseOutputFormat(config.io.output_format),
                                             json_options);
        std::cout.flush();

    } catch (const QuoteError& e) {
        spdlog::error("{}", e.what());
        return ErrorHandler::toExitCode(e.code());
    }

    return ErrorHandler::EXIT_OK;
}
