#include "Config.hpp"
#include "Connection.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include "ResultHandle.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <vector>

using namespace pgresult;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Results go to stdout, logs to stderr
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

        auto logger = std::make_shared<spdlog::logger>("pgresult", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

// "[connect > execute] " prefix for error lines, empty without context
std::string contextPrefix(const std::string& context) {
    return context.empty() ? "" : "[" + context + "] ";
}

void printResult(const ResultHandle& result, const OutputConfig& output) {
    JSONOptions json_options;
    json_options.pretty = output.pretty_json;
    json_options.includeNull = output.include_null;

    if (output.format == "describe") {
        std::cout << FormatConverter::describe(result, json_options) << std::endl;
    } else if (output.format == "json") {
        std::cout << FormatConverter::toJSON(result, json_options) << std::endl;
    } else {
        CSVOptions csv_options;
        csv_options.delimiter = output.delimiter;
        csv_options.includeHeader = output.include_csv_header;
        std::cout << FormatConverter::toCSV(result, csv_options);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = Config::parseArgs(argc, argv);

    setupLogging(config.debug, config.log_file);

    if (!config.validate()) {
        return 1;
    }

    try {
        Connection conn(config.connection);

        if (config.load_type_catalog) {
            auto catalog = conn.loadTypeCatalog();
            spdlog::debug("Using {} type names from pg_type", catalog->size());
        }

        ErrorContext ctx("query");
        ResultHandle result = conn.execute(config.query);
        spdlog::info("{}: {} rows, {} affected", result.statusMessage(),
                     result.countRows(), result.countAffectedRows());

        printResult(result, config.output);
        result.free();

    } catch (const ConnectionError& e) {
        spdlog::error("{}{}", contextPrefix(e.context()), e.what());
        return 1;
    } catch (const QueryError& e) {
        if (e.sqlState().empty()) {
            spdlog::error("{}Query failed: {}", contextPrefix(e.context()), e.what());
        } else {
            spdlog::error("{}Query failed [{}]: {}", contextPrefix(e.context()),
                          e.sqlState(), e.what());
        }
        return 1;
    } catch (const ResultError& e) {
        spdlog::error("{}{} error: {}", contextPrefix(e.context()),
                      ErrorHandler::kindName(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
