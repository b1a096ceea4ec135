#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace pgresult {

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

char parseDelimiter(const std::string& value) {
    if (value == "\\t" || value == "tab") return '\t';
    return value.empty() ? ',' : value[0];
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
    int line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            spdlog::warn("{}:{}: ignoring line without '='", path.string(), line_no);
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

        try {
            if (current_section == "connection") {
                if (key == "host") config.connection.host = value;
                else if (key == "port") config.connection.port = static_cast<uint16_t>(std::stoi(value));
                else if (key == "user") config.connection.user = value;
                else if (key == "password") config.connection.password = value;
                else if (key == "database" || key == "dbname") config.connection.database = value;
                else if (key == "sslmode") config.connection.sslmode = value;
                else if (key == "sslrootcert") config.connection.sslrootcert = value;
                else if (key == "sslcert") config.connection.sslcert = value;
                else if (key == "sslkey") config.connection.sslkey = value;
                else if (key == "connect_timeout")
                    config.connection.connect_timeout = std::chrono::milliseconds(std::stoi(value));
                else if (key == "application_name") config.connection.application_name = value;
            }
            else if (current_section == "output") {
                if (key == "format") config.output.format = value;
                else if (key == "pretty_json") config.output.pretty_json = parseBool(value);
                else if (key == "include_csv_header") config.output.include_csv_header = parseBool(value);
                else if (key == "include_null") config.output.include_null = parseBool(value);
                else if (key == "delimiter") config.output.delimiter = parseDelimiter(value);
            }
            else if (current_section.empty() || current_section == "general") {
                if (key == "query") config.query = value;
                else if (key == "load_type_catalog") config.load_type_catalog = parseBool(value);
                else if (key == "debug") config.debug = parseBool(value);
                else if (key == "log_file") config.log_file = value;
            }
        } catch (const std::logic_error& e) {
            spdlog::warn("{}:{}: invalid value '{}' for {}: {}",
                         path.string(), line_no, value, key, e.what());
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"pgresult-dump - run one PostgreSQL query and print its result"};

    // Connection options
    app.add_option("-H,--host", config.connection.host, "Database server host")
        ->default_val("localhost");
    app.add_option("-P,--port", config.connection.port, "Database server port")
        ->default_val(5432);
    app.add_option("-u,--user", config.connection.user, "Database username");
    app.add_option("-p,--password", config.connection.password,
                   "Database password (or use PGPASSWORD env)");
    app.add_option("-D,--database", config.connection.database, "Database name");
    app.add_option("--sslmode", config.connection.sslmode,
                   "SSL mode (disable, allow, prefer, require, verify-ca, verify-full)")
        ->default_val("prefer");
    app.add_option("--sslrootcert", config.connection.sslrootcert, "SSL CA certificate file");
    app.add_option("--sslcert", config.connection.sslcert, "SSL client certificate file");
    app.add_option("--sslkey", config.connection.sslkey, "SSL client key file");
    int connect_timeout_ms = static_cast<int>(config.connection.connect_timeout.count());
    app.add_option("--connect-timeout", connect_timeout_ms, "Connect timeout in milliseconds")
        ->default_val(5000);

    // Output options
    app.add_option("-F,--format", config.output.format, "Output format (csv, json, describe)")
        ->default_val("csv");
    app.add_flag("--compact", [&config](int64_t) { config.output.pretty_json = false; },
                 "Print JSON on a single line");
    app.add_flag("--no-header", [&config](int64_t) { config.output.include_csv_header = false; },
                 "Omit the CSV header row");
    app.add_flag("--skip-null", [&config](int64_t) { config.output.include_null = false; },
                 "Omit NULL fields from JSON objects");
    std::string delimiter;
    app.add_option("--delimiter", delimiter, "CSV field delimiter");
    app.add_flag("--no-type-catalog", [&config](int64_t) { config.load_type_catalog = false; },
                 "Use the built-in type names instead of loading pg_type");

    // Logging
    app.add_flag("-d,--debug", config.debug, "Enable debug output");
    app.add_option("--log-file", config.log_file, "Also write logs to this file");

    // Config file
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Query (positional)
    app.add_option("query", config.query, "SQL statement to execute");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    config.connection.connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
    if (!delimiter.empty()) {
        config.output.delimiter = parseDelimiter(delimiter);
    }

    // Command line values override the config file
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            Config merged = *file_config;
            auto given = [&app](const char* name) { return app.count(name) > 0; };

            if (given("--host")) merged.connection.host = config.connection.host;
            if (given("--port")) merged.connection.port = config.connection.port;
            if (given("--user")) merged.connection.user = config.connection.user;
            if (given("--password")) merged.connection.password = config.connection.password;
            if (given("--database")) merged.connection.database = config.connection.database;
            if (given("--sslmode")) merged.connection.sslmode = config.connection.sslmode;
            if (given("--sslrootcert")) merged.connection.sslrootcert = config.connection.sslrootcert;
            if (given("--sslcert")) merged.connection.sslcert = config.connection.sslcert;
            if (given("--sslkey")) merged.connection.sslkey = config.connection.sslkey;
            if (given("--connect-timeout"))
                merged.connection.connect_timeout = config.connection.connect_timeout;
            if (given("--format")) merged.output.format = config.output.format;
            if (given("--compact")) merged.output.pretty_json = false;
            if (given("--no-header")) merged.output.include_csv_header = false;
            if (given("--skip-null")) merged.output.include_null = false;
            if (given("--delimiter")) merged.output.delimiter = config.output.delimiter;
            if (given("--no-type-catalog")) merged.load_type_catalog = false;
            if (given("--debug")) merged.debug = true;
            if (given("--log-file")) merged.log_file = config.log_file;
            if (given("query")) merged.query = config.query;

            config = std::move(merged);
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Resolve password from environment if not set
    config.resolvePassword();

    return config;
}

bool Config::validate() const {
    if (query.empty()) {
        spdlog::error("A query is required");
        return false;
    }

    if (output.format != "csv" && output.format != "json" && output.format != "describe") {
        spdlog::error("Unknown output format: {}", output.format);
        return false;
    }

    if (connection.port == 0) {
        spdlog::error("Invalid port: {}", connection.port);
        return false;
    }

    if (connection.connect_timeout.count() < 0) {
        spdlog::error("Connect timeout must not be negative");
        return false;
    }

    if (!connection.sslrootcert.empty() && !std::filesystem::exists(connection.sslrootcert)) {
        spdlog::error("SSL CA file not found: {}", connection.sslrootcert);
        return false;
    }
    if (!connection.sslcert.empty() && !std::filesystem::exists(connection.sslcert)) {
        spdlog::error("SSL certificate file not found: {}", connection.sslcert);
        return false;
    }
    if (!connection.sslkey.empty() && !std::filesystem::exists(connection.sslkey)) {
        spdlog::error("SSL key file not found: {}", connection.sslkey);
        return false;
    }

    return true;
}

void Config::resolvePassword() {
    if (connection.password.empty()) {
        const char* env_pwd = std::getenv("PGPASSWORD");
        if (env_pwd) {
            connection.password = env_pwd;
        }
    }
}

}  // namespace pgresult
