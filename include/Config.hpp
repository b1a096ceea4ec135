#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace pgresult {

struct ConnectionConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user;
    std::string password;
    std::string database;

    // SSL options
    std::string sslmode = "prefer";
    std::string sslrootcert;
    std::string sslcert;
    std::string sslkey;

    std::chrono::milliseconds connect_timeout{5000};
    std::string application_name = "pgresult-dump";
};

struct OutputConfig {
    std::string format = "csv";  // csv, json, describe
    bool pretty_json = true;
    bool include_csv_header = true;
    bool include_null = true;
    char delimiter = ',';
};

struct Config {
    ConnectionConfig connection;
    OutputConfig output;

    std::string query;
    bool load_type_catalog = true;
    bool debug = false;
    std::string log_file;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments; command line values override the -c file
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get password from PGPASSWORD if not set
    void resolvePassword();
};

}  // namespace pgresult
