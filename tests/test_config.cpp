#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <string>
#include <vector>

using namespace pgresult;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test files
        tempDir_ = std::filesystem::temp_directory_path() / "pgresult_config_test";
        std::filesystem::create_directories(tempDir_);
        unsetenv("PGPASSWORD");
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
        unsetenv("PGPASSWORD");
    }

    std::filesystem::path tempDir_;

    void writeConfigFile(const std::string& filename, const std::string& content) {
        std::ofstream file(tempDir_ / filename);
        file << content;
    }

    Config parse(std::vector<std::string> args) {
        args.insert(args.begin(), "pgresult-dump");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return Config::parseArgs(static_cast<int>(argv.size()), argv.data());
    }
};

// Default configuration tests
TEST_F(ConfigTest, DefaultConnectionConfig) {
    ConnectionConfig config;

    EXPECT_EQ(config.host, "localhost");
    EXPECT_EQ(config.port, 5432);
    EXPECT_TRUE(config.user.empty());
    EXPECT_TRUE(config.password.empty());
    EXPECT_TRUE(config.database.empty());
    EXPECT_EQ(config.sslmode, "prefer");
    EXPECT_EQ(config.connect_timeout, 5000ms);
    EXPECT_EQ(config.application_name, "pgresult-dump");
}

TEST_F(ConfigTest, DefaultOutputConfig) {
    OutputConfig config;

    EXPECT_EQ(config.format, "csv");
    EXPECT_TRUE(config.pretty_json);
    EXPECT_TRUE(config.include_csv_header);
    EXPECT_TRUE(config.include_null);
    EXPECT_EQ(config.delimiter, ',');
}

TEST_F(ConfigTest, DefaultConfig) {
    Config config;

    EXPECT_TRUE(config.query.empty());
    EXPECT_TRUE(config.load_type_catalog);
    EXPECT_FALSE(config.debug);
    EXPECT_TRUE(config.log_file.empty());
}

// Config file loading tests
TEST_F(ConfigTest, LoadFromValidFile) {
    writeConfigFile("valid.conf", R"(
query = SELECT 1
debug = true

[connection]
host = db.example.com
port = 5433
user = reader
password = "s3cret"
database = inventory
connect_timeout = 2500

[output]
format = json
pretty_json = false
include_null = no
)");

    auto config = Config::loadFromFile(tempDir_ / "valid.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->query, "SELECT 1");
    EXPECT_TRUE(config->debug);
    EXPECT_EQ(config->connection.host, "db.example.com");
    EXPECT_EQ(config->connection.port, 5433);
    EXPECT_EQ(config->connection.user, "reader");
    EXPECT_EQ(config->connection.password, "s3cret");
    EXPECT_EQ(config->connection.database, "inventory");
    EXPECT_EQ(config->connection.connect_timeout, 2500ms);
    EXPECT_EQ(config->output.format, "json");
    EXPECT_FALSE(config->output.pretty_json);
    EXPECT_FALSE(config->output.include_null);
}

TEST_F(ConfigTest, LoadFromNonExistentFile) {
    auto config = Config::loadFromFile("/nonexistent/path/config.conf");

    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, LoadFromEmptyFile) {
    writeConfigFile("empty.conf", "");

    auto config = Config::loadFromFile(tempDir_ / "empty.conf");

    // Should still return a config with defaults
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->connection.port, 5432);
}

TEST_F(ConfigTest, LoadSkipsCommentsAndBadValues) {
    writeConfigFile("comments.conf", R"(
# comment
; another comment
[connection]
port = not-a-number
host = kept.example.com
garbage line
)");

    auto config = Config::loadFromFile(tempDir_ / "comments.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->connection.port, 5432);
    EXPECT_EQ(config->connection.host, "kept.example.com");
}

TEST_F(ConfigTest, LoadTabDelimiter) {
    writeConfigFile("tab.conf", R"(
[output]
delimiter = tab
)");

    auto config = Config::loadFromFile(tempDir_ / "tab.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->output.delimiter, '\t');
}

// Command line tests
TEST_F(ConfigTest, ParseArgsBasic) {
    auto config = parse({"-H", "pg.internal", "-P", "6432", "-u", "app", "-D", "shop",
                         "-F", "json", "--compact", "SELECT * FROM orders"});

    EXPECT_EQ(config.connection.host, "pg.internal");
    EXPECT_EQ(config.connection.port, 6432);
    EXPECT_EQ(config.connection.user, "app");
    EXPECT_EQ(config.connection.database, "shop");
    EXPECT_EQ(config.output.format, "json");
    EXPECT_FALSE(config.output.pretty_json);
    EXPECT_EQ(config.query, "SELECT * FROM orders");
}

TEST_F(ConfigTest, ParseArgsFlags) {
    auto config = parse({"--no-header", "--skip-null", "--no-type-catalog", "--delimiter", ";",
                         "-d", "SELECT 1"});

    EXPECT_FALSE(config.output.include_csv_header);
    EXPECT_FALSE(config.output.include_null);
    EXPECT_FALSE(config.load_type_catalog);
    EXPECT_EQ(config.output.delimiter, ';');
    EXPECT_TRUE(config.debug);
}

TEST_F(ConfigTest, CommandLineOverridesConfigFile) {
    writeConfigFile("base.conf", R"(
query = SELECT 2
[connection]
host = file.example.com
user = file_user
[output]
format = describe
)");

    auto config = parse({"-c", (tempDir_ / "base.conf").string(), "-u", "cli_user"});

    EXPECT_EQ(config.connection.host, "file.example.com");
    EXPECT_EQ(config.connection.user, "cli_user");
    EXPECT_EQ(config.output.format, "describe");
    EXPECT_EQ(config.query, "SELECT 2");
}

TEST_F(ConfigTest, PasswordFromEnvironment) {
    setenv("PGPASSWORD", "from-env", 1);

    auto config = parse({"SELECT 1"});

    EXPECT_EQ(config.connection.password, "from-env");
}

TEST_F(ConfigTest, ExplicitPasswordWinsOverEnvironment) {
    setenv("PGPASSWORD", "from-env", 1);

    auto config = parse({"-p", "given", "SELECT 1"});

    EXPECT_EQ(config.connection.password, "given");
}

// Config validation tests
TEST_F(ConfigTest, ValidateWithQuery) {
    Config config;
    config.query = "SELECT 1";

    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateWithoutQuery) {
    Config config;

    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateUnknownFormat) {
    Config config;
    config.query = "SELECT 1";
    config.output.format = "xml";

    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateZeroPort) {
    Config config;
    config.query = "SELECT 1";
    config.connection.port = 0;

    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateMissingSslFile) {
    Config config;
    config.query = "SELECT 1";
    config.connection.sslrootcert = (tempDir_ / "missing-ca.pem").string();

    EXPECT_FALSE(config.validate());

    writeConfigFile("missing-ca.pem", "cert");
    EXPECT_TRUE(config.validate());
}
