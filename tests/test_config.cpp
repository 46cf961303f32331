#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>

using namespace sqlbridge;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test files
        tempDir_ = std::filesystem::temp_directory_path() / "sqlbridge_config_test";
        std::filesystem::create_directories(tempDir_);
        clearEnvironment();
    }

    void TearDown() override {
        clearEnvironment();
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;

    void writeConfigFile(const std::string& filename, const std::string& content) {
        std::ofstream file(tempDir_ / filename);
        file << content;
    }

    static void clearEnvironment() {
        for (const char* name : {"DB_DRIVER", "DB_PATH", "DB_HOST", "DB_PORT", "DB_USER",
                                 "DB_PASSWORD", "DB_NAME", "DB_SSLMODE", "DB_MAX_OPEN_CONNS",
                                 "DB_MAX_IDLE_CONNS", "DB_CONN_MAX_LIFETIME",
                                 "TARGET_DB_DRIVER", "TARGET_DB_HOST", "TARGET_DB_PORT",
                                 "TARGET_DB_USER", "TARGET_DB_PASSWORD", "TARGET_DB_NAME",
                                 "MIGRATION_BATCH_SIZE", "MIGRATION_TIMEOUT_SECONDS",
                                 "MIGRATION_RETRY_ATTEMPTS", "MIGRATION_WORKERS", "PGPASSWORD"}) {
            unsetenv(name);
        }
    }

    static DatabaseConfig postgresConfig() {
        DatabaseConfig db;
        db.type = DatabaseType::PostgreSQL;
        db.connection.user = "app";
        db.connection.database = "ledger";
        return db;
    }
};

// Default configuration tests
TEST_F(ConfigTest, DefaultConnectionConfig) {
    ConnectionConfig config;

    EXPECT_EQ(config.sqlite_path, "data/sqlbridge.db");
    EXPECT_EQ(config.host, "localhost");
    EXPECT_EQ(config.port, 5432);
    EXPECT_TRUE(config.user.empty());
    EXPECT_TRUE(config.password.empty());
    EXPECT_EQ(config.ssl_mode, "disable");
    EXPECT_EQ(config.application_name, "sqlbridge");
    EXPECT_EQ(config.connect_timeout, 5000ms);
}

TEST_F(ConfigTest, DefaultPoolConfig) {
    PoolConfig config;

    EXPECT_EQ(config.max_open, 10u);
    EXPECT_EQ(config.max_idle, 5u);
    EXPECT_EQ(config.max_lifetime, 3600s);
    EXPECT_EQ(config.acquire_timeout, 30000ms);
}

TEST_F(ConfigTest, DefaultMigrationConfig) {
    MigrationConfig config;

    EXPECT_EQ(config.batch_size, 500u);
    EXPECT_EQ(config.timeout, 30s);
    EXPECT_EQ(config.retry_attempts, 3);
    EXPECT_EQ(config.workers, 1u);
    EXPECT_EQ(config.retry_backoff, 100ms);
}

TEST_F(ConfigTest, DefaultConfig) {
    Config config;

    EXPECT_EQ(config.current.type, DatabaseType::SQLite);
    EXPECT_EQ(config.target.type, DatabaseType::SQLite);
    EXPECT_TRUE(config.tables.empty());
    EXPECT_FALSE(config.resume);
    EXPECT_FALSE(config.init_schema);
    EXPECT_FALSE(config.debug);
}

// Database type parsing
TEST_F(ConfigTest, ParseDatabaseTypeAcceptsAliases) {
    EXPECT_EQ(parseDatabaseType("sqlite"), DatabaseType::SQLite);
    EXPECT_EQ(parseDatabaseType("SQLite3"), DatabaseType::SQLite);
    EXPECT_EQ(parseDatabaseType("postgres"), DatabaseType::PostgreSQL);
    EXPECT_EQ(parseDatabaseType("PostgreSQL"), DatabaseType::PostgreSQL);
    EXPECT_EQ(parseDatabaseType("pgsql"), DatabaseType::PostgreSQL);
}

TEST_F(ConfigTest, ParseDatabaseTypeRejectsUnknown) {
    EXPECT_THROW(parseDatabaseType("mysql"), std::invalid_argument);
    EXPECT_THROW(parseDatabaseType(""), std::invalid_argument);
}

TEST_F(ConfigTest, DatabaseTypeToStringMatchesDialect) {
    EXPECT_EQ(databaseTypeToString(DatabaseType::SQLite), "sqlite");
    EXPECT_EQ(databaseTypeToString(DatabaseType::PostgreSQL), "postgres");
}

// Config file loading tests
TEST_F(ConfigTest, LoadFromValidFile) {
    writeConfigFile("valid.conf", R"(
[current]
driver = sqlite
path = /var/lib/ledger/app.db

[target]
driver = postgres
host = pg.example.com
port = 5433
user = migrator
password = "s3cret; with spaces"
dbname = ledger
sslmode = require
max_open_conns = 20
max_idle_conns = 4
conn_max_lifetime = 600

[migration]
batch_size = 250
timeout_seconds = 45
retry_attempts = 5
workers = 4
tables = users, loans,payments
state_file = /tmp/ledger.state

[logging]
debug = true
file = /tmp/sqlbridge.log
)");

    auto config = Config::loadFromFile(tempDir_ / "valid.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->current.type, DatabaseType::SQLite);
    EXPECT_EQ(config->current.connection.sqlite_path, "/var/lib/ledger/app.db");
    EXPECT_EQ(config->target.type, DatabaseType::PostgreSQL);
    EXPECT_EQ(config->target.connection.host, "pg.example.com");
    EXPECT_EQ(config->target.connection.port, 5433);
    EXPECT_EQ(config->target.connection.user, "migrator");
    EXPECT_EQ(config->target.connection.password, "s3cret; with spaces");
    EXPECT_EQ(config->target.connection.database, "ledger");
    EXPECT_EQ(config->target.connection.ssl_mode, "require");
    EXPECT_EQ(config->target.pool.max_open, 20u);
    EXPECT_EQ(config->target.pool.max_idle, 4u);
    EXPECT_EQ(config->target.pool.max_lifetime, 600s);
    EXPECT_EQ(config->migration.batch_size, 250u);
    EXPECT_EQ(config->migration.timeout, 45s);
    EXPECT_EQ(config->migration.retry_attempts, 5);
    EXPECT_EQ(config->migration.workers, 4u);
    EXPECT_THAT(config->tables, ::testing::ElementsAre("users", "loans", "payments"));
    EXPECT_EQ(config->state_file, "/tmp/ledger.state");
    EXPECT_TRUE(config->debug);
    EXPECT_EQ(config->log_file, "/tmp/sqlbridge.log");
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
    EXPECT_EQ(config->migration.batch_size, 500u);
}

TEST_F(ConfigTest, SourceIsAnAliasForCurrent) {
    writeConfigFile("source.conf", R"(
[source]
path = legacy.db
)");

    auto config = Config::loadFromFile(tempDir_ / "source.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->current.connection.sqlite_path, "legacy.db");
}

TEST_F(ConfigTest, ConfigWithCommentsAndWhitespace) {
    writeConfigFile("comments.conf", R"(
# This is a comment
[target]
; Another comment
  host = db.internal
  port = 6432
)");

    auto config = Config::loadFromFile(tempDir_ / "comments.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->target.connection.host, "db.internal");
    EXPECT_EQ(config->target.connection.port, 6432);
}

TEST_F(ConfigTest, ConfigWithInvalidValuesIsRejected) {
    writeConfigFile("invalid.conf", R"(
[target]
port = not_a_number
)");

    auto config = Config::loadFromFile(tempDir_ / "invalid.conf");

    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, ConfigWithUnknownDriverIsRejected) {
    writeConfigFile("driver.conf", R"(
[current]
driver = oracle
)");

    EXPECT_FALSE(Config::loadFromFile(tempDir_ / "driver.conf").has_value());
}

// Environment overrides
TEST_F(ConfigTest, EnvironmentOverridesDatabaseSettings) {
    Config config;
    setenv("DB_DRIVER", "sqlite", 1);
    setenv("DB_PATH", "/data/env.db", 1);
    setenv("TARGET_DB_DRIVER", "postgres", 1);
    setenv("TARGET_DB_HOST", "envhost", 1);
    setenv("TARGET_DB_PORT", "15432", 1);
    setenv("TARGET_DB_USER", "envuser", 1);
    setenv("TARGET_DB_NAME", "envdb", 1);

    config.applyEnvironment();

    EXPECT_EQ(config.current.type, DatabaseType::SQLite);
    EXPECT_EQ(config.current.connection.sqlite_path, "/data/env.db");
    EXPECT_EQ(config.target.type, DatabaseType::PostgreSQL);
    EXPECT_EQ(config.target.connection.host, "envhost");
    EXPECT_EQ(config.target.connection.port, 15432);
    EXPECT_EQ(config.target.connection.user, "envuser");
    EXPECT_EQ(config.target.connection.database, "envdb");
}

TEST_F(ConfigTest, EnvironmentOverridesMigrationSettings) {
    Config config;
    setenv("MIGRATION_BATCH_SIZE", "1000", 1);
    setenv("MIGRATION_TIMEOUT_SECONDS", "90", 1);
    setenv("MIGRATION_RETRY_ATTEMPTS", "7", 1);
    setenv("MIGRATION_WORKERS", "3", 1);

    config.applyEnvironment();

    EXPECT_EQ(config.migration.batch_size, 1000u);
    EXPECT_EQ(config.migration.timeout, 90s);
    EXPECT_EQ(config.migration.retry_attempts, 7);
    EXPECT_EQ(config.migration.workers, 3u);
}

TEST_F(ConfigTest, EnvironmentPoolLimits) {
    Config config;
    setenv("DB_MAX_OPEN_CONNS", "25", 1);
    setenv("DB_MAX_IDLE_CONNS", "2", 1);
    setenv("DB_CONN_MAX_LIFETIME", "120", 1);

    config.applyEnvironment();

    EXPECT_EQ(config.current.pool.max_open, 25u);
    EXPECT_EQ(config.current.pool.max_idle, 2u);
    EXPECT_EQ(config.current.pool.max_lifetime, 120s);
}

TEST_F(ConfigTest, PgPasswordFillsMissingPasswords) {
    Config config;
    config.current.connection.password = "explicit";
    setenv("PGPASSWORD", "from_pg", 1);

    config.applyEnvironment();

    EXPECT_EQ(config.current.connection.password, "explicit");
    EXPECT_EQ(config.target.connection.password, "from_pg");
}

TEST_F(ConfigTest, InvalidEnvironmentNumberThrows) {
    Config config;
    setenv("MIGRATION_BATCH_SIZE", "lots", 1);

    EXPECT_THROW(config.applyEnvironment(), std::invalid_argument);
}

// Config validation tests
TEST_F(ConfigTest, ValidateSqliteRequiresPath) {
    DatabaseConfig db;
    EXPECT_TRUE(db.validate());

    db.connection.sqlite_path.clear();
    EXPECT_FALSE(db.validate());
}

TEST_F(ConfigTest, ValidatePostgresRequiresUserAndDatabase) {
    auto db = postgresConfig();
    EXPECT_TRUE(db.validate());

    auto noUser = postgresConfig();
    noUser.connection.user.clear();
    EXPECT_FALSE(noUser.validate());

    auto noDb = postgresConfig();
    noDb.connection.database.clear();
    EXPECT_FALSE(noDb.validate());
}

TEST_F(ConfigTest, ValidatePostgresRejectsUnknownSslMode) {
    auto db = postgresConfig();
    db.connection.ssl_mode = "sometimes";

    EXPECT_FALSE(db.validate());
}

TEST_F(ConfigTest, ValidateRequiresTables) {
    Config config;
    EXPECT_FALSE(config.validate());

    config.tables = {"users"};
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsZeroBatchSize) {
    Config config;
    config.tables = {"users"};
    config.migration.batch_size = 0;

    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateResumeRequiresStateFile) {
    Config config;
    config.tables = {"users"};
    config.resume = true;
    EXPECT_FALSE(config.validate());

    config.state_file = "migration.state";
    EXPECT_TRUE(config.validate());
}

// Command line
TEST_F(ConfigTest, ParseArgsCommandLineOverridesFile) {
    writeConfigFile("cli.conf", R"(
[target]
driver = postgres
host = filehost
user = fileuser
dbname = filedb

[migration]
batch_size = 100
tables = users
)");
    std::string configPath = (tempDir_ / "cli.conf").string();

    std::vector<std::string> args = {
        "sqlbridge-migrate", "-c", configPath,
        "--target-host", "clihost",
        "--batch-size", "50",
        "--tables", "users,loans",
        "--workers", "2",
        "--resume", "--state-file", "run.state"
    };
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());

    Config config = Config::parseArgs(static_cast<int>(argv.size()), argv.data());

    EXPECT_EQ(config.target.type, DatabaseType::PostgreSQL);
    EXPECT_EQ(config.target.connection.host, "clihost");
    EXPECT_EQ(config.target.connection.user, "fileuser");
    EXPECT_EQ(config.migration.batch_size, 50u);
    EXPECT_EQ(config.migration.workers, 2u);
    EXPECT_THAT(config.tables, ::testing::ElementsAre("users", "loans"));
    EXPECT_TRUE(config.resume);
    EXPECT_EQ(config.state_file, "run.state");
}

TEST_F(ConfigTest, ParseArgsEnvironmentBetweenFileAndCommandLine) {
    writeConfigFile("env.conf", R"(
[migration]
retry_attempts = 2
batch_size = 100
)");
    std::string configPath = (tempDir_ / "env.conf").string();
    setenv("MIGRATION_RETRY_ATTEMPTS", "4", 1);
    setenv("MIGRATION_BATCH_SIZE", "300", 1);

    std::vector<std::string> args = {"sqlbridge-migrate", "-c", configPath, "--batch-size", "10"};
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());

    Config config = Config::parseArgs(static_cast<int>(argv.size()), argv.data());

    EXPECT_EQ(config.migration.retry_attempts, 4);
    EXPECT_EQ(config.migration.batch_size, 10u);
}
