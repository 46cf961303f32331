#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace sqlbridge {

enum class DatabaseType {
    SQLite,
    PostgreSQL
};

// Parse "sqlite", "sqlite3", "postgres", "postgresql", "pgsql" (case-insensitive)
DatabaseType parseDatabaseType(const std::string& type);
std::string databaseTypeToString(DatabaseType type);

struct ConnectionConfig {
    // SQLite
    std::string sqlite_path = "data/sqlbridge.db";

    // PostgreSQL
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user;
    std::string password;
    std::string database;
    std::string ssl_mode = "disable";  // disable, allow, prefer, require, verify-ca, verify-full
    std::string application_name = "sqlbridge";

    std::chrono::milliseconds connect_timeout{5000};
};

struct PoolConfig {
    size_t max_open = 10;
    size_t max_idle = 5;
    std::chrono::seconds max_lifetime{3600};  // 0 disables recycling
    std::chrono::milliseconds acquire_timeout{30000};
};

struct DatabaseConfig {
    DatabaseType type = DatabaseType::SQLite;
    ConnectionConfig connection;
    PoolConfig pool;
    std::filesystem::path schema_dir = "schema";

    bool validate() const;
};

struct MigrationConfig {
    size_t batch_size = 500;
    std::chrono::seconds timeout{30};
    int retry_attempts = 3;
    size_t workers = 1;
    std::chrono::milliseconds retry_backoff{100};
};

struct Config {
    DatabaseConfig current;
    DatabaseConfig target;
    MigrationConfig migration;

    std::vector<std::string> tables;
    std::string state_file;
    bool resume = false;
    bool init_schema = false;
    bool debug = false;
    std::string log_file;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments (command line > environment > file)
    static Config parseArgs(int argc, char* argv[]);

    // Override values from DB_* / TARGET_DB_* / MIGRATION_* variables
    void applyEnvironment();

    // Validate configuration
    bool validate() const;
};

}  // namespace sqlbridge
