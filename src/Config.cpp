#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>

namespace sqlbridge {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    for (char c : str) {
        if (c == delimiter) {
            if (!trim(current).empty()) {
                result.push_back(trim(current));
            }
            current.clear();
        } else {
            current += c;
        }
    }
    if (!trim(current).empty()) {
        result.push_back(trim(current));
    }
    return result;
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

// Keys shared by [current] and [target]
void applyDatabaseKey(DatabaseConfig& db, const std::string& key, const std::string& value) {
    if (key == "driver" || key == "type") db.type = parseDatabaseType(value);
    else if (key == "path") db.connection.sqlite_path = value;
    else if (key == "host") db.connection.host = value;
    else if (key == "port") db.connection.port = static_cast<uint16_t>(std::stoi(value));
    else if (key == "user") db.connection.user = value;
    else if (key == "password") db.connection.password = value;
    else if (key == "database" || key == "dbname") db.connection.database = value;
    else if (key == "sslmode" || key == "ssl_mode") db.connection.ssl_mode = value;
    else if (key == "application_name") db.connection.application_name = value;
    else if (key == "connect_timeout")
        db.connection.connect_timeout = std::chrono::milliseconds(std::stoi(value));
    else if (key == "max_open_conns") db.pool.max_open = std::stoul(value);
    else if (key == "max_idle_conns") db.pool.max_idle = std::stoul(value);
    else if (key == "conn_max_lifetime")
        db.pool.max_lifetime = std::chrono::seconds(std::stol(value));
    else if (key == "acquire_timeout")
        db.pool.acquire_timeout = std::chrono::milliseconds(std::stol(value));
    else if (key == "schema_dir") db.schema_dir = value;
    else spdlog::warn("Unknown database config key: {}", key);
}

void applyDatabaseEnvironment(DatabaseConfig& db, const std::string& prefix) {
    auto env = [&prefix](const char* name) -> const char* {
        return std::getenv((prefix + name).c_str());
    };

    if (const char* v = env("DRIVER")) db.type = parseDatabaseType(v);
    if (const char* v = env("PATH")) db.connection.sqlite_path = v;
    if (const char* v = env("HOST")) db.connection.host = v;
    if (const char* v = env("PORT")) db.connection.port = static_cast<uint16_t>(std::stoi(v));
    if (const char* v = env("USER")) db.connection.user = v;
    if (const char* v = env("PASSWORD")) db.connection.password = v;
    if (const char* v = env("NAME")) db.connection.database = v;
    if (const char* v = env("SSLMODE")) db.connection.ssl_mode = v;
    if (const char* v = env("MAX_OPEN_CONNS")) db.pool.max_open = std::stoul(v);
    if (const char* v = env("MAX_IDLE_CONNS")) db.pool.max_idle = std::stoul(v);
    if (const char* v = env("CONN_MAX_LIFETIME"))
        db.pool.max_lifetime = std::chrono::seconds(std::stol(v));
    if (const char* v = env("SCHEMA_DIR")) db.schema_dir = v;
}

}  // namespace

DatabaseType parseDatabaseType(const std::string& type) {
    std::string lower = type;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "sqlite" || lower == "sqlite3") {
        return DatabaseType::SQLite;
    } else if (lower == "postgres" || lower == "postgresql" || lower == "pgsql") {
        return DatabaseType::PostgreSQL;
    }

    throw std::invalid_argument("Unknown database type: " + type);
}

std::string databaseTypeToString(DatabaseType type) {
    switch (type) {
        case DatabaseType::SQLite:
            return "sqlite";
        case DatabaseType::PostgreSQL:
            return "postgres";
        default:
            return "unknown";
    }
}

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
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

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

        try {
            if (current_section == "current" || current_section == "source") {
                applyDatabaseKey(config.current, key, value);
            } else if (current_section == "target") {
                applyDatabaseKey(config.target, key, value);
            } else if (current_section == "migration") {
                if (key == "batch_size") config.migration.batch_size = std::stoul(value);
                else if (key == "timeout_seconds")
                    config.migration.timeout = std::chrono::seconds(std::stol(value));
                else if (key == "retry_attempts") config.migration.retry_attempts = std::stoi(value);
                else if (key == "workers") config.migration.workers = std::stoul(value);
                else if (key == "retry_backoff_ms")
                    config.migration.retry_backoff = std::chrono::milliseconds(std::stol(value));
                else if (key == "tables") config.tables = split(value, ',');
                else if (key == "state_file") config.state_file = value;
            } else if (current_section == "logging") {
                if (key == "debug") config.debug = parseBool(value);
                else if (key == "file") config.log_file = value;
            }
        } catch (const std::exception& e) {
            spdlog::error("{}:{}: invalid value for '{}': {}", path.string(), line_no, key, e.what());
            return std::nullopt;
        }
    }

    return config;
}

void Config::applyEnvironment() {
    applyDatabaseEnvironment(current, "DB_");
    applyDatabaseEnvironment(target, "TARGET_DB_");

    if (const char* v = std::getenv("MIGRATION_BATCH_SIZE")) migration.batch_size = std::stoul(v);
    if (const char* v = std::getenv("MIGRATION_TIMEOUT_SECONDS"))
        migration.timeout = std::chrono::seconds(std::stol(v));
    if (const char* v = std::getenv("MIGRATION_RETRY_ATTEMPTS")) migration.retry_attempts = std::stoi(v);
    if (const char* v = std::getenv("MIGRATION_WORKERS")) migration.workers = std::stoul(v);

    // libpq's own variable as the last resort for passwords
    const char* pg_pwd = std::getenv("PGPASSWORD");
    if (pg_pwd) {
        if (current.connection.password.empty()) current.connection.password = pg_pwd;
        if (target.connection.password.empty()) target.connection.password = pg_pwd;
    }
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config cli;
    CLI::App app{"sqlbridge-migrate - copy tables between SQLite and PostgreSQL"};

    std::string source_type;
    std::string target_type;
    std::string tables_str;
    std::string config_file;
    int timeout_seconds = 0;

    auto addDatabaseOptions = [&app](const std::string& prefix, DatabaseConfig& db,
                                     std::string& type) {
        app.add_option("--" + prefix + "-type", type, "Backend: sqlite or postgres");
        app.add_option("--" + prefix + "-path", db.connection.sqlite_path, "SQLite database file");
        app.add_option("--" + prefix + "-host", db.connection.host, "PostgreSQL host");
        app.add_option("--" + prefix + "-port", db.connection.port, "PostgreSQL port");
        app.add_option("--" + prefix + "-user", db.connection.user, "PostgreSQL user");
        app.add_option("--" + prefix + "-password", db.connection.password, "PostgreSQL password");
        app.add_option("--" + prefix + "-db", db.connection.database, "PostgreSQL database name");
        app.add_option("--" + prefix + "-sslmode", db.connection.ssl_mode, "PostgreSQL sslmode");
        app.add_option("--" + prefix + "-max-open", db.pool.max_open, "Maximum open connections");
    };

    addDatabaseOptions("source", cli.current, source_type);
    addDatabaseOptions("target", cli.target, target_type);

    app.add_option("--tables", tables_str, "Comma-separated tables in dependency order");
    app.add_option("--batch-size", cli.migration.batch_size, "Rows per batch");
    app.add_option("--timeout", timeout_seconds, "Per-attempt timeout in seconds");
    app.add_option("--retries", cli.migration.retry_attempts, "Attempts per batch");
    app.add_option("--workers", cli.migration.workers,
                   "Concurrent batch workers (PostgreSQL targets only)");
    app.add_option("--state-file", cli.state_file, "File recording committed offsets");
    app.add_flag("--resume", cli.resume, "Resume from the offsets in --state-file");
    app.add_flag("--init-schema", cli.init_schema, "Apply the target schema before migrating");
    std::string schema_dir;
    app.add_option("--schema-dir", schema_dir, "Directory holding schema.<dialect>.sql files");
    app.add_option("-c,--config", config_file, "Path to configuration file");
    app.add_flag("-d,--debug", cli.debug, "Enable debug output");
    app.add_option("--log-file", cli.log_file, "Also log to this file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    Config config;
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = std::move(*file_config);
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Command line overrides file and environment
    auto given = [&app](const std::string& name) { return app.count(name) > 0; };
    auto mergeDatabase = [&given](const std::string& prefix, DatabaseConfig& dst,
                                  const DatabaseConfig& src, const std::string& type) {
        if (given("--" + prefix + "-type")) dst.type = parseDatabaseType(type);
        if (given("--" + prefix + "-path")) dst.connection.sqlite_path = src.connection.sqlite_path;
        if (given("--" + prefix + "-host")) dst.connection.host = src.connection.host;
        if (given("--" + prefix + "-port")) dst.connection.port = src.connection.port;
        if (given("--" + prefix + "-user")) dst.connection.user = src.connection.user;
        if (given("--" + prefix + "-password")) dst.connection.password = src.connection.password;
        if (given("--" + prefix + "-db")) dst.connection.database = src.connection.database;
        if (given("--" + prefix + "-sslmode")) dst.connection.ssl_mode = src.connection.ssl_mode;
        if (given("--" + prefix + "-max-open")) dst.pool.max_open = src.pool.max_open;
    };

    try {
        config.applyEnvironment();
        mergeDatabase("source", config.current, cli.current, source_type);
        mergeDatabase("target", config.target, cli.target, target_type);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        std::exit(2);
    }

    if (given("--tables")) config.tables = split(tables_str, ',');
    if (given("--batch-size")) config.migration.batch_size = cli.migration.batch_size;
    if (given("--timeout")) config.migration.timeout = std::chrono::seconds(timeout_seconds);
    if (given("--retries")) config.migration.retry_attempts = cli.migration.retry_attempts;
    if (given("--workers")) config.migration.workers = cli.migration.workers;
    if (given("--state-file")) config.state_file = cli.state_file;
    if (given("--schema-dir")) {
        config.current.schema_dir = schema_dir;
        config.target.schema_dir = schema_dir;
    }
    if (given("--log-file")) config.log_file = cli.log_file;
    config.resume = config.resume || cli.resume;
    config.init_schema = config.init_schema || cli.init_schema;
    config.debug = config.debug || cli.debug;

    return config;
}

bool DatabaseConfig::validate() const {
    if (type == DatabaseType::SQLite) {
        if (connection.sqlite_path.empty()) {
            spdlog::error("SQLite database path is required");
            return false;
        }
        return true;
    }

    if (connection.host.empty()) {
        spdlog::error("PostgreSQL host is required");
        return false;
    }
    if (connection.port == 0) {
        spdlog::error("PostgreSQL port must be non-zero");
        return false;
    }
    if (connection.user.empty()) {
        spdlog::error("PostgreSQL user is required");
        return false;
    }
    if (connection.database.empty()) {
        spdlog::error("PostgreSQL database name is required");
        return false;
    }

    static const std::vector<std::string> kSslModes = {
        "disable", "allow", "prefer", "require", "verify-ca", "verify-full"};
    if (std::find(kSslModes.begin(), kSslModes.end(), connection.ssl_mode) == kSslModes.end()) {
        spdlog::error("Invalid sslmode: {}", connection.ssl_mode);
        return false;
    }

    if (pool.max_open == 0) {
        spdlog::error("max_open must be at least 1");
        return false;
    }

    return true;
}

bool Config::validate() const {
    if (!current.validate() || !target.validate()) {
        return false;
    }

    if (tables.empty()) {
        spdlog::error("At least one table is required (use --tables)");
        return false;
    }

    if (migration.batch_size == 0) {
        spdlog::error("Batch size must be at least 1");
        return false;
    }

    if (migration.retry_attempts < 1) {
        spdlog::error("Retry attempts must be at least 1");
        return false;
    }

    if (migration.timeout.count() <= 0) {
        spdlog::error("Timeout must be positive");
        return false;
    }

    if (resume && state_file.empty()) {
        spdlog::error("--resume requires --state-file");
        return false;
    }

    return true;
}

}  // namespace sqlbridge
