#include "DriverFactory.hpp"
#include "SQLiteDriver.hpp"
#include "PostgreSQLDriver.hpp"
#include <spdlog/spdlog.h>

namespace sqlbridge {

std::unique_ptr<Driver> createDriver(DatabaseType type) {
    switch (type) {
        case DatabaseType::SQLite:
            return std::make_unique<SQLiteDriver>();

        case DatabaseType::PostgreSQL:
            return std::make_unique<PostgreSQLDriver>();
    }

    throw ConnectionError("unsupported database type");
}

std::unique_ptr<Driver> connectDriver(const DatabaseConfig& config) {
    if (!config.validate()) {
        throw ConnectionError("invalid " + databaseTypeToString(config.type) + " database configuration");
    }

    auto driver = createDriver(config.type);
    spdlog::debug("Connecting {} driver", driver->dialect());
    driver->connect(config);
    return driver;
}

}  // namespace sqlbridge
