#pragma once

#include "Config.hpp"
#include "Driver.hpp"
#include <memory>

namespace sqlbridge {

// Unconnected driver for the given backend
std::unique_ptr<Driver> createDriver(DatabaseType type);

// Creates the driver for config.type and connects it. Throws
// ConnectionError when the configuration is invalid or the backend can not
// be reached; no half-connected driver is ever returned.
std::unique_ptr<Driver> connectDriver(const DatabaseConfig& config);

}  // namespace sqlbridge
