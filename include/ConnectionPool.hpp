#pragma once

#include <cstddef>

namespace sqlbridge {

struct PoolStats {
    size_t open = 0;     ///< Connections currently open (idle + in use)
    size_t idle = 0;     ///< Connections waiting in the pool
    size_t inUse = 0;    ///< Connections leased out
    size_t waiting = 0;  ///< Callers blocked in acquire()
    size_t maxOpen = 0;  ///< Effective limit after backend caps
};

class ConnectionPool {
public:
    virtual ~ConnectionPool() = default;

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Pool statistics
    virtual PoolStats stats() const = 0;

    // Health check
    virtual bool healthCheck() = 0;

    // Close idle connections and refuse new acquisitions. Leased connections
    // are closed when they come back.
    virtual void drain() = 0;

protected:
    ConnectionPool() = default;
};

}  // namespace sqlbridge
