#pragma once

/**
 * @file PostgreSQLConnectionPool.hpp
 * @brief Thread-safe connection pool for PostgreSQL database connections.
 *
 * This file implements a connection pool that manages PGconn* handles
 * for efficient reuse across multiple operations. The pool handles
 * connection lifecycle, validation, and thread-safe distribution.
 */

#include "ConnectionPool.hpp"
#include "Config.hpp"
#include "PostgreSQLConnection.hpp"
#include <libpq-fe.h>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>

namespace sqlbridge {

/**
 * @class PostgreSQLConnectionPool
 * @brief Thread-safe pool of PostgreSQL database connections.
 *
 * Manages a pool of PGconn* handles, providing efficient connection reuse.
 * Connections are validated before being handed out and can be created
 * on-demand up to max_open.
 *
 * PostgreSQL Connection Management:
 * - Uses libpq's PQconnectdb() for connection establishment
 * - Connection string format: "host='X' dbname='Y' user='Z' password='W'"
 * - Validates connections with a simple query before reuse
 *
 * Pool Behavior:
 * - acquire() blocks until a connection is available or timeout
 * - At most max_idle connections are kept when released
 * - Connections older than max_lifetime are closed instead of reused
 * - Broken connections are destroyed and replaced on demand
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Uses mutex and condition_variable for synchronization
 *
 * @see PostgreSQLConnection for connection wrapper usage
 */
class PostgreSQLConnectionPool : public ConnectionPool,
                                 public std::enable_shared_from_this<PostgreSQLConnectionPool> {
public:
    /**
     * @brief Create a new PostgreSQL connection pool.
     * @param config Connection configuration (host, port, database, credentials).
     * @param pool Pool limits.
     *
     * Does not immediately create connections; call open() to validate one.
     */
    PostgreSQLConnectionPool(const ConnectionConfig& config, const PoolConfig& pool);

    /**
     * @brief Destructor - closes all connections.
     */
    ~PostgreSQLConnectionPool() override;

    /**
     * @brief Open and validate the first connection.
     * @throws ConnectionError when the server can not be reached.
     */
    void open();

    /**
     * @brief Acquire a connection from the pool.
     * @param timeout Maximum time to wait for a connection.
     * @return Lease returning the connection on destruction.
     * @throws ConnectionError on timeout, connect failure or a drained pool.
     */
    std::unique_ptr<PostgreSQLConnection> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Return a connection to the pool.
     * @param conn The PGconn* to return.
     * @param broken Close the connection instead of keeping it idle.
     */
    void releaseConnection(PGconn* conn, bool broken);

    // ----- ConnectionPool interface implementation -----

    PoolStats stats() const override;

    /**
     * @brief Check if the pool can provide a working connection.
     */
    bool healthCheck() override;

    /**
     * @brief Close all idle connections and refuse new acquisitions.
     */
    void drain() override;

    /**
     * @brief Build a libpq keyword/value connection string.
     *
     * Every value is single-quoted with backslashes and quotes escaped, so
     * passwords containing spaces or quotes survive intact.
     */
    static std::string buildConnectionString(const ConnectionConfig& config);

    // Connection string with the password masked, for logs
    static std::string describe(const ConnectionConfig& config);

private:
    /**
     * @brief Create a new PostgreSQL connection.
     * @throws ConnectionError if the connection fails.
     */
    PGconn* createConnection();

    void destroyConnection(PGconn* conn);
    bool validateConnection(PGconn* conn);
    bool expired(PGconn* conn) const;

    ConnectionConfig m_config;                ///< Connection configuration
    PoolConfig m_poolConfig;                  ///< Pool limits
    std::deque<PGconn*> m_available;          ///< Idle connections
    std::map<PGconn*, std::chrono::steady_clock::time_point> m_openedAt;  ///< Every open connection
    size_t m_waitingCount = 0;                ///< Callers blocked in acquire()
    size_t m_pendingCount = 0;                ///< Connections being dialled
    bool m_shutdown = false;
    mutable std::mutex m_mutex;               ///< Protects all of the above
    std::condition_variable m_cv;             ///< Signals connection availability
};

}  // namespace sqlbridge
