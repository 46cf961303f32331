#pragma once

/**
 * @file SQLiteConnectionPool.hpp
 * @brief Single-writer connection pool for SQLite databases.
 *
 * SQLite allows any number of readers but only one writer per database
 * file. Rather than let concurrent writers fail with SQLITE_BUSY, this pool
 * is capped at one connection and serializes every caller on it.
 */

#include "ConnectionPool.hpp"
#include "Config.hpp"
#include "SQLiteConnection.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace sqlbridge {

class SQLiteConnectionPool;

/**
 * @class PooledSQLiteConnection
 * @brief Lease on a pooled SQLite connection.
 *
 * Returns the connection to its pool when destroyed. A lease that saw the
 * connection in an unknown state (for example a failed ROLLBACK) should be
 * marked broken so the pool closes the connection instead of reusing it.
 */
class PooledSQLiteConnection {
public:
    PooledSQLiteConnection(std::shared_ptr<SQLiteConnectionPool> pool,
                           std::unique_ptr<SQLiteConnection> conn);
    ~PooledSQLiteConnection();

    PooledSQLiteConnection(const PooledSQLiteConnection&) = delete;
    PooledSQLiteConnection& operator=(const PooledSQLiteConnection&) = delete;

    SQLiteConnection* operator->() const { return m_conn.get(); }
    SQLiteConnection& operator*() const { return *m_conn; }

    void markBroken() { m_broken = true; }

private:
    std::shared_ptr<SQLiteConnectionPool> m_pool;
    std::unique_ptr<SQLiteConnection> m_conn;
    bool m_broken = false;
};

/**
 * @class SQLiteConnectionPool
 * @brief Pool of SQLite connections to one database file, capped at one.
 *
 * SQLite Concurrency Notes:
 * - Multiple connections can read simultaneously
 * - Only one connection can write at a time (database-level locking)
 * - WAL mode allows concurrent reads during writes
 *
 * Because every statement may write, the pool hands out a single
 * connection: max_open from the configuration is ignored and the pool
 * becomes a serialization point for all callers of the driver.
 *
 * Pool Behavior:
 * - acquire() blocks until the connection is free or the timeout expires
 * - Connections older than max_lifetime are closed and reopened
 * - With max_idle = 0 the connection is closed after every use
 *
 * @see SQLiteConnection for individual connection usage
 */
class SQLiteConnectionPool : public ConnectionPool,
                             public std::enable_shared_from_this<SQLiteConnectionPool> {
public:
    static constexpr size_t kMaxConnections = 1;

    /**
     * @brief Create a pool for an SQLite database file.
     * @param dbPath Path to the SQLite database file.
     * @param config Pool limits; max_open is capped at kMaxConnections.
     *
     * No connection is opened until open() or acquire() is called.
     */
    SQLiteConnectionPool(const std::string& dbPath, const PoolConfig& config);

    /**
     * @brief Destructor - closes all connections.
     */
    ~SQLiteConnectionPool() override;

    /**
     * @brief Open the first connection eagerly.
     * @throws ConnectionError if the database can not be opened.
     */
    void open();

    /**
     * @brief Acquire the connection.
     * @param timeout Maximum time to wait for the connection to be released.
     * @return Lease returning the connection on destruction.
     * @throws ConnectionError on timeout, open failure, or a drained pool.
     */
    std::unique_ptr<PooledSQLiteConnection> acquire(std::chrono::milliseconds timeout);

    // ----- ConnectionPool interface implementation -----

    PoolStats stats() const override;

    /**
     * @brief Check if the pool can provide a working connection.
     * @return true if "SELECT 1" succeeds.
     */
    bool healthCheck() override;

    /**
     * @brief Close idle connections and refuse new acquisitions.
     */
    void drain() override;

    const std::string& path() const { return m_dbPath; }

private:
    friend class PooledSQLiteConnection;

    void release(std::unique_ptr<SQLiteConnection> conn, bool broken);
    bool expired(const SQLiteConnection& conn) const;

    std::string m_dbPath;         ///< Path to SQLite database file
    PoolConfig m_config;          ///< Limits with max_open capped
    std::vector<std::unique_ptr<SQLiteConnection>> m_available;  ///< Idle connections
    size_t m_openCount = 0;       ///< Open connections (idle + leased)
    size_t m_waitingCount = 0;    ///< Callers blocked in acquire()
    bool m_shutdown = false;
    mutable std::mutex m_mutex;   ///< Protects all of the above
    std::condition_variable m_cv; ///< Signals when the connection is released
};

}  // namespace sqlbridge
