#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for an SQLite database connection.
 *
 * This class provides a safe wrapper for SQLite database connections,
 * handling automatic cleanup when the connection goes out of scope.
 * Every connection is configured for write-ahead journaling and
 * foreign-key enforcement as soon as it is opened.
 */

#include "Context.hpp"
#include "SQLiteResultSet.hpp"
#include <sqlite3.h>
#include <chrono>
#include <string>
#include <cstdint>

namespace sqlbridge {

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite database file connection.
 *
 * SQLiteConnection manages a connection to an SQLite database file.
 * The connection is automatically closed when the object is destroyed.
 *
 * Connection setup:
 * - PRAGMA journal_mode = WAL (readers never block the single writer)
 * - PRAGMA foreign_keys = ON
 * - busy timeout so a locked database is waited on, not failed immediately
 *
 * Usage:
 * @code
 *   SQLiteConnection conn("/path/to/database.db");
 *   conn.execute("CREATE TABLE IF NOT EXISTS test (id INTEGER)");
 *   auto rs = conn.prepare("SELECT * FROM test WHERE id = ?");
 *   rs.bind({int64_t{1}});
 *   while (rs.step()) {
 *       // Use row...
 *   }
 * @endcode
 *
 * Thread Safety:
 * - SQLite supports multiple concurrent readers but only one writer
 * - Connections are opened with SQLITE_OPEN_FULLMUTEX for serialized mode,
 *   which also makes interrupt() safe to call from another thread
 */
class SQLiteConnection {
public:
    /**
     * @brief Open a connection to an SQLite database file.
     * @param dbPath Path to the SQLite database file.
     * @param busyTimeout How long to wait on a locked database.
     * @throws ConnectionError if the file can not be opened or configured.
     *
     * Creates the database file if it doesn't exist.
     */
    explicit SQLiteConnection(const std::string& dbPath,
                              std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(5000));

    /**
     * @brief Destructor - closes the database connection.
     */
    ~SQLiteConnection();

    // Non-copyable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Movable
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3 handle.
     * @return Raw sqlite3* pointer (still owned by this object).
     */
    sqlite3* get() const { return m_db; }

    /**
     * @brief Check if the connection is valid and open.
     */
    bool isValid() const { return m_db != nullptr; }

    /**
     * @brief Execute one or more SQL statements without parameters.
     * @param sql The SQL text to execute.
     * @throws QueryError carrying the SQLite result code.
     *
     * Use this for BEGIN/COMMIT/PRAGMA and other parameterless statements.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepare a single SQL statement.
     * @param sql The SQL statement to prepare.
     * @return Result set owning the prepared statement.
     * @throws QueryError if the statement does not compile.
     */
    SQLiteResultSet prepare(const std::string& sql);

    /**
     * @brief Abort long-running statements when the context is done.
     * @param context Context to poll, or nullptr to remove the handler.
     *
     * Installs an SQLite progress handler; an aborted statement fails with
     * SQLITE_INTERRUPT. The context must outlive the installation.
     */
    void watch(const ContextPtr& context);

    /**
     * @brief Interrupt the statement currently running on this connection.
     *
     * Safe to call from any thread.
     */
    void interrupt();

    /**
     * @brief Throw the current connection error as a QueryError.
     * @param what Operation description used as message prefix.
     */
    [[noreturn]] void throwError(const std::string& what) const;

    const char* error() const;
    int extendedErrorCode() const;
    int64_t lastInsertRowId() const;
    int changes() const;

    const std::string& path() const { return m_path; }

    /**
     * @brief Time the connection was opened; used for lifetime recycling.
     */
    std::chrono::steady_clock::time_point openedAt() const { return m_openedAt; }

private:
    sqlite3* m_db = nullptr;  ///< SQLite database handle
    std::string m_path;       ///< Path to database file
    std::chrono::steady_clock::time_point m_openedAt;
};

}  // namespace sqlbridge
