#pragma once

/**
 * @file SQLiteResultSet.hpp
 * @brief RAII wrapper for SQLite prepared statement results.
 *
 * This file provides a high-level interface for binding parameters to an
 * SQLite prepared statement and iterating through its results, handling
 * automatic cleanup of sqlite3_stmt resources.
 */

#include "Value.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace sqlbridge {

/**
 * @class SQLiteResultSet
 * @brief RAII wrapper for SQLite prepared statement results.
 *
 * SQLiteResultSet manages a sqlite3_stmt handle, providing methods to
 * bind parameters, step through rows and access column values. The
 * statement is automatically finalized when the wrapper is destroyed.
 *
 * SQLite Result Iteration:
 * Unlike PostgreSQL which separates query execution from result retrieval,
 * SQLite uses step() to both execute and fetch rows. Each call to step()
 * advances to the next row (or completes the statement for DML).
 *
 * Usage:
 * @code
 *   auto result = conn.prepare("SELECT id, name FROM employees WHERE dept = ?");
 *   result.bind({std::string("sales")});
 *   while (result.step()) {
 *       int64_t id = result.getInt64(0);
 *       std::string name = result.getString(1);
 *       // Process row...
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; each thread should have its own result set.
 */
class SQLiteResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param stmt sqlite3_stmt handle to manage (takes ownership), or nullptr.
     */
    explicit SQLiteResultSet(sqlite3_stmt* stmt = nullptr);

    /**
     * @brief Destructor - finalizes the statement if still owned.
     */
    ~SQLiteResultSet();

    // Non-copyable
    SQLiteResultSet(const SQLiteResultSet&) = delete;
    SQLiteResultSet& operator=(const SQLiteResultSet&) = delete;

    // Movable
    SQLiteResultSet(SQLiteResultSet&& other) noexcept;
    SQLiteResultSet& operator=(SQLiteResultSet&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3_stmt handle.
     * @return Raw sqlite3_stmt* pointer (still owned by this object).
     */
    sqlite3_stmt* get() const { return m_stmt; }

    /**
     * @brief Boolean conversion - true if statement is valid.
     */
    explicit operator bool() const { return m_stmt != nullptr; }

    /**
     * @brief Bind positional parameters (1-based in SQLite, 0-based here).
     * @param params Values to bind, in placeholder order.
     * @throws QueryError if the count does not match or binding fails.
     */
    void bind(const Params& params);

    /**
     * @brief Step to the next row.
     * @return true if a row is available, false when the statement is done.
     * @throws QueryError on any result other than SQLITE_ROW/SQLITE_DONE.
     */
    bool step();

    /**
     * @brief Run the statement to completion, discarding rows.
     */
    void run();

    /**
     * @brief Get the number of columns in the result.
     */
    int columnCount() const;

    /**
     * @brief Get a column name by index.
     */
    std::string columnName(int index) const;

    /**
     * @brief All column names, in result order.
     */
    std::vector<std::string> columnNames() const;

    /**
     * @brief Get a column value as a string.
     * @return String value, or empty string if NULL.
     *
     * SQLite's dynamic typing means any column can be retrieved as text.
     */
    std::string getString(int index) const;

    /**
     * @brief Get a column value as a 64-bit integer.
     * @return Integer value, or 0 if NULL or non-numeric.
     */
    int64_t getInt64(int index) const;

    /**
     * @brief Get a column value using its storage class.
     * @return Value holding null, integer, real, text or blob.
     */
    Value getValue(int index) const;

    /**
     * @brief Check if a column value is NULL.
     */
    bool isNull(int index) const;

    /**
     * @brief Finalize the statement and release resources.
     *
     * After calling finalize(), the statement cannot be used.
     * This is called automatically by the destructor.
     */
    void finalize();

private:
    sqlite3_stmt* m_stmt;  ///< SQLite prepared statement handle (owned)
};

}  // namespace sqlbridge
