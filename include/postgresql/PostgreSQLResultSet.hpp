#pragma once

/**
 * @file PostgreSQLResultSet.hpp
 * @brief RAII wrapper for PostgreSQL query results.
 *
 * This file provides a high-level interface for working with PostgreSQL
 * query results (PGresult*), handling automatic cleanup and decoding
 * column values into backend-neutral Values by type OID.
 */

#include "Value.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>
#include <cstdint>

namespace sqlbridge {

/**
 * @class PostgreSQLResultSet
 * @brief RAII wrapper for PostgreSQL query results.
 *
 * PostgreSQLResultSet manages a PGresult* handle, providing methods to
 * access row/column data and metadata. The result is automatically
 * cleared (PQclear) when the wrapper is destroyed.
 *
 * PostgreSQL loads the entire result into memory at once; rows are
 * accessed directly with getValue(row, col) or getTypedValue(row, col).
 *
 * Result Status:
 * - PGRES_TUPLES_OK: SELECT query with data
 * - PGRES_COMMAND_OK: DML/DDL completed successfully
 * - PGRES_EMPTY_QUERY: Empty query string
 * - PGRES_FATAL_ERROR: Error occurred
 *
 * Value decoding (text result format):
 * - int2/int4/int8 -> int64_t
 * - float4/float8 -> double
 * - bool -> int64_t 0/1 (SQLite has no boolean storage class)
 * - bytea -> Blob
 * - everything else (numeric included, to keep precision) -> std::string
 *
 * Thread Safety:
 * - Not thread-safe; each thread should have its own result set.
 */
class PostgreSQLResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param res PGresult handle to manage (takes ownership), or nullptr.
     */
    explicit PostgreSQLResultSet(PGresult* res = nullptr);

    /**
     * @brief Destructor - clears the result if still owned.
     */
    ~PostgreSQLResultSet();

    // Non-copyable
    PostgreSQLResultSet(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet& operator=(const PostgreSQLResultSet&) = delete;

    // Movable
    PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept;
    PostgreSQLResultSet& operator=(PostgreSQLResultSet&& other) noexcept;

    PGresult* get() const { return m_res; }

    /**
     * @brief Check if the command succeeded.
     * @return true for PGRES_COMMAND_OK or PGRES_TUPLES_OK.
     */
    bool isOk() const;

    /**
     * @brief Check if the result carries rows.
     */
    bool hasData() const;

    const char* errorMessage() const;

    /**
     * @brief SQLSTATE of a failed command (e.g. "42P07"), empty if none.
     */
    std::string sqlState() const;

    /**
     * @brief Throw a QueryError (with SQLSTATE) unless isOk().
     * @param fallback Message used when there is no result at all.
     */
    void throwIfError(const std::string& fallback) const;

    int numFields() const;
    int numRows() const;

    /**
     * @brief Rows affected by INSERT/UPDATE/DELETE (PQcmdTuples).
     */
    int64_t affectedRows() const;

    const char* getValue(int row, int col) const;

    /**
     * @brief Decode a cell into a Value according to its column type.
     */
    Value getTypedValue(int row, int col) const;

    Oid fieldType(int col) const;
    std::vector<std::string> getColumnNames() const;

private:
    PGresult* m_res;     ///< PostgreSQL result handle (owned)
};

}  // namespace sqlbridge
