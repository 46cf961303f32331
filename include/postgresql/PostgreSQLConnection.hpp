#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief RAII wrapper for pooled PostgreSQL database connections.
 *
 * This file provides a connection wrapper that integrates with the
 * PostgreSQLConnectionPool for automatic connection lifecycle management.
 * When a PostgreSQLConnection goes out of scope, the underlying PGconn
 * is automatically returned to the pool for reuse.
 */

#include "PostgreSQLResultSet.hpp"
#include "Value.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>

namespace sqlbridge {

// Forward declaration
class PostgreSQLConnectionPool;

/**
 * @class PostgreSQLConnection
 * @brief RAII wrapper for a PostgreSQL connection from the pool.
 *
 * This class wraps a PGconn* handle obtained from PostgreSQLConnectionPool,
 * providing automatic connection return when destroyed. The wrapper keeps
 * the pool alive through a shared pointer, so a lease may safely outlive
 * the driver that handed it out.
 *
 * PostgreSQL libpq API Usage:
 * - PQexec() for simple statements without parameters
 * - PQexecParams() for parameterized statements ($1, $2, ...)
 * - PQtransactionStatus() to detect an aborted transaction
 * - PQgetCancel() for out-of-band cancellation of a running statement
 *
 * Error Reporting:
 * - execute() and executeParams() throw QueryError carrying the SQLSTATE
 * - When the server connection itself is lost the lease is marked broken
 *   and the error carries SQLSTATE 08006 so it classifies as retryable
 *
 * Thread Safety:
 * - Individual connections should not be shared between threads
 * - The pool handles thread-safe connection distribution
 *
 * @see PostgreSQLConnectionPool for connection acquisition
 */
class PostgreSQLConnection {
public:
    /**
     * @brief Construct a connection wrapper.
     * @param pool Owning connection pool.
     * @param conn Raw PGconn* handle to wrap.
     *
     * The connection will be returned to the pool upon destruction.
     */
    PostgreSQLConnection(std::shared_ptr<PostgreSQLConnectionPool> pool, PGconn* conn);

    /**
     * @brief Destructor - returns connection to pool.
     */
    ~PostgreSQLConnection();

    // Non-copyable (connection ownership semantics)
    PostgreSQLConnection(const PostgreSQLConnection&) = delete;
    PostgreSQLConnection& operator=(const PostgreSQLConnection&) = delete;

    /**
     * @brief Get the underlying PGconn handle.
     * @return Raw PGconn* pointer (still owned by this wrapper).
     */
    PGconn* get() const { return m_conn; }

    /**
     * @brief Check if the connection is valid.
     * @return true if connection is established and not in error state.
     */
    bool isValid() const;

    /**
     * @brief Test connection by executing a simple query.
     * @return true if the server responds successfully.
     */
    bool ping();

    /**
     * @brief Execute a statement without parameters.
     * @throws QueryError with the SQLSTATE when the statement fails.
     */
    PostgreSQLResultSet execute(const std::string& sql);

    /**
     * @brief Execute a parameterized statement.
     * @param sql SQL statement with $1, $2, etc. placeholders.
     * @param params Values bound in order; blobs are sent in binary format.
     * @throws QueryError with the SQLSTATE when the statement fails.
     */
    PostgreSQLResultSet executeParams(const std::string& sql, const Params& params);

    /**
     * @brief Get the last error message.
     * @return Error message string from PQerrorMessage().
     */
    const char* error() const;

    PGTransactionStatusType transactionStatus() const;

    // The pool closes a broken connection instead of reusing it
    void markBroken() { m_broken = true; }

private:
    PostgreSQLResultSet check(PGresult* res, const std::string& sql);

    /**
     * @brief Return the connection to the pool.
     */
    void release();

    std::shared_ptr<PostgreSQLConnectionPool> m_pool;  ///< Owning connection pool
    PGconn* m_conn;                                    ///< PostgreSQL connection handle
    bool m_broken = false;                             ///< Close instead of reuse
};

}  // namespace sqlbridge
