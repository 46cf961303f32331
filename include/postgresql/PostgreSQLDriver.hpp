#pragma once

/**
 * @file PostgreSQLDriver.hpp
 * @brief Driver implementation for PostgreSQL servers.
 */

#include "Driver.hpp"
#include "PostgreSQLConnectionPool.hpp"
#include <memory>

namespace sqlbridge {

/**
 * @class PostgreSQLDriver
 * @brief Driver backed by a pool of libpq connections to one database.
 *
 * Statements are written with portable '?' placeholders and rewritten to
 * $1, $2, ... by transformQuery(). Parameters travel as text (blobs in
 * binary bytea format) and result columns are decoded by type OID, see
 * PostgreSQLResultSet.
 *
 * Context-bound transactions set a transaction-local statement_timeout
 * from the context deadline and cancel the running statement with
 * PQcancel when the context is cancelled.
 */
class PostgreSQLDriver : public Driver {
public:
    PostgreSQLDriver() = default;
    ~PostgreSQLDriver() override;

    void connect(const DatabaseConfig& config) override;
    void close() override;
    void ping() override;

    std::unique_ptr<Transaction> beginTransaction(ContextPtr context = nullptr) override;

    ExecResult execute(const std::string& sql, const Params& params = {}) override;
    std::unique_ptr<RowStream> query(const std::string& sql, const Params& params = {}) override;

    std::string dialect() const override { return "postgres"; }
    std::string transformQuery(const std::string& sql) const override;

    bool isAlreadyExists(const QueryError& error) const override;
    bool isRetryable(const QueryError& error) const override;
    bool supportsConcurrentWriters() const override { return true; }

    std::vector<std::string> tableColumns(const std::string& table) override;
    std::vector<std::string> primaryKeyColumns(const std::string& table) override;

    PoolStats poolStats() const override;

private:
    std::shared_ptr<PostgreSQLConnectionPool> pool() const;
    std::unique_ptr<PostgreSQLConnection> acquire() const;

    std::shared_ptr<PostgreSQLConnectionPool> m_pool;
};

}  // namespace sqlbridge
