#pragma once

/**
 * @file SQLiteDriver.hpp
 * @brief Driver implementation for the embedded SQLite engine.
 */

#include "Driver.hpp"
#include "SQLiteConnectionPool.hpp"
#include <memory>

namespace sqlbridge {

/**
 * @class SQLiteDriver
 * @brief Driver backed by one SQLite database file.
 *
 * connect() creates the parent directory of the database file when it is
 * missing, then opens a single-connection pool in WAL mode with foreign
 * keys enforced. Portable '?' placeholders are native to SQLite, so
 * transformQuery() is the identity.
 *
 * Transactions start with BEGIN IMMEDIATE so the write lock is taken up
 * front; since the pool has one connection, other callers wait in acquire()
 * until the transaction ends.
 */
class SQLiteDriver : public Driver {
public:
    SQLiteDriver() = default;
    ~SQLiteDriver() override;

    void connect(const DatabaseConfig& config) override;
    void close() override;
    void ping() override;

    std::unique_ptr<Transaction> beginTransaction(ContextPtr context = nullptr) override;

    ExecResult execute(const std::string& sql, const Params& params = {}) override;
    std::unique_ptr<RowStream> query(const std::string& sql, const Params& params = {}) override;

    std::string dialect() const override { return "sqlite"; }
    std::string transformQuery(const std::string& sql) const override;

    bool isAlreadyExists(const QueryError& error) const override;
    bool isRetryable(const QueryError& error) const override;
    bool supportsConcurrentWriters() const override { return false; }

    std::vector<std::string> tableColumns(const std::string& table) override;
    std::vector<std::string> primaryKeyColumns(const std::string& table) override;

    PoolStats poolStats() const override;

private:
    std::shared_ptr<SQLiteConnectionPool> pool() const;
    std::unique_ptr<PooledSQLiteConnection> acquire() const;

    std::shared_ptr<SQLiteConnectionPool> m_pool;
};

}  // namespace sqlbridge
