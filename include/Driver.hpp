#pragma once

/**
 * @file Driver.hpp
 * @brief Backend-neutral driver contract.
 *
 * Application code talks to either backend through Driver and writes
 * portable '?' placeholders; each driver rewrites statements for its own
 * dialect before they reach the engine.
 */

#include "Config.hpp"
#include "ConnectionPool.hpp"
#include "Context.hpp"
#include "ErrorHandler.hpp"
#include "Value.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sqlbridge {

/**
 * @class Transaction
 * @brief A transaction pinned to one pooled connection.
 *
 * Exclusively owned by its creator until commit() or rollback(); never
 * share it across threads. Destroying an unfinished transaction rolls it
 * back. When bound to a context, a cancelled or expired context aborts the
 * in-flight statement and commit() rolls back instead of committing.
 */
class Transaction {
public:
    virtual ~Transaction() = default;

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    virtual ExecResult execute(const std::string& sql, const Params& params = {}) = 0;

    // The stream borrows the transaction's connection and must not outlive it
    virtual std::unique_ptr<RowStream> query(const std::string& sql, const Params& params = {}) = 0;

    std::optional<Row> queryOne(const std::string& sql, const Params& params = {});

    virtual void commit() = 0;
    virtual void rollback() = 0;

    virtual bool isActive() const = 0;

protected:
    Transaction() = default;
};

/**
 * @class Driver
 * @brief Capability set implemented by the SQLite and PostgreSQL drivers.
 *
 * Lifecycle: Disconnected -> connect() -> Connected -> close() -> Closed.
 * Every operation other than connect()/close() throws ConnectionError
 * outside the Connected state, and a closed driver can not be reconnected.
 * A failed connect() leaves the driver Disconnected with no pool.
 *
 * Thread Safety:
 * - All operations may be called concurrently; the pool distributes
 *   connections. Transactions and row streams are single-owner objects.
 */
class Driver {
public:
    enum class State {
        Disconnected,
        Connected,
        Closed
    };

    virtual ~Driver() = default;

    // Non-copyable
    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    // ----- Connection management -----

    virtual void connect(const DatabaseConfig& config) = 0;

    // Idempotent; closing an already closed driver is a no-op
    virtual void close() = 0;

    virtual void ping() = 0;

    // ----- Transactions -----

    virtual std::unique_ptr<Transaction> beginTransaction(ContextPtr context = nullptr) = 0;

    // ----- Statement execution (statements use portable '?' placeholders) -----

    virtual ExecResult execute(const std::string& sql, const Params& params = {}) = 0;
    virtual std::unique_ptr<RowStream> query(const std::string& sql, const Params& params = {}) = 0;

    // First row of the result, or std::nullopt when the result is empty
    virtual std::optional<Row> queryOne(const std::string& sql, const Params& params = {});

    // ----- Schema -----

    // Applies schema.<dialect>.sql (or schema.sql) from the configured schema_dir
    virtual void initializeSchema();

    // ----- Dialect -----

    // "sqlite" or "postgres"
    virtual std::string dialect() const = 0;

    // Pure and deterministic; input without placeholders comes back unchanged
    virtual std::string transformQuery(const std::string& sql) const = 0;

    virtual bool isAlreadyExists(const QueryError& error) const = 0;
    virtual bool isRetryable(const QueryError& error) const = 0;
    virtual bool supportsConcurrentWriters() const = 0;

    // ----- Catalog -----

    // Column names in table order; empty when the table does not exist
    virtual std::vector<std::string> tableColumns(const std::string& table) = 0;
    virtual std::vector<std::string> primaryKeyColumns(const std::string& table) = 0;

    // ----- Status -----

    State state() const { return m_state.load(); }
    bool isConnected() const { return m_state.load() == State::Connected; }
    virtual PoolStats poolStats() const = 0;
    const DatabaseConfig& config() const { return m_config; }

    // "name" with embedded quotes doubled; valid in both dialects
    static std::string quoteIdentifier(const std::string& identifier);

protected:
    Driver() = default;

    // Throws ConnectionError unless Connected
    void requireConnected() const;

    // Throws ConnectionError when connect() is not allowed
    void requireConnectable() const;

    DatabaseConfig m_config;
    std::atomic<State> m_state{State::Disconnected};
    mutable std::mutex m_stateMutex;
};

}  // namespace sqlbridge
