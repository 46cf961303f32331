/**
 * @file SQLiteDriver.cpp
 * @brief SQLite implementation of the driver contract.
 */

#include "SQLiteDriver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace sqlbridge {

namespace {

bool isInterrupt(const QueryError& e) {
    return (e.nativeCode() & 0xff) == SQLITE_INTERRUPT;
}

// Rows from one prepared statement. Owns the pooled connection when the
// stream came from the driver; borrows it when it came from a transaction.
class SQLiteRowStream : public RowStream {
public:
    SQLiteRowStream(std::unique_ptr<PooledSQLiteConnection> lease, SQLiteResultSet rs,
                    ContextPtr context)
        : m_lease(std::move(lease))
        , m_rs(std::move(rs))
        , m_context(std::move(context))
        , m_columns(std::make_shared<const std::vector<std::string>>(m_rs.columnNames())) {}

    bool next() override {
        if (m_done) return false;

        bool hasRow = false;
        try {
            hasRow = m_rs.step();
        } catch (const QueryError& e) {
            finish();
            if (isInterrupt(e) && m_context && m_context->isDone()) {
                throw ContextError(m_context->reason() + ": " + e.what());
            }
            throw;
        }

        if (!hasRow) {
            finish();
            return false;
        }

        std::vector<Value> values;
        values.reserve(m_columns->size());
        for (int i = 0; i < static_cast<int>(m_columns->size()); ++i) {
            values.push_back(m_rs.getValue(i));
        }
        m_row = Row(m_columns, std::move(values));
        return true;
    }

    const Row& row() const override { return m_row; }
    const std::vector<std::string>& columns() const override { return *m_columns; }

private:
    void finish() {
        m_done = true;
        m_rs.finalize();
        m_lease.reset();
    }

    // Declared before m_rs so the statement is finalized first
    std::unique_ptr<PooledSQLiteConnection> m_lease;
    SQLiteResultSet m_rs;
    ContextPtr m_context;
    std::shared_ptr<const std::vector<std::string>> m_columns;
    Row m_row;
    bool m_done = false;
};

// Target of the context cancel callback; detached when the transaction ends
// so a late callback can not interrupt the next user of the connection.
struct InterruptTarget {
    std::mutex mutex;
    SQLiteConnection* conn = nullptr;

    void interrupt() {
        std::lock_guard<std::mutex> lock(mutex);
        if (conn) conn->interrupt();
    }

    void detach() {
        std::lock_guard<std::mutex> lock(mutex);
        conn = nullptr;
    }
};

class SQLiteTransaction : public Transaction {
public:
    SQLiteTransaction(std::unique_ptr<PooledSQLiteConnection> lease, ContextPtr context)
        : m_lease(std::move(lease)), m_context(std::move(context)) {
        if (m_context) {
            (*m_lease)->watch(m_context);
            m_target = std::make_shared<InterruptTarget>();
            m_target->conn = &**m_lease;
            auto target = m_target;
            m_cancel = std::make_unique<CancelRegistration>(m_context, [target]() {
                target->interrupt();
            });
        }

        try {
            (*m_lease)->execute("BEGIN IMMEDIATE");
        } catch (const QueryError& e) {
            release();
            throw ConnectionError(std::string("failed to begin SQLite transaction: ") + e.what());
        }
        m_active = true;
    }

    ~SQLiteTransaction() override {
        if (m_active) {
            rollback();
        }
    }

    ExecResult execute(const std::string& sql, const Params& params) override {
        checkUsable();
        try {
            auto rs = (*m_lease)->prepare(sql);
            rs.bind(params);
            rs.run();
            ExecResult result;
            result.rowsAffected = (*m_lease)->changes();
            result.lastInsertId = (*m_lease)->lastInsertRowId();
            return result;
        } catch (const QueryError& e) {
            if (isInterrupt(e) && m_context && m_context->isDone()) {
                throw ContextError(m_context->reason() + ": " + e.what());
            }
            throw;
        }
    }

    std::unique_ptr<RowStream> query(const std::string& sql, const Params& params) override {
        checkUsable();
        auto rs = (*m_lease)->prepare(sql);
        rs.bind(params);
        return std::make_unique<SQLiteRowStream>(nullptr, std::move(rs), m_context);
    }

    void commit() override {
        if (!m_active) {
            throw QueryError("transaction is no longer active");
        }
        if (m_context && m_context->isDone()) {
            std::string reason = m_context->reason();
            rollback();
            throw ContextError("commit refused, " + reason);
        }

        try {
            (*m_lease)->execute("COMMIT");
        } catch (const QueryError&) {
            rollback();
            throw;
        }
        release();
    }

    void rollback() override {
        if (!m_active) return;

        // An interrupted or failed statement may already have ended the
        // transaction; autocommit mode tells us whether one is still open
        if (!sqlite3_get_autocommit((*m_lease)->get())) {
            try {
                (*m_lease)->execute("ROLLBACK");
            } catch (const QueryError& e) {
                spdlog::warn("SQLite rollback failed, discarding connection: {}", e.what());
                m_lease->markBroken();
            }
        }
        release();
    }

    bool isActive() const override { return m_active; }

private:
    void checkUsable() const {
        if (!m_active) {
            throw QueryError("transaction is no longer active");
        }
        if (m_context && m_context->isDone()) {
            throw ContextError(m_context->reason());
        }
    }

    void release() {
        m_active = false;
        m_cancel.reset();
        if (m_target) {
            m_target->detach();
        }
        if (m_lease) {
            (*m_lease)->watch(nullptr);
            m_lease.reset();
        }
    }

    std::unique_ptr<PooledSQLiteConnection> m_lease;
    ContextPtr m_context;
    std::shared_ptr<InterruptTarget> m_target;
    std::unique_ptr<CancelRegistration> m_cancel;
    bool m_active = false;
};

}  // namespace

SQLiteDriver::~SQLiteDriver() {
    close();
}

// ============================================================================
// Connection Management
// ============================================================================

void SQLiteDriver::connect(const DatabaseConfig& config) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    requireConnectable();

    const std::string& path = config.connection.sqlite_path;
    if (path.empty()) {
        throw ConnectionError("SQLite database path is empty");
    }

    if (path != ":memory:") {
        std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw ConnectionError("failed to create database directory '" + parent.string() +
                                      "': " + ec.message());
            }
        }
    }

    auto pool = std::make_shared<SQLiteConnectionPool>(path, config.pool);
    pool->open();
    if (!pool->healthCheck()) {
        throw ConnectionError("failed to ping SQLite database '" + path + "'");
    }

    m_config = config;
    m_pool = std::move(pool);
    m_state = State::Connected;
    spdlog::info("Connected to SQLite database '{}'", path);
}

void SQLiteDriver::close() {
    std::shared_ptr<SQLiteConnectionPool> pool;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_state == State::Closed) return;
        pool = std::move(m_pool);
        m_state = State::Closed;
    }
    if (pool) {
        pool->drain();
        spdlog::info("Closed SQLite database '{}'", pool->path());
    }
}

void SQLiteDriver::ping() {
    auto lease = acquire();
    try {
        auto rs = (*lease)->prepare("SELECT 1");
        rs.step();
    } catch (const QueryError& e) {
        throw ConnectionError(std::string("SQLite ping failed: ") + e.what());
    }
}

std::shared_ptr<SQLiteConnectionPool> SQLiteDriver::pool() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    requireConnected();
    return m_pool;
}

std::unique_ptr<PooledSQLiteConnection> SQLiteDriver::acquire() const {
    auto p = pool();
    return p->acquire(m_config.pool.acquire_timeout);
}

// ============================================================================
// Transactions and Statements
// ============================================================================

std::unique_ptr<Transaction> SQLiteDriver::beginTransaction(ContextPtr context) {
    auto p = pool();
    if (context && context->isDone()) {
        throw ContextError(context->reason());
    }

    auto timeout = m_config.pool.acquire_timeout;
    if (context) {
        if (auto left = context->remaining()) {
            timeout = std::min(timeout, *left);
        }
    }

    auto lease = p->acquire(timeout);
    return std::make_unique<SQLiteTransaction>(std::move(lease), std::move(context));
}

ExecResult SQLiteDriver::execute(const std::string& sql, const Params& params) {
    auto lease = acquire();
    auto rs = (*lease)->prepare(transformQuery(sql));
    rs.bind(params);
    rs.run();

    ExecResult result;
    result.rowsAffected = (*lease)->changes();
    result.lastInsertId = (*lease)->lastInsertRowId();
    return result;
}

std::unique_ptr<RowStream> SQLiteDriver::query(const std::string& sql, const Params& params) {
    auto lease = acquire();
    auto rs = (*lease)->prepare(transformQuery(sql));
    rs.bind(params);
    return std::make_unique<SQLiteRowStream>(std::move(lease), std::move(rs), nullptr);
}

// ============================================================================
// Dialect
// ============================================================================

std::string SQLiteDriver::transformQuery(const std::string& sql) const {
    // '?' is SQLite's native placeholder
    return sql;
}

bool SQLiteDriver::isAlreadyExists(const QueryError& error) const {
    return ErrorHandler::sqliteIsAlreadyExists(error.nativeCode(), error.what());
}

bool SQLiteDriver::isRetryable(const QueryError& error) const {
    return ErrorHandler::sqliteIsRetryable(error.nativeCode());
}

// ============================================================================
// Catalog
// ============================================================================

std::vector<std::string> SQLiteDriver::tableColumns(const std::string& table) {
    std::vector<std::string> columns;
    auto lease = acquire();
    auto rs = (*lease)->prepare("PRAGMA table_info(" + quoteIdentifier(table) + ")");
    while (rs.step()) {
        columns.push_back(rs.getString(1));  // Column 1 is the column name
    }
    return columns;
}

std::vector<std::string> SQLiteDriver::primaryKeyColumns(const std::string& table) {
    std::vector<std::pair<int64_t, std::string>> keyed;
    auto lease = acquire();
    auto rs = (*lease)->prepare("PRAGMA table_info(" + quoteIdentifier(table) + ")");
    while (rs.step()) {
        int64_t pkOrdinal = rs.getInt64(5);  // Column 5 is the 1-based position in the key
        if (pkOrdinal > 0) {
            keyed.emplace_back(pkOrdinal, rs.getString(1));
        }
    }

    std::sort(keyed.begin(), keyed.end());
    std::vector<std::string> columns;
    for (auto& entry : keyed) {
        columns.push_back(std::move(entry.second));
    }
    return columns;
}

PoolStats SQLiteDriver::poolStats() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_pool ? m_pool->stats() : PoolStats{};
}

}  // namespace sqlbridge
