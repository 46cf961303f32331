/**
 * @file PostgreSQLDriver.cpp
 * @brief PostgreSQL implementation of the driver contract.
 */

#include "PostgreSQLDriver.hpp"
#include "SqlScanner.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace sqlbridge {

namespace {

constexpr const char* kQueryCanceled = "57014";

// Rows of a fully buffered PGresult. Keeps the lease, when there is one,
// until the rows are exhausted.
class PostgreSQLRowStream : public RowStream {
public:
    PostgreSQLRowStream(std::unique_ptr<PostgreSQLConnection> lease, PostgreSQLResultSet rs)
        : m_lease(std::move(lease))
        , m_rs(std::move(rs))
        , m_columns(std::make_shared<const std::vector<std::string>>(m_rs.getColumnNames())) {}

    bool next() override {
        if (m_index >= m_rs.numRows()) {
            m_lease.reset();
            return false;
        }

        std::vector<Value> values;
        values.reserve(m_columns->size());
        for (int col = 0; col < static_cast<int>(m_columns->size()); ++col) {
            values.push_back(m_rs.getTypedValue(m_index, col));
        }
        m_row = Row(m_columns, std::move(values));
        ++m_index;
        return true;
    }

    const Row& row() const override { return m_row; }
    const std::vector<std::string>& columns() const override { return *m_columns; }

private:
    std::unique_ptr<PostgreSQLConnection> m_lease;
    PostgreSQLResultSet m_rs;
    std::shared_ptr<const std::vector<std::string>> m_columns;
    Row m_row;
    int m_index = 0;
};

// PQcancel handle shared with the context callback. Detached when the
// transaction ends so a late cancel can not hit the next user of the
// connection.
class CancelHandle {
public:
    explicit CancelHandle(PGconn* conn) : m_cancel(PQgetCancel(conn)) {}

    ~CancelHandle() { detach(); }

    CancelHandle(const CancelHandle&) = delete;
    CancelHandle& operator=(const CancelHandle&) = delete;

    void cancel() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_cancel) return;
        char errbuf[256];
        if (!PQcancel(m_cancel, errbuf, sizeof(errbuf))) {
            spdlog::warn("PostgreSQL cancel request failed: {}", errbuf);
        }
    }

    void detach() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancel) {
            PQfreeCancel(m_cancel);
            m_cancel = nullptr;
        }
    }

private:
    std::mutex m_mutex;
    PGcancel* m_cancel;
};

class PostgreSQLTransaction : public Transaction {
public:
    PostgreSQLTransaction(std::unique_ptr<PostgreSQLConnection> lease, ContextPtr context)
        : m_lease(std::move(lease)), m_context(std::move(context)) {
        try {
            m_lease->execute("BEGIN");
        } catch (const QueryError& e) {
            m_lease->markBroken();
            m_lease.reset();
            throw ConnectionError(std::string("failed to begin PostgreSQL transaction: ") + e.what());
        }
        m_active = true;

        if (!m_context) return;

        if (auto left = m_context->remaining()) {
            // statement_timeout = 0 disables the limit
            auto ms = std::max<int64_t>(left->count(), 1);
            try {
                m_lease->execute("SET LOCAL statement_timeout = " + std::to_string(ms));
            } catch (const QueryError&) {
                rollback();
                throw;
            }
        }

        m_cancelHandle = std::make_shared<CancelHandle>(m_lease->get());
        auto handle = m_cancelHandle;
        m_cancel = std::make_unique<CancelRegistration>(m_context, [handle]() {
            handle->cancel();
        });
    }

    ~PostgreSQLTransaction() override {
        if (m_active) {
            rollback();
        }
    }

    ExecResult execute(const std::string& sql, const Params& params) override {
        checkUsable();
        try {
            auto rs = m_lease->executeParams(SqlScanner::rewritePlaceholders(sql), params);
            ExecResult result;
            result.rowsAffected = rs.affectedRows();
            return result;
        } catch (const QueryError& e) {
            translate(e);
            throw;
        }
    }

    std::unique_ptr<RowStream> query(const std::string& sql, const Params& params) override {
        checkUsable();
        try {
            auto rs = m_lease->executeParams(SqlScanner::rewritePlaceholders(sql), params);
            return std::make_unique<PostgreSQLRowStream>(nullptr, std::move(rs));
        } catch (const QueryError& e) {
            translate(e);
            throw;
        }
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

        // COMMIT on an aborted transaction silently rolls back
        if (m_lease->transactionStatus() == PQTRANS_INERROR) {
            rollback();
            throw QueryError("transaction aborted by an earlier error, rolled back", 0, "25P02");
        }

        try {
            m_lease->execute("COMMIT");
        } catch (const QueryError& e) {
            rollback();
            translate(e);
            throw;
        }
        release();
    }

    void rollback() override {
        if (!m_active) return;

        if (m_lease->transactionStatus() != PQTRANS_IDLE) {
            try {
                m_lease->execute("ROLLBACK");
            } catch (const QueryError& e) {
                spdlog::warn("PostgreSQL rollback failed, discarding connection: {}", e.what());
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

    // A statement cancelled by PQcancel or statement_timeout belongs to the context
    void translate(const QueryError& e) const {
        if (e.sqlState() == kQueryCanceled && m_context && m_context->isDone()) {
            throw ContextError(m_context->reason() + ": " + e.what());
        }
    }

    void release() {
        m_active = false;
        m_cancel.reset();
        if (m_cancelHandle) {
            m_cancelHandle->detach();
        }
        m_lease.reset();
    }

    std::unique_ptr<PostgreSQLConnection> m_lease;
    ContextPtr m_context;
    std::shared_ptr<CancelHandle> m_cancelHandle;
    std::unique_ptr<CancelRegistration> m_cancel;
    bool m_active = false;
};

}  // namespace

PostgreSQLDriver::~PostgreSQLDriver() {
    close();
}

// ============================================================================
// Connection Management
// ============================================================================

void PostgreSQLDriver::connect(const DatabaseConfig& config) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    requireConnectable();

    auto pool = std::make_shared<PostgreSQLConnectionPool>(config.connection, config.pool);
    try {
        pool->open();
    } catch (const ConnectionError&) {
        pool->drain();
        throw;
    }

    m_config = config;
    m_pool = std::move(pool);
    m_state = State::Connected;
    spdlog::info("Connected to PostgreSQL database '{}' on {}:{}",
                 config.connection.database, config.connection.host, config.connection.port);
}

void PostgreSQLDriver::close() {
    std::shared_ptr<PostgreSQLConnectionPool> pool;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_state == State::Closed) return;
        pool = std::move(m_pool);
        m_state = State::Closed;
    }
    if (pool) {
        pool->drain();
        spdlog::info("Closed PostgreSQL database '{}'", m_config.connection.database);
    }
}

void PostgreSQLDriver::ping() {
    auto conn = acquire();
    if (!conn->ping()) {
        conn->markBroken();
        throw ConnectionError(std::string("PostgreSQL ping failed: ") + conn->error());
    }
}

std::shared_ptr<PostgreSQLConnectionPool> PostgreSQLDriver::pool() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    requireConnected();
    return m_pool;
}

std::unique_ptr<PostgreSQLConnection> PostgreSQLDriver::acquire() const {
    auto p = pool();
    return p->acquire(m_config.pool.acquire_timeout);
}

// ============================================================================
// Transactions and Statements
// ============================================================================

std::unique_ptr<Transaction> PostgreSQLDriver::beginTransaction(ContextPtr context) {
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
    return std::make_unique<PostgreSQLTransaction>(std::move(lease), std::move(context));
}

ExecResult PostgreSQLDriver::execute(const std::string& sql, const Params& params) {
    auto conn = acquire();
    auto rs = conn->executeParams(transformQuery(sql), params);

    ExecResult result;
    result.rowsAffected = rs.affectedRows();
    return result;
}

std::unique_ptr<RowStream> PostgreSQLDriver::query(const std::string& sql, const Params& params) {
    auto conn = acquire();
    auto rs = conn->executeParams(transformQuery(sql), params);
    return std::make_unique<PostgreSQLRowStream>(std::move(conn), std::move(rs));
}

// ============================================================================
// Dialect
// ============================================================================

std::string PostgreSQLDriver::transformQuery(const std::string& sql) const {
    return SqlScanner::rewritePlaceholders(sql);
}

bool PostgreSQLDriver::isAlreadyExists(const QueryError& error) const {
    return ErrorHandler::postgresIsAlreadyExists(error.sqlState());
}

bool PostgreSQLDriver::isRetryable(const QueryError& error) const {
    return ErrorHandler::postgresIsRetryable(error.sqlState());
}

// ============================================================================
// Catalog
// ============================================================================

std::vector<std::string> PostgreSQLDriver::tableColumns(const std::string& table) {
    static const char* kSql =
        "SELECT column_name FROM information_schema.columns "
        "WHERE table_schema = current_schema() AND table_name = ? "
        "ORDER BY ordinal_position";

    std::vector<std::string> columns;
    auto stream = query(kSql, {table});
    while (stream->next()) {
        columns.push_back(stream->row().getString(0));
    }
    return columns;
}

std::vector<std::string> PostgreSQLDriver::primaryKeyColumns(const std::string& table) {
    // indkey order is key order; to_regclass yields NULL for a missing table
    static const char* kSql =
        "SELECT a.attname FROM pg_index i "
        "JOIN pg_attribute a ON a.attrelid = i.indrelid AND a.attnum = ANY(i.indkey) "
        "WHERE i.indrelid = to_regclass(?) AND i.indisprimary "
        "ORDER BY array_position(i.indkey::int2[], a.attnum)";

    std::vector<std::string> columns;
    auto stream = query(kSql, {quoteIdentifier(table)});
    while (stream->next()) {
        columns.push_back(stream->row().getString(0));
    }
    return columns;
}

PoolStats PostgreSQLDriver::poolStats() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_pool ? m_pool->stats() : PoolStats{};
}

}  // namespace sqlbridge
