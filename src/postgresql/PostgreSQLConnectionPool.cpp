/**
 * @file PostgreSQLConnectionPool.cpp
 * @brief Implementation of thread-safe PostgreSQL connection pool.
 *
 * Implements the PostgreSQLConnectionPool class which manages a pool of PostgreSQL
 * connections for efficient reuse across concurrent operations. Uses libpq
 * connection strings for configuration and supports SSL connections.
 */

#include "PostgreSQLConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace sqlbridge {

namespace {

// libpq rule: single quotes around the value, backslash before ' and \.
std::string quoteConnValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

PostgreSQLConnectionPool::PostgreSQLConnectionPool(const ConnectionConfig& config, const PoolConfig& pool)
    : m_config(config), m_poolConfig(pool) {
    if (m_poolConfig.max_open == 0) {
        m_poolConfig.max_open = 1;
    }
    m_poolConfig.max_idle = std::min(m_poolConfig.max_idle, m_poolConfig.max_open);
}

PostgreSQLConnectionPool::~PostgreSQLConnectionPool() {
    drain();
}

void PostgreSQLConnectionPool::open() {
    auto conn = acquire(m_poolConfig.acquire_timeout);
    if (!conn->ping()) {
        conn->markBroken();
        throw ConnectionError("PostgreSQL connection to " + describe(m_config) +
                              " failed validation: " + conn->error());
    }
    spdlog::info("PostgreSQL connection pool opened ({}, max_open={}, max_idle={})",
                 describe(m_config), m_poolConfig.max_open, m_poolConfig.max_idle);
}

// ============================================================================
// Connection Creation and Validation
// ============================================================================

std::string PostgreSQLConnectionPool::buildConnectionString(const ConnectionConfig& config) {
    std::ostringstream connInfo;

    connInfo << "host=" << quoteConnValue(config.host);
    connInfo << " port=" << config.port;

    if (!config.user.empty()) {
        connInfo << " user=" << quoteConnValue(config.user);
    }

    if (!config.password.empty()) {
        connInfo << " password=" << quoteConnValue(config.password);
    }

    if (!config.database.empty()) {
        connInfo << " dbname=" << quoteConnValue(config.database);
    }

    if (!config.ssl_mode.empty()) {
        connInfo << " sslmode=" << quoteConnValue(config.ssl_mode);
    }

    // Timeout in whole seconds, rounded up; 0 would wait forever
    auto ms = config.connect_timeout.count();
    if (ms > 0) {
        connInfo << " connect_timeout=" << (ms + 999) / 1000;
    }

    // Application name for identification
    if (!config.application_name.empty()) {
        connInfo << " application_name=" << quoteConnValue(config.application_name);
    }

    return connInfo.str();
}

std::string PostgreSQLConnectionPool::describe(const ConnectionConfig& config) {
    ConnectionConfig masked = config;
    if (!masked.password.empty()) {
        masked.password = "****";
    }
    return buildConnectionString(masked);
}

PGconn* PostgreSQLConnectionPool::createConnection() {
    PGconn* conn = PQconnectdb(buildConnectionString(m_config).c_str());

    if (!conn) {
        throw ConnectionError("Failed to allocate PostgreSQL connection");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string errorMsg = PQerrorMessage(conn);
        while (!errorMsg.empty() && errorMsg.back() == '\n') errorMsg.pop_back();
        PQfinish(conn);
        throw ConnectionError("Failed to connect to PostgreSQL (" + describe(m_config) + "): " + errorMsg);
    }

    // Set client encoding to UTF-8
    PQsetClientEncoding(conn, "UTF8");

    return conn;
}

void PostgreSQLConnectionPool::destroyConnection(PGconn* conn) {
    if (conn) {
        PQfinish(conn);
    }
}

bool PostgreSQLConnectionPool::validateConnection(PGconn* conn) {
    if (!conn) return false;

    // Check connection status
    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::debug("PostgreSQL connection validation failed: bad status");
        return false;
    }

    // A connection left inside a transaction is not safe to hand out
    if (PQtransactionStatus(conn) != PQTRANS_IDLE) {
        spdlog::debug("PostgreSQL connection validation failed: transaction still open");
        return false;
    }

    return true;
}

bool PostgreSQLConnectionPool::expired(PGconn* conn) const {
    if (m_poolConfig.max_lifetime.count() <= 0) return false;
    auto it = m_openedAt.find(conn);
    if (it == m_openedAt.end()) return false;
    return std::chrono::steady_clock::now() - it->second >= m_poolConfig.max_lifetime;
}

// ============================================================================
// Connection Acquisition
// ============================================================================

std::unique_ptr<PostgreSQLConnection> PostgreSQLConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    ++m_waitingCount;

    while (true) {
        if (m_shutdown) {
            --m_waitingCount;
            throw ConnectionError("PostgreSQL connection pool is closed");
        }

        while (!m_available.empty()) {
            PGconn* conn = m_available.front();
            m_available.pop_front();
            if (expired(conn) || !validateConnection(conn)) {
                spdlog::debug("Recycling PostgreSQL connection");
                m_openedAt.erase(conn);
                destroyConnection(conn);
                continue;
            }
            --m_waitingCount;
            return std::make_unique<PostgreSQLConnection>(shared_from_this(), conn);
        }

        // Try to create a new connection if under limit
        if (m_openedAt.size() + m_pendingCount < m_poolConfig.max_open) {
            ++m_pendingCount;
            --m_waitingCount;
            lock.unlock();

            PGconn* conn = nullptr;
            try {
                conn = createConnection();
            } catch (const ConnectionError& e) {
                spdlog::error("{}", e.what());
                lock.lock();
                --m_pendingCount;
                m_cv.notify_one();
                throw;
            }

            lock.lock();
            --m_pendingCount;
            m_openedAt[conn] = std::chrono::steady_clock::now();
            spdlog::debug("Created new PostgreSQL connection (total: {})", m_openedAt.size());
            return std::make_unique<PostgreSQLConnection>(shared_from_this(), conn);
        }

        // Wait for a connection to be released
        if (m_cv.wait_until(lock, deadline) == std::cv_status::timeout &&
            m_available.empty() && !m_shutdown &&
            m_openedAt.size() + m_pendingCount >= m_poolConfig.max_open) {
            --m_waitingCount;
            throw ConnectionError("timed out after " + std::to_string(timeout.count()) +
                                  "ms waiting for a PostgreSQL connection");
        }
    }
}

// ============================================================================
// Connection Release
// ============================================================================

void PostgreSQLConnectionPool::releaseConnection(PGconn* conn, bool broken) {
    if (!conn) return;

    bool close = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown || broken || expired(conn) || !validateConnection(conn) ||
            m_available.size() >= m_poolConfig.max_idle) {
            m_openedAt.erase(conn);
            close = true;
        } else {
            m_available.push_back(conn);
        }
    }

    // Close outside the lock; PQfinish talks to the server
    if (close) {
        destroyConnection(conn);
    }
    m_cv.notify_one();
}

// ============================================================================
// Pool Statistics and Management
// ============================================================================

PoolStats PostgreSQLConnectionPool::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    PoolStats s;
    s.open = m_openedAt.size();
    s.idle = m_available.size();
    s.inUse = m_openedAt.size() - m_available.size();
    s.waiting = m_waitingCount;
    s.maxOpen = m_poolConfig.max_open;
    return s;
}

bool PostgreSQLConnectionPool::healthCheck() {
    try {
        auto conn = acquire(m_poolConfig.acquire_timeout);
        return conn->ping();
    } catch (const DatabaseError& e) {
        spdlog::warn("PostgreSQL health check failed: {}", e.what());
        return false;
    }
}

void PostgreSQLConnectionPool::drain() {
    std::deque<PGconn*> closing;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) return;
        m_shutdown = true;
        closing.swap(m_available);
        for (PGconn* conn : closing) {
            m_openedAt.erase(conn);
        }
    }
    m_cv.notify_all();

    for (PGconn* conn : closing) {
        destroyConnection(conn);
    }
    spdlog::info("PostgreSQL connection pool drained");
}

}  // namespace sqlbridge
