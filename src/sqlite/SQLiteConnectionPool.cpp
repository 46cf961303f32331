/**
 * @file SQLiteConnectionPool.cpp
 * @brief Implementation of the single-writer SQLite connection pool.
 *
 * The pool never holds more than one open connection. Callers queue on a
 * condition variable until the lease on that connection is returned.
 */

#include "SQLiteConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace sqlbridge {

// ============================================================================
// Lease
// ============================================================================

PooledSQLiteConnection::PooledSQLiteConnection(std::shared_ptr<SQLiteConnectionPool> pool,
                                               std::unique_ptr<SQLiteConnection> conn)
    : m_pool(std::move(pool)), m_conn(std::move(conn)) {}

PooledSQLiteConnection::~PooledSQLiteConnection() {
    if (m_pool && m_conn) {
        m_pool->release(std::move(m_conn), m_broken);
    }
}

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnectionPool::SQLiteConnectionPool(const std::string& dbPath, const PoolConfig& config)
    : m_dbPath(dbPath), m_config(config) {
    if (m_config.max_open != kMaxConnections) {
        spdlog::info("SQLite supports a single writer; pool for '{}' capped at {} connection "
                     "(configured max_open={})", dbPath, kMaxConnections, m_config.max_open);
    }
    m_config.max_open = kMaxConnections;
    m_config.max_idle = std::min(m_config.max_idle, kMaxConnections);
}

SQLiteConnectionPool::~SQLiteConnectionPool() {
    drain();
}

void SQLiteConnectionPool::open() {
    auto lease = acquire(m_config.acquire_timeout);
    spdlog::info("SQLite connection pool opened for '{}'", m_dbPath);
}

// ============================================================================
// Connection Acquisition and Release
// ============================================================================

std::unique_ptr<PooledSQLiteConnection> SQLiteConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    ++m_waitingCount;

    while (true) {
        if (m_shutdown) {
            --m_waitingCount;
            throw ConnectionError("SQLite connection pool for '" + m_dbPath + "' is closed");
        }

        if (!m_available.empty()) {
            auto conn = std::move(m_available.back());
            m_available.pop_back();
            if (expired(*conn)) {
                spdlog::debug("Recycling SQLite connection past max lifetime");
                conn.reset();
                --m_openCount;
                continue;
            }
            --m_waitingCount;
            return std::make_unique<PooledSQLiteConnection>(shared_from_this(), std::move(conn));
        }

        if (m_openCount < m_config.max_open) {
            ++m_openCount;
            --m_waitingCount;
            lock.unlock();
            try {
                auto conn = std::make_unique<SQLiteConnection>(m_dbPath);
                return std::make_unique<PooledSQLiteConnection>(shared_from_this(), std::move(conn));
            } catch (const ConnectionError&) {
                lock.lock();
                --m_openCount;
                m_cv.notify_one();
                throw;
            }
        }

        if (m_cv.wait_until(lock, deadline) == std::cv_status::timeout &&
            m_available.empty() && m_openCount >= m_config.max_open && !m_shutdown) {
            --m_waitingCount;
            throw ConnectionError("timed out after " + std::to_string(timeout.count()) +
                                  "ms waiting for the SQLite connection");
        }
    }
}

void SQLiteConnectionPool::release(std::unique_ptr<SQLiteConnection> conn, bool broken) {
    if (!conn) return;

    std::unique_ptr<SQLiteConnection> doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown || broken || !conn->isValid() || expired(*conn) ||
            m_available.size() >= m_config.max_idle) {
            // Close outside the lock
            doomed = std::move(conn);
            --m_openCount;
        } else {
            m_available.push_back(std::move(conn));
        }
    }
    m_cv.notify_one();
}

bool SQLiteConnectionPool::expired(const SQLiteConnection& conn) const {
    if (m_config.max_lifetime.count() <= 0) return false;
    return std::chrono::steady_clock::now() - conn.openedAt() >= m_config.max_lifetime;
}

// ============================================================================
// Pool Statistics and Management
// ============================================================================

bool SQLiteConnectionPool::healthCheck() {
    try {
        auto lease = acquire(m_config.acquire_timeout);
        auto rs = (*lease)->prepare("SELECT 1");
        return rs.step();
    } catch (const DatabaseError& e) {
        spdlog::warn("SQLite health check failed: {}", e.what());
        return false;
    }
}

void SQLiteConnectionPool::drain() {
    std::vector<std::unique_ptr<SQLiteConnection>> closing;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) return;
        m_shutdown = true;
        closing.swap(m_available);
        m_openCount -= closing.size();
    }
    m_cv.notify_all();
    closing.clear();
    spdlog::info("SQLite connection pool drained");
}

PoolStats SQLiteConnectionPool::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    PoolStats s;
    s.open = m_openCount;
    s.idle = m_available.size();
    s.inUse = m_openCount - m_available.size();
    s.waiting = m_waitingCount;
    s.maxOpen = m_config.max_open;
    return s;
}

}  // namespace sqlbridge
