/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of RAII SQLite connection wrapper.
 *
 * Implements the SQLiteConnection class which provides a safe wrapper around
 * sqlite3 database handles with automatic resource management.
 */

#include "SQLiteConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlbridge {

namespace {

int progressCallback(void* arg) {
    // Non-zero aborts the running statement with SQLITE_INTERRUPT
    auto* context = static_cast<Context*>(arg);
    return context->isDone() ? 1 : 0;
}

// Virtual machine instructions between progress callbacks
constexpr int kProgressInterval = 1000;

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath, std::chrono::milliseconds busyTimeout)
    : m_path(dbPath), m_openedAt(std::chrono::steady_clock::now()) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        throw ConnectionError("failed to open SQLite database '" + dbPath + "': " + message);
    }

    sqlite3_extended_result_codes(m_db, 1);
    sqlite3_busy_timeout(m_db, static_cast<int>(busyTimeout.count()));

    try {
        // journal_mode returns the resulting mode as a row
        auto rs = prepare("PRAGMA journal_mode = WAL");
        std::string mode = rs.step() ? rs.getString(0) : "";
        if (mode != "wal") {
            spdlog::warn("SQLite database '{}' is using journal mode '{}' instead of WAL",
                         dbPath, mode);
        }
        execute("PRAGMA foreign_keys = ON");
    } catch (const QueryError& e) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw ConnectionError("failed to configure SQLite database '" + dbPath + "': " + e.what());
    }
}

SQLiteConnection::~SQLiteConnection() {
    // Close database handle if open
    if (m_db) {
        sqlite3_close_v2(m_db);
    }
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : m_db(other.m_db), m_path(std::move(other.m_path)), m_openedAt(other.m_openedAt) {
    other.m_db = nullptr;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        if (m_db) {
            sqlite3_close_v2(m_db);
        }
        m_db = other.m_db;
        m_path = std::move(other.m_path);
        m_openedAt = other.m_openedAt;
        other.m_db = nullptr;
    }
    return *this;
}

// ============================================================================
// Query Execution
// ============================================================================

void SQLiteConnection::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : sqlite3_errstr(rc);
        if (errMsg) sqlite3_free(errMsg);
        spdlog::debug("SQLite exec failed: {}", message);
        throw QueryError(message, extendedErrorCode());
    }
}

SQLiteResultSet SQLiteConnection::prepare(const std::string& sql) {
    // Compile SQL into a prepared statement for execution
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::debug("SQLite prepare failed: {}", sqlite3_errmsg(m_db));
        throwError("prepare failed");
    }
    return SQLiteResultSet(stmt);
}

// ============================================================================
// Cancellation
// ============================================================================

void SQLiteConnection::watch(const ContextPtr& context) {
    if (!m_db) return;
    if (context) {
        sqlite3_progress_handler(m_db, kProgressInterval, progressCallback, context.get());
    } else {
        sqlite3_progress_handler(m_db, 0, nullptr, nullptr);
    }
}

void SQLiteConnection::interrupt() {
    if (m_db) {
        sqlite3_interrupt(m_db);
    }
}

// ============================================================================
// Error and Status Information
// ============================================================================

void SQLiteConnection::throwError(const std::string& what) const {
    throw QueryError(what + ": " + error(), extendedErrorCode());
}

const char* SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::extendedErrorCode() const {
    return m_db ? sqlite3_extended_errcode(m_db) : SQLITE_ERROR;
}

int64_t SQLiteConnection::lastInsertRowId() const {
    return m_db ? sqlite3_last_insert_rowid(m_db) : 0;
}

int SQLiteConnection::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

}  // namespace sqlbridge
