/**
 * @file SQLiteResultSet.cpp
 * @brief Implementation of RAII SQLite result set wrapper.
 *
 * Implements the SQLiteResultSet class which provides a safe wrapper around
 * sqlite3_stmt prepared statement handles with automatic finalization.
 * Uses the step() iteration pattern to retrieve rows one at a time.
 */

#include "SQLiteResultSet.hpp"
#include "ErrorHandler.hpp"

namespace sqlbridge {

namespace {

[[noreturn]] void throwStatementError(sqlite3_stmt* stmt, const std::string& what) {
    sqlite3* db = sqlite3_db_handle(stmt);
    throw QueryError(what + ": " + sqlite3_errmsg(db), sqlite3_extended_errcode(db));
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteResultSet::SQLiteResultSet(sqlite3_stmt* stmt) : m_stmt(stmt) {}

SQLiteResultSet::~SQLiteResultSet() {
    finalize();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteResultSet::SQLiteResultSet(SQLiteResultSet&& other) noexcept
    : m_stmt(other.m_stmt) {
    other.m_stmt = nullptr;
}

SQLiteResultSet& SQLiteResultSet::operator=(SQLiteResultSet&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = other.m_stmt;
        other.m_stmt = nullptr;
    }
    return *this;
}

// ============================================================================
// Parameter Binding
// ============================================================================

void SQLiteResultSet::bind(const Params& params) {
    if (!m_stmt) {
        throw QueryError("bind on a finalized statement");
    }

    int expected = sqlite3_bind_parameter_count(m_stmt);
    if (expected != static_cast<int>(params.size())) {
        throw QueryError("statement expects " + std::to_string(expected) +
                         " parameter(s), got " + std::to_string(params.size()),
                         SQLITE_RANGE);
    }

    for (size_t i = 0; i < params.size(); ++i) {
        const int pos = static_cast<int>(i) + 1;
        const Value& v = params[i];
        int rc = SQLITE_OK;

        if (std::holds_alternative<std::nullptr_t>(v)) {
            rc = sqlite3_bind_null(m_stmt, pos);
        } else if (auto iv = std::get_if<int64_t>(&v)) {
            rc = sqlite3_bind_int64(m_stmt, pos, *iv);
        } else if (auto dv = std::get_if<double>(&v)) {
            rc = sqlite3_bind_double(m_stmt, pos, *dv);
        } else if (auto sv = std::get_if<std::string>(&v)) {
            rc = sqlite3_bind_text64(m_stmt, pos, sv->data(), sv->size(),
                                     SQLITE_TRANSIENT, SQLITE_UTF8);
        } else if (auto bv = std::get_if<Blob>(&v)) {
            // A null data pointer would bind SQL NULL instead of an empty blob
            rc = bv->empty() ? sqlite3_bind_zeroblob(m_stmt, pos, 0)
                             : sqlite3_bind_blob64(m_stmt, pos, bv->data(), bv->size(), SQLITE_TRANSIENT);
        }

        if (rc != SQLITE_OK) {
            throwStatementError(m_stmt, "bind parameter " + std::to_string(pos) + " failed");
        }
    }
}

// ============================================================================
// Row Iteration
// ============================================================================

bool SQLiteResultSet::step() {
    if (!m_stmt) return false;

    // SQLITE_ROW indicates a row is available; SQLITE_DONE means no more rows
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throwStatementError(m_stmt, "step failed");
}

void SQLiteResultSet::run() {
    while (step()) {
    }
}

// ============================================================================
// Column Access
// ============================================================================

int SQLiteResultSet::columnCount() const {
    return m_stmt ? sqlite3_column_count(m_stmt) : 0;
}

std::string SQLiteResultSet::columnName(int index) const {
    if (!m_stmt) return "";
    const char* name = sqlite3_column_name(m_stmt, index);
    return name ? name : "";
}

std::vector<std::string> SQLiteResultSet::columnNames() const {
    std::vector<std::string> names;
    int count = columnCount();
    names.reserve(count);
    for (int i = 0; i < count; ++i) {
        names.push_back(columnName(i));
    }
    return names;
}

std::string SQLiteResultSet::getString(int index) const {
    if (!m_stmt || isNull(index)) return "";
    const unsigned char* text = sqlite3_column_text(m_stmt, index);
    return text ? reinterpret_cast<const char*>(text) : "";
}

int64_t SQLiteResultSet::getInt64(int index) const {
    if (!m_stmt) return 0;
    return sqlite3_column_int64(m_stmt, index);
}

Value SQLiteResultSet::getValue(int index) const {
    if (!m_stmt) return nullptr;

    switch (sqlite3_column_type(m_stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(m_stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(m_stmt, index);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, index));
            int len = sqlite3_column_bytes(m_stmt, index);
            return std::string(text ? text : "", static_cast<size_t>(len));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(m_stmt, index));
            int len = sqlite3_column_bytes(m_stmt, index);
            return data ? Blob(data, data + len) : Blob();
        }
        default:
            return nullptr;
    }
}

bool SQLiteResultSet::isNull(int index) const {
    if (!m_stmt) return true;
    return sqlite3_column_type(m_stmt, index) == SQLITE_NULL;
}

// ============================================================================
// Statement Management
// ============================================================================

void SQLiteResultSet::finalize() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

}  // namespace sqlbridge
