#include "ErrorHandler.hpp"
#include <sqlite3.h>
#include <utility>

namespace sqlbridge {

thread_local std::string ErrorContext::s_currentContext;

QueryError::QueryError(const std::string& message, int nativeCode, std::string sqlState)
    : DatabaseError(message)
    , m_nativeCode(nativeCode)
    , m_sqlState(std::move(sqlState)) {
}

ContextError::ContextError(const std::string& message)
    : QueryError(message) {
}

SchemaError::SchemaError(const std::string& message, long statementIndex, std::string statement)
    : DatabaseError(message)
    , m_statementIndex(statementIndex)
    , m_statement(std::move(statement)) {
}

MigrationError::MigrationError(std::string table, uint64_t committedOffset, int attempts,
                               const std::string& cause)
    : DatabaseError("migration of table '" + table + "' failed after " +
                    std::to_string(attempts) + " attempt(s) at committed offset " +
                    std::to_string(committedOffset) + ": " + cause)
    , m_table(std::move(table))
    , m_committedOffset(committedOffset)
    , m_attempts(attempts)
    , m_cause(cause) {
}

bool ErrorHandler::sqliteIsAlreadyExists(int code, const std::string& message) {
    // SQLite reports duplicate CREATE as a plain SQLITE_ERROR; the message is
    // the only discriminator ("table x already exists", "index x already exists")
    if ((code & 0xff) != SQLITE_ERROR) {
        return false;
    }
    return message.find("already exists") != std::string::npos ||
           message.find("duplicate column name") != std::string::npos;
}

bool ErrorHandler::sqliteIsRetryable(int code) {
    switch (code & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_PROTOCOL:
        case SQLITE_INTERRUPT:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::postgresIsAlreadyExists(const std::string& sqlState) {
    return sqlState == "42P07" ||  // duplicate_table
           sqlState == "42710" ||  // duplicate_object
           sqlState == "42P06" ||  // duplicate_schema
           sqlState == "42723" ||  // duplicate_function
           sqlState == "42701" ||  // duplicate_column
           sqlState == "42P04";    // duplicate_database
}

bool ErrorHandler::postgresIsRetryable(const std::string& sqlState) {
    if (postgresIsConnectionError(sqlState)) {
        return true;
    }
    return sqlState == "40001" ||  // serialization_failure
           sqlState == "40P01" ||  // deadlock_detected
           sqlState == "55P03" ||  // lock_not_available
           sqlState == "57014" ||  // query_canceled
           sqlState == "53300";    // too_many_connections
}

bool ErrorHandler::postgresIsConnectionError(const std::string& sqlState) {
    // Class 08: connection exception; 57P01..57P03: server shutting down
    return sqlState.compare(0, 2, "08") == 0 ||
           sqlState == "57P01" || sqlState == "57P02" || sqlState == "57P03";
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

}  // namespace sqlbridge
