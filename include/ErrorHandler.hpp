#pragma once

#include <string>
#include <stdexcept>
#include <functional>
#include <thread>
#include <chrono>
#include <cstdint>
#include <algorithm>

namespace sqlbridge {

// Base for every error raised by the driver layer
class DatabaseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Dial, ping, directory creation, pool exhaustion, or use of an
// unconnected/closed handle. The handle must not be reused.
class ConnectionError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

// Engine failure passed through as-is. nativeCode is the SQLite result code,
// sqlState the PostgreSQL SQLSTATE; both are only used for classification.
class QueryError : public DatabaseError {
public:
    QueryError(const std::string& message, int nativeCode = 0, std::string sqlState = {});

    int nativeCode() const { return m_nativeCode; }
    const std::string& sqlState() const { return m_sqlState; }

private:
    int m_nativeCode;
    std::string m_sqlState;
};

// Statement aborted because its context was cancelled or timed out
class ContextError : public QueryError {
public:
    explicit ContextError(const std::string& message);
};

class SchemaError : public DatabaseError {
public:
    static constexpr long kNoStatement = -1;

    SchemaError(const std::string& message, long statementIndex = kNoStatement,
                std::string statement = {});

    long statementIndex() const { return m_statementIndex; }
    const std::string& statement() const { return m_statement; }

private:
    long m_statementIndex;
    std::string m_statement;
};

class MigrationError : public DatabaseError {
public:
    MigrationError(std::string table, uint64_t committedOffset, int attempts,
                   const std::string& cause);

    const std::string& table() const { return m_table; }
    uint64_t committedOffset() const { return m_committedOffset; }
    int attempts() const { return m_attempts; }
    const std::string& cause() const { return m_cause; }

private:
    std::string m_table;
    uint64_t m_committedOffset;
    int m_attempts;
    std::string m_cause;
};

// Backend error classification
class ErrorHandler {
public:
    // SQLite (primary or extended result code plus message)
    static bool sqliteIsAlreadyExists(int code, const std::string& message);
    static bool sqliteIsRetryable(int code);

    // PostgreSQL SQLSTATE
    static bool postgresIsAlreadyExists(const std::string& sqlState);
    static bool postgresIsRetryable(const std::string& sqlState);
    static bool postgresIsConnectionError(const std::string& sqlState);

    // Execute with retry logic. Calls operation(attempt) with attempt starting
    // at 1; rethrows the last failure once maxAttempts have been made or
    // shouldRetry rejects it.
    template<typename Func>
    static auto executeWithRetry(Func&& operation, int maxAttempts,
                                 std::chrono::milliseconds backoff,
                                 const std::function<bool(const std::exception&, int)>& shouldRetry)
        -> decltype(operation(1)) {
        int attempt = 1;
        while (true) {
            try {
                return operation(attempt);
            } catch (const std::exception& e) {
                if (attempt >= maxAttempts || !shouldRetry(e, attempt)) {
                    throw;
                }
            }

            // Exponential backoff: backoff, 2*backoff, 4*backoff...
            if (backoff.count() > 0) {
                std::this_thread::sleep_for(backoff * (1 << std::min(attempt - 1, 10)));
            }
            ++attempt;
        }
    }
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

}  // namespace sqlbridge
