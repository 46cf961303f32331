#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include <sqlite3.h>

using namespace sqlbridge;
using namespace std::chrono_literals;

class ErrorHandlerTest : public ::testing::Test {
};

// SQLite classification tests
TEST_F(ErrorHandlerTest, SqliteDuplicateTableIsAlreadyExists) {
    EXPECT_TRUE(ErrorHandler::sqliteIsAlreadyExists(SQLITE_ERROR, "table users already exists"));
    EXPECT_TRUE(ErrorHandler::sqliteIsAlreadyExists(SQLITE_ERROR, "index idx_loans_user already exists"));
    EXPECT_TRUE(ErrorHandler::sqliteIsAlreadyExists(SQLITE_ERROR, "duplicate column name: email"));
}

TEST_F(ErrorHandlerTest, SqliteOtherErrorsAreNotAlreadyExists) {
    EXPECT_FALSE(ErrorHandler::sqliteIsAlreadyExists(SQLITE_ERROR, "near \"CREAT\": syntax error"));
    EXPECT_FALSE(ErrorHandler::sqliteIsAlreadyExists(SQLITE_CONSTRAINT, "UNIQUE constraint failed: users.id"));
}

TEST_F(ErrorHandlerTest, SqliteBusyAndLockedAreRetryable) {
    EXPECT_TRUE(ErrorHandler::sqliteIsRetryable(SQLITE_BUSY));
    EXPECT_TRUE(ErrorHandler::sqliteIsRetryable(SQLITE_LOCKED));
    EXPECT_TRUE(ErrorHandler::sqliteIsRetryable(SQLITE_BUSY_SNAPSHOT));
}

TEST_F(ErrorHandlerTest, SqliteConstraintIsNotRetryable) {
    EXPECT_FALSE(ErrorHandler::sqliteIsRetryable(SQLITE_CONSTRAINT));
    EXPECT_FALSE(ErrorHandler::sqliteIsRetryable(SQLITE_CONSTRAINT_PRIMARYKEY));
    EXPECT_FALSE(ErrorHandler::sqliteIsRetryable(SQLITE_ERROR));
}

// PostgreSQL classification tests
TEST_F(ErrorHandlerTest, PostgresDuplicateObjectsAreAlreadyExists) {
    EXPECT_TRUE(ErrorHandler::postgresIsAlreadyExists("42P07"));
    EXPECT_TRUE(ErrorHandler::postgresIsAlreadyExists("42710"));
    EXPECT_TRUE(ErrorHandler::postgresIsAlreadyExists("42723"));
    EXPECT_FALSE(ErrorHandler::postgresIsAlreadyExists("23505"));
    EXPECT_FALSE(ErrorHandler::postgresIsAlreadyExists(""));
}

TEST_F(ErrorHandlerTest, PostgresTransientStatesAreRetryable) {
    EXPECT_TRUE(ErrorHandler::postgresIsRetryable("40001"));
    EXPECT_TRUE(ErrorHandler::postgresIsRetryable("40P01"));
    EXPECT_TRUE(ErrorHandler::postgresIsRetryable("55P03"));
    EXPECT_TRUE(ErrorHandler::postgresIsRetryable("08006"));
    EXPECT_TRUE(ErrorHandler::postgresIsRetryable("53300"));
}

TEST_F(ErrorHandlerTest, PostgresDataErrorsAreNotRetryable) {
    EXPECT_FALSE(ErrorHandler::postgresIsRetryable("23505"));
    EXPECT_FALSE(ErrorHandler::postgresIsRetryable("42601"));
    EXPECT_FALSE(ErrorHandler::postgresIsRetryable("22P02"));
}

TEST_F(ErrorHandlerTest, PostgresConnectionClass) {
    EXPECT_TRUE(ErrorHandler::postgresIsConnectionError("08000"));
    EXPECT_TRUE(ErrorHandler::postgresIsConnectionError("08006"));
    EXPECT_TRUE(ErrorHandler::postgresIsConnectionError("57P01"));
    EXPECT_FALSE(ErrorHandler::postgresIsConnectionError("57014"));
    EXPECT_FALSE(ErrorHandler::postgresIsConnectionError(""));
}

// Exception types
TEST_F(ErrorHandlerTest, ErrorHierarchy) {
    EXPECT_THROW(throw ConnectionError("down"), DatabaseError);
    EXPECT_THROW(throw ContextError("context cancelled"), QueryError);
    EXPECT_THROW(throw SchemaError("bad"), DatabaseError);
}

TEST_F(ErrorHandlerTest, QueryErrorCarriesCodes) {
    QueryError error("duplicate key", 0, "23505");

    EXPECT_EQ(error.nativeCode(), 0);
    EXPECT_EQ(error.sqlState(), "23505");
    EXPECT_STREQ(error.what(), "duplicate key");
}

TEST_F(ErrorHandlerTest, MigrationErrorDescribesProgress) {
    MigrationError error("loans", 1500, 3, "deadlock detected");

    EXPECT_EQ(error.table(), "loans");
    EXPECT_EQ(error.committedOffset(), 1500u);
    EXPECT_EQ(error.attempts(), 3);
    EXPECT_EQ(error.cause(), "deadlock detected");
    EXPECT_THAT(error.what(), ::testing::HasSubstr("loans"));
    EXPECT_THAT(error.what(), ::testing::HasSubstr("1500"));
    EXPECT_THAT(error.what(), ::testing::HasSubstr("deadlock detected"));
}

TEST_F(ErrorHandlerTest, SchemaErrorWithoutStatement) {
    SchemaError error("no schema file");

    EXPECT_EQ(error.statementIndex(), SchemaError::kNoStatement);
    EXPECT_TRUE(error.statement().empty());
}

// Retry tests
TEST_F(ErrorHandlerTest, ExecuteWithRetrySucceedsFirstTime) {
    int calls = 0;

    int result = ErrorHandler::executeWithRetry(
        [&](int) { ++calls; return 42; }, 3, 0ms,
        [](const std::exception&, int) { return true; });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 1);
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryRecoversAfterFailures) {
    std::vector<int> attempts;

    int result = ErrorHandler::executeWithRetry(
        [&](int attempt) {
            attempts.push_back(attempt);
            if (attempt < 3) throw QueryError("database is locked", SQLITE_BUSY);
            return attempt;
        },
        3, 1ms, [](const std::exception&, int) { return true; });

    EXPECT_EQ(result, 3);
    EXPECT_THAT(attempts, ::testing::ElementsAre(1, 2, 3));
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryRethrowsLastFailure) {
    int calls = 0;

    EXPECT_THROW(ErrorHandler::executeWithRetry(
                     [&](int attempt) -> int {
                         ++calls;
                         throw QueryError("attempt " + std::to_string(attempt));
                     },
                     2, 0ms, [](const std::exception&, int) { return true; }),
                 QueryError);
    EXPECT_EQ(calls, 2);
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryStopsWhenRejected) {
    int calls = 0;

    EXPECT_THROW(ErrorHandler::executeWithRetry(
                     [&](int) -> int {
                         ++calls;
                         throw QueryError("UNIQUE constraint failed", SQLITE_CONSTRAINT);
                     },
                     5, 0ms,
                     [](const std::exception& e, int) {
                         auto* query = dynamic_cast<const QueryError*>(&e);
                         return query && ErrorHandler::sqliteIsRetryable(query->nativeCode());
                     }),
                 QueryError);
    EXPECT_EQ(calls, 1);
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryBacksOffExponentially) {
    auto start = std::chrono::steady_clock::now();

    EXPECT_THROW(ErrorHandler::executeWithRetry(
                     [](int) -> int { throw QueryError("busy"); }, 3, 10ms,
                     [](const std::exception&, int) { return true; }),
                 QueryError);

    // 10ms + 20ms between the three attempts
    EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
}

// Error context tests
TEST_F(ErrorHandlerTest, ErrorContextNests) {
    EXPECT_EQ(ErrorContext::current(), "");
    {
        ErrorContext outer("migrate users");
        EXPECT_EQ(ErrorContext::current(), "migrate users");
        {
            ErrorContext inner("batch 0");
            EXPECT_EQ(ErrorContext::current(), "migrate users > batch 0");
        }
        EXPECT_EQ(ErrorContext::current(), "migrate users");
    }
    EXPECT_EQ(ErrorContext::current(), "");
}
