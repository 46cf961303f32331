#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "SQLiteDriver.hpp"
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <atomic>
#include <thread>

using namespace sqlbridge;
using namespace std::chrono_literals;

class SQLiteDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "sqlbridge_sqlite_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    DatabaseConfig configFor(const std::filesystem::path& path) const {
        DatabaseConfig config;
        config.type = DatabaseType::SQLite;
        config.connection.sqlite_path = path.string();
        config.pool.acquire_timeout = 2000ms;
        return config;
    }

    std::unique_ptr<SQLiteDriver> connected() {
        auto driver = std::make_unique<SQLiteDriver>();
        driver->connect(configFor(tempDir_ / "test.db"));
        driver->execute("CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT NOT NULL, "
                        "price REAL, data BLOB)");
        return driver;
    }

    std::filesystem::path tempDir_;
};

// Lifecycle tests
TEST_F(SQLiteDriverTest, ConnectAndPing) {
    SQLiteDriver driver;
    EXPECT_EQ(driver.state(), Driver::State::Disconnected);

    driver.connect(configFor(tempDir_ / "test.db"));

    EXPECT_TRUE(driver.isConnected());
    EXPECT_NO_THROW(driver.ping());
    EXPECT_EQ(driver.dialect(), "sqlite");
}

TEST_F(SQLiteDriverTest, ConnectCreatesParentDirectory) {
    auto path = tempDir_ / "nested" / "deeper" / "app.db";
    SQLiteDriver driver;

    driver.connect(configFor(path));

    EXPECT_TRUE(std::filesystem::exists(path.parent_path()));
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(SQLiteDriverTest, ConnectFailsWhenDirectoryCannotBeCreated) {
    std::ofstream(tempDir_ / "blocker") << "not a directory";
    SQLiteDriver driver;

    EXPECT_THROW(driver.connect(configFor(tempDir_ / "blocker" / "sub" / "app.db")), ConnectionError);
    EXPECT_EQ(driver.state(), Driver::State::Disconnected);
}

TEST_F(SQLiteDriverTest, ConnectTwiceFails) {
    SQLiteDriver driver;
    driver.connect(configFor(tempDir_ / "test.db"));

    EXPECT_THROW(driver.connect(configFor(tempDir_ / "other.db")), ConnectionError);
}

TEST_F(SQLiteDriverTest, OperationsBeforeConnectFail) {
    SQLiteDriver driver;

    EXPECT_THROW(driver.ping(), ConnectionError);
    EXPECT_THROW(driver.execute("SELECT 1"), ConnectionError);
    EXPECT_THROW(driver.query("SELECT 1"), ConnectionError);
    EXPECT_THROW(driver.beginTransaction(), ConnectionError);
}

TEST_F(SQLiteDriverTest, CloseIsIdempotent) {
    auto driver = connected();

    driver->close();
    EXPECT_NO_THROW(driver->close());

    EXPECT_EQ(driver->state(), Driver::State::Closed);
    EXPECT_THROW(driver->ping(), ConnectionError);
    EXPECT_THROW(driver->execute("SELECT 1"), ConnectionError);
    EXPECT_THROW(driver->connect(configFor(tempDir_ / "test.db")), ConnectionError);
}

// Dialect tests
TEST_F(SQLiteDriverTest, TransformQueryIsIdentity) {
    SQLiteDriver driver;
    const std::string sql = "SELECT * FROM t WHERE a = ? AND b = '?'";

    EXPECT_EQ(driver.transformQuery(sql), sql);
    EXPECT_FALSE(driver.supportsConcurrentWriters());
}

TEST_F(SQLiteDriverTest, DuplicateTableIsAlreadyExists) {
    auto driver = connected();

    try {
        driver->execute("CREATE TABLE items (id INTEGER)");
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_TRUE(driver->isAlreadyExists(e));
        EXPECT_FALSE(driver->isRetryable(e));
    }
}

TEST_F(SQLiteDriverTest, SyntaxErrorIsNotAlreadyExists) {
    auto driver = connected();

    try {
        driver->execute("CREAT TABLE broken (id INTEGER)");
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_FALSE(driver->isAlreadyExists(e));
    }
}

// Statement tests
TEST_F(SQLiteDriverTest, ExecuteReportsRowsAndInsertId) {
    auto driver = connected();

    auto first = driver->execute("INSERT INTO items (name, price) VALUES (?, ?)",
                                 Params{std::string("apple"), 1.25});
    auto second = driver->execute("INSERT INTO items (name, price) VALUES (?, ?)",
                                  Params{std::string("pear"), nullptr});
    auto update = driver->execute("UPDATE items SET price = ?", Params{2.0});

    EXPECT_EQ(first.rowsAffected, 1);
    EXPECT_EQ(first.lastInsertId, 1);
    EXPECT_EQ(second.lastInsertId, 2);
    EXPECT_EQ(update.rowsAffected, 2);
}

TEST_F(SQLiteDriverTest, QueryDecodesValues) {
    auto driver = connected();
    Blob data = {0x00, 0xff, 0x10};
    driver->execute("INSERT INTO items (id, name, price, data) VALUES (?, ?, ?, ?)",
                    Params{int64_t{7}, std::string("widget"), 9.5, data});

    auto row = driver->queryOne("SELECT id, name, price, data FROM items WHERE id = ?", Params{int64_t{7}});

    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->getInt64(0), 7);
    EXPECT_EQ(row->getString(1), "widget");
    EXPECT_DOUBLE_EQ(row->getDouble(2), 9.5);
    EXPECT_EQ(std::get<Blob>(row->at("data")), data);
    EXPECT_THAT(row->columns(), ::testing::ElementsAre("id", "name", "price", "data"));
}

TEST_F(SQLiteDriverTest, EmptyBlobIsNotNull) {
    auto driver = connected();
    driver->execute("INSERT INTO items (id, name, data) VALUES (?, ?, ?)",
                    Params{int64_t{1}, std::string("plain"), Blob{}});
    {
        auto tx = driver->beginTransaction();
        tx->execute("INSERT INTO items (id, name, data) VALUES (?, ?, ?)",
                    Params{int64_t{2}, std::string("in tx"), Blob{}});
        tx->commit();
    }

    auto stream = driver->query("SELECT typeof(data), data FROM items ORDER BY id");
    int rows = 0;
    while (stream->next()) {
        ++rows;
        EXPECT_EQ(stream->row().getString(0), "blob");
        ASSERT_TRUE(std::holds_alternative<Blob>(stream->row().at(1)));
        EXPECT_TRUE(std::get<Blob>(stream->row().at(1)).empty());
    }
    EXPECT_EQ(rows, 2);
}

TEST_F(SQLiteDriverTest, QueryOneOnEmptyResult) {
    auto driver = connected();

    EXPECT_FALSE(driver->queryOne("SELECT id FROM items").has_value());
}

TEST_F(SQLiteDriverTest, QueryStreamsAllRows) {
    auto driver = connected();
    for (int64_t i = 1; i <= 5; ++i) {
        driver->execute("INSERT INTO items (id, name) VALUES (?, ?)", Params{i, "n" + std::to_string(i)});
    }

    std::vector<Row> rows;
    {
        auto stream = driver->query("SELECT id FROM items ORDER BY id LIMIT ? OFFSET ?",
                                    Params{int64_t{3}, int64_t{1}});
        rows = stream->all();
    }

    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].getInt64(0), 2);
    EXPECT_EQ(rows[2].getInt64(0), 4);
}

TEST_F(SQLiteDriverTest, WrongParameterCountFails) {
    auto driver = connected();

    EXPECT_THROW(driver->execute("INSERT INTO items (name) VALUES (?)", Params{}), QueryError);
}

TEST_F(SQLiteDriverTest, ForeignKeysAreEnforced) {
    auto driver = connected();
    driver->execute("CREATE TABLE tags (id INTEGER PRIMARY KEY, item_id INTEGER NOT NULL REFERENCES items(id))");

    EXPECT_THROW(driver->execute("INSERT INTO tags (item_id) VALUES (?)", Params{int64_t{99}}), QueryError);
}

// Transaction tests
TEST_F(SQLiteDriverTest, CommitPersistsRows) {
    auto driver = connected();

    auto tx = driver->beginTransaction();
    tx->execute("INSERT INTO items (name) VALUES (?)", Params{std::string("a")});
    tx->execute("INSERT INTO items (name) VALUES (?)", Params{std::string("b")});
    auto inside = tx->queryOne("SELECT COUNT(*) FROM items");
    tx->commit();

    ASSERT_TRUE(inside.has_value());
    EXPECT_EQ(inside->getInt64(0), 2);
    EXPECT_FALSE(tx->isActive());
    EXPECT_EQ(driver->queryOne("SELECT COUNT(*) FROM items")->getInt64(0), 2);
}

TEST_F(SQLiteDriverTest, RollbackDiscardsRows) {
    auto driver = connected();

    auto tx = driver->beginTransaction();
    tx->execute("INSERT INTO items (name) VALUES (?)", Params{std::string("a")});
    tx->rollback();

    EXPECT_EQ(driver->queryOne("SELECT COUNT(*) FROM items")->getInt64(0), 0);
    EXPECT_THROW(tx->execute("SELECT 1"), QueryError);
    EXPECT_THROW(tx->commit(), QueryError);
}

TEST_F(SQLiteDriverTest, DestroyedTransactionRollsBack) {
    auto driver = connected();

    {
        auto tx = driver->beginTransaction();
        tx->execute("INSERT INTO items (name) VALUES (?)", Params{std::string("a")});
    }

    EXPECT_EQ(driver->queryOne("SELECT COUNT(*) FROM items")->getInt64(0), 0);
}

TEST_F(SQLiteDriverTest, FailedStatementKeepsTransactionUsable) {
    auto driver = connected();

    auto tx = driver->beginTransaction();
    tx->execute("INSERT INTO items (id, name) VALUES (?, ?)", Params{int64_t{1}, std::string("a")});
    EXPECT_THROW(tx->execute("INSERT INTO items (id, name) VALUES (?, ?)",
                             Params{int64_t{1}, std::string("dup")}),
                 QueryError);
    tx->commit();

    EXPECT_EQ(driver->queryOne("SELECT COUNT(*) FROM items")->getInt64(0), 1);
}

TEST_F(SQLiteDriverTest, BeginWithDoneContextFails) {
    auto driver = connected();
    auto ctx = Context::withCancel(Context::background());
    ctx->cancel();

    EXPECT_THROW(driver->beginTransaction(ctx), ContextError);
}

TEST_F(SQLiteDriverTest, CommitAfterCancelRollsBack) {
    auto driver = connected();
    auto ctx = Context::withCancel(Context::background());

    auto tx = driver->beginTransaction(ctx);
    tx->execute("INSERT INTO items (name) VALUES (?)", Params{std::string("a")});
    ctx->cancel();

    EXPECT_THROW(tx->commit(), ContextError);
    EXPECT_FALSE(tx->isActive());
    EXPECT_EQ(driver->queryOne("SELECT COUNT(*) FROM items")->getInt64(0), 0);
}

TEST_F(SQLiteDriverTest, ExpiredContextInterruptsLongStatement) {
    auto driver = connected();
    auto ctx = Context::withTimeout(Context::background(), 50ms);

    auto tx = driver->beginTransaction(ctx);
    EXPECT_THROW(tx->execute("WITH RECURSIVE n(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM n) "
                             "SELECT COUNT(*) FROM n"),
                 ContextError);
    tx->rollback();

    EXPECT_NO_THROW(driver->ping());
}

TEST_F(SQLiteDriverTest, TransactionsAreSerialized) {
    auto driver = connected();
    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};

    auto work = [&](int64_t base) {
        for (int64_t i = 0; i < 10; ++i) {
            auto tx = driver->beginTransaction();
            int now = ++inside;
            maxInside = std::max(maxInside.load(), now);
            tx->execute("INSERT INTO items (id, name) VALUES (?, ?)", Params{base + i, std::string("x")});
            --inside;
            tx->commit();
        }
    };

    std::thread a(work, int64_t{0});
    std::thread b(work, int64_t{100});
    a.join();
    b.join();

    EXPECT_EQ(maxInside.load(), 1);
    EXPECT_EQ(driver->queryOne("SELECT COUNT(*) FROM items")->getInt64(0), 20);
}

// Catalog tests
TEST_F(SQLiteDriverTest, TableColumnsInOrder) {
    auto driver = connected();

    EXPECT_THAT(driver->tableColumns("items"), ::testing::ElementsAre("id", "name", "price", "data"));
    EXPECT_TRUE(driver->tableColumns("missing").empty());
}

TEST_F(SQLiteDriverTest, PrimaryKeyColumnsInKeyOrder) {
    auto driver = connected();
    driver->execute("CREATE TABLE pairs (a INTEGER, b TEXT, c INTEGER, PRIMARY KEY (c, a))");
    driver->execute("CREATE TABLE heap (a INTEGER, b TEXT)");

    EXPECT_THAT(driver->primaryKeyColumns("items"), ::testing::ElementsAre("id"));
    EXPECT_THAT(driver->primaryKeyColumns("pairs"), ::testing::ElementsAre("c", "a"));
    EXPECT_TRUE(driver->primaryKeyColumns("heap").empty());
}

TEST_F(SQLiteDriverTest, PoolHoldsOneConnection) {
    auto driver = connected();

    PoolStats stats = driver->poolStats();

    EXPECT_EQ(stats.maxOpen, 1u);
    EXPECT_LE(stats.open, 1u);
}

TEST_F(SQLiteDriverTest, QuoteIdentifierDoublesQuotes) {
    EXPECT_EQ(Driver::quoteIdentifier("users"), "\"users\"");
    EXPECT_EQ(Driver::quoteIdentifier("we\"ird"), "\"we\"\"ird\"");
}
