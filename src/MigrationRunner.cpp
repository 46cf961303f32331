/**
 * @file MigrationRunner.cpp
 * @brief Implementation of the batched table migration.
 */

#include "MigrationRunner.hpp"
#include "Driver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <exception>
#include <sstream>
#include <thread>

namespace sqlbridge {

namespace {

std::string joinQuoted(const std::vector<std::string>& identifiers) {
    std::ostringstream out;
    for (size_t i = 0; i < identifiers.size(); ++i) {
        if (i > 0) out << ", ";
        out << Driver::quoteIdentifier(identifiers[i]);
    }
    return out.str();
}

}  // namespace

uint64_t MigrationResult::rowsTransferred() const {
    uint64_t rows = 0;
    for (const auto& table : tables) {
        rows += table.rowsTransferred;
    }
    return rows;
}

MigrationRunner::MigrationRunner(ContextPtr context)
    : m_context(context ? std::move(context) : Context::background()) {
}

std::string MigrationRunner::buildSelect(const std::string& table, const std::vector<std::string>& columns,
                                         const std::vector<std::string>& orderBy) {
    return "SELECT " + joinQuoted(columns) + " FROM " + Driver::quoteIdentifier(table) +
           " ORDER BY " + joinQuoted(orderBy) + " LIMIT ? OFFSET ?";
}

std::string MigrationRunner::buildInsert(const std::string& table, const std::vector<std::string>& columns) {
    std::string placeholders;
    for (size_t i = 0; i < columns.size(); ++i) {
        placeholders += i == 0 ? "?" : ", ?";
    }
    return "INSERT INTO " + Driver::quoteIdentifier(table) + " (" + joinQuoted(columns) +
           ") VALUES (" + placeholders + ")";
}

// ============================================================================
// Job
// ============================================================================

MigrationResult MigrationRunner::run(MigrationJob& job) {
    MigrationResult result;
    job.state = JobState::Running;
    result.state = JobState::Running;

    auto fail = [&](JobState state, const std::string& table, int attempts, const std::string& cause) {
        uint64_t offset = table.empty() ? 0 : job.cursors[table].committedOffset();
        job.state = state;
        result.state = state;
        result.error.emplace(table, offset, attempts, cause);
        spdlog::error("Migration {}: {}", toString(state), result.error->what());
    };

    std::string problem;
    if (!job.source || !job.target) {
        problem = "source and target drivers are required";
    } else if (!job.source->isConnected() || !job.target->isConnected()) {
        problem = "source and target drivers must be connected";
    } else if (job.tables.empty()) {
        problem = "no tables to migrate";
    } else if (job.batchSize == 0) {
        problem = "batch size must be at least 1";
    } else if (job.maxAttempts < 1) {
        problem = "at least one attempt per batch is required";
    } else if (job.timeout.count() <= 0) {
        problem = "attempt timeout must be positive";
    }
    if (!problem.empty()) {
        fail(JobState::Failed, "", 0, "invalid migration job: " + problem);
        return result;
    }

    spdlog::info("Migrating {} table(s) from {} to {} (batch size {}, {} attempt(s), {} worker(s))",
                 job.tables.size(), job.source->dialect(), job.target->dialect(),
                 job.batchSize, job.maxAttempts, job.workers);

    for (const auto& table : job.tables) {
        if (m_context->isDone()) {
            fail(JobState::Failed, table, 0, m_context->reason());
            return result;
        }

        result.tables.push_back(TableResult{});
        TableResult& tableResult = result.tables.back();
        tableResult.table = table;
        tableResult.state = TableState::Running;
        tableResult.committedOffset = job.cursors[table].committedOffset();

        TablePlan plan;
        try {
            plan = planTable(job, table, tableResult);
        } catch (const std::exception& e) {
            tableResult.state = TableState::Failed;
            fail(JobState::Failed, table, 0, e.what());
            return result;
        }

        try {
            runTable(job, plan, tableResult);
        } catch (const BatchExhausted& e) {
            tableResult.state = TableState::Failed;
            tableResult.committedOffset = job.cursors[table].committedOffset();
            fail(JobState::PartiallyCompleted, table, e.attempts, e.cause);
            return result;
        } catch (const std::exception& e) {
            tableResult.state = TableState::Failed;
            tableResult.committedOffset = job.cursors[table].committedOffset();
            fail(JobState::Failed, table, 0, e.what());
            return result;
        }

        tableResult.committedOffset = job.cursors[table].committedOffset();
        tableResult.state = TableState::Completed;
        spdlog::info("Table {} completed: {} row(s) in {} batch(es), cursor at {}",
                     table, tableResult.rowsTransferred, tableResult.batchesCommitted,
                     tableResult.committedOffset);
    }

    job.state = JobState::Completed;
    result.state = JobState::Completed;
    spdlog::info("Migration completed: {} row(s) transferred", result.rowsTransferred());
    return result;
}

// ============================================================================
// Table
// ============================================================================

MigrationRunner::TablePlan MigrationRunner::planTable(MigrationJob& job, const std::string& table,
                                                      TableResult& result) {
    ErrorContext ctx("plan " + table);

    auto columns = job.source->tableColumns(table);
    if (columns.empty()) {
        throw DatabaseError("table '" + table + "' not found on the " + job.source->dialect() + " source");
    }
    if (job.target->tableColumns(table).empty()) {
        throw DatabaseError("table '" + table + "' not found on the " + job.target->dialect() + " target");
    }

    auto orderBy = job.source->primaryKeyColumns(table);
    if (orderBy.empty()) {
        spdlog::warn("Table {} has no primary key, ordering batches by every column", table);
        orderBy = columns;
    }

    {
        auto tx = job.source->beginTransaction(m_context);
        auto count = tx->queryOne("SELECT COUNT(*) FROM " + Driver::quoteIdentifier(table));
        result.totalRows = count ? static_cast<uint64_t>(count->getInt64(0)) : 0;
        tx->commit();
    }

    TablePlan plan;
    plan.table = table;
    plan.selectSql = buildSelect(table, columns, orderBy);
    plan.insertSql = buildInsert(table, columns);
    plan.batches = job.cursors[table].planBatches(result.totalRows, job.batchSize);

    spdlog::info("Table {}: {} row(s), {} batch(es) pending from offset {}",
                 table, result.totalRows, plan.batches.size(), result.committedOffset);
    return plan;
}

void MigrationRunner::runTable(MigrationJob& job, const TablePlan& plan, TableResult& result) {
    size_t workers = job.workers;
    if (workers > 1 && !job.target->supportsConcurrentWriters()) {
        spdlog::debug("{} target takes one writer, running batches of {} sequentially",
                      job.target->dialect(), plan.table);
        workers = 1;
    }
    workers = std::min(workers, plan.batches.size());

    if (workers <= 1) {
        for (const auto& batch : plan.batches) {
            if (m_context->isDone()) {
                throw ContextError(m_context->reason());
            }
            runBatch(job, plan, batch, result);
        }
        return;
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> stop{false};
    std::optional<BatchExhausted> exhausted;
    std::exception_ptr fatal;

    auto worker = [&]() {
        while (!stop.load() && !m_context->isDone()) {
            size_t index = next.fetch_add(1);
            if (index >= plan.batches.size()) break;
            try {
                runBatch(job, plan, plan.batches[index], result);
            } catch (const BatchExhausted& e) {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!exhausted) exhausted = e;
                stop = true;
            } catch (const std::exception&) {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!fatal) fatal = std::current_exception();
                stop = true;
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    if (exhausted) {
        throw *exhausted;
    }
    if (fatal) {
        std::rethrow_exception(fatal);
    }
    if (m_context->isDone()) {
        throw ContextError(m_context->reason());
    }
}

// ============================================================================
// Batch
// ============================================================================

void MigrationRunner::runBatch(MigrationJob& job, const TablePlan& plan, const BatchRange& batch,
                               TableResult& result) {
    int attemptsMade = 0;
    size_t rows = 0;

    try {
        rows = ErrorHandler::executeWithRetry(
            [&](int attempt) {
                attemptsMade = attempt;
                return copyBatch(job, plan, batch);
            },
            job.maxAttempts, job.retryBackoff,
            [&](const std::exception& e, int attempt) {
                if (m_context->isDone()) {
                    return false;
                }
                spdlog::warn("Batch {}+{} of {} failed (attempt {}/{}): {}",
                             batch.offset, batch.limit, plan.table, attempt, job.maxAttempts, e.what());
                return true;
            });
    } catch (const std::exception& e) {
        if (m_context->isDone()) {
            throw ContextError(m_context->reason() + ": " + e.what());
        }
        throw BatchExhausted{attemptsMade, e.what()};
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    job.cursors[plan.table].markCommitted(batch.offset, batch.end());
    result.rowsTransferred += rows;
    ++result.batchesCommitted;
    spdlog::debug("Committed batch {}+{} of {} ({} row(s)), cursor at {}",
                  batch.offset, batch.limit, plan.table, rows,
                  job.cursors[plan.table].committedOffset());
    if (job.onCommit) {
        job.onCommit(job.cursors);
    }
}

size_t MigrationRunner::copyBatch(MigrationJob& job, const TablePlan& plan, const BatchRange& batch) {
    auto attempt = Context::withTimeout(m_context, job.timeout);

    // The read shares the attempt's deadline with the write
    std::vector<Row> rows;
    {
        auto read = job.source->beginTransaction(attempt);
        {
            auto stream = read->query(plan.selectSql, Params{static_cast<int64_t>(batch.limit),
                                                            static_cast<int64_t>(batch.offset)});
            rows = stream->all();
        }
        read->commit();
    }
    if (rows.size() != batch.limit) {
        spdlog::warn("Batch {}+{} of {} read {} row(s); the source changed during migration",
                     batch.offset, batch.limit, plan.table, rows.size());
    }

    auto tx = job.target->beginTransaction(attempt);
    for (const auto& row : rows) {
        tx->execute(plan.insertSql, row.values());
    }
    tx->commit();
    return rows.size();
}

}  // namespace sqlbridge
