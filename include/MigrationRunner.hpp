#pragma once

/**
 * @file MigrationRunner.hpp
 * @brief Batched, resumable, retrying table copy between two drivers.
 */

#include "Context.hpp"
#include "ErrorHandler.hpp"
#include "MigrationState.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sqlbridge {

class Driver;

/**
 * @brief Everything one migration needs; the cursors are updated in place.
 *
 * Both drivers must already be connected and outlive the run. Tables are
 * migrated in list order, which must respect foreign-key dependencies.
 * Running the same job again, or a job whose cursors were loaded from a
 * state file, resumes every table at its recorded cursor.
 */
struct MigrationJob {
    Driver* source = nullptr;
    Driver* target = nullptr;
    std::vector<std::string> tables;

    size_t batchSize = 500;
    std::chrono::milliseconds timeout{30000};    ///< Per batch attempt
    int maxAttempts = 3;                         ///< Total attempts per batch
    size_t workers = 1;                          ///< Used only with concurrent-writer targets
    std::chrono::milliseconds retryBackoff{100}; ///< Doubled after each failed attempt

    CursorMap cursors;
    JobState state = JobState::Pending;

    // Called after every committed batch with the updated cursors, one
    // call at a time even when workers run. An exception from it fails the
    // job after the batch has been recorded.
    std::function<void(const CursorMap&)> onCommit;
};

struct TableResult {
    std::string table;
    TableState state = TableState::Pending;
    uint64_t totalRows = 0;         ///< Source rows counted at the start of the table
    uint64_t rowsTransferred = 0;   ///< Rows committed during this run
    uint64_t batchesCommitted = 0;  ///< Batches committed during this run
    uint64_t committedOffset = 0;   ///< Contiguous cursor after this run
};

struct MigrationResult {
    JobState state = JobState::Pending;
    std::vector<TableResult> tables;    ///< Tables that were started, in order
    std::optional<MigrationError> error;

    bool completed() const { return state == JobState::Completed; }
    uint64_t rowsTransferred() const;
};

/**
 * @class MigrationRunner
 * @brief Copies rows table by table in primary-key ordered batches.
 *
 * Each batch is read from the source with LIMIT/OFFSET and written to the
 * target in one transaction, both bound to a per-attempt timeout, and is
 * recorded in the table cursor only after the commit succeeded. A failed attempt is
 * rolled back and retried with exponential backoff; once maxAttempts have
 * failed the table is Failed, the job PartiallyCompleted, and later tables
 * are not started.
 *
 * Job-level problems (invalid job, unknown table, catalog failure, parent
 * context cancelled) end the job Failed. Either way result.error carries a
 * MigrationError with the table and its committed offset.
 *
 * With a target that supports concurrent writers and workers > 1, the
 * batches of one table run on a pool of threads; out-of-order commits are
 * kept as committed ranges in the cursor.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(ContextPtr context = Context::background());

    MigrationResult run(MigrationJob& job);

    // SELECT cols FROM t ORDER BY pk LIMIT ? OFFSET ?
    static std::string buildSelect(const std::string& table, const std::vector<std::string>& columns,
                                   const std::vector<std::string>& orderBy);

    // INSERT INTO t (cols) VALUES (?, ...)
    static std::string buildInsert(const std::string& table, const std::vector<std::string>& columns);

private:
    struct TablePlan {
        std::string table;
        std::string selectSql;
        std::string insertSql;
        std::vector<BatchRange> batches;
    };

    // Thrown when the batch ran out of attempts
    struct BatchExhausted {
        int attempts;
        std::string cause;
    };

    TablePlan planTable(MigrationJob& job, const std::string& table, TableResult& result);
    void runTable(MigrationJob& job, const TablePlan& plan, TableResult& result);
    void runBatch(MigrationJob& job, const TablePlan& plan, const BatchRange& batch, TableResult& result);
    size_t copyBatch(MigrationJob& job, const TablePlan& plan, const BatchRange& batch);

    ContextPtr m_context;
    std::mutex m_mutex;  ///< Guards cursors and counters while workers run
};

}  // namespace sqlbridge
