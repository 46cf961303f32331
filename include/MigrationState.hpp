#pragma once

/**
 * @file MigrationState.hpp
 * @brief Migration state machines, per-table cursors and the cursor state file.
 */

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace sqlbridge {

enum class JobState {
    Pending,
    Running,
    Completed,
    Failed,
    PartiallyCompleted
};

enum class TableState {
    Pending,
    Running,
    Completed,
    Failed
};

std::string toString(JobState state);
std::string toString(TableState state);

// Rows [offset, offset + limit) in primary-key order
struct BatchRange {
    uint64_t offset = 0;
    uint64_t limit = 0;

    uint64_t end() const { return offset + limit; }
    bool operator==(const BatchRange& other) const {
        return offset == other.offset && limit == other.limit;
    }
};

/**
 * @class TableCursor
 * @brief Committed progress of one table.
 *
 * committedOffset() is the contiguous watermark: every row below it is on
 * the target. Batches committed out of order by concurrent workers are
 * kept as ranges above the watermark and folded into it once the gap
 * below them is committed. Only committed batches are ever recorded, so a
 * resumed run that skips these rows never writes a row twice.
 *
 * Not thread-safe; the runner serializes updates.
 */
class TableCursor {
public:
    TableCursor() = default;
    explicit TableCursor(uint64_t committedOffset) : m_offset(committedOffset) {}

    uint64_t committedOffset() const { return m_offset; }

    // start -> end (exclusive), all strictly above the watermark
    const std::map<uint64_t, uint64_t>& committedRanges() const { return m_ranges; }

    // Rows covered by the watermark and the ranges
    uint64_t committedRows() const;

    bool isCommitted(uint64_t start, uint64_t end) const;

    // Record rows [start, end) as committed
    void markCommitted(uint64_t start, uint64_t end);

    /**
     * @brief Batches still to transfer for a table of totalRows rows.
     *
     * Starts at the watermark, skips committed ranges and splits the gaps
     * into batches of at most batchSize rows. From an empty cursor this is
     * ceil(totalRows / batchSize) batches.
     */
    std::vector<BatchRange> planBatches(uint64_t totalRows, uint64_t batchSize) const;

    // "offset" or "offset;start-end,start-end"
    std::string serialize() const;

    // Throws std::invalid_argument on malformed input
    static TableCursor parse(const std::string& text);

    bool operator==(const TableCursor& other) const {
        return m_offset == other.m_offset && m_ranges == other.m_ranges;
    }

private:
    void absorb();

    uint64_t m_offset = 0;
    std::map<uint64_t, uint64_t> m_ranges;
};

using CursorMap = std::map<std::string, TableCursor>;

/**
 * @brief Cursor persistence as "table=offset[;start-end,...]" lines.
 *
 * Blank lines and lines starting with '#' are ignored.
 */
class MigrationStateFile {
public:
    // Missing file yields an empty map; malformed content throws std::runtime_error
    static CursorMap load(const std::filesystem::path& path);

    // Written to a temporary file and renamed over the target
    static void save(const std::filesystem::path& path, const CursorMap& cursors);
};

}  // namespace sqlbridge
