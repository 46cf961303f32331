#include "MigrationState.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace sqlbridge {

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

uint64_t parseNumber(const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid cursor offset '" + text + "'");
    }
    return std::stoull(value);
}

}  // namespace

std::string toString(JobState state) {
    switch (state) {
        case JobState::Pending: return "pending";
        case JobState::Running: return "running";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::PartiallyCompleted: return "partially_completed";
    }
    return "unknown";
}

std::string toString(TableState state) {
    switch (state) {
        case TableState::Pending: return "pending";
        case TableState::Running: return "running";
        case TableState::Completed: return "completed";
        case TableState::Failed: return "failed";
    }
    return "unknown";
}

// ============================================================================
// TableCursor
// ============================================================================

uint64_t TableCursor::committedRows() const {
    uint64_t rows = m_offset;
    for (const auto& [start, end] : m_ranges) {
        rows += end - start;
    }
    return rows;
}

bool TableCursor::isCommitted(uint64_t start, uint64_t end) const {
    if (end <= m_offset) return true;
    if (start < m_offset) return false;

    auto it = m_ranges.upper_bound(start);
    if (it == m_ranges.begin()) return false;
    --it;
    return it->first <= start && end <= it->second;
}

void TableCursor::markCommitted(uint64_t start, uint64_t end) {
    if (end <= start) return;
    start = std::max(start, m_offset);
    if (end <= start) return;

    // Merge with every overlapping or adjacent range
    auto it = m_ranges.lower_bound(start);
    if (it != m_ranges.begin()) {
        auto prev = std::prev(it);
        if (prev->second >= start) {
            it = prev;
        }
    }
    while (it != m_ranges.end() && it->first <= end) {
        start = std::min(start, it->first);
        end = std::max(end, it->second);
        it = m_ranges.erase(it);
    }
    m_ranges.emplace(start, end);

    absorb();
}

void TableCursor::absorb() {
    while (!m_ranges.empty() && m_ranges.begin()->first <= m_offset) {
        m_offset = std::max(m_offset, m_ranges.begin()->second);
        m_ranges.erase(m_ranges.begin());
    }
}

std::vector<BatchRange> TableCursor::planBatches(uint64_t totalRows, uint64_t batchSize) const {
    std::vector<BatchRange> batches;
    if (batchSize == 0) {
        throw std::invalid_argument("batch size must be at least 1");
    }

    uint64_t pos = m_offset;
    auto range = m_ranges.begin();
    while (pos < totalRows) {
        if (range != m_ranges.end() && range->first <= pos) {
            pos = std::max(pos, range->second);
            ++range;
            continue;
        }

        uint64_t end = std::min(pos + batchSize, totalRows);
        if (range != m_ranges.end()) {
            end = std::min(end, range->first);
        }
        batches.push_back(BatchRange{pos, end - pos});
        pos = end;
    }
    return batches;
}

std::string TableCursor::serialize() const {
    std::ostringstream out;
    out << m_offset;
    char sep = ';';
    for (const auto& [start, end] : m_ranges) {
        out << sep << start << '-' << end;
        sep = ',';
    }
    return out.str();
}

TableCursor TableCursor::parse(const std::string& text) {
    auto semicolon = text.find(';');
    TableCursor cursor(parseNumber(text.substr(0, semicolon)));
    if (semicolon == std::string::npos) {
        return cursor;
    }

    std::stringstream ranges(text.substr(semicolon + 1));
    std::string item;
    while (std::getline(ranges, item, ',')) {
        if (trim(item).empty()) continue;
        auto dash = item.find('-');
        if (dash == std::string::npos) {
            throw std::invalid_argument("invalid committed range '" + item + "'");
        }
        uint64_t start = parseNumber(item.substr(0, dash));
        uint64_t end = parseNumber(item.substr(dash + 1));
        if (end <= start) {
            throw std::invalid_argument("empty committed range '" + item + "'");
        }
        cursor.markCommitted(start, end);
    }
    return cursor;
}

// ============================================================================
// MigrationStateFile
// ============================================================================

CursorMap MigrationStateFile::load(const std::filesystem::path& path) {
    CursorMap cursors;

    std::ifstream file(path);
    if (!file) {
        spdlog::info("No migration state at {}, starting from the beginning", path.string());
        return cursors;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.rfind('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::runtime_error(path.string() + ":" + std::to_string(lineNo) +
                                     ": expected table=offset");
        }

        std::string table = trim(line.substr(0, eq));
        try {
            cursors[table] = TableCursor::parse(line.substr(eq + 1));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(path.string() + ":" + std::to_string(lineNo) + ": " + e.what());
        }
    }

    spdlog::info("Loaded migration state for {} table(s) from {}", cursors.size(), path.string());
    return cursors;
}

void MigrationStateFile::save(const std::filesystem::path& path, const CursorMap& cursors) {
    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("cannot write migration state to " + tmp.string());
        }
        file << "# sqlbridge migration state: table=committed_offset[;start-end,...]\n";
        for (const auto& [table, cursor] : cursors) {
            file << table << '=' << cursor.serialize() << '\n';
        }
        file.flush();
        if (!file) {
            throw std::runtime_error("failed writing migration state to " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw std::runtime_error("cannot replace " + path.string() + ": " + ec.message());
    }
    spdlog::debug("Saved migration state to {}", path.string());
}

}  // namespace sqlbridge
