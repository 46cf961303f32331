#pragma once

/**
 * @file Value.hpp
 * @brief Backend-neutral SQL values, rows and statement results.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace sqlbridge {

using Blob = std::vector<uint8_t>;

/**
 * @brief A single SQL value: NULL, integer, real, text or blob.
 *
 * Parameters are bound from Values and result columns are decoded into
 * Values, so rows read from one backend can be written to the other
 * without conversion by the caller.
 */
using Value = std::variant<std::nullptr_t, int64_t, double, std::string, Blob>;

using Params = std::vector<Value>;

inline bool isNull(const Value& v) { return std::holds_alternative<std::nullptr_t>(v); }

// Text rendering for logs and PostgreSQL text parameters (blobs as \x hex)
std::string valueToString(const Value& v);

class Row {
public:
    Row() = default;
    Row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<Value> values);

    size_t size() const { return m_values.size(); }
    const std::vector<std::string>& columns() const;
    const std::vector<Value>& values() const { return m_values; }

    // Throws std::out_of_range on a bad index or unknown column
    const Value& at(size_t index) const;
    const Value& at(const std::string& column) const;

    int64_t getInt64(size_t index) const;
    double getDouble(size_t index) const;
    std::string getString(size_t index) const;
    bool isNull(size_t index) const { return sqlbridge::isNull(at(index)); }

private:
    std::shared_ptr<const std::vector<std::string>> m_columns;
    std::vector<Value> m_values;
};

struct ExecResult {
    int64_t rowsAffected = 0;
    int64_t lastInsertId = 0;  ///< SQLite rowid; always 0 on PostgreSQL
};

/**
 * @class RowStream
 * @brief Forward-only cursor over a query result.
 *
 * A stream keeps its pooled connection until it is exhausted or destroyed.
 * On SQLite, where the pool holds a single connection, no other statement
 * can run on the same driver while a stream is open.
 */
class RowStream {
public:
    virtual ~RowStream() = default;

    RowStream(const RowStream&) = delete;
    RowStream& operator=(const RowStream&) = delete;

    // Advance to the next row; false when the result is exhausted
    virtual bool next() = 0;

    // Current row; valid after next() returned true
    virtual const Row& row() const = 0;

    virtual const std::vector<std::string>& columns() const = 0;

    // Drain the remaining rows
    std::vector<Row> all();

protected:
    RowStream() = default;
};

}  // namespace sqlbridge
