#include "Value.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace sqlbridge {

namespace {

const std::vector<std::string>& emptyColumns() {
    static const std::vector<std::string> empty;
    return empty;
}

}  // namespace

std::string valueToString(const Value& v) {
    struct Visitor {
        std::string operator()(std::nullptr_t) const { return "NULL"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.17g", d);
            return buf;
        }
        std::string operator()(const std::string& s) const { return s; }
        std::string operator()(const Blob& b) const {
            static const char kHex[] = "0123456789abcdef";
            std::string out = "\\x";
            out.reserve(2 + b.size() * 2);
            for (uint8_t byte : b) {
                out += kHex[byte >> 4];
                out += kHex[byte & 0x0f];
            }
            return out;
        }
    };
    return std::visit(Visitor{}, v);
}

Row::Row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<Value> values)
    : m_columns(std::move(columns)), m_values(std::move(values)) {}

const std::vector<std::string>& Row::columns() const {
    return m_columns ? *m_columns : emptyColumns();
}

const Value& Row::at(size_t index) const {
    if (index >= m_values.size()) {
        throw std::out_of_range("column index " + std::to_string(index) + " out of range");
    }
    return m_values[index];
}

const Value& Row::at(const std::string& column) const {
    const auto& cols = columns();
    auto it = std::find(cols.begin(), cols.end(), column);
    if (it == cols.end()) {
        throw std::out_of_range("unknown column: " + column);
    }
    return at(static_cast<size_t>(it - cols.begin()));
}

int64_t Row::getInt64(size_t index) const {
    const Value& v = at(index);
    if (auto i = std::get_if<int64_t>(&v)) return *i;
    if (auto d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    if (auto s = std::get_if<std::string>(&v)) return std::stoll(*s);
    return 0;
}

double Row::getDouble(size_t index) const {
    const Value& v = at(index);
    if (auto d = std::get_if<double>(&v)) return *d;
    if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    if (auto s = std::get_if<std::string>(&v)) return std::stod(*s);
    return 0.0;
}

std::string Row::getString(size_t index) const {
    const Value& v = at(index);
    if (sqlbridge::isNull(v)) return "";
    return valueToString(v);
}

std::vector<Row> RowStream::all() {
    std::vector<Row> rows;
    while (next()) {
        rows.push_back(row());
    }
    return rows;
}

}  // namespace sqlbridge
