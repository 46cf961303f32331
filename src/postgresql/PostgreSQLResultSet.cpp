#include "PostgreSQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include <cstdlib>

namespace sqlbridge {

namespace {

// PostgreSQL OID constants for the types decoded natively
constexpr Oid BOOLOID = 16;
constexpr Oid BYTEAOID = 17;
constexpr Oid INT8OID = 20;
constexpr Oid INT2OID = 21;
constexpr Oid INT4OID = 23;
constexpr Oid FLOAT4OID = 700;
constexpr Oid FLOAT8OID = 701;

}  // namespace

PostgreSQLResultSet::PostgreSQLResultSet(PGresult* res) : m_res(res) {}

PostgreSQLResultSet::~PostgreSQLResultSet() {
    if (m_res) {
        PQclear(m_res);
    }
}

PostgreSQLResultSet::PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept
    : m_res(other.m_res) {
    other.m_res = nullptr;
}

PostgreSQLResultSet& PostgreSQLResultSet::operator=(PostgreSQLResultSet&& other) noexcept {
    if (this != &other) {
        if (m_res) {
            PQclear(m_res);
        }
        m_res = other.m_res;
        other.m_res = nullptr;
    }
    return *this;
}

bool PostgreSQLResultSet::isOk() const {
    if (!m_res) return false;
    ExecStatusType status = PQresultStatus(m_res);
    return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
}

bool PostgreSQLResultSet::hasData() const {
    return m_res && PQresultStatus(m_res) == PGRES_TUPLES_OK;
}

const char* PostgreSQLResultSet::errorMessage() const {
    return m_res ? PQresultErrorMessage(m_res) : "No result";
}

std::string PostgreSQLResultSet::sqlState() const {
    if (!m_res) return "";
    const char* state = PQresultErrorField(m_res, PG_DIAG_SQLSTATE);
    return state ? state : "";
}

void PostgreSQLResultSet::throwIfError(const std::string& fallback) const {
    if (isOk()) return;
    if (!m_res) {
        throw QueryError(fallback);
    }

    std::string message = errorMessage();
    // libpq messages end with a newline
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }
    if (message.empty()) {
        message = std::string(PQresStatus(PQresultStatus(m_res)));
    }
    throw QueryError(message, static_cast<int>(PQresultStatus(m_res)), sqlState());
}

int PostgreSQLResultSet::numFields() const {
    return m_res ? PQnfields(m_res) : 0;
}

int PostgreSQLResultSet::numRows() const {
    return m_res ? PQntuples(m_res) : 0;
}

int64_t PostgreSQLResultSet::affectedRows() const {
    if (!m_res) return 0;
    const char* affected = PQcmdTuples(m_res);
    if (!affected || !*affected) return 0;
    return std::strtoll(affected, nullptr, 10);
}

const char* PostgreSQLResultSet::getValue(int row, int col) const {
    if (!m_res) return nullptr;
    if (row < 0 || row >= numRows()) return nullptr;
    if (col < 0 || col >= numFields()) return nullptr;
    if (PQgetisnull(m_res, row, col)) return nullptr;
    return PQgetvalue(m_res, row, col);
}

Value PostgreSQLResultSet::getTypedValue(int row, int col) const {
    const char* raw = getValue(row, col);
    if (!raw) return nullptr;

    switch (fieldType(col)) {
        case INT2OID:
        case INT4OID:
        case INT8OID:
            return static_cast<int64_t>(std::strtoll(raw, nullptr, 10));
        case FLOAT4OID:
        case FLOAT8OID:
            return std::strtod(raw, nullptr);
        case BOOLOID:
            return static_cast<int64_t>(raw[0] == 't' ? 1 : 0);
        case BYTEAOID: {
            size_t len = 0;
            unsigned char* bytes = PQunescapeBytea(reinterpret_cast<const unsigned char*>(raw), &len);
            if (!bytes) {
                throw QueryError("failed to decode bytea value");
            }
            Blob blob(bytes, bytes + len);
            PQfreemem(bytes);
            return blob;
        }
        default:
            return std::string(raw, static_cast<size_t>(PQgetlength(m_res, row, col)));
    }
}

Oid PostgreSQLResultSet::fieldType(int col) const {
    if (!m_res || col < 0 || col >= numFields()) return InvalidOid;
    return PQftype(m_res, col);
}

std::vector<std::string> PostgreSQLResultSet::getColumnNames() const {
    std::vector<std::string> names;
    if (!m_res) return names;

    int nFields = PQnfields(m_res);
    names.reserve(nFields);

    for (int i = 0; i < nFields; ++i) {
        const char* name = PQfname(m_res, i);
        names.emplace_back(name ? name : "");
    }

    return names;
}

}  // namespace sqlbridge
