#include "PostgreSQLConnection.hpp"
#include "PostgreSQLConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <vector>

namespace sqlbridge {

namespace {

constexpr Oid BYTEAOID = 17;

// Text form accepted by the PostgreSQL input functions
std::string parameterText(const Value& value) {
    if (auto d = std::get_if<double>(&value)) {
        if (std::isnan(*d)) return "NaN";
        if (std::isinf(*d)) return *d > 0 ? "Infinity" : "-Infinity";
    }
    return valueToString(value);
}

}  // namespace

PostgreSQLConnection::PostgreSQLConnection(std::shared_ptr<PostgreSQLConnectionPool> pool, PGconn* conn)
    : m_pool(std::move(pool)), m_conn(conn) {
}

PostgreSQLConnection::~PostgreSQLConnection() {
    release();
}

bool PostgreSQLConnection::isValid() const {
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

bool PostgreSQLConnection::ping() {
    if (!isValid()) return false;

    // Try a simple query to check connection
    PostgreSQLResultSet rs(PQexec(m_conn, "SELECT 1"));
    return rs.hasData();
}

PostgreSQLResultSet PostgreSQLConnection::execute(const std::string& sql) {
    if (!m_conn) {
        throw ConnectionError("PostgreSQL connection has been released");
    }
    return check(PQexec(m_conn, sql.c_str()), sql);
}

PostgreSQLResultSet PostgreSQLConnection::executeParams(const std::string& sql, const Params& params) {
    if (!m_conn) {
        throw ConnectionError("PostgreSQL connection has been released");
    }
    if (params.empty()) {
        return check(PQexecParams(m_conn, sql.c_str(), 0, nullptr, nullptr, nullptr, nullptr, 0), sql);
    }

    int nParams = static_cast<int>(params.size());
    std::vector<std::string> text(params.size());
    std::vector<const char*> values(params.size(), nullptr);
    std::vector<Oid> types(params.size(), 0);
    std::vector<int> lengths(params.size(), 0);
    std::vector<int> formats(params.size(), 0);

    for (size_t i = 0; i < params.size(); ++i) {
        const Value& param = params[i];
        if (isNull(param)) {
            continue;
        }
        if (auto blob = std::get_if<Blob>(&param)) {
            // Binary bytea avoids escaping
            // libpq reads a null value pointer as SQL NULL, even for an empty bytea
            values[i] = blob->empty() ? "" : reinterpret_cast<const char*>(blob->data());
            lengths[i] = static_cast<int>(blob->size());
            formats[i] = 1;
            types[i] = BYTEAOID;
            continue;
        }
        text[i] = parameterText(param);
        values[i] = text[i].c_str();
    }

    PGresult* res = PQexecParams(m_conn, sql.c_str(), nParams, types.data(),
                                 values.data(), lengths.data(), formats.data(), 0);
    return check(res, sql);
}

PostgreSQLResultSet PostgreSQLConnection::check(PGresult* res, const std::string& sql) {
    PostgreSQLResultSet rs(res);
    if (rs.isOk()) {
        return rs;
    }

    if (PQstatus(m_conn) != CONNECTION_OK) {
        m_broken = true;
        std::string message = PQerrorMessage(m_conn);
        while (!message.empty() && message.back() == '\n') message.pop_back();
        spdlog::warn("PostgreSQL connection lost: {}", message);
        // connection_failure, so the statement classifies as retryable
        throw QueryError("PostgreSQL connection lost: " + message, 0, "08006");
    }

    spdlog::debug("PostgreSQL statement failed: {}", sql);
    rs.throwIfError(std::string("PostgreSQL statement failed: ") + PQerrorMessage(m_conn));
    return rs;
}

const char* PostgreSQLConnection::error() const {
    if (!m_conn) return "No connection";
    return PQerrorMessage(m_conn);
}

PGTransactionStatusType PostgreSQLConnection::transactionStatus() const {
    if (!m_conn) return PQTRANS_UNKNOWN;
    return PQtransactionStatus(m_conn);
}

void PostgreSQLConnection::release() {
    if (m_pool && m_conn) {
        m_pool->releaseConnection(m_conn, m_broken);
    }
    m_conn = nullptr;
    m_pool.reset();
}

}  // namespace sqlbridge
