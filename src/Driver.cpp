#include "Driver.hpp"
#include "SchemaManager.hpp"
#include <spdlog/spdlog.h>

namespace sqlbridge {

std::optional<Row> Transaction::queryOne(const std::string& sql, const Params& params) {
    auto stream = query(sql, params);
    if (!stream->next()) {
        return std::nullopt;
    }
    return stream->row();
}

std::optional<Row> Driver::queryOne(const std::string& sql, const Params& params) {
    auto stream = query(sql, params);
    if (!stream->next()) {
        return std::nullopt;
    }
    return stream->row();
}

void Driver::initializeSchema() {
    requireConnected();

    SchemaManager manager(*this, m_config.schema_dir);
    auto report = manager.apply();
    spdlog::info("Schema {} applied to {} database: {} executed, {} already present",
                 report.source.string(), dialect(), report.executed, report.skippedExisting);
}

std::string Driver::quoteIdentifier(const std::string& identifier) {
    std::string result = "\"";
    for (char c : identifier) {
        if (c == '"') result += "\"\"";
        else result += c;
    }
    result += "\"";
    return result;
}

void Driver::requireConnected() const {
    switch (m_state.load()) {
        case State::Connected:
            return;
        case State::Closed:
            throw ConnectionError(dialect() + " driver is closed");
        default:
            throw ConnectionError(dialect() + " driver is not connected");
    }
}

void Driver::requireConnectable() const {
    switch (m_state.load()) {
        case State::Disconnected:
            return;
        case State::Closed:
            throw ConnectionError(dialect() + " driver is closed and can not be reconnected");
        default:
            throw ConnectionError(dialect() + " driver is already connected");
    }
}

}  // namespace sqlbridge
