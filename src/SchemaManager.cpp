#include "SchemaManager.hpp"
#include "Driver.hpp"
#include "SqlScanner.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace sqlbridge {

namespace {

// First line of a statement, for log messages
std::string headline(const std::string& statement) {
    auto end = statement.find('\n');
    std::string line = statement.substr(0, end);
    if (line.size() > 80) {
        line = line.substr(0, 77) + "...";
    }
    return line;
}

}  // namespace

SchemaManager::SchemaManager(Driver& driver, std::filesystem::path schemaDir)
    : m_driver(driver), m_schemaDir(std::move(schemaDir)) {
}

std::filesystem::path SchemaManager::selectSource() const {
    std::error_code ec;

    auto dialectFile = m_schemaDir / ("schema." + m_driver.dialect() + ".sql");
    if (std::filesystem::is_regular_file(dialectFile, ec)) {
        return dialectFile;
    }

    auto genericFile = m_schemaDir / "schema.sql";
    if (std::filesystem::is_regular_file(genericFile, ec)) {
        return genericFile;
    }

    throw SchemaError("no schema source found: neither " + dialectFile.string() +
                      " nor " + genericFile.string() + " exists");
}

std::vector<std::string> SchemaManager::splitStatements(const std::string& text) {
    return SqlScanner::splitStatements(text);
}

SchemaReport SchemaManager::apply() {
    auto source = selectSource();

    std::ifstream file(source);
    if (!file) {
        throw SchemaError("failed to read schema source " + source.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    return applySource(buffer.str(), source);
}

SchemaReport SchemaManager::applySource(const std::string& text, const std::filesystem::path& origin) {
    ErrorContext ctx("schema " + origin.string());

    SchemaReport report;
    report.source = origin;

    auto statements = splitStatements(text);
    report.statements = statements.size();

    for (size_t i = 0; i < statements.size(); ++i) {
        const std::string& statement = statements[i];
        try {
            m_driver.execute(statement);
            ++report.executed;
            spdlog::debug("Schema statement {} applied: {}", i, headline(statement));
        } catch (const QueryError& e) {
            if (m_driver.isAlreadyExists(e)) {
                ++report.skippedExisting;
                spdlog::debug("Schema statement {} already applied: {}", i, headline(statement));
                continue;
            }
            spdlog::error("[{}] statement {} failed: {}", ErrorContext::current(), i, e.what());
            throw SchemaError("schema statement " + std::to_string(i) + " failed: " + e.what(),
                              static_cast<long>(i), statement);
        } catch (const ConnectionError& e) {
            throw SchemaError("schema statement " + std::to_string(i) + " could not run: " + e.what(),
                              static_cast<long>(i), statement);
        }
    }

    return report;
}

}  // namespace sqlbridge
