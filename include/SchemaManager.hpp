#pragma once

/**
 * @file SchemaManager.hpp
 * @brief Idempotent application of a dialect's schema file.
 */

#include <filesystem>
#include <string>
#include <vector>

namespace sqlbridge {

class Driver;

struct SchemaReport {
    std::filesystem::path source;  ///< File the statements were read from
    size_t statements = 0;         ///< Statements found in the source
    size_t executed = 0;           ///< Statements that ran successfully
    size_t skippedExisting = 0;    ///< Statements rejected as "already exists"
};

/**
 * @class SchemaManager
 * @brief Applies schema.<dialect>.sql (or schema.sql) through a driver.
 *
 * Every statement is executed on every call; nothing records which ones
 * ran before. Re-application is safe because the engine rejects duplicate
 * creation and the driver classifies that rejection as "already exists",
 * which is skipped. Any other failure aborts with a SchemaError carrying
 * the index and text of the failing statement; statements before it stay
 * applied.
 *
 * Statements run in source order with no dependency analysis.
 */
class SchemaManager {
public:
    SchemaManager(Driver& driver, std::filesystem::path schemaDir);

    /**
     * @brief Pick the schema file for the driver's dialect.
     * @throws SchemaError when neither schema.<dialect>.sql nor schema.sql exists.
     */
    std::filesystem::path selectSource() const;

    // Literal-aware split on ';' with comments and blank statements removed
    static std::vector<std::string> splitStatements(const std::string& text);

    /**
     * @brief Read the selected source and apply it.
     * @throws SchemaError on an unreadable file or a failing statement.
     */
    SchemaReport apply();

    // Apply statements from an in-memory source
    SchemaReport applySource(const std::string& text, const std::filesystem::path& origin = {});

private:
    Driver& m_driver;
    std::filesystem::path m_schemaDir;
};

}  // namespace sqlbridge
