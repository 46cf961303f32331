#pragma once

/**
 * @file SqlScanner.hpp
 * @brief Literal-aware lexical scanning of SQL text.
 *
 * Splits SQL into code and non-code segments (string literals, quoted
 * identifiers, comments, dollar-quoted bodies) so that statement
 * terminators and placeholders are only recognised in code.
 */

#include <string>
#include <string_view>
#include <vector>

namespace sqlbridge {

class SqlScanner {
public:
    enum class SegmentKind {
        Code,
        SingleQuoted,   ///< 'text' with '' escapes, E'text' with backslash escapes
        DoubleQuoted,   ///< "identifier", or `identifier` when backticks quote
        LineComment,    ///< -- to end of line
        BlockComment,   ///< /* ... */, nesting allowed
        DollarQuoted    ///< $tag$ ... $tag$
    };

    struct Segment {
        SegmentKind kind;
        std::string_view text;
    };

    /**
     * @brief Break SQL into consecutive segments covering the whole input.
     *
     * An unterminated literal or comment runs to the end of the input.
     * SQLite accepts `identifier`; PostgreSQL has no backtick quoting, so
     * with backticks = false a backtick is ordinary code.
     */
    static std::vector<Segment> scan(std::string_view sql, bool backticks = true);

    /**
     * @brief Split on ';' outside literals and comments.
     *
     * Comments are removed, each statement is trimmed, and blank statements
     * are dropped. Terminators are not included in the output.
     */
    static std::vector<std::string> splitStatements(std::string_view sql);

    /**
     * @brief Replace each '?' in code segments with $1, $2, ... left to right.
     *
     * Text inside literals, quoted identifiers, comments and dollar-quoted
     * bodies is copied unchanged. Input without placeholders is returned as is.
     * The output is PostgreSQL, so backticks do not quote.
     */
    static std::string rewritePlaceholders(std::string_view sql);

    // Number of '?' placeholders in code segments
    static size_t countPlaceholders(std::string_view sql);
};

}  // namespace sqlbridge
