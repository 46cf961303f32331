#include "SqlScanner.hpp"
#include <algorithm>
#include <cctype>

namespace sqlbridge {

namespace {

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool isTagStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isTagChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Length of a $tag$ opener at pos, or 0. "$1" is a parameter, not a tag.
size_t dollarTagLength(std::string_view sql, size_t pos) {
    if (sql[pos] != '$') return 0;
    if (pos > 0 && isIdentChar(sql[pos - 1])) return 0;

    size_t i = pos + 1;
    if (i < sql.size() && isTagStart(sql[i])) {
        while (i < sql.size() && isTagChar(sql[i])) ++i;
    }
    if (i < sql.size() && sql[i] == '$') {
        return i - pos + 1;
    }
    return 0;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(start, end - start + 1);
}

}  // namespace

std::vector<SqlScanner::Segment> SqlScanner::scan(std::string_view sql, bool backticks) {
    std::vector<Segment> segments;
    const size_t n = sql.size();
    size_t codeStart = 0;
    size_t i = 0;

    while (i < n) {
        const char c = sql[i];
        const size_t start = i;
        size_t end = 0;
        SegmentKind kind = SegmentKind::Code;

        if (c == '\'') {
            // E'...' enables backslash escapes (PostgreSQL)
            bool backslash = start > 0 && (sql[start - 1] == 'E' || sql[start - 1] == 'e') &&
                             (start < 2 || !isIdentChar(sql[start - 2]));
            end = i + 1;
            while (end < n) {
                if (backslash && sql[end] == '\\') {
                    end += 2;
                    continue;
                }
                if (sql[end] == '\'') {
                    if (end + 1 < n && sql[end + 1] == '\'') {
                        end += 2;
                        continue;
                    }
                    ++end;
                    break;
                }
                ++end;
            }
            end = std::min(end, n);
            kind = SegmentKind::SingleQuoted;
        } else if (c == '"' || (backticks && c == '`')) {
            end = i + 1;
            while (end < n) {
                if (sql[end] == c) {
                    if (end + 1 < n && sql[end + 1] == c) {
                        end += 2;
                        continue;
                    }
                    ++end;
                    break;
                }
                ++end;
            }
            end = std::min(end, n);
            kind = SegmentKind::DoubleQuoted;
        } else if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
            // The newline stays in the following code segment
            end = sql.find('\n', i);
            if (end == std::string_view::npos) end = n;
            kind = SegmentKind::LineComment;
        } else if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
            int depth = 1;
            end = i + 2;
            while (end < n && depth > 0) {
                if (sql[end] == '/' && end + 1 < n && sql[end + 1] == '*') {
                    ++depth;
                    end += 2;
                } else if (sql[end] == '*' && end + 1 < n && sql[end + 1] == '/') {
                    --depth;
                    end += 2;
                } else {
                    ++end;
                }
            }
            kind = SegmentKind::BlockComment;
        } else if (size_t tagLen = dollarTagLength(sql, i)) {
            std::string_view tag = sql.substr(i, tagLen);
            size_t close = sql.find(tag, i + tagLen);
            end = (close == std::string_view::npos) ? n : close + tagLen;
            kind = SegmentKind::DollarQuoted;
        } else {
            ++i;
            continue;
        }

        if (start > codeStart) {
            segments.push_back({SegmentKind::Code, sql.substr(codeStart, start - codeStart)});
        }
        segments.push_back({kind, sql.substr(start, end - start)});
        i = end;
        codeStart = end;
    }

    if (n > codeStart) {
        segments.push_back({SegmentKind::Code, sql.substr(codeStart)});
    }
    return segments;
}

std::vector<std::string> SqlScanner::splitStatements(std::string_view sql) {
    std::vector<std::string> statements;
    std::string current;

    auto finish = [&statements, &current]() {
        std::string stmt = trim(current);
        if (!stmt.empty()) {
            statements.push_back(std::move(stmt));
        }
        current.clear();
    };

    for (const auto& seg : scan(sql)) {
        switch (seg.kind) {
            case SegmentKind::Code:
                for (char ch : seg.text) {
                    if (ch == ';') {
                        finish();
                    } else {
                        current += ch;
                    }
                }
                break;
            case SegmentKind::LineComment:
                break;
            case SegmentKind::BlockComment:
                current += ' ';
                break;
            default:
                current.append(seg.text);
                break;
        }
    }
    finish();

    return statements;
}

std::string SqlScanner::rewritePlaceholders(std::string_view sql) {
    std::string out;
    out.reserve(sql.size() + 8);
    size_t index = 0;

    for (const auto& seg : scan(sql, false)) {
        if (seg.kind != SegmentKind::Code) {
            out.append(seg.text);
            continue;
        }
        for (char ch : seg.text) {
            if (ch == '?') {
                out += '$';
                out += std::to_string(++index);
            } else {
                out += ch;
            }
        }
    }
    return out;
}

size_t SqlScanner::countPlaceholders(std::string_view sql) {
    size_t count = 0;
    for (const auto& seg : scan(sql)) {
        if (seg.kind == SegmentKind::Code) {
            count += static_cast<size_t>(std::count(seg.text.begin(), seg.text.end(), '?'));
        }
    }
    return count;
}

}  // namespace sqlbridge
