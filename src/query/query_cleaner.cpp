#include "query/query_cleaner.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>

namespace querygate {

namespace {

// ============================================================================
// Character classification
// ============================================================================

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

inline bool is_ident_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') ||
           (u >= '0' && u <= '9') || u == '_';
}

inline bool is_quote(char c) {
    return c == '\'' || c == '"' || c == '`';
}

// Backslash escapes apply to string literals only, never to `identifiers`.
inline bool is_backslash_escape(std::string_view s, size_t i, char quote_char, bool enabled) {
    return enabled && quote_char != '`' && s[i] == '\\' && i + 1 < s.size();
}

// ============================================================================
// Stage 1: byte filtering
// ============================================================================

struct FilterCounts {
    size_t control = 0;
    size_t smart = 0;
};

/**
 * @brief Length of a smart-punctuation UTF-8 sequence starting at i, or 0
 *
 * U+00A0, U+200B, U+2013, U+2014, U+2018, U+2019, U+201C, U+201D, U+2026, U+FEFF
 */
size_t smart_punctuation_length(std::string_view s, size_t i) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 == 0xC2 && i + 1 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0xA0) {
        return 2;
    }
    if (i + 2 >= s.size()) return 0;
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    const auto b2 = static_cast<unsigned char>(s[i + 2]);
    if (b0 == 0xE2 && b1 == 0x80) {
        switch (b2) {
            case 0x8B: case 0x93: case 0x94: case 0x98:
            case 0x99: case 0x9C: case 0x9D: case 0xA6:
                return 3;
            default:
                return 0;
        }
    }
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) return 3;
    return 0;
}

std::string filter_bytes(std::string_view raw, FilterCounts& counts) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size();) {
        const auto c = static_cast<unsigned char>(raw[i]);
        if ((c < 0x20 && !is_space(raw[i])) || c == 0x7F) {
            ++counts.control;
            ++i;
            continue;
        }
        if (const size_t n = smart_punctuation_length(raw, i); n > 0) {
            ++counts.smart;
            i += n;
            continue;
        }
        out += raw[i++];
    }
    return out;
}

// ============================================================================
// Stage 2: comment removal and statement splitting
// ============================================================================

enum class State {
    NORMAL,
    IN_QUOTE,            // '...', "..." or `...`, closing char in quote_char
    IN_LINE_COMMENT,     // -- up to newline
    IN_BLOCK_COMMENT     // /* ... */, nested
};

struct SplitResult {
    std::vector<std::string> statements;
    bool unterminated_comment = false;
};

// "GO" alone on a line (surrounding spaces/tabs allowed) starting at i.
// Returns the index just past the line content, or npos.
size_t match_go_line(std::string_view s, size_t i) {
    if (i + 1 >= s.size() || !utils::iequals(s.substr(i, 2), "GO")) {
        return std::string_view::npos;
    }
    size_t j = i + 2;
    while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\r')) ++j;
    if (j < s.size() && s[j] != '\n') return std::string_view::npos;
    return j;
}

constexpr std::array<std::string_view, 37> kStatementKeywords = {
    "SELECT", "WITH", "VALUES", "EXPLAIN", "SHOW", "DESCRIBE",
    "INSERT", "UPDATE", "MERGE", "REPLACE", "UPSERT",
    "DELETE", "TRUNCATE", "CREATE", "DROP", "ALTER", "GRANT", "REVOKE",
    "EXEC", "EXECUTE", "CALL", "SET", "RESET", "ATTACH", "DETACH",
    "PRAGMA", "INSTALL", "LOAD", "COPY",
    "DECLARE", "USE", "PRINT", "BEGIN", "COMMIT", "ROLLBACK", "IF", "WHILE",
};

// A GO line separates batches only between two statements: some text must
// precede it, and what follows must be empty or open a new statement. A
// column called "go" on its own line stays part of the query.
bool separates_batches(std::string_view before, std::string_view after) {
    if (utils::trim(before).empty()) {
        return false;
    }
    const std::string keyword = QueryCleaner::leading_keyword(after);
    if (keyword.empty()) {
        return utils::trim(after).empty();
    }
    return std::find(kStatementKeywords.begin(), kStatementKeywords.end(), keyword)
        != kStatementKeywords.end();
}

SplitResult split_statements(std::string_view s, bool backslash_escapes) {
    SplitResult result;
    std::string current;
    current.reserve(s.size());

    State state = State::NORMAL;
    char quote_char = 0;
    int comment_depth = 0;
    bool line_blank = true;

    const auto finish_statement = [&] {
        result.statements.push_back(utils::trim(current));
        current.clear();
    };

    const size_t len = s.size();
    size_t i = 0;
    while (i < len) {
        const char c = s[i];
        const char next = (i + 1 < len) ? s[i + 1] : '\0';

        switch (state) {
            case State::NORMAL:
                if (c == '-' && next == '-') {
                    state = State::IN_LINE_COMMENT;
                    i += 2;
                } else if (c == '/' && next == '*') {
                    state = State::IN_BLOCK_COMMENT;
                    comment_depth = 1;
                    i += 2;
                } else if (c == ';') {
                    finish_statement();
                    line_blank = true;
                    ++i;
                } else if (line_blank && (c == 'G' || c == 'g')) {
                    if (const size_t end = match_go_line(s, i);
                        end != std::string_view::npos && separates_batches(current, s.substr(end))) {
                        finish_statement();
                        i = end;
                    } else {
                        current += c;
                        line_blank = false;
                        ++i;
                    }
                } else {
                    if (is_quote(c)) {
                        state = State::IN_QUOTE;
                        quote_char = c;
                    }
                    if (c == '\n') {
                        line_blank = true;
                    } else if (!is_space(c)) {
                        line_blank = false;
                    }
                    current += c;
                    ++i;
                }
                break;

            case State::IN_QUOTE:
                current += c;
                if (is_backslash_escape(s, i, quote_char, backslash_escapes)) {
                    current += next;
                    i += 2;
                    break;
                }
                if (c == quote_char) {
                    if (next == quote_char) {
                        // Doubled quote is an escaped quote character
                        current += next;
                        i += 2;
                        break;
                    }
                    state = State::NORMAL;
                }
                ++i;
                break;

            case State::IN_LINE_COMMENT:
                if (c == '\n') {
                    state = State::NORMAL;
                    current += '\n';
                    line_blank = true;
                }
                ++i;
                break;

            case State::IN_BLOCK_COMMENT:
                if (c == '/' && next == '*') {
                    ++comment_depth;
                    i += 2;
                } else if (c == '*' && next == '/') {
                    i += 2;
                    if (--comment_depth == 0) {
                        state = State::NORMAL;
                        current += ' ';
                    }
                } else {
                    ++i;
                }
                break;
        }
    }

    result.unterminated_comment = (state == State::IN_BLOCK_COMMENT);
    finish_statement();
    return result;
}

// ============================================================================
// Stage 3: quote / parenthesis balance
// ============================================================================

struct Balance {
    char open_quote = 0;     // Quote char left open at end of text, or 0
    int paren_depth = 0;     // Net '(' minus ')' outside quotes
};

Balance scan_balance(std::string_view s, bool backslash_escapes) {
    Balance b;
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (b.open_quote) {
            if (is_backslash_escape(s, i, b.open_quote, backslash_escapes)) {
                ++i;
            } else if (c == b.open_quote) {
                if (i + 1 < s.size() && s[i + 1] == b.open_quote) {
                    ++i;
                } else {
                    b.open_quote = 0;
                }
            }
        } else if (is_quote(c)) {
            b.open_quote = c;
        } else if (c == '(') {
            ++b.paren_depth;
        } else if (c == ')') {
            --b.paren_depth;
        }
    }
    return b;
}

const char* quote_name(char q) {
    switch (q) {
        case '\'': return "single quote";
        case '"':  return "double quote";
        default:   return "backtick";
    }
}

} // anonymous namespace

// ============================================================================
// CleanResult
// ============================================================================

bool CleanResult::has_warning(CleaningWarning::Kind kind) const {
    for (const auto& w : warnings) {
        if (w.kind == kind) return true;
    }
    return false;
}

// ============================================================================
// QueryCleaner
// ============================================================================

CleanResult QueryCleaner::clean(std::string_view raw) const {
    CleanResult result;
    const auto warn = [&result](CleaningWarning::Kind kind, std::string message) {
        utils::log::warn(std::format("Query cleaning: {}", message));
        result.warnings.push_back({kind, std::move(message)});
    };

    FilterCounts counts;
    const std::string filtered = filter_bytes(raw, counts);
    if (counts.control > 0) {
        warn(CleaningWarning::Kind::CONTROL_CHARACTERS,
             std::format("Removed {} non-printable control character(s)", counts.control));
    }
    if (counts.smart > 0) {
        warn(CleaningWarning::Kind::SMART_PUNCTUATION,
             std::format("Removed {} smart punctuation character(s)", counts.smart));
    }

    auto split = split_statements(filtered, config_.backslash_escapes);
    if (split.unterminated_comment) {
        warn(CleaningWarning::Kind::UNTERMINATED_COMMENT,
             "Unterminated block comment removed to end of query");
    }

    auto& statements = split.statements;

    // A trailing run of terminators leaves empty statements at the back.
    size_t trailing_terminators = 0;
    while (statements.size() > 1 && statements.back().empty()) {
        statements.pop_back();
        ++trailing_terminators;
    }
    if (trailing_terminators > 1) {
        warn(CleaningWarning::Kind::EXTRA_TERMINATORS,
             std::format("Collapsed {} trailing statement terminators", trailing_terminators));
    }

    size_t ignored = 0;
    for (size_t i = 1; i < statements.size(); ++i) {
        if (!statements[i].empty()) ++ignored;
    }

    std::string query = std::move(statements.front());
    if (query.empty()) {
        if (ignored > 0) {
            throw CleaningError(
                "Query begins with an empty statement; refusing to run the statements that follow it",
                std::string(raw.substr(0, 100)));
        }
        return result;
    }
    if (ignored > 0) {
        warn(CleaningWarning::Kind::MULTIPLE_STATEMENTS,
             std::format("Multiple SQL statements detected; only the first statement will be used "
                         "(ignored {} additional statement(s))", ignored));
    }

    const Balance balance = scan_balance(query, config_.backslash_escapes);
    if (balance.open_quote) {
        while (!query.empty() && is_space(query.back())) query.pop_back();
        query += balance.open_quote;
        warn(CleaningWarning::Kind::UNBALANCED_QUOTE,
             std::format("Unbalanced {}; appended a closing {}",
                         quote_name(balance.open_quote), quote_name(balance.open_quote)));
    }

    result.pre_repair_query = query;

    if (balance.paren_depth > 0) {
        query.append(static_cast<size_t>(balance.paren_depth), ')');
        warn(CleaningWarning::Kind::UNBALANCED_PARENTHESES,
             std::format("Unbalanced parentheses; appended {} closing parenthesis(es)",
                         balance.paren_depth));
    } else if (balance.paren_depth < 0) {
        warn(CleaningWarning::Kind::UNBALANCED_PARENTHESES,
             std::format("Unbalanced parentheses: {} more ')' than '('",
                         -balance.paren_depth));
    }

    if (config_.enforce_select) {
        const std::string keyword = leading_keyword(query);
        if (keyword != "SELECT") {
            const std::string fragment = keyword.empty() ? query.substr(0, 20) : keyword;
            throw NotASelectError(
                std::format("Query must be a SELECT statement, but starts with '{}'", fragment),
                fragment);
        }
    }

    result.query = std::move(query);
    return result;
}

std::string QueryCleaner::leading_keyword(std::string_view sql) {
    size_t i = 0;
    const size_t len = sql.size();
    while (i < len) {
        if (is_space(sql[i]) || sql[i] == '(') {
            ++i;
        } else if (sql.substr(i, 2) == "--") {
            const size_t nl = sql.find('\n', i);
            i = (nl == std::string_view::npos) ? len : nl + 1;
        } else if (sql.substr(i, 2) == "/*") {
            int depth = 0;
            while (i < len) {
                if (sql.substr(i, 2) == "/*") {
                    ++depth;
                    i += 2;
                } else if (sql.substr(i, 2) == "*/") {
                    i += 2;
                    if (--depth == 0) break;
                } else {
                    ++i;
                }
            }
        } else {
            break;
        }
    }

    const size_t start = i;
    while (i < len && is_ident_char(sql[i])) ++i;
    return utils::to_upper(sql.substr(start, i - start));
}

} // namespace querygate
