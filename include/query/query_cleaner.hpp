#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace querygate {

/**
 * @brief Recoverable irregularity found while cleaning
 */
struct CleaningWarning {
    enum class Kind {
        CONTROL_CHARACTERS,
        SMART_PUNCTUATION,
        UNTERMINATED_COMMENT,
        EXTRA_TERMINATORS,
        MULTIPLE_STATEMENTS,
        UNBALANCED_QUOTE,
        UNBALANCED_PARENTHESES
    };

    Kind kind;
    std::string message;
};

/**
 * @brief Outcome of QueryCleaner::clean()
 *
 * query is std::nullopt when nothing executable remains ("no executable
 * content"), which callers treat as the identity query.
 */
struct CleanResult {
    std::optional<std::string> query;
    std::string pre_repair_query;       // Cleaned text before ')' auto-repair
    std::vector<CleaningWarning> warnings;

    [[nodiscard]] bool has_content() const { return query.has_value(); }
    [[nodiscard]] bool has_warning(CleaningWarning::Kind kind) const;
};

/**
 * @brief Normalizes raw, LLM-authored SQL into a single clean statement
 *
 * Pipeline (one lexer pass plus a balance scan):
 * - Remove non-printable control bytes and smart punctuation
 * - Remove -- and nested block comments outside quoted regions
 * - Split on top-level ';' and T-SQL "GO" lines, keep the first statement
 * - Close a dangling quote, append missing ')'
 * - Optionally require a leading SELECT
 *
 * Cleaning is idempotent: cleaning an already-cleaned query returns it unchanged.
 *
 * Thread-safety: stateless after construction, safe to share.
 */
class QueryCleaner {
public:
    struct Config {
        bool enforce_select = false;
        bool backslash_escapes = false;  // MySQL: \' and \" inside a string do not close it
    };

    QueryCleaner() = default;
    explicit QueryCleaner(const Config& config) : config_(config) {}

    /**
     * @brief Clean raw query text
     * @throws CleaningError when the first statement is empty but later ones are not
     * @throws NotASelectError when enforce_select is set and the query is not a SELECT
     */
    [[nodiscard]] CleanResult clean(std::string_view raw) const;

    /**
     * @brief First keyword of a statement, upper-cased
     *
     * Skips leading whitespace, '(' and comments. Returns "" when the text
     * does not start with an identifier character.
     */
    [[nodiscard]] static std::string leading_keyword(std::string_view sql);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace querygate
