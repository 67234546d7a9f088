#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace querygate {

/**
 * @brief Error kinds surfaced to the tool layer
 */
enum class ErrorKind {
    CLEANING_ERROR,
    POLICY_VIOLATION,
    NOT_A_SELECT,
    TABLE_NOT_FOUND,
    COLUMN_MISMATCH,
    BACKEND_EXECUTION,
    CONFIGURATION_ERROR,
    SOURCE_RELEASED
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);

/**
 * @brief Base of every gateway error
 *
 * Structured as {kind, message, offending_fragment?} so an orchestrating
 * layer can relay it to the LLM without parsing text.
 */
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message,
                 std::optional<std::string> offending_fragment = std::nullopt)
        : std::runtime_error(message),
          kind_(kind),
          offending_fragment_(std::move(offending_fragment)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] std::string message() const { return what(); }
    [[nodiscard]] const std::optional<std::string>& offending_fragment() const noexcept {
        return offending_fragment_;
    }

    /**
     * @brief {"kind":"...","message":"...","offending_fragment":"..."}
     *
     * offending_fragment is omitted when absent.
     */
    [[nodiscard]] std::string to_json() const;

private:
    ErrorKind kind_;
    std::optional<std::string> offending_fragment_;
};

class CleaningError : public GatewayError {
public:
    explicit CleaningError(const std::string& message,
                           std::optional<std::string> fragment = std::nullopt)
        : GatewayError(ErrorKind::CLEANING_ERROR, message, std::move(fragment)) {}
};

enum class PolicyClass { ALWAYS_BLOCKED, UPDATE_BLOCKED };

[[nodiscard]] std::string_view policy_class_to_string(PolicyClass cls);

class PolicyViolation : public GatewayError {
public:
    PolicyViolation(PolicyClass cls, std::string keyword, const std::string& message)
        : GatewayError(ErrorKind::POLICY_VIOLATION, message, keyword),
          class_(cls),
          keyword_(std::move(keyword)) {}

    [[nodiscard]] PolicyClass policy_class() const noexcept { return class_; }
    [[nodiscard]] const std::string& keyword() const noexcept { return keyword_; }

private:
    PolicyClass class_;
    std::string keyword_;
};

class NotASelectError : public GatewayError {
public:
    NotASelectError(const std::string& message, std::string first_token)
        : GatewayError(ErrorKind::NOT_A_SELECT, message, std::move(first_token)) {}
};

class TableNotFoundError : public GatewayError {
public:
    TableNotFoundError(const std::string& message, std::string table)
        : GatewayError(ErrorKind::TABLE_NOT_FOUND, message, std::move(table)) {}
};

class ColumnMismatchError : public GatewayError {
public:
    ColumnMismatchError(const std::string& message, std::vector<std::string> missing)
        : GatewayError(ErrorKind::COLUMN_MISMATCH, message),
          missing_columns_(std::move(missing)) {}

    [[nodiscard]] const std::vector<std::string>& missing_columns() const noexcept {
        return missing_columns_;
    }

private:
    std::vector<std::string> missing_columns_;
};

class BackendExecutionError : public GatewayError {
public:
    BackendExecutionError(const std::string& message, std::string sql)
        : GatewayError(ErrorKind::BACKEND_EXECUTION, message, std::move(sql)) {}
};

class ConfigurationError : public GatewayError {
public:
    explicit ConfigurationError(const std::string& message,
                                std::optional<std::string> fragment = std::nullopt)
        : GatewayError(ErrorKind::CONFIGURATION_ERROR, message, std::move(fragment)) {}
};

class SourceReleasedError : public GatewayError {
public:
    explicit SourceReleasedError(const std::string& identifier)
        : GatewayError(ErrorKind::SOURCE_RELEASED,
                       "Data source '" + identifier + "' has been released") {}
};

} // namespace querygate
