#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace querygate {

std::string_view error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CLEANING_ERROR:      return "cleaning_error";
        case ErrorKind::POLICY_VIOLATION:    return "policy_violation";
        case ErrorKind::NOT_A_SELECT:        return "not_a_select";
        case ErrorKind::TABLE_NOT_FOUND:     return "table_not_found";
        case ErrorKind::COLUMN_MISMATCH:     return "column_mismatch";
        case ErrorKind::BACKEND_EXECUTION:   return "backend_execution";
        case ErrorKind::CONFIGURATION_ERROR: return "configuration_error";
        case ErrorKind::SOURCE_RELEASED:     return "source_released";
    }
    return "unknown";
}

std::string_view policy_class_to_string(PolicyClass cls) {
    switch (cls) {
        case PolicyClass::ALWAYS_BLOCKED: return "always_blocked";
        case PolicyClass::UPDATE_BLOCKED: return "update_blocked";
    }
    return "unknown";
}

std::string GatewayError::to_json() const {
    std::string out = std::format(R"({{"kind":"{}","message":"{}")",
        error_kind_to_string(kind_), utils::escape_json(what()));
    if (offending_fragment_) {
        out += std::format(R"(,"offending_fragment":"{}")",
            utils::escape_json(*offending_fragment_));
    }
    out += '}';
    return out;
}

} // namespace querygate
