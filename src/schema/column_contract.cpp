#include "schema/column_contract.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace querygate {

std::vector<std::string> ColumnContractValidator::missing_columns(
    const std::vector<std::string>& required,
    const std::vector<std::string>& actual) {

    const std::unordered_set<std::string> present(actual.begin(), actual.end());

    std::vector<std::string> missing;
    for (const auto& name : required) {
        if (!present.contains(name)) {
            missing.push_back(name);
        }
    }

    std::sort(missing.begin(), missing.end());
    missing.erase(std::unique(missing.begin(), missing.end()), missing.end());
    return missing;
}

void ColumnContractValidator::validate(const std::vector<std::string>& required,
                                       const std::vector<std::string>& actual) {
    auto missing = missing_columns(required, actual);
    if (missing.empty()) {
        return;
    }

    auto message = std::format(
        "Query result missing required columns: {}. The query must return all "
        "original table columns. Original columns: {}",
        utils::join_quoted(missing), utils::join_quoted(required));
    utils::log::warn(message);
    throw ColumnMismatchError(message, std::move(missing));
}

} // namespace querygate
