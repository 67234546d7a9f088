#pragma once

#include <string>
#include <vector>

namespace querygate {

/**
 * @brief Checks that a query result keeps every original table column
 *
 * Names compare exactly (case-sensitive). Extra result columns are allowed.
 */
class ColumnContractValidator {
public:
    /**
     * @brief Required names absent from actual, sorted and de-duplicated
     */
    [[nodiscard]] static std::vector<std::string> missing_columns(
        const std::vector<std::string>& required,
        const std::vector<std::string>& actual);

    /**
     * @throws ColumnMismatchError listing the missing columns
     */
    static void validate(const std::vector<std::string>& required,
                         const std::vector<std::string>& actual);
};

} // namespace querygate
