#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <string_view>

namespace querygate {

/**
 * @brief Convert a text-protocol cell (libpq, MySQL C API) into a typed Value
 *
 * Cells that do not parse as the column's class are kept as text rather
 * than dropped.
 */
[[nodiscard]] inline Value parse_text_value(std::string_view text, GenericColumnType type) {
    if (is_integer_type(type)) {
        if (auto v = utils::try_parse_int<int64_t>(text)) return *v;
    } else if (is_floating_type(type)) {
        if (auto v = utils::try_parse_double(text)) return *v;
    } else if (type == GenericColumnType::BOOLEAN) {
        if (text == "t" || text == "1" || utils::iequals(text, "true")) return true;
        if (text == "f" || text == "0" || utils::iequals(text, "false")) return false;
    }
    return std::string(text);
}

} // namespace querygate
