#include "core/types.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace querygate {

std::string format_value(const Value& v) {
    struct Formatter {
        std::string operator()(std::monostate) const { return "NULL"; }
        std::string operator()(bool b) const { return utils::booltostr(b); }
        std::string operator()(int64_t i) const { return std::format("{}", i); }
        std::string operator()(double d) const { return std::format("{}", d); }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(Formatter{}, v);
}

std::string value_to_json(const Value& v) {
    struct Formatter {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool b) const { return utils::booltostr(b); }
        std::string operator()(int64_t i) const { return std::format("{}", i); }
        std::string operator()(double d) const {
            // JSON has no NaN/Infinity
            return std::isfinite(d) ? std::format("{}", d) : std::string("null");
        }
        std::string operator()(const std::string& s) const {
            return std::format("\"{}\"", utils::escape_json(s));
        }
    };
    return std::visit(Formatter{}, v);
}

std::vector<std::string> QueryResult::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& col : columns) {
        names.push_back(col.name);
    }
    return names;
}

const ResultColumn* QueryResult::find_column(const std::string& name) const {
    for (const auto& col : columns) {
        if (col.name == name) return &col;
    }
    return nullptr;
}

std::string QueryResult::to_json() const {
    std::string out = R"({"columns":[)";
    for (size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(columns[c].name));
    }
    out += R"(],"rows":[)";
    for (size_t r = 0; r < row_count; ++r) {
        if (r > 0) out += ',';
        out += '[';
        for (size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) out += ',';
            out += value_to_json(columns[c].values[r]);
        }
        out += ']';
    }
    out += std::format(R"(],"row_count":{}}})", row_count);
    return out;
}

} // namespace querygate
