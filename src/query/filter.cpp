#include "query/filter.h"

#include <fmt/format.h>

namespace multiquery {

std::optional<CompareOp> tryParseOperator(std::string_view op) {
    if (op == "==") return CompareOp::EQ;
    if (op == ">") return CompareOp::GT;
    if (op == ">=") return CompareOp::GTE;
    if (op == "<") return CompareOp::LT;
    if (op == "<=") return CompareOp::LTE;
    return std::nullopt;
}

CompareOp parseOperator(std::string_view op) {
    auto parsed = tryParseOperator(op);
    if (!parsed) {
        throw InvalidOperatorException(std::string(op));
    }
    return *parsed;
}

const char* operatorToString(CompareOp op) {
    switch (op) {
        case CompareOp::EQ: return "==";
        case CompareOp::GT: return ">";
        case CompareOp::GTE: return ">=";
        case CompareOp::LT: return "<";
        case CompareOp::LTE: return "<=";
    }
    return "?";
}

std::string quoteString(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('\'');
    for (char c : text) {
        if (c == '\\' || c == '\'') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string formatLiteral(const FilterValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return quoteString(*s);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return fmt::format("{}", *d);
    }
    return std::to_string(std::get<int64_t>(value));
}

std::string Filter::toString() const {
    return field + " " + op + " " + formatLiteral(value);
}

} // namespace multiquery
