#include "query/predicate.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace multiquery {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Parses the whole string (surrounding whitespace allowed); empty -> 0
double parseNumber(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    if (b == e) return 0.0;

    const std::string trimmed = s.substr(b, e - b);
    char* endp = nullptr;
    double v = std::strtod(trimmed.c_str(), &endp);
    if (endp != trimmed.c_str() + trimmed.size()) return kNaN;
    return v;
}

template<typename T>
bool applyOp(CompareOp op, const T& l, const T& r) {
    switch (op) {
        case CompareOp::EQ: return l == r;
        case CompareOp::GT: return l > r;
        case CompareOp::GTE: return l >= r;
        case CompareOp::LT: return l < r;
        case CompareOp::LTE: return l <= r;
    }
    return false;
}

double literalToNumber(const FilterValue& literal) {
    if (const auto* s = std::get_if<std::string>(&literal)) {
        return parseNumber(*s);
    }
    if (const auto* d = std::get_if<double>(&literal)) {
        return *d;
    }
    return static_cast<double>(std::get<int64_t>(literal));
}

} // namespace

double Predicate::toNumber(const nlohmann::json& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_boolean()) return value.get<bool>() ? 1.0 : 0.0;
    if (value.is_null()) return 0.0;
    if (value.is_string()) return parseNumber(value.get_ref<const std::string&>());
    return kNaN;
}

const nlohmann::json* Predicate::resolveField(const nlohmann::json& document, std::string_view path) {
    const nlohmann::json* current = &document;
    size_t pos = 0;
    while (true) {
        size_t dot = path.find('.', pos);
        std::string segment(path.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos));
        if (!current->is_object()) return nullptr;
        auto it = current->find(segment);
        if (it == current->end()) return nullptr;
        current = &*it;
        if (dot == std::string_view::npos) return current;
        pos = dot + 1;
    }
}

bool Predicate::Condition::evaluate(const nlohmann::json& document) const {
    const nlohmann::json* fieldValue = resolveField(document, field);
    if (!fieldValue) return false;

    if (fieldValue->is_null() && op == CompareOp::EQ) return false;

    if (fieldValue->is_string()) {
        if (const auto* text = std::get_if<std::string>(&literal)) {
            return applyOp(op, fieldValue->get_ref<const std::string&>(), *text);
        }
    }

    const double l = toNumber(*fieldValue);
    const double r = literalToNumber(literal);
    if (std::isnan(l) || std::isnan(r)) return false;
    return applyOp(op, l, r);
}

std::string Predicate::Condition::toString() const {
    return "data." + field + " " + operatorToString(op) + " " + formatLiteral(literal);
}

Predicate Predicate::compile(const std::vector<Filter>& filters) {
    Predicate predicate;
    predicate.conditions_.reserve(filters.size());
    for (const auto& f : filters) {
        predicate.conditions_.push_back(Condition{f.field, parseOperator(f.op), f.value});
    }
    return predicate;
}

bool Predicate::matches(const nlohmann::json& document) const {
    for (const auto& c : conditions_) {
        if (!c.evaluate(document)) return false;
    }
    return true;
}

std::string Predicate::toString() const {
    if (conditions_.empty()) return "true";

    std::string out;
    for (size_t i = 0; i < conditions_.size(); ++i) {
        if (i > 0) out += " && ";
        out += conditions_[i].toString();
    }
    return out;
}

} // namespace multiquery
