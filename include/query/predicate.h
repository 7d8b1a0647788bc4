#pragma once

#include "query/filter.h"

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace multiquery {

/// Compiled conjunction of typed comparisons, evaluated once per document in
/// the map stage of a job. Built from data only (no source text is
/// generated or executed), so literals can never change the shape of the
/// expression.
///
/// Semantics per condition `document.<field> <op> <literal>`:
///  - missing field                -> false
///  - text field vs text literal   -> byte-wise lexicographic comparison
///  - everything else              -> both sides as numbers (numeric strings
///    parse, booleans 0/1, null 0 for relational operators); NaN -> false
///  - null is never == a literal
class Predicate {
public:
    struct Condition {
        std::string field;  // dotted path, e.g. "address.city"
        CompareOp op = CompareOp::EQ;
        FilterValue literal;

        bool evaluate(const nlohmann::json& document) const;
        std::string toString() const;
    };

    /// Empty predicate: matches everything
    Predicate() = default;

    /// Throws InvalidOperatorException on the first unsupported operator.
    static Predicate compile(const std::vector<Filter>& filters);

    bool matches(const nlohmann::json& document) const;
    bool operator()(const nlohmann::json& document) const { return matches(document); }

    /// "true" for the empty predicate, else "data.a == 'x' && data.b < 5"
    std::string toString() const;

    const std::vector<Condition>& conditions() const { return conditions_; }
    bool alwaysTrue() const { return conditions_.empty(); }

    /// Resolves a dotted path; nullptr when any segment is missing
    static const nlohmann::json* resolveField(const nlohmann::json& document, std::string_view path);

    /// Numeric coercion of a document value; NaN when not representable
    static double toNumber(const nlohmann::json& value);

private:
    std::vector<Condition> conditions_;
};

} // namespace multiquery
