#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace multiquery {

/// Literal on the right-hand side of a filter: text or number.
/// Text selects the "_bin" index, numbers (integral or not) the "_int" index.
using FilterValue = std::variant<std::string, int64_t, double>;

enum class CompareOp {
    EQ,   // ==
    GT,   // >
    GTE,  // >=
    LT,   // <
    LTE   // <=
};

/// Raised when a filter carries an operator outside {==, >, >=, <, <=}.
/// Surfaces at execution time, not when the filter is added.
class InvalidOperatorException : public std::invalid_argument {
public:
    explicit InvalidOperatorException(std::string op)
        : std::invalid_argument("Invalid operator " + op), op_(std::move(op)) {}

    const std::string& op() const noexcept { return op_; }

private:
    std::string op_;
};

/// One (field, operator, value) condition as the caller wrote it.
/// The operator stays a string until the query is executed.
struct Filter {
    std::string field;
    std::string op;
    FilterValue value;

    bool isText() const { return std::holds_alternative<std::string>(value); }

    /// "name == 'Sreejith'" / "age < 50"
    std::string toString() const;

    bool operator==(const Filter& other) const {
        return field == other.field && op == other.op && value == other.value;
    }
};

/// nullopt for unsupported operators
std::optional<CompareOp> tryParseOperator(std::string_view op);

/// Throws InvalidOperatorException for unsupported operators
CompareOp parseOperator(std::string_view op);

const char* operatorToString(CompareOp op);

/// Literal rendering: text single-quoted with '\\' and '\'' escaped, numbers bare
std::string formatLiteral(const FilterValue& value);
std::string quoteString(std::string_view text);

} // namespace multiquery
