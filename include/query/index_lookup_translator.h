#pragma once

#include "query/filter.h"
#include "query/index_lookup.h"

#include <cstdint>
#include <string_view>

namespace multiquery {

/// Übersetzt einen Filter in eine einzelne Sekundärindex-Abfrage.
///
/// - Text  -> "<field>_bin", offene Grenzen als ""
/// - Zahl  -> "<field>_int", offene Grenzen als +/- intBound
/// - "==" exakt, ">"/">=" -> [value, +bound], "<"/"<=" -> [-bound, value]
///
/// Strict and non-strict operators map to the same inclusive range; the
/// predicate stage of the job applies the exact comparison afterwards.
class IndexLookupTranslator {
public:
    static constexpr int64_t DEFAULT_INT_BOUND = 99999999999999999LL;

    explicit IndexLookupTranslator(int64_t intBound = DEFAULT_INT_BOUND);

    /// Throws InvalidOperatorException for unsupported operators.
    IndexLookup translate(std::string_view bucket, const Filter& filter) const;

    static IndexKind kindFor(const FilterValue& value);

    int64_t intBound() const { return intBound_; }

private:
    int64_t intBound_;
};

} // namespace multiquery
