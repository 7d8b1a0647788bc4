#pragma once

#include "query/filter.h"

#include <optional>
#include <string>

namespace multiquery {

enum class IndexKind {
    BIN,  // text values, index name suffix "_bin"
    INT   // integer values, index name suffix "_int"
};

const char* indexKindSuffix(IndexKind kind);

/// Native secondary-index request: exact match on `start`, or the inclusive
/// range [start, end] when `end` is set.
struct IndexLookup {
    std::string bucket;
    std::string index;   // <field>_<kind>
    IndexKind kind = IndexKind::BIN;
    FilterValue start;
    std::optional<FilterValue> end;

    bool isRange() const { return end.has_value(); }

    /// "age_int[-99999999999999999..50]" / "name_bin=='Vishnu'"
    std::string toString() const;

    bool operator==(const IndexLookup& other) const {
        return bucket == other.bucket && index == other.index && kind == other.kind
            && start == other.start && end == other.end;
    }
};

} // namespace multiquery
