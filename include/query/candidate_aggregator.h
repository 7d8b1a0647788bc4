#pragma once

#include "query/filter.h"
#include "query/index_lookup_translator.h"

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace multiquery {

class StoreClient;

/// Ordered set of unique object keys selected by the index phase of one run.
using CandidateKeySet = std::set<std::string>;

/// Issues one index lookup per filter (sequentially) and unions the keys.
///
/// Union, not intersection: the index phase only narrows coarsely, the map
/// stage applies the exact predicate. An empty result tells the assembler to
/// scan the whole bucket instead, which costs a full scan when the filters
/// legitimately match nothing.
class CandidateAggregator {
public:
    explicit CandidateAggregator(const IndexLookupTranslator& translator);

    /// Throws InvalidOperatorException (translation) and whatever the store
    /// throws for a failed lookup; no partial result is returned.
    CandidateKeySet collect(StoreClient& client,
                            std::string_view bucket,
                            const std::vector<Filter>& filters) const;

private:
    const IndexLookupTranslator& translator_;
};

} // namespace multiquery
