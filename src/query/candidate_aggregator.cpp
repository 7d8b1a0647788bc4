#include "query/candidate_aggregator.h"
#include "store/store_client.h"
#include "utils/logger.h"

namespace multiquery {

CandidateAggregator::CandidateAggregator(const IndexLookupTranslator& translator)
    : translator_(translator) {}

CandidateKeySet CandidateAggregator::collect(StoreClient& client,
                                             std::string_view bucket,
                                             const std::vector<Filter>& filters) const {
    CandidateKeySet keys;
    for (const auto& filter : filters) {
        const IndexLookup lookup = translator_.translate(bucket, filter);
        const auto refs = client.index(lookup);
        for (const auto& ref : refs) {
            keys.insert(ref.getKey());
        }
        MULTIQUERY_DEBUG("Index lookup {} on bucket '{}' returned {} keys", lookup.toString(), bucket, refs.size());
    }

    if (!filters.empty() && keys.empty()) {
        MULTIQUERY_DEBUG("No candidates for {} filter(s) on bucket '{}', falling back to bucket scan",
                         filters.size(), bucket);
    }
    return keys;
}

} // namespace multiquery
