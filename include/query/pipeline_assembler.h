#pragma once

#include "query/candidate_aggregator.h"
#include "query/job_spec.h"
#include "query/query_state.h"

namespace multiquery {

/// Builds the job for one run:
///  - input: candidate keys, or the whole bucket when there are none
///  - map:   compiled predicate (constant true without filters)
///  - sort reduce when an order is set
///  - slice reduce [offset, offset + limit) when limit > 0; offset alone has no effect
class PipelineAssembler {
public:
    /// Throws InvalidOperatorException if a filter operator is unsupported.
    JobSpec assemble(const QueryState& state, const CandidateKeySet& candidates) const;
};

} // namespace multiquery
