#include "query/pipeline_assembler.h"
#include "utils/logger.h"

#include <cstdint>
#include <limits>

namespace multiquery {

JobSpec PipelineAssembler::assemble(const QueryState& state, const CandidateKeySet& candidates) const {
    JobSpec job;

    if (candidates.empty()) {
        job.input = JobInput::forBucket(state.bucket);
    } else {
        job.input = JobInput::forKeys(state.bucket, std::vector<std::string>(candidates.begin(), candidates.end()));
    }

    job.map.predicate = Predicate::compile(state.filters);

    if (state.order) {
        job.reduces.emplace_back(SortReduce{state.order->field, state.order->descending()});
    }

    if (state.limit > 0) {
        // offset + limit, gesättigt bei INT64_MAX
        const int64_t end = state.offset > std::numeric_limits<int64_t>::max() - state.limit
            ? std::numeric_limits<int64_t>::max()
            : state.offset + state.limit;
        job.reduces.emplace_back(SliceReduce{state.offset, end});
    }

    MULTIQUERY_DEBUG("Assembled job: {}", job.describe());
    return job;
}

} // namespace multiquery
