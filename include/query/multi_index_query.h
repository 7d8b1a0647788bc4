#pragma once

#include "query/candidate_aggregator.h"
#include "query/index_lookup_translator.h"
#include "query/job_spec.h"
#include "query/pipeline_assembler.h"
#include "query/query_state.h"
#include "store/result_stream.h"

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace multiquery {

class StoreClient;

/// Multi-predicate, sortable, paginated query over a store whose only native
/// query primitive is a single-field secondary-index lookup.
///
/// Ablauf von run():
///   1. je Filter ein Index-Lookup, Schlüssel werden vereinigt (Kandidaten)
///   2. keine Kandidaten -> ganzer Bucket als Job-Input
///   3. Map-Stage mit kompiliertem Prädikat, optional Sort- und Slice-Reduce
///   4. Job wird mit Timeout abgeschickt, Ergebnisse kommen lazy zurück
///
/// Usage:
///   MultiIndexQuery q(client, "users");
///   for (const auto& row : q.filter("age", "<", int64_t{50}).order("age").limit(10).run()) { ... }
///
/// Not thread-safe. run() works on a snapshot of the builder state, so the
/// builder can be changed or reset() while a previous result is consumed.
class MultiIndexQuery {
public:
    struct Options {
        std::chrono::milliseconds default_timeout{9000};
        int64_t int_index_bound = IndexLookupTranslator::DEFAULT_INT_BOUND;
    };

    MultiIndexQuery(StoreClient& client, std::string bucket);
    MultiIndexQuery(StoreClient& client, std::string bucket, Options options);

    MultiIndexQuery(const MultiIndexQuery&) = delete;
    MultiIndexQuery& operator=(const MultiIndexQuery&) = delete;

    /// Add a condition, e.g. filter("age", ">=", 25). Operator is checked at run().
    MultiIndexQuery& filter(std::string field, std::string op, FilterValue value);

    /// Result offset; only effective together with limit > 0
    MultiIndexQuery& offset(int64_t n);

    /// Number of results; 0 fetches all records
    MultiIndexQuery& limit(int64_t n = 0);

    /// Sort numerically by field; any direction other than "DESC" is ascending
    MultiIndexQuery& order(std::string field, std::string direction = "ASC");

    /// Back to the initial state: no filters, no order, offset 0, limit 0
    MultiIndexQuery& reset();

    /// Index phase and job assembly without submitting.
    /// Throws InvalidOperatorException or the store's lookup failure.
    JobSpec plan() const;

    /// Execute with the configured default timeout
    ResultStream run() const;

    /// Execute; errors from lookups/submission propagate unchanged, job
    /// errors surface while iterating the returned stream.
    ResultStream run(std::chrono::milliseconds timeout) const;

    /// "MultiIndexQuery(bucket=b).filter(age < 50).order(age, 'ASC').offset(0).limit(0)"
    std::string toString() const;

    const std::string& bucket() const { return state_.bucket; }
    const std::vector<Filter>& filters() const { return state_.filters; }
    const std::optional<OrderBy>& orderBy() const { return state_.order; }
    int64_t getOffset() const { return state_.offset; }
    int64_t getLimit() const { return state_.limit; }
    const QueryState& state() const { return state_; }

private:
    StoreClient& client_;
    Options options_;
    QueryState state_;
    IndexLookupTranslator translator_;
    CandidateAggregator aggregator_;
    PipelineAssembler assembler_;

    JobSpec planFor_(const QueryState& snapshot) const;
};

std::ostream& operator<<(std::ostream& os, const MultiIndexQuery& query);

} // namespace multiquery
