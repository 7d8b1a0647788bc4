#include "query/multi_index_query.h"
#include "store/store_client.h"
#include "utils/logger.h"

#include <ostream>

namespace multiquery {

MultiIndexQuery::MultiIndexQuery(StoreClient& client, std::string bucket)
    : MultiIndexQuery(client, std::move(bucket), Options{}) {}

MultiIndexQuery::MultiIndexQuery(StoreClient& client, std::string bucket, Options options)
    : client_(client)
    , options_(options)
    , translator_(options.int_index_bound)
    , aggregator_(translator_) {
    state_.bucket = std::move(bucket);
}

MultiIndexQuery& MultiIndexQuery::filter(std::string field, std::string op, FilterValue value) {
    state_.filters.push_back(Filter{std::move(field), std::move(op), std::move(value)});
    return *this;
}

MultiIndexQuery& MultiIndexQuery::offset(int64_t n) {
    state_.offset = n;
    return *this;
}

MultiIndexQuery& MultiIndexQuery::limit(int64_t n) {
    state_.limit = n;
    return *this;
}

MultiIndexQuery& MultiIndexQuery::order(std::string field, std::string direction) {
    state_.order = OrderBy{std::move(field), std::move(direction)};
    return *this;
}

MultiIndexQuery& MultiIndexQuery::reset() {
    state_.clear();
    return *this;
}

JobSpec MultiIndexQuery::planFor_(const QueryState& snapshot) const {
    const CandidateKeySet candidates = aggregator_.collect(client_, snapshot.bucket, snapshot.filters);
    return assembler_.assemble(snapshot, candidates);
}

JobSpec MultiIndexQuery::plan() const {
    return planFor_(state_);
}

ResultStream MultiIndexQuery::run() const {
    return run(options_.default_timeout);
}

ResultStream MultiIndexQuery::run(std::chrono::milliseconds timeout) const {
    const QueryState snapshot = state_;
    JobSpec job = planFor_(snapshot);

    MULTIQUERY_DEBUG("Submitting {} (timeout {} ms)", toString(), timeout.count());
    return client_.submit(job, timeout);
}

std::string MultiIndexQuery::toString() const {
    std::string out = "MultiIndexQuery(bucket=" + state_.bucket + ")";
    for (const auto& f : state_.filters) {
        out += ".filter(" + f.toString() + ")";
    }
    if (state_.order) {
        out += ".order(" + state_.order->field + ", " + quoteString(state_.order->direction) + ")";
    } else {
        out += ".order(None, 'ASC')";
    }
    out += ".offset(" + std::to_string(state_.offset) + ")";
    out += ".limit(" + std::to_string(state_.limit) + ")";
    return out;
}

std::ostream& operator<<(std::ostream& os, const MultiIndexQuery& query) {
    return os << query.toString();
}

} // namespace multiquery
