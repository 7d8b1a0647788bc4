#pragma once

#include "query/index_lookup.h"
#include "query/job_spec.h"
#include "store/result_stream.h"
#include "store/store_errors.h"

#include <chrono>
#include <string>
#include <vector>

namespace multiquery {

/// Reference to a stored object as returned by an index lookup.
struct ObjectRef {
    std::string bucket;
    std::string key;

    const std::string& getKey() const { return key; }

    bool operator==(const ObjectRef& other) const {
        return bucket == other.bucket && key == other.key;
    }
};

/// Boundary to the key-value store. The query layer only plans; the store
/// answers single-index lookups and executes computation jobs.
///
/// Implementations report failures by throwing StoreException (lookup,
/// submission) or JobException (while streaming).
class StoreClient {
public:
    virtual ~StoreClient() = default;

    /// Exact or inclusive-range lookup on one secondary index
    virtual std::vector<ObjectRef> index(const IndexLookup& lookup) = 0;

    /// Submit a job; results stream lazily and must be consumed within `timeout`
    virtual ResultStream submit(const JobSpec& job, std::chrono::milliseconds timeout) = 0;
};

} // namespace multiquery
