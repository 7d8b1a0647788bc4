#pragma once

#include "store/store_client.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace multiquery {
namespace testing_support {

/// Serves rows from a fixed vector; used where only planning is under test.
class VectorSource : public ResultSource {
public:
    explicit VectorSource(std::vector<ResultRow> rows) : rows_(std::move(rows)) {}

    std::optional<ResultRow> next() override {
        if (pos_ >= rows_.size()) return std::nullopt;
        return rows_[pos_++];
    }

private:
    std::vector<ResultRow> rows_;
    size_t pos_ = 0;
};

/// StoreClient double: canned answers per lookup, records every call.
class FakeStoreClient : public StoreClient {
public:
    // Key: IndexLookup::toString() of the expected lookup
    std::map<std::string, std::vector<std::string>> answers;
    std::vector<IndexLookup> lookups;
    std::vector<JobSpec> submitted;
    std::vector<std::chrono::milliseconds> timeouts;
    std::vector<ResultRow> rows;

    // Throw StoreException on the n-th lookup (0-based)
    std::optional<size_t> failLookupAt;
    bool failSubmit = false;

    std::vector<ObjectRef> index(const IndexLookup& lookup) override {
        if (failLookupAt && *failLookupAt == lookups.size()) {
            lookups.push_back(lookup);
            throw StoreException("lookup failed: " + lookup.toString());
        }
        lookups.push_back(lookup);

        std::vector<ObjectRef> refs;
        auto it = answers.find(lookup.toString());
        if (it != answers.end()) {
            for (const auto& k : it->second) refs.push_back(ObjectRef{lookup.bucket, k});
        }
        return refs;
    }

    ResultStream submit(const JobSpec& job, std::chrono::milliseconds timeout) override {
        if (failSubmit) throw StoreException("submit failed");
        submitted.push_back(job);
        timeouts.push_back(timeout);
        return ResultStream(std::make_unique<VectorSource>(rows));
    }
};

} // namespace testing_support
} // namespace multiquery
