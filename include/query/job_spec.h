#pragma once

#include "query/predicate.h"
#include "query/result_row.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace multiquery {

/// Input of a job: explicit keys of one bucket, or the whole bucket.
struct JobInput {
    std::string bucket;
    std::vector<std::string> keys; // leer bei wholeBucket
    bool wholeBucket = false;

    static JobInput forKeys(std::string bucket, std::vector<std::string> keys);
    static JobInput forBucket(std::string bucket);
};

/// Map stage: load document, evaluate predicate, emit (key, document) on match.
struct MapStage {
    Predicate predicate;

    std::optional<ResultRow> apply(const std::string& key, nlohmann::json document) const;
};

/// Ordering reduce. Compares the field numerically by subtraction:
/// ASC a.f - b.f, DESC b.f - a.f. Non-numeric values yield NaN.
struct SortReduce {
    std::string field;
    bool descending = false;

    double compare(const ResultRow& a, const ResultRow& b) const;

    /// Stable sort by compare(); rows whose field is not numeric keep their
    /// relative order and follow the numeric ones.
    void apply(std::vector<ResultRow>& rows) const;
};

/// Pagination reduce: rows.slice(start, end) with array-slice semantics
/// (negative positions count from the end, bounds clamp to the list).
struct SliceReduce {
    int64_t start = 0;
    int64_t end = 0;

    void apply(std::vector<ResultRow>& rows) const;
};

using ReduceStage = std::variant<SortReduce, SliceReduce>;

void applyReduce(const ReduceStage& stage, std::vector<ResultRow>& rows);
std::string describeReduce(const ReduceStage& stage);

/// Complete description of one computation job; built fresh per run.
struct JobSpec {
    JobInput input;
    MapStage map;
    std::vector<ReduceStage> reduces; // [sort?, slice?]

    bool hasReduces() const { return !reduces.empty(); }

    /// One-line diagnostic summary
    std::string describe() const;
};

} // namespace multiquery
