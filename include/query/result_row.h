#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace multiquery {

/// One (key, document) pair emitted by the map stage of a job.
struct ResultRow {
    std::string key;
    nlohmann::json document;

    bool operator==(const ResultRow& other) const {
        return key == other.key && document == other.document;
    }
};

} // namespace multiquery
