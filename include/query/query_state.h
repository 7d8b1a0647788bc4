#pragma once

#include "query/filter.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace multiquery {

struct OrderBy {
    std::string field;
    std::string direction = "ASC"; // unvalidiert; nur exakt "DESC" sortiert absteigend

    bool descending() const { return direction == "DESC"; }

    bool operator==(const OrderBy& other) const {
        return field == other.field && direction == other.direction;
    }
};

/// Everything a query accumulates through the builder. run() works on a copy.
struct QueryState {
    std::string bucket;
    std::vector<Filter> filters; // alle mit AND verknüpft
    std::optional<OrderBy> order;
    int64_t offset = 0;
    int64_t limit = 0; // 0 = unbegrenzt

    void clear() {
        filters.clear();
        order.reset();
        offset = 0;
        limit = 0;
    }
};

} // namespace multiquery
