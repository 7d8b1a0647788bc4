#include "query/index_lookup_translator.h"
#include "utils/logger.h"

namespace multiquery {

const char* indexKindSuffix(IndexKind kind) {
    return kind == IndexKind::BIN ? "bin" : "int";
}

std::string IndexLookup::toString() const {
    if (!end) {
        return index + "==" + formatLiteral(start);
    }
    return index + "[" + formatLiteral(start) + ".." + formatLiteral(*end) + "]";
}

IndexLookupTranslator::IndexLookupTranslator(int64_t intBound)
    : intBound_(intBound) {}

IndexKind IndexLookupTranslator::kindFor(const FilterValue& value) {
    return std::holds_alternative<std::string>(value) ? IndexKind::BIN : IndexKind::INT;
}

IndexLookup IndexLookupTranslator::translate(std::string_view bucket, const Filter& filter) const {
    const CompareOp op = parseOperator(filter.op);

    IndexLookup lookup;
    lookup.bucket = std::string(bucket);
    lookup.kind = kindFor(filter.value);
    lookup.index = filter.field + "_" + indexKindSuffix(lookup.kind);

    FilterValue upperSentinel;
    FilterValue lowerSentinel;
    if (lookup.kind == IndexKind::BIN) {
        upperSentinel = std::string();
        lowerSentinel = std::string();
    } else {
        upperSentinel = intBound_;
        lowerSentinel = -intBound_;
    }

    switch (op) {
        case CompareOp::EQ:
            lookup.start = filter.value;
            break;
        case CompareOp::GT:
        case CompareOp::GTE:
            lookup.start = filter.value;
            lookup.end = upperSentinel;
            break;
        case CompareOp::LT:
        case CompareOp::LTE:
            lookup.start = lowerSentinel;
            lookup.end = filter.value;
            break;
    }

    MULTIQUERY_TRACE("Translated filter '{}' to index lookup {}", filter.toString(), lookup.toString());
    return lookup;
}

} // namespace multiquery
