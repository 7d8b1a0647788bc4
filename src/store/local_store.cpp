#include "store/local_store.h"
#include "storage/key_schema.h"
#include "utils/logger.h"

#include <cmath>
#include <limits>
#include <memory>

namespace multiquery {

namespace {

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<uint8_t> toBytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::string objectLabel(std::string_view bucket, std::string_view key) {
    return std::string(bucket) + "/" + std::string(key);
}

using Clock = std::chrono::steady_clock;

/// Runs one job against the store. Without reduce stages every next() maps
/// the following input; with reduce stages the first next() maps all inputs,
/// applies the reduces in order and the rows are then handed out one by one.
class LocalJobSource : public ResultSource {
public:
    LocalJobSource(LocalStore& store, JobSpec job, std::vector<std::string> inputs, Clock::time_point deadline)
        : store_(store)
        , job_(std::move(job))
        , inputs_(std::move(inputs))
        , deadline_(deadline) {}

    std::optional<ResultRow> next() override {
        if (!job_.hasReduces()) {
            return nextMapped_();
        }
        if (!reduced_) {
            runReduces_();
        }
        if (buffer_pos_ >= buffer_.size()) return std::nullopt;
        return std::move(buffer_[buffer_pos_++]);
    }

private:
    LocalStore& store_;
    JobSpec job_;
    std::vector<std::string> inputs_;
    size_t input_pos_ = 0;
    Clock::time_point deadline_;

    bool reduced_ = false;
    std::vector<ResultRow> buffer_;
    size_t buffer_pos_ = 0;

    void checkDeadline_() const {
        if (Clock::now() >= deadline_) {
            throw JobTimeoutException("Job on bucket '" + job_.input.bucket + "' timed out after "
                                      + std::to_string(input_pos_) + " of " + std::to_string(inputs_.size())
                                      + " inputs");
        }
    }

    nlohmann::json load_(const std::string& key) const {
        std::optional<std::string> raw;
        try {
            raw = store_.fetchRaw(job_.input.bucket, key);
        } catch (const StoreException& e) {
            throw JobException("Cannot read map input " + objectLabel(job_.input.bucket, key) + ": " + e.what());
        }
        if (!raw) {
            throw JobException("Map input not found: " + objectLabel(job_.input.bucket, key));
        }
        try {
            return nlohmann::json::parse(*raw);
        } catch (const nlohmann::json::parse_error& e) {
            throw JobException("Cannot decode " + objectLabel(job_.input.bucket, key) + ": " + e.what());
        }
    }

    std::optional<ResultRow> nextMapped_() {
        while (input_pos_ < inputs_.size()) {
            checkDeadline_();
            const std::string& key = inputs_[input_pos_++];
            auto row = job_.map.apply(key, load_(key));
            if (row) return row;
        }
        return std::nullopt;
    }

    void runReduces_() {
        while (auto row = nextMapped_()) {
            buffer_.push_back(std::move(*row));
        }
        for (const auto& stage : job_.reduces) {
            applyReduce(stage, buffer_);
        }
        reduced_ = true;
        MULTIQUERY_DEBUG("Job on bucket '{}' reduced to {} rows", job_.input.bucket, buffer_.size());
    }
};

} // namespace

LocalStore::LocalStore(RocksDBWrapper& db) : db_(db) {}

void LocalStore::ensureOpen_(const char* op) const {
    if (!db_.isOpen()) {
        throw StoreException(std::string(op) + ": database not open");
    }
}

std::optional<std::vector<uint8_t>> LocalStore::read_(std::string_view dbKey, const char* op) {
    auto [st, value] = db_.get(dbKey);
    if (!st.ok) {
        throw StoreException(std::string(op) + ": read failed: " + st.message);
    }
    return std::move(value);
}

IndexKind LocalStore::kindOfIndexName(std::string_view index) {
    if (endsWith(index, "_bin")) return IndexKind::BIN;
    if (endsWith(index, "_int")) return IndexKind::INT;
    throw StoreException("Invalid index name '" + std::string(index) + "' (expected suffix _bin or _int)");
}

std::string LocalStore::encodeIndexValue(IndexKind kind, const FilterValue& value) {
    if (kind == IndexKind::BIN) {
        const auto* text = std::get_if<std::string>(&value);
        if (!text) throw StoreException("Numeric value used on a _bin index");
        return KeySchema::encodeBinValue(*text);
    }
    if (std::holds_alternative<std::string>(value)) {
        throw StoreException("Text value used on an _int index");
    }
    const auto* number = std::get_if<int64_t>(&value);
    if (!number) throw StoreException("Non-integer value used on an _int index");
    return KeySchema::encodeIntValue(*number);
}

std::optional<int64_t> LocalStore::intBoundOf(const FilterValue& value, bool lower) {
    if (std::holds_alternative<std::string>(value)) {
        throw StoreException("Text value used on an _int index");
    }
    if (const auto* number = std::get_if<int64_t>(&value)) return *number;

    // Nicht-ganzzahlige Grenze: nach innen runden, außerhalb von int64 kappen
    const double d = std::get<double>(value);
    if (std::isnan(d)) return std::nullopt;
    const double rounded = lower ? std::ceil(d) : std::floor(d);
    constexpr double kTwoPow63 = 9223372036854775808.0;
    if (rounded >= kTwoPow63) {
        if (lower) return std::nullopt;
        return std::numeric_limits<int64_t>::max();
    }
    if (rounded < -kTwoPow63) {
        if (!lower) return std::nullopt;
        return std::numeric_limits<int64_t>::min();
    }
    return static_cast<int64_t>(rounded);
}

void LocalStore::validateIndexEntry(const IndexEntry& entry) {
    encodeIndexValue(kindOfIndexName(entry.index), entry.value);
}

nlohmann::json LocalStore::indexEntriesToJson(const std::vector<IndexEntry>& entries) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : entries) {
        nlohmann::json v = std::visit([](const auto& x) { return nlohmann::json(x); }, e.value);
        arr.push_back({{"index", e.index}, {"value", v}});
    }
    return arr;
}

std::vector<LocalStore::IndexEntry> LocalStore::indexEntriesFromJson(const nlohmann::json& j) {
    std::vector<IndexEntry> out;
    for (const auto& item : j) {
        IndexEntry e;
        e.index = item.at("index").get<std::string>();
        const auto& v = item.at("value");
        if (v.is_string()) {
            e.value = v.get<std::string>();
        } else if (v.is_number_integer()) {
            e.value = v.get<int64_t>();
        } else {
            e.value = v.get<double>();
        }
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<LocalStore::IndexEntry> LocalStore::indexesOf(std::string_view bucket, std::string_view key) {
    ensureOpen_("indexesOf");
    auto raw = read_(KeySchema::makeIndexMetaKey(bucket, key), "indexesOf");
    if (!raw) return {};
    try {
        return indexEntriesFromJson(nlohmann::json::parse(raw->begin(), raw->end()));
    } catch (const nlohmann::json::exception& e) {
        throw StoreException("Corrupt index metadata for " + objectLabel(bucket, key) + ": " + e.what());
    }
}

void LocalStore::storeObject(std::string_view bucket,
                             std::string_view key,
                             const nlohmann::json& document,
                             const std::vector<IndexEntry>& indexes) {
    ensureOpen_("storeObject");
    if (bucket.empty() || key.empty()) {
        throw StoreException("storeObject: bucket/key must not be empty");
    }
    for (const auto& entry : indexes) {
        validateIndexEntry(entry);
    }

    const auto previous = indexesOf(bucket, key);

    auto batch = db_.createWriteBatch();
    for (const auto& old : previous) {
        const IndexKind kind = kindOfIndexName(old.index);
        batch->del(KeySchema::makeIndexEntryKey(bucket, old.index, encodeIndexValue(kind, old.value), key));
    }
    batch->put(KeySchema::makeObjectKey(bucket, key), toBytes(document.dump()));
    for (const auto& entry : indexes) {
        const IndexKind kind = kindOfIndexName(entry.index);
        batch->put(KeySchema::makeIndexEntryKey(bucket, entry.index, encodeIndexValue(kind, entry.value), key), {});
    }
    batch->put(KeySchema::makeIndexMetaKey(bucket, key), toBytes(indexEntriesToJson(indexes).dump()));

    if (!batch->commit()) {
        throw StoreException("storeObject: commit failed for " + objectLabel(bucket, key));
    }
    MULTIQUERY_TRACE("Stored {} with {} index entries", objectLabel(bucket, key), indexes.size());
}

std::optional<std::string> LocalStore::fetchRaw(std::string_view bucket, std::string_view key) {
    ensureOpen_("fetch");
    auto raw = read_(KeySchema::makeObjectKey(bucket, key), "fetch");
    if (!raw) return std::nullopt;
    return std::string(raw->begin(), raw->end());
}

std::optional<nlohmann::json> LocalStore::fetchObject(std::string_view bucket, std::string_view key) {
    auto raw = fetchRaw(bucket, key);
    if (!raw) return std::nullopt;
    try {
        return nlohmann::json::parse(*raw);
    } catch (const nlohmann::json::parse_error& e) {
        throw StoreException("Cannot decode " + objectLabel(bucket, key) + ": " + e.what());
    }
}

bool LocalStore::deleteObject(std::string_view bucket, std::string_view key) {
    ensureOpen_("deleteObject");
    const std::string objectKey = KeySchema::makeObjectKey(bucket, key);
    if (!read_(objectKey, "deleteObject")) return false;

    const auto previous = indexesOf(bucket, key);
    auto batch = db_.createWriteBatch();
    for (const auto& old : previous) {
        const IndexKind kind = kindOfIndexName(old.index);
        batch->del(KeySchema::makeIndexEntryKey(bucket, old.index, encodeIndexValue(kind, old.value), key));
    }
    batch->del(objectKey);
    batch->del(KeySchema::makeIndexMetaKey(bucket, key));

    if (!batch->commit()) {
        throw StoreException("deleteObject: commit failed for " + objectLabel(bucket, key));
    }
    return true;
}

std::vector<std::string> LocalStore::listKeys(std::string_view bucket) {
    ensureOpen_("listKeys");
    std::vector<std::string> keys;
    const bool ok = db_.scanPrefix(KeySchema::makeObjectPrefix(bucket), [&keys](std::string_view k, std::string_view) {
        if (auto key = KeySchema::extractObjectKey(k)) {
            keys.push_back(std::move(*key));
        }
        return true;
    });
    if (!ok) {
        throw StoreException("listKeys: scan failed for bucket '" + std::string(bucket) + "'");
    }
    return keys;
}

std::vector<ObjectRef> LocalStore::index(const IndexLookup& lookup) {
    ensureOpen_("index");
    const IndexKind kind = kindOfIndexName(lookup.index);
    if (kind != lookup.kind) {
        throw StoreException("Index lookup kind does not match index name '" + lookup.index + "'");
    }

    std::vector<ObjectRef> refs;
    auto collect = [&refs, &lookup](std::string_view k, std::string_view) {
        if (auto key = KeySchema::extractObjectKey(k)) {
            refs.push_back(ObjectRef{lookup.bucket, std::move(*key)});
        }
        return true;
    };

    std::string start;
    std::string end;
    bool empty = false;
    if (kind == IndexKind::INT) {
        // exakt = [v, v]; bei nicht-ganzzahligem v leer
        const auto lo = intBoundOf(lookup.start, true);
        const auto hi = intBoundOf(lookup.isRange() ? *lookup.end : lookup.start, false);
        empty = !lo || !hi || *lo > *hi;
        if (!empty) {
            start = KeySchema::encodeIntValue(*lo);
            end = KeySchema::encodeIntValue(*hi);
        }
    } else {
        start = encodeIndexValue(kind, lookup.start);
        end = lookup.isRange() ? encodeIndexValue(kind, *lookup.end) : start;
        // start > end: leerer Bereich
        empty = start > end;
    }

    bool ok = true;
    if (!empty && start == end) {
        ok = db_.scanPrefix(KeySchema::makeIndexValuePrefix(lookup.bucket, lookup.index, start), collect);
    } else if (!empty) {
        ok = db_.scanRange(KeySchema::makeIndexValuePrefix(lookup.bucket, lookup.index, start),
                           KeySchema::makeIndexValueUpperBound(lookup.bucket, lookup.index, end),
                           collect);
    }
    if (!ok) {
        throw StoreException("Index lookup " + lookup.toString() + " failed");
    }

    MULTIQUERY_TRACE("Index lookup {} -> {} refs", lookup.toString(), refs.size());
    return refs;
}

ResultStream LocalStore::submit(const JobSpec& job, std::chrono::milliseconds timeout) {
    ensureOpen_("submit");
    if (job.input.bucket.empty()) {
        throw StoreException("submit: job input has no bucket");
    }

    // now + timeout, gesättigt bei time_point::max()
    const auto now = Clock::now();
    const auto deadline = timeout >= std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now)
                              ? Clock::time_point::max()
                              : now + std::chrono::duration_cast<Clock::duration>(timeout);
    std::vector<std::string> inputs = job.input.wholeBucket ? listKeys(job.input.bucket) : job.input.keys;

    MULTIQUERY_DEBUG("Job submitted: {} ({} inputs, timeout {} ms)", job.describe(), inputs.size(), timeout.count());
    return ResultStream(std::make_unique<LocalJobSource>(*this, job, std::move(inputs), deadline));
}

} // namespace multiquery
