#pragma once

#include "storage/rocksdb_wrapper.h"
#include "store/store_client.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace multiquery {

/// Embedded StoreClient on top of RocksDB.
///
/// - Objects: JSON documents per (bucket, key)
/// - Secondary indexes: "<name>_bin" (text) and "<name>_int" (integer) entries
///   attached per object, maintained atomically with the object (WriteBatch)
/// - Jobs: executed in-process; map lazily per input, reduces over the full
///   map output
///
/// Fehler werden als StoreException (Lookup/Submit) bzw. JobException
/// (beim Iterieren) gemeldet. The store must outlive every ResultStream it
/// returned.
class LocalStore : public StoreClient {
public:
    struct IndexEntry {
        std::string index;  // e.g. "age_int"
        FilterValue value;

        bool operator==(const IndexEntry& other) const {
            return index == other.index && value == other.value;
        }
    };

    explicit LocalStore(RocksDBWrapper& db);

    /// Insert or replace an object and its index entries.
    /// Throws StoreException on an index name/value mismatch or write failure.
    void storeObject(std::string_view bucket,
                     std::string_view key,
                     const nlohmann::json& document,
                     const std::vector<IndexEntry>& indexes = {});

    /// nullopt if the object does not exist; StoreException if the stored
    /// bytes are not valid JSON
    std::optional<nlohmann::json> fetchObject(std::string_view bucket, std::string_view key);

    /// Index entries currently attached to an object
    std::vector<IndexEntry> indexesOf(std::string_view bucket, std::string_view key);

    /// Removes object and index entries; false if it did not exist
    bool deleteObject(std::string_view bucket, std::string_view key);

    /// All keys of a bucket in key order
    std::vector<std::string> listKeys(std::string_view bucket);

    // StoreClient
    std::vector<ObjectRef> index(const IndexLookup& lookup) override;
    ResultStream submit(const JobSpec& job, std::chrono::milliseconds timeout) override;

    /// Raw document bytes; used by the job executor
    std::optional<std::string> fetchRaw(std::string_view bucket, std::string_view key);

private:
    RocksDBWrapper& db_;

    static std::string encodeIndexValue(IndexKind kind, const FilterValue& value);
    /// Integer bound of an _int lookup; nullopt when nothing can fall inside
    static std::optional<int64_t> intBoundOf(const FilterValue& value, bool lower);
    static IndexKind kindOfIndexName(std::string_view index);
    static void validateIndexEntry(const IndexEntry& entry);

    static nlohmann::json indexEntriesToJson(const std::vector<IndexEntry>& entries);
    static std::vector<IndexEntry> indexEntriesFromJson(const nlohmann::json& j);

    void ensureOpen_(const char* op) const;
    /// Point read; StoreException on a read failure, nullopt only if absent
    std::optional<std::vector<uint8_t>> read_(std::string_view dbKey, const char* op);
};

} // namespace multiquery
