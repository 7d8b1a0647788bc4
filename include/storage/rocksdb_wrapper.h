#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <functional>
#include <utility>

namespace rocksdb {
    class DB;
    class WriteBatch;
    class Options;
    class ReadOptions;
    class WriteOptions;
    class Iterator;
}

namespace multiquery {

/// Thin wrapper around a plain RocksDB instance.
/// Owns options and handles; exposes point ops, atomic batches and ordered scans.
class RocksDBWrapper {
public:
    struct Config {
        std::string db_path = "./data/multiquery";
        std::string wal_dir; // wenn leer -> Standard unter db_path

        size_t memtable_size_mb = 64;
        size_t block_cache_size_mb = 128;
        int bloom_bits_per_key = 10;
        bool enable_wal = true;
        int max_background_jobs = 2;

        // Values: "none", "lz4", "zstd", "snappy", "zlib"
        std::string compression_default = "none";
    };

    struct Status {
        bool ok = true;
        std::string message;
        static Status OK() { return {}; }
        static Status Error(std::string msg) { return Status{false, std::move(msg)}; }
    };

    explicit RocksDBWrapper(const Config& config);
    ~RocksDBWrapper();

    // Disable copy, allow move
    RocksDBWrapper(const RocksDBWrapper&) = delete;
    RocksDBWrapper& operator=(const RocksDBWrapper&) = delete;
    RocksDBWrapper(RocksDBWrapper&&) noexcept;
    RocksDBWrapper& operator=(RocksDBWrapper&&) noexcept;

    /// Open the database (creates directories as needed)
    bool open();

    /// Close the database
    void close();

    bool isOpen() const;

    // ===== Point Operations =====

    /// Missing key: ok status and nullopt. Read failures (or a closed DB) give an error status.
    std::pair<Status, std::optional<std::vector<uint8_t>>> get(std::string_view key);
    bool put(std::string_view key, const std::vector<uint8_t>& value);

    // ===== Atomic Batch Operations =====

    class WriteBatchWrapper {
    public:
        explicit WriteBatchWrapper(RocksDBWrapper* db);
        ~WriteBatchWrapper();

        void put(std::string_view key, const std::vector<uint8_t>& value);
        void del(std::string_view key);

        /// Commit the batch atomically
        bool commit();

    private:
        RocksDBWrapper* db_;
        std::unique_ptr<rocksdb::WriteBatch> batch_;
    };

    std::unique_ptr<WriteBatchWrapper> createWriteBatch();

    // ===== Iteration / Scanning =====

    /// Callback returns false to stop the scan
    using ScanCallback = std::function<bool(std::string_view key, std::string_view value)>;

    /// Scan all keys starting with prefix; false if the iterator reported an error
    bool scanPrefix(std::string_view prefix, ScanCallback callback);

    /// Scan range [start_key, end_key); false if the iterator reported an error
    bool scanRange(std::string_view start_key, std::string_view end_key, ScanCallback callback);

private:
    Config config_;
    std::unique_ptr<rocksdb::DB> db_;
    std::unique_ptr<rocksdb::Options> options_;
    std::unique_ptr<rocksdb::ReadOptions> read_options_;
    std::unique_ptr<rocksdb::WriteOptions> write_options_;

    void configureOptions();
    bool commitBatch(rocksdb::WriteBatch* batch);
    static bool checkIterator_(const rocksdb::Iterator& it);
};

} // namespace multiquery
