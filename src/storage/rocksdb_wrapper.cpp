#include "storage/rocksdb_wrapper.h"
#include "utils/logger.h"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <rocksdb/iterator.h>
#include <rocksdb/table.h>
#include <rocksdb/cache.h>
#include <rocksdb/filter_policy.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace multiquery {

RocksDBWrapper::RocksDBWrapper(const Config& config) : config_(config) {
    options_ = std::make_unique<rocksdb::Options>();
    read_options_ = std::make_unique<rocksdb::ReadOptions>();
    write_options_ = std::make_unique<rocksdb::WriteOptions>();
    configureOptions();
}

RocksDBWrapper::~RocksDBWrapper() {
    close();
}

RocksDBWrapper::RocksDBWrapper(RocksDBWrapper&& other) noexcept
    : config_(std::move(other.config_))
    , db_(std::move(other.db_))
    , options_(std::move(other.options_))
    , read_options_(std::move(other.read_options_))
    , write_options_(std::move(other.write_options_)) {}

RocksDBWrapper& RocksDBWrapper::operator=(RocksDBWrapper&& other) noexcept {
    if (this != &other) {
        close();
        config_ = std::move(other.config_);
        db_ = std::move(other.db_);
        options_ = std::move(other.options_);
        read_options_ = std::move(other.read_options_);
        write_options_ = std::move(other.write_options_);
    }
    return *this;
}

void RocksDBWrapper::configureOptions() {
    options_->create_if_missing = true;

    // Memtable (write buffer)
    options_->write_buffer_size = config_.memtable_size_mb * 1024 * 1024;

    // Block cache + bloom filter for point lookups on object keys
    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config_.block_cache_size_mb * 1024 * 1024);
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(config_.bloom_bits_per_key, false));
    options_->table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    options_->max_background_jobs = config_.max_background_jobs;

    auto toCompression = [](const std::string& s) {
        std::string v = s;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (v == "lz4") return rocksdb::kLZ4Compression;
        if (v == "zstd") return rocksdb::kZSTD;
        if (v == "snappy") return rocksdb::kSnappyCompression;
        if (v == "zlib") return rocksdb::kZlibCompression;
        return rocksdb::kNoCompression;
    };
    options_->compression = toCompression(config_.compression_default);

    // WAL
    write_options_->disableWAL = !config_.enable_wal;
    if (!config_.wal_dir.empty()) {
        options_->wal_dir = config_.wal_dir;
    }
}

bool RocksDBWrapper::open() {
    if (db_) return true;

    std::error_code ec;
    std::filesystem::create_directories(config_.db_path, ec);
    if (ec) {
        MULTIQUERY_ERROR("Failed to create DB directory '{}': {}", config_.db_path, ec.message());
        return false;
    }
    if (!config_.wal_dir.empty()) {
        std::filesystem::create_directories(config_.wal_dir, ec);
        if (ec) {
            MULTIQUERY_ERROR("Failed to create WAL directory '{}': {}", config_.wal_dir, ec.message());
            return false;
        }
    }

    rocksdb::DB* db_ptr = nullptr;
    rocksdb::Status status = rocksdb::DB::Open(*options_, config_.db_path, &db_ptr);
    if (!status.ok()) {
        MULTIQUERY_ERROR("Failed to open RocksDB at {}: {}", config_.db_path, status.ToString());
        return false;
    }

    db_.reset(db_ptr);
    MULTIQUERY_INFO("Opened RocksDB at: {}", config_.db_path);
    return true;
}

void RocksDBWrapper::close() {
    if (db_) {
        MULTIQUERY_INFO("Closing RocksDB at: {}", config_.db_path);
        db_.reset();
    }
}

bool RocksDBWrapper::isOpen() const {
    return db_ != nullptr;
}

std::pair<RocksDBWrapper::Status, std::optional<std::vector<uint8_t>>> RocksDBWrapper::get(std::string_view key) {
    if (!db_) return {Status::Error("database not open"), std::nullopt};

    std::string value;
    rocksdb::Status status = db_->Get(*read_options_, rocksdb::Slice(key.data(), key.size()), &value);
    if (status.ok()) {
        return {Status::OK(), std::vector<uint8_t>(value.begin(), value.end())};
    }
    if (status.IsNotFound()) {
        return {Status::OK(), std::nullopt};
    }
    MULTIQUERY_ERROR("RocksDB get failed: {}", status.ToString());
    return {Status::Error(status.ToString()), std::nullopt};
}

bool RocksDBWrapper::put(std::string_view key, const std::vector<uint8_t>& value) {
    if (!db_) return false;

    rocksdb::Status status = db_->Put(
        *write_options_,
        rocksdb::Slice(key.data(), key.size()),
        rocksdb::Slice(reinterpret_cast<const char*>(value.data()), value.size())
    );
    return status.ok();
}

// WriteBatchWrapper implementation

RocksDBWrapper::WriteBatchWrapper::WriteBatchWrapper(RocksDBWrapper* db)
    : db_(db), batch_(std::make_unique<rocksdb::WriteBatch>()) {}

RocksDBWrapper::WriteBatchWrapper::~WriteBatchWrapper() = default;

void RocksDBWrapper::WriteBatchWrapper::put(std::string_view key, const std::vector<uint8_t>& value) {
    batch_->Put(
        rocksdb::Slice(key.data(), key.size()),
        rocksdb::Slice(reinterpret_cast<const char*>(value.data()), value.size())
    );
}

void RocksDBWrapper::WriteBatchWrapper::del(std::string_view key) {
    batch_->Delete(rocksdb::Slice(key.data(), key.size()));
}

bool RocksDBWrapper::WriteBatchWrapper::commit() {
    return db_->commitBatch(batch_.get());
}

std::unique_ptr<RocksDBWrapper::WriteBatchWrapper> RocksDBWrapper::createWriteBatch() {
    return std::make_unique<WriteBatchWrapper>(this);
}

bool RocksDBWrapper::commitBatch(rocksdb::WriteBatch* batch) {
    if (!db_) return false;

    rocksdb::Status status = db_->Write(*write_options_, batch);
    if (!status.ok()) {
        MULTIQUERY_ERROR("RocksDB batch commit failed: {}", status.ToString());
        return false;
    }
    return true;
}

bool RocksDBWrapper::checkIterator_(const rocksdb::Iterator& it) {
    if (!it.status().ok()) {
        MULTIQUERY_ERROR("RocksDB iterator failed: {}", it.status().ToString());
        return false;
    }
    return true;
}

bool RocksDBWrapper::scanPrefix(std::string_view prefix, ScanCallback callback) {
    if (!db_) return false;

    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    rocksdb::Slice prefix_slice(prefix.data(), prefix.size());

    for (it->Seek(prefix_slice); it->Valid() && it->key().starts_with(prefix_slice); it->Next()) {
        std::string_view key(it->key().data(), it->key().size());
        std::string_view value(it->value().data(), it->value().size());

        if (!callback(key, value)) {
            break; // Stop iteration if callback returns false
        }
    }
    return checkIterator_(*it);
}

bool RocksDBWrapper::scanRange(std::string_view start_key, std::string_view end_key, ScanCallback callback) {
    if (!db_) return false;

    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    rocksdb::Slice start_slice(start_key.data(), start_key.size());
    rocksdb::Slice end_slice(end_key.data(), end_key.size());

    for (it->Seek(start_slice); it->Valid() && it->key().compare(end_slice) < 0; it->Next()) {
        std::string_view key(it->key().data(), it->key().size());
        std::string_view value(it->value().data(), it->value().size());

        if (!callback(key, value)) {
            break;
        }
    }
    return checkIterator_(*it);
}

} // namespace multiquery
