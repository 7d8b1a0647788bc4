#pragma once

#include "storage/rocksdb_wrapper.h"
#include "utils/logger.h"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace multiquery {

using json = nlohmann::json;

class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Runtime configuration for query planning, logging and the embedded store.
 *
 * Missing keys keep their defaults. Layout (YAML or JSON):
 *
 *   query:   { default_timeout_ms, int_index_bound }
 *   logging: { level, file }
 *   storage: { db_path, wal_dir, memtable_size_mb, block_cache_size_mb, enable_wal, compression }
 */
struct QueryConfig {
    struct QuerySettings {
        std::chrono::milliseconds default_timeout{9000};
        int64_t int_index_bound = 99999999999999999LL; // offene Grenze für _int-Range-Lookups
    } query;

    struct LoggingSettings {
        std::string level = "info";
        std::string file;                              // leer = nur Konsole
    } logging;

    RocksDBWrapper::Config storage;

    /**
     * @brief Load configuration from a YAML file
     * @throws ConfigException if the file cannot be read or parsed
     */
    static QueryConfig loadFromYaml(const std::string& yaml_path);

    /**
     * @brief Load configuration from a JSON file
     * @throws ConfigException if the file cannot be read or parsed
     */
    static QueryConfig loadFromJsonFile(const std::string& json_path);

    /**
     * @brief Dispatch on extension (.yaml/.yml, otherwise JSON)
     */
    static QueryConfig loadFromFile(const std::string& path);

    static QueryConfig fromJson(const json& j);
    json toJson() const;

    /// Apply logging settings to the global logger
    void applyLogging() const;
};

} // namespace multiquery
