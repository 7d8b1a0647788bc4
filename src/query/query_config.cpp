#include "query/query_config.h"

#include <fstream>
#include <yaml-cpp/yaml.h>

namespace multiquery {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

QueryConfig QueryConfig::loadFromYaml(const std::string& yaml_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(yaml_path);
    } catch (const YAML::Exception& e) {
        throw ConfigException("Failed to load config " + yaml_path + ": " + e.what());
    }

    QueryConfig result;
    try {
        if (config["query"]) {
            auto q = config["query"];
            result.query.default_timeout = std::chrono::milliseconds(
                q["default_timeout_ms"].as<int64_t>(result.query.default_timeout.count())
            );
            result.query.int_index_bound = q["int_index_bound"].as<int64_t>(result.query.int_index_bound);
        }

        if (config["logging"]) {
            auto l = config["logging"];
            result.logging.level = l["level"].as<std::string>(result.logging.level);
            result.logging.file = l["file"].as<std::string>(result.logging.file);
        }

        if (config["storage"]) {
            auto s = config["storage"];
            auto& st = result.storage;
            st.db_path = s["db_path"].as<std::string>(st.db_path);
            st.wal_dir = s["wal_dir"].as<std::string>(st.wal_dir);
            st.memtable_size_mb = s["memtable_size_mb"].as<size_t>(st.memtable_size_mb);
            st.block_cache_size_mb = s["block_cache_size_mb"].as<size_t>(st.block_cache_size_mb);
            st.enable_wal = s["enable_wal"].as<bool>(st.enable_wal);
            st.compression_default = s["compression"].as<std::string>(st.compression_default);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigException("Invalid config " + yaml_path + ": " + e.what());
    }

    MULTIQUERY_DEBUG("Loaded query config from {}", yaml_path);
    return result;
}

QueryConfig QueryConfig::loadFromJsonFile(const std::string& json_path) {
    std::ifstream f(json_path);
    if (!f.is_open()) {
        throw ConfigException("Failed to open config " + json_path);
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw ConfigException("Failed to parse config " + json_path + ": " + e.what());
    }
    return fromJson(j);
}

QueryConfig QueryConfig::loadFromFile(const std::string& path) {
    if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
        return loadFromYaml(path);
    }
    return loadFromJsonFile(path);
}

QueryConfig QueryConfig::fromJson(const json& j) {
    QueryConfig result;
    try {
        if (j.contains("query")) {
            const auto& q = j["query"];
            result.query.default_timeout = std::chrono::milliseconds(
                q.value("default_timeout_ms", static_cast<int64_t>(result.query.default_timeout.count()))
            );
            result.query.int_index_bound = q.value("int_index_bound", result.query.int_index_bound);
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            result.logging.level = l.value("level", result.logging.level);
            result.logging.file = l.value("file", result.logging.file);
        }

        if (j.contains("storage")) {
            const auto& s = j["storage"];
            auto& st = result.storage;
            st.db_path = s.value("db_path", st.db_path);
            st.wal_dir = s.value("wal_dir", st.wal_dir);
            st.memtable_size_mb = s.value("memtable_size_mb", st.memtable_size_mb);
            st.block_cache_size_mb = s.value("block_cache_size_mb", st.block_cache_size_mb);
            st.enable_wal = s.value("enable_wal", st.enable_wal);
            st.compression_default = s.value("compression", st.compression_default);
        }
    } catch (const json::exception& e) {
        throw ConfigException(std::string("Invalid config: ") + e.what());
    }
    return result;
}

json QueryConfig::toJson() const {
    return {
        {"query", {
            {"default_timeout_ms", static_cast<int64_t>(query.default_timeout.count())},
            {"int_index_bound", query.int_index_bound}
        }},
        {"logging", {
            {"level", logging.level},
            {"file", logging.file}
        }},
        {"storage", {
            {"db_path", storage.db_path},
            {"wal_dir", storage.wal_dir},
            {"memtable_size_mb", storage.memtable_size_mb},
            {"block_cache_size_mb", storage.block_cache_size_mb},
            {"enable_wal", storage.enable_wal},
            {"compression", storage.compression_default}
        }}
    };
}

void QueryConfig::applyLogging() const {
    utils::Logger::init(logging.file, utils::Logger::levelFromString(logging.level));
}

} // namespace multiquery
