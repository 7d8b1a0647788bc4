// Example: multi-index queries against the embedded store

#include "query/multi_index_query.h"
#include "query/query_config.h"
#include "store/local_store.h"
#include "utils/logger.h"
#include <iostream>
#include <string>

using namespace multiquery;

namespace {

void printRows(ResultStream rows) {
    for (const auto& row : rows) {
        std::cout << "  [" << row.key << ", " << row.document.dump() << "]\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    QueryConfig config;
    config.storage.db_path = "./data/multiquery_demo";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            try {
                config = QueryConfig::loadFromFile(argv[++i]);
            } catch (const ConfigException& e) {
                std::cerr << e.what() << "\n";
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [--config FILE]\n";
            return 0;
        }
    }
    config.applyLogging();

    RocksDBWrapper db(config.storage);
    if (!db.open()) {
        MULTIQUERY_CRITICAL("Cannot open database at {}", config.storage.db_path);
        return 1;
    }

    try {
        LocalStore store(db);
        const std::string bucket = "test_multi_index";

        // 1. Seed two documents with name_bin / age_int index entries
        store.storeObject(bucket, "sree", {{"name", "Sreejith"}, {"age", 25}},
                          {{"name_bin", std::string("Sreejith")}, {"age_int", int64_t{25}}});
        store.storeObject(bucket, "vishnu", {{"name", "Vishnu"}, {"age", 31}},
                          {{"name_bin", std::string("Vishnu")}, {"age_int", int64_t{31}}});

        MultiIndexQuery::Options options;
        options.default_timeout = config.query.default_timeout;
        options.int_index_bound = config.query.int_index_bound;
        MultiIndexQuery query(store, bucket, options);

        // 2. Exact match over the text index
        printRows(query.filter("name", "==", "Sreejith").run());
        std::cout << "Last executed query: " << query << "\n";

        // 3. Range + exact, intersected by the map stage
        query.reset();
        printRows(query.filter("age", "<", int64_t{50}).filter("name", "==", "Vishnu").run());
        std::cout << "Last executed query: " << query << "\n";

        // 4. Ordered by age
        query.reset();
        printRows(query.filter("age", "<", int64_t{50}).order("age", "ASC").run());
        std::cout << "Last executed query: " << query << "\n";

        // 5. No filters: whole bucket, first row only
        query.reset();
        printRows(query.limit(1).run());
        std::cout << "Last executed query: " << query << "\n";

        // 6. Second page of size one
        query.reset();
        printRows(query.order("age", "ASC").offset(1).limit(1).run());
        std::cout << "Last executed query: " << query << "\n";

        // 7. Cleanup
        query.reset();
        for (const auto& row : query.run()) {
            if (!store.deleteObject(bucket, row.key)) {
                MULTIQUERY_WARN("Object {} vanished before cleanup", row.key);
            }
        }
    } catch (const std::exception& e) {
        MULTIQUERY_ERROR("Demo failed: {}", e.what());
        db.close();
        return 1;
    }

    db.close();
    utils::Logger::shutdown();
    return 0;
}
