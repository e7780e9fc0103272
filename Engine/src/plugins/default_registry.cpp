#include <plugins/default_registry.hpp>
#include <plugins/clickhouse_plugin.hpp>
#include <plugins/elasticsearch_plugin.hpp>
#include <plugins/postgres_plugin.hpp>
#include <plugins/sqlite_plugin.hpp>
#include <utils/logger.hpp>
#include <memory>
#include <string>

#ifdef OMNIDB_WITH_MYSQL
#include <plugins/mysql_plugin.hpp>
#endif
#ifdef OMNIDB_WITH_REDIS
#include <plugins/redis_plugin.hpp>
#endif
#ifdef OMNIDB_WITH_MONGODB
#include <plugins/mongodb_plugin.hpp>
#endif

namespace Omnidb {

PluginRegistry make_default_registry(const EngineSettings& settings) {
    PluginRegistry registry;

    registry.add(std::make_unique<PostgresPlugin>());
#ifdef OMNIDB_WITH_MYSQL
    registry.add(std::make_unique<MySqlPlugin>(DatabaseType::MySQL));
    registry.add(std::make_unique<MySqlPlugin>(DatabaseType::MariaDB));
#endif
    registry.add(std::make_unique<SqlitePlugin>());
    registry.add(std::make_unique<ClickHousePlugin>());
#ifdef OMNIDB_WITH_MONGODB
    registry.add(std::make_unique<MongoPlugin>(settings.mongo_sample_size));
#endif
#ifdef OMNIDB_WITH_REDIS
    registry.add(std::make_unique<RedisPlugin>(settings.redis_scan_limit));
#endif
    registry.add(std::make_unique<ElasticsearchPlugin>(settings.es_max_result_window));

    registry.finalize();

    std::string names;
    for (DatabaseType type : registry.types()) {
        if (!names.empty()) names += ", ";
        names += to_string(type);
    }
    Logger::debug("Registered engines: " + names);

    return registry;
}

} // namespace Omnidb
