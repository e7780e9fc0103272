/**
 * @file redis_plugin.hpp
 * @brief Redis adapter over hiredis
 *
 * Keys are storage units; their rows depend on the key type. The database
 * index comes from Credentials.database and the schema argument is ignored.
 *
 * Updates that change a set member, hash field or zset member need the old
 * value: pass it as the "Original" extra of that record.
 */

#pragma once

#include <core/connection_scope.hpp>
#include <core/plugin.hpp>
#include <database/redis_connection.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Omnidb {

class RedisPlugin : public Plugin {
public:
    /**
     * @param scan_limit most keys or elements read by one bounded scan
     */
    explicit RedisPlugin(std::size_t scan_limit = 10000);

    bool is_available(const PluginConfig& config) override;
    std::vector<std::string> get_databases(const PluginConfig& config) override;
    std::vector<std::string> get_all_schemas(const PluginConfig& config) override;
    std::vector<StorageUnit> get_storage_units(const PluginConfig& config, const std::string& schema) override;
    std::vector<Column> get_columns(const PluginConfig& config,
                                    const std::string& schema,
                                    const std::string& storage_unit) override;

    RowsResult get_rows(const PluginConfig& config,
                        const std::string& schema,
                        const std::string& storage_unit,
                        const WhereCondition* where,
                        std::size_t page_size,
                        std::size_t page_offset) override;

    bool add_storage_unit(const PluginConfig& config,
                          const std::string& schema,
                          const std::string& storage_unit,
                          const std::vector<Record>& fields) override;

    bool update_storage_unit(const PluginConfig& config,
                             const std::string& schema,
                             const std::string& storage_unit,
                             const std::vector<Record>& values,
                             const std::vector<std::string>& updated_columns) override;

    bool add_row(const PluginConfig& config,
                 const std::string& schema,
                 const std::string& storage_unit,
                 const std::vector<Record>& values) override;

    bool delete_row(const PluginConfig& config,
                    const std::string& schema,
                    const std::string& storage_unit,
                    const std::vector<Record>& values) override;

    std::vector<std::string> supported_operators() const override;

private:
    std::unique_ptr<RedisConnection> connect(const PluginConfig& config) const;

    template <typename Operation>
    auto run(const PluginConfig& config, const std::string& operation, Operation&& op) {
        return with_connection(config, engine_name(), operation,
                               [this](const PluginConfig& scoped) { return connect(scoped); },
                               std::forward<Operation>(op));
    }

    /**
     * @brief Type of an existing key; MalformedInput when it does not exist.
     */
    std::string key_type(RedisConnection& conn, const std::string& key) const;

    /**
     * @brief SCAN-family walk until the cursor wraps or limit items are read.
     * @return true when the walk stopped at the limit
     */
    bool scan(RedisConnection& conn, std::vector<std::string> command_prefix,
              std::size_t step, std::size_t limit, std::vector<std::string>& items) const;

    std::size_t scan_limit_;
};

} // namespace Omnidb
