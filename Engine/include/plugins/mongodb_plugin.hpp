/**
 * @file mongodb_plugin.hpp
 * @brief MongoDB adapter over mongocxx
 *
 * Databases are schemas, collections are storage units and every row is one
 * "document" cell holding relaxed extended JSON.
 */

#pragma once

#include <core/connection_scope.hpp>
#include <core/plugin.hpp>
#include <database/mongodb_connection.hpp>
#include <plugins/mongodb_filter.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Omnidb {

class MongoPlugin : public Plugin {
public:
    /**
     * @param sample_size documents sampled per collection for columns and
     * reference inference
     */
    explicit MongoPlugin(std::size_t sample_size = 1);

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

    std::vector<GraphUnit> get_graph(const PluginConfig& config, const std::string& schema) override;

    std::vector<std::string> supported_operators() const override { return mongodb_operators(); }

private:
    std::unique_ptr<MongoConnection> connect(const PluginConfig& config) const;

    template <typename Operation>
    auto run(const PluginConfig& config, const std::string& operation, Operation&& op) {
        return with_connection(config, engine_name(), operation,
                               [this](const PluginConfig& scoped) { return connect(scoped); },
                               std::forward<Operation>(op));
    }

    std::vector<StorageUnit> load_collections(MongoConnection& conn, const std::string& schema) const;

    std::size_t sample_size_;
};

} // namespace Omnidb
