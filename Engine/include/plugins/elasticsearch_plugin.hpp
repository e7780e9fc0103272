/**
 * @file elasticsearch_plugin.hpp
 * @brief Elasticsearch adapter over the REST API
 *
 * Indices are storage units and every row is one "document" cell holding
 * {"_id": ..., ...source}. There are no databases or schemas; the schema
 * argument is ignored.
 */

#pragma once

#include <core/connection_scope.hpp>
#include <core/plugin.hpp>
#include <database/http_client.hpp>
#include <plugins/elasticsearch_query.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Omnidb {

class ElasticsearchPlugin : public Plugin {
public:
    /**
     * @param max_result_window deepest from + size served without a
     * point-in-time walk (the index.max_result_window setting)
     */
    explicit ElasticsearchPlugin(std::size_t max_result_window = 10000);

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

    std::vector<std::string> supported_operators() const override { return elasticsearch_operators(); }
    std::vector<std::string> supported_column_types() const override { return elasticsearch_field_types(); }

    /**
     * @brief Index names must be lower-case, must not start with _, - or +,
     * and must not contain spaces or any of \ / * ? " < > | , #
     */
    static bool is_valid_index_name(const std::string& name);

private:
    std::unique_ptr<HttpClient> connect(const PluginConfig& config) const;

    template <typename Operation>
    auto run(const PluginConfig& config, const std::string& operation, Operation&& op) {
        return with_connection(config, engine_name(), operation,
                               [this](const PluginConfig& scoped) { return connect(scoped); },
                               std::forward<Operation>(op));
    }

    FieldTypes load_fields(HttpClient& http, const std::string& index) const;
    std::vector<std::string> search_page(HttpClient& http, const std::string& index,
                                         const nlohmann::json& query,
                                         std::size_t page_size, std::size_t page_offset) const;
    std::vector<std::string> search_deep(HttpClient& http, const std::string& index,
                                         const nlohmann::json& query,
                                         std::size_t page_size, std::size_t page_offset) const;

    std::size_t max_result_window_;
};

} // namespace Omnidb
