/**
 * @file relational_plugin.hpp
 * @brief Shared implementation of the adapter contract for SQL engines
 */

#pragma once

#include <core/connection_scope.hpp>
#include <core/plugin.hpp>
#include <relational/graph_classifier.hpp>
#include <relational/sql_builder.hpp>
#include <relational/sql_connection.hpp>
#include <relational/sql_dialect.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Omnidb {

/**
 * @brief Implements every Plugin operation in terms of a SqlDialect and a
 * SqlConnection; concrete engines only supply the dialect and connect().
 */
class RelationalPlugin : public Plugin {
public:
    RelationalPlugin(DatabaseType type, std::unique_ptr<SqlDialect> dialect);

    const SqlDialect& dialect() const { return *dialect_; }

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
    RowsResult raw_execute(const PluginConfig& config, const std::string& query) override;

    std::vector<ChatMessage> chat(const PluginConfig& config,
                                  const std::string& schema,
                                  const std::vector<ChatMessage>& previous,
                                  const std::string& query,
                                  ChatModel& model) override;

    std::vector<std::string> supported_operators() const override { return dialect_->supported_operators(); }
    std::vector<std::string> supported_column_types() const override { return dialect_->supported_column_types(); }

protected:
    /**
     * @brief Open a native connection honouring config.context's deadline.
     * @throws ConnectionError
     */
    virtual std::unique_ptr<SqlConnection> connect(const PluginConfig& config) const = 0;

    template <typename Operation>
    auto run(const PluginConfig& config, const std::string& operation, Operation&& op) {
        return with_connection(config, engine_name(), operation,
                               [this](const PluginConfig& scoped) { return connect(scoped); },
                               std::forward<Operation>(op));
    }

    ResultSet run_catalog(SqlConnection& conn, const CatalogQuery& query) const;
    std::vector<StorageUnit> load_storage_units(SqlConnection& conn, const std::string& schema) const;
    std::vector<Column> load_columns(SqlConnection& conn, const std::string& schema, const std::string& unit) const;
    std::vector<std::string> load_primary_key(SqlConnection& conn, const std::string& schema,
                                              const std::string& unit) const;

    /**
     * @brief Catalog columns of a unit; MalformedInput when the unit does not exist.
     */
    std::vector<Column> require_columns(SqlConnection& conn, const std::string& schema,
                                        const std::string& unit) const;

    /**
     * @brief Pair records with catalog columns and coerce them for writing.
     * @throws DbError(MalformedInput) on unknown columns or invalid values
     */
    std::vector<Assignment> assign(const std::vector<Column>& columns,
                                   const std::vector<Record>& values,
                                   const std::string& unit) const;

private:
    std::unique_ptr<SqlDialect> dialect_;
    SqlBuilder builder_;
};

} // namespace Omnidb
