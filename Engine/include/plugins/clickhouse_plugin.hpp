/**
 * @file clickhouse_plugin.hpp
 * @brief ClickHouse dialect and adapter
 *
 * ClickHouse has no foreign keys and no unique constraints, so rows are
 * matched on their full column set and get_graph is unsupported. UPDATE and
 * DELETE are ALTER TABLE mutations, run synchronously.
 */

#pragma once

#include <relational/relational_plugin.hpp>
#include <relational/sql_dialect.hpp>

namespace Omnidb {

class ClickHouseDialect : public SqlDialect {
public:
    std::string name() const override { return "ClickHouse"; }
    std::string quote_identifier(const std::string& identifier) const override;
    std::string placeholder(std::size_t index, const std::string& column_type) const override;
    std::vector<std::string> supported_operators() const override;
    std::vector<std::string> supported_column_types() const override;
    bool is_supported_column_type(const std::string& type) const override;

    CatalogQuery databases_query() const override;
    CatalogQuery schemas_query() const override;
    CatalogQuery storage_units_query(const std::string& schema) const override;
    CatalogQuery columns_query(const std::string& schema) const override;
    CatalogQuery table_columns_query(const std::string& schema, const std::string& table) const override;
    CatalogQuery primary_key_query(const std::string& schema, const std::string& table) const override;
    CatalogQuery key_columns_query(const std::string& schema) const override;
    CatalogQuery foreign_keys_query(const std::string& schema) const override;

    bool supports_foreign_keys() const override { return false; }
    bool reports_affected_rows() const override { return false; }
    std::string update_prefix(const std::string& qualified) const override;
    std::string delete_prefix(const std::string& qualified) const override;
    bool insert_uses_select() const override { return true; }
    bool inline_primary_key() const override { return false; }
    std::string create_table_suffix(const std::vector<std::string>& primary_keys) const override;
};

class ClickHousePlugin : public RelationalPlugin {
public:
    ClickHousePlugin();

protected:
    std::unique_ptr<SqlConnection> connect(const PluginConfig& config) const override;
};

} // namespace Omnidb
