/**
 * @file sqlite_plugin.hpp
 * @brief SQLite dialect and adapter
 *
 * Credentials.database is the database file path. Schemas are the attached
 * database names ("main" plus anything ATTACHed).
 */

#pragma once

#include <relational/relational_plugin.hpp>
#include <relational/sql_dialect.hpp>

namespace Omnidb {

class SqliteDialect : public SqlDialect {
public:
    std::string name() const override { return "SQLite"; }
    std::string placeholder(std::size_t index, const std::string& column_type) const override;
    std::vector<std::string> supported_operators() const override;
    std::vector<std::string> supported_column_types() const override;

    CatalogQuery databases_query() const override;
    CatalogQuery schemas_query() const override;
    CatalogQuery storage_units_query(const std::string& schema) const override;
    CatalogQuery columns_query(const std::string& schema) const override;
    CatalogQuery table_columns_query(const std::string& schema, const std::string& table) const override;
    CatalogQuery primary_key_query(const std::string& schema, const std::string& table) const override;
    CatalogQuery key_columns_query(const std::string& schema) const override;
    CatalogQuery foreign_keys_query(const std::string& schema) const override;

private:
    std::string master_table(const std::string& schema) const;
};

class SqlitePlugin : public RelationalPlugin {
public:
    SqlitePlugin();

    /**
     * @brief The database file name, as the single database of this connection.
     */
    std::vector<std::string> get_databases(const PluginConfig& config) override;

protected:
    std::unique_ptr<SqlConnection> connect(const PluginConfig& config) const override;
};

} // namespace Omnidb
