/**
 * @file mysql_dialect.hpp
 * @brief MySQL / MariaDB SQL spelling
 */

#pragma once

#include <relational/sql_dialect.hpp>
#include <string>
#include <utility>

namespace Omnidb {

/**
 * @brief Backtick quoting, positional ? placeholders, information_schema catalog.
 *
 * The schema argument of every catalog query is a database name.
 */
class MySqlDialect : public SqlDialect {
public:
    explicit MySqlDialect(std::string display_name = "MySQL") : display_name_(std::move(display_name)) {}

    std::string name() const override { return display_name_; }
    std::string quote_identifier(const std::string& identifier) const override;
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
    std::string display_name_;
};

} // namespace Omnidb
