/**
 * @file sql_dialect.hpp
 * @brief Per-engine SQL spelling: quoting, placeholders, catalog queries
 *
 * Dialects are pure: they build strings and never touch a connection.
 */

#pragma once

#include <core/value_coercion.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace Omnidb {

/**
 * @brief A catalog statement with its bound parameters.
 *
 * An empty sql means the engine has no such catalog (e.g. ClickHouse has
 * no foreign keys) and the caller treats the result as empty.
 */
struct CatalogQuery {
    std::string sql;
    std::vector<Value> params;

    bool empty() const { return sql.empty(); }
};

class SqlDialect {
public:
    virtual ~SqlDialect() = default;

    /**
     * @brief Display name used in prompts and logs ("PostgreSQL", "SQLite", ...).
     */
    virtual std::string name() const = 0;

    /**
     * @brief Quote one identifier, doubling any embedded quote character.
     */
    virtual std::string quote_identifier(const std::string& identifier) const;

    /**
     * @brief schema.unit, or just the unit when schema is empty.
     */
    virtual std::string qualified_name(const std::string& schema, const std::string& unit) const;

    /**
     * @brief Placeholder for the 1-based parameter index bound to a column
     * of the given type. An empty type means a plain text pattern.
     */
    virtual std::string placeholder(std::size_t index, const std::string& column_type) const = 0;

    virtual std::vector<std::string> supported_operators() const;
    virtual std::vector<std::string> supported_column_types() const = 0;

    /**
     * @brief Whether a column type may be used in CREATE TABLE.
     *
     * Matches the base name case-insensitively against supported_column_types()
     * and allows numeric parameters such as varchar(255) or numeric(10, 2).
     */
    virtual bool is_supported_column_type(const std::string& type) const;

    virtual std::string pagination_clause(std::size_t limit, std::size_t offset) const;

    // Catalog queries. Column layouts:
    //   databases_query, schemas_query: name
    //   storage_units_query:   name, then one column per descriptive attribute
    //   columns_query:         table, column, type
    //   table_columns_query:   column, type
    //   primary_key_query:     column (in key order)
    //   key_columns_query:     table, column, kind ("PRIMARY KEY" | "UNIQUE"), constraint
    //   foreign_keys_query:    table, column, referenced table, referenced column, constraint
    virtual CatalogQuery databases_query() const = 0;
    virtual CatalogQuery schemas_query() const = 0;
    virtual CatalogQuery storage_units_query(const std::string& schema) const = 0;
    virtual CatalogQuery columns_query(const std::string& schema) const = 0;
    virtual CatalogQuery table_columns_query(const std::string& schema, const std::string& table) const = 0;
    virtual CatalogQuery primary_key_query(const std::string& schema, const std::string& table) const = 0;
    virtual CatalogQuery key_columns_query(const std::string& schema) const = 0;
    virtual CatalogQuery foreign_keys_query(const std::string& schema) const = 0;

    virtual bool supports_foreign_keys() const { return true; }

    /**
     * @brief False where UPDATE/DELETE are asynchronous mutations with no row count.
     */
    virtual bool reports_affected_rows() const { return true; }

    // Statement shape hooks.
    virtual std::string update_prefix(const std::string& qualified) const { return "UPDATE " + qualified + " SET "; }
    virtual std::string delete_prefix(const std::string& qualified) const { return "DELETE FROM " + qualified; }
    virtual bool insert_uses_select() const { return false; }
    virtual bool inline_primary_key() const { return true; }

    /**
     * @brief Text appended after the column list of CREATE TABLE.
     */
    virtual std::string create_table_suffix(const std::vector<std::string>& primary_keys) const;

    /**
     * @brief SELECT/WITH/SHOW/DESCRIBE/EXPLAIN/PRAGMA/VALUES.
     */
    virtual bool is_read_statement(const std::string& sql) const;

protected:
    std::string quote_with(const std::string& identifier, char quote) const;
};

/**
 * @brief Identifier syntax accepted by add_storage_unit: [A-Za-z_][A-Za-z0-9_$]*
 */
bool is_valid_identifier(const std::string& identifier);

} // namespace Omnidb
