#include <plugins/mysql_dialect.hpp>

namespace Omnidb {

std::string MySqlDialect::quote_identifier(const std::string& identifier) const {
    return quote_with(identifier, '`');
}

std::string MySqlDialect::placeholder(std::size_t, const std::string&) const {
    return "?";
}

std::vector<std::string> MySqlDialect::supported_operators() const {
    auto ops = SqlDialect::supported_operators();
    ops.insert(ops.end(), {"REGEXP", "NOT REGEXP"});
    return ops;
}

std::vector<std::string> MySqlDialect::supported_column_types() const {
    return {
        "tinyint", "smallint", "mediumint", "int", "integer", "bigint",
        "decimal", "numeric", "float", "double", "real", "bit", "boolean", "bool",
        "date", "time", "datetime", "timestamp", "year",
        "char", "varchar", "tinytext", "text", "mediumtext", "longtext",
        "binary", "varbinary", "tinyblob", "blob", "mediumblob", "longblob",
        "json"
    };
}

CatalogQuery MySqlDialect::databases_query() const {
    return {"SELECT SCHEMA_NAME FROM information_schema.SCHEMATA ORDER BY SCHEMA_NAME", {}};
}

CatalogQuery MySqlDialect::schemas_query() const {
    return databases_query();
}

CatalogQuery MySqlDialect::storage_units_query(const std::string& schema) const {
    return {"SELECT TABLE_NAME AS `name`, TABLE_TYPE AS `Type`, "
            "COALESCE(DATA_LENGTH + INDEX_LENGTH, 0) AS `Total Size`, "
            "COALESCE(TABLE_ROWS, 0) AS `Count` "
            "FROM information_schema.TABLES WHERE TABLE_SCHEMA = ? ORDER BY TABLE_NAME",
            {Value::of_text(schema)}};
}

CatalogQuery MySqlDialect::columns_query(const std::string& schema) const {
    return {"SELECT TABLE_NAME, COLUMN_NAME, DATA_TYPE FROM information_schema.COLUMNS "
            "WHERE TABLE_SCHEMA = ? ORDER BY TABLE_NAME, ORDINAL_POSITION",
            {Value::of_text(schema)}};
}

CatalogQuery MySqlDialect::table_columns_query(const std::string& schema, const std::string& table) const {
    return {"SELECT COLUMN_NAME, DATA_TYPE FROM information_schema.COLUMNS "
            "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? ORDER BY ORDINAL_POSITION",
            {Value::of_text(schema), Value::of_text(table)}};
}

CatalogQuery MySqlDialect::primary_key_query(const std::string& schema, const std::string& table) const {
    return {"SELECT COLUMN_NAME FROM information_schema.KEY_COLUMN_USAGE "
            "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? AND CONSTRAINT_NAME = 'PRIMARY' "
            "ORDER BY ORDINAL_POSITION",
            {Value::of_text(schema), Value::of_text(table)}};
}

CatalogQuery MySqlDialect::key_columns_query(const std::string& schema) const {
    return {"SELECT kcu.TABLE_NAME, kcu.COLUMN_NAME, tc.CONSTRAINT_TYPE, tc.CONSTRAINT_NAME "
            "FROM information_schema.TABLE_CONSTRAINTS tc "
            "JOIN information_schema.KEY_COLUMN_USAGE kcu "
            "ON kcu.CONSTRAINT_SCHEMA = tc.CONSTRAINT_SCHEMA AND kcu.CONSTRAINT_NAME = tc.CONSTRAINT_NAME "
            "AND kcu.TABLE_NAME = tc.TABLE_NAME "
            "WHERE tc.TABLE_SCHEMA = ? AND tc.CONSTRAINT_TYPE IN ('PRIMARY KEY', 'UNIQUE') "
            "ORDER BY kcu.TABLE_NAME, tc.CONSTRAINT_NAME, kcu.ORDINAL_POSITION",
            {Value::of_text(schema)}};
}

CatalogQuery MySqlDialect::foreign_keys_query(const std::string& schema) const {
    return {"SELECT TABLE_NAME, COLUMN_NAME, REFERENCED_TABLE_NAME, REFERENCED_COLUMN_NAME, CONSTRAINT_NAME "
            "FROM information_schema.KEY_COLUMN_USAGE "
            "WHERE TABLE_SCHEMA = ? AND REFERENCED_TABLE_NAME IS NOT NULL "
            "ORDER BY TABLE_NAME, CONSTRAINT_NAME, ORDINAL_POSITION",
            {Value::of_text(schema)}};
}

} // namespace Omnidb
