#include <plugins/sqlite_plugin.hpp>
#include <database/sqlite_connection.hpp>

namespace Omnidb {

namespace {

std::string base_name(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string schema_or_main(const std::string& schema) {
    return schema.empty() ? "main" : schema;
}

} // namespace

std::string SqliteDialect::placeholder(std::size_t index, const std::string&) const {
    return "?" + std::to_string(index);
}

std::vector<std::string> SqliteDialect::supported_operators() const {
    auto ops = SqlDialect::supported_operators();
    ops.insert(ops.end(), {"GLOB", "NOT GLOB"});
    return ops;
}

std::vector<std::string> SqliteDialect::supported_column_types() const {
    return {
        "integer", "int", "tinyint", "smallint", "mediumint", "bigint",
        "real", "double", "float", "numeric", "decimal",
        "boolean", "date", "datetime", "timestamp",
        "text", "varchar", "char", "clob", "blob", "json"
    };
}

std::string SqliteDialect::master_table(const std::string& schema) const {
    return quote_identifier(schema_or_main(schema)) + ".sqlite_master";
}

CatalogQuery SqliteDialect::databases_query() const {
    return {"SELECT file FROM pragma_database_list WHERE name = 'main'", {}};
}

CatalogQuery SqliteDialect::schemas_query() const {
    return {"SELECT name FROM pragma_database_list WHERE name <> 'temp' ORDER BY seq", {}};
}

CatalogQuery SqliteDialect::storage_units_query(const std::string& schema) const {
    return {"SELECT m.name, m.type AS \"Type\" FROM " + master_table(schema) + " m "
            "WHERE m.type IN ('table', 'view') AND m.name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
            "ORDER BY m.name", {}};
}

CatalogQuery SqliteDialect::columns_query(const std::string& schema) const {
    return {"SELECT m.name, p.name, lower(p.type) FROM " + master_table(schema) + " m "
            "JOIN pragma_table_info(m.name, ?1) p "
            "WHERE m.type IN ('table', 'view') AND m.name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
            "ORDER BY m.name, p.cid",
            {Value::of_text(schema_or_main(schema))}};
}

CatalogQuery SqliteDialect::table_columns_query(const std::string& schema, const std::string& table) const {
    return {"SELECT name, lower(type) FROM pragma_table_info(?1, ?2) ORDER BY cid",
            {Value::of_text(table), Value::of_text(schema_or_main(schema))}};
}

CatalogQuery SqliteDialect::primary_key_query(const std::string& schema, const std::string& table) const {
    return {"SELECT name FROM pragma_table_info(?1, ?2) WHERE pk > 0 ORDER BY pk",
            {Value::of_text(table), Value::of_text(schema_or_main(schema))}};
}

CatalogQuery SqliteDialect::key_columns_query(const std::string& schema) const {
    // INTEGER PRIMARY KEY has no index, so primary keys come from table_info.
    return {"SELECT m.name, p.name, 'PRIMARY KEY', 'primary' FROM " + master_table(schema) + " m "
            "JOIN pragma_table_info(m.name, ?1) p WHERE m.type = 'table' AND p.pk > 0 "
            "UNION ALL "
            "SELECT m.name, ii.name, 'UNIQUE', il.name FROM " + master_table(schema) + " m "
            "JOIN pragma_index_list(m.name, ?1) il "
            "JOIN pragma_index_info(il.name, ?1) ii "
            "WHERE m.type = 'table' AND il.\"unique\" = 1 AND il.origin <> 'pk'",
            {Value::of_text(schema_or_main(schema))}};
}

CatalogQuery SqliteDialect::foreign_keys_query(const std::string& schema) const {
    return {"SELECT m.name, f.\"from\", f.\"table\", f.\"to\", m.name || '#' || f.id FROM " + master_table(schema) + " m "
            "JOIN pragma_foreign_key_list(m.name, ?1) f WHERE m.type = 'table' "
            "ORDER BY m.name, f.id, f.seq",
            {Value::of_text(schema_or_main(schema))}};
}

SqlitePlugin::SqlitePlugin()
    : RelationalPlugin(DatabaseType::Sqlite3, std::make_unique<SqliteDialect>()) {}

std::vector<std::string> SqlitePlugin::get_databases(const PluginConfig& config) {
    auto files = RelationalPlugin::get_databases(config);
    std::string file = files.empty() || files.front().empty() ? config.credentials.database : files.front();
    return {base_name(file)};
}

std::unique_ptr<SqlConnection> SqlitePlugin::connect(const PluginConfig& config) const {
    return std::make_unique<SqliteConnection>(config.credentials.database, config.context);
}

} // namespace Omnidb
