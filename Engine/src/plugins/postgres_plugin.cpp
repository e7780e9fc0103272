#include <plugins/postgres_plugin.hpp>
#include <database/postgres_connection.hpp>

namespace Omnidb {

std::string PostgresDialect::placeholder(std::size_t index, const std::string&) const {
    return "$" + std::to_string(index);
}

std::vector<std::string> PostgresDialect::supported_operators() const {
    auto ops = SqlDialect::supported_operators();
    ops.insert(ops.end(), {"ILIKE", "NOT ILIKE", "SIMILAR TO", "NOT SIMILAR TO"});
    return ops;
}

std::vector<std::string> PostgresDialect::supported_column_types() const {
    return {
        "smallint", "integer", "int", "bigint", "int2", "int4", "int8", "serial", "bigserial",
        "decimal", "numeric", "real", "double precision", "float4", "float8", "money",
        "boolean", "bool",
        "char", "character", "varchar", "character varying", "text", "citext",
        "bytea",
        "date", "time", "timetz", "timestamp", "timestamptz", "interval",
        "uuid", "json", "jsonb", "xml", "inet", "cidr", "macaddr"
    };
}

CatalogQuery PostgresDialect::databases_query() const {
    return {"SELECT datname FROM pg_database WHERE NOT datistemplate ORDER BY datname", {}};
}

CatalogQuery PostgresDialect::schemas_query() const {
    return {"SELECT schema_name FROM information_schema.schemata "
            "WHERE schema_name NOT LIKE 'pg\\_%' AND schema_name <> 'information_schema' "
            "ORDER BY schema_name", {}};
}

CatalogQuery PostgresDialect::storage_units_query(const std::string& schema) const {
    return {"SELECT t.table_name, t.table_type AS \"Type\", "
            "pg_size_pretty(pg_total_relation_size(format('%I.%I', t.table_schema, t.table_name)::regclass)) "
            "AS \"Total Size\", "
            "COALESCE(s.n_live_tup, 0) AS \"Count\" "
            "FROM information_schema.tables t "
            "LEFT JOIN pg_stat_user_tables s ON s.schemaname = t.table_schema AND s.relname = t.table_name "
            "WHERE t.table_schema = $1 ORDER BY t.table_name",
            {Value::of_text(schema)}};
}

CatalogQuery PostgresDialect::columns_query(const std::string& schema) const {
    return {"SELECT table_name, column_name, data_type FROM information_schema.columns "
            "WHERE table_schema = $1 ORDER BY table_name, ordinal_position",
            {Value::of_text(schema)}};
}

CatalogQuery PostgresDialect::table_columns_query(const std::string& schema, const std::string& table) const {
    return {"SELECT column_name, data_type FROM information_schema.columns "
            "WHERE table_schema = $1 AND table_name = $2 ORDER BY ordinal_position",
            {Value::of_text(schema), Value::of_text(table)}};
}

CatalogQuery PostgresDialect::primary_key_query(const std::string& schema, const std::string& table) const {
    return {"SELECT kcu.column_name FROM information_schema.table_constraints tc "
            "JOIN information_schema.key_column_usage kcu "
            "ON kcu.constraint_name = tc.constraint_name AND kcu.table_schema = tc.table_schema "
            "AND kcu.table_name = tc.table_name "
            "WHERE tc.constraint_type = 'PRIMARY KEY' AND tc.table_schema = $1 AND tc.table_name = $2 "
            "ORDER BY kcu.ordinal_position",
            {Value::of_text(schema), Value::of_text(table)}};
}

CatalogQuery PostgresDialect::key_columns_query(const std::string& schema) const {
    return {"SELECT tc.table_name, kcu.column_name, tc.constraint_type, tc.constraint_name "
            "FROM information_schema.table_constraints tc "
            "JOIN information_schema.key_column_usage kcu "
            "ON kcu.constraint_name = tc.constraint_name AND kcu.table_schema = tc.table_schema "
            "AND kcu.table_name = tc.table_name "
            "WHERE tc.constraint_type IN ('PRIMARY KEY', 'UNIQUE') AND tc.table_schema = $1 "
            "ORDER BY tc.table_name, tc.constraint_name, kcu.ordinal_position",
            {Value::of_text(schema)}};
}

CatalogQuery PostgresDialect::foreign_keys_query(const std::string& schema) const {
    return {"SELECT kcu.table_name, kcu.column_name, ccu.table_name, ccu.column_name, tc.constraint_name "
            "FROM information_schema.table_constraints tc "
            "JOIN information_schema.key_column_usage kcu "
            "ON kcu.constraint_name = tc.constraint_name AND kcu.table_schema = tc.table_schema "
            "JOIN information_schema.constraint_column_usage ccu "
            "ON ccu.constraint_name = tc.constraint_name AND ccu.constraint_schema = tc.constraint_schema "
            "WHERE tc.constraint_type = 'FOREIGN KEY' AND tc.table_schema = $1 "
            "ORDER BY kcu.table_name, tc.constraint_name, kcu.ordinal_position",
            {Value::of_text(schema)}};
}

PostgresPlugin::PostgresPlugin()
    : RelationalPlugin(DatabaseType::Postgres, std::make_unique<PostgresDialect>()) {}

std::unique_ptr<SqlConnection> PostgresPlugin::connect(const PluginConfig& config) const {
    return std::make_unique<PostgresConnection>(
        PostgresConnection::build_conninfo(config.credentials, config.context), config.context);
}

} // namespace Omnidb
