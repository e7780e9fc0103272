#include <plugins/clickhouse_plugin.hpp>
#include <database/clickhouse_connection.hpp>

namespace Omnidb {

namespace {

// Strips one Wrapper(...) layer; returns false when type is not wrapped.
bool unwrap(std::string& type, const std::string& wrapper) {
    const std::string prefix = wrapper + "(";
    if (type.size() > prefix.size() && type.compare(0, prefix.size(), prefix) == 0 && type.back() == ')') {
        type = type.substr(prefix.size(), type.size() - prefix.size() - 1);
        return true;
    }
    return false;
}

} // namespace

std::string ClickHouseDialect::quote_identifier(const std::string& identifier) const {
    return quote_with(identifier, '`');
}

std::string ClickHouseDialect::placeholder(std::size_t index, const std::string& column_type) const {
    std::string type = column_type.empty() ? "String" : column_type;
    unwrap(type, "LowCardinality");
    return "{p" + std::to_string(index) + ":" + type + "}";
}

std::vector<std::string> ClickHouseDialect::supported_operators() const {
    auto ops = SqlDialect::supported_operators();
    ops.insert(ops.end(), {"ILIKE", "NOT ILIKE"});
    return ops;
}

std::vector<std::string> ClickHouseDialect::supported_column_types() const {
    return {
        "UInt8", "UInt16", "UInt32", "UInt64", "UInt128", "UInt256",
        "Int8", "Int16", "Int32", "Int64", "Int128", "Int256",
        "Float32", "Float64",
        "Decimal", "Decimal32", "Decimal64", "Decimal128", "Decimal256",
        "Bool", "String", "FixedString", "UUID",
        "Date", "Date32", "DateTime", "DateTime64",
        "IPv4", "IPv6", "JSON"
    };
}

bool ClickHouseDialect::is_supported_column_type(const std::string& type) const {
    std::string inner = type;
    while (unwrap(inner, "Nullable") || unwrap(inner, "LowCardinality")) {
    }
    return SqlDialect::is_supported_column_type(inner);
}

CatalogQuery ClickHouseDialect::databases_query() const {
    return {"SELECT name FROM system.databases ORDER BY name", {}};
}

CatalogQuery ClickHouseDialect::schemas_query() const {
    return databases_query();
}

CatalogQuery ClickHouseDialect::storage_units_query(const std::string& schema) const {
    return {"SELECT name, engine AS `Type`, "
            "formatReadableSize(total_bytes) AS `Total Size`, "
            "total_rows AS `Count` "
            "FROM system.tables WHERE database = {p1:String} ORDER BY name",
            {Value::of_text(schema)}};
}

CatalogQuery ClickHouseDialect::columns_query(const std::string& schema) const {
    return {"SELECT table, name, type FROM system.columns "
            "WHERE database = {p1:String} ORDER BY table, position",
            {Value::of_text(schema)}};
}

CatalogQuery ClickHouseDialect::table_columns_query(const std::string& schema, const std::string& table) const {
    return {"SELECT name, type FROM system.columns "
            "WHERE database = {p1:String} AND table = {p2:String} ORDER BY position",
            {Value::of_text(schema), Value::of_text(table)}};
}

CatalogQuery ClickHouseDialect::primary_key_query(const std::string&, const std::string&) const {
    return {};
}

CatalogQuery ClickHouseDialect::key_columns_query(const std::string&) const {
    return {};
}

CatalogQuery ClickHouseDialect::foreign_keys_query(const std::string&) const {
    return {};
}

std::string ClickHouseDialect::update_prefix(const std::string& qualified) const {
    return "ALTER TABLE " + qualified + " UPDATE ";
}

std::string ClickHouseDialect::delete_prefix(const std::string& qualified) const {
    return "ALTER TABLE " + qualified + " DELETE";
}

std::string ClickHouseDialect::create_table_suffix(const std::vector<std::string>& primary_keys) const {
    if (primary_keys.empty()) return " ENGINE = MergeTree ORDER BY tuple()";
    std::string keys;
    for (const auto& key : primary_keys) {
        if (!keys.empty()) keys += ", ";
        keys += quote_identifier(key);
    }
    return " ENGINE = MergeTree ORDER BY (" + keys + ")";
}

ClickHousePlugin::ClickHousePlugin()
    : RelationalPlugin(DatabaseType::ClickHouse, std::make_unique<ClickHouseDialect>()) {}

std::unique_ptr<SqlConnection> ClickHousePlugin::connect(const PluginConfig& config) const {
    return std::make_unique<ClickHouseConnection>(config.credentials, config.context);
}

} // namespace Omnidb
