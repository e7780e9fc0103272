/**
 * @file types.hpp
 * @brief Request-scoped data model shared by the contract and every adapter
 */

#pragma once

#include <core/call_context.hpp>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Omnidb {

/**
 * @brief Closed set of supported engines.
 */
enum class DatabaseType {
    Postgres,
    MySQL,
    MariaDB,
    Sqlite3,
    ClickHouse,
    MongoDB,
    Redis,
    ElasticSearch
};

const char* to_string(DatabaseType type);

/**
 * @brief Parse an engine identifier, case-insensitive. Unknown names yield nullopt.
 */
std::optional<DatabaseType> parse_database_type(const std::string& id);

std::vector<DatabaseType> all_database_types();

/**
 * @brief Key/value pair used for attributes, column definitions and row fields.
 */
struct Record {
    std::string key;
    std::string value;
    std::map<std::string, std::string> extra;

    Record() = default;
    Record(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}
    Record(std::string k, std::string v, std::map<std::string, std::string> e)
        : key(std::move(k)), value(std::move(v)), extra(std::move(e)) {}

    /**
     * @brief Look up an extra flag, returning fallback when absent.
     */
    std::string extra_value(const std::string& name, const std::string& fallback = "") const;

    bool operator==(const Record& other) const {
        return key == other.key && value == other.value && extra == other.extra;
    }
};

struct Column {
    std::string name;
    std::string type;

    bool operator==(const Column& other) const {
        return name == other.name && type == other.type;
    }
};

/**
 * @brief Table, collection, index or key with its attribute records.
 *
 * Descriptive attributes come first, column attributes (extra Kind=Column) last.
 */
struct StorageUnit {
    std::string name;
    std::vector<Record> attributes;

    std::vector<Column> columns() const;
};

/**
 * @brief Uniform tabular result.
 *
 * disable_update is set when rows do not map back to one addressable unit;
 * truncated is set when a bounded client-side scan hit its bound.
 */
struct RowsResult {
    std::vector<Column> columns;
    std::vector<std::vector<std::string>> rows;
    bool disable_update = false;
    bool truncated = false;
};

enum class RelationshipType {
    OneToOne,
    OneToMany,
    ManyToOne,
    ManyToMany,
    Unknown
};

const char* to_string(RelationshipType type);

struct GraphUnitRelationship {
    std::string name;
    RelationshipType relationship = RelationshipType::Unknown;

    bool operator==(const GraphUnitRelationship& other) const {
        return name == other.name && relationship == other.relationship;
    }
};

struct GraphUnit {
    StorageUnit unit;
    std::vector<GraphUnitRelationship> relations;
};

/**
 * @brief Connection parameters for one engine instance.
 */
struct Credentials {
    DatabaseType type = DatabaseType::Postgres;
    std::string hostname;
    std::string port;
    std::string username;
    std::string password;
    std::string database;
    std::vector<Record> advanced;
    bool is_profile = false;

    /**
     * @brief Value of an advanced option, or fallback when not set.
     */
    std::string advanced_value(const std::string& key, const std::string& fallback = "") const;

    /**
     * @brief Port as a number, default_port when empty.
     * @throws ConnectionError when port is not an integer in 1..65535.
     */
    int port_number(int default_port) const;

    /**
     * @brief Read OMNIDB_HOST, OMNIDB_PORT, OMNIDB_USER, OMNIDB_PASSWORD, OMNIDB_DATABASE.
     */
    static Credentials from_env(DatabaseType type);
};

/**
 * @brief Credentials plus per-call options. Never mutated after construction.
 */
struct PluginConfig {
    Credentials credentials;
    CallContext context;

    PluginConfig() = default;
    explicit PluginConfig(Credentials creds, CallContext ctx = {})
        : credentials(std::move(creds)), context(std::move(ctx)) {}
};

/**
 * @brief One turn of an AI-assisted conversation.
 */
struct ChatMessage {
    std::string type;   // "message", "sql:get", "sql:insert", ...
    std::string text;
    std::optional<RowsResult> result;
};

} // namespace Omnidb
