#include <core/types.hpp>
#include <core/errors.hpp>
#include <core/value_coercion.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace Omnidb {

namespace {

struct TypeName {
    DatabaseType type;
    const char* name;
};

constexpr TypeName k_type_names[] = {
    {DatabaseType::Postgres,      "Postgres"},
    {DatabaseType::MySQL,         "MySQL"},
    {DatabaseType::MariaDB,       "MariaDB"},
    {DatabaseType::Sqlite3,       "Sqlite3"},
    {DatabaseType::ClickHouse,    "ClickHouse"},
    {DatabaseType::MongoDB,       "MongoDB"},
    {DatabaseType::Redis,         "Redis"},
    {DatabaseType::ElasticSearch, "ElasticSearch"},
};

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

} // namespace

const char* to_string(DatabaseType type) {
    for (const auto& entry : k_type_names) {
        if (entry.type == type) return entry.name;
    }
    return "Unknown";
}

std::optional<DatabaseType> parse_database_type(const std::string& id) {
    std::string wanted = lower(id);
    for (const auto& entry : k_type_names) {
        if (lower(entry.name) == wanted) return entry.type;
    }
    return std::nullopt;
}

std::vector<DatabaseType> all_database_types() {
    std::vector<DatabaseType> types;
    for (const auto& entry : k_type_names) types.push_back(entry.type);
    return types;
}

const char* to_string(RelationshipType type) {
    switch (type) {
        case RelationshipType::OneToOne:   return "OneToOne";
        case RelationshipType::OneToMany:  return "OneToMany";
        case RelationshipType::ManyToOne:  return "ManyToOne";
        case RelationshipType::ManyToMany: return "ManyToMany";
        case RelationshipType::Unknown:    return "Unknown";
    }
    return "Unknown";
}

std::string Record::extra_value(const std::string& name, const std::string& fallback) const {
    auto it = extra.find(name);
    return it == extra.end() ? fallback : it->second;
}

std::vector<Column> StorageUnit::columns() const {
    std::vector<Column> out;
    for (const auto& attr : attributes) {
        if (attr.extra_value("Kind") == "Column") {
            out.push_back({attr.key, attr.value});
        }
    }
    return out;
}

std::string Credentials::advanced_value(const std::string& key, const std::string& fallback) const {
    for (const auto& rec : advanced) {
        if (rec.key == key) return rec.value;
    }
    return fallback;
}

int Credentials::port_number(int default_port) const {
    if (port.empty()) return default_port;
    int64_t parsed = 0;
    if (!parse_integer(port, parsed) || parsed <= 0 || parsed > 65535) {
        throw ConnectionError("invalid port '" + port + "'");
    }
    return static_cast<int>(parsed);
}

Credentials Credentials::from_env(DatabaseType type) {
    Credentials creds;
    creds.type = type;
    creds.hostname = env_or("OMNIDB_HOST", "localhost");
    creds.port = env_or("OMNIDB_PORT", "");
    creds.username = env_or("OMNIDB_USER", "");
    creds.password = env_or("OMNIDB_PASSWORD", "");
    creds.database = env_or("OMNIDB_DATABASE", "");
    return creds;
}

} // namespace Omnidb
