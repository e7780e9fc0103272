/**
 * @file redis_plugin.cpp
 * @brief Redis adapter implementation
 */

#include <plugins/redis_plugin.hpp>
#include <core/row_filter.hpp>
#include <plugins/redis_rows.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <unordered_set>

namespace Omnidb {

namespace {

constexpr std::size_t kScanCount = 1000;
const char* const kOriginal = "Original";

const Record* find_record(const std::vector<Record>& values, const std::string& key) {
    auto it = std::find_if(values.begin(), values.end(), [&](const Record& r) { return r.key == key; });
    return it == values.end() ? nullptr : &*it;
}

const Record& require_record(const std::vector<Record>& values, const std::string& key, const std::string& type) {
    const Record* record = find_record(values, key);
    if (!record) throw malformed_input("a " + type + " row needs '" + key + "'");
    return *record;
}

bool is_updated(const std::vector<std::string>& updated, const std::string& key) {
    return std::find(updated.begin(), updated.end(), key) != updated.end();
}

std::string original_of(const Record& record) {
    std::string original = record.extra_value(kOriginal);
    if (original.empty()) {
        throw malformed_input("changing '" + record.key + "' needs its previous value in extra '" + kOriginal + "'");
    }
    return original;
}

std::vector<std::string> reply_strings(const RedisValue& reply) {
    std::vector<std::string> out;
    out.reserve(reply.elements.size());
    for (const auto& element : reply.elements) out.push_back(element.as_text());
    return out;
}

// Runs commands as one MULTI/EXEC transaction.
void transaction(RedisConnection& conn, const std::vector<std::vector<std::string>>& commands) {
    conn.command({"MULTI"});
    for (const auto& cmd : commands) conn.command(cmd);
    RedisValue results = conn.command({"EXEC"});
    for (const auto& result : results.elements) {
        if (result.type == RedisValue::Type::Error) throw DriverError("Redis transaction failed: " + result.text);
    }
}

} // namespace

RedisPlugin::RedisPlugin(std::size_t scan_limit)
    : Plugin(DatabaseType::Redis), scan_limit_(scan_limit == 0 ? 1 : scan_limit) {}

std::unique_ptr<RedisConnection> RedisPlugin::connect(const PluginConfig& config) const {
    return std::make_unique<RedisConnection>(config.credentials, config.context);
}

std::vector<std::string> RedisPlugin::supported_operators() const {
    return RowFilter::supported_operators();
}

std::string RedisPlugin::key_type(RedisConnection& conn, const std::string& key) const {
    std::string type = conn.command({"TYPE", key}).as_text();
    if (type == "none") throw malformed_input("key '" + key + "' does not exist");
    return type;
}

bool RedisPlugin::scan(RedisConnection& conn, std::vector<std::string> command_prefix,
                       std::size_t step, std::size_t limit, std::vector<std::string>& items) const {
    std::unordered_set<std::string> seen;
    std::string cursor = "0";
    do {
        std::vector<std::string> argv = command_prefix;
        argv.push_back(cursor);
        argv.insert(argv.end(), {"COUNT", std::to_string(kScanCount)});

        RedisValue reply = conn.command(argv);
        if (reply.elements.size() != 2) throw DriverError("Redis " + command_prefix.front() + " returned an unexpected reply");
        cursor = reply.elements[0].as_text();
        append_scan_batch(reply.elements[1].elements, step, seen, items);

        if (items.size() / step >= limit) {
            items.resize(limit * step);
            return cursor != "0";
        }
    } while (cursor != "0");
    return false;
}

bool RedisPlugin::is_available(const PluginConfig& config) {
    try {
        return run(config, "is_available", [](RedisConnection& conn) { return conn.ping(); });
    } catch (const std::exception& e) {
        Logger::debug(engine_name() + " is not available: " + e.what());
        return false;
    }
}

std::vector<std::string> RedisPlugin::get_databases(const PluginConfig& config) {
    return run(config, "get_databases", [](RedisConnection& conn) {
        RedisValue reply = conn.try_command({"CONFIG", "GET", "databases"});
        if (reply.type == RedisValue::Type::Error) {
            Logger::debug("CONFIG GET databases refused: " + reply.text);
            return redis_database_names(RedisValue{});
        }
        return redis_database_names(reply);
    });
}

std::vector<std::string> RedisPlugin::get_all_schemas(const PluginConfig&) {
    return {};
}

std::vector<StorageUnit> RedisPlugin::get_storage_units(const PluginConfig& config, const std::string&) {
    return run(config, "get_storage_units", [this](RedisConnection& conn) {
        std::vector<std::string> keys;
        if (scan(conn, {"SCAN"}, 1, scan_limit_, keys)) {
            Logger::warn("Redis key listing stopped after " + std::to_string(scan_limit_) + " keys");
        }
        std::sort(keys.begin(), keys.end());
        keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

        std::vector<StorageUnit> out;
        out.reserve(keys.size());
        for (const auto& key : keys) {
            std::string type = conn.command({"TYPE", key}).as_text();
            if (type == "none") continue;   // expired since SCAN

            std::string size;
            if (type == "string") size = conn.command({"STRLEN", key}).as_text();
            else if (type == "hash") size = conn.command({"HLEN", key}).as_text();
            else if (type == "list") size = conn.command({"LLEN", key}).as_text();
            else if (type == "set") size = conn.command({"SCARD", key}).as_text();
            else if (type == "zset") size = conn.command({"ZCARD", key}).as_text();

            StorageUnit unit;
            unit.name = key;
            unit.attributes.emplace_back("Type", type);
            unit.attributes.emplace_back("Size", size);
            out.push_back(std::move(unit));
        }
        return out;
    });
}

std::vector<Column> RedisPlugin::get_columns(const PluginConfig& config,
                                             const std::string&,
                                             const std::string& storage_unit) {
    return run(config, "get_columns", [&](RedisConnection& conn) {
        return redis_columns(key_type(conn, storage_unit));
    });
}

RowsResult RedisPlugin::get_rows(const PluginConfig& config,
                                 const std::string&,
                                 const std::string& storage_unit,
                                 const WhereCondition* where,
                                 std::size_t page_size,
                                 std::size_t page_offset) {
    check_page_size(page_size, "get_rows");
    return run(config, "get_rows", [&](RedisConnection& conn) {
        const std::string type = key_type(conn, storage_unit);
        std::vector<Column> columns = redis_columns(type);
        const std::string limit = std::to_string(scan_limit_ - 1);

        std::vector<std::string> items;
        bool truncated = false;
        if (type == "string") {
            items.push_back(conn.command({"GET", storage_unit}).as_text());
        } else if (type == "hash") {
            truncated = scan(conn, {"HSCAN", storage_unit}, 2, scan_limit_, items);
        } else if (type == "set") {
            truncated = scan(conn, {"SSCAN", storage_unit}, 1, scan_limit_, items);
        } else if (type == "list") {
            truncated = conn.command({"LLEN", storage_unit}).integer > static_cast<long long>(scan_limit_);
            items = reply_strings(conn.command({"LRANGE", storage_unit, "0", limit}));
        } else {
            truncated = conn.command({"ZCARD", storage_unit}).integer > static_cast<long long>(scan_limit_);
            items = reply_strings(conn.command({"ZRANGE", storage_unit, "0", limit, "WITHSCORES"}));
        }

        return filter_redis_rows(storage_unit, columns, redis_rows(type, items), where,
                                 page_size, page_offset, truncated);
    });
}

bool RedisPlugin::add_storage_unit(const PluginConfig& config,
                                   const std::string&,
                                   const std::string& storage_unit,
                                   const std::vector<Record>& fields) {
    if (storage_unit.empty() || fields.empty()) {
        throw DbError(ErrorKind::MalformedInput, engine_name(), "add_storage_unit",
                      "a new key needs a name and at least one field");
    }
    return run(config, "add_storage_unit", [&](RedisConnection& conn) {
        if (conn.command({"EXISTS", storage_unit}).integer > 0) {
            throw DbError(ErrorKind::ExecutionFailure, "", "", "key '" + storage_unit + "' already exists");
        }
        std::vector<std::string> argv = {"HSET", storage_unit};
        for (const auto& field : fields) {
            argv.push_back(field.key);
            argv.push_back(field.value);
        }
        conn.command(argv);
        return true;
    });
}

bool RedisPlugin::add_row(const PluginConfig& config,
                          const std::string&,
                          const std::string& storage_unit,
                          const std::vector<Record>& values) {
    return run(config, "add_row", [&](RedisConnection& conn) {
        const std::string type = key_type(conn, storage_unit);
        if (type == "hash") {
            conn.command({"HSET", storage_unit, require_record(values, "field", type).value,
                          require_record(values, "value", type).value});
        } else if (type == "list") {
            conn.command({"RPUSH", storage_unit, require_record(values, "value", type).value});
        } else if (type == "set") {
            conn.command({"SADD", storage_unit, require_record(values, "value", type).value});
        } else if (type == "zset") {
            conn.command({"ZADD", storage_unit, require_record(values, "score", type).value,
                          require_record(values, "member", type).value});
        } else if (type == "string") {
            conn.command({"SET", storage_unit, require_record(values, "value", type).value});
        } else {
            throw unsupported_operation(engine_name(), "add_row on " + type);
        }
        return true;
    });
}

bool RedisPlugin::update_storage_unit(const PluginConfig& config,
                                      const std::string&,
                                      const std::string& storage_unit,
                                      const std::vector<Record>& values,
                                      const std::vector<std::string>& updated_columns) {
    if (updated_columns.empty()) {
        throw DbError(ErrorKind::MalformedInput, engine_name(), "update_storage_unit", "no updated columns given");
    }
    return run(config, "update_storage_unit", [&](RedisConnection& conn) {
        const std::string type = key_type(conn, storage_unit);
        if (type == "hash") {
            const Record& field = require_record(values, "field", type);
            const Record& value = require_record(values, "value", type);
            if (is_updated(updated_columns, "field")) {
                transaction(conn, {{"HDEL", storage_unit, original_of(field)},
                                   {"HSET", storage_unit, field.value, value.value}});
            } else {
                conn.command({"HSET", storage_unit, field.value, value.value});
            }
        } else if (type == "list") {
            conn.command({"LSET", storage_unit, require_record(values, "index", type).value,
                          require_record(values, "value", type).value});
        } else if (type == "set") {
            const Record& value = require_record(values, "value", type);
            transaction(conn, {{"SREM", storage_unit, original_of(value)},
                               {"SADD", storage_unit, value.value}});
        } else if (type == "zset") {
            const Record& member = require_record(values, "member", type);
            const Record& score = require_record(values, "score", type);
            if (is_updated(updated_columns, "member")) {
                transaction(conn, {{"ZREM", storage_unit, original_of(member)},
                                   {"ZADD", storage_unit, score.value, member.value}});
            } else {
                conn.command({"ZADD", storage_unit, "XX", score.value, member.value});
            }
        } else if (type == "string") {
            conn.command({"SET", storage_unit, require_record(values, "value", type).value});
        } else {
            throw unsupported_operation(engine_name(), "update_storage_unit on " + type);
        }
        return true;
    });
}

bool RedisPlugin::delete_row(const PluginConfig& config,
                             const std::string&,
                             const std::string& storage_unit,
                             const std::vector<Record>& values) {
    return run(config, "delete_row", [&](RedisConnection& conn) {
        const std::string type = key_type(conn, storage_unit);
        RedisValue reply;
        if (type == "hash") {
            reply = conn.command({"HDEL", storage_unit, require_record(values, "field", type).value});
        } else if (type == "list") {
            reply = conn.command({"LREM", storage_unit, "1", require_record(values, "value", type).value});
        } else if (type == "set") {
            reply = conn.command({"SREM", storage_unit, require_record(values, "value", type).value});
        } else if (type == "zset") {
            reply = conn.command({"ZREM", storage_unit, require_record(values, "member", type).value});
        } else if (type == "string") {
            reply = conn.command({"DEL", storage_unit});
        } else {
            throw unsupported_operation(engine_name(), "delete_row on " + type);
        }
        return reply.integer > 0;
    });
}

} // namespace Omnidb
