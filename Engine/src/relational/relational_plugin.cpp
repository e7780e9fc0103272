/**
 * @file relational_plugin.cpp
 * @brief Relational adapter base implementation
 */

#include <relational/relational_plugin.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <map>

namespace Omnidb {

RelationalPlugin::RelationalPlugin(DatabaseType type, std::unique_ptr<SqlDialect> dialect)
    : Plugin(type), dialect_(std::move(dialect)), builder_(*dialect_) {}

ResultSet RelationalPlugin::run_catalog(SqlConnection& conn, const CatalogQuery& query) const {
    if (query.empty()) return {};
    return conn.query(query.sql, query.params);
}

std::vector<StorageUnit> RelationalPlugin::load_storage_units(SqlConnection& conn, const std::string& schema) const {
    ResultSet units = run_catalog(conn, dialect_->storage_units_query(schema));

    std::vector<StorageUnit> out;
    std::map<std::string, size_t> index;
    for (const auto& row : units.rows) {
        if (row.empty()) continue;
        StorageUnit unit;
        unit.name = row[0];
        for (size_t i = 1; i < row.size() && i < units.columns.size(); ++i) {
            unit.attributes.emplace_back(units.columns[i].name, row[i]);
        }
        index.emplace(unit.name, out.size());
        out.push_back(std::move(unit));
    }

    ResultSet columns = run_catalog(conn, dialect_->columns_query(schema));
    for (const auto& row : columns.rows) {
        if (row.size() < 3) continue;
        auto it = index.find(row[0]);
        if (it == index.end()) continue;
        out[it->second].attributes.emplace_back(row[1], row[2], std::map<std::string, std::string>{{"Kind", "Column"}});
    }
    return out;
}

std::vector<Column> RelationalPlugin::load_columns(SqlConnection& conn, const std::string& schema,
                                                   const std::string& unit) const {
    ResultSet rs = run_catalog(conn, dialect_->table_columns_query(schema, unit));
    std::vector<Column> out;
    out.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (row.size() >= 2) out.push_back({row[0], row[1]});
    }
    return out;
}

std::vector<std::string> RelationalPlugin::load_primary_key(SqlConnection& conn, const std::string& schema,
                                                            const std::string& unit) const {
    ResultSet rs = run_catalog(conn, dialect_->primary_key_query(schema, unit));
    std::vector<std::string> out;
    for (const auto& row : rs.rows) {
        if (!row.empty()) out.push_back(row[0]);
    }
    return out;
}

std::vector<Column> RelationalPlugin::require_columns(SqlConnection& conn, const std::string& schema,
                                                      const std::string& unit) const {
    auto columns = load_columns(conn, schema, unit);
    if (columns.empty()) {
        throw malformed_input("storage unit '" + unit + "' not found" + (schema.empty() ? "" : " in '" + schema + "'"));
    }
    return columns;
}

std::vector<Assignment> RelationalPlugin::assign(const std::vector<Column>& columns,
                                                 const std::vector<Record>& values,
                                                 const std::string& unit) const {
    std::vector<Assignment> out;
    out.reserve(values.size());
    for (const auto& record : values) {
        auto it = std::find_if(columns.begin(), columns.end(),
                               [&](const Column& c) { return c.name == record.key; });
        if (it == columns.end()) {
            throw malformed_input("unknown column '" + record.key + "' in '" + unit + "'");
        }
        try {
            out.emplace_back(*it, coerce_for_write(record.value, it->type));
        } catch (const CoercionError& e) {
            throw malformed_input("'" + record.key + "': " + e.what());
        }
    }
    return out;
}

bool RelationalPlugin::is_available(const PluginConfig& config) {
    try {
        return run(config, "is_available", [](SqlConnection& conn) { return conn.ping(); });
    } catch (const std::exception& e) {
        Logger::debug(engine_name() + " is not available: " + e.what());
        return false;
    }
}

std::vector<std::string> RelationalPlugin::get_databases(const PluginConfig& config) {
    return run(config, "get_databases", [this](SqlConnection& conn) {
        std::vector<std::string> out;
        for (const auto& row : run_catalog(conn, dialect_->databases_query()).rows) {
            if (!row.empty()) out.push_back(row[0]);
        }
        return out;
    });
}

std::vector<std::string> RelationalPlugin::get_all_schemas(const PluginConfig& config) {
    return run(config, "get_all_schemas", [this](SqlConnection& conn) {
        std::vector<std::string> out;
        for (const auto& row : run_catalog(conn, dialect_->schemas_query()).rows) {
            if (!row.empty()) out.push_back(row[0]);
        }
        return out;
    });
}

std::vector<StorageUnit> RelationalPlugin::get_storage_units(const PluginConfig& config, const std::string& schema) {
    return run(config, "get_storage_units",
               [&](SqlConnection& conn) { return load_storage_units(conn, schema); });
}

std::vector<Column> RelationalPlugin::get_columns(const PluginConfig& config,
                                                  const std::string& schema,
                                                  const std::string& storage_unit) {
    return run(config, "get_columns",
               [&](SqlConnection& conn) { return require_columns(conn, schema, storage_unit); });
}

RowsResult RelationalPlugin::get_rows(const PluginConfig& config,
                                      const std::string& schema,
                                      const std::string& storage_unit,
                                      const WhereCondition* where,
                                      std::size_t page_size,
                                      std::size_t page_offset) {
    check_page_size(page_size, "get_rows");

    return run(config, "get_rows", [&](SqlConnection& conn) {
        RowsResult result;
        result.columns = require_columns(conn, schema, storage_unit);

        std::vector<std::string> order_by = load_primary_key(conn, schema, storage_unit);
        if (order_by.empty()) {
            for (const auto& column : result.columns) {
                if (is_orderable(classify_column_type(column.type))) order_by.push_back(column.name);
            }
        }

        Statement stmt = builder_.select_rows(schema, storage_unit, result.columns, order_by,
                                              where, page_size, page_offset);
        result.rows = conn.query(stmt.sql, stmt.params).rows;
        return result;
    });
}

bool RelationalPlugin::add_storage_unit(const PluginConfig& config,
                                        const std::string& schema,
                                        const std::string& storage_unit,
                                        const std::vector<Record>& fields) {
    // Validate before connecting so bad input never reaches the engine.
    std::string sql;
    try {
        sql = builder_.create_table(schema, storage_unit, fields);
    } catch (const DbError& e) {
        throw e.with_context(engine_name(), "add_storage_unit");
    }

    return run(config, "add_storage_unit", [&](SqlConnection& conn) {
        conn.execute(sql);
        return true;
    });
}

bool RelationalPlugin::update_storage_unit(const PluginConfig& config,
                                           const std::string& schema,
                                           const std::string& storage_unit,
                                           const std::vector<Record>& values,
                                           const std::vector<std::string>& updated_columns) {
    if (updated_columns.empty()) {
        throw DbError(ErrorKind::MalformedInput, engine_name(), "update_storage_unit", "no updated columns given");
    }

    return run(config, "update_storage_unit", [&](SqlConnection& conn) {
        const auto columns = require_columns(conn, schema, storage_unit);
        const auto row = assign(columns, values, storage_unit);
        const auto primary = load_primary_key(conn, schema, storage_unit);

        auto updated = [&](const std::string& name) {
            return std::find(updated_columns.begin(), updated_columns.end(), name) != updated_columns.end();
        };
        auto value_of = [&](const std::string& name) {
            return std::find_if(row.begin(), row.end(), [&](const Assignment& a) { return a.first.name == name; });
        };

        std::vector<Assignment> set;
        for (const auto& name : updated_columns) {
            auto it = value_of(name);
            if (it == row.end()) throw malformed_input("updated column '" + name + "' has no value");
            set.push_back(*it);
        }

        const bool by_primary_key = !primary.empty() && std::all_of(primary.begin(), primary.end(),
            [&](const std::string& pk) { return value_of(pk) != row.end() && !updated(pk); });

        std::vector<Assignment> match;
        if (by_primary_key) {
            for (const auto& pk : primary) match.push_back(*value_of(pk));
        } else {
            for (const auto& a : row) {
                if (!updated(a.first.name)) match.push_back(a);
            }
        }

        Statement stmt = builder_.update_row(schema, storage_unit, set, match);
        long long affected = conn.execute(stmt.sql, stmt.params);
        if (dialect_->reports_affected_rows() && affected == 0) {
            throw DbError(ErrorKind::ExecutionFailure, engine_name(), "update_storage_unit",
                          "no row matched in '" + storage_unit + "'");
        }
        return true;
    });
}

bool RelationalPlugin::add_row(const PluginConfig& config,
                               const std::string& schema,
                               const std::string& storage_unit,
                               const std::vector<Record>& values) {
    return run(config, "add_row", [&](SqlConnection& conn) {
        const auto columns = require_columns(conn, schema, storage_unit);
        Statement stmt = builder_.insert_row(schema, storage_unit, assign(columns, values, storage_unit));
        conn.execute(stmt.sql, stmt.params);
        return true;
    });
}

bool RelationalPlugin::delete_row(const PluginConfig& config,
                                  const std::string& schema,
                                  const std::string& storage_unit,
                                  const std::vector<Record>& values) {
    return run(config, "delete_row", [&](SqlConnection& conn) {
        const auto columns = require_columns(conn, schema, storage_unit);
        const auto row = assign(columns, values, storage_unit);
        const auto primary = load_primary_key(conn, schema, storage_unit);

        std::vector<Assignment> match;
        for (const auto& pk : primary) {
            auto it = std::find_if(row.begin(), row.end(), [&](const Assignment& a) { return a.first.name == pk; });
            if (it == row.end()) {
                match.clear();
                break;
            }
            match.push_back(*it);
        }
        if (match.empty()) match = row;

        Statement stmt = builder_.delete_row(schema, storage_unit, match);
        long long affected = conn.execute(stmt.sql, stmt.params);
        return !dialect_->reports_affected_rows() || affected > 0;
    });
}

std::vector<GraphUnit> RelationalPlugin::get_graph(const PluginConfig& config, const std::string& schema) {
    if (!dialect_->supports_foreign_keys()) throw unsupported_operation(engine_name(), "get_graph");

    return run(config, "get_graph", [&](SqlConnection& conn) {
        const auto units = load_storage_units(conn, schema);

        std::vector<KeyConstraint> keys;
        std::map<std::pair<std::string, std::string>, size_t> key_index;
        for (const auto& row : run_catalog(conn, dialect_->key_columns_query(schema)).rows) {
            if (row.size() < 4) continue;
            auto id = std::make_pair(row[0], row[3]);
            auto it = key_index.find(id);
            if (it == key_index.end()) {
                key_index.emplace(id, keys.size());
                keys.push_back({row[0], row[3], row[2], {row[1]}});
            } else {
                keys[it->second].columns.push_back(row[1]);
            }
        }

        std::vector<ForeignKeyColumn> fks;
        for (const auto& row : run_catalog(conn, dialect_->foreign_keys_query(schema)).rows) {
            if (row.size() < 5) continue;
            ForeignKeyColumn fk{row[0], row[1], row[2], row[3], row[4]};
            // SQLite leaves the target column empty when it is the referenced table's primary key.
            if (fk.referenced_column.empty()) {
                for (const auto& key : keys) {
                    if (key.table == fk.referenced_table && key.kind == "PRIMARY KEY" && key.columns.size() == 1) {
                        fk.referenced_column = key.columns.front();
                    }
                }
            }
            fks.push_back(std::move(fk));
        }

        return classify_relationships(units, fks, keys);
    });
}

RowsResult RelationalPlugin::raw_execute(const PluginConfig& config, const std::string& query) {
    const bool read = dialect_->is_read_statement(query);

    return run(config, "raw_execute", [&](SqlConnection& conn) {
        SqlConnection::Transaction tx(conn);
        ResultSet rs = conn.raw(query);
        tx.commit();

        RowsResult result;
        result.disable_update = true;
        if (read) {
            result.columns = std::move(rs.columns);
            result.rows = std::move(rs.rows);
        }
        return result;
    });
}

std::vector<ChatMessage> RelationalPlugin::chat(const PluginConfig& config,
                                                const std::string& schema,
                                                const std::vector<ChatMessage>& previous,
                                                const std::string& query,
                                                ChatModel& model) {
    const auto units = get_storage_units(config, schema);
    const std::string reply = model.complete(build_chat_prompt(dialect_->name(), schema, units, previous, query));

    std::vector<ChatMessage> out;
    for (const auto& segment : split_chat_reply(reply)) {
        if (!segment.is_sql) {
            out.push_back({"message", segment.text, std::nullopt});
            continue;
        }
        ChatMessage message{classify_sql_statement(segment.text), segment.text, std::nullopt};
        if (message.type == "sql:get") message.result = raw_execute(config, segment.text);
        out.push_back(std::move(message));
    }
    return out;
}

} // namespace Omnidb
