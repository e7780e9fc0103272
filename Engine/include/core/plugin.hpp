/**
 * @file plugin.hpp
 * @brief Capability contract every engine adapter implements
 */

#pragma once

#include <core/chat.hpp>
#include <core/errors.hpp>
#include <core/types.hpp>
#include <core/where_condition.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace Omnidb {

/**
 * @brief Base class for engine adapters.
 *
 * Adapters are stateless dispatch targets: every call opens its own
 * connection from the PluginConfig it is given. Optional operations
 * default to throwing UnsupportedOperation so callers always get either
 * a result or an explicit error, never a silently empty answer.
 */
class Plugin {
public:
    explicit Plugin(DatabaseType type) : type_(type) {}
    virtual ~Plugin() = default;

    Plugin(const Plugin&) = delete;
    Plugin& operator=(const Plugin&) = delete;

    DatabaseType type() const { return type_; }
    std::string engine_name() const { return to_string(type_); }

    /**
     * @brief Lightweight connectivity probe. Never throws.
     */
    virtual bool is_available(const PluginConfig& config) = 0;

    virtual std::vector<std::string> get_databases(const PluginConfig& config) = 0;
    virtual std::vector<std::string> get_all_schemas(const PluginConfig& config) = 0;

    virtual std::vector<StorageUnit> get_storage_units(const PluginConfig& config,
                                                       const std::string& schema) = 0;

    virtual std::vector<Column> get_columns(const PluginConfig& config,
                                            const std::string& schema,
                                            const std::string& storage_unit) = 0;

    /**
     * @brief Filtered, paginated rows. where may be null for "no filter".
     */
    virtual RowsResult get_rows(const PluginConfig& config,
                                const std::string& schema,
                                const std::string& storage_unit,
                                const WhereCondition* where,
                                std::size_t page_size,
                                std::size_t page_offset) = 0;

    virtual bool add_storage_unit(const PluginConfig& config,
                                  const std::string& schema,
                                  const std::string& storage_unit,
                                  const std::vector<Record>& fields) = 0;

    /**
     * @brief Update one row: values holds the full row, updated_columns the
     * keys whose values changed.
     */
    virtual bool update_storage_unit(const PluginConfig& config,
                                     const std::string& schema,
                                     const std::string& storage_unit,
                                     const std::vector<Record>& values,
                                     const std::vector<std::string>& updated_columns) = 0;

    virtual bool add_row(const PluginConfig& config,
                         const std::string& schema,
                         const std::string& storage_unit,
                         const std::vector<Record>& values) = 0;

    virtual bool delete_row(const PluginConfig& config,
                            const std::string& schema,
                            const std::string& storage_unit,
                            const std::vector<Record>& values) = 0;

    virtual std::vector<GraphUnit> get_graph(const PluginConfig& config, const std::string& schema) {
        (void)config;
        (void)schema;
        throw unsupported_operation(engine_name(), "get_graph");
    }

    virtual RowsResult raw_execute(const PluginConfig& config, const std::string& query) {
        (void)config;
        (void)query;
        throw unsupported_operation(engine_name(), "raw_execute");
    }

    virtual std::vector<ChatMessage> chat(const PluginConfig& config,
                                          const std::string& schema,
                                          const std::vector<ChatMessage>& previous,
                                          const std::string& query,
                                          ChatModel& model) {
        (void)config;
        (void)schema;
        (void)previous;
        (void)query;
        (void)model;
        throw unsupported_operation(engine_name(), "chat");
    }

    virtual std::vector<std::string> supported_operators() const = 0;
    virtual std::vector<std::string> supported_column_types() const { return {}; }

protected:
    /**
     * @brief Reject a zero page size before touching the engine.
     */
    void check_page_size(std::size_t page_size, const std::string& operation) const {
        if (page_size == 0) {
            throw DbError(ErrorKind::MalformedInput, engine_name(), operation, "page size must be greater than zero");
        }
    }

private:
    DatabaseType type_;
};

} // namespace Omnidb
