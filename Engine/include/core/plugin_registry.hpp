/**
 * @file plugin_registry.hpp
 * @brief Database-type to adapter lookup, immutable after bootstrap
 */

#pragma once

#include <core/plugin.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Omnidb {

/**
 * @brief Ordered (type, adapter) table.
 *
 * Populated once during bootstrap, then finalize()d. Lookups on a finalized
 * registry are read-only and need no locking; add() after finalize() throws.
 */
class PluginRegistry {
public:
    PluginRegistry() = default;

    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;
    PluginRegistry(PluginRegistry&&) = default;
    PluginRegistry& operator=(PluginRegistry&&) = default;

    /**
     * @brief Register an adapter under its own type.
     * @throws std::logic_error if finalized or the type is already registered
     */
    void add(std::unique_ptr<Plugin> plugin);

    /**
     * @brief Register an adapter under an explicit type (e.g. MariaDB served by the MySQL adapter).
     */
    void add(DatabaseType type, std::unique_ptr<Plugin> plugin);

    void finalize() noexcept { finalized_ = true; }
    bool finalized() const noexcept { return finalized_; }

    /**
     * @throws DbError(UnsupportedType) for unregistered types or before finalize()
     */
    Plugin& choose(DatabaseType type) const;

    /**
     * @throws DbError(UnsupportedType) for unknown identifiers
     */
    Plugin& choose(const std::string& type_id) const;

    bool supports(DatabaseType type) const;
    std::vector<DatabaseType> types() const;

private:
    std::vector<std::pair<DatabaseType, std::unique_ptr<Plugin>>> plugins_;
    bool finalized_ = false;
};

} // namespace Omnidb
