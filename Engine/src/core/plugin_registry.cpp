/**
 * @file plugin_registry.cpp
 * @brief Engine registry implementation
 */

#include <core/plugin_registry.hpp>
#include <stdexcept>

namespace Omnidb {

void PluginRegistry::add(std::unique_ptr<Plugin> plugin) {
    if (!plugin) throw std::invalid_argument("cannot register a null plugin");
    DatabaseType type = plugin->type();
    add(type, std::move(plugin));
}

void PluginRegistry::add(DatabaseType type, std::unique_ptr<Plugin> plugin) {
    if (finalized_) {
        throw std::logic_error("plugin registry is finalized; cannot register " + std::string(to_string(type)));
    }
    if (!plugin) throw std::invalid_argument("cannot register a null plugin");
    if (supports(type)) {
        throw std::logic_error(std::string(to_string(type)) + " is already registered");
    }
    plugins_.emplace_back(type, std::move(plugin));
}

Plugin& PluginRegistry::choose(DatabaseType type) const {
    if (!finalized_) {
        throw DbError(ErrorKind::UnsupportedType, to_string(type), "choose", "registry has not been finalized");
    }
    for (const auto& [registered, plugin] : plugins_) {
        if (registered == type) return *plugin;
    }
    throw DbError(ErrorKind::UnsupportedType, to_string(type), "choose", "no adapter registered for this type");
}

Plugin& PluginRegistry::choose(const std::string& type_id) const {
    auto type = parse_database_type(type_id);
    if (!type) {
        throw DbError(ErrorKind::UnsupportedType, type_id, "choose", "unknown database type '" + type_id + "'");
    }
    return choose(*type);
}

bool PluginRegistry::supports(DatabaseType type) const {
    for (const auto& entry : plugins_) {
        if (entry.first == type) return true;
    }
    return false;
}

std::vector<DatabaseType> PluginRegistry::types() const {
    std::vector<DatabaseType> out;
    out.reserve(plugins_.size());
    for (const auto& entry : plugins_) out.push_back(entry.first);
    return out;
}

} // namespace Omnidb
