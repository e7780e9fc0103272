/**
 * @file default_registry.hpp
 * @brief Bootstrap of the engine registry with every adapter this build supports
 */

#pragma once

#include <config/settings.hpp>
#include <core/plugin_registry.hpp>

namespace Omnidb {

/**
 * @brief Finalized registry with the built-in adapters.
 *
 * PostgreSQL, SQLite, ClickHouse and Elasticsearch are always present.
 * MySQL/MariaDB, Redis and MongoDB are present only when their client
 * libraries were found at build time.
 */
PluginRegistry make_default_registry(const EngineSettings& settings);

} // namespace Omnidb
