/**
 * @file mysql_plugin.hpp
 * @brief MySQL and MariaDB adapter over libmysqlclient
 */

#pragma once

#include <plugins/mysql_dialect.hpp>
#include <relational/relational_plugin.hpp>

namespace Omnidb {

/**
 * @brief Serves both MySQL and MariaDB; the type only changes the reported name.
 */
class MySqlPlugin : public RelationalPlugin {
public:
    explicit MySqlPlugin(DatabaseType type = DatabaseType::MySQL);

protected:
    std::unique_ptr<SqlConnection> connect(const PluginConfig& config) const override;
};

} // namespace Omnidb
