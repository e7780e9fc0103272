#include <plugins/mysql_plugin.hpp>
#include <database/mysql_connection.hpp>

namespace Omnidb {

MySqlPlugin::MySqlPlugin(DatabaseType type)
    : RelationalPlugin(type, std::make_unique<MySqlDialect>(type == DatabaseType::MariaDB ? "MariaDB" : "MySQL")) {}

std::unique_ptr<SqlConnection> MySqlPlugin::connect(const PluginConfig& config) const {
    return std::make_unique<MySqlConnection>(config.credentials, config.context);
}

} // namespace Omnidb
