/**
 * @file mysql_connection.hpp
 * @brief MySQL / MariaDB connection over libmysqlclient
 */

#pragma once

#include <core/call_context.hpp>
#include <core/types.hpp>
#include <relational/sql_connection.hpp>
#include <string>
#include <vector>
#include <mysql.h>

namespace Omnidb {

/**
 * @brief Parameterised statements use the binary prepared-statement
 * protocol; raw() uses the text protocol so SHOW and friends work.
 *
 * The driver has no portable mid-statement cancel, so the context is
 * enforced through connect/read/write timeouts and checked between
 * statements.
 */
class MySqlConnection : public SqlConnection {
public:
    MySqlConnection(const Credentials& credentials, CallContext context = {});
    ~MySqlConnection() override;

    MySqlConnection(const MySqlConnection&) = delete;
    MySqlConnection& operator=(const MySqlConnection&) = delete;

    ResultSet query(const std::string& sql, const std::vector<Value>& params = {}) override;
    long long execute(const std::string& sql, const std::vector<Value>& params = {}) override;
    ResultSet raw(const std::string& sql) override;

    void begin() override;
    void commit() override;
    void rollback() override;
    bool ping() override;

    static std::string type_name(const MYSQL_FIELD& field);

private:
    ResultSet run_prepared(const std::string& sql, const std::vector<Value>& params);
    void check_context() const;
    [[noreturn]] void fail(const std::string& what, unsigned int code, const char* message) const;

    MYSQL* conn_ = nullptr;
    CallContext context_;
};

} // namespace Omnidb
