/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <core/call_context.hpp>
#include <core/types.hpp>
#include <relational/sql_connection.hpp>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace Omnidb {

/**
 * @brief PostgreSQL connection wrapper
 *
 * Statements are sent asynchronously so a cancelled or expired CallContext
 * can interrupt them server-side with PQcancel.
 */
class PostgresConnection : public SqlConnection {
public:
    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo, CallContext context = {});

    ~PostgresConnection() override;

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    /**
     * @brief libpq keyword/value string for these credentials.
     *
     * Adds connect_timeout and statement_timeout from the context, and
     * sslmode from the "SSL Mode" advanced option.
     */
    static std::string build_conninfo(const Credentials& credentials, const CallContext& context);

    /**
     * @brief Check if connected
     */
    bool is_connected() const;

    ResultSet query(const std::string& sql, const std::vector<Value>& params = {}) override;
    long long execute(const std::string& sql, const std::vector<Value>& params = {}) override;
    ResultSet raw(const std::string& sql) override;
    bool ping() override;

    /**
     * @brief Get last error message
     */
    std::string last_error() const;

    /**
     * @brief Type name for a built-in type OID ("int4", "text", ...).
     */
    static std::string type_name(Oid oid);

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void check_result(PGresult* result);

    // Send, then wait for the final result while watching the context.
    PGresult* run(const std::string& sql, const std::vector<Value>* params);
    void wait_for_result();
    ResultSet collect(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
    CallContext context_;
};

} // namespace Omnidb
