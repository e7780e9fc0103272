/**
 * @file clickhouse_connection.hpp
 * @brief ClickHouse over its HTTP interface
 */

#pragma once

#include <core/call_context.hpp>
#include <core/types.hpp>
#include <database/http_client.hpp>
#include <relational/sql_connection.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Omnidb {

/**
 * @brief Statements go out as POST bodies; values travel as param_pN URL
 * parameters matching {pN:Type} placeholders, so nothing is spliced into
 * the SQL text. Reads are returned as JSONCompact.
 *
 * ClickHouse has no transactions over HTTP.
 */
class ClickHouseConnection : public SqlConnection {
public:
    ClickHouseConnection(const Credentials& credentials, CallContext context = {});

    ResultSet query(const std::string& sql, const std::vector<Value>& params = {}) override;
    long long execute(const std::string& sql, const std::vector<Value>& params = {}) override;
    ResultSet raw(const std::string& sql) override;

    bool supports_transactions() const override { return false; }
    bool ping() override;

    /**
     * @brief Decode a JSONCompact document into a ResultSet.
     * @throws DriverError on a malformed body
     */
    static ResultSet parse_json_compact(const std::string& body);

private:
    std::string parameter_string(const std::vector<Value>& params) const;
    HttpResponse send(const std::string& sql, const std::string& query_string);

    HttpClient http_;
};

} // namespace Omnidb
