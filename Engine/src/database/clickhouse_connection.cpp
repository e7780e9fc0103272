/**
 * @file clickhouse_connection.cpp
 * @brief ClickHouse HTTP connection implementation
 */

#include <database/clickhouse_connection.hpp>
#include <core/chat.hpp>
#include <core/errors.hpp>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace Omnidb {

namespace {

std::string cell_text(const nlohmann::json& cell) {
    if (cell.is_null()) return {};
    if (cell.is_string()) return cell.get<std::string>();
    if (cell.is_boolean()) return cell.get<bool>() ? "true" : "false";
    return cell.dump();
}

std::string strip_terminator(std::string sql) {
    while (!sql.empty() && (sql.back() == ';' || std::isspace(static_cast<unsigned char>(sql.back())))) {
        sql.pop_back();
    }
    return sql;
}

} // namespace

ClickHouseConnection::ClickHouseConnection(const Credentials& credentials, CallContext context)
    : http_(make_base_url(credentials.hostname, credentials.port, "8123",
                          credentials.advanced_value("HTTP Protocol") == "https"),
            std::move(context)) {
    http_.set_header("X-ClickHouse-User", credentials.username.empty() ? "default" : credentials.username);
    if (!credentials.password.empty()) http_.set_header("X-ClickHouse-Key", credentials.password);
    if (!credentials.database.empty()) http_.set_header("X-ClickHouse-Database", credentials.database);
    http_.set_verify_tls(credentials.advanced_value("SSL Verify", "true") != "false");
}

ResultSet ClickHouseConnection::parse_json_compact(const std::string& body) {
    ResultSet out;
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw DriverError(std::string("ClickHouse returned invalid JSON: ") + e.what());
    }

    for (const auto& column : doc.value("meta", nlohmann::json::array())) {
        out.columns.push_back({column.value("name", ""), column.value("type", "")});
    }
    for (const auto& row : doc.value("data", nlohmann::json::array())) {
        std::vector<std::string> cells;
        cells.reserve(row.size());
        for (const auto& cell : row) cells.push_back(cell_text(cell));
        out.rows.push_back(std::move(cells));
    }
    out.affected = static_cast<long long>(out.rows.size());
    return out;
}

std::string ClickHouseConnection::parameter_string(const std::vector<Value>& params) const {
    std::string out;
    for (size_t i = 0; i < params.size(); ++i) {
        out += "&param_p" + std::to_string(i + 1) + "=" + http_.escape(params[i].is_null() ? "\\N" : params[i].text);
    }
    return out;
}

HttpResponse ClickHouseConnection::send(const std::string& sql, const std::string& query_string) {
    HttpResponse response = http_.post("/?" + query_string, sql, "text/plain; charset=utf-8");
    if (response.status == 401 || response.status == 403 || response.status == 516) {
        throw ConnectionError("ClickHouse authentication failed: " + response.body);
    }
    if (!response.ok()) {
        throw DriverError("ClickHouse query failed: " + response.body);
    }
    return response;
}

ResultSet ClickHouseConnection::query(const std::string& sql, const std::vector<Value>& params) {
    HttpResponse response = send(strip_terminator(sql) + " FORMAT JSONCompact",
                                 "output_format_json_quote_64bit_integers=1" + parameter_string(params));
    return parse_json_compact(response.body);
}

long long ClickHouseConnection::execute(const std::string& sql, const std::vector<Value>& params) {
    HttpResponse response = send(strip_terminator(sql), "mutations_sync=1" + parameter_string(params));

    auto summary = response.headers.find("x-clickhouse-summary");
    if (summary == response.headers.end()) return 0;
    auto parsed = nlohmann::json::parse(summary->second, nullptr, false);
    if (parsed.is_discarded() || !parsed.contains("written_rows")) return 0;
    return std::atoll(cell_text(parsed["written_rows"]).c_str());
}

ResultSet ClickHouseConnection::raw(const std::string& sql) {
    const std::string verb = statement_verb(sql);
    if (verb == "select" || verb == "with" || verb == "show" || verb == "describe" ||
        verb == "desc" || verb == "explain") {
        return query(sql);
    }
    ResultSet out;
    out.affected = execute(sql);
    return out;
}

bool ClickHouseConnection::ping() {
    HttpResponse response = http_.get("/ping");
    return response.ok();
}

} // namespace Omnidb
