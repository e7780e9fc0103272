/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <utility>
#include <poll.h>

namespace Omnidb {

namespace {

std::string conninfo_value(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

constexpr int kPollIntervalMs = 50;

} // namespace

PostgresConnection::PostgresConnection(const std::string& conninfo, CallContext context)
    : context_(std::move(context)) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)), context_(std::move(other.context_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        context_ = std::move(other.context_);
        other.conn_ = nullptr;
    }
    return *this;
}

std::string PostgresConnection::build_conninfo(const Credentials& credentials, const CallContext& context) {
    std::ostringstream conninfo;

    conninfo << "host=" << conninfo_value(credentials.hostname.empty() ? "localhost" : credentials.hostname) << " ";
    conninfo << "port=" << credentials.port_number(5432) << " ";
    if (!credentials.database.empty()) conninfo << "dbname=" << conninfo_value(credentials.database) << " ";
    if (!credentials.username.empty()) conninfo << "user=" << conninfo_value(credentials.username) << " ";
    if (!credentials.password.empty()) conninfo << "password=" << conninfo_value(credentials.password) << " ";

    std::string ssl = credentials.advanced_value("SSL Mode");
    if (!ssl.empty()) conninfo << "sslmode=" << conninfo_value(ssl) << " ";

    long long remaining = context.remaining_ms();
    if (remaining > 0) {
        // libpq counts whole seconds and treats anything below 2 as 2.
        long long seconds = std::max<long long>(2, (remaining + 999) / 1000);
        conninfo << "connect_timeout=" << seconds << " ";
        conninfo << "options=" << conninfo_value("-c statement_timeout=" + std::to_string(remaining)) << " ";
    }
    conninfo << "application_name='omnidb'";

    return conninfo.str();
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw ConnectionError("PostgreSQL connection failed: " + last_error_);
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK && status != PGRES_EMPTY_QUERY) {
        last_error_ = result ? PQresultErrorMessage(result) : PQerrorMessage(conn_);
        PQclear(result);
        if (PQstatus(conn_) != CONNECTION_OK) {
            throw ConnectionError("PostgreSQL connection lost: " + last_error_);
        }
        throw DriverError("PostgreSQL query failed: " + last_error_);
    }
}

void PostgresConnection::wait_for_result() {
    bool cancel_sent = false;
    const int socket = PQsocket(conn_);

    while (true) {
        if (PQconsumeInput(conn_) == 0) {
            last_error_ = PQerrorMessage(conn_);
            throw ConnectionError("PostgreSQL connection lost: " + last_error_);
        }
        if (!PQisBusy(conn_)) return;

        if (!cancel_sent && context_.should_stop()) {
            char errbuf[256];
            PGcancel* cancel = PQgetCancel(conn_);
            if (cancel) {
                PQcancel(cancel, errbuf, sizeof(errbuf));
                PQfreeCancel(cancel);
            }
            cancel_sent = true;
        }

        pollfd fd{socket, POLLIN, 0};
        if (poll(&fd, 1, kPollIntervalMs) < 0 && errno != EINTR) {
            throw ConnectionError("PostgreSQL poll failed");
        }
    }
}

PGresult* PostgresConnection::run(const std::string& sql, const std::vector<Value>* params) {
    if (!is_connected()) {
        throw ConnectionError("Not connected to database");
    }

    int sent = 0;
    if (params) {
        std::vector<const char*> param_values;
        param_values.reserve(params->size());
        for (const auto& p : *params) {
            param_values.push_back(p.is_null() ? nullptr : p.text.c_str());
        }
        sent = PQsendQueryParams(
            conn_,
            sql.c_str(),
            static_cast<int>(param_values.size()),
            nullptr,
            param_values.data(),
            nullptr,
            nullptr,
            0  // Text format
        );
    } else {
        sent = PQsendQuery(conn_, sql.c_str());
    }
    if (sent == 0) {
        last_error_ = PQerrorMessage(conn_);
        throw DriverError("PostgreSQL query failed: " + last_error_);
    }

    // A simple-protocol string may hold several statements; keep the last result.
    PGresult* last = nullptr;
    while (true) {
        wait_for_result();
        PGresult* next = PQgetResult(conn_);
        if (!next) break;
        if (last) PQclear(last);
        last = next;
    }

    if (context_.should_stop() && PQresultStatus(last) != PGRES_TUPLES_OK &&
        PQresultStatus(last) != PGRES_COMMAND_OK) {
        PQclear(last);
        throw ConnectionError(context_.cancelled() ? "cancelled" : "deadline exceeded");
    }
    check_result(last);
    return last;
}

ResultSet PostgresConnection::collect(PGresult* result) {
    ResultSet out;

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    out.columns.reserve(nfields);
    for (int j = 0; j < nfields; ++j) {
        out.columns.push_back({PQfname(result, j), type_name(PQftype(result, j))});
    }

    out.rows.reserve(nrows);
    for (int i = 0; i < nrows; ++i) {
        std::vector<std::string> row;
        row.reserve(nfields);

        for (int j = 0; j < nfields; ++j) {
            row.push_back(PQgetisnull(result, i, j) ? std::string() : std::string(PQgetvalue(result, i, j)));
        }

        out.rows.push_back(std::move(row));
    }

    const char* affected = PQcmdTuples(result);
    out.affected = (affected && *affected) ? std::atoll(affected) : 0;

    PQclear(result);
    return out;
}

ResultSet PostgresConnection::query(const std::string& sql, const std::vector<Value>& params) {
    return collect(run(sql, &params));
}

long long PostgresConnection::execute(const std::string& sql, const std::vector<Value>& params) {
    return collect(run(sql, &params)).affected;
}

ResultSet PostgresConnection::raw(const std::string& sql) {
    return collect(run(sql, nullptr));
}

bool PostgresConnection::ping() {
    return !query("SELECT 1").rows.empty();
}

std::string PostgresConnection::last_error() const {
    return last_error_;
}

std::string PostgresConnection::type_name(Oid oid) {
    switch (oid) {
        case 16:   return "bool";
        case 17:   return "bytea";
        case 18:   return "char";
        case 19:   return "name";
        case 20:   return "int8";
        case 21:   return "int2";
        case 23:   return "int4";
        case 25:   return "text";
        case 26:   return "oid";
        case 114:  return "json";
        case 700:  return "float4";
        case 701:  return "float8";
        case 790:  return "money";
        case 1042: return "bpchar";
        case 1043: return "varchar";
        case 1082: return "date";
        case 1083: return "time";
        case 1114: return "timestamp";
        case 1184: return "timestamptz";
        case 1186: return "interval";
        case 1266: return "timetz";
        case 1700: return "numeric";
        case 2950: return "uuid";
        case 3802: return "jsonb";
        default:   return "unknown";
    }
}

} // namespace Omnidb
