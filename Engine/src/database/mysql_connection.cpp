/**
 * @file mysql_connection.cpp
 * @brief MySQL/MariaDB connection over prepared statements
 */

#include <database/mysql_connection.hpp>
#include <core/errors.hpp>
#include <errmsg.h>
#include <memory>
#include <mutex>
#include <utility>

namespace Omnidb {

namespace {

// my_bool in MariaDB Connector/C, bool in MySQL 8.
using BindFlag = decltype(MYSQL_BIND::is_null_value);

constexpr unsigned long kInitialCellBuffer = 256;

void init_library() {
    static std::once_flag once;
    std::call_once(once, [] { mysql_library_init(0, nullptr, nullptr); });
}

bool is_connection_error(unsigned int code) {
    return code == CR_SERVER_GONE_ERROR || code == CR_SERVER_LOST || code == CR_CONNECTION_ERROR ||
           code == CR_CONN_HOST_ERROR;
}

struct StatementCloser {
    void operator()(MYSQL_STMT* stmt) const { mysql_stmt_close(stmt); }
};

struct ResultFreer {
    void operator()(MYSQL_RES* res) const { mysql_free_result(res); }
};

} // namespace

MySqlConnection::MySqlConnection(const Credentials& credentials, CallContext context)
    : context_(std::move(context)) {
    const unsigned int port = static_cast<unsigned int>(credentials.port_number(3306));
    const std::string host = credentials.hostname.empty() ? "localhost" : credentials.hostname;

    init_library();

    conn_ = mysql_init(nullptr);
    if (!conn_) throw ConnectionError("MySQL connection failed: out of memory");

    long long remaining = context_.remaining_ms();
    if (remaining > 0) {
        unsigned int seconds = static_cast<unsigned int>((remaining + 999) / 1000);
        mysql_options(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &seconds);
        mysql_options(conn_, MYSQL_OPT_READ_TIMEOUT, &seconds);
        mysql_options(conn_, MYSQL_OPT_WRITE_TIMEOUT, &seconds);
    }
    mysql_options(conn_, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    if (!mysql_real_connect(conn_, host.c_str(), credentials.username.c_str(), credentials.password.c_str(),
                            credentials.database.empty() ? nullptr : credentials.database.c_str(),
                            port, nullptr, 0)) {
        std::string msg = mysql_error(conn_);
        mysql_close(conn_);
        conn_ = nullptr;
        throw ConnectionError("MySQL connection failed: " + msg);
    }
}

MySqlConnection::~MySqlConnection() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

void MySqlConnection::check_context() const {
    if (context_.should_stop()) {
        throw ConnectionError(context_.cancelled() ? "cancelled" : "deadline exceeded");
    }
}

void MySqlConnection::fail(const std::string& what, unsigned int code, const char* message) const {
    if (is_connection_error(code)) {
        throw ConnectionError("MySQL connection lost: " + std::string(message));
    }
    throw DriverError("MySQL " + what + " failed: " + std::string(message));
}

std::string MySqlConnection::type_name(const MYSQL_FIELD& field) {
    const bool binary = field.charsetnr == 63;
    switch (field.type) {
        case MYSQL_TYPE_TINY:        return "tinyint";
        case MYSQL_TYPE_SHORT:       return "smallint";
        case MYSQL_TYPE_INT24:       return "mediumint";
        case MYSQL_TYPE_LONG:        return "int";
        case MYSQL_TYPE_LONGLONG:    return "bigint";
        case MYSQL_TYPE_FLOAT:       return "float";
        case MYSQL_TYPE_DOUBLE:      return "double";
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:  return "decimal";
        case MYSQL_TYPE_DATE:        return "date";
        case MYSQL_TYPE_TIME:        return "time";
        case MYSQL_TYPE_DATETIME:    return "datetime";
        case MYSQL_TYPE_TIMESTAMP:   return "timestamp";
        case MYSQL_TYPE_YEAR:        return "year";
        case MYSQL_TYPE_BIT:         return "bit";
        case MYSQL_TYPE_JSON:        return "json";
        case MYSQL_TYPE_ENUM:        return "enum";
        case MYSQL_TYPE_SET:         return "set";
        case MYSQL_TYPE_GEOMETRY:    return "geometry";
        case MYSQL_TYPE_NULL:        return "null";
        case MYSQL_TYPE_STRING:      return binary ? "binary" : "char";
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:     return binary ? "varbinary" : "varchar";
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB:        return binary ? "blob" : "text";
        default:                     return "unknown";
    }
}

ResultSet MySqlConnection::run_prepared(const std::string& sql, const std::vector<Value>& params) {
    check_context();

    std::unique_ptr<MYSQL_STMT, StatementCloser> stmt(mysql_stmt_init(conn_));
    if (!stmt) fail("prepare", mysql_errno(conn_), mysql_error(conn_));

    if (mysql_stmt_prepare(stmt.get(), sql.c_str(), sql.size()) != 0) {
        fail("prepare", mysql_stmt_errno(stmt.get()), mysql_stmt_error(stmt.get()));
    }

    const unsigned long expected = mysql_stmt_param_count(stmt.get());
    std::vector<MYSQL_BIND> in(expected);
    std::vector<unsigned long> in_lengths(expected, 0);
    std::vector<BindFlag> in_nulls(expected, 0);
    for (unsigned long i = 0; i < expected && i < params.size(); ++i) {
        MYSQL_BIND& b = in[i];
        b = MYSQL_BIND{};
        b.buffer_type = MYSQL_TYPE_STRING;
        in_nulls[i] = params[i].is_null() ? 1 : 0;
        in_lengths[i] = static_cast<unsigned long>(params[i].text.size());
        b.buffer = const_cast<char*>(params[i].text.data());
        b.buffer_length = in_lengths[i];
        b.length = &in_lengths[i];
        b.is_null = &in_nulls[i];
    }
    if (expected > 0 && mysql_stmt_bind_param(stmt.get(), in.data()) != 0) {
        fail("bind", mysql_stmt_errno(stmt.get()), mysql_stmt_error(stmt.get()));
    }

    if (mysql_stmt_execute(stmt.get()) != 0) {
        fail("query", mysql_stmt_errno(stmt.get()), mysql_stmt_error(stmt.get()));
    }

    ResultSet out;
    std::unique_ptr<MYSQL_RES, ResultFreer> meta(mysql_stmt_result_metadata(stmt.get()));
    if (!meta) {
        out.affected = static_cast<long long>(mysql_stmt_affected_rows(stmt.get()));
        return out;
    }

    const unsigned int ncols = mysql_num_fields(meta.get());
    const MYSQL_FIELD* fields = mysql_fetch_fields(meta.get());
    for (unsigned int c = 0; c < ncols; ++c) {
        out.columns.push_back({fields[c].name, type_name(fields[c])});
    }

    std::vector<MYSQL_BIND> cells(ncols);
    std::vector<std::vector<char>> buffers(ncols, std::vector<char>(kInitialCellBuffer));
    std::vector<unsigned long> lengths(ncols, 0);
    std::vector<BindFlag> nulls(ncols, 0);
    std::vector<BindFlag> errors(ncols, 0);
    for (unsigned int c = 0; c < ncols; ++c) {
        MYSQL_BIND& b = cells[c];
        b = MYSQL_BIND{};
        b.buffer_type = MYSQL_TYPE_STRING;
        b.buffer = buffers[c].data();
        b.buffer_length = kInitialCellBuffer;
        b.length = &lengths[c];
        b.is_null = &nulls[c];
        b.error = &errors[c];
    }
    if (mysql_stmt_bind_result(stmt.get(), cells.data()) != 0) {
        fail("bind", mysql_stmt_errno(stmt.get()), mysql_stmt_error(stmt.get()));
    }

    while (true) {
        int rc = mysql_stmt_fetch(stmt.get());
        if (rc == MYSQL_NO_DATA) break;
        if (rc == 1) fail("fetch", mysql_stmt_errno(stmt.get()), mysql_stmt_error(stmt.get()));

        std::vector<std::string> row;
        row.reserve(ncols);
        for (unsigned int c = 0; c < ncols; ++c) {
            if (nulls[c]) {
                row.emplace_back();
                continue;
            }
            if (lengths[c] > kInitialCellBuffer) {
                // Truncated cell: fetch the whole value into a right-sized buffer.
                std::string big(lengths[c], '\0');
                MYSQL_BIND whole{};
                unsigned long whole_length = 0;
                whole.buffer_type = MYSQL_TYPE_STRING;
                whole.buffer = &big[0];
                whole.buffer_length = lengths[c];
                whole.length = &whole_length;
                if (mysql_stmt_fetch_column(stmt.get(), &whole, c, 0) != 0) {
                    fail("fetch", mysql_stmt_errno(stmt.get()), mysql_stmt_error(stmt.get()));
                }
                row.push_back(std::move(big));
            } else {
                row.emplace_back(buffers[c].data(), lengths[c]);
            }
        }
        out.rows.push_back(std::move(row));
    }

    out.affected = static_cast<long long>(out.rows.size());
    return out;
}

ResultSet MySqlConnection::query(const std::string& sql, const std::vector<Value>& params) {
    return run_prepared(sql, params);
}

long long MySqlConnection::execute(const std::string& sql, const std::vector<Value>& params) {
    return run_prepared(sql, params).affected;
}

ResultSet MySqlConnection::raw(const std::string& sql) {
    check_context();

    if (mysql_real_query(conn_, sql.c_str(), sql.size()) != 0) {
        fail("query", mysql_errno(conn_), mysql_error(conn_));
    }

    ResultSet out;
    std::unique_ptr<MYSQL_RES, ResultFreer> res(mysql_store_result(conn_));
    if (!res) {
        if (mysql_field_count(conn_) != 0) fail("query", mysql_errno(conn_), mysql_error(conn_));
        out.affected = static_cast<long long>(mysql_affected_rows(conn_));
        return out;
    }

    const unsigned int ncols = mysql_num_fields(res.get());
    const MYSQL_FIELD* fields = mysql_fetch_fields(res.get());
    for (unsigned int c = 0; c < ncols; ++c) {
        out.columns.push_back({fields[c].name, type_name(fields[c])});
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res.get())) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res.get());
        std::vector<std::string> cells;
        cells.reserve(ncols);
        for (unsigned int c = 0; c < ncols; ++c) {
            cells.push_back(row[c] ? std::string(row[c], lengths[c]) : std::string());
        }
        out.rows.push_back(std::move(cells));
    }
    out.affected = static_cast<long long>(out.rows.size());
    return out;
}

void MySqlConnection::begin() {
    raw("START TRANSACTION");
}

void MySqlConnection::commit() {
    if (mysql_commit(conn_) != 0) fail("commit", mysql_errno(conn_), mysql_error(conn_));
}

void MySqlConnection::rollback() {
    if (mysql_rollback(conn_) != 0) fail("rollback", mysql_errno(conn_), mysql_error(conn_));
}

bool MySqlConnection::ping() {
    check_context();
    return mysql_ping(conn_) == 0;
}

} // namespace Omnidb
