/**
 * @file sqlite_connection.cpp
 * @brief SQLite connection implementation
 */

#include <database/sqlite_connection.hpp>
#include <core/errors.hpp>
#include <climits>
#include <memory>
#include <utility>

namespace Omnidb {

namespace {

constexpr int kProgressOps = 1000;

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

std::string storage_class(int type) {
    switch (type) {
        case SQLITE_INTEGER: return "INTEGER";
        case SQLITE_FLOAT:   return "REAL";
        case SQLITE_BLOB:    return "BLOB";
        case SQLITE_NULL:    return "NULL";
        default:             return "TEXT";
    }
}

std::string cell_text(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_NULL:
            return {};
        case SQLITE_BLOB: {
            static const char* digits = "0123456789abcdef";
            const auto* bytes = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, col));
            int size = sqlite3_column_bytes(stmt, col);
            std::string out = "\\x";
            out.reserve(2 + static_cast<size_t>(size) * 2);
            for (int i = 0; i < size; ++i) {
                out.push_back(digits[bytes[i] >> 4]);
                out.push_back(digits[bytes[i] & 0x0F]);
            }
            return out;
        }
        default: {
            const auto* text = sqlite3_column_text(stmt, col);
            return text ? std::string(reinterpret_cast<const char*>(text),
                                      static_cast<size_t>(sqlite3_column_bytes(stmt, col)))
                        : std::string();
        }
    }
}

} // namespace

SqliteConnection::SqliteConnection(const std::string& path, CallContext context)
    : path_(path), context_(std::move(context)) {
    if (path_.empty()) {
        throw ConnectionError("SQLite connection failed: no database file given");
    }

    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw ConnectionError("SQLite connection failed: " + msg);
    }

    long long remaining = context_.remaining_ms();
    sqlite3_busy_timeout(db_, remaining > 0 && remaining < INT_MAX ? static_cast<int>(remaining) : 5000);
    sqlite3_progress_handler(db_, kProgressOps, &SqliteConnection::on_progress, this);
    sqlite3_extended_result_codes(db_, 1);
}

SqliteConnection::~SqliteConnection() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

int SqliteConnection::on_progress(void* self) {
    return static_cast<SqliteConnection*>(self)->context_.should_stop() ? 1 : 0;
}

void SqliteConnection::fail(int code, const std::string& what) {
    if ((code & 0xFF) == SQLITE_INTERRUPT) {
        throw ConnectionError(context_.cancelled() ? "cancelled" : "deadline exceeded");
    }
    throw DriverError("SQLite " + what + " failed: " + sqlite3_errmsg(db_));
}

void SqliteConnection::bind(sqlite3_stmt* stmt, const std::vector<Value>& params) {
    const int expected = sqlite3_bind_parameter_count(stmt);
    for (size_t i = 0; i < params.size() && static_cast<int>(i) < expected; ++i) {
        const int index = static_cast<int>(i) + 1;
        const Value& v = params[i];
        int rc = SQLITE_OK;
        if (v.is_null()) {
            rc = sqlite3_bind_null(stmt, index);
        } else if (auto n = std::get_if<int64_t>(&v.native)) {
            rc = sqlite3_bind_int64(stmt, index, *n);
        } else if (auto d = std::get_if<double>(&v.native)) {
            rc = sqlite3_bind_double(stmt, index, *d);
        } else if (auto b = std::get_if<bool>(&v.native)) {
            rc = sqlite3_bind_int(stmt, index, *b ? 1 : 0);
        } else {
            rc = sqlite3_bind_text(stmt, index, v.text.c_str(), static_cast<int>(v.text.size()), SQLITE_TRANSIENT);
        }
        if (rc != SQLITE_OK) fail(rc, "bind");
    }
}

ResultSet SqliteConnection::run(const std::string& sql, const std::vector<Value>* params) {
    if (context_.should_stop()) {
        throw ConnectionError(context_.cancelled() ? "cancelled" : "deadline exceeded");
    }

    ResultSet out;
    const sqlite3_int64 changes_before = sqlite3_total_changes64(db_);
    const char* tail = sql.c_str();
    const char* end = tail + sql.size();

    while (tail && tail < end) {
        sqlite3_stmt* raw_stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, tail, static_cast<int>(end - tail), &raw_stmt, &tail);
        if (rc != SQLITE_OK) fail(rc, "prepare");
        if (!raw_stmt) continue;  // whitespace or comment
        StatementPtr stmt(raw_stmt, &sqlite3_finalize);

        if (params) bind(stmt.get(), *params);

        const int ncols = sqlite3_column_count(stmt.get());
        ResultSet current;
        std::vector<bool> typed(static_cast<size_t>(ncols), false);
        for (int c = 0; c < ncols; ++c) {
            const char* decl = sqlite3_column_decltype(stmt.get(), c);
            typed[static_cast<size_t>(c)] = decl != nullptr;
            current.columns.push_back({sqlite3_column_name(stmt.get(), c), decl ? decl : ""});
        }

        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            std::vector<std::string> row;
            row.reserve(static_cast<size_t>(ncols));
            for (int c = 0; c < ncols; ++c) {
                if (!typed[static_cast<size_t>(c)] && sqlite3_column_type(stmt.get(), c) != SQLITE_NULL) {
                    current.columns[static_cast<size_t>(c)].type = storage_class(sqlite3_column_type(stmt.get(), c));
                    typed[static_cast<size_t>(c)] = true;
                }
                row.push_back(cell_text(stmt.get(), c));
            }
            current.rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE) fail(rc, "query");

        if (ncols > 0) out = std::move(current);
    }

    out.affected = static_cast<long long>(sqlite3_total_changes64(db_) - changes_before);
    return out;
}

ResultSet SqliteConnection::query(const std::string& sql, const std::vector<Value>& params) {
    return run(sql, &params);
}

long long SqliteConnection::execute(const std::string& sql, const std::vector<Value>& params) {
    return run(sql, &params).affected;
}

ResultSet SqliteConnection::raw(const std::string& sql) {
    return run(sql, nullptr);
}

bool SqliteConnection::ping() {
    return !query("SELECT 1").rows.empty();
}

} // namespace Omnidb
