/**
 * @file sqlite_connection.hpp
 * @brief SQLite 3 connection over the C API
 */

#pragma once

#include <core/call_context.hpp>
#include <relational/sql_connection.hpp>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace Omnidb {

/**
 * @brief One sqlite3 handle on a database file.
 *
 * A progress handler polls the CallContext and interrupts the running
 * statement once it is cancelled or past its deadline.
 */
class SqliteConnection : public SqlConnection {
public:
    explicit SqliteConnection(const std::string& path, CallContext context = {});
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    ResultSet query(const std::string& sql, const std::vector<Value>& params = {}) override;
    long long execute(const std::string& sql, const std::vector<Value>& params = {}) override;
    ResultSet raw(const std::string& sql) override;
    bool ping() override;

    const std::string& path() const { return path_; }

private:
    // Runs every statement in sql; the last one that yields columns wins.
    ResultSet run(const std::string& sql, const std::vector<Value>* params);
    void bind(sqlite3_stmt* stmt, const std::vector<Value>& params);
    [[noreturn]] void fail(int code, const std::string& what);

    static int on_progress(void* self);

    sqlite3* db_ = nullptr;
    std::string path_;
    CallContext context_;
};

} // namespace Omnidb
