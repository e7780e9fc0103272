/**
 * @file sql_connection.hpp
 * @brief Driver-neutral connection interface used by the relational adapters
 */

#pragma once

#include <core/types.hpp>
#include <core/value_coercion.hpp>
#include <string>
#include <vector>

namespace Omnidb {

/**
 * @brief Materialised statement result. NULL cells are empty strings.
 */
struct ResultSet {
    std::vector<Column> columns;
    std::vector<std::vector<std::string>> rows;
    long long affected = 0;
};

/**
 * @brief One open connection to a SQL engine.
 *
 * Implementations throw ConnectionError when the server goes away and
 * DriverError when a statement is rejected.
 */
class SqlConnection {
public:
    virtual ~SqlConnection() = default;

    /**
     * @brief Run a parameterised statement and collect its rows.
     */
    virtual ResultSet query(const std::string& sql, const std::vector<Value>& params = {}) = 0;

    /**
     * @brief Run a parameterised statement, returning the affected row count.
     */
    virtual long long execute(const std::string& sql, const std::vector<Value>& params = {}) = 0;

    /**
     * @brief Run caller-supplied SQL as-is, with column metadata from the driver.
     */
    virtual ResultSet raw(const std::string& sql) = 0;

    virtual bool supports_transactions() const { return true; }
    virtual void begin() { execute("BEGIN"); }
    virtual void commit() { execute("COMMIT"); }
    virtual void rollback() { execute("ROLLBACK"); }

    virtual bool ping() = 0;

    /**
     * @brief RAII transaction guard; rolls back unless committed.
     */
    class Transaction {
    public:
        explicit Transaction(SqlConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        SqlConnection& conn_;
        bool active_ = false;
    };
};

} // namespace Omnidb
