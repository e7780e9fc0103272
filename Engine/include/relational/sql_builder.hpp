/**
 * @file sql_builder.hpp
 * @brief Parameterised statement construction on top of a SqlDialect
 */

#pragma once

#include <core/types.hpp>
#include <core/value_coercion.hpp>
#include <core/where_condition.hpp>
#include <relational/sql_dialect.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Omnidb {

struct Statement {
    std::string sql;
    std::vector<Value> params;
};

/**
 * @brief A column paired with the value bound to it.
 */
using Assignment = std::pair<Column, Value>;

class SqlBuilder {
public:
    explicit SqlBuilder(const SqlDialect& dialect) : dialect_(dialect) {}

    /**
     * @brief Compile a filter into a boolean expression, appending its values to params.
     *
     * Columns are resolved against the catalog layout, which also supplies the
     * type each value is coerced to.
     * @throws DbError(MalformedFilter) on unknown columns, operators or values
     */
    std::string compile_where(const WhereCondition& where,
                              const std::vector<Column>& columns,
                              std::vector<Value>& params) const;

    Statement select_rows(const std::string& schema,
                          const std::string& unit,
                          const std::vector<Column>& columns,
                          const std::vector<std::string>& order_by,
                          const WhereCondition* where,
                          std::size_t limit,
                          std::size_t offset) const;

    Statement insert_row(const std::string& schema,
                         const std::string& unit,
                         const std::vector<Assignment>& values) const;

    /**
     * @brief UPDATE ... SET set WHERE match. NULL match values become IS NULL.
     */
    Statement update_row(const std::string& schema,
                         const std::string& unit,
                         const std::vector<Assignment>& set,
                         const std::vector<Assignment>& match) const;

    Statement delete_row(const std::string& schema,
                         const std::string& unit,
                         const std::vector<Assignment>& match) const;

    /**
     * @brief CREATE TABLE from field records (key = name, value = type,
     * extra Primary/Nullable).
     * @throws DbError(MalformedInput) on invalid names or unsupported types
     */
    std::string create_table(const std::string& schema,
                             const std::string& unit,
                             const std::vector<Record>& fields) const;

private:
    std::string bind(std::vector<Value>& params, Value value, const std::string& column_type) const;
    std::string match_clause(const std::vector<Assignment>& match, std::vector<Value>& params) const;
    std::string compile_atom(const AtomicWhereCondition& atom,
                             const std::vector<Column>& columns,
                             std::vector<Value>& params) const;

    const SqlDialect& dialect_;
};

} // namespace Omnidb
