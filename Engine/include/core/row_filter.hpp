/**
 * @file row_filter.hpp
 * @brief In-memory evaluation of a WhereCondition over string rows
 *
 * This is the client-side filter path for engines with no server-side
 * predicates. Callers run it after a bounded scan, so results are only as
 * complete as that scan; the adapter reports truncation separately.
 */

#pragma once

#include <core/types.hpp>
#include <core/where_condition.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace Omnidb {

class RowFilter {
public:
    /**
     * @brief Bind a condition to a column layout.
     *
     * Validates every referenced column, operator and value up front.
     * @throws DbError(MalformedFilter)
     */
    RowFilter(const WhereCondition& where, const std::vector<Column>& columns);

    bool matches(const std::vector<std::string>& row) const;

    static const std::vector<std::string>& supported_operators();

    /**
     * @brief SQL LIKE matching with % and _ wildcards, case-sensitive.
     */
    static bool like(const std::string& text, const std::string& pattern);

private:
    bool evaluate(const WhereCondition& node, const std::vector<std::string>& row) const;
    bool evaluate_atom(const AtomicWhereCondition& atom, const std::vector<std::string>& row) const;
    void validate(const WhereCondition& node) const;
    size_t column_index(const std::string& key) const;
    std::string column_type(const AtomicWhereCondition& atom) const;

    WhereCondition where_;
    std::vector<Column> columns_;
};

} // namespace Omnidb
