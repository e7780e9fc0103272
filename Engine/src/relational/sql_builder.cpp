/**
 * @file sql_builder.cpp
 * @brief Parameter-bound statement assembly
 *
 * Every value goes through a placeholder; identifiers are validated and
 * quoted by the dialect before they reach the SQL text.
 */

#include <relational/sql_builder.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <sstream>

namespace Omnidb {

std::string SqlBuilder::bind(std::vector<Value>& params, Value value, const std::string& column_type) const {
    params.push_back(std::move(value));
    return dialect_.placeholder(params.size(), column_type);
}

std::string SqlBuilder::compile_atom(const AtomicWhereCondition& atom,
                                     const std::vector<Column>& columns,
                                     std::vector<Value>& params) const {
    auto it = std::find_if(columns.begin(), columns.end(),
                           [&](const Column& c) { return c.name == atom.key; });
    if (it == columns.end()) {
        throw malformed_filter("unknown column '" + atom.key + "'");
    }

    const std::string op = normalize_operator(atom.op);
    const auto ops = dialect_.supported_operators();
    if (std::find(ops.begin(), ops.end(), op) == ops.end()) {
        throw malformed_filter("operator '" + atom.op + "' is not supported on '" + atom.key + "'");
    }

    const std::string lhs = dialect_.quote_identifier(it->name);
    if (is_unary_operator(op)) return lhs + " " + op;

    // Pattern operators compare text; the value is not coerced to the column type.
    if (op.find("LIKE") != std::string::npos || op.find("GLOB") != std::string::npos ||
        op.find("REGEXP") != std::string::npos || op.find("SIMILAR") != std::string::npos) {
        return lhs + " " + op + " " + bind(params, Value::of_text(atom.value), "");
    }

    try {
        if (is_list_operator(op)) {
            auto items = split_value_list(atom.value);
            if (items.empty()) throw malformed_filter(op + " needs at least one value for '" + atom.key + "'");
            std::string out = lhs + " " + op + " (";
            for (size_t i = 0; i < items.size(); ++i) {
                if (i) out += ", ";
                out += bind(params, coerce_value(items[i], it->type), it->type);
            }
            return out + ")";
        }
        return lhs + " " + op + " " + bind(params, coerce_value(atom.value, it->type), it->type);
    } catch (const CoercionError& e) {
        throw malformed_filter("'" + atom.key + "': " + e.what());
    }
}

std::string SqlBuilder::compile_where(const WhereCondition& where,
                                      const std::vector<Column>& columns,
                                      std::vector<Value>& params) const {
    if (where.is_atomic()) return compile_atom(where.atom(), columns, params);

    const char* joiner = where.kind() == WhereCondition::Kind::And ? " AND " : " OR ";
    std::string out = "(";
    bool first = true;
    for (const auto& child : where.children()) {
        if (!first) out += joiner;
        out += compile_where(child, columns, params);
        first = false;
    }
    return out + ")";
}

Statement SqlBuilder::select_rows(const std::string& schema,
                                  const std::string& unit,
                                  const std::vector<Column>& columns,
                                  const std::vector<std::string>& order_by,
                                  const WhereCondition* where,
                                  std::size_t limit,
                                  std::size_t offset) const {
    Statement stmt;
    std::ostringstream sql;
    sql << "SELECT ";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i) sql << ", ";
        sql << dialect_.quote_identifier(columns[i].name);
    }
    sql << " FROM " << dialect_.qualified_name(schema, unit);

    if (where) {
        sql << " WHERE " << compile_where(*where, columns, stmt.params);
    }
    if (!order_by.empty()) {
        sql << " ORDER BY ";
        for (size_t i = 0; i < order_by.size(); ++i) {
            if (i) sql << ", ";
            sql << dialect_.quote_identifier(order_by[i]);
        }
    }
    sql << dialect_.pagination_clause(limit, offset);

    stmt.sql = sql.str();
    return stmt;
}

Statement SqlBuilder::insert_row(const std::string& schema,
                                 const std::string& unit,
                                 const std::vector<Assignment>& values) const {
    if (values.empty()) throw malformed_input("no values to insert into '" + unit + "'");

    Statement stmt;
    std::string names;
    std::string holders;
    for (const auto& [column, value] : values) {
        if (!names.empty()) {
            names += ", ";
            holders += ", ";
        }
        names += dialect_.quote_identifier(column.name);
        holders += bind(stmt.params, value, column.type);
    }

    stmt.sql = "INSERT INTO " + dialect_.qualified_name(schema, unit) + " (" + names + ")" +
               (dialect_.insert_uses_select() ? " SELECT " + holders : " VALUES (" + holders + ")");
    return stmt;
}

std::string SqlBuilder::match_clause(const std::vector<Assignment>& match, std::vector<Value>& params) const {
    std::string out;
    for (const auto& [column, value] : match) {
        if (!out.empty()) out += " AND ";
        out += dialect_.quote_identifier(column.name);
        if (value.is_null()) {
            out += " IS NULL";
        } else {
            out += " = " + bind(params, value, column.type);
        }
    }
    return out;
}

Statement SqlBuilder::update_row(const std::string& schema,
                                 const std::string& unit,
                                 const std::vector<Assignment>& set,
                                 const std::vector<Assignment>& match) const {
    if (set.empty()) throw malformed_input("no columns to update in '" + unit + "'");
    if (match.empty()) throw malformed_input("no columns identify the row to update in '" + unit + "'");

    Statement stmt;
    std::string sql = dialect_.update_prefix(dialect_.qualified_name(schema, unit));
    for (size_t i = 0; i < set.size(); ++i) {
        if (i) sql += ", ";
        sql += dialect_.quote_identifier(set[i].first.name) + " = " +
               bind(stmt.params, set[i].second, set[i].first.type);
    }
    sql += " WHERE " + match_clause(match, stmt.params);
    stmt.sql = std::move(sql);
    return stmt;
}

Statement SqlBuilder::delete_row(const std::string& schema,
                                 const std::string& unit,
                                 const std::vector<Assignment>& match) const {
    if (match.empty()) throw malformed_input("no columns identify the row to delete in '" + unit + "'");

    Statement stmt;
    stmt.sql = dialect_.delete_prefix(dialect_.qualified_name(schema, unit)) + " WHERE " +
               match_clause(match, stmt.params);
    return stmt;
}

std::string SqlBuilder::create_table(const std::string& schema,
                                     const std::string& unit,
                                     const std::vector<Record>& fields) const {
    if (!is_valid_identifier(unit)) throw malformed_input("invalid table name '" + unit + "'");
    if (fields.empty()) throw malformed_input("table '" + unit + "' needs at least one column");

    std::vector<std::string> primary;
    std::vector<std::string> seen;
    std::string body;
    for (const auto& field : fields) {
        if (!is_valid_identifier(field.key)) {
            throw malformed_input("invalid column name '" + field.key + "'");
        }
        if (std::find(seen.begin(), seen.end(), field.key) != seen.end()) {
            throw malformed_input("duplicate column '" + field.key + "'");
        }
        seen.push_back(field.key);
        if (!dialect_.is_supported_column_type(field.value)) {
            throw malformed_input("unsupported column type '" + field.value + "' for '" + field.key + "'");
        }

        if (!body.empty()) body += ", ";
        body += dialect_.quote_identifier(field.key) + " " + field.value;

        bool is_primary = field.extra_value("Primary") == "true";
        if (is_primary) primary.push_back(field.key);
        if (is_primary || field.extra_value("Nullable") == "false") body += " NOT NULL";
    }

    if (!primary.empty() && dialect_.inline_primary_key()) {
        body += ", PRIMARY KEY (";
        for (size_t i = 0; i < primary.size(); ++i) {
            if (i) body += ", ";
            body += dialect_.quote_identifier(primary[i]);
        }
        body += ")";
    }

    return "CREATE TABLE " + dialect_.qualified_name(schema, unit) + " (" + body + ")" +
           dialect_.create_table_suffix(primary);
}

} // namespace Omnidb
