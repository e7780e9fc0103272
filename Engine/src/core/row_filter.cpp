#include <core/row_filter.hpp>
#include <core/errors.hpp>
#include <core/value_coercion.hpp>
#include <algorithm>

namespace Omnidb {

namespace {

bool numeric(TypeCategory c) {
    return c == TypeCategory::Integer || c == TypeCategory::Float || c == TypeCategory::Decimal;
}

// -1, 0, 1; nullopt when either side does not parse for the category.
std::optional<int> compare_typed(const std::string& lhs, const std::string& rhs, TypeCategory category) {
    if (numeric(category)) {
        double a = 0.0;
        double b = 0.0;
        if (!parse_float(lhs, a) || !parse_float(rhs, b)) return std::nullopt;
        return a < b ? -1 : (a > b ? 1 : 0);
    }
    if (category == TypeCategory::Boolean) {
        bool a = false;
        bool b = false;
        if (!parse_boolean(lhs, a) || !parse_boolean(rhs, b)) return std::nullopt;
        return a == b ? 0 : (a ? 1 : -1);
    }
    int c = lhs.compare(rhs);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace

RowFilter::RowFilter(const WhereCondition& where, const std::vector<Column>& columns)
    : where_(where), columns_(columns) {
    validate(where_);
}

const std::vector<std::string>& RowFilter::supported_operators() {
    static const std::vector<std::string> ops = {
        "=", "!=", "<>", ">", ">=", "<", "<=",
        "LIKE", "NOT LIKE", "IN", "NOT IN", "IS NULL", "IS NOT NULL"
    };
    return ops;
}

size_t RowFilter::column_index(const std::string& key) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == key) return i;
    }
    return columns_.size();
}

std::string RowFilter::column_type(const AtomicWhereCondition& atom) const {
    if (!atom.column_type.empty()) return atom.column_type;
    size_t idx = column_index(atom.key);
    return idx < columns_.size() ? columns_[idx].type : std::string();
}

void RowFilter::validate(const WhereCondition& node) const {
    if (!node.is_atomic()) {
        for (const auto& child : node.children()) validate(child);
        return;
    }

    const auto& atom = node.atom();
    if (column_index(atom.key) == columns_.size()) {
        throw malformed_filter("unknown column '" + atom.key + "'");
    }

    std::string op = normalize_operator(atom.op);
    const auto& ops = supported_operators();
    if (std::find(ops.begin(), ops.end(), op) == ops.end()) {
        throw malformed_filter("operator '" + atom.op + "' is not supported on '" + atom.key + "'");
    }
    if (is_unary_operator(op) || op == "LIKE" || op == "NOT LIKE") return;

    std::string type = column_type(atom);
    try {
        if (is_list_operator(op)) {
            for (const auto& item : split_value_list(atom.value)) coerce_value(item, type);
        } else {
            coerce_value(atom.value, type);
        }
    } catch (const CoercionError& e) {
        throw malformed_filter(std::string(e.what()) + " in condition " + node.to_string());
    }
}

bool RowFilter::matches(const std::vector<std::string>& row) const {
    return evaluate(where_, row);
}

bool RowFilter::evaluate(const WhereCondition& node, const std::vector<std::string>& row) const {
    switch (node.kind()) {
        case WhereCondition::Kind::Atomic:
            return evaluate_atom(node.atom(), row);
        case WhereCondition::Kind::And:
            return std::all_of(node.children().begin(), node.children().end(),
                               [&](const WhereCondition& c) { return evaluate(c, row); });
        case WhereCondition::Kind::Or:
            return std::any_of(node.children().begin(), node.children().end(),
                               [&](const WhereCondition& c) { return evaluate(c, row); });
    }
    return false;
}

bool RowFilter::evaluate_atom(const AtomicWhereCondition& atom, const std::vector<std::string>& row) const {
    size_t idx = column_index(atom.key);
    const std::string cell = idx < row.size() ? row[idx] : std::string();
    const std::string op = normalize_operator(atom.op);
    const TypeCategory category = classify_column_type(column_type(atom));

    if (op == "IS NULL") return cell.empty();
    if (op == "IS NOT NULL") return !cell.empty();
    if (op == "LIKE") return like(cell, atom.value);
    if (op == "NOT LIKE") return !like(cell, atom.value);

    if (is_list_operator(op)) {
        bool found = false;
        for (const auto& item : split_value_list(atom.value)) {
            auto cmp = compare_typed(cell, item, category);
            if (cmp && *cmp == 0) {
                found = true;
                break;
            }
        }
        return op == "IN" ? found : !found;
    }

    auto cmp = compare_typed(cell, atom.value, category);
    if (!cmp) return false;
    if (op == "=") return *cmp == 0;
    if (op == "!=" || op == "<>") return *cmp != 0;
    if (op == ">") return *cmp > 0;
    if (op == ">=") return *cmp >= 0;
    if (op == "<") return *cmp < 0;
    if (op == "<=") return *cmp <= 0;
    return false;
}

bool RowFilter::like(const std::string& text, const std::string& pattern) {
    // Iterative wildcard match with single-star backtracking.
    size_t t = 0;
    size_t p = 0;
    size_t star_p = std::string::npos;
    size_t star_t = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '_' || pattern[p] == text[t])) {
            ++t;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '%') {
            star_p = p++;
            star_t = t;
        } else if (star_p != std::string::npos) {
            p = star_p + 1;
            t = ++star_t;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '%') ++p;
    return p == pattern.size();
}

} // namespace Omnidb
