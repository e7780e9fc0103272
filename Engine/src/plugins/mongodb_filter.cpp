#include <plugins/mongodb_filter.hpp>
#include <core/errors.hpp>
#include <core/value_coercion.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>

namespace Omnidb {

using nlohmann::json;

namespace {

class FilterTranslator {
public:
    explicit FilterTranslator(const std::map<std::string, std::string>& field_types) : field_types_(field_types) {}

    json translate(const WhereCondition& node) const {
        if (node.is_atomic()) return translate_atom(node.atom());

        json children = json::array();
        for (const auto& child : node.children()) children.push_back(translate(child));
        return {{node.kind() == WhereCondition::Kind::And ? "$and" : "$or", children}};
    }

private:
    std::string value_type(const AtomicWhereCondition& atom) const {
        if (!atom.column_type.empty()) return atom.column_type;
        auto it = field_types_.find(atom.key);
        return it == field_types_.end() ? "" : it->second;
    }

    json typed_value(const AtomicWhereCondition& atom, const std::string& raw) const {
        if (atom.key == "_id") return mongodb_id(raw);
        const std::string type = value_type(atom);
        if (type.empty()) return raw;

        switch (classify_column_type(type)) {
            case TypeCategory::Integer: {
                int64_t v = 0;
                if (!parse_integer(raw, v)) throw malformed_filter("value '" + raw + "' is not an integer for '" + atom.key + "'");
                return v;
            }
            case TypeCategory::Decimal:
            case TypeCategory::Float: {
                double v = 0;
                if (!parse_float(raw, v)) throw malformed_filter("value '" + raw + "' is not a number for '" + atom.key + "'");
                return v;
            }
            case TypeCategory::Boolean: {
                bool v = false;
                if (!parse_boolean(raw, v)) throw malformed_filter("value '" + raw + "' is not a boolean for '" + atom.key + "'");
                return v;
            }
            default:
                return raw;
        }
    }

    json translate_atom(const AtomicWhereCondition& atom) const {
        const std::string op = normalize_operator(atom.op);
        const auto& ops = mongodb_operators();
        if (std::find(ops.begin(), ops.end(), op) == ops.end()) {
            throw malformed_filter("operator '" + atom.op + "' is not supported on '" + atom.key + "'");
        }

        static const std::map<std::string, std::string> comparisons = {
            {"=", "$eq"}, {"!=", "$ne"}, {"<>", "$ne"},
            {">", "$gt"}, {">=", "$gte"}, {"<", "$lt"}, {"<=", "$lte"}
        };

        json condition;
        auto cmp = comparisons.find(op);
        if (cmp != comparisons.end()) {
            condition = {{cmp->second, typed_value(atom, atom.value)}};
        } else if (op == "IN" || op == "NOT IN") {
            json values = json::array();
            for (const auto& item : split_value_list(atom.value)) values.push_back(typed_value(atom, item));
            condition = {{op == "IN" ? "$in" : "$nin", values}};
        } else if (op == "LIKE") {
            condition = {{"$regex", like_to_regex(atom.value)}};
        } else if (op == "NOT LIKE") {
            condition = {{"$not", {{"$regex", like_to_regex(atom.value)}}}};
        } else if (op == "EXISTS") {
            condition = {{"$exists", true}};
        } else if (op == "NOT EXISTS") {
            condition = {{"$exists", false}};
        } else if (op == "IS NULL") {
            condition = {{"$eq", nullptr}};
        } else {
            // IS NOT NULL
            condition = {{"$ne", nullptr}};
        }
        return {{atom.key, condition}};
    }

    const std::map<std::string, std::string>& field_types_;
};

} // namespace

const std::vector<std::string>& mongodb_operators() {
    static const std::vector<std::string> ops = {
        "=", "!=", "<>", ">", ">=", "<", "<=", "IN", "NOT IN",
        "LIKE", "NOT LIKE", "EXISTS", "NOT EXISTS", "IS NULL", "IS NOT NULL"
    };
    return ops;
}

bool is_object_id(const std::string& text) {
    return text.size() == 24 &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

json mongodb_id(const std::string& text) {
    if (is_object_id(text)) return {{"$oid", text}};
    return text;
}

json to_mongodb_filter(const WhereCondition* where, const std::map<std::string, std::string>& field_types) {
    if (!where) return json::object();
    return FilterTranslator(field_types).translate(*where);
}

std::string like_to_regex(const std::string& pattern) {
    static const std::string meta = ".^$*+?()[]{}|\\/";
    std::string out = "^";
    for (char c : pattern) {
        if (c == '%') {
            out += ".*";
        } else if (c == '_') {
            out.push_back('.');
        } else {
            if (meta.find(c) != std::string::npos) out.push_back('\\');
            out.push_back(c);
        }
    }
    out.push_back('$');
    return out;
}

} // namespace Omnidb
