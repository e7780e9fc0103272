/**
 * @file where_condition.cpp
 * @brief Filter tree construction, validation and JSON parsing
 */

#include <core/where_condition.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Omnidb {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

const std::vector<WhereCondition> k_no_children;

} // namespace

WhereCondition WhereCondition::atomic(std::string key, std::string op, std::string value,
                                      std::string column_type) {
    if (trim(key).empty()) {
        throw malformed_filter("condition has an empty column name");
    }
    if (trim(op).empty()) {
        throw malformed_filter("condition on '" + key + "' has no operator");
    }
    AtomicWhereCondition atom{std::move(column_type), std::move(key), std::move(op), std::move(value)};
    return WhereCondition(std::move(atom));
}

WhereCondition WhereCondition::all_of(std::vector<WhereCondition> children) {
    if (children.empty()) {
        throw malformed_filter("AND group has no children");
    }
    AndNode node;
    node.children = std::move(children);
    return WhereCondition(std::move(node));
}

WhereCondition WhereCondition::any_of(std::vector<WhereCondition> children) {
    if (children.empty()) {
        throw malformed_filter("OR group has no children");
    }
    OrNode node;
    node.children = std::move(children);
    return WhereCondition(std::move(node));
}

WhereCondition::Kind WhereCondition::kind() const {
    switch (node_.index()) {
        case 0: return Kind::Atomic;
        case 1: return Kind::And;
        default: return Kind::Or;
    }
}

const AtomicWhereCondition& WhereCondition::atom() const {
    return std::get<AtomicWhereCondition>(node_);
}

const std::vector<WhereCondition>& WhereCondition::children() const {
    if (auto* node = std::get_if<AndNode>(&node_)) return node->children;
    if (auto* node = std::get_if<OrNode>(&node_)) return node->children;
    return k_no_children;
}

std::vector<std::string> WhereCondition::referenced_keys() const {
    std::vector<std::string> keys;
    std::vector<const WhereCondition*> stack{this};
    while (!stack.empty()) {
        const WhereCondition* cur = stack.back();
        stack.pop_back();
        if (cur->is_atomic()) {
            if (std::find(keys.begin(), keys.end(), cur->atom().key) == keys.end()) {
                keys.push_back(cur->atom().key);
            }
            continue;
        }
        const auto& kids = cur->children();
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) stack.push_back(&*it);
    }
    return keys;
}

std::string WhereCondition::to_string() const {
    if (is_atomic()) {
        const auto& a = atom();
        std::string op = normalize_operator(a.op);
        if (is_unary_operator(op)) return a.key + " " + op;
        return a.key + " " + op + " '" + a.value + "'";
    }
    std::ostringstream out;
    const char* joiner = kind() == Kind::And ? " AND " : " OR ";
    out << "(";
    bool first = true;
    for (const auto& child : children()) {
        if (!first) out << joiner;
        out << child.to_string();
        first = false;
    }
    out << ")";
    return out.str();
}

std::string normalize_operator(const std::string& op) {
    std::string out;
    bool pending_space = false;
    for (char c : trim(op)) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = true;
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

bool is_unary_operator(const std::string& normalized_op) {
    return normalized_op == "IS NULL" || normalized_op == "IS NOT NULL";
}

bool is_list_operator(const std::string& normalized_op) {
    return normalized_op == "IN" || normalized_op == "NOT IN";
}

std::vector<std::string> split_value_list(const std::string& value) {
    std::vector<std::string> out;
    std::string current;
    for (char c : value) {
        if (c == ',') {
            out.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    out.push_back(trim(current));
    return out;
}

} // namespace Omnidb
