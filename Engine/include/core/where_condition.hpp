/**
 * @file where_condition.hpp
 * @brief Engine-agnostic filter tree passed into every adapter
 */

#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Omnidb {

/**
 * @brief One column/operator/value triple.
 *
 * column_type is optional: relational adapters take the type from the
 * catalog, schemaless adapters rely on it to coerce the value.
 */
struct AtomicWhereCondition {
    std::string column_type;
    std::string key;
    std::string op;
    std::string value;
};

/**
 * @brief Immutable condition tree: Atomic | And{children} | Or{children}.
 *
 * Groups always hold at least one child and atoms always name a column;
 * the factories throw MalformedFilter otherwise.
 */
class WhereCondition {
public:
    enum class Kind { Atomic, And, Or };

    static WhereCondition atomic(std::string key, std::string op, std::string value,
                                 std::string column_type = "");
    static WhereCondition all_of(std::vector<WhereCondition> children);
    static WhereCondition any_of(std::vector<WhereCondition> children);

    Kind kind() const;
    bool is_atomic() const { return kind() == Kind::Atomic; }

    /**
     * @brief The atom; only valid when is_atomic().
     */
    const AtomicWhereCondition& atom() const;

    /**
     * @brief Children of an And/Or node; empty for atoms.
     */
    const std::vector<WhereCondition>& children() const;

    /**
     * @brief Column names referenced anywhere in the tree, in first-seen order.
     */
    std::vector<std::string> referenced_keys() const;

    /**
     * @brief Human-readable rendering used in error messages and logs.
     */
    std::string to_string() const;

private:
    struct Group {
        std::vector<WhereCondition> children;
    };
    struct AndNode : Group {};
    struct OrNode : Group {};

    explicit WhereCondition(std::variant<AtomicWhereCondition, AndNode, OrNode> node)
        : node_(std::move(node)) {}

    std::variant<AtomicWhereCondition, AndNode, OrNode> node_;
};

/**
 * @brief Canonical operator spelling: trimmed, upper-case, single spaces.
 */
std::string normalize_operator(const std::string& op);

/**
 * @brief True for IS NULL / IS NOT NULL, which take no value.
 */
bool is_unary_operator(const std::string& normalized_op);

/**
 * @brief True for IN / NOT IN, whose value is a comma-separated list.
 */
bool is_list_operator(const std::string& normalized_op);

/**
 * @brief Split an IN list on commas, trimming whitespace around each element.
 */
std::vector<std::string> split_value_list(const std::string& value);

} // namespace Omnidb
