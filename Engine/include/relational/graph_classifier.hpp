/**
 * @file graph_classifier.hpp
 * @brief Relationship classification from catalog foreign keys and key constraints
 */

#pragma once

#include <core/types.hpp>
#include <string>
#include <vector>

namespace Omnidb {

/**
 * @brief One column of a foreign key. Multi-column keys share a constraint name.
 */
struct ForeignKeyColumn {
    std::string table;
    std::string column;
    std::string referenced_table;
    std::string referenced_column;
    std::string constraint;
};

/**
 * @brief A primary-key or unique constraint with its columns in key order.
 */
struct KeyConstraint {
    std::string table;
    std::string name;
    std::string kind;   // "PRIMARY KEY" or "UNIQUE"
    std::vector<std::string> columns;
};

/**
 * @brief Build the relationship graph for one schema.
 *
 * A table with exactly two columns that are both single-column foreign keys
 * is a join table: it links its two referenced tables ManyToMany and is left
 * out of the result. Every other foreign key is classified from the
 * uniqueness of its two ends:
 *   unique -> unique       OneToOne both ways
 *   non-unique -> unique   ManyToOne, plus OneToMany on the referenced table
 *   anything else          Unknown from the referencing table
 *
 * Units keep their input order; relations keep discovery order without
 * duplicates.
 */
std::vector<GraphUnit> classify_relationships(const std::vector<StorageUnit>& units,
                                              const std::vector<ForeignKeyColumn>& foreign_keys,
                                              const std::vector<KeyConstraint>& keys);

/**
 * @brief Whether some constraint on table covers exactly this one column.
 */
bool is_single_column_unique(const std::vector<KeyConstraint>& keys,
                             const std::string& table,
                             const std::string& column);

} // namespace Omnidb
