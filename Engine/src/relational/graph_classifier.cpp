/**
 * @file graph_classifier.cpp
 * @brief Foreign-key and unique-key metadata to relationship kinds
 *
 * A two-column table whose columns are two distinct single-column foreign
 * keys is a join table: it is hidden and its two ends become ManyToMany.
 */

#include <relational/graph_classifier.hpp>
#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace Omnidb {

bool is_single_column_unique(const std::vector<KeyConstraint>& keys,
                             const std::string& table,
                             const std::string& column) {
    return std::any_of(keys.begin(), keys.end(), [&](const KeyConstraint& k) {
        return k.table == table && k.columns.size() == 1 && k.columns.front() == column;
    });
}

namespace {

// A foreign key with all its columns gathered under one constraint.
struct ForeignKey {
    std::string table;
    std::string referenced_table;
    std::vector<std::string> columns;
    std::vector<std::string> referenced_columns;
};

std::vector<ForeignKey> group_foreign_keys(const std::vector<ForeignKeyColumn>& rows) {
    std::vector<ForeignKey> out;
    std::map<std::pair<std::string, std::string>, size_t> index;
    for (const auto& row : rows) {
        auto key = std::make_pair(row.table, row.constraint.empty() ? row.table + "." + row.column : row.constraint);
        auto it = index.find(key);
        if (it == index.end()) {
            index.emplace(key, out.size());
            out.push_back({row.table, row.referenced_table, {row.column}, {row.referenced_column}});
            continue;
        }
        ForeignKey& fk = out[it->second];
        if (std::find(fk.columns.begin(), fk.columns.end(), row.column) == fk.columns.end()) {
            fk.columns.push_back(row.column);
        }
        if (std::find(fk.referenced_columns.begin(), fk.referenced_columns.end(), row.referenced_column) ==
            fk.referenced_columns.end()) {
            fk.referenced_columns.push_back(row.referenced_column);
        }
    }
    return out;
}

class GraphBuilder {
public:
    explicit GraphBuilder(const std::vector<StorageUnit>& units) {
        for (const auto& unit : units) relations_[unit.name];
    }

    void link(const std::string& from, const std::string& to, RelationshipType type) {
        auto it = relations_.find(from);
        if (it == relations_.end()) return;
        GraphUnitRelationship rel{to, type};
        if (std::find(it->second.begin(), it->second.end(), rel) == it->second.end()) {
            it->second.push_back(rel);
        }
    }

    std::vector<GraphUnit> build(const std::vector<StorageUnit>& units, const std::set<std::string>& hidden) {
        std::vector<GraphUnit> out;
        for (const auto& unit : units) {
            if (hidden.count(unit.name)) continue;
            out.push_back({unit, relations_[unit.name]});
        }
        return out;
    }

private:
    std::map<std::string, std::vector<GraphUnitRelationship>> relations_;
};

} // namespace

std::vector<GraphUnit> classify_relationships(const std::vector<StorageUnit>& units,
                                              const std::vector<ForeignKeyColumn>& foreign_keys,
                                              const std::vector<KeyConstraint>& keys) {
    const auto fks = group_foreign_keys(foreign_keys);
    GraphBuilder graph(units);

    // Join tables: two columns, each a distinct single-column foreign key.
    std::set<std::string> join_tables;
    for (const auto& unit : units) {
        const auto columns = unit.columns();
        if (columns.size() != 2) continue;

        std::vector<const ForeignKey*> refs;
        for (const auto& fk : fks) {
            if (fk.table == unit.name && fk.columns.size() == 1) refs.push_back(&fk);
        }
        if (refs.size() != 2 || refs[0]->columns.front() == refs[1]->columns.front()) continue;

        bool covers = std::all_of(columns.begin(), columns.end(), [&](const Column& c) {
            return c.name == refs[0]->columns.front() || c.name == refs[1]->columns.front();
        });
        if (!covers) continue;

        join_tables.insert(unit.name);
        graph.link(refs[0]->referenced_table, refs[1]->referenced_table, RelationshipType::ManyToMany);
        graph.link(refs[1]->referenced_table, refs[0]->referenced_table, RelationshipType::ManyToMany);
    }

    for (const auto& fk : fks) {
        if (join_tables.count(fk.table)) continue;

        if (fk.columns.size() != 1 || fk.referenced_columns.size() != 1) {
            graph.link(fk.table, fk.referenced_table, RelationshipType::Unknown);
            continue;
        }

        const bool from_unique = is_single_column_unique(keys, fk.table, fk.columns.front());
        const bool to_unique = is_single_column_unique(keys, fk.referenced_table, fk.referenced_columns.front());

        if (from_unique && to_unique) {
            graph.link(fk.table, fk.referenced_table, RelationshipType::OneToOne);
            graph.link(fk.referenced_table, fk.table, RelationshipType::OneToOne);
        } else if (to_unique) {
            graph.link(fk.table, fk.referenced_table, RelationshipType::ManyToOne);
            graph.link(fk.referenced_table, fk.table, RelationshipType::OneToMany);
        } else {
            graph.link(fk.table, fk.referenced_table, RelationshipType::Unknown);
        }
    }

    return graph.build(units, join_tables);
}

} // namespace Omnidb
