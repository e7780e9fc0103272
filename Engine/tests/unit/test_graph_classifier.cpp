/**
 * @file test_graph_classifier.cpp
 * @brief Relationship inference from foreign keys and unique constraints
 */

#include <gtest/gtest.h>
#include <relational/graph_classifier.hpp>

using namespace Omnidb;

namespace {

StorageUnit table(const std::string& name, const std::vector<std::string>& columns) {
    StorageUnit unit;
    unit.name = name;
    for (const auto& column : columns) {
        unit.attributes.emplace_back(column, "integer", std::map<std::string, std::string>{{"Kind", "Column"}});
    }
    return unit;
}

KeyConstraint primary(const std::string& table, const std::string& column) {
    return {table, table + "_pkey", "PRIMARY KEY", {column}};
}

const GraphUnit& find(const std::vector<GraphUnit>& graph, const std::string& name) {
    for (const auto& unit : graph) {
        if (unit.unit.name == name) return unit;
    }
    throw std::runtime_error("no unit " + name);
}

} // namespace

TEST(GraphClassifierTest, ManyToOneAddsInverseOneToMany) {
    std::vector<StorageUnit> units = {table("users", {"id", "name"}), table("orders", {"id", "user_id"})};
    std::vector<ForeignKeyColumn> fks = {{"orders", "user_id", "users", "id", "orders_user_fk"}};
    std::vector<KeyConstraint> keys = {primary("users", "id"), primary("orders", "id")};

    auto graph = classify_relationships(units, fks, keys);

    ASSERT_EQ(graph.size(), 2u);
    EXPECT_EQ(graph[0].unit.name, "users");
    EXPECT_EQ(find(graph, "orders").relations,
              (std::vector<GraphUnitRelationship>{{"users", RelationshipType::ManyToOne}}));
    EXPECT_EQ(find(graph, "users").relations,
              (std::vector<GraphUnitRelationship>{{"orders", RelationshipType::OneToMany}}));
}

TEST(GraphClassifierTest, UniqueForeignKeyIsOneToOne) {
    std::vector<StorageUnit> units = {table("users", {"id"}), table("profiles", {"id", "user_id"})};
    std::vector<ForeignKeyColumn> fks = {{"profiles", "user_id", "users", "id", "profiles_user_fk"}};
    std::vector<KeyConstraint> keys = {primary("users", "id"), primary("profiles", "id"),
                                       {"profiles", "profiles_user_key", "UNIQUE", {"user_id"}}};

    auto graph = classify_relationships(units, fks, keys);

    EXPECT_EQ(find(graph, "profiles").relations.at(0).relationship, RelationshipType::OneToOne);
    EXPECT_EQ(find(graph, "users").relations.at(0).relationship, RelationshipType::OneToOne);
}

TEST(GraphClassifierTest, JoinTableLinksBothSidesAndIsHidden) {
    std::vector<StorageUnit> units = {table("students", {"id"}), table("courses", {"id"}),
                                      table("enrollments", {"student_id", "course_id"})};
    std::vector<ForeignKeyColumn> fks = {
        {"enrollments", "student_id", "students", "id", "enr_student_fk"},
        {"enrollments", "course_id", "courses", "id", "enr_course_fk"},
    };
    std::vector<KeyConstraint> keys = {primary("students", "id"), primary("courses", "id"),
                                       {"enrollments", "enr_pkey", "PRIMARY KEY", {"student_id", "course_id"}}};

    auto graph = classify_relationships(units, fks, keys);

    ASSERT_EQ(graph.size(), 2u);
    EXPECT_EQ(find(graph, "students").relations,
              (std::vector<GraphUnitRelationship>{{"courses", RelationshipType::ManyToMany}}));
    EXPECT_EQ(find(graph, "courses").relations,
              (std::vector<GraphUnitRelationship>{{"students", RelationshipType::ManyToMany}}));
}

TEST(GraphClassifierTest, NonUniqueTargetAndCompositeKeysAreUnknown) {
    std::vector<StorageUnit> units = {table("a", {"x", "y", "z"}), table("b", {"x", "y"})};
    std::vector<ForeignKeyColumn> fks = {
        {"a", "x", "b", "x", "a_b_fk"},
        {"a", "y", "b", "y", "a_b_fk"},
    };

    auto graph = classify_relationships(units, fks, {});

    EXPECT_EQ(find(graph, "a").relations,
              (std::vector<GraphUnitRelationship>{{"b", RelationshipType::Unknown}}));
    EXPECT_TRUE(find(graph, "b").relations.empty());
}

TEST(GraphClassifierTest, UnitsWithoutKeysStillAppear) {
    auto graph = classify_relationships({table("lonely", {"id"})}, {}, {});
    ASSERT_EQ(graph.size(), 1u);
    EXPECT_TRUE(graph[0].relations.empty());
}

TEST(GraphClassifierTest, SingleColumnUniqueLookup) {
    std::vector<KeyConstraint> keys = {{"t", "k", "UNIQUE", {"a", "b"}}, primary("t", "id")};
    EXPECT_TRUE(is_single_column_unique(keys, "t", "id"));
    EXPECT_FALSE(is_single_column_unique(keys, "t", "a"));
    EXPECT_FALSE(is_single_column_unique(keys, "u", "id"));
}
