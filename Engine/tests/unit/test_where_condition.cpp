/**
 * @file test_where_condition.cpp
 * @brief Filter tree construction, operator helpers and JSON parsing
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <core/json_codec.hpp>
#include <core/where_condition.hpp>

using namespace Omnidb;

TEST(WhereConditionTest, AtomRequiresKeyAndOperator) {
    EXPECT_THROW(WhereCondition::atomic("", "=", "1"), DbError);
    EXPECT_THROW(WhereCondition::atomic("id", " ", "1"), DbError);
    EXPECT_NO_THROW(WhereCondition::atomic("id", "=", "1"));
}

TEST(WhereConditionTest, GroupsRejectEmptyChildren) {
    try {
        WhereCondition::all_of({});
        FAIL() << "expected MalformedFilter";
    } catch (const DbError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedFilter);
    }
    EXPECT_THROW(WhereCondition::any_of({}), DbError);
}

TEST(WhereConditionTest, ReferencedKeysInFirstSeenOrder) {
    auto where = WhereCondition::all_of({
        WhereCondition::atomic("name", "=", "a"),
        WhereCondition::any_of({
            WhereCondition::atomic("age", ">", "3"),
            WhereCondition::atomic("name", "LIKE", "b%"),
        }),
    });
    EXPECT_EQ(where.referenced_keys(), (std::vector<std::string>{"name", "age"}));
    EXPECT_EQ(where.kind(), WhereCondition::Kind::And);
    EXPECT_EQ(where.children().size(), 2u);
}

TEST(WhereConditionTest, OperatorHelpers) {
    EXPECT_EQ(normalize_operator("  not   in "), "NOT IN");
    EXPECT_EQ(normalize_operator("like"), "LIKE");
    EXPECT_TRUE(is_unary_operator("IS NULL"));
    EXPECT_TRUE(is_unary_operator("IS NOT NULL"));
    EXPECT_FALSE(is_unary_operator("="));
    EXPECT_TRUE(is_list_operator("IN"));
    EXPECT_TRUE(is_list_operator("NOT IN"));
    EXPECT_EQ(split_value_list(" 1, 2 ,3 "), (std::vector<std::string>{"1", "2", "3"}));
}

TEST(WhereConditionTest, ParsesNestedJson) {
    auto where = parse_where(R"({"or": [
        {"atomic": {"key": "id", "operator": "=", "value": 1}},
        {"and": [{"atomic": {"key": "name", "operator": "IS NULL"}}]}
    ]})");
    ASSERT_EQ(where.kind(), WhereCondition::Kind::Or);
    EXPECT_EQ(where.children()[0].atom().value, "1");
    EXPECT_EQ(where.children()[1].children()[0].atom().op, "IS NULL");

    auto round = where_from_json(where_to_json(where));
    EXPECT_EQ(round.to_string(), where.to_string());
}

TEST(WhereConditionTest, MalformedJsonIsMalformedFilter) {
    for (const char* text : {"not json", "{}", R"({"xor": []})", R"({"and": {}})",
                             R"({"atomic": {"key": "id"}})", R"({"and": []})"}) {
        try {
            parse_where(text);
            FAIL() << "accepted " << text;
        } catch (const DbError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::MalformedFilter) << text;
        }
    }
}
