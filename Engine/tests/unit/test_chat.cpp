/**
 * @file test_chat.cpp
 * @brief Prompt construction and model reply splitting
 */

#include <gtest/gtest.h>
#include <core/chat.hpp>

using namespace Omnidb;

TEST(ChatTest, StatementVerbSkipsComments) {
    EXPECT_EQ(statement_verb("  SELECT * FROM t"), "select");
    EXPECT_EQ(statement_verb("-- first\n-- second\nInsert into t values (1)"), "insert");
    EXPECT_EQ(statement_verb("-- only a comment"), "");
    EXPECT_EQ(statement_verb(""), "");
}

TEST(ChatTest, ClassifiesStatements) {
    EXPECT_EQ(classify_sql_statement("select 1"), "sql:get");
    EXPECT_EQ(classify_sql_statement("WITH x AS (SELECT 1) SELECT * FROM x"), "sql:get");
    EXPECT_EQ(classify_sql_statement("PRAGMA table_info(users)"), "sql:get");
    EXPECT_EQ(classify_sql_statement("UPDATE users SET name = 'a'"), "sql:update");
    EXPECT_EQ(classify_sql_statement("drop table users"), "sql:drop");
    EXPECT_EQ(classify_sql_statement("VACUUM"), "sql");
}

TEST(ChatTest, SplitsProseAndFencedSql) {
    auto segments = split_chat_reply(
        "Here are the users:\n```sql\nSELECT * FROM users;\n```\nAnd the count:\n```\nSELECT count(*) FROM users\n```");

    ASSERT_EQ(segments.size(), 4u);
    EXPECT_FALSE(segments[0].is_sql);
    EXPECT_EQ(segments[0].text, "Here are the users:");
    EXPECT_TRUE(segments[1].is_sql);
    EXPECT_EQ(segments[1].text, "SELECT * FROM users;");
    EXPECT_FALSE(segments[2].is_sql);
    EXPECT_TRUE(segments[3].is_sql);
    EXPECT_EQ(segments[3].text, "SELECT count(*) FROM users");
}

TEST(ChatTest, OtherFenceLanguagesStayProse) {
    auto segments = split_chat_reply("```python\nprint('hi')\n```");
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_FALSE(segments[0].is_sql);
    EXPECT_EQ(segments[0].text, "print('hi')");
}

TEST(ChatTest, UnterminatedFenceKeepsItsBody) {
    auto segments = split_chat_reply("Try this\n```sql\nSELECT 1");
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_TRUE(segments[1].is_sql);
    EXPECT_EQ(segments[1].text, "SELECT 1");
}

TEST(ChatTest, PromptListsTablesAndHistory) {
    StorageUnit users;
    users.name = "users";
    users.attributes = {
        Record("Count", "3"),
        Record("id", "integer", {{"Kind", "Column"}}),
        Record("name", "text", {{"Kind", "Column"}}),
    };
    std::vector<ChatMessage> previous = {{"message", "hello", std::nullopt}};

    std::string prompt = build_chat_prompt("PostgreSQL", "public", {users}, previous, "who signed up?");

    EXPECT_NE(prompt.find("PostgreSQL"), std::string::npos);
    EXPECT_NE(prompt.find("Schema: public"), std::string::npos);
    EXPECT_NE(prompt.find("Tables:\n- users (id integer, name text)"), std::string::npos);
    EXPECT_NE(prompt.find("[message] hello"), std::string::npos);
    EXPECT_NE(prompt.find("User: who signed up?"), std::string::npos);
}
