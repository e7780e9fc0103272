/**
 * @file test_sql_builder.cpp
 * @brief Statement construction per dialect
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <plugins/clickhouse_plugin.hpp>
#include <plugins/mysql_dialect.hpp>
#include <plugins/postgres_plugin.hpp>
#include <plugins/sqlite_plugin.hpp>
#include <relational/sql_builder.hpp>
#include <functional>

using namespace Omnidb;

namespace {

const std::vector<Column> kUsers = {{"id", "integer"}, {"name", "text"}, {"active", "boolean"}};

Assignment assign(const Column& column, const std::string& raw) {
    return {column, coerce_for_write(raw, column.type)};
}

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const DbError& e) {
        return e.kind();
    }
    return ErrorKind::Unavailable;
}

} // namespace

TEST(SqlBuilderTest, PostgresSelectWithFilterAndPagination) {
    PostgresDialect dialect;
    SqlBuilder builder(dialect);

    auto where = WhereCondition::all_of({
        WhereCondition::atomic("id", ">", "1"),
        WhereCondition::any_of({
            WhereCondition::atomic("name", "ILIKE", "b%"),
            WhereCondition::atomic("active", "IS NULL", ""),
        }),
    });
    Statement stmt = builder.select_rows("public", "users", kUsers, {"id"}, &where, 10, 20);

    EXPECT_EQ(stmt.sql,
              "SELECT \"id\", \"name\", \"active\" FROM \"public\".\"users\" "
              "WHERE (\"id\" > $1 AND (\"name\" ILIKE $2 OR \"active\" IS NULL)) "
              "ORDER BY \"id\" LIMIT 10 OFFSET 20");
    ASSERT_EQ(stmt.params.size(), 2u);
    EXPECT_EQ(std::get<int64_t>(stmt.params[0].native), 1);
    EXPECT_EQ(stmt.params[1].text, "b%");
}

TEST(SqlBuilderTest, InListBindsOneParameterPerElement) {
    SqliteDialect dialect;
    SqlBuilder builder(dialect);
    std::vector<Value> params;

    std::string sql = builder.compile_where(WhereCondition::atomic("id", "not in", "1, 2,3"), kUsers, params);

    EXPECT_EQ(sql, "\"id\" NOT IN (?1, ?2, ?3)");
    EXPECT_EQ(params.size(), 3u);
}

TEST(SqlBuilderTest, FilterValuesAreNeverInlined) {
    PostgresDialect dialect;
    SqlBuilder builder(dialect);
    std::vector<Value> params;

    std::string sql = builder.compile_where(
        WhereCondition::atomic("name", "=", "x'; DROP TABLE users; --"), kUsers, params);

    EXPECT_EQ(sql, "\"name\" = $1");
    EXPECT_EQ(params.at(0).text, "x'; DROP TABLE users; --");
}

TEST(SqlBuilderTest, RejectsUnknownColumnsOperatorsAndBadValues) {
    SqliteDialect sqlite;
    SqlBuilder builder(sqlite);
    std::vector<Value> params;

    EXPECT_EQ(kind_of([&] { builder.compile_where(WhereCondition::atomic("nope", "=", "1"), kUsers, params); }),
              ErrorKind::MalformedFilter);
    EXPECT_EQ(kind_of([&] { builder.compile_where(WhereCondition::atomic("name", "ILIKE", "a"), kUsers, params); }),
              ErrorKind::MalformedFilter);
    EXPECT_EQ(kind_of([&] { builder.compile_where(WhereCondition::atomic("id", "=", "abc"), kUsers, params); }),
              ErrorKind::MalformedFilter);
    EXPECT_EQ(kind_of([&] { builder.compile_where(WhereCondition::atomic("active", "=", "maybe"), kUsers, params); }),
              ErrorKind::MalformedFilter);
}

TEST(SqlBuilderTest, MySqlUsesBackticksAndQuestionMarks) {
    MySqlDialect dialect("MariaDB");
    SqlBuilder builder(dialect);

    Statement stmt = builder.insert_row("shop", "users", {assign(kUsers[0], "7"), assign(kUsers[1], "Ann")});
    EXPECT_EQ(stmt.sql, "INSERT INTO `shop`.`users` (`id`, `name`) VALUES (?, ?)");
    EXPECT_EQ(dialect.name(), "MariaDB");
}

TEST(SqlBuilderTest, UpdateMatchesNullWithIsNull) {
    PostgresDialect dialect;
    SqlBuilder builder(dialect);

    Statement stmt = builder.update_row("", "users", {assign(kUsers[1], "Bob")},
                                        {assign(kUsers[0], "2"), assign(kUsers[2], "")});
    EXPECT_EQ(stmt.sql, "UPDATE \"users\" SET \"name\" = $1 WHERE \"id\" = $2 AND \"active\" IS NULL");
    EXPECT_EQ(stmt.params.size(), 2u);
}

TEST(SqlBuilderTest, ClickHouseMutationsAndTypedPlaceholders) {
    ClickHouseDialect dialect;
    SqlBuilder builder(dialect);
    const Column id{"id", "UInt64"};
    const Column name{"name", "LowCardinality(String)"};

    Statement update = builder.update_row("db", "events", {assign(name, "x")}, {assign(id, "3")});
    EXPECT_EQ(update.sql, "ALTER TABLE `db`.`events` UPDATE `name` = {p1:String} WHERE `id` = {p2:UInt64}");

    Statement del = builder.delete_row("db", "events", {assign(id, "3")});
    EXPECT_EQ(del.sql, "ALTER TABLE `db`.`events` DELETE WHERE `id` = {p1:UInt64}");

    Statement insert = builder.insert_row("db", "events", {assign(id, "1")});
    EXPECT_EQ(insert.sql, "INSERT INTO `db`.`events` (`id`) SELECT {p1:UInt64}");
}

TEST(SqlBuilderTest, CreateTableWithPrimaryKey) {
    SqliteDialect dialect;
    SqlBuilder builder(dialect);

    std::string sql = builder.create_table("", "users", {
        Record("id", "integer", {{"Primary", "true"}}),
        Record("name", "varchar(40)", {{"Nullable", "false"}}),
        Record("bio", "text"),
    });
    EXPECT_EQ(sql, "CREATE TABLE \"users\" (\"id\" integer NOT NULL, \"name\" varchar(40) NOT NULL, "
                   "\"bio\" text, PRIMARY KEY (\"id\"))");
}

TEST(SqlBuilderTest, ClickHouseCreateTableUsesMergeTree) {
    ClickHouseDialect dialect;
    SqlBuilder builder(dialect);

    std::string sql = builder.create_table("db", "events", {
        Record("id", "UInt64", {{"Primary", "true"}}),
        Record("label", "Nullable(String)"),
    });
    EXPECT_EQ(sql, "CREATE TABLE `db`.`events` (`id` UInt64 NOT NULL, `label` Nullable(String)) "
                   "ENGINE = MergeTree ORDER BY (`id`)");
}

TEST(SqlBuilderTest, CreateTableRejectsBadDefinitions) {
    PostgresDialect dialect;
    SqlBuilder builder(dialect);

    EXPECT_EQ(kind_of([&] { builder.create_table("", "users", {Record("id", "frobnicate")}); }),
              ErrorKind::MalformedInput);
    EXPECT_EQ(kind_of([&] { builder.create_table("", "bad name", {Record("id", "int")}); }),
              ErrorKind::MalformedInput);
    EXPECT_EQ(kind_of([&] { builder.create_table("", "t", {Record("a", "int"), Record("a", "text")}); }),
              ErrorKind::MalformedInput);
    EXPECT_EQ(kind_of([&] { builder.create_table("", "t", {}); }), ErrorKind::MalformedInput);
}

TEST(SqlDialectTest, ReadStatementDetection) {
    PostgresDialect dialect;
    EXPECT_TRUE(dialect.is_read_statement("  select 1"));
    EXPECT_TRUE(dialect.is_read_statement("-- note\nWITH x AS (SELECT 1) SELECT * FROM x"));
    EXPECT_FALSE(dialect.is_read_statement("DELETE FROM t"));
    EXPECT_TRUE(is_valid_identifier("user_2"));
    EXPECT_FALSE(is_valid_identifier("2user"));
    EXPECT_FALSE(is_valid_identifier("a;b"));
}
