/**
 * @file test_postgres_plugin.cpp
 * @brief PostgreSQL adapter against a live server
 *
 * Runs only when OMNIDB_TEST_POSTGRES is set; connection parameters come
 * from OMNIDB_HOST, OMNIDB_PORT, OMNIDB_USER, OMNIDB_PASSWORD and
 * OMNIDB_DATABASE.
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <plugins/postgres_plugin.hpp>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <string>

using namespace Omnidb;

class PostgresPluginTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!std::getenv("OMNIDB_TEST_POSTGRES")) {
            GTEST_SKIP() << "OMNIDB_TEST_POSTGRES not set - skipping PostgreSQL integration test";
        }
        config_ = PluginConfig(Credentials::from_env(DatabaseType::Postgres),
                               CallContext(std::chrono::milliseconds(10000)));
        if (!plugin_.is_available(config_)) {
            GTEST_SKIP() << "PostgreSQL not available";
        }

        plugin_.raw_execute(config_, "DROP TABLE IF EXISTS public.omnidb_orders");
        plugin_.raw_execute(config_, "DROP TABLE IF EXISTS public.omnidb_users");
        ASSERT_TRUE(plugin_.add_storage_unit(config_, "public", "omnidb_users", {
            Record("id", "integer", {{"Primary", "true"}}),
            Record("name", "text"),
            Record("active", "boolean"),
        }));
        plugin_.raw_execute(config_,
            "CREATE TABLE public.omnidb_orders (id integer PRIMARY KEY, "
            "user_id integer REFERENCES public.omnidb_users(id))");
        ready_ = true;
    }

    void TearDown() override {
        if (!ready_) return;
        plugin_.raw_execute(config_, "DROP TABLE IF EXISTS public.omnidb_orders");
        plugin_.raw_execute(config_, "DROP TABLE IF EXISTS public.omnidb_users");
    }

    PostgresPlugin plugin_;
    PluginConfig config_;
    bool ready_ = false;
};

TEST_F(PostgresPluginTest, ListsSchemasAndUnits) {
    auto schemas = plugin_.get_all_schemas(config_);
    EXPECT_NE(std::find(schemas.begin(), schemas.end(), "public"), schemas.end());

    auto columns = plugin_.get_columns(config_, "public", "omnidb_users");
    ASSERT_EQ(columns.size(), 3u);
    EXPECT_EQ(columns[0].name, "id");
}

TEST_F(PostgresPluginTest, RoundTripsRows) {
    ASSERT_TRUE(plugin_.add_row(config_, "public", "omnidb_users",
                                {Record("id", "1"), Record("name", "Alice"), Record("active", "yes")}));
    ASSERT_TRUE(plugin_.add_row(config_, "public", "omnidb_users",
                                {Record("id", "2"), Record("name", "Bob"), Record("active", "")}));

    auto where = WhereCondition::all_of({
        WhereCondition::atomic("name", "ILIKE", "b%"),
        WhereCondition::atomic("active", "IS NULL", ""),
    });
    RowsResult result = plugin_.get_rows(config_, "public", "omnidb_users", &where, 10, 0);
    EXPECT_EQ(result.rows, (std::vector<std::vector<std::string>>{{"2", "Bob", ""}}));

    ASSERT_TRUE(plugin_.update_storage_unit(config_, "public", "omnidb_users",
                                            {Record("id", "2"), Record("name", "Bob"), Record("active", "true")},
                                            {"active"}));
    EXPECT_TRUE(plugin_.delete_row(config_, "public", "omnidb_users", {Record("id", "1")}));
    EXPECT_EQ(plugin_.get_rows(config_, "public", "omnidb_users", nullptr, 10, 0).rows.size(), 1u);
}

TEST_F(PostgresPluginTest, GraphFromForeignKeys) {
    auto graph = plugin_.get_graph(config_, "public");

    bool found = false;
    for (const auto& unit : graph) {
        if (unit.unit.name != "omnidb_orders") continue;
        found = true;
        EXPECT_EQ(unit.relations,
                  (std::vector<GraphUnitRelationship>{{"omnidb_users", RelationshipType::ManyToOne}}));
    }
    EXPECT_TRUE(found);
}

TEST_F(PostgresPluginTest, UnreachableServerIsUnavailable) {
    Credentials creds = config_.credentials;
    creds.port = "1";
    PluginConfig bad(creds, CallContext(std::chrono::milliseconds(2000)));

    EXPECT_FALSE(plugin_.is_available(bad));
    try {
        plugin_.get_databases(bad);
        FAIL() << "expected DbError";
    } catch (const DbError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Unavailable);
    }
}
