/**
 * @file test_sqlite_plugin.cpp
 * @brief SQLite adapter end to end against a scratch database file
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <plugins/sqlite_plugin.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

using namespace Omnidb;

namespace {

class ScriptedModel : public ChatModel {
public:
    explicit ScriptedModel(std::string reply) : reply_(std::move(reply)) {}

    std::string complete(const std::string& prompt) override {
        last_prompt = prompt;
        return reply_;
    }

    std::string last_prompt;

private:
    std::string reply_;
};

const GraphUnit* find_unit(const std::vector<GraphUnit>& graph, const std::string& name) {
    for (const auto& unit : graph) {
        if (unit.unit.name == name) return &unit;
    }
    return nullptr;
}

} // namespace

class SqlitePluginTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path() /
                (std::string("omnidb_") + info->name() + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db");

        Credentials creds;
        creds.type = DatabaseType::Sqlite3;
        creds.database = path_.string();
        config_ = PluginConfig(creds, CallContext(std::chrono::milliseconds(5000)));

        ASSERT_TRUE(plugin_.add_storage_unit(config_, "main", "users", {
            Record("id", "int", {{"Primary", "true"}}),
            Record("name", "text"),
        }));
        ASSERT_TRUE(plugin_.add_row(config_, "main", "users", {Record("id", "1"), Record("name", "Alice")}));
        ASSERT_TRUE(plugin_.add_row(config_, "main", "users", {Record("id", "2"), Record("name", "Bob")}));
        ASSERT_TRUE(plugin_.add_row(config_, "main", "users", {Record("id", "3"), Record("name", "Carol")}));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void exec(const std::string& sql) { plugin_.raw_execute(config_, sql); }

    SqlitePlugin plugin_;
    PluginConfig config_;
    std::filesystem::path path_;
};

TEST_F(SqlitePluginTest, IsAvailable) {
    EXPECT_TRUE(plugin_.is_available(config_));

    PluginConfig missing(Credentials{}, CallContext{});
    missing.credentials.type = DatabaseType::Sqlite3;
    EXPECT_FALSE(plugin_.is_available(missing));
}

TEST_F(SqlitePluginTest, ListsDatabaseSchemasAndUnits) {
    EXPECT_EQ(plugin_.get_databases(config_), (std::vector<std::string>{path_.filename().string()}));
    EXPECT_EQ(plugin_.get_all_schemas(config_), (std::vector<std::string>{"main"}));

    auto units = plugin_.get_storage_units(config_, "main");
    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].name, "users");
    EXPECT_EQ(units[0].columns(), (std::vector<Column>{{"id", "int"}, {"name", "text"}}));
}

TEST_F(SqlitePluginTest, ReportsDeclaredTypesInLowerCase) {
    exec("CREATE TABLE events (id INTEGER PRIMARY KEY, label VARCHAR(20), at DateTime)");

    EXPECT_EQ(plugin_.get_columns(config_, "main", "events"),
              (std::vector<Column>{{"id", "integer"}, {"label", "varchar(20)"}, {"at", "datetime"}}));

    for (const auto& unit : plugin_.get_storage_units(config_, "main")) {
        if (unit.name != "events") continue;
        EXPECT_EQ(unit.columns(),
                  (std::vector<Column>{{"id", "integer"}, {"label", "varchar(20)"}, {"at", "datetime"}}));
    }
}

TEST_F(SqlitePluginTest, IntrospectionIsRepeatable) {
    auto first = plugin_.get_storage_units(config_, "main");
    auto second = plugin_.get_storage_units(config_, "main");
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].name, second[i].name);
        EXPECT_EQ(first[i].attributes, second[i].attributes);
    }
    EXPECT_EQ(plugin_.get_columns(config_, "main", "users"), plugin_.get_columns(config_, "main", "users"));
}

TEST_F(SqlitePluginTest, FiltersRowsByEquality) {
    auto where = WhereCondition::atomic("name", "=", "Bob");
    RowsResult result = plugin_.get_rows(config_, "main", "users", &where, 10, 0);

    EXPECT_EQ(result.columns, (std::vector<Column>{{"id", "int"}, {"name", "text"}}));
    EXPECT_EQ(result.rows, (std::vector<std::vector<std::string>>{{"2", "Bob"}}));
    EXPECT_FALSE(result.disable_update);
}

TEST_F(SqlitePluginTest, FiltersWithAndOr) {
    auto where = WhereCondition::any_of({
        WhereCondition::atomic("id", "=", "1"),
        WhereCondition::all_of({
            WhereCondition::atomic("id", ">", "1"),
            WhereCondition::atomic("name", "LIKE", "C%"),
        }),
    });
    RowsResult result = plugin_.get_rows(config_, "main", "users", &where, 10, 0);
    EXPECT_EQ(result.rows, (std::vector<std::vector<std::string>>{{"1", "Alice"}, {"3", "Carol"}}));

    auto glob = WhereCondition::atomic("name", "GLOB", "B*");
    EXPECT_EQ(plugin_.get_rows(config_, "main", "users", &glob, 10, 0).rows.size(), 1u);
}

TEST_F(SqlitePluginTest, PaginatesInKeyOrder) {
    EXPECT_EQ(plugin_.get_rows(config_, "main", "users", nullptr, 2, 0).rows,
              (std::vector<std::vector<std::string>>{{"1", "Alice"}, {"2", "Bob"}}));
    EXPECT_EQ(plugin_.get_rows(config_, "main", "users", nullptr, 2, 2).rows,
              (std::vector<std::vector<std::string>>{{"3", "Carol"}}));
    EXPECT_TRUE(plugin_.get_rows(config_, "main", "users", nullptr, 2, 10).rows.empty());
}

TEST_F(SqlitePluginTest, RejectsBadFiltersAndPageSizes) {
    auto unknown = WhereCondition::atomic("email", "=", "x");
    try {
        plugin_.get_rows(config_, "main", "users", &unknown, 10, 0);
        FAIL() << "expected DbError";
    } catch (const DbError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedFilter);
        EXPECT_EQ(e.engine(), "Sqlite3");
        EXPECT_EQ(e.operation(), "get_rows");
    }

    auto op = WhereCondition::atomic("name", "ILIKE", "a");
    EXPECT_THROW(plugin_.get_rows(config_, "main", "users", &op, 10, 0), DbError);

    EXPECT_THROW(plugin_.get_rows(config_, "main", "users", nullptr, 0, 0), DbError);
    EXPECT_THROW(plugin_.get_rows(config_, "main", "nope", nullptr, 10, 0), DbError);
}

TEST_F(SqlitePluginTest, UpdatesByPrimaryKey) {
    ASSERT_TRUE(plugin_.update_storage_unit(config_, "main", "users",
                                            {Record("id", "2"), Record("name", "Robert")}, {"name"}));

    auto where = WhereCondition::atomic("id", "=", "2");
    EXPECT_EQ(plugin_.get_rows(config_, "main", "users", &where, 10, 0).rows,
              (std::vector<std::vector<std::string>>{{"2", "Robert"}}));

    try {
        plugin_.update_storage_unit(config_, "main", "users", {Record("id", "99"), Record("name", "X")}, {"name"});
        FAIL() << "expected DbError";
    } catch (const DbError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ExecutionFailure);
    }
    EXPECT_THROW(plugin_.update_storage_unit(config_, "main", "users", {Record("id", "2")}, {}), DbError);
}

TEST_F(SqlitePluginTest, DeletesRows) {
    EXPECT_TRUE(plugin_.delete_row(config_, "main", "users", {Record("id", "3"), Record("name", "Carol")}));
    EXPECT_FALSE(plugin_.delete_row(config_, "main", "users", {Record("id", "3"), Record("name", "Carol")}));
    EXPECT_EQ(plugin_.get_rows(config_, "main", "users", nullptr, 10, 0).rows.size(), 2u);
}

TEST_F(SqlitePluginTest, RejectsInvalidMutations) {
    auto expect_kind = [](const std::function<void()>& fn, ErrorKind kind) {
        try {
            fn();
            ADD_FAILURE() << "expected DbError";
        } catch (const DbError& e) {
            EXPECT_EQ(e.kind(), kind);
        }
    };

    expect_kind([&] { plugin_.add_row(config_, "main", "users", {Record("id", "abc")}); }, ErrorKind::MalformedInput);
    expect_kind([&] { plugin_.add_row(config_, "main", "users", {Record("age", "3")}); }, ErrorKind::MalformedInput);
    expect_kind([&] { plugin_.add_storage_unit(config_, "main", "t", {Record("a", "frobnicate")}); },
                ErrorKind::MalformedInput);
    expect_kind([&] { plugin_.add_row(config_, "main", "users", {Record("id", "1"), Record("name", "Dup")}); },
                ErrorKind::ExecutionFailure);
}

TEST_F(SqlitePluginTest, GraphFromForeignKeys) {
    exec("CREATE TABLE profiles (id INTEGER PRIMARY KEY, user_id INTEGER UNIQUE REFERENCES users(id))");
    exec("CREATE TABLE orders (id INTEGER PRIMARY KEY, user_id INTEGER REFERENCES users(id))");
    exec("CREATE TABLE tags (id INTEGER PRIMARY KEY, label TEXT)");
    exec("CREATE TABLE user_tags (user_id INTEGER REFERENCES users(id), tag_id INTEGER REFERENCES tags, "
         "PRIMARY KEY (user_id, tag_id))");

    auto graph = plugin_.get_graph(config_, "main");

    EXPECT_EQ(find_unit(graph, "user_tags"), nullptr);

    const GraphUnit* users = find_unit(graph, "users");
    ASSERT_NE(users, nullptr);
    EXPECT_EQ(users->relations, (std::vector<GraphUnitRelationship>{
                                    {"tags", RelationshipType::ManyToMany},
                                    {"orders", RelationshipType::OneToMany},
                                    {"profiles", RelationshipType::OneToOne}}));

    ASSERT_NE(find_unit(graph, "orders"), nullptr);
    EXPECT_EQ(find_unit(graph, "orders")->relations,
              (std::vector<GraphUnitRelationship>{{"users", RelationshipType::ManyToOne}}));
    EXPECT_EQ(find_unit(graph, "tags")->relations,
              (std::vector<GraphUnitRelationship>{{"users", RelationshipType::ManyToMany}}));
}

TEST_F(SqlitePluginTest, RawExecute) {
    RowsResult read = plugin_.raw_execute(config_, "SELECT name FROM users WHERE id > 1 ORDER BY id");
    EXPECT_TRUE(read.disable_update);
    ASSERT_EQ(read.columns.size(), 1u);
    EXPECT_EQ(read.columns[0].name, "name");
    EXPECT_EQ(read.rows, (std::vector<std::vector<std::string>>{{"Bob"}, {"Carol"}}));

    RowsResult write = plugin_.raw_execute(config_, "DELETE FROM users WHERE id = 1");
    EXPECT_TRUE(write.rows.empty());
    EXPECT_EQ(plugin_.get_rows(config_, "main", "users", nullptr, 10, 0).rows.size(), 2u);

    EXPECT_THROW(plugin_.raw_execute(config_, "SELEC nonsense"), DbError);
}

TEST_F(SqlitePluginTest, ChatRunsReadQueries) {
    ScriptedModel model("Here you go:\n```sql\nSELECT count(*) FROM users\n```\nDone.");

    auto messages = plugin_.chat(config_, "main", {}, "how many users?", model);

    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].type, "message");
    EXPECT_EQ(messages[1].type, "sql:get");
    ASSERT_TRUE(messages[1].result.has_value());
    EXPECT_EQ(messages[1].result->rows, (std::vector<std::vector<std::string>>{{"3"}}));
    EXPECT_NE(model.last_prompt.find("- users (id int, name text)"), std::string::npos);
}
