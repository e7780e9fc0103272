/**
 * @file test_plugin_registry.cpp
 * @brief Registry lookup rules and the connection scope error mapping
 */

#include <gtest/gtest.h>
#include <core/connection_scope.hpp>
#include <core/plugin_registry.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace Omnidb;

namespace {

class FakePlugin : public Plugin {
public:
    explicit FakePlugin(DatabaseType type) : Plugin(type) {}

    bool is_available(const PluginConfig&) override { return true; }
    std::vector<std::string> get_databases(const PluginConfig&) override { return {"main"}; }
    std::vector<std::string> get_all_schemas(const PluginConfig&) override { return {}; }
    std::vector<StorageUnit> get_storage_units(const PluginConfig&, const std::string&) override { return {}; }
    std::vector<Column> get_columns(const PluginConfig&, const std::string&, const std::string&) override {
        return {};
    }
    RowsResult get_rows(const PluginConfig&, const std::string&, const std::string&,
                        const WhereCondition*, std::size_t page_size, std::size_t) override {
        check_page_size(page_size, "get_rows");
        return {};
    }
    bool add_storage_unit(const PluginConfig&, const std::string&, const std::string&,
                          const std::vector<Record>&) override {
        return true;
    }
    bool update_storage_unit(const PluginConfig&, const std::string&, const std::string&,
                             const std::vector<Record>&, const std::vector<std::string>&) override {
        return true;
    }
    bool add_row(const PluginConfig&, const std::string&, const std::string&, const std::vector<Record>&) override {
        return true;
    }
    bool delete_row(const PluginConfig&, const std::string&, const std::string&, const std::vector<Record>&) override {
        return true;
    }
    std::vector<std::string> supported_operators() const override { return {"="}; }
};

struct FakeConnection {
    explicit FakeConnection(bool* flag) : closed(flag) {}
    ~FakeConnection() { *closed = true; }
    bool* closed;
};

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const DbError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected DbError";
    return ErrorKind::Unavailable;
}

} // namespace

TEST(PluginRegistryTest, ChooseByTypeAndIdentifier) {
    PluginRegistry registry;
    registry.add(std::make_unique<FakePlugin>(DatabaseType::Postgres));
    registry.add(DatabaseType::MariaDB, std::make_unique<FakePlugin>(DatabaseType::MySQL));
    registry.finalize();

    EXPECT_EQ(registry.choose(DatabaseType::Postgres).type(), DatabaseType::Postgres);
    EXPECT_EQ(registry.choose("mariadb").type(), DatabaseType::MySQL);
    EXPECT_TRUE(registry.supports(DatabaseType::MariaDB));
    EXPECT_FALSE(registry.supports(DatabaseType::Redis));
    EXPECT_EQ(registry.types(), (std::vector<DatabaseType>{DatabaseType::Postgres, DatabaseType::MariaDB}));
}

TEST(PluginRegistryTest, RejectsDuplicatesLateAddsAndNull) {
    PluginRegistry registry;
    registry.add(std::make_unique<FakePlugin>(DatabaseType::Sqlite3));
    EXPECT_THROW(registry.add(std::make_unique<FakePlugin>(DatabaseType::Sqlite3)), std::logic_error);
    EXPECT_THROW(registry.add(nullptr), std::invalid_argument);

    registry.finalize();
    EXPECT_THROW(registry.add(std::make_unique<FakePlugin>(DatabaseType::Redis)), std::logic_error);
}

TEST(PluginRegistryTest, UnknownOrUnregisteredTypeIsUnsupportedType) {
    PluginRegistry registry;
    registry.add(std::make_unique<FakePlugin>(DatabaseType::Postgres));

    EXPECT_EQ(kind_of([&] { registry.choose(DatabaseType::Postgres); }), ErrorKind::UnsupportedType);

    registry.finalize();
    EXPECT_EQ(kind_of([&] { registry.choose(DatabaseType::MongoDB); }), ErrorKind::UnsupportedType);
    EXPECT_EQ(kind_of([&] { registry.choose("Oracle"); }), ErrorKind::UnsupportedType);
}

TEST(PluginTest, OptionalOperationsAreUnsupported) {
    FakePlugin plugin(DatabaseType::Redis);
    PluginConfig config;

    EXPECT_EQ(kind_of([&] { plugin.get_graph(config, ""); }), ErrorKind::UnsupportedOperation);
    EXPECT_EQ(kind_of([&] { plugin.raw_execute(config, "INFO"); }), ErrorKind::UnsupportedOperation);
    EXPECT_EQ(kind_of([&] { plugin.get_rows(config, "", "k", nullptr, 0, 0); }), ErrorKind::MalformedInput);
}

TEST(ConnectionScopeTest, ReleasesConnectionOnSuccessAndFailure) {
    PluginConfig config;
    bool closed = false;
    auto connector = [&](const PluginConfig&) { return std::make_unique<FakeConnection>(&closed); };

    EXPECT_FALSE(closed);
    int value = with_connection(config, "Fake", "op", connector, [](FakeConnection&) { return 42; });
    EXPECT_EQ(value, 42);
    EXPECT_TRUE(closed);

    closed = false;
    EXPECT_EQ(kind_of([&] {
                  with_connection(config, "Fake", "op", connector,
                                  [](FakeConnection&) -> int { throw std::runtime_error("boom"); });
              }),
              ErrorKind::ExecutionFailure);
    EXPECT_TRUE(closed);
}

TEST(ConnectionScopeTest, MapsConnectorAndDriverFailures) {
    PluginConfig config;
    bool closed = false;
    auto failing = [](const PluginConfig&) -> std::unique_ptr<FakeConnection> {
        throw ConnectionError("refused");
    };
    auto working = [&](const PluginConfig&) { return std::make_unique<FakeConnection>(&closed); };

    EXPECT_EQ(kind_of([&] { with_connection(config, "Fake", "op", failing, [](FakeConnection&) { return 0; }); }),
              ErrorKind::Unavailable);
    EXPECT_EQ(kind_of([&] {
                  with_connection(config, "Fake", "op", working,
                                  [](FakeConnection&) -> int { throw ConnectionError("reset"); });
              }),
              ErrorKind::Unavailable);
}

TEST(ConnectionScopeTest, FillsEngineAndOperationIntoDbErrors) {
    PluginConfig config;
    bool closed = false;
    auto connector = [&](const PluginConfig&) { return std::make_unique<FakeConnection>(&closed); };

    try {
        with_connection(config, "Fake", "get_rows", connector,
                        [](FakeConnection&) -> int { throw malformed_filter("unknown column 'x'"); });
        FAIL() << "expected DbError";
    } catch (const DbError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedFilter);
        EXPECT_EQ(e.engine(), "Fake");
        EXPECT_EQ(e.operation(), "get_rows");
    }
}

TEST(ConnectionScopeTest, CancelledOrExpiredCallsAreUnavailable) {
    bool closed = false;
    auto connector = [&](const PluginConfig&) { return std::make_unique<FakeConnection>(&closed); };

    CancellationToken token;
    token.cancel();
    PluginConfig cancelled(Credentials{}, CallContext(std::chrono::milliseconds(0), token));
    EXPECT_EQ(kind_of([&] { with_connection(cancelled, "Fake", "op", connector, [](FakeConnection&) { return 0; }); }),
              ErrorKind::Unavailable);

    PluginConfig short_deadline(Credentials{}, CallContext(std::chrono::milliseconds(1)));
    auto slow = [&](const PluginConfig&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return std::make_unique<FakeConnection>(&closed);
    };
    EXPECT_EQ(kind_of([&] { with_connection(short_deadline, "Fake", "op", slow, [](FakeConnection&) { return 0; }); }),
              ErrorKind::Unavailable);
}

TEST(CallContextTest, ArmingFixesTheDeadline) {
    CallContext unbounded;
    EXPECT_FALSE(unbounded.armed().deadline().has_value());
    EXPECT_EQ(unbounded.remaining_ms(), 0);

    CallContext bounded(std::chrono::milliseconds(5000));
    CallContext armed = bounded.armed();
    ASSERT_TRUE(armed.deadline().has_value());
    EXPECT_GT(armed.remaining_ms(), 0);
    EXPECT_LE(armed.remaining_ms(), 5000);
    EXPECT_FALSE(armed.should_stop());
}
