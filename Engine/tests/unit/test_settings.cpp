/**
 * @file test_settings.cpp
 * @brief Environment-driven engine settings
 */

#include <gtest/gtest.h>
#include <config/settings.hpp>
#include <core/errors.hpp>
#include <core/types.hpp>
#include <plugins/postgres_plugin.hpp>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

using namespace Omnidb;

namespace {

const char* const kVariables[] = {
    "OMNIDB_LOG_LEVEL", "OMNIDB_TIMEOUT_MS", "OMNIDB_REDIS_SCAN_LIMIT",
    "OMNIDB_ES_MAX_RESULT_WINDOW", "OMNIDB_MONGO_SAMPLE_SIZE",
    "OMNIDB_HOST", "OMNIDB_PORT", "OMNIDB_USER", "OMNIDB_PASSWORD", "OMNIDB_DATABASE",
};

} // namespace

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kVariables) unsetenv(name);
    }
};

TEST_F(SettingsTest, DefaultsWhenUnset) {
    EngineSettings settings = EngineSettings::load_from_env();
    EXPECT_EQ(settings.log_level, Logger::Level::Info);
    EXPECT_EQ(settings.default_timeout.count(), 30000);
    EXPECT_EQ(settings.redis_scan_limit, 10000u);
    EXPECT_EQ(settings.es_max_result_window, 10000u);
    EXPECT_EQ(settings.mongo_sample_size, 1u);
}

TEST_F(SettingsTest, ReadsOverrides) {
    setenv("OMNIDB_LOG_LEVEL", "debug", 1);
    setenv("OMNIDB_TIMEOUT_MS", "0", 1);
    setenv("OMNIDB_REDIS_SCAN_LIMIT", "250", 1);
    setenv("OMNIDB_MONGO_SAMPLE_SIZE", "5", 1);

    EngineSettings settings = EngineSettings::load_from_env();
    EXPECT_EQ(settings.log_level, Logger::Level::Debug);
    EXPECT_EQ(settings.default_timeout.count(), 0);
    EXPECT_EQ(settings.redis_scan_limit, 250u);
    EXPECT_EQ(settings.mongo_sample_size, 5u);
}

TEST_F(SettingsTest, RejectsMalformedNumbers) {
    setenv("OMNIDB_TIMEOUT_MS", "soon", 1);
    EXPECT_THROW(EngineSettings::load_from_env(), std::invalid_argument);

    setenv("OMNIDB_TIMEOUT_MS", "-5", 1);
    EXPECT_THROW(EngineSettings::load_from_env(), std::invalid_argument);

    unsetenv("OMNIDB_TIMEOUT_MS");
    setenv("OMNIDB_REDIS_SCAN_LIMIT", "0", 1);
    EXPECT_THROW(EngineSettings::load_from_env(), std::invalid_argument);
}

TEST_F(SettingsTest, CredentialsFromEnvironment) {
    Credentials defaults = Credentials::from_env(DatabaseType::Redis);
    EXPECT_EQ(defaults.type, DatabaseType::Redis);
    EXPECT_EQ(defaults.hostname, "localhost");
    EXPECT_TRUE(defaults.port.empty());

    setenv("OMNIDB_HOST", "db.internal", 1);
    setenv("OMNIDB_PORT", "5433", 1);
    setenv("OMNIDB_USER", "app", 1);
    setenv("OMNIDB_DATABASE", "shop", 1);

    Credentials creds = Credentials::from_env(DatabaseType::Postgres);
    EXPECT_EQ(creds.hostname, "db.internal");
    EXPECT_EQ(creds.port, "5433");
    EXPECT_EQ(creds.username, "app");
    EXPECT_EQ(creds.database, "shop");
}

TEST(DatabaseTypeTest, ParsesIdentifiersCaseInsensitively) {
    EXPECT_EQ(parse_database_type("postgres"), DatabaseType::Postgres);
    EXPECT_EQ(parse_database_type("SQLITE3"), DatabaseType::Sqlite3);
    EXPECT_EQ(parse_database_type("ElasticSearch"), DatabaseType::ElasticSearch);
    EXPECT_FALSE(parse_database_type("Oracle").has_value());
    EXPECT_STREQ(to_string(DatabaseType::ClickHouse), "ClickHouse");
}

TEST(CredentialsTest, PortNumberValidatesRange) {
    Credentials creds;
    EXPECT_EQ(creds.port_number(3306), 3306);

    creds.port = "13306";
    EXPECT_EQ(creds.port_number(3306), 13306);

    for (const char* bad : {"abc", "0", "-1", "65536", "70000", "33o6"}) {
        creds.port = bad;
        EXPECT_THROW(creds.port_number(3306), ConnectionError) << bad;
    }
}

TEST(CredentialsTest, InvalidPortIsUnavailableBeforeConnecting) {
    Credentials creds;
    creds.type = DatabaseType::Postgres;
    creds.hostname = "localhost";
    creds.port = "70000";
    PluginConfig config(creds, CallContext(std::chrono::milliseconds(1000)));

    PostgresPlugin plugin;
    EXPECT_FALSE(plugin.is_available(config));
    try {
        plugin.get_databases(config);
        FAIL() << "expected DbError";
    } catch (const DbError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Unavailable);
        EXPECT_NE(std::string(e.what()).find("invalid port"), std::string::npos);
    }
}
