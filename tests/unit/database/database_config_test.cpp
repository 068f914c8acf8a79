#include <gtest/gtest.h>

#include <string>

#include "quarry/database/database_config.hpp"
#include "quarry/foundation/config_manager.hpp"

using namespace quarry::db;
using quarry::foundation::ConfigManager;
using quarry::foundation::ErrorCode;

// --- Backend tags ---

TEST(DatabaseConfigTest, ParseBackendTypeAliases) {
    EXPECT_EQ(parseBackendType("mysql").value(), BackendType::MySQL);
    EXPECT_EQ(parseBackendType("MariaDB").value(), BackendType::MySQL);
    EXPECT_EQ(parseBackendType("postgresql").value(), BackendType::PostgreSQL);
    EXPECT_EQ(parseBackendType("pgsql").value(), BackendType::PostgreSQL);
    EXPECT_EQ(parseBackendType("mongo").value(), BackendType::MongoDB);
    EXPECT_EQ(parseBackendType("memory").value(), BackendType::Memory);
}

TEST(DatabaseConfigTest, ParseBackendTypeUnknown) {
    auto result = parseBackendType("oracle");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownBackend);
}

TEST(DatabaseConfigTest, FamilyAndDefaultPort) {
    EXPECT_EQ(backendFamily(BackendType::MongoDB), BackendFamily::Document);
    EXPECT_EQ(backendFamily(BackendType::MySQL), BackendFamily::Relational);
    EXPECT_EQ(defaultPort(BackendType::PostgreSQL), 5432);
    EXPECT_EQ(defaultPort(BackendType::MySQL), 3306);
    EXPECT_EQ(defaultPort(BackendType::MongoDB), 27017);
    EXPECT_EQ(backendName(BackendType::PostgreSQL), "postgres");
}

// --- Validation ---

TEST(DatabaseConfigTest, ValidateRequiresDatabaseName) {
    DatabaseConfig config;
    config.type = BackendType::MySQL;
    auto result = validateConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidConfiguration);

    config.database = "shop";
    EXPECT_TRUE(validateConfig(config).hasValue());
}

TEST(DatabaseConfigTest, ValidateMemoryNeedsNoDatabase) {
    DatabaseConfig config;
    config.type = BackendType::Memory;
    EXPECT_TRUE(validateConfig(config).hasValue());
}

TEST(DatabaseConfigTest, ValidatePoolBounds) {
    DatabaseConfig config;
    config.database = "shop";
    config.pool.min = 5;
    config.pool.max = 2;
    EXPECT_TRUE(validateConfig(config).hasError());

    config.pool.min = 0;
    config.pool.max = 0;
    EXPECT_TRUE(validateConfig(config).hasError());
}

TEST(DatabaseConfigTest, ValidateUrlMatchesBackend) {
    DatabaseConfig config;
    config.type = BackendType::MongoDB;
    config.url = "postgres://localhost/app";
    EXPECT_TRUE(validateConfig(config).hasError());

    config.url = "mongodb+srv://cluster0.example.net/app";
    EXPECT_TRUE(validateConfig(config).hasValue());

    config.type = BackendType::PostgreSQL;
    EXPECT_TRUE(validateConfig(config).hasError());
}

// --- Connection strings ---

TEST(DatabaseConfigTest, PostgresConnectionString) {
    DatabaseConfig config;
    config.type = BackendType::PostgreSQL;
    config.host = "db.internal";
    config.database = "app";
    config.username = "svc";
    config.password = "secret";
    config.ssl = true;

    EXPECT_EQ(buildConnectionString(config),
              "host=db.internal port=5432 dbname=app user=svc password=secret "
              "connect_timeout=30 sslmode=require");
}

TEST(DatabaseConfigTest, MysqlConnectionStringUsesExplicitPort) {
    DatabaseConfig config;
    config.type = BackendType::MySQL;
    config.port = 3307;
    config.database = "shop";
    config.username = "root";

    EXPECT_EQ(buildConnectionString(config),
              "host=127.0.0.1 port=3307 database=shop user=root");
}

TEST(DatabaseConfigTest, MongoConnectionString) {
    DatabaseConfig config;
    config.type = BackendType::MongoDB;
    config.host = "mongo";
    config.database = "blog";
    config.username = "app";
    config.password = "pw";

    EXPECT_EQ(buildConnectionString(config), "mongodb://app:pw@mongo:27017/blog");
}

TEST(DatabaseConfigTest, UrlOverridesFields) {
    DatabaseConfig config;
    config.type = BackendType::MongoDB;
    config.url = "mongodb://replica/app";
    config.host = "ignored";
    EXPECT_EQ(buildConnectionString(config), "mongodb://replica/app");
}

// --- Loading from configuration ---

TEST(DatabaseConfigTest, LoadFromConfigManager) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadString(R"(
database:
  type: postgres
  host: pg.local
  port: 6432
  database: app
  username: svc
  pool:
    min: 2
    max: 16
  timeout: 5
)").hasValue());

    auto result = loadDatabaseConfig(manager);
    ASSERT_TRUE(result.hasValue()) << result.error().describe();
    const auto& config = result.value();
    EXPECT_EQ(config.type, BackendType::PostgreSQL);
    EXPECT_EQ(config.host, "pg.local");
    EXPECT_EQ(config.port, 6432);
    EXPECT_EQ(config.database, "app");
    EXPECT_EQ(config.pool.min, 2u);
    EXPECT_EQ(config.pool.max, 16u);
    EXPECT_EQ(config.connectionTimeout.count(), 5);
    EXPECT_FALSE(config.ssl);
}

TEST(DatabaseConfigTest, LoadWithCustomPrefixAndDefaults) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadString("connections:\n  test:\n    type: memory\n").hasValue());

    auto result = loadDatabaseConfig(manager, "connections.test");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().type, BackendType::Memory);
    EXPECT_EQ(result.value().host, "127.0.0.1");
    EXPECT_EQ(result.value().pool.max, 10u);
}

TEST(DatabaseConfigTest, LoadRejectsMissingType) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadString("database:\n  host: x\n").hasValue());
    auto result = loadDatabaseConfig(manager);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST(DatabaseConfigTest, LoadRejectsUnknownType) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadString("database:\n  type: sqlite\n").hasValue());
    auto result = loadDatabaseConfig(manager);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownBackend);
}

TEST(DatabaseConfigTest, LoadRejectsBadPortType) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadString("database:\n  type: mysql\n  database: x\n  port: high\n").hasValue());
    auto result = loadDatabaseConfig(manager);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}
