#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "quarry/foundation/config_manager.hpp"
#include "quarry/orm/database.hpp"
#include "quarry/schema/migration_runner.hpp"
#include "quarry/schema/schema.hpp"

using namespace quarry::schema;
using quarry::db::BackendType;
using quarry::db::DatabaseConfig;
using quarry::foundation::ConfigManager;
using quarry::foundation::ErrorCode;
using quarry::foundation::OrmError;
using quarry::orm::Database;

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::unique_ptr<Migration> createTable(std::string table, std::vector<std::string>* log = nullptr) {
    return std::make_unique<CallbackMigration>(
        [table, log](Database& db) {
            if (log) {
                log->push_back("up " + table);
            }
            return db.schema().create(table, [](Blueprint& t) {
                t.increments("id");
                t.string("name").nullable();
            });
        },
        [table, log](Database& db) {
            if (log) {
                log->push_back("down " + table);
            }
            return db.schema().dropIfExists(table);
        });
}

std::unique_ptr<Migration> failing() {
    return std::make_unique<CallbackMigration>(
        [](Database&) {
            return OrmResult<void>::err(OrmError(ErrorCode::QueryFailed, "syntax error"));
        },
        [](Database&) { return OrmResult<void>::ok(); });
}

} // namespace

// ---------------------------------------------------------------------------
// Naming and statement splitting
// ---------------------------------------------------------------------------

TEST(MigrationNameTest, Validation) {
    EXPECT_TRUE(isValidMigrationName("20240101000000_create_users"));
    EXPECT_TRUE(isValidMigrationName("20240101000000_v2"));
    EXPECT_FALSE(isValidMigrationName("create_users"));
    EXPECT_FALSE(isValidMigrationName("2024010100000_create_users"));
    EXPECT_FALSE(isValidMigrationName("20240101000000_"));
    EXPECT_FALSE(isValidMigrationName("20240101000000-create_users"));
    EXPECT_FALSE(isValidMigrationName("20240101000000_create-users"));
}

TEST(SplitStatementsTest, RespectsQuotesAndComments) {
    auto statements = splitStatements(
        "CREATE TABLE a (x TEXT);\n"
        "-- comment; with a semicolon\n"
        "INSERT INTO a VALUES ('x;y');\n"
        "/* block; comment */ INSERT INTO a VALUES ('it''s');\n"
        "  ;  \n");
    ASSERT_EQ(statements.size(), 3u);
    EXPECT_EQ(trim(statements[0]), "CREATE TABLE a (x TEXT)");
    EXPECT_EQ(trim(statements[1]), "INSERT INTO a VALUES ('x;y')");
    EXPECT_EQ(trim(statements[2]), "INSERT INTO a VALUES ('it''s')");
}

TEST(SplitStatementsTest, TrailingStatementWithoutSemicolon) {
    auto statements = splitStatements("DROP TABLE a");
    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0], "DROP TABLE a");
    EXPECT_TRUE(splitStatements("  \n -- only a comment\n").empty());
}

TEST(MigratorConfigTest, LoadsFromYaml) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("migrations:\n  table: schema_log\n  directory: db/m\n").hasValue());
    auto loaded = MigratorConfig::load(config);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value().table, "schema_log");
    EXPECT_EQ(loaded.value().directory, std::filesystem::path("db/m"));

    ConfigManager empty;
    auto defaults = MigratorConfig::load(empty);
    ASSERT_TRUE(defaults.hasValue());
    EXPECT_EQ(defaults.value().table, "migrations");
}

// ---------------------------------------------------------------------------
// Runner against the memory backend
// ---------------------------------------------------------------------------

class MigrationRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        DatabaseConfig config;
        config.type = BackendType::Memory;
        auto opened = Database::open(config);
        ASSERT_TRUE(opened.hasValue());
        db_ = std::move(opened).value();
    }

    bool hasTable(const std::string& table) { return db_->schema().hasTable(table).value(); }

    std::unique_ptr<Database> db_;
    std::vector<std::string> log_;
};

TEST_F(MigrationRunnerTest, AddRejectsBadNames) {
    MigrationRunner runner(*db_);
    auto bad = runner.add("create_users", createTable("users"));
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidMigrationName);

    ASSERT_TRUE(runner.add("20240101000000_create_users", createTable("users")).hasValue());
    auto duplicate = runner.add("20240101000000_create_users", createTable("users"));
    ASSERT_TRUE(duplicate.hasError());
    EXPECT_EQ(duplicate.error().code(), ErrorCode::AlreadyExists);
}

TEST_F(MigrationRunnerTest, MigrateRunsInNameOrder) {
    MigrationRunner runner(*db_);
    ASSERT_TRUE(runner.add("20240102000000_create_posts", createTable("posts", &log_)).hasValue());
    ASSERT_TRUE(runner.add("20240101000000_create_users", createTable("users", &log_)).hasValue());

    auto ran = runner.migrate();
    ASSERT_TRUE(ran.hasValue());
    EXPECT_EQ(ran.value(), (std::vector<std::string>{"20240101000000_create_users",
                                                     "20240102000000_create_posts"}));
    EXPECT_EQ(log_, (std::vector<std::string>{"up users", "up posts"}));
    EXPECT_TRUE(hasTable("users"));
    EXPECT_TRUE(hasTable("posts"));
    EXPECT_TRUE(hasTable("migrations"));

    auto again = runner.migrate();
    ASSERT_TRUE(again.hasValue());
    EXPECT_TRUE(again.value().empty());
}

TEST_F(MigrationRunnerTest, BatchesAndRollback) {
    MigrationRunner runner(*db_);
    ASSERT_TRUE(runner.add("20240101000000_create_users", createTable("users", &log_)).hasValue());
    ASSERT_TRUE(runner.migrate().hasValue());
    auto tablesAfterFirst = db_->schema().listTables().value();

    ASSERT_TRUE(runner.add("20240102000000_create_posts", createTable("posts", &log_)).hasValue());
    ASSERT_TRUE(runner.add("20240103000000_create_tags", createTable("tags", &log_)).hasValue());
    ASSERT_TRUE(runner.migrate().hasValue());

    auto status = runner.status();
    ASSERT_TRUE(status.hasValue());
    ASSERT_EQ(status.value().size(), 3u);
    EXPECT_EQ(status.value()[0].batch, 1);
    EXPECT_EQ(status.value()[1].batch, 2);
    EXPECT_EQ(status.value()[2].batch, 2);

    log_.clear();
    auto reverted = runner.rollback();
    ASSERT_TRUE(reverted.hasValue());
    EXPECT_EQ(reverted.value(), (std::vector<std::string>{"20240103000000_create_tags",
                                                          "20240102000000_create_posts"}));
    EXPECT_EQ(log_, (std::vector<std::string>{"down tags", "down posts"}));
    EXPECT_EQ(db_->schema().listTables().value(), tablesAfterFirst);

    status = runner.status();
    ASSERT_TRUE(status.hasValue());
    EXPECT_TRUE(status.value()[0].ran);
    EXPECT_FALSE(status.value()[1].ran);
    EXPECT_FALSE(status.value()[1].batch.has_value());
}

TEST_F(MigrationRunnerTest, FailureStopsTheBatch) {
    MigrationRunner runner(*db_);
    ASSERT_TRUE(runner.add("20240101000000_create_users", createTable("users")).hasValue());
    ASSERT_TRUE(runner.add("20240102000000_broken", failing()).hasValue());
    ASSERT_TRUE(runner.add("20240103000000_create_tags", createTable("tags")).hasValue());

    auto ran = runner.migrate();
    ASSERT_TRUE(ran.hasError());
    EXPECT_EQ(ran.error().code(), ErrorCode::QueryFailed);
    EXPECT_EQ(ran.error().message(), "syntax error");
    EXPECT_TRUE(hasTable("users"));
    EXPECT_FALSE(hasTable("tags"));

    auto status = runner.status();
    ASSERT_TRUE(status.hasValue());
    EXPECT_TRUE(status.value()[0].ran);
    EXPECT_FALSE(status.value()[1].ran);
    EXPECT_FALSE(status.value()[2].ran);
}

TEST_F(MigrationRunnerTest, ResetAndFresh) {
    MigrationRunner runner(*db_);
    ASSERT_TRUE(runner.add("20240101000000_create_users", createTable("users", &log_)).hasValue());
    ASSERT_TRUE(runner.migrate().hasValue());
    ASSERT_TRUE(runner.add("20240102000000_create_posts", createTable("posts", &log_)).hasValue());
    ASSERT_TRUE(runner.migrate().hasValue());

    log_.clear();
    auto reverted = runner.reset();
    ASSERT_TRUE(reverted.hasValue());
    EXPECT_EQ(log_, (std::vector<std::string>{"down posts", "down users"}));
    EXPECT_FALSE(hasTable("users"));

    ASSERT_TRUE(db_->schema().create("stray", [](Blueprint& t) { t.increments("id"); }).hasValue());
    auto fresh = runner.fresh();
    ASSERT_TRUE(fresh.hasValue());
    EXPECT_EQ(fresh.value().size(), 2u);
    EXPECT_FALSE(hasTable("stray"));
    EXPECT_TRUE(hasTable("posts"));
}

TEST_F(MigrationRunnerTest, StatusListsRecordedButUnregistered) {
    {
        MigrationRunner first(*db_);
        ASSERT_TRUE(first.add("20240101000000_create_users", createTable("users")).hasValue());
        ASSERT_TRUE(first.migrate().hasValue());
    }
    MigrationRunner second(*db_);
    auto status = second.status();
    ASSERT_TRUE(status.hasValue());
    ASSERT_EQ(status.value().size(), 1u);
    EXPECT_TRUE(status.value()[0].ran);

    auto reverted = second.rollback();
    ASSERT_TRUE(reverted.hasError());
    EXPECT_EQ(reverted.error().code(), ErrorCode::MigrationNotFound);
}

TEST_F(MigrationRunnerTest, RollbackWithUnregisteredMemberLeavesBatchIntact) {
    {
        MigrationRunner first(*db_);
        ASSERT_TRUE(first.add("20240101000000_create_a", createTable("a")).hasValue());
        ASSERT_TRUE(first.add("20240101000001_create_b", createTable("b")).hasValue());
        ASSERT_TRUE(first.migrate().hasValue());
    }
    MigrationRunner second(*db_);
    ASSERT_TRUE(second.add("20240101000001_create_b", createTable("b", &log_)).hasValue());
    auto before = second.status();
    ASSERT_TRUE(before.hasValue());

    auto reverted = second.rollback();
    ASSERT_TRUE(reverted.hasError());
    EXPECT_EQ(reverted.error().code(), ErrorCode::MigrationNotFound);
    EXPECT_TRUE(log_.empty());
    EXPECT_TRUE(hasTable("a"));
    EXPECT_TRUE(hasTable("b"));

    auto after = second.status();
    ASSERT_TRUE(after.hasValue());
    ASSERT_EQ(after.value().size(), before.value().size());
    for (std::size_t i = 0; i < after.value().size(); ++i) {
        EXPECT_EQ(after.value()[i].name, before.value()[i].name);
        EXPECT_EQ(after.value()[i].ran, before.value()[i].ran);
        EXPECT_EQ(after.value()[i].batch, before.value()[i].batch);
    }
}

TEST_F(MigrationRunnerTest, MigrateThenRollbackRestoresSchemaExceptRepository) {
    ASSERT_TRUE(db_->schema().create("existing", [](Blueprint& t) { t.increments("id"); }).hasValue());
    auto snapshot = db_->schema().listTables().value();

    MigrationRunner runner(*db_);
    ASSERT_TRUE(runner.add("20240101000000_create_users", createTable("users")).hasValue());
    ASSERT_TRUE(runner.add("20240102000000_create_posts", createTable("posts")).hasValue());
    ASSERT_TRUE(runner.migrate().hasValue());
    ASSERT_TRUE(runner.rollback().hasValue());

    auto tables = db_->schema().listTables().value();
    tables.erase(std::remove(tables.begin(), tables.end(), "migrations"), tables.end());
    EXPECT_EQ(tables, snapshot);
    EXPECT_EQ(db_->table("migrations").count().value(), 0u);
}

TEST_F(MigrationRunnerTest, CustomRepositoryTable) {
    MigratorConfig config;
    config.table = "schema_log";
    MigrationRunner runner(*db_, config);
    ASSERT_TRUE(runner.add("20240101000000_create_users", createTable("users")).hasValue());
    ASSERT_TRUE(runner.migrate().hasValue());
    EXPECT_TRUE(hasTable("schema_log"));
    EXPECT_FALSE(hasTable("migrations"));
    EXPECT_EQ(db_->table("schema_log").count().value(), 1u);
}

// ---------------------------------------------------------------------------
// Discovery of SQL file pairs
// ---------------------------------------------------------------------------

class MigrationDiscoveryTest : public MigrationRunnerTest {
protected:
    void SetUp() override {
        MigrationRunnerTest::SetUp();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("quarry_migrations_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void write(const std::string& file, const std::string& content) {
        std::ofstream out(dir_ / file);
        out << content;
    }

    MigratorConfig config() const {
        MigratorConfig c;
        c.directory = dir_;
        return c;
    }

    std::filesystem::path dir_;
};

TEST_F(MigrationDiscoveryTest, RegistersUpDownPairs) {
    write("20240102000000_create_posts.up.sql", "CREATE TABLE posts (id INT);");
    write("20240102000000_create_posts.down.sql", "DROP TABLE posts;");
    write("20240101000000_create_users.up.sql", "CREATE TABLE users (id INT);");
    write("20240101000000_create_users.down.sql", "DROP TABLE users;");
    write("README.md", "not a migration");

    MigrationRunner runner(*db_, config());
    auto found = runner.discover();
    ASSERT_TRUE(found.hasValue());
    EXPECT_EQ(found.value(), 2u);
    EXPECT_EQ(runner.names(), (std::vector<std::string>{"20240101000000_create_users",
                                                        "20240102000000_create_posts"}));

    // Already registered pairs are skipped.
    EXPECT_EQ(runner.discover().value(), 0u);

    // The memory backend has no raw SQL, so file migrations fail cleanly.
    auto ran = runner.migrate();
    ASSERT_TRUE(ran.hasError());
    EXPECT_EQ(ran.error().code(), ErrorCode::UnsupportedOperation);
}

TEST_F(MigrationDiscoveryTest, MissingDownFile) {
    write("20240101000000_create_users.up.sql", "CREATE TABLE users (id INT);");
    MigrationRunner runner(*db_, config());
    auto found = runner.discover();
    ASSERT_TRUE(found.hasError());
    EXPECT_EQ(found.error().code(), ErrorCode::MigrationNotFound);
}

TEST_F(MigrationDiscoveryTest, InvalidFileName) {
    write("create_users.up.sql", "CREATE TABLE users (id INT);");
    write("create_users.down.sql", "DROP TABLE users;");
    MigrationRunner runner(*db_, config());
    auto found = runner.discover();
    ASSERT_TRUE(found.hasError());
    EXPECT_EQ(found.error().code(), ErrorCode::InvalidMigrationName);
}

TEST_F(MigrationDiscoveryTest, MissingDirectory) {
    MigratorConfig c;
    c.directory = dir_ / "absent";
    MigrationRunner runner(*db_, c);
    auto found = runner.discover();
    ASSERT_TRUE(found.hasError());
    EXPECT_EQ(found.error().code(), ErrorCode::MigrationNotFound);
}
