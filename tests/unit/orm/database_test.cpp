#include <gtest/gtest.h>

#include "quarry/database/memory_adapter.hpp"
#include "quarry/orm/database.hpp"
#include "quarry/schema/schema.hpp"

using namespace quarry::orm;
using quarry::db::BackendType;
using quarry::db::DatabaseConfig;
using quarry::db::DbValue;
using quarry::foundation::ConfigManager;
using quarry::foundation::ErrorCode;
using quarry::foundation::OrmError;

// ---------------------------------------------------------------------------
// Fixture: an open memory database with an accounts table
// ---------------------------------------------------------------------------

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        DatabaseConfig config;
        config.type = BackendType::Memory;
        auto opened = Database::open(config);
        ASSERT_TRUE(opened.hasValue());
        db_ = std::move(opened).value();

        auto created = db_->schema().create("accounts", [](quarry::schema::Blueprint& t) {
            t.increments("id");
            t.string("owner");
            t.integer("balance").defaultValue(std::int64_t{0});
        });
        ASSERT_TRUE(created.hasValue());
        ASSERT_TRUE(db_->table("accounts")
                        .insert({{"owner", std::string("ann")}, {"balance", std::int64_t{100}}})
                        .hasValue());
    }

    std::uint64_t accountCount() { return db_->table("accounts").count().value(); }

    std::unique_ptr<Database> db_;
};

TEST(DatabaseOpenTest, UnknownBackendFromConfig) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("database:\n  type: cassandra\n").hasValue());
    auto opened = Database::open(config);
    ASSERT_TRUE(opened.hasError());
    EXPECT_EQ(opened.error().code(), ErrorCode::UnknownBackend);
}

TEST(DatabaseOpenTest, OpenFromConfigManager) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("test:\n  type: memory\n").hasValue());
    auto opened = Database::open(config, "test");
    ASSERT_TRUE(opened.hasValue());
    EXPECT_EQ(opened.value()->backend(), BackendType::Memory);
    EXPECT_TRUE(opened.value()->adapter().isConnected());
    EXPECT_TRUE(opened.value()->macros().has("exec"));
}

TEST_F(DatabaseTest, TableBuilderTargetsAdapter) {
    auto builder = db_->table("accounts");
    EXPECT_EQ(builder.tableName(), "accounts");
    EXPECT_EQ(&builder.adapter(), &db_->adapter());
    EXPECT_EQ(accountCount(), 1u);
}

TEST_F(DatabaseTest, GuardRollsBackWhenDropped) {
    {
        auto txn = db_->beginTransaction();
        ASSERT_TRUE(txn.hasValue());
        EXPECT_TRUE(txn.value().isActive());
        ASSERT_TRUE(db_->table("accounts").insert({{"owner", std::string("bob")}}).hasValue());
        EXPECT_EQ(accountCount(), 2u);
    }
    EXPECT_EQ(accountCount(), 1u);
    EXPECT_EQ(db_->adapter().transactionDepth(), 0u);
}

TEST_F(DatabaseTest, GuardCommit) {
    auto txn = db_->beginTransaction();
    ASSERT_TRUE(txn.hasValue());
    ASSERT_TRUE(db_->table("accounts").insert({{"owner", std::string("bob")}}).hasValue());
    ASSERT_TRUE(txn.value().commit().hasValue());
    EXPECT_FALSE(txn.value().isActive());

    auto again = txn.value().commit();
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::TransactionFailed);
    EXPECT_EQ(accountCount(), 2u);
}

TEST_F(DatabaseTest, GuardMoveTransfersOwnership) {
    auto txn = db_->beginTransaction();
    ASSERT_TRUE(txn.hasValue());
    TransactionGuard moved = std::move(txn).value();
    EXPECT_TRUE(moved.isActive());
    ASSERT_TRUE(moved.rollback().hasValue());
    EXPECT_EQ(db_->adapter().transactionDepth(), 0u);
}

TEST_F(DatabaseTest, TransactionCommitsOnSuccess) {
    auto result = db_->transaction([](Database& db) {
        auto moved = db.table("accounts")
                         .where("owner", std::string("ann"))
                         .update({{"balance", std::int64_t{40}}});
        if (moved.hasError()) {
            return quarry::foundation::OrmResult<void>::err(std::move(moved).error());
        }
        auto inserted =
            db.table("accounts").insert({{"owner", std::string("bob")}, {"balance", std::int64_t{60}}});
        if (inserted.hasError()) {
            return quarry::foundation::OrmResult<void>::err(std::move(inserted).error());
        }
        return quarry::foundation::OrmResult<void>::ok();
    });

    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(db_->table("accounts").sum("balance").value(), DbValue(std::int64_t{100}));
}

TEST_F(DatabaseTest, TransactionRollsBackOnError) {
    auto result = db_->transaction([](Database& db) {
        auto inserted = db.table("accounts").insert({{"owner", std::string("bob")}});
        EXPECT_TRUE(inserted.hasValue());
        return quarry::foundation::OrmResult<void>::err(
            OrmError(ErrorCode::InvalidArgument, "insufficient funds"));
    });

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message(), "insufficient funds");
    EXPECT_EQ(accountCount(), 1u);
}

TEST_F(DatabaseTest, TransactionRollsBackOnException) {
    EXPECT_THROW(
        {
            auto ignored = db_->transaction([](Database& db) -> quarry::foundation::OrmResult<void> {
                auto inserted = db.table("accounts").insert({{"owner", std::string("bob")}});
                EXPECT_TRUE(inserted.hasValue());
                throw std::runtime_error("boom");
            });
            (void)ignored;
        },
        std::runtime_error);
    EXPECT_EQ(accountCount(), 1u);
}

TEST_F(DatabaseTest, RawUnsupportedOnMemory) {
    auto rows = db_->raw("SELECT 1");
    ASSERT_TRUE(rows.hasError());
    EXPECT_EQ(rows.error().code(), ErrorCode::UnsupportedOperation);
}

TEST_F(DatabaseTest, CloseDisconnects) {
    db_->close();
    EXPECT_FALSE(db_->adapter().isConnected());
    auto rows = db_->table("accounts").get();
    ASSERT_TRUE(rows.hasError());
    EXPECT_EQ(rows.error().code(), ErrorCode::NotConnected);
}
