#include <gtest/gtest.h>

#include "quarry/orm/database.hpp"
#include "quarry/schema/schema.hpp"
#include "quarry/validation/presence_verifier.hpp"

using namespace quarry::validation;
using quarry::db::BackendType;
using quarry::db::DatabaseConfig;
using quarry::db::DbNull;
using quarry::foundation::ErrorCode;
using quarry::orm::Database;

// ---------------------------------------------------------------------------
// Fixture: users with emails and an optional team
// ---------------------------------------------------------------------------

class PresenceVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        DatabaseConfig config;
        config.type = BackendType::Memory;
        auto opened = Database::open(config);
        ASSERT_TRUE(opened.hasValue());
        db_ = std::move(opened).value();

        ASSERT_TRUE(db_->schema()
                        .create("users",
                                [](quarry::schema::Blueprint& t) {
                                    t.increments("id");
                                    t.string("email");
                                    t.string("team").nullable();
                                    t.boolean("active").defaultValue(true);
                                })
                        .hasValue());
        insert("ann@example.com", std::string("red"), true);
        insert("bob@example.com", DbNull{}, true);
        insert("old@example.com", std::string("red"), false);
    }

    void insert(const std::string& email, DbValue team, bool active) {
        ASSERT_TRUE(db_->table("users")
                        .insert({{"email", email}, {"team", std::move(team)}, {"active", active}})
                        .hasValue());
    }

    std::unique_ptr<Database> db_;
};

TEST_F(PresenceVerifierTest, GetCount) {
    PresenceVerifier verifier(*db_);
    EXPECT_EQ(verifier.getCount("users", "team", std::string("red")).value(), 2u);
    EXPECT_EQ(verifier.getCount("users", "team", std::string("red"), std::int64_t{1}).value(), 1u);
    EXPECT_EQ(verifier
                  .getCount("users", "team", std::string("red"), std::nullopt, "id",
                            {{"active", true}})
                  .value(),
              1u);
}

TEST_F(PresenceVerifierTest, NullExtraMatchesNull) {
    PresenceVerifier verifier(*db_);
    EXPECT_EQ(verifier
                  .getCount("users", "active", true, std::nullopt, "id", {{"team", DbNull{}}})
                  .value(),
              1u);
}

TEST_F(PresenceVerifierTest, UniqueIgnoresOwnRow) {
    PresenceVerifier verifier(*db_);
    EXPECT_FALSE(verifier.isUnique("users", "email", std::string("ann@example.com")).value());
    EXPECT_TRUE(verifier
                    .isUnique("users", "email", std::string("ann@example.com"), std::int64_t{1})
                    .value());
    EXPECT_TRUE(verifier.isUnique("users", "email", std::string("new@example.com")).value());
}

TEST_F(PresenceVerifierTest, Exists) {
    PresenceVerifier verifier(*db_);
    EXPECT_TRUE(verifier.exists("users", "id", std::int64_t{2}).value());
    EXPECT_FALSE(verifier.exists("users", "id", std::int64_t{9}).value());
    EXPECT_FALSE(verifier
                     .exists("users", "email", std::string("old@example.com"), {{"active", true}})
                     .value());
}

TEST_F(PresenceVerifierTest, MultiCountAndExistsAll) {
    PresenceVerifier verifier(*db_);
    EXPECT_EQ(verifier.getMultiCount("users", "id", {std::int64_t{1}, std::int64_t{3}}).value(),
              2u);
    EXPECT_EQ(verifier.getMultiCount("users", "id", {}).value(), 0u);

    EXPECT_TRUE(verifier.existsAll("users", "id", {std::int64_t{1}, std::int64_t{2},
                                                   std::int64_t{1}})
                    .value());
    EXPECT_FALSE(verifier.existsAll("users", "id", {std::int64_t{1}, std::int64_t{4}}).value());
    EXPECT_FALSE(verifier.existsAll("users", "id", {DbNull{}}).value());
    EXPECT_TRUE(verifier.existsAll("users", "id", {}).value());
}

TEST_F(PresenceVerifierTest, MissingTableReportsError) {
    PresenceVerifier verifier(*db_);
    auto count = verifier.getCount("ghosts", "id", std::int64_t{1});
    ASSERT_TRUE(count.hasError());
    EXPECT_EQ(count.error().code(), ErrorCode::QueryFailed);
}
