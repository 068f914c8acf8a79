#include <gtest/gtest.h>

#include "quarry/database/memory_adapter.hpp"
#include "quarry/orm/model.hpp"
#include "quarry/schema/schema.hpp"

using namespace quarry::orm;
using quarry::db::BackendType;
using quarry::db::DatabaseConfig;
using quarry::db::DbNull;
using quarry::foundation::ErrorCode;

namespace {

class Member : public Model<Member> {
public:
    static ModelMeta describe() {
        ModelMeta m;
        m.table = "members";
        m.fillable = {"name", "email", "is_admin", "settings", "age"};
        m.hidden = {"password"};
        m.casts = {{"is_admin", CastType::Boolean},
                   {"settings", CastType::Json},
                   {"age", CastType::Integer}};
        return m;
    }
};

class Tag : public Model<Tag> {
public:
    static ModelMeta describe() {
        ModelMeta m;
        m.table = "tags";
        m.primaryKey = "slug";
        m.fillable = {"slug", "label"};
        m.timestamps = false;
        return m;
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Fixture: memory database with members and tags tables
// ---------------------------------------------------------------------------

class ModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        DatabaseConfig config;
        config.type = BackendType::Memory;
        auto opened = Database::open(config);
        ASSERT_TRUE(opened.hasValue());
        db_ = std::move(opened).value();

        auto schema = db_->schema();
        ASSERT_TRUE(schema
                        .create("members",
                                [](quarry::schema::Blueprint& t) {
                                    t.increments("id");
                                    t.string("name");
                                    t.string("email").unique();
                                    t.string("password").nullable();
                                    t.boolean("is_admin").defaultValue(false);
                                    t.json("settings").nullable();
                                    t.integer("age").nullable();
                                    t.timestamps();
                                })
                        .hasValue());
        ASSERT_TRUE(schema
                        .create("tags",
                                [](quarry::schema::Blueprint& t) {
                                    t.string("slug").primary();
                                    t.string("label");
                                })
                        .hasValue());
    }

    OrmResult<Member> createMember(const std::string& name, const std::string& email) {
        return Member::create(*db_, {{"name", name}, {"email", email}});
    }

    quarry::db::MemoryAdapter& memory() {
        return static_cast<quarry::db::MemoryAdapter&>(db_->adapter());
    }

    std::unique_ptr<Database> db_;
};

// --- Create / find ---

TEST_F(ModelTest, CreateAssignsKeyAndTimestamps) {
    auto member = createMember("Ada", "ada@example.com");
    ASSERT_TRUE(member.hasValue());
    EXPECT_TRUE(member.value().exists());
    EXPECT_EQ(member.value().get<std::int64_t>("id"), 1);
    EXPECT_FALSE(quarry::db::isNull(member.value().getAttribute("created_at")));
    EXPECT_FALSE(quarry::db::isNull(member.value().getAttribute("updated_at")));
    EXPECT_FALSE(member.value().isDirty());
    EXPECT_EQ(member.value().get<bool>("is_admin"), false);
}

TEST_F(ModelTest, FindReturnsHydratedModel) {
    ASSERT_TRUE(createMember("Ada", "ada@example.com").hasValue());
    auto found = Member::find(*db_, std::int64_t{1});
    ASSERT_TRUE(found.hasValue());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->get<std::string>("name"), "Ada");

    auto missing = Member::find(*db_, std::int64_t{99});
    ASSERT_TRUE(missing.hasValue());
    EXPECT_FALSE(missing.value().has_value());
}

TEST_F(ModelTest, FindOrFailReportsModelNotFound) {
    auto missing = Member::findOrFail(*db_, std::int64_t{7});
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ModelNotFound);
    ASSERT_NE(missing.error().detail(), nullptr);
    EXPECT_EQ(missing.error().detail()->table, "members");

    auto none = Member::query(*db_).where("name", std::string("nobody")).firstOrFail();
    ASSERT_TRUE(none.hasError());
    EXPECT_EQ(none.error().code(), ErrorCode::ModelNotFound);
}

TEST_F(ModelTest, DuplicateUniqueColumnFails) {
    ASSERT_TRUE(createMember("Ada", "ada@example.com").hasValue());
    auto duplicate = createMember("Other Ada", "ada@example.com");
    ASSERT_TRUE(duplicate.hasError());
    EXPECT_EQ(duplicate.error().code(), ErrorCode::UniqueViolation);
}

// --- Mass assignment ---

TEST_F(ModelTest, FillIgnoresGuardedKeys) {
    auto member = Member::make({{"name", std::string("Ada")},
                                {"password", std::string("secret")},
                                {"id", std::int64_t{42}}});
    EXPECT_TRUE(member.hasAttribute("name"));
    EXPECT_FALSE(member.hasAttribute("password"));
    EXPECT_FALSE(member.exists());
}

TEST_F(ModelTest, SetBypassesFillable) {
    auto member = Member::make({{"name", std::string("Ada")}, {"email", std::string("a@x")}});
    member.set("password", std::string("secret"));
    ASSERT_TRUE(member.save(*db_).hasValue());

    auto row = db_->table("members").find(member.getKey());
    ASSERT_TRUE(row.hasValue());
    ASSERT_TRUE(row.value().has_value());
    EXPECT_EQ(row.value()->at("password"), DbValue(std::string("secret")));
}

// --- Dirty tracking and updates ---

TEST_F(ModelTest, DirtyTrackingAndSave) {
    auto created = createMember("Ada", "ada@example.com");
    ASSERT_TRUE(created.hasValue());
    auto member = std::move(created).value();

    member.set("name", std::string("Ada Lovelace"));
    EXPECT_TRUE(member.isDirty());
    EXPECT_TRUE(member.isDirty("name"));
    EXPECT_FALSE(member.isDirty("email"));

    memory().resetStats();
    ASSERT_TRUE(member.save(*db_).hasValue());
    EXPECT_FALSE(member.isDirty());
    EXPECT_EQ(memory().stats().updates, 1u);

    // Nothing changed, nothing written.
    ASSERT_TRUE(member.save(*db_).hasValue());
    EXPECT_EQ(memory().stats().updates, 1u);

    auto reloaded = Member::findOrFail(*db_, member.getKey());
    ASSERT_TRUE(reloaded.hasValue());
    EXPECT_EQ(reloaded.value().get<std::string>("name"), "Ada Lovelace");
}

TEST_F(ModelTest, ChangingPrimaryKeyUpdatesOriginalRow) {
    ASSERT_TRUE(db_->table("tags")
                    .insert({{"slug", std::string("cpp")}, {"label", std::string("C++")}}, "slug")
                    .hasValue());
    auto tag = Tag::findOrFail(*db_, std::string("cpp"));
    ASSERT_TRUE(tag.hasValue());
    tag.value().set("slug", std::string("cxx"));
    ASSERT_TRUE(tag.value().save(*db_).hasValue());

    EXPECT_FALSE(Tag::find(*db_, std::string("cpp")).value().has_value());
    EXPECT_TRUE(Tag::find(*db_, std::string("cxx")).value().has_value());
}

TEST_F(ModelTest, BulkUpdateThroughQuery) {
    ASSERT_TRUE(createMember("Ada", "ada@example.com").hasValue());
    ASSERT_TRUE(createMember("Bob", "bob@example.com").hasValue());

    auto updated = Member::query(*db_).where("name", "!=", std::string("Ada")).update(
        {{"is_admin", std::string("yes")}});
    ASSERT_TRUE(updated.hasValue());
    EXPECT_EQ(updated.value(), 1u);

    auto admins = Member::query(*db_).where("is_admin", true).get();
    ASSERT_TRUE(admins.hasValue());
    ASSERT_EQ(admins.value().size(), 1u);
    EXPECT_EQ(admins.value()[0].get<std::string>("name"), "Bob");
}

TEST_F(ModelTest, RemoveAndDestroy) {
    auto ada = createMember("Ada", "ada@example.com");
    ASSERT_TRUE(createMember("Bob", "bob@example.com").hasValue());
    ASSERT_TRUE(createMember("Cy", "cy@example.com").hasValue());

    ASSERT_TRUE(ada.value().remove(*db_).hasValue());
    auto again = ada.value().remove(*db_);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::ModelNotFound);

    auto destroyed = Member::destroy(*db_, {std::int64_t{2}, std::int64_t{3}, std::int64_t{9}});
    ASSERT_TRUE(destroyed.hasValue());
    EXPECT_EQ(destroyed.value(), 2u);
    EXPECT_EQ(Member::query(*db_).count().value(), 0u);
}

TEST_F(ModelTest, RemoveUnsavedModelFails) {
    auto member = Member::make({{"name", std::string("Ada")}});
    auto removed = member.remove(*db_);
    ASSERT_TRUE(removed.hasError());
    EXPECT_EQ(removed.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(ModelTest, RefreshReloadsAttributes) {
    auto member = createMember("Ada", "ada@example.com");
    ASSERT_TRUE(member.hasValue());
    ASSERT_TRUE(db_->table("members")
                    .where("id", member.value().getKey())
                    .update({{"name", std::string("Changed")}})
                    .hasValue());

    ASSERT_TRUE(member.value().refresh(*db_).hasValue());
    EXPECT_EQ(member.value().get<std::string>("name"), "Changed");
    EXPECT_FALSE(member.value().isDirty());
}

// --- Casts ---

TEST_F(ModelTest, CastsApplyOnWriteAndRead) {
    auto member = Member::create(*db_, {{"name", std::string("Ada")},
                                        {"email", std::string("ada@example.com")},
                                        {"is_admin", std::string("true")},
                                        {"age", std::string("36")},
                                        {"settings", std::string(R"({"theme":"dark"})")}});
    ASSERT_TRUE(member.hasValue());

    auto found = Member::findOrFail(*db_, member.value().getKey());
    ASSERT_TRUE(found.hasValue());
    EXPECT_EQ(found.value().getAttribute("is_admin"), DbValue(true));
    EXPECT_EQ(found.value().getAttribute("age"), DbValue(std::int64_t{36}));
    auto settings = found.value().getAttribute("settings");
    ASSERT_TRUE(std::holds_alternative<quarry::db::JsonValue>(settings));
    EXPECT_EQ(std::get<quarry::db::JsonValue>(settings).data["theme"], Json("dark"));
}

TEST_F(ModelTest, RejectedCastFailsSave) {
    auto member = Member::make({{"name", std::string("Ada")},
                                {"email", std::string("ada@example.com")},
                                {"age", std::string("thirty")}});
    auto saved = member.save(*db_);
    ASSERT_TRUE(saved.hasError());
    EXPECT_EQ(saved.error().code(), ErrorCode::CastFailed);
    ASSERT_NE(saved.error().detail(), nullptr);
    EXPECT_EQ(saved.error().detail()->column, "age");
    EXPECT_EQ(Member::query(*db_).count().value(), 0u);
}

// --- Serialization ---

TEST_F(ModelTest, ToJsonOmitsHiddenAttributes) {
    auto member = Member::make({{"name", std::string("Ada")}, {"is_admin", std::int64_t{1}}});
    member.set("password", std::string("secret"));

    auto json = member.toJson();
    EXPECT_EQ(json["name"], Json("Ada"));
    EXPECT_EQ(json["is_admin"], Json(true));
    EXPECT_FALSE(json.contains("password"));
}

// --- Query surface ---

TEST_F(ModelTest, QueryPaginatesModels) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(createMember("m" + std::to_string(i),
                                 "m" + std::to_string(i) + "@example.com")
                        .hasValue());
    }
    auto page = Member::query(*db_).orderBy("id").paginate(2, 2);
    ASSERT_TRUE(page.hasValue());
    EXPECT_EQ(page.value().total, 5u);
    EXPECT_EQ(page.value().lastPage, 3u);
    ASSERT_EQ(page.value().data.size(), 2u);
    EXPECT_EQ(page.value().data[0].get<std::string>("name"), "m2");
    EXPECT_TRUE(page.value().hasMorePages());
}

TEST_F(ModelTest, GetAsyncUsesSnapshot) {
    ASSERT_TRUE(createMember("Ada", "ada@example.com").hasValue());
    auto query = Member::query(*db_);
    query.where("name", std::string("Ada"));
    auto future = query.getAsync();
    query.where("name", std::string("nobody"));

    auto models = future.get();
    ASSERT_TRUE(models.hasValue());
    EXPECT_EQ(models.value().size(), 1u);
}
