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

class Article;
class Profile;
class Role;

class Author : public Model<Author> {
public:
    static ModelMeta describe() {
        ModelMeta m;
        m.table = "authors";
        m.fillable = {"name"};
        m.timestamps = false;
        return m;
    }
    static void relations(RelationRegistry& r);
};

class Article : public Model<Article> {
public:
    static ModelMeta describe() {
        ModelMeta m;
        m.table = "articles";
        m.fillable = {"title", "author_id"};
        m.timestamps = false;
        return m;
    }
    static void relations(RelationRegistry& r) { r.belongsTo<Author>("author"); }
};

class Profile : public Model<Profile> {
public:
    static ModelMeta describe() {
        ModelMeta m;
        m.table = "profiles";
        m.fillable = {"bio"};
        m.timestamps = false;
        return m;
    }
};

class Role : public Model<Role> {
public:
    static ModelMeta describe() {
        ModelMeta m;
        m.table = "roles";
        m.fillable = {"name"};
        m.timestamps = false;
        return m;
    }
};

void Author::relations(RelationRegistry& r) {
    r.hasMany<Article>("articles");
    r.hasOne<Profile>("profile");
    r.belongsToMany<Role>("roles", {}, {}, {}, {"granted_by"});
}

} // namespace

// ---------------------------------------------------------------------------
// Naming helpers
// ---------------------------------------------------------------------------

TEST(RelationNamingTest, Singularize) {
    EXPECT_EQ(singularize("users"), "user");
    EXPECT_EQ(singularize("categories"), "category");
    EXPECT_EQ(singularize("statuses"), "status");
    EXPECT_EQ(singularize("boxes"), "box");
    EXPECT_EQ(singularize("address"), "address");
    EXPECT_EQ(foreignKeyFor("authors"), "author_id");
}

TEST(RelationNamingTest, PivotTableIsAlphabetical) {
    EXPECT_EQ(pivotTableFor("users", "roles"), "role_user");
    EXPECT_EQ(pivotTableFor("roles", "users"), "role_user");
}

// ---------------------------------------------------------------------------
// Fixture: authors with articles, profiles and roles
// ---------------------------------------------------------------------------

class RelationTest : public ::testing::Test {
protected:
    void SetUp() override {
        DatabaseConfig config;
        config.type = BackendType::Memory;
        auto opened = Database::open(config);
        ASSERT_TRUE(opened.hasValue());
        db_ = std::move(opened).value();

        using quarry::schema::Blueprint;
        auto schema = db_->schema();
        ASSERT_TRUE(schema.create("authors", [](Blueprint& t) {
            t.increments("id");
            t.string("name");
        }).hasValue());
        ASSERT_TRUE(schema.create("articles", [](Blueprint& t) {
            t.increments("id");
            t.foreignId("author_id").nullable();
            t.string("title");
        }).hasValue());
        ASSERT_TRUE(schema.create("profiles", [](Blueprint& t) {
            t.increments("id");
            t.foreignId("author_id");
            t.string("bio");
        }).hasValue());
        ASSERT_TRUE(schema.create("roles", [](Blueprint& t) {
            t.increments("id");
            t.string("name");
        }).hasValue());
        ASSERT_TRUE(schema.create("author_role", [](Blueprint& t) {
            t.foreignId("author_id");
            t.foreignId("role_id");
            t.string("granted_by").nullable();
        }).hasValue());

        for (const char* name : {"ann", "bob", "cy"}) {
            ASSERT_TRUE(Author::create(*db_, {{"name", std::string(name)}}).hasValue());
        }
        for (const char* name : {"admin", "editor", "viewer"}) {
            ASSERT_TRUE(Role::create(*db_, {{"name", std::string(name)}}).hasValue());
        }
        insertArticle(1, "First");
        insertArticle(1, "Second");
        insertArticle(2, "Hello");
        ASSERT_TRUE(db_->table("profiles")
                        .insert({{"author_id", std::int64_t{2}}, {"bio", std::string("bob's bio")}})
                        .hasValue());
    }

    void insertArticle(std::int64_t author, const std::string& title) {
        ASSERT_TRUE(db_->table("articles")
                        .insert({{"author_id", author}, {"title", title}})
                        .hasValue());
    }

    Author author(std::int64_t id) { return Author::findOrFail(*db_, id).value(); }

    quarry::db::MemoryAdapter& memory() {
        return static_cast<quarry::db::MemoryAdapter&>(db_->adapter());
    }

    std::unique_ptr<Database> db_;
};

// --- HasMany / HasOne ---

TEST_F(RelationTest, HasManyLazy) {
    auto ann = author(1);
    auto articles = ann.hasMany<Article>(*db_).orderBy("id").get();
    ASSERT_TRUE(articles.hasValue());
    ASSERT_EQ(articles.value().size(), 2u);
    EXPECT_EQ(articles.value()[0].get<std::string>("title"), "First");
    EXPECT_EQ(articles.value()[1].get<std::string>("title"), "Second");

    EXPECT_EQ(ann.hasMany<Article>(*db_).count().value(), 2u);
    EXPECT_EQ(author(3).hasMany<Article>(*db_).count().value(), 0u);
}

TEST_F(RelationTest, HasManyExtraConstraints) {
    auto ann = author(1);
    auto relation = ann.hasMany<Article>(*db_);
    relation.where("title", std::string("Second"));
    auto articles = relation.get();
    ASSERT_TRUE(articles.hasValue());
    ASSERT_EQ(articles.value().size(), 1u);
    EXPECT_EQ(articles.value()[0].get<std::string>("title"), "Second");
}

TEST_F(RelationTest, HasManyCreateSetsForeignKey) {
    auto cy = author(3);
    auto created = cy.hasMany<Article>(*db_).create({{"title", std::string("Debut")}});
    ASSERT_TRUE(created.hasValue());
    EXPECT_EQ(created.value().getAttribute("author_id"), DbValue(std::int64_t{3}));
    EXPECT_EQ(cy.hasMany<Article>(*db_).count().value(), 1u);
}

TEST_F(RelationTest, HasManyMakeManyLeavesModelsUnsaved) {
    auto cy = author(3);
    auto drafts = cy.hasMany<Article>(*db_).makeMany(
        {{{"title", std::string("Draft A")}}, {{"title", std::string("Draft B")}}});
    ASSERT_EQ(drafts.size(), 2u);
    EXPECT_EQ(drafts[0].getAttribute("author_id"), DbValue(std::int64_t{3}));
    EXPECT_EQ(drafts[1].get<std::string>("title"), "Draft B");
    EXPECT_FALSE(drafts[0].exists());
    EXPECT_EQ(cy.hasMany<Article>(*db_).count().value(), 0u);
}

TEST_F(RelationTest, HasManyFindOrFailIsScopedToParent) {
    auto ann = author(1);
    auto second = ann.hasMany<Article>(*db_).findOrFail(std::int64_t{2});
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(second.value().get<std::string>("title"), "Second");

    auto foreign = ann.hasMany<Article>(*db_).findOrFail(std::int64_t{3});
    ASSERT_TRUE(foreign.hasError());
    EXPECT_EQ(foreign.error().code(), ErrorCode::ModelNotFound);
    EXPECT_EQ(foreign.error().detail()->table, "articles");
}

TEST_F(RelationTest, HasManyPluckIds) {
    auto ann = author(1);
    auto articles = ann.hasMany<Article>(*db_);
    articles.orderBy("id");
    auto ids = articles.pluckIds();
    ASSERT_TRUE(ids.hasValue());
    EXPECT_EQ(ids.value(), (std::vector<DbValue>{std::int64_t{1}, std::int64_t{2}}));

    auto cy = author(3);
    EXPECT_TRUE(cy.hasMany<Article>(*db_).pluckIds().value().empty());
}

TEST_F(RelationTest, FirstOrCreateReusesExisting) {
    auto ann = author(1);
    auto existing = ann.hasMany<Article>(*db_).firstOrCreate({{"title", std::string("First")}});
    ASSERT_TRUE(existing.hasValue());
    EXPECT_EQ(existing.value().getKey(), DbValue(std::int64_t{1}));

    auto fresh = ann.hasMany<Article>(*db_).firstOrCreate({{"title", std::string("Third")}});
    ASSERT_TRUE(fresh.hasValue());
    EXPECT_TRUE(fresh.value().exists());
    EXPECT_EQ(ann.hasMany<Article>(*db_).count().value(), 3u);
}

TEST_F(RelationTest, HasOneReturnsSingleModel) {
    auto profile = author(2).getOne<Profile>(*db_, "profile");
    ASSERT_TRUE(profile.hasValue());
    ASSERT_NE(profile.value(), nullptr);
    EXPECT_EQ(profile.value()->get<std::string>("bio"), "bob's bio");

    auto none = author(1).getOne<Profile>(*db_, "profile");
    ASSERT_TRUE(none.hasValue());
    EXPECT_EQ(none.value(), nullptr);
}

TEST_F(RelationTest, UnsavedParentSkipsQuery) {
    auto draft = Author::make({{"name", std::string("draft")}});
    memory().resetStats();
    auto articles = draft.hasMany<Article>(*db_).get();
    ASSERT_TRUE(articles.hasValue());
    EXPECT_TRUE(articles.value().empty());
    EXPECT_EQ(memory().stats().reads(), 0u);
}

// --- BelongsTo ---

TEST_F(RelationTest, BelongsToLoadsOwner) {
    auto article = Article::findOrFail(*db_, std::int64_t{3});
    ASSERT_TRUE(article.hasValue());
    auto owner = article.value().getOne<Author>(*db_, "author");
    ASSERT_TRUE(owner.hasValue());
    ASSERT_NE(owner.value(), nullptr);
    EXPECT_EQ(owner.value()->get<std::string>("name"), "bob");
}

TEST_F(RelationTest, AssociateAndDissociate) {
    auto article = Article::make({{"title", std::string("Orphan")}});
    auto cy = author(3);
    ASSERT_TRUE(article.belongsTo<Author>(*db_).associate(cy).hasValue());
    EXPECT_EQ(article.getAttribute("author_id"), DbValue(std::int64_t{3}));
    EXPECT_TRUE(article.relationLoaded("author"));
    ASSERT_TRUE(article.save(*db_).hasValue());
    EXPECT_EQ(cy.hasMany<Article>(*db_).count().value(), 1u);

    article.belongsTo<Author>(*db_).dissociate();
    EXPECT_TRUE(quarry::db::isNull(article.getAttribute("author_id")));
    EXPECT_EQ(article.toJson()["author"], Json(nullptr));

    auto unsaved = Author::make({{"name", std::string("ghost")}});
    auto failed = article.belongsTo<Author>(*db_).associate(unsaved);
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::InvalidArgument);
}

// --- Eager loading ---

TEST_F(RelationTest, EagerHasManyCostsOneQuery) {
    memory().resetStats();
    auto authors = Author::query(*db_).with("articles").orderBy("id").get();
    ASSERT_TRUE(authors.hasValue());
    EXPECT_EQ(memory().stats().selects, 2u);

    ASSERT_EQ(authors.value().size(), 3u);
    for (auto& eager : authors.value()) {
        ASSERT_TRUE(eager.relationLoaded("articles"));
        auto lazy = author(eager.get<std::int64_t>("id").value()).hasMany<Article>(*db_).get();
        ASSERT_TRUE(lazy.hasValue());
        const auto* loaded = eager.relation("articles");
        ASSERT_EQ(loaded->models.size(), lazy.value().size());
        for (std::size_t i = 0; i < lazy.value().size(); ++i) {
            EXPECT_EQ(loaded->models[i]->getKey(), lazy.value()[i].getKey());
        }
    }
    EXPECT_TRUE(authors.value()[2].relation("articles")->models.empty());
}

TEST_F(RelationTest, EagerLoadingServesCachedAccess) {
    auto authors = Author::query(*db_).with(std::vector<std::string>{"articles", "profile"}).orderBy("id").get();
    ASSERT_TRUE(authors.hasValue());

    memory().resetStats();
    auto articles = authors.value()[0].getMany<Article>(*db_, "articles");
    ASSERT_TRUE(articles.hasValue());
    EXPECT_EQ(articles.value().size(), 2u);
    auto profile = authors.value()[1].getOne<Profile>(*db_, "profile");
    ASSERT_TRUE(profile.hasValue());
    EXPECT_NE(profile.value(), nullptr);
    EXPECT_EQ(memory().stats().reads(), 0u);

    auto json = authors.value()[0].toJson();
    ASSERT_TRUE(json["articles"].is_array());
    EXPECT_EQ(json["articles"].size(), 2u);
    EXPECT_TRUE(json["profile"].is_null());
}

TEST_F(RelationTest, EagerBelongsTo) {
    memory().resetStats();
    auto articles = Article::query(*db_).with("author").get();
    ASSERT_TRUE(articles.hasValue());
    EXPECT_EQ(memory().stats().selects, 2u);
    for (const auto& article : articles.value()) {
        const auto* owner = article.relation("author");
        ASSERT_NE(owner, nullptr);
        ASSERT_EQ(owner->models.size(), 1u);
        EXPECT_EQ(owner->models.front()->getKey(), article.getAttribute("author_id"));
    }
}

TEST_F(RelationTest, UndefinedRelationFails) {
    auto loaded = Author::query(*db_).with("followers").get();
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::RelationNotDefined);

    auto ann = author(1);
    auto lazy = ann.load(*db_, {"followers"});
    ASSERT_TRUE(lazy.hasError());
    EXPECT_EQ(lazy.error().code(), ErrorCode::RelationNotDefined);
}

// --- BelongsToMany ---

TEST_F(RelationTest, AttachAndReadPivot) {
    auto ann = author(1);
    auto roles = ann.belongsToMany<Role>(*db_);
    EXPECT_EQ(roles.pivotTable(), "author_role");
    EXPECT_EQ(roles.foreignPivotKey(), "author_id");
    EXPECT_EQ(roles.relatedPivotKey(), "role_id");

    ASSERT_TRUE(roles.attach({std::int64_t{1}, std::int64_t{2}},
                             {{"granted_by", std::string("root")}})
                    .hasValue());

    auto loaded = ann.belongsToMany<Role>(*db_).withPivot({"granted_by"}).orderBy("id").get();
    ASSERT_TRUE(loaded.hasValue());
    ASSERT_EQ(loaded.value().size(), 2u);
    EXPECT_EQ(loaded.value()[0].get<std::string>("name"), "admin");
    EXPECT_EQ(loaded.value()[0].pivot().at("granted_by"), DbValue(std::string("root")));
    EXPECT_EQ(loaded.value()[0].pivot().at("author_id"), DbValue(std::int64_t{1}));
    EXPECT_FALSE(loaded.value()[0].hasAttribute("pivot_granted_by"));

    EXPECT_EQ(ann.belongsToMany<Role>(*db_).count().value(), 2u);
}

TEST_F(RelationTest, DetachAndSync) {
    auto ann = author(1);
    ASSERT_TRUE(ann.belongsToMany<Role>(*db_).attach({std::int64_t{1}, std::int64_t{2}}).hasValue());

    auto synced = ann.belongsToMany<Role>(*db_).sync({std::int64_t{2}, std::int64_t{3}});
    ASSERT_TRUE(synced.hasValue());
    ASSERT_EQ(synced.value().attached.size(), 1u);
    EXPECT_EQ(synced.value().attached[0], DbValue(std::int64_t{3}));
    ASSERT_EQ(synced.value().detached.size(), 1u);
    EXPECT_EQ(synced.value().detached[0], DbValue(std::int64_t{1}));

    auto names = ann.belongsToMany<Role>(*db_).orderBy("id").get();
    ASSERT_TRUE(names.hasValue());
    ASSERT_EQ(names.value().size(), 2u);
    EXPECT_EQ(names.value()[0].get<std::string>("name"), "editor");
    EXPECT_EQ(names.value()[1].get<std::string>("name"), "viewer");

    auto detached = ann.belongsToMany<Role>(*db_).detach();
    ASSERT_TRUE(detached.hasValue());
    EXPECT_EQ(detached.value(), 2u);
    EXPECT_EQ(ann.belongsToMany<Role>(*db_).count().value(), 0u);
}

TEST_F(RelationTest, SyncAttachesInCallerOrder) {
    auto ann = author(1);
    auto synced = ann.belongsToMany<Role>(*db_).sync(
        {std::int64_t{3}, std::int64_t{1}, std::int64_t{3}, std::int64_t{2}});
    ASSERT_TRUE(synced.hasValue());
    EXPECT_EQ(synced.value().attached,
              (std::vector<DbValue>{std::int64_t{3}, std::int64_t{1}, std::int64_t{2}}));
    EXPECT_TRUE(synced.value().detached.empty());

    auto stored = db_->table("author_role").pluck("role_id");
    ASSERT_TRUE(stored.hasValue());
    EXPECT_EQ(stored.value(),
              (std::vector<DbValue>{std::int64_t{3}, std::int64_t{1}, std::int64_t{2}}));
}

TEST_F(RelationTest, EagerBelongsToManySharesRelated) {
    ASSERT_TRUE(author(1).belongsToMany<Role>(*db_).attach({std::int64_t{1}}).hasValue());
    ASSERT_TRUE(author(2)
                    .belongsToMany<Role>(*db_)
                    .attach({std::int64_t{1}, std::int64_t{3}},
                            {{"granted_by", std::string("ann")}})
                    .hasValue());

    memory().resetStats();
    auto authors = Author::query(*db_).with("roles").orderBy("id").get();
    ASSERT_TRUE(authors.hasValue());
    EXPECT_EQ(memory().stats().selects, 2u);

    EXPECT_EQ(authors.value()[0].relation("roles")->models.size(), 1u);
    const auto& bobRoles = authors.value()[1].relation("roles")->models;
    ASSERT_EQ(bobRoles.size(), 2u);
    EXPECT_EQ(bobRoles[0]->pivot().at("granted_by"), DbValue(std::string("ann")));
    EXPECT_TRUE(authors.value()[2].relation("roles")->models.empty());
}

TEST_F(RelationTest, AttachWithoutParentKeyFails) {
    auto draft = Author::make({{"name", std::string("draft")}});
    auto attached = draft.belongsToMany<Role>(*db_).attach({std::int64_t{1}});
    ASSERT_TRUE(attached.hasError());
    EXPECT_EQ(attached.error().code(), ErrorCode::InvalidArgument);
}
