#include <gtest/gtest.h>

#include <string>

#include "quarry/database/sql_grammar.hpp"

using namespace quarry::db;
using quarry::foundation::ErrorCode;

namespace {

Predicate where(std::string column, Operator op, DbValue value,
                Boolean boolean = Boolean::And) {
    Predicate p;
    p.column = std::move(column);
    p.op = op;
    p.value = std::move(value);
    p.boolean = boolean;
    return p;
}

Predicate whereList(std::string column, Operator op, std::vector<DbValue> values) {
    Predicate p;
    p.column = std::move(column);
    p.op = op;
    p.values = std::move(values);
    return p;
}

SelectQuery selectFrom(std::string table) {
    SelectQuery q;
    q.from = parseTableRef(table);
    return q;
}

} // namespace

// ---------------------------------------------------------------------------
// Identifiers
// ---------------------------------------------------------------------------

TEST(SqlGrammarTest, WrapQuotesPerDialect) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    SqlGrammar my(SqlDialect::MySQL);

    EXPECT_EQ(pg.wrap("users.email"), "\"users\".\"email\"");
    EXPECT_EQ(my.wrap("users.email"), "`users`.`email`");
    EXPECT_EQ(pg.wrap("posts.*"), "\"posts\".*");
    EXPECT_EQ(pg.wrap("users.name as author"), "\"users\".\"name\" AS \"author\"");
    EXPECT_EQ(pg.wrap("COUNT(id)"), "COUNT(id)");
    EXPECT_EQ(pg.wrap("we\"ird"), "\"we\"\"ird\"");
}

TEST(SqlGrammarTest, WrapTableWithAlias) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    EXPECT_EQ(pg.wrapTable(TableRef{"users", "u"}), "\"users\" AS \"u\"");
}

// ---------------------------------------------------------------------------
// SELECT
// ---------------------------------------------------------------------------

TEST(SqlGrammarTest, SelectWithWhereOrderLimitPostgres) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    auto q = selectFrom("posts");
    q.columns = {"id", "title"};
    q.wheres.push_back(where("published", Operator::Equal, true));
    q.wheres.push_back(where("views", Operator::Greater, std::int64_t{100}));
    q.orders.push_back({"created_at", Direction::Desc});
    q.limit = 2;
    q.offset = 4;

    auto stmt = pg.compileSelect(q);
    ASSERT_TRUE(stmt.hasValue());
    EXPECT_EQ(stmt.value().sql(),
              "SELECT \"id\", \"title\" FROM \"posts\" WHERE \"published\" = $1 AND "
              "\"views\" > $2 ORDER BY \"created_at\" DESC LIMIT 2 OFFSET 4");
    ASSERT_EQ(stmt.value().bindings().size(), 2u);
    EXPECT_EQ(stmt.value().bindings()[1], DbValue(std::int64_t{100}));
}

TEST(SqlGrammarTest, SelectMysqlOffsetWithoutLimit) {
    SqlGrammar my(SqlDialect::MySQL);
    auto q = selectFrom("users");
    q.offset = 10;

    auto stmt = my.compileSelect(q);
    ASSERT_TRUE(stmt.hasValue());
    EXPECT_EQ(stmt.value().sql(),
              "SELECT * FROM `users` LIMIT 18446744073709551615 OFFSET 10");
}

TEST(SqlGrammarTest, SelectDistinctWithJoin) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    auto q = selectFrom("posts");
    q.distinct = true;
    q.columns = {"users.name"};
    JoinClause j;
    j.table = "users";
    j.first = "users.id";
    j.second = "posts.user_id";
    q.joins.push_back(j);

    auto stmt = pg.compileSelect(q);
    ASSERT_TRUE(stmt.hasValue());
    EXPECT_EQ(stmt.value().sql(),
              "SELECT DISTINCT \"users\".\"name\" FROM \"posts\" INNER JOIN \"users\" ON "
              "\"users\".\"id\" = \"posts\".\"user_id\"");
}

TEST(SqlGrammarTest, JoinRejectsUnsupportedOperator) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    auto q = selectFrom("posts");
    JoinClause j;
    j.table = "users";
    j.first = "users.id";
    j.op = "LIKE";
    j.second = "posts.user_id";
    q.joins.push_back(j);

    auto stmt = pg.compileSelect(q);
    ASSERT_TRUE(stmt.hasError());
    EXPECT_EQ(stmt.error().code(), ErrorCode::UnsupportedOperator);
}

TEST(SqlGrammarTest, SelectRequiresTable) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    EXPECT_TRUE(pg.compileSelect(SelectQuery{}).hasError());
}

// ---------------------------------------------------------------------------
// Predicates
// ---------------------------------------------------------------------------

TEST(SqlGrammarTest, EmptyInAndNotIn) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    std::vector<DbValue> bindings;
    auto in = pg.compileWheres({whereList("id", Operator::In, {})}, bindings);
    EXPECT_EQ(in.value(), "0 = 1");
    auto notIn = pg.compileWheres({whereList("id", Operator::NotIn, {})}, bindings);
    EXPECT_EQ(notIn.value(), "1 = 1");
    EXPECT_TRUE(bindings.empty());
}

TEST(SqlGrammarTest, InListBindsEachValue) {
    SqlGrammar my(SqlDialect::MySQL);
    std::vector<DbValue> bindings;
    auto sql = my.compileWheres(
        {whereList("id", Operator::In, {std::int64_t{1}, std::int64_t{2}, std::int64_t{3}})},
        bindings);
    EXPECT_EQ(sql.value(), "`id` IN (?, ?, ?)");
    EXPECT_EQ(bindings.size(), 3u);
}

TEST(SqlGrammarTest, EqualNullBecomesIsNull) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    std::vector<DbValue> bindings;
    auto sql = pg.compileWheres({where("deleted_at", Operator::Equal, DbNull{}),
                                 where("parent_id", Operator::NotEqual, DbNull{}, Boolean::Or)},
                                bindings);
    EXPECT_EQ(sql.value(), "\"deleted_at\" IS NULL OR \"parent_id\" IS NOT NULL");
    EXPECT_TRUE(bindings.empty());
}

TEST(SqlGrammarTest, BetweenRequiresTwoValues) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    std::vector<DbValue> bindings;
    auto ok = pg.compileWheres(
        {whereList("age", Operator::Between, {std::int64_t{18}, std::int64_t{30}})}, bindings);
    EXPECT_EQ(ok.value(), "\"age\" BETWEEN $1 AND $2");

    bindings.clear();
    auto bad = pg.compileWheres({whereList("age", Operator::Between, {std::int64_t{18}})},
                                bindings);
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidQuery);
}

TEST(SqlGrammarTest, NestedGroupAndRaw) {
    SqlGrammar pg(SqlDialect::PostgreSQL);

    Predicate group;
    group.op = Operator::Group;
    group.nested = {where("role", Operator::Equal, std::string("admin")),
                    where("role", Operator::Equal, std::string("editor"), Boolean::Or)};

    Predicate raw;
    raw.op = Operator::Raw;
    raw.column = "lower(email) = ?";
    raw.values = {std::string("a@x.io")};

    std::vector<DbValue> bindings;
    auto sql = pg.compileWheres({where("active", Operator::Equal, true), group, raw}, bindings);
    ASSERT_TRUE(sql.hasValue());
    EXPECT_EQ(sql.value(),
              "\"active\" = $1 AND (\"role\" = $2 OR \"role\" = $3) AND (lower(email) = $4)");
    EXPECT_EQ(bindings.size(), 4u);
}

// ---------------------------------------------------------------------------
// Aggregates
// ---------------------------------------------------------------------------

TEST(SqlGrammarTest, CountAndExists) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    auto q = selectFrom("users");
    q.wheres.push_back(where("active", Operator::Equal, true));

    EXPECT_EQ(pg.compileCount(q).value().sql(),
              "SELECT COUNT(*) AS \"aggregate\" FROM \"users\" WHERE \"active\" = $1");
    EXPECT_EQ(pg.compileExists(q).value().sql(),
              "SELECT EXISTS(SELECT 1 FROM \"users\" WHERE \"active\" = $1) AS \"exists\"");
}

TEST(SqlGrammarTest, CountDistinctUsesSubquery) {
    SqlGrammar my(SqlDialect::MySQL);
    auto q = selectFrom("posts");
    q.distinct = true;
    q.columns = {"user_id"};
    q.limit = 5;

    EXPECT_EQ(my.compileCount(q).value().sql(),
              "SELECT COUNT(*) AS `aggregate` FROM (SELECT DISTINCT `user_id` FROM `posts`) "
              "AS `aggregate_table`");
}

TEST(SqlGrammarTest, AggregateFunctions) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    auto q = selectFrom("orders");
    EXPECT_EQ(pg.compileAggregate(q, AggregateFunction::Sum, "total").value().sql(),
              "SELECT SUM(\"total\") AS \"aggregate\" FROM \"orders\"");
    EXPECT_TRUE(pg.compileAggregate(q, AggregateFunction::Max, "").hasError());
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

TEST(SqlGrammarTest, InsertPerDialect) {
    InsertQuery q;
    q.table = "users";
    q.values = {{"email", std::string("a@x.io")}, {"name", std::string("Ann")}};

    EXPECT_EQ(SqlGrammar(SqlDialect::MySQL).compileInsert(q).value().sql(),
              "INSERT INTO `users` (`email`, `name`) VALUES (?, ?)");
    EXPECT_EQ(SqlGrammar(SqlDialect::PostgreSQL).compileInsert(q).value().sql(),
              "INSERT INTO \"users\" (\"email\", \"name\") VALUES ($1, $2) RETURNING *");
}

TEST(SqlGrammarTest, InsertDefaultValues) {
    InsertQuery q;
    q.table = "events";
    EXPECT_EQ(SqlGrammar(SqlDialect::PostgreSQL).compileInsert(q).value().sql(),
              "INSERT INTO \"events\" DEFAULT VALUES RETURNING *");
    EXPECT_EQ(SqlGrammar(SqlDialect::MySQL).compileInsert(q).value().sql(),
              "INSERT INTO `events` () VALUES ()");
}

TEST(SqlGrammarTest, UpdateNumbersSetBeforeWhere) {
    MutationQuery q;
    q.from.name = "users";
    q.wheres.push_back(where("id", Operator::Equal, std::int64_t{7}));

    auto stmt = SqlGrammar(SqlDialect::PostgreSQL)
                    .compileUpdate(q, {{"name", std::string("Bo")}});
    ASSERT_TRUE(stmt.hasValue());
    EXPECT_EQ(stmt.value().sql(),
              "UPDATE \"users\" SET \"name\" = $1 WHERE \"id\" = $2 RETURNING 1");
    EXPECT_EQ(stmt.value().bindings()[1], DbValue(std::int64_t{7}));

    EXPECT_TRUE(SqlGrammar(SqlDialect::MySQL).compileUpdate(q, {}).hasError());
}

TEST(SqlGrammarTest, DeleteStatement) {
    MutationQuery q;
    q.from.name = "sessions";
    q.wheres.push_back(where("expires_at", Operator::Less, std::string("2024-01-01")));

    EXPECT_EQ(SqlGrammar(SqlDialect::MySQL).compileDelete(q).value().sql(),
              "DELETE FROM `sessions` WHERE `expires_at` < ?");
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

TEST(SqlGrammarTest, ColumnDefinitions) {
    SqlGrammar my(SqlDialect::MySQL);
    SqlGrammar pg(SqlDialect::PostgreSQL);

    ColumnDefinition id{"id", ColumnType::Increments};
    EXPECT_EQ(my.compileColumn(id), "`id` INT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY");

    ColumnDefinition bigId{"id", ColumnType::BigIncrements};
    EXPECT_EQ(pg.compileColumn(bigId), "\"id\" BIGSERIAL PRIMARY KEY");

    ColumnDefinition email{"email", ColumnType::String};
    email.unique = true;
    EXPECT_EQ(pg.compileColumn(email), "\"email\" VARCHAR(255) NOT NULL UNIQUE");

    ColumnDefinition flag{"active", ColumnType::Boolean};
    flag.defaultValue = DbValue(true);
    EXPECT_EQ(my.compileColumn(flag), "`active` TINYINT(1) NOT NULL DEFAULT 1");

    ColumnDefinition meta{"meta", ColumnType::Json};
    meta.nullable = true;
    EXPECT_EQ(pg.compileColumn(meta), "\"meta\" JSONB NULL");

    ColumnDefinition created{"created_at", ColumnType::Timestamp};
    created.nullable = true;
    created.useCurrent = true;
    EXPECT_EQ(my.compileColumn(created), "`created_at` TIMESTAMP NULL DEFAULT CURRENT_TIMESTAMP");
}

TEST(SqlGrammarTest, CreateTableWithIndexesAndForeignKey) {
    SqlGrammar pg(SqlDialect::PostgreSQL);

    TableDefinition table;
    table.name = "posts";
    table.columns.push_back(ColumnDefinition{"id", ColumnType::BigIncrements});
    ColumnDefinition userId{"user_id", ColumnType::BigInteger};
    userId.isUnsigned = true;
    table.columns.push_back(userId);
    table.columns.push_back(ColumnDefinition{"slug", ColumnType::String});
    table.indexes.push_back(IndexDefinition{"", {"slug"}, true});
    ForeignKeyDefinition fk;
    fk.column = "user_id";
    fk.onTable = "users";
    fk.onDelete = "CASCADE";
    table.foreignKeys.push_back(fk);

    auto stmts = pg.compileCreateTable(table);
    ASSERT_TRUE(stmts.hasValue());
    ASSERT_EQ(stmts.value().size(), 2u);
    EXPECT_EQ(stmts.value()[0],
              "CREATE TABLE \"posts\" (\"id\" BIGSERIAL PRIMARY KEY, \"user_id\" BIGINT NOT NULL, "
              "\"slug\" VARCHAR(255) NOT NULL, CONSTRAINT \"posts_user_id_foreign\" FOREIGN KEY "
              "(\"user_id\") REFERENCES \"users\" (\"id\") ON DELETE CASCADE)");
    EXPECT_EQ(stmts.value()[1],
              "CREATE UNIQUE INDEX \"posts_slug_unique\" ON \"posts\" (\"slug\")");
}

TEST(SqlGrammarTest, CreateTableWithoutColumnsFails) {
    TableDefinition table;
    table.name = "empty";
    auto stmts = SqlGrammar(SqlDialect::MySQL).compileCreateTable(table);
    ASSERT_TRUE(stmts.hasError());
    EXPECT_EQ(stmts.error().code(), ErrorCode::SchemaError);
}

TEST(SqlGrammarTest, AlterTable) {
    SqlGrammar my(SqlDialect::MySQL);
    TableDefinition delta;
    delta.name = "users";
    ColumnDefinition bio{"bio", ColumnType::Text};
    bio.nullable = true;
    delta.columns.push_back(bio);
    delta.renameColumns.emplace_back("name", "full_name");
    delta.dropIndexes.push_back("users_email_index");
    delta.dropColumns.push_back("legacy");

    auto stmts = my.compileAlterTable(delta);
    ASSERT_TRUE(stmts.hasValue());
    ASSERT_EQ(stmts.value().size(), 4u);
    EXPECT_EQ(stmts.value()[0], "ALTER TABLE `users` ADD COLUMN `bio` TEXT NULL");
    EXPECT_EQ(stmts.value()[1], "ALTER TABLE `users` RENAME COLUMN `name` TO `full_name`");
    EXPECT_EQ(stmts.value()[2], "DROP INDEX `users_email_index` ON `users`");
    EXPECT_EQ(stmts.value()[3], "ALTER TABLE `users` DROP COLUMN `legacy`");
}

TEST(SqlGrammarTest, DropTableAndIntrospection) {
    SqlGrammar pg(SqlDialect::PostgreSQL);
    EXPECT_EQ(pg.compileDropTable("users", true), "DROP TABLE IF EXISTS \"users\"");
    EXPECT_EQ(pg.compileDropTable("users", false), "DROP TABLE \"users\"");

    auto has = pg.compileHasColumn("users", "email");
    EXPECT_EQ(has.bindings().size(), 2u);
    EXPECT_NE(std::string(has.sql()).find("current_schema()"), std::string::npos);
}

TEST(SqlGrammarTest, Savepoints) {
    EXPECT_EQ(SqlGrammar::compileSavepoint(2), "SAVEPOINT sp_2");
    EXPECT_EQ(SqlGrammar::compileReleaseSavepoint(2), "RELEASE SAVEPOINT sp_2");
    EXPECT_EQ(SqlGrammar::compileRollbackToSavepoint(1), "ROLLBACK TO SAVEPOINT sp_1");
}
