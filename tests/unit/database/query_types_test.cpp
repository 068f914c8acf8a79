#include <gtest/gtest.h>

#include "quarry/database/query_types.hpp"

using namespace quarry::db;
using quarry::foundation::ErrorCode;

// --- Operators ---

TEST(QueryTypesTest, ParseOperatorSymbols) {
    EXPECT_EQ(parseOperator("=").value(), Operator::Equal);
    EXPECT_EQ(parseOperator("<>").value(), Operator::NotEqual);
    EXPECT_EQ(parseOperator(">=").value(), Operator::GreaterEqual);
}

TEST(QueryTypesTest, ParseOperatorKeywordsIgnoreCaseAndSpacing) {
    EXPECT_EQ(parseOperator("LIKE").value(), Operator::Like);
    EXPECT_EQ(parseOperator("not   in").value(), Operator::NotIn);
    EXPECT_EQ(parseOperator(" Between ").value(), Operator::Between);
    EXPECT_EQ(parseOperator("is not null").value(), Operator::IsNotNull);
}

TEST(QueryTypesTest, ParseOperatorRejectsUnknown) {
    auto result = parseOperator("~=");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnsupportedOperator);
    ASSERT_NE(result.error().detail(), nullptr);
    EXPECT_EQ(result.error().detail()->op, "~=");
}

TEST(QueryTypesTest, OperatorSymbol) {
    EXPECT_EQ(operatorSymbol(Operator::NotLike), "NOT LIKE");
    EXPECT_EQ(operatorSymbol(Operator::LessEqual), "<=");
}

// --- Ordering ---

TEST(QueryTypesTest, ParseDirection) {
    EXPECT_EQ(parseDirection("DESC").value(), Direction::Desc);
    EXPECT_EQ(parseDirection("asc").value(), Direction::Asc);

    auto bad = parseDirection("sideways");
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidQuery);
}

// --- Table and column references ---

TEST(QueryTypesTest, ParseTableRef) {
    auto plain = parseTableRef("users");
    EXPECT_EQ(plain.name, "users");
    EXPECT_TRUE(plain.alias.empty());
    EXPECT_EQ(plain.reference(), "users");

    auto aliased = parseTableRef("users AS u");
    EXPECT_EQ(aliased.name, "users");
    EXPECT_EQ(aliased.alias, "u");
    EXPECT_EQ(aliased.reference(), "u");

    auto bare = parseTableRef("posts p");
    EXPECT_EQ(bare.name, "posts");
    EXPECT_EQ(bare.alias, "p");
}

TEST(QueryTypesTest, SplitColumnAlias) {
    auto [col, alias] = splitColumnAlias("users.name as author");
    EXPECT_EQ(col, "users.name");
    EXPECT_EQ(alias, "author");

    auto [plainCol, noAlias] = splitColumnAlias("title");
    EXPECT_EQ(plainCol, "title");
    EXPECT_TRUE(noAlias.empty());
}

TEST(QueryTypesTest, AggregateName) {
    EXPECT_EQ(aggregateName(AggregateFunction::Avg), "avg");
    EXPECT_EQ(aggregateName(AggregateFunction::Max), "max");
}
