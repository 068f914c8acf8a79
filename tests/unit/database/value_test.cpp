#include <gtest/gtest.h>

#include <string>

#include "quarry/database/value.hpp"

using namespace quarry::db;

// --- Key normalization ---

TEST(ValueTest, NormalizeKeyUnifiesNumericForms) {
    EXPECT_EQ(normalizeKey(DbValue{std::int64_t{42}}), "42");
    EXPECT_EQ(normalizeKey(DbValue{42.0}), "42");
    EXPECT_EQ(normalizeKey(DbValue{std::string("42")}), "42");
}

TEST(ValueTest, NormalizeKeyNullNeverMatches) {
    EXPECT_FALSE(normalizeKey(DbValue{DbNull{}}).has_value());
}

TEST(ValueTest, NormalizeKeyBooleansAndFractions) {
    EXPECT_EQ(normalizeKey(DbValue{true}), "1");
    EXPECT_EQ(normalizeKey(DbValue{false}), "0");
    EXPECT_EQ(normalizeKey(DbValue{2.5}), "2.5");
}

// --- Comparison ---

TEST(ValueTest, CompareValuesPromotesNumbers) {
    EXPECT_EQ(compareValues(std::int64_t{3}, 3.0), 0);
    EXPECT_LT(compareValues(std::int64_t{2}, 2.5), 0);
    EXPECT_GT(compareValues(10.0, std::int64_t{9}), 0);
}

TEST(ValueTest, CompareValuesNullSortsFirst) {
    EXPECT_LT(compareValues(DbNull{}, std::int64_t{0}), 0);
    EXPECT_GT(compareValues(std::string("a"), DbNull{}), 0);
    EXPECT_EQ(compareValues(DbNull{}, DbNull{}), 0);
}

TEST(ValueTest, CompareValuesStringsLexicographic) {
    EXPECT_LT(compareValues(std::string("alice"), std::string("bob")), 0);
    EXPECT_EQ(compareValues(std::string("x"), std::string("x")), 0);
}

TEST(ValueTest, LooselyEqual) {
    EXPECT_TRUE(looselyEqual(std::int64_t{42}, 42.0));
    EXPECT_TRUE(looselyEqual(DbNull{}, DbNull{}));
    EXPECT_FALSE(looselyEqual(DbNull{}, std::int64_t{0}));
    EXPECT_FALSE(looselyEqual(std::string("42"), std::int64_t{42}));
}

// --- Display and JSON bridging ---

TEST(ValueTest, DisplayString) {
    EXPECT_EQ(toDisplayString(DbNull{}), "NULL");
    EXPECT_EQ(toDisplayString(std::string("hi")), "hi");
    EXPECT_EQ(toDisplayString(true), "true");
    EXPECT_EQ(toDisplayString(JsonValue{Json::array({1, 2})}), "[1,2]");
    EXPECT_EQ(typeName(DbValue{std::int64_t{1}}), "integer");
}

TEST(ValueTest, JsonBridge) {
    Json doc = {{"name", "alice"}, {"age", 30}, {"tags", {"a", "b"}}, {"gone", nullptr}};

    EXPECT_EQ(valueAs<std::string>(fromJson(doc["name"])), "alice");
    EXPECT_EQ(valueAs<std::int64_t>(fromJson(doc["age"])), 30);
    EXPECT_TRUE(isNull(fromJson(doc["gone"])));

    auto tags = fromJson(doc["tags"]);
    ASSERT_TRUE(std::holds_alternative<JsonValue>(tags));
    EXPECT_EQ(toJson(tags), doc["tags"]);

    EXPECT_TRUE(toJson(DbNull{}).is_null());
    EXPECT_EQ(toJson(std::int64_t{7}), Json(7));
}

TEST(ValueTest, ValueAsWrongAlternative) {
    EXPECT_FALSE(valueAs<std::int64_t>(DbValue{std::string("7")}).has_value());
}

TEST(ValueTest, CurrentTimestampFormat) {
    auto ts = currentTimestamp();
    ASSERT_EQ(ts.size(), 19u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[13], ':');
}
