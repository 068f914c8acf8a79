#include <gtest/gtest.h>

#include "quarry/quarry.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(quarry::Version::major, 0);
    EXPECT_EQ(quarry::Version::minor, 3);
    EXPECT_EQ(quarry::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(quarry::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = quarry::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = quarry::Result<int>::err(quarry::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ValueOr) {
    auto ok = quarry::Result<int>::ok(10);
    auto err = quarry::Result<int>::err(quarry::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    auto ok = quarry::Result<int>::ok(1);
    auto err = quarry::Result<int>::err(quarry::Error("fail"));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, MoveOutValue) {
    auto result = quarry::Result<std::string>::ok("rows");
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "rows");
}

TEST(ResultVoidTest, Ok) {
    auto result = quarry::Result<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = quarry::Result<void>::err(quarry::Error("void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
