#include <gtest/gtest.h>

#include <string>

#include "quarry/foundation/orm_result.hpp"

using namespace quarry::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConnectionFailed), "Connection");
    EXPECT_EQ(errorSubsystem(ErrorCode::UniqueViolation), "Query");
    EXPECT_EQ(errorSubsystem(ErrorCode::ModelNotFound), "Model");
    EXPECT_EQ(errorSubsystem(ErrorCode::MigrationFailed), "Schema");
    EXPECT_EQ(errorSubsystem(ErrorCode::UnknownBackend), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, ConfigurationTaxonomy) {
    EXPECT_TRUE(isConfigurationError(ErrorCode::UnknownBackend));
    EXPECT_TRUE(isConfigurationError(ErrorCode::InvalidConfiguration));
    EXPECT_TRUE(isConfigurationError(ErrorCode::RelationNotDefined));
    EXPECT_TRUE(isConfigurationError(ErrorCode::MacroNotDefined));
    EXPECT_FALSE(isConfigurationError(ErrorCode::QueryFailed));
}

TEST(ErrorCodeTest, ConnectionTaxonomy) {
    EXPECT_TRUE(isConnectionError(ErrorCode::ConnectionFailed));
    EXPECT_TRUE(isConnectionError(ErrorCode::NotConnected));
    EXPECT_FALSE(isConnectionError(ErrorCode::TransactionFailed));
}

// --- OrmError tests ---

TEST(OrmErrorTest, DefaultConstruction) {
    OrmError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
    EXPECT_EQ(err.detail(), nullptr);
}

TEST(OrmErrorTest, CodeAndMessage) {
    OrmError err(ErrorCode::ModelNotFound, "no users row with key 7");
    EXPECT_EQ(err.code(), ErrorCode::ModelNotFound);
    EXPECT_EQ(err.message(), "no users row with key 7");
    EXPECT_EQ(err.subsystem(), "Model");
    EXPECT_FALSE(err.isSuccess());
}

TEST(OrmErrorTest, DetailContext) {
    ErrorDetail detail;
    detail.backend = "postgres";
    detail.operation = "select";
    detail.table = "users";
    detail.column = "emial";
    OrmError err(ErrorCode::QueryFailed, "column does not exist", detail);

    ASSERT_NE(err.detail(), nullptr);
    EXPECT_EQ(err.detail()->column, "emial");
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(OrmErrorTest, DescribeIncludesBackendAndOperation) {
    ErrorDetail detail;
    detail.backend = "postgres";
    detail.operation = "select";
    detail.table = "users";
    OrmError err(ErrorCode::QueryFailed, "relation does not exist", detail);
    EXPECT_EQ(err.describe(), "[Query/postgres] select on users: relation does not exist");
}

TEST(OrmErrorTest, DescribeWithoutDetail) {
    OrmError err(ErrorCode::ConfigKeyNotFound, "config key not found: database.type");
    EXPECT_EQ(err.describe(), "[Config] config key not found: database.type");
}

// --- OrmResult tests ---

TEST(OrmResultTest, OkValue) {
    auto result = OrmResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(OrmResultTest, FailWithAttachesDetail) {
    ErrorDetail detail;
    detail.operation = "insert";
    detail.table = "users";
    auto result = failWith<int>(ErrorCode::UniqueViolation, "duplicate", detail);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UniqueViolation);
    ASSERT_NE(result.error().detail(), nullptr);
    EXPECT_EQ(result.error().detail()->table, "users");
}

TEST(OrmResultTest, VoidError) {
    auto result = OrmResult<void>::err(OrmError(ErrorCode::NotConnected, "closed"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotConnected);
}
