/// @file engine_result_test.cpp
/// @brief Tests for Result, EngineError and the error code table.

#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "sfe/foundation/engine_result.hpp"

using namespace sfe::foundation;

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, HoldsValue) {
    auto season = EngineResult<int>::ok(2023);
    EXPECT_TRUE(season.hasValue());
    EXPECT_FALSE(season.hasError());
    EXPECT_TRUE(static_cast<bool>(season));
    EXPECT_EQ(season.value(), 2023);
    EXPECT_EQ(season.valueOr(0), 2023);
}

TEST(ResultTest, HoldsError) {
    auto season = EngineResult<int>::err(
        EngineError(ErrorCode::ConfigTypeMismatch, "type mismatch for key: query.season"));
    EXPECT_FALSE(season);
    EXPECT_EQ(season.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_EQ(season.valueOr(2022), 2022);
    EXPECT_THROW((void)season.value(), std::bad_variant_access);
}

TEST(ResultTest, MoveValueOut) {
    auto team = EngineResult<std::string>::ok("Nott'm Forest");
    std::string name = std::move(team).value();
    EXPECT_EQ(name, "Nott'm Forest");
}

TEST(ResultTest, SameValueAndErrorType) {
    using Lookup = sfe::Result<std::string, std::string>;
    auto found = Lookup::ok("Arsenal");
    auto missing = Lookup::err("unknown team");
    EXPECT_TRUE(found.hasValue());
    EXPECT_EQ(found.value(), "Arsenal");
    EXPECT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error(), "unknown team");
}

TEST(ResultTest, VoidOutcome) {
    auto done = EngineResult<void>::ok();
    EXPECT_TRUE(done.hasValue());
    EXPECT_FALSE(done.hasError());

    auto failed = EngineResult<void>::err(EngineError(ErrorCode::NotConnected, "offline"));
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().message(), "offline");
}

// ============================================================================
// EngineError and ErrorCode
// ============================================================================

TEST(EngineErrorTest, DefaultIsUnknown) {
    EngineError error;
    EXPECT_EQ(error.code(), ErrorCode::Unknown);
    EXPECT_TRUE(error.message().empty());
    EXPECT_EQ(error.subsystem(), "General");
}

TEST(EngineErrorTest, DescribeNamesSubsystem) {
    EngineError error(ErrorCode::MalformedRow, "column 'season' is not an integer");
    EXPECT_EQ(error.describe(), "Repository: column 'season' is not an integer");
}

TEST(ErrorCodeTest, EveryCodeMapsToItsSubsystem) {
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigValueInvalid), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigLoadFailed), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::QueryFailed), "Database");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConnectionPoolExhausted), "Database");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobFailed), "Scheduler");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidMatchRecord), "Repository");
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0x7F00)), "Unknown");
}
