/// @file config_manager_test.cpp
/// @brief Tests for ConfigManager over forecast-runner documents.

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "sfe/foundation/config_manager.hpp"

using namespace sfe::foundation;

namespace {

constexpr const char* kRunnerYaml = R"(
rating:
  k_factor: 20
  base_rating: 1500
query:
  competition: PL
  season: 2023
database:
  connection_string: matches.db
)";

} // namespace

TEST(ConfigManagerTest, DottedKeysReachNestedValues) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kRunnerYaml).hasValue());

    EXPECT_DOUBLE_EQ(config.get<double>("rating.k_factor").value(), 20.0);
    EXPECT_EQ(config.get<int>("query.season").value(), 2023);
    EXPECT_EQ(config.get<std::string>("query.competition").value(), "PL");
    EXPECT_TRUE(config.hasKey("database.connection_string"));
    EXPECT_FALSE(config.hasKey("database"));
}

TEST(ConfigManagerTest, MissingKeyAndWrongType) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kRunnerYaml).hasValue());

    auto missing = config.get<double>("forecast.home_advantage");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);

    auto wrong = config.get<int>("query.competition");
    ASSERT_TRUE(wrong.hasError());
    EXPECT_EQ(wrong.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigManagerTest, ReloadDropsPreviousKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kRunnerYaml).hasValue());
    ASSERT_TRUE(config.loadFromString("scheduler:\n  threads: 4\n").hasValue());

    EXPECT_FALSE(config.hasKey("query.season"));
    EXPECT_EQ(config.get<unsigned int>("scheduler.threads").value(), 4u);
}

TEST(ConfigManagerTest, EmptyDocumentIsAcceptedAndScalarRootIsNot) {
    ConfigManager config;
    EXPECT_TRUE(config.loadFromString("").hasValue());
    EXPECT_FALSE(config.hasKey("rating.k_factor"));

    auto scalar = config.loadFromString("just a string");
    ASSERT_TRUE(scalar.hasError());
    EXPECT_EQ(scalar.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, MalformedYamlFailsToLoad) {
    ConfigManager config;
    auto result = config.loadFromString("rating: [unclosed\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "sfe_config_manager_test.yaml";
    {
        std::ofstream out(path);
        out << kRunnerYaml;
    }

    ConfigManager config;
    auto loaded = config.load(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(config.get<std::string>("database.connection_string").value(), "matches.db");

    auto missing = config.load(path);
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigLoadFailed);
}
