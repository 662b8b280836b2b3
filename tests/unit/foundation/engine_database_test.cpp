/// @file engine_database_test.cpp
/// @brief Tests for PreparedStatement rendering and EngineDatabase
///        behaviour without a live backend.

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>

#include "sfe/foundation/engine_database.hpp"

using namespace sfe::foundation;

// ============================================================================
// PreparedStatement
// ============================================================================

TEST(PreparedStatementTest, RendersEachBoundKind) {
    PreparedStatement stmt(
        "INSERT INTO matches (home_team, season, home_goals, away_goals) "
        "VALUES ($home_team, $season, $home_goals, $away_goals)");
    stmt.bindString("home_team", "Nott'm Forest")
        .bindInt("season", 2023)
        .bindOptionalInt("home_goals", 2)
        .bindOptionalInt("away_goals", std::nullopt);

    EXPECT_EQ(stmt.resolve(),
              "INSERT INTO matches (home_team, season, home_goals, away_goals) "
              "VALUES ('Nott''m Forest', 2023, 2, NULL)");
    EXPECT_NE(stmt.sql().find("$home_team"), std::string::npos);
}

TEST(PreparedStatementTest, BoundTextIsNeverRescanned) {
    PreparedStatement stmt("SELECT * FROM matches WHERE home_team = $team AND date = $date");
    stmt.bindString("team", "Real $date").bindString("date", "2024-01-01");

    EXPECT_EQ(stmt.resolve(),
              "SELECT * FROM matches WHERE home_team = 'Real $date' "
              "AND date = '2024-01-01'");
}

TEST(PreparedStatementTest, BoundTextCannotCloseTheLiteral) {
    PreparedStatement stmt("SELECT * FROM matches WHERE competition = $competition");
    stmt.bindString("competition", "PL' OR '1'='1");

    EXPECT_EQ(stmt.resolve(),
              "SELECT * FROM matches WHERE competition = 'PL'' OR ''1''=''1'");
}

TEST(PreparedStatementTest, PlaceholderNamesMatchWholeIdentifiers) {
    PreparedStatement stmt("SELECT $season, $season_start, $seasons");
    stmt.bindInt("season", 2023).bindInt("season_start", 2022);

    EXPECT_EQ(stmt.resolve(), "SELECT 2023, 2022, $seasons");
}

TEST(PreparedStatementTest, RepeatedPlaceholderAndStrayDollar) {
    PreparedStatement stmt("SELECT $limit, $limit, '$', $");
    stmt.bindInt("limit", 10);

    EXPECT_EQ(stmt.resolve(), "SELECT 10, 10, '$', $");
}

TEST(PreparedStatementTest, RebindingReplacesValue) {
    PreparedStatement stmt("LIMIT $limit");
    stmt.bindInt("limit", 5).bindInt("limit", 380);
    EXPECT_EQ(stmt.resolve(), "LIMIT 380");
}

// ============================================================================
// DatabaseType / DatabaseConfig
// ============================================================================

TEST(DatabaseTypeTest, ParsesConfiguredNames) {
    EXPECT_EQ(parseDatabaseType("sqlite"), DatabaseType::SQLite);
    EXPECT_EQ(parseDatabaseType("postgresql"), DatabaseType::PostgreSQL);
    EXPECT_EQ(parseDatabaseType("postgres"), DatabaseType::PostgreSQL);
    EXPECT_EQ(parseDatabaseType("mysql"), DatabaseType::MySQL);
    EXPECT_FALSE(parseDatabaseType("SQLite").has_value());
    EXPECT_FALSE(parseDatabaseType("").has_value());
}

TEST(DatabaseConfigTest, DefaultsOpenLocalMatchFile) {
    DatabaseConfig config;
    EXPECT_EQ(config.connectionString, "matches.db");
    EXPECT_EQ(config.dbType, DatabaseType::SQLite);
    EXPECT_EQ(config.minConnections, 1u);
    EXPECT_EQ(config.maxConnections, 4u);
    EXPECT_EQ(config.connectionTimeout, std::chrono::seconds(30));
}

// ============================================================================
// EngineDatabase without a connection
// ============================================================================

TEST(EngineDatabaseTest, PoolBoundsAreValidatedBeforeConnecting) {
    EngineDatabase db;

    DatabaseConfig inverted;
    inverted.minConnections = 3;
    inverted.maxConnections = 2;
    auto result = db.connect(inverted);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);

    DatabaseConfig empty;
    empty.minConnections = 0;
    empty.maxConnections = 0;
    result = db.connect(empty);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_FALSE(db.isConnected());
}

TEST(EngineDatabaseTest, CallsBeforeConnectReportNotConnected) {
    EngineDatabase db;
    EXPECT_FALSE(db.isConnected());

    auto rows = db.query("SELECT COUNT(*) AS n FROM matches");
    ASSERT_TRUE(rows.hasError());
    EXPECT_EQ(rows.error().code(), ErrorCode::NotConnected);

    auto ddl = db.execute("CREATE TABLE IF NOT EXISTS matches (id INTEGER)");
    ASSERT_TRUE(ddl.hasError());
    EXPECT_EQ(ddl.error().code(), ErrorCode::NotConnected);

    PreparedStatement stmt("SELECT * FROM matches WHERE season = $season");
    stmt.bindInt("season", 2023);
    auto selected = db.execute(stmt);
    ASSERT_TRUE(selected.hasError());
    EXPECT_EQ(selected.error().code(), ErrorCode::NotConnected);

    db.disconnect();
    EXPECT_FALSE(db.isConnected());
}
